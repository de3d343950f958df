#include <re/Logger.hpp>
#include <re/vulkan/Shader.hpp>
#include <slang-com-ptr.h>
#include <slang.h>
#include <algorithm>
#include <map>
#include <optional>
#include <utility>

// ============================================================================
// Slang Session Management
// ============================================================================
// One global session and one SPIR-V session, created on first use and kept
// for the lifetime of the process.
// ============================================================================

namespace re
{

namespace
{

Slang::ComPtr<slang::IGlobalSession> create_global_session()
{
	Slang::ComPtr<slang::IGlobalSession> session;
	SlangGlobalSessionDesc				 desc = {};
	createGlobalSession(&desc, session.writeRef());
	Logger::instance().debug("Created Slang global session");
	return session;
}

Slang::ComPtr<slang::ISession> create_spirv_session(slang::IGlobalSession* global)
{
	slang::SessionDesc session_desc = {};

	slang::TargetDesc target_desc = {};
	target_desc.format			  = SLANG_SPIRV;
	target_desc.profile			  = global->findProfile("spirv_1_5");
	session_desc.targets		  = &target_desc;
	session_desc.targetCount	  = 1;

	const char* search_paths[]	 = {SHADER_DIR};
	session_desc.searchPaths	 = search_paths;
	session_desc.searchPathCount = 1;

	Slang::ComPtr<slang::ISession> session;
	global->createSession(session_desc, session.writeRef());
	Logger::instance().debug("Created SPIR-V session with search path: {}", SHADER_DIR);
	return session;
}

slang::ISession* get_session()
{
	static Slang::ComPtr<slang::IGlobalSession> global	= create_global_session();
	static Slang::ComPtr<slang::ISession>		session = create_spirv_session(global);
	return session.get();
}

// ============================================================================
// Shader Compilation
// ============================================================================

/// Check Slang diagnostics blob for errors. Returns error string if present.
std::optional<std::string> check_diagnostics(slang::IBlob* diagnostics)
{
	if (!diagnostics || diagnostics->getBufferSize() == 0)
	{
		return std::nullopt;
	}
	return std::string{static_cast<const char*>(diagnostics->getBufferPointer()), diagnostics->getBufferSize()};
}

/// Load a module and link it together with the named entry point.
std::expected<Slang::ComPtr<slang::IComponentType>, std::string> load_linked_program(const std::string& name,
																					 std::string_view entry_point)
{
	Logger::instance().debug("Loading shader module '{}' with entry point '{}'", name, entry_point);

	auto*						session = get_session();
	Slang::ComPtr<slang::IBlob> diagnostics;

	Slang::ComPtr<slang::IModule> module(session->loadModule(name.c_str(), diagnostics.writeRef()));
	if (auto error = check_diagnostics(diagnostics.get()))
	{
		return std::unexpected{fmt::format("module '{}': {}", name, *error)};
	}
	if (!module)
	{
		return std::unexpected{fmt::format("Failed to load module '{}'", name)};
	}

	Slang::ComPtr<slang::IEntryPoint> entry;
	module->findEntryPointByName(std::string{entry_point}.c_str(), entry.writeRef());
	if (!entry)
	{
		return std::unexpected{fmt::format("Entry point '{}' not found in '{}'", entry_point, name)};
	}

	slang::IComponentType*				 components[] = {module, entry};
	Slang::ComPtr<slang::IComponentType> program;
	session->createCompositeComponentType(components, 2, program.writeRef(), diagnostics.writeRef());
	if (auto error = check_diagnostics(diagnostics.get()))
	{
		return std::unexpected{*error};
	}

	Slang::ComPtr<slang::IComponentType> linked;
	program->link(linked.writeRef(), diagnostics.writeRef());
	if (auto error = check_diagnostics(diagnostics.get()))
	{
		return std::unexpected{fmt::format("link '{}': {}", name, *error)};
	}

	Logger::instance().trace("Linked shader program '{}':'{}'", name, entry_point);
	return linked;
}

std::expected<Slang::ComPtr<slang::IBlob>, std::string> get_spirv_code(slang::IComponentType* linked)
{
	Slang::ComPtr<slang::IBlob> code;
	Slang::ComPtr<slang::IBlob> diagnostics;

	linked->getEntryPointCode(0, 0, code.writeRef(), diagnostics.writeRef());
	if (auto error = check_diagnostics(diagnostics.get()))
	{
		return std::unexpected{*error};
	}

	Logger::instance().trace("Generated SPIR-V code: {} bytes", code->getBufferSize());
	return code;
}

std::expected<vk::ShaderModule, std::string> create_shader_module(vk::Device device, slang::IBlob* spirv)
{
	auto create_info = vk::ShaderModuleCreateInfo()
						   .setCodeSize(spirv->getBufferSize())
						   .setPCode(static_cast<const uint32_t*>(spirv->getBufferPointer()));

	auto module_res = device.createShaderModule(create_info);
	CHECK_VK_RESULT(module_res, "Failed to create shader module {}");
	Logger::instance().debug("Created shader module ({} bytes)", spirv->getBufferSize());
	return module_res.value;
}

// ============================================================================
// Reflection
// ============================================================================

std::expected<vk::ShaderStageFlagBits, std::string> to_vk_shader_stage(SlangStage stage)
{
	switch (stage)
	{
		case SLANG_STAGE_VERTEX: return vk::ShaderStageFlagBits::eVertex;
		case SLANG_STAGE_FRAGMENT: return vk::ShaderStageFlagBits::eFragment;
		default: return std::unexpected{fmt::format("Unsupported shader stage {}", static_cast<int>(stage))};
	}
}

vk::DescriptorType to_vk_descriptor_type(slang::BindingType binding_type)
{
	using enum slang::BindingType;

	auto base_type =
		static_cast<slang::BindingType>(static_cast<uint32_t>(binding_type) & static_cast<uint32_t>(BaseMask));
	bool is_mutable = (static_cast<uint32_t>(binding_type) & static_cast<uint32_t>(MutableFlag)) != 0;

	switch (base_type)
	{
		case Sampler: return vk::DescriptorType::eSampler;
		case Texture: return is_mutable ? vk::DescriptorType::eStorageImage : vk::DescriptorType::eSampledImage;
		case ConstantBuffer: return vk::DescriptorType::eUniformBuffer;
		case RawBuffer: return vk::DescriptorType::eStorageBuffer;
		case CombinedTextureSampler: return vk::DescriptorType::eCombinedImageSampler;
		default:
			Logger::instance().warn("Unhandled binding type {}, treating as uniform buffer",
									static_cast<uint32_t>(binding_type));
			return vk::DescriptorType::eUniformBuffer;
	}
}

/// Recursively extract size from a type layout, unwrapping arrays/structs.
std::size_t extract_size(slang::TypeLayoutReflection* type_layout)
{
	auto size = type_layout->getSize();
	if (size > 0)
	{
		return size;
	}

	auto* element_type = type_layout->getElementTypeLayout();
	if (element_type && element_type != type_layout)
	{
		return extract_size(element_type);
	}
	return 0;
}

void extract_bindings(slang::VariableLayoutReflection* param, vk::ShaderStageFlagBits stage,
					  std::vector<DescriptorInfo>& out)
{
	auto*		type_layout	 = param->getTypeLayout();
	const char* name		 = param->getName();
	uint32_t	base_binding = param->getBindingIndex();
	uint32_t	set			 = param->getBindingSpace();

	for (unsigned r = 0; r < type_layout->getBindingRangeCount(); r++)
	{
		auto binding_type = type_layout->getBindingRangeType(r);
		if (binding_type == slang::BindingType::VaryingInput || binding_type == slang::BindingType::VaryingOutput ||
			binding_type == slang::BindingType::PushConstant)
		{
			continue;
		}

		auto* leaf_type = type_layout->getBindingRangeLeafTypeLayout(r);
		out.push_back(DescriptorInfo{
			.name			  = name ? name : "",
			.size			  = leaf_type ? extract_size(leaf_type) : 0,
			.binding		  = base_binding + r,
			.set			  = set,
			.descriptor_count = static_cast<uint32_t>(type_layout->getBindingRangeBindingCount(r)),
			.type			  = to_vk_descriptor_type(binding_type),
			.stage			  = stage,
		});
		Logger::instance().trace("  Binding: set={} binding={} name='{}' type={}", set, base_binding + r,
								 out.back().name, vk::to_string(out.back().type));
	}
}

std::vector<DescriptorInfo> extract_descriptors(slang::IComponentType* linked, vk::ShaderStageFlagBits stage)
{
	slang::ProgramLayout*		layout = linked->getLayout();
	std::vector<DescriptorInfo> descriptors;
	for (unsigned i = 0; i < layout->getParameterCount(); i++)
	{
		extract_bindings(layout->getParameterByIndex(i), stage, descriptors);
	}
	Logger::instance().debug("Extracted {} descriptor bindings", descriptors.size());
	return descriptors;
}

} // anonymous namespace

// ============================================================================
// Shader Class
// ============================================================================

std::expected<Shader, std::string> Shader::create_shader(vk::Device device, const std::filesystem::path& path,
														 std::string_view entry_point)
{
	auto name = path.generic_string();
	Logger::instance().info("Creating shader '{}':'{}'", name, entry_point);

	auto linked = load_linked_program(name, entry_point);
	if (!linked)
	{
		return std::unexpected{linked.error()};
	}

	slang::ProgramLayout* layout = (*linked)->getLayout();
	if (layout->getEntryPointCount() == 0)
	{
		return std::unexpected{fmt::format("'{}' has no entry point", name)};
	}
	auto stage = to_vk_shader_stage(layout->getEntryPointByIndex(0)->getStage());
	if (!stage)
	{
		return std::unexpected{stage.error()};
	}

	auto spirv = get_spirv_code(linked->get());
	if (!spirv)
	{
		return std::unexpected{spirv.error()};
	}

	auto module = create_shader_module(device, spirv->get());
	if (!module)
	{
		return std::unexpected{module.error()};
	}

	auto descriptors = extract_descriptors(linked->get(), *stage);
	return Shader{device, *module, *stage, std::move(descriptors), std::string{entry_point}};
}

vk::PipelineShaderStageCreateInfo Shader::create_pipeline_shader_stage_create_info() const
{
	return vk::PipelineShaderStageCreateInfo{}.setStage(m_stage).setModule(m_shader_module).setPName(
		m_entry_point.c_str());
}

Shader::~Shader()
{
	if (m_shader_module)
	{
		m_device.destroyShaderModule(m_shader_module);
		Logger::instance().trace("Destroyed shader module");
	}
}

Shader::Shader(Shader&& other) noexcept
	: m_device(other.m_device)
	, m_shader_module(std::exchange(other.m_shader_module, nullptr))
	, m_stage(other.m_stage)
	, m_descriptor_infos(std::move(other.m_descriptor_infos))
	, m_entry_point(std::move(other.m_entry_point))
{
}

Shader& Shader::operator=(Shader&& other) noexcept
{
	if (this != &other)
	{
		if (m_shader_module)
		{
			m_device.destroyShaderModule(m_shader_module);
		}
		m_device		   = other.m_device;
		m_shader_module	   = std::exchange(other.m_shader_module, nullptr);
		m_stage			   = other.m_stage;
		m_descriptor_infos = std::move(other.m_descriptor_infos);
		m_entry_point	   = std::move(other.m_entry_point);
	}
	return *this;
}

Shader::Shader(vk::Device device, vk::ShaderModule shader_module, vk::ShaderStageFlagBits stage,
			   std::vector<DescriptorInfo> descriptor_infos, std::string entry_point)
	: m_device(device)
	, m_shader_module(shader_module)
	, m_stage(stage)
	, m_descriptor_infos(std::move(descriptor_infos))
	, m_entry_point(std::move(entry_point))
{
}

std::expected<std::vector<std::vector<vk::DescriptorSetLayoutBinding>>, std::string>
merge_descriptor_layouts(const std::vector<const Shader*>& shaders)
{
	std::map<std::pair<uint32_t, uint32_t>, vk::DescriptorSetLayoutBinding> merged;
	uint32_t set_count = 0;

	for (const auto* shader : shaders)
	{
		for (const auto& info : shader->descriptor_infos())
		{
			set_count = std::max(set_count, info.set + 1);
			auto key  = std::make_pair(info.set, info.binding);
			if (auto it = merged.find(key); it != merged.end())
			{
				if (it->second.descriptorType != info.type)
				{
					return std::unexpected{fmt::format("set {} binding {} declared as {} and {}", info.set,
													   info.binding, vk::to_string(it->second.descriptorType),
													   vk::to_string(info.type))};
				}
				it->second.stageFlags |= info.stage;
				continue;
			}
			merged.emplace(key, vk::DescriptorSetLayoutBinding()
									.setBinding(info.binding)
									.setDescriptorType(info.type)
									.setDescriptorCount(info.descriptor_count)
									.setStageFlags(info.stage));
		}
	}

	std::vector<std::vector<vk::DescriptorSetLayoutBinding>> sets(set_count);
	for (const auto& [key, binding] : merged)
	{
		sets[key.first].push_back(binding);
	}
	return sets;
}

} // namespace re
