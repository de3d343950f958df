#ifndef RENDERENGINE_SHADER_HPP
#define RENDERENGINE_SHADER_HPP
#include <re/Common.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace re
{

struct DescriptorInfo
{
	std::string name;
	std::size_t size; // Size per descriptor
	uint32_t binding;
	uint32_t set;
	uint32_t descriptor_count; // 1 if not array
	vk::DescriptorType type;
	vk::ShaderStageFlags stage;
};

/**
 * @brief Slang module compiled to SPIR-V with its descriptor reflection
 *
 * Paths are resolved against SHADER_DIR by the Slang session.
 */
class Shader
{
public:
	static std::expected<Shader, std::string> create_shader(vk::Device device, const std::filesystem::path& path,
															std::string_view entry_point = "main");

	[[nodiscard]] const std::vector<DescriptorInfo>& descriptor_infos() const { return m_descriptor_infos; }
	[[nodiscard]] vk::ShaderStageFlagBits stage() const { return m_stage; }
	[[nodiscard]] vk::ShaderModule shader_module() const { return m_shader_module; }
	[[nodiscard]] vk::PipelineShaderStageCreateInfo create_pipeline_shader_stage_create_info() const;

	Shader(const Shader&) = delete;
	Shader& operator=(const Shader&) = delete;
	Shader(Shader&& other) noexcept;
	Shader& operator=(Shader&& other) noexcept;
	~Shader();

private:
	Shader(vk::Device device, vk::ShaderModule shader_module, vk::ShaderStageFlagBits stage,
		   std::vector<DescriptorInfo> descriptor_infos, std::string entry_point);

	vk::Device m_device;
	vk::ShaderModule m_shader_module;
	vk::ShaderStageFlagBits m_stage;
	std::vector<DescriptorInfo> m_descriptor_infos;
	std::string m_entry_point;
};

/**
 * @brief Merge the descriptors of several stages into per-set layout bindings
 *
 * Bindings shared by stages are emitted once with their stage flags combined.
 * The result has one entry per set index up to the highest set used.
 */
[[nodiscard]] std::expected<std::vector<std::vector<vk::DescriptorSetLayoutBinding>>, std::string>
merge_descriptor_layouts(const std::vector<const Shader*>& shaders);

} // namespace re

#endif // RENDERENGINE_SHADER_HPP
