#include <re/Logger.hpp>
#include <re/vulkan/VulkanContext.hpp>
#include <GLFW/glfw3.h>
#include <array>
#include <cstring>
#include <optional>
#include <stdexcept>

VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

namespace re
{

namespace
{

constexpr std::array VALIDATION_LAYERS = {"VK_LAYER_KHRONOS_validation"};

vk::Bool32 debug_callback(vk::DebugUtilsMessageSeverityFlagBitsEXT severity,
						  [[maybe_unused]] vk::DebugUtilsMessageTypeFlagsEXT type,
						  const vk::DebugUtilsMessengerCallbackDataEXT* callback_data, [[maybe_unused]] void* user_data)
{
	auto& logger = Logger::instance();
	logger.set_pattern(Logger::tagged_pattern("[VulkanDebug]"));
	switch (severity)
	{
		case vk::DebugUtilsMessageSeverityFlagBitsEXT::eVerbose: logger.trace("{}", callback_data->pMessage); break;
		case vk::DebugUtilsMessageSeverityFlagBitsEXT::eInfo: logger.debug("{}", callback_data->pMessage); break;
		case vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning: logger.warn("{}", callback_data->pMessage); break;
		case vk::DebugUtilsMessageSeverityFlagBitsEXT::eError: logger.error("{}", callback_data->pMessage); break;
		default: logger.info("{}", callback_data->pMessage); break;
	}
	return vk::False;
}

bool validation_layers_available()
{
	auto available_res = vk::enumerateInstanceLayerProperties();
	if (available_res.result != vk::Result::eSuccess)
	{
		Logger::instance().warn("Could not query instance layers {}", vk::to_string(available_res.result));
		return false;
	}
	for (const char* layer_name : VALIDATION_LAYERS)
	{
		bool found = false;
		for (const auto& layer : available_res.value)
		{
			if (std::strcmp(layer_name, layer.layerName) == 0)
			{
				found = true;
				break;
			}
		}
		if (!found)
		{
			Logger::instance().warn("Validation layer {} not available", layer_name);
			return false;
		}
	}
	return true;
}

vk::DebugUtilsMessengerCreateInfoEXT make_debug_messenger_create_info()
{
	return vk::DebugUtilsMessengerCreateInfoEXT()
		.setMessageSeverity(vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning |
							vk::DebugUtilsMessageSeverityFlagBitsEXT::eError)
		.setMessageType(vk::DebugUtilsMessageTypeFlagBitsEXT::eGeneral |
						vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation |
						vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance)
		.setPfnUserCallback(debug_callback);
}

void ensure_glfw_initialized()
{
	static bool initialized = false;
	if (!initialized)
	{
		if (!glfwInit())
		{
			throw std::runtime_error("Failed to initialize GLFW");
		}
		initialized = true;
	}
}

vk::Instance create_instance(const VulkanContextConfig& config, bool validation)
{
	static vk::detail::DynamicLoader dl;
	auto vkGetInstanceProcAddr = dl.getProcAddress<PFN_vkGetInstanceProcAddr>("vkGetInstanceProcAddr");
	VULKAN_HPP_DEFAULT_DISPATCHER.init(vkGetInstanceProcAddr);

	auto app_info = vk::ApplicationInfo()
						.setPApplicationName(config.application_name.c_str())
						.setApplicationVersion(VK_MAKE_VERSION(1, 0, 0))
						.setPEngineName("RenderEngine")
						.setEngineVersion(VK_MAKE_VERSION(1, 0, 0))
						.setApiVersion(VK_API_VERSION_1_3);

	ensure_glfw_initialized();
	uint32_t glfw_extension_count = 0;
	const char** glfw_extensions = glfwGetRequiredInstanceExtensions(&glfw_extension_count);
	std::vector<const char*> extensions(glfw_extensions, glfw_extensions + glfw_extension_count);
	if (validation)
	{
		extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
	}

	Logger::instance().debug("Instance extensions:");
	for (const auto* ext : extensions)
	{
		Logger::instance().debug("  {}", ext);
	}

	auto create_info = vk::InstanceCreateInfo().setPApplicationInfo(&app_info).setPEnabledExtensionNames(extensions);

	auto debug_create_info = make_debug_messenger_create_info();
	if (validation)
	{
		create_info.setPEnabledLayerNames(VALIDATION_LAYERS);
		create_info.setPNext(&debug_create_info);
		Logger::instance().info("Validation layers enabled");
	}

	auto instance_res = vk::createInstance(create_info);
	if (instance_res.result != vk::Result::eSuccess)
	{
		throw std::runtime_error(fmt::format("Failed to create instance {}", vk::to_string(instance_res.result)));
	}
	VULKAN_HPP_DEFAULT_DISPATCHER.init(instance_res.value);
	Logger::instance().debug("Created Vulkan instance");
	return instance_res.value;
}

vk::DebugUtilsMessengerEXT create_debug_messenger(vk::Instance instance, bool validation)
{
	if (!validation)
	{
		return nullptr;
	}
	auto messenger_res = instance.createDebugUtilsMessengerEXT(make_debug_messenger_create_info());
	if (messenger_res.result != vk::Result::eSuccess)
	{
		Logger::instance().error("Failed to create debug messenger {}", vk::to_string(messenger_res.result));
		return nullptr;
	}
	Logger::instance().debug("Created debug messenger");
	return messenger_res.value;
}

vk::PhysicalDevice select_physical_device(vk::Instance instance)
{
	auto devices_res = instance.enumeratePhysicalDevices();
	if (devices_res.result != vk::Result::eSuccess)
	{
		throw std::runtime_error(
			fmt::format("Failed to enumerate physical devices {}", vk::to_string(devices_res.result)));
	}

	for (auto preferred : {vk::PhysicalDeviceType::eDiscreteGpu, vk::PhysicalDeviceType::eIntegratedGpu})
	{
		for (const auto& dev : devices_res.value)
		{
			auto props = dev.getProperties();
			if (props.deviceType == preferred)
			{
				Logger::instance().info("Selected {}: {}", vk::to_string(preferred), props.deviceName.data());
				return dev;
			}
		}
	}

	throw std::runtime_error{"No suitable physical device found"};
}

uint32_t find_graphics_family(vk::Instance instance, vk::PhysicalDevice physical_device)
{
	auto queue_families = physical_device.getQueueFamilyProperties();
	for (uint32_t i = 0; i < queue_families.size(); i++)
	{
		bool graphics = static_cast<bool>(queue_families[i].queueFlags & vk::QueueFlagBits::eGraphics);
		bool present = glfwGetPhysicalDevicePresentationSupport(static_cast<VkInstance>(instance),
																static_cast<VkPhysicalDevice>(physical_device), i);
		if (graphics && present)
		{
			Logger::instance().debug("Graphics queue family: {}", i);
			return i;
		}
	}
	throw std::runtime_error{"No queue family supports both graphics and presentation"};
}

vk::Device create_logical_device(vk::PhysicalDevice physical_device, uint32_t graphics_family)
{
	float queue_priority = 1.0f;
	auto queue_create_info =
		vk::DeviceQueueCreateInfo().setQueueFamilyIndex(graphics_family).setQueueCount(1).setPQueuePriorities(
			&queue_priority);

	std::array<const char*, 1> extensions = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

	vk::PhysicalDeviceFeatures features{};
	features.sampleRateShading = physical_device.getFeatures().sampleRateShading;

	auto create_info = vk::DeviceCreateInfo()
						   .setQueueCreateInfos(queue_create_info)
						   .setPEnabledExtensionNames(extensions)
						   .setPEnabledFeatures(&features);

	auto device_res = physical_device.createDevice(create_info);
	if (device_res.result != vk::Result::eSuccess)
	{
		throw std::runtime_error(fmt::format("Failed to create device {}", vk::to_string(device_res.result)));
	}
	Logger::instance().debug("Created logical device");
	return device_res.value;
}

} // anonymous namespace

VulkanContext::VulkanContext(const VulkanContextConfig& config)
{
	bool validation = config.enable_validation && validation_layers_available();
	m_instance = create_instance(config, validation);
	m_debug_messenger = create_debug_messenger(m_instance, validation);
	m_physical_device = select_physical_device(m_instance);
	m_graphics_family = find_graphics_family(m_instance, m_physical_device);
	m_device = create_logical_device(m_physical_device, m_graphics_family);
	VULKAN_HPP_DEFAULT_DISPATCHER.init(m_device);
	m_graphics_queue = m_device.getQueue(m_graphics_family, 0);
	Logger::instance().info("VulkanContext initialized, VK_HEADER_VERSION: {}", VK_HEADER_VERSION);
}

VulkanContext::~VulkanContext()
{
	if (m_device)
	{
		m_device.destroy();
		Logger::instance().trace("Destroyed logical device");
	}
	if (m_debug_messenger)
	{
		m_instance.destroyDebugUtilsMessengerEXT(m_debug_messenger);
		Logger::instance().trace("Destroyed debug messenger");
	}
	if (m_instance)
	{
		m_instance.destroy();
		Logger::instance().trace("Destroyed instance");
	}
}

std::expected<uint32_t, std::string> VulkanContext::find_memory_type(uint32_t type_bits,
																	 vk::MemoryPropertyFlags properties) const
{
	auto mem_properties = m_physical_device.getMemoryProperties();
	for (uint32_t i = 0; i < mem_properties.memoryTypeCount; i++)
	{
		if ((type_bits & (1u << i)) && (mem_properties.memoryTypes[i].propertyFlags & properties) == properties)
		{
			return i;
		}
	}
	return std::unexpected(fmt::format("No memory type with {}", vk::to_string(properties)));
}

} // namespace re
