#ifndef RENDERENGINE_VULKANCONTEXT_HPP
#define RENDERENGINE_VULKANCONTEXT_HPP

#include <re/Common.hpp>
#include <cstdint>
#include <expected>
#include <string>

namespace re
{

struct VulkanContextConfig
{
	std::string application_name = "RenderEngine";
	/// Ignored when the validation layer is not installed.
	bool enable_validation =
#ifdef NDEBUG
		false;
#else
		true;
#endif
};

/// Instance, device and the graphics queue every backend object is created from.
class VulkanContext
{
public:
	explicit VulkanContext(const VulkanContextConfig& config = {});
	~VulkanContext();

	VulkanContext(const VulkanContext&) = delete;
	VulkanContext& operator=(const VulkanContext&) = delete;
	VulkanContext(VulkanContext&&) = delete;
	VulkanContext& operator=(VulkanContext&&) = delete;

	[[nodiscard]] vk::Instance instance() const { return m_instance; }
	[[nodiscard]] vk::PhysicalDevice physical_device() const { return m_physical_device; }
	[[nodiscard]] vk::Device device() const { return m_device; }
	[[nodiscard]] uint32_t graphics_queue_family() const { return m_graphics_family; }
	[[nodiscard]] vk::Queue graphics_queue() const { return m_graphics_queue; }

	/// Index of a memory type allowed by type_bits with all of properties.
	[[nodiscard]] std::expected<uint32_t, std::string> find_memory_type(uint32_t type_bits,
																		vk::MemoryPropertyFlags properties) const;

private:
	vk::Instance m_instance;
	vk::DebugUtilsMessengerEXT m_debug_messenger;
	vk::PhysicalDevice m_physical_device;
	uint32_t m_graphics_family;
	vk::Device m_device;
	vk::Queue m_graphics_queue;
};

} // namespace re

#endif // RENDERENGINE_VULKANCONTEXT_HPP
