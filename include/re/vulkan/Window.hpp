#pragma once

#include <re/Backend.hpp>
#include <re/vulkan/VulkanContext.hpp>
#include <re/vulkan/VulkanResources.hpp>
#include <GLFW/glfw3.h>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace re {

struct WindowConfig {
    int width = 1280;
    int height = 720;
    std::string title = "RenderEngine";
    /// Use mailbox presentation when available, FIFO otherwise.
    bool prefer_mailbox = true;
};

/**
 * @brief GLFW window presenting through a Vulkan swapchain
 *
 * Swapchain images are handed out as Image handles, so a System can render
 * straight into them. Stale swapchains (resize, out-of-date) are rebuilt
 * inside next_image(), which then reports nullopt for that frame. A suboptimal
 * acquire still renders and presents; the rebuild happens on the next acquire.
 */
class Window final : public SwapchainTarget {
public:
    /**
     * @brief Create a window with its surface and swapchain
     *
     * @param context Vulkan context, must outlive the window
     * @return Window instance or error message
     */
    static std::expected<std::unique_ptr<Window>, std::string> create(
        const VulkanContext& context,
        const WindowConfig& config = {}
    );

    ~Window() override;

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    [[nodiscard]] std::optional<ImageHandle> next_image() override;
    [[nodiscard]] CompletionSignalHandle get_future() override;
    bool present_future(const CompletionSignalHandle& signal) override;

    [[nodiscard]] bool should_close() const;

    /// Poll GLFW events and note framebuffer size changes.
    void poll_events();

    /// Next next_image() rebuilds the swapchain.
    void mark_resize_needed() { m_needs_resize = true; }

    /// Presents whose wait semaphore is still held, at most one per swapchain image.
    [[nodiscard]] std::size_t pending_presents() const;

    [[nodiscard]] vk::Extent2D extent() const { return m_extent; }
    [[nodiscard]] std::size_t image_count() const { return m_images.size(); }
    [[nodiscard]] vk::Format format() const { return m_surface_format.format; }
    [[nodiscard]] GLFWwindow* get_window_handle() const { return m_window_handle; }

private:
    Window(const VulkanContext& context, const WindowConfig& config);

    std::expected<void, std::string> create_surface();
    std::expected<void, std::string> create_swapchain();
    std::expected<void, std::string> recreate_swapchain();
    void cleanup_swapchain();

    vk::SurfaceFormatKHR choose_surface_format(const std::vector<vk::SurfaceFormatKHR>& available_formats) const;
    vk::PresentModeKHR choose_present_mode(const std::vector<vk::PresentModeKHR>& available_modes) const;
    vk::Extent2D choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities) const;

    GLFWwindow* m_window_handle = nullptr;
    WindowConfig m_config;
    const VulkanContext* m_context;
    vk::Device m_device;

    vk::SurfaceKHR m_surface;
    vk::SurfaceFormatKHR m_surface_format;
    vk::SwapchainKHR m_swapchain;
    vk::Extent2D m_extent;
    std::vector<std::shared_ptr<VulkanImage>> m_images;

    std::shared_ptr<VulkanCompletionSignal> m_acquire_signal;
    std::vector<std::shared_ptr<VulkanCompletionSignal>> m_presented_signals;
    uint32_t m_current_image_index = 0;
    bool m_needs_resize = false;
};

} // namespace re
