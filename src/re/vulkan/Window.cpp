#include <re/Error.hpp>
#include <re/Logger.hpp>
#include <re/RenderPasses.hpp>
#include <re/vulkan/Window.hpp>
#include <algorithm>
#include <stdexcept>

namespace re {

std::expected<std::unique_ptr<Window>, std::string> Window::create(
    const VulkanContext& context,
    const WindowConfig& config
) {
    std::unique_ptr<Window> window;
    try {
        window.reset(new Window(context, config));
    } catch (const std::runtime_error& e) {
        return std::unexpected(std::string("Window creation failed: ") + e.what());
    }

    if (auto result = window->create_surface(); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = window->create_swapchain(); !result) {
        return std::unexpected(result.error());
    }
    return window;
}

Window::Window(const VulkanContext& context, const WindowConfig& config)
    : m_config(config)
    , m_context(&context)
    , m_device(context.device())
{
    // VulkanContext has already initialised GLFW.
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    m_window_handle = glfwCreateWindow(config.width, config.height, config.title.c_str(), nullptr, nullptr);
    if (!m_window_handle) {
        throw std::runtime_error("Failed to create GLFW window");
    }
}

Window::~Window()
{
    if (m_device) {
        if (auto res = m_device.waitIdle(); res != vk::Result::eSuccess) {
            Logger::instance().error("waitIdle failed: {}", vk::to_string(res));
        }
    }
    m_acquire_signal.reset();
    m_presented_signals.clear();
    cleanup_swapchain();
    if (m_surface) {
        m_context->instance().destroySurfaceKHR(m_surface);
    }
    if (m_window_handle) {
        glfwDestroyWindow(m_window_handle);
    }
}

bool Window::should_close() const
{
    return glfwWindowShouldClose(m_window_handle);
}

void Window::poll_events()
{
    glfwPollEvents();
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_window_handle, &width, &height);
    if (static_cast<uint32_t>(width) != m_extent.width || static_cast<uint32_t>(height) != m_extent.height) {
        m_needs_resize = true;
    }
}

std::expected<void, std::string> Window::create_surface()
{
    VkSurfaceKHR surface_c;
    VkResult result = glfwCreateWindowSurface(
        static_cast<VkInstance>(m_context->instance()),
        m_window_handle,
        nullptr,
        &surface_c
    );
    if (result != VK_SUCCESS) {
        return std::unexpected(fmt::format("Failed to create window surface {}",
                                           vk::to_string(static_cast<vk::Result>(result))));
    }
    m_surface = vk::SurfaceKHR(surface_c);
    return {};
}

std::expected<void, std::string> Window::create_swapchain()
{
    auto physical_device = m_context->physical_device();

    auto supported_res = physical_device.getSurfaceSupportKHR(m_context->graphics_queue_family(), m_surface);
    CHECK_VK_RESULT(supported_res, "Could not query surface support {}");
    if (!supported_res.value) {
        return std::unexpected(std::string("Graphics queue cannot present to this surface"));
    }

    auto surface_capabilities_res = physical_device.getSurfaceCapabilitiesKHR(m_surface);
    auto surface_formats_res = physical_device.getSurfaceFormatsKHR(m_surface);
    auto present_modes_res = physical_device.getSurfacePresentModesKHR(m_surface);
    if (surface_formats_res.result != vk::Result::eSuccess ||
        present_modes_res.result != vk::Result::eSuccess ||
        surface_capabilities_res.result != vk::Result::eSuccess ||
        surface_formats_res.value.empty()) {
        return std::unexpected(std::string("Inadequate swapchain support"));
    }

    m_surface_format = choose_surface_format(surface_formats_res.value);
    auto present_mode = choose_present_mode(present_modes_res.value);
    auto surface_capabilities = surface_capabilities_res.value;
    m_extent = choose_extent(surface_capabilities);

    uint32_t image_count = surface_capabilities.minImageCount + 1;
    if (surface_capabilities.maxImageCount > 0 && image_count > surface_capabilities.maxImageCount) {
        image_count = surface_capabilities.maxImageCount;
    }

    auto swapchain_info = vk::SwapchainCreateInfoKHR()
        .setSurface(m_surface)
        .setMinImageCount(image_count)
        .setImageFormat(m_surface_format.format)
        .setImageColorSpace(m_surface_format.colorSpace)
        .setImageExtent(m_extent)
        .setImageArrayLayers(1)
        .setImageUsage(vk::ImageUsageFlagBits::eColorAttachment)
        .setImageSharingMode(vk::SharingMode::eExclusive)
        .setPreTransform(surface_capabilities.currentTransform)
        .setCompositeAlpha(vk::CompositeAlphaFlagBitsKHR::eOpaque)
        .setPresentMode(present_mode)
        .setClipped(true);

    auto swapchain_res = m_device.createSwapchainKHR(swapchain_info);
    CHECK_VK_RESULT(swapchain_res, "Could not create swapchain {}");
    m_swapchain = swapchain_res.value;

    auto images_res = m_device.getSwapchainImagesKHR(m_swapchain);
    CHECK_VK_RESULT(images_res, "Could not get swapchain images {}");

    m_images.clear();
    for (auto image : images_res.value) {
        auto wrapped = VulkanImage::wrap(m_device, image, m_extent, m_surface_format.format);
        if (!wrapped) {
            return std::unexpected(wrapped.error());
        }
        m_images.push_back(std::move(*wrapped));
    }
    m_presented_signals.assign(m_images.size(), nullptr);

    Logger::instance().debug("Swapchain: {} images {}x{} {} {}", m_images.size(), m_extent.width, m_extent.height,
                             vk::to_string(m_surface_format.format), vk::to_string(present_mode));
    return {};
}

std::optional<ImageHandle> Window::next_image()
{
    if (m_needs_resize) {
        if (auto result = recreate_swapchain(); !result) {
            fatal("acquire", "", fmt::format("swapchain rebuild failed: {}", result.error()));
        }
        return std::nullopt;
    }

    auto signal = VulkanCompletionSignal::create(m_device, false);
    if (!signal) {
        fatal("acquire", "", signal.error());
    }

    auto next_img_res = m_device.acquireNextImageKHR(m_swapchain, UINT64_MAX, signal.value()->semaphore(), nullptr);
    auto acquire_result = next_img_res.result;
    if (acquire_result == vk::Result::eErrorOutOfDateKHR) {
        // Nothing was acquired, so the semaphore has no pending signal.
        if (auto result = recreate_swapchain(); !result) {
            fatal("acquire", "", fmt::format("swapchain rebuild failed: {}", result.error()));
        }
        return std::nullopt;
    }
    if (acquire_result == vk::Result::eSuboptimalKHR) {
        // The image is still usable; render and present it, rebuild on the next acquire.
        m_needs_resize = true;
    } else if (acquire_result != vk::Result::eSuccess) {
        fatal("acquire", "", fmt::format("acquireNextImageKHR: {}", vk::to_string(acquire_result)));
    }

    m_current_image_index = next_img_res.value;
    m_acquire_signal = std::move(*signal);
    // The previous present of this image has finished with its wait semaphore.
    m_presented_signals[m_current_image_index].reset();
    return m_images[m_current_image_index];
}

CompletionSignalHandle Window::get_future()
{
    return m_acquire_signal;
}

bool Window::present_future(const CompletionSignalHandle& signal)
{
    auto vk_signal = std::dynamic_pointer_cast<VulkanCompletionSignal>(signal);
    if (!vk_signal) {
        fatal("present", "", "signal is null or was not created by the Vulkan backend");
    }

    auto wait_semaphore = vk_signal->semaphore();
    auto present_info = vk::PresentInfoKHR()
        .setWaitSemaphores(wait_semaphore)
        .setSwapchains(m_swapchain)
        .setImageIndices(m_current_image_index);

    // vulkan-hpp treats eErrorOutOfDateKHR as fatal here, so go through the C entry point.
    auto present_result = static_cast<vk::Result>(VULKAN_HPP_DEFAULT_DISPATCHER.vkQueuePresentKHR(
        static_cast<VkQueue>(m_context->graphics_queue()),
        reinterpret_cast<const VkPresentInfoKHR*>(&present_info)));

    if (present_result != vk::Result::eSuccess && present_result != vk::Result::eSuboptimalKHR &&
        present_result != vk::Result::eErrorOutOfDateKHR) {
        fatal("present", "", fmt::format("vkQueuePresentKHR: {}", vk::to_string(present_result)));
    }

    // The present may still wait on the semaphore after the submission's fence has signaled.
    m_presented_signals[m_current_image_index] = std::move(vk_signal);

    if (present_result != vk::Result::eSuccess) {
        m_needs_resize = true;
        return present_result == vk::Result::eSuboptimalKHR;
    }
    return true;
}

std::size_t Window::pending_presents() const
{
    return static_cast<std::size_t>(std::count_if(m_presented_signals.begin(), m_presented_signals.end(),
                                                  [](const auto& signal) { return signal != nullptr; }));
}

std::expected<void, std::string> Window::recreate_swapchain()
{
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_window_handle, &width, &height);
    while (width == 0 || height == 0) {
        glfwWaitEvents();
        glfwGetFramebufferSize(m_window_handle, &width, &height);
    }

    if (auto res = m_device.waitIdle(); res != vk::Result::eSuccess) {
        return std::unexpected(fmt::format("waitIdle failed {}", vk::to_string(res)));
    }

    m_acquire_signal.reset();
    m_presented_signals.clear();
    cleanup_swapchain();
    if (auto result = create_swapchain(); !result) {
        return result;
    }
    m_needs_resize = false;
    Logger::instance().info("Swapchain recreated: {}x{}", m_extent.width, m_extent.height);
    return {};
}

void Window::cleanup_swapchain()
{
    m_images.clear();
    if (m_swapchain) {
        m_device.destroySwapchainKHR(m_swapchain);
        m_swapchain = nullptr;
    }
}

vk::SurfaceFormatKHR Window::choose_surface_format(const std::vector<vk::SurfaceFormatKHR>& available_formats) const
{
    for (const auto& format : available_formats) {
        if (format.format == render_passes::DEFAULT_COLOR_FORMAT &&
            format.colorSpace == vk::ColorSpaceKHR::eSrgbNonlinear) {
            return format;
        }
    }
    Logger::instance().warn("Surface does not offer {}, using {}",
                            vk::to_string(render_passes::DEFAULT_COLOR_FORMAT),
                            vk::to_string(available_formats[0].format));
    return available_formats[0];
}

vk::PresentModeKHR Window::choose_present_mode(const std::vector<vk::PresentModeKHR>& available_modes) const
{
    if (m_config.prefer_mailbox) {
        for (const auto& mode : available_modes) {
            if (mode == vk::PresentModeKHR::eMailbox) {
                return mode;
            }
        }
    }
    return vk::PresentModeKHR::eFifo;
}

vk::Extent2D Window::choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities) const
{
    if (capabilities.currentExtent.width != UINT32_MAX) {
        return capabilities.currentExtent;
    }

    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_window_handle, &width, &height);
    vk::Extent2D actual_extent = {static_cast<uint32_t>(width), static_cast<uint32_t>(height)};
    actual_extent.width = std::clamp(actual_extent.width,
        capabilities.minImageExtent.width,
        capabilities.maxImageExtent.width);
    actual_extent.height = std::clamp(actual_extent.height,
        capabilities.minImageExtent.height,
        capabilities.maxImageExtent.height);
    return actual_extent;
}

} // namespace re
