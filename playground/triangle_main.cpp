// Triangle - smallest complete frame loop
// One forward pass rendering a colored triangle straight into the swapchain.

#include <re/Logger.hpp>
#include <re/Object.hpp>
#include <re/Templates.hpp>
#include <re/vulkan/VulkanBackend.hpp>
#include <re/vulkan/VulkanContext.hpp>
#include <re/vulkan/Window.hpp>

int main() {
    re::Logger::instance().set_level(spdlog::level::trace);
    re::Logger::instance().info("Starting triangle example...");

    try {
        re::VulkanContext context(re::VulkanContextConfig{.application_name = "Triangle"});

        auto window = re::Window::create(context, re::WindowConfig{.title = "RenderEngine - Triangle"});
        if (!window) {
            re::Logger::instance().error("Failed to create window: {}", window.error());
            return 1;
        }

        auto backend = re::VulkanBackend::create(context);
        if (!backend) {
            re::Logger::instance().error("Failed to create backend: {}", backend.error());
            return 1;
        }

        auto system = re::templates::forward(**backend, (*window)->format());

        re::ObjectPrototype<re::VPosColor2D> prototype{
            .vertex_shader = "triangle/triangle.vert",
            .fragment_shader = "triangle/triangle.frag",
            .mesh = {
                .vertices = {
                    {{0.0f, -0.5f}, {1.0f, 0.0f, 0.0f}},
                    {{0.5f, 0.5f}, {0.0f, 1.0f, 0.0f}},
                    {{-0.5f, 0.5f}, {0.0f, 0.0f, 1.0f}},
                },
                .indices = {0, 1, 2},
            },
        };
        auto triangle = prototype.build(**backend, system.pipeline_cache(0));

        while (!(*window)->should_close()) {
            (*window)->poll_events();
            if (!system.start_window(**window)) {
                continue;
            }
            system.add_object(triangle);
            if (!system.finish_to_window(**window)) {
                re::Logger::instance().debug("Swapchain went stale, rebuilding before the next frame");
            }
        }

        (*backend)->wait_idle();
        system.print_stats();
        re::Logger::instance().info("Application exited successfully");
        return 0;

    } catch (const std::exception& e) {
        re::Logger::instance().error("Unhandled exception: {}", e.what());
        return 1;
    }
}
