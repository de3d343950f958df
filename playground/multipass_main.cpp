// Multipass - geometry into an offscreen image, then a vignette post-process
// pass that samples it and writes the swapchain image.

#include <re/Logger.hpp>
#include <re/Object.hpp>
#include <re/RenderPasses.hpp>
#include <re/System.hpp>
#include <re/vulkan/VulkanBackend.hpp>
#include <re/vulkan/VulkanContext.hpp>
#include <re/vulkan/Window.hpp>
#include <chrono>
#include <cmath>

namespace {

struct Transform {
    glm::vec2 offset;
    float scale;
    float padding;
};

struct VignetteParams {
    float strength;
    float padding[3];
};

} // anonymous namespace

int main() {
    re::Logger::instance().set_level(spdlog::level::trace);
    re::Logger::instance().info("Starting multipass example...");

    try {
        re::VulkanContext context(re::VulkanContextConfig{.application_name = "Multipass"});

        auto window = re::Window::create(context, re::WindowConfig{.title = "RenderEngine - Multipass"});
        if (!window) {
            re::Logger::instance().error("Failed to create window: {}", window.error());
            return 1;
        }

        auto backend_result = re::VulkanBackend::create(context);
        if (!backend_result) {
            re::Logger::instance().error("Failed to create backend: {}", backend_result.error());
            return 1;
        }
        auto& backend = **backend_result;

        auto geometry_pass = backend.create_render_pass(
            re::render_passes::basic(re::render_passes::SAMPLED_LAYOUT));
        auto post_pass = backend.create_render_pass(
            re::render_passes::basic(re::render_passes::PRESENT_LAYOUT, (*window)->format()));
        if (!geometry_pass || !post_pass) {
            re::Logger::instance().error("Failed to create render passes");
            return 1;
        }

        std::vector<re::Pass> passes = {
            re::Pass{
                .name = "geometry",
                .images_created_tags = {"scene"},
                .images_needed_tags = {},
                .render_pass = *geometry_pass,
            },
            re::Pass{
                .name = "post",
                .images_created_tags = {"output"},
                .images_needed_tags = {"scene"},
                .render_pass = *post_pass,
            },
        };
        re::System system(backend, std::move(passes), {}, "output");

        re::ObjectPrototype<re::VPosColor2D> triangle_prototype{
            .vertex_shader = "triangle/moving.vert",
            .fragment_shader = "triangle/triangle.frag",
            .mesh = {
                .vertices = {
                    {{0.0f, -0.5f}, {1.0f, 0.6f, 0.2f}},
                    {{0.5f, 0.5f}, {0.2f, 1.0f, 0.6f}},
                    {{-0.5f, 0.5f}, {0.6f, 0.2f, 1.0f}},
                },
                .indices = {0, 1, 2},
            },
            .collection = {re::SetData{}.add_uniform(Transform{{0.0f, 0.0f}, 1.0f, 0.0f})},
        };
        auto triangle = triangle_prototype.build(backend, system.pipeline_cache(0), system.object_slot_offset(0));

        auto quad_mesh = re::fullscreen_quad();
        re::ObjectPrototype<re::VPos2D> post_prototype{
            .vertex_shader = "postprocess/fullscreen.vert",
            .fragment_shader = "postprocess/vignette.frag",
            .mesh = quad_mesh,
            .collection = {re::SetData{}.add_uniform(VignetteParams{1.5f, {}})},
        };
        auto post = post_prototype.build(backend, system.pipeline_cache(1), system.object_slot_offset(1));

        auto start_time = std::chrono::steady_clock::now();
        while (!(*window)->should_close()) {
            (*window)->poll_events();

            float t = std::chrono::duration<float>(std::chrono::steady_clock::now() - start_time).count();
            auto& transform = triangle.collection().set(0);
            transform.data().write_uniform(0, Transform{{0.4f * std::cos(t), 0.4f * std::sin(t)}, 0.8f, 0.0f});

            if (!system.start_window(**window)) {
                continue;
            }
            transform.upload(backend);
            system.add_object(triangle);
            system.next_pass();
            system.add_object(post);
            if (!system.finish_to_window(**window)) {
                re::Logger::instance().debug("Swapchain went stale, rebuilding before the next frame");
            }
        }

        backend.wait_idle();
        system.print_stats();
        re::Logger::instance().info("Application exited successfully");
        return 0;

    } catch (const std::exception& e) {
        re::Logger::instance().error("Unhandled exception: {}", e.what());
        return 1;
    }
}
