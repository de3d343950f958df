#include <re/Error.hpp>
#include <re/RenderPasses.hpp>
#include <re/Templates.hpp>

namespace re::templates {

namespace {

RenderPassHandle make_render_pass(Backend& backend, const RenderPassDesc& desc)
{
    auto render_pass = backend.create_render_pass(desc);
    if (!render_pass) {
        fatal("system setup", "geometry", render_pass.error());
    }
    return *render_pass;
}

System single_pass(Backend& backend, const RenderPassDesc& desc, std::vector<std::string> tags, std::string output)
{
    std::vector<Pass> passes;
    passes.push_back(Pass{
        .name = "geometry",
        .images_created_tags = std::move(tags),
        .images_needed_tags = {},
        .render_pass = make_render_pass(backend, desc),
    });
    return System{backend, std::move(passes), {}, std::move(output)};
}

} // anonymous namespace

System forward(Backend& backend, vk::Format color_format)
{
    return single_pass(backend, render_passes::basic(render_passes::PRESENT_LAYOUT, color_format),
                       {"color"}, "color");
}

System forward_with_depth(Backend& backend, vk::Format color_format)
{
    return single_pass(backend, render_passes::with_depth(render_passes::PRESENT_LAYOUT, color_format),
                       {"color", "depth"}, "color");
}

System forward_msaa_depth(Backend& backend, vk::SampleCountFlagBits samples, vk::Format color_format)
{
    return single_pass(backend,
                       render_passes::multisampled_with_depth(samples, render_passes::PRESENT_LAYOUT, color_format),
                       {"resolve_color", "color", "depth"}, "resolve_color");
}

} // namespace re::templates
