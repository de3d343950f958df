#include <re/RenderPasses.hpp>

namespace re::render_passes {

namespace {

AttachmentInfo color(vk::Format format, vk::SampleCountFlagBits samples, vk::ImageLayout final_layout)
{
    return AttachmentInfo{
        .format = format,
        .samples = samples,
        .load_op = vk::AttachmentLoadOp::eClear,
        .store_op = vk::AttachmentStoreOp::eStore,
        .final_layout = final_layout,
        .clear_value = vk::ClearColorValue(std::array<float, 4>{0.0f, 0.0f, 0.0f, 1.0f}),
    };
}

AttachmentInfo depth(vk::Format format, vk::SampleCountFlagBits samples, vk::AttachmentStoreOp store_op,
                     vk::ImageLayout final_layout)
{
    return AttachmentInfo{
        .format = format,
        .samples = samples,
        .load_op = vk::AttachmentLoadOp::eClear,
        .store_op = store_op,
        .final_layout = final_layout,
        .clear_value = vk::ClearDepthStencilValue(1.0f, 0),
    };
}

} // anonymous namespace

RenderPassDesc basic(vk::ImageLayout color_final_layout, vk::Format color_format)
{
    return RenderPassDesc{
        .attachments = {color(color_format, vk::SampleCountFlagBits::e1, color_final_layout)},
        .color_attachments = {0},
        .depth_attachment = std::nullopt,
        .resolve_attachments = {},
    };
}

RenderPassDesc with_depth(vk::ImageLayout color_final_layout, vk::Format color_format)
{
    return RenderPassDesc{
        .attachments = {
            color(color_format, vk::SampleCountFlagBits::e1, color_final_layout),
            depth(DEFAULT_DEPTH_FORMAT, vk::SampleCountFlagBits::e1, vk::AttachmentStoreOp::eDontCare,
                  vk::ImageLayout::eDepthStencilAttachmentOptimal),
        },
        .color_attachments = {0},
        .depth_attachment = 1,
        .resolve_attachments = {},
    };
}

RenderPassDesc only_depth(vk::Format depth_format)
{
    return RenderPassDesc{
        .attachments = {
            depth(depth_format, vk::SampleCountFlagBits::e1, vk::AttachmentStoreOp::eStore,
                  vk::ImageLayout::eShaderReadOnlyOptimal),
        },
        .color_attachments = {},
        .depth_attachment = 0,
        .resolve_attachments = {},
    };
}

RenderPassDesc multisampled_with_depth(vk::SampleCountFlagBits samples, vk::ImageLayout color_final_layout,
                                       vk::Format color_format)
{
    auto resolve_color = color(color_format, vk::SampleCountFlagBits::e1, color_final_layout);
    resolve_color.load_op = vk::AttachmentLoadOp::eDontCare;

    auto ms_color = color(color_format, samples, vk::ImageLayout::eColorAttachmentOptimal);
    ms_color.store_op = vk::AttachmentStoreOp::eDontCare;

    return RenderPassDesc{
        .attachments = {
            resolve_color,
            ms_color,
            depth(DEFAULT_DEPTH_FORMAT, samples, vk::AttachmentStoreOp::eDontCare,
                  vk::ImageLayout::eDepthStencilAttachmentOptimal),
        },
        .color_attachments = {1},
        .depth_attachment = 2,
        .resolve_attachments = {0},
    };
}

} // namespace re::render_passes
