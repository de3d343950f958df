#include <re/Backend.hpp>

namespace re {

bool AttachmentInfo::is_depth() const
{
    switch (format) {
        case vk::Format::eD16Unorm:
        case vk::Format::eX8D24UnormPack32:
        case vk::Format::eD32Sfloat:
        case vk::Format::eD16UnormS8Uint:
        case vk::Format::eD24UnormS8Uint:
        case vk::Format::eD32SfloatS8Uint:
            return true;
        default:
            return false;
    }
}

vk::SampleCountFlagBits RenderPassDesc::rasterization_samples() const
{
    if (!color_attachments.empty()) {
        return attachments.at(color_attachments.front()).samples;
    }
    if (depth_attachment) {
        return attachments.at(*depth_attachment).samples;
    }
    return vk::SampleCountFlagBits::e1;
}

std::vector<vk::ClearValue> RenderPassDesc::clear_values() const
{
    std::vector<vk::ClearValue> values;
    values.reserve(attachments.size());
    for (const auto& attachment : attachments) {
        values.push_back(attachment.clear_value);
    }
    return values;
}

DynamicState DynamicState::full(vk::Extent2D extent)
{
    return region(0.0f, 0.0f, static_cast<float>(extent.width), static_cast<float>(extent.height));
}

DynamicState DynamicState::region(float x, float y, float width, float height)
{
    DynamicState state;
    state.viewport = vk::Viewport()
        .setX(x)
        .setY(y)
        .setWidth(width)
        .setHeight(height)
        .setMinDepth(0.0f)
        .setMaxDepth(1.0f);
    state.scissor = vk::Rect2D()
        .setOffset({static_cast<int32_t>(x), static_cast<int32_t>(y)})
        .setExtent({static_cast<uint32_t>(width), static_cast<uint32_t>(height)});
    return state;
}

} // namespace re
