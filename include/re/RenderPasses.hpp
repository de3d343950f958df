#pragma once

#include <re/Backend.hpp>

/**
 * @brief Ready-made single-subpass render pass layouts
 *
 * Each function returns the description; create it with
 * Backend::create_render_pass. Attachment order matches the images_created_tags
 * the templates in Templates.hpp use.
 */
namespace re::render_passes {

inline constexpr vk::Format DEFAULT_COLOR_FORMAT = vk::Format::eB8G8R8A8Unorm;
inline constexpr vk::Format DEFAULT_DEPTH_FORMAT = vk::Format::eD16Unorm;

/// Final layout for passes whose color output is presented.
inline constexpr vk::ImageLayout PRESENT_LAYOUT = vk::ImageLayout::ePresentSrcKHR;
/// Final layout for passes whose output is sampled later.
inline constexpr vk::ImageLayout SAMPLED_LAYOUT = vk::ImageLayout::eShaderReadOnlyOptimal;

/// color
[[nodiscard]] RenderPassDesc basic(
    vk::ImageLayout color_final_layout = PRESENT_LAYOUT,
    vk::Format color_format = DEFAULT_COLOR_FORMAT
);

/// color, depth
[[nodiscard]] RenderPassDesc with_depth(
    vk::ImageLayout color_final_layout = PRESENT_LAYOUT,
    vk::Format color_format = DEFAULT_COLOR_FORMAT
);

/// depth, kept for sampling
[[nodiscard]] RenderPassDesc only_depth(vk::Format depth_format = DEFAULT_DEPTH_FORMAT);

/// resolve color, multisampled color, multisampled depth
[[nodiscard]] RenderPassDesc multisampled_with_depth(
    vk::SampleCountFlagBits samples,
    vk::ImageLayout color_final_layout = PRESENT_LAYOUT,
    vk::Format color_format = DEFAULT_COLOR_FORMAT
);

} // namespace re::render_passes
