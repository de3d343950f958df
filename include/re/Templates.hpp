#pragma once

#include <re/Backend.hpp>
#include <re/System.hpp>

/// Single-pass Systems for plain forward rendering.
namespace re::templates {

/// One pass "geometry" writing "color", which is the output.
[[nodiscard]] System forward(Backend& backend, vk::Format color_format = vk::Format::eB8G8R8A8Unorm);

/// As forward, plus a depth buffer tagged "depth".
[[nodiscard]] System forward_with_depth(Backend& backend, vk::Format color_format = vk::Format::eB8G8R8A8Unorm);

/// Multisampled color and depth resolved into the output "resolve_color".
[[nodiscard]] System forward_msaa_depth(
    Backend& backend,
    vk::SampleCountFlagBits samples = vk::SampleCountFlagBits::e4,
    vk::Format color_format = vk::Format::eB8G8R8A8Unorm
);

} // namespace re::templates
