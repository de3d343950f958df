#pragma once

#include <re/Backend.hpp>
#include <string>
#include <vector>

namespace re {

/**
 * @brief One rendering stage of a System
 *
 * images_created_tags[k] names the image bound to attachment k of the render
 * pass. images_needed_tags are sampled, in order, from binding set 0 of every
 * pipeline drawn in this pass.
 */
struct Pass {
    std::string name;
    std::vector<std::string> images_created_tags;
    std::vector<std::string> images_needed_tags;
    RenderPassHandle render_pass;

    [[nodiscard]] bool needs_images() const { return !images_needed_tags.empty(); }
};

} // namespace re
