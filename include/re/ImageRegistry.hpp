#pragma once

#include <re/Binding.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace re {

/**
 * @brief Tag to image mapping for one frame
 *
 * The generation changes whenever the images behind the tags change, which
 * lets caches holding bindings to them know they are stale.
 */
class ImageRegistry {
public:
    using Map = std::map<std::string, ImageHandle, std::less<>>;

    /// Insert or replace the image for tag.
    void insert(std::string tag, ImageHandle image);

    [[nodiscard]] ImageHandle find(std::string_view tag) const;
    [[nodiscard]] bool contains(std::string_view tag) const;
    [[nodiscard]] std::size_t size() const { return m_images.size(); }
    [[nodiscard]] const Map& images() const { return m_images; }

    [[nodiscard]] uint64_t generation() const { return m_generation; }
    void set_generation(uint64_t generation) { m_generation = generation; }

    void clear();

private:
    Map m_images;
    uint64_t m_generation = 0;
};

} // namespace re
