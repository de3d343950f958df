#include <re/ImageRegistry.hpp>

namespace re {

void ImageRegistry::insert(std::string tag, ImageHandle image)
{
    m_images.insert_or_assign(std::move(tag), std::move(image));
}

ImageHandle ImageRegistry::find(std::string_view tag) const
{
    auto it = m_images.find(tag);
    if (it == m_images.end()) {
        return nullptr;
    }
    return it->second;
}

bool ImageRegistry::contains(std::string_view tag) const
{
    return m_images.find(tag) != m_images.end();
}

void ImageRegistry::clear()
{
    m_images.clear();
}

} // namespace re
