#ifndef RENDERENGINE_BINDING_HPP
#define RENDERENGINE_BINDING_HPP

#include <cstddef>
#include <memory>
#include <variant>
#include <vector>

namespace re
{

class Image;
using ImageHandle = std::shared_ptr<Image>;

/// Plain data copied into a uniform buffer.
struct UniformBinding
{
	std::vector<std::byte> bytes;
};

/// Image sampled through the backend's sampler.
struct ImageBinding
{
	ImageHandle image;
};

using Binding = std::variant<UniformBinding, ImageBinding>;

} // namespace re

#endif // RENDERENGINE_BINDING_HPP
