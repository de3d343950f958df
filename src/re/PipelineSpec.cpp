#include <re/PipelineSpec.hpp>

namespace re
{

namespace
{

void hash_combine(std::size_t& seed, std::size_t value)
{
	seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

template<typename E>
std::size_t hash_enum(E value)
{
	return std::hash<std::underlying_type_t<E>>{}(static_cast<std::underlying_type_t<E>>(value));
}

} // anonymous namespace

std::vector<vk::VertexInputAttributeDescription> VertexLayout::to_attribute_descriptions() const
{
	std::vector<vk::VertexInputAttributeDescription> out;
	out.reserve(attributes.size());
	for (const auto& attribute : attributes)
	{
		out.push_back(attribute.to_attribute_description(0));
	}
	return out;
}

std::size_t PipelineSpecHash::operator()(const PipelineSpec& spec) const noexcept
{
	std::size_t seed = std::filesystem::hash_value(spec.vertex_shader);
	hash_combine(seed, std::filesystem::hash_value(spec.fragment_shader));
	hash_combine(seed, hash_enum(spec.topology));
	hash_combine(seed, (spec.read_depth ? 1u : 0u) | (spec.write_depth ? 2u : 0u));
	hash_combine(seed, spec.vertex_layout.stride);
	for (const auto& attribute : spec.vertex_layout.attributes)
	{
		hash_combine(seed, attribute.location);
		hash_combine(seed, attribute.offset);
		hash_combine(seed, hash_enum(attribute.format));
	}
	return seed;
}

} // namespace re
