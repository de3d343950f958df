//
// Pipeline description used as the key of both per-pass caches.
//

#ifndef RENDERENGINE_PIPELINESPEC_HPP
#define RENDERENGINE_PIPELINESPEC_HPP

#include <re/Common.hpp>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace re
{

struct VertexAttribute
{
	uint32_t location;
	uint32_t offset; // Within the vertex stride
	vk::Format format;

	[[nodiscard]] vk::VertexInputAttributeDescription to_attribute_description(uint32_t binding) const
	{
		return vk::VertexInputAttributeDescription()
			.setLocation(location)
			.setBinding(binding)
			.setFormat(format)
			.setOffset(offset);
	}

	bool operator==(const VertexAttribute&) const = default;
};

/// Memory layout of one vertex, all attributes read from binding 0.
struct VertexLayout
{
	uint32_t stride = 0;
	std::vector<VertexAttribute> attributes;

	[[nodiscard]] vk::VertexInputBindingDescription to_binding_description() const
	{
		return vk::VertexInputBindingDescription()
			.setBinding(0)
			.setStride(stride)
			.setInputRate(vk::VertexInputRate::eVertex);
	}

	[[nodiscard]] std::vector<vk::VertexInputAttributeDescription> to_attribute_descriptions() const;

	bool operator==(const VertexLayout&) const = default;
};

/**
 * @brief Everything needed to build a graphics pipeline for one pass
 *
 * Two specs are equal iff all fields are equal. The vertex layout takes part
 * in equality, so two vertex types with the same shaders get separate
 * pipelines.
 */
struct PipelineSpec
{
	std::filesystem::path vertex_shader;
	std::filesystem::path fragment_shader;
	vk::PrimitiveTopology topology = vk::PrimitiveTopology::eTriangleList;
	bool read_depth = false;
	bool write_depth = false;
	VertexLayout vertex_layout;

	[[nodiscard]] bool uses_depth() const { return read_depth || write_depth; }

	bool operator==(const PipelineSpec&) const = default;
};

struct PipelineSpecHash
{
	[[nodiscard]] std::size_t operator()(const PipelineSpec& spec) const noexcept;
};

} // namespace re

#endif // RENDERENGINE_PIPELINESPEC_HPP
