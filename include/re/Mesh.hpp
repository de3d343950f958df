#pragma once

#include <re/Backend.hpp>
#include <re/Vertex.hpp>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace re {

struct MeshBuffers {
    BufferHandle vertex_buffer;
    BufferHandle index_buffer;
    uint32_t index_count = 0;
};

/// Indexed triangle data, uploaded once into immutable buffers.
template<Vertex V>
struct Mesh {
    std::vector<V> vertices;
    std::vector<uint32_t> indices;

    [[nodiscard]] std::expected<MeshBuffers, std::string> upload(Backend& backend) const
    {
        if (vertices.empty() || indices.empty()) {
            return std::unexpected(std::string("mesh has no vertices or no indices"));
        }

        auto vertex_buffer = backend.create_buffer(
            std::as_bytes(std::span(vertices)), vk::BufferUsageFlagBits::eVertexBuffer);
        if (!vertex_buffer) {
            return std::unexpected(fmt::format("vertex buffer: {}", vertex_buffer.error()));
        }

        auto index_buffer = backend.create_buffer(
            std::as_bytes(std::span(indices)), vk::BufferUsageFlagBits::eIndexBuffer);
        if (!index_buffer) {
            return std::unexpected(fmt::format("index buffer: {}", index_buffer.error()));
        }

        return MeshBuffers{
            .vertex_buffer = std::move(*vertex_buffer),
            .index_buffer = std::move(*index_buffer),
            .index_count = static_cast<uint32_t>(indices.size()),
        };
    }
};

/// Two triangles covering clip space, for post-processing passes.
[[nodiscard]] Mesh<VPos2D> fullscreen_quad();

} // namespace re
