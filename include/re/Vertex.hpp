#pragma once

#include <re/PipelineSpec.hpp>
#include <glm/glm.hpp>
#include <concepts>
#include <type_traits>

namespace re {

/// A vertex type uploadable as-is that knows its own attribute layout.
template<typename V>
concept Vertex = std::is_trivially_copyable_v<V> && requires {
    { V::layout() } -> std::convertible_to<VertexLayout>;
};

struct VPos2D {
    glm::vec2 position;

    static VertexLayout layout();
};

struct VPosColor2D {
    glm::vec2 position;
    glm::vec3 color;

    static VertexLayout layout();
};

struct VPosNorm {
    glm::vec3 position;
    glm::vec3 normal;

    static VertexLayout layout();
};

} // namespace re
