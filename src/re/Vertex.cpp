#include <re/Vertex.hpp>
#include <cstddef>

namespace re {

VertexLayout VPos2D::layout()
{
    return VertexLayout{
        .stride = sizeof(VPos2D),
        .attributes = {
            {.location = 0, .offset = offsetof(VPos2D, position), .format = vk::Format::eR32G32Sfloat},
        },
    };
}

VertexLayout VPosColor2D::layout()
{
    return VertexLayout{
        .stride = sizeof(VPosColor2D),
        .attributes = {
            {.location = 0, .offset = offsetof(VPosColor2D, position), .format = vk::Format::eR32G32Sfloat},
            {.location = 1, .offset = offsetof(VPosColor2D, color), .format = vk::Format::eR32G32B32Sfloat},
        },
    };
}

VertexLayout VPosNorm::layout()
{
    return VertexLayout{
        .stride = sizeof(VPosNorm),
        .attributes = {
            {.location = 0, .offset = offsetof(VPosNorm, position), .format = vk::Format::eR32G32B32Sfloat},
            {.location = 1, .offset = offsetof(VPosNorm, normal), .format = vk::Format::eR32G32B32Sfloat},
        },
    };
}

} // namespace re
