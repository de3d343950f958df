#include <re/Mesh.hpp>

namespace re {

Mesh<VPos2D> fullscreen_quad()
{
    return Mesh<VPos2D>{
        .vertices = {
            {{-1.0f, -1.0f}},
            {{1.0f, -1.0f}},
            {{1.0f, 1.0f}},
            {{-1.0f, 1.0f}},
        },
        .indices = {0, 1, 2, 2, 3, 0},
    };
}

} // namespace re
