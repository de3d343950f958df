#include <re/Object.hpp>

namespace re {

Object::Object(
    PipelineSpec spec,
    MeshBuffers mesh,
    Collection collection,
    std::optional<DynamicState> custom_dynamic_state
)
    : m_spec(std::move(spec))
    , m_mesh(std::move(mesh))
    , m_collection(std::move(collection))
    , m_custom_dynamic_state(custom_dynamic_state)
{
}

std::vector<BindingSetHandle> Object::resolved_bindings(
    Backend& backend,
    const PipelineHandle& pipeline,
    uint32_t first_slot
) {
    return m_collection.resolve(backend, pipeline, first_slot);
}

} // namespace re
