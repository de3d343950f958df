#pragma once

#include <re/Backend.hpp>
#include <re/Collection.hpp>
#include <re/Error.hpp>
#include <re/Mesh.hpp>
#include <re/PipelineCache.hpp>
#include <re/PipelineSpec.hpp>
#include <optional>
#include <vector>

namespace re {

/**
 * @brief Anything a System can draw
 *
 * The System asks for the pipeline spec, buffers, index count and the
 * object's own binding sets, which it binds right after the pass-level sets.
 */
class Drawcall {
public:
    virtual ~Drawcall() = default;

    [[nodiscard]] virtual const PipelineSpec& pipeline_spec() const = 0;
    [[nodiscard]] virtual BufferHandle vertex_buffer() const = 0;
    [[nodiscard]] virtual BufferHandle index_buffer() const = 0;
    [[nodiscard]] virtual uint32_t index_count() const = 0;

    /**
     * @brief Binding sets of this object for pipeline
     *
     * @param first_slot Slot of the first set, following the pass-level sets
     */
    [[nodiscard]] virtual std::vector<BindingSetHandle> resolved_bindings(
        Backend& backend,
        const PipelineHandle& pipeline,
        uint32_t first_slot
    ) = 0;

    /// Overrides the full-extent viewport when set.
    [[nodiscard]] virtual std::optional<DynamicState> custom_dynamic_state() const = 0;
};

/**
 * @brief Mesh buffers plus the pipeline spec and collection to draw them with
 *
 * Spec, collection and dynamic state may be changed between frames.
 */
class Object final : public Drawcall {
public:
    Object(
        PipelineSpec spec,
        MeshBuffers mesh,
        Collection collection = {},
        std::optional<DynamicState> custom_dynamic_state = std::nullopt
    );

    [[nodiscard]] const PipelineSpec& pipeline_spec() const override { return m_spec; }
    [[nodiscard]] BufferHandle vertex_buffer() const override { return m_mesh.vertex_buffer; }
    [[nodiscard]] BufferHandle index_buffer() const override { return m_mesh.index_buffer; }
    [[nodiscard]] uint32_t index_count() const override { return m_mesh.index_count; }
    [[nodiscard]] std::vector<BindingSetHandle> resolved_bindings(
        Backend& backend,
        const PipelineHandle& pipeline,
        uint32_t first_slot
    ) override;
    [[nodiscard]] std::optional<DynamicState> custom_dynamic_state() const override { return m_custom_dynamic_state; }

    void set_pipeline_spec(PipelineSpec spec) { m_spec = std::move(spec); }
    void set_custom_dynamic_state(std::optional<DynamicState> state) { m_custom_dynamic_state = state; }
    [[nodiscard]] Collection& collection() { return m_collection; }
    [[nodiscard]] const Collection& collection() const { return m_collection; }

private:
    PipelineSpec m_spec;
    MeshBuffers m_mesh;
    Collection m_collection;
    std::optional<DynamicState> m_custom_dynamic_state;
};

/// Everything needed to turn a mesh into an Object for one pass.
template<Vertex V>
struct ObjectPrototype {
    std::filesystem::path vertex_shader;
    std::filesystem::path fragment_shader;
    vk::PrimitiveTopology topology = vk::PrimitiveTopology::eTriangleList;
    bool read_depth = false;
    bool write_depth = false;
    Mesh<V> mesh;
    std::vector<SetData> collection;
    std::optional<DynamicState> custom_dynamic_state;

    [[nodiscard]] PipelineSpec pipeline_spec() const
    {
        return PipelineSpec{
            .vertex_shader = vertex_shader,
            .fragment_shader = fragment_shader,
            .topology = topology,
            .read_depth = read_depth,
            .write_depth = write_depth,
            .vertex_layout = V::layout(),
        };
    }

    /**
     * @brief Upload the mesh and build the collection against the pass's pipeline
     *
     * @param cache Pipeline cache of the pass the object will be drawn in
     * @param first_slot Slot of the object's first set, see System::object_slot_offset
     * @throws FatalError if the mesh cannot be uploaded or the pipeline built
     */
    [[nodiscard]] Object build(Backend& backend, PipelineCache& cache, uint32_t first_slot = 0) const
    {
        auto spec = pipeline_spec();
        auto buffers = mesh.upload(backend);
        if (!buffers) {
            fatal("object build", cache.pass_name(), buffers.error());
        }
        auto pipeline = cache.get(spec);
        Collection sets{backend, pipeline, collection, first_slot};
        return Object{std::move(spec), std::move(*buffers), std::move(sets), custom_dynamic_state};
    }
};

} // namespace re
