#pragma once

#include <re/Backend.hpp>
#include <re/CacheStats.hpp>
#include <re/ImageRegistry.hpp>
#include <re/Pass.hpp>
#include <re/PipelineSpec.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace re {

/**
 * @brief Memoizes the pass-level binding sets that expose input images
 *
 * For a pass that needs images, each pipeline gets one binding set at slot 0
 * holding those images in images_needed_tags order. Entries are tied to the
 * registry generation they were built from and are dropped when it changes.
 */
class CollectionCache {
public:
    CollectionCache(Backend& backend, std::string pass_name);

    /**
     * @brief Binding sets to bind ahead of the object's own sets
     *
     * @return Empty when the pass needs no images, otherwise one set at slot 0
     * @throws FatalError if a needed tag is absent from the registry, or more
     *         images are needed than the backend allows in a single set
     */
    [[nodiscard]] std::vector<BindingSetHandle> get(
        const PipelineSpec& spec,
        const PipelineHandle& pipeline,
        const Pass& pass,
        const ImageRegistry& registry
    );

    void clear();

    [[nodiscard]] std::size_t size() const { return m_collections.size(); }
    [[nodiscard]] const CacheStats& stats() const { return m_stats; }
    void print_stats() const;

private:
    std::vector<BindingSetHandle> build(const PipelineHandle& pipeline, const Pass& pass, const ImageRegistry& registry);

    Backend* m_backend;
    std::string m_pass_name;
    std::unordered_map<PipelineSpec, std::vector<BindingSetHandle>, PipelineSpecHash> m_collections;
    uint64_t m_generation = 0;
    CacheStats m_stats;
};

} // namespace re
