#pragma once

#include <re/Backend.hpp>
#include <re/CacheStats.hpp>
#include <re/PipelineSpec.hpp>
#include <string>
#include <unordered_map>

namespace re {

/**
 * @brief Memoizes pipelines built for one pass's render pass
 *
 * Equal specs always yield the same handle. A spec that fails to build is a
 * fatal configuration error.
 */
class PipelineCache {
public:
    PipelineCache(Backend& backend, RenderPassHandle render_pass, std::string pass_name);

    /**
     * @brief Return the pipeline for spec, building it on first request
     *
     * @throws FatalError if the backend cannot build the pipeline
     */
    [[nodiscard]] PipelineHandle get(const PipelineSpec& spec);

    [[nodiscard]] bool contains(const PipelineSpec& spec) const;
    [[nodiscard]] std::size_t size() const { return m_pipelines.size(); }
    [[nodiscard]] const CacheStats& stats() const { return m_stats; }
    [[nodiscard]] const std::string& pass_name() const { return m_pass_name; }

    void print_stats() const;

private:
    Backend* m_backend;
    RenderPassHandle m_render_pass;
    std::string m_pass_name;
    std::unordered_map<PipelineSpec, PipelineHandle, PipelineSpecHash> m_pipelines;
    CacheStats m_stats;
};

} // namespace re
