#include <re/Error.hpp>
#include <re/Logger.hpp>
#include <re/PipelineCache.hpp>
#include <chrono>

namespace re {

PipelineCache::PipelineCache(Backend& backend, RenderPassHandle render_pass, std::string pass_name)
    : m_backend(&backend)
    , m_render_pass(std::move(render_pass))
    , m_pass_name(std::move(pass_name))
{
}

PipelineHandle PipelineCache::get(const PipelineSpec& spec)
{
    if (auto it = m_pipelines.find(spec); it != m_pipelines.end()) {
        ++m_stats.hits;
        return it->second;
    }

    ++m_stats.misses;
    Logger::instance().debug("Building pipeline '{}' + '{}' for pass '{}'",
                             spec.vertex_shader.string(), spec.fragment_shader.string(), m_pass_name);

    auto start = std::chrono::steady_clock::now();
    auto pipeline = m_backend->create_pipeline(spec, m_render_pass, 0);
    m_stats.build_times.emplace_back(std::chrono::steady_clock::now() - start);

    if (!pipeline) {
        fatal("pipeline build", m_pass_name,
              fmt::format("shaders '{}' + '{}': {}", spec.vertex_shader.string(),
                          spec.fragment_shader.string(), pipeline.error()));
    }

    m_pipelines.emplace(spec, *pipeline);
    return *pipeline;
}

bool PipelineCache::contains(const PipelineSpec& spec) const
{
    return m_pipelines.contains(spec);
}

void PipelineCache::print_stats() const
{
    m_stats.log("PipelineCache", m_pass_name);
}

} // namespace re
