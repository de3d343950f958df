#include <re/CollectionCache.hpp>
#include <re/Error.hpp>
#include <re/Logger.hpp>
#include <chrono>

namespace re {

CollectionCache::CollectionCache(Backend& backend, std::string pass_name)
    : m_backend(&backend)
    , m_pass_name(std::move(pass_name))
{
}

std::vector<BindingSetHandle> CollectionCache::get(
    const PipelineSpec& spec,
    const PipelineHandle& pipeline,
    const Pass& pass,
    const ImageRegistry& registry
) {
    if (registry.generation() != m_generation) {
        if (!m_collections.empty()) {
            Logger::instance().debug("Image generation {} -> {}, dropping {} collections of pass '{}'",
                                     m_generation, registry.generation(), m_collections.size(), m_pass_name);
        }
        m_collections.clear();
        m_generation = registry.generation();
    }

    if (auto it = m_collections.find(spec); it != m_collections.end()) {
        ++m_stats.hits;
        return it->second;
    }

    ++m_stats.misses;
    auto start = std::chrono::steady_clock::now();
    auto sets = build(pipeline, pass, registry);
    m_stats.build_times.emplace_back(std::chrono::steady_clock::now() - start);

    m_collections.emplace(spec, sets);
    return sets;
}

std::vector<BindingSetHandle> CollectionCache::build(
    const PipelineHandle& pipeline,
    const Pass& pass,
    const ImageRegistry& registry
) {
    if (!pass.needs_images()) {
        return {};
    }

    auto limit = m_backend->max_images_per_set();
    if (pass.images_needed_tags.size() > limit) {
        fatal("collection build", m_pass_name,
              fmt::format("{} input images requested but a binding set holds at most {}",
                          pass.images_needed_tags.size(), limit));
    }

    std::vector<Binding> bindings;
    bindings.reserve(pass.images_needed_tags.size());
    for (const auto& tag : pass.images_needed_tags) {
        auto image = registry.find(tag);
        if (!image) {
            fatal("collection build", m_pass_name,
                  fmt::format("image '{}' was neither created by an earlier pass nor supplied", tag));
        }
        bindings.emplace_back(ImageBinding{std::move(image)});
    }

    auto set = m_backend->create_binding_set(pipeline, 0, bindings);
    if (!set) {
        fatal("collection build", m_pass_name, set.error());
    }

    Logger::instance().trace("Built input collection with {} images for pass '{}'", bindings.size(), m_pass_name);
    return {*set};
}

void CollectionCache::clear()
{
    m_collections.clear();
}

void CollectionCache::print_stats() const
{
    m_stats.log("CollectionCache", m_pass_name);
}

} // namespace re
