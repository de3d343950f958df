#include <re/Error.hpp>
#include <re/Logger.hpp>
#include <re/System.hpp>
#include <set>

namespace re {

System::System(Backend& backend, std::vector<Pass> passes, CustomImages custom_images, std::string output_tag)
    : m_backend(&backend)
    , m_passes(std::move(passes))
    , m_custom_images(std::move(custom_images))
    , m_output_tag(std::move(output_tag))
{
    validate();

    m_pipeline_caches.reserve(m_passes.size());
    m_collection_caches.reserve(m_passes.size());
    for (const auto& pass : m_passes) {
        m_pipeline_caches.emplace_back(backend, pass.render_pass, pass.name);
        m_collection_caches.emplace_back(backend, pass.name);
    }

    Logger::instance().debug("System created: {} passes, {} custom images, output '{}'",
                             m_passes.size(), m_custom_images.size(), m_output_tag);
}

void System::validate() const
{
    if (m_passes.empty()) {
        fatal("system setup", "", "a system needs at least one pass");
    }

    for (const auto& [tag, image] : m_custom_images) {
        if (!image) {
            fatal("system setup", "", fmt::format("custom image '{}' is null", tag));
        }
    }

    std::set<std::string, std::less<>> names;
    std::set<std::string, std::less<>> available;
    for (const auto& [tag, image] : m_custom_images) {
        available.insert(tag);
    }

    for (const auto& pass : m_passes) {
        if (!names.insert(pass.name).second) {
            fatal("system setup", pass.name, "pass name used twice");
        }
        if (!pass.render_pass) {
            fatal("system setup", pass.name, "pass has no render pass");
        }
        if (pass.images_created_tags.empty()) {
            fatal("system setup", pass.name, "pass creates no images");
        }
        auto attachment_count = pass.render_pass->desc().attachments.size();
        if (pass.images_created_tags.size() != attachment_count) {
            fatal("system setup", pass.name,
                  fmt::format("pass creates {} images but its render pass has {} attachments",
                              pass.images_created_tags.size(), attachment_count));
        }
        for (const auto& tag : pass.images_needed_tags) {
            if (!available.contains(tag)) {
                fatal("system setup", pass.name,
                      fmt::format("input '{}' is not created by an earlier pass nor supplied", tag));
            }
        }
        available.insert(pass.images_created_tags.begin(), pass.images_created_tags.end());
    }

    bool output_created = false;
    for (const auto& pass : m_passes) {
        for (const auto& tag : pass.images_created_tags) {
            output_created = output_created || tag == m_output_tag;
        }
    }
    if (!output_created) {
        fatal("system setup", "", fmt::format("no pass creates output image '{}'", m_output_tag));
    }
}

void System::start(const ImageHandle& destination)
{
    if (auto* active = std::get_if<Recording>(&m_state)) {
        fatal("start", m_passes[active->pass_index].name, "previous frame was never finished");
    }
    if (!destination) {
        fatal("start", "", "destination image is null");
    }

    auto dimensions = destination->extent();
    ensure_images(dimensions);
    bind_images(destination);

    std::vector<FramebufferHandle> framebuffers;
    framebuffers.reserve(m_passes.size());
    for (const auto& pass : m_passes) {
        std::vector<ImageHandle> attachments;
        attachments.reserve(pass.images_created_tags.size());
        for (const auto& tag : pass.images_created_tags) {
            attachments.push_back(m_registry.find(tag));
        }
        auto framebuffer = m_backend->create_framebuffer(pass.render_pass, attachments);
        if (!framebuffer) {
            fatal("start", pass.name, fmt::format("framebuffer: {}", framebuffer.error()));
        }
        framebuffers.push_back(std::move(*framebuffer));
    }

    auto sequence = m_backend->begin_sequence();
    if (!sequence) {
        fatal("start", m_passes.front().name, fmt::format("command sequence: {}", sequence.error()));
    }

    m_backend->begin_render_pass(**sequence, m_passes.front().render_pass, framebuffers.front());
    m_state = Recording{
        .sequence = std::move(*sequence),
        .pass_index = 0,
        .framebuffers = std::move(framebuffers),
        .dimensions = dimensions,
    };
}

bool System::start_window(SwapchainTarget& target)
{
    auto image = target.next_image();
    if (!image) {
        Logger::instance().debug("Swapchain image unavailable, skipping frame");
        return false;
    }
    start(*image);
    return true;
}

void System::add_object(Drawcall& object)
{
    auto& active = recording("add object");
    auto index = active.pass_index;
    const auto& pass = m_passes[index];
    const auto& spec = object.pipeline_spec();

    auto pipeline = m_pipeline_caches[index].get(spec);
    auto sets = m_collection_caches[index].get(spec, pipeline, pass, m_registry);
    auto own_sets = object.resolved_bindings(*m_backend, pipeline, static_cast<uint32_t>(sets.size()));
    sets.insert(sets.end(), own_sets.begin(), own_sets.end());

    DrawCommand command{
        .pipeline = std::move(pipeline),
        .dynamic_state = object.custom_dynamic_state().value_or(DynamicState::full(active.dimensions)),
        .vertex_buffer = object.vertex_buffer(),
        .index_buffer = object.index_buffer(),
        .index_count = object.index_count(),
        .binding_sets = std::move(sets),
    };
    m_backend->draw_indexed(*active.sequence, command);
}

void System::next_pass()
{
    auto& active = recording("next pass");
    if (active.pass_index + 1 >= m_passes.size()) {
        fatal("next pass", m_passes[active.pass_index].name,
              fmt::format("already at the last of {} passes", m_passes.size()));
    }

    m_backend->end_render_pass(*active.sequence);
    ++active.pass_index;
    m_backend->begin_render_pass(*active.sequence, m_passes[active.pass_index].render_pass,
                                 active.framebuffers[active.pass_index]);
}

CompletionSignalHandle System::finish(const CompletionSignalHandle& dependency)
{
    auto& active = recording("finish");
    const auto& pass_name = m_passes[active.pass_index].name;
    if (active.pass_index + 1 < m_passes.size()) {
        Logger::instance().warn("Frame finished in pass '{}', {} later passes were not recorded",
                                pass_name, m_passes.size() - active.pass_index - 1);
    }

    m_backend->end_render_pass(*active.sequence);
    auto sequence = std::move(active.sequence);
    m_state = Idle{};

    auto signal = m_backend->submit(std::move(sequence), dependency);
    if (!signal) {
        fatal("finish", pass_name, signal.error());
    }
    return *signal;
}

bool System::finish_to_window(SwapchainTarget& target)
{
    auto signal = finish(target.get_future());
    return target.present_future(signal);
}

void System::set_output_tag(std::string tag)
{
    bool created = false;
    for (const auto& pass : m_passes) {
        for (const auto& created_tag : pass.images_created_tags) {
            created = created || created_tag == tag;
        }
    }
    if (!created) {
        fatal("set output tag", "", fmt::format("no pass creates image '{}'", tag));
    }
    m_output_tag = std::move(tag);
}

bool System::is_recording() const
{
    return std::holds_alternative<Recording>(m_state);
}

std::optional<std::size_t> System::current_pass() const
{
    return std::visit(overloaded{
        [](const Idle&) -> std::optional<std::size_t> { return std::nullopt; },
        [](const Recording& active) -> std::optional<std::size_t> { return active.pass_index; },
    }, m_state);
}

uint32_t System::object_slot_offset(std::size_t pass_index) const
{
    return m_passes.at(pass_index).needs_images() ? 1u : 0u;
}

void System::print_stats() const
{
    for (std::size_t i = 0; i < m_passes.size(); i++) {
        m_pipeline_caches[i].print_stats();
        m_collection_caches[i].print_stats();
    }
}

System::Recording& System::recording(std::string_view stage)
{
    auto* active = std::get_if<Recording>(&m_state);
    if (!active) {
        fatal(stage, "", "no frame is being recorded, call start() first");
    }
    return *active;
}

void System::ensure_images(vk::Extent2D dimensions)
{
    if (m_image_set && m_image_set->dimensions == dimensions && m_image_set->output_tag == m_output_tag) {
        return;
    }

    ImageSet image_set{.dimensions = dimensions, .output_tag = m_output_tag, .images = {}};
    for (const auto& pass : m_passes) {
        const auto& attachments = pass.render_pass->desc().attachments;
        for (std::size_t k = 0; k < pass.images_created_tags.size(); k++) {
            const auto& tag = pass.images_created_tags[k];
            if (tag == m_output_tag || m_custom_images.contains(tag) || image_set.images.contains(tag)) {
                continue;
            }
            const auto& attachment = attachments[k];
            auto image = m_backend->create_image(dimensions, attachment.samples, attachment.format);
            if (!image) {
                fatal("start", pass.name, fmt::format("image '{}': {}", tag, image.error()));
            }
            image_set.images.emplace(tag, std::move(*image));
        }
    }

    ++m_generation;
    Logger::instance().info("Allocated {} intermediate images at {}x{}",
                            image_set.images.size(), dimensions.width, dimensions.height);
    m_image_set = std::move(image_set);
}

void System::bind_images(const ImageHandle& destination)
{
    if (m_last_destination.lock() != destination && output_is_sampled()) {
        ++m_generation;
    }
    m_last_destination = destination;

    m_registry.clear();
    for (const auto& [tag, image] : m_image_set->images) {
        m_registry.insert(tag, image);
    }
    m_registry.insert(m_output_tag, destination);
    for (const auto& [tag, image] : m_custom_images) {
        m_registry.insert(tag, image);
    }
    m_registry.set_generation(m_generation);
}

bool System::output_is_sampled() const
{
    for (const auto& pass : m_passes) {
        for (const auto& tag : pass.images_needed_tags) {
            if (tag == m_output_tag) {
                return true;
            }
        }
    }
    return false;
}

} // namespace re
