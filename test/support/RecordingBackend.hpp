#pragma once

#include <re/Backend.hpp>
#include <re/Error.hpp>
#include <re/RenderPasses.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

// In-memory Backend for the core tests. Every handle it returns is one of the
// Mock* types below, so tests can look inside what the engine asked for.
namespace re::test {

struct MockImage final : Image {
    MockImage(vk::Extent2D extent, vk::SampleCountFlagBits samples, vk::Format format)
        : m_extent(extent), m_samples(samples), m_format(format) {}

    [[nodiscard]] vk::Extent2D extent() const override { return m_extent; }
    [[nodiscard]] vk::Format format() const override { return m_format; }
    [[nodiscard]] vk::SampleCountFlagBits samples() const override { return m_samples; }

    vk::Extent2D m_extent;
    vk::SampleCountFlagBits m_samples;
    vk::Format m_format;
};

struct MockBuffer final : Buffer {
    MockBuffer(std::vector<std::byte> data, vk::BufferUsageFlags usage)
        : m_data(std::move(data)), m_usage(usage) {}

    [[nodiscard]] vk::DeviceSize size() const override { return m_data.size(); }

    std::vector<std::byte> m_data;
    vk::BufferUsageFlags m_usage;
};

struct MockRenderPass final : RenderPass {
    explicit MockRenderPass(RenderPassDesc desc) : m_desc(std::move(desc)) {}

    [[nodiscard]] const RenderPassDesc& desc() const override { return m_desc; }

    RenderPassDesc m_desc;
};

struct MockPipeline final : Pipeline {
    MockPipeline(PipelineSpec spec, RenderPassHandle render_pass)
        : m_spec(std::move(spec)), m_render_pass(std::move(render_pass)) {}

    [[nodiscard]] const PipelineSpec& spec() const override { return m_spec; }

    PipelineSpec m_spec;
    RenderPassHandle m_render_pass;
};

struct MockBindingSet final : BindingSet {
    MockBindingSet(PipelineHandle pipeline, uint32_t slot, std::vector<Binding> bindings)
        : m_pipeline(std::move(pipeline)), m_slot(slot), m_bindings(std::move(bindings)) {}

    [[nodiscard]] uint32_t slot() const override { return m_slot; }

    PipelineHandle m_pipeline;
    uint32_t m_slot;
    std::vector<Binding> m_bindings;
};

struct MockFramebuffer final : Framebuffer {
    MockFramebuffer(RenderPassHandle render_pass, std::vector<ImageHandle> images)
        : m_render_pass(std::move(render_pass)), m_images(std::move(images)) {}

    [[nodiscard]] vk::Extent2D extent() const override
    {
        return m_images.empty() ? vk::Extent2D{} : m_images.front()->extent();
    }

    RenderPassHandle m_render_pass;
    std::vector<ImageHandle> m_images;
};

struct BeginPassEvent {
    RenderPassHandle render_pass;
    FramebufferHandle framebuffer;
};

struct EndPassEvent {};

struct DrawEvent {
    DrawCommand command;
};

using Event = std::variant<BeginPassEvent, EndPassEvent, DrawEvent>;

struct MockCommandSequence final : CommandSequence {
    std::vector<Event> events;
};

struct MockCompletionSignal final : CompletionSignal {
    explicit MockCompletionSignal(uint32_t id) : m_id(id) {}

    uint32_t m_id;
};

struct Submission {
    std::vector<Event> events;
    CompletionSignalHandle dependency;
    CompletionSignalHandle signal;
};

class RecordingBackend final : public Backend {
public:
    [[nodiscard]] std::expected<RenderPassHandle, std::string> create_render_pass(const RenderPassDesc& desc) override
    {
        ++render_passes_created;
        return std::make_shared<MockRenderPass>(desc);
    }

    [[nodiscard]] std::expected<PipelineHandle, std::string> create_pipeline(
        const PipelineSpec& spec,
        const RenderPassHandle& render_pass,
        uint32_t
    ) override
    {
        if (failing_shaders.contains(spec.fragment_shader.string())) {
            return std::unexpected(std::string("shader failed to compile"));
        }
        ++pipelines_created;
        return std::make_shared<MockPipeline>(spec, render_pass);
    }

    [[nodiscard]] std::expected<BindingSetHandle, std::string> create_binding_set(
        const PipelineHandle& pipeline,
        uint32_t slot,
        const std::vector<Binding>& bindings
    ) override
    {
        ++binding_sets_created;
        return std::make_shared<MockBindingSet>(pipeline, slot, bindings);
    }

    [[nodiscard]] std::expected<ImageHandle, std::string> create_image(
        vk::Extent2D extent,
        vk::SampleCountFlagBits samples,
        vk::Format format
    ) override
    {
        auto image = std::make_shared<MockImage>(extent, samples, format);
        images_created.push_back(image);
        return image;
    }

    [[nodiscard]] std::expected<BufferHandle, std::string> create_buffer(
        std::span<const std::byte> data,
        vk::BufferUsageFlags usage
    ) override
    {
        if (data.empty()) {
            return std::unexpected(std::string("empty buffer"));
        }
        ++buffers_created;
        return std::make_shared<MockBuffer>(std::vector<std::byte>(data.begin(), data.end()), usage);
    }

    [[nodiscard]] std::expected<FramebufferHandle, std::string> create_framebuffer(
        const RenderPassHandle& render_pass,
        const std::vector<ImageHandle>& images
    ) override
    {
        ++framebuffers_created;
        return std::make_shared<MockFramebuffer>(render_pass, images);
    }

    [[nodiscard]] std::expected<CommandSequenceHandle, std::string> begin_sequence() override
    {
        return std::make_unique<MockCommandSequence>();
    }

    void begin_render_pass(
        CommandSequence& sequence,
        const RenderPassHandle& render_pass,
        const FramebufferHandle& framebuffer
    ) override
    {
        events_of(sequence).emplace_back(BeginPassEvent{render_pass, framebuffer});
    }

    void end_render_pass(CommandSequence& sequence) override
    {
        events_of(sequence).emplace_back(EndPassEvent{});
    }

    void draw_indexed(CommandSequence& sequence, const DrawCommand& command) override
    {
        events_of(sequence).emplace_back(DrawEvent{command});
    }

    [[nodiscard]] std::expected<CompletionSignalHandle, std::string> submit(
        CommandSequenceHandle sequence,
        const CompletionSignalHandle& dependency
    ) override
    {
        if (fail_submit) {
            return std::unexpected(std::string("device lost"));
        }
        auto signal = std::make_shared<MockCompletionSignal>(static_cast<uint32_t>(submissions.size()));
        submissions.push_back(Submission{
            .events = std::move(static_cast<MockCommandSequence&>(*sequence).events),
            .dependency = dependency,
            .signal = signal,
        });
        return signal;
    }

    [[nodiscard]] uint32_t max_images_per_set() const override { return max_images; }

    /// Destination image not owned by any System, like a swapchain image.
    [[nodiscard]] static ImageHandle make_target(uint32_t width, uint32_t height)
    {
        return std::make_shared<MockImage>(vk::Extent2D{width, height}, vk::SampleCountFlagBits::e1,
                                           render_passes::DEFAULT_COLOR_FORMAT);
    }

    uint32_t render_passes_created = 0;
    uint32_t pipelines_created = 0;
    uint32_t binding_sets_created = 0;
    uint32_t buffers_created = 0;
    uint32_t framebuffers_created = 0;
    std::vector<ImageHandle> images_created;
    std::vector<Submission> submissions;

    std::set<std::string> failing_shaders;
    bool fail_submit = false;
    uint32_t max_images = 4;

private:
    static std::vector<Event>& events_of(CommandSequence& sequence)
    {
        return static_cast<MockCommandSequence&>(sequence).events;
    }
};

/// SwapchainTarget handing out images from a queue; an empty slot reports a stale swapchain.
/// The *_failure fields make acquire or present fail the way a lost device does.
class MockSwapchain final : public SwapchainTarget {
public:
    [[nodiscard]] std::optional<ImageHandle> next_image() override
    {
        if (acquire_failure) {
            fatal("acquire", "", *acquire_failure);
        }
        if (pending.empty()) {
            return std::nullopt;
        }
        auto image = pending.front();
        pending.pop_front();
        if (!image) {
            return std::nullopt;
        }
        ++acquired;
        return image;
    }

    [[nodiscard]] CompletionSignalHandle get_future() override { return acquire_signal; }

    bool present_future(const CompletionSignalHandle& signal) override
    {
        if (present_failure) {
            fatal("present", "", *present_failure);
        }
        presented.push_back(signal);
        return !present_stale;
    }

    std::deque<ImageHandle> pending;
    CompletionSignalHandle acquire_signal = std::make_shared<MockCompletionSignal>(1000);
    std::vector<CompletionSignalHandle> presented;
    uint32_t acquired = 0;

    std::optional<std::string> acquire_failure;
    std::optional<std::string> present_failure;
    bool present_stale = false;
};

/// Events of a submission as short names, e.g. {"begin", "draw", "end"}.
[[nodiscard]] inline std::vector<std::string> event_names(const std::vector<Event>& events)
{
    std::vector<std::string> names;
    for (const auto& event : events) {
        names.push_back(std::visit(overloaded{
            [](const BeginPassEvent&) { return std::string("begin"); },
            [](const EndPassEvent&) { return std::string("end"); },
            [](const DrawEvent&) { return std::string("draw"); },
        }, event));
    }
    return names;
}

[[nodiscard]] inline std::vector<DrawCommand> draws(const std::vector<Event>& events)
{
    std::vector<DrawCommand> commands;
    for (const auto& event : events) {
        if (const auto* draw = std::get_if<DrawEvent>(&event)) {
            commands.push_back(draw->command);
        }
    }
    return commands;
}

} // namespace re::test
