#pragma once

#include <re/Binding.hpp>
#include <re/Common.hpp>
#include <re/PipelineSpec.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace re {

class Image {
public:
    virtual ~Image() = default;
    [[nodiscard]] virtual vk::Extent2D extent() const = 0;
    [[nodiscard]] virtual vk::Format format() const = 0;
    [[nodiscard]] virtual vk::SampleCountFlagBits samples() const = 0;
};

class Buffer {
public:
    virtual ~Buffer() = default;
    [[nodiscard]] virtual vk::DeviceSize size() const = 0;
};

struct RenderPassDesc;

class RenderPass {
public:
    virtual ~RenderPass() = default;
    [[nodiscard]] virtual const RenderPassDesc& desc() const = 0;
};

class Pipeline {
public:
    virtual ~Pipeline() = default;
    [[nodiscard]] virtual const PipelineSpec& spec() const = 0;
};

class BindingSet {
public:
    virtual ~BindingSet() = default;
    [[nodiscard]] virtual uint32_t slot() const = 0;
};

class Framebuffer {
public:
    virtual ~Framebuffer() = default;
    [[nodiscard]] virtual vk::Extent2D extent() const = 0;
};

class CommandSequence {
public:
    virtual ~CommandSequence() = default;
};

/// Token a later submission or a presentation can wait on.
class CompletionSignal {
public:
    virtual ~CompletionSignal() = default;
};

using BufferHandle = std::shared_ptr<Buffer>;
using RenderPassHandle = std::shared_ptr<RenderPass>;
using PipelineHandle = std::shared_ptr<Pipeline>;
using BindingSetHandle = std::shared_ptr<BindingSet>;
using FramebufferHandle = std::shared_ptr<Framebuffer>;
using CommandSequenceHandle = std::unique_ptr<CommandSequence>;
using CompletionSignalHandle = std::shared_ptr<CompletionSignal>;

struct AttachmentInfo {
    vk::Format format;
    vk::SampleCountFlagBits samples = vk::SampleCountFlagBits::e1;
    vk::AttachmentLoadOp load_op = vk::AttachmentLoadOp::eClear;
    vk::AttachmentStoreOp store_op = vk::AttachmentStoreOp::eStore;
    vk::ImageLayout final_layout = vk::ImageLayout::eShaderReadOnlyOptimal;
    vk::ClearValue clear_value;

    [[nodiscard]] bool is_depth() const;
};

/**
 * @brief Single-subpass render pass layout
 *
 * Attachment k is bound to image k of the framebuffer, and therefore to tag k
 * of the pass's images_created_tags.
 */
struct RenderPassDesc {
    std::vector<AttachmentInfo> attachments;
    std::vector<uint32_t> color_attachments;
    std::optional<uint32_t> depth_attachment;
    /// Empty, or one entry per color attachment.
    std::vector<uint32_t> resolve_attachments;

    [[nodiscard]] vk::SampleCountFlagBits rasterization_samples() const;
    [[nodiscard]] std::vector<vk::ClearValue> clear_values() const;
};

/// Viewport plus scissor applied to one draw.
struct DynamicState {
    vk::Viewport viewport;
    vk::Rect2D scissor;

    /// Full viewport over the given dimensions, depth range 0..1.
    [[nodiscard]] static DynamicState full(vk::Extent2D extent);
    [[nodiscard]] static DynamicState region(float x, float y, float width, float height);

    bool operator==(const DynamicState&) const = default;
};

struct DrawCommand {
    PipelineHandle pipeline;
    DynamicState dynamic_state;
    BufferHandle vertex_buffer;
    BufferHandle index_buffer;
    uint32_t index_count = 0;
    /// Bound in order starting at set 0.
    std::vector<BindingSetHandle> binding_sets;
};

/**
 * @brief Graphics API seen by the engine core
 *
 * Resource creation reports failures as an error string. Recording calls
 * only append to a sequence; failures surface when it is submitted.
 */
class Backend {
public:
    virtual ~Backend() = default;

    [[nodiscard]] virtual std::expected<RenderPassHandle, std::string> create_render_pass(const RenderPassDesc& desc) = 0;

    [[nodiscard]] virtual std::expected<PipelineHandle, std::string> create_pipeline(
        const PipelineSpec& spec,
        const RenderPassHandle& render_pass,
        uint32_t subpass
    ) = 0;

    [[nodiscard]] virtual std::expected<BindingSetHandle, std::string> create_binding_set(
        const PipelineHandle& pipeline,
        uint32_t slot,
        const std::vector<Binding>& bindings
    ) = 0;

    [[nodiscard]] virtual std::expected<ImageHandle, std::string> create_image(
        vk::Extent2D extent,
        vk::SampleCountFlagBits samples,
        vk::Format format
    ) = 0;

    /// Immutable buffer initialised with data.
    [[nodiscard]] virtual std::expected<BufferHandle, std::string> create_buffer(
        std::span<const std::byte> data,
        vk::BufferUsageFlags usage
    ) = 0;

    [[nodiscard]] virtual std::expected<FramebufferHandle, std::string> create_framebuffer(
        const RenderPassHandle& render_pass,
        const std::vector<ImageHandle>& images
    ) = 0;

    [[nodiscard]] virtual std::expected<CommandSequenceHandle, std::string> begin_sequence() = 0;

    virtual void begin_render_pass(
        CommandSequence& sequence,
        const RenderPassHandle& render_pass,
        const FramebufferHandle& framebuffer
    ) = 0;

    virtual void end_render_pass(CommandSequence& sequence) = 0;

    virtual void draw_indexed(CommandSequence& sequence, const DrawCommand& command) = 0;

    /**
     * @brief Submit a finished sequence
     *
     * @param sequence Sequence to execute, consumed
     * @param dependency Signal the GPU waits on first, may be null
     * @return Signal raised when execution completes
     */
    [[nodiscard]] virtual std::expected<CompletionSignalHandle, std::string> submit(
        CommandSequenceHandle sequence,
        const CompletionSignalHandle& dependency
    ) = 0;

    /// Most images a single binding set may reference.
    [[nodiscard]] virtual uint32_t max_images_per_set() const = 0;
};

/**
 * @brief Presentable image source, usually a window swapchain
 *
 * Call order per frame: next_image(), get_future(), present_future().
 */
class SwapchainTarget {
public:
    virtual ~SwapchainTarget() = default;

    /**
     * @brief Acquire the next image to render into
     *
     * @return The image, or nullopt if the swapchain was stale and has been
     *         rebuilt; the caller should skip the frame and retry
     * @throws FatalError (stage "acquire") on any other failure
     */
    [[nodiscard]] virtual std::optional<ImageHandle> next_image() = 0;

    /// Signal raised once the last acquired image may be written.
    [[nodiscard]] virtual CompletionSignalHandle get_future() = 0;

    /**
     * @brief Present the last acquired image once signal is raised
     *
     * The target keeps signal alive until the presentation engine is done with it.
     *
     * @return False if the swapchain went stale; it is rebuilt on the next acquire
     * @throws FatalError (stage "present") on any other failure
     */
    virtual bool present_future(const CompletionSignalHandle& signal) = 0;
};

} // namespace re
