#pragma once

#include <re/Backend.hpp>
#include <re/vulkan/VulkanContext.hpp>
#include <re/vulkan/VulkanResources.hpp>
#include <deque>
#include <expected>
#include <memory>
#include <string>

namespace re {

struct VulkanBackendConfig {
    /// Submissions allowed in flight before begin_sequence() blocks.
    uint32_t max_frames_in_flight = 2;
    /// Cap on images a single binding set may reference.
    uint32_t max_images_per_set = 4;
    vk::Filter sampler_filter = vk::Filter::eLinear;
    vk::SamplerAddressMode sampler_address_mode = vk::SamplerAddressMode::eRepeat;
};

/**
 * @brief Backend implementation on top of a VulkanContext
 *
 * Every handle it returns is one of the Vulkan* resource types. Handles from
 * another backend are rejected.
 */
class VulkanBackend final : public Backend {
public:
    static std::expected<std::unique_ptr<VulkanBackend>, std::string> create(
        const VulkanContext& context,
        const VulkanBackendConfig& config = {}
    );

    ~VulkanBackend() override;
    VulkanBackend(const VulkanBackend&) = delete;
    VulkanBackend& operator=(const VulkanBackend&) = delete;

    [[nodiscard]] std::expected<RenderPassHandle, std::string> create_render_pass(const RenderPassDesc& desc) override;
    [[nodiscard]] std::expected<PipelineHandle, std::string> create_pipeline(
        const PipelineSpec& spec,
        const RenderPassHandle& render_pass,
        uint32_t subpass
    ) override;
    [[nodiscard]] std::expected<BindingSetHandle, std::string> create_binding_set(
        const PipelineHandle& pipeline,
        uint32_t slot,
        const std::vector<Binding>& bindings
    ) override;
    [[nodiscard]] std::expected<ImageHandle, std::string> create_image(
        vk::Extent2D extent,
        vk::SampleCountFlagBits samples,
        vk::Format format
    ) override;
    [[nodiscard]] std::expected<BufferHandle, std::string> create_buffer(
        std::span<const std::byte> data,
        vk::BufferUsageFlags usage
    ) override;
    [[nodiscard]] std::expected<FramebufferHandle, std::string> create_framebuffer(
        const RenderPassHandle& render_pass,
        const std::vector<ImageHandle>& images
    ) override;
    [[nodiscard]] std::expected<CommandSequenceHandle, std::string> begin_sequence() override;
    void begin_render_pass(
        CommandSequence& sequence,
        const RenderPassHandle& render_pass,
        const FramebufferHandle& framebuffer
    ) override;
    void end_render_pass(CommandSequence& sequence) override;
    void draw_indexed(CommandSequence& sequence, const DrawCommand& command) override;
    [[nodiscard]] std::expected<CompletionSignalHandle, std::string> submit(
        CommandSequenceHandle sequence,
        const CompletionSignalHandle& dependency
    ) override;
    [[nodiscard]] uint32_t max_images_per_set() const override { return m_config.max_images_per_set; }

    /// Block until every submission has completed.
    void wait_idle();

    [[nodiscard]] std::size_t submissions_in_flight() const { return m_in_flight.size(); }

private:
    // Destroyed bottom-up: the signal waits on the fence before the sequence is freed.
    struct Submission {
        CommandSequenceHandle sequence;
        CompletionSignalHandle dependency;
        std::shared_ptr<VulkanCompletionSignal> signal;
    };

    VulkanBackend(const VulkanContext& context, const VulkanBackendConfig& config);

    /// Drop submissions whose fence has signaled.
    void reap_completed();

    const VulkanContext* m_context;
    vk::Device m_device;
    VulkanBackendConfig m_config;
    vk::CommandPool m_command_pool;
    vk::Sampler m_sampler;
    std::deque<Submission> m_in_flight;
};

} // namespace re
