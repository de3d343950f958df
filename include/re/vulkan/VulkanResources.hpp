#pragma once

#include <re/Backend.hpp>
#include <re/vulkan/VulkanContext.hpp>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace re {

/// 2D image with one view. Swapchain images are wrapped without taking ownership.
class VulkanImage final : public Image {
public:
    static std::expected<std::shared_ptr<VulkanImage>, std::string> create(
        const VulkanContext& context,
        vk::Extent2D extent,
        vk::SampleCountFlagBits samples,
        vk::Format format
    );

    static std::expected<std::shared_ptr<VulkanImage>, std::string> wrap(
        vk::Device device,
        vk::Image image,
        vk::Extent2D extent,
        vk::Format format
    );

    ~VulkanImage() override;
    VulkanImage(const VulkanImage&) = delete;
    VulkanImage& operator=(const VulkanImage&) = delete;

    [[nodiscard]] vk::Extent2D extent() const override { return m_extent; }
    [[nodiscard]] vk::Format format() const override { return m_format; }
    [[nodiscard]] vk::SampleCountFlagBits samples() const override { return m_samples; }
    [[nodiscard]] vk::Image image() const { return m_image; }
    [[nodiscard]] vk::ImageView view() const { return m_view; }

private:
    VulkanImage(vk::Device device, vk::Extent2D extent, vk::Format format, vk::SampleCountFlagBits samples);

    vk::Device m_device;
    vk::Image m_image;
    vk::DeviceMemory m_memory;
    vk::ImageView m_view;
    vk::Extent2D m_extent;
    vk::Format m_format;
    vk::SampleCountFlagBits m_samples;
    bool m_owns_image = false;
};

/// Host-visible buffer written once at creation.
class VulkanBuffer final : public Buffer {
public:
    static std::expected<std::shared_ptr<VulkanBuffer>, std::string> create(
        const VulkanContext& context,
        std::span<const std::byte> data,
        vk::BufferUsageFlags usage
    );

    ~VulkanBuffer() override;
    VulkanBuffer(const VulkanBuffer&) = delete;
    VulkanBuffer& operator=(const VulkanBuffer&) = delete;

    [[nodiscard]] vk::DeviceSize size() const override { return m_size; }
    [[nodiscard]] vk::Buffer buffer() const { return m_buffer; }

private:
    explicit VulkanBuffer(vk::Device device) : m_device(device) {}

    vk::Device m_device;
    vk::Buffer m_buffer;
    vk::DeviceMemory m_memory;
    vk::DeviceSize m_size = 0;
};

class VulkanRenderPass final : public RenderPass {
public:
    VulkanRenderPass(vk::Device device, vk::RenderPass render_pass, RenderPassDesc desc)
        : m_device(device), m_render_pass(render_pass), m_desc(std::move(desc)) {}
    ~VulkanRenderPass() override { m_device.destroyRenderPass(m_render_pass); }
    VulkanRenderPass(const VulkanRenderPass&) = delete;
    VulkanRenderPass& operator=(const VulkanRenderPass&) = delete;

    [[nodiscard]] const RenderPassDesc& desc() const override { return m_desc; }
    [[nodiscard]] vk::RenderPass render_pass() const { return m_render_pass; }

private:
    vk::Device m_device;
    vk::RenderPass m_render_pass;
    RenderPassDesc m_desc;
};

class VulkanPipeline final : public Pipeline {
public:
    VulkanPipeline(
        vk::Device device,
        PipelineSpec spec,
        std::vector<vk::DescriptorSetLayout> set_layouts,
        std::vector<std::vector<vk::DescriptorSetLayoutBinding>> set_bindings,
        vk::PipelineLayout layout,
        vk::Pipeline pipeline
    );
    ~VulkanPipeline() override;
    VulkanPipeline(const VulkanPipeline&) = delete;
    VulkanPipeline& operator=(const VulkanPipeline&) = delete;

    [[nodiscard]] const PipelineSpec& spec() const override { return m_spec; }
    [[nodiscard]] vk::Pipeline pipeline() const { return m_pipeline; }
    [[nodiscard]] vk::PipelineLayout layout() const { return m_layout; }
    [[nodiscard]] std::size_t set_count() const { return m_set_layouts.size(); }
    [[nodiscard]] vk::DescriptorSetLayout set_layout(uint32_t slot) const { return m_set_layouts.at(slot); }
    [[nodiscard]] const std::vector<vk::DescriptorSetLayoutBinding>& set_bindings(uint32_t slot) const
    {
        return m_set_bindings.at(slot);
    }

private:
    vk::Device m_device;
    PipelineSpec m_spec;
    std::vector<vk::DescriptorSetLayout> m_set_layouts;
    std::vector<std::vector<vk::DescriptorSetLayoutBinding>> m_set_bindings;
    vk::PipelineLayout m_layout;
    vk::Pipeline m_pipeline;
};

/// Descriptor set with its own pool, keeping bound buffers and images alive.
class VulkanBindingSet final : public BindingSet {
public:
    VulkanBindingSet(vk::Device device, vk::DescriptorPool pool, vk::DescriptorSet set, uint32_t slot,
                     std::vector<std::shared_ptr<const void>> resources)
        : m_device(device), m_pool(pool), m_set(set), m_slot(slot), m_resources(std::move(resources)) {}
    ~VulkanBindingSet() override { m_device.destroyDescriptorPool(m_pool); }
    VulkanBindingSet(const VulkanBindingSet&) = delete;
    VulkanBindingSet& operator=(const VulkanBindingSet&) = delete;

    [[nodiscard]] uint32_t slot() const override { return m_slot; }
    [[nodiscard]] vk::DescriptorSet set() const { return m_set; }

private:
    vk::Device m_device;
    vk::DescriptorPool m_pool;
    vk::DescriptorSet m_set;
    uint32_t m_slot;
    std::vector<std::shared_ptr<const void>> m_resources;
};

class VulkanFramebuffer final : public Framebuffer {
public:
    VulkanFramebuffer(vk::Device device, vk::Framebuffer framebuffer, vk::Extent2D extent,
                      std::vector<ImageHandle> images)
        : m_device(device), m_framebuffer(framebuffer), m_extent(extent), m_images(std::move(images)) {}
    ~VulkanFramebuffer() override { m_device.destroyFramebuffer(m_framebuffer); }
    VulkanFramebuffer(const VulkanFramebuffer&) = delete;
    VulkanFramebuffer& operator=(const VulkanFramebuffer&) = delete;

    [[nodiscard]] vk::Extent2D extent() const override { return m_extent; }
    [[nodiscard]] vk::Framebuffer framebuffer() const { return m_framebuffer; }

private:
    vk::Device m_device;
    vk::Framebuffer m_framebuffer;
    vk::Extent2D m_extent;
    std::vector<ImageHandle> m_images;
};

/// Primary command buffer plus every resource its commands reference.
class VulkanCommandSequence final : public CommandSequence {
public:
    VulkanCommandSequence(vk::Device device, vk::CommandPool pool, vk::CommandBuffer command_buffer)
        : m_device(device), m_pool(pool), m_command_buffer(command_buffer) {}
    ~VulkanCommandSequence() override { m_device.freeCommandBuffers(m_pool, m_command_buffer); }
    VulkanCommandSequence(const VulkanCommandSequence&) = delete;
    VulkanCommandSequence& operator=(const VulkanCommandSequence&) = delete;

    [[nodiscard]] vk::CommandBuffer command_buffer() const { return m_command_buffer; }
    void keep_alive(std::shared_ptr<const void> resource) { m_resources.push_back(std::move(resource)); }

private:
    vk::Device m_device;
    vk::CommandPool m_pool;
    vk::CommandBuffer m_command_buffer;
    std::vector<std::shared_ptr<const void>> m_resources;
};

/**
 * @brief Semaphore for GPU-side waits, plus a fence for submissions
 *
 * Destruction blocks until the fence, if any, has signaled.
 */
class VulkanCompletionSignal final : public CompletionSignal {
public:
    static std::expected<std::shared_ptr<VulkanCompletionSignal>, std::string> create(vk::Device device, bool with_fence);

    ~VulkanCompletionSignal() override;
    VulkanCompletionSignal(const VulkanCompletionSignal&) = delete;
    VulkanCompletionSignal& operator=(const VulkanCompletionSignal&) = delete;

    [[nodiscard]] vk::Semaphore semaphore() const { return m_semaphore; }
    [[nodiscard]] vk::Fence fence() const { return m_fence; }
    [[nodiscard]] bool is_complete() const;
    void wait() const;

private:
    explicit VulkanCompletionSignal(vk::Device device) : m_device(device) {}

    vk::Device m_device;
    vk::Semaphore m_semaphore;
    vk::Fence m_fence;
};

} // namespace re
