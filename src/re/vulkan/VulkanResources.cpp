#include <re/Logger.hpp>
#include <re/vulkan/VulkanResources.hpp>
#include <cstring>

namespace re {

namespace {

bool is_depth_format(vk::Format format)
{
    return AttachmentInfo{.format = format}.is_depth();
}

std::expected<vk::ImageView, std::string> create_view(vk::Device device, vk::Image image, vk::Format format)
{
    auto view_info = vk::ImageViewCreateInfo()
        .setImage(image)
        .setViewType(vk::ImageViewType::e2D)
        .setFormat(format)
        .setSubresourceRange(vk::ImageSubresourceRange()
            .setAspectMask(is_depth_format(format) ? vk::ImageAspectFlagBits::eDepth : vk::ImageAspectFlagBits::eColor)
            .setBaseMipLevel(0)
            .setLevelCount(1)
            .setBaseArrayLayer(0)
            .setLayerCount(1));
    auto view_res = device.createImageView(view_info);
    CHECK_VK_RESULT(view_res, "Could not create image view {}");
    return view_res.value;
}

} // anonymous namespace

VulkanImage::VulkanImage(vk::Device device, vk::Extent2D extent, vk::Format format, vk::SampleCountFlagBits samples)
    : m_device(device)
    , m_extent(extent)
    , m_format(format)
    , m_samples(samples)
{
}

std::expected<std::shared_ptr<VulkanImage>, std::string> VulkanImage::create(
    const VulkanContext& context,
    vk::Extent2D extent,
    vk::SampleCountFlagBits samples,
    vk::Format format
) {
    auto device = context.device();
    std::shared_ptr<VulkanImage> out(new VulkanImage(device, extent, format, samples));
    out->m_owns_image = true;

    auto usage = is_depth_format(format)
        ? vk::ImageUsageFlagBits::eDepthStencilAttachment
        : vk::ImageUsageFlagBits::eColorAttachment;
    if (samples == vk::SampleCountFlagBits::e1) {
        usage |= vk::ImageUsageFlagBits::eSampled;
    }

    auto image_info = vk::ImageCreateInfo()
        .setImageType(vk::ImageType::e2D)
        .setExtent(vk::Extent3D(extent.width, extent.height, 1))
        .setMipLevels(1)
        .setArrayLayers(1)
        .setFormat(format)
        .setTiling(vk::ImageTiling::eOptimal)
        .setInitialLayout(vk::ImageLayout::eUndefined)
        .setUsage(usage)
        .setSharingMode(vk::SharingMode::eExclusive)
        .setSamples(samples);

    auto image_res = device.createImage(image_info);
    CHECK_VK_RESULT(image_res, "Could not create image {}");
    out->m_image = image_res.value;

    auto requirements = device.getImageMemoryRequirements(out->m_image);
    auto memory_type = context.find_memory_type(requirements.memoryTypeBits, vk::MemoryPropertyFlagBits::eDeviceLocal);
    if (!memory_type) {
        return std::unexpected(memory_type.error());
    }

    auto alloc_info = vk::MemoryAllocateInfo()
        .setAllocationSize(requirements.size)
        .setMemoryTypeIndex(*memory_type);
    auto memory_res = device.allocateMemory(alloc_info);
    CHECK_VK_RESULT(memory_res, "Could not allocate image memory {}");
    out->m_memory = memory_res.value;

    auto bind_res = device.bindImageMemory(out->m_image, out->m_memory, 0);
    CHECK_VK_RESULT_VOID(bind_res, "Could not bind image memory {}");

    auto view = create_view(device, out->m_image, format);
    if (!view) {
        return std::unexpected(view.error());
    }
    out->m_view = *view;

    Logger::instance().trace("Created {}x{} image {} x{}", extent.width, extent.height,
                             vk::to_string(format), static_cast<uint32_t>(samples));
    return out;
}

std::expected<std::shared_ptr<VulkanImage>, std::string> VulkanImage::wrap(
    vk::Device device,
    vk::Image image,
    vk::Extent2D extent,
    vk::Format format
) {
    std::shared_ptr<VulkanImage> out(new VulkanImage(device, extent, format, vk::SampleCountFlagBits::e1));
    out->m_image = image;
    auto view = create_view(device, image, format);
    if (!view) {
        return std::unexpected(view.error());
    }
    out->m_view = *view;
    return out;
}

VulkanImage::~VulkanImage()
{
    if (m_view) {
        m_device.destroyImageView(m_view);
    }
    if (m_owns_image) {
        if (m_image) {
            m_device.destroyImage(m_image);
        }
        if (m_memory) {
            m_device.freeMemory(m_memory);
        }
    }
}

std::expected<std::shared_ptr<VulkanBuffer>, std::string> VulkanBuffer::create(
    const VulkanContext& context,
    std::span<const std::byte> data,
    vk::BufferUsageFlags usage
) {
    if (data.empty()) {
        return std::unexpected(std::string("Cannot create an empty buffer"));
    }

    auto device = context.device();
    std::shared_ptr<VulkanBuffer> out(new VulkanBuffer(device));
    out->m_size = data.size();

    auto buffer_info = vk::BufferCreateInfo()
        .setSize(data.size())
        .setUsage(usage)
        .setSharingMode(vk::SharingMode::eExclusive);
    auto buffer_res = device.createBuffer(buffer_info);
    CHECK_VK_RESULT(buffer_res, "Could not create buffer {}");
    out->m_buffer = buffer_res.value;

    auto requirements = device.getBufferMemoryRequirements(out->m_buffer);
    auto memory_type = context.find_memory_type(
        requirements.memoryTypeBits,
        vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent);
    if (!memory_type) {
        return std::unexpected(memory_type.error());
    }

    auto alloc_info = vk::MemoryAllocateInfo()
        .setAllocationSize(requirements.size)
        .setMemoryTypeIndex(*memory_type);
    auto memory_res = device.allocateMemory(alloc_info);
    CHECK_VK_RESULT(memory_res, "Could not allocate buffer memory {}");
    out->m_memory = memory_res.value;

    auto bind_res = device.bindBufferMemory(out->m_buffer, out->m_memory, 0);
    CHECK_VK_RESULT_VOID(bind_res, "Could not bind buffer memory {}");

    auto map_res = device.mapMemory(out->m_memory, 0, data.size());
    CHECK_VK_RESULT(map_res, "Could not map buffer memory {}");
    std::memcpy(map_res.value, data.data(), data.size());
    device.unmapMemory(out->m_memory);

    return out;
}

VulkanBuffer::~VulkanBuffer()
{
    if (m_buffer) {
        m_device.destroyBuffer(m_buffer);
    }
    if (m_memory) {
        m_device.freeMemory(m_memory);
    }
}

VulkanPipeline::VulkanPipeline(
    vk::Device device,
    PipelineSpec spec,
    std::vector<vk::DescriptorSetLayout> set_layouts,
    std::vector<std::vector<vk::DescriptorSetLayoutBinding>> set_bindings,
    vk::PipelineLayout layout,
    vk::Pipeline pipeline
)
    : m_device(device)
    , m_spec(std::move(spec))
    , m_set_layouts(std::move(set_layouts))
    , m_set_bindings(std::move(set_bindings))
    , m_layout(layout)
    , m_pipeline(pipeline)
{
}

VulkanPipeline::~VulkanPipeline()
{
    m_device.destroyPipeline(m_pipeline);
    m_device.destroyPipelineLayout(m_layout);
    for (auto set_layout : m_set_layouts) {
        m_device.destroyDescriptorSetLayout(set_layout);
    }
}

std::expected<std::shared_ptr<VulkanCompletionSignal>, std::string> VulkanCompletionSignal::create(
    vk::Device device,
    bool with_fence
) {
    std::shared_ptr<VulkanCompletionSignal> out(new VulkanCompletionSignal(device));

    auto semaphore_res = device.createSemaphore(vk::SemaphoreCreateInfo());
    CHECK_VK_RESULT(semaphore_res, "Could not create semaphore {}");
    out->m_semaphore = semaphore_res.value;

    if (with_fence) {
        auto fence_res = device.createFence(vk::FenceCreateInfo());
        CHECK_VK_RESULT(fence_res, "Could not create fence {}");
        out->m_fence = fence_res.value;
    }
    return out;
}

bool VulkanCompletionSignal::is_complete() const
{
    return !m_fence || m_device.getFenceStatus(m_fence) == vk::Result::eSuccess;
}

void VulkanCompletionSignal::wait() const
{
    if (!m_fence) {
        return;
    }
    if (auto res = m_device.waitForFences(m_fence, vk::True, UINT64_MAX); res != vk::Result::eSuccess) {
        Logger::instance().error("Waiting for submission failed: {}", vk::to_string(res));
    }
}

VulkanCompletionSignal::~VulkanCompletionSignal()
{
    wait();
    if (m_fence) {
        m_device.destroyFence(m_fence);
    }
    if (m_semaphore) {
        m_device.destroySemaphore(m_semaphore);
    }
}

} // namespace re
