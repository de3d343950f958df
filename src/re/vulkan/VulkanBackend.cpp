#include <re/Error.hpp>
#include <re/Logger.hpp>
#include <re/vulkan/Shader.hpp>
#include <re/vulkan/VulkanBackend.hpp>
#include <algorithm>
#include <array>

namespace re {

namespace {

template<typename T, typename H>
std::expected<std::shared_ptr<T>, std::string> as_vulkan(const std::shared_ptr<H>& handle, std::string_view what)
{
    auto cast = std::dynamic_pointer_cast<T>(handle);
    if (!cast) {
        return std::unexpected(fmt::format("{} is null or was not created by the Vulkan backend", what));
    }
    return cast;
}

VulkanCommandSequence& as_vulkan(CommandSequence& sequence)
{
    auto* cast = dynamic_cast<VulkanCommandSequence*>(&sequence);
    if (!cast) {
        fatal("record", "", "Command sequence was not created by the Vulkan backend");
    }
    return *cast;
}

vk::AttachmentDescription to_attachment_description(const AttachmentInfo& info)
{
    auto initial_layout = info.load_op == vk::AttachmentLoadOp::eLoad ? info.final_layout : vk::ImageLayout::eUndefined;
    return vk::AttachmentDescription()
        .setFormat(info.format)
        .setSamples(info.samples)
        .setLoadOp(info.load_op)
        .setStoreOp(info.store_op)
        .setStencilLoadOp(vk::AttachmentLoadOp::eDontCare)
        .setStencilStoreOp(vk::AttachmentStoreOp::eDontCare)
        .setInitialLayout(initial_layout)
        .setFinalLayout(info.final_layout);
}

vk::PipelineDepthStencilStateCreateInfo depth_state(const PipelineSpec& spec)
{
    auto state = vk::PipelineDepthStencilStateCreateInfo()
        .setDepthTestEnable(spec.uses_depth())
        .setDepthWriteEnable(spec.write_depth)
        .setDepthCompareOp(spec.read_depth ? vk::CompareOp::eLessOrEqual : vk::CompareOp::eAlways)
        .setDepthBoundsTestEnable(false)
        .setStencilTestEnable(false);
    return state;
}

} // anonymous namespace

std::expected<std::unique_ptr<VulkanBackend>, std::string> VulkanBackend::create(
    const VulkanContext& context,
    const VulkanBackendConfig& config
) {
    if (config.max_frames_in_flight == 0) {
        return std::unexpected(std::string("max_frames_in_flight must be at least 1"));
    }

    std::unique_ptr<VulkanBackend> backend(new VulkanBackend(context, config));

    auto pool_info = vk::CommandPoolCreateInfo()
        .setFlags(vk::CommandPoolCreateFlagBits::eResetCommandBuffer)
        .setQueueFamilyIndex(context.graphics_queue_family());
    auto pool_res = backend->m_device.createCommandPool(pool_info);
    CHECK_VK_RESULT(pool_res, "Could not create command pool {}");
    backend->m_command_pool = pool_res.value;

    auto sampler_info = vk::SamplerCreateInfo()
        .setMagFilter(config.sampler_filter)
        .setMinFilter(config.sampler_filter)
        .setMipmapMode(vk::SamplerMipmapMode::eLinear)
        .setAddressModeU(config.sampler_address_mode)
        .setAddressModeV(config.sampler_address_mode)
        .setAddressModeW(config.sampler_address_mode)
        .setMaxLod(1.0f);
    auto sampler_res = backend->m_device.createSampler(sampler_info);
    CHECK_VK_RESULT(sampler_res, "Could not create sampler {}");
    backend->m_sampler = sampler_res.value;

    Logger::instance().info("VulkanBackend ready, {} frames in flight", config.max_frames_in_flight);
    return backend;
}

VulkanBackend::VulkanBackend(const VulkanContext& context, const VulkanBackendConfig& config)
    : m_context(&context)
    , m_device(context.device())
    , m_config(config)
{
}

VulkanBackend::~VulkanBackend()
{
    wait_idle();
    m_in_flight.clear();
    if (m_sampler) {
        m_device.destroySampler(m_sampler);
    }
    if (m_command_pool) {
        m_device.destroyCommandPool(m_command_pool);
    }
}

std::expected<RenderPassHandle, std::string> VulkanBackend::create_render_pass(const RenderPassDesc& desc)
{
    std::vector<vk::AttachmentDescription> attachments;
    attachments.reserve(desc.attachments.size());
    for (const auto& info : desc.attachments) {
        attachments.push_back(to_attachment_description(info));
    }

    std::vector<vk::AttachmentReference> color_refs;
    for (auto index : desc.color_attachments) {
        color_refs.emplace_back(index, vk::ImageLayout::eColorAttachmentOptimal);
    }
    std::vector<vk::AttachmentReference> resolve_refs;
    for (auto index : desc.resolve_attachments) {
        resolve_refs.emplace_back(index, vk::ImageLayout::eColorAttachmentOptimal);
    }
    if (!resolve_refs.empty() && resolve_refs.size() != color_refs.size()) {
        return std::unexpected(fmt::format("{} resolve attachments for {} color attachments",
                                           resolve_refs.size(), color_refs.size()));
    }
    vk::AttachmentReference depth_ref(desc.depth_attachment.value_or(0),
                                      vk::ImageLayout::eDepthStencilAttachmentOptimal);

    auto subpass = vk::SubpassDescription()
        .setPipelineBindPoint(vk::PipelineBindPoint::eGraphics)
        .setColorAttachments(color_refs)
        .setPDepthStencilAttachment(desc.depth_attachment ? &depth_ref : nullptr);
    if (!resolve_refs.empty()) {
        subpass.setPResolveAttachments(resolve_refs.data());
    }

    constexpr auto attachment_stages = vk::PipelineStageFlagBits::eColorAttachmentOutput |
        vk::PipelineStageFlagBits::eEarlyFragmentTests | vk::PipelineStageFlagBits::eLateFragmentTests;
    constexpr auto attachment_writes =
        vk::AccessFlagBits::eColorAttachmentWrite | vk::AccessFlagBits::eDepthStencilAttachmentWrite;

    // Earlier passes' writes must land before this pass samples them, and
    // this pass's writes before anything later samples them.
    std::array dependencies = {
        vk::SubpassDependency()
            .setSrcSubpass(VK_SUBPASS_EXTERNAL)
            .setDstSubpass(0)
            .setSrcStageMask(attachment_stages)
            .setDstStageMask(attachment_stages | vk::PipelineStageFlagBits::eFragmentShader)
            .setSrcAccessMask(attachment_writes)
            .setDstAccessMask(attachment_writes | vk::AccessFlagBits::eShaderRead),
        vk::SubpassDependency()
            .setSrcSubpass(0)
            .setDstSubpass(VK_SUBPASS_EXTERNAL)
            .setSrcStageMask(attachment_stages)
            .setDstStageMask(vk::PipelineStageFlagBits::eFragmentShader)
            .setSrcAccessMask(attachment_writes)
            .setDstAccessMask(vk::AccessFlagBits::eShaderRead),
    };

    auto render_pass_info = vk::RenderPassCreateInfo()
        .setAttachments(attachments)
        .setSubpasses(subpass)
        .setDependencies(dependencies);

    auto render_pass_res = m_device.createRenderPass(render_pass_info);
    CHECK_VK_RESULT(render_pass_res, "Could not create render pass {}");
    Logger::instance().debug("Created render pass with {} attachments", attachments.size());
    return std::make_shared<VulkanRenderPass>(m_device, render_pass_res.value, desc);
}

std::expected<PipelineHandle, std::string> VulkanBackend::create_pipeline(
    const PipelineSpec& spec,
    const RenderPassHandle& render_pass,
    uint32_t subpass
) {
    auto vk_render_pass = as_vulkan<VulkanRenderPass>(render_pass, "render pass");
    if (!vk_render_pass) {
        return std::unexpected(vk_render_pass.error());
    }

    auto vert = Shader::create_shader(m_device, spec.vertex_shader);
    if (!vert) {
        return std::unexpected(fmt::format("vertex shader: {}", vert.error()));
    }
    auto frag = Shader::create_shader(m_device, spec.fragment_shader);
    if (!frag) {
        return std::unexpected(fmt::format("fragment shader: {}", frag.error()));
    }

    auto set_bindings = merge_descriptor_layouts({&*vert, &*frag});
    if (!set_bindings) {
        return std::unexpected(set_bindings.error());
    }

    std::vector<vk::DescriptorSetLayout> set_layouts;
    auto destroy_set_layouts = [&] {
        for (auto layout : set_layouts) {
            m_device.destroyDescriptorSetLayout(layout);
        }
    };
    for (const auto& bindings : *set_bindings) {
        auto layout_res = m_device.createDescriptorSetLayout(vk::DescriptorSetLayoutCreateInfo().setBindings(bindings));
        if (layout_res.result != vk::Result::eSuccess) {
            destroy_set_layouts();
            return std::unexpected(fmt::format("Could not create descriptor set layout {}",
                                               vk::to_string(layout_res.result)));
        }
        set_layouts.push_back(layout_res.value);
    }

    auto layout_res = m_device.createPipelineLayout(vk::PipelineLayoutCreateInfo().setSetLayouts(set_layouts));
    if (layout_res.result != vk::Result::eSuccess) {
        destroy_set_layouts();
        return std::unexpected(fmt::format("Could not create pipeline layout {}", vk::to_string(layout_res.result)));
    }
    auto pipeline_layout = layout_res.value;

    std::array shader_stages = {
        vert->create_pipeline_shader_stage_create_info(),
        frag->create_pipeline_shader_stage_create_info(),
    };

    auto binding_description = spec.vertex_layout.to_binding_description();
    auto attribute_descriptions = spec.vertex_layout.to_attribute_descriptions();
    auto vertex_input_info = vk::PipelineVertexInputStateCreateInfo();
    if (spec.vertex_layout.stride > 0) {
        vertex_input_info
            .setVertexBindingDescriptions(binding_description)
            .setVertexAttributeDescriptions(attribute_descriptions);
    }

    auto input_assembly = vk::PipelineInputAssemblyStateCreateInfo()
        .setTopology(spec.topology)
        .setPrimitiveRestartEnable(false);

    // Viewport and scissor come from each draw.
    auto viewport_state = vk::PipelineViewportStateCreateInfo()
        .setViewportCount(1)
        .setScissorCount(1);

    auto rasterizer = vk::PipelineRasterizationStateCreateInfo()
        .setDepthClampEnable(false)
        .setRasterizerDiscardEnable(false)
        .setPolygonMode(vk::PolygonMode::eFill)
        .setLineWidth(1.0f)
        .setCullMode(vk::CullModeFlagBits::eNone)
        .setFrontFace(vk::FrontFace::eCounterClockwise)
        .setDepthBiasEnable(false);

    const auto& desc = vk_render_pass.value()->desc();
    auto multisampling = vk::PipelineMultisampleStateCreateInfo()
        .setSampleShadingEnable(false)
        .setRasterizationSamples(desc.rasterization_samples());

    auto blend_attachment = vk::PipelineColorBlendAttachmentState()
        .setColorWriteMask(
            vk::ColorComponentFlagBits::eR |
            vk::ColorComponentFlagBits::eG |
            vk::ColorComponentFlagBits::eB |
            vk::ColorComponentFlagBits::eA)
        .setBlendEnable(false);
    std::vector<vk::PipelineColorBlendAttachmentState> blend_attachments(desc.color_attachments.size(), blend_attachment);

    auto color_blending = vk::PipelineColorBlendStateCreateInfo()
        .setLogicOpEnable(false)
        .setAttachments(blend_attachments);

    auto depth_stencil = depth_state(spec);

    std::array dynamic_states = {
        vk::DynamicState::eViewport,
        vk::DynamicState::eScissor
    };
    auto dynamic_state = vk::PipelineDynamicStateCreateInfo().setDynamicStates(dynamic_states);

    auto pipeline_info = vk::GraphicsPipelineCreateInfo()
        .setStages(shader_stages)
        .setPVertexInputState(&vertex_input_info)
        .setPInputAssemblyState(&input_assembly)
        .setPViewportState(&viewport_state)
        .setPRasterizationState(&rasterizer)
        .setPMultisampleState(&multisampling)
        .setPDepthStencilState(&depth_stencil)
        .setPColorBlendState(&color_blending)
        .setPDynamicState(&dynamic_state)
        .setLayout(pipeline_layout)
        .setRenderPass(vk_render_pass.value()->render_pass())
        .setSubpass(subpass);

    auto pipeline_res = m_device.createGraphicsPipeline(nullptr, pipeline_info);
    if (pipeline_res.result != vk::Result::eSuccess) {
        m_device.destroyPipelineLayout(pipeline_layout);
        destroy_set_layouts();
        return std::unexpected(fmt::format("Failed to create graphics pipeline {}", vk::to_string(pipeline_res.result)));
    }

    Logger::instance().debug("Created pipeline '{}' + '{}' with {} descriptor sets",
                             spec.vertex_shader.string(), spec.fragment_shader.string(), set_layouts.size());
    return std::make_shared<VulkanPipeline>(m_device, spec, std::move(set_layouts), std::move(*set_bindings),
                                            pipeline_layout, pipeline_res.value);
}

std::expected<BindingSetHandle, std::string> VulkanBackend::create_binding_set(
    const PipelineHandle& pipeline,
    uint32_t slot,
    const std::vector<Binding>& bindings
) {
    auto vk_pipeline = as_vulkan<VulkanPipeline>(pipeline, "pipeline");
    if (!vk_pipeline) {
        return std::unexpected(vk_pipeline.error());
    }
    if (slot >= vk_pipeline.value()->set_count()) {
        return std::unexpected(fmt::format("pipeline declares {} descriptor sets, slot {} requested",
                                           vk_pipeline.value()->set_count(), slot));
    }
    if (bindings.empty()) {
        return std::unexpected(std::string("binding set has no bindings"));
    }

    uint32_t uniform_count = 0;
    uint32_t image_count = 0;
    for (const auto& binding : bindings) {
        std::visit(overloaded{
            [&](const UniformBinding&) { ++uniform_count; },
            [&](const ImageBinding&) { ++image_count; },
        }, binding);
    }
    if (image_count > m_config.max_images_per_set) {
        return std::unexpected(fmt::format("{} images in one set, at most {}", image_count, m_config.max_images_per_set));
    }

    std::vector<vk::DescriptorPoolSize> pool_sizes;
    if (uniform_count > 0) {
        pool_sizes.emplace_back(vk::DescriptorType::eUniformBuffer, uniform_count);
    }
    if (image_count > 0) {
        pool_sizes.emplace_back(vk::DescriptorType::eCombinedImageSampler, image_count);
    }
    auto pool_res = m_device.createDescriptorPool(vk::DescriptorPoolCreateInfo()
        .setMaxSets(1)
        .setPoolSizes(pool_sizes));
    CHECK_VK_RESULT(pool_res, "Could not create descriptor pool {}");
    auto pool = pool_res.value;

    auto set_layout = vk_pipeline.value()->set_layout(slot);
    auto sets_res = m_device.allocateDescriptorSets(vk::DescriptorSetAllocateInfo()
        .setDescriptorPool(pool)
        .setSetLayouts(set_layout));
    if (sets_res.result != vk::Result::eSuccess) {
        m_device.destroyDescriptorPool(pool);
        return std::unexpected(fmt::format("Could not allocate descriptor set {}", vk::to_string(sets_res.result)));
    }
    auto set = sets_res.value.front();

    std::vector<std::shared_ptr<const void>> resources;
    std::vector<vk::DescriptorBufferInfo> buffer_infos;
    std::vector<vk::DescriptorImageInfo> image_infos;
    buffer_infos.reserve(bindings.size());
    image_infos.reserve(bindings.size());
    std::vector<vk::WriteDescriptorSet> writes;

    for (uint32_t i = 0; i < bindings.size(); i++) {
        auto write = vk::WriteDescriptorSet().setDstSet(set).setDstBinding(i).setDescriptorCount(1);
        if (const auto* uniform = std::get_if<UniformBinding>(&bindings[i])) {
            auto buffer = VulkanBuffer::create(*m_context, uniform->bytes, vk::BufferUsageFlagBits::eUniformBuffer);
            if (!buffer) {
                m_device.destroyDescriptorPool(pool);
                return std::unexpected(fmt::format("uniform {}: {}", i, buffer.error()));
            }
            buffer_infos.emplace_back(buffer.value()->buffer(), 0, buffer.value()->size());
            write.setDescriptorType(vk::DescriptorType::eUniformBuffer).setPBufferInfo(&buffer_infos.back());
            resources.push_back(std::move(*buffer));
        } else {
            auto image = as_vulkan<VulkanImage>(std::get<ImageBinding>(bindings[i]).image, "bound image");
            if (!image) {
                m_device.destroyDescriptorPool(pool);
                return std::unexpected(image.error());
            }
            image_infos.emplace_back(m_sampler, image.value()->view(), vk::ImageLayout::eShaderReadOnlyOptimal);
            write.setDescriptorType(vk::DescriptorType::eCombinedImageSampler).setPImageInfo(&image_infos.back());
            resources.push_back(std::move(*image));
        }
        writes.push_back(write);
    }

    m_device.updateDescriptorSets(writes, {});
    return std::make_shared<VulkanBindingSet>(m_device, pool, set, slot, std::move(resources));
}

std::expected<ImageHandle, std::string> VulkanBackend::create_image(
    vk::Extent2D extent,
    vk::SampleCountFlagBits samples,
    vk::Format format
) {
    auto image = VulkanImage::create(*m_context, extent, samples, format);
    if (!image) {
        return std::unexpected(image.error());
    }
    return ImageHandle{std::move(*image)};
}

std::expected<BufferHandle, std::string> VulkanBackend::create_buffer(
    std::span<const std::byte> data,
    vk::BufferUsageFlags usage
) {
    auto buffer = VulkanBuffer::create(*m_context, data, usage);
    if (!buffer) {
        return std::unexpected(buffer.error());
    }
    return BufferHandle{std::move(*buffer)};
}

std::expected<FramebufferHandle, std::string> VulkanBackend::create_framebuffer(
    const RenderPassHandle& render_pass,
    const std::vector<ImageHandle>& images
) {
    auto vk_render_pass = as_vulkan<VulkanRenderPass>(render_pass, "render pass");
    if (!vk_render_pass) {
        return std::unexpected(vk_render_pass.error());
    }
    if (images.empty()) {
        return std::unexpected(std::string("framebuffer needs at least one image"));
    }

    std::vector<vk::ImageView> views;
    views.reserve(images.size());
    vk::Extent2D extent{UINT32_MAX, UINT32_MAX};
    for (const auto& handle : images) {
        auto image = as_vulkan<VulkanImage>(handle, "framebuffer image");
        if (!image) {
            return std::unexpected(image.error());
        }
        views.push_back(image.value()->view());
        extent.width = std::min(extent.width, handle->extent().width);
        extent.height = std::min(extent.height, handle->extent().height);
    }

    auto framebuffer_info = vk::FramebufferCreateInfo()
        .setRenderPass(vk_render_pass.value()->render_pass())
        .setAttachments(views)
        .setWidth(extent.width)
        .setHeight(extent.height)
        .setLayers(1);
    auto framebuffer_res = m_device.createFramebuffer(framebuffer_info);
    CHECK_VK_RESULT(framebuffer_res, "Could not create framebuffer {}");
    return std::make_shared<VulkanFramebuffer>(m_device, framebuffer_res.value, extent, images);
}

std::expected<CommandSequenceHandle, std::string> VulkanBackend::begin_sequence()
{
    reap_completed();
    while (m_in_flight.size() >= m_config.max_frames_in_flight) {
        m_in_flight.front().signal->wait();
        m_in_flight.pop_front();
    }

    auto alloc_info = vk::CommandBufferAllocateInfo()
        .setCommandPool(m_command_pool)
        .setLevel(vk::CommandBufferLevel::ePrimary)
        .setCommandBufferCount(1);
    auto buffers_res = m_device.allocateCommandBuffers(alloc_info);
    CHECK_VK_RESULT(buffers_res, "Could not allocate command buffer {}");

    auto sequence = std::make_unique<VulkanCommandSequence>(m_device, m_command_pool, buffers_res.value.front());
    auto begin_res = sequence->command_buffer().begin(
        vk::CommandBufferBeginInfo().setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
    CHECK_VK_RESULT_VOID(begin_res, "Could not begin command buffer {}");
    return sequence;
}

void VulkanBackend::begin_render_pass(
    CommandSequence& sequence,
    const RenderPassHandle& render_pass,
    const FramebufferHandle& framebuffer
) {
    auto& vk_sequence = as_vulkan(sequence);
    auto vk_render_pass = std::dynamic_pointer_cast<VulkanRenderPass>(render_pass);
    auto vk_framebuffer = std::dynamic_pointer_cast<VulkanFramebuffer>(framebuffer);
    if (!vk_render_pass || !vk_framebuffer) {
        fatal("record", "", "Render pass or framebuffer was not created by the Vulkan backend");
    }

    auto clear_values = vk_render_pass->desc().clear_values();
    auto begin_info = vk::RenderPassBeginInfo()
        .setRenderPass(vk_render_pass->render_pass())
        .setFramebuffer(vk_framebuffer->framebuffer())
        .setRenderArea(vk::Rect2D({0, 0}, vk_framebuffer->extent()))
        .setClearValues(clear_values);
    vk_sequence.command_buffer().beginRenderPass(begin_info, vk::SubpassContents::eInline);
    vk_sequence.keep_alive(std::move(vk_render_pass));
    vk_sequence.keep_alive(std::move(vk_framebuffer));
}

void VulkanBackend::end_render_pass(CommandSequence& sequence)
{
    as_vulkan(sequence).command_buffer().endRenderPass();
}

void VulkanBackend::draw_indexed(CommandSequence& sequence, const DrawCommand& command)
{
    auto& vk_sequence = as_vulkan(sequence);
    auto pipeline = std::dynamic_pointer_cast<VulkanPipeline>(command.pipeline);
    auto vertex_buffer = std::dynamic_pointer_cast<VulkanBuffer>(command.vertex_buffer);
    auto index_buffer = std::dynamic_pointer_cast<VulkanBuffer>(command.index_buffer);
    if (!pipeline || !vertex_buffer || !index_buffer) {
        fatal("record", "", "Draw references resources not created by the Vulkan backend");
    }

    auto cmd = vk_sequence.command_buffer();
    cmd.bindPipeline(vk::PipelineBindPoint::eGraphics, pipeline->pipeline());
    cmd.setViewport(0, command.dynamic_state.viewport);
    cmd.setScissor(0, command.dynamic_state.scissor);
    cmd.bindVertexBuffers(0, vertex_buffer->buffer(), vk::DeviceSize{0});
    cmd.bindIndexBuffer(index_buffer->buffer(), 0, vk::IndexType::eUint32);

    if (!command.binding_sets.empty()) {
        std::vector<vk::DescriptorSet> sets;
        sets.reserve(command.binding_sets.size());
        for (const auto& handle : command.binding_sets) {
            auto set = std::dynamic_pointer_cast<VulkanBindingSet>(handle);
            if (!set) {
                fatal("record", "", "Binding set was not created by the Vulkan backend");
            }
            sets.push_back(set->set());
            vk_sequence.keep_alive(std::move(set));
        }
        cmd.bindDescriptorSets(vk::PipelineBindPoint::eGraphics, pipeline->layout(), 0, sets, {});
    }

    cmd.drawIndexed(command.index_count, 1, 0, 0, 0);
    vk_sequence.keep_alive(std::move(pipeline));
    vk_sequence.keep_alive(std::move(vertex_buffer));
    vk_sequence.keep_alive(std::move(index_buffer));
}

std::expected<CompletionSignalHandle, std::string> VulkanBackend::submit(
    CommandSequenceHandle sequence,
    const CompletionSignalHandle& dependency
) {
    auto& vk_sequence = as_vulkan(*sequence);
    auto cmd = vk_sequence.command_buffer();
    auto end_res = cmd.end();
    CHECK_VK_RESULT_VOID(end_res, "Could not end command buffer {}");

    std::vector<vk::Semaphore> wait_semaphores;
    std::vector<vk::PipelineStageFlags> wait_stages;
    if (dependency) {
        auto vk_dependency = std::dynamic_pointer_cast<VulkanCompletionSignal>(dependency);
        if (!vk_dependency) {
            return std::unexpected(std::string("dependency was not created by the Vulkan backend"));
        }
        wait_semaphores.push_back(vk_dependency->semaphore());
        wait_stages.emplace_back(vk::PipelineStageFlagBits::eColorAttachmentOutput);
    }

    auto signal = VulkanCompletionSignal::create(m_device, true);
    if (!signal) {
        return std::unexpected(signal.error());
    }
    auto signal_semaphore = signal.value()->semaphore();

    auto submit_info = vk::SubmitInfo()
        .setWaitSemaphores(wait_semaphores)
        .setWaitDstStageMask(wait_stages)
        .setCommandBuffers(cmd)
        .setSignalSemaphores(signal_semaphore);
    auto submit_res = m_context->graphics_queue().submit(submit_info, signal.value()->fence());
    CHECK_VK_RESULT_VOID(submit_res, "Failed to submit command buffer {}");

    m_in_flight.push_back(Submission{
        .sequence = std::move(sequence),
        .dependency = dependency,
        .signal = *signal,
    });
    return CompletionSignalHandle{*signal};
}

void VulkanBackend::wait_idle()
{
    if (auto res = m_device.waitIdle(); res != vk::Result::eSuccess) {
        Logger::instance().error("waitIdle failed: {}", vk::to_string(res));
    }
    reap_completed();
}

void VulkanBackend::reap_completed()
{
    while (!m_in_flight.empty() && m_in_flight.front().signal->is_complete()) {
        m_in_flight.pop_front();
    }
}

} // namespace re
