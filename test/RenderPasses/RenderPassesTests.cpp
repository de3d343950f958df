#include <catch2/catch_test_macros.hpp>
#include <re/RenderPasses.hpp>

using namespace re;

TEST_CASE("basic render pass", "[render_passes]")
{
    auto desc = render_passes::basic();

    REQUIRE(desc.attachments.size() == 1);
    REQUIRE(desc.color_attachments == std::vector<uint32_t>{0});
    REQUIRE_FALSE(desc.depth_attachment);
    REQUIRE(desc.resolve_attachments.empty());
    REQUIRE(desc.attachments[0].format == render_passes::DEFAULT_COLOR_FORMAT);
    REQUIRE(desc.attachments[0].final_layout == render_passes::PRESENT_LAYOUT);
    REQUIRE(desc.attachments[0].load_op == vk::AttachmentLoadOp::eClear);
    REQUIRE(desc.rasterization_samples() == vk::SampleCountFlagBits::e1);

    SECTION("sampled variant")
    {
        auto sampled = render_passes::basic(render_passes::SAMPLED_LAYOUT, vk::Format::eR8G8B8A8Unorm);
        REQUIRE(sampled.attachments[0].final_layout == vk::ImageLayout::eShaderReadOnlyOptimal);
        REQUIRE(sampled.attachments[0].format == vk::Format::eR8G8B8A8Unorm);
    }

    SECTION("clears to opaque black")
    {
        auto clear = desc.clear_values().at(0).color.float32;
        REQUIRE(clear[0] == 0.0f);
        REQUIRE(clear[3] == 1.0f);
    }
}

TEST_CASE("depth render passes", "[render_passes]")
{
    SECTION("with_depth puts depth second")
    {
        auto desc = render_passes::with_depth();
        REQUIRE(desc.attachments.size() == 2);
        REQUIRE(desc.depth_attachment == 1u);
        REQUIRE(desc.attachments[1].is_depth());
        REQUIRE_FALSE(desc.attachments[0].is_depth());
        REQUIRE(desc.clear_values().at(1).depthStencil.depth == 1.0f);
    }

    SECTION("only_depth keeps the depth image for sampling")
    {
        auto desc = render_passes::only_depth();
        REQUIRE(desc.attachments.size() == 1);
        REQUIRE(desc.color_attachments.empty());
        REQUIRE(desc.depth_attachment == 0u);
        REQUIRE(desc.attachments[0].store_op == vk::AttachmentStoreOp::eStore);
        REQUIRE(desc.attachments[0].final_layout == vk::ImageLayout::eShaderReadOnlyOptimal);
    }
}

TEST_CASE("multisampled render pass", "[render_passes]")
{
    auto desc = render_passes::multisampled_with_depth(vk::SampleCountFlagBits::e4);

    REQUIRE(desc.attachments.size() == 3);
    REQUIRE(desc.color_attachments == std::vector<uint32_t>{1});
    REQUIRE(desc.depth_attachment == 2u);
    REQUIRE(desc.resolve_attachments == std::vector<uint32_t>{0});

    REQUIRE(desc.attachments[0].samples == vk::SampleCountFlagBits::e1);
    REQUIRE(desc.attachments[0].final_layout == render_passes::PRESENT_LAYOUT);
    REQUIRE(desc.attachments[1].samples == vk::SampleCountFlagBits::e4);
    REQUIRE(desc.attachments[2].samples == vk::SampleCountFlagBits::e4);
    REQUIRE(desc.rasterization_samples() == vk::SampleCountFlagBits::e4);
}
