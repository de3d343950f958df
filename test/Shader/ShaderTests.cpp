#include <catch2/catch_test_macros.hpp>
#include <map>

#include <re/Logger.hpp>
#include <re/vulkan/Shader.hpp>
#include <re/vulkan/VulkanContext.hpp>

// Compiles the shaders under shaders/ and needs a device for the modules.

using namespace re;

TEST_CASE("Triangle vertex shader loads correctly", "[.][vulkan][shader]")
{
    Logger::instance().set_level(spdlog::level::trace);
    VulkanContext ctx(VulkanContextConfig{.application_name = "Shader Test"});

    auto shader_result = Shader::create_shader(ctx.device(), "triangle/triangle.vert");
    REQUIRE(shader_result.has_value());
    auto& shader = shader_result.value();

    SECTION("shader module is valid")
    {
        REQUIRE(shader.shader_module());
    }

    SECTION("shader has correct stage")
    {
        REQUIRE(shader.stage() == vk::ShaderStageFlagBits::eVertex);
    }

    SECTION("shader has no descriptors")
    {
        REQUIRE(shader.descriptor_infos().empty());
    }

    SECTION("stage info names the entry point")
    {
        auto info = shader.create_pipeline_shader_stage_create_info();
        REQUIRE(info.stage == vk::ShaderStageFlagBits::eVertex);
        REQUIRE(std::string(info.pName) == "main");
    }
}

TEST_CASE("Moving vertex shader reflects its transform", "[.][vulkan][shader]")
{
    VulkanContext ctx(VulkanContextConfig{.application_name = "Shader Test"});

    auto shader_result = Shader::create_shader(ctx.device(), "triangle/moving.vert");
    REQUIRE(shader_result.has_value());

    const auto& descriptors = shader_result->descriptor_infos();
    REQUIRE(descriptors.size() == 1);

    const auto& desc = descriptors[0];
    REQUIRE(desc.name == "transform");
    REQUIRE(desc.binding == 0);
    REQUIRE(desc.set == 0);
    REQUIRE(desc.descriptor_count == 1);
    REQUIRE(desc.type == vk::DescriptorType::eUniformBuffer);
    REQUIRE(desc.stage == vk::ShaderStageFlagBits::eVertex);
    REQUIRE(desc.size >= 12); // float2 + float
}

TEST_CASE("Vignette fragment shader uses two sets", "[.][vulkan][shader]")
{
    VulkanContext ctx(VulkanContextConfig{.application_name = "Shader Test"});

    auto shader_result = Shader::create_shader(ctx.device(), "postprocess/vignette.frag");
    REQUIRE(shader_result.has_value());
    auto& shader = shader_result.value();

    REQUIRE(shader.stage() == vk::ShaderStageFlagBits::eFragment);

    std::map<std::string, const DescriptorInfo*> desc_map;
    for (const auto& desc : shader.descriptor_infos()) {
        desc_map[desc.name] = &desc;
    }
    REQUIRE(desc_map.size() == 2);
    REQUIRE(desc_map.contains("scene"));
    REQUIRE(desc_map.contains("params"));

    SECTION("pass input in set 0")
    {
        const auto* scene = desc_map["scene"];
        REQUIRE(scene->set == 0);
        REQUIRE(scene->binding == 0);
        REQUIRE(scene->type == vk::DescriptorType::eCombinedImageSampler);
    }

    SECTION("object parameters in set 1")
    {
        const auto* params = desc_map["params"];
        REQUIRE(params->set == 1);
        REQUIRE(params->binding == 0);
        REQUIRE(params->type == vk::DescriptorType::eUniformBuffer);
    }
}

TEST_CASE("Missing shader reports an error", "[.][vulkan][shader]")
{
    VulkanContext ctx(VulkanContextConfig{.application_name = "Shader Test"});

    auto shader_result = Shader::create_shader(ctx.device(), "does/not/exist.frag");
    REQUIRE_FALSE(shader_result.has_value());
    REQUIRE_FALSE(shader_result.error().empty());
}

TEST_CASE("Entry point must exist", "[.][vulkan][shader]")
{
    VulkanContext ctx(VulkanContextConfig{.application_name = "Shader Test"});

    auto shader_result = Shader::create_shader(ctx.device(), "triangle/triangle.vert", "not_main");
    REQUIRE_FALSE(shader_result.has_value());
    REQUIRE(shader_result.error().find("not_main") != std::string::npos);
}

TEST_CASE("Descriptor layouts merge across stages", "[.][vulkan][shader]")
{
    VulkanContext ctx(VulkanContextConfig{.application_name = "Shader Test"});

    auto moving = Shader::create_shader(ctx.device(), "triangle/moving.vert");
    auto fullscreen = Shader::create_shader(ctx.device(), "postprocess/fullscreen.vert");
    auto vignette = Shader::create_shader(ctx.device(), "postprocess/vignette.frag");
    REQUIRE(moving.has_value());
    REQUIRE(fullscreen.has_value());
    REQUIRE(vignette.has_value());

    SECTION("one entry per set up to the highest used")
    {
        auto sets = merge_descriptor_layouts({&*fullscreen, &*vignette});
        REQUIRE(sets.has_value());
        REQUIRE(sets->size() == 2);
        REQUIRE((*sets)[0].size() == 1);
        REQUIRE((*sets)[0][0].descriptorType == vk::DescriptorType::eCombinedImageSampler);
        REQUIRE((*sets)[1].size() == 1);
        REQUIRE((*sets)[1][0].stageFlags == vk::ShaderStageFlagBits::eFragment);
    }

    SECTION("no descriptors gives no sets")
    {
        auto sets = merge_descriptor_layouts({&*fullscreen});
        REQUIRE(sets.has_value());
        REQUIRE(sets->empty());
    }

    SECTION("conflicting types at the same slot are rejected")
    {
        // moving.vert has a uniform buffer where vignette.frag has a sampler.
        auto sets = merge_descriptor_layouts({&*moving, &*vignette});
        REQUIRE_FALSE(sets.has_value());
    }
}
