#include <catch2/catch_test_macros.hpp>
#include <re/Templates.hpp>
#include <support/RecordingBackend.hpp>

using namespace re;
using re::test::RecordingBackend;

TEST_CASE("forward templates", "[templates]")
{
    RecordingBackend backend;

    SECTION("forward")
    {
        auto system = templates::forward(backend);
        REQUIRE(system.passes().size() == 1);
        REQUIRE(system.passes()[0].name == "geometry");
        REQUIRE(system.passes()[0].images_created_tags == std::vector<std::string>{"color"});
        REQUIRE(system.output_tag() == "color");
        REQUIRE(backend.render_passes_created == 1);
    }

    SECTION("forward_with_depth allocates only the depth image")
    {
        auto system = templates::forward_with_depth(backend);
        REQUIRE(system.passes()[0].images_created_tags == std::vector<std::string>{"color", "depth"});

        system.start(RecordingBackend::make_target(320, 240));
        (void)system.finish(nullptr);
        REQUIRE(backend.images_created.size() == 1);
        REQUIRE(backend.images_created[0]->format() == vk::Format::eD16Unorm);
    }

    SECTION("forward_msaa_depth resolves into the output")
    {
        auto system = templates::forward_msaa_depth(backend, vk::SampleCountFlagBits::e8);
        REQUIRE(system.passes()[0].images_created_tags
                == std::vector<std::string>{"resolve_color", "color", "depth"});
        REQUIRE(system.output_tag() == "resolve_color");

        system.start(RecordingBackend::make_target(320, 240));
        (void)system.finish(nullptr);
        REQUIRE(backend.images_created.size() == 2);
        for (const auto& image : backend.images_created) {
            REQUIRE(image->samples() == vk::SampleCountFlagBits::e8);
            REQUIRE(image->extent() == vk::Extent2D{320, 240});
        }
    }
}
