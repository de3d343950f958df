#include <catch2/catch_test_macros.hpp>
#include <re/Logger.hpp>
#include <re/RenderPasses.hpp>
#include <re/System.hpp>
#include <support/RecordingBackend.hpp>
#include <functional>

using namespace re;
using re::test::MockBindingSet;
using re::test::MockFramebuffer;
using re::test::MockSwapchain;
using re::test::RecordingBackend;

namespace {

Pass make_pass(RecordingBackend& backend, std::string name, std::vector<std::string> created,
               std::vector<std::string> needed, const RenderPassDesc& desc)
{
    return Pass{
        .name = std::move(name),
        .images_created_tags = std::move(created),
        .images_needed_tags = std::move(needed),
        .render_pass = *backend.create_render_pass(desc),
    };
}

/// "geometry" renders "scene", "post" samples it into "output".
System two_pass_system(RecordingBackend& backend, System::CustomImages custom = {},
                       std::vector<std::string> post_inputs = {"scene"})
{
    std::vector<Pass> passes;
    passes.push_back(make_pass(backend, "geometry", {"scene"}, {},
                               render_passes::basic(render_passes::SAMPLED_LAYOUT)));
    passes.push_back(make_pass(backend, "post", {"output"}, std::move(post_inputs), render_passes::basic()));
    return System{backend, std::move(passes), std::move(custom), "output"};
}

ObjectPrototype<VPosColor2D> triangle_prototype()
{
    return ObjectPrototype<VPosColor2D>{
        .vertex_shader = "triangle/triangle.vert",
        .fragment_shader = "triangle/triangle.frag",
        .mesh = {
            .vertices = {
                {{0.0f, -0.5f}, {1.0f, 0.0f, 0.0f}},
                {{0.5f, 0.5f}, {0.0f, 1.0f, 0.0f}},
                {{-0.5f, 0.5f}, {0.0f, 0.0f, 1.0f}},
            },
            .indices = {0, 1, 2},
        },
    };
}

ObjectPrototype<VPos2D> post_prototype()
{
    return ObjectPrototype<VPos2D>{
        .vertex_shader = "postprocess/fullscreen.vert",
        .fragment_shader = "postprocess/vignette.frag",
        .mesh = fullscreen_quad(),
        .collection = {SetData{}.add_uniform(1.5f)},
    };
}

void require_setup_error(const std::function<void()>& build)
{
    try {
        build();
        FAIL("expected FatalError");
    } catch (const FatalError& e) {
        REQUIRE(e.stage() == "system setup");
    }
}

} // anonymous namespace

TEST_CASE("System validates its passes", "[system]")
{
    Logger::instance().set_level(spdlog::level::trace);
    RecordingBackend backend;

    SECTION("at least one pass")
    {
        require_setup_error([&] { System(backend, {}, {}, "color"); });
    }

    SECTION("pass names are unique")
    {
        require_setup_error([&] {
            std::vector<Pass> passes;
            passes.push_back(make_pass(backend, "geometry", {"a"}, {}, render_passes::basic()));
            passes.push_back(make_pass(backend, "geometry", {"b"}, {}, render_passes::basic()));
            System(backend, std::move(passes), {}, "b");
        });
    }

    SECTION("one created image per attachment")
    {
        require_setup_error([&] {
            std::vector<Pass> passes;
            passes.push_back(make_pass(backend, "geometry", {"color", "depth"}, {}, render_passes::basic()));
            System(backend, std::move(passes), {}, "color");
        });
    }

    SECTION("inputs come from earlier passes or custom images")
    {
        require_setup_error([&] { two_pass_system(backend, {}, {"scene", "noise"}); });

        require_setup_error([&] {
            std::vector<Pass> passes;
            passes.push_back(make_pass(backend, "first", {"a"}, {"b"}, render_passes::basic()));
            passes.push_back(make_pass(backend, "second", {"b"}, {}, render_passes::basic()));
            System(backend, std::move(passes), {}, "b");
        });

        REQUIRE_NOTHROW(two_pass_system(backend, {{"noise", RecordingBackend::make_target(8, 8)}},
                                        {"scene", "noise"}));
    }

    SECTION("custom images are not null")
    {
        require_setup_error([&] { two_pass_system(backend, {{"noise", nullptr}}); });
    }

    SECTION("some pass creates the output")
    {
        require_setup_error([&] {
            std::vector<Pass> passes;
            passes.push_back(make_pass(backend, "geometry", {"color"}, {}, render_passes::basic()));
            System(backend, std::move(passes), {}, "screen");
        });
    }
}

TEST_CASE("System frame protocol", "[system]")
{
    RecordingBackend backend;
    auto system = two_pass_system(backend);
    auto target = RecordingBackend::make_target(100, 100);

    REQUIRE_FALSE(system.is_recording());
    REQUIRE_FALSE(system.current_pass());

    SECTION("calls outside a frame are fatal")
    {
        auto object = triangle_prototype().build(backend, system.pipeline_cache(0));
        REQUIRE_THROWS_AS(system.add_object(object), FatalError);
        REQUIRE_THROWS_AS(system.next_pass(), FatalError);
        REQUIRE_THROWS_AS(system.finish(nullptr), FatalError);
        REQUIRE(backend.submissions.empty());
    }

    SECTION("a null destination is fatal")
    {
        REQUIRE_THROWS_AS(system.start(nullptr), FatalError);
        REQUIRE_FALSE(system.is_recording());
    }

    SECTION("start twice without finishing is fatal")
    {
        system.start(target);
        REQUIRE_THROWS_AS(system.start(target), FatalError);
    }

    SECTION("next_pass past the last pass is fatal")
    {
        system.start(target);
        REQUIRE(system.current_pass() == 0u);
        system.next_pass();
        REQUIRE(system.current_pass() == 1u);
        REQUIRE_THROWS_AS(system.next_pass(), FatalError);
        REQUIRE(system.current_pass() == 1u);
    }

    SECTION("finish submits after its dependency and returns to idle")
    {
        auto dependency = std::make_shared<re::test::MockCompletionSignal>(42);
        system.start(target);
        system.next_pass();
        auto signal = system.finish(dependency);

        REQUIRE_FALSE(system.is_recording());
        REQUIRE(backend.submissions.size() == 1);
        REQUIRE(backend.submissions[0].dependency == dependency);
        REQUIRE(backend.submissions[0].signal == signal);
        REQUIRE(re::test::event_names(backend.submissions[0].events)
                == std::vector<std::string>{"begin", "end", "begin", "end"});
    }

    SECTION("finish before the last pass submits what was recorded")
    {
        system.start(target);
        (void)system.finish(nullptr);
        REQUIRE(re::test::event_names(backend.submissions[0].events) == std::vector<std::string>{"begin", "end"});
        REQUIRE_NOTHROW(system.start(target));
    }

    SECTION("a failed submit is fatal and leaves the system idle")
    {
        backend.fail_submit = true;
        system.start(target);
        REQUIRE_THROWS_AS(system.finish(nullptr), FatalError);
        REQUIRE_FALSE(system.is_recording());
    }
}

TEST_CASE("System draws with pass and object bindings", "[system]")
{
    RecordingBackend backend;
    auto system = two_pass_system(backend);
    REQUIRE(system.object_slot_offset(0) == 0);
    REQUIRE(system.object_slot_offset(1) == 1);

    auto triangle = triangle_prototype().build(backend, system.pipeline_cache(0), system.object_slot_offset(0));
    auto post = post_prototype().build(backend, system.pipeline_cache(1), system.object_slot_offset(1));
    auto sets_before = backend.binding_sets_created;

    auto target = RecordingBackend::make_target(100, 100);
    system.start(target);
    system.add_object(triangle);
    system.add_object(triangle);
    system.next_pass();
    system.add_object(post);
    (void)system.finish(nullptr);

    const auto& events = backend.submissions.at(0).events;
    REQUIRE(re::test::event_names(events)
            == std::vector<std::string>{"begin", "draw", "draw", "end", "begin", "draw", "end"});

    auto commands = re::test::draws(events);
    REQUIRE(commands.size() == 3);

    SECTION("geometry draws use only their own sets")
    {
        REQUIRE(commands[0].binding_sets.empty());
        REQUIRE(commands[0].index_count == 3);
        REQUIRE(commands[0].pipeline == commands[1].pipeline);
        REQUIRE(commands[0].vertex_buffer == triangle.vertex_buffer());
        REQUIRE(commands[0].dynamic_state == DynamicState::full({100, 100}));
    }

    SECTION("post draw binds the scene at slot 0 and its own set at slot 1")
    {
        const auto& sets = commands[2].binding_sets;
        REQUIRE(sets.size() == 2);
        REQUIRE(sets[0]->slot() == 0);
        REQUIRE(sets[1]->slot() == 1);
        REQUIRE(sets[1] == post.collection().set(0).get());

        const auto& input = static_cast<const MockBindingSet&>(*sets[0]);
        REQUIRE(std::get<ImageBinding>(input.m_bindings.at(0)).image == system.images().find("scene"));
        REQUIRE(commands[2].index_count == 6);

        // Only the pass-level input set was built while recording.
        REQUIRE(backend.binding_sets_created == sets_before + 1);
    }

    SECTION("each pass renders into its own framebuffer")
    {
        auto begin_geometry = std::get<re::test::BeginPassEvent>(events[0]);
        auto begin_post = std::get<re::test::BeginPassEvent>(events[4]);
        REQUIRE(begin_geometry.render_pass == system.passes()[0].render_pass);
        REQUIRE(begin_post.render_pass == system.passes()[1].render_pass);

        const auto& post_framebuffer = static_cast<const MockFramebuffer&>(*begin_post.framebuffer);
        REQUIRE(post_framebuffer.m_images == std::vector<ImageHandle>{target});
        REQUIRE(post_framebuffer.extent() == vk::Extent2D{100, 100});
    }
}

TEST_CASE("System custom dynamic state", "[system]")
{
    RecordingBackend backend;
    auto system = two_pass_system(backend);
    auto prototype = triangle_prototype();
    prototype.custom_dynamic_state = DynamicState::region(0.0f, 0.0f, 50.0f, 25.0f);
    auto triangle = prototype.build(backend, system.pipeline_cache(0));

    system.start(RecordingBackend::make_target(100, 100));
    system.add_object(triangle);
    (void)system.finish(nullptr);

    auto commands = re::test::draws(backend.submissions.at(0).events);
    REQUIRE(commands.at(0).dynamic_state == DynamicState::region(0.0f, 0.0f, 50.0f, 25.0f));
}

TEST_CASE("System intermediate images follow the destination size", "[system]")
{
    RecordingBackend backend;
    auto system = two_pass_system(backend);
    auto post = post_prototype().build(backend, system.pipeline_cache(1), system.object_slot_offset(1));

    auto frame = [&](const ImageHandle& target) {
        system.start(target);
        system.next_pass();
        system.add_object(post);
        (void)system.finish(nullptr);
    };

    frame(RecordingBackend::make_target(100, 100));
    REQUIRE(backend.images_created.size() == 1);
    auto scene = system.images().find("scene");
    REQUIRE(scene->extent() == vk::Extent2D{100, 100});
    REQUIRE(scene->format() == render_passes::DEFAULT_COLOR_FORMAT);
    auto sets_after_first = backend.binding_sets_created;

    SECTION("same size reuses images and input sets")
    {
        frame(RecordingBackend::make_target(100, 100));
        REQUIRE(backend.images_created.size() == 1);
        REQUIRE(system.images().find("scene") == scene);
        REQUIRE(backend.binding_sets_created == sets_after_first);
        REQUIRE(system.collection_cache(1).stats().hits == 1);
    }

    SECTION("new size reallocates and rebuilds input sets")
    {
        frame(RecordingBackend::make_target(200, 150));
        REQUIRE(backend.images_created.size() == 2);
        auto resized = system.images().find("scene");
        REQUIRE(resized != scene);
        REQUIRE(resized->extent() == vk::Extent2D{200, 150});
        REQUIRE(backend.binding_sets_created == sets_after_first + 1);

        auto commands = re::test::draws(backend.submissions.back().events);
        const auto& input = static_cast<const MockBindingSet&>(*commands.at(0).binding_sets.at(0));
        REQUIRE(std::get<ImageBinding>(input.m_bindings.at(0)).image == resized);
    }

    SECTION("the destination is never allocated")
    {
        auto target = RecordingBackend::make_target(100, 100);
        frame(target);
        REQUIRE(system.images().find("output") == target);
        for (const auto& image : backend.images_created) {
            REQUIRE(image != target);
        }
    }
}

TEST_CASE("System custom images", "[system]")
{
    RecordingBackend backend;
    auto noise = RecordingBackend::make_target(8, 8);
    auto system = two_pass_system(backend, {{"noise", noise}}, {"scene", "noise"});
    auto post = post_prototype().build(backend, system.pipeline_cache(1), system.object_slot_offset(1));

    system.start(RecordingBackend::make_target(100, 100));
    system.next_pass();
    system.add_object(post);
    (void)system.finish(nullptr);

    REQUIRE(backend.images_created.size() == 1);
    REQUIRE(system.images().find("noise") == noise);

    auto commands = re::test::draws(backend.submissions.at(0).events);
    const auto& input = static_cast<const MockBindingSet&>(*commands.at(0).binding_sets.at(0));
    REQUIRE(input.m_bindings.size() == 2);
    REQUIRE(std::get<ImageBinding>(input.m_bindings[1]).image == noise);
}

TEST_CASE("System output tag can be switched", "[system]")
{
    RecordingBackend backend;
    auto system = two_pass_system(backend);
    auto target = RecordingBackend::make_target(100, 100);

    system.start(target);
    (void)system.finish(nullptr);
    REQUIRE(backend.images_created.size() == 1);

    try {
        system.set_output_tag("screen");
        FAIL("expected FatalError");
    } catch (const FatalError& e) {
        REQUIRE(e.stage() == "set output tag");
    }
    REQUIRE(system.output_tag() == "output");

    system.set_output_tag("scene");
    system.start(target);
    (void)system.finish(nullptr);

    REQUIRE(system.images().find("scene") == target);
    REQUIRE(system.images().find("output") != target);
    REQUIRE(backend.images_created.size() == 2);
    REQUIRE(backend.images_created.back() == system.images().find("output"));
}

TEST_CASE("System rebuilds input sets when a sampled destination changes", "[system]")
{
    RecordingBackend backend;
    std::vector<Pass> passes;
    passes.push_back(make_pass(backend, "geometry", {"output"}, {},
                               render_passes::basic(render_passes::SAMPLED_LAYOUT)));
    passes.push_back(make_pass(backend, "copy", {"final"}, {"output"}, render_passes::basic()));
    System system(backend, std::move(passes), {}, "output");
    auto post = post_prototype().build(backend, system.pipeline_cache(1), system.object_slot_offset(1));

    auto frame = [&](const ImageHandle& target) {
        system.start(target);
        system.next_pass();
        system.add_object(post);
        (void)system.finish(nullptr);
    };

    auto first = RecordingBackend::make_target(64, 64);
    auto second = RecordingBackend::make_target(64, 64);
    frame(first);
    auto sets = backend.binding_sets_created;

    frame(second);
    REQUIRE(backend.binding_sets_created == sets + 1);

    frame(second);
    REQUIRE(backend.binding_sets_created == sets + 1);
}

TEST_CASE("System renders into a swapchain target", "[system]")
{
    RecordingBackend backend;
    auto system = two_pass_system(backend);
    MockSwapchain swapchain;

    SECTION("a stale swapchain skips the frame")
    {
        swapchain.pending.push_back(nullptr);
        REQUIRE_FALSE(system.start_window(swapchain));
        REQUIRE_FALSE(system.is_recording());
    }

    SECTION("acquired images are rendered and presented")
    {
        auto image = RecordingBackend::make_target(320, 200);
        swapchain.pending.push_back(image);
        REQUIRE(system.start_window(swapchain));
        REQUIRE(system.images().find("output") == image);

        system.next_pass();
        REQUIRE(system.finish_to_window(swapchain));

        REQUIRE(backend.submissions.size() == 1);
        REQUIRE(backend.submissions[0].dependency == swapchain.acquire_signal);
        REQUIRE(swapchain.presented == std::vector<CompletionSignalHandle>{backend.submissions[0].signal});
    }

    SECTION("a stale present still submits the frame")
    {
        swapchain.pending.push_back(RecordingBackend::make_target(320, 200));
        swapchain.present_stale = true;
        REQUIRE(system.start_window(swapchain));
        system.next_pass();
        REQUIRE_FALSE(system.finish_to_window(swapchain));
        REQUIRE(backend.submissions.size() == 1);
        REQUIRE_FALSE(system.is_recording());
    }
}

TEST_CASE("System does not retry hard swapchain failures", "[system]")
{
    RecordingBackend backend;
    auto system = two_pass_system(backend);
    MockSwapchain swapchain;

    SECTION("acquire failure is fatal")
    {
        swapchain.pending.push_back(RecordingBackend::make_target(320, 200));
        swapchain.acquire_failure = "ErrorDeviceLost";
        try {
            (void)system.start_window(swapchain);
            FAIL("expected FatalError");
        } catch (const FatalError& e) {
            REQUIRE(e.stage() == "acquire");
            REQUIRE(std::string(e.what()).find("ErrorDeviceLost") != std::string::npos);
        }
        REQUIRE_FALSE(system.is_recording());
        REQUIRE(backend.submissions.empty());
    }

    SECTION("present failure is fatal after the frame was submitted")
    {
        swapchain.pending.push_back(RecordingBackend::make_target(320, 200));
        swapchain.present_failure = "ErrorSurfaceLostKHR";
        REQUIRE(system.start_window(swapchain));
        system.next_pass();
        try {
            (void)system.finish_to_window(swapchain);
            FAIL("expected FatalError");
        } catch (const FatalError& e) {
            REQUIRE(e.stage() == "present");
        }
        REQUIRE(backend.submissions.size() == 1);
        REQUIRE_FALSE(system.is_recording());

        swapchain.present_failure.reset();
        swapchain.pending.push_back(RecordingBackend::make_target(320, 200));
        REQUIRE(system.start_window(swapchain));
    }
}

TEST_CASE("System reports pipeline failures with the pass name", "[system]")
{
    RecordingBackend backend;
    auto system = two_pass_system(backend);
    auto triangle = triangle_prototype().build(backend, system.pipeline_cache(0));

    auto broken_spec = triangle.pipeline_spec();
    broken_spec.fragment_shader = "broken.frag";
    triangle.set_pipeline_spec(broken_spec);
    backend.failing_shaders.insert("broken.frag");

    system.start(RecordingBackend::make_target(100, 100));
    try {
        system.add_object(triangle);
        FAIL("expected FatalError");
    } catch (const FatalError& e) {
        REQUIRE(e.stage() == "pipeline build");
        REQUIRE(e.pass() == "geometry");
    }
}
