#include <catch2/catch_test_macros.hpp>

#include <est/Logger.hpp>
#include <est/Pipeline.hpp>

#include "Support/TestSupport.hpp"

using namespace est;
using namespace est::test;

namespace
{

RenderPipelineState state_for(const Shader& shader, uint32_t sample_count = 1)
{
    return RenderPipelineState{.shader = shader,
                               .primitive = shader.primitive(),
                               .targets = {ColorTargetState{.format = TextureFormat::Rgba8Unorm,
                                                            .blend = std::nullopt,
                                                            .write_mask = ColorWrite::All}},
                               .depth = std::nullopt,
                               .sample_count = sample_count};
}

} // anonymous namespace

TEST_CASE("Render pipelines are created once per state", "[cache][pipeline]")
{
    Logger::instance().set_level(spdlog::level::warn);
    TestContext test;
    auto shader = build_shader(test.context, uniform_module());

    SECTION("the second lookup reuses the backend pipeline")
    {
        auto first = get_render_pipeline(test.context, state_for(shader));
        auto second = get_render_pipeline(test.context, state_for(shader));
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(*first == *second);
        REQUIRE(test.device->created().render_pipelines == 1);
        REQUIRE(test.context.pipeline_cache().stats().hits == 1);
    }

    SECTION("every field of the state takes part in the key")
    {
        auto base = state_for(shader);
        auto key = render_pipeline_key(base);

        auto blended = base;
        blended.targets[0].blend = BlendState::alpha_blending();
        REQUIRE(render_pipeline_key(blended) != key);

        auto formatted = base;
        formatted.targets[0].format = TextureFormat::Bgra8Unorm;
        REQUIRE(render_pipeline_key(formatted) != key);

        auto culled = base;
        culled.primitive.cull_mode = CullMode::Back;
        REQUIRE(render_pipeline_key(culled) != key);

        auto depth = base;
        depth.depth = DepthStencilState{.format = TextureFormat::Depth32Float};
        REQUIRE(render_pipeline_key(depth) != key);

        auto sampled = base;
        sampled.sample_count = 4;
        REQUIRE(render_pipeline_key(sampled) != key);

        REQUIRE(render_pipeline_key(state_for(shader)) == key);
    }

    SECTION("two shaders never share a key")
    {
        auto other = build_shader(test.context, uniform_module());
        REQUIRE(render_pipeline_key(state_for(shader)) != render_pipeline_key(state_for(other)));
    }

    SECTION("the vertex buffer layout reaches the backend")
    {
        auto drawing = build_shader(test.context, drawing_module());
        auto pipeline = get_render_pipeline(test.context, state_for(drawing));
        REQUIRE(pipeline.has_value());
        const auto& descriptor = test.device->render_pipeline((*pipeline)->handle.get());
        REQUIRE(descriptor.vertex_buffer.has_value());
        REQUIRE(descriptor.vertex_buffer->stride == 36);
        REQUIRE(descriptor.vertex_entry_point == "vertex_main");
        REQUIRE(descriptor.fragment_entry_point == "fragment_main");
    }

    SECTION("a compute shader is refused")
    {
        Logger::instance().set_level(spdlog::level::off);
        auto compute = build_compute_shader(test.context);
        auto pipeline = get_render_pipeline(test.context, state_for(compute));
        REQUIRE_FALSE(pipeline.has_value());
        REQUIRE(pipeline.error().kind == ErrorKind::InvalidShaderType);
    }

    SECTION("device failures are reported and nothing is cached")
    {
        Logger::instance().set_level(spdlog::level::off);
        test.device->fail_next();
        auto pipeline = get_render_pipeline(test.context, state_for(shader));
        REQUIRE_FALSE(pipeline.has_value());
        REQUIRE(pipeline.error().kind == ErrorKind::DeviceFailure);
        REQUIRE(test.context.pipeline_cache().size() == 0);
    }
}

TEST_CASE("Compute pipelines are cached by shader", "[cache][pipeline][compute]")
{
    Logger::instance().set_level(spdlog::level::warn);
    TestContext test;
    auto shader = build_compute_shader(test.context);

    auto first = get_compute_pipeline(test.context, {.shader = shader});
    auto second = get_compute_pipeline(test.context, {.shader = shader});
    REQUIRE(first.has_value());
    REQUIRE(*first == *second);
    REQUIRE((*first)->kind == PipelineKind::Compute);
    REQUIRE(test.device->created().compute_pipelines == 1);
    REQUIRE(compute_pipeline_key({.shader = shader}) != render_pipeline_key(state_for(build_shader(test.context, plain_module()))));
}

TEST_CASE("Idle pipelines are released by cycling", "[cache][pipeline][lifetime]")
{
    Logger::instance().set_level(spdlog::level::warn);
    TestContext test;
    auto shader = build_shader(test.context, uniform_module());

    auto pipeline = get_render_pipeline(test.context, state_for(shader)).value();
    auto handle = pipeline->handle.get();
    pipeline.reset();

    for (uint32_t i = 0; i < PIPELINE_CACHE_CONFIG.lifetime - 1; ++i)
        test.context.cycle();
    REQUIRE(test.device->is_live(handle));

    test.context.cycle();
    REQUIRE_FALSE(test.device->is_live(handle));
    REQUIRE(test.context.pipeline_cache().size() == 0);
}

TEST_CASE("Too many live pipeline variants in one frame", "[cache][pipeline][capacity]")
{
    Logger::instance().set_level(spdlog::level::off);
    TestContext test;
    auto shader = build_shader(test.context, uniform_module());

    for (uint32_t i = 1; i <= PIPELINE_CACHE_CONFIG.capacity; ++i)
    {
        REQUIRE(get_render_pipeline(test.context, state_for(shader, i)).has_value());
    }
    REQUIRE(test.context.pipeline_cache().size() == PIPELINE_CACHE_CONFIG.capacity);

    auto kind = fatal_kind([&] { (void)get_render_pipeline(test.context, state_for(shader, 10'000)); });
    REQUIRE(kind == ErrorKind::CacheCapacityExceeded);
}

TEST_CASE("EvictOldest keeps a full pipeline cache usable", "[cache][pipeline][capacity]")
{
    Logger::instance().set_level(spdlog::level::off);
    ContextConfig config;
    config.pipeline_cache = {.capacity = 3, .lifetime = 50, .emergency_lifetime = 10, .overflow = OverflowPolicy::EvictOldest};
    TestContext test(config);
    auto shader = build_shader(test.context, uniform_module());

    for (uint32_t i = 1; i <= 4; ++i)
    {
        REQUIRE(get_render_pipeline(test.context, state_for(shader, i)).has_value());
    }
    REQUIRE(test.context.pipeline_cache().size() == 3);
    REQUIRE(test.context.pipeline_cache().stats().evictions == 1);
}
