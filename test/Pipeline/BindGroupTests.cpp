#include <catch2/catch_test_macros.hpp>

#include <est/BindGroup.hpp>
#include <est/Logger.hpp>
#include <est/Pipeline.hpp>

#include "Support/TestSupport.hpp"

using namespace est;
using namespace est::test;

TEST_CASE("Uniform attachments are validated against the shader", "[bind_group][validation]")
{
    Logger::instance().set_level(spdlog::level::warn);
    TestContext test;
    auto shader = build_shader(test.context, uniform_module());

    SECTION("a 64 byte uniform buffer is accepted")
    {
        auto buffer = build_buffer(test.context, 64, BufferUsage::Uniform | BufferUsage::CopyDst);
        auto pipeline = RenderPipelineBuilder(test.context).set_shader(shader).set_attachment_uniform(0, 0, buffer).build();
        REQUIRE(pipeline.has_value());
        REQUIRE(pipeline->bind_groups() != nullptr);
        REQUIRE(pipeline->bind_groups()->groups.size() == 1);

        const auto& descriptor = test.device->bind_group(pipeline->bind_groups()->groups[0].second.get());
        REQUIRE(descriptor.entries.size() == 1);
        const auto& binding = std::get<BufferBinding>(descriptor.entries[0].resource);
        REQUIRE(binding.buffer == buffer.handle());
        REQUIRE(binding.size == 64);
    }

    SECTION("a 32 byte buffer is too small")
    {
        Logger::instance().set_level(spdlog::level::off);
        auto buffer = build_buffer(test.context, 32, BufferUsage::Uniform);
        auto pipeline = RenderPipelineBuilder(test.context).set_shader(shader).set_attachment_uniform(0, 0, buffer).build();
        REQUIRE_FALSE(pipeline.has_value());
        REQUIRE(pipeline.error().kind == ErrorKind::BindingTypeMismatch);
    }

    SECTION("a storage attachment on a uniform binding")
    {
        Logger::instance().set_level(spdlog::level::off);
        auto buffer = build_buffer(test.context, 64, BufferUsage::Uniform | BufferUsage::Storage);
        auto pipeline = RenderPipelineBuilder(test.context).set_shader(shader).set_attachment_storage(0, 0, buffer).build();
        REQUIRE(pipeline.error().kind == ErrorKind::BindingTypeMismatch);
    }

    SECTION("a buffer without Uniform usage")
    {
        Logger::instance().set_level(spdlog::level::off);
        auto buffer = build_buffer(test.context, 64, BufferUsage::Storage);
        auto pipeline = RenderPipelineBuilder(test.context).set_shader(shader).set_attachment_uniform(0, 0, buffer).build();
        REQUIRE(pipeline.error().kind == ErrorKind::BindingTypeMismatch);
    }

    SECTION("nothing attached")
    {
        Logger::instance().set_level(spdlog::level::off);
        auto pipeline = RenderPipelineBuilder(test.context).set_shader(shader).build();
        REQUIRE(pipeline.error().kind == ErrorKind::MissingBinding);
    }

    SECTION("an attachment at an undeclared binding")
    {
        Logger::instance().set_level(spdlog::level::off);
        auto buffer = build_buffer(test.context, 64, BufferUsage::Uniform);
        auto pipeline = RenderPipelineBuilder(test.context)
                            .set_shader(shader)
                            .set_attachment_uniform(0, 0, buffer)
                            .set_attachment_uniform(0, 5, buffer)
                            .build();
        REQUIRE(pipeline.error().kind == ErrorKind::BindingNotFound);
    }

    SECTION("an attachment in an undeclared group")
    {
        Logger::instance().set_level(spdlog::level::off);
        auto buffer = build_buffer(test.context, 64, BufferUsage::Uniform);
        auto pipeline = RenderPipelineBuilder(test.context)
                            .set_shader(shader)
                            .set_attachment_uniform(0, 0, buffer)
                            .set_attachment_uniform(3, 0, buffer)
                            .build();
        REQUIRE(pipeline.error().kind == ErrorKind::BindGroupNotFound);
    }

    SECTION("a removed attachment is missing again")
    {
        Logger::instance().set_level(spdlog::level::off);
        auto buffer = build_buffer(test.context, 64, BufferUsage::Uniform);
        auto pipeline = RenderPipelineBuilder(test.context)
                            .set_shader(shader)
                            .set_attachment_uniform(0, 0, buffer)
                            .remove_attachment(0, 0)
                            .build();
        REQUIRE(pipeline.error().kind == ErrorKind::MissingBinding);
    }
}

TEST_CASE("Texture and sampler attachments", "[bind_group][validation]")
{
    Logger::instance().set_level(spdlog::level::warn);
    TestContext test;
    auto shader = build_shader(test.context, drawing_module());
    const auto& texture = test.context.default_texture();
    const auto& sampler = test.context.default_sampler();

    SECTION("the defaults fit the drawing layout")
    {
        auto pipeline = RenderPipelineBuilder(test.context)
                            .set_shader(shader)
                            .set_attachment_texture(0, 0, texture)
                            .set_attachment_sampler(0, 1, sampler)
                            .build();
        REQUIRE(pipeline.has_value());
    }

    SECTION("a comparison sampler on a filtering binding")
    {
        Logger::instance().set_level(spdlog::level::off);
        auto compare = SamplerBuilder(test.context).set_compare(CompareFunction::Less).build().value();
        auto pipeline = RenderPipelineBuilder(test.context)
                            .set_shader(shader)
                            .set_attachment_texture(0, 0, texture)
                            .set_attachment_sampler(0, 1, compare)
                            .build();
        REQUIRE(pipeline.error().kind == ErrorKind::BindingTypeMismatch);
    }

    SECTION("a texture without TextureBinding usage")
    {
        Logger::instance().set_level(spdlog::level::off);
        auto target = build_target(test.context, 4, 4);
        auto pipeline = RenderPipelineBuilder(test.context)
                            .set_shader(shader)
                            .set_attachment_texture(0, 0, target)
                            .set_attachment_sampler(0, 1, sampler)
                            .build();
        REQUIRE(pipeline.error().kind == ErrorKind::BindingTypeMismatch);
    }

    SECTION("a multisampled texture on a single sampled binding")
    {
        Logger::instance().set_level(spdlog::level::off);
        auto msaa = TextureBuilder(test.context)
                        .set_size(4, 4)
                        .set_sample_count(4)
                        .set_usage(TextureUsage::TextureBinding | TextureUsage::RenderAttachment)
                        .build()
                        .value();
        auto pipeline = RenderPipelineBuilder(test.context)
                            .set_shader(shader)
                            .set_attachment_texture(0, 0, msaa)
                            .set_attachment_sampler(0, 1, sampler)
                            .build();
        REQUIRE(pipeline.error().kind == ErrorKind::BindingTypeMismatch);
    }

    SECTION("a buffer on a texture binding")
    {
        Logger::instance().set_level(spdlog::level::off);
        auto buffer = build_buffer(test.context, 64, BufferUsage::Uniform);
        auto pipeline = RenderPipelineBuilder(test.context)
                            .set_shader(shader)
                            .set_attachment_uniform(0, 0, buffer)
                            .set_attachment_sampler(0, 1, sampler)
                            .build();
        REQUIRE(pipeline.error().kind == ErrorKind::BindingTypeMismatch);
    }
}

TEST_CASE("Bind groups are cached by their attachments", "[bind_group][cache]")
{
    Logger::instance().set_level(spdlog::level::warn);
    TestContext test;
    auto shader = build_shader(test.context, uniform_module());
    auto buffer = build_buffer(test.context, 64, BufferUsage::Uniform);

    BindingSet attachments;
    attachments.set_uniform(0, 0, buffer);

    SECTION("identical attachments reuse the bind group")
    {
        auto first = create_bind_groups(test.context, shader, attachments).value();
        auto second = create_bind_groups(test.context, shader, attachments).value();
        REQUIRE(first == second);
        REQUIRE(test.device->created().bind_groups == 1);
    }

    SECTION("another buffer gives another key")
    {
        auto other = build_buffer(test.context, 64, BufferUsage::Uniform);
        BindingSet changed;
        changed.set_uniform(0, 0, other);
        REQUIRE(bind_group_key(shader, attachments) != bind_group_key(shader, changed));
    }

    SECTION("the attachment kind is part of the key")
    {
        BindingSet storage;
        storage.set_storage(0, 0, buffer);
        REQUIRE(bind_group_key(shader, attachments) != bind_group_key(shader, storage));
    }

    SECTION("the shader is part of the key")
    {
        auto other = build_shader(test.context, uniform_module());
        REQUIRE(bind_group_key(shader, attachments) != bind_group_key(other, attachments));
    }

    SECTION("the cached bind group keeps the buffer alive")
    {
        auto handle = buffer.handle();
        (void)create_bind_groups(test.context, shader, attachments).value();
        attachments.clear();
        buffer = build_buffer(test.context, 64, BufferUsage::Uniform);
        REQUIRE(test.device->is_live(handle));

        for (uint32_t i = 0; i < BIND_GROUP_CACHE_CONFIG.lifetime; ++i)
            test.context.cycle();
        REQUIRE_FALSE(test.device->is_live(handle));
    }

    SECTION("a shader without bind groups needs none")
    {
        auto plain = build_shader(test.context, plain_module());
        auto groups = create_bind_groups(test.context, plain, BindingSet{});
        REQUIRE(groups.has_value());
        REQUIRE(*groups == nullptr);
        REQUIRE(test.context.bind_group_cache().size() == 0);
    }
}

TEST_CASE("Pipeline builders check the shader kind", "[pipeline]")
{
    Logger::instance().set_level(spdlog::level::off);
    TestContext test;

    SECTION("render pipeline without shader")
    {
        REQUIRE(RenderPipelineBuilder(test.context).build().error().kind == ErrorKind::ShaderNotSet);
    }

    SECTION("render pipeline with a compute shader")
    {
        auto compute = build_compute_shader(test.context);
        REQUIRE(RenderPipelineBuilder(test.context).set_shader(compute).build().error().kind ==
                ErrorKind::InvalidShaderType);
    }

    SECTION("compute pipeline with a graphics shader")
    {
        auto graphics = build_shader(test.context, plain_module());
        REQUIRE(ComputePipelineBuilder(test.context).set_shader(graphics).build().error().kind ==
                ErrorKind::InvalidShaderType);
    }

    SECTION("compute pipeline with its storage buffer")
    {
        Logger::instance().set_level(spdlog::level::warn);
        auto compute = build_compute_shader(test.context);
        auto values = build_buffer(test.context, 256, BufferUsage::Storage);
        auto pipeline = ComputePipelineBuilder(test.context).set_shader(compute).set_attachment_storage(0, 0, values).build();
        REQUIRE(pipeline.has_value());
        REQUIRE(pipeline->pipeline() != nullptr);
        REQUIRE(pipeline->pipeline()->kind == PipelineKind::Compute);
        REQUIRE(pipeline->bind_groups()->groups.size() == 1);
    }

    SECTION("render pipeline keeps the shader primitive unless overridden")
    {
        Logger::instance().set_level(spdlog::level::warn);
        auto shader = ShaderBuilder(test.context)
                          .add_module(plain_module(), {}, "plain")
                          .set_topology(PrimitiveTopology::LineList)
                          .build()
                          .value();
        auto kept = RenderPipelineBuilder(test.context).set_shader(shader).build().value();
        REQUIRE(kept.primitive().topology == PrimitiveTopology::LineList);

        PrimitiveState points;
        points.topology = PrimitiveTopology::PointList;
        auto overridden = RenderPipelineBuilder(test.context).set_shader(shader).set_primitive(points).build().value();
        REQUIRE(overridden.primitive().topology == PrimitiveTopology::PointList);
    }
}
