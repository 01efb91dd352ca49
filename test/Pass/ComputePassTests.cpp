#include <catch2/catch_test_macros.hpp>

#include <array>

#include <est/CommandBuffer.hpp>
#include <est/ComputePass.hpp>
#include <est/Logger.hpp>

#include "Support/TestSupport.hpp"

using namespace est;
using namespace est::test;

namespace
{

Shader compute_shader_without_push_constants(GraphicsContext& context)
{
    ast::Module module;
    module.entry_points.push_back(entry("compute_main", ast::Stage::Compute));
    return ComputeShaderBuilder(context).set_module(module, {}, "module").build().value();
}

} // anonymous namespace

TEST_CASE("Compute pass replay", "[compute_pass][replay]")
{
    Logger::instance().set_level(spdlog::level::warn);
    TestContext test;
    auto shader = build_compute_shader(test.context);
    auto values = build_buffer(test.context, 256, BufferUsage::Storage | BufferUsage::CopySrc, "Values");

    SECTION("a dispatch emits pipeline, bind group, push constants in order")
    {
        CommandBuffer commands(test.context);
        {
            auto pass = commands.compute_pass();
            pass.set_shader(shader);
            pass.set_attachment_storage(0, 0, values);
            pass.set_push_constants_value(std::array<uint32_t, 2>{64, 2});
            pass.dispatch(1, 1, 1);
            REQUIRE(pass.state() == PassState::Recording);
        }
        commands.submit();

        REQUIRE(command_indices(test.device->submitted()) ==
                std::vector<std::size_t>{command_index<BeginComputePass>(), command_index<SetPipeline>(),
                                         command_index<SetBindGroup>(), command_index<SetPushConstants>(),
                                         command_index<Dispatch>(), command_index<EndComputePass>()});

        auto push = test.device->submitted_of<SetPushConstants>().at(0);
        REQUIRE(push.stages == ShaderStageFlags::Compute);
        REQUIRE(push.data.size() == 8);
        REQUIRE(push.data[0] == 64);
        REQUIRE(push.data[4] == 2);
    }

    SECTION("a zero sized grid is skipped")
    {
        CommandBuffer commands(test.context);
        {
            auto pass = commands.compute_pass();
            pass.set_shader(shader);
            pass.set_attachment_storage(0, 0, values);
            pass.dispatch(0, 1, 1);
            pass.dispatch(4, 0, 1);
            pass.dispatch(4, 1, 0);
            REQUIRE(pass.queued().empty());
            pass.dispatch(4, 2, 1);
        }
        commands.submit();

        auto dispatches = test.device->submitted_of<Dispatch>();
        REQUIRE(dispatches.size() == 1);
        REQUIRE(dispatches[0].x == 4);
        REQUIRE(dispatches[0].y == 2);
        REQUIRE(dispatches[0].z == 1);
    }

    SECTION("several dispatches share the cached pipeline")
    {
        CommandBuffer commands(test.context);
        {
            auto pass = commands.compute_pass();
            pass.set_shader(shader);
            pass.set_attachment_storage(0, 0, values);
            pass.dispatch(1, 1, 1);
            pass.dispatch(2, 1, 1);
        }
        commands.submit();
        REQUIRE(test.device->count<Dispatch>() == 2);
        REQUIRE(test.device->created().compute_pipelines == 1);
        REQUIRE(test.device->created().bind_groups == 1);
    }

    SECTION("a prebuilt compute pipeline")
    {
        auto pipeline = ComputePipelineBuilder(test.context).set_shader(shader).set_attachment_storage(0, 0, values).build().value();
        CommandBuffer commands(test.context);
        {
            auto pass = commands.compute_pass();
            pass.set_pipeline(pipeline);
            pass.dispatch(8, 1, 1);
        }
        commands.submit();

        auto set = test.device->submitted_of<SetPipeline>().at(0);
        REQUIRE(set.pipeline == pipeline.pipeline()->handle.get());
        REQUIRE(test.device->count<SetBindGroup>() == 1);
    }

    SECTION("indirect dispatch")
    {
        auto indirect = build_buffer(test.context, 12, BufferUsage::Indirect | BufferUsage::CopyDst, "Indirect");
        CommandBuffer commands(test.context);
        {
            auto pass = commands.compute_pass();
            pass.set_shader(shader);
            pass.set_attachment_storage(0, 0, values);
            pass.dispatch_indirect(indirect);
        }
        commands.submit();
        REQUIRE(test.device->count<DispatchIndirect>() == 1);
    }
}

TEST_CASE("Compute pass validation", "[compute_pass][validation]")
{
    Logger::instance().set_level(spdlog::level::off);
    TestContext test;
    auto shader = build_compute_shader(test.context);
    auto values = build_buffer(test.context, 256, BufferUsage::Storage, "Values");
    CommandBuffer commands(test.context);
    auto pass = commands.compute_pass();

    SECTION("a graphics shader")
    {
        auto graphics = build_shader(test.context, plain_module());
        REQUIRE(fatal_kind([&] { pass.set_shader(graphics); }) == ErrorKind::InvalidShaderType);
    }

    SECTION("dispatching without a shader")
    {
        REQUIRE(fatal_kind([&] { pass.dispatch(1, 1, 1); }) == ErrorKind::ShaderNotSet);
    }

    SECTION("textures and samplers cannot be attached")
    {
        pass.set_shader(shader);
        REQUIRE(fatal_kind([&] { pass.set_attachment(BindGroupAttachment::texture(0, 0, test.context.default_texture())); }) ==
                ErrorKind::InvalidAttachmentType);
        REQUIRE(fatal_kind([&] { pass.set_attachment(BindGroupAttachment::sampler(0, 0, test.context.default_sampler())); }) ==
                ErrorKind::InvalidAttachmentType);
    }

    SECTION("the storage binding must be attached")
    {
        pass.set_shader(shader);
        REQUIRE(fatal_kind([&] { pass.dispatch(1, 1, 1); }) == ErrorKind::MissingBinding);
    }

    SECTION("a uniform attachment on a storage binding")
    {
        pass.set_shader(shader);
        auto uniform = build_buffer(test.context, 256, BufferUsage::Uniform);
        REQUIRE(fatal_kind([&] { pass.set_attachment_uniform(0, 0, uniform); }) == ErrorKind::BindingTypeMismatch);
    }

    SECTION("attaching while a prebuilt pipeline is bound")
    {
        auto pipeline = ComputePipelineBuilder(test.context).set_shader(shader).set_attachment_storage(0, 0, values).build().value();
        pass.set_pipeline(pipeline);
        REQUIRE(fatal_kind([&] { pass.set_attachment_storage(0, 0, values); }) == ErrorKind::InvalidAttachmentType);
    }

    SECTION("push constants")
    {
        pass.set_shader(shader);
        std::array<uint8_t, 12> large{};
        REQUIRE(fatal_kind([&] { pass.set_push_constants(large); }) == ErrorKind::InvalidSize);

        pass.set_shader(compute_shader_without_push_constants(test.context));
        std::array<uint8_t, 4> data{};
        REQUIRE(fatal_kind([&] { pass.set_push_constants(data); }) == ErrorKind::InvalidUsage);
    }

    SECTION("push constants left over from a previous shader")
    {
        pass.set_shader(shader);
        pass.set_push_constants_value(std::array<uint32_t, 2>{64, 2});
        pass.set_shader(compute_shader_without_push_constants(test.context));
        REQUIRE(fatal_kind([&] { pass.dispatch(1, 1, 1); }) == ErrorKind::InvalidUsage);
        REQUIRE(pass.queued().empty());

        pass.set_push_constants({});
        REQUIRE_FALSE(fatal_kind([&] { pass.dispatch(1, 1, 1); }).has_value());
        REQUIRE(pass.queued().size() == 1);
    }

    SECTION("indirect dispatch needs Indirect usage")
    {
        pass.set_shader(shader);
        pass.set_attachment_storage(0, 0, values);
        REQUIRE(fatal_kind([&] { pass.dispatch_indirect(values); }) == ErrorKind::InvalidUsage);
    }

    SECTION("ending twice")
    {
        pass.end();
        REQUIRE(pass.state() == PassState::Ended);
        REQUIRE(fatal_kind([&] { pass.end(); }) == ErrorKind::PassAlreadyEnded);
        REQUIRE(fatal_kind([&] { pass.dispatch(1, 1, 1); }) == ErrorKind::PassAlreadyEnded);
    }

    SECTION("a render pass cannot open while the compute pass is")
    {
        REQUIRE(fatal_kind([&] { (void)commands.render_pass(); }) == ErrorKind::InvalidUsage);
    }
}
