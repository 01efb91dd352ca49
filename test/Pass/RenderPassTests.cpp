#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <array>
#include <iterator>

#include <est/CommandBuffer.hpp>
#include <est/Logger.hpp>
#include <est/RenderPass.hpp>

#include "Support/TestSupport.hpp"

using namespace est;
using namespace est::test;

namespace
{

/// Vertex and fragment stages sharing a 16 byte push constant block.
ast::Module push_constant_module()
{
    auto module = plain_module();
    auto v4 = module.add_type({.name = "float4", .inner = ast::Vector{ast::ScalarKind::Float, 4}});
    auto block = module.add_type(
        {.name = "Tint", .inner = ast::Struct{{{.name = "color", .type = v4, .location = std::nullopt}}}});
    module.globals.push_back({.name = "tint",
                              .space = ast::AddressSpace::PushConstant,
                              .access = StorageAccess::Read,
                              .binding = ast::ResourceBinding{.group = PUSH_CONSTANT_GROUP, .binding = 0},
                              .type = block});
    return module;
}

Buffer vertex_buffer(GraphicsContext& context, uint64_t size = 36 * 3)
{
    return build_buffer(context, size, BufferUsage::Vertex | BufferUsage::CopyDst, "Vertices");
}

Buffer index_buffer(GraphicsContext& context, uint64_t size = 12)
{
    return build_buffer(context, size, BufferUsage::Index | BufferUsage::CopyDst, "Indices");
}

} // anonymous namespace

TEST_CASE("Render pass attachments are validated", "[render_pass][builder]")
{
    Logger::instance().set_level(spdlog::level::off);
    TestContext test;
    CommandBuffer commands(test.context);
    auto target = build_target(test.context, 64, 64);

    auto kind_of = [&](RenderPassBuilder builder) { return builder.build().error().kind; };

    SECTION("a single color target")
    {
        auto pass = commands.render_pass().add_color_attachment(target).build();
        REQUIRE(pass.has_value());
        REQUIRE(pass->size() == glm::uvec2{64, 64});
        REQUIRE(pass->state() == PassState::Configuring);
        pass->end();
    }

    SECTION("a color target without RenderAttachment usage")
    {
        auto texture = TextureBuilder(test.context).set_size(64, 64).set_usage(TextureUsage::TextureBinding).build().value();
        REQUIRE(kind_of(commands.render_pass().add_color_attachment(texture)) ==
                ErrorKind::ColorAttachmentNotRenderTarget);
    }

    SECTION("color targets of different sizes")
    {
        auto small = build_target(test.context, 32, 32);
        REQUIRE(kind_of(commands.render_pass().add_color_attachment(target).add_color_attachment(small)) ==
                ErrorKind::AttachmentSizeMismatch);
    }

    SECTION("a multisampled color target")
    {
        auto msaa = TextureBuilder(test.context)
                        .set_size(64, 64)
                        .set_sample_count(4)
                        .set_usage(TextureUsage::RenderAttachment)
                        .build()
                        .value();
        REQUIRE(kind_of(commands.render_pass().add_color_attachment(msaa)) == ErrorKind::ColorAttachmentMultiSampled);
    }

    SECTION("MSAA targets")
    {
        auto msaa = TextureBuilder(test.context)
                        .set_size(64, 64)
                        .set_sample_count(4)
                        .set_usage(TextureUsage::RenderAttachment)
                        .build()
                        .value();
        auto single = build_target(test.context, 64, 64);
        auto small = TextureBuilder(test.context)
                         .set_size(32, 32)
                         .set_sample_count(4)
                         .set_usage(TextureUsage::RenderAttachment)
                         .build()
                         .value();
        auto eight = TextureBuilder(test.context)
                         .set_size(64, 64)
                         .set_sample_count(8)
                         .set_usage(TextureUsage::RenderAttachment)
                         .build()
                         .value();
        auto not_attachment = TextureBuilder(test.context)
                                  .set_size(64, 64)
                                  .set_sample_count(4)
                                  .set_usage(TextureUsage::TextureBinding)
                                  .build()
                                  .value();

        REQUIRE(kind_of(commands.render_pass().add_color_attachment(target).add_msaa_attachment(single)) ==
                ErrorKind::MsaaTextureNotMultiSampled);
        REQUIRE(kind_of(commands.render_pass().add_color_attachment(target).add_msaa_attachment(small)) ==
                ErrorKind::MsaaTextureInvalidSize);
        REQUIRE(kind_of(commands.render_pass().add_color_attachment(target).add_msaa_attachment(not_attachment)) ==
                ErrorKind::MsaaTextureNotRenderAttachment);
        REQUIRE(kind_of(commands.render_pass()
                            .add_color_attachment(target)
                            .add_color_attachment(build_target(test.context, 64, 64))
                            .add_msaa_attachment(msaa)
                            .add_msaa_attachment(eight)) == ErrorKind::MismatchedAttachmentSampleCount);
    }

    SECTION("depth targets")
    {
        auto depth = [&](TextureFormat format, uint32_t size, TextureUsage usage)
        { return TextureBuilder(test.context).set_size(size, size).set_format(format).set_usage(usage).build().value(); };

        auto depth24 = depth(TextureFormat::Depth24Plus, 64, TextureUsage::RenderAttachment);
        REQUIRE(kind_of(commands.render_pass().add_color_attachment(target).set_depth_attachment(depth24)) ==
                ErrorKind::DepthTextureFormatNotSupported);

        auto sampled = depth(TextureFormat::Depth32Float, 64, TextureUsage::TextureBinding);
        REQUIRE(kind_of(commands.render_pass().add_color_attachment(target).set_depth_attachment(sampled)) ==
                ErrorKind::DepthTextureNotRenderAttachment);

        auto small = depth(TextureFormat::Depth32Float, 32, TextureUsage::RenderAttachment);
        REQUIRE(kind_of(commands.render_pass().add_color_attachment(target).set_depth_attachment(small)) ==
                ErrorKind::DepthTextureInvalidSize);

        auto valid = depth(TextureFormat::Depth24PlusStencil8, 64, TextureUsage::RenderAttachment);
        auto pass = commands.render_pass().add_color_attachment(target).set_depth_attachment(valid).build();
        REQUIRE(pass.has_value());
        pass->end();
    }

    SECTION("a depth target alone is enough")
    {
        auto depth = TextureBuilder(test.context)
                         .set_size(16, 16)
                         .set_format(TextureFormat::Depth32Float)
                         .set_usage(TextureUsage::RenderAttachment)
                         .build()
                         .value();
        auto pass = commands.render_pass().set_depth_attachment(depth).build();
        REQUIRE(pass.has_value());
        REQUIRE(pass->size() == glm::uvec2{16, 16});
        pass->end();
    }

    SECTION("no attachment at all")
    {
        REQUIRE(kind_of(commands.render_pass()) == ErrorKind::NoColorOrDepthAttachment);
    }
}

TEST_CASE("Render pass draw validation", "[render_pass][validation]")
{
    Logger::instance().set_level(spdlog::level::off);
    TestContext test;
    CommandBuffer commands(test.context);
    auto target = build_target(test.context, 64, 64);
    auto pass = commands.render_pass().add_color_attachment(target).build().value();

    SECTION("drawing without a shader")
    {
        REQUIRE(fatal_kind([&] { pass.draw(0, 3); }) == ErrorKind::ShaderNotSet);
    }

    SECTION("a compute shader")
    {
        auto compute = build_compute_shader(test.context);
        REQUIRE(fatal_kind([&] { pass.set_shader(compute); }) == ErrorKind::InvalidShaderType);
    }

    SECTION("vertex input without a vertex buffer")
    {
        pass.set_shader(build_shader(test.context, drawing_module()));
        pass.set_attachment_texture(0, 0, test.context.default_texture());
        pass.set_attachment_sampler(0, 1, test.context.default_sampler());
        REQUIRE(fatal_kind([&] { pass.draw(0, 3); }) == ErrorKind::MissingVertexBuffer);
    }

    SECTION("an indexed draw without an index buffer")
    {
        pass.set_shader(build_shader(test.context, plain_module()));
        REQUIRE(fatal_kind([&] { pass.draw_indexed(0, 3); }) == ErrorKind::MissingIndexBuffer);
    }

    SECTION("an indexed draw without an index format")
    {
        auto shader =
            ShaderBuilder(test.context).add_module(plain_module(), {}, "plain").set_index_format(std::nullopt).build().value();
        pass.set_shader(shader);
        pass.set_index_buffer(index_buffer(test.context));
        REQUIRE(fatal_kind([&] { pass.draw_indexed(0, 3); }) == ErrorKind::MissingIndexFormat);

        pass.set_index_format(IndexFormat::Uint32);
        REQUIRE_FALSE(fatal_kind([&] { pass.draw_indexed(0, 3); }).has_value());
    }

    SECTION("a missing attachment")
    {
        pass.set_shader(build_shader(test.context, uniform_module()));
        REQUIRE(fatal_kind([&] { pass.draw(0, 3); }) == ErrorKind::MissingBinding);
    }

    SECTION("an attachment of the wrong type")
    {
        pass.set_shader(build_shader(test.context, uniform_module()));
        auto storage = build_buffer(test.context, 64, BufferUsage::Storage);
        REQUIRE(fatal_kind([&] { pass.set_attachment_storage(0, 0, storage); }) == ErrorKind::BindingTypeMismatch);
    }

    SECTION("a vertex buffer without Vertex usage")
    {
        auto buffer = build_buffer(test.context, 64, BufferUsage::Uniform);
        REQUIRE(fatal_kind([&] { pass.set_vertex_buffer(buffer); }) == ErrorKind::InvalidUsage);
    }

    SECTION("attaching while a prebuilt pipeline is bound")
    {
        auto shader = build_shader(test.context, uniform_module());
        auto uniform = build_buffer(test.context, 64, BufferUsage::Uniform);
        auto pipeline = RenderPipelineBuilder(test.context).set_shader(shader).set_attachment_uniform(0, 0, uniform).build().value();
        pass.set_pipeline(pipeline);
        REQUIRE(fatal_kind([&] { pass.set_attachment_uniform(0, 0, uniform); }) == ErrorKind::InvalidAttachmentType);
        REQUIRE(fatal_kind([&] { pass.remove_attachment(0, 0); }) == ErrorKind::InvalidAttachmentType);
    }

    SECTION("push constants larger than declared")
    {
        pass.set_shader(build_shader(test.context, push_constant_module()));
        std::array<uint8_t, 20> data{};
        REQUIRE(fatal_kind([&] { pass.set_push_constants(data); }) == ErrorKind::InvalidSize);
    }

    SECTION("push constants on a shader without any")
    {
        pass.set_shader(build_shader(test.context, plain_module()));
        std::array<uint8_t, 4> data{};
        REQUIRE(fatal_kind([&] { pass.set_push_constants(data); }) == ErrorKind::InvalidUsage);
    }

    SECTION("push constants left over from a previous shader")
    {
        pass.set_shader(build_shader(test.context, push_constant_module()));
        std::array<uint8_t, 16> data{};
        pass.set_push_constants(data);
        pass.draw(0, 3);

        pass.set_shader(build_shader(test.context, plain_module()));
        REQUIRE(fatal_kind([&] { pass.draw(0, 3); }) == ErrorKind::InvalidUsage);

        pass.set_push_constants({});
        REQUIRE_FALSE(fatal_kind([&] { pass.draw(0, 3); }).has_value());
        REQUIRE(pass.queued().size() == 2);
        REQUIRE(pass.queued()[1].push_constants.empty());
    }

    SECTION("ending twice")
    {
        pass.end();
        REQUIRE(pass.state() == PassState::Ended);
        REQUIRE(fatal_kind([&] { pass.end(); }) == ErrorKind::PassAlreadyEnded);
        REQUIRE(fatal_kind([&] { pass.draw(0, 3); }) == ErrorKind::PassAlreadyEnded);
    }
}

TEST_CASE("Render pass replay", "[render_pass][replay]")
{
    Logger::instance().set_level(spdlog::level::warn);
    TestContext test;
    auto target = build_target(test.context, 64, 64);
    auto shader = build_shader(test.context, drawing_module());
    auto vertices = vertex_buffer(test.context);
    auto indices = index_buffer(test.context);

    SECTION("an indexed draw emits its state in order")
    {
        CommandBuffer commands(test.context);
        {
            auto pass = commands.render_pass().add_color_attachment(target).build().value();
            pass.set_shader(shader);
            pass.set_attachment_texture(0, 0, test.context.default_texture());
            pass.set_attachment_sampler(0, 1, test.context.default_sampler());
            pass.set_vertex_buffer(vertices);
            pass.set_index_buffer(indices);
            pass.set_scissor(ScissorRect{0, 0, 32, 32});
            pass.set_viewport(Viewport{0.0f, 0.0f, 64.0f, 64.0f});
            pass.draw_indexed(0, 6, 0, 1);
            REQUIRE(pass.queued().size() == 1);
            REQUIRE(pass.state() == PassState::Recording);
        }
        commands.submit();
        REQUIRE(commands.is_submitted());

        REQUIRE(command_indices(test.device->submitted()) ==
                std::vector<std::size_t>{command_index<BeginRenderPass>(), command_index<SetPipeline>(),
                                         command_index<SetBindGroup>(), command_index<SetVertexBuffer>(),
                                         command_index<SetIndexBuffer>(), command_index<SetScissor>(),
                                         command_index<SetViewport>(), command_index<DrawIndexed>(),
                                         command_index<EndRenderPass>()});

        auto begin = test.device->submitted_of<BeginRenderPass>().at(0);
        REQUIRE(begin.descriptor.width == 64);
        REQUIRE(begin.descriptor.color_attachments.size() == 1);
        REQUIRE(begin.descriptor.color_attachments[0].view == target.handle());
        REQUIRE(begin.descriptor.color_attachments[0].clear.has_value());

        auto draw = test.device->submitted_of<DrawIndexed>().at(0);
        REQUIRE(draw.index_count == 6);
        REQUIRE(draw.first_index == 0);
        REQUIRE(test.device->submitted_of<SetIndexBuffer>().at(0).format == IndexFormat::Uint16);
    }

    SECTION("degenerate viewports and scissors skip the draw")
    {
        CommandBuffer commands(test.context);
        {
            auto pass = commands.render_pass().add_color_attachment(target).build().value();
            pass.set_shader(build_shader(test.context, plain_module()));
            pass.set_viewport(Viewport{0.0f, 0.0f, 0.0f, 64.0f});
            pass.draw(0, 3);
            pass.set_viewport(std::nullopt);
            pass.set_scissor(ScissorRect{0, 0, 10, 0});
            pass.draw(0, 3);
            REQUIRE(pass.queued().empty());
        }
        commands.submit();
        REQUIRE(test.device->count<Draw>() == 0);
        REQUIRE(test.device->count<BeginRenderPass>() == 1);
    }

    SECTION("the state of each draw is captured when it is queued")
    {
        CommandBuffer commands(test.context);
        {
            auto pass = commands.render_pass().add_color_attachment(target).build().value();
            pass.set_shader(build_shader(test.context, plain_module()));
            pass.draw(0, 3);
            pass.set_blend(0, BlendState::alpha_blending());
            pass.draw(3, 3, 2);
            REQUIRE(pass.queued().size() == 2);
            REQUIRE(pass.queued()[0].pipeline != pass.queued()[1].pipeline);
        }
        commands.submit();

        auto draws = test.device->submitted_of<Draw>();
        REQUIRE(draws.size() == 2);
        REQUIRE(draws[1].first_vertex == 3);
        REQUIRE(draws[1].instance_count == 2);

        auto pipelines = test.device->submitted_of<SetPipeline>();
        REQUIRE(test.device->render_pipeline(pipelines[1].pipeline).targets[0].blend == BlendState::alpha_blending());
    }

    SECTION("a draw without a scissor covers the whole target again")
    {
        CommandBuffer commands(test.context);
        {
            auto pass = commands.render_pass().add_color_attachment(target).build().value();
            pass.set_shader(build_shader(test.context, plain_module()));
            pass.set_scissor(ScissorRect{0, 0, 8, 8});
            pass.set_viewport(Viewport{0.0f, 0.0f, 8.0f, 8.0f});
            pass.draw(0, 3);
            pass.set_scissor(std::nullopt);
            pass.set_viewport(std::nullopt);
            pass.draw(0, 3);
        }
        commands.submit();

        const auto& submitted = test.device->submitted();
        auto indices = command_indices(submitted);
        auto second_draw = std::find(std::next(std::find(indices.begin(), indices.end(), command_index<Draw>())),
                                     indices.end(), command_index<Draw>());
        REQUIRE(second_draw != indices.end());
        REQUIRE(*std::prev(second_draw, 2) == command_index<SetScissor>());
        REQUIRE(*std::prev(second_draw) == command_index<SetViewport>());

        auto scissors = test.device->submitted_of<SetScissor>();
        REQUIRE(scissors.size() == 2);
        REQUIRE(scissors[0].scissor == ScissorRect{0, 0, 8, 8});
        REQUIRE(scissors[1].scissor == ScissorRect{0, 0, 64, 64});
        auto viewports = test.device->submitted_of<SetViewport>();
        REQUIRE(viewports[1].viewport == Viewport{0.0f, 0.0f, 64.0f, 64.0f});
    }

    SECTION("scissors are clipped to the target")
    {
        CommandBuffer commands(test.context);
        {
            auto pass = commands.render_pass().add_color_attachment(target).build().value();
            pass.set_shader(build_shader(test.context, plain_module()));
            pass.set_scissor(ScissorRect{-5, -5, 20, 20});
            pass.draw(0, 3);
            pass.set_scissor(ScissorRect{60, 32, 10, 100});
            pass.draw(0, 3);
            pass.set_scissor(ScissorRect{70, 0, 10, 10});
            pass.draw(0, 3);
            REQUIRE(pass.queued().size() == 3);
        }
        commands.submit();

        auto scissors = test.device->submitted_of<SetScissor>();
        REQUIRE(scissors.size() == 2);
        REQUIRE(scissors[0].scissor == ScissorRect{0, 0, 15, 15});
        REQUIRE(scissors[1].scissor == ScissorRect{60, 32, 4, 32});
        REQUIRE(test.device->count<Draw>() == 2);
    }

    SECTION("push constants are recorded with the declared stages")
    {
        CommandBuffer commands(test.context);
        {
            auto pass = commands.render_pass().add_color_attachment(target).build().value();
            pass.set_shader(build_shader(test.context, push_constant_module()));
            std::array<uint8_t, 6> data = {1, 2, 3, 4, 5, 6};
            pass.set_push_constants(data);
            pass.draw(0, 3);
        }
        commands.submit();

        auto push = test.device->submitted_of<SetPushConstants>().at(0);
        REQUIRE(push.stages == (ShaderStageFlags::Vertex | ShaderStageFlags::Fragment));
        REQUIRE(push.data == std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 0, 0});
    }

    SECTION("a prebuilt pipeline's blend overrides the target blend")
    {
        auto uniform = build_buffer(test.context, 64, BufferUsage::Uniform);
        auto pipeline = RenderPipelineBuilder(test.context)
                            .set_shader(build_shader(test.context, uniform_module()))
                            .set_attachment_uniform(0, 0, uniform)
                            .set_blend(BlendState::additive())
                            .build()
                            .value();
        CommandBuffer commands(test.context);
        {
            auto pass = commands.render_pass().add_color_attachment(target, BlendState::alpha_blending()).build().value();
            pass.set_pipeline(pipeline);
            pass.draw(0, 3);
        }
        commands.submit();

        auto set = test.device->submitted_of<SetPipeline>().at(0);
        REQUIRE(test.device->render_pipeline(set.pipeline).targets[0].blend == BlendState::additive());
        REQUIRE(test.device->count<SetBindGroup>() == 1);
    }

    SECTION("a transparent clear color loads the target")
    {
        CommandBuffer commands(test.context);
        {
            auto pass = commands.render_pass().add_color_attachment(target).set_clear_color(glm::vec4{0.0f}).build().value();
        }
        commands.submit();
        auto begin = test.device->submitted_of<BeginRenderPass>().at(0);
        REQUIRE_FALSE(begin.descriptor.color_attachments[0].clear.has_value());
    }

    SECTION("switching the shader keeps the attachments")
    {
        CommandBuffer commands(test.context);
        {
            auto pass = commands.render_pass().add_color_attachment(target).build().value();
            auto first = build_shader(test.context, uniform_module());
            auto second = build_shader(test.context, uniform_module());
            auto uniform = build_buffer(test.context, 64, BufferUsage::Uniform);
            pass.set_shader(first);
            pass.set_attachment_uniform(0, 0, uniform);
            pass.draw(0, 3);
            pass.set_shader(second);
            pass.draw(0, 3);
            REQUIRE(pass.queued().size() == 2);
            REQUIRE(pass.queued()[1].bind_groups != nullptr);
        }
        commands.submit();
        REQUIRE(test.device->count<Draw>() == 2);
    }
}

TEST_CASE("Command buffer lifetime", "[command_buffer]")
{
    Logger::instance().set_level(spdlog::level::off);
    TestContext test;
    auto target = build_target(test.context, 8, 8);

    SECTION("a command buffer submits itself on scope exit")
    {
        {
            CommandBuffer commands(test.context);
            auto pass = commands.render_pass().add_color_attachment(target).build().value();
        }
        REQUIRE(test.device->submissions() == 1);
        REQUIRE(test.device->count<EndRenderPass>() == 1);
    }

    SECTION("objects stay alive until the submission finished")
    {
        auto handle = PipelineHandle{};
        CommandBuffer commands(test.context);
        {
            auto pass = commands.render_pass().add_color_attachment(target).build().value();
            pass.set_shader(build_shader(test.context, plain_module()));
            pass.draw(0, 3);
            handle = pass.queued().at(0).pipeline->handle.get();
        }
        test.context.pipeline_cache().clear();
        REQUIRE(test.device->is_live(handle));

        commands.submit();
        REQUIRE_FALSE(test.device->is_live(handle));
    }

    SECTION("a second pass cannot start while one is open")
    {
        CommandBuffer commands(test.context);
        auto pass = commands.render_pass().add_color_attachment(target).build().value();
        REQUIRE(fatal_kind([&] { (void)commands.render_pass(); }) == ErrorKind::InvalidUsage);
        REQUIRE(fatal_kind([&] { commands.submit(); }) == ErrorKind::InvalidUsage);
        pass.end();
        commands.submit();
        REQUIRE(fatal_kind([&] { commands.submit(); }) == ErrorKind::InvalidUsage);
    }

    SECTION("a timeout on submit is fatal")
    {
        CommandBuffer commands(test.context);
        test.device->set_time_out(true);
        REQUIRE(fatal_kind([&] { commands.submit(); }) == ErrorKind::DeviceTimeout);
    }

    SECTION("buffer copies are recorded outside passes")
    {
        std::array<uint8_t, 8> data = {1, 2, 3, 4, 5, 6, 7, 8};
        auto src = BufferBuilder(test.context).set_data(data).set_usage(BufferUsage::CopySrc).build().value();
        auto dst = build_buffer(test.context, 8, BufferUsage::CopyDst | BufferUsage::MapRead);
        CommandBuffer commands(test.context);
        commands.copy_buffer(src, dst);
        commands.submit();
        REQUIRE(dst.read().value() == std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 7, 8});
    }
}
