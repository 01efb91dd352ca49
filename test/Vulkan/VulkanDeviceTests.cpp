#include <catch2/catch_test_macros.hpp>

#include <array>
#include <numeric>
#include <vector>

#include <est/CommandBuffer.hpp>
#include <est/ComputePass.hpp>
#include <est/GraphicsContext.hpp>
#include <est/Logger.hpp>
#include <est/RenderPass.hpp>
#include <est/VulkanDevice.hpp>

using namespace est;

namespace
{

std::shared_ptr<VulkanDevice> create_device()
{
    auto device = VulkanDevice::create({.application_name = "EstRender Tests",
                                        .enable_validation = true,
                                        .preferred_device = PreferredDeviceType::Cpu});
    if (!device)
    {
        return nullptr;
    }
    return *device;
}

Texture readable_target(GraphicsContext& context, uint32_t size)
{
    return TextureBuilder(context)
        .set_size(size, size)
        .set_format(TextureFormat::Rgba8Unorm)
        .set_usage(TextureUsage::RenderAttachment | TextureUsage::CopySrc)
        .set_label("Readback target")
        .build()
        .value();
}

} // anonymous namespace

TEST_CASE("VulkanDevice creation", "[vulkan]")
{
    Logger::instance().set_level(spdlog::level::warn);
    auto device = create_device();
    if (!device)
    {
        SKIP("No Vulkan 1.3 device available");
    }

    SECTION("handles are valid")
    {
        REQUIRE(device->instance());
        REQUIRE(device->physical_device());
        REQUIRE(device->device());
    }

    SECTION("limits are reported")
    {
        REQUIRE(device->limits().max_push_constant_size >= 128);
        REQUIRE(device->limits().max_bind_groups >= 4);
    }
}

TEST_CASE("Compute shader doubles a storage buffer on the GPU", "[vulkan][compute]")
{
    Logger::instance().set_level(spdlog::level::warn);
    auto device = create_device();
    if (!device)
    {
        SKIP("No Vulkan 1.3 device available");
    }
    GraphicsContext context(device);

    std::vector<uint32_t> input(256);
    std::iota(input.begin(), input.end(), 0u);

    auto values = BufferBuilder(context)
                      .set_values(std::span<const uint32_t>{input})
                      .set_usage(BufferUsage::Storage | BufferUsage::CopySrc)
                      .set_label("Values")
                      .build()
                      .value();
    auto shader = ComputeShaderBuilder(context).set_module("tests/double_values").build().value();

    {
        CommandBuffer commands(context);
        {
            auto pass = commands.compute_pass();
            pass.set_shader(shader);
            pass.set_attachment_storage(0, 0, values);
            pass.set_push_constants_value(std::array<uint32_t, 2>{static_cast<uint32_t>(input.size()), 2});
            pass.dispatch(static_cast<uint32_t>(input.size()) / 64, 1, 1);
        }
        commands.submit();
    }

    auto output = values.read_values<uint32_t>();
    REQUIRE(output.has_value());
    REQUIRE(output->size() == input.size());
    for (std::size_t i = 0; i < input.size(); ++i)
    {
        REQUIRE((*output)[i] == input[i] * 2);
    }
}

TEST_CASE("Render passes write their target", "[vulkan][render]")
{
    Logger::instance().set_level(spdlog::level::warn);
    auto device = create_device();
    if (!device)
    {
        SKIP("No Vulkan 1.3 device available");
    }
    GraphicsContext context(device);
    auto target = readable_target(context, 4);

    SECTION("the clear color fills an empty pass")
    {
        {
            CommandBuffer commands(context);
            auto pass = commands.render_pass()
                            .add_color_attachment(target)
                            .set_clear_color(glm::vec4{1.0f, 0.0f, 0.0f, 1.0f})
                            .build()
                            .value();
            pass.end();
            commands.submit();
        }

        auto pixels = target.read();
        REQUIRE(pixels.has_value());
        REQUIRE(pixels->size() == 4 * 4 * 4);
        for (std::size_t i = 0; i < pixels->size(); i += 4)
        {
            REQUIRE((*pixels)[i + 0] == 255);
            REQUIRE((*pixels)[i + 1] == 0);
            REQUIRE((*pixels)[i + 2] == 0);
            REQUIRE((*pixels)[i + 3] == 255);
        }
    }

    SECTION("a full screen triangle takes its color from a uniform")
    {
        std::array<float, 16> tint{};
        for (std::size_t row = 0; row < 4; ++row)
        {
            tint[row * 4 + 0] = 0.0f;
            tint[row * 4 + 1] = 1.0f;
            tint[row * 4 + 2] = 0.0f;
            tint[row * 4 + 3] = 1.0f;
        }
        auto uniform = BufferBuilder(context)
                           .set_values(std::span<const float>{tint})
                           .set_usage(BufferUsage::Uniform | BufferUsage::CopyDst)
                           .build()
                           .value();
        auto shader = ShaderBuilder(context).add_module("tests/uniform_color").build().value();

        {
            CommandBuffer commands(context);
            auto pass = commands.render_pass().add_color_attachment(target).build().value();
            pass.set_shader(shader);
            pass.set_attachment_uniform(0, 0, uniform);
            pass.draw(0, 3);
            pass.end();
            commands.submit();
        }

        auto pixels = target.read().value();
        for (std::size_t i = 0; i < pixels.size(); i += 4)
        {
            REQUIRE(pixels[i + 0] == 0);
            REQUIRE(pixels[i + 1] == 255);
            REQUIRE(pixels[i + 2] == 0);
        }
    }

    SECTION("the drawing API covers the target")
    {
        {
            CommandBuffer commands(context);
            auto pass = commands.render_pass().add_color_attachment(target).build().value();
            {
                auto session = pass.begin_drawing();
                session.rectangle_filled({0.0f, 0.0f}, {4.0f, 4.0f}, glm::vec4{0.0f, 0.0f, 1.0f, 1.0f});
            }
            pass.end();
            commands.submit();
        }

        auto pixels = target.read().value();
        REQUIRE(pixels[2] == 255);
        REQUIRE(pixels[pixels.size() - 2] == 255);
        REQUIRE(pixels[0] == 0);
    }
}
