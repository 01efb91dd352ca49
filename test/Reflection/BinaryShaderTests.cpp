#include <catch2/catch_test_macros.hpp>

#include <algorithm>

#include <est/BinaryShader.hpp>
#include <est/Logger.hpp>
#include <est/Reflection.hpp>

#include "Support/TestSupport.hpp"

using namespace est;
using namespace est::test;

namespace
{

std::vector<uint8_t> sample_spirv()
{
    return {0x03, 0x02, 0x23, 0x07, 0x00, 0x00, 0x01, 0x00};
}

} // anonymous namespace

TEST_CASE("Binary shader container", "[binary_shader]")
{
    Logger::instance().set_level(spdlog::level::warn);

    SECTION("vertex/fragment shader with vertex input survives a write and load")
    {
        BinaryShader shader{.reflection = reflect(drawing_module()).value(), .spirv = sample_spirv()};
        auto loaded = load_binary_shader(write_binary_shader(shader));
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->reflection == shader.reflection);
        REQUIRE(loaded->spirv == shader.spirv);

        const auto& reflection = std::get<VertexFragmentReflection>(loaded->reflection);
        REQUIRE(reflection.vertex_entry_point == "vertex_main");
        REQUIRE(reflection.fragment_entry_point == "fragment_main");
    }

    SECTION("a vertex stage without vertex buffers keeps an empty input")
    {
        BinaryShader shader{.reflection = reflect(uniform_module()).value(), .spirv = sample_spirv()};
        auto loaded = load_binary_shader(write_binary_shader(shader));
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->reflection.vertex_input() == nullptr);
    }

    SECTION("compute shader keeps storage access and push constants")
    {
        BinaryShader shader{.reflection = reflect(compute_module()).value(), .spirv = sample_spirv()};
        auto loaded = load_binary_shader(write_binary_shader(shader));
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->reflection.is_compute());
        REQUIRE(loaded->reflection.bindings() == shader.reflection.bindings());
    }

    SECTION("the container starts with the magic")
    {
        BinaryShader shader{.reflection = reflect(compute_module()).value(), .spirv = {}};
        auto data = write_binary_shader(shader);
        REQUIRE(data.size() > BINARY_SHADER_MAGIC.size());
        REQUIRE(std::equal(BINARY_SHADER_MAGIC.begin(), BINARY_SHADER_MAGIC.end(), data.begin(),
                           [](char a, uint8_t b) { return static_cast<uint8_t>(a) == b; }));
        // Kind id follows the magic, little endian
        REQUIRE(data[BINARY_SHADER_MAGIC.size()] == 3);
    }
}

TEST_CASE("Malformed binary shaders are rejected", "[binary_shader][errors]")
{
    Logger::instance().set_level(spdlog::level::off);
    BinaryShader shader{.reflection = reflect(drawing_module()).value(), .spirv = sample_spirv()};
    auto data = write_binary_shader(shader);

    SECTION("empty data")
    {
        auto loaded = load_binary_shader({});
        REQUIRE_FALSE(loaded.has_value());
        REQUIRE(loaded.error().kind == ErrorKind::MalformedBinaryShader);
    }

    SECTION("bad magic")
    {
        data[0] = 'x';
        auto loaded = load_binary_shader(data);
        REQUIRE_FALSE(loaded.has_value());
        REQUIRE(loaded.error().kind == ErrorKind::MalformedBinaryShader);
    }

    SECTION("unknown shader kind")
    {
        data[BINARY_SHADER_MAGIC.size()] = 9;
        auto loaded = load_binary_shader(data);
        REQUIRE_FALSE(loaded.has_value());
        REQUIRE(loaded.error().kind == ErrorKind::MalformedBinaryShader);
    }

    SECTION("truncated at every length")
    {
        for (std::size_t length = 0; length < data.size(); ++length)
        {
            auto loaded = load_binary_shader(std::span{data.data(), length});
            REQUIRE_FALSE(loaded.has_value());
            REQUIRE(loaded.error().kind == ErrorKind::MalformedBinaryShader);
        }
    }
}
