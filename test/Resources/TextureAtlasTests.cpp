#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <vector>

#include <est/Logger.hpp>
#include <est/Texture.hpp>

#include "Support/TestSupport.hpp"

using namespace est;
using namespace est::test;
using Catch::Approx;

namespace
{

std::vector<uint8_t> filled(uint32_t width, uint32_t height, uint8_t value)
{
    return std::vector<uint8_t>(static_cast<std::size_t>(width) * height * 4, value);
}

uint8_t texel(const std::vector<uint8_t>& data, uint32_t width, uint32_t x, uint32_t y)
{
    return data.at((static_cast<std::size_t>(y) * width + x) * 4);
}

} // anonymous namespace

TEST_CASE("Texture atlas packing", "[texture][atlas]")
{
    Logger::instance().set_level(spdlog::level::warn);
    TestContext test;

    auto atlas = TextureAtlasBuilder(test.context)
                     .add_texture_raw("wide", filled(4, 2, 7), 4, 2)
                     .add_texture_raw("tall", filled(2, 3, 9), 2, 3)
                     .set_label("Icons")
                     .build();
    REQUIRE(atlas.has_value());

    SECTION("items share a shelf, tallest first, with one texel of padding")
    {
        REQUIRE(atlas->item_count() == 2);
        REQUIRE(atlas->size() == glm::uvec2{8, 4});
        REQUIRE(atlas->texture().format() == TextureFormat::Rgba8Unorm);
        REQUIRE(has_flag(atlas->texture().usage(), TextureUsage::TextureBinding));
        REQUIRE(atlas->texture().label() == "Icons");
    }

    SECTION("regions are inset by half a texel")
    {
        const auto* tall = atlas->find("tall");
        REQUIRE(tall != nullptr);
        REQUIRE(tall->size == glm::uvec2{2, 3});
        REQUIRE(tall->uv.x == Approx(1.5f / 8.0f));
        REQUIRE(tall->uv.y == Approx(1.5f / 4.0f));
        REQUIRE(tall->uv.z == Approx(2.5f / 8.0f));
        REQUIRE(tall->uv.w == Approx(3.5f / 4.0f));

        const auto* wide = atlas->find("wide");
        REQUIRE(wide->uv.x == Approx(4.5f / 8.0f));
        REQUIRE(wide->uv.w == Approx(2.5f / 4.0f));

        REQUIRE(atlas->find("missing") == nullptr);
    }

    SECTION("texels are copied into place")
    {
        const auto& data = test.device->texture_data(atlas->texture().handle());
        REQUIRE(data.size() == 8 * 4 * 4);
        REQUIRE(texel(data, 8, 0, 0) == 0);
        REQUIRE(texel(data, 8, 1, 1) == 9);
        REQUIRE(texel(data, 8, 2, 3) == 9);
        REQUIRE(texel(data, 8, 3, 1) == 0);
        REQUIRE(texel(data, 8, 4, 1) == 7);
        REQUIRE(texel(data, 8, 7, 2) == 7);
        REQUIRE(texel(data, 8, 4, 3) == 0);
    }
}

TEST_CASE("Texture atlas options", "[texture][atlas]")
{
    Logger::instance().set_level(spdlog::level::warn);
    TestContext test;

    SECTION("an item added twice keeps the last data")
    {
        auto atlas = TextureAtlasBuilder(test.context)
                         .add_texture_raw("icon", filled(1, 1, 1), 1, 1)
                         .add_texture_raw("icon", filled(2, 2, 2), 2, 2)
                         .build()
                         .value();
        REQUIRE(atlas.item_count() == 1);
        REQUIRE(atlas.find("icon")->size == glm::uvec2{2, 2});
    }

    SECTION("sRGB atlases")
    {
        auto atlas =
            TextureAtlasBuilder(test.context).add_texture_raw("icon", filled(1, 1, 1), 1, 1).set_srgb(true).build().value();
        REQUIRE(atlas.texture().format() == TextureFormat::Rgba8UnormSrgb);
    }
}

TEST_CASE("Texture atlas errors", "[texture][atlas][errors]")
{
    Logger::instance().set_level(spdlog::level::off);
    TestContext test;

    SECTION("no items")
    {
        REQUIRE(TextureAtlasBuilder(test.context).build().error().kind == ErrorKind::EmptyAtlas);
    }

    SECTION("data of the wrong length")
    {
        auto atlas = TextureAtlasBuilder(test.context).add_texture_raw("icon", filled(2, 2, 1), 3, 2).build();
        REQUIRE(atlas.error().kind == ErrorKind::InvalidSize);
    }

    SECTION("a zero extent")
    {
        auto atlas = TextureAtlasBuilder(test.context).add_texture_raw("icon", {}, 0, 4).build();
        REQUIRE(atlas.error().kind == ErrorKind::InvalidSize);
    }

    SECTION("an item wider than the atlas")
    {
        auto atlas =
            TextureAtlasBuilder(test.context).add_texture_raw("strip", filled(MAX_ATLAS_SIZE, 1, 1), MAX_ATLAS_SIZE, 1).build();
        REQUIRE(atlas.error().kind == ErrorKind::AtlasTooLarge);
    }

    SECTION("items that overflow the last shelf")
    {
        auto atlas = TextureAtlasBuilder(test.context)
                         .add_texture_raw("a", filled(1100, 1100, 1), 1100, 1100)
                         .add_texture_raw("b", filled(1100, 1100, 2), 1100, 1100)
                         .build();
        REQUIRE(atlas.error().kind == ErrorKind::AtlasTooLarge);
        REQUIRE(test.device->created().textures == 0);
    }
}
