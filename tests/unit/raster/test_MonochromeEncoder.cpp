#include <labelbridge/raster/MonochromeEncoder.hpp>

#include <doctest/doctest.h>

#include <array>
#include <cstdint>
#include <vector>

using namespace LB;
using namespace LB::Raster;

namespace {

auto solid(std::uint32_t width, std::uint32_t height, std::uint8_t value) -> RgbaBitmap {
    RgbaBitmap image;
    image.width = width;
    image.height = height;
    image.pixels.assign(static_cast<std::size_t>(width) * height * 4u, value);
    return image;
}

void set_pixel(RgbaBitmap& image, std::uint32_t x, std::uint32_t y, std::array<std::uint8_t, 4> rgba) {
    auto const offset = (static_cast<std::size_t>(y) * image.width + x) * 4u;
    for (std::size_t c = 0; c < 4; ++c) {
        image.pixels[offset + c] = rgba[c];
    }
}

} // namespace

TEST_SUITE("raster.monochrome") {
    TEST_CASE("binarize uses the channel average and ignores alpha") {
        auto image = solid(4, 1, 255);
        set_pixel(image, 0, 0, {0, 0, 0, 0});         // transparent black is still ink
        set_pixel(image, 1, 0, {127, 127, 127, 255}); // just below the threshold
        set_pixel(image, 2, 0, {128, 128, 128, 255}); // at the threshold is background
        set_pixel(image, 3, 0, {255, 0, 0, 255});     // average 85

        auto bitmap = binarize(image, 128);
        REQUIRE(bitmap.bits.size() == 4);
        CHECK(bitmap.bits[0] == 1);
        CHECK(bitmap.bits[1] == 1);
        CHECK(bitmap.bits[2] == 0);
        CHECK(bitmap.bits[3] == 1);
    }

    TEST_CASE("threshold extremes") {
        auto black = solid(2, 1, 0);
        auto white = solid(2, 1, 255);
        CHECK(binarize(black, 0).bits == std::vector<std::uint8_t>{0, 0});
        CHECK(binarize(white, 256).bits == std::vector<std::uint8_t>{1, 1});
    }

    TEST_CASE("packRows is MSB first with row padding") {
        MonochromeBitmap bitmap;
        bitmap.width = 10;
        bitmap.height = 2;
        bitmap.bits = {1, 0, 1, 0, 0, 0, 0, 0, 1, 1,
                       0, 0, 0, 0, 0, 0, 0, 1, 0, 1};
        auto packed = packRows(bitmap);
        REQUIRE(packed.size() == 4);
        CHECK(packed[0] == 0xA0);
        CHECK(packed[1] == 0xC0);
        CHECK(packed[2] == 0x01);
        CHECK(packed[3] == 0x40);
    }

    TEST_CASE("bytesPerRow rounds up") {
        CHECK(bytesPerRow(0) == 0);
        CHECK(bytesPerRow(1) == 1);
        CHECK(bytesPerRow(8) == 1);
        CHECK(bytesPerRow(9) == 2);
    }

    TEST_CASE("toHex is upper case") {
        std::vector<std::uint8_t> bytes{0x00, 0x0F, 0xAB, 0xFF};
        CHECK(toHex(bytes) == "000FABFF");
    }

    TEST_CASE("encodeMonochromeHex on an all-black image") {
        auto image = solid(8, 2, 0);
        for (std::size_t i = 3; i < image.pixels.size(); i += 4) {
            image.pixels[i] = 255;
        }
        auto hex = encodeMonochromeHex(image);
        REQUIRE(hex.has_value());
        CHECK(*hex == "FFFF");
    }

    TEST_CASE("all-background image encodes to zero digits") {
        auto image = solid(13, 3, 255);
        auto hex = encodeMonochromeHex(image);
        REQUIRE(hex.has_value());
        CHECK(*hex == std::string(2 * 3 * bytesPerRow(13), '0'));
        CHECK(hex->size() == 12);
    }

    TEST_CASE("encodeMonochromeHex pads partial bytes") {
        auto image = solid(3, 1, 0);
        auto hex = encodeMonochromeHex(image);
        REQUIRE(hex.has_value());
        CHECK(*hex == "E0");
    }

    TEST_CASE("encodeMonochromeHex rejects bad input") {
        auto image = solid(2, 2, 0);
        auto low = encodeMonochromeHex(image, -1);
        REQUIRE_FALSE(low.has_value());
        CHECK(low.error().code == Error::Code::InvalidArgument);
        CHECK_FALSE(encodeMonochromeHex(image, 257).has_value());

        image.pixels.pop_back();
        auto truncated = encodeMonochromeHex(image);
        REQUIRE_FALSE(truncated.has_value());
        CHECK(truncated.error().code == Error::Code::InvalidArgument);
    }
}
