#pragma once

#include <cstdint>
#include <vector>

namespace LB::Raster {

struct RgbaBitmap {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    // 8-bit straight RGBA in row-major order.
    std::vector<std::uint8_t> pixels; // size = width * height * 4
};

// One byte per pixel, 1 = ink, 0 = background.
struct MonochromeBitmap {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> bits;
};

} // namespace LB::Raster
