#pragma once

#include <labelbridge/core/Error.hpp>
#include <labelbridge/raster/Bitmap.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace LB::Raster {

inline constexpr int kDefaultThreshold = 128;

// A pixel is ink when the plain average of its red, green and blue channels is
// below the threshold. Alpha does not take part.
[[nodiscard]] auto binarize(RgbaBitmap const& image, int threshold = kDefaultThreshold) -> MonochromeBitmap;

// MSB-first packing. Every row starts on a byte boundary and a trailing partial
// byte is padded with zero bits.
[[nodiscard]] auto packRows(MonochromeBitmap const& bitmap) -> std::vector<std::uint8_t>;

[[nodiscard]] auto toHex(std::span<std::uint8_t const> bytes) -> std::string;

[[nodiscard]] inline auto bytesPerRow(std::uint32_t width) -> std::uint32_t {
    return (width + 7u) / 8u;
}

// binarize + packRows + toHex. Fails with InvalidArgument when the threshold is
// outside 0..256 or the pixel buffer does not match the dimensions.
[[nodiscard]] auto encodeMonochromeHex(RgbaBitmap const& image, int threshold = kDefaultThreshold) -> Expected<std::string>;

} // namespace LB::Raster
