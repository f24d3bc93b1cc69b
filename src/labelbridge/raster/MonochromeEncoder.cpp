#include <labelbridge/raster/MonochromeEncoder.hpp>

#include "log/TaggedLogger.hpp"

namespace LB::Raster {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

} // namespace

auto binarize(RgbaBitmap const& image, int threshold) -> MonochromeBitmap {
    MonochromeBitmap bitmap;
    bitmap.width = image.width;
    bitmap.height = image.height;
    auto const pixel_count = static_cast<std::size_t>(image.width) * image.height;
    bitmap.bits.resize(pixel_count, 0);

    for (std::size_t i = 0; i < pixel_count && (i * 4u + 2u) < image.pixels.size(); ++i) {
        int const sum = image.pixels[i * 4u + 0] + image.pixels[i * 4u + 1] + image.pixels[i * 4u + 2];
        // sum / 3 < threshold, kept in integers
        bitmap.bits[i] = (sum < threshold * 3) ? 1 : 0;
    }
    return bitmap;
}

auto packRows(MonochromeBitmap const& bitmap) -> std::vector<std::uint8_t> {
    auto const stride = bytesPerRow(bitmap.width);
    std::vector<std::uint8_t> packed(static_cast<std::size_t>(stride) * bitmap.height, 0);

    for (std::uint32_t y = 0; y < bitmap.height; ++y) {
        auto const row = static_cast<std::size_t>(y) * bitmap.width;
        auto* out = packed.data() + static_cast<std::size_t>(y) * stride;
        std::uint8_t mask = 0x80;
        for (std::uint32_t x = 0; x < bitmap.width; ++x) {
            if (bitmap.bits[row + x]) {
                *out |= mask;
            }
            mask >>= 1;
            if (mask == 0) {
                mask = 0x80;
                ++out;
            }
        }
    }
    return packed;
}

auto toHex(std::span<std::uint8_t const> bytes) -> std::string {
    std::string hex;
    hex.reserve(bytes.size() * 2u);
    for (auto byte : bytes) {
        hex.push_back(kHexDigits[byte >> 4]);
        hex.push_back(kHexDigits[byte & 0x0F]);
    }
    return hex;
}

auto encodeMonochromeHex(RgbaBitmap const& image, int threshold) -> Expected<std::string> {
    if (threshold < 0 || threshold > 256) {
        return std::unexpected(Error{Error::Code::InvalidArgument,
                                     "threshold " + std::to_string(threshold) + " outside 0..256"});
    }
    auto const expected_size = static_cast<std::size_t>(image.width) * image.height * 4u;
    if (image.pixels.size() != expected_size) {
        return std::unexpected(Error{Error::Code::InvalidArgument,
                                     "pixel buffer holds " + std::to_string(image.pixels.size()) + " bytes, expected "
                                         + std::to_string(expected_size)});
    }

    auto const packed = packRows(binarize(image, threshold));
    lb_log("Encoded " + std::to_string(image.width) + "x" + std::to_string(image.height) + " bitmap into "
               + std::to_string(packed.size()) + " bytes",
           "Raster", "INFO");
    return toHex(packed);
}

} // namespace LB::Raster
