#pragma once

#include <labelbridge/core/Error.hpp>
#include <labelbridge/raster/Bitmap.hpp>

#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

namespace LB::Raster {

// Image acquisition capability handed to the layout translator. Implementations
// should give up early and return Error::Code::Cancelled once stop is requested.
class ImageLoader {
public:
    virtual ~ImageLoader() = default;

    virtual auto load(std::string const& uri, std::stop_token stop) -> Expected<RgbaBitmap> = 0;
};

// Decodes PNG, JPEG, BMP, GIF or TGA bytes into 8-bit RGBA.
[[nodiscard]] auto decodeImage(std::vector<std::uint8_t> const& bytes) -> Expected<RgbaBitmap>;

// Loads images from the local file system. Accepts plain paths and file:// URIs;
// relative paths resolve against the base directory.
class FileImageLoader final : public ImageLoader {
public:
    FileImageLoader() = default;
    explicit FileImageLoader(std::filesystem::path base_directory);

    auto load(std::string const& uri, std::stop_token stop) -> Expected<RgbaBitmap> override;

    [[nodiscard]] auto resolve(std::string const& uri) const -> Expected<std::filesystem::path>;

private:
    std::filesystem::path base_directory_;
};

} // namespace LB::Raster
