#include <labelbridge/raster/ImageLoader.hpp>

#include "log/TaggedLogger.hpp"

#include <fstream>
#include <iterator>
#include <memory>
#include <string_view>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO
#define STBI_ONLY_PNG
#define STBI_ONLY_JPEG
#define STBI_ONLY_BMP
#define STBI_ONLY_GIF
#define STBI_ONLY_TGA
#include <stb_image.h>

namespace LB::Raster {

namespace {

constexpr std::string_view kFileScheme{"file://"};

auto make_decode_error(std::string message) -> Error {
    return Error{Error::Code::DecodeFailure, std::move(message)};
}

auto read_file_bytes(std::filesystem::path const& path) -> Expected<std::vector<std::uint8_t>> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(Error{Error::Code::IoFailure, "cannot open " + path.string()});
    }
    std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
    if (stream.bad()) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed reading " + path.string()});
    }
    return bytes;
}

} // namespace

auto decodeImage(std::vector<std::uint8_t> const& bytes) -> Expected<RgbaBitmap> {
    if (bytes.empty()) {
        return std::unexpected(make_decode_error("image data is empty"));
    }

    int width = 0;
    int height = 0;
    int channels = 0;

    unsigned char* decoded = stbi_load_from_memory(
        bytes.data(),
        static_cast<int>(bytes.size()),
        &width,
        &height,
        &channels,
        STBI_rgb_alpha);

    if (!decoded || width <= 0 || height <= 0) {
        std::string reason = "failed to decode image";
        if (auto const* why = stbi_failure_reason()) {
            reason += ": ";
            reason += why;
        }
        if (decoded) {
            stbi_image_free(decoded);
        }
        return std::unexpected(make_decode_error(std::move(reason)));
    }

    std::unique_ptr<unsigned char, void (*)(void*)> pixels(decoded, stbi_image_free);
    RgbaBitmap image;
    image.width = static_cast<std::uint32_t>(width);
    image.height = static_cast<std::uint32_t>(height);
    auto const size = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u;
    image.pixels.assign(pixels.get(), pixels.get() + size);
    return image;
}

FileImageLoader::FileImageLoader(std::filesystem::path base_directory)
    : base_directory_(std::move(base_directory)) {}

auto FileImageLoader::resolve(std::string const& uri) const -> Expected<std::filesystem::path> {
    std::string_view view{uri};
    if (view.starts_with(kFileScheme)) {
        view.remove_prefix(kFileScheme.size());
    } else if (view.find("://") != std::string_view::npos) {
        return std::unexpected(Error{Error::Code::NotSupported,
                                     "unsupported image scheme in '" + uri + "'"});
    }
    if (view.empty()) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "empty image uri"});
    }

    std::filesystem::path path{std::string(view)};
    if (path.is_relative() && !base_directory_.empty()) {
        path = base_directory_ / path;
    }
    return path;
}

auto FileImageLoader::load(std::string const& uri, std::stop_token stop) -> Expected<RgbaBitmap> {
    if (stop.stop_requested()) {
        return std::unexpected(Error{Error::Code::Cancelled, "load of '" + uri + "' cancelled"});
    }

    auto path = resolve(uri);
    if (!path) {
        return std::unexpected(path.error());
    }

    lb_log("Loading image " + path->string(), "Raster", "INFO");
    auto bytes = read_file_bytes(*path);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    if (stop.stop_requested()) {
        return std::unexpected(Error{Error::Code::Cancelled, "load of '" + uri + "' cancelled"});
    }
    return decodeImage(*bytes);
}

} // namespace LB::Raster
