#include <labelbridge/layout/LayoutDocument.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace LB::Layout {

namespace {

using json = nlohmann::json;

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

auto element_label(std::size_t index) -> std::string {
    return "element " + std::to_string(index);
}

auto read_pixels(json const& value, std::string_view key, std::size_t index) -> Expected<std::optional<double>> {
    if (value.is_null()) {
        return std::optional<double>{};
    }
    if (value.is_number()) {
        return std::optional<double>{value.get<double>()};
    }
    if (value.is_string()) {
        auto const text = value.get<std::string>();
        if (auto parsed = parsePixels(text)) {
            return std::optional<double>{*parsed};
        }
        return std::unexpected(malformed(element_label(index) + ": " + std::string(key) + " '" + text + "' is not a pixel value"));
    }
    return std::unexpected(malformed(element_label(index) + ": " + std::string(key) + " must be a number or string"));
}

auto attribute_text(json const& value) -> std::optional<std::string> {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_number()) {
        return value.dump();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? std::string{"true"} : std::string{"false"};
    }
    return std::nullopt;
}

auto parse_element(json const& object, std::size_t index) -> Expected<PlacedElement> {
    if (!object.is_object()) {
        return std::unexpected(malformed(element_label(index) + " is not an object"));
    }
    if (!object.contains("type") || !object["type"].is_string()) {
        return std::unexpected(malformed(element_label(index) + " has no string \"type\""));
    }

    PlacedElement element;
    element.type = object["type"].get<std::string>();

    auto field = [&](char const* key) { return object.contains(key) ? object[key] : json{}; };

    auto left = read_pixels(field("left"), "left", index);
    if (!left) {
        return std::unexpected(left.error());
    }
    auto top = read_pixels(field("top"), "top", index);
    if (!top) {
        return std::unexpected(top.error());
    }
    if (!*left || !*top) {
        return std::unexpected(malformed(element_label(index) + " needs \"left\" and \"top\""));
    }
    element.left = **left;
    element.top = **top;

    auto width = read_pixels(field("width"), "width", index);
    if (!width) {
        return std::unexpected(width.error());
    }
    auto height = read_pixels(field("height"), "height", index);
    if (!height) {
        return std::unexpected(height.error());
    }
    element.width = *width;
    element.height = *height;

    if (object.contains("attributes")) {
        auto const& attributes = object["attributes"];
        if (!attributes.is_object()) {
            return std::unexpected(malformed(element_label(index) + ": \"attributes\" must be an object"));
        }
        for (auto it = attributes.begin(); it != attributes.end(); ++it) {
            auto text = attribute_text(it.value());
            if (!text) {
                return std::unexpected(malformed(element_label(index) + ": attribute '" + it.key() + "' must be a scalar"));
            }
            element.attributes.emplace(it.key(), std::move(*text));
        }
    }
    return element;
}

} // namespace

auto parseLayoutDocument(std::string_view json_text) -> Expected<std::vector<PlacedElement>> {
    auto document = json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(malformed("layout document is not valid JSON"));
    }

    json const* list = &document;
    if (document.is_object()) {
        if (!document.contains("elements")) {
            return std::unexpected(malformed("layout document has no \"elements\""));
        }
        list = &document["elements"];
    }
    if (!list->is_array()) {
        return std::unexpected(malformed("layout elements must be an array"));
    }

    std::vector<PlacedElement> elements;
    elements.reserve(list->size());
    for (std::size_t i = 0; i < list->size(); ++i) {
        auto element = parse_element((*list)[i], i);
        if (!element) {
            return std::unexpected(element.error());
        }
        elements.push_back(std::move(*element));
    }
    lb_log("Loaded layout with " + std::to_string(elements.size()) + " elements", "Layout", "INFO");
    return elements;
}

auto loadLayoutDocument(std::filesystem::path const& path) -> Expected<std::vector<PlacedElement>> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(Error{Error::Code::IoFailure, "cannot open " + path.string()});
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    if (stream.bad()) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed reading " + path.string()});
    }
    return parseLayoutDocument(buffer.str());
}

} // namespace LB::Layout
