#include <labelbridge/layout/PlacedElement.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <utility>

namespace LB::Layout {

namespace {

struct KindTag {
    std::string_view tag;
    ElementKind      kind;
};

constexpr std::array<KindTag, 12> kKindTags{{
    {"text", ElementKind::Text},
    {"zpl-text", ElementKind::Text},
    {"barcode", ElementKind::Barcode},
    {"zpl-barcode", ElementKind::Barcode},
    {"box", ElementKind::Box},
    {"zpl-graphic-box", ElementKind::Box},
    {"circle", ElementKind::Circle},
    {"zpl-graphic-circle", ElementKind::Circle},
    {"diagonal-line", ElementKind::DiagonalLine},
    {"zpl-graphic-diagonal-line", ElementKind::DiagonalLine},
    {"image", ElementKind::Image},
    {"zpl-image", ElementKind::Image},
}};

auto trim(std::string_view value) -> std::string_view {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

auto to_lower(std::string_view value) -> std::string {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

auto attribute(PlacedElement const& element, std::string const& key) -> std::optional<std::string> {
    auto it = element.attributes.find(key);
    if (it == element.attributes.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto to_pixel(double value, std::string_view what) -> Expected<int> {
    if (!std::isfinite(value)) {
        return std::unexpected(Error{Error::Code::MalformedInput, std::string(what) + " is not a finite number"});
    }
    auto const rounded = std::round(value);
    if (rounded < static_cast<double>(std::numeric_limits<int>::min())
        || rounded > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::unexpected(Error{Error::Code::OutOfRange, std::string(what) + " does not fit a pixel coordinate"});
    }
    return static_cast<int>(rounded);
}

auto position_of(PlacedElement const& element) -> Expected<Dpl::Position> {
    auto x = to_pixel(element.left, "left");
    if (!x) {
        return std::unexpected(x.error());
    }
    auto y = to_pixel(element.top, "top");
    if (!y) {
        return std::unexpected(y.error());
    }
    return Dpl::Position{*x, *y};
}

auto required_size(std::optional<double> const& value, std::string_view what) -> Expected<int> {
    if (!value) {
        return std::unexpected(Error{Error::Code::MalformedInput, std::string(what) + " is required"});
    }
    return to_pixel(*value, what);
}

auto thickness_of(PlacedElement const& element) -> Expected<int> {
    auto raw = attribute(element, "thickness");
    if (!raw) {
        return 1;
    }
    auto value = parsePixels(*raw);
    if (!value) {
        return std::unexpected(Error{Error::Code::MalformedInput, "thickness '" + *raw + "' is not a number"});
    }
    return to_pixel(*value, "thickness");
}

auto resolve_text(PlacedElement const& element, Dpl::Position at) -> Expected<ResolvedElement> {
    return TextElement{at, attribute(element, "text").value_or("")};
}

auto resolve_barcode(PlacedElement const& element, Dpl::Position at) -> Expected<ResolvedElement> {
    BarcodeElement barcode;
    barcode.at = at;
    barcode.data = attribute(element, "data").value_or("");
    if (auto type = attribute(element, "type"); type && !type->empty()) {
        if (to_lower(*type) == "qrcode") {
            barcode.symbology = BarcodeElement::Symbology::Qr;
        } else {
            barcode.code = *type;
        }
    }
    return barcode;
}

auto resolve_box(PlacedElement const& element, Dpl::Position at) -> Expected<ResolvedElement> {
    auto width = required_size(element.width, "width");
    if (!width) {
        return std::unexpected(width.error());
    }
    auto height = required_size(element.height, "height");
    if (!height) {
        return std::unexpected(height.error());
    }
    auto thickness = thickness_of(element);
    if (!thickness) {
        return std::unexpected(thickness.error());
    }
    return BoxElement{at, *width, *height, *thickness};
}

auto resolve_circle(PlacedElement const& element, Dpl::Position at) -> Expected<ResolvedElement> {
    auto diameter = required_size(element.width, "width");
    if (!diameter) {
        return std::unexpected(diameter.error());
    }
    auto thickness = thickness_of(element);
    if (!thickness) {
        return std::unexpected(thickness.error());
    }
    return CircleElement{at, *diameter, *thickness};
}

auto resolve_line(PlacedElement const& element, Dpl::Position at) -> Expected<ResolvedElement> {
    auto width = required_size(element.width, "width");
    if (!width) {
        return std::unexpected(width.error());
    }
    auto height = required_size(element.height, "height");
    if (!height) {
        return std::unexpected(height.error());
    }
    auto thickness = thickness_of(element);
    if (!thickness) {
        return std::unexpected(thickness.error());
    }
    return LineElement{at, *width, *height, *thickness};
}

auto resolve_image(PlacedElement const& element, Dpl::Position at) -> Expected<ResolvedElement> {
    ImageElement image;
    image.at = at;
    auto source = attribute(element, "src");
    if (!source || trim(*source).empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "image element has no src"});
    }
    image.source = *source;
    if (auto name = attribute(element, "image-name"); name && !name->empty()) {
        image.name = *name;
    }
    return image;
}

} // namespace

auto parseElementKind(std::string_view tag) -> std::optional<ElementKind> {
    auto const lowered = to_lower(trim(tag));
    for (auto const& entry : kKindTags) {
        if (entry.tag == lowered) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

auto elementKindToString(ElementKind kind) -> std::string_view {
    switch (kind) {
    case ElementKind::Text:
        return "text";
    case ElementKind::Barcode:
        return "barcode";
    case ElementKind::Box:
        return "box";
    case ElementKind::Circle:
        return "circle";
    case ElementKind::DiagonalLine:
        return "diagonal-line";
    case ElementKind::Image:
        return "image";
    }
    return "text";
}

auto parsePixels(std::string_view value) -> std::optional<double> {
    value = trim(value);
    if (value.size() >= 2) {
        auto const suffix = to_lower(value.substr(value.size() - 2));
        if (suffix == "px") {
            value = trim(value.substr(0, value.size() - 2));
        }
    }
    if (value.empty()) {
        return std::nullopt;
    }
    if (value.front() == '+') {
        value.remove_prefix(1);
    }
    double parsed = 0.0;
    auto const* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return parsed;
}

auto resolveElement(PlacedElement const& element) -> Expected<ResolvedElement> {
    auto kind = parseElementKind(element.type);
    if (!kind) {
        return std::unexpected(Error{Error::Code::NotSupported, "unsupported element type '" + element.type + "'"});
    }
    auto at = position_of(element);
    if (!at) {
        return std::unexpected(at.error());
    }

    switch (*kind) {
    case ElementKind::Text:
        return resolve_text(element, *at);
    case ElementKind::Barcode:
        return resolve_barcode(element, *at);
    case ElementKind::Box:
        return resolve_box(element, *at);
    case ElementKind::Circle:
        return resolve_circle(element, *at);
    case ElementKind::DiagonalLine:
        return resolve_line(element, *at);
    case ElementKind::Image:
        return resolve_image(element, *at);
    }
    return std::unexpected(Error{Error::Code::NotSupported, "unsupported element type '" + element.type + "'"});
}

} // namespace LB::Layout
