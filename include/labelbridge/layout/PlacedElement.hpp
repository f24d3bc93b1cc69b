#pragma once

#include <labelbridge/core/Error.hpp>
#include <labelbridge/dpl/DplCommands.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace LB::Layout {

// Element as handed over by a design surface: a tag, a box in pixels and loose
// string attributes.
struct PlacedElement {
    std::string                        type;
    double                             left = 0.0;
    double                             top = 0.0;
    std::optional<double>              width;
    std::optional<double>              height;
    std::map<std::string, std::string> attributes;
};

enum class ElementKind {
    Text,
    Barcode,
    Box,
    Circle,
    DiagonalLine,
    Image
};

struct TextElement {
    Dpl::Position at;
    std::string   text;
};

struct BarcodeElement {
    enum class Symbology {
        Linear,
        Qr
    };

    Dpl::Position at;
    Symbology     symbology = Symbology::Linear;
    std::string   code = "C"; // DPL symbology letter for linear codes
    std::string   data;
};

struct BoxElement {
    Dpl::Position at;
    int           width = 0;
    int           height = 0;
    int           thickness = 1;
};

struct CircleElement {
    Dpl::Position at;
    int           diameter = 0;
    int           thickness = 1;
};

struct LineElement {
    Dpl::Position at;
    int           width = 0;
    int           height = 0;
    int           thickness = 1;
};

struct ImageElement {
    Dpl::Position at;
    std::string   source;
    std::string   name = "IMG001";
};

using ResolvedElement = std::variant<TextElement, BarcodeElement, BoxElement, CircleElement, LineElement, ImageElement>;

// Accepts the bare kind ("box") and the designer tag ("zpl-graphic-box").
[[nodiscard]] auto parseElementKind(std::string_view tag) -> std::optional<ElementKind>;
[[nodiscard]] auto elementKindToString(ElementKind kind) -> std::string_view;

// "150px", "150", " 12.5 px"
[[nodiscard]] auto parsePixels(std::string_view value) -> std::optional<double>;

// Errors: NotSupported for an unknown tag, MalformedInput for a missing or
// non-numeric field, OutOfRange for coordinates that do not fit an int.
[[nodiscard]] auto resolveElement(PlacedElement const& element) -> Expected<ResolvedElement>;

} // namespace LB::Layout
