#pragma once

#include <labelbridge/core/Error.hpp>

#include <string>
#include <string_view>

namespace LB::Dpl {

inline constexpr char kStartOfHeader = '\x02';
inline constexpr char kTerminator = '\r';

// Rotation 1, font 2, width and height multipliers 1, no barcode height.
inline constexpr std::string_view kTextFormat{"1211000"};
inline constexpr std::string_view kQrOptions{" Q,M,S7"};
inline constexpr std::string_view kQrDataMode{"d2"};
inline constexpr std::string_view kLabelConfiguration{"D11"};
inline constexpr int kMaxPosition = 9999;

struct Position {
    int x = 0;
    int y = 0;
};

// Zero padded four digit field. Values outside 0..9999 are OutOfRange; they are
// never widened or truncated.
[[nodiscard]] auto formatPosition(long long value) -> Expected<std::string>;

[[nodiscard]] auto text(Position at, std::string_view payload) -> Expected<std::string>;
[[nodiscard]] auto linearBarcode(Position at, std::string_view symbology, std::string_view payload) -> Expected<std::string>;
[[nodiscard]] auto qrBarcode(Position at, std::string_view payload) -> Expected<std::string>;
[[nodiscard]] auto box(Position at, int width, int height, int thickness) -> Expected<std::string>;
[[nodiscard]] auto circle(Position at, int diameter, int thickness) -> Expected<std::string>;
[[nodiscard]] auto line(Position at, int width, int height, int thickness) -> Expected<std::string>;
[[nodiscard]] auto recallImage(Position at, std::string_view name) -> Expected<std::string>;

[[nodiscard]] auto storeImage(std::string_view name, std::string_view hex) -> std::string;
[[nodiscard]] auto labelHeader() -> std::string;
[[nodiscard]] auto labelFooter() -> std::string;

} // namespace LB::Dpl
