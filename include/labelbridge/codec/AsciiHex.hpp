#pragma once

#include <labelbridge/core/Error.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace LB::Codec {

// ZPL compressed ASCII hex. 'G'..'Y' repeat the following character 1..19 times,
// 'g'..'y' repeat it 20..380 times in steps of 20.
inline constexpr int kLowerRepeatStep = 20;

[[nodiscard]] auto compressionCount(char token) -> std::optional<int>;

// Removes CR and LF so a payload split over several lines decodes as one run.
[[nodiscard]] auto stripLineBreaks(std::string_view payload) -> std::string;

// Expands every (token, literal) pair and passes other characters through. The
// result is upper-cased. A token in the last position is a MalformedInput error.
[[nodiscard]] auto decompress(std::string_view payload) -> Expected<std::string>;

} // namespace LB::Codec
