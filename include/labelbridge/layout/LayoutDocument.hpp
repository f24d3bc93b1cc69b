#pragma once

#include <labelbridge/core/Error.hpp>
#include <labelbridge/layout/PlacedElement.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace LB::Layout {

// Reads {"elements": [...]} or a bare array of elements. Each element carries
// "type", "left", "top", optional "width"/"height" (numbers or "12px" strings)
// and an optional "attributes" object.
[[nodiscard]] auto parseLayoutDocument(std::string_view json_text) -> Expected<std::vector<PlacedElement>>;

[[nodiscard]] auto loadLayoutDocument(std::filesystem::path const& path) -> Expected<std::vector<PlacedElement>>;

} // namespace LB::Layout
