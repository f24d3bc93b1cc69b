#pragma once

#include <labelbridge/core/Error.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LB::Zpl {

inline constexpr char kFormatPrefix = '^';
inline constexpr char kControlPrefix = '~';

struct Command {
    std::string opcode; // two characters, upper case
    std::string params; // raw text up to the next '^'
    std::size_t offset = 0;
};

struct Cursor {
    int x = 0;
    int y = 0;
};

struct LabelBlock {
    std::string_view content; // text between ^XA and ^XZ
    std::size_t      offset = 0;
};

// ~DG<device:name>,<total bytes>,<bytes per row>,<data>
struct StoredGraphic {
    std::string name;   // logical name, device prefix removed
    std::string device; // empty when no prefix was given
    std::size_t total_bytes = 0;
    std::size_t bytes_per_row = 0;
    std::string payload; // still compressed, line breaks removed
    std::size_t offset = 0;
};

// First ^XA and the nearest ^XZ after it.
[[nodiscard]] auto findLabelBlock(std::string_view text) -> std::optional<LabelBlock>;

// Splits a label block into commands. Offsets are relative to base_offset.
// Unknown opcodes stay in the list so forward lookups see every command.
[[nodiscard]] auto parseCommands(std::string_view block, std::size_t base_offset = 0) -> std::vector<Command>;

// Index of the first command after from_index with the given opcode.
[[nodiscard]] auto findNextCommand(std::vector<Command> const& commands,
                                   std::size_t from_index,
                                   std::string_view opcode) -> std::optional<std::size_t>;

[[nodiscard]] auto splitParams(std::string_view params) -> std::vector<std::string_view>;
[[nodiscard]] auto parseInt(std::string_view field) -> std::optional<int>;

// ^FOx,y. On error the caller keeps its previous cursor.
[[nodiscard]] auto applyFieldOrigin(Cursor cursor, std::string_view params) -> Expected<Cursor>;

// ^XG[device:]name[,mx,my]
[[nodiscard]] auto parseRecallName(std::string_view params) -> std::optional<std::string>;

[[nodiscard]] auto scanStoredGraphics(std::string_view text) -> std::vector<StoredGraphic>;

} // namespace LB::Zpl
