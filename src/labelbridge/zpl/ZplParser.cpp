#include <labelbridge/zpl/ZplParser.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>
#include <charconv>

namespace LB::Zpl {

namespace {

constexpr std::string_view kLabelStart{"^XA"};
constexpr std::string_view kLabelEnd{"^XZ"};
constexpr std::string_view kDownloadGraphic{"~DG"};

auto is_alnum(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

auto is_name_char(char c) -> bool {
    return is_alnum(c) || c == '_' || c == '.' || c == ':';
}

auto trim(std::string_view value) -> std::string_view {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

auto read_size(std::string_view text, std::size_t& pos) -> std::optional<std::size_t> {
    std::size_t value = 0;
    auto const* begin = text.data() + pos;
    auto const* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr == begin) {
        return std::nullopt;
    }
    pos += static_cast<std::size_t>(ptr - begin);
    return value;
}

auto expect_comma(std::string_view text, std::size_t& pos) -> bool {
    if (pos < text.size() && text[pos] == ',') {
        ++pos;
        return true;
    }
    return false;
}

// Parses one ~DG block starting right after the "~DG" marker.
auto parse_stored_graphic(std::string_view text, std::size_t pos, std::size_t offset) -> std::optional<StoredGraphic> {
    auto const name_begin = pos;
    while (pos < text.size() && is_name_char(text[pos])) {
        ++pos;
    }
    if (pos == name_begin) {
        return std::nullopt;
    }
    auto qualified = text.substr(name_begin, pos - name_begin);

    StoredGraphic graphic;
    graphic.offset = offset;
    if (auto colon = qualified.find(':'); colon != std::string_view::npos) {
        graphic.device = std::string(qualified.substr(0, colon));
        qualified.remove_prefix(colon + 1);
    }
    if (qualified.empty() || qualified.find(':') != std::string_view::npos) {
        return std::nullopt;
    }
    graphic.name = std::string(qualified);

    if (!expect_comma(text, pos)) {
        return std::nullopt;
    }
    auto total = read_size(text, pos);
    if (!total || !expect_comma(text, pos)) {
        return std::nullopt;
    }
    auto per_row = read_size(text, pos);
    if (!per_row || !expect_comma(text, pos)) {
        return std::nullopt;
    }
    graphic.total_bytes = *total;
    graphic.bytes_per_row = *per_row;

    while (pos < text.size() && (is_alnum(text[pos]) || text[pos] == '\r' || text[pos] == '\n')) {
        if (text[pos] != '\r' && text[pos] != '\n') {
            graphic.payload.push_back(text[pos]);
        }
        ++pos;
    }
    if (graphic.payload.empty()) {
        return std::nullopt;
    }
    return graphic;
}

} // namespace

auto findLabelBlock(std::string_view text) -> std::optional<LabelBlock> {
    auto const start = text.find(kLabelStart);
    if (start == std::string_view::npos) {
        return std::nullopt;
    }
    auto const content_begin = start + kLabelStart.size();
    auto const end = text.find(kLabelEnd, content_begin);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return LabelBlock{text.substr(content_begin, end - content_begin), content_begin};
}

auto parseCommands(std::string_view block, std::size_t base_offset) -> std::vector<Command> {
    std::vector<Command> commands;
    std::size_t pos = block.find(kFormatPrefix);
    while (pos != std::string_view::npos) {
        auto const next = block.find(kFormatPrefix, pos + 1);
        if (pos + 2 < block.size() && is_alnum(block[pos + 1]) && is_alnum(block[pos + 2])) {
            Command command;
            command.opcode.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(block[pos + 1]))));
            command.opcode.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(block[pos + 2]))));
            auto const params_begin = pos + 3;
            auto const params_end = next == std::string_view::npos ? block.size() : next;
            command.params = std::string(block.substr(params_begin, params_end - params_begin));
            command.offset = base_offset + pos;
            commands.push_back(std::move(command));
        }
        pos = next;
    }
    lb_log("Parsed " + std::to_string(commands.size()) + " commands", "Zpl", "INFO");
    return commands;
}

auto findNextCommand(std::vector<Command> const& commands,
                     std::size_t from_index,
                     std::string_view opcode) -> std::optional<std::size_t> {
    for (auto i = from_index + 1; i < commands.size(); ++i) {
        if (commands[i].opcode == opcode) {
            return i;
        }
    }
    return std::nullopt;
}

auto splitParams(std::string_view params) -> std::vector<std::string_view> {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        auto const comma = params.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(params.substr(start));
            break;
        }
        fields.push_back(params.substr(start, comma - start));
        start = comma + 1;
    }
    return fields;
}

auto parseInt(std::string_view field) -> std::optional<int> {
    field = trim(field);
    if (field.empty()) {
        return std::nullopt;
    }
    if (field.front() == '+') {
        field.remove_prefix(1);
    }
    int value = 0;
    auto const* end = field.data() + field.size();
    auto [ptr, ec] = std::from_chars(field.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto applyFieldOrigin(Cursor cursor, std::string_view params) -> Expected<Cursor> {
    auto const fields = splitParams(params);
    if (fields.size() < 2) {
        return std::unexpected(Error{Error::Code::MalformedInput, "^FO needs x and y, got '" + std::string(params) + "'"});
    }
    auto x = parseInt(fields[0]);
    auto y = parseInt(fields[1]);
    if (!x || !y) {
        return std::unexpected(Error{Error::Code::MalformedInput, "^FO has non-numeric origin '" + std::string(params) + "'"});
    }
    cursor.x = *x;
    cursor.y = *y;
    return cursor;
}

auto parseRecallName(std::string_view params) -> std::optional<std::string> {
    auto name = splitParams(params).front();
    if (auto colon = name.find(':'); colon != std::string_view::npos) {
        name.remove_prefix(colon + 1);
    }
    name = trim(name);
    if (name.empty()) {
        return std::nullopt;
    }
    return std::string(name);
}

auto scanStoredGraphics(std::string_view text) -> std::vector<StoredGraphic> {
    std::vector<StoredGraphic> graphics;
    std::size_t pos = text.find(kDownloadGraphic);
    while (pos != std::string_view::npos) {
        if (auto graphic = parse_stored_graphic(text, pos + kDownloadGraphic.size(), pos)) {
            lb_log("Found stored graphic " + graphic->name, "Zpl", "INFO");
            graphics.push_back(std::move(*graphic));
        } else {
            lb_log("Ignoring malformed ~DG at offset " + std::to_string(pos), "Zpl", "WARN");
        }
        pos = text.find(kDownloadGraphic, pos + kDownloadGraphic.size());
    }
    return graphics;
}

} // namespace LB::Zpl
