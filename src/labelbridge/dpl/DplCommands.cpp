#include <labelbridge/dpl/DplCommands.hpp>

namespace LB::Dpl {

namespace {

struct Corners {
    std::string y;
    std::string x;
};

auto corners(long long x, long long y) -> Expected<Corners> {
    auto y_field = formatPosition(y);
    if (!y_field) {
        return std::unexpected(y_field.error());
    }
    auto x_field = formatPosition(x);
    if (!x_field) {
        return std::unexpected(x_field.error());
    }
    return Corners{std::move(*y_field), std::move(*x_field)};
}

auto corners(Position at) -> Expected<Corners> {
    return corners(at.x, at.y);
}

auto end_corners(Position at, int width, int height) -> Expected<Corners> {
    return corners(static_cast<long long>(at.x) + width, static_cast<long long>(at.y) + height);
}

} // namespace

auto formatPosition(long long value) -> Expected<std::string> {
    if (value < 0 || value > kMaxPosition) {
        return std::unexpected(Error{Error::Code::OutOfRange,
                                     "position " + std::to_string(value) + " does not fit four digits"});
    }
    auto digits = std::to_string(value);
    return std::string(4 - digits.size(), '0') + digits;
}

auto text(Position at, std::string_view payload) -> Expected<std::string> {
    auto c = corners(at);
    if (!c) {
        return std::unexpected(c.error());
    }
    std::string command{kTextFormat};
    command += c->y;
    command += c->x;
    command += payload;
    command += kTerminator;
    return command;
}

auto linearBarcode(Position at, std::string_view symbology, std::string_view payload) -> Expected<std::string> {
    auto c = corners(at);
    if (!c) {
        return std::unexpected(c.error());
    }
    std::string command{"B"};
    command += symbology;
    command += c->y;
    command += c->x;
    command += payload;
    command += kTerminator;
    return command;
}

auto qrBarcode(Position at, std::string_view payload) -> Expected<std::string> {
    auto c = corners(at);
    if (!c) {
        return std::unexpected(c.error());
    }
    std::string command{"B"};
    command += kQrOptions;
    command += c->y;
    command += ',';
    command += c->x;
    command += ',';
    command += kQrDataMode;
    command += ',';
    command += payload;
    command += kTerminator;
    return command;
}

auto box(Position at, int width, int height, int thickness) -> Expected<std::string> {
    auto start = corners(at);
    if (!start) {
        return std::unexpected(start.error());
    }
    auto end = end_corners(at, width, height);
    if (!end) {
        return std::unexpected(end.error());
    }
    auto const t = std::to_string(thickness);
    return "E" + start->y + "," + start->x + "," + end->y + "," + end->x + "," + t + "," + t + kTerminator;
}

auto circle(Position at, int diameter, int thickness) -> Expected<std::string> {
    auto c = corners(at);
    if (!c) {
        return std::unexpected(c.error());
    }
    return "C" + c->y + "," + c->x + "," + std::to_string(diameter) + "," + std::to_string(thickness) + kTerminator;
}

auto line(Position at, int width, int height, int thickness) -> Expected<std::string> {
    auto start = corners(at);
    if (!start) {
        return std::unexpected(start.error());
    }
    auto end = end_corners(at, width, height);
    if (!end) {
        return std::unexpected(end.error());
    }
    return "X" + start->y + "," + start->x + "," + end->y + "," + end->x + "," + std::to_string(thickness) + kTerminator;
}

auto recallImage(Position at, std::string_view name) -> Expected<std::string> {
    auto c = corners(at);
    if (!c) {
        return std::unexpected(c.error());
    }
    std::string command = "Y" + c->y + "," + c->x + ",";
    command += name;
    command += kTerminator;
    return command;
}

auto storeImage(std::string_view name, std::string_view hex) -> std::string {
    std::string command{"ID"};
    command.reserve(name.size() + hex.size() + 4);
    command += name;
    command += kTerminator;
    command += hex;
    command += kTerminator;
    return command;
}

auto labelHeader() -> std::string {
    std::string header;
    header += kStartOfHeader;
    header += 'L';
    header += kTerminator;
    header += kLabelConfiguration;
    header += kTerminator;
    return header;
}

auto labelFooter() -> std::string {
    return std::string{"E"} + kTerminator;
}

} // namespace LB::Dpl
