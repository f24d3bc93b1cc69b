#include <labelbridge/codec/AsciiHex.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>

namespace LB::Codec {

auto compressionCount(char token) -> std::optional<int> {
    if (token >= 'G' && token <= 'Y') {
        return token - 'F';
    }
    if (token >= 'g' && token <= 'y') {
        return (token - 'f') * kLowerRepeatStep;
    }
    return std::nullopt;
}

auto stripLineBreaks(std::string_view payload) -> std::string {
    std::string stripped;
    stripped.reserve(payload.size());
    for (char c : payload) {
        if (c != '\r' && c != '\n') {
            stripped.push_back(c);
        }
    }
    return stripped;
}

auto decompress(std::string_view payload) -> Expected<std::string> {
    std::string expanded;
    expanded.reserve(payload.size() * 2);

    std::size_t i = 0;
    while (i < payload.size()) {
        auto const count = compressionCount(payload[i]);
        if (!count) {
            expanded.push_back(payload[i]);
            ++i;
            continue;
        }
        if (i + 1 >= payload.size()) {
            lb_log("Repeat token '" + std::string(1, payload[i]) + "' has no literal", "Codec", "ERROR");
            return std::unexpected(Error{Error::Code::MalformedInput,
                                         "repeat token '" + std::string(1, payload[i]) + "' at offset "
                                             + std::to_string(i) + " has no literal"});
        }
        expanded.append(static_cast<std::size_t>(*count), payload[i + 1]);
        i += 2;
    }

    for (auto& c : expanded) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return expanded;
}

} // namespace LB::Codec
