#include <labelbridge/Translator.hpp>

#include <labelbridge/codec/AsciiHex.hpp>
#include <labelbridge/dpl/DplCommands.hpp>
#include <labelbridge/dpl/ScriptAssembler.hpp>
#include <labelbridge/zpl/ZplParser.hpp>

#include "TranslatorDetail.hpp"

#include <array>
#include <optional>

namespace LB {

namespace {

using TranslatorDetail::Record;
using TranslatorDetail::RecordCommandError;

enum class Opcode {
    FieldOrigin,
    FieldData,
    Barcode,
    GraphicBox,
    GraphicCircle,
    GraphicDiagonal,
    RecallGraphic,
    Other
};

struct OpcodeEntry {
    std::string_view opcode;
    Opcode           kind;
    std::string_view symbology; // DPL letter, barcodes only; empty selects QR
};

constexpr std::array<OpcodeEntry, 9> kOpcodes{{
    {"FO", Opcode::FieldOrigin, ""},
    {"FD", Opcode::FieldData, ""},
    {"BC", Opcode::Barcode, "C"},
    {"B3", Opcode::Barcode, "A"},
    {"BQ", Opcode::Barcode, ""},
    {"GB", Opcode::GraphicBox, ""},
    {"GC", Opcode::GraphicCircle, ""},
    {"GD", Opcode::GraphicDiagonal, ""},
    {"XG", Opcode::RecallGraphic, ""},
}};

auto classify(std::string_view opcode) -> OpcodeEntry {
    for (auto const& entry : kOpcodes) {
        if (entry.opcode == opcode) {
            return entry;
        }
    }
    return OpcodeEntry{opcode, Opcode::Other, ""};
}

// Integer field at index, or fallback when the field is absent or empty.
auto field_or(std::vector<std::string_view> const& fields, std::size_t index, std::optional<int> fallback) -> std::optional<int> {
    if (index >= fields.size() || fields[index].find_first_not_of(' ') == std::string_view::npos) {
        return fallback;
    }
    return Zpl::parseInt(fields[index]);
}

auto malformed(Zpl::Command const& command) -> Error {
    return Error{Error::Code::MalformedInput, "^" + command.opcode + " has bad parameters '" + command.params + "'"};
}

auto emit_box(Zpl::Command const& command, Dpl::Position at) -> Expected<std::string> {
    auto const fields = Zpl::splitParams(command.params);
    auto width = field_or(fields, 0, std::nullopt);
    auto height = field_or(fields, 1, std::nullopt);
    auto thickness = field_or(fields, 2, 1);
    if (!width || !height || !thickness) {
        return std::unexpected(malformed(command));
    }
    return Dpl::box(at, *width, *height, *thickness);
}

auto emit_circle(Zpl::Command const& command, Dpl::Position at) -> Expected<std::string> {
    auto const fields = Zpl::splitParams(command.params);
    auto diameter = field_or(fields, 0, std::nullopt);
    auto thickness = field_or(fields, 1, 1);
    if (!diameter || !thickness) {
        return std::unexpected(malformed(command));
    }
    return Dpl::circle(at, *diameter, *thickness);
}

auto emit_diagonal(Zpl::Command const& command, Dpl::Position at) -> Expected<std::string> {
    auto const fields = Zpl::splitParams(command.params);
    auto width = field_or(fields, 0, std::nullopt);
    auto height = field_or(fields, 1, std::nullopt);
    auto thickness = field_or(fields, 2, 1);
    if (!width || !height || !thickness) {
        return std::unexpected(malformed(command));
    }
    return Dpl::line(at, *width, *height, *thickness);
}

auto store_graphics(std::string_view zpl, Dpl::ScriptAssembler& assembler, Diagnostics& diagnostics, TranslateOptions const& options) -> Expected<void> {
    for (auto const& graphic : Zpl::scanStoredGraphics(zpl)) {
        auto hex = Codec::decompress(graphic.payload);
        if (!hex) {
            if (options.fail_on_decode_error) {
                return std::unexpected(Error{Error::Code::DecodeFailure, "~DG " + graphic.name + ": " + describeError(hex.error())});
            }
            Record(diagnostics, Diagnostic::Severity::Error, Diagnostic::Kind::DecodeFailure, graphic.offset,
                   "~DG " + graphic.name + ": " + describeError(hex.error()));
            continue;
        }
        if (hex->size() != graphic.total_bytes * 2u) {
            Record(diagnostics, Diagnostic::Severity::Warning, Diagnostic::Kind::MalformedCommand, graphic.offset,
                   "~DG " + graphic.name + " declares " + std::to_string(graphic.total_bytes) + " bytes but decodes to "
                       + std::to_string(hex->size() / 2u));
        }
        assembler.storeImage(Dpl::ImageRecord{graphic.name, std::move(*hex)});
    }
    return {};
}

void emit_layout(std::vector<Zpl::Command> const& commands, Dpl::ScriptAssembler& assembler, Diagnostics& diagnostics) {
    Zpl::Cursor cursor;

    for (std::size_t i = 0; i < commands.size(); ++i) {
        auto const& command = commands[i];
        auto const entry = classify(command.opcode);
        Dpl::Position const at{cursor.x, cursor.y};
        Expected<std::string> emitted{std::string{}};

        switch (entry.kind) {
        case Opcode::FieldOrigin: {
            auto moved = Zpl::applyFieldOrigin(cursor, command.params);
            if (!moved) {
                RecordCommandError(diagnostics, command.offset, moved.error());
            } else {
                cursor = *moved;
            }
            continue;
        }
        case Opcode::FieldData:
            emitted = Dpl::text(at, command.params);
            break;
        case Opcode::Barcode: {
            auto data = Zpl::findNextCommand(commands, i, "FD");
            if (!data) {
                Record(diagnostics, Diagnostic::Severity::Warning, Diagnostic::Kind::UnresolvedReference, command.offset,
                       "^" + command.opcode + " has no following ^FD");
                continue;
            }
            auto const& payload = commands[*data].params;
            emitted = entry.symbology.empty() ? Dpl::qrBarcode(at, payload) : Dpl::linearBarcode(at, entry.symbology, payload);
            break;
        }
        case Opcode::GraphicBox:
            emitted = emit_box(command, at);
            break;
        case Opcode::GraphicCircle:
            emitted = emit_circle(command, at);
            break;
        case Opcode::GraphicDiagonal:
            emitted = emit_diagonal(command, at);
            break;
        case Opcode::RecallGraphic: {
            auto name = Zpl::parseRecallName(command.params);
            if (!name) {
                emitted = std::unexpected(malformed(command));
                break;
            }
            if (!assembler.hasImage(*name)) {
                Record(diagnostics, Diagnostic::Severity::Warning, Diagnostic::Kind::UnresolvedReference, command.offset,
                       "^XG recalls " + *name + " which was not stored");
                continue;
            }
            emitted = Dpl::recallImage(at, *name);
            break;
        }
        case Opcode::Other:
            continue;
        }

        if (!emitted) {
            RecordCommandError(diagnostics, command.offset, emitted.error());
            continue;
        }
        assembler.addLayout(std::move(*emitted));
    }
}

} // namespace

auto translateZpl(std::string_view zpl, TranslateOptions const& options) -> Expected<TranslationResult> {
    if (auto valid = TranslatorDetail::ValidateOptions(options); !valid) {
        return std::unexpected(valid.error());
    }

    TranslationResult result;
    Dpl::ScriptAssembler assembler;

    auto stored = store_graphics(zpl, assembler, result.diagnostics, options);
    if (!stored) {
        lb_log(describeError(stored.error()), "Translate", "ERROR");
        return std::unexpected(stored.error());
    }

    if (auto block = Zpl::findLabelBlock(zpl)) {
        auto const commands = Zpl::parseCommands(block->content, block->offset);
        emit_layout(commands, assembler, result.diagnostics);
    } else {
        Record(result.diagnostics, Diagnostic::Severity::Warning, Diagnostic::Kind::MissingLabelBlock, 0,
               "no ^XA..^XZ label block");
    }

    result.script = assembler.finish();
    lb_log("Translated ZPL into " + std::to_string(assembler.imageCount()) + " images and "
               + std::to_string(assembler.layoutCount()) + " layout commands",
           "Translate", "INFO");
    return result;
}

} // namespace LB
