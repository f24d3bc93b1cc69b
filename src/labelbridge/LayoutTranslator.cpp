#include <labelbridge/Translator.hpp>

#include <labelbridge/dpl/DplCommands.hpp>
#include <labelbridge/dpl/ScriptAssembler.hpp>

#include "TranslatorDetail.hpp"

#include <map>
#include <variant>

namespace LB {

namespace {

using TranslatorDetail::Record;
using TranslatorDetail::RecordCommandError;

struct LayoutEmitter {
    Dpl::ScriptAssembler&              assembler;
    Raster::ImageLoader&               loader;
    TranslateOptions const&            options;
    Diagnostics&                       diagnostics;
    std::map<std::string, std::string> stored_sources{};
    std::size_t                        index = 0;

    auto operator()(Layout::TextElement const& text) -> Expected<std::string> {
        return Dpl::text(text.at, text.text);
    }

    auto operator()(Layout::BarcodeElement const& barcode) -> Expected<std::string> {
        if (barcode.symbology == Layout::BarcodeElement::Symbology::Qr) {
            return Dpl::qrBarcode(barcode.at, barcode.data);
        }
        return Dpl::linearBarcode(barcode.at, barcode.code, barcode.data);
    }

    auto operator()(Layout::BoxElement const& box) -> Expected<std::string> {
        return Dpl::box(box.at, box.width, box.height, box.thickness);
    }

    auto operator()(Layout::CircleElement const& circle) -> Expected<std::string> {
        return Dpl::circle(circle.at, circle.diameter, circle.thickness);
    }

    auto operator()(Layout::LineElement const& line) -> Expected<std::string> {
        return Dpl::line(line.at, line.width, line.height, line.thickness);
    }

    auto operator()(Layout::ImageElement const& image) -> Expected<std::string> {
        // Validate the recall before paying for the load.
        auto recall = Dpl::recallImage(image.at, image.name);
        if (!recall) {
            return recall;
        }

        if (auto stored = stored_sources.find(image.name); stored != stored_sources.end()) {
            if (stored->second == image.source) {
                return recall;
            }
            Record(diagnostics, Diagnostic::Severity::Warning, Diagnostic::Kind::UnresolvedReference, index,
                   "image name " + image.name + " is already stored from " + stored->second);
            return std::string{};
        }

        if (options.stop_token.stop_requested()) {
            Record(diagnostics, Diagnostic::Severity::Warning, Diagnostic::Kind::Cancelled, index,
                   "load of " + image.source + " cancelled");
            return std::string{};
        }

        auto bitmap = loader.load(image.source, options.stop_token);
        if (!bitmap) {
            auto const kind = bitmap.error().code == Error::Code::Cancelled ? Diagnostic::Kind::Cancelled
                                                                            : Diagnostic::Kind::ResourceFailure;
            auto const severity = kind == Diagnostic::Kind::Cancelled ? Diagnostic::Severity::Warning
                                                                      : Diagnostic::Severity::Error;
            Record(diagnostics, severity, kind, index, image.source + ": " + describeError(bitmap.error()));
            return std::string{};
        }

        auto hex = Raster::encodeMonochromeHex(*bitmap, options.threshold);
        if (!hex) {
            Record(diagnostics, Diagnostic::Severity::Error, Diagnostic::Kind::ResourceFailure, index,
                   image.source + ": " + describeError(hex.error()));
            return std::string{};
        }

        assembler.storeImage(Dpl::ImageRecord{image.name, std::move(*hex)});
        stored_sources.emplace(image.name, image.source);
        return recall;
    }
};

auto resolve_failure_kind(Error const& error) -> Diagnostic::Kind {
    switch (error.code) {
    case Error::Code::NotSupported:
        return Diagnostic::Kind::UnsupportedElement;
    case Error::Code::OutOfRange:
        return Diagnostic::Kind::PositionOutOfRange;
    default:
        return Diagnostic::Kind::MalformedCommand;
    }
}

} // namespace

auto translateLayout(std::vector<Layout::PlacedElement> const& elements,
                     Raster::ImageLoader& loader,
                     TranslateOptions const& options) -> Expected<TranslationResult> {
    if (auto valid = TranslatorDetail::ValidateOptions(options); !valid) {
        return std::unexpected(valid.error());
    }

    TranslationResult result;
    Dpl::ScriptAssembler assembler;
    LayoutEmitter emitter{.assembler = assembler, .loader = loader, .options = options, .diagnostics = result.diagnostics};

    for (std::size_t i = 0; i < elements.size(); ++i) {
        auto resolved = Layout::resolveElement(elements[i]);
        if (!resolved) {
            Record(result.diagnostics, Diagnostic::Severity::Warning, resolve_failure_kind(resolved.error()), i,
                   describeError(resolved.error()));
            continue;
        }

        emitter.index = i;
        auto emitted = std::visit(emitter, *resolved);
        if (!emitted) {
            RecordCommandError(result.diagnostics, i, emitted.error());
            continue;
        }
        assembler.addLayout(std::move(*emitted));
    }

    result.script = assembler.finish();
    lb_log("Translated layout into " + std::to_string(assembler.imageCount()) + " images and "
               + std::to_string(assembler.layoutCount()) + " layout commands",
           "Translate", "INFO");
    return result;
}

} // namespace LB
