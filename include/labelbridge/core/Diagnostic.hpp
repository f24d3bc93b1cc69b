#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace LB {

// Non-fatal finding recorded while translating a label. The translation keeps
// going after every diagnostic; callers decide whether any of them is fatal.
struct Diagnostic {
    enum class Severity {
        Warning,
        Error
    };

    enum class Kind {
        DecodeFailure,
        ResourceFailure,
        MissingLabelBlock,
        UnresolvedReference,
        PositionOutOfRange,
        MalformedCommand,
        UnsupportedElement,
        Cancelled
    };

    Severity    severity = Severity::Warning;
    Kind        kind     = Kind::MalformedCommand;
    std::size_t index    = 0; // source offset (text path) or element index (layout path)
    std::string message;
};

using Diagnostics = std::vector<Diagnostic>;

[[nodiscard]] auto diagnosticKindToString(Diagnostic::Kind kind) -> std::string_view;
[[nodiscard]] auto severityToString(Diagnostic::Severity severity) -> std::string_view;
[[nodiscard]] auto describeDiagnostic(Diagnostic const& diagnostic) -> std::string;
[[nodiscard]] auto hasErrors(Diagnostics const& diagnostics) -> bool;

} // namespace LB
