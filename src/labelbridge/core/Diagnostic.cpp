#include <labelbridge/core/Diagnostic.hpp>

#include <algorithm>

namespace LB {

auto diagnosticKindToString(Diagnostic::Kind kind) -> std::string_view {
    switch (kind) {
    case Diagnostic::Kind::DecodeFailure:
        return "decode_failure";
    case Diagnostic::Kind::ResourceFailure:
        return "resource_failure";
    case Diagnostic::Kind::MissingLabelBlock:
        return "missing_label_block";
    case Diagnostic::Kind::UnresolvedReference:
        return "unresolved_reference";
    case Diagnostic::Kind::PositionOutOfRange:
        return "position_out_of_range";
    case Diagnostic::Kind::MalformedCommand:
        return "malformed_command";
    case Diagnostic::Kind::UnsupportedElement:
        return "unsupported_element";
    case Diagnostic::Kind::Cancelled:
        return "cancelled";
    }
    return "malformed_command";
}

auto severityToString(Diagnostic::Severity severity) -> std::string_view {
    switch (severity) {
    case Diagnostic::Severity::Warning:
        return "warning";
    case Diagnostic::Severity::Error:
        return "error";
    }
    return "warning";
}

auto describeDiagnostic(Diagnostic const& diagnostic) -> std::string {
    std::string text;
    auto const severity = severityToString(diagnostic.severity);
    auto const kind     = diagnosticKindToString(diagnostic.kind);
    text.append(severity.data(), severity.size());
    text.push_back('[');
    text.append(kind.data(), kind.size());
    text.append("]@");
    text.append(std::to_string(diagnostic.index));
    if (!diagnostic.message.empty()) {
        text.append(": ");
        text.append(diagnostic.message);
    }
    return text;
}

auto hasErrors(Diagnostics const& diagnostics) -> bool {
    return std::any_of(diagnostics.begin(), diagnostics.end(), [](Diagnostic const& d) {
        return d.severity == Diagnostic::Severity::Error;
    });
}

} // namespace LB
