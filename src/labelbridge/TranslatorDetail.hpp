#pragma once

#include <labelbridge/Translator.hpp>
#include <labelbridge/core/Diagnostic.hpp>
#include <labelbridge/core/Error.hpp>

#include "log/TaggedLogger.hpp"

#include <string>

namespace LB::TranslatorDetail {

inline void Record(Diagnostics& diagnostics,
                   Diagnostic::Severity severity,
                   Diagnostic::Kind kind,
                   std::size_t index,
                   std::string message) {
    Diagnostic diagnostic{severity, kind, index, std::move(message)};
    lb_log(describeDiagnostic(diagnostic), "Translate", severity == Diagnostic::Severity::Error ? "ERROR" : "WARN");
    diagnostics.push_back(std::move(diagnostic));
}

// Command level failures: positions that do not fit the field become
// PositionOutOfRange, everything else MalformedCommand.
inline void RecordCommandError(Diagnostics& diagnostics, std::size_t index, Error const& error) {
    auto const kind = error.code == Error::Code::OutOfRange ? Diagnostic::Kind::PositionOutOfRange
                                                            : Diagnostic::Kind::MalformedCommand;
    Record(diagnostics, Diagnostic::Severity::Warning, kind, index, describeError(error));
}

inline auto ValidateOptions(TranslateOptions const& options) -> Expected<void> {
    if (options.threshold < 0 || options.threshold > 256) {
        return std::unexpected(Error{Error::Code::InvalidArgument,
                                     "threshold " + std::to_string(options.threshold) + " outside 0..256"});
    }
    return {};
}

} // namespace LB::TranslatorDetail
