#pragma once

#include <labelbridge/core/Diagnostic.hpp>

#include <nlohmann/json.hpp>

namespace LB {

inline auto diagnostic_to_json(Diagnostic const& diagnostic) -> nlohmann::json {
    return nlohmann::json{{"severity", severityToString(diagnostic.severity)},
                          {"kind", diagnosticKindToString(diagnostic.kind)},
                          {"index", diagnostic.index},
                          {"message", diagnostic.message}};
}

inline auto diagnostics_to_json(Diagnostics const& diagnostics) -> nlohmann::json {
    auto list = nlohmann::json::array();
    std::size_t errors = 0;
    for (auto const& diagnostic : diagnostics) {
        list.push_back(diagnostic_to_json(diagnostic));
        if (diagnostic.severity == Diagnostic::Severity::Error) {
            ++errors;
        }
    }
    return nlohmann::json{{"total", diagnostics.size()},
                          {"errors", errors},
                          {"warnings", diagnostics.size() - errors},
                          {"diagnostics", std::move(list)}};
}

} // namespace LB
