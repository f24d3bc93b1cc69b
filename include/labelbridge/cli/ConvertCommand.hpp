#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <set>
#include <string>

namespace LB::CLI {

enum class InputMode {
    Auto,
    Zpl,
    Layout
};

struct ConvertOptions {
    std::string                          input; // "-" reads stdin
    InputMode                            mode = InputMode::Auto;
    std::optional<std::filesystem::path> outputPath;
    std::optional<std::filesystem::path> diagnosticsPath;
    std::optional<std::filesystem::path> imageRoot;
    int                                  threshold = 128;
    bool                                 strict = false;
    bool                                 verbose = false;
    std::set<std::string>                logTags; // empty: every tag
    bool                                 showHelp = false;
};

void print_usage(std::ostream& out);

// Falls back to LABELBRIDGE_IMAGE_ROOT and LABELBRIDGE_LOG for values not given
// on the command line. Returns nullopt after reporting a usage error.
[[nodiscard]] auto parse_convert_options(int argc, char const* const* argv) -> std::optional<ConvertOptions>;

// Layout when the mode says so or the input ends in .json.
[[nodiscard]] auto resolve_mode(ConvertOptions const& options) -> InputMode;

// 0 success, 1 hard failure, 2 strict mode with error diagnostics.
[[nodiscard]] auto run_convert(ConvertOptions const& options) -> int;

} // namespace LB::CLI
