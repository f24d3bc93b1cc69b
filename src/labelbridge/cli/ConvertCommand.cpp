#include <labelbridge/cli/ConvertCommand.hpp>

#include <labelbridge/Translator.hpp>
#include <labelbridge/cli/CommandLine.hpp>
#include <labelbridge/core/DiagnosticsJson.hpp>
#include <labelbridge/layout/LayoutDocument.hpp>
#include <labelbridge/raster/ImageLoader.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string_view>

namespace LB::CLI {

namespace {

auto ends_with_json(std::string_view path) -> bool {
    constexpr std::string_view kSuffix{".json"};
    if (path.size() < kSuffix.size()) {
        return false;
    }
    auto tail = path.substr(path.size() - kSuffix.size());
    for (std::size_t i = 0; i < kSuffix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(tail[i])) != kSuffix[i]) {
            return false;
        }
    }
    return true;
}

auto read_input(std::string const& input) -> Expected<std::string> {
    std::ostringstream buffer;
    if (input == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream stream(input, std::ios::binary);
    if (!stream) {
        return std::unexpected(Error{Error::Code::IoFailure, "cannot open " + input});
    }
    buffer << stream.rdbuf();
    if (stream.bad()) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed reading " + input});
    }
    return buffer.str();
}

auto write_text(std::string const& text, std::optional<std::filesystem::path> const& output) -> bool {
    if (!output || output->string() == "-") {
        std::cout << text << std::flush;
        return std::cout.good();
    }
    std::ofstream stream(*output, std::ios::binary);
    if (!stream.is_open()) {
        std::cerr << "Failed to open output file '" << output->string() << "'" << std::endl;
        return false;
    }
    stream << text;
    if (!stream.good()) {
        std::cerr << "Failed to write '" << output->string() << "'" << std::endl;
        return false;
    }
    return true;
}

auto default_image_root(ConvertOptions const& options) -> std::filesystem::path {
    if (options.imageRoot) {
        return *options.imageRoot;
    }
    if (options.input != "-") {
        return std::filesystem::path(options.input).parent_path();
    }
    return {};
}

auto translate(ConvertOptions const& options, std::string const& text) -> Expected<TranslationResult> {
    TranslateOptions translate_options;
    translate_options.threshold = options.threshold;
    translate_options.fail_on_decode_error = options.strict;

    if (resolve_mode(options) == InputMode::Layout) {
        auto elements = Layout::parseLayoutDocument(text);
        if (!elements) {
            return std::unexpected(elements.error());
        }
        Raster::FileImageLoader loader{default_image_root(options)};
        return translateLayout(*elements, loader, translate_options);
    }
    return translateZpl(text, translate_options);
}

} // namespace

void print_usage(std::ostream& out) {
    out << "Usage: labelbridge [options] <input>\n"
           "Translates a ZPL script or a JSON label layout into a DPL script.\n"
           "Options:\n"
           "  --mode <zpl|layout>        Input kind (default: layout for .json inputs, zpl otherwise)\n"
           "  --output <file>            Write the DPL script to file instead of stdout\n"
           "  --threshold <0-256>        Ink threshold for image elements (default 128)\n"
           "  --image-root <dir>         Base directory for relative image sources\n"
           "  --diagnostics-json <file>  Write diagnostics as JSON\n"
           "  --strict                   Fail on undecodable graphics and on error diagnostics\n"
           "  --verbose                  Enable logging to stderr\n"
           "  --log-tags <list>          Log only these comma separated tags (implies --verbose)\n"
           "  --help                     Show this message\n"
           "Input '-' reads from stdin.\n";
}

auto parse_convert_options(int argc, char const* const* argv) -> std::optional<ConvertOptions> {
    ConvertOptions options;
    if (char const* root = std::getenv("LABELBRIDGE_IMAGE_ROOT"); root != nullptr && *root != '\0') {
        options.imageRoot = std::filesystem::path(root);
    }
    if (char const* log = std::getenv("LABELBRIDGE_LOG"); log != nullptr) {
        auto setting = parseLogSetting(log);
        options.verbose = setting.enabled;
        options.logTags = std::move(setting.tags);
    }

    CommandLine cli;
    cli.set_program_name("labelbridge");
    cli.set_unknown_argument_handler([&](std::string_view token) {
        if (token.size() > 1 && token.front() == '-') {
            std::cerr << "labelbridge: unknown flag '" << token << "'" << std::endl;
            return false;
        }
        if (!options.input.empty()) {
            std::cerr << "labelbridge: only one input is accepted, got '" << token << "'" << std::endl;
            return false;
        }
        options.input.assign(token.begin(), token.end());
        return true;
    });

    CommandLine::ValueOption modeOption{};
    modeOption.on_value = [&](std::optional<std::string_view> value) -> CommandLine::ParseError {
        if (value == std::string_view{"zpl"}) {
            options.mode = InputMode::Zpl;
        } else if (value == std::string_view{"layout"}) {
            options.mode = InputMode::Layout;
        } else {
            return std::string{"--mode expects zpl or layout"};
        }
        return std::nullopt;
    };
    cli.add_value("--mode", std::move(modeOption));

    auto pathOption = [](std::optional<std::filesystem::path>& target, std::string name) {
        CommandLine::ValueOption option{};
        option.on_value = [&target, name = std::move(name)](std::optional<std::string_view> value) -> CommandLine::ParseError {
            if (!value || value->empty()) {
                return name + " requires a path";
            }
            target = std::filesystem::path(std::string{*value});
            return std::nullopt;
        };
        return option;
    };
    cli.add_value("--output", pathOption(options.outputPath, "--output"));
    cli.add_value("--diagnostics-json", pathOption(options.diagnosticsPath, "--diagnostics-json"));
    cli.add_value("--image-root", pathOption(options.imageRoot, "--image-root"));
    cli.add_alias("-o", "--output");

    cli.add_int("--threshold", {.on_value = [&](int value) -> CommandLine::ParseError {
                    if (value < 0 || value > 256) {
                        return std::string{"--threshold must be within 0..256"};
                    }
                    options.threshold = value;
                    return std::nullopt;
                }});

    cli.add_flag("--strict", {.on_set = [&] { options.strict = true; }});
    cli.add_flag("--verbose", {.on_set = [&] { options.verbose = true; }});

    CommandLine::ValueOption tagsOption{};
    tagsOption.on_value = [&](std::optional<std::string_view> value) -> CommandLine::ParseError {
        auto setting = parseLogSetting(value.value_or(std::string_view{}));
        if (!setting.enabled || setting.tags.empty()) {
            return std::string{"--log-tags expects a comma separated tag list"};
        }
        options.verbose = true;
        options.logTags = std::move(setting.tags);
        return std::nullopt;
    };
    cli.add_value("--log-tags", std::move(tagsOption));
    cli.add_flag("--help", {.on_set = [&] { options.showHelp = true; }});
    cli.add_alias("-h", "--help");

    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    if (!options.showHelp && options.input.empty()) {
        std::cerr << "labelbridge: missing input" << std::endl;
        return std::nullopt;
    }
    return options;
}

auto resolve_mode(ConvertOptions const& options) -> InputMode {
    if (options.mode != InputMode::Auto) {
        return options.mode;
    }
    return ends_with_json(options.input) ? InputMode::Layout : InputMode::Zpl;
}

auto run_convert(ConvertOptions const& options) -> int {
    if (options.showHelp) {
        print_usage(std::cout);
        return 0;
    }
#ifdef LB_LOG_DEBUG
    set_thread_name("Main");
    configure_logging({.enabled = options.verbose, .tags = options.logTags});
#endif

    auto text = read_input(options.input);
    if (!text) {
        std::cerr << "labelbridge: " << describeError(text.error()) << std::endl;
        return 1;
    }

    auto result = translate(options, *text);
    if (!result) {
        std::cerr << "labelbridge: " << describeError(result.error()) << std::endl;
        return 1;
    }

    for (auto const& diagnostic : result->diagnostics) {
        std::cerr << "labelbridge: " << describeDiagnostic(diagnostic) << '\n';
    }
    if (options.diagnosticsPath) {
        if (!write_text(diagnostics_to_json(result->diagnostics).dump(2) + "\n", options.diagnosticsPath)) {
            return 1;
        }
    }
    if (!write_text(result->script, options.outputPath)) {
        return 1;
    }
    if (options.strict && hasErrors(result->diagnostics)) {
        return 2;
    }
    return 0;
}

} // namespace LB::CLI
