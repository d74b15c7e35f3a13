#include "cli/cli_options.hpp"

#include <format>
#include <string_view>

namespace promptsan {

namespace {

enum class ValueOption { INPUT, OUTPUT, CONFIG };

std::optional<ValueOption> value_option(std::string_view name) {
    if (name == "-i" || name == "--input") return ValueOption::INPUT;
    if (name == "-o" || name == "--output") return ValueOption::OUTPUT;
    if (name == "-c" || name == "--config") return ValueOption::CONFIG;
    return std::nullopt;
}

void assign(CliOptions& opts, ValueOption which, std::string value) {
    switch (which) {
        case ValueOption::INPUT:  opts.input_path = std::move(value); break;
        case ValueOption::OUTPUT: opts.output_path = std::move(value); break;
        case ValueOption::CONFIG: opts.config_path = std::move(value); break;
    }
}

} // anonymous namespace

Result<CliOptions> parse_cli_options(const std::vector<std::string>& args) {
    CliOptions opts;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
            continue;
        }
        if (arg == "-V" || arg == "--version") {
            opts.show_version = true;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
            continue;
        }
        if (arg == "-f" || arg == "--force") {
            opts.force = true;
            continue;
        }

        // --name=value
        if (arg.starts_with("--")) {
            const size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                const auto which = value_option(std::string_view(arg).substr(0, eq));
                if (!which) {
                    return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
                        std::format("Unknown option: {}", arg.substr(0, eq)));
                }
                const std::string value = arg.substr(eq + 1);
                if (value.empty()) {
                    return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
                        std::format("Option {} requires a value", arg.substr(0, eq)));
                }
                assign(opts, *which, value);
                continue;
            }
        }

        if (const auto which = value_option(arg)) {
            if (i + 1 >= args.size()) {
                return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
                    std::format("Option {} requires a value", arg));
            }
            assign(opts, *which, args[++i]);
            continue;
        }

        if (arg.starts_with("-")) {
            return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
                std::format("Unknown option: {}", arg));
        }
        return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
            std::format("Unexpected argument: {}", arg));
    }

    if (opts.show_help || opts.show_version) {
        return Result<CliOptions>::ok(std::move(opts));
    }

    if (opts.input_path.empty()) {
        return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
            "Missing required option --input <INPUT_FILE>");
    }
    if (opts.output_path.empty()) {
        return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
            "Missing required option --output <OUTPUT_FILE>");
    }

    return Result<CliOptions>::ok(std::move(opts));
}

std::string usage_text() {
    return std::format(
        "A command-line utility for sanitizing LLM prompts against prompt injection patterns\n"
        "\n"
        "Usage: {} --input <INPUT_FILE> --output <OUTPUT_FILE> [OPTIONS]\n"
        "\n"
        "Options:\n"
        "  -i, --input <INPUT_FILE>    Path to the input file containing the prompt to sanitize\n"
        "  -o, --output <OUTPUT_FILE>  Path to the output file where the sanitized prompt is written\n"
        "  -c, --config <CONFIG_FILE>  Optional TOML configuration file\n"
        "  -v, --verbose               Show detailed information about what was filtered\n"
        "  -f, --force                 Overwrite output file if it exists\n"
        "  -h, --help                  Print help\n"
        "  -V, --version               Print version\n",
        kProgramName);
}

} // namespace promptsan
