#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>
#include <vector>

namespace promptsan {

inline constexpr const char* kProgramName = "prompt_sanitizer";
inline constexpr const char* kProgramVersion = "0.1.0";

/**
 * @brief Parsed command line
 *
 * verbose/force are optional so that values from the config file apply
 * unless the flag was given explicitly.
 */
struct CliOptions {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<bool> verbose;
    std::optional<bool> force;
    bool show_help = false;
    bool show_version = false;
};

/**
 * @brief Parse argv (excluding argv[0])
 *
 * Accepts -i/--input, -o/--output, -c/--config (value as the next argument
 * or --name=value), -v/--verbose, -f/--force, -h/--help, -V/--version.
 * --help and --version skip the required-argument check.
 */
[[nodiscard]] Result<CliOptions> parse_cli_options(const std::vector<std::string>& args);

[[nodiscard]] std::string usage_text();

} // namespace promptsan
