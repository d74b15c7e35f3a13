#pragma once

#include "cli/cli_options.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <iosfwd>
#include <string>

namespace promptsan {

class PromptSanitizer;

/**
 * @brief File-to-file sanitization driven by the command line
 *
 * Checks that the input exists and that the output may be written, reads
 * and validates the input as UTF-8, sanitizes it, writes the result, and
 * prints progress to the supplied stream.
 */
class SanitizeCommand {
public:
    struct Settings {
        std::string input_path;
        std::string output_path;
        bool verbose = false;
        bool force = false;
        size_t max_input_bytes = InputConfig{}.max_bytes;
    };

    /**
     * @brief Merge command-line flags over config file values
     */
    [[nodiscard]] static Settings resolve(const CliOptions& options, const SanitizerConfig& config);

    SanitizeCommand(Settings settings, const PromptSanitizer& sanitizer, std::ostream& out);

    /**
     * @brief Run the command
     * @return Report for the written text, or the failure category and message
     */
    [[nodiscard]] Result<SanitizeReport> run() const;

    [[nodiscard]] const Settings& settings() const { return settings_; }

private:
    [[nodiscard]] Result<std::string> read_input() const;
    [[nodiscard]] Result<bool> write_output(const std::string& content) const;
    void print_changes(const std::string& original, const SanitizeReport& report) const;

    Settings settings_;
    const PromptSanitizer& sanitizer_;
    std::ostream& out_;
};

/**
 * @brief Process exit status for a command-line failure category
 */
[[nodiscard]] int exit_code_for(ErrorCategory category);

} // namespace promptsan
