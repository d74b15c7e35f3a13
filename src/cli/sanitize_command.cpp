#include "cli/sanitize_command.hpp"
#include "sanitizer/prompt_sanitizer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <ostream>
#include <system_error>

namespace promptsan {

namespace fs = std::filesystem;

SanitizeCommand::Settings SanitizeCommand::resolve(const CliOptions& options,
                                                   const SanitizerConfig& config) {
    Settings settings;
    settings.input_path = options.input_path;
    settings.output_path = options.output_path;
    settings.verbose = options.verbose.value_or(config.cli.verbose);
    settings.force = options.force.value_or(config.cli.force);
    settings.max_input_bytes = config.input.max_bytes;
    return settings;
}

SanitizeCommand::SanitizeCommand(Settings settings, const PromptSanitizer& sanitizer,
                                 std::ostream& out)
    : settings_(std::move(settings)), sanitizer_(sanitizer), out_(out) {}

Result<SanitizeReport> SanitizeCommand::run() const {
    std::error_code ec;
    if (!fs::exists(settings_.input_path, ec)) {
        return Result<SanitizeReport>::error(ErrorCategory::INPUT_MISSING,
            std::format("Input file does not exist: {}", settings_.input_path));
    }

    if (fs::exists(settings_.output_path, ec) && !settings_.force) {
        return Result<SanitizeReport>::error(ErrorCategory::OUTPUT_EXISTS,
            std::format("Output file already exists: {}. Use --force to overwrite.",
                        settings_.output_path));
    }

    auto input = read_input();
    if (input.is_error()) {
        return Result<SanitizeReport>::error(input.error_category(), input.error_message());
    }
    const std::string& original = input.value();

    if (settings_.verbose) {
        out_ << std::format("Read {} characters from input file\n", original.size());
    }

    utils::Timer timer;
    auto report = sanitizer_.analyze(original);
    utils::log::info(std::format("Sanitized {} bytes in {}us ({} replacements)",
        original.size(), timer.elapsed_us().count(), report.total_replacements));

    if (settings_.verbose) {
        print_changes(original, report);
    }

    const auto written = write_output(report.text);
    if (written.is_error()) {
        return Result<SanitizeReport>::error(written.error_category(), written.error_message());
    }

    out_ << std::format("Successfully sanitized prompt from '{}' to '{}'\n",
                        settings_.input_path, settings_.output_path);
    return Result<SanitizeReport>::ok(std::move(report));
}

Result<std::string> SanitizeCommand::read_input() const {
    const auto fail = [this](std::string_view reason) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("Failed to read input file: {}: {}", settings_.input_path, reason));
    };

    std::error_code ec;
    const auto size = fs::file_size(settings_.input_path, ec);
    if (ec) {
        return fail(ec.message());
    }
    if (size > settings_.max_input_bytes) {
        return fail(std::format("file is {} bytes, limit is {}", size, settings_.max_input_bytes));
    }

    std::ifstream file(settings_.input_path, std::ios::binary);
    if (!file.is_open()) {
        return fail("cannot open file");
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return fail("read error");
    }
    if (!utils::is_valid_utf8(content)) {
        return fail("stream did not contain valid UTF-8");
    }
    return Result<std::string>::ok(std::move(content));
}

Result<bool> SanitizeCommand::write_output(const std::string& content) const {
    std::ofstream file(settings_.output_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Result<bool>::error(ErrorCategory::IO_ERROR,
            std::format("Failed to write output file: {}", settings_.output_path));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
        return Result<bool>::error(ErrorCategory::IO_ERROR,
            std::format("Failed to write output file: {}", settings_.output_path));
    }
    return Result<bool>::ok(true);
}

void SanitizeCommand::print_changes(const std::string& original,
                                    const SanitizeReport& report) const {
    // Counts markers in the output, including any present in the input
    const size_t filtered = utils::count_occurrences(report.text, kFilteredMarker);
    if (filtered == 0) {
        out_ << "No malicious patterns detected - input is clean\n";
        return;
    }

    out_ << std::format("Filtered {} potentially malicious patterns\n", filtered);
    for (const auto& entry : report.categories) {
        if (entry.replacements > 0) {
            out_ << std::format("  {}: {}\n", category_to_string(entry.category),
                                entry.replacements);
        }
    }

    if (original == report.text) return;

    out_ << "\n--- Changes Made ---\n";
    out_ << std::format("Original length: {} chars\n", original.size());
    out_ << std::format("Sanitized length: {} chars\n", report.text.size());

    const auto original_lines = utils::split_lines(original);
    const auto sanitized_lines = utils::split_lines(report.text);
    const size_t common = std::min(original_lines.size(), sanitized_lines.size());
    for (size_t i = 0; i < common; ++i) {
        if (original_lines[i] != sanitized_lines[i]) {
            out_ << std::format("Line {}: '{}' -> '{}'\n",
                                i + 1, original_lines[i], sanitized_lines[i]);
        }
    }
}

int exit_code_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:           return 0;
        case ErrorCategory::USAGE_ERROR:    return 2;
        case ErrorCategory::INPUT_MISSING:  return 3;
        case ErrorCategory::OUTPUT_EXISTS:  return 4;
        case ErrorCategory::IO_ERROR:       return 5;
        case ErrorCategory::CONFIG_ERROR:   return 6;
        case ErrorCategory::INTERNAL_ERROR: return 1;
    }
    return 1;
}

} // namespace promptsan
