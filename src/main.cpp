#include "cli/cli_options.hpp"
#include "cli/sanitize_command.hpp"
#include "config/config_loader.hpp"
#include "sanitizer/pattern_tables.hpp"
#include "sanitizer/prompt_sanitizer.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>
#include <iostream>
#include <string>
#include <vector>

using namespace promptsan;

int main(int argc, char* argv[]) {
    try {
        const std::vector<std::string> args(argv + 1, argv + argc);

        auto parsed = parse_cli_options(args);
        if (parsed.is_error()) {
            utils::log::error(parsed.error_message());
            std::cerr << usage_text();
            return exit_code_for(parsed.error_category());
        }
        const CliOptions& options = parsed.value();

        if (options.show_help) {
            std::cout << usage_text();
            return 0;
        }
        if (options.show_version) {
            std::cout << std::format("{} {}\n", kProgramName, kProgramVersion);
            return 0;
        }

        // Configuration (optional)
        SanitizerConfig config;
        if (options.config_path) {
            auto loaded = ConfigLoader::load_from_file(*options.config_path);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return exit_code_for(ErrorCategory::CONFIG_ERROR);
            }
            config = std::move(loaded.config);
        }
        utils::log::set_level(config.logging.level);

        const auto& sanitizer = PromptSanitizer::instance();
        utils::log::info(std::format("Sanitizer ready: {} categories, {} rules ({} skipped)",
            sanitizer.filters().size(), total_pattern_count(), sanitizer.skipped_rule_count()));

        SanitizeCommand command(SanitizeCommand::resolve(options, config), sanitizer, std::cout);
        const auto result = command.run();
        if (result.is_error()) {
            utils::log::error(result.error_message());
            return exit_code_for(result.error_category());
        }
        return 0;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return exit_code_for(ErrorCategory::INTERNAL_ERROR);
    }
}
