#pragma once

#include "core/utils.hpp"

#include <toml.hpp>

#include <cstddef>
#include <string>
#include <utility>

namespace promptsan {

// ============================================================================
// Config sections (mirror the TOML layout)
// ============================================================================

struct LoggingConfig {
    utils::log::Level level = utils::log::Level::WARN;
};

struct CliDefaultsConfig {
    bool verbose = false;
    bool force = false;
};

struct InputConfig {
    size_t max_bytes = 10 * 1024 * 1024;
};

struct SanitizerConfig {
    LoggingConfig logging;
    CliDefaultsConfig cli;
    InputConfig input;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads the command-line tool configuration
 *
 * Recognised layout:
 *   [logging] level = "info" | "warn" | "error" (default "warn")
 *   [cli]     verbose = bool, force = bool
 *   [input]   max_bytes = positive integer
 *
 * String values are ${VAR}-expanded when read. Missing sections and
 * keys keep their defaults. The pattern rule set is not configurable.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        SanitizerConfig config;

        static LoadResult ok(SanitizerConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

private:
    static SanitizerConfig extract(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static CliDefaultsConfig extract_cli(const toml::table& root);
    static InputConfig extract_input(const toml::table& root);
};

} // namespace promptsan
