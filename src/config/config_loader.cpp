#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iterator>
#include <stdexcept>

using namespace std::string_literals;

namespace promptsan {

// Constexpr config keys
static constexpr std::string_view kLogging  = "logging";
static constexpr std::string_view kCli      = "cli";
static constexpr std::string_view kInput    = "input";
static constexpr std::string_view kLevel    = "level";
static constexpr std::string_view kVerbose  = "verbose";
static constexpr std::string_view kForce    = "force";
static constexpr std::string_view kMaxBytes = "max_bytes";

// ============================================================================
// TOML Parsing Helpers (env expansion, typed reads)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

// ---- Typed reads (present-but-wrong-type is an error) ----------------------
// String values are env-expanded as they are read.

bool read_bool(const toml::table& tbl, std::string_view section,
               std::string_view key, bool fallback) {
    const auto node = tbl[key];
    if (!node) return fallback;
    if (const auto v = node.value<bool>()) return *v;
    throw std::invalid_argument(
        std::format("[{}] {} must be a boolean", section, key));
}

std::string read_string(const toml::table& tbl, std::string_view section,
                        std::string_view key, const std::string& fallback) {
    const auto node = tbl[key];
    if (!node) return fallback;
    if (const auto* s = node.as_string()) return expand_env_vars(s->get());
    throw std::invalid_argument(
        std::format("[{}] {} must be a string", section, key));
}

int64_t read_int(const toml::table& tbl, std::string_view section,
                 std::string_view key, int64_t fallback) {
    const auto node = tbl[key];
    if (!node) return fallback;
    if (const auto* i = node.as_integer()) return i->get();
    throw std::invalid_argument(
        std::format("[{}] {} must be an integer", section, key));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open config file: {}", config_path));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    auto result = load_from_string(buffer);
    if (!result.success) {
        result.error_message = std::format("{}: {}", config_path, result.error_message);
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto root = toml::parse(toml_content);
        return LoadResult::ok(extract(root));
    } catch (const toml::parse_error& e) {
        const auto& src = e.source();
        return LoadResult::error(std::format("TOML parse error at line {}, column {}: {}",
            src.begin.line, src.begin.column, e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(e.what());
    }
}

// ---- Section extractors ----------------------------------------------------

SanitizerConfig ConfigLoader::extract(const toml::table& root) {
    SanitizerConfig cfg;
    cfg.logging = extract_logging(root);
    cfg.cli = extract_cli(root);
    cfg.input = extract_input(root);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root[kLogging].as_table();
    if (!logging) return cfg;

    const std::string level_str = read_string(*logging, kLogging, kLevel, "warn"s);
    const auto level = utils::log::parse_level(level_str);
    if (!level) {
        throw std::invalid_argument(
            std::format("[logging] level must be one of info, warn, error (got '{}')", level_str));
    }
    cfg.level = *level;
    return cfg;
}

CliDefaultsConfig ConfigLoader::extract_cli(const toml::table& root) {
    CliDefaultsConfig cfg;
    const auto* cli = root[kCli].as_table();
    if (!cli) return cfg;

    cfg.verbose = read_bool(*cli, kCli, kVerbose, cfg.verbose);
    cfg.force = read_bool(*cli, kCli, kForce, cfg.force);
    return cfg;
}

InputConfig ConfigLoader::extract_input(const toml::table& root) {
    InputConfig cfg;
    const auto* input = root[kInput].as_table();
    if (!input) return cfg;

    const int64_t max_bytes = read_int(*input, kInput, kMaxBytes,
                                       static_cast<int64_t>(cfg.max_bytes));
    if (max_bytes <= 0) {
        throw std::invalid_argument("[input] max_bytes must be positive");
    }
    cfg.max_bytes = static_cast<size_t>(max_bytes);
    return cfg;
}

} // namespace promptsan
