#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace promptsan;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "prompt_sanitizer_test_config") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

} // namespace

// ============================================================================
// Defaults
// ============================================================================

TEST_CASE("Config: empty document yields defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == utils::log::Level::WARN);
    CHECK_FALSE(result.config.cli.verbose);
    CHECK_FALSE(result.config.cli.force);
    CHECK(result.config.input.max_bytes == 10u * 1024u * 1024u);
}

TEST_CASE("Config: unknown sections are ignored", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[server]
port = 8080
)");
    REQUIRE(result.success);
    CHECK(result.config.input.max_bytes == InputConfig{}.max_bytes);
}

// ============================================================================
// Values
// ============================================================================

TEST_CASE("Config: all sections parsed", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "info"

[cli]
verbose = true
force = true

[input]
max_bytes = 4096
)");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == utils::log::Level::INFO);
    CHECK(result.config.cli.verbose);
    CHECK(result.config.cli.force);
    CHECK(result.config.input.max_bytes == 4096);
}

TEST_CASE("Config: env vars are expanded in strings", "[config][env]") {
    ::setenv("PROMPT_SANITIZER_TEST_LEVEL", "error", 1);
    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "${PROMPT_SANITIZER_TEST_LEVEL}"
)");
    ::unsetenv("PROMPT_SANITIZER_TEST_LEVEL");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == utils::log::Level::ERROR);
}

TEST_CASE("Config: only keys that are read are env-expanded", "[config][env]") {
    // An unterminated substitution outside the schema is never looked at
    const auto result = ConfigLoader::load_from_string(R"(
[server]
host = "${OOPS"

[logging]
level = "info"
)");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == utils::log::Level::INFO);
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("Config: unknown log level is rejected", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "debug"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("level") != std::string::npos);
}

TEST_CASE("Config: wrong value types are rejected", "[config][validation]") {
    CHECK_FALSE(ConfigLoader::load_from_string("[cli]\nverbose = \"yes\"\n").success);
    CHECK_FALSE(ConfigLoader::load_from_string("[input]\nmax_bytes = \"big\"\n").success);
    CHECK_FALSE(ConfigLoader::load_from_string("[logging]\nlevel = 3\n").success);
}

TEST_CASE("Config: non-positive max_bytes is rejected", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string("[input]\nmax_bytes = 0\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("max_bytes") != std::string::npos);
}

TEST_CASE("Config: unclosed env substitution is rejected", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"${OOPS\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

TEST_CASE("Config: malformed TOML reports a parse error", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string("[logging\nlevel = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("TOML parse error") != std::string::npos);
}

// ============================================================================
// Files
// ============================================================================

TEST_CASE("Config: load from file", "[config][file]") {
    TmpDir tmp;
    const auto path = tmp.file("sanitizer.toml", R"(
[cli]
force = true
)");
    const auto result = ConfigLoader::load_from_file(path);
    REQUIRE(result.success);
    CHECK(result.config.cli.force);
    CHECK_FALSE(result.config.cli.verbose);
}

TEST_CASE("Config: missing file is an error", "[config][file]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/prompt_sanitizer.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Cannot open config file") != std::string::npos);
}

TEST_CASE("Config: file errors are prefixed with the path", "[config][file]") {
    TmpDir tmp;
    const auto path = tmp.file("bad.toml", "[input]\nmax_bytes = -1\n");
    const auto result = ConfigLoader::load_from_file(path);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with(path));
}
