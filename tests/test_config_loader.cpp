#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace sqlmigrator;

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.migration.workers == 1);
    CHECK(result.config.migration.fallback_enabled);
    CHECK(result.config.report.output_dir == "reports");
    CHECK(result.config.report.file_name == "impacted_queries.json");
    CHECK(result.config.report.impacted_only);
}

TEST_CASE("ConfigLoader: all sections are read", "[config]") {
    const std::string toml = R"(
[logging]
level = "debug"

[input]
mappings_file = "in/map.json"
queries_file = "in/q.json"

[migration]
workers = 8
fallback_enabled = false

[report]
output_dir = "out"
file_name = "report.json"
impacted_only = false
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.input.mappings_file == "in/map.json");
    CHECK(cfg.input.queries_file == "in/q.json");
    CHECK(cfg.migration.workers == 8);
    CHECK_FALSE(cfg.migration.fallback_enabled);
    CHECK(cfg.report.output_dir == "out");
    CHECK(cfg.report.file_name == "report.json");
    CHECK_FALSE(cfg.report.impacted_only);
}

TEST_CASE("ConfigValidation: worker count out of range fails", "[config][validation]") {
    auto zero = ConfigLoader::load_from_string("[migration]\nworkers = 0\n");
    CHECK_FALSE(zero.success);
    CHECK(zero.error_message.find("migration.workers") != std::string::npos);

    auto many = ConfigLoader::load_from_string("[migration]\nworkers = 65\n");
    CHECK_FALSE(many.success);
}

TEST_CASE("ConfigValidation: unknown log level fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"verbose\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigValidation: every violation is reported", "[config][validation]") {
    const std::string toml = R"(
[input]
mappings_file = ""

[report]
file_name = ""
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Config validation failed:") == 0);
    CHECK(result.error_message.find("input.mappings_file") != std::string::npos);
    CHECK(result.error_message.find("report.file_name") != std::string::npos);
}

TEST_CASE("ConfigLoader: environment variables are expanded", "[config][env]") {
    ::setenv("SQLMIGRATOR_TEST_DIR", "/tmp/migrator", 1);
    auto result = ConfigLoader::load_from_string(
        "[report]\noutput_dir = \"${SQLMIGRATOR_TEST_DIR}/reports\"\n");
    REQUIRE(result.success);
    CHECK(result.config.report.output_dir == "/tmp/migrator/reports");
    ::unsetenv("SQLMIGRATOR_TEST_DIR");
}

TEST_CASE("ConfigLoader: unclosed substitution is an error", "[config][env]") {
    auto result = ConfigLoader::load_from_string("[report]\noutput_dir = \"${BROKEN\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed env var substitution") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML is an error", "[config]") {
    auto result = ConfigLoader::load_from_string("[logging\nlevel = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") == 0);
}

TEST_CASE("ConfigLoader: missing file is an error", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/migrator.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") == 0);
}
