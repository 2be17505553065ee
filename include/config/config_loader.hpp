#pragma once

#include <toml++/toml.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace sqlmigrator {

// ============================================================================
// Config sections (mirror the TOML hierarchy of migrator.toml)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct InputConfig {
    std::string mappings_file = "data/mappings.json";
    std::string queries_file = "data/queries.json";
};

struct MigrationConfig {
    int64_t workers = 1;
    bool fallback_enabled = true;
};

struct ReportConfig {
    std::string output_dir = "reports";
    std::string file_name = "impacted_queries.json";
    bool impacted_only = true;
};

struct MigratorConfig {
    LoggingConfig logging;
    InputConfig input;
    MigrationConfig migration;
    ReportConfig report;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        MigratorConfig config;

        static LoadResult ok(MigratorConfig cfg) {
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
     * @param config_path Path to migrator.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Every validation error of a config (empty when valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const MigratorConfig& config);

private:
    static MigratorConfig extract_all_sections(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static InputConfig extract_input(const toml::table& root);
    static MigrationConfig extract_migration(const toml::table& root);
    static ReportConfig extract_report(const toml::table& root);

    static LoadResult validate_and_return(MigratorConfig config);
};

} // namespace sqlmigrator
