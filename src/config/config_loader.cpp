#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace sqlmigrator {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to "".
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

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

} // anonymous namespace

// ============================================================================
// Section extraction
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    return cfg;
}

InputConfig ConfigLoader::extract_input(const toml::table& root) {
    InputConfig cfg;
    const auto* input = root["input"].as_table();
    if (!input) return cfg;
    const auto& in = *input;

    cfg.mappings_file = in["mappings_file"].value_or(cfg.mappings_file);
    cfg.queries_file = in["queries_file"].value_or(cfg.queries_file);
    return cfg;
}

MigrationConfig ConfigLoader::extract_migration(const toml::table& root) {
    MigrationConfig cfg;
    const auto* migration = root["migration"].as_table();
    if (!migration) return cfg;
    const auto& m = *migration;

    cfg.workers = m["workers"].value_or(cfg.workers);
    cfg.fallback_enabled = m["fallback_enabled"].value_or(cfg.fallback_enabled);
    return cfg;
}

ReportConfig ConfigLoader::extract_report(const toml::table& root) {
    ReportConfig cfg;
    const auto* report = root["report"].as_table();
    if (!report) return cfg;
    const auto& r = *report;

    cfg.output_dir = r["output_dir"].value_or(cfg.output_dir);
    cfg.file_name = r["file_name"].value_or(cfg.file_name);
    cfg.impacted_only = r["impacted_only"].value_or(cfg.impacted_only);
    return cfg;
}

MigratorConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    MigratorConfig config;
    config.logging = extract_logging(root);
    config.input = extract_input(root);
    config.migration = extract_migration(root);
    config.report = extract_report(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(MigratorConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const MigratorConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got '{}'", config.logging.level));
    }

    if (config.input.mappings_file.empty()) {
        errors.push_back("input.mappings_file must not be empty");
    }
    if (config.input.queries_file.empty()) {
        errors.push_back("input.queries_file must not be empty");
    }

    if (!utils::in_range<1, 64>(config.migration.workers)) {
        errors.push_back(std::format("migration.workers must be 1-64, got {}", config.migration.workers));
    }

    if (config.report.output_dir.empty()) {
        errors.push_back("report.output_dir must not be empty");
    }
    if (config.report.file_name.empty()) {
        errors.push_back("report.file_name must not be empty");
    }

    return errors;
}

} // namespace sqlmigrator
