#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "io/batch_loader.hpp"
#include "migration/migration_orchestrator.hpp"
#include "report/report_generator.hpp"

#include <cstdlib>
#include <format>
#include <iostream>

using namespace sqlmigrator;

namespace {

int fail(const std::string& error) {
    utils::log::error(error);
    RunSummary summary;
    summary.message = "Migration failed.";
    summary.error = error;
    std::cout << summary.to_json() << std::endl;
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_file = "config/migrator.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            return fail(config_result.error_message);
        }
        const MigratorConfig& config = config_result.config;

        if (auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::info("[2/4] Loading mappings and queries");
        auto mappings = BatchLoader::load_mappings(config.input.mappings_file);
        if (mappings.is_error()) {
            return fail(std::format("Failed to load mappings ({}): {}",
                error_category_name(mappings.error_category()), mappings.error_message()));
        }
        auto queries = BatchLoader::load_queries(config.input.queries_file);
        if (queries.is_error()) {
            return fail(std::format("Failed to load queries ({}): {}",
                error_category_name(queries.error_category()), queries.error_message()));
        }

        utils::log::info("[3/4] Migrating queries");
        MigrationOptions options;
        options.workers = static_cast<size_t>(config.migration.workers);
        options.fallback_enabled = config.migration.fallback_enabled;

        const MigrationOrchestrator orchestrator(mappings.value(), options);
        std::vector<QueryRecord> records = queries.take();
        const BatchSummary batch = orchestrator.migrate(records);

        if (batch.fallback > 0 || batch.failed > 0) {
            utils::log::info(std::format("{} structural, {} by text rewrite, {} failed",
                batch.structural, batch.fallback, batch.failed));
        }

        utils::log::info("[4/4] Writing report");
        ReportOptions report_options;
        report_options.output_dir = config.report.output_dir;
        report_options.file_name = config.report.file_name;
        report_options.impacted_only = config.report.impacted_only;

        const ReportGenerator generator(std::move(report_options));
        const RunSummary summary = generator.write(records, batch);
        std::cout << summary.to_json() << std::endl;
        return summary.success ? EXIT_SUCCESS : EXIT_FAILURE;

    } catch (const std::exception& e) {
        return fail(std::format("Fatal error: {}", e.what()));
    }
}
