#include "migration/migration_orchestrator.hpp"
#include "migration/text_rewriter.hpp"
#include "parser/sql_sanitizer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <thread>

namespace sqlmigrator {

MigrationOrchestrator::MigrationOrchestrator(const std::vector<MappingEntry>& mappings,
                                             MigrationOptions options)
    : index_(mappings),
      structural_(index_),
      fallback_(mappings),
      options_(options) {}

BatchSummary MigrationOrchestrator::migrate(std::vector<QueryRecord>& records) const {
    utils::Timer timer;
    utils::log::info(std::format("Migrating {} queries with {} field and {} table mappings",
        records.size(), index_.field_mapping_count(), index_.table_mapping_count()));

    const size_t workers = std::clamp<size_t>(options_.workers, 1, std::max<size_t>(records.size(), 1));
    if (workers == 1) {
        for (auto& record : records) {
            migrate_query(record);
        }
    } else {
        std::atomic<size_t> next{0};
        std::vector<std::jthread> pool;
        pool.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            pool.emplace_back([this, &records, &next] {
                for (size_t idx = next.fetch_add(1); idx < records.size(); idx = next.fetch_add(1)) {
                    migrate_query(records[idx]);
                }
            });
        }
    }   // jthreads join here

    BatchSummary summary;
    summary.total = records.size();
    for (const auto& record : records) {
        if (record.impacted) ++summary.impacted;
        switch (record.strategy) {
            case MigrationStrategy::STRUCTURAL: ++summary.structural; break;
            case MigrationStrategy::FALLBACK:   ++summary.fallback; break;
            case MigrationStrategy::FAILED:     ++summary.failed; break;
            case MigrationStrategy::UNCHANGED:  break;
        }
    }

    utils::log::info(std::format("Migration complete. {} out of {} queries impacted ({} ms)",
        summary.impacted, summary.total, timer.elapsed_ms().count()));
    return summary;
}

void MigrationOrchestrator::migrate_query(QueryRecord& record) const {
    record.impacted = false;
    record.strategy = MigrationStrategy::UNCHANGED;

    try {
        const std::string sanitized = SqlSanitizer::sanitize(record.original_query);
        auto parsed = parser_.parse(sanitized);

        if (parsed.success) {
            migrate_structural(record, *parsed.statement);
            return;
        }

        utils::log::warn(std::format("Query '{}' could not be parsed ({}): {}",
            record.name, error_code_name(parsed.error_code), parsed.error_message));

        if (options_.fallback_enabled) {
            migrate_fallback(record);
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Query '{}' failed: {}", record.name, e.what()));
        record.impacted = false;
        record.strategy = MigrationStrategy::FAILED;
        record.status = std::format("FAILED: {}", e.what());
    }
}

void MigrationOrchestrator::migrate_structural(QueryRecord& record,
                                               ast::SelectStatement& statement) const {
    const MigrationOutcome outcome = structural_.migrate(statement);
    if (!outcome.has_changes) {
        utils::log::debug(std::format("Query '{}' not impacted", record.name));
        return;
    }

    if (utils::log::enabled(utils::log::Level::DEBUG)) {
        for (const auto& [from, to] : outcome.replacements) {
            utils::log::debug(std::format("Query '{}' replacement: {} -> {}", record.name, from, to));
        }
    }

    record.updated_query = FormattingRewriter::rewrite(record.original_query, outcome.replacements);
    record.impacted = true;
    record.strategy = MigrationStrategy::STRUCTURAL;
}

void MigrationOrchestrator::migrate_fallback(QueryRecord& record) const {
    const std::string rewritten = fallback_.rewrite(record.original_query);
    if (rewritten == record.original_query) {
        return;
    }

    record.updated_query = rewritten;
    record.impacted = true;
    record.strategy = MigrationStrategy::FALLBACK;
    utils::log::info(std::format("Query '{}' migrated by direct text rewrite", record.name));
}

} // namespace sqlmigrator
