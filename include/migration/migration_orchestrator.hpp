#pragma once

#include "core/types.hpp"
#include "mapping/mapping_index.hpp"
#include "migration/fallback_rewriter.hpp"
#include "migration/structural_migrator.hpp"
#include "parser/select_parser.hpp"

#include <cstddef>
#include <vector>

namespace sqlmigrator {

struct MigrationOptions {
    size_t workers = 1;             // 1 = sequential
    bool fallback_enabled = true;
};

/**
 * @brief Runs the migration of a batch of saved queries
 *
 * Per query: sanitize -> parse -> structural migration + formatting
 * rewrite, or the fallback rewriter when the parser rejects the text.
 * Every record is updated in place and no exception escapes a single
 * query. The mapping index is built once and shared read-only by the
 * worker threads; each worker writes only to the records it claims.
 */
class MigrationOrchestrator {
public:
    explicit MigrationOrchestrator(const std::vector<MappingEntry>& mappings,
                                   MigrationOptions options = {});

    virtual ~MigrationOrchestrator() = default;

    MigrationOrchestrator(const MigrationOrchestrator&) = delete;
    MigrationOrchestrator& operator=(const MigrationOrchestrator&) = delete;

    /**
     * @brief Migrate every record; order and count are preserved
     */
    BatchSummary migrate(std::vector<QueryRecord>& records) const;

    /**
     * @brief Migrate one record (never throws)
     */
    void migrate_query(QueryRecord& record) const;

    [[nodiscard]] const MappingIndex& index() const { return index_; }

protected:
    // Strategy steps; an exception thrown here marks the record FAILED
    virtual void migrate_structural(QueryRecord& record, ast::SelectStatement& statement) const;
    virtual void migrate_fallback(QueryRecord& record) const;

private:

    MappingIndex index_;
    StructuralMigrator structural_;
    FallbackRewriter fallback_;
    SelectParser parser_;
    MigrationOptions options_;
};

} // namespace sqlmigrator
