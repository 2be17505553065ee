#pragma once

#include "mapping/mapping_index.hpp"
#include "migration/replacement_log.hpp"
#include "parser/select_ast.hpp"

namespace sqlmigrator {

struct MigrationOutcome {
    bool has_changes = false;
    ReplacementLog replacements;
};

/**
 * @brief Tree-based migration of one parsed SELECT statement
 *
 * For every SELECT block (each branch of a set operation in its own alias
 * scope):
 * 1. Collect FROM / JOIN tables and their aliases
 * 2. Analyze qualified columns: a field-level mapping decides the table's
 *    rename target (later columns overwrite); otherwise the first
 *    table-level mapping is recorded unless a target already exists
 * 3. Tables from FROM / JOIN with a table-level mapping and no target yet
 *    receive their first table-level mapping
 * 4. Rename tables, then JOIN ... ON columns, then every other column
 *
 * The statement is mutated in place; the replacement log records every
 * rename for the formatting-preserving rewriter. Stateless between calls;
 * the index is borrowed and must outlive the migrator.
 */
class StructuralMigrator {
public:
    explicit StructuralMigrator(const MappingIndex& index);

    [[nodiscard]] MigrationOutcome migrate(ast::SelectStatement& statement) const;

private:
    const MappingIndex& index_;
};

} // namespace sqlmigrator
