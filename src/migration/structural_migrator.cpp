#include "migration/structural_migrator.hpp"
#include "core/utils.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace sqlmigrator {

using namespace ast;

namespace {

/**
 * Alias scope and rename decisions of one SELECT block. Keys are
 * lower-cased; values of table_to_new keep the mapping's spelling.
 */
class BlockMigrator {
public:
    BlockMigrator(const MappingIndex& index, MigrationOutcome& outcome)
        : index_(index), outcome_(outcome) {}

    void run(PlainSelect& select) {
        collect_tables(select);

        auto analyze = [this](ColumnRef& c) { analyze_column(c); };
        for_each_clause_column(select, analyze);

        assign_default_targets();

        auto update = [this](ColumnRef& c) { update_column(c); };
        if (select.from && select.from->table) {
            update_table(*select.from->table);
        }
        for (auto& join : select.joins) {
            if (join.right.table) {
                update_table(*join.right.table);
            }
            for (auto& on : join.on) {
                for_each_column(on.get(), update);
            }
        }

        for_each_clause_column(select, update);
    }

private:
    void collect_from_item(const FromItem& item) {
        if (!item.table) return;
        const TableRef& table = *item.table;
        const std::string name = utils::to_lower(table.name);
        const std::string key = table.alias.empty() ? name : utils::to_lower(table.alias);
        alias_to_table_[key] = name;
        alias_to_original_[key] = name;
        tables_.push_back(name);
    }

    void collect_tables(const PlainSelect& select) {
        if (select.from) {
            collect_from_item(*select.from);
        }
        for (const auto& join : select.joins) {
            collect_from_item(join.right);
        }
    }

    void analyze_column(const ColumnRef& column) {
        if (column.qualifier.empty()) return;

        const std::string qualifier = utils::to_lower(column.qualifier);
        const auto it = alias_to_table_.find(qualifier);
        const std::string& actual = it != alias_to_table_.end() ? it->second : qualifier;

        if (const auto* mapping = index_.field_mapping(actual, column.column)) {
            table_to_new_[actual] = mapping->new_table;
        } else if (const auto* first = index_.first_table_mapping(actual)) {
            table_to_new_.try_emplace(actual, first->new_table);
        }
    }

    void assign_default_targets() {
        for (const auto& table : tables_) {
            if (const auto* first = index_.first_table_mapping(table)) {
                table_to_new_.try_emplace(table, first->new_table);
            }
        }
    }

    void update_table(TableRef& table) {
        const std::string old_name = utils::to_lower(table.name);
        const auto it = table_to_new_.find(old_name);
        if (it == table_to_new_.end() || it->second.empty()) return;

        const std::string& new_name = it->second;
        outcome_.replacements.put(old_name, new_name);
        if (!utils::iequals(new_name, old_name)) {
            outcome_.has_changes = true;
        }
        table.name = new_name;

        // Qualifiers resolve to the original table for field lookups
        const std::string new_key = utils::to_lower(new_name);
        if (!table.alias.empty()) {
            alias_to_table_[utils::to_lower(table.alias)] = new_key;
        } else {
            alias_to_table_[new_key] = new_key;
            alias_to_original_[new_key] = old_name;
        }
    }

    void update_column(ColumnRef& column) {
        if (column.qualifier.empty()) return;

        const std::string qualifier = utils::to_lower(column.qualifier);
        const std::string column_key = utils::to_lower(column.column);
        const auto orig_it = alias_to_original_.find(qualifier);
        const std::string original = orig_it != alias_to_original_.end() ? orig_it->second : qualifier;
        const std::string log_key = original + "." + column_key;
        const bool aliased = qualifier != original;

        // Table-only rename: the column keeps its name
        const auto target = table_to_new_.find(original);
        if (target != table_to_new_.end() && !target->second.empty()) {
            outcome_.replacements.put(log_key, target->second + "." + column.column);
            if (!utils::iequals(target->second, original)) {
                outcome_.has_changes = true;
            }
            if (!aliased) column.qualifier = target->second;
        }

        // Field-level rename overwrites the same log key
        if (const auto* mapping = index_.field_mapping(original, column_key)) {
            const std::string& new_table = mapping->new_table.empty() ? original : mapping->new_table;
            const std::string new_field = mapping->new_field.empty() ? column.column : mapping->new_field;
            outcome_.replacements.put(log_key, new_table + "." + new_field);

            if (!utils::iequals(new_field, column.column) || !utils::iequals(new_table, original)) {
                outcome_.has_changes = true;
            }
            column.column = new_field;
            if (!aliased) column.qualifier = new_table;
        }
    }

    const MappingIndex& index_;
    MigrationOutcome& outcome_;

    std::unordered_map<std::string, std::string> alias_to_table_;
    std::unordered_map<std::string, std::string> alias_to_original_;
    std::unordered_map<std::string, std::string> table_to_new_;
    std::vector<std::string> tables_;
};

} // namespace

StructuralMigrator::StructuralMigrator(const MappingIndex& index)
    : index_(index) {}

MigrationOutcome StructuralMigrator::migrate(SelectStatement& statement) const {
    MigrationOutcome outcome;
    for (auto& select : statement.selects) {
        BlockMigrator block(index_, outcome);
        block.run(select);
    }
    return outcome;
}

} // namespace sqlmigrator
