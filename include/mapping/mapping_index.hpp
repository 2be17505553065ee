#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sqlmigrator {

/**
 * @brief Lookup structures over the mapping rows of one batch
 *
 * - Field mappings: "table.column" (lower-cased) -> entry. On duplicate keys
 *   the later row wins.
 * - Table mappings: table (lower-cased) -> every table-level row for that
 *   table, in input order. A table may map to several new tables.
 *
 * Rows with an empty deprecated table are ignored. Immutable after
 * construction; safe to share across worker threads.
 */
class MappingIndex {
public:
    MappingIndex() = default;
    explicit MappingIndex(const std::vector<MappingEntry>& entries);

    /**
     * @brief Field-level row for table.column, or nullptr
     */
    [[nodiscard]] const MappingEntry* field_mapping(std::string_view table,
                                                    std::string_view column) const;

    /**
     * @brief Table-level rows for a table (empty when unmapped)
     */
    [[nodiscard]] const std::vector<MappingEntry>& table_mappings(std::string_view table) const;

    /**
     * @brief First table-level row for a table, or nullptr
     */
    [[nodiscard]] const MappingEntry* first_table_mapping(std::string_view table) const;

    [[nodiscard]] size_t field_mapping_count() const { return field_mappings_.size(); }
    [[nodiscard]] size_t table_mapping_count() const { return table_mappings_.size(); }
    [[nodiscard]] bool empty() const { return field_mappings_.empty() && table_mappings_.empty(); }

    [[nodiscard]] static std::string field_key(std::string_view table, std::string_view column);

private:
    std::unordered_map<std::string, MappingEntry> field_mappings_;
    std::unordered_map<std::string, std::vector<MappingEntry>> table_mappings_;
};

} // namespace sqlmigrator
