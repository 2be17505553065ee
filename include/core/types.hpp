#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sqlmigrator {

// ============================================================================
// Mapping Rows
// ============================================================================

/**
 * @brief One deprecated-object -> new-object row of the mapping sheet
 *
 * "Amendment" -> "Orders" is a table-level mapping,
 * "Amendment.Name" -> "Orders.OrderNumber" is a field-level mapping.
 */
struct MappingEntry {
    std::string deprecated_object;
    std::string new_object;

    // Parsed components
    std::string deprecated_table;
    std::string deprecated_field;   // Empty for table-level mappings
    std::string new_table;
    std::string new_field;          // Empty when new object has no dot

    MappingEntry() = default;

    /**
     * @brief Build an entry by splitting both objects on the first '.'
     */
    [[nodiscard]] static MappingEntry parse(std::string_view deprecated_object,
                                            std::string_view new_object);

    [[nodiscard]] bool is_field_level() const { return !deprecated_field.empty(); }
    [[nodiscard]] bool is_table_level() const { return deprecated_field.empty(); }
};

// ============================================================================
// Query Records
// ============================================================================

enum class MigrationStrategy {
    UNCHANGED,
    STRUCTURAL,
    FALLBACK,
    FAILED
};

[[nodiscard]] inline constexpr const char* strategy_name(MigrationStrategy s) {
    switch (s) {
        case MigrationStrategy::UNCHANGED:  return "UNCHANGED";
        case MigrationStrategy::STRUCTURAL: return "STRUCTURAL";
        case MigrationStrategy::FALLBACK:   return "FALLBACK";
        case MigrationStrategy::FAILED:     return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @brief One saved query of the batch
 *
 * updated_query / impacted / strategy are filled by the orchestrator.
 * old_url / new_url / status belong to the console-update collaborator;
 * the orchestrator only writes status when a query fails outright.
 */
struct QueryRecord {
    std::string name;
    std::string description;
    std::string original_query;
    std::string updated_query;
    bool impacted = false;
    MigrationStrategy strategy = MigrationStrategy::UNCHANGED;
    std::string old_url;
    std::string new_url;
    std::string status;

    QueryRecord() = default;
    QueryRecord(std::string n, std::string d, std::string q)
        : name(std::move(n)), description(std::move(d)), original_query(std::move(q)) {}
};

// ============================================================================
// Batch Summary
// ============================================================================

struct BatchSummary {
    size_t total = 0;
    size_t impacted = 0;
    size_t structural = 0;
    size_t fallback = 0;
    size_t failed = 0;
};

} // namespace sqlmigrator
