#pragma once

#include "migration/replacement_log.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sqlmigrator {

/**
 * @brief Qualified-column entry of a replacement log, split into parts
 */
struct ColumnReplacement {
    std::string key;            // "amendment.name"
    std::string old_table;      // lower-cased
    std::string old_column;
    std::string new_table;
    std::string new_column;
};

/**
 * @brief Target tables of one deprecated table, primary first
 */
struct SourcePlan {
    std::string source;                 // lower-cased deprecated table
    std::vector<std::string> targets;   // sorted by length, distinct
};

/**
 * @brief Classified replacement log with the alias of every target table
 */
struct RewritePlan {
    std::vector<ColumnReplacement> columns;
    std::vector<std::pair<std::string, std::string>> identifiers;  // AmendmentName -> OrdersOrdernumber
    std::vector<SourcePlan> sources;
    std::unordered_map<std::string, std::string> aliases;          // lower(target) -> alias
    bool multi_target = false;

    [[nodiscard]] const SourcePlan* find_source(std::string_view table) const;
    [[nodiscard]] const std::string& alias_for(std::string_view target) const;

    /**
     * @brief Join column of the primary target: X when the log maps
     * source.id -> primary.X, otherwise "Id"
     */
    [[nodiscard]] std::string id_column(const SourcePlan& source) const;
};

/**
 * @brief Formatting-preserving rewrite of the original query text
 *
 * Applies a replacement log to the unsanitized query so whitespace,
 * comments and unaffected tokens survive. Steps, in order:
 *   A. classify log entries (table-only, qualified, alias-style pairs)
 *   B. assign aliases to every target table
 *   C. rewrite FROM / JOIN clauses, synthesize joins for split tables
 *      before the first WHERE, else before GROUP BY / HAVING / ORDER BY /
 *      LIMIT, else at the end (ahead of a trailing ';')
 *   D. retarget old alias prefixes (single-target logs only)
 *   E. route every qualified column to its target's alias in a single
 *      pass (longest key claims first), then replace alias-style
 *      identifiers
 *   F. rewrite `<alias>.<column> AS <name>` clauses of renamed tables
 *
 * Matching is case-insensitive and tolerates whitespace / newlines
 * around the qualifier dot. May throw std::regex_error on pathological
 * input; callers contain it per query.
 */
class FormattingRewriter {
public:
    [[nodiscard]] static RewritePlan plan(const ReplacementLog& log);

    [[nodiscard]] static std::string rewrite(const std::string& original,
                                             const ReplacementLog& log);
};

} // namespace sqlmigrator
