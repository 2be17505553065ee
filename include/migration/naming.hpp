#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sqlmigrator::naming {

/**
 * @brief "oRDERS" -> "Orders": first character upper, rest lower
 */
[[nodiscard]] std::string capitalize(std::string_view word);

/**
 * @brief English singular of a table name
 *
 * ...ies -> ...y; ...sses / ...shes / ...ches / ...xes / ...zes / ...uses
 * drop "es"; ...ss / ...us / ...is are kept; otherwise one trailing 's'
 * is dropped. Case of the remaining characters is preserved.
 */
[[nodiscard]] std::string singularize(std::string_view word);

/**
 * @brief Lower-cased first three characters ("Orders" -> "ord")
 */
[[nodiscard]] std::string alias_prefix(std::string_view table);

/**
 * @brief Identifier used for generated column aliases:
 * Capitalize(table) + Capitalize(column)
 */
[[nodiscard]] std::string identifier_pair(std::string_view table, std::string_view column);

/**
 * @brief Assign table aliases to the targets of one source table
 *
 * Targets are stably sorted by name length (shorter first). Each target
 * gets its 3-letter prefix, suffixed with a, b, c, ... when an earlier
 * target already took that alias. Aliases present in `aliases` (keyed by
 * lower-cased target) count as taken, and a target already listed there
 * keeps its alias. Returns the sorted order.
 */
std::vector<std::string> assign_aliases(std::vector<std::string> targets,
                                        std::unordered_map<std::string, std::string>& aliases);

} // namespace sqlmigrator::naming
