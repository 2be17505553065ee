#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sqlmigrator {

/**
 * @brief Reads the mapping sheet and the saved-query list from JSON
 *
 * Mapping rows: {"deprecated_object": "...", "new_object": "..."}
 * Query rows:   {"name", "description", "query", "updated_query"?}
 * Either file may be a bare array or an object wrapping the array under
 * "mappings" / "queries".
 */
class BatchLoader {
public:
    [[nodiscard]] static Result<std::vector<MappingEntry>> load_mappings(const std::string& path);
    [[nodiscard]] static Result<std::vector<QueryRecord>> load_queries(const std::string& path);

    [[nodiscard]] static Result<std::vector<MappingEntry>> parse_mappings(std::string_view json);
    [[nodiscard]] static Result<std::vector<QueryRecord>> parse_queries(std::string_view json);
};

} // namespace sqlmigrator
