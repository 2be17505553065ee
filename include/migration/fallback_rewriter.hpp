#pragma once

#include "core/types.hpp"
#include "migration/replacement_log.hpp"

#include <string>
#include <vector>

namespace sqlmigrator {

/**
 * @brief Direct text migration for queries the parser rejects
 *
 * Derives a replacement log from the mapping rows whose deprecated table
 * occurs as a whole word in the query, then feeds the
 * FormattingRewriter. Each source table gets a single target (its first
 * table-level row, else its first field-level row); field rows pointing
 * elsewhere are skipped, since split tables need the structural path.
 */
class FallbackRewriter {
public:
    explicit FallbackRewriter(std::vector<MappingEntry> mappings);

    /**
     * @brief Replacement log for one query (empty when nothing applies)
     */
    [[nodiscard]] ReplacementLog build_log(const std::string& original) const;

    /**
     * @brief Rewritten query, or the original text when nothing applies
     */
    [[nodiscard]] std::string rewrite(const std::string& original) const;

private:
    std::vector<MappingEntry> mappings_;
};

} // namespace sqlmigrator
