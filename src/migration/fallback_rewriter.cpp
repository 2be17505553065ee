#include "migration/fallback_rewriter.hpp"
#include "migration/text_rewriter.hpp"
#include "core/utils.hpp"

#include <format>
#include <regex>
#include <unordered_map>

namespace sqlmigrator {

namespace {

[[nodiscard]] bool contains_word(const std::string& text, const std::string& word) {
    const std::regex re(std::format("\\b{}\\b", utils::regex_escape(word)),
                        std::regex::ECMAScript | std::regex::icase);
    return std::regex_search(text, re);
}

} // namespace

FallbackRewriter::FallbackRewriter(std::vector<MappingEntry> mappings)
    : mappings_(std::move(mappings)) {}

ReplacementLog FallbackRewriter::build_log(const std::string& original) const {
    ReplacementLog log;

    // Participating rows: deprecated table present in the text
    std::vector<const MappingEntry*> rows;
    std::unordered_map<std::string, bool> present;
    for (const auto& entry : mappings_) {
        if (entry.deprecated_table.empty() || entry.new_table.empty()) continue;
        const std::string table = utils::to_lower(entry.deprecated_table);
        auto it = present.find(table);
        if (it == present.end()) {
            it = present.emplace(table, contains_word(original, entry.deprecated_table)).first;
        }
        if (it->second) {
            rows.push_back(&entry);
        }
    }
    if (rows.empty()) return log;

    // One target per source: first table-level row, else first field-level row
    std::unordered_map<std::string, std::string> targets;
    for (const auto* row : rows) {
        if (row->is_table_level()) {
            targets.try_emplace(utils::to_lower(row->deprecated_table), row->new_table);
        }
    }
    for (const auto* row : rows) {
        if (row->is_field_level()) {
            targets.try_emplace(utils::to_lower(row->deprecated_table), row->new_table);
        }
    }

    for (const auto* row : rows) {
        const std::string table = utils::to_lower(row->deprecated_table);
        const std::string& target = targets.at(table);
        log.put(table, target);

        if (!row->is_field_level()) continue;
        if (!utils::iequals(row->new_table, target)) {
            utils::log::warn(std::format(
                "Fallback skips {} -> {}: {} already maps to {}",
                row->deprecated_object, row->new_object, row->deprecated_table, target));
            continue;
        }
        const std::string new_field = row->new_field.empty() ? row->deprecated_field : row->new_field;
        log.put(table + "." + utils::to_lower(row->deprecated_field), target + "." + new_field);
    }
    return log;
}

std::string FallbackRewriter::rewrite(const std::string& original) const {
    const ReplacementLog log = build_log(original);
    if (log.empty()) return original;
    return FormattingRewriter::rewrite(original, log);
}

} // namespace sqlmigrator
