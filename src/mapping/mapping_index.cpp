#include "mapping/mapping_index.hpp"
#include "core/utils.hpp"

namespace sqlmigrator {

namespace {

// Split "table.field" on the first dot; both halves trimmed
std::pair<std::string, std::string> split_object(std::string_view object) {
    const std::string trimmed = utils::trim(object);
    const size_t dot = trimmed.find('.');
    if (dot == std::string::npos) {
        return {trimmed, {}};
    }
    return {utils::trim(std::string_view(trimmed).substr(0, dot)),
            utils::trim(std::string_view(trimmed).substr(dot + 1))};
}

} // anonymous namespace

MappingEntry MappingEntry::parse(std::string_view deprecated_object,
                                 std::string_view new_object) {
    MappingEntry entry;
    entry.deprecated_object = utils::trim(deprecated_object);
    entry.new_object = utils::trim(new_object);

    auto [old_table, old_field] = split_object(entry.deprecated_object);
    entry.deprecated_table = std::move(old_table);
    entry.deprecated_field = std::move(old_field);

    auto [new_table, new_field] = split_object(entry.new_object);
    entry.new_table = std::move(new_table);
    entry.new_field = std::move(new_field);
    return entry;
}

MappingIndex::MappingIndex(const std::vector<MappingEntry>& entries) {
    for (const auto& entry : entries) {
        if (entry.deprecated_table.empty()) continue;

        if (entry.is_field_level()) {
            // insert_or_assign: the later row replaces an earlier duplicate
            field_mappings_.insert_or_assign(
                field_key(entry.deprecated_table, entry.deprecated_field), entry);
        } else {
            table_mappings_[utils::to_lower(entry.deprecated_table)].push_back(entry);
        }
    }
}

std::string MappingIndex::field_key(std::string_view table, std::string_view column) {
    std::string key = utils::to_lower(table);
    key += '.';
    key += utils::to_lower(column);
    return key;
}

const MappingEntry* MappingIndex::field_mapping(std::string_view table,
                                                std::string_view column) const {
    const auto it = field_mappings_.find(field_key(table, column));
    return it != field_mappings_.end() ? &it->second : nullptr;
}

const std::vector<MappingEntry>& MappingIndex::table_mappings(std::string_view table) const {
    static const std::vector<MappingEntry> kNone;
    const auto it = table_mappings_.find(utils::to_lower(table));
    return it != table_mappings_.end() ? it->second : kNone;
}

const MappingEntry* MappingIndex::first_table_mapping(std::string_view table) const {
    const auto& rows = table_mappings(table);
    return rows.empty() ? nullptr : &rows.front();
}

} // namespace sqlmigrator
