#include "io/batch_loader.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <sstream>

namespace sqlmigrator {

namespace {

Result<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot open '{}'", path));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::ok(ss.str());
}

// Bare array, or the array under `wrapper_key`
Result<JsonValue> row_array(std::string_view json, std::string_view wrapper_key) {
    JsonValue root;
    try {
        root = JsonValue::parse(json);
    } catch (const JsonValue::parse_error& e) {
        return Result<JsonValue>::error(ErrorCategory::PARSE_ERROR, e.what());
    }

    if (root.is_object() && root.contains(wrapper_key)) {
        root = root[wrapper_key];
    }
    if (!root.is_array()) {
        return Result<JsonValue>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Expected an array of rows or an object with \"{}\"", wrapper_key));
    }
    return Result<JsonValue>::ok(std::move(root));
}

} // namespace

Result<std::vector<MappingEntry>> BatchLoader::parse_mappings(std::string_view json) {
    auto rows = row_array(json, "mappings");
    if (rows.is_error()) {
        return Result<std::vector<MappingEntry>>::error(rows.error_category(), rows.error_message());
    }

    std::vector<MappingEntry> entries;
    size_t dropped = 0;
    for (const auto& row : rows.value().elements()) {
        const std::string deprecated = row.string_at("deprecated_object");
        if (utils::trim(deprecated).empty()) {
            ++dropped;
            continue;
        }
        entries.push_back(MappingEntry::parse(deprecated, row.string_at("new_object")));
    }

    if (dropped > 0) {
        utils::log::debug(std::format("Dropped {} mapping rows without a deprecated object", dropped));
    }
    return Result<std::vector<MappingEntry>>::ok(std::move(entries));
}

Result<std::vector<QueryRecord>> BatchLoader::parse_queries(std::string_view json) {
    auto rows = row_array(json, "queries");
    if (rows.is_error()) {
        return Result<std::vector<QueryRecord>>::error(rows.error_category(), rows.error_message());
    }

    std::vector<QueryRecord> records;
    for (const auto& row : rows.value().elements()) {
        std::string name = row.string_at("name");
        if (name.empty()) continue;

        QueryRecord record(std::move(name), row.string_at("description"), row.string_at("query"));
        record.updated_query = row.string_at("updated_query");
        records.push_back(std::move(record));
    }
    return Result<std::vector<QueryRecord>>::ok(std::move(records));
}

Result<std::vector<MappingEntry>> BatchLoader::load_mappings(const std::string& path) {
    auto content = read_file(path);
    if (content.is_error()) {
        return Result<std::vector<MappingEntry>>::error(content.error_category(), content.error_message());
    }
    auto result = parse_mappings(content.value());
    if (result.is_error()) {
        return Result<std::vector<MappingEntry>>::error(result.error_category(),
            std::format("{}: {}", path, result.error_message()));
    }
    utils::log::info(std::format("Loaded {} mappings from {}", result.value().size(), path));
    return result;
}

Result<std::vector<QueryRecord>> BatchLoader::load_queries(const std::string& path) {
    auto content = read_file(path);
    if (content.is_error()) {
        return Result<std::vector<QueryRecord>>::error(content.error_category(), content.error_message());
    }
    auto result = parse_queries(content.value());
    if (result.is_error()) {
        return Result<std::vector<QueryRecord>>::error(result.error_category(),
            std::format("{}: {}", path, result.error_message()));
    }
    utils::log::info(std::format("Loaded {} queries from {}", result.value().size(), path));
    return result;
}

} // namespace sqlmigrator
