#include "report/report_generator.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <system_error>

namespace sqlmigrator {

std::string RunSummary::to_json() const {
    return std::format(
        "{{\"success\":{},\"message\":\"{}\",\"totalQueries\":{},"
        "\"impactedQueries\":{},\"reportFilePath\":\"{}\",\"error\":\"{}\"}}",
        utils::booltostr(success), utils::escape_json(message), total_queries,
        impacted_queries, utils::escape_json(report_file_path), utils::escape_json(error));
}

ReportGenerator::ReportGenerator(ReportOptions options)
    : options_(std::move(options)) {}

std::string ReportGenerator::record_to_json(const QueryRecord& record) {
    return std::format(
        "{{\"queryName\":\"{}\",\"description\":\"{}\",\"originalQuery\":\"{}\","
        "\"updatedQuery\":\"{}\",\"impacted\":{},\"strategy\":\"{}\",\"status\":\"{}\"}}",
        utils::escape_json(record.name),
        utils::escape_json(record.description),
        utils::escape_json(record.original_query),
        utils::escape_json(record.updated_query),
        utils::booltostr(record.impacted),
        strategy_name(record.strategy),
        utils::escape_json(record.status));
}

std::string ReportGenerator::generate_json(const std::vector<QueryRecord>& records) const {
    std::string json;
    json.reserve(records.size() * 512 + 128);
    json += '{';
    json += std::format("\"generated_at\":\"{}\",",
                        utils::format_timestamp(std::chrono::system_clock::now()));
    json += "\"queries\":[";

    bool first = true;
    for (const auto& record : records) {
        if (options_.impacted_only && !record.impacted) continue;
        if (!first) json += ',';
        first = false;
        json += record_to_json(record);
    }

    json += "]}";
    return json;
}

RunSummary ReportGenerator::write(const std::vector<QueryRecord>& records,
                                  const BatchSummary& batch) const {
    RunSummary summary;
    summary.total_queries = batch.total;
    summary.impacted_queries = batch.impacted;

    if (batch.impacted == 0) {
        summary.success = true;
        summary.message = "Migration completed successfully. No queries were impacted.";
        return summary;
    }

    const std::filesystem::path dir(options_.output_dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        summary.message = "Migration failed.";
        summary.error = std::format("Cannot create report directory '{}': {}",
                                    options_.output_dir, ec.message());
        return summary;
    }

    const auto path = dir / options_.file_name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        summary.message = "Migration failed.";
        summary.error = std::format("Cannot write report '{}'", path.string());
        return summary;
    }
    out << generate_json(records);
    out.close();
    if (!out) {
        summary.message = "Migration failed.";
        summary.error = std::format("Error while writing report '{}'", path.string());
        return summary;
    }

    utils::log::info(std::format("Report written to {}", path.string()));
    summary.success = true;
    summary.message = "Migration completed successfully.";
    summary.report_file_path = path.string();
    return summary;
}

} // namespace sqlmigrator
