#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace sqlmigrator {

struct ReportOptions {
    std::string output_dir = "reports";
    std::string file_name = "impacted_queries.json";
    bool impacted_only = true;
};

/**
 * @brief Outcome of a batch run, printed to stdout by the CLI
 */
struct RunSummary {
    bool success = false;
    std::string message;
    size_t total_queries = 0;
    size_t impacted_queries = 0;
    std::string report_file_path;   // Empty when no report was written
    std::string error;

    [[nodiscard]] std::string to_json() const;
};

class ReportGenerator {
public:
    explicit ReportGenerator(ReportOptions options);

    /**
     * @brief Report document for the migrated records, in input order
     */
    [[nodiscard]] std::string generate_json(const std::vector<QueryRecord>& records) const;

    /**
     * @brief Write the report (unless nothing is impacted) and summarize the run
     */
    [[nodiscard]] RunSummary write(const std::vector<QueryRecord>& records,
                                   const BatchSummary& batch) const;

private:
    [[nodiscard]] static std::string record_to_json(const QueryRecord& record);

    ReportOptions options_;
};

} // namespace sqlmigrator
