#include <catch2/catch_test_macros.hpp>
#include "report/report_generator.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace sqlmigrator;

namespace {

std::vector<QueryRecord> sample_records() {
    QueryRecord impacted("orders \"open\"", "line1\nline2", "SELECT a.Name FROM Amendment a");
    impacted.updated_query = "SELECT ord.Name FROM Orders ord";
    impacted.impacted = true;
    impacted.strategy = MigrationStrategy::STRUCTURAL;

    QueryRecord untouched("other", "", "SELECT 1");
    return {impacted, untouched};
}

BatchSummary summary_of(const std::vector<QueryRecord>& records) {
    BatchSummary summary;
    summary.total = records.size();
    for (const auto& r : records) {
        if (r.impacted) ++summary.impacted;
    }
    return summary;
}

std::string read_all(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("ReportGenerator: impacted rows only by default", "[report]") {
    const ReportGenerator generator(ReportOptions{});
    const std::string json = generator.generate_json(sample_records());

    CHECK(json.find("\"generated_at\":\"") != std::string::npos);
    CHECK(json.find(R"("queryName":"orders \"open\"")") != std::string::npos);
    CHECK(json.find(R"("description":"line1\nline2")") != std::string::npos);
    CHECK(json.find(R"("updatedQuery":"SELECT ord.Name FROM Orders ord")") != std::string::npos);
    CHECK(json.find(R"("impacted":true)") != std::string::npos);
    CHECK(json.find(R"("strategy":"STRUCTURAL")") != std::string::npos);
    CHECK(json.find(R"("queryName":"other")") == std::string::npos);
}

TEST_CASE("ReportGenerator: all rows when impacted_only is off", "[report]") {
    ReportOptions options;
    options.impacted_only = false;
    const ReportGenerator generator(options);
    const std::string json = generator.generate_json(sample_records());

    const auto first = json.find(R"("queryName":"orders)");
    const auto second = json.find(R"("queryName":"other")");
    REQUIRE(first != std::string::npos);
    REQUIRE(second != std::string::npos);
    CHECK(first < second);
    CHECK(json.find(R"("strategy":"UNCHANGED")") != std::string::npos);
}

TEST_CASE("ReportGenerator: nothing impacted writes no file", "[report][write]") {
    const auto dir = std::filesystem::temp_directory_path() / "sqlmigrator_report_none";
    std::filesystem::remove_all(dir);

    ReportOptions options;
    options.output_dir = dir.string();
    const ReportGenerator generator(options);

    const std::vector<QueryRecord> records{QueryRecord("q", "", "SELECT 1")};
    const auto summary = generator.write(records, summary_of(records));

    CHECK(summary.success);
    CHECK(summary.message == "Migration completed successfully. No queries were impacted.");
    CHECK(summary.report_file_path.empty());
    CHECK_FALSE(std::filesystem::exists(dir));
}

TEST_CASE("ReportGenerator: report file is written into a new directory", "[report][write]") {
    const auto dir = std::filesystem::temp_directory_path() / "sqlmigrator_report_out" / "nested";
    std::filesystem::remove_all(dir.parent_path());

    ReportOptions options;
    options.output_dir = dir.string();
    options.file_name = "impacted.json";
    const ReportGenerator generator(options);

    const auto records = sample_records();
    const auto summary = generator.write(records, summary_of(records));

    REQUIRE(summary.success);
    CHECK(summary.message == "Migration completed successfully.");
    CHECK(summary.total_queries == 2);
    CHECK(summary.impacted_queries == 1);
    CHECK(summary.report_file_path == (dir / "impacted.json").string());

    const std::string content = read_all(dir / "impacted.json");
    CHECK(content.find(R"("originalQuery":"SELECT a.Name FROM Amendment a")") != std::string::npos);

    std::filesystem::remove_all(dir.parent_path());
}

TEST_CASE("RunSummary: JSON field names", "[report][summary]") {
    RunSummary summary;
    summary.success = true;
    summary.message = "Migration completed successfully.";
    summary.total_queries = 3;
    summary.impacted_queries = 1;
    summary.report_file_path = "reports/impacted_queries.json";

    CHECK(summary.to_json() ==
          R"({"success":true,"message":"Migration completed successfully.","totalQueries":3,)"
          R"("impactedQueries":1,"reportFilePath":"reports/impacted_queries.json","error":""})");
}
