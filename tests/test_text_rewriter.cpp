#include <catch2/catch_test_macros.hpp>
#include "migration/text_rewriter.hpp"

using namespace sqlmigrator;

namespace {

ReplacementLog make_log(std::initializer_list<std::pair<std::string, std::string>> entries) {
    ReplacementLog log;
    for (const auto& [key, value] : entries) log.put(key, value);
    return log;
}

ReplacementLog split_log() {
    return make_log({
        {"amendment", "OrderActions"},
        {"amendment.name", "Orders.OrderNumber"},
        {"amendment.action", "OrderActions.action"},
    });
}

} // namespace

TEST_CASE("FormattingRewriter: empty log returns the original", "[rewriter]") {
    const std::string sql = "SELECT a.Name\n  FROM Amendment a -- keep";
    CHECK(FormattingRewriter::rewrite(sql, ReplacementLog{}) == sql);
}

TEST_CASE("FormattingRewriter: plan classifies entries and assigns aliases", "[rewriter][plan]") {
    const auto plan = FormattingRewriter::plan(split_log());

    REQUIRE(plan.sources.size() == 1);
    CHECK(plan.sources[0].source == "amendment");
    CHECK(plan.sources[0].targets == std::vector<std::string>{"Orders", "OrderActions"});
    CHECK(plan.multi_target);
    CHECK(plan.alias_for("orders") == "ord");
    CHECK(plan.alias_for("OrderActions") == "orda");
    CHECK(plan.columns.size() == 2);
    REQUIRE(plan.identifiers.size() == 2);
    CHECK(plan.identifiers[0].first == "AmendmentName");
    CHECK(plan.identifiers[0].second == "OrdersOrdernumber");
    CHECK(plan.id_column(plan.sources[0]) == "Id");
}

TEST_CASE("FormattingRewriter: id column comes from a mapped id", "[rewriter][plan]") {
    const auto plan = FormattingRewriter::plan(make_log({
        {"amendment", "Orders"},
        {"amendment.id", "Orders.OrderId"},
        {"amendment.action", "OrderActions.Action"},
    }));
    REQUIRE(plan.sources.size() == 1);
    CHECK(plan.id_column(plan.sources[0]) == "OrderId");
}

TEST_CASE("FormattingRewriter: table rename keeps column casing and layout", "[rewriter]") {
    const auto log = make_log({
        {"amendment", "Orders"},
        {"amendment.name", "Orders.name"},
        {"amendment.status", "Orders.status"},
    });
    CHECK(FormattingRewriter::rewrite("SELECT a.Name FROM Amendment a WHERE a.Status = 'X'", log)
          == "SELECT ord.Name FROM Orders ord WHERE ord.Status = 'X'");
    CHECK(FormattingRewriter::rewrite("SELECT a.Name\n  FROM Amendment AS a\n WHERE a.Status = 'X'", log)
          == "SELECT ord.Name\n  FROM Orders ord\n WHERE ord.Status = 'X'");
}

TEST_CASE("FormattingRewriter: clause keyword after table is not an alias", "[rewriter]") {
    const auto log = make_log({
        {"amendment", "Orders"},
        {"amendment.name", "Orders.name"},
        {"amendment.status", "Orders.status"},
    });
    CHECK(FormattingRewriter::rewrite(
              "SELECT Amendment.Name FROM Amendment WHERE Amendment.Status = 'X'", log)
          == "SELECT ord.Name FROM Orders ord WHERE ord.Status = 'X'");
}

TEST_CASE("FormattingRewriter: renamed column is routed to the new field", "[rewriter]") {
    const auto log = make_log({
        {"amendment", "Orders"},
        {"amendment.name", "Orders.OrderNumber"},
        {"amendment.status", "Orders.status"},
    });
    CHECK(FormattingRewriter::rewrite("SELECT a.Name FROM Amendment a WHERE a.Status = 'X'", log)
          == "SELECT ord.OrderNumber FROM Orders ord WHERE ord.Status = 'X'");
}

TEST_CASE("FormattingRewriter: qualifier split across lines is matched", "[rewriter]") {
    const auto log = make_log({
        {"amendment", "Orders"},
        {"amendment.name", "Orders.OrderNumber"},
    });
    CHECK(FormattingRewriter::rewrite("SELECT a\n    .Name FROM Amendment a", log)
          == "SELECT ord.OrderNumber FROM Orders ord");
}

TEST_CASE("FormattingRewriter: split table synthesizes a join before WHERE", "[rewriter][join]") {
    CHECK(FormattingRewriter::rewrite(
              "SELECT a.Name\nFROM Amendment a\nWHERE a.Action = 'X'", split_log())
          == "SELECT ord.OrderNumber\nFROM Orders ord\n"
             "JOIN OrderActions orda ON ord.Id = orda.OrderId\n"
             "WHERE orda.Action = 'X'");

    CHECK(FormattingRewriter::rewrite(
              "SELECT a.Name FROM Amendment a WHERE a.Action = 'X'", split_log())
          == "SELECT ord.OrderNumber FROM Orders ord "
             "JOIN OrderActions orda ON ord.Id = orda.OrderId WHERE orda.Action = 'X'");
}

TEST_CASE("FormattingRewriter: synthesized join is appended before a trailing semicolon", "[rewriter][join]") {
    CHECK(FormattingRewriter::rewrite("SELECT a.Name FROM Amendment a;", split_log())
          == "SELECT ord.OrderNumber FROM Orders ord JOIN OrderActions orda ON ord.Id = orda.OrderId;");
}

TEST_CASE("FormattingRewriter: alias prefixes are left alone for split tables", "[rewriter][join]") {
    const std::string out = FormattingRewriter::rewrite(
        "SELECT a.Name, a.Other FROM Amendment a", split_log());
    CHECK(out.find("a.Other") != std::string::npos);
    CHECK(out.find("ord.OrderNumber") != std::string::npos);
}

TEST_CASE("FormattingRewriter: no join when the FROM clause is not found", "[rewriter][join]") {
    const std::string out = FormattingRewriter::rewrite("SELECT Amendment.Name FROM dbo . x", split_log());
    CHECK(out.find("JOIN") == std::string::npos);
}

TEST_CASE("FormattingRewriter: chained mappings apply once", "[rewriter]") {
    const auto log = make_log({{"alpha", "Beta"}, {"beta", "Gamma"}});
    CHECK(FormattingRewriter::rewrite("SELECT x FROM Alpha", log) == "SELECT x FROM Beta bet");
}

TEST_CASE("FormattingRewriter: AS alias is regenerated for unchanged columns", "[rewriter][as]") {
    const auto log = make_log({
        {"amendment", "Orders"},
        {"amendment.id", "Orders.id"},
    });
    CHECK(FormattingRewriter::rewrite("SELECT a.Id AS AmendmentId FROM Amendment a", log)
          == "SELECT ord.Id AS OrderId FROM Orders ord");
}

TEST_CASE("FormattingRewriter: AS alias is dropped for renamed columns", "[rewriter][as]") {
    const auto log = make_log({
        {"amendment", "Orders"},
        {"amendment.name", "Orders.OrderNumber"},
    });
    CHECK(FormattingRewriter::rewrite("SELECT a.Name AS AmendmentName FROM Amendment a", log)
          == "SELECT ord.OrderNumber FROM Orders ord");
}

TEST_CASE("FormattingRewriter: alias-style identifiers are replaced outside qualified names", "[rewriter]") {
    const auto log = make_log({
        {"amendment", "Orders"},
        {"amendment.name", "Orders.OrderNumber"},
    });
    CHECK(FormattingRewriter::rewrite(
              "SELECT a.Name FROM Amendment a ORDER BY AmendmentName", log)
          == "SELECT ord.OrderNumber FROM Orders ord ORDER BY OrdersOrdernumber");
}

TEST_CASE("FormattingRewriter: chained column renames apply once", "[rewriter]") {
    const auto log = make_log({
        {"amendment", "Orders"},
        {"amendment.description", "Orders.Notes"},
        {"amendment.notes", "Orders.InternalNotes"},
    });
    CHECK(FormattingRewriter::rewrite("SELECT m.Description, m.Notes FROM Amendment m", log)
          == "SELECT ord.Notes, ord.InternalNotes FROM Orders ord");
}

TEST_CASE("FormattingRewriter: swapped column names stay swapped", "[rewriter]") {
    const auto log = make_log({
        {"amendment", "Orders"},
        {"amendment.a", "Orders.b"},
        {"amendment.b", "Orders.a"},
    });
    CHECK(FormattingRewriter::rewrite("SELECT m.a, m.b FROM Amendment m", log)
          == "SELECT ord.b, ord.a FROM Orders ord");
}

TEST_CASE("FormattingRewriter: without WHERE the join goes before ORDER BY", "[rewriter][join]") {
    CHECK(FormattingRewriter::rewrite(
              "SELECT a.Name FROM Amendment a ORDER BY a.Action", split_log())
          == "SELECT ord.OrderNumber FROM Orders ord "
             "JOIN OrderActions orda ON ord.Id = orda.OrderId ORDER BY orda.Action");

    CHECK(FormattingRewriter::rewrite(
              "SELECT a.Name\nFROM Amendment a\nGROUP BY a.Name", split_log())
          == "SELECT ord.OrderNumber\nFROM Orders ord\n"
             "JOIN OrderActions orda ON ord.Id = orda.OrderId\n"
             "GROUP BY ord.OrderNumber");
}
