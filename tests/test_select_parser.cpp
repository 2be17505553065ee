#include <catch2/catch_test_macros.hpp>
#include "parser/select_parser.hpp"

#include <variant>

using namespace sqlmigrator;

namespace {

std::vector<std::string> columns_of(ast::PlainSelect& select) {
    std::vector<std::string> out;
    auto collect = [&](ast::ColumnRef& c) {
        out.push_back(c.qualifier.empty() ? c.column : c.qualifier + "." + c.column);
    };
    ast::for_each_clause_column(select, collect);
    return out;
}

} // namespace

TEST_CASE("SelectParser: simple select builds one block", "[parser]") {
    SelectParser parser;
    auto result = parser.parse("SELECT a.Name, a.Status FROM Amendment a WHERE a.Id = 1");
    REQUIRE(result.success);
    REQUIRE(result.statement);

    auto& stmt = *result.statement;
    CHECK_FALSE(stmt.is_set_operation());
    REQUIRE(stmt.selects.size() == 1);

    auto& select = stmt.selects[0];
    REQUIRE(select.from);
    REQUIRE(select.from->table);
    CHECK(select.from->table->name == "amendment");
    CHECK(select.from->table->alias == "a");
    CHECK(select.select_items.size() == 2);
    CHECK(columns_of(select) == std::vector<std::string>{"a.name", "a.status", "a.id"});
}

TEST_CASE("SelectParser: quoted identifiers keep their case", "[parser]") {
    SelectParser parser;
    auto result = parser.parse(R"(SELECT "Name" FROM "Amendment")");
    REQUIRE(result.success);
    auto& select = result.statement->selects[0];
    CHECK(select.from->table->name == "Amendment");
    CHECK(columns_of(select) == std::vector<std::string>{"Name"});
}

TEST_CASE("SelectParser: select alias and star", "[parser]") {
    SelectParser parser;
    auto result = parser.parse("SELECT a.Id AS AmendmentId, * FROM Amendment a");
    REQUIRE(result.success);
    auto& items = result.statement->selects[0].select_items;
    REQUIRE(items.size() == 2);
    CHECK(items[0].alias == "amendmentid");
    REQUIRE(std::holds_alternative<ast::Literal>(items[1].expr->node));
    CHECK(std::get<ast::Literal>(items[1].expr->node).kind == "star");
}

TEST_CASE("SelectParser: explicit joins flatten in source order", "[parser][join]") {
    SelectParser parser;
    auto result = parser.parse(
        "SELECT a.Name FROM Amendment a "
        "JOIN Contract c ON c.Id = a.ContractId "
        "LEFT JOIN Account acc ON acc.Id = c.AccountId");
    REQUIRE(result.success);

    auto& select = result.statement->selects[0];
    CHECK(select.from->table->name == "amendment");
    REQUIRE(select.joins.size() == 2);
    CHECK(select.joins[0].join_type == "INNER");
    CHECK(select.joins[0].right.table->name == "contract");
    CHECK(select.joins[1].join_type == "LEFT");
    CHECK(select.joins[1].right.table->alias == "acc");

    std::vector<std::string> on_columns;
    auto collect = [&](ast::ColumnRef& c) { on_columns.push_back(c.qualifier + "." + c.column); };
    for (auto& expr : select.joins[1].on) ast::for_each_column(expr.get(), collect);
    CHECK(on_columns == std::vector<std::string>{"acc.id", "c.accountid"});
}

TEST_CASE("SelectParser: comma joins and cross joins", "[parser][join]") {
    SelectParser parser;
    auto result = parser.parse("SELECT * FROM Amendment a, Contract c CROSS JOIN Account");
    REQUIRE(result.success);

    auto& select = result.statement->selects[0];
    REQUIRE(select.joins.size() == 2);
    CHECK(select.joins[0].join_type == "COMMA");
    CHECK(select.joins[0].on.empty());
    CHECK(select.joins[1].join_type == "CROSS");
    CHECK(select.joins[1].right.table->name == "account");
}

TEST_CASE("SelectParser: subquery in FROM has no table", "[parser][join]") {
    SelectParser parser;
    auto result = parser.parse("SELECT s.x FROM (SELECT x FROM t) s");
    REQUIRE(result.success);
    REQUIRE(result.statement->selects[0].from);
    CHECK_FALSE(result.statement->selects[0].from->table);
}

TEST_CASE("SelectParser: set operations keep branches and operators", "[parser][union]") {
    SelectParser parser;
    auto result = parser.parse(
        "SELECT a.Name FROM Amendment a UNION ALL SELECT c.Name FROM Contract c "
        "UNION SELECT x.Name FROM Other x");
    REQUIRE(result.success);

    auto& stmt = *result.statement;
    CHECK(stmt.is_set_operation());
    REQUIRE(stmt.selects.size() == 3);
    REQUIRE(stmt.operators.size() == 2);
    CHECK(stmt.operators[0] == "UNION ALL");
    CHECK(stmt.operators[1] == "UNION");
    CHECK(stmt.selects[0].from->table->name == "amendment");
    CHECK(stmt.selects[2].from->table->name == "other");
}

TEST_CASE("SelectParser: expression kinds expose their columns", "[parser][expr]") {
    SelectParser parser;
    auto result = parser.parse(
        "SELECT COALESCE(a.Name, a.Title), "
        "CASE WHEN a.Status = 'X' THEN a.Amount ELSE 0 END "
        "FROM Amendment a "
        "WHERE a.Created BETWEEN 1 AND 2 AND a.Kind IN (1, 2) AND NOT a.Flag "
        "AND a.Deleted IS NULL "
        "GROUP BY a.Name HAVING COUNT(*) > 1 ORDER BY a.Name DESC");
    REQUIRE(result.success);

    auto& select = result.statement->selects[0];
    CHECK(columns_of(select) == std::vector<std::string>{
        "a.name", "a.title", "a.status", "a.amount",
        "a.created", "a.kind", "a.flag", "a.deleted",
        "a.name", "a.name"});
    REQUIRE(select.order_by.size() == 1);
    CHECK(select.order_by[0].descending);
}

TEST_CASE("SelectParser: AND chains fold left", "[parser][expr]") {
    SelectParser parser;
    auto result = parser.parse("SELECT 1 FROM t WHERE a = 1 AND b = 2 AND c = 3");
    REQUIRE(result.success);

    auto* where = result.statement->selects[0].where.get();
    REQUIRE(where);
    REQUIRE(std::holds_alternative<ast::BinaryExpr>(where->node));
    auto& top = std::get<ast::BinaryExpr>(where->node);
    CHECK(top.op == "AND");
    REQUIRE(std::holds_alternative<ast::BinaryExpr>(top.left->node));
    CHECK(std::get<ast::BinaryExpr>(top.left->node).op == "AND");
    REQUIRE(std::holds_alternative<ast::BinaryExpr>(top.right->node));
    CHECK(std::get<ast::BinaryExpr>(top.right->node).op == "=");
}

TEST_CASE("SelectParser: subquery columns stay out of scope", "[parser][expr]") {
    SelectParser parser;
    auto result = parser.parse("SELECT a.Id FROM Amendment a WHERE a.Id IN (SELECT b.Id FROM B b)");
    REQUIRE(result.success);
    CHECK(columns_of(result.statement->selects[0]) == std::vector<std::string>{"a.id", "a.id"});
}

TEST_CASE("SelectParser: error codes", "[parser][error]") {
    SelectParser parser;

    auto empty = parser.parse("   ");
    CHECK_FALSE(empty.success);
    CHECK(empty.error_code == SelectParser::ErrorCode::EMPTY_QUERY);

    auto syntax = parser.parse("SELEC a FROM");
    CHECK_FALSE(syntax.success);
    CHECK(syntax.error_code == SelectParser::ErrorCode::SYNTAX_ERROR);
    CHECK_FALSE(syntax.error_message.empty());

    auto update = parser.parse("UPDATE t SET a = 1");
    CHECK(update.error_code == SelectParser::ErrorCode::UNSUPPORTED_STATEMENT);
    CHECK(update.error_message.find("UpdateStmt") != std::string::npos);

    auto multi = parser.parse("SELECT 1; SELECT 2");
    CHECK(multi.error_code == SelectParser::ErrorCode::MULTIPLE_STATEMENTS);

    auto with = parser.parse("WITH x AS (SELECT 1) SELECT * FROM x");
    CHECK(with.error_code == SelectParser::ErrorCode::UNSUPPORTED_STATEMENT);

    auto values = parser.parse("VALUES (1, 2)");
    CHECK(values.error_code == SelectParser::ErrorCode::UNSUPPORTED_STATEMENT);

    CHECK(std::string(error_code_name(SelectParser::ErrorCode::SYNTAX_ERROR)) == "SYNTAX_ERROR");
}

TEST_CASE("SelectParser: trailing semicolon is accepted", "[parser]") {
    SelectParser parser;
    CHECK(parser.parse("SELECT a FROM t;").success);
}
