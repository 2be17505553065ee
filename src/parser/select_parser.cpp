#include "parser/select_parser.hpp"
#include "parser/ast_keys.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

// libpg_query C API
extern "C" {
#include "pg_query.h"
}

#include <format>
#include <stdexcept>
#include <utility>
#include <vector>

namespace sqlmigrator {

using namespace ast;

namespace {

// Raised while building the tree for SELECT forms the migrator cannot
// represent (VALUES, SELECT INTO, WITH); mapped to UNSUPPORTED_STATEMENT.
struct UnsupportedSelect : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ============================================================================
// JSON helpers
// ============================================================================

// {"NodeType": {...}} -> ("NodeType", {...})
[[nodiscard]] std::pair<std::string, JsonValue> node_body(const JsonValue& node) {
    for (const auto& [key, value] : node.members()) {
        if (value.is_object()) {
            return {key, value};
        }
    }
    return {"", JsonValue{}};
}

// String node value; libpg_query v15+ uses "sval", older versions "str"
[[nodiscard]] std::string string_node(const JsonValue& node) {
    if (!node.has(pg::kString)) return {};
    const JsonValue str = node[pg::kString];
    std::string val = str.string_at(pg::kSval);
    if (val.empty()) val = str.string_at(pg::kStr);
    return val;
}

// List payloads appear either as a bare array or wrapped as {"List": {"items": [...]}}
[[nodiscard]] JsonValue list_items(const JsonValue& node) {
    if (node.is_array()) return node;
    if (node.has(pg::kList)) return node[pg::kList][pg::kItems];
    return {};
}

// Set-operation arms are SelectStmt bodies, wrapped or not depending on version
[[nodiscard]] JsonValue unwrap_select(const JsonValue& node) {
    if (node.has(pg::kSelectStmt)) return node[pg::kSelectStmt];
    return node;
}

// "SETOP_UNION" -> "UNION", "JOIN_LEFT" -> "LEFT"
[[nodiscard]] std::string enum_suffix(const std::string& value) {
    const auto pos = value.find('_');
    return pos == std::string::npos ? value : value.substr(pos + 1);
}

// ============================================================================
// Expressions
// ============================================================================

ExprPtr build_expr(const JsonValue& node);

std::vector<ExprPtr> build_expr_list(const JsonValue& nodes) {
    std::vector<ExprPtr> out;
    for (const auto& item : nodes.elements()) {
        if (auto expr = build_expr(item)) {
            out.push_back(std::move(expr));
        }
    }
    return out;
}

ExprPtr build_column_ref(const JsonValue& col) {
    std::vector<std::string> parts;
    bool star = false;
    for (const auto& field : col[pg::kFields].elements()) {
        if (field.has(pg::kAStar)) {
            star = true;
        } else {
            parts.push_back(string_node(field));
        }
    }

    if (star) {
        // t.* / *
        return make_expr(Literal{"star", parts.empty() ? "*" : parts.back() + ".*"});
    }
    if (parts.empty()) {
        return make_expr(Literal{"column", ""});
    }

    // schema.table.col keeps the table as qualifier
    ColumnRef ref;
    ref.column = parts.back();
    if (parts.size() >= 2) {
        ref.qualifier = parts[parts.size() - 2];
    }
    return make_expr(std::move(ref));
}

ExprPtr build_a_expr(const JsonValue& expr) {
    const std::string kind = expr.string_at(pg::kKind);
    std::string op;
    for (const auto& part : expr[pg::kName].elements()) {
        op = string_node(part);
    }

    if (kind.find("BETWEEN") != std::string::npos) {
        BetweenExpr between;
        between.operand = build_expr(expr[pg::kLexpr]);
        const JsonValue bounds = list_items(expr[pg::kRexpr]);
        between.lower = build_expr(bounds.at(0));
        between.upper = build_expr(bounds.at(1));
        between.negated = kind.find("NOT") != std::string::npos;
        return make_expr(std::move(between));
    }

    if (kind == "AEXPR_IN") {
        InExpr in;
        in.operand = build_expr(expr[pg::kLexpr]);
        in.values = build_expr_list(list_items(expr[pg::kRexpr]));
        in.negated = op == "<>";
        return make_expr(std::move(in));
    }

    if (!expr.has(pg::kLexpr)) {
        return make_expr(UnaryExpr{op, build_expr(expr[pg::kRexpr])});
    }

    // A_Expr's rexpr may itself be a list (e.g. = ANY(ARRAY[...]))
    const JsonValue rexpr = expr[pg::kRexpr];
    ExprPtr right = rexpr.is_array()
        ? make_expr(ExprList{build_expr_list(rexpr)})
        : build_expr(rexpr);
    return make_expr(BinaryExpr{op, build_expr(expr[pg::kLexpr]), std::move(right)});
}

ExprPtr build_bool_expr(const JsonValue& expr) {
    const std::string boolop = expr.string_at(pg::kBoolop);
    std::vector<ExprPtr> args = build_expr_list(expr[pg::kArgs]);

    if (boolop == "NOT_EXPR") {
        return make_expr(UnaryExpr{"NOT", args.empty() ? nullptr : std::move(args.front())});
    }
    if (args.empty()) {
        return nullptr;
    }

    // a AND b AND c -> ((a AND b) AND c)
    const std::string op = boolop == "OR_EXPR" ? "OR" : "AND";
    ExprPtr folded = std::move(args.front());
    for (size_t i = 1; i < args.size(); ++i) {
        folded = make_expr(BinaryExpr{op, std::move(folded), std::move(args[i])});
    }
    return folded;
}

ExprPtr build_func_call(const JsonValue& func) {
    FunctionCall call;
    for (const auto& part : func[pg::kFuncname].elements()) {
        call.name = string_node(part);  // last part; drops pg_catalog.
    }
    if (func.bool_at(pg::kAggStar)) {
        call.args.push_back(make_expr(Literal{"star", "*"}));
    }
    for (auto& arg : build_expr_list(func[pg::kArgs])) {
        call.args.push_back(std::move(arg));
    }
    return make_expr(std::move(call));
}

ExprPtr build_case(const JsonValue& ce) {
    CaseExpr out;
    out.operand = build_expr(ce[pg::kArg]);
    for (const auto& when : ce[pg::kArgs].elements()) {
        if (!when.has(pg::kCaseWhen)) continue;
        const JsonValue cw = when[pg::kCaseWhen];
        out.whens.emplace_back(build_expr(cw[pg::kExpr]), build_expr(cw[pg::kResult]));
    }
    out.otherwise = build_expr(ce[pg::kDefresult]);
    return make_expr(std::move(out));
}

ExprPtr build_expr(const JsonValue& node) {
    if (!node.is_object()) {
        return nullptr;
    }

    const auto [kind, body] = node_body(node);

    if (kind == pg::kColumnRef) return build_column_ref(body);
    if (kind == pg::kAExpr) return build_a_expr(body);
    if (kind == pg::kBoolExpr) return build_bool_expr(body);
    if (kind == pg::kFuncCall) return build_func_call(body);
    if (kind == pg::kCaseExpr) return build_case(body);

    if (kind == pg::kNullTest) {
        const std::string type = body.string_at(pg::kNullTestType);
        return make_expr(UnaryExpr{type == "IS_NOT_NULL" ? "IS NOT NULL" : "IS NULL",
                                   build_expr(body[pg::kArg])});
    }
    if (kind == pg::kBooleanTest) {
        return make_expr(UnaryExpr{body.string_at(pg::kBoolTestType), build_expr(body[pg::kArg])});
    }
    if (kind == pg::kTypeCast) {
        return make_expr(UnaryExpr{"CAST", build_expr(body[pg::kArg])});
    }
    if (kind == pg::kCoalesceExpr) {
        return make_expr(FunctionCall{"coalesce", build_expr_list(body[pg::kArgs])});
    }
    if (kind == pg::kMinMaxExpr) {
        const std::string name = body.string_at(pg::kMinMaxOp) == "IS_LEAST" ? "least" : "greatest";
        return make_expr(FunctionCall{name, build_expr_list(body[pg::kArgs])});
    }
    if (kind == pg::kRowExpr) {
        return make_expr(ExprList{build_expr_list(body[pg::kArgs])});
    }
    if (kind == pg::kList) {
        return make_expr(ExprList{build_expr_list(body[pg::kItems])});
    }
    if (kind == pg::kSubLink) {
        // x IN (SELECT ...): only the outer operand is in scope
        if (body.has(pg::kTestexpr)) {
            return make_expr(InExpr{build_expr(body[pg::kTestexpr]), {}, false});
        }
        return make_expr(Literal{"subquery", body.string_at(pg::kSubLinkType)});
    }
    if (kind == pg::kAConst) return make_expr(Literal{"const", ""});
    if (kind == pg::kParamRef) return make_expr(Literal{"param", ""});

    return make_expr(Literal{kind, ""});
}

// ============================================================================
// FROM clause
// ============================================================================

FromItem build_from_item(const JsonValue& node) {
    FromItem item;
    if (!node.has(pg::kRangeVar)) {
        return item;    // subquery, function, ...
    }

    const JsonValue rv = node[pg::kRangeVar];
    TableRef table;
    table.name = rv.string_at(pg::kRelname);
    table.schema = rv.string_at(pg::kSchemaname);

    if (rv.has(pg::kAliasFld)) {
        JsonValue alias = rv[pg::kAliasFld];
        if (alias.has(pg::kAlias)) {
            alias = alias[pg::kAlias];
        }
        table.alias = alias.string_at(pg::kAliasname);
    }

    item.table = std::move(table);
    return item;
}

// Flatten a JoinExpr tree into FROM item + ordered joins. The left arm
// inherits the incoming join context; the right arm takes this join's
// type and ON predicate.
void add_from_node(const JsonValue& node, PlainSelect& select,
                   const std::string& join_type, const JsonValue& quals) {
    if (node.has(pg::kJoinExpr)) {
        const JsonValue je = node[pg::kJoinExpr];
        add_from_node(je[pg::kLarg], select, join_type, quals);

        std::string type = enum_suffix(je.string_at(pg::kJoinType));
        if (type == "INNER" && !je.has(pg::kQuals)) {
            type = "CROSS";
        }
        add_from_node(je[pg::kRarg], select, type, je[pg::kQuals]);
        return;
    }

    FromItem item = build_from_item(node);
    if (!select.from) {
        select.from = std::move(item);
        return;
    }

    JoinClause join;
    join.join_type = join_type;
    join.right = std::move(item);
    if (auto on = build_expr(quals)) {
        join.on.push_back(std::move(on));
    }
    select.joins.push_back(std::move(join));
}

// ============================================================================
// SELECT blocks
// ============================================================================

PlainSelect build_plain_select(const JsonValue& body) {
    if (!list_items(body[pg::kValuesLists]).empty()) {
        throw UnsupportedSelect("VALUES lists are not supported");
    }
    if (body.has(pg::kIntoClause)) {
        throw UnsupportedSelect("SELECT INTO is not supported");
    }

    PlainSelect select;

    for (const auto& target : body[pg::kTargetList].elements()) {
        if (!target.has(pg::kResTarget)) continue;
        const JsonValue rt = target[pg::kResTarget];
        SelectItem item;
        item.expr = build_expr(rt[pg::kVal]);
        item.alias = rt.string_at(pg::kName);
        select.select_items.push_back(std::move(item));
    }

    for (const auto& from : body[pg::kFromClause].elements()) {
        add_from_node(from, select, "COMMA", JsonValue{});
    }

    select.where = build_expr(body[pg::kWhereClause]);
    select.group_by = build_expr_list(body[pg::kGroupClause]);
    select.having = build_expr(body[pg::kHaving]);

    for (const auto& sort : body[pg::kSortClause].elements()) {
        if (!sort.has(pg::kSortBy)) continue;
        const JsonValue sb = sort[pg::kSortBy];
        OrderItem item;
        item.expr = build_expr(sb[pg::kNode]);
        item.descending = sb.string_at(pg::kSortbyDir) == "SORTBY_DESC";
        select.order_by.push_back(std::move(item));
    }

    return select;
}

void build_select_body(const JsonValue& body, SelectStatement& out) {
    const std::string op = body.string_at(pg::kOp);
    if (op.empty() || op == "SETOP_NONE") {
        out.selects.push_back(build_plain_select(body));
        return;
    }

    build_select_body(unwrap_select(body[pg::kLarg]), out);
    std::string name = enum_suffix(op);
    if (body.bool_at(pg::kAll)) {
        name += " ALL";
    }
    out.operators.push_back(std::move(name));
    build_select_body(unwrap_select(body[pg::kRarg]), out);
}

} // namespace

// ============================================================================
// SelectParser
// ============================================================================

SelectParser::ParseResult SelectParser::parse(std::string_view sql) const {
    const std::string trimmed_sql = utils::trim(sql);
    if (trimmed_sql.empty()) {
        return ParseResult::error(ErrorCode::EMPTY_QUERY, "Empty SQL query");
    }

    PgQueryParseResult parse_result = pg_query_parse(trimmed_sql.c_str());

    // Early return: parse error
    if (parse_result.error) {
        std::string error_msg = parse_result.error->message
            ? parse_result.error->message
            : std::string(pg::kUnknownParseError);
        pg_query_free_parse_result(parse_result);
        return ParseResult::error(ErrorCode::SYNTAX_ERROR, std::move(error_msg));
    }

    if (!parse_result.parse_tree) {
        pg_query_free_parse_result(parse_result);
        return ParseResult::error(ErrorCode::PARSER_INTERNAL_ERROR, "Parser returned no tree");
    }

    const std::string tree(parse_result.parse_tree);
    pg_query_free_parse_result(parse_result);

    JsonValue root;
    try {
        root = JsonValue::parse(tree);
    } catch (const JsonValue::parse_error& e) {
        return ParseResult::error(ErrorCode::PARSER_INTERNAL_ERROR, e.what());
    }

    // Structure: {"version": N, "stmts": [{"stmt": {"SelectStmt": {...}}}]}
    const JsonValue stmts = root[pg::kStmts];
    if (!stmts.is_array() || stmts.empty()) {
        return ParseResult::error(ErrorCode::EMPTY_QUERY, "No statement found");
    }
    if (stmts.size() > 1) {
        return ParseResult::error(ErrorCode::MULTIPLE_STATEMENTS,
            std::format("Expected one statement, found {}", stmts.size()));
    }

    const auto [kind, body] = node_body(stmts.at(0)[pg::kStmt]);
    if (kind != pg::kSelectStmt) {
        return ParseResult::error(ErrorCode::UNSUPPORTED_STATEMENT,
            std::format("Only SELECT statements are supported (got {})",
                        kind.empty() ? "unknown" : kind));
    }
    if (body.has(pg::kWithClause)) {
        return ParseResult::error(ErrorCode::UNSUPPORTED_STATEMENT,
            "WITH clauses are not supported");
    }

    auto statement = std::make_shared<SelectStatement>();
    try {
        build_select_body(body, *statement);
    } catch (const UnsupportedSelect& e) {
        return ParseResult::error(ErrorCode::UNSUPPORTED_STATEMENT, e.what());
    }

    return ParseResult::ok(std::move(statement));
}

const char* error_code_name(SelectParser::ErrorCode code) {
    switch (code) {
        case SelectParser::ErrorCode::SUCCESS:               return "SUCCESS";
        case SelectParser::ErrorCode::EMPTY_QUERY:           return "EMPTY_QUERY";
        case SelectParser::ErrorCode::SYNTAX_ERROR:          return "SYNTAX_ERROR";
        case SelectParser::ErrorCode::UNSUPPORTED_STATEMENT: return "UNSUPPORTED_STATEMENT";
        case SelectParser::ErrorCode::MULTIPLE_STATEMENTS:   return "MULTIPLE_STATEMENTS";
        case SelectParser::ErrorCode::PARSER_INTERNAL_ERROR: return "PARSER_INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

} // namespace sqlmigrator
