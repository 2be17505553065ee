#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sqlmigrator::ast {

// ============================================================================
// Expressions (closed sum type)
// ============================================================================

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

/**
 * @brief Column reference; qualifier is the table name or alias
 * ("" for an unqualified column)
 */
struct ColumnRef {
    std::string qualifier;
    std::string column;
};

/**
 * @brief Comparison, arithmetic, LIKE, AND / OR (left-associative chains)
 */
struct BinaryExpr {
    std::string op;
    ExprPtr left;
    ExprPtr right;
};

/**
 * @brief NOT, IS [NOT] NULL, IS TRUE, casts, unary minus
 */
struct UnaryExpr {
    std::string op;
    ExprPtr operand;
};

struct FunctionCall {
    std::string name;
    std::vector<ExprPtr> args;
};

struct BetweenExpr {
    ExprPtr operand;
    ExprPtr lower;
    ExprPtr upper;
    bool negated = false;
};

/**
 * @brief x IN (...); values is empty for IN (subquery)
 */
struct InExpr {
    ExprPtr operand;
    std::vector<ExprPtr> values;
    bool negated = false;
};

/**
 * @brief Parenthesized expression list / row constructor
 */
struct ExprList {
    std::vector<ExprPtr> items;
};

struct CaseExpr {
    ExprPtr operand;                                 // CASE <operand> WHEN ...; may be null
    std::vector<std::pair<ExprPtr, ExprPtr>> whens;  // (condition, result)
    ExprPtr otherwise;                               // may be null
};

/**
 * @brief Leaf with no column references: constants, parameters, '*',
 * subqueries (opaque scope)
 */
struct Literal {
    std::string kind;
    std::string text;
};

struct Expr {
    using Node = std::variant<ColumnRef, BinaryExpr, UnaryExpr, FunctionCall,
                              BetweenExpr, InExpr, ExprList, CaseExpr, Literal>;
    Node node;

    template<typename T>
    explicit Expr(T&& n) : node(std::forward<T>(n)) {}
};

template<typename T>
[[nodiscard]] ExprPtr make_expr(T&& node) {
    return std::make_unique<Expr>(std::forward<T>(node));
}

// ============================================================================
// FROM items and SELECT blocks
// ============================================================================

struct TableRef {
    std::string schema;
    std::string name;
    std::string alias;      // "" when the table is unaliased
};

/**
 * @brief FROM / JOIN item; table is empty for subqueries and table functions
 */
struct FromItem {
    std::optional<TableRef> table;
};

struct JoinClause {
    std::string join_type;      // INNER, LEFT, RIGHT, FULL, CROSS, COMMA
    FromItem right;
    std::vector<ExprPtr> on;
};

struct SelectItem {
    ExprPtr expr;
    std::string alias;
};

struct OrderItem {
    ExprPtr expr;
    bool descending = false;
};

struct PlainSelect {
    std::vector<SelectItem> select_items;
    std::optional<FromItem> from;
    std::vector<JoinClause> joins;
    ExprPtr where;
    std::vector<ExprPtr> group_by;
    ExprPtr having;
    std::vector<OrderItem> order_by;
};

/**
 * @brief One SELECT statement: a single block, or the branches of a set
 * operation in source order with the operators between them
 * (operators.size() == selects.size() - 1)
 */
struct SelectStatement {
    std::vector<PlainSelect> selects;
    std::vector<std::string> operators;   // "UNION", "UNION ALL", "INTERSECT", "EXCEPT"

    [[nodiscard]] bool is_set_operation() const { return selects.size() > 1; }
};

// ============================================================================
// Column traversal
// ============================================================================

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

/**
 * @brief Call fn(ColumnRef&) for every column reachable through the node
 * kinds that can carry a table-qualified column: binary operands, list
 * items, function arguments, BETWEEN operand and bounds, the left operand
 * of IN, unary operands and every CASE part. Literals (including
 * subqueries) are leaves.
 */
template<typename Fn>
void for_each_column(Expr* expr, Fn& fn) {
    if (!expr) return;
    std::visit(overloaded{
        [&](ColumnRef& c) { fn(c); },
        [&](BinaryExpr& b) {
            for_each_column(b.left.get(), fn);
            for_each_column(b.right.get(), fn);
        },
        [&](UnaryExpr& u) { for_each_column(u.operand.get(), fn); },
        [&](FunctionCall& f) {
            for (auto& arg : f.args) for_each_column(arg.get(), fn);
        },
        [&](BetweenExpr& b) {
            for_each_column(b.operand.get(), fn);
            for_each_column(b.lower.get(), fn);
            for_each_column(b.upper.get(), fn);
        },
        [&](InExpr& in) { for_each_column(in.operand.get(), fn); },
        [&](ExprList& l) {
            for (auto& item : l.items) for_each_column(item.get(), fn);
        },
        [&](CaseExpr& c) {
            for_each_column(c.operand.get(), fn);
            for (auto& [cond, result] : c.whens) {
                for_each_column(cond.get(), fn);
                for_each_column(result.get(), fn);
            }
            for_each_column(c.otherwise.get(), fn);
        },
        [&](Literal&) {},
    }, expr->node);
}

/**
 * @brief Columns of the select list, WHERE, GROUP BY, HAVING and ORDER BY,
 * in that order (JOIN predicates are visited separately)
 */
template<typename Fn>
void for_each_clause_column(PlainSelect& select, Fn& fn) {
    for (auto& item : select.select_items) for_each_column(item.expr.get(), fn);
    for_each_column(select.where.get(), fn);
    for (auto& expr : select.group_by) for_each_column(expr.get(), fn);
    for_each_column(select.having.get(), fn);
    for (auto& item : select.order_by) for_each_column(item.expr.get(), fn);
}

} // namespace sqlmigrator::ast
