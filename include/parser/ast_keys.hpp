#pragma once

#include <string_view>

namespace sqlmigrator::pg {

// libpg_query JSON parse-tree keys
inline constexpr std::string_view kStmts       = "stmts";
inline constexpr std::string_view kStmt        = "stmt";
inline constexpr std::string_view kSelectStmt  = "SelectStmt";

inline constexpr std::string_view kOp          = "op";
inline constexpr std::string_view kAll         = "all";
inline constexpr std::string_view kLarg        = "larg";
inline constexpr std::string_view kRarg        = "rarg";
inline constexpr std::string_view kTargetList  = "targetList";
inline constexpr std::string_view kFromClause  = "fromClause";
inline constexpr std::string_view kWhereClause = "whereClause";
inline constexpr std::string_view kGroupClause = "groupClause";
inline constexpr std::string_view kHaving      = "havingClause";
inline constexpr std::string_view kSortClause  = "sortClause";
inline constexpr std::string_view kValuesLists = "valuesLists";
inline constexpr std::string_view kIntoClause  = "intoClause";
inline constexpr std::string_view kWithClause  = "withClause";

inline constexpr std::string_view kResTarget   = "ResTarget";
inline constexpr std::string_view kVal         = "val";
inline constexpr std::string_view kName        = "name";
inline constexpr std::string_view kSortBy      = "SortBy";
inline constexpr std::string_view kNode        = "node";
inline constexpr std::string_view kSortbyDir   = "sortby_dir";

inline constexpr std::string_view kRangeVar    = "RangeVar";
inline constexpr std::string_view kRelname     = "relname";
inline constexpr std::string_view kSchemaname  = "schemaname";
inline constexpr std::string_view kAliasFld    = "alias";
inline constexpr std::string_view kAlias       = "Alias";
inline constexpr std::string_view kAliasname   = "aliasname";
inline constexpr std::string_view kJoinExpr    = "JoinExpr";
inline constexpr std::string_view kJoinType    = "jointype";
inline constexpr std::string_view kQuals       = "quals";

inline constexpr std::string_view kColumnRef   = "ColumnRef";
inline constexpr std::string_view kFields      = "fields";
inline constexpr std::string_view kString      = "String";
inline constexpr std::string_view kSval        = "sval";
inline constexpr std::string_view kStr         = "str";
inline constexpr std::string_view kAStar       = "A_Star";
inline constexpr std::string_view kAExpr       = "A_Expr";
inline constexpr std::string_view kKind        = "kind";
inline constexpr std::string_view kLexpr       = "lexpr";
inline constexpr std::string_view kRexpr       = "rexpr";
inline constexpr std::string_view kBoolExpr    = "BoolExpr";
inline constexpr std::string_view kBoolop      = "boolop";
inline constexpr std::string_view kArgs        = "args";
inline constexpr std::string_view kArg         = "arg";
inline constexpr std::string_view kFuncCall    = "FuncCall";
inline constexpr std::string_view kFuncname    = "funcname";
inline constexpr std::string_view kAggStar     = "agg_star";
inline constexpr std::string_view kList        = "List";
inline constexpr std::string_view kItems       = "items";
inline constexpr std::string_view kRowExpr     = "RowExpr";
inline constexpr std::string_view kNullTest    = "NullTest";
inline constexpr std::string_view kNullTestType = "nulltesttype";
inline constexpr std::string_view kBooleanTest = "BooleanTest";
inline constexpr std::string_view kBoolTestType = "booltesttype";
inline constexpr std::string_view kTypeCast    = "TypeCast";
inline constexpr std::string_view kCaseExpr    = "CaseExpr";
inline constexpr std::string_view kCaseWhen    = "CaseWhen";
inline constexpr std::string_view kExpr        = "expr";
inline constexpr std::string_view kResult      = "result";
inline constexpr std::string_view kDefresult   = "defresult";
inline constexpr std::string_view kCoalesceExpr = "CoalesceExpr";
inline constexpr std::string_view kMinMaxExpr  = "MinMaxExpr";
inline constexpr std::string_view kMinMaxOp    = "op";
inline constexpr std::string_view kSubLink     = "SubLink";
inline constexpr std::string_view kSubLinkType = "subLinkType";
inline constexpr std::string_view kTestexpr    = "testexpr";
inline constexpr std::string_view kAConst      = "A_Const";
inline constexpr std::string_view kParamRef    = "ParamRef";

// Common error messages
inline constexpr std::string_view kUnknownParseError = "Unknown parse error";

} // namespace sqlmigrator::pg
