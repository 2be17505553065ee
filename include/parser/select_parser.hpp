#pragma once

#include "parser/select_ast.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace sqlmigrator {

/**
 * @brief SELECT parser - wraps libpg_query (PostgreSQL's parser)
 *
 * Parses one SELECT statement (including UNION / INTERSECT / EXCEPT
 * chains) into the ast::SelectStatement tree used by the structural
 * migrator. Anything else is reported as a failed ParseResult, never as
 * an exception, so the caller can branch to the fallback rewriter.
 *
 * PostgreSQL folds unquoted identifiers to lower case; names in the
 * resulting tree are therefore lower-cased unless they were quoted.
 *
 * Thread-safety: stateless, safe for concurrent use
 */
class SelectParser {
public:
    enum class ErrorCode {
        SUCCESS = 0,
        EMPTY_QUERY,
        SYNTAX_ERROR,
        UNSUPPORTED_STATEMENT,
        MULTIPLE_STATEMENTS,
        PARSER_INTERNAL_ERROR
    };

    struct ParseResult {
        bool success;
        ErrorCode error_code;
        std::string error_message;
        std::shared_ptr<ast::SelectStatement> statement;

        ParseResult()
            : success(false), error_code(ErrorCode::SUCCESS) {}

        static ParseResult ok(std::shared_ptr<ast::SelectStatement> stmt) {
            ParseResult result;
            result.success = true;
            result.error_code = ErrorCode::SUCCESS;
            result.statement = std::move(stmt);
            return result;
        }

        static ParseResult error(ErrorCode code, std::string message) {
            ParseResult result;
            result.success = false;
            result.error_code = code;
            result.error_message = std::move(message);
            return result;
        }
    };

    SelectParser() = default;

    /**
     * @brief Parse a single SELECT statement
     * @param sql SQL text (already sanitized by the caller)
     * @return Parse result with the statement tree or error
     */
    [[nodiscard]] ParseResult parse(std::string_view sql) const;
};

[[nodiscard]] const char* error_code_name(SelectParser::ErrorCode code);

} // namespace sqlmigrator
