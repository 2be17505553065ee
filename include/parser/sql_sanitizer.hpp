#pragma once

#include <string>
#include <string_view>

namespace sqlmigrator {

/**
 * @brief Normalizes pasted SQL before a structural parse attempt
 *
 * The sanitized text only feeds the parser; rewriting always works on the
 * original text. Transformations, in order:
 * 1. Drop control characters other than tab / newline / carriage return
 * 2. Normalize line endings to \n
 * 3. Remove a trailing comma before FROM, WHERE, GROUP BY, ORDER BY, LIMIT,
 *    HAVING or UNION (the comma and following whitespace become one \n)
 * 4. Remove a trailing comma before ')'
 * 5. Indented lines get a fixed 4-space indent; interior space runs collapse
 * 6. Strip trailing whitespace per line, then trim the whole text
 *
 * Never throws.
 */
class SqlSanitizer {
public:
    [[nodiscard]] static std::string sanitize(std::string_view sql);

private:
    static std::string strip_control_chars(std::string_view sql);
    static std::string normalize_line_endings(const std::string& sql);
    static std::string remove_trailing_commas(const std::string& sql);
    static std::string normalize_whitespace(const std::string& sql);
};

} // namespace sqlmigrator
