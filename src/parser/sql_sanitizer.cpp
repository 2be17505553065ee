#include "parser/sql_sanitizer.hpp"
#include "core/utils.hpp"

#include <regex>

namespace sqlmigrator {

std::string SqlSanitizer::sanitize(std::string_view sql) {
    if (sql.empty()) {
        return {};
    }

    std::string result = strip_control_chars(sql);
    result = normalize_line_endings(result);
    result = remove_trailing_commas(result);
    result = normalize_whitespace(result);
    return utils::trim(result);
}

std::string SqlSanitizer::strip_control_chars(std::string_view sql) {
    std::string result;
    result.reserve(sql.size());
    for (const char c : sql) {
        const auto uc = static_cast<unsigned char>(c);
        const bool control = (uc < 0x20 && c != '\t' && c != '\n' && c != '\r') || uc == 0x7F;
        if (!control) {
            result += c;
        }
    }
    return result;
}

std::string SqlSanitizer::normalize_line_endings(const std::string& sql) {
    std::string result;
    result.reserve(sql.size());
    for (size_t i = 0; i < sql.size(); ++i) {
        if (sql[i] == '\r') {
            result += '\n';
            if (i + 1 < sql.size() && sql[i + 1] == '\n') ++i;
        } else {
            result += sql[i];
        }
    }
    return result;
}

std::string SqlSanitizer::remove_trailing_commas(const std::string& sql) {
    static const std::regex kBeforeClause(
        R"(,\s*(FROM|WHERE|GROUP\s+BY|ORDER\s+BY|LIMIT|HAVING|UNION)\b)",
        std::regex::icase);
    static const std::regex kBeforeParen(R"(,\s*\))");

    std::string result = std::regex_replace(sql, kBeforeClause, "\n$1");
    return std::regex_replace(result, kBeforeParen, ")");
}

std::string SqlSanitizer::normalize_whitespace(const std::string& sql) {
    std::string result;
    result.reserve(sql.size());

    size_t line_start = 0;
    while (line_start <= sql.size()) {
        size_t line_end = sql.find('\n', line_start);
        if (line_end == std::string::npos) line_end = sql.size();
        const std::string_view line(sql.data() + line_start, line_end - line_start);

        const size_t content = line.find_first_not_of(" \t");
        if (content != std::string_view::npos) {
            if (content > 0) {
                result += "    ";
            }
            // Collapse interior space runs; tabs inside the line are kept
            bool prev_space = false;
            std::string body;
            for (const char c : line.substr(content)) {
                if (c == ' ') {
                    if (!prev_space) body += c;
                    prev_space = true;
                } else {
                    body += c;
                    prev_space = false;
                }
            }
            const size_t last = body.find_last_not_of(" \t");
            result.append(body, 0, last + 1);
        }

        if (line_end == sql.size()) break;
        result += '\n';
        line_start = line_end + 1;
    }
    return result;
}

} // namespace sqlmigrator
