#include "migration/text_rewriter.hpp"
#include "migration/naming.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <optional>
#include <regex>
#include <unordered_set>

namespace sqlmigrator {

namespace {

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::icase;

// Words that can follow a table in FROM / JOIN without being its alias
constexpr std::string_view kClauseKeywords =
    "WHERE|JOIN|INNER|LEFT|RIGHT|FULL|OUTER|CROSS|NATURAL|ON|USING|GROUP|ORDER|"
    "HAVING|LIMIT|OFFSET|UNION|INTERSECT|EXCEPT|WINDOW|FETCH|FOR|AND|OR";

constexpr std::string_view kIdentifier = "[A-Za-z_]\\w*";

const std::string kEmpty;

/**
 * @brief Escaped alternation of names, longest first, case-insensitively distinct
 */
std::string alternation(std::vector<std::string> names) {
    std::stable_sort(names.begin(), names.end(),
        [](const std::string& a, const std::string& b) { return a.size() > b.size(); });

    std::string out;
    std::unordered_set<std::string> seen;
    for (const auto& name : names) {
        if (name.empty() || !seen.insert(utils::to_lower(name)).second) continue;
        if (!out.empty()) out += '|';
        out += utils::regex_escape(name);
    }
    return out;
}

[[nodiscard]] bool preceded_by_dot(const std::string& text, const std::smatch& m) {
    const auto pos = static_cast<size_t>(m.position(0));
    return pos > 0 && text[pos - 1] == '.';
}

[[nodiscard]] bool followed_by_dot(const std::string& text, const std::smatch& m) {
    const auto end = static_cast<size_t>(m.position(0) + m.length(0));
    return end < text.size() && text[end] == '.';
}

[[nodiscard]] std::pair<std::string, std::string> split_qualified(const std::string& value) {
    const auto dot = value.find('.');
    return {value.substr(0, dot), value.substr(dot + 1)};
}

/**
 * Per-rewrite state discovered while scanning the text
 */
struct RewriteState {
    RewritePlan plan;
    std::unordered_map<std::string, std::string> actual_aliases;   // lower(alias in text) -> source
    std::unordered_set<std::string> found_sources;                 // FROM / JOIN clause rewritten
    std::unordered_set<std::string> renamed;                       // lower(alias) + "." + lower(new column)
};

// ============================================================================
// Step C: FROM / JOIN clauses and synthesized joins
// ============================================================================

std::string rewrite_from_join(const std::string& text, RewriteState& st) {
    std::vector<std::string> sources;
    for (const auto& sp : st.plan.sources) {
        sources.push_back(sp.source);
    }
    if (sources.empty()) return text;

    // One pass over every source so chained mappings (A -> B, B -> C) apply once
    const std::regex re(std::format(
        "\\b(FROM|JOIN)(\\s+)({})\\b(?:\\s+(?:AS\\s+)?(?!(?:{})\\b)({}))?",
        alternation(sources), kClauseKeywords, kIdentifier), kRegexFlags);

    return utils::regex_replace_each(text, re, [&](const std::smatch& m) -> std::optional<std::string> {
        if (preceded_by_dot(text, m)) return std::nullopt;

        const SourcePlan* sp = st.plan.find_source(m[3].str());
        if (!sp) return std::nullopt;

        // Unaliased tables are qualified by their own name
        const std::string actual = m[4].matched ? m[4].str() : m[3].str();
        st.actual_aliases[utils::to_lower(actual)] = sp->source;
        st.found_sources.insert(sp->source);

        const std::string& primary = sp->targets.front();
        return m[1].str() + m[2].str() + primary + " " + st.plan.alias_for(primary);
    });
}

std::string insert_joins(const std::string& text, const std::vector<std::string>& joins) {
    static const std::regex where_re("\\bWHERE\\b", kRegexFlags);
    static const std::regex clause_re("\\b(?:GROUP\\s+BY|HAVING|ORDER\\s+BY|LIMIT)\\b", kRegexFlags);

    std::smatch m;
    if (std::regex_search(text, m, where_re) || std::regex_search(text, m, clause_re)) {
        const auto pos = static_cast<size_t>(m.position(0));
        const size_t newline = pos == 0 ? std::string::npos : text.rfind('\n', pos - 1);
        const size_t line_start = newline == std::string::npos ? 0 : newline + 1;
        const std::string indent = text.substr(line_start, pos - line_start);
        const bool starts_line = newline != std::string::npos
            && indent.find_first_not_of(" \t") == std::string::npos;

        std::string insertion;
        for (const auto& join : joins) {
            insertion += starts_line ? join + "\n" + indent : join + " ";
        }
        return text.substr(0, pos) + insertion + text.substr(pos);
    }

    // No anchor clause: append before trailing whitespace / ';'
    size_t content_end = text.find_last_not_of(" \t\r\n");
    if (content_end == std::string::npos) return text;
    if (text[content_end] == ';') {
        const size_t before = content_end == 0 ? std::string::npos
                                               : text.find_last_not_of(" \t\r\n", content_end - 1);
        content_end = before == std::string::npos ? 0 : before + 1;
    } else {
        ++content_end;
    }

    const std::string separator = text.find('\n') != std::string::npos ? "\n" : " ";
    std::string insertion;
    for (const auto& join : joins) {
        insertion += separator + join;
    }
    return text.substr(0, content_end) + insertion + text.substr(content_end);
}

std::string synthesize_joins(const std::string& text, const RewriteState& st) {
    std::vector<std::string> joins;
    for (const auto& sp : st.plan.sources) {
        if (sp.targets.size() < 2 || !st.found_sources.contains(sp.source)) continue;

        const std::string& primary = sp.targets.front();
        const std::string& primary_alias = st.plan.alias_for(primary);
        const std::string id_column = st.plan.id_column(sp);
        const std::string foreign_key = naming::singularize(primary) + naming::capitalize(id_column);

        for (size_t i = 1; i < sp.targets.size(); ++i) {
            const std::string& secondary = sp.targets[i];
            const std::string& alias = st.plan.alias_for(secondary);
            joins.push_back(std::format("JOIN {} {} ON {}.{} = {}.{}",
                secondary, alias, primary_alias, id_column, alias, foreign_key));
        }
    }
    return joins.empty() ? text : insert_joins(text, joins);
}

// ============================================================================
// Step D: old alias prefixes
// ============================================================================

std::string rewrite_alias_prefixes(const std::string& text, const RewriteState& st) {
    if (st.plan.multi_target || st.actual_aliases.empty()) return text;

    std::vector<std::string> aliases;
    for (const auto& [alias, source] : st.actual_aliases) {
        aliases.push_back(alias);
    }

    const std::regex re(std::format("\\b({})\\s*\\.", alternation(aliases)), kRegexFlags);
    return utils::regex_replace_each(text, re, [&](const std::smatch& m) -> std::optional<std::string> {
        if (preceded_by_dot(text, m)) return std::nullopt;

        const auto it = st.actual_aliases.find(utils::to_lower(m[1].str()));
        if (it == st.actual_aliases.end()) return std::nullopt;
        const SourcePlan* sp = st.plan.find_source(it->second);
        if (!sp) return std::nullopt;
        return st.plan.alias_for(sp->targets.front()) + ".";
    });
}

// ============================================================================
// Step E: per-column routing and alias-style identifiers
// ============================================================================

std::string route_columns(const std::string& text, RewriteState& st) {
    std::vector<ColumnReplacement> entries = st.plan.columns;
    std::stable_sort(entries.begin(), entries.end(),
        [](const ColumnReplacement& a, const ColumnReplacement& b) { return a.key.size() > b.key.size(); });

    struct Route {
        std::string alias;
        std::string column;     // empty: keep the column as written
    };
    // lower(qualifier) + "." + lower(column) -> route; the first claim of a key wins
    std::unordered_map<std::string, Route> routes;
    std::vector<std::string> qualifiers;
    std::vector<std::string> columns;

    auto claim = [&](const std::string& qualifier, const std::string& column, Route route) {
        if (routes.try_emplace(utils::to_lower(qualifier) + "." + utils::to_lower(column),
                               std::move(route)).second) {
            qualifiers.push_back(qualifier);
            columns.push_back(column);
        }
    };

    // <actual alias | old table>.<old column>
    for (const auto& c : entries) {
        const std::string& alias = st.plan.alias_for(c.new_table);
        if (alias.empty()) continue;
        const bool renamed = !utils::iequals(c.old_column, c.new_column);
        const Route route{alias, renamed ? c.new_column : std::string{}};

        claim(c.old_table, c.old_column, route);
        for (const auto& [actual, source] : st.actual_aliases) {
            if (source == c.old_table) claim(actual, c.old_column, route);
        }
        if (renamed) {
            st.renamed.insert(utils::to_lower(alias) + "." + utils::to_lower(c.new_column));
        }
    }
    // Leftovers of the alias-prefix pass: <new alias>.<old column>
    for (const auto& c : entries) {
        const std::string& alias = st.plan.alias_for(c.new_table);
        if (alias.empty() || utils::iequals(c.old_column, c.new_column)) continue;
        claim(alias, c.old_column, Route{alias, c.new_column});
    }
    // <new table>.<new column>
    for (const auto& c : entries) {
        const std::string& alias = st.plan.alias_for(c.new_table);
        if (alias.empty()) continue;
        claim(c.new_table, c.new_column, Route{alias, {}});
    }
    if (routes.empty()) return text;

    // A single pass, so a column written by one entry is never matched by another
    const std::regex re(std::format("\\b({})\\s*\\.\\s*({})\\b",
        alternation(qualifiers), alternation(columns)), kRegexFlags);

    return utils::regex_replace_each(text, re, [&](const std::smatch& m) -> std::optional<std::string> {
        if (preceded_by_dot(text, m)) return std::nullopt;
        const auto it = routes.find(utils::to_lower(m[1].str()) + "." + utils::to_lower(m[2].str()));
        if (it == routes.end()) return std::nullopt;
        return it->second.alias + "." + (it->second.column.empty() ? m[2].str() : it->second.column);
    });
}

std::string rewrite_identifiers(const std::string& text, const RewritePlan& plan) {
    std::unordered_map<std::string, std::string> lookup;
    std::vector<std::string> olds;
    for (const auto& [old_id, new_id] : plan.identifiers) {
        if (utils::iequals(old_id, new_id)) continue;
        if (lookup.try_emplace(utils::to_lower(old_id), new_id).second) {
            olds.push_back(old_id);
        }
    }
    if (olds.empty()) return text;

    const std::regex re(std::format("\\b({})\\b", alternation(olds)), kRegexFlags);
    return utils::regex_replace_each(text, re, [&](const std::smatch& m) -> std::optional<std::string> {
        if (preceded_by_dot(text, m) || followed_by_dot(text, m)) return std::nullopt;
        const auto it = lookup.find(utils::to_lower(m[1].str()));
        if (it == lookup.end()) return std::nullopt;
        return it->second;
    });
}

// ============================================================================
// Step F: AS aliases
// ============================================================================

std::string rewrite_as_aliases(const std::string& text, const RewriteState& st) {
    // Aliases introduced by Step C -> their target table
    std::unordered_map<std::string, std::string> alias_targets;
    for (const auto& sp : st.plan.sources) {
        if (!st.found_sources.contains(sp.source)) continue;
        for (const auto& target : sp.targets) {
            alias_targets.try_emplace(utils::to_lower(st.plan.alias_for(target)), target);
        }
    }
    if (alias_targets.empty()) return text;

    static const std::regex re(std::format("\\b({0})(\\s*\\.\\s*)({0})(\\s+AS\\s+)({0})\\b", kIdentifier),
                               kRegexFlags);

    return utils::regex_replace_each(text, re, [&](const std::smatch& m) -> std::optional<std::string> {
        if (preceded_by_dot(text, m)) return std::nullopt;

        const std::string alias = utils::to_lower(m[1].str());
        const auto it = alias_targets.find(alias);
        if (it == alias_targets.end()) return std::nullopt;

        const std::string column = m[3].str();
        const std::string reference = m[1].str() + m[2].str() + column;
        if (st.renamed.contains(alias + "." + utils::to_lower(column))) {
            return reference;
        }
        return reference + m[4].str()
            + naming::capitalize(naming::singularize(it->second)) + naming::capitalize(column);
    });
}

} // namespace

// ============================================================================
// RewritePlan
// ============================================================================

const SourcePlan* RewritePlan::find_source(std::string_view table) const {
    const std::string key = utils::to_lower(table);
    for (const auto& sp : sources) {
        if (sp.source == key) return &sp;
    }
    return nullptr;
}

const std::string& RewritePlan::alias_for(std::string_view target) const {
    const auto it = aliases.find(utils::to_lower(target));
    return it != aliases.end() ? it->second : kEmpty;
}

std::string RewritePlan::id_column(const SourcePlan& source) const {
    const std::string& primary = source.targets.front();
    for (const auto& c : columns) {
        if (c.old_table == source.source && utils::iequals(c.old_column, "id")
            && utils::iequals(c.new_table, primary)) {
            return c.new_column;
        }
    }
    return "Id";
}

// ============================================================================
// FormattingRewriter
// ============================================================================

RewritePlan FormattingRewriter::plan(const ReplacementLog& log) {
    RewritePlan result;

    auto add_target = [&result](const std::string& source, const std::string& target) {
        if (target.empty()) return;
        auto it = std::find_if(result.sources.begin(), result.sources.end(),
            [&](const SourcePlan& sp) { return sp.source == source; });
        if (it == result.sources.end()) {
            result.sources.push_back(SourcePlan{source, {}});
            it = std::prev(result.sources.end());
        }
        const bool known = std::any_of(it->targets.begin(), it->targets.end(),
            [&](const std::string& t) { return utils::iequals(t, target); });
        if (!known) {
            it->targets.push_back(target);
        }
    };

    // Step A: table-only entries first, then the targets of qualified entries
    for (const auto& [key, value] : log) {
        if (key.find('.') == std::string::npos) {
            add_target(utils::to_lower(key), value);
        }
    }
    for (const auto& [key, value] : log) {
        if (key.find('.') == std::string::npos || value.find('.') == std::string::npos) continue;

        auto [old_table, old_column] = split_qualified(key);
        auto [new_table, new_column] = split_qualified(value);
        if (old_table.empty() || old_column.empty() || new_table.empty() || new_column.empty()) continue;

        result.identifiers.emplace_back(naming::identifier_pair(old_table, old_column),
                                      naming::identifier_pair(new_table, new_column));
        add_target(utils::to_lower(old_table), new_table);
        result.columns.push_back(ColumnReplacement{key, utils::to_lower(old_table),
            std::move(old_column), std::move(new_table), std::move(new_column)});
    }

    // Step B: aliases, shorter target names first
    for (auto& sp : result.sources) {
        sp.targets = naming::assign_aliases(std::move(sp.targets), result.aliases);
        if (sp.targets.size() > 1) {
            result.multi_target = true;
        }
    }
    return result;
}

std::string FormattingRewriter::rewrite(const std::string& original, const ReplacementLog& log) {
    if (log.empty()) return original;

    RewriteState st;
    st.plan = plan(log);

    std::string result = rewrite_from_join(original, st);
    result = synthesize_joins(result, st);
    result = rewrite_alias_prefixes(result, st);
    result = route_columns(result, st);
    result = rewrite_identifiers(result, st.plan);
    result = rewrite_as_aliases(result, st);
    return result;
}

} // namespace sqlmigrator
