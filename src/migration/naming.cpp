#include "migration/naming.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace sqlmigrator::naming {

namespace {

[[nodiscard]] bool ends_with_ci(std::string_view word, std::string_view suffix) {
    return word.size() >= suffix.size()
        && utils::iequals(word.substr(word.size() - suffix.size()), suffix);
}

} // namespace

std::string capitalize(std::string_view word) {
    std::string result = utils::to_lower(word);
    if (!result.empty()) {
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    }
    return result;
}

std::string singularize(std::string_view word) {
    std::string result(word);
    if (result.size() < 2) {
        return result;
    }

    if (ends_with_ci(word, "ies") && word.size() > 3) {
        result.resize(result.size() - 3);
        result += std::islower(static_cast<unsigned char>(word.back())) ? 'y' : 'Y';
        return result;
    }

    static constexpr std::string_view kEsSuffixes[] = {"sses", "shes", "ches", "xes", "zes", "uses"};
    for (const auto suffix : kEsSuffixes) {
        if (ends_with_ci(word, suffix) && word.size() > suffix.size()) {
            result.resize(result.size() - 2);
            return result;
        }
    }

    if (ends_with_ci(word, "ss") || ends_with_ci(word, "us") || ends_with_ci(word, "is")) {
        return result;
    }

    if (ends_with_ci(word, "s")) {
        result.pop_back();
    }
    return result;
}

std::string alias_prefix(std::string_view table) {
    const std::string cleaned = utils::trim(table);
    return utils::to_lower(std::string_view(cleaned).substr(0, std::min<size_t>(3, cleaned.size())));
}

std::string identifier_pair(std::string_view table, std::string_view column) {
    return capitalize(table) + capitalize(column);
}

std::vector<std::string> assign_aliases(std::vector<std::string> targets,
                                        std::unordered_map<std::string, std::string>& aliases) {
    std::stable_sort(targets.begin(), targets.end(),
        [](const std::string& a, const std::string& b) { return a.size() < b.size(); });

    std::unordered_set<std::string> taken;
    for (const auto& [target, alias] : aliases) {
        taken.insert(alias);
    }

    for (const auto& target : targets) {
        const std::string key = utils::to_lower(target);
        if (aliases.contains(key)) continue;

        const std::string prefix = alias_prefix(target);
        std::string alias = prefix;
        for (char suffix = 'a'; taken.contains(alias) && suffix <= 'z'; ++suffix) {
            alias = prefix + suffix;
        }
        taken.insert(alias);
        aliases.emplace(key, std::move(alias));
    }
    return targets;
}

} // namespace sqlmigrator::naming
