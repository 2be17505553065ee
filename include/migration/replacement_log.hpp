#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sqlmigrator {

/**
 * @brief Insertion-ordered old -> new reference map
 *
 * Keys are either a bare table name ("amendment") or a qualified column
 * ("amendment.name"). Re-putting an existing key overwrites its value in
 * place, so the key keeps its first position. Iteration follows insertion
 * order. Created per query, never shared.
 */
class ReplacementLog {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    void put(const std::string& key, std::string value) {
        const auto it = index_.find(key);
        if (it != index_.end()) {
            entries_[it->second].second = std::move(value);
            return;
        }
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, std::move(value));
    }

    [[nodiscard]] const std::string* find(const std::string& key) const {
        const auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return index_.contains(key);
    }

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const { return entries_.end(); }

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace sqlmigrator
