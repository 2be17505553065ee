#pragma once

#include <glaze/glaze.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlmigrator {

/**
 * @brief Read-only navigation over a glz::json_t document
 *
 * Used for libpg_query parse trees and the batch input files. Lookups
 * never throw: a missing member, a wrong type or an index past the end
 * yields a null value. Children are returned by value.
 */
class JsonValue {
public:
    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    [[nodiscard]] static JsonValue parse(std::string_view text) {
        glz::json_t doc;
        if (auto ec = glz::read_json(doc, text)) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(doc));
    }

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    // Element count of an array, member count of an object, else 0
    [[nodiscard]] size_t size() const {
        if (data_.is_array()) return data_.get_array().size();
        if (data_.is_object()) return data_.get_object().size();
        return 0;
    }
    [[nodiscard]] bool empty() const { return size() == 0; }

    [[nodiscard]] bool contains(std::string_view key) const { return member(key) != nullptr; }

    // Present and not null
    [[nodiscard]] bool has(std::string_view key) const {
        const auto* m = member(key);
        return m && !m->is_null();
    }

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        const auto* m = member(key);
        return m ? JsonValue(*m) : JsonValue{};
    }

    [[nodiscard]] JsonValue at(size_t idx) const {
        if (!data_.is_array() || idx >= data_.get_array().size()) return {};
        return JsonValue(data_.get_array()[idx]);
    }

    [[nodiscard]] std::string string_at(std::string_view key) const {
        const auto* m = member(key);
        return m && m->is_string() ? m->get<std::string>() : std::string{};
    }

    [[nodiscard]] bool bool_at(std::string_view key) const {
        const auto* m = member(key);
        return m && m->is_boolean() && m->get<bool>();
    }

    // Array elements in order; empty for non-arrays
    [[nodiscard]] std::vector<JsonValue> elements() const {
        std::vector<JsonValue> out;
        if (!data_.is_array()) return out;
        out.reserve(data_.get_array().size());
        for (const auto& v : data_.get_array()) out.emplace_back(v);
        return out;
    }

    // Object members; empty for non-objects
    [[nodiscard]] std::vector<std::pair<std::string, JsonValue>> members() const {
        std::vector<std::pair<std::string, JsonValue>> out;
        if (!data_.is_object()) return out;
        for (const auto& [k, v] : data_.get_object()) out.emplace_back(k, JsonValue(v));
        return out;
    }

private:
    [[nodiscard]] const glz::json_t* member(std::string_view key) const {
        if (!data_.is_object()) return nullptr;
        const auto& obj = data_.get_object();
        const auto it = obj.find(std::string(key));
        return it != obj.end() ? &it->second : nullptr;
    }

    glz::json_t data_{};
};

} // namespace sqlmigrator
