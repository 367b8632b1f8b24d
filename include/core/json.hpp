#pragma once

#include <glaze/glaze.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace nlsql {

/**
 * @brief Read-only view over glz::json_t with an nlohmann-style API
 *
 * Used for parsing model answers and recorded fragment streams.
 * Const operator[] returns copies; missing keys yield null.
 */
class JsonValue {
public:
    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    /// String member or default when missing / not a string
    [[nodiscard]] std::string string_or(std::string_view key, std::string default_value) const {
        const JsonValue node = (*this)[key];
        return node.is_string() ? node.get<std::string>() : std::move(default_value);
    }

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

private:
    glz::json_t data_{};
};

} // namespace nlsql
