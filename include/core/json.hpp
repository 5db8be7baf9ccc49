#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace keygate {

/**
 * @brief Read-only view over a glz::json_t document
 *
 * Used for the JSON documents keygate consumes: OIDC discovery metadata,
 * JSON Web Key Sets, token endpoint responses and JSON config files.
 * Const operator[] returns copies; missing keys yield a null value.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

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
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    // node.value("key", default); a present key of the wrong type also yields the default
    template <typename T>
    [[nodiscard]] T value(std::string_view key, T default_value) const {
        const JsonValue node = (*this)[key];
        if constexpr (std::is_same_v<T, std::string>) {
            if (!node.is_string()) return default_value;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (!node.is_boolean()) return default_value;
        } else {
            if (!node.is_number()) return default_value;
        }
        return node.get<T>();
    }

    // String elements of an array member; non-string elements are skipped
    [[nodiscard]] std::vector<std::string> string_array(std::string_view key) const {
        std::vector<std::string> out;
        const JsonValue node = (*this)[key];
        if (!node.is_array()) return out;
        for (const auto& item : node.data_.get_array()) {
            if (item.is_string()) out.push_back(item.get<std::string>());
        }
        return out;
    }

    // Elements of an array member (empty when the member is absent or not an array)
    [[nodiscard]] std::vector<JsonValue> elements(std::string_view key) const {
        std::vector<JsonValue> out;
        const JsonValue node = (*this)[key];
        if (!node.is_array()) return out;
        for (const auto& item : node.data_.get_array()) {
            out.emplace_back(item);
        }
        return out;
    }

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

} // namespace keygate
