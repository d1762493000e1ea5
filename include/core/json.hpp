#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace nl2sql {

/**
 * @brief Read-only view over a parsed glz::json_t document
 *
 * The document is shared between all views derived from it, so element
 * access never copies subtrees. Used for the catalog document, the
 * libpg_query parse tree, LLM response bodies and memory imports.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return !node_ || node_->is_null(); }
    [[nodiscard]] bool is_object() const { return node_ && node_->is_object(); }
    [[nodiscard]] bool is_array() const { return node_ && node_->is_array(); }
    [[nodiscard]] bool is_string() const { return node_ && node_->is_string(); }
    [[nodiscard]] bool is_number() const { return node_ && node_->is_number(); }
    [[nodiscard]] bool is_boolean() const { return node_ && node_->is_boolean(); }

    [[nodiscard]] bool is_number_integer() const {
        if (!is_number()) return false;
        const double d = node_->get<double>();
        return std::isfinite(d) && d == std::floor(d);
    }

    // ===== Container Properties =====

    [[nodiscard]] size_t size() const {
        if (is_array()) return node_->get_array().size();
        if (is_object()) return node_->get_object().size();
        return 0;
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!is_object()) return false;
        const auto& obj = node_->get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Element Access =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!is_object()) return {};
        const auto& obj = node_->get_object();
        const auto it = obj.find(std::string(key));
        if (it == obj.end()) return {};
        return JsonValue(doc_, &it->second);
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!is_array()) return {};
        const auto& arr = node_->get_array();
        if (idx >= arr.size()) return {};
        return JsonValue(doc_, &arr[idx]);
    }

    [[nodiscard]] std::vector<JsonValue> elements() const {
        std::vector<JsonValue> out;
        if (!is_array()) return out;
        const auto& arr = node_->get_array();
        out.reserve(arr.size());
        for (const auto& elem : arr) {
            out.push_back(JsonValue(doc_, &elem));
        }
        return out;
    }

    [[nodiscard]] std::vector<std::pair<std::string, JsonValue>> items() const {
        std::vector<std::pair<std::string, JsonValue>> out;
        if (!is_object()) return out;
        const auto& obj = node_->get_object();
        out.reserve(obj.size());
        for (const auto& [key, val] : obj) {
            out.emplace_back(key, JsonValue(doc_, &val));
        }
        return out;
    }

    // ===== Value Extraction =====

    /// Throws std::bad_variant_access when the node holds another type.
    template <typename T>
    [[nodiscard]] T get() const {
        if (!node_) throw std::bad_variant_access();
        if constexpr (std::is_same_v<T, std::string>) {
            return node_->get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return node_->get<bool>();
        } else if constexpr (std::is_floating_point_v<T>) {
            return static_cast<T>(node_->get<double>());
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores every number as double
            return static_cast<T>(node_->get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    /// Member lookup with a default for missing or differently-typed values.
    template <typename T>
    [[nodiscard]] T value(std::string_view key, T default_value) const {
        const JsonValue child = (*this)[key];
        if constexpr (std::is_same_v<T, std::string>) {
            return child.is_string() ? child.get<std::string>() : default_value;
        } else if constexpr (std::is_same_v<T, bool>) {
            return child.is_boolean() ? child.get<bool>() : default_value;
        } else if constexpr (std::is_arithmetic_v<T>) {
            return child.is_number() ? child.get<T>() : default_value;
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::value<T>()");
        }
    }

    std::string value(std::string_view key, const char* default_value) const {
        return value<std::string>(key, std::string(default_value));
    }

    // ===== Parsing =====

    [[nodiscard]] static JsonValue parse(std::string_view text) {
        auto doc = std::make_shared<glz::json_t>();
        const std::string buffer(text);
        const auto ec = glz::read_json(*doc, buffer);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        const glz::json_t* root = doc.get();
        return JsonValue(std::move(doc), root);
    }

private:
    JsonValue(std::shared_ptr<const glz::json_t> doc, const glz::json_t* node)
        : doc_(std::move(doc)), node_(node) {}

    std::shared_ptr<const glz::json_t> doc_;
    const glz::json_t* node_ = nullptr;
};

} // namespace nl2sql
