#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace bqlineage {

/**
 * @brief Thin wrapper around glz::json_t for navigating audit record payloads
 *
 * Stores json_t by value. Const operator[] returns copies, so a lookup on a
 * missing key (or on a non-object) yields a null value instead of throwing.
 * Path helpers report the first missing key of a nested lookup, which is what
 * the record parser surfaces in its failures.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}
    JsonValue(std::nullptr_t) {}
    JsonValue(bool v) { data_ = v; }
    JsonValue(int v) { data_ = static_cast<double>(v); }
    JsonValue(double v) { data_ = v; }
    JsonValue(const char* v) { data_ = std::string(v); }
    JsonValue(const std::string& v) { data_ = v; }
    JsonValue(std::string&& v) { data_ = std::move(v); }

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }

    // ===== Container Properties =====

    [[nodiscard]] bool empty() const { return data_.empty(); }
    [[nodiscard]] size_t size() const { return data_.size(); }
    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    // ===== Path Access =====

    /**
     * @brief Walk nested objects along keys.
     * @return First key that is absent (or null), nullopt when the whole path exists
     */
    [[nodiscard]] std::optional<std::string> first_missing_key(
        std::initializer_list<std::string_view> keys) const {
        const glz::json_t* node = &data_;
        for (const auto key : keys) {
            if (!node->is_object()) return std::string(key);
            const auto& obj = node->get_object();
            auto it = obj.find(std::string(key));
            if (it == obj.end() || it->second.is_null()) return std::string(key);
            node = &it->second;
        }
        return std::nullopt;
    }

    // Value at the end of the path, null if any step is missing
    [[nodiscard]] JsonValue at_path(std::initializer_list<std::string_view> keys) const {
        const glz::json_t* node = &data_;
        for (const auto key : keys) {
            if (!node->is_object()) return {};
            const auto& obj = node->get_object();
            auto it = obj.find(std::string(key));
            if (it == obj.end()) return {};
            node = &it->second;
        }
        return JsonValue(*node);
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
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    // String at key, nullopt when absent or not a string
    [[nodiscard]] std::optional<std::string> string_at(std::string_view key) const {
        const auto v = (*this)[key];
        if (!v.is_string()) return std::nullopt;
        return v.get<std::string>();
    }

    /**
     * @brief Whole number that fits in int64_t.
     * json_t stores every number as a double; NaN, infinities, fractions and
     * out-of-range values yield nullopt instead of an undefined conversion.
     */
    [[nodiscard]] std::optional<int64_t> as_int64() const {
        if (!data_.is_number()) return std::nullopt;
        const double d = data_.get<double>();
        // 2^63 is exactly representable; INT64_MAX is not
        constexpr double kUpper = 9223372036854775808.0;
        if (!std::isfinite(d) || d != std::trunc(d) || d < -kUpper || d >= kUpper) {
            return std::nullopt;
        }
        return static_cast<int64_t>(d);
    }

    // ===== Unified Iterator (arrays + objects) =====

    class const_iterator {
        friend class JsonValue;
        enum class Kind { ARRAY, OBJECT, END };

        Kind kind_ = Kind::END;
        const array_t* arr_ = nullptr;
        size_t arr_idx_ = 0;
        object_t::const_iterator obj_it_{};

        const_iterator(const array_t* arr, size_t idx)
            : kind_(Kind::ARRAY), arr_(arr), arr_idx_(idx) {}
        const_iterator(object_t::const_iterator it, Kind /*tag*/)
            : kind_(Kind::OBJECT), obj_it_(it) {}
        const_iterator() = default;

    public:
        [[nodiscard]] JsonValue operator*() const {
            if (kind_ == Kind::ARRAY) return JsonValue((*arr_)[arr_idx_]);
            if (kind_ == Kind::OBJECT) return JsonValue(obj_it_->second);
            return {};
        }

        const_iterator& operator++() {
            if (kind_ == Kind::ARRAY) ++arr_idx_;
            else if (kind_ == Kind::OBJECT) ++obj_it_;
            return *this;
        }

        [[nodiscard]] bool operator==(const const_iterator& o) const {
            if (kind_ != o.kind_) return false;
            if (kind_ == Kind::ARRAY) return arr_idx_ == o.arr_idx_;
            if (kind_ == Kind::OBJECT) return obj_it_ == o.obj_it_;
            return true; // both END
        }

        [[nodiscard]] bool operator!=(const const_iterator& o) const { return !(*this == o); }
    };

    [[nodiscard]] const_iterator begin() const {
        if (data_.is_array()) {
            const auto& arr = data_.get_array();
            return const_iterator(&arr, 0);
        }
        if (data_.is_object()) {
            const auto& obj = data_.get_object();
            return const_iterator(obj.begin(), const_iterator::Kind::OBJECT);
        }
        return {};
    }

    [[nodiscard]] const_iterator end() const {
        if (data_.is_array()) {
            const auto& arr = data_.get_array();
            return const_iterator(&arr, arr.size());
        }
        if (data_.is_object()) {
            const auto& obj = data_.get_object();
            return const_iterator(obj.end(), const_iterator::Kind::OBJECT);
        }
        return {};
    }

    // ===== Static Factories =====

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error(glz::format_error(ec, json_str));
        }
        return JsonValue(std::move(result));
    }

private:
    glz::json_t data_{};
};

} // namespace bqlineage
