#pragma once

/// @file value.hpp
/// @brief Dynamic value type held by the reactive store

#include "fwd.hpp"
#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace seedbed_state {

/// Alternative index of Value::Variant
enum class ValueType : std::uint8_t {
    Null = 0,
    Bool,
    Int,
    Float,
    String,
    Array,
    Object,
    Bytes,
};

[[nodiscard]] const char* value_type_name(ValueType type) noexcept;

class Value;

using ValueArray = std::vector<Value>;
using ValueObject = std::map<std::string, Value>;
using ValueBytes = std::vector<std::uint8_t>;

// =============================================================================
// Value
// =============================================================================

/// Anything a store key can hold.
///
/// Equality is structural over the whole tree. Int and Float are separate
/// alternatives, so Value(1) != Value(1.0). NaN compares equal to NaN, so
/// writing NaN over NaN is not a change.
class Value {
public:
    using Variant = std::variant<std::monostate, bool, std::int64_t, double, std::string,
                                 ValueArray, ValueObject, ValueBytes>;

    Value() = default;
    Value(bool v) : m_data(v) {}
    Value(int v) : m_data(std::int64_t{v}) {}
    Value(std::uint32_t v) : m_data(std::int64_t{v}) {}
    Value(std::int64_t v) : m_data(v) {}
    /// Values above INT64_MAX wrap
    Value(std::uint64_t v) : m_data(static_cast<std::int64_t>(v)) {}
    Value(float v) : m_data(double{v}) {}
    Value(double v) : m_data(v) {}
    Value(const char* v) : m_data(std::string(v)) {}
    Value(std::string v) : m_data(std::move(v)) {}
    Value(std::string_view v) : m_data(std::string(v)) {}
    Value(ValueArray v) : m_data(std::move(v)) {}
    Value(ValueObject v) : m_data(std::move(v)) {}
    Value(ValueBytes v) : m_data(std::move(v)) {}

    [[nodiscard]] static Value array(std::initializer_list<Value> values) { return ValueArray(values); }
    [[nodiscard]] static Value empty_array() { return ValueArray{}; }
    [[nodiscard]] static Value empty_object() { return ValueObject{}; }

    [[nodiscard]] ValueType type() const noexcept { return static_cast<ValueType>(m_data.index()); }
    [[nodiscard]] const char* type_name() const noexcept { return value_type_name(type()); }

    bool is_null() const noexcept { return holds<std::monostate>(); }
    bool is_bool() const noexcept { return holds<bool>(); }
    bool is_int() const noexcept { return holds<std::int64_t>(); }
    bool is_float() const noexcept { return holds<double>(); }
    bool is_numeric() const noexcept { return is_int() || is_float(); }
    bool is_string() const noexcept { return holds<std::string>(); }
    bool is_array() const noexcept { return holds<ValueArray>(); }
    bool is_object() const noexcept { return holds<ValueObject>(); }

    // Checked access; a wrong alternative throws std::bad_variant_access

    bool as_bool() const { return std::get<bool>(m_data); }
    std::int64_t as_int() const { return std::get<std::int64_t>(m_data); }
    double as_float() const { return std::get<double>(m_data); }
    /// Int widened to double, Float as is
    double as_numeric() const;
    const std::string& as_string() const { return std::get<std::string>(m_data); }
    const ValueArray& as_array() const { return std::get<ValueArray>(m_data); }
    const ValueObject& as_object() const { return std::get<ValueObject>(m_data); }
    const ValueBytes& as_bytes() const { return std::get<ValueBytes>(m_data); }

    // Probing access; a wrong alternative yields nullopt or nullptr

    std::optional<bool> try_bool() const noexcept { return copy_if<bool>(); }
    std::optional<std::int64_t> try_int() const noexcept { return copy_if<std::int64_t>(); }
    std::optional<double> try_float() const noexcept { return copy_if<double>(); }
    const std::string* try_string() const noexcept { return std::get_if<std::string>(&m_data); }
    const ValueArray* try_array() const noexcept { return std::get_if<ValueArray>(&m_data); }
    const ValueObject* try_object() const noexcept { return std::get_if<ValueObject>(&m_data); }

    /// Elements of an Array, Object or Bytes; 0 for scalars
    [[nodiscard]] std::size_t size() const noexcept;

    const Value& operator[](std::size_t index) const { return as_array().at(index); }
    const Value& operator[](const std::string& key) const { return as_object().at(key); }

    /// Object member or nullptr
    [[nodiscard]] const Value* get(const std::string& key) const;
    [[nodiscard]] bool contains(const std::string& key) const { return get(key) != nullptr; }

    bool operator==(const Value& other) const;

private:
    template <typename T>
    bool holds() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    template <typename T>
    std::optional<T> copy_if() const noexcept {
        if (const auto* p = std::get_if<T>(&m_data)) return *p;
        return std::nullopt;
    }

    Variant m_data;
};

/// Compact JSON text, used in log lines and diagnostics
[[nodiscard]] std::string to_display_string(const Value& value);

// Bytes travel as {"$bytes": [..]}, everything else maps onto the JSON type
void to_json(nlohmann::json& j, const Value& value);
void from_json(const nlohmann::json& j, Value& value);

/// Stored value plus the time of its last change
struct ReactiveValue {
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    Value value;
    TimePoint last_updated{};
};

} // namespace seedbed_state
