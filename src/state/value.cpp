/// @file value.cpp
/// @brief Value queries and JSON conversion

#include <seedbed/state/value.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <cmath>

namespace seedbed_state {

namespace {

constexpr const char* BYTES_TAG = "$bytes";

constexpr std::array<const char*, 8> k_type_names = {
    "Null", "Bool", "Int", "Float", "String", "Array", "Object", "Bytes",
};

/// {"$bytes": [...]} with every element in 0..255
bool is_tagged_bytes(const nlohmann::json& j) {
    if (j.size() != 1 || !j.contains(BYTES_TAG) || !j[BYTES_TAG].is_array()) {
        return false;
    }
    for (const auto& b : j[BYTES_TAG]) {
        if (!b.is_number_unsigned() || b.get<std::uint64_t>() > 0xFF) {
            return false;
        }
    }
    return true;
}

} // namespace

const char* value_type_name(ValueType type) noexcept {
    auto index = static_cast<std::size_t>(type);
    return index < k_type_names.size() ? k_type_names[index] : "Unknown";
}

// =============================================================================
// Value
// =============================================================================

double Value::as_numeric() const {
    if (const auto* i = std::get_if<std::int64_t>(&m_data)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(m_data);
}

std::size_t Value::size() const noexcept {
    switch (type()) {
        case ValueType::Array: return std::get<ValueArray>(m_data).size();
        case ValueType::Object: return std::get<ValueObject>(m_data).size();
        case ValueType::Bytes: return std::get<ValueBytes>(m_data).size();
        default: return 0;
    }
}

const Value* Value::get(const std::string& key) const {
    const auto* members = try_object();
    if (!members) {
        return nullptr;
    }
    auto it = members->find(key);
    return it == members->end() ? nullptr : &it->second;
}

bool Value::operator==(const Value& other) const {
    const auto* lhs = std::get_if<double>(&m_data);
    const auto* rhs = std::get_if<double>(&other.m_data);
    if (lhs && rhs) {
        return *lhs == *rhs || (std::isnan(*lhs) && std::isnan(*rhs));
    }
    return m_data == other.m_data;
}

// =============================================================================
// JSON
// =============================================================================

void to_json(nlohmann::json& j, const Value& value) {
    switch (value.type()) {
        case ValueType::Null:
            j = nullptr;
            break;
        case ValueType::Bool:
            j = value.as_bool();
            break;
        case ValueType::Int:
            j = value.as_int();
            break;
        case ValueType::Float:
            j = value.as_float();
            break;
        case ValueType::String:
            j = value.as_string();
            break;
        case ValueType::Array: {
            j = nlohmann::json::array();
            for (const auto& elem : value.as_array()) {
                nlohmann::json child;
                to_json(child, elem);
                j.push_back(std::move(child));
            }
            break;
        }
        case ValueType::Object: {
            j = nlohmann::json::object();
            for (const auto& [key, member] : value.as_object()) {
                nlohmann::json child;
                to_json(child, member);
                j[key] = std::move(child);
            }
            break;
        }
        case ValueType::Bytes: {
            nlohmann::json bytes = nlohmann::json::array();
            for (std::uint8_t b : value.as_bytes()) {
                bytes.push_back(b);
            }
            j = nlohmann::json::object();
            j[BYTES_TAG] = std::move(bytes);
            break;
        }
    }
}

void from_json(const nlohmann::json& j, Value& value) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            value = Value{};
            break;
        case nlohmann::json::value_t::boolean:
            value = Value(j.get<bool>());
            break;
        case nlohmann::json::value_t::number_integer:
            value = Value(j.get<std::int64_t>());
            break;
        case nlohmann::json::value_t::number_unsigned:
            value = Value(static_cast<std::int64_t>(j.get<std::uint64_t>()));
            break;
        case nlohmann::json::value_t::number_float:
            value = Value(j.get<double>());
            break;
        case nlohmann::json::value_t::string:
            value = Value(j.get<std::string>());
            break;
        case nlohmann::json::value_t::array: {
            ValueArray arr;
            arr.reserve(j.size());
            for (const auto& elem : j) {
                Value child;
                from_json(elem, child);
                arr.push_back(std::move(child));
            }
            value = Value(std::move(arr));
            break;
        }
        case nlohmann::json::value_t::object: {
            // A malformed tag is kept as a plain object
            if (is_tagged_bytes(j)) {
                ValueBytes bytes;
                for (const auto& b : j[BYTES_TAG]) {
                    bytes.push_back(static_cast<std::uint8_t>(b.get<std::uint64_t>()));
                }
                value = Value(std::move(bytes));
                break;
            }
            ValueObject obj;
            for (auto it = j.begin(); it != j.end(); ++it) {
                Value child;
                from_json(it.value(), child);
                obj.emplace(it.key(), std::move(child));
            }
            value = Value(std::move(obj));
            break;
        }
        case nlohmann::json::value_t::binary: {
            const auto& bin = j.get_binary();
            value = Value(ValueBytes(bin.begin(), bin.end()));
            break;
        }
    }
}

std::string to_display_string(const Value& value) {
    nlohmann::json j;
    to_json(j, value);
    return j.dump();
}

} // namespace seedbed_state
