/// @file store.cpp
/// @brief Reactive store implementation

#include <seedbed/state/store.hpp>
#include <seedbed/core/log.hpp>

#include <algorithm>

namespace seedbed_state {

using seedbed_core::Err;
using seedbed_core::Ok;
using seedbed_core::StoreError;

// =============================================================================
// StoreLimits
// =============================================================================

namespace {

seedbed_core::Result<void> check_value(const StoreLimits& limits, const std::string& key, const Value& value) {
    switch (value.type()) {
        case ValueType::String:
            if (limits.max_string_length && value.as_string().size() > limits.max_string_length) {
                return Err(StoreError::limit_exceeded(key,
                    "string of " + std::to_string(value.as_string().size()) + " chars (max " +
                    std::to_string(limits.max_string_length) + ")"));
            }
            break;
        case ValueType::Array:
            if (limits.max_array_length && value.as_array().size() > limits.max_array_length) {
                return Err(StoreError::limit_exceeded(key,
                    "array of " + std::to_string(value.as_array().size()) + " items (max " +
                    std::to_string(limits.max_array_length) + ")"));
            }
            for (const auto& elem : value.as_array()) {
                auto r = check_value(limits, key, elem);
                if (!r) return r;
            }
            break;
        case ValueType::Object:
            if (limits.max_object_fields && value.as_object().size() > limits.max_object_fields) {
                return Err(StoreError::limit_exceeded(key,
                    "object of " + std::to_string(value.as_object().size()) + " fields (max " +
                    std::to_string(limits.max_object_fields) + ")"));
            }
            for (const auto& [field, member] : value.as_object()) {
                auto r = check_value(limits, key, member);
                if (!r) return r;
            }
            break;
        default:
            break;
    }
    return Ok();
}

} // anonymous namespace

seedbed_core::Result<void> StoreLimits::check(const std::string& key, const Value& value) const {
    if (key.empty()) {
        return Err(StoreError::limit_exceeded(key, "empty key"));
    }
    if (max_key_length && key.size() > max_key_length) {
        return Err(StoreError::limit_exceeded(key,
            "key of " + std::to_string(key.size()) + " chars (max " + std::to_string(max_key_length) + ")"));
    }
    return check_value(*this, key, value);
}

// =============================================================================
// Store
// =============================================================================

Store::Store(StoreLimits limits)
    : m_limits(limits) {}

Store::TimePoint Store::now() const {
    return m_clock ? m_clock() : Clock::now();
}

Value Store::get(const std::string& key, const Value& default_value) {
    auto it = m_slots.find(key);
    if (it != m_slots.end()) {
        return it->second.current.value;
    }

    if (m_disposed || !m_limits.check(key, default_value)) {
        return default_value;
    }

    Slot slot;
    slot.current.value = default_value;
    slot.current.last_updated = now();
    slot.declared = default_value.type();
    m_slots.emplace(key, std::move(slot));
    return default_value;
}

Value Store::peek(const std::string& key, const Value& default_value) const {
    auto it = m_slots.find(key);
    return it != m_slots.end() ? it->second.current.value : default_value;
}

const ReactiveValue* Store::find(const std::string& key) const {
    auto it = m_slots.find(key);
    return it != m_slots.end() ? &it->second.current : nullptr;
}

bool Store::contains(const std::string& key) const {
    return m_slots.find(key) != m_slots.end();
}

std::optional<ValueType> Store::declared_type(const std::string& key) const {
    auto it = m_slots.find(key);
    if (it == m_slots.end() || it->second.declared == ValueType::Null) {
        return std::nullopt;
    }
    return it->second.declared;
}

std::vector<std::string> Store::keys() const {
    std::vector<std::string> out;
    out.reserve(m_slots.size());
    for (const auto& [key, slot] : m_slots) {
        out.push_back(key);
    }
    std::sort(out.begin(), out.end());
    return out;
}

ValueObject Store::snapshot() const {
    ValueObject out;
    for (const auto& [key, slot] : m_slots) {
        out.emplace(key, slot.current.value);
    }
    return out;
}

seedbed_core::Result<bool> Store::set(const std::string& key, Value value) {
    if (m_disposed) {
        return Ok(false);
    }

    auto it = m_slots.find(key);
    if (it != m_slots.end()) {
        Slot& slot = it->second;
        if (slot.current.value == value) {
            return Ok(false);
        }
        if (!value.is_null() && slot.declared != ValueType::Null && slot.declared != value.type()) {
            return Err<bool>(StoreError::type_mismatch(key, value_type_name(slot.declared), value.type_name()));
        }
    }

    auto limit_check = m_limits.check(key, value);
    if (!limit_check) {
        return Err<bool>(limit_check.error());
    }

    if (it == m_slots.end()) {
        it = m_slots.emplace(key, Slot{}).first;
    }

    Slot& slot = it->second;
    if (slot.declared == ValueType::Null) {
        slot.declared = value.type();
    }
    // Replace the whole record
    slot.current = ReactiveValue{std::move(value), now()};
    ++m_change_count;

    auto logger = seedbed_core::store_logger();
    if (logger->should_log(spdlog::level::trace)) {
        logger->trace("set '{}' = {}", key, to_display_string(slot.current.value));
    }

    if (m_listener) {
        m_listener(key);
    }
    return Ok(true);
}

void Store::dispose() {
    if (m_disposed) {
        return;
    }
    m_disposed = true;
    m_listener = nullptr;
    m_slots.clear();
}

} // namespace seedbed_state
