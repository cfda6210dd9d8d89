#pragma once

/// @file store.hpp
/// @brief Keyed reactive value store

#include "fwd.hpp"
#include "value.hpp"
#include <seedbed/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace seedbed_state {

// =============================================================================
// StoreLimits
// =============================================================================

/// Size limits enforced on every write (0 = unlimited)
struct StoreLimits {
    std::size_t max_key_length = 0;
    std::size_t max_string_length = 0;
    std::size_t max_array_length = 0;
    std::size_t max_object_fields = 0;

    [[nodiscard]] static StoreLimits unlimited() { return StoreLimits{}; }

    /// Limits for state coming from untrusted module code
    [[nodiscard]] static StoreLimits sandboxed() {
        StoreLimits limits;
        limits.max_key_length = 50;
        limits.max_string_length = 1000;
        limits.max_array_length = 100;
        limits.max_object_fields = 50;
        return limits;
    }

    /// Check key and value against the limits
    [[nodiscard]] seedbed_core::Result<void> check(const std::string& key, const Value& value) const;
};

// =============================================================================
// Store
// =============================================================================

/// Mapping from key to ReactiveValue
///
/// A key's declared type is fixed by its first non-null value. Writing a
/// different non-null type later fails with StoreError::TypeMismatch. Null may
/// be written to any key. Writing a value equal to the current one is a no-op
/// and does not notify the change listener.
class Store {
public:
    using Clock = ReactiveValue::Clock;
    using TimePoint = ReactiveValue::TimePoint;
    using ClockFn = std::function<TimePoint()>;
    using ChangeListener = std::function<void(const std::string& key)>;

    explicit Store(StoreLimits limits = StoreLimits::unlimited());

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    // -------------------------------------------------------------------------
    // Reads
    // -------------------------------------------------------------------------

    /// Current value of key, creating it with default_value on first access
    Value get(const std::string& key, const Value& default_value = Value{});

    /// Current value of key without creating it
    [[nodiscard]] Value peek(const std::string& key, const Value& default_value = Value{}) const;

    /// Full record of key (nullptr if absent)
    [[nodiscard]] const ReactiveValue* find(const std::string& key) const;

    [[nodiscard]] bool contains(const std::string& key) const;

    /// Type fixed for key (nullopt while absent or only ever Null)
    [[nodiscard]] std::optional<ValueType> declared_type(const std::string& key) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_slots.size(); }

    /// All keys, sorted
    [[nodiscard]] std::vector<std::string> keys() const;

    /// Copy of every key and value
    [[nodiscard]] ValueObject snapshot() const;

    // -------------------------------------------------------------------------
    // Writes
    // -------------------------------------------------------------------------

    /// Write value; Ok(true) if the stored value changed
    ///
    /// After dispose() this is a no-op returning Ok(false).
    seedbed_core::Result<bool> set(const std::string& key, Value value);

    // -------------------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------------------

    /// Called after every effective change
    void set_change_listener(ChangeListener listener) { m_listener = std::move(listener); }

    /// Replace the timestamp source (tests use virtual time)
    void set_clock(ClockFn clock) { m_clock = std::move(clock); }

    [[nodiscard]] const StoreLimits& limits() const noexcept { return m_limits; }

    /// Number of effective changes since construction
    [[nodiscard]] std::uint64_t change_count() const noexcept { return m_change_count; }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// Drop all values and refuse further writes
    void dispose();

    [[nodiscard]] bool is_disposed() const noexcept { return m_disposed; }

private:
    struct Slot {
        ReactiveValue current;
        ValueType declared = ValueType::Null;
    };

    [[nodiscard]] TimePoint now() const;

    StoreLimits m_limits;
    std::unordered_map<std::string, Slot> m_slots;
    ChangeListener m_listener;
    ClockFn m_clock;
    std::uint64_t m_change_count = 0;
    bool m_disposed = false;
};

} // namespace seedbed_state
