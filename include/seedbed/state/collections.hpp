#pragma once

/// @file collections.hpp
/// @brief List and map views over a single store key
///
/// The whole collection lives in one key. Every mutation builds a new
/// collection and writes it with Store::set, so watchers see one change per
/// mutation and readers only ever get detached copies.

#include "fwd.hpp"
#include "store.hpp"
#include "value.hpp"
#include <seedbed/core/error.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace seedbed_state {

// =============================================================================
// ValueTraits
// =============================================================================

/// Conversion between T and Value
template<typename T, typename Enable = void>
struct ValueTraits;

template<>
struct ValueTraits<Value> {
    static Value to_value(const Value& v) { return v; }
    static std::optional<Value> from_value(const Value& v) { return v; }
};

template<>
struct ValueTraits<bool> {
    static Value to_value(bool v) { return Value(v); }
    static std::optional<bool> from_value(const Value& v) { return v.try_bool(); }
};

template<typename T>
struct ValueTraits<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static Value to_value(T v) { return Value(static_cast<std::int64_t>(v)); }
    static std::optional<T> from_value(const Value& v) {
        auto i = v.try_int();
        if (!i || !std::in_range<T>(*i)) return std::nullopt;
        return static_cast<T>(*i);
    }
};

template<typename T>
struct ValueTraits<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static Value to_value(T v) { return Value(static_cast<double>(v)); }
    static std::optional<T> from_value(const Value& v) {
        if (auto f = v.try_float()) return static_cast<T>(*f);
        return std::nullopt;
    }
};

template<>
struct ValueTraits<std::string> {
    static Value to_value(const std::string& v) { return Value(v); }
    static std::optional<std::string> from_value(const Value& v) {
        if (auto* s = v.try_string()) return *s;
        return std::nullopt;
    }
};

/// Conversion between map keys and object field names
template<typename K, typename Enable = void>
struct KeyTraits;

template<>
struct KeyTraits<std::string> {
    static std::string to_field(const std::string& k) { return k; }
    static std::optional<std::string> from_field(const std::string& f) { return f; }
};

template<typename K>
struct KeyTraits<K, std::enable_if_t<std::is_integral_v<K> && !std::is_same_v<K, bool>>> {
    static std::string to_field(K k) { return std::to_string(k); }
    static std::optional<K> from_field(const std::string& f) {
        K k{};
        auto [ptr, ec] = std::from_chars(f.data(), f.data() + f.size(), k);
        if (ec != std::errc{} || ptr != f.data() + f.size()) return std::nullopt;
        return k;
    }
};

// =============================================================================
// ReactiveList
// =============================================================================

/// Ordered collection stored as an Array under one key
template<typename T>
class ReactiveList {
public:
    using Traits = ValueTraits<T>;

    ReactiveList(Store& store, std::string key)
        : m_store(&store), m_key(std::move(key)) {
        (void)m_store->get(m_key, Value::empty_array());
    }

    [[nodiscard]] const std::string& key() const noexcept { return m_key; }

    /// Detached copy of the elements
    [[nodiscard]] std::vector<T> items() const {
        std::vector<T> out;
        for (const auto& v : raw()) {
            if (auto item = Traits::from_value(v)) {
                out.push_back(std::move(*item));
            }
        }
        return out;
    }

    [[nodiscard]] std::size_t size() const { return raw().size(); }
    [[nodiscard]] bool empty() const { return raw().empty(); }

    [[nodiscard]] std::optional<T> at(std::size_t index) const {
        auto arr = raw();
        if (index >= arr.size()) return std::nullopt;
        return Traits::from_value(arr[index]);
    }

    [[nodiscard]] bool contains(const T& item) const {
        auto arr = raw();
        return std::find(arr.begin(), arr.end(), Traits::to_value(item)) != arr.end();
    }

    seedbed_core::Result<bool> add(const T& item) {
        auto arr = raw();
        arr.push_back(Traits::to_value(item));
        return commit(std::move(arr));
    }

    seedbed_core::Result<bool> insert(std::size_t index, const T& item) {
        auto arr = raw();
        if (index > arr.size()) return out_of_range(index, arr.size());
        arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(index), Traits::to_value(item));
        return commit(std::move(arr));
    }

    /// Replace the element at index
    seedbed_core::Result<bool> assign(std::size_t index, const T& item) {
        auto arr = raw();
        if (index >= arr.size()) return out_of_range(index, arr.size());
        arr[index] = Traits::to_value(item);
        return commit(std::move(arr));
    }

    seedbed_core::Result<bool> remove_at(std::size_t index) {
        auto arr = raw();
        if (index >= arr.size()) return out_of_range(index, arr.size());
        arr.erase(arr.begin() + static_cast<std::ptrdiff_t>(index));
        return commit(std::move(arr));
    }

    /// Remove the first element equal to item; Ok(false) if absent
    seedbed_core::Result<bool> remove(const T& item) {
        auto arr = raw();
        auto it = std::find(arr.begin(), arr.end(), Traits::to_value(item));
        if (it == arr.end()) return seedbed_core::Ok(false);
        arr.erase(it);
        return commit(std::move(arr));
    }

    seedbed_core::Result<bool> clear() {
        return commit(ValueArray{});
    }

private:
    [[nodiscard]] ValueArray raw() const {
        const Value current = m_store->peek(m_key);
        if (auto* arr = current.try_array()) return *arr;
        return {};
    }

    seedbed_core::Result<bool> commit(ValueArray arr) {
        return m_store->set(m_key, Value(std::move(arr)));
    }

    seedbed_core::Result<bool> out_of_range(std::size_t index, std::size_t size) const {
        return seedbed_core::Err<bool>(seedbed_core::Error(seedbed_core::ErrorCode::InvalidArgument,
            "Index " + std::to_string(index) + " out of range for '" + m_key + "' of size " +
            std::to_string(size)));
    }

    Store* m_store;
    std::string m_key;
};

// =============================================================================
// ReactiveMap
// =============================================================================

/// Keyed collection stored as an Object under one key
template<typename K, typename V>
class ReactiveMap {
public:
    using KTraits = KeyTraits<K>;
    using VTraits = ValueTraits<V>;

    ReactiveMap(Store& store, std::string key)
        : m_store(&store), m_key(std::move(key)) {
        (void)m_store->get(m_key, Value::empty_object());
    }

    [[nodiscard]] const std::string& key() const noexcept { return m_key; }

    /// Detached copy of the entries
    [[nodiscard]] std::map<K, V> entries() const {
        std::map<K, V> out;
        for (const auto& [field, v] : raw()) {
            auto k = KTraits::from_field(field);
            auto value = VTraits::from_value(v);
            if (k && value) {
                out.emplace(std::move(*k), std::move(*value));
            }
        }
        return out;
    }

    [[nodiscard]] std::size_t size() const { return raw().size(); }
    [[nodiscard]] bool empty() const { return raw().empty(); }

    [[nodiscard]] bool contains(const K& k) const {
        auto obj = raw();
        return obj.find(KTraits::to_field(k)) != obj.end();
    }

    [[nodiscard]] std::optional<V> get(const K& k) const {
        auto obj = raw();
        auto it = obj.find(KTraits::to_field(k));
        if (it == obj.end()) return std::nullopt;
        return VTraits::from_value(it->second);
    }

    seedbed_core::Result<bool> set(const K& k, const V& v) {
        auto obj = raw();
        obj[KTraits::to_field(k)] = VTraits::to_value(v);
        return commit(std::move(obj));
    }

    /// Ok(false) if k was absent
    seedbed_core::Result<bool> remove(const K& k) {
        auto obj = raw();
        if (obj.erase(KTraits::to_field(k)) == 0) return seedbed_core::Ok(false);
        return commit(std::move(obj));
    }

    seedbed_core::Result<bool> clear() {
        return commit(ValueObject{});
    }

private:
    [[nodiscard]] ValueObject raw() const {
        const Value current = m_store->peek(m_key);
        if (auto* obj = current.try_object()) return *obj;
        return {};
    }

    seedbed_core::Result<bool> commit(ValueObject obj) {
        return m_store->set(m_key, Value(std::move(obj)));
    }

    Store* m_store;
    std::string m_key;
};

} // namespace seedbed_state
