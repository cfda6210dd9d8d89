#pragma once

/// @file binding.hpp
/// @brief Byte-level bindings between store keys and linear memory

#include "fwd.hpp"

#include <seedbed/core/error.hpp>
#include <seedbed/state/value.hpp>

#include <nlohmann/json_fwd.hpp>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace seedbed_bridge {

// =============================================================================
// Encoding
// =============================================================================

/// @brief How a binding's bytes map to a Value
enum class Encoding : std::uint8_t {
    UnsignedLE,   ///< Little-endian unsigned integer, Int
    SignedLE,     ///< Little-endian two's complement integer, Int
    FloatLE,      ///< IEEE 754 float (width 4 or 8), Float
    Bool,         ///< Non-zero = true, Bool
    Custom        ///< User codec
};

[[nodiscard]] const char* encoding_name(Encoding encoding);

/// @brief User-supplied conversion for Encoding::Custom
class BindingCodec {
public:
    virtual ~BindingCodec() = default;

    [[nodiscard]] virtual seedbed_state::Value decode(std::span<const std::uint8_t> bytes) const = 0;

    /// Fill `out` (exactly the binding's width) from `value`
    virtual seedbed_core::Result<void> encode(const seedbed_state::Value& value, std::span<std::uint8_t> out) const = 0;
};

// =============================================================================
// MemoryBinding
// =============================================================================

struct MemoryBinding {
    std::string key;
    std::size_t offset = 0;
    std::size_t width = 4;
    Encoding encoding = Encoding::UnsignedLE;
    std::shared_ptr<const BindingCodec> codec;  ///< Custom only

    [[nodiscard]] std::size_t end() const noexcept { return offset + width; }

    [[nodiscard]] bool overlaps(const MemoryBinding& other) const noexcept {
        return offset < other.end() && other.offset < end();
    }

    [[nodiscard]] bool intersects(std::size_t range_offset, std::size_t range_length) const noexcept {
        return offset < range_offset + range_length && range_offset < end();
    }

    /// Shorthand type name ("u32", "i16", "f64", "bool", "custom")
    [[nodiscard]] std::string type_name() const;

    /// Read this binding's bytes out of memory
    [[nodiscard]] seedbed_core::Result<seedbed_state::Value> decode(std::span<const std::uint8_t> memory) const;

    /// Write a value into memory at this binding's offset. Null is ignored.
    seedbed_core::Result<void> encode(const seedbed_state::Value& value, std::span<std::uint8_t> memory) const;

    /// Width/encoding checks that do not need the memory size
    [[nodiscard]] seedbed_core::Result<void> validate_shape() const;
};

/// Build a binding from a shorthand type ("u8".."u64", "i8".."i64", "f32",
/// "f64", "bool"). Bool takes an explicit width; other types imply it.
[[nodiscard]] seedbed_core::Result<MemoryBinding> make_binding(const std::string& key, std::size_t offset,
                                                               std::string_view type,
                                                               std::optional<std::size_t> width = std::nullopt);

// =============================================================================
// LayoutTable
// =============================================================================

/// @brief Set of bindings for one module
///
/// Layouts come from configuration or from the module's "seedbed.layout"
/// custom section:
///
///     {"bindings": [{"key": "count", "offset": 0, "type": "u32"},
///                   {"key": "on", "offset": 8, "type": "bool", "width": 1}]}
///
/// "encoding" is accepted as an alias of "type".
class LayoutTable {
public:
    LayoutTable() = default;

    [[nodiscard]] static seedbed_core::Result<LayoutTable> from_json(const nlohmann::json& json);
    [[nodiscard]] static seedbed_core::Result<LayoutTable> parse(std::string_view text);

    /// Add one binding; a duplicate key is a BindingError
    seedbed_core::Result<void> add(MemoryBinding binding);

    /// Add every binding of another table; duplicate keys are a BindingError
    seedbed_core::Result<void> merge(const LayoutTable& other);

    /// Full validation against a memory of `memory_size` bytes
    [[nodiscard]] seedbed_core::Result<void> validate(std::size_t memory_size) const;

    [[nodiscard]] const MemoryBinding* find(const std::string& key) const;
    [[nodiscard]] const std::vector<MemoryBinding>& bindings() const noexcept { return m_bindings; }
    [[nodiscard]] std::size_t size() const noexcept { return m_bindings.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_bindings.empty(); }

    void clear() { m_bindings.clear(); }

    [[nodiscard]] nlohmann::json to_json() const;

private:
    std::vector<MemoryBinding> m_bindings;
};

} // namespace seedbed_bridge
