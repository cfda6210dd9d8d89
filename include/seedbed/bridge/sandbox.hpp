#pragma once

/// @file sandbox.hpp
/// @brief Isolated execution target seen by the bridge

#include "fwd.hpp"

#include <seedbed/core/error.hpp>
#include <seedbed/state/value.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace seedbed_bridge {

/// @brief Byte range of linear memory written by the guest
struct DirtyRange {
    std::size_t offset = 0;
    std::size_t length = 0;

    [[nodiscard]] std::size_t end() const noexcept { return offset + length; }

    [[nodiscard]] bool intersects(std::size_t other_offset, std::size_t other_length) const noexcept {
        return offset < other_offset + other_length && other_offset < end();
    }
};

/// Called when the guest announces a write through its notify import
using WriteHook = std::function<void(std::size_t offset, std::size_t length)>;

// =============================================================================
// Sandbox
// =============================================================================

/// @brief Compiled module running in isolation
///
/// The bridge only ever talks to this interface. All calls happen on the
/// owning thread; a sandbox is never entered concurrently.
class Sandbox {
public:
    virtual ~Sandbox() = default;

    /// Decode and instantiate a module. Failures are LoadError.
    virtual seedbed_core::Result<void> instantiate(std::span<const std::uint8_t> bytes) = 0;

    [[nodiscard]] virtual bool is_instantiated() const = 0;

    /// True when the module exports a linear memory
    [[nodiscard]] virtual bool has_memory() const = 0;

    /// Exported linear memory. The span is invalidated by any guest call,
    /// since the guest may grow memory.
    [[nodiscard]] virtual std::span<std::uint8_t> memory() = 0;

    /// Payload of a named custom section, if the module carries one
    [[nodiscard]] virtual std::optional<std::vector<std::uint8_t>> custom_section(const std::string& name) const = 0;

    [[nodiscard]] virtual bool has_export(const std::string& name) const = 0;

    /// Invoke an exported function. Zero results yield Null, one result
    /// yields that value, several yield an Array.
    virtual seedbed_core::Result<seedbed_state::Value> call(const std::string& name,
                                                            const std::vector<seedbed_state::Value>& args) = 0;

    virtual void set_write_hook(WriteHook hook) = 0;

    /// Ranges written since the last call, oldest first
    virtual std::vector<DirtyRange> take_dirty_ranges() = 0;

    /// Drop the instance; the sandbox returns to the uninstantiated state
    virtual void release() = 0;
};

using SandboxFactory = std::function<std::unique_ptr<Sandbox>()>;

} // namespace seedbed_bridge
