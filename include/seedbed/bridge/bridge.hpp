#pragma once

/// @file bridge.hpp
/// @brief Keeps store keys and sandbox memory in sync

#include "binding.hpp"
#include "sandbox.hpp"

#include <seedbed/core/error.hpp>
#include <seedbed/state/scheduler.hpp>
#include <seedbed/state/store.hpp>
#include <seedbed/state/timer.hpp>

#include <chrono>
#include <memory>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace seedbed_core { class DiagnosticsSink; }

namespace seedbed_bridge {

// =============================================================================
// BridgeState
// =============================================================================

/// Unloaded -> Loading -> Ready -> Disposed, or Loading -> Failed
enum class BridgeState : std::uint8_t {
    Unloaded,
    Loading,
    Ready,
    Failed,
    Disposed
};

[[nodiscard]] const char* bridge_state_name(BridgeState state);

// =============================================================================
// Configuration
// =============================================================================

struct BridgeConfig {
    /// Fallback sync interval
    seedbed_state::TimerQueue::Duration poll_interval = std::chrono::milliseconds(100);
    bool enable_polling = true;

    /// Bindings supplied by the host, merged with the module's layout section
    std::vector<MemoryBinding> bindings;

    std::string layout_section = "seedbed.layout";

    /// Optional export run once after the initial push
    std::string initializer = "_initialize";
};

struct BridgeStats {
    std::uint64_t polls = 0;
    std::uint64_t values_pulled = 0;     ///< Store writes caused by memory changes
    std::uint64_t values_pushed = 0;     ///< Memory writes caused by store changes
    std::uint64_t calls = 0;
    std::uint64_t call_failures = 0;
    std::uint64_t guest_notifications = 0;
};

// =============================================================================
// ExecutionBridge
// =============================================================================

/// @brief Mirrors bound store keys into a sandbox's linear memory
///
/// Memory to store: guest write notifications, dirty ranges after each call,
/// and a periodic poll. Store to memory: a watcher on every bound key pushes
/// the new value when the scheduler flushes, or push() on demand.
///
/// Each binding remembers the last value memory and the store agreed on.
/// A pull only overwrites the store when memory moved away from that value,
/// and store writes not yet flushed are pushed before every poll and call,
/// so the guest never reads or restores a stale value.
///
/// A bridge is single use. Once it reaches Failed or Disposed it stays there;
/// the owner creates a fresh bridge to retry.
class ExecutionBridge {
public:
    ExecutionBridge(seedbed_state::Store& store,
                    seedbed_state::BatchScheduler& scheduler,
                    seedbed_state::TimerQueue& timers,
                    std::unique_ptr<Sandbox> sandbox,
                    seedbed_core::DiagnosticsSink* diagnostics = nullptr,
                    BridgeConfig config = {});
    ~ExecutionBridge();

    ExecutionBridge(const ExecutionBridge&) = delete;
    ExecutionBridge& operator=(const ExecutionBridge&) = delete;

    /// Instantiate the module, seed the store and establish bindings.
    /// Any failure moves the bridge to Failed with no bindings active.
    seedbed_core::Result<void> load(std::span<const std::uint8_t> bytecode,
                                    const seedbed_state::ValueObject& initial_state = {});

    /// Read every binding and set changed values; returns keys updated
    std::size_t poll();

    /// Write the store's current value of a bound key into memory
    seedbed_core::Result<void> push(const std::string& key);

    /// Push every bound key present in the store; returns keys written
    std::size_t push_all();

    /// Invoke an export. Failures are reported and returned.
    seedbed_core::Result<seedbed_state::Value> call_function(const std::string& name,
                                                             const std::vector<seedbed_state::Value>& args = {});

    /// Stop syncing and release the sandbox; idempotent
    void dispose();

    [[nodiscard]] BridgeState state() const noexcept { return m_state; }
    [[nodiscard]] bool is_ready() const noexcept { return m_state == BridgeState::Ready; }
    [[nodiscard]] const LayoutTable& layout() const noexcept { return m_layout; }
    [[nodiscard]] const BridgeStats& stats() const noexcept { return m_stats; }
    [[nodiscard]] const BridgeConfig& config() const noexcept { return m_config; }
    [[nodiscard]] Sandbox* sandbox() noexcept { return m_sandbox.get(); }

private:
    seedbed_core::Error fail(seedbed_core::Error error);
    void report(const seedbed_core::Error& error);

    seedbed_core::Result<LayoutTable> build_layout();
    seedbed_core::Result<bool> pull_binding(const MemoryBinding& binding);
    std::size_t pull_range(std::size_t offset, std::size_t length);
    std::size_t sync_dirty_ranges();
    seedbed_core::Result<void> write_binding(const MemoryBinding& binding, const seedbed_state::Value& value);
    std::size_t push_unsynced();
    [[nodiscard]] bool is_synced(const std::string& key, const seedbed_state::Value& value) const;

    void on_guest_write(std::size_t offset, std::size_t length);
    void watch_bindings();
    void unwatch_bindings();
    void schedule_poll();
    void cancel_poll();

    seedbed_state::Store& m_store;
    seedbed_state::BatchScheduler& m_scheduler;
    seedbed_state::TimerQueue& m_timers;
    std::unique_ptr<Sandbox> m_sandbox;
    seedbed_core::DiagnosticsSink* m_diagnostics;
    BridgeConfig m_config;

    /// Last agreed value of a binding, as decoded from memory and as stored
    struct SyncedValue {
        seedbed_state::Value memory;
        seedbed_state::Value store;
    };

    BridgeState m_state = BridgeState::Unloaded;
    LayoutTable m_layout;
    BridgeStats m_stats;
    std::unordered_map<std::string, SyncedValue> m_synced;

    seedbed_state::WatchHandle m_push_handle;
    std::vector<seedbed_state::Subscription> m_subscriptions;
    seedbed_state::TimerId m_poll_timer;
    std::shared_ptr<int> m_alive = std::make_shared<int>(0);
};

} // namespace seedbed_bridge
