#pragma once

/// @file runtime.hpp
/// @brief One loaded module with its store, scheduler and bridge

#include "config.hpp"

#include <seedbed/bridge/bridge.hpp>
#include <seedbed/bridge/sandbox.hpp>
#include <seedbed/state/computed.hpp>
#include <seedbed/state/scheduler.hpp>
#include <seedbed/state/store.hpp>
#include <seedbed/state/timer.hpp>
#include <seedbed/state/transaction.hpp>

#include <nlohmann/json_fwd.hpp>

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace seedbed_core { class DiagnosticsSink; }

namespace seedbed_runtime {

/// @brief Collaborators a runtime borrows from its host
struct RuntimeContext {
    seedbed_state::TimerQueue& timers;
    seedbed_core::DiagnosticsSink* diagnostics = nullptr;
    /// Creates the sandbox for each load attempt (WasmSandbox when empty)
    seedbed_bridge::SandboxFactory sandbox_factory;
};

struct RuntimeStats {
    std::size_t value_count = 0;
    std::size_t watcher_count = 0;
    std::size_t pending_updates = 0;
    bool disposed = false;
    std::uint64_t flush_count = 0;
    std::uint64_t notification_count = 0;
    std::size_t computed_count = 0;
    seedbed_bridge::BridgeState bridge_state = seedbed_bridge::BridgeState::Unloaded;

    [[nodiscard]] nlohmann::json to_json() const;
};

// =============================================================================
// RuntimeInstance
// =============================================================================

/// @brief Facade the view layer talks to
///
/// Owns the store and its satellites for one module. Everything runs on the
/// thread that drives the context's TimerQueue.
class RuntimeInstance {
public:
    explicit RuntimeInstance(RuntimeContext context, RuntimeConfig config = {});
    ~RuntimeInstance();

    RuntimeInstance(const RuntimeInstance&) = delete;
    RuntimeInstance& operator=(const RuntimeInstance&) = delete;

    // -------------------------------------------------------------------------
    // Module
    // -------------------------------------------------------------------------

    /// Load a module. After a failed load, calling again retries with a
    /// fresh bridge and sandbox.
    seedbed_core::Result<void> load(std::span<const std::uint8_t> bytecode,
                                    const seedbed_state::ValueObject& initial_state = {});

    seedbed_core::Result<seedbed_state::Value> call_function(const std::string& name,
                                                             const std::vector<seedbed_state::Value>& args = {});

    // -------------------------------------------------------------------------
    // State
    // -------------------------------------------------------------------------

    seedbed_state::Value get_value(const std::string& key, const seedbed_state::Value& default_value = {});
    seedbed_core::Result<bool> set_value(const std::string& key, seedbed_state::Value value);

    seedbed_state::Subscription watch(const std::string& key, seedbed_state::WatchCallback callback);
    seedbed_state::Subscription watch(const std::string& key, seedbed_state::WatchHandle handle);
    bool unwatch(const std::string& key, const seedbed_state::WatchHandle& handle);

    /// Run fn with the timed flush suppressed, then flush once
    template<typename F>
    decltype(auto) transaction(F&& fn) {
        return seedbed_state::transaction(m_scheduler, std::forward<F>(fn));
    }

    seedbed_core::Result<void> computed(const std::string& key, seedbed_state::ComputeFn fn,
                                        std::vector<std::string> dependencies);

    /// Deliver pending notifications now instead of waiting for the tick
    std::size_t flush() { return m_scheduler.flush(); }

    // -------------------------------------------------------------------------
    // Snapshots
    // -------------------------------------------------------------------------

    /// Store contents as a JSON object
    [[nodiscard]] std::string snapshot_json(int indent = -1) const;

    /// Write every member of a JSON object through set() inside one
    /// transaction. Stops at the first rejected key; earlier keys stay set.
    seedbed_core::Result<void> restore_json(std::string_view text);

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    [[nodiscard]] RuntimeStats get_stats() const;

    void dispose();
    [[nodiscard]] bool is_disposed() const noexcept { return m_disposed; }

    [[nodiscard]] seedbed_state::Store& store() noexcept { return m_store; }
    [[nodiscard]] seedbed_state::BatchScheduler& scheduler() noexcept { return m_scheduler; }
    [[nodiscard]] seedbed_state::ComputedEngine& computed_engine() noexcept { return m_computed; }
    [[nodiscard]] seedbed_bridge::ExecutionBridge* bridge() noexcept { return m_bridge.get(); }
    [[nodiscard]] const RuntimeConfig& config() const noexcept { return m_config; }

private:
    std::unique_ptr<seedbed_bridge::Sandbox> make_sandbox() const;

    RuntimeContext m_context;
    RuntimeConfig m_config;
    seedbed_state::Store m_store;
    seedbed_state::BatchScheduler m_scheduler;
    seedbed_state::ComputedEngine m_computed;
    std::unique_ptr<seedbed_bridge::ExecutionBridge> m_bridge;
    bool m_disposed = false;
};

} // namespace seedbed_runtime
