#pragma once

/// @file scheduler.hpp
/// @brief Watcher registry and coalescing batch scheduler
///
/// Writes to the store mark keys pending. A single tick is scheduled on the
/// timer queue; when it fires every pending key is delivered once, with its
/// current value, to each watcher in registration order. Keys marked while a
/// flush is running (computed values, watchers writing back) are delivered in
/// further rounds of the same flush.

#include "fwd.hpp"
#include "store.hpp"
#include "timer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace seedbed_core { class DiagnosticsSink; }

namespace seedbed_state {

/// Callback invoked with the key and its current value
using WatchCallback = std::function<void(const std::string& key, const Value& value)>;

/// Shared callback identity; registering the same handle twice is a no-op
using WatchHandle = std::shared_ptr<const WatchCallback>;

[[nodiscard]] inline WatchHandle make_watch_handle(WatchCallback callback) {
    return std::make_shared<const WatchCallback>(std::move(callback));
}

// =============================================================================
// Configuration
// =============================================================================

struct SchedulerConfig {
    /// Delay between the first write and the flush
    TimerQueue::Duration tick_interval = std::chrono::milliseconds(16);
    /// Delivery rounds per flush before leftovers roll to the next tick
    std::size_t max_flush_rounds = 64;
};

struct SchedulerStats {
    std::uint64_t flush_count = 0;
    std::uint64_t notification_count = 0;
    std::uint64_t callback_errors = 0;
    std::uint64_t deferred_flushes = 0;
};

// =============================================================================
// Subscription
// =============================================================================

class BatchScheduler;

/// Handle returned by watch(); unsubscribe() is idempotent
///
/// Dropping a Subscription does not unsubscribe.
class Subscription {
public:
    Subscription() = default;

    void unsubscribe();

    /// True until unsubscribe() or scheduler teardown
    [[nodiscard]] bool active() const;

    [[nodiscard]] const std::string& key() const noexcept { return m_key; }
    [[nodiscard]] const WatchHandle& handle() const noexcept { return m_handle; }

private:
    friend class BatchScheduler;

    Subscription(BatchScheduler* scheduler, std::weak_ptr<void> alive, std::string key, WatchHandle handle)
        : m_scheduler(scheduler), m_alive(std::move(alive)), m_key(std::move(key)), m_handle(std::move(handle)) {}

    BatchScheduler* m_scheduler = nullptr;
    std::weak_ptr<void> m_alive;
    std::string m_key;
    WatchHandle m_handle;
};

// =============================================================================
// BatchScheduler
// =============================================================================

class BatchScheduler {
public:
    BatchScheduler(Store& store, TimerQueue& timers, seedbed_core::DiagnosticsSink* diagnostics = nullptr,
                   SchedulerConfig config = {});
    ~BatchScheduler();

    BatchScheduler(const BatchScheduler&) = delete;
    BatchScheduler& operator=(const BatchScheduler&) = delete;

    // -------------------------------------------------------------------------
    // Watchers
    // -------------------------------------------------------------------------

    Subscription watch(const std::string& key, WatchHandle handle);
    Subscription watch(const std::string& key, WatchCallback callback);

    /// Remove handle from key; false if it was not registered
    bool unwatch(const std::string& key, const WatchHandle& handle);

    [[nodiscard]] bool is_watching(const std::string& key, const WatchHandle& handle) const;

    /// Total registrations across all keys
    [[nodiscard]] std::size_t watcher_count() const;

    [[nodiscard]] std::size_t watcher_count(const std::string& key) const;

    // -------------------------------------------------------------------------
    // Pending set
    // -------------------------------------------------------------------------

    /// Mark key changed and schedule a tick if none is pending
    void mark(const std::string& key);

    [[nodiscard]] std::size_t pending_count() const noexcept { return m_pending_order.size(); }
    [[nodiscard]] bool is_pending(const std::string& key) const;
    [[nodiscard]] bool tick_scheduled() const noexcept { return m_tick.is_valid(); }

    /// Deliver everything pending now; returns keys delivered
    ///
    /// Calls made while a flush is already running return 0; the running
    /// flush picks up the new marks.
    std::size_t flush();

    [[nodiscard]] bool is_flushing() const noexcept { return m_flushing; }

    // -------------------------------------------------------------------------
    // Transactions
    // -------------------------------------------------------------------------

    /// Suppress timed ticks until the matching end_transaction()
    void begin_transaction();

    /// Close one level; the outermost close flushes immediately
    void end_transaction();

    [[nodiscard]] std::size_t transaction_depth() const noexcept { return m_transaction_depth; }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// Cancel the tick and drop all pending keys
    void clear();

    /// clear() plus removal of every watcher; later marks are ignored
    void dispose();

    [[nodiscard]] bool is_disposed() const noexcept { return m_disposed; }

    [[nodiscard]] const SchedulerStats& stats() const noexcept { return m_stats; }
    [[nodiscard]] const SchedulerConfig& config() const noexcept { return m_config; }

private:
    void schedule_tick();
    void cancel_tick();
    void deliver(const std::string& key);
    void report_callback_failure(const std::string& key, const std::string& reason);

    Store& m_store;
    TimerQueue& m_timers;
    seedbed_core::DiagnosticsSink* m_diagnostics;
    SchedulerConfig m_config;

    std::unordered_map<std::string, std::vector<WatchHandle>> m_watchers;
    std::vector<std::string> m_pending_order;
    std::unordered_set<std::string> m_pending;

    TimerId m_tick;
    std::size_t m_transaction_depth = 0;
    bool m_flushing = false;
    bool m_disposed = false;
    SchedulerStats m_stats;

    std::shared_ptr<int> m_alive = std::make_shared<int>(0);
};

} // namespace seedbed_state
