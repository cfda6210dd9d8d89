/// @file scheduler.cpp
/// @brief Watcher registry and batch scheduler implementation

#include <seedbed/state/scheduler.hpp>
#include <seedbed/core/diagnostics.hpp>
#include <seedbed/core/log.hpp>

#include <algorithm>
#include <exception>

namespace seedbed_state {

// =============================================================================
// Subscription
// =============================================================================

void Subscription::unsubscribe() {
    if (m_scheduler && !m_alive.expired() && m_handle) {
        m_scheduler->unwatch(m_key, m_handle);
    }
    m_scheduler = nullptr;
    m_alive.reset();
}

bool Subscription::active() const {
    return m_scheduler && !m_alive.expired() && m_handle && m_scheduler->is_watching(m_key, m_handle);
}

// =============================================================================
// BatchScheduler
// =============================================================================

namespace {

/// Resets a flag on scope exit
struct FlagGuard {
    bool& flag;
    explicit FlagGuard(bool& f) : flag(f) { flag = true; }
    ~FlagGuard() { flag = false; }
};

} // anonymous namespace

BatchScheduler::BatchScheduler(Store& store, TimerQueue& timers, seedbed_core::DiagnosticsSink* diagnostics,
                               SchedulerConfig config)
    : m_store(store)
    , m_timers(timers)
    , m_diagnostics(diagnostics)
    , m_config(config)
{
    if (m_config.max_flush_rounds == 0) {
        m_config.max_flush_rounds = 1;
    }
    m_store.set_change_listener([this](const std::string& key) { mark(key); });
}

BatchScheduler::~BatchScheduler() {
    cancel_tick();
    if (!m_store.is_disposed()) {
        m_store.set_change_listener(nullptr);
    }
}

Subscription BatchScheduler::watch(const std::string& key, WatchHandle handle) {
    if (m_disposed || !handle) {
        return Subscription{};
    }

    auto& handles = m_watchers[key];
    if (std::find(handles.begin(), handles.end(), handle) == handles.end()) {
        handles.push_back(handle);
    }
    return Subscription(this, m_alive, key, std::move(handle));
}

Subscription BatchScheduler::watch(const std::string& key, WatchCallback callback) {
    return watch(key, make_watch_handle(std::move(callback)));
}

bool BatchScheduler::unwatch(const std::string& key, const WatchHandle& handle) {
    auto it = m_watchers.find(key);
    if (it == m_watchers.end()) {
        return false;
    }

    auto& handles = it->second;
    auto pos = std::find(handles.begin(), handles.end(), handle);
    if (pos == handles.end()) {
        return false;
    }
    handles.erase(pos);
    if (handles.empty()) {
        m_watchers.erase(it);
    }
    return true;
}

bool BatchScheduler::is_watching(const std::string& key, const WatchHandle& handle) const {
    auto it = m_watchers.find(key);
    if (it == m_watchers.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), handle) != it->second.end();
}

std::size_t BatchScheduler::watcher_count() const {
    std::size_t count = 0;
    for (const auto& [key, handles] : m_watchers) {
        count += handles.size();
    }
    return count;
}

std::size_t BatchScheduler::watcher_count(const std::string& key) const {
    auto it = m_watchers.find(key);
    return it != m_watchers.end() ? it->second.size() : 0;
}

bool BatchScheduler::is_pending(const std::string& key) const {
    return m_pending.find(key) != m_pending.end();
}

// =============================================================================
// Marking and ticks
// =============================================================================

void BatchScheduler::mark(const std::string& key) {
    if (m_disposed) {
        return;
    }
    if (m_pending.insert(key).second) {
        m_pending_order.push_back(key);
    }
    if (!m_flushing && m_transaction_depth == 0) {
        schedule_tick();
    }
}

void BatchScheduler::schedule_tick() {
    if (m_tick.is_valid() || m_disposed) {
        return;
    }

    std::weak_ptr<int> alive = m_alive;
    m_tick = m_timers.schedule(m_config.tick_interval, [this, alive]() {
        if (alive.expired() || m_disposed) {
            return;
        }
        m_tick = TimerId{};
        flush();
    });
}

void BatchScheduler::cancel_tick() {
    if (m_tick.is_valid()) {
        m_timers.cancel(m_tick);
        m_tick = TimerId{};
    }
}

// =============================================================================
// Flush
// =============================================================================

std::size_t BatchScheduler::flush() {
    if (m_disposed || m_flushing) {
        return 0;
    }

    cancel_tick();
    if (m_pending_order.empty()) {
        return 0;
    }

    FlagGuard guard(m_flushing);
    std::size_t delivered = 0;
    std::size_t rounds = 0;

    while (!m_pending_order.empty() && !m_disposed) {
        if (rounds == m_config.max_flush_rounds) {
            ++m_stats.deferred_flushes;
            seedbed_core::scheduler_logger()->warn(
                "Flush stopped after {} rounds with {} keys pending, deferring to next tick",
                rounds, m_pending_order.size());
            break;
        }

        std::vector<std::string> batch;
        batch.swap(m_pending_order);
        m_pending.clear();

        for (const auto& key : batch) {
            if (m_disposed) {
                break;
            }
            deliver(key);
            ++delivered;
        }
        ++rounds;
    }

    ++m_stats.flush_count;
    seedbed_core::scheduler_logger()->trace("Flush #{} delivered {} keys in {} rounds",
                                            m_stats.flush_count, delivered, rounds);

    // Leftovers from a capped flush roll over to the next tick
    if (!m_disposed && !m_pending_order.empty() && m_transaction_depth == 0) {
        m_flushing = false;
        schedule_tick();
    }

    return delivered;
}

void BatchScheduler::deliver(const std::string& key) {
    auto it = m_watchers.find(key);
    if (it == m_watchers.end()) {
        return;
    }

    // Callbacks may watch/unwatch; iterate a copy and skip removed handles
    const std::vector<WatchHandle> handles = it->second;
    const Value value = m_store.peek(key);

    for (const auto& handle : handles) {
        if (m_disposed) {
            return;
        }
        if (!is_watching(key, handle)) {
            continue;
        }

        ++m_stats.notification_count;
        try {
            (*handle)(key, value);
        } catch (const std::exception& e) {
            report_callback_failure(key, e.what());
        } catch (...) {
            report_callback_failure(key, "unknown exception");
        }
    }
}

void BatchScheduler::report_callback_failure(const std::string& key, const std::string& reason) {
    ++m_stats.callback_errors;
    seedbed_core::Error error = seedbed_core::WatcherError::callback_failed(key, reason);
    seedbed_core::debug::record_error(error);
    seedbed_core::scheduler_logger()->warn("{}", error.message());
    if (m_diagnostics) {
        m_diagnostics->report_error("scheduler", error);
    }
}

// =============================================================================
// Transactions
// =============================================================================

void BatchScheduler::begin_transaction() {
    if (m_disposed) {
        return;
    }
    if (m_transaction_depth++ == 0) {
        cancel_tick();
    }
}

void BatchScheduler::end_transaction() {
    if (m_transaction_depth == 0) {
        return;
    }
    if (--m_transaction_depth == 0 && !m_disposed) {
        flush();
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

void BatchScheduler::clear() {
    cancel_tick();
    m_pending_order.clear();
    m_pending.clear();
}

void BatchScheduler::dispose() {
    if (m_disposed) {
        return;
    }
    clear();
    m_disposed = true;
    m_watchers.clear();
    m_transaction_depth = 0;
    m_alive.reset();
}

} // namespace seedbed_state
