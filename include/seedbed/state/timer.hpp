#pragma once

/// @file timer.hpp
/// @brief Single-threaded timer queues driving scheduler ticks and bridge polling
///
/// Timers never fire on their own: the host loop calls poll()/run_for() on a
/// SteadyTimerQueue, tests call advance() on a ManualTimerQueue. Callbacks
/// always run on the caller's thread.

#include "fwd.hpp"

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <utility>

namespace seedbed_state {

// =============================================================================
// TimerId
// =============================================================================

/// Handle of a scheduled timer
struct TimerId {
    std::uint64_t id = 0;

    constexpr TimerId() = default;
    constexpr explicit TimerId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const TimerId&) const noexcept = default;
    constexpr bool operator==(const TimerId&) const noexcept = default;
};

// =============================================================================
// TimerQueue
// =============================================================================

/// One-shot timer queue
class TimerQueue {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = Clock::duration;
    using TimePoint = Clock::time_point;
    using Callback = std::function<void()>;

    virtual ~TimerQueue() = default;

    /// Schedule callback to run once after delay
    virtual TimerId schedule(Duration delay, Callback callback) = 0;

    /// Cancel a pending timer; false if it already ran or was cancelled
    virtual bool cancel(TimerId id) = 0;

    /// Current time of this queue
    [[nodiscard]] virtual TimePoint now() const = 0;

    /// Number of timers not yet run
    [[nodiscard]] virtual std::size_t pending() const = 0;
};

namespace detail {

/// Ordered timer storage shared by the concrete queues
class TimerList {
public:
    using TimePoint = TimerQueue::TimePoint;

    TimerId add(TimePoint due, TimerQueue::Callback callback);
    bool remove(TimerId id);

    /// Pop the earliest timer due at or before limit
    [[nodiscard]] std::optional<std::pair<TimePoint, TimerQueue::Callback>> pop_due(TimePoint limit);

    [[nodiscard]] std::optional<TimePoint> next_due() const;
    [[nodiscard]] std::size_t size() const noexcept { return m_timers.size(); }

private:
    using Key = std::pair<TimePoint, std::uint64_t>;

    std::map<Key, TimerQueue::Callback> m_timers;
    std::map<std::uint64_t, TimePoint> m_due_by_id;
    std::uint64_t m_next_id = 1;
};

} // namespace detail

// =============================================================================
// ManualTimerQueue
// =============================================================================

/// Virtual-time queue; time only moves on advance()
class ManualTimerQueue final : public TimerQueue {
public:
    ManualTimerQueue() = default;

    TimerId schedule(Duration delay, Callback callback) override;
    bool cancel(TimerId id) override;
    [[nodiscard]] TimePoint now() const override { return m_now; }
    [[nodiscard]] std::size_t pending() const override { return m_timers.size(); }

    /// Move time forward, running every timer that falls due in order
    /// @return Number of callbacks run
    std::size_t advance(Duration delta);

    /// Run timers due at the current instant
    std::size_t run_due() { return advance(Duration::zero()); }

private:
    detail::TimerList m_timers;
    TimePoint m_now{};
};

// =============================================================================
// SteadyTimerQueue
// =============================================================================

/// Wall-clock queue for host event loops
class SteadyTimerQueue final : public TimerQueue {
public:
    SteadyTimerQueue() = default;

    TimerId schedule(Duration delay, Callback callback) override;
    bool cancel(TimerId id) override;
    [[nodiscard]] TimePoint now() const override { return Clock::now(); }
    [[nodiscard]] std::size_t pending() const override { return m_timers.size(); }

    /// Run every timer already due
    std::size_t poll();

    /// Sleep between timers until duration has elapsed
    std::size_t run_for(Duration duration);

private:
    detail::TimerList m_timers;
};

} // namespace seedbed_state
