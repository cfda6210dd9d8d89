/// @file timer.cpp
/// @brief Timer queue implementations

#include <seedbed/state/timer.hpp>

#include <thread>

namespace seedbed_state {

// =============================================================================
// TimerList
// =============================================================================

namespace detail {

TimerId TimerList::add(TimePoint due, TimerQueue::Callback callback) {
    std::uint64_t id = m_next_id++;
    m_timers.emplace(Key{due, id}, std::move(callback));
    m_due_by_id.emplace(id, due);
    return TimerId(id);
}

bool TimerList::remove(TimerId id) {
    auto it = m_due_by_id.find(id.id);
    if (it == m_due_by_id.end()) {
        return false;
    }
    m_timers.erase(Key{it->second, id.id});
    m_due_by_id.erase(it);
    return true;
}

std::optional<std::pair<TimerQueue::TimePoint, TimerQueue::Callback>> TimerList::pop_due(TimePoint limit) {
    if (m_timers.empty()) {
        return std::nullopt;
    }
    auto it = m_timers.begin();
    if (it->first.first > limit) {
        return std::nullopt;
    }
    std::pair<TimePoint, TimerQueue::Callback> out{it->first.first, std::move(it->second)};
    m_due_by_id.erase(it->first.second);
    m_timers.erase(it);
    return out;
}

std::optional<TimerQueue::TimePoint> TimerList::next_due() const {
    if (m_timers.empty()) {
        return std::nullopt;
    }
    return m_timers.begin()->first.first;
}

} // namespace detail

// =============================================================================
// ManualTimerQueue
// =============================================================================

TimerId ManualTimerQueue::schedule(Duration delay, Callback callback) {
    if (delay < Duration::zero()) {
        delay = Duration::zero();
    }
    return m_timers.add(m_now + delay, std::move(callback));
}

bool ManualTimerQueue::cancel(TimerId id) {
    return m_timers.remove(id);
}

std::size_t ManualTimerQueue::advance(Duration delta) {
    const TimePoint target = m_now + delta;
    std::size_t ran = 0;

    // Timers scheduled by callbacks run too if they fall due before target
    while (auto timer = m_timers.pop_due(target)) {
        if (timer->first > m_now) {
            m_now = timer->first;
        }
        if (timer->second) {
            timer->second();
        }
        ++ran;
    }

    m_now = target;
    return ran;
}

// =============================================================================
// SteadyTimerQueue
// =============================================================================

TimerId SteadyTimerQueue::schedule(Duration delay, Callback callback) {
    if (delay < Duration::zero()) {
        delay = Duration::zero();
    }
    return m_timers.add(Clock::now() + delay, std::move(callback));
}

bool SteadyTimerQueue::cancel(TimerId id) {
    return m_timers.remove(id);
}

std::size_t SteadyTimerQueue::poll() {
    const TimePoint limit = Clock::now();
    std::size_t ran = 0;
    while (auto timer = m_timers.pop_due(limit)) {
        if (timer->second) {
            timer->second();
        }
        ++ran;
    }
    return ran;
}

std::size_t SteadyTimerQueue::run_for(Duration duration) {
    const TimePoint deadline = Clock::now() + duration;
    std::size_t ran = 0;

    for (;;) {
        ran += poll();

        TimePoint now = Clock::now();
        if (now >= deadline) {
            break;
        }

        TimePoint wake = deadline;
        if (auto next = m_timers.next_due(); next && *next < wake) {
            wake = *next;
        }
        if (wake > now) {
            std::this_thread::sleep_until(wake);
        }
    }

    return ran;
}

} // namespace seedbed_state
