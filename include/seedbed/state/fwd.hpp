#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for seedbed_state module

#include <cstdint>

namespace seedbed_state {

// Values
enum class ValueType : std::uint8_t;
class Value;
struct ReactiveValue;

// Store
struct StoreLimits;
class Store;

// Timers
struct TimerId;
class TimerQueue;
class ManualTimerQueue;
class SteadyTimerQueue;

// Scheduling
struct SchedulerConfig;
struct SchedulerStats;
class Subscription;
class BatchScheduler;

// Derived values
class ComputedEngine;

// Collections
template<typename T> class ReactiveList;
template<typename K, typename V> class ReactiveMap;

} // namespace seedbed_state
