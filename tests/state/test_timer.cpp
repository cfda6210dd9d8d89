// seedbed_state timer queue tests

#include <catch2/catch_test_macros.hpp>
#include <seedbed/state/timer.hpp>

#include <chrono>
#include <vector>

using namespace seedbed_state;
using namespace std::chrono_literals;

TEST_CASE("ManualTimerQueue ordering", "[state][timer]") {
    ManualTimerQueue timers;
    std::vector<int> order;

    timers.schedule(30ms, [&]() { order.push_back(3); });
    timers.schedule(10ms, [&]() { order.push_back(1); });
    timers.schedule(20ms, [&]() { order.push_back(2); });

    REQUIRE(timers.pending() == 3);
    REQUIRE(timers.advance(15ms) == 1);
    REQUIRE(order == std::vector<int>{1});

    REQUIRE(timers.advance(100ms) == 2);
    REQUIRE(order == std::vector<int>{1, 2, 3});
    REQUIRE(timers.pending() == 0);
}

TEST_CASE("ManualTimerQueue cancel", "[state][timer]") {
    ManualTimerQueue timers;
    bool fired = false;

    TimerId id = timers.schedule(10ms, [&]() { fired = true; });
    REQUIRE(id.is_valid());
    REQUIRE(timers.cancel(id));
    REQUIRE_FALSE(timers.cancel(id));

    timers.advance(1s);
    REQUIRE_FALSE(fired);
}

TEST_CASE("ManualTimerQueue callbacks see their due time", "[state][timer]") {
    ManualTimerQueue timers;
    const auto start = timers.now();
    TimerQueue::TimePoint seen{};
    int chained = 0;

    timers.schedule(10ms, [&]() {
        seen = timers.now();
        // Rescheduled timers inside the window also run
        timers.schedule(10ms, [&]() { ++chained; });
    });

    timers.advance(25ms);
    REQUIRE(seen - start == 10ms);
    REQUIRE(chained == 1);
    REQUIRE(timers.now() - start == 25ms);
}

TEST_CASE("SteadyTimerQueue runs due timers", "[state][timer]") {
    SteadyTimerQueue timers;
    int ran = 0;

    timers.schedule(0ms, [&]() { ++ran; });
    timers.schedule(1h, [&]() { ++ran; });

    REQUIRE(timers.poll() == 1);
    REQUIRE(ran == 1);
    REQUIRE(timers.pending() == 1);

    timers.run_for(5ms);
    REQUIRE(ran == 1);
}
