// seedbed_state ReactiveList / ReactiveMap tests

#include <catch2/catch_test_macros.hpp>
#include <seedbed/state/collections.hpp>
#include <seedbed/state/scheduler.hpp>
#include <seedbed/state/timer.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

using namespace seedbed_state;
using namespace std::chrono_literals;

TEST_CASE("ReactiveList", "[state][collections]") {
    Store store;
    ReactiveList<int> list(store, "items");

    REQUIRE(store.get("items") == Value::empty_array());
    REQUIRE(list.empty());

    SECTION("mutations") {
        REQUIRE(list.add(1).is_ok());
        REQUIRE(list.add(3).is_ok());
        REQUIRE(list.insert(1, 2).is_ok());
        REQUIRE(list.items() == std::vector<int>{1, 2, 3});

        REQUIRE(list.assign(0, 10).is_ok());
        REQUIRE(list.at(0) == 10);
        REQUIRE(list.contains(3));

        REQUIRE(list.remove(2).value());
        REQUIRE_FALSE(list.remove(42).value());
        REQUIRE(list.remove_at(0).is_ok());
        REQUIRE(list.items() == std::vector<int>{3});

        REQUIRE(list.clear().is_ok());
        REQUIRE(list.size() == 0);
    }

    SECTION("index out of range") {
        auto r = list.insert(5, 1);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == seedbed_core::ErrorCode::InvalidArgument);
        REQUIRE_FALSE(list.at(0).has_value());
    }

    SECTION("readers get detached copies") {
        REQUIRE(list.add(1).is_ok());
        auto copy = list.items();
        copy.push_back(99);
        REQUIRE(list.size() == 1);
    }
}

TEST_CASE("ReactiveList skips elements that do not fit the element type", "[state][collections]") {
    Store store;
    REQUIRE(store.set("levels", Value::array({Value(7), Value(300), Value(-1), Value(255)})).is_ok());

    ReactiveList<std::uint8_t> levels(store, "levels");
    REQUIRE(levels.size() == 4);
    REQUIRE(levels.items() == std::vector<std::uint8_t>{7, 255});
    REQUIRE(levels.at(0) == std::uint8_t{7});
    REQUIRE_FALSE(levels.at(1).has_value());
    REQUIRE_FALSE(levels.at(2).has_value());

    ReactiveMap<std::string, std::int16_t> offsets(store, "offsets");
    REQUIRE(store.set("offsets", Value(ValueObject{{"near", Value(-40)}, {"far", Value(70000)}})).is_ok());
    REQUIRE(offsets.get("near") == std::int16_t{-40});
    REQUIRE_FALSE(offsets.get("far").has_value());
    REQUIRE(offsets.entries().size() == 1);
}

TEST_CASE("ReactiveList notifies once per mutation", "[state][collections]") {
    ManualTimerQueue timers;
    Store store;
    BatchScheduler scheduler(store, timers);
    ReactiveList<std::string> list(store, "names");

    std::vector<std::size_t> sizes;
    scheduler.watch("names", [&](const std::string&, const Value& v) { sizes.push_back(v.size()); });

    REQUIRE(list.add("a").is_ok());
    scheduler.flush();
    REQUIRE(list.add("b").is_ok());
    scheduler.flush();

    REQUIRE(sizes == std::vector<std::size_t>{1, 2});
}

TEST_CASE("ReactiveList respects store limits", "[state][collections]") {
    Store store(StoreLimits::sandboxed());
    ReactiveList<int> list(store, "items");
    for (int i = 0; i < 100; ++i) {
        REQUIRE(list.add(i).is_ok());
    }
    REQUIRE(list.add(100).is_err());
    REQUIRE(list.size() == 100);
}

TEST_CASE("ReactiveMap", "[state][collections]") {
    Store store;
    ReactiveMap<std::string, double> prices(store, "prices");

    REQUIRE(prices.set("apple", 1.5).is_ok());
    REQUIRE(prices.set("pear", 2.0).is_ok());
    REQUIRE(prices.get("apple") == 1.5);
    REQUIRE(prices.contains("pear"));
    REQUIRE_FALSE(prices.get("plum").has_value());

    REQUIRE(prices.remove("pear").value());
    REQUIRE_FALSE(prices.remove("pear").value());
    REQUIRE(prices.entries() == std::map<std::string, double>{{"apple", 1.5}});

    REQUIRE(store.get("prices")["apple"] == Value(1.5));
}

TEST_CASE("ReactiveMap with integer keys", "[state][collections]") {
    Store store;
    ReactiveMap<int, std::string> names(store, "by_id");

    REQUIRE(names.set(7, "seven").is_ok());
    REQUIRE(names.set(12, "twelve").is_ok());
    REQUIRE(store.get("by_id").contains("7"));

    auto entries = names.entries();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries.at(12) == "twelve");

    REQUIRE(names.clear().is_ok());
    REQUIRE(names.empty());
}
