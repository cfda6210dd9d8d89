// seedbed_state Store tests

#include <catch2/catch_test_macros.hpp>
#include <seedbed/state/store.hpp>

#include <limits>
#include <string>
#include <vector>

using namespace seedbed_state;
using seedbed_core::ErrorCode;

TEST_CASE("Store get", "[state][store]") {
    Store store;

    SECTION("creates key with default on first access") {
        REQUIRE(store.get("count", 5) == Value(5));
        REQUIRE(store.contains("count"));
        REQUIRE(store.get("count", 9) == Value(5));
    }

    SECTION("does not notify") {
        int changes = 0;
        store.set_change_listener([&](const std::string&) { ++changes; });
        (void)store.get("count", 5);
        REQUIRE(changes == 0);
    }

    SECTION("peek does not create") {
        REQUIRE(store.peek("missing", 1) == Value(1));
        REQUIRE_FALSE(store.contains("missing"));
    }
}

TEST_CASE("Store set", "[state][store]") {
    Store store;
    std::vector<std::string> changed;
    store.set_change_listener([&](const std::string& key) { changed.push_back(key); });

    SECTION("read your write") {
        auto r = store.set("name", "seed");
        REQUIRE(r.is_ok());
        REQUIRE(r.value());
        REQUIRE(store.get("name") == Value("seed"));
    }

    SECTION("equal write is a no-op") {
        REQUIRE(store.set("count", 1).value());
        REQUIRE_FALSE(store.set("count", 1).value());
        REQUIRE(changed.size() == 1);
        REQUIRE(store.change_count() == 1);
    }

    SECTION("rewriting NaN is a no-op") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        REQUIRE(store.set("ratio", nan).value());
        REQUIRE_FALSE(store.set("ratio", nan).value());
        REQUIRE(changed.size() == 1);
    }

    SECTION("type is fixed by first non-null value") {
        REQUIRE(store.set("count", 1).is_ok());
        auto r = store.set("count", "one");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::TypeMismatch);
        REQUIRE(store.get("count") == Value(1));
        REQUIRE(store.declared_type("count") == ValueType::Int);
    }

    SECTION("null may replace any type and keeps the declared type") {
        REQUIRE(store.set("count", 1).is_ok());
        REQUIRE(store.set("count", Value{}).value());
        REQUIRE(store.set("count", 2).value());
        REQUIRE(store.set("count", "two").is_err());
    }

    SECTION("timestamps come from the configured clock") {
        auto t0 = Store::TimePoint{} + std::chrono::seconds(10);
        store.set_clock([&]() { return t0; });
        REQUIRE(store.set("count", 1).is_ok());
        REQUIRE(store.find("count")->last_updated == t0);
    }

    SECTION("snapshot copies everything") {
        REQUIRE(store.set("a", 1).is_ok());
        REQUIRE(store.set("b", "x").is_ok());
        auto snap = store.snapshot();
        REQUIRE(snap.size() == 2);
        REQUIRE(snap.at("b") == Value("x"));
        REQUIRE(store.keys() == std::vector<std::string>{"a", "b"});
    }
}

TEST_CASE("Store limits", "[state][store]") {
    Store store(StoreLimits::sandboxed());

    SECTION("long key") {
        auto r = store.set(std::string(51, 'k'), 1);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::LimitExceeded);
    }

    SECTION("long string") {
        REQUIRE(store.set("text", std::string(1000, 'x')).is_ok());
        REQUIRE(store.set("text", std::string(1001, 'x')).is_err());
    }

    SECTION("nested array is checked") {
        ValueArray inner(101, Value(1));
        auto r = store.set("nested", Value(ValueObject{{"items", Value(inner)}}));
        REQUIRE(r.is_err());
        REQUIRE_FALSE(store.contains("nested"));
    }

    SECTION("empty key is rejected everywhere") {
        Store open;
        REQUIRE(open.set("", 1).is_err());
    }
}

TEST_CASE("Store dispose", "[state][store]") {
    Store store;
    REQUIRE(store.set("count", 1).is_ok());

    store.dispose();
    store.dispose();

    REQUIRE(store.is_disposed());
    REQUIRE(store.size() == 0);
    auto r = store.set("count", 2);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value());
    REQUIRE(store.get("count", 7) == Value(7));
    REQUIRE_FALSE(store.contains("count"));
}
