// seedbed_state Value tests

#include <catch2/catch_test_macros.hpp>
#include <seedbed/state/value.hpp>
#include <nlohmann/json.hpp>

#include <limits>

using namespace seedbed_state;

TEST_CASE("Value types", "[state][value]") {
    SECTION("default is null") {
        Value v;
        REQUIRE(v.is_null());
        REQUIRE(v.type() == ValueType::Null);
    }

    SECTION("scalars") {
        REQUIRE(Value(true).is_bool());
        REQUIRE(Value(42).is_int());
        REQUIRE(Value(42).as_int() == 42);
        REQUIRE(Value(1.5).is_float());
        REQUIRE(Value("text").is_string());
        REQUIRE(Value("text").as_string() == "text");
    }

    SECTION("int and float never compare equal") {
        REQUIRE(Value(1) != Value(1.0));
        REQUIRE(Value(1).is_numeric());
        REQUIRE(Value(1.0).is_numeric());
    }

    SECTION("NaN compares equal to NaN") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        REQUIRE(Value(nan) == Value(nan));
        REQUIRE(Value::array({nan, 1}) == Value::array({nan, 1}));
        REQUIRE(Value(nan) != Value(0.0));
        REQUIRE(Value(0.0) == Value(-0.0));
    }

    SECTION("containers compare structurally") {
        Value a = Value::array({1, 2, 3});
        Value b = Value::array({1, 2, 3});
        REQUIRE(a == b);
        REQUIRE(a.size() == 3);
        REQUIRE(a[1].as_int() == 2);

        Value obj(ValueObject{{"name", "seed"}, {"count", 2}});
        REQUIRE(obj.contains("name"));
        REQUIRE(obj.get("missing") == nullptr);
        REQUIRE(obj["count"].as_int() == 2);
    }

    SECTION("try accessors return empty on mismatch") {
        Value v("text");
        REQUIRE_FALSE(v.try_int().has_value());
        REQUIRE(v.try_string() != nullptr);
        REQUIRE(v.try_array() == nullptr);
    }
}

TEST_CASE("Value JSON conversion", "[state][value][json]") {
    SECTION("object with nested members") {
        auto j = nlohmann::json::parse(R"({"count": 3, "ratio": 0.5, "tags": ["a", "b"], "on": true, "none": null})");
        Value v = j.get<Value>();

        REQUIRE(v.is_object());
        REQUIRE(v["count"] == Value(3));
        REQUIRE(v["ratio"].is_float());
        REQUIRE(v["tags"].size() == 2);
        REQUIRE(v["on"].as_bool());
        REQUIRE(v["none"].is_null());

        nlohmann::json back = v;
        REQUIRE(back == j);
    }

    SECTION("bytes use a tagged array") {
        Value v(ValueBytes{1, 2, 255});
        nlohmann::json j = v;
        REQUIRE(j.is_object());
        REQUIRE(j["$bytes"].size() == 3);
        REQUIRE(j.get<Value>() == v);
    }

    SECTION("malformed bytes tags stay plain objects") {
        Value wide = nlohmann::json::parse(R"({"$bytes": [300, 1]})").get<Value>();
        REQUIRE(wide.is_object());
        REQUIRE(wide["$bytes"] == Value::array({300, 1}));

        Value text = nlohmann::json::parse(R"({"$bytes": ["x"]})").get<Value>();
        REQUIRE(text.is_object());
        REQUIRE(text["$bytes"] == Value::array({"x"}));

        Value negative = nlohmann::json::parse(R"({"$bytes": [-1]})").get<Value>();
        REQUIRE(negative.is_object());
    }

    SECTION("display string is compact JSON") {
        REQUIRE(to_display_string(Value::array({1, "x"})) == R"([1,"x"])");
    }
}
