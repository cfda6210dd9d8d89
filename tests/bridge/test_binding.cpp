// seedbed_bridge binding codec and layout tests

#include <catch2/catch_test_macros.hpp>
#include <seedbed/bridge/binding.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <string>

using namespace seedbed_bridge;
using seedbed_core::BindingError;
using seedbed_core::ErrorCode;
using seedbed_core::StoreError;
using seedbed_state::Value;

namespace {

MemoryBinding binding(const std::string& key, std::size_t offset, std::string_view type,
                      std::optional<std::size_t> width = std::nullopt) {
    auto result = make_binding(key, offset, type, width);
    REQUIRE(result.is_ok());
    return result.value();
}

BindingError::Kind binding_kind(const seedbed_core::Error& error) {
    const auto* details = error.as<BindingError>();
    REQUIRE(details != nullptr);
    return details->kind;
}

} // namespace

// =============================================================================
// make_binding
// =============================================================================

TEST_CASE("make_binding shorthand types", "[bridge][binding]") {
    auto u8 = binding("a", 0, "u8");
    REQUIRE(u8.width == 1);
    REQUIRE(u8.encoding == Encoding::UnsignedLE);
    REQUIRE(u8.type_name() == "u8");

    auto i16 = binding("b", 2, "i16");
    REQUIRE(i16.width == 2);
    REQUIRE(i16.encoding == Encoding::SignedLE);

    auto f64 = binding("c", 8, "f64");
    REQUIRE(f64.width == 8);
    REQUIRE(f64.encoding == Encoding::FloatLE);
    REQUIRE(f64.end() == 16);

    auto flag = binding("d", 4, "bool");
    REQUIRE(flag.width == 1);
    REQUIRE(binding("e", 4, "bool", 4).width == 4);
}

TEST_CASE("make_binding rejects bad shapes", "[bridge][binding]") {
    SECTION("unknown type") {
        auto result = make_binding("a", 0, "string");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
        REQUIRE(binding_kind(result.error()) == BindingError::Kind::InvalidLayout);
    }

    SECTION("width that is not 1, 2, 4 or 8") {
        auto result = make_binding("a", 0, "u24");
        REQUIRE(result.is_err());
        REQUIRE(binding_kind(result.error()) == BindingError::Kind::InvalidWidth);
        REQUIRE(result.error().code() == ErrorCode::BindingFailed);
    }

    SECTION("16-bit float") {
        auto result = make_binding("a", 0, "f16");
        REQUIRE(result.is_err());
        REQUIRE(binding_kind(result.error()) == BindingError::Kind::EncodingMismatch);
    }

    SECTION("explicit width disagrees with the type") {
        auto result = make_binding("a", 0, "u32", 2);
        REQUIRE(result.is_err());
        REQUIRE(binding_kind(result.error()) == BindingError::Kind::EncodingMismatch);
    }

    SECTION("empty key") {
        REQUIRE(make_binding("", 0, "u8").is_err());
    }
}

// =============================================================================
// Codec
// =============================================================================

TEST_CASE("MemoryBinding decodes little-endian values", "[bridge][binding]") {
    std::array<std::uint8_t, 16> memory{};

    SECTION("unsigned") {
        memory[0] = 0x2A;
        memory[1] = 0x01;
        REQUIRE(binding("n", 0, "u16").decode(memory).value() == Value(298));
        REQUIRE(binding("n", 0, "u8").decode(memory).value() == Value(42));
    }

    SECTION("signed values are sign-extended") {
        memory[4] = 0xFF;
        memory[5] = 0xFF;
        REQUIRE(binding("n", 4, "i16").decode(memory).value() == Value(-1));
        REQUIRE(binding("n", 4, "u16").decode(memory).value() == Value(65535));
        REQUIRE(binding("n", 4, "i8").decode(memory).value() == Value(-1));
    }

    SECTION("bool is any non-zero byte") {
        REQUIRE(binding("b", 0, "bool", 4).decode(memory).value() == Value(false));
        memory[3] = 0x80;
        REQUIRE(binding("b", 0, "bool", 4).decode(memory).value() == Value(true));
    }

    SECTION("out of bounds") {
        auto result = binding("n", 14, "u32").decode(memory);
        REQUIRE(result.is_err());
        REQUIRE(binding_kind(result.error()) == BindingError::Kind::OutOfBounds);
    }
}

TEST_CASE("MemoryBinding encodes values", "[bridge][binding]") {
    std::array<std::uint8_t, 16> memory{};

    SECTION("unsigned little-endian") {
        REQUIRE(binding("n", 0, "u32").encode(Value(0x01020304), memory).is_ok());
        REQUIRE(memory[0] == 0x04);
        REQUIRE(memory[1] == 0x03);
        REQUIRE(memory[2] == 0x02);
        REQUIRE(memory[3] == 0x01);
    }

    SECTION("signed negative") {
        REQUIRE(binding("n", 2, "i16").encode(Value(-2), memory).is_ok());
        REQUIRE(memory[2] == 0xFE);
        REQUIRE(memory[3] == 0xFF);
        REQUIRE(binding("n", 2, "i16").decode(memory).value() == Value(-2));
    }

    SECTION("floats accept Int and Float") {
        auto f32 = binding("x", 0, "f32");
        REQUIRE(f32.encode(Value(1.5), memory).is_ok());
        REQUIRE(f32.decode(memory).value() == Value(1.5));

        auto f64 = binding("y", 8, "f64");
        REQUIRE(f64.encode(Value(3), memory).is_ok());
        REQUIRE(f64.decode(memory).value() == Value(3.0));
    }

    SECTION("bool") {
        auto flag = binding("b", 0, "bool");
        REQUIRE(flag.encode(Value(true), memory).is_ok());
        REQUIRE(memory[0] == 1);
        REQUIRE(flag.encode(Value(false), memory).is_ok());
        REQUIRE(memory[0] == 0);
    }

    SECTION("null leaves memory untouched") {
        memory[0] = 7;
        REQUIRE(binding("n", 0, "u8").encode(Value{}, memory).is_ok());
        REQUIRE(memory[0] == 7);
    }

    SECTION("values that do not fit") {
        auto u8 = binding("n", 0, "u8");
        auto too_big = u8.encode(Value(256), memory);
        REQUIRE(too_big.is_err());
        REQUIRE(too_big.error().code() == ErrorCode::LimitExceeded);
        REQUIRE(too_big.error().is<StoreError>());

        REQUIRE(u8.encode(Value(-1), memory).error().code() == ErrorCode::LimitExceeded);
        REQUIRE(binding("n", 0, "i8").encode(Value(128), memory).error().code() == ErrorCode::LimitExceeded);
        REQUIRE(binding("n", 0, "i8").encode(Value(-128), memory).is_ok());
    }

    SECTION("wrong value type") {
        auto result = binding("n", 0, "u32").encode(Value("seven"), memory);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::TypeMismatch);

        REQUIRE(binding("n", 0, "u32").encode(Value(1.0), memory).error().code() == ErrorCode::TypeMismatch);
        REQUIRE(binding("b", 0, "bool").encode(Value(1), memory).error().code() == ErrorCode::TypeMismatch);
    }
}

// =============================================================================
// LayoutTable
// =============================================================================

TEST_CASE("LayoutTable parses layout JSON", "[bridge][layout]") {
    SECTION("object form") {
        auto table = LayoutTable::parse(R"({"bindings": [
            {"key": "count", "offset": 0, "type": "u32"},
            {"key": "on", "offset": 8, "encoding": "bool", "width": 1}
        ]})");
        REQUIRE(table.is_ok());
        REQUIRE(table->size() == 2);

        const auto* on = table->find("on");
        REQUIRE(on != nullptr);
        REQUIRE(on->encoding == Encoding::Bool);
        REQUIRE(on->offset == 8);
        REQUIRE(table->find("missing") == nullptr);
    }

    SECTION("bare array form") {
        auto table = LayoutTable::parse(R"([{"key": "x", "offset": 4, "type": "f32"}])");
        REQUIRE(table.is_ok());
        REQUIRE(table->bindings()[0].type_name() == "f32");
    }

    SECTION("malformed input") {
        auto not_json = LayoutTable::parse("{bindings:");
        REQUIRE(not_json.is_err());
        REQUIRE(binding_kind(not_json.error()) == BindingError::Kind::InvalidLayout);

        REQUIRE(LayoutTable::parse(R"({"layout": []})").is_err());
        REQUIRE(LayoutTable::parse(R"({"bindings": [{"offset": 0, "type": "u8"}]})").is_err());
        REQUIRE(LayoutTable::parse(R"({"bindings": [{"key": "a", "offset": -4, "type": "u8"}]})").is_err());
        REQUIRE(LayoutTable::parse(R"({"bindings": [{"key": "a", "offset": 0}]})").is_err());
    }

    SECTION("duplicate keys") {
        auto table = LayoutTable::parse(R"([{"key": "a", "offset": 0, "type": "u8"},
                                            {"key": "a", "offset": 4, "type": "u8"}])");
        REQUIRE(table.is_err());
        REQUIRE(table.error().code() == ErrorCode::AlreadyExists);
    }
}

TEST_CASE("LayoutTable validation", "[bridge][layout]") {
    LayoutTable table;
    REQUIRE(table.add(binding("a", 0, "u32")).is_ok());
    REQUIRE(table.add(binding("b", 4, "u16")).is_ok());
    REQUIRE(table.validate(16).is_ok());

    SECTION("bounds") {
        auto result = table.validate(5);
        REQUIRE(result.is_err());
        REQUIRE(binding_kind(result.error()) == BindingError::Kind::OutOfBounds);
    }

    SECTION("overlap") {
        REQUIRE(table.add(binding("c", 5, "u8")).is_ok());
        auto result = table.validate(16);
        REQUIRE(result.is_err());
        const auto* details = result.error().as<BindingError>();
        REQUIRE(details->kind == BindingError::Kind::Overlap);
        REQUIRE(details->key == "c");
        REQUIRE(details->other_key == "b");
    }

    SECTION("merge refuses duplicates") {
        LayoutTable other;
        REQUIRE(other.add(binding("a", 8, "u8")).is_ok());
        REQUIRE(table.merge(other).is_err());

        LayoutTable extra;
        REQUIRE(extra.add(binding("z", 8, "u8")).is_ok());
        REQUIRE(table.merge(extra).is_ok());
        REQUIRE(table.size() == 3);
    }
}

TEST_CASE("LayoutTable serializes to JSON", "[bridge][layout]") {
    LayoutTable table;
    REQUIRE(table.add(binding("count", 0, "u32")).is_ok());
    REQUIRE(table.add(binding("on", 4, "bool", 4)).is_ok());

    auto json = table.to_json();
    REQUIRE(json["bindings"].size() == 2);
    REQUIRE(json["bindings"][0]["key"] == "count");
    REQUIRE(json["bindings"][0]["type"] == "u32");
    REQUIRE(json["bindings"][1]["width"] == 4);

    auto reparsed = LayoutTable::from_json(json);
    REQUIRE(reparsed.is_ok());
    REQUIRE(reparsed->find("on")->width == 4);
}
