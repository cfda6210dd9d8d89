// seedbed_runtime configuration tests

#include <catch2/catch_test_macros.hpp>
#include <seedbed/runtime/config.hpp>

#include <chrono>
#include <string>

using namespace seedbed_runtime;
using namespace std::chrono_literals;
using seedbed_core::ErrorCode;

TEST_CASE("RuntimeConfig defaults", "[runtime][config]") {
    auto config = RuntimeConfig::parse_string("");
    REQUIRE(config.is_ok());

    REQUIRE(config->scheduler.tick_interval == 16ms);
    REQUIRE(config->scheduler.max_flush_rounds == 64);
    REQUIRE(config->store_limits.max_key_length == 0);
    REQUIRE(config->sandbox.max_memory_pages == 16);
    REQUIRE(config->sandbox.fuel_limit == 0);
    REQUIRE(config->bridge.poll_interval == 100ms);
    REQUIRE(config->bridge.enable_polling);
    REQUIRE(config->bridge.layout_section == "seedbed.layout");
    REQUIRE(config->bridge.bindings.empty());
}

TEST_CASE("RuntimeConfig parses every section", "[runtime][config]") {
    auto config = RuntimeConfig::parse_string(R"(
[scheduler]
tick_interval_ms = 5
max_flush_rounds = 8

[store]
limits = "sandboxed"
max_string_length = 64

[sandbox]
fuel_limit = 100000
max_memory_pages = 4
max_call_depth = 128
poll_interval_ms = 250
polling = false
initializer = "init"
layout_section = "custom.layout"

[logging]
level = "debug"
console = false

[logging.levels]
bridge = "trace"
wasm = "warn"

[[bindings]]
key = "count"
offset = 0
type = "u32"

[[bindings]]
key = "on"
offset = 4
encoding = "bool"
width = 4
)");
    REQUIRE(config.is_ok());

    REQUIRE(config->scheduler.tick_interval == 5ms);
    REQUIRE(config->scheduler.max_flush_rounds == 8);

    REQUIRE(config->store_limits.max_key_length == 50);
    REQUIRE(config->store_limits.max_string_length == 64);
    REQUIRE(config->store_limits.max_array_length == 100);

    REQUIRE(config->sandbox.fuel_limit == 100000);
    REQUIRE(config->sandbox.max_memory_pages == 4);
    REQUIRE(config->sandbox.max_call_depth == 128);

    REQUIRE(config->bridge.poll_interval == 250ms);
    REQUIRE_FALSE(config->bridge.enable_polling);
    REQUIRE(config->bridge.initializer == "init");
    REQUIRE(config->bridge.layout_section == "custom.layout");

    REQUIRE(config->logging.level == spdlog::level::debug);
    REQUIRE_FALSE(config->logging.console_enabled);
    REQUIRE(config->logging.subsystem_levels.size() == 2);
    REQUIRE(config->logging.subsystem_levels.at(seedbed_core::LogSubsystem::Bridge) == spdlog::level::trace);
    REQUIRE(config->logging.subsystem_levels.at(seedbed_core::LogSubsystem::Wasm) == spdlog::level::warn);

    REQUIRE(config->bridge.bindings.size() == 2);
    REQUIRE(config->bridge.bindings[0].key == "count");
    REQUIRE(config->bridge.bindings[0].width == 4);
    REQUIRE(config->bridge.bindings[1].encoding == seedbed_bridge::Encoding::Bool);
    REQUIRE(config->bridge.bindings[1].width == 4);
}

TEST_CASE("RuntimeConfig validation errors", "[runtime][config]") {
    auto code_of = [](const char* text) {
        auto config = RuntimeConfig::parse_string(text);
        REQUIRE(config.is_err());
        return config.error().code();
    };

    REQUIRE(code_of("[scheduler]\ntick_interval_ms = -1\n") == ErrorCode::ValidationError);
    REQUIRE(code_of("[scheduler]\nmax_flush_rounds = 0\n") == ErrorCode::ValidationError);
    REQUIRE(code_of("[store]\nlimits = \"tiny\"\n") == ErrorCode::ValidationError);
    REQUIRE(code_of("[sandbox]\nmax_memory_pages = 70000\n") == ErrorCode::ValidationError);
    REQUIRE(code_of("[sandbox]\npoll_interval_ms = 0\n") == ErrorCode::ValidationError);
    REQUIRE(code_of("[sandbox]\nfuel_limit = \"lots\"\n") == ErrorCode::ValidationError);
    REQUIRE(code_of("[logging]\nlevel = \"loud\"\n") == ErrorCode::ValidationError);
    REQUIRE(code_of("[logging.levels]\naudio = \"debug\"\n") == ErrorCode::ValidationError);
    REQUIRE(code_of("[logging.levels]\nstore = 3\n") == ErrorCode::ValidationError);
    REQUIRE(code_of("[[bindings]]\noffset = 0\ntype = \"u8\"\n") == ErrorCode::ValidationError);
    REQUIRE(code_of("[[bindings]]\nkey = \"a\"\noffset = -1\ntype = \"u8\"\n") == ErrorCode::ValidationError);
    REQUIRE(code_of("[[bindings]]\nkey = \"a\"\noffset = 0\n") == ErrorCode::ValidationError);
}

TEST_CASE("RuntimeConfig binding errors keep their kind", "[runtime][config]") {
    auto config = RuntimeConfig::parse_string("[[bindings]]\nkey = \"a\"\noffset = 0\ntype = \"u24\"\n");
    REQUIRE(config.is_err());
    REQUIRE(config.error().code() == ErrorCode::BindingFailed);
}

TEST_CASE("RuntimeConfig syntax errors", "[runtime][config]") {
    auto config = RuntimeConfig::parse_string("[scheduler\ntick = ");
    REQUIRE(config.is_err());
    REQUIRE(config.error().code() == ErrorCode::ParseError);
}

TEST_CASE("RuntimeConfig missing file", "[runtime][config]") {
    auto config = RuntimeConfig::load("/nonexistent/seedbed.toml");
    REQUIRE(config.is_err());
    REQUIRE(config.error().code() == ErrorCode::NotFound);
}
