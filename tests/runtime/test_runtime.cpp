// seedbed_runtime RuntimeInstance tests

#include <catch2/catch_test_macros.hpp>
#include <seedbed/core/diagnostics.hpp>
#include <seedbed/runtime/runtime.hpp>

#include "wasm/module_builder.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace seedbed_runtime;
using namespace std::chrono_literals;
using seedbed_core::Error;
using seedbed_core::ErrorCode;
using seedbed_core::Result;
using seedbed_state::Value;

namespace {

/// Sandbox with 64 bytes of memory, a u8 "hits" binding at offset 0 and a
/// single "bump" export that increments it
class FakeSandbox final : public seedbed_bridge::Sandbox {
public:
    explicit FakeSandbox(bool refuse) : m_refuse(refuse) {}

    Result<void> instantiate(std::span<const std::uint8_t>) override {
        if (m_refuse) {
            return Error(seedbed_core::LoadError::instantiation_failed("refused"));
        }
        m_instantiated = true;
        m_memory.assign(64, 0);
        return seedbed_core::Ok();
    }

    bool is_instantiated() const override { return m_instantiated; }
    bool has_memory() const override { return m_instantiated; }
    std::span<std::uint8_t> memory() override { return m_memory; }

    std::optional<std::vector<std::uint8_t>> custom_section(const std::string& name) const override {
        if (name != "seedbed.layout") {
            return std::nullopt;
        }
        const std::string layout = R"([{"key": "hits", "offset": 0, "type": "u8"}])";
        return std::vector<std::uint8_t>(layout.begin(), layout.end());
    }

    bool has_export(const std::string& name) const override { return m_instantiated && name == "bump"; }

    Result<Value> call(const std::string& name, const std::vector<Value>&) override {
        if (!m_instantiated) {
            return Error(seedbed_core::SandboxError::not_instantiated());
        }
        if (name != "bump") {
            return Error(seedbed_core::SandboxError::export_not_found(name));
        }
        ++m_memory[0];
        m_dirty.push_back(seedbed_bridge::DirtyRange{0, 1});
        return Value{};
    }

    void set_write_hook(seedbed_bridge::WriteHook hook) override { m_hook = std::move(hook); }

    std::vector<seedbed_bridge::DirtyRange> take_dirty_ranges() override {
        return std::exchange(m_dirty, {});
    }

    void release() override {
        m_instantiated = false;
        m_memory.clear();
        m_dirty.clear();
    }

private:
    bool m_refuse;
    bool m_instantiated = false;
    std::vector<std::uint8_t> m_memory;
    std::vector<seedbed_bridge::DirtyRange> m_dirty;
    seedbed_bridge::WriteHook m_hook;
};

struct RuntimeFixture {
    seedbed_state::ManualTimerQueue timers;
    seedbed_core::DiagnosticsLog diagnostics;
};

const std::vector<std::uint8_t> k_any_bytes = {0x00};

} // namespace

// =============================================================================
// Loading
// =============================================================================

TEST_CASE_METHOD(RuntimeFixture, "Runtime loads a WebAssembly module", "[runtime]") {
    RuntimeInstance runtime(RuntimeContext{timers, &diagnostics, {}});

    REQUIRE(runtime.load(seedbed_test::counter_module(), {{"count", Value(2)}}).is_ok());
    REQUIRE(runtime.bridge() != nullptr);
    REQUIRE(runtime.bridge()->is_ready());
    REQUIRE(runtime.get_value("count") == Value(2));

    REQUIRE(runtime.call_function("increment").is_ok());
    REQUIRE(runtime.get_value("count") == Value(3));

    auto stats = runtime.get_stats();
    REQUIRE(stats.value_count == 1);
    REQUIRE(stats.watcher_count == 1);
    REQUIRE(stats.bridge_state == seedbed_bridge::BridgeState::Ready);

    // Only one bridge per runtime while it is healthy
    auto again = runtime.load(seedbed_test::counter_module());
    REQUIRE(again.is_err());
    REQUIRE(again.error().code() == ErrorCode::InvalidState);
}

TEST_CASE_METHOD(RuntimeFixture, "Runtime calls see values set just before", "[runtime]") {
    RuntimeInstance runtime(RuntimeContext{timers, &diagnostics, {}});
    REQUIRE(runtime.load(seedbed_test::counter_module(), {{"count", Value(42)}}).is_ok());
    runtime.flush();

    REQUIRE(runtime.set_value("count", 7).is_ok());
    REQUIRE(runtime.call_function("increment").is_ok());
    REQUIRE(runtime.get_value("count") == Value(8));
}

TEST_CASE_METHOD(RuntimeFixture, "Runtime applies its sandbox configuration", "[runtime]") {
    RuntimeConfig config;
    config.sandbox.max_memory_pages = 0;
    RuntimeInstance runtime(RuntimeContext{timers, &diagnostics, {}}, config);

    auto loaded = runtime.load(seedbed_test::counter_module());
    REQUIRE(loaded.is_err());
    REQUIRE(loaded.error().code() == ErrorCode::LoadFailed);
}

TEST_CASE_METHOD(RuntimeFixture, "Runtime retries after a failed load", "[runtime]") {
    int created = 0;
    RuntimeContext context{timers, &diagnostics, [&]() -> std::unique_ptr<seedbed_bridge::Sandbox> {
        return std::make_unique<FakeSandbox>(created++ == 0);
    }};
    RuntimeInstance runtime(std::move(context));

    auto first = runtime.load(k_any_bytes);
    REQUIRE(first.is_err());
    REQUIRE(first.error().code() == ErrorCode::LoadFailed);
    REQUIRE(runtime.get_stats().bridge_state == seedbed_bridge::BridgeState::Failed);
    REQUIRE(diagnostics.count("bridge", ErrorCode::LoadFailed) == 1);

    REQUIRE(runtime.load(k_any_bytes).is_ok());
    REQUIRE(created == 2);
    REQUIRE(runtime.get_value("hits") == Value(0));

    REQUIRE(runtime.call_function("bump").is_ok());
    REQUIRE(runtime.call_function("bump").is_ok());
    REQUIRE(runtime.get_value("hits") == Value(2));
}

TEST_CASE_METHOD(RuntimeFixture, "Runtime calls before load", "[runtime]") {
    RuntimeInstance runtime(RuntimeContext{timers, &diagnostics, {}});
    auto result = runtime.call_function("anything");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::InvalidState);
}

// =============================================================================
// State
// =============================================================================

TEST_CASE_METHOD(RuntimeFixture, "Runtime state and watchers", "[runtime]") {
    RuntimeInstance runtime(RuntimeContext{timers, &diagnostics, {}});

    std::vector<Value> seen;
    runtime.watch("n", [&](const std::string&, const Value& v) { seen.push_back(v); });

    REQUIRE(runtime.get_value("missing", Value(9)) == Value(9));
    REQUIRE(runtime.set_value("n", 1).value());
    REQUIRE_FALSE(runtime.set_value("n", 1).value());
    REQUIRE(runtime.set_value("n", 2).value());

    timers.advance(16ms);
    REQUIRE(seen == std::vector<Value>{Value(2)});

    auto handle = seedbed_state::make_watch_handle([&](const std::string&, const Value& v) { seen.push_back(v); });
    runtime.watch("n", handle);
    REQUIRE(runtime.unwatch("n", handle));
    REQUIRE_FALSE(runtime.unwatch("n", handle));
}

TEST_CASE_METHOD(RuntimeFixture, "Runtime transactions flush once", "[runtime]") {
    RuntimeInstance runtime(RuntimeContext{timers, &diagnostics, {}});

    int calls = 0;
    runtime.watch("a", [&](const std::string&, const Value&) { ++calls; });
    runtime.watch("b", [&](const std::string&, const Value&) { ++calls; });

    auto sum = runtime.transaction([&]() {
        (void)runtime.set_value("a", 1);
        (void)runtime.set_value("b", 2);
        return 3;
    });

    REQUIRE(sum == 3);
    REQUIRE(calls == 2);
    REQUIRE(runtime.get_stats().flush_count == 1);
    REQUIRE(runtime.get_stats().pending_updates == 0);
}

TEST_CASE_METHOD(RuntimeFixture, "Runtime computed values", "[runtime]") {
    RuntimeInstance runtime(RuntimeContext{timers, &diagnostics, {}});

    REQUIRE(runtime.set_value("n", 4).is_ok());
    auto defined = runtime.computed("double", [](const seedbed_state::Store& store) {
        return Value(store.peek("n").as_int() * 2);
    }, {"n"});
    REQUIRE(defined.is_ok());
    REQUIRE(runtime.get_value("double") == Value(8));
    REQUIRE(runtime.get_stats().computed_count == 1);

    REQUIRE(runtime.set_value("n", 5).is_ok());
    runtime.flush();
    REQUIRE(runtime.get_value("double") == Value(10));
}

TEST_CASE_METHOD(RuntimeFixture, "Runtime store limits come from config", "[runtime]") {
    RuntimeConfig config;
    config.store_limits = seedbed_state::StoreLimits::sandboxed();
    RuntimeInstance runtime(RuntimeContext{timers, &diagnostics, {}}, config);

    auto result = runtime.set_value("text", std::string(1001, 'x'));
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::LimitExceeded);
    REQUIRE(runtime.set_value("text", std::string(1000, 'x')).is_ok());
}

// =============================================================================
// Snapshots
// =============================================================================

TEST_CASE_METHOD(RuntimeFixture, "Runtime snapshots", "[runtime]") {
    RuntimeInstance runtime(RuntimeContext{timers, &diagnostics, {}});
    REQUIRE(runtime.set_value("a", 1).is_ok());
    REQUIRE(runtime.set_value("b", "x").is_ok());

    REQUIRE(runtime.snapshot_json() == R"({"a":1,"b":"x"})");
    REQUIRE(nlohmann::json::parse(runtime.snapshot_json(2)) == nlohmann::json{{"a", 1}, {"b", "x"}});
}

TEST_CASE_METHOD(RuntimeFixture, "Runtime restore", "[runtime]") {
    RuntimeInstance runtime(RuntimeContext{timers, &diagnostics, {}});
    REQUIRE(runtime.set_value("a", 1).is_ok());
    runtime.flush();

    int calls = 0;
    runtime.watch("a", [&](const std::string&, const Value&) { ++calls; });

    SECTION("object members are written in one transaction") {
        REQUIRE(runtime.restore_json(R"({"a": 5, "c": [1, 2]})").is_ok());
        REQUIRE(runtime.get_value("a") == Value(5));
        REQUIRE(runtime.get_value("c") == Value::array({Value(1), Value(2)}));
        REQUIRE(calls == 1);
        REQUIRE(runtime.get_stats().pending_updates == 0);
    }

    SECTION("invalid JSON") {
        auto result = runtime.restore_json("{not json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("non-object JSON") {
        REQUIRE(runtime.restore_json("[1, 2]").error().code() == ErrorCode::ParseError);
    }

    SECTION("tagged bytes") {
        REQUIRE(runtime.restore_json(R"({"blob": {"$bytes": [1, 255]}})").is_ok());
        REQUIRE(runtime.get_value("blob") == Value(seedbed_state::ValueBytes{1, 255}));
    }

    SECTION("malformed bytes tags restore as objects") {
        REQUIRE(runtime.restore_json(R"({"wide": {"$bytes": [300, 1]}})").is_ok());
        REQUIRE(runtime.get_value("wide").is_object());

        REQUIRE(runtime.restore_json(R"({"text": {"$bytes": ["x"]}})").is_ok());
        REQUIRE(runtime.get_value("text")["$bytes"] == Value::array({Value("x")}));
    }

    SECTION("rejected member") {
        auto result = runtime.restore_json(R"({"a": "text"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::TypeMismatch);
        REQUIRE(runtime.get_value("a") == Value(1));
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_CASE_METHOD(RuntimeFixture, "Runtime dispose", "[runtime]") {
    RuntimeInstance runtime(RuntimeContext{timers, &diagnostics, [] {
        return std::unique_ptr<seedbed_bridge::Sandbox>(std::make_unique<FakeSandbox>(false));
    }});
    REQUIRE(runtime.load(k_any_bytes).is_ok());
    runtime.watch("hits", [](const std::string&, const Value&) {});

    runtime.dispose();
    runtime.dispose();

    REQUIRE(runtime.is_disposed());
    auto stats = runtime.get_stats();
    REQUIRE(stats.disposed);
    REQUIRE(stats.watcher_count == 0);
    REQUIRE(stats.bridge_state == seedbed_bridge::BridgeState::Disposed);
    REQUIRE(stats.to_json()["bridge_state"] == "disposed");

    REQUIRE(runtime.load(k_any_bytes).error().code() == ErrorCode::InvalidState);
    REQUIRE(runtime.call_function("bump").error().code() == ErrorCode::InvalidState);
    REQUIRE(runtime.restore_json("{}").error().code() == ErrorCode::InvalidState);

    auto write = runtime.set_value("hits", 3);
    REQUIRE(write.is_ok());
    REQUIRE_FALSE(write.value());
    REQUIRE(timers.advance(1s) <= 1);
}

TEST_CASE("RuntimeStats serializes to JSON", "[runtime]") {
    RuntimeStats stats;
    stats.value_count = 3;

    auto json = stats.to_json();
    REQUIRE(json["value_count"] == 3);
    REQUIRE(json["bridge_state"] == "unloaded");
    REQUIRE(json["disposed"] == false);
}
