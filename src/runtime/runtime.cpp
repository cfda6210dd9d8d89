/// @file runtime.cpp
/// @brief RuntimeInstance implementation

#include <seedbed/runtime/runtime.hpp>
#include <seedbed/bridge/wasm_sandbox.hpp>
#include <seedbed/core/diagnostics.hpp>
#include <seedbed/core/log.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>
#include <utility>
#include <vector>

namespace seedbed_runtime {

using seedbed_core::Error;
using seedbed_core::ErrorCode;
using seedbed_core::Result;
using seedbed_state::Value;

nlohmann::json RuntimeStats::to_json() const {
    return nlohmann::json{
        {"value_count", value_count},
        {"watcher_count", watcher_count},
        {"pending_updates", pending_updates},
        {"disposed", disposed},
        {"flush_count", flush_count},
        {"notification_count", notification_count},
        {"computed_count", computed_count},
        {"bridge_state", seedbed_bridge::bridge_state_name(bridge_state)},
    };
}

RuntimeInstance::RuntimeInstance(RuntimeContext context, RuntimeConfig config)
    : m_context(std::move(context))
    , m_config(std::move(config))
    , m_store(m_config.store_limits)
    , m_scheduler(m_store, m_context.timers, m_context.diagnostics, m_config.scheduler)
    , m_computed(m_store, m_scheduler, m_context.diagnostics) {}

RuntimeInstance::~RuntimeInstance() {
    dispose();
}

std::unique_ptr<seedbed_bridge::Sandbox> RuntimeInstance::make_sandbox() const {
    if (m_context.sandbox_factory) {
        return m_context.sandbox_factory();
    }
    return std::make_unique<seedbed_bridge::WasmSandbox>(m_config.sandbox);
}

// =============================================================================
// Module
// =============================================================================

Result<void> RuntimeInstance::load(std::span<const std::uint8_t> bytecode,
                                   const seedbed_state::ValueObject& initial_state) {
    if (m_disposed) {
        return Error(seedbed_core::LoadError::invalid_state("disposed"));
    }
    if (m_bridge && m_bridge->state() != seedbed_bridge::BridgeState::Failed) {
        return Error(seedbed_core::LoadError::invalid_state(seedbed_bridge::bridge_state_name(m_bridge->state())));
    }
    if (m_bridge) {
        seedbed_core::bridge_logger()->info("Retrying load with a fresh bridge");
        m_bridge.reset();
    }

    m_bridge = std::make_unique<seedbed_bridge::ExecutionBridge>(
        m_store, m_scheduler, m_context.timers, make_sandbox(), m_context.diagnostics, m_config.bridge);
    return m_bridge->load(bytecode, initial_state);
}

Result<Value> RuntimeInstance::call_function(const std::string& name, const std::vector<Value>& args) {
    if (!m_bridge) {
        return Error(seedbed_core::SandboxError::not_instantiated());
    }
    return m_bridge->call_function(name, args);
}

// =============================================================================
// State
// =============================================================================

Value RuntimeInstance::get_value(const std::string& key, const Value& default_value) {
    return m_store.get(key, default_value);
}

Result<bool> RuntimeInstance::set_value(const std::string& key, Value value) {
    return m_store.set(key, std::move(value));
}

seedbed_state::Subscription RuntimeInstance::watch(const std::string& key, seedbed_state::WatchCallback callback) {
    return m_scheduler.watch(key, std::move(callback));
}

seedbed_state::Subscription RuntimeInstance::watch(const std::string& key, seedbed_state::WatchHandle handle) {
    return m_scheduler.watch(key, std::move(handle));
}

bool RuntimeInstance::unwatch(const std::string& key, const seedbed_state::WatchHandle& handle) {
    return m_scheduler.unwatch(key, handle);
}

Result<void> RuntimeInstance::computed(const std::string& key, seedbed_state::ComputeFn fn,
                                       std::vector<std::string> dependencies) {
    return m_computed.define(key, std::move(fn), std::move(dependencies));
}

// =============================================================================
// Snapshots
// =============================================================================

std::string RuntimeInstance::snapshot_json(int indent) const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : m_store.snapshot()) {
        j[key] = value;
    }
    return j.dump(indent);
}

Result<void> RuntimeInstance::restore_json(std::string_view text) {
    if (m_disposed) {
        return Error(seedbed_core::StoreError::disposed("restore"));
    }

    std::vector<std::pair<std::string, Value>> entries;
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return Error(ErrorCode::ParseError, "Snapshot must be a JSON object");
        }
        entries.reserve(j.size());
        for (const auto& [key, item] : j.items()) {
            entries.emplace_back(key, item.get<Value>());
        }
    } catch (const nlohmann::json::parse_error& e) {
        return Error(ErrorCode::ParseError, "Snapshot parse error: " + std::string(e.what()));
    } catch (const nlohmann::json::exception& e) {
        return Error(ErrorCode::ParseError, "Snapshot conversion error: " + std::string(e.what()));
    }

    return transaction([&]() -> Result<void> {
        for (auto& [key, value] : entries) {
            auto written = m_store.set(key, std::move(value));
            if (!written) {
                return written.error();
            }
        }
        return seedbed_core::Ok();
    });
}

// =============================================================================
// Lifecycle
// =============================================================================

RuntimeStats RuntimeInstance::get_stats() const {
    RuntimeStats stats;
    stats.value_count = m_store.size();
    stats.watcher_count = m_scheduler.watcher_count();
    stats.pending_updates = m_scheduler.pending_count();
    stats.disposed = m_disposed;
    stats.flush_count = m_scheduler.stats().flush_count;
    stats.notification_count = m_scheduler.stats().notification_count;
    stats.computed_count = m_computed.size();
    if (m_bridge) {
        stats.bridge_state = m_bridge->state();
    }
    return stats;
}

void RuntimeInstance::dispose() {
    if (m_disposed) {
        return;
    }
    m_disposed = true;

    if (m_bridge) {
        m_bridge->dispose();
    }
    m_scheduler.dispose();
    m_computed.clear();
    m_store.dispose();

    seedbed_core::log_event(seedbed_core::LogSubsystem::Store, spdlog::level::debug, "Runtime disposed",
                            {{"bridge", m_bridge ? seedbed_bridge::bridge_state_name(m_bridge->state()) : "none"},
                             {"flushes", std::to_string(m_scheduler.stats().flush_count)}});
}

} // namespace seedbed_runtime
