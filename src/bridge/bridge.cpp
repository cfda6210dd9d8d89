/// @file bridge.cpp
/// @brief ExecutionBridge implementation

#include <seedbed/bridge/bridge.hpp>
#include <seedbed/core/diagnostics.hpp>
#include <seedbed/core/log.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

namespace seedbed_bridge {

using seedbed_core::BindingError;
using seedbed_core::Error;
using seedbed_core::LoadError;
using seedbed_core::Ok;
using seedbed_core::Result;
using seedbed_state::Value;
using seedbed_state::ValueObject;

const char* bridge_state_name(BridgeState state) {
    switch (state) {
        case BridgeState::Unloaded: return "unloaded";
        case BridgeState::Loading: return "loading";
        case BridgeState::Ready: return "ready";
        case BridgeState::Failed: return "failed";
        case BridgeState::Disposed: return "disposed";
    }
    return "unknown";
}

ExecutionBridge::ExecutionBridge(seedbed_state::Store& store,
                                 seedbed_state::BatchScheduler& scheduler,
                                 seedbed_state::TimerQueue& timers,
                                 std::unique_ptr<Sandbox> sandbox,
                                 seedbed_core::DiagnosticsSink* diagnostics,
                                 BridgeConfig config)
    : m_store(store)
    , m_scheduler(scheduler)
    , m_timers(timers)
    , m_sandbox(std::move(sandbox))
    , m_diagnostics(diagnostics)
    , m_config(std::move(config)) {}

ExecutionBridge::~ExecutionBridge() {
    dispose();
}

// =============================================================================
// Load
// =============================================================================

Result<void> ExecutionBridge::load(std::span<const std::uint8_t> bytecode, const ValueObject& initial_state) {
    if (m_state != BridgeState::Unloaded) {
        return Error(LoadError::invalid_state(bridge_state_name(m_state)));
    }
    if (!m_sandbox) {
        return fail(LoadError::instantiation_failed("no sandbox attached"));
    }

    SEEDBED_LOG_SCOPE(seedbed_core::LogSubsystem::Bridge, "load");
    m_state = BridgeState::Loading;
    auto logger = seedbed_core::bridge_logger();
    logger->info("Loading module ({} bytes, {} initial keys)", bytecode.size(), initial_state.size());

    auto instantiated = m_sandbox->instantiate(bytecode);
    if (!instantiated) {
        return fail(instantiated.error());
    }

    auto layout = build_layout();
    if (!layout) {
        return fail(layout.error());
    }
    if (!layout->empty() && !m_sandbox->has_memory()) {
        return fail(LoadError::missing_memory());
    }
    auto valid = layout->validate(m_sandbox->memory().size());
    if (!valid) {
        return fail(valid.error());
    }
    m_layout = std::move(*layout);

    for (const auto& [key, value] : initial_state) {
        auto seeded = m_store.set(key, value);
        if (!seeded) {
            return fail(seeded.error());
        }
    }

    for (const auto& binding : m_layout.bindings()) {
        const auto* current = m_store.find(binding.key);
        if (!current) {
            continue;
        }
        auto written = write_binding(binding, current->value);
        if (!written) {
            return fail(written.error());
        }
    }

    m_sandbox->set_write_hook([this](std::size_t offset, std::size_t length) {
        on_guest_write(offset, length);
    });

    if (!m_config.initializer.empty() && m_sandbox->has_export(m_config.initializer)) {
        logger->debug("Running initializer '{}'", m_config.initializer);
        auto initialized = m_sandbox->call(m_config.initializer, {});
        if (!initialized) {
            return fail(LoadError::initializer_failed(initialized.error().message()));
        }
    }

    (void)m_sandbox->take_dirty_ranges();
    for (const auto& binding : m_layout.bindings()) {
        auto pulled = pull_binding(binding);
        if (!pulled) {
            return fail(pulled.error());
        }
    }

    watch_bindings();
    m_state = BridgeState::Ready;
    schedule_poll();

    logger->info("Bridge ready with {} bindings", m_layout.size());
    return Ok();
}

Result<LayoutTable> ExecutionBridge::build_layout() {
    LayoutTable table;
    for (const auto& binding : m_config.bindings) {
        auto added = table.add(binding);
        if (!added) {
            return added.error();
        }
    }

    if (!m_config.layout_section.empty()) {
        if (auto section = m_sandbox->custom_section(m_config.layout_section)) {
            std::string text(section->begin(), section->end());
            auto embedded = LayoutTable::parse(text);
            if (!embedded) {
                return embedded.error();
            }
            auto merged = table.merge(*embedded);
            if (!merged) {
                return merged.error();
            }
            seedbed_core::bridge_logger()->debug("Layout section '{}' declares {} bindings",
                                                 m_config.layout_section, embedded->size());
        }
    }
    return table;
}

Error ExecutionBridge::fail(Error error) {
    report(error);
    cancel_poll();
    unwatch_bindings();
    m_layout.clear();
    m_synced.clear();
    if (m_sandbox) {
        m_sandbox->set_write_hook(nullptr);
        m_sandbox->release();
    }
    m_state = BridgeState::Failed;
    seedbed_core::bridge_logger()->error("Load failed: {}", error.message());
    return error;
}

void ExecutionBridge::report(const Error& error) {
    seedbed_core::debug::record_error(error);
    if (m_diagnostics) {
        m_diagnostics->report_error("bridge", error);
    }
}

// =============================================================================
// Memory -> Store
// =============================================================================

Result<bool> ExecutionBridge::pull_binding(const MemoryBinding& binding) {
    auto decoded = binding.decode(m_sandbox->memory());
    if (!decoded) {
        return decoded.error();
    }
    auto synced = m_synced.find(binding.key);
    if (synced != m_synced.end() && synced->second.memory == *decoded) {
        return Ok(false);
    }
    auto changed = m_store.set(binding.key, *decoded);
    if (!changed) {
        return changed.error();
    }
    m_synced[binding.key] = SyncedValue{*decoded, std::move(*decoded)};
    if (*changed) {
        ++m_stats.values_pulled;
    }
    return changed;
}

std::size_t ExecutionBridge::poll() {
    if (m_state != BridgeState::Ready) {
        return 0;
    }
    ++m_stats.polls;
    push_unsynced();
    // A full read supersedes any recorded ranges
    (void)m_sandbox->take_dirty_ranges();

    std::size_t updated = 0;
    for (const auto& binding : m_layout.bindings()) {
        auto pulled = pull_binding(binding);
        if (!pulled) {
            seedbed_core::bridge_logger()->warn("Pull of '{}' failed: {}", binding.key, pulled.error().message());
            report(pulled.error());
            continue;
        }
        if (*pulled) {
            ++updated;
        }
    }
    return updated;
}

std::size_t ExecutionBridge::pull_range(std::size_t offset, std::size_t length) {
    std::size_t updated = 0;
    for (const auto& binding : m_layout.bindings()) {
        if (!binding.intersects(offset, length)) {
            continue;
        }
        auto pulled = pull_binding(binding);
        if (!pulled) {
            seedbed_core::bridge_logger()->warn("Pull of '{}' failed: {}", binding.key, pulled.error().message());
            report(pulled.error());
            continue;
        }
        if (*pulled) {
            ++updated;
        }
    }
    return updated;
}

std::size_t ExecutionBridge::sync_dirty_ranges() {
    std::size_t updated = 0;
    for (const auto& range : m_sandbox->take_dirty_ranges()) {
        updated += pull_range(range.offset, range.length);
    }
    return updated;
}

void ExecutionBridge::on_guest_write(std::size_t offset, std::size_t length) {
    if (m_state != BridgeState::Ready && m_state != BridgeState::Loading) {
        return;
    }
    ++m_stats.guest_notifications;
    seedbed_core::bridge_logger()->trace("Guest wrote [{}, +{})", offset, length);
    if (m_state == BridgeState::Ready) {
        pull_range(offset, length);
    }
}

// =============================================================================
// Store -> Memory
// =============================================================================

Result<void> ExecutionBridge::write_binding(const MemoryBinding& binding, const Value& value) {
    auto memory = m_sandbox->memory();
    auto current = binding.decode(memory);
    if (current && *current == value) {
        m_synced[binding.key] = SyncedValue{std::move(*current), value};
        return Ok();
    }
    auto encoded = binding.encode(value, memory);
    if (!encoded) {
        // Rejected values are reported once, memory keeps its last good value
        m_synced[binding.key].store = value;
        return encoded;
    }
    if (!value.is_null()) {
        ++m_stats.values_pushed;
    }
    auto written = binding.decode(memory);
    if (written) {
        m_synced[binding.key] = SyncedValue{std::move(*written), value};
    }
    return Ok();
}

bool ExecutionBridge::is_synced(const std::string& key, const Value& value) const {
    auto it = m_synced.find(key);
    return it != m_synced.end() && it->second.store == value;
}

std::size_t ExecutionBridge::push_unsynced() {
    std::size_t written = 0;
    for (const auto& binding : m_layout.bindings()) {
        const auto* current = m_store.find(binding.key);
        if (!current) {
            continue;
        }
        if (is_synced(binding.key, current->value)) {
            continue;
        }
        auto pushed = write_binding(binding, current->value);
        if (!pushed) {
            seedbed_core::bridge_logger()->warn("Push of '{}' failed: {}", binding.key, pushed.error().message());
            report(pushed.error());
            continue;
        }
        ++written;
    }
    return written;
}

Result<void> ExecutionBridge::push(const std::string& key) {
    if (m_state != BridgeState::Ready) {
        return Error(seedbed_core::SandboxError::not_instantiated());
    }
    const auto* binding = m_layout.find(key);
    if (!binding) {
        return Error(seedbed_core::ErrorCode::NotFound, "No binding for key '" + key + "'");
    }
    return write_binding(*binding, m_store.peek(key));
}

std::size_t ExecutionBridge::push_all() {
    if (m_state != BridgeState::Ready) {
        return 0;
    }
    std::size_t written = 0;
    for (const auto& binding : m_layout.bindings()) {
        if (!m_store.contains(binding.key)) {
            continue;
        }
        auto pushed = write_binding(binding, m_store.peek(binding.key));
        if (!pushed) {
            report(pushed.error());
            continue;
        }
        ++written;
    }
    return written;
}

void ExecutionBridge::watch_bindings() {
    m_push_handle = seedbed_state::make_watch_handle([this](const std::string& key, const Value& value) {
        if (m_state != BridgeState::Ready) {
            return;
        }
        const auto* binding = m_layout.find(key);
        if (!binding || is_synced(key, value)) {
            return;
        }
        auto pushed = write_binding(*binding, value);
        if (!pushed) {
            seedbed_core::bridge_logger()->warn("Push of '{}' failed: {}", key, pushed.error().message());
            report(pushed.error());
        }
    });

    for (const auto& binding : m_layout.bindings()) {
        m_subscriptions.push_back(m_scheduler.watch(binding.key, m_push_handle));
    }
}

void ExecutionBridge::unwatch_bindings() {
    for (auto& subscription : m_subscriptions) {
        subscription.unsubscribe();
    }
    m_subscriptions.clear();
    m_push_handle.reset();
}

// =============================================================================
// Calls
// =============================================================================

Result<Value> ExecutionBridge::call_function(const std::string& name, const std::vector<Value>& args) {
    if (m_state != BridgeState::Ready) {
        Error error = seedbed_core::SandboxError::not_instantiated();
        error.with_context("function", name);
        report(error);
        return error;
    }

    ++m_stats.calls;
    push_unsynced();
    auto result = m_sandbox->call(name, args);
    sync_dirty_ranges();

    if (!result) {
        ++m_stats.call_failures;
        seedbed_core::bridge_logger()->warn("Call to '{}' failed: {}", name, result.error().message());
        report(result.error());
    }
    return result;
}

// =============================================================================
// Polling
// =============================================================================

void ExecutionBridge::schedule_poll() {
    if (!m_config.enable_polling || m_layout.empty() || m_poll_timer.is_valid()) {
        return;
    }
    std::weak_ptr<int> alive = m_alive;
    m_poll_timer = m_timers.schedule(m_config.poll_interval, [this, alive]() {
        if (alive.expired() || m_state != BridgeState::Ready) {
            return;
        }
        m_poll_timer = seedbed_state::TimerId{};
        poll();
        schedule_poll();
    });
}

void ExecutionBridge::cancel_poll() {
    if (m_poll_timer.is_valid()) {
        m_timers.cancel(m_poll_timer);
        m_poll_timer = seedbed_state::TimerId{};
    }
}

// =============================================================================
// Dispose
// =============================================================================

void ExecutionBridge::dispose() {
    if (m_state == BridgeState::Disposed) {
        return;
    }
    cancel_poll();
    unwatch_bindings();
    if (m_sandbox) {
        m_sandbox->set_write_hook(nullptr);
        m_sandbox->release();
    }
    m_layout.clear();
    m_synced.clear();
    m_alive.reset();

    const bool was_ready = m_state == BridgeState::Ready;
    m_state = BridgeState::Disposed;
    if (was_ready) {
        seedbed_core::bridge_logger()->info("Bridge disposed");
    }
}

} // namespace seedbed_bridge
