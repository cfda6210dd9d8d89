#pragma once

/// @file config.hpp
/// @brief Runtime configuration loaded from TOML

#include <seedbed/bridge/bridge.hpp>
#include <seedbed/core/error.hpp>
#include <seedbed/core/log.hpp>
#include <seedbed/state/scheduler.hpp>
#include <seedbed/state/store.hpp>
#include <seedbed/wasm/types.hpp>

#include <filesystem>
#include <string_view>

namespace seedbed_runtime {

/// @brief Everything a RuntimeInstance can be tuned with
///
/// TOML layout (all keys optional):
///
///     [scheduler]
///     tick_interval_ms = 16
///     max_flush_rounds = 64
///
///     [store]
///     limits = "unlimited"        # or "sandboxed"
///     max_string_length = 1000    # overrides one limit
///
///     [sandbox]
///     fuel_limit = 0
///     max_memory_pages = 16
///     max_call_depth = 512
///     poll_interval_ms = 100
///     polling = true
///     initializer = "_initialize"
///     layout_section = "seedbed.layout"
///
///     [logging]
///     level = "info"
///     console = true
///     file = false
///     directory = "logs"
///
///     [[bindings]]
///     key = "count"
///     offset = 0
///     type = "u32"
struct RuntimeConfig {
    seedbed_state::SchedulerConfig scheduler;
    seedbed_state::StoreLimits store_limits = seedbed_state::StoreLimits::unlimited();
    seedbed_wasm::WasmConfig sandbox;
    seedbed_bridge::BridgeConfig bridge;
    seedbed_core::LogConfig logging;

    [[nodiscard]] static seedbed_core::Result<RuntimeConfig> load(const std::filesystem::path& path);
    [[nodiscard]] static seedbed_core::Result<RuntimeConfig> parse_string(std::string_view text);
};

} // namespace seedbed_runtime
