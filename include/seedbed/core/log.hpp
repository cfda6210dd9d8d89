#pragma once

/// @file log.hpp
/// @brief Per-subsystem spdlog loggers for seedbed

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// =============================================================================
// Logging Macros
// =============================================================================

#define SEEDBED_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define SEEDBED_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define SEEDBED_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define SEEDBED_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define SEEDBED_LOG_ERROR(...) spdlog::error(__VA_ARGS__)

namespace seedbed_core {

// =============================================================================
// Subsystems
// =============================================================================

/// Components that own a named logger
enum class LogSubsystem : std::uint8_t {
    Store,       ///< Reactive store and computed values
    Scheduler,   ///< Watcher delivery and flushes
    Bridge,      ///< Execution bridge lifecycle and sync
    Wasm,        ///< WebAssembly decoding and execution
    Diagnostics  ///< Default diagnostics sink
};

/// Short name used in configuration ("store", "bridge", ...)
[[nodiscard]] const char* subsystem_name(LogSubsystem subsystem);

/// Full logger name ("seedbed.store", ...)
[[nodiscard]] std::string subsystem_logger_name(LogSubsystem subsystem);

[[nodiscard]] std::optional<LogSubsystem> parse_subsystem(std::string_view name);

// =============================================================================
// Configuration
// =============================================================================

struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 4 * 1024 * 1024;
    std::size_t max_files = 3;
    spdlog::level::level_enum level = spdlog::level::info;
    /// Level overrides by subsystem
    std::map<LogSubsystem, spdlog::level::level_enum> subsystem_levels;
};

/// Apply a configuration; existing loggers get new sinks and levels
void configure_logging(const LogConfig& config);

/// Configuration currently in effect
[[nodiscard]] LogConfig current_log_config();

// =============================================================================
// Loggers
// =============================================================================

/// Get or create a logger with the configured sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

std::shared_ptr<spdlog::logger> subsystem_logger(LogSubsystem subsystem);

inline std::shared_ptr<spdlog::logger> store_logger() { return subsystem_logger(LogSubsystem::Store); }
inline std::shared_ptr<spdlog::logger> scheduler_logger() { return subsystem_logger(LogSubsystem::Scheduler); }
inline std::shared_ptr<spdlog::logger> bridge_logger() { return subsystem_logger(LogSubsystem::Bridge); }
inline std::shared_ptr<spdlog::logger> wasm_logger() { return subsystem_logger(LogSubsystem::Wasm); }

[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);
[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Events
// =============================================================================

struct LogField {
    std::string_view key;
    std::string value;
};

/// Log `message key=value ...` on a subsystem logger
void log_event(LogSubsystem subsystem, spdlog::level::level_enum level, std::string_view message,
               std::initializer_list<LogField> fields);

/// Trace entry and exit of a scope with its duration
class LogScope {
public:
    LogScope(LogSubsystem subsystem, std::string name);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define SEEDBED_LOG_CONCAT_INNER(a, b) a##b
#define SEEDBED_LOG_CONCAT(a, b) SEEDBED_LOG_CONCAT_INNER(a, b)
#define SEEDBED_LOG_SCOPE(subsystem, name) \
    ::seedbed_core::LogScope SEEDBED_LOG_CONCAT(seedbed_log_scope_, __LINE__)(subsystem, name)

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flush and drop every logger created through get_logger
void shutdown_logging();

} // namespace seedbed_core
