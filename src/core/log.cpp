/// @file log.cpp
/// @brief Subsystem loggers, sinks and event formatting

#include <seedbed/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <filesystem>
#include <mutex>
#include <vector>

namespace seedbed_core {

namespace {

constexpr std::array<LogSubsystem, 5> k_subsystems = {
    LogSubsystem::Store, LogSubsystem::Scheduler, LogSubsystem::Bridge,
    LogSubsystem::Wasm, LogSubsystem::Diagnostics,
};

struct Registry {
    std::mutex mutex;
    LogConfig config;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
};

Registry& registry() {
    static Registry instance;
    return instance;
}

spdlog::level::level_enum level_for(const LogConfig& config, const std::string& name) {
    for (auto subsystem : k_subsystems) {
        if (subsystem_logger_name(subsystem) != name) {
            continue;
        }
        auto it = config.subsystem_levels.find(subsystem);
        if (it != config.subsystem_levels.end()) {
            return it->second;
        }
        break;
    }
    return config.level;
}

std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("%H:%M:%S.%e %^%-5l%$ %n: %v");
        sinks.push_back(std::move(console));
    }
    if (config.file_enabled && !config.log_directory.empty()) {
        auto path = std::filesystem::path(config.log_directory) / (name + ".log");
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            file->set_pattern("%Y-%m-%dT%H:%M:%S.%e %l %n: %v");
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Log file {} unavailable: {}", path.string(), e.what());
        }
    }
    return sinks;
}

bool needs_quotes(std::string_view value) {
    if (value.empty()) {
        return true;
    }
    return value.find_first_of(" \t\"=") != std::string_view::npos;
}

} // namespace

// =============================================================================
// Subsystems
// =============================================================================

const char* subsystem_name(LogSubsystem subsystem) {
    switch (subsystem) {
        case LogSubsystem::Store: return "store";
        case LogSubsystem::Scheduler: return "scheduler";
        case LogSubsystem::Bridge: return "bridge";
        case LogSubsystem::Wasm: return "wasm";
        case LogSubsystem::Diagnostics: return "diagnostics";
    }
    return "unknown";
}

std::string subsystem_logger_name(LogSubsystem subsystem) {
    return std::string("seedbed.") + subsystem_name(subsystem);
}

std::optional<LogSubsystem> parse_subsystem(std::string_view name) {
    for (auto subsystem : k_subsystems) {
        if (name == subsystem_name(subsystem)) {
            return subsystem;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.config = config;

    for (auto& [name, logger] : reg.loggers) {
        logger->sinks() = make_sinks(reg.config, name);
        logger->set_level(level_for(reg.config, name));
    }
    spdlog::set_level(reg.config.level);
}

LogConfig current_log_config() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config;
}

// =============================================================================
// Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.loggers.find(name); it != reg.loggers.end()) {
        return it->second;
    }

    auto sinks = make_sinks(reg.config, name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level_for(reg.config, name));
    reg.loggers.emplace(name, logger);
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> subsystem_logger(LogSubsystem subsystem) {
    return get_logger(subsystem_logger_name(subsystem));
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "warning") return spdlog::level::warn;
    if (str == "error") return spdlog::level::err;
    if (str == "off") return spdlog::level::off;
    // spdlog maps unknown names to off, so only accept exact matches
    auto level = spdlog::level::from_str(str);
    if (level == spdlog::level::off) {
        return std::nullopt;
    }
    return level;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Events
// =============================================================================

void log_event(LogSubsystem subsystem, spdlog::level::level_enum level, std::string_view message,
               std::initializer_list<LogField> fields) {
    auto logger = subsystem_logger(subsystem);
    if (!logger->should_log(level)) {
        return;
    }

    std::string line(message);
    for (const auto& field : fields) {
        line += ' ';
        line.append(field.key);
        line += '=';
        if (needs_quotes(field.value)) {
            line += '"';
            line += field.value;
            line += '"';
        } else {
            line += field.value;
        }
    }
    logger->log(level, line);
}

LogScope::LogScope(LogSubsystem subsystem, std::string name)
    : m_name(std::move(name))
    , m_logger(subsystem_logger(subsystem))
    , m_start(std::chrono::steady_clock::now()) {
    m_logger->trace("enter {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("leave {} after {}us", m_name, elapsed.count());
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    for (const auto& [name, logger] : reg.loggers) {
        spdlog::drop(name);
    }
    reg.loggers.clear();
}

} // namespace seedbed_core
