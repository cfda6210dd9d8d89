#pragma once

/// @file diagnostics.hpp
/// @brief Injectable diagnostics sinks for behavioral errors and runtime events
///
/// Errors that occur during scheduled delivery (watcher callbacks, computed
/// re-evaluation, bridge sync) never propagate to a caller. They are reported
/// to a DiagnosticsSink owned by whoever constructs the runtime.

#include "fwd.hpp"
#include "error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spdlog { class logger; }

namespace seedbed_core {

// =============================================================================
// Diagnostic
// =============================================================================

/// Diagnostic severity
enum class Severity : std::uint8_t {
    Debug,
    Info,
    Warning,
    Error,
};

[[nodiscard]] const char* severity_name(Severity severity);

/// One reported event
struct Diagnostic {
    Severity severity = Severity::Info;
    std::string source;   ///< Reporting subsystem ("scheduler", "computed", "bridge", ...)
    std::string message;
    std::optional<ErrorCode> code;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    [[nodiscard]] static Diagnostic from_error(Severity severity, const std::string& source, const Error& error);

    [[nodiscard]] bool is_error() const noexcept { return severity == Severity::Error; }
};

// =============================================================================
// DiagnosticsSink
// =============================================================================

/// Receiver of diagnostics
class DiagnosticsSink {
public:
    virtual ~DiagnosticsSink() = default;

    virtual void report(const Diagnostic& diagnostic) = 0;

    /// Convenience for error reporting
    void report_error(const std::string& source, const Error& error) {
        report(Diagnostic::from_error(Severity::Error, source, error));
    }

    void report_warning(const std::string& source, const Error& error) {
        report(Diagnostic::from_error(Severity::Warning, source, error));
    }

    void report_info(const std::string& source, const std::string& message) {
        Diagnostic d;
        d.severity = Severity::Info;
        d.source = source;
        d.message = message;
        report(d);
    }
};

/// Forwards diagnostics to a named spdlog logger
class LogDiagnostics : public DiagnosticsSink {
public:
    explicit LogDiagnostics(const std::string& logger_name = "seedbed.diagnostics");

    void report(const Diagnostic& diagnostic) override;

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

// =============================================================================
// DiagnosticsLog
// =============================================================================

/// Aggregate counters of a DiagnosticsLog
struct DiagnosticsStats {
    std::uint64_t total_reported = 0;
    std::uint64_t errors_reported = 0;
    std::uint64_t warnings_reported = 0;
    std::size_t entries_held = 0;
    std::size_t errors_held = 0;
    std::size_t capacity = 0;
};

/// Bounded in-memory history of diagnostics
class DiagnosticsLog : public DiagnosticsSink {
public:
    static constexpr std::size_t k_default_capacity = 1000;

    explicit DiagnosticsLog(std::size_t capacity = k_default_capacity, DiagnosticsSink* forward = nullptr);

    void report(const Diagnostic& diagnostic) override;

    /// All held entries, oldest first
    [[nodiscard]] const std::deque<Diagnostic>& entries() const noexcept { return m_entries; }

    /// Held error-severity entries, oldest first
    [[nodiscard]] const std::deque<Diagnostic>& errors() const noexcept { return m_errors; }

    [[nodiscard]] std::vector<Diagnostic> by_severity(Severity severity) const;
    [[nodiscard]] std::vector<Diagnostic> by_source(const std::string& source) const;

    /// Number of held entries from source with an error code
    [[nodiscard]] std::size_t count(const std::string& source, ErrorCode code) const;

    [[nodiscard]] const Diagnostic* latest() const noexcept {
        return m_entries.empty() ? nullptr : &m_entries.back();
    }

    [[nodiscard]] DiagnosticsStats stats() const;

    void clear();

private:
    std::size_t m_capacity;
    DiagnosticsSink* m_forward;
    std::deque<Diagnostic> m_entries;
    std::deque<Diagnostic> m_errors;
    std::uint64_t m_total = 0;
    std::uint64_t m_error_total = 0;
    std::uint64_t m_warning_total = 0;
};

} // namespace seedbed_core
