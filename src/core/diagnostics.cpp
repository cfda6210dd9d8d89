/// @file diagnostics.cpp
/// @brief Diagnostics sinks implementation

#include <seedbed/core/diagnostics.hpp>
#include <seedbed/core/log.hpp>

#include <algorithm>
#include <iterator>

namespace seedbed_core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Debug: return "debug";
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
        default: return "unknown";
    }
}

Diagnostic Diagnostic::from_error(Severity severity, const std::string& source, const Error& error) {
    Diagnostic d;
    d.severity = severity;
    d.source = source;
    d.message = error.message();
    d.code = error.code();
    return d;
}

// =============================================================================
// LogDiagnostics
// =============================================================================

LogDiagnostics::LogDiagnostics(const std::string& logger_name)
    : m_logger(get_logger(logger_name)) {}

void LogDiagnostics::report(const Diagnostic& diagnostic) {
    spdlog::level::level_enum level = spdlog::level::info;
    switch (diagnostic.severity) {
        case Severity::Debug: level = spdlog::level::debug; break;
        case Severity::Info: level = spdlog::level::info; break;
        case Severity::Warning: level = spdlog::level::warn; break;
        case Severity::Error: level = spdlog::level::err; break;
    }

    if (diagnostic.code) {
        m_logger->log(level, "[{}] {} ({})", diagnostic.source, diagnostic.message,
                      error_code_name(*diagnostic.code));
    } else {
        m_logger->log(level, "[{}] {}", diagnostic.source, diagnostic.message);
    }
}

// =============================================================================
// DiagnosticsLog
// =============================================================================

DiagnosticsLog::DiagnosticsLog(std::size_t capacity, DiagnosticsSink* forward)
    : m_capacity(std::max<std::size_t>(capacity, 1))
    , m_forward(forward) {}

void DiagnosticsLog::report(const Diagnostic& diagnostic) {
    ++m_total;
    if (diagnostic.severity == Severity::Warning) {
        ++m_warning_total;
    }

    m_entries.push_back(diagnostic);
    if (m_entries.size() > m_capacity) {
        m_entries.pop_front();
    }

    if (diagnostic.is_error()) {
        ++m_error_total;
        m_errors.push_back(diagnostic);
        if (m_errors.size() > m_capacity) {
            m_errors.pop_front();
        }
    }

    if (m_forward) {
        m_forward->report(diagnostic);
    }
}

std::vector<Diagnostic> DiagnosticsLog::by_severity(Severity severity) const {
    std::vector<Diagnostic> out;
    std::copy_if(m_entries.begin(), m_entries.end(), std::back_inserter(out),
                 [severity](const Diagnostic& d) { return d.severity == severity; });
    return out;
}

std::vector<Diagnostic> DiagnosticsLog::by_source(const std::string& source) const {
    std::vector<Diagnostic> out;
    std::copy_if(m_entries.begin(), m_entries.end(), std::back_inserter(out),
                 [&source](const Diagnostic& d) { return d.source == source; });
    return out;
}

std::size_t DiagnosticsLog::count(const std::string& source, ErrorCode code) const {
    return static_cast<std::size_t>(std::count_if(m_entries.begin(), m_entries.end(),
        [&](const Diagnostic& d) { return d.source == source && d.code && *d.code == code; }));
}

DiagnosticsStats DiagnosticsLog::stats() const {
    DiagnosticsStats s;
    s.total_reported = m_total;
    s.errors_reported = m_error_total;
    s.warnings_reported = m_warning_total;
    s.entries_held = m_entries.size();
    s.errors_held = m_errors.size();
    s.capacity = m_capacity;
    return s;
}

void DiagnosticsLog::clear() {
    m_entries.clear();
    m_errors.clear();
}

} // namespace seedbed_core
