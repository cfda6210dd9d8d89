#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for seedbed_core module

#include <cstdint>

namespace seedbed_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct StoreError;
struct CycleError;
struct LoadError;
struct BindingError;
struct ComputeError;
struct WatcherError;
struct SandboxError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

enum class LogSubsystem : std::uint8_t;
struct LogConfig;
class LogScope;

// =============================================================================
// Diagnostics
// =============================================================================

enum class Severity : std::uint8_t;
struct Diagnostic;
struct DiagnosticsStats;
class DiagnosticsSink;
class LogDiagnostics;
class DiagnosticsLog;

} // namespace seedbed_core
