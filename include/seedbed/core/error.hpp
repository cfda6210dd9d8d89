#pragma once

/// @file error.hpp
/// @brief Error handling types for seedbed_core

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace seedbed_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    TypeMismatch,
    LimitExceeded,
    CycleDetected,
    LoadFailed,
    BindingFailed,
    ComputeFailed,
    CallbackFailed,
    Trap,
    OutOfMemory,
    Timeout,
    NotSupported,
};

[[nodiscard]] const char* error_code_name(ErrorCode code);

// =============================================================================
// Error Kinds
// =============================================================================

/// Store write errors
struct StoreError {
    enum class Kind : std::uint8_t {
        TypeMismatch,   // Write of a different type than the key's declared type
        LimitExceeded,  // Key/string/collection over the configured store limit
        Disposed,       // Operation on a disposed runtime
    };

    Kind kind;
    std::string message;
    std::string key;
    std::string expected;  // For TypeMismatch
    std::string found;     // For TypeMismatch

    [[nodiscard]] static StoreError type_mismatch(const std::string& key, const std::string& expected_t,
                                                  const std::string& found_t) {
        return StoreError{Kind::TypeMismatch,
            "Type mismatch for '" + key + "': declared " + expected_t + ", got " + found_t,
            key, expected_t, found_t};
    }

    [[nodiscard]] static StoreError limit_exceeded(const std::string& key, const std::string& what) {
        return StoreError{Kind::LimitExceeded, "Limit exceeded for '" + key + "': " + what, key, {}, {}};
    }

    [[nodiscard]] static StoreError disposed(const std::string& operation) {
        return StoreError{Kind::Disposed, "Runtime disposed, cannot " + operation, {}, {}, {}};
    }
};

/// Dependency graph errors raised at computed registration
struct CycleError {
    enum class Kind : std::uint8_t {
        SelfReference,  // Computed key lists itself as a dependency
        Cycle,          // Transitive cycle through other computed keys
    };

    Kind kind;
    std::string message;
    std::string key;
    std::vector<std::string> path;  // For Cycle, first == last

    [[nodiscard]] static CycleError self_reference(const std::string& key) {
        return CycleError{Kind::SelfReference, "Computed '" + key + "' depends on itself", key, {key, key}};
    }

    [[nodiscard]] static CycleError cycle(const std::string& key, std::vector<std::string> path) {
        std::string chain;
        for (const auto& step : path) {
            if (!chain.empty()) chain += " -> ";
            chain += step;
        }
        return CycleError{Kind::Cycle, "Dependency cycle through '" + key + "': " + chain, key, std::move(path)};
    }
};

/// Module load errors
struct LoadError {
    enum class Kind : std::uint8_t {
        MalformedModule,      // Bytes are not a valid module
        InstantiationFailed,  // Sandbox refused to instantiate
        MissingMemory,        // Module exports no linear memory
        InitializerFailed,    // Module initializer trapped
        InvalidState,         // Bridge is not in a loadable state
    };

    Kind kind;
    std::string message;
    std::string reason;

    [[nodiscard]] static LoadError malformed_module(const std::string& reason) {
        return LoadError{Kind::MalformedModule, "Malformed module: " + reason, reason};
    }

    [[nodiscard]] static LoadError instantiation_failed(const std::string& reason) {
        return LoadError{Kind::InstantiationFailed, "Instantiation failed: " + reason, reason};
    }

    [[nodiscard]] static LoadError missing_memory() {
        return LoadError{Kind::MissingMemory, "Module exports no linear memory", {}};
    }

    [[nodiscard]] static LoadError initializer_failed(const std::string& reason) {
        return LoadError{Kind::InitializerFailed, "Module initializer failed: " + reason, reason};
    }

    [[nodiscard]] static LoadError invalid_state(const std::string& state) {
        return LoadError{Kind::InvalidState, "Cannot load in state " + state, state};
    }
};

/// Memory binding configuration errors
struct BindingError {
    enum class Kind : std::uint8_t {
        OutOfBounds,       // Region falls outside exported memory
        InvalidWidth,      // Width not in {1, 2, 4, 8}
        EncodingMismatch,  // Encoding cannot use this width
        Overlap,           // Region collides with another binding
        DuplicateKey,      // Key bound twice
        InvalidLayout,     // Layout table could not be parsed
    };

    Kind kind;
    std::string message;
    std::string key;
    std::string other_key;  // For Overlap / DuplicateKey
    std::size_t offset = 0;
    std::size_t width = 0;

    [[nodiscard]] static BindingError out_of_bounds(const std::string& key, std::size_t offset,
                                                    std::size_t width, std::size_t memory_size) {
        return BindingError{Kind::OutOfBounds,
            "Binding '" + key + "' [" + std::to_string(offset) + ", +" + std::to_string(width) +
            ") outside memory of " + std::to_string(memory_size) + " bytes",
            key, {}, offset, width};
    }

    [[nodiscard]] static BindingError invalid_width(const std::string& key, std::size_t width) {
        return BindingError{Kind::InvalidWidth,
            "Binding '" + key + "' has invalid width " + std::to_string(width), key, {}, 0, width};
    }

    [[nodiscard]] static BindingError encoding_mismatch(const std::string& key, const std::string& encoding,
                                                        std::size_t width) {
        return BindingError{Kind::EncodingMismatch,
            "Binding '" + key + "' encoding " + encoding + " cannot use width " + std::to_string(width),
            key, {}, 0, width};
    }

    [[nodiscard]] static BindingError overlap(const std::string& key, const std::string& other, std::size_t offset) {
        return BindingError{Kind::Overlap,
            "Binding '" + key + "' overlaps '" + other + "' at offset " + std::to_string(offset),
            key, other, offset, 0};
    }

    [[nodiscard]] static BindingError duplicate_key(const std::string& key) {
        return BindingError{Kind::DuplicateKey, "Key '" + key + "' bound more than once", key, key, 0, 0};
    }

    [[nodiscard]] static BindingError invalid_layout(const std::string& reason) {
        return BindingError{Kind::InvalidLayout, "Invalid layout table: " + reason, {}, {}, 0, 0};
    }
};

/// Computed value errors
struct ComputeError {
    enum class Kind : std::uint8_t {
        EvaluationFailed,  // Compute function threw
        AlreadyDefined,    // Key already has a computed descriptor
        WriteRejected,     // Result could not be stored
    };

    Kind kind;
    std::string message;
    std::string key;
    std::string reason;

    [[nodiscard]] static ComputeError evaluation_failed(const std::string& key, const std::string& reason) {
        return ComputeError{Kind::EvaluationFailed, "Computed '" + key + "' failed: " + reason, key, reason};
    }

    [[nodiscard]] static ComputeError already_defined(const std::string& key) {
        return ComputeError{Kind::AlreadyDefined, "Computed '" + key + "' already defined", key, {}};
    }

    [[nodiscard]] static ComputeError write_rejected(const std::string& key, const std::string& reason) {
        return ComputeError{Kind::WriteRejected, "Computed '" + key + "' result rejected: " + reason, key, reason};
    }
};

/// Watcher delivery errors
struct WatcherError {
    enum class Kind : std::uint8_t {
        CallbackFailed,  // Subscriber callback threw
    };

    Kind kind;
    std::string message;
    std::string key;
    std::string reason;

    [[nodiscard]] static WatcherError callback_failed(const std::string& key, const std::string& reason) {
        return WatcherError{Kind::CallbackFailed, "Watcher of '" + key + "' threw: " + reason, key, reason};
    }
};

/// Sandbox execution errors
struct SandboxError {
    enum class Kind : std::uint8_t {
        NotInstantiated,  // No module loaded
        ExportNotFound,   // Function export missing
        Trap,             // Execution trapped
        FuelExhausted,    // Instruction budget used up
    };

    Kind kind;
    std::string message;
    std::string function;
    std::string reason;

    [[nodiscard]] static SandboxError not_instantiated() {
        return SandboxError{Kind::NotInstantiated, "Sandbox has no instantiated module", {}, {}};
    }

    [[nodiscard]] static SandboxError export_not_found(const std::string& name) {
        return SandboxError{Kind::ExportNotFound, "Export not found: " + name, name, {}};
    }

    [[nodiscard]] static SandboxError trap(const std::string& name, const std::string& reason) {
        return SandboxError{Kind::Trap, "Trap in '" + name + "': " + reason, name, reason};
    }

    [[nodiscard]] static SandboxError fuel_exhausted(const std::string& name) {
        return SandboxError{Kind::FuelExhausted, "Fuel exhausted in '" + name + "'", name, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        StoreError,
        CycleError,
        LoadError,
        BindingError,
        ComputeError,
        WatcherError,
        SandboxError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(StoreError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(CycleError err) : m_code(ErrorCode::CycleDetected), m_error(std::move(err)) {}
    Error(LoadError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(BindingError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ComputeError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(WatcherError err) : m_code(ErrorCode::CallbackFailed), m_error(std::move(err)) {}
    Error(SandboxError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(StoreError::Kind kind) {
        switch (kind) {
            case StoreError::Kind::TypeMismatch: return ErrorCode::TypeMismatch;
            case StoreError::Kind::LimitExceeded: return ErrorCode::LimitExceeded;
            case StoreError::Kind::Disposed: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(LoadError::Kind kind) {
        switch (kind) {
            case LoadError::Kind::MalformedModule: return ErrorCode::ParseError;
            case LoadError::Kind::InstantiationFailed: return ErrorCode::LoadFailed;
            case LoadError::Kind::MissingMemory: return ErrorCode::LoadFailed;
            case LoadError::Kind::InitializerFailed: return ErrorCode::LoadFailed;
            case LoadError::Kind::InvalidState: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(BindingError::Kind kind) {
        switch (kind) {
            case BindingError::Kind::DuplicateKey: return ErrorCode::AlreadyExists;
            case BindingError::Kind::InvalidLayout: return ErrorCode::ParseError;
            default: return ErrorCode::BindingFailed;
        }
    }

    static ErrorCode to_error_code(ComputeError::Kind kind) {
        switch (kind) {
            case ComputeError::Kind::AlreadyDefined: return ErrorCode::AlreadyExists;
            default: return ErrorCode::ComputeFailed;
        }
    }

    static ErrorCode to_error_code(SandboxError::Kind kind) {
        switch (kind) {
            case SandboxError::Kind::NotInstantiated: return ErrorCode::InvalidState;
            case SandboxError::Kind::ExportNotFound: return ErrorCode::NotFound;
            case SandboxError::Kind::Trap: return ErrorCode::Trap;
            case SandboxError::Kind::FuelExhausted: return ErrorCode::Timeout;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

    /// Handle error case

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace seedbed_core
