#pragma once

/// @file types.hpp
/// @brief Values, signatures and failures shared by the WASM decoder and interpreter

#include "fwd.hpp"
#include <seedbed/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace seedbed_wasm {

// =============================================================================
// Values
// =============================================================================

/// Number types of the MVP plus funcref for table entries
enum class WasmValType : std::uint8_t {
    I32,
    I64,
    F32,
    F64,
    FuncRef
};

[[nodiscard]] const char* wasm_val_type_name(WasmValType type);

/// Tagged operand as it sits on the interpreter stack
struct WasmValue {
    WasmValType type = WasmValType::I32;

    union {
        std::int32_t i32;
        std::int64_t i64;
        float f32;
        double f64;
    };

    WasmValue() : i64(0) {}
    WasmValue(std::int32_t v) : type(WasmValType::I32), i32(v) {}
    WasmValue(std::int64_t v) : type(WasmValType::I64), i64(v) {}
    WasmValue(float v) : type(WasmValType::F32), f32(v) {}
    WasmValue(double v) : type(WasmValType::F64), f64(v) {}
};

/// Signature from the type section, printed as `(i32, i32) -> (i32)`
struct WasmFunctionType {
    std::vector<WasmValType> params;
    std::vector<WasmValType> results;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const WasmFunctionType&) const = default;
};

/// Page limits of a memory or element limits of a table
struct WasmLimits {
    std::uint32_t min = 0;
    std::optional<std::uint32_t> max;
};

// =============================================================================
// Imports and Exports
// =============================================================================

enum class WasmExternKind : std::uint8_t {
    Func,
    Table,
    Memory,
    Global
};

struct WasmImport {
    std::string module;
    std::string name;
    WasmExternKind kind = WasmExternKind::Func;
    std::uint32_t type_index = 0;  ///< Only meaningful for functions
};

struct WasmExport {
    std::string name;
    WasmExternKind kind = WasmExternKind::Func;
    std::uint32_t index = 0;
};

// =============================================================================
// Limits
// =============================================================================

/// Execution limits for one instance
struct WasmConfig {
    /// Ceiling on linear memory, 16 pages = 1 MiB
    std::size_t max_memory_pages = 16;
    /// Instructions per call, 0 disables metering
    std::uint64_t fuel_limit = 0;
    std::size_t max_call_depth = 512;
    /// Operand stack ceiling in values
    std::size_t max_stack_values = 64 * 1024;
};

// =============================================================================
// Failures
// =============================================================================

/// Decode failures, link failures, then traps
enum class WasmError {
    InvalidModule,
    UnsupportedFeature,

    ImportNotFound,
    ImportTypeMismatch,

    OutOfMemory,
    StackOverflow,
    StackUnderflow,
    Unreachable,
    DivisionByZero,
    IntegerOverflow,
    InvalidConversion,
    IndirectCallTypeMismatch,
    UndefinedElement,
    OutOfBounds,
    FuelExhausted,
    HostFunctionFailed
};

[[nodiscard]] const char* wasm_error_name(WasmError error);

/// Thrown inside the decoder and interpreter, caught at the public boundary
class WasmException : public std::exception {
public:
    WasmException(WasmError error, std::string message);

    [[nodiscard]] const char* what() const noexcept override { return message_.c_str(); }
    [[nodiscard]] WasmError error() const { return error_; }
    [[nodiscard]] const std::string& message() const { return message_; }

    /// `<error name>: <message>`
    [[nodiscard]] std::string describe() const;

private:
    WasmError error_;
    std::string message_;
};

template <typename T>
using WasmResult = seedbed_core::Result<T, seedbed_core::Error>;

/// Map an exception raised during a call of `function` to a sandbox error
[[nodiscard]] seedbed_core::Error call_failure(const WasmException& e, std::string_view function);

// =============================================================================
// Callbacks
// =============================================================================

/// Host import body; an error return traps the guest
using HostFunctionCallback = std::function<WasmResult<std::vector<WasmValue>>(std::span<const WasmValue> args)>;

/// Observes guest loads and stores that passed the bounds check
using MemoryAccessCallback = std::function<void(std::size_t offset, std::size_t size, bool is_write)>;

} // namespace seedbed_wasm
