/// @file types.cpp
/// @brief WASM value names and failure classification

#include <seedbed/wasm/types.hpp>

#include <array>

namespace seedbed_wasm {

namespace {

struct ErrorInfo {
    WasmError error;
    const char* name;
};

constexpr std::array<ErrorInfo, 16> k_errors = {{
    {WasmError::InvalidModule, "invalid module"},
    {WasmError::UnsupportedFeature, "unsupported feature"},
    {WasmError::ImportNotFound, "unresolved import"},
    {WasmError::ImportTypeMismatch, "import signature mismatch"},
    {WasmError::OutOfMemory, "out of memory"},
    {WasmError::StackOverflow, "call stack exhausted"},
    {WasmError::StackUnderflow, "operand stack underflow"},
    {WasmError::Unreachable, "unreachable executed"},
    {WasmError::DivisionByZero, "integer divide by zero"},
    {WasmError::IntegerOverflow, "integer overflow"},
    {WasmError::InvalidConversion, "invalid conversion to integer"},
    {WasmError::IndirectCallTypeMismatch, "indirect call type mismatch"},
    {WasmError::UndefinedElement, "undefined element"},
    {WasmError::OutOfBounds, "out of bounds memory access"},
    {WasmError::FuelExhausted, "fuel exhausted"},
    {WasmError::HostFunctionFailed, "host function failed"},
}};

const ErrorInfo* info(WasmError error) {
    for (const auto& entry : k_errors) {
        if (entry.error == error) return &entry;
    }
    return nullptr;
}

void append_types(std::string& out, const std::vector<WasmValType>& types) {
    out += '(';
    for (std::size_t i = 0; i < types.size(); ++i) {
        if (i > 0) out += ", ";
        out += wasm_val_type_name(types[i]);
    }
    out += ')';
}

} // namespace

const char* wasm_val_type_name(WasmValType type) {
    switch (type) {
        case WasmValType::I32: return "i32";
        case WasmValType::I64: return "i64";
        case WasmValType::F32: return "f32";
        case WasmValType::F64: return "f64";
        case WasmValType::FuncRef: return "funcref";
    }
    return "?";
}

std::string WasmFunctionType::to_string() const {
    std::string out;
    append_types(out, params);
    out += " -> ";
    append_types(out, results);
    return out;
}

// =============================================================================
// Failures
// =============================================================================

const char* wasm_error_name(WasmError error) {
    const auto* entry = info(error);
    return entry ? entry->name : "unknown failure";
}

WasmException::WasmException(WasmError error, std::string message)
    : error_(error)
    , message_(std::move(message)) {}

std::string WasmException::describe() const {
    return std::string(wasm_error_name(error_)) + ": " + message_;
}

seedbed_core::Error call_failure(const WasmException& e, std::string_view function) {
    const std::string name(function);
    if (e.error() == WasmError::FuelExhausted) {
        return seedbed_core::SandboxError::fuel_exhausted(name);
    }
    seedbed_core::Error error = seedbed_core::SandboxError::trap(name, e.message());
    error.with_context("cause", wasm_error_name(e.error()));
    return error;
}

} // namespace seedbed_wasm
