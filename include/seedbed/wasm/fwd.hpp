#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for seedbed_wasm module

#include <cstdint>

namespace seedbed_wasm {

enum class WasmValType : std::uint8_t;
struct WasmValue;
struct WasmFunctionType;
struct WasmLimits;
struct WasmImport;
struct WasmExport;
struct WasmConfig;
enum class WasmError;
class WasmException;

class WasmMemory;
struct WasmFunction;
struct BlockInfo;
class WasmModule;
struct HostImport;
class WasmInstance;

} // namespace seedbed_wasm
