#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for seedbed_bridge module

#include <cstdint>

namespace seedbed_bridge {

struct DirtyRange;
class Sandbox;
class WasmSandbox;

enum class Encoding : std::uint8_t;
class BindingCodec;
struct MemoryBinding;
class LayoutTable;

enum class BridgeState : std::uint8_t;
struct BridgeConfig;
struct BridgeStats;
class ExecutionBridge;

} // namespace seedbed_bridge
