#pragma once

/// @file instance.hpp
/// @brief Instantiated WASM module with its own memory, globals and table

#include "memory.hpp"
#include "module.hpp"
#include "types.hpp"

#include <memory>
#include <span>
#include <string>
#include <vector>

namespace seedbed_wasm {

class WasmInterpreter;

/// @brief Host function offered to a module's imports
struct HostImport {
    std::string module;
    std::string name;
    WasmFunctionType signature;
    HostFunctionCallback callback;
};

// =============================================================================
// WasmInstance
// =============================================================================

/// @brief A running module
///
/// Every import must resolve to a HostImport with an identical signature.
/// Imported memories, tables and globals are not supported. Traps raised by
/// a call leave the instance usable for further calls.
class WasmInstance {
public:
    /// Link and initialize a module. Runs the start function if present.
    [[nodiscard]] static WasmResult<std::unique_ptr<WasmInstance>> instantiate(
        std::shared_ptr<const WasmModule> module,
        std::vector<HostImport> imports,
        const WasmConfig& config = {});

    ~WasmInstance();

    WasmInstance(const WasmInstance&) = delete;
    WasmInstance& operator=(const WasmInstance&) = delete;

    [[nodiscard]] const WasmModule& module() const { return *module_; }
    [[nodiscard]] const WasmConfig& config() const;

    /// Linear memory, or nullptr when the module declares none
    [[nodiscard]] WasmMemory* memory();
    [[nodiscard]] const WasmMemory* memory() const;

    /// True when the module exports its linear memory
    [[nodiscard]] bool exports_memory() const;

    [[nodiscard]] bool has_function(const std::string& name) const;
    [[nodiscard]] const WasmFunctionType* function_signature(const std::string& name) const;

    /// Invoke an exported function. Traps come back as SandboxError.
    WasmResult<std::vector<WasmValue>> call(const std::string& name, std::span<const WasmValue> args = {});

    /// Observe guest stores into linear memory
    void set_memory_callback(MemoryAccessCallback callback);

    /// Instructions executed by the most recent call
    [[nodiscard]] std::uint64_t fuel_consumed() const;

private:
    WasmInstance(std::shared_ptr<const WasmModule> module, std::unique_ptr<WasmInterpreter> interpreter);

    std::shared_ptr<const WasmModule> module_;
    std::unique_ptr<WasmInterpreter> interpreter_;
};

} // namespace seedbed_wasm
