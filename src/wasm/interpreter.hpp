#pragma once

/// @file interpreter.hpp
/// @brief Stack-machine interpreter behind WasmInstance

#include <seedbed/wasm/instance.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace seedbed_wasm {

namespace detail {
class ByteReader;
}

/// @brief Control label on a frame's label stack
struct Label {
    std::size_t continuation = 0;   ///< Branch target pc
    std::size_t stack_height = 0;   ///< Operand height at block entry
    std::uint32_t arity = 0;        ///< Values carried by a branch
    bool is_loop = false;
};

/// @brief Activation of one defined function
struct CallFrame {
    const WasmFunction* function = nullptr;
    std::vector<WasmValue> locals;
    std::vector<Label> labels;
    std::size_t stack_base = 0;
    std::uint32_t result_count = 0;
};

/// @brief Executes functions of one instance
///
/// All runtime faults are thrown as WasmException and converted to
/// Result errors by WasmInstance.
class WasmInterpreter {
public:
    WasmInterpreter(std::shared_ptr<const WasmModule> module, const WasmConfig& config);

    /// Resolve imports and initialize memory, globals, table and data
    void link(std::vector<HostImport> imports);

    /// Run the start function if the module has one
    void run_start();

    /// Invoke a function with already type-checked arguments
    std::vector<WasmValue> invoke(std::uint32_t func_index, std::span<const WasmValue> args);

    /// Drop operand and call state left behind by a trap
    void reset();

    [[nodiscard]] WasmMemory* memory() { return memory_.get(); }
    [[nodiscard]] const WasmMemory* memory() const { return memory_.get(); }
    [[nodiscard]] const WasmConfig& config() const { return config_; }
    [[nodiscard]] std::uint64_t fuel_consumed() const { return fuel_used_; }
    [[nodiscard]] bool executing() const { return depth_ > 0; }

    void set_memory_callback(MemoryAccessCallback callback) { memory_callback_ = std::move(callback); }

private:
    void call_function(std::uint32_t func_index);
    void call_host(std::uint32_t func_index);
    void execute(CallFrame& frame);
    void execute_fc(detail::ByteReader& r);

    void branch(CallFrame& frame, detail::ByteReader& r, std::uint32_t depth);
    void consume_fuel();

    WasmValue evaluate(const InitExpr& expr) const;

    // Stack helpers
    void push(WasmValue value);
    WasmValue pop();
    std::int32_t pop_i32() { return pop().i32; }
    std::int64_t pop_i64() { return pop().i64; }
    float pop_f32() { return pop().f32; }
    double pop_f64() { return pop().f64; }

    // Memory helpers
    WasmMemory& require_memory();
    std::size_t effective_address(detail::ByteReader& r);
    void notify_write(std::size_t offset, std::size_t size);

    std::shared_ptr<const WasmModule> module_;
    WasmConfig config_;
    std::unique_ptr<WasmMemory> memory_;
    std::vector<WasmValue> globals_;
    std::vector<std::optional<std::uint32_t>> table_;
    std::vector<HostImport> host_functions_;   ///< Indexed like imported functions
    MemoryAccessCallback memory_callback_;

    std::vector<WasmValue> stack_;
    std::size_t depth_ = 0;
    std::uint64_t fuel_used_ = 0;
};

} // namespace seedbed_wasm
