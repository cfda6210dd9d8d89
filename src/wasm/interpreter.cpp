/// @file interpreter.cpp
/// @brief Stack-machine interpreter implementation

#include "interpreter.hpp"
#include "opcodes.hpp"
#include "reader.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <limits>
#include <type_traits>

namespace seedbed_wasm {

using detail::ByteReader;
using detail::Op;
using detail::OpFC;

namespace {

/// Table entries beyond this are treated as hostile input
constexpr std::uint32_t k_max_table_size = 100000;

[[noreturn]] void trap(WasmError error, const std::string& message) {
    throw WasmException(error, message);
}

inline std::uint32_t u32(std::int32_t v) { return static_cast<std::uint32_t>(v); }
inline std::uint64_t u64(std::int64_t v) { return static_cast<std::uint64_t>(v); }

WasmValue zero_value(WasmValType type) {
    switch (type) {
        case WasmValType::I64: return WasmValue(std::int64_t{0});
        case WasmValType::F32: return WasmValue(0.0f);
        case WasmValType::F64: return WasmValue(0.0);
        case WasmValType::FuncRef: {
            WasmValue v(std::int32_t{-1});
            v.type = WasmValType::FuncRef;
            return v;
        }
        default: return WasmValue(std::int32_t{0});
    }
}

const char* extern_kind_name(WasmExternKind kind) {
    switch (kind) {
        case WasmExternKind::Func: return "function";
        case WasmExternKind::Table: return "table";
        case WasmExternKind::Memory: return "memory";
        case WasmExternKind::Global: return "global";
    }
    return "extern";
}

template <typename I, typename F>
I trunc_checked(F value) {
    if (std::isnan(value)) {
        trap(WasmError::InvalidConversion, "invalid conversion to integer");
    }
    const double t = std::trunc(static_cast<double>(value));
    if constexpr (std::is_signed_v<I>) {
        const double lo = static_cast<double>(std::numeric_limits<I>::min());
        if (t < lo || t >= -lo) {
            trap(WasmError::IntegerOverflow, "integer overflow");
        }
    } else {
        if (t <= -1.0 || t >= static_cast<double>(std::numeric_limits<I>::max()) + 1.0) {
            trap(WasmError::IntegerOverflow, "integer overflow");
        }
    }
    return static_cast<I>(t);
}

template <typename I, typename F>
I trunc_saturate(F value) {
    if (std::isnan(value)) {
        return 0;
    }
    const double t = std::trunc(static_cast<double>(value));
    if constexpr (std::is_signed_v<I>) {
        const double lo = static_cast<double>(std::numeric_limits<I>::min());
        if (t < lo) return std::numeric_limits<I>::min();
        if (t >= -lo) return std::numeric_limits<I>::max();
    } else {
        if (t <= -1.0) return 0;
        if (t >= static_cast<double>(std::numeric_limits<I>::max()) + 1.0) return std::numeric_limits<I>::max();
    }
    return static_cast<I>(t);
}

template <typename F>
F float_min(F a, F b) {
    if (std::isnan(a) || std::isnan(b)) return std::numeric_limits<F>::quiet_NaN();
    if (a == b) return std::signbit(a) ? a : b;
    return a < b ? a : b;
}

template <typename F>
F float_max(F a, F b) {
    if (std::isnan(a) || std::isnan(b)) return std::numeric_limits<F>::quiet_NaN();
    if (a == b) return std::signbit(a) ? b : a;
    return a > b ? a : b;
}

} // namespace

// =============================================================================
// Setup
// =============================================================================

WasmInterpreter::WasmInterpreter(std::shared_ptr<const WasmModule> module, const WasmConfig& config)
    : module_(std::move(module))
    , config_(config) {}

void WasmInterpreter::link(std::vector<HostImport> imports) {
    for (const auto& imp : module_->imports()) {
        const std::string qualified = imp.module + "." + imp.name;
        if (imp.kind != WasmExternKind::Func) {
            trap(WasmError::UnsupportedFeature,
                 std::string("imported ") + extern_kind_name(imp.kind) + " '" + qualified + "' is not supported");
        }

        auto it = std::find_if(imports.begin(), imports.end(), [&](const HostImport& h) {
            return h.module == imp.module && h.name == imp.name;
        });
        if (it == imports.end() || !it->callback) {
            trap(WasmError::ImportNotFound, "unresolved import '" + qualified + "'");
        }
        const auto& expected = module_->types()[imp.type_index];
        if (it->signature != expected) {
            trap(WasmError::ImportTypeMismatch, "import '" + qualified + "' expects " + expected.to_string() +
                                                    " but host provides " + it->signature.to_string());
        }
        host_functions_.push_back(*it);
    }

    if (const auto& limits = module_->memory()) {
        if (limits->min > config_.max_memory_pages) {
            trap(WasmError::OutOfMemory, "module requests " + std::to_string(limits->min) +
                                             " pages, limit is " + std::to_string(config_.max_memory_pages));
        }
        std::size_t max = config_.max_memory_pages;
        if (limits->max) {
            max = std::min<std::size_t>(max, *limits->max);
        }
        memory_ = std::make_unique<WasmMemory>(limits->min, max);
    }

    for (const auto& global : module_->globals()) {
        WasmValue value = evaluate(global.init);
        if (value.type != global.type) {
            trap(WasmError::InvalidModule, "global initializer type mismatch");
        }
        globals_.push_back(value);
    }

    if (!module_->tables().empty()) {
        const auto& limits = module_->tables().front().limits;
        if (limits.min > k_max_table_size) {
            trap(WasmError::OutOfMemory, "table too large");
        }
        table_.assign(limits.min, std::nullopt);
    }

    for (const auto& segment : module_->elements()) {
        std::size_t offset = u32(evaluate(segment.offset).i32);
        if (segment.table_index != 0 || offset + segment.functions.size() > table_.size()) {
            trap(WasmError::OutOfBounds, "element segment out of bounds");
        }
        for (std::size_t i = 0; i < segment.functions.size(); ++i) {
            table_[offset + i] = segment.functions[i];
        }
    }

    for (const auto& segment : module_->data()) {
        if (segment.passive) continue;
        if (!memory_) {
            trap(WasmError::InvalidModule, "data segment without memory");
        }
        std::size_t offset = u32(evaluate(segment.offset).i32);
        memory_->write_bytes(offset, segment.bytes);
    }
}

void WasmInterpreter::run_start() {
    if (auto start = module_->start_function()) {
        const auto& type = module_->function_type(*start);
        if (!type.params.empty() || !type.results.empty()) {
            trap(WasmError::InvalidModule, "start function must take and return nothing");
        }
        (void)invoke(*start, {});
    }
}

WasmValue WasmInterpreter::evaluate(const InitExpr& expr) const {
    if (expr.kind == InitExpr::Kind::GlobalGet) {
        if (expr.global_index >= globals_.size()) {
            trap(WasmError::InvalidModule, "constant expression reads an uninitialized global");
        }
        return globals_[expr.global_index];
    }
    return expr.value;
}

// =============================================================================
// Invocation
// =============================================================================

std::vector<WasmValue> WasmInterpreter::invoke(std::uint32_t func_index, std::span<const WasmValue> args) {
    fuel_used_ = 0;
    stack_.clear();
    for (const auto& arg : args) {
        push(arg);
    }

    call_function(func_index);

    std::vector<WasmValue> results(stack_.begin(), stack_.end());
    stack_.clear();
    return results;
}

void WasmInterpreter::reset() {
    stack_.clear();
    depth_ = 0;
}

void WasmInterpreter::call_function(std::uint32_t func_index) {
    if (func_index < module_->imported_function_count()) {
        call_host(func_index);
        return;
    }
    if (depth_ >= config_.max_call_depth) {
        trap(WasmError::StackOverflow, "call stack exhausted");
    }

    const auto& fn = module_->functions()[func_index - module_->imported_function_count()];
    const auto& type = module_->types()[fn.type_index];
    const std::size_t param_count = type.params.size();
    if (stack_.size() < param_count) {
        trap(WasmError::StackUnderflow, "missing call arguments");
    }

    CallFrame frame;
    frame.function = &fn;
    frame.locals.reserve(param_count + fn.locals.size());
    frame.locals.assign(stack_.end() - static_cast<std::ptrdiff_t>(param_count), stack_.end());
    stack_.resize(stack_.size() - param_count);
    for (auto local_type : fn.locals) {
        frame.locals.push_back(zero_value(local_type));
    }
    frame.stack_base = stack_.size();
    frame.result_count = static_cast<std::uint32_t>(type.results.size());
    frame.labels.push_back(Label{fn.code.size(), frame.stack_base, frame.result_count, false});

    ++depth_;
    execute(frame);
    --depth_;

    const std::size_t expected = frame.stack_base + frame.result_count;
    if (stack_.size() < expected) {
        trap(WasmError::StackUnderflow, "function returned too few values");
    }
    if (stack_.size() > expected) {
        std::move(stack_.end() - frame.result_count, stack_.end(),
                  stack_.begin() + static_cast<std::ptrdiff_t>(frame.stack_base));
        stack_.resize(expected);
    }
}

void WasmInterpreter::call_host(std::uint32_t func_index) {
    const auto& host = host_functions_[func_index];
    const auto& type = module_->function_type(func_index);
    const std::size_t param_count = type.params.size();
    if (stack_.size() < param_count) {
        trap(WasmError::StackUnderflow, "missing host call arguments");
    }

    std::vector<WasmValue> args(stack_.end() - static_cast<std::ptrdiff_t>(param_count), stack_.end());
    stack_.resize(stack_.size() - param_count);

    const std::string qualified = host.module + "." + host.name;
    try {
        auto result = host.callback(args);
        if (!result) {
            trap(WasmError::HostFunctionFailed, qualified + ": " + result.error().message());
        }
        if (result->size() != type.results.size()) {
            trap(WasmError::HostFunctionFailed, qualified + " returned " + std::to_string(result->size()) +
                                                    " values, expected " + std::to_string(type.results.size()));
        }
        for (const auto& value : *result) {
            push(value);
        }
    } catch (const WasmException&) {
        throw;
    } catch (const std::exception& e) {
        trap(WasmError::HostFunctionFailed, qualified + ": " + e.what());
    }
}

// =============================================================================
// Helpers
// =============================================================================

void WasmInterpreter::push(WasmValue value) {
    if (stack_.size() >= config_.max_stack_values) {
        trap(WasmError::StackOverflow, "operand stack exhausted");
    }
    stack_.push_back(value);
}

WasmValue WasmInterpreter::pop() {
    if (stack_.empty()) {
        trap(WasmError::StackUnderflow, "operand stack underflow");
    }
    WasmValue value = stack_.back();
    stack_.pop_back();
    return value;
}

void WasmInterpreter::consume_fuel() {
    ++fuel_used_;
    if (config_.fuel_limit != 0 && fuel_used_ > config_.fuel_limit) {
        trap(WasmError::FuelExhausted, "fuel exhausted after " + std::to_string(config_.fuel_limit) + " instructions");
    }
}

WasmMemory& WasmInterpreter::require_memory() {
    if (!memory_) {
        trap(WasmError::OutOfBounds, "module has no linear memory");
    }
    return *memory_;
}

std::size_t WasmInterpreter::effective_address(ByteReader& r) {
    (void)r.read_u32();  // alignment hint
    std::uint64_t offset = r.read_u32();
    std::uint64_t base = u32(pop_i32());
    return static_cast<std::size_t>(base + offset);
}

void WasmInterpreter::notify_write(std::size_t offset, std::size_t size) {
    if (memory_callback_ && size > 0) {
        memory_callback_(offset, size, true);
    }
}

void WasmInterpreter::branch(CallFrame& frame, ByteReader& r, std::uint32_t depth) {
    if (depth >= frame.labels.size()) {
        trap(WasmError::InvalidModule, "branch depth out of range");
    }
    const std::size_t target_index = frame.labels.size() - 1 - depth;
    const Label target = frame.labels[target_index];
    if (stack_.size() < target.stack_height + target.arity) {
        trap(WasmError::StackUnderflow, "branch operands missing");
    }

    std::move(stack_.end() - target.arity, stack_.end(),
              stack_.begin() + static_cast<std::ptrdiff_t>(target.stack_height));
    stack_.resize(target.stack_height + target.arity);

    frame.labels.resize(target.is_loop ? target_index + 1 : target_index);
    r.seek(target.continuation);
}

// =============================================================================
// Execution
// =============================================================================

void WasmInterpreter::execute(CallFrame& frame) {
    const auto& fn = *frame.function;
    ByteReader r(fn.code);

    auto push_i32 = [this](auto v) { push(WasmValue(static_cast<std::int32_t>(v))); };
    auto push_i64 = [this](auto v) { push(WasmValue(static_cast<std::int64_t>(v))); };
    auto push_f32 = [this](auto v) { push(WasmValue(static_cast<float>(v))); };
    auto push_f64 = [this](auto v) { push(WasmValue(static_cast<double>(v))); };

    auto un_i32 = [&](auto op) { auto a = pop_i32(); push_i32(op(a)); };
    auto bin_i32 = [&](auto op) { auto b = pop_i32(); auto a = pop_i32(); push_i32(op(a, b)); };
    auto un_i64 = [&](auto op) { auto a = pop_i64(); push_i64(op(a)); };
    auto bin_i64 = [&](auto op) { auto b = pop_i64(); auto a = pop_i64(); push_i64(op(a, b)); };
    auto cmp_i64 = [&](auto op) { auto b = pop_i64(); auto a = pop_i64(); push_i32(op(a, b) ? 1 : 0); };
    auto un_f32 = [&](auto op) { auto a = pop_f32(); push_f32(op(a)); };
    auto bin_f32 = [&](auto op) { auto b = pop_f32(); auto a = pop_f32(); push_f32(op(a, b)); };
    auto cmp_f32 = [&](auto op) { auto b = pop_f32(); auto a = pop_f32(); push_i32(op(a, b) ? 1 : 0); };
    auto un_f64 = [&](auto op) { auto a = pop_f64(); push_f64(op(a)); };
    auto bin_f64 = [&](auto op) { auto b = pop_f64(); auto a = pop_f64(); push_f64(op(a, b)); };
    auto cmp_f64 = [&](auto op) { auto b = pop_f64(); auto a = pop_f64(); push_i32(op(a, b) ? 1 : 0); };

    auto local_at = [&](std::uint32_t index) -> WasmValue& {
        if (index >= frame.locals.size()) {
            trap(WasmError::InvalidModule, "local index out of range");
        }
        return frame.locals[index];
    };
    auto global_at = [&](std::uint32_t index) -> WasmValue& {
        if (index >= globals_.size()) {
            trap(WasmError::InvalidModule, "global index out of range");
        }
        return globals_[index];
    };

    while (!frame.labels.empty() && !r.at_end()) {
        consume_fuel();
        const std::size_t op_pc = r.position();
        const auto op = static_cast<Op>(r.read_byte());

        switch (op) {
            // -----------------------------------------------------------------
            // Control
            // -----------------------------------------------------------------
            case Op::Unreachable:
                trap(WasmError::Unreachable, "unreachable executed");
            case Op::Nop:
                break;
            case Op::Block:
            case Op::Loop: {
                const auto& info = fn.blocks.at(op_pc);
                Label label;
                label.stack_height = stack_.size() - info.param_count;
                if (op == Op::Loop) {
                    label.continuation = info.body_pc;
                    label.arity = info.param_count;
                    label.is_loop = true;
                } else {
                    label.continuation = info.end_pc;
                    label.arity = info.result_count;
                }
                frame.labels.push_back(label);
                r.seek(info.body_pc);
                break;
            }
            case Op::If: {
                const auto& info = fn.blocks.at(op_pc);
                const bool condition = pop_i32() != 0;
                Label label{info.end_pc, stack_.size() - info.param_count, info.result_count, false};
                if (condition) {
                    frame.labels.push_back(label);
                    r.seek(info.body_pc);
                } else if (info.else_pc != 0) {
                    frame.labels.push_back(label);
                    r.seek(info.else_pc + 1);
                } else {
                    r.seek(info.end_pc);
                }
                break;
            }
            case Op::Else:
                // Then-arm finished: continue after the matching end
                r.seek(frame.labels.back().continuation);
                frame.labels.pop_back();
                break;
            case Op::End:
                frame.labels.pop_back();
                break;
            case Op::Br:
                branch(frame, r, r.read_u32());
                break;
            case Op::BrIf: {
                const auto depth = r.read_u32();
                if (pop_i32() != 0) {
                    branch(frame, r, depth);
                }
                break;
            }
            case Op::BrTable: {
                const auto count = r.read_u32();
                const auto index = std::min(u32(pop_i32()), count);
                std::uint32_t depth = 0;
                for (std::uint32_t k = 0; k <= count; ++k) {
                    const auto d = r.read_u32();
                    if (k == index) depth = d;
                }
                branch(frame, r, depth);
                break;
            }
            case Op::Return:
                branch(frame, r, static_cast<std::uint32_t>(frame.labels.size() - 1));
                break;
            case Op::Call:
                call_function(r.read_u32());
                break;
            case Op::CallIndirect: {
                const auto type_index = r.read_u32();
                (void)r.read_u32();  // table index
                const auto element = u32(pop_i32());
                if (element >= table_.size() || !table_[element]) {
                    trap(WasmError::UndefinedElement, "undefined table element " + std::to_string(element));
                }
                const auto target = *table_[element];
                if (module_->function_type(target) != module_->types()[type_index]) {
                    trap(WasmError::IndirectCallTypeMismatch, "indirect call signature mismatch");
                }
                call_function(target);
                break;
            }

            // -----------------------------------------------------------------
            // Parametric
            // -----------------------------------------------------------------
            case Op::Drop:
                (void)pop();
                break;
            case Op::SelectTyped:
                for (std::uint32_t k = 0, n = r.read_u32(); k < n; ++k) {
                    (void)r.read_byte();
                }
                [[fallthrough]];
            case Op::Select: {
                const bool condition = pop_i32() != 0;
                WasmValue b = pop();
                WasmValue a = pop();
                push(condition ? a : b);
                break;
            }

            // -----------------------------------------------------------------
            // Variables
            // -----------------------------------------------------------------
            case Op::LocalGet:
                push(local_at(r.read_u32()));
                break;
            case Op::LocalSet: {
                auto& slot = local_at(r.read_u32());
                slot = pop();
                break;
            }
            case Op::LocalTee: {
                auto& slot = local_at(r.read_u32());
                if (stack_.empty()) {
                    trap(WasmError::StackUnderflow, "local.tee on empty stack");
                }
                slot = stack_.back();
                break;
            }
            case Op::GlobalGet:
                push(global_at(r.read_u32()));
                break;
            case Op::GlobalSet: {
                auto& slot = global_at(r.read_u32());
                slot = pop();
                break;
            }

            // -----------------------------------------------------------------
            // Memory
            // -----------------------------------------------------------------
            case Op::I32Load: { auto a = effective_address(r); push_i32(require_memory().read<std::int32_t>(a)); break; }
            case Op::I64Load: { auto a = effective_address(r); push_i64(require_memory().read<std::int64_t>(a)); break; }
            case Op::F32Load: { auto a = effective_address(r); push_f32(require_memory().read<float>(a)); break; }
            case Op::F64Load: { auto a = effective_address(r); push_f64(require_memory().read<double>(a)); break; }
            case Op::I32Load8S: { auto a = effective_address(r); push_i32(require_memory().read<std::int8_t>(a)); break; }
            case Op::I32Load8U: { auto a = effective_address(r); push_i32(require_memory().read<std::uint8_t>(a)); break; }
            case Op::I32Load16S: { auto a = effective_address(r); push_i32(require_memory().read<std::int16_t>(a)); break; }
            case Op::I32Load16U: { auto a = effective_address(r); push_i32(require_memory().read<std::uint16_t>(a)); break; }
            case Op::I64Load8S: { auto a = effective_address(r); push_i64(require_memory().read<std::int8_t>(a)); break; }
            case Op::I64Load8U: { auto a = effective_address(r); push_i64(require_memory().read<std::uint8_t>(a)); break; }
            case Op::I64Load16S: { auto a = effective_address(r); push_i64(require_memory().read<std::int16_t>(a)); break; }
            case Op::I64Load16U: { auto a = effective_address(r); push_i64(require_memory().read<std::uint16_t>(a)); break; }
            case Op::I64Load32S: { auto a = effective_address(r); push_i64(require_memory().read<std::int32_t>(a)); break; }
            case Op::I64Load32U: { auto a = effective_address(r); push_i64(require_memory().read<std::uint32_t>(a)); break; }

            case Op::I32Store:
            case Op::I32Store8:
            case Op::I32Store16: {
                const auto value = pop_i32();
                const auto addr = effective_address(r);
                auto& mem = require_memory();
                if (op == Op::I32Store) {
                    mem.write<std::int32_t>(addr, value);
                    notify_write(addr, 4);
                } else if (op == Op::I32Store8) {
                    mem.write<std::uint8_t>(addr, static_cast<std::uint8_t>(value));
                    notify_write(addr, 1);
                } else {
                    mem.write<std::uint16_t>(addr, static_cast<std::uint16_t>(value));
                    notify_write(addr, 2);
                }
                break;
            }
            case Op::I64Store:
            case Op::I64Store8:
            case Op::I64Store16:
            case Op::I64Store32: {
                const auto value = pop_i64();
                const auto addr = effective_address(r);
                auto& mem = require_memory();
                switch (op) {
                    case Op::I64Store: mem.write<std::int64_t>(addr, value); notify_write(addr, 8); break;
                    case Op::I64Store8: mem.write<std::uint8_t>(addr, static_cast<std::uint8_t>(value)); notify_write(addr, 1); break;
                    case Op::I64Store16: mem.write<std::uint16_t>(addr, static_cast<std::uint16_t>(value)); notify_write(addr, 2); break;
                    default: mem.write<std::uint32_t>(addr, static_cast<std::uint32_t>(value)); notify_write(addr, 4); break;
                }
                break;
            }
            case Op::F32Store: {
                const auto value = pop_f32();
                const auto addr = effective_address(r);
                require_memory().write<float>(addr, value);
                notify_write(addr, 4);
                break;
            }
            case Op::F64Store: {
                const auto value = pop_f64();
                const auto addr = effective_address(r);
                require_memory().write<double>(addr, value);
                notify_write(addr, 8);
                break;
            }
            case Op::MemorySize:
                (void)r.read_byte();
                push_i32(require_memory().pages());
                break;
            case Op::MemoryGrow: {
                (void)r.read_byte();
                const auto delta = u32(pop_i32());
                auto grown = require_memory().grow(delta);
                push_i32(grown ? static_cast<std::int64_t>(*grown) : -1);
                break;
            }

            // -----------------------------------------------------------------
            // Constants
            // -----------------------------------------------------------------
            case Op::I32Const: push_i32(r.read_i32()); break;
            case Op::I64Const: push_i64(r.read_i64()); break;
            case Op::F32Const: push_f32(r.read_f32()); break;
            case Op::F64Const: push_f64(r.read_f64()); break;

            // -----------------------------------------------------------------
            // i32 comparison and arithmetic
            // -----------------------------------------------------------------
            case Op::I32Eqz: un_i32([](std::int32_t a) { return a == 0 ? 1 : 0; }); break;
            case Op::I32Eq: bin_i32([](std::int32_t a, std::int32_t b) { return a == b ? 1 : 0; }); break;
            case Op::I32Ne: bin_i32([](std::int32_t a, std::int32_t b) { return a != b ? 1 : 0; }); break;
            case Op::I32LtS: bin_i32([](std::int32_t a, std::int32_t b) { return a < b ? 1 : 0; }); break;
            case Op::I32LtU: bin_i32([](std::int32_t a, std::int32_t b) { return u32(a) < u32(b) ? 1 : 0; }); break;
            case Op::I32GtS: bin_i32([](std::int32_t a, std::int32_t b) { return a > b ? 1 : 0; }); break;
            case Op::I32GtU: bin_i32([](std::int32_t a, std::int32_t b) { return u32(a) > u32(b) ? 1 : 0; }); break;
            case Op::I32LeS: bin_i32([](std::int32_t a, std::int32_t b) { return a <= b ? 1 : 0; }); break;
            case Op::I32LeU: bin_i32([](std::int32_t a, std::int32_t b) { return u32(a) <= u32(b) ? 1 : 0; }); break;
            case Op::I32GeS: bin_i32([](std::int32_t a, std::int32_t b) { return a >= b ? 1 : 0; }); break;
            case Op::I32GeU: bin_i32([](std::int32_t a, std::int32_t b) { return u32(a) >= u32(b) ? 1 : 0; }); break;

            case Op::I32Clz: un_i32([](std::int32_t a) { return std::countl_zero(u32(a)); }); break;
            case Op::I32Ctz: un_i32([](std::int32_t a) { return std::countr_zero(u32(a)); }); break;
            case Op::I32Popcnt: un_i32([](std::int32_t a) { return std::popcount(u32(a)); }); break;
            case Op::I32Add: bin_i32([](std::int32_t a, std::int32_t b) { return u32(a) + u32(b); }); break;
            case Op::I32Sub: bin_i32([](std::int32_t a, std::int32_t b) { return u32(a) - u32(b); }); break;
            case Op::I32Mul: bin_i32([](std::int32_t a, std::int32_t b) { return u32(a) * u32(b); }); break;
            case Op::I32DivS:
                bin_i32([](std::int32_t a, std::int32_t b) {
                    if (b == 0) trap(WasmError::DivisionByZero, "integer divide by zero");
                    if (a == std::numeric_limits<std::int32_t>::min() && b == -1) {
                        trap(WasmError::IntegerOverflow, "integer overflow");
                    }
                    return a / b;
                });
                break;
            case Op::I32DivU:
                bin_i32([](std::int32_t a, std::int32_t b) {
                    if (b == 0) trap(WasmError::DivisionByZero, "integer divide by zero");
                    return u32(a) / u32(b);
                });
                break;
            case Op::I32RemS:
                bin_i32([](std::int32_t a, std::int32_t b) {
                    if (b == 0) trap(WasmError::DivisionByZero, "integer divide by zero");
                    if (b == -1) return 0;
                    return a % b;
                });
                break;
            case Op::I32RemU:
                bin_i32([](std::int32_t a, std::int32_t b) {
                    if (b == 0) trap(WasmError::DivisionByZero, "integer divide by zero");
                    return u32(a) % u32(b);
                });
                break;
            case Op::I32And: bin_i32([](std::int32_t a, std::int32_t b) { return a & b; }); break;
            case Op::I32Or: bin_i32([](std::int32_t a, std::int32_t b) { return a | b; }); break;
            case Op::I32Xor: bin_i32([](std::int32_t a, std::int32_t b) { return a ^ b; }); break;
            case Op::I32Shl: bin_i32([](std::int32_t a, std::int32_t b) { return u32(a) << (u32(b) & 31); }); break;
            case Op::I32ShrS: bin_i32([](std::int32_t a, std::int32_t b) { return a >> (u32(b) & 31); }); break;
            case Op::I32ShrU: bin_i32([](std::int32_t a, std::int32_t b) { return u32(a) >> (u32(b) & 31); }); break;
            case Op::I32Rotl:
                bin_i32([](std::int32_t a, std::int32_t b) { return std::rotl(u32(a), static_cast<int>(u32(b) & 31)); });
                break;
            case Op::I32Rotr:
                bin_i32([](std::int32_t a, std::int32_t b) { return std::rotr(u32(a), static_cast<int>(u32(b) & 31)); });
                break;

            // -----------------------------------------------------------------
            // i64 comparison and arithmetic
            // -----------------------------------------------------------------
            case Op::I64Eqz: { auto a = pop_i64(); push_i32(a == 0 ? 1 : 0); break; }
            case Op::I64Eq: cmp_i64([](std::int64_t a, std::int64_t b) { return a == b; }); break;
            case Op::I64Ne: cmp_i64([](std::int64_t a, std::int64_t b) { return a != b; }); break;
            case Op::I64LtS: cmp_i64([](std::int64_t a, std::int64_t b) { return a < b; }); break;
            case Op::I64LtU: cmp_i64([](std::int64_t a, std::int64_t b) { return u64(a) < u64(b); }); break;
            case Op::I64GtS: cmp_i64([](std::int64_t a, std::int64_t b) { return a > b; }); break;
            case Op::I64GtU: cmp_i64([](std::int64_t a, std::int64_t b) { return u64(a) > u64(b); }); break;
            case Op::I64LeS: cmp_i64([](std::int64_t a, std::int64_t b) { return a <= b; }); break;
            case Op::I64LeU: cmp_i64([](std::int64_t a, std::int64_t b) { return u64(a) <= u64(b); }); break;
            case Op::I64GeS: cmp_i64([](std::int64_t a, std::int64_t b) { return a >= b; }); break;
            case Op::I64GeU: cmp_i64([](std::int64_t a, std::int64_t b) { return u64(a) >= u64(b); }); break;

            case Op::I64Clz: un_i64([](std::int64_t a) { return std::countl_zero(u64(a)); }); break;
            case Op::I64Ctz: un_i64([](std::int64_t a) { return std::countr_zero(u64(a)); }); break;
            case Op::I64Popcnt: un_i64([](std::int64_t a) { return std::popcount(u64(a)); }); break;
            case Op::I64Add: bin_i64([](std::int64_t a, std::int64_t b) { return u64(a) + u64(b); }); break;
            case Op::I64Sub: bin_i64([](std::int64_t a, std::int64_t b) { return u64(a) - u64(b); }); break;
            case Op::I64Mul: bin_i64([](std::int64_t a, std::int64_t b) { return u64(a) * u64(b); }); break;
            case Op::I64DivS:
                bin_i64([](std::int64_t a, std::int64_t b) {
                    if (b == 0) trap(WasmError::DivisionByZero, "integer divide by zero");
                    if (a == std::numeric_limits<std::int64_t>::min() && b == -1) {
                        trap(WasmError::IntegerOverflow, "integer overflow");
                    }
                    return a / b;
                });
                break;
            case Op::I64DivU:
                bin_i64([](std::int64_t a, std::int64_t b) {
                    if (b == 0) trap(WasmError::DivisionByZero, "integer divide by zero");
                    return u64(a) / u64(b);
                });
                break;
            case Op::I64RemS:
                bin_i64([](std::int64_t a, std::int64_t b) -> std::int64_t {
                    if (b == 0) trap(WasmError::DivisionByZero, "integer divide by zero");
                    if (b == -1) return 0;
                    return a % b;
                });
                break;
            case Op::I64RemU:
                bin_i64([](std::int64_t a, std::int64_t b) {
                    if (b == 0) trap(WasmError::DivisionByZero, "integer divide by zero");
                    return u64(a) % u64(b);
                });
                break;
            case Op::I64And: bin_i64([](std::int64_t a, std::int64_t b) { return a & b; }); break;
            case Op::I64Or: bin_i64([](std::int64_t a, std::int64_t b) { return a | b; }); break;
            case Op::I64Xor: bin_i64([](std::int64_t a, std::int64_t b) { return a ^ b; }); break;
            case Op::I64Shl: bin_i64([](std::int64_t a, std::int64_t b) { return u64(a) << (u64(b) & 63); }); break;
            case Op::I64ShrS: bin_i64([](std::int64_t a, std::int64_t b) { return a >> (u64(b) & 63); }); break;
            case Op::I64ShrU: bin_i64([](std::int64_t a, std::int64_t b) { return u64(a) >> (u64(b) & 63); }); break;
            case Op::I64Rotl:
                bin_i64([](std::int64_t a, std::int64_t b) { return std::rotl(u64(a), static_cast<int>(u64(b) & 63)); });
                break;
            case Op::I64Rotr:
                bin_i64([](std::int64_t a, std::int64_t b) { return std::rotr(u64(a), static_cast<int>(u64(b) & 63)); });
                break;

            // -----------------------------------------------------------------
            // Floating point
            // -----------------------------------------------------------------
            case Op::F32Eq: cmp_f32([](float a, float b) { return a == b; }); break;
            case Op::F32Ne: cmp_f32([](float a, float b) { return a != b; }); break;
            case Op::F32Lt: cmp_f32([](float a, float b) { return a < b; }); break;
            case Op::F32Gt: cmp_f32([](float a, float b) { return a > b; }); break;
            case Op::F32Le: cmp_f32([](float a, float b) { return a <= b; }); break;
            case Op::F32Ge: cmp_f32([](float a, float b) { return a >= b; }); break;
            case Op::F64Eq: cmp_f64([](double a, double b) { return a == b; }); break;
            case Op::F64Ne: cmp_f64([](double a, double b) { return a != b; }); break;
            case Op::F64Lt: cmp_f64([](double a, double b) { return a < b; }); break;
            case Op::F64Gt: cmp_f64([](double a, double b) { return a > b; }); break;
            case Op::F64Le: cmp_f64([](double a, double b) { return a <= b; }); break;
            case Op::F64Ge: cmp_f64([](double a, double b) { return a >= b; }); break;

            case Op::F32Abs: un_f32([](float a) { return std::fabs(a); }); break;
            case Op::F32Neg: un_f32([](float a) { return -a; }); break;
            case Op::F32Ceil: un_f32([](float a) { return std::ceil(a); }); break;
            case Op::F32Floor: un_f32([](float a) { return std::floor(a); }); break;
            case Op::F32Trunc: un_f32([](float a) { return std::trunc(a); }); break;
            case Op::F32Nearest: un_f32([](float a) { return std::nearbyint(a); }); break;
            case Op::F32Sqrt: un_f32([](float a) { return std::sqrt(a); }); break;
            case Op::F32Add: bin_f32([](float a, float b) { return a + b; }); break;
            case Op::F32Sub: bin_f32([](float a, float b) { return a - b; }); break;
            case Op::F32Mul: bin_f32([](float a, float b) { return a * b; }); break;
            case Op::F32Div: bin_f32([](float a, float b) { return a / b; }); break;
            case Op::F32Min: bin_f32([](float a, float b) { return float_min(a, b); }); break;
            case Op::F32Max: bin_f32([](float a, float b) { return float_max(a, b); }); break;
            case Op::F32Copysign: bin_f32([](float a, float b) { return std::copysign(a, b); }); break;

            case Op::F64Abs: un_f64([](double a) { return std::fabs(a); }); break;
            case Op::F64Neg: un_f64([](double a) { return -a; }); break;
            case Op::F64Ceil: un_f64([](double a) { return std::ceil(a); }); break;
            case Op::F64Floor: un_f64([](double a) { return std::floor(a); }); break;
            case Op::F64Trunc: un_f64([](double a) { return std::trunc(a); }); break;
            case Op::F64Nearest: un_f64([](double a) { return std::nearbyint(a); }); break;
            case Op::F64Sqrt: un_f64([](double a) { return std::sqrt(a); }); break;
            case Op::F64Add: bin_f64([](double a, double b) { return a + b; }); break;
            case Op::F64Sub: bin_f64([](double a, double b) { return a - b; }); break;
            case Op::F64Mul: bin_f64([](double a, double b) { return a * b; }); break;
            case Op::F64Div: bin_f64([](double a, double b) { return a / b; }); break;
            case Op::F64Min: bin_f64([](double a, double b) { return float_min(a, b); }); break;
            case Op::F64Max: bin_f64([](double a, double b) { return float_max(a, b); }); break;
            case Op::F64Copysign: bin_f64([](double a, double b) { return std::copysign(a, b); }); break;

            // -----------------------------------------------------------------
            // Conversions
            // -----------------------------------------------------------------
            case Op::I32WrapI64: push_i32(pop_i64()); break;
            case Op::I32TruncF32S: push_i32(trunc_checked<std::int32_t>(pop_f32())); break;
            case Op::I32TruncF32U: push_i32(trunc_checked<std::uint32_t>(pop_f32())); break;
            case Op::I32TruncF64S: push_i32(trunc_checked<std::int32_t>(pop_f64())); break;
            case Op::I32TruncF64U: push_i32(trunc_checked<std::uint32_t>(pop_f64())); break;
            case Op::I64ExtendI32S: push_i64(pop_i32()); break;
            case Op::I64ExtendI32U: push_i64(u32(pop_i32())); break;
            case Op::I64TruncF32S: push_i64(trunc_checked<std::int64_t>(pop_f32())); break;
            case Op::I64TruncF32U: push_i64(trunc_checked<std::uint64_t>(pop_f32())); break;
            case Op::I64TruncF64S: push_i64(trunc_checked<std::int64_t>(pop_f64())); break;
            case Op::I64TruncF64U: push_i64(trunc_checked<std::uint64_t>(pop_f64())); break;
            case Op::F32ConvertI32S: push_f32(pop_i32()); break;
            case Op::F32ConvertI32U: push_f32(u32(pop_i32())); break;
            case Op::F32ConvertI64S: push_f32(pop_i64()); break;
            case Op::F32ConvertI64U: push_f32(u64(pop_i64())); break;
            case Op::F32DemoteF64: push_f32(pop_f64()); break;
            case Op::F64ConvertI32S: push_f64(pop_i32()); break;
            case Op::F64ConvertI32U: push_f64(u32(pop_i32())); break;
            case Op::F64ConvertI64S: push_f64(pop_i64()); break;
            case Op::F64ConvertI64U: push_f64(u64(pop_i64())); break;
            case Op::F64PromoteF32: push_f64(pop_f32()); break;
            case Op::I32ReinterpretF32: push_i32(std::bit_cast<std::int32_t>(pop_f32())); break;
            case Op::I64ReinterpretF64: push_i64(std::bit_cast<std::int64_t>(pop_f64())); break;
            case Op::F32ReinterpretI32: push_f32(std::bit_cast<float>(pop_i32())); break;
            case Op::F64ReinterpretI64: push_f64(std::bit_cast<double>(pop_i64())); break;

            case Op::I32Extend8S: un_i32([](std::int32_t a) { return static_cast<std::int8_t>(a); }); break;
            case Op::I32Extend16S: un_i32([](std::int32_t a) { return static_cast<std::int16_t>(a); }); break;
            case Op::I64Extend8S: un_i64([](std::int64_t a) { return static_cast<std::int8_t>(a); }); break;
            case Op::I64Extend16S: un_i64([](std::int64_t a) { return static_cast<std::int16_t>(a); }); break;
            case Op::I64Extend32S: un_i64([](std::int64_t a) { return static_cast<std::int32_t>(a); }); break;

            case Op::PrefixFC:
                execute_fc(r);
                break;

            default:
                trap(WasmError::UnsupportedFeature, "unsupported opcode " + std::to_string(static_cast<int>(op)));
        }
    }
}

void WasmInterpreter::execute_fc(ByteReader& r) {
    const auto sub = static_cast<OpFC>(r.read_u32());
    switch (sub) {
        case OpFC::I32TruncSatF32S: push(WasmValue(trunc_saturate<std::int32_t>(pop_f32()))); break;
        case OpFC::I32TruncSatF32U:
            push(WasmValue(static_cast<std::int32_t>(trunc_saturate<std::uint32_t>(pop_f32()))));
            break;
        case OpFC::I32TruncSatF64S: push(WasmValue(trunc_saturate<std::int32_t>(pop_f64()))); break;
        case OpFC::I32TruncSatF64U:
            push(WasmValue(static_cast<std::int32_t>(trunc_saturate<std::uint32_t>(pop_f64()))));
            break;
        case OpFC::I64TruncSatF32S: push(WasmValue(trunc_saturate<std::int64_t>(pop_f32()))); break;
        case OpFC::I64TruncSatF32U:
            push(WasmValue(static_cast<std::int64_t>(trunc_saturate<std::uint64_t>(pop_f32()))));
            break;
        case OpFC::I64TruncSatF64S: push(WasmValue(trunc_saturate<std::int64_t>(pop_f64()))); break;
        case OpFC::I64TruncSatF64U:
            push(WasmValue(static_cast<std::int64_t>(trunc_saturate<std::uint64_t>(pop_f64()))));
            break;
        case OpFC::MemoryCopy: {
            (void)r.read_byte();
            (void)r.read_byte();
            const std::size_t count = u32(pop_i32());
            const std::size_t src = u32(pop_i32());
            const std::size_t dest = u32(pop_i32());
            require_memory().copy_within(dest, src, count);
            notify_write(dest, count);
            break;
        }
        case OpFC::MemoryFill: {
            (void)r.read_byte();
            const std::size_t count = u32(pop_i32());
            const auto value = static_cast<std::uint8_t>(pop_i32());
            const std::size_t dest = u32(pop_i32());
            require_memory().fill(dest, value, count);
            notify_write(dest, count);
            break;
        }
        default:
            trap(WasmError::UnsupportedFeature, "unsupported 0xFC instruction");
    }
}

} // namespace seedbed_wasm
