/// @file module.cpp
/// @brief Binary decoder for WASM modules

#include <seedbed/wasm/module.hpp>
#include <seedbed/core/log.hpp>

#include "opcodes.hpp"
#include "reader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace seedbed_wasm {

using detail::ByteReader;
using detail::Op;
using detail::OpFC;

namespace {

constexpr std::uint8_t k_magic[4] = {0x00, 0x61, 0x73, 0x6D};
constexpr std::uint32_t k_version = 1;

/// Declared locals beyond this are treated as hostile input
constexpr std::uint64_t k_max_locals = 50000;

[[noreturn]] void fail(const std::string& message) {
    throw WasmException(WasmError::InvalidModule, message);
}

[[noreturn]] void unsupported(const std::string& message) {
    throw WasmException(WasmError::UnsupportedFeature, message);
}

WasmValType decode_val_type(std::uint8_t byte) {
    switch (byte) {
        case 0x7F: return WasmValType::I32;
        case 0x7E: return WasmValType::I64;
        case 0x7D: return WasmValType::F32;
        case 0x7C: return WasmValType::F64;
        case 0x70: return WasmValType::FuncRef;
        case 0x7B: unsupported("v128 values are not supported");
        case 0x6F: unsupported("externref values are not supported");
        default: fail("invalid value type 0x" + std::to_string(byte));
    }
}

WasmLimits read_limits(ByteReader& r) {
    WasmLimits limits;
    std::uint8_t flags = r.read_byte();
    if (flags > 1) {
        unsupported("shared or 64-bit limits are not supported");
    }
    limits.min = r.read_u32();
    if (flags == 1) {
        limits.max = r.read_u32();
        if (*limits.max < limits.min) {
            fail("limits maximum below minimum");
        }
    }
    return limits;
}

InitExpr read_init_expr(ByteReader& r) {
    InitExpr expr;
    auto op = static_cast<Op>(r.read_byte());
    switch (op) {
        case Op::I32Const: expr.value = WasmValue(r.read_i32()); break;
        case Op::I64Const: expr.value = WasmValue(r.read_i64()); break;
        case Op::F32Const: expr.value = WasmValue(r.read_f32()); break;
        case Op::F64Const: expr.value = WasmValue(r.read_f64()); break;
        case Op::GlobalGet:
            expr.kind = InitExpr::Kind::GlobalGet;
            expr.global_index = r.read_u32();
            break;
        default:
            unsupported("unsupported constant expression");
    }
    if (static_cast<Op>(r.read_byte()) != Op::End) {
        fail("constant expression not terminated");
    }
    return expr;
}

} // namespace

// =============================================================================
// ModuleParser
// =============================================================================

class ModuleParser {
public:
    explicit ModuleParser(std::span<const std::uint8_t> bytes)
        : reader_(bytes) {}

    std::shared_ptr<WasmModule> run() {
        module_ = std::shared_ptr<WasmModule>(new WasmModule());

        auto magic = reader_.read_bytes(4);
        if (!std::equal(magic.begin(), magic.end(), std::begin(k_magic))) {
            fail("invalid magic number");
        }
        auto version = reader_.read_bytes(4);
        std::uint32_t v = version[0] | (version[1] << 8) | (version[2] << 16) |
                          (static_cast<std::uint32_t>(version[3]) << 24);
        if (v != k_version) {
            fail("unsupported binary version " + std::to_string(v));
        }

        std::size_t declared_functions = 0;
        bool saw_code = false;

        while (!reader_.at_end()) {
            std::uint8_t id = reader_.read_byte();
            std::uint32_t length = reader_.read_u32();
            if (length > reader_.remaining()) {
                fail("section length out of bounds");
            }
            std::size_t end = reader_.position() + length;

            switch (id) {
                case 0: parse_custom(end); break;
                case 1: parse_types(); break;
                case 2: parse_imports(); break;
                case 3: declared_functions = parse_function_decls(); break;
                case 4: parse_tables(); break;
                case 5: parse_memory(); break;
                case 6: parse_globals(); break;
                case 7: parse_exports(); break;
                case 8: module_->start_ = reader_.read_u32(); break;
                case 9: parse_elements(); break;
                case 10: parse_code(); saw_code = true; break;
                case 11: parse_data(); break;
                case 12: (void)reader_.read_u32(); break;  // data count
                default: fail("unknown section id " + std::to_string(id));
            }

            if (reader_.position() != end) {
                fail("section size mismatch in section " + std::to_string(id));
            }
        }

        if (declared_functions > 0 && !saw_code) {
            fail("function section without code section");
        }
        validate_indices();
        return module_;
    }

private:
    void parse_custom(std::size_t end) {
        CustomSection section;
        section.name = reader_.read_name();
        if (reader_.position() > end) {
            fail("custom section name overruns section");
        }
        auto payload = reader_.read_bytes(end - reader_.position());
        section.payload.assign(payload.begin(), payload.end());
        module_->custom_sections_.push_back(std::move(section));
    }

    void parse_types() {
        std::uint32_t count = reader_.read_u32();
        for (std::uint32_t i = 0; i < count; ++i) {
            if (reader_.read_byte() != 0x60) {
                fail("invalid function type form");
            }
            WasmFunctionType type;
            std::uint32_t params = reader_.read_u32();
            for (std::uint32_t p = 0; p < params; ++p) {
                type.params.push_back(decode_val_type(reader_.read_byte()));
            }
            std::uint32_t results = reader_.read_u32();
            for (std::uint32_t p = 0; p < results; ++p) {
                type.results.push_back(decode_val_type(reader_.read_byte()));
            }
            module_->types_.push_back(std::move(type));
        }
    }

    void parse_imports() {
        std::uint32_t count = reader_.read_u32();
        for (std::uint32_t i = 0; i < count; ++i) {
            WasmImport imp;
            imp.module = reader_.read_name();
            imp.name = reader_.read_name();
            std::uint8_t kind = reader_.read_byte();
            switch (kind) {
                case 0:
                    imp.kind = WasmExternKind::Func;
                    imp.type_index = reader_.read_u32();
                    if (imp.type_index >= module_->types_.size()) {
                        fail("import type index out of range");
                    }
                    module_->import_type_indices_.push_back(imp.type_index);
                    ++module_->imported_functions_;
                    break;
                case 1:
                    imp.kind = WasmExternKind::Table;
                    (void)decode_val_type(reader_.read_byte());
                    (void)read_limits(reader_);
                    break;
                case 2:
                    imp.kind = WasmExternKind::Memory;
                    (void)read_limits(reader_);
                    break;
                case 3:
                    imp.kind = WasmExternKind::Global;
                    (void)decode_val_type(reader_.read_byte());
                    (void)reader_.read_byte();
                    break;
                default:
                    fail("invalid import kind");
            }
            module_->imports_.push_back(std::move(imp));
        }
    }

    std::size_t parse_function_decls() {
        std::uint32_t count = reader_.read_u32();
        for (std::uint32_t i = 0; i < count; ++i) {
            WasmFunction fn;
            fn.type_index = reader_.read_u32();
            if (fn.type_index >= module_->types_.size()) {
                fail("function type index out of range");
            }
            module_->functions_.push_back(std::move(fn));
        }
        return count;
    }

    void parse_tables() {
        std::uint32_t count = reader_.read_u32();
        for (std::uint32_t i = 0; i < count; ++i) {
            if (decode_val_type(reader_.read_byte()) != WasmValType::FuncRef) {
                unsupported("only funcref tables are supported");
            }
            module_->tables_.push_back(WasmTableDef{read_limits(reader_)});
        }
    }

    void parse_memory() {
        std::uint32_t count = reader_.read_u32();
        if (count > 1) {
            unsupported("multiple memories are not supported");
        }
        if (count == 1) {
            if (module_->memory_) {
                fail("duplicate memory definition");
            }
            module_->memory_ = read_limits(reader_);
        }
    }

    void parse_globals() {
        std::uint32_t count = reader_.read_u32();
        for (std::uint32_t i = 0; i < count; ++i) {
            WasmGlobalDef global;
            global.type = decode_val_type(reader_.read_byte());
            std::uint8_t mut = reader_.read_byte();
            if (mut > 1) {
                fail("invalid global mutability");
            }
            global.is_mutable = mut == 1;
            global.init = read_init_expr(reader_);
            module_->globals_.push_back(global);
        }
    }

    void parse_exports() {
        std::uint32_t count = reader_.read_u32();
        for (std::uint32_t i = 0; i < count; ++i) {
            WasmExport exp;
            exp.name = reader_.read_name();
            std::uint8_t kind = reader_.read_byte();
            if (kind > 3) {
                fail("invalid export kind");
            }
            exp.kind = static_cast<WasmExternKind>(kind);
            exp.index = reader_.read_u32();
            if (module_->find_export(exp.name)) {
                fail("duplicate export name '" + exp.name + "'");
            }
            module_->exports_.push_back(std::move(exp));
        }
    }

    void parse_elements() {
        std::uint32_t count = reader_.read_u32();
        for (std::uint32_t i = 0; i < count; ++i) {
            std::uint32_t flags = reader_.read_u32();
            if (flags != 0) {
                unsupported("only active funcref element segments are supported");
            }
            ElementSegment segment;
            segment.offset = read_init_expr(reader_);
            std::uint32_t n = reader_.read_u32();
            for (std::uint32_t k = 0; k < n; ++k) {
                segment.functions.push_back(reader_.read_u32());
            }
            module_->elements_.push_back(std::move(segment));
        }
    }

    void parse_data() {
        std::uint32_t count = reader_.read_u32();
        for (std::uint32_t i = 0; i < count; ++i) {
            DataSegment segment;
            std::uint32_t flags = reader_.read_u32();
            switch (flags) {
                case 0:
                    segment.offset = read_init_expr(reader_);
                    break;
                case 1:
                    segment.passive = true;
                    break;
                case 2:
                    if (reader_.read_u32() != 0) {
                        fail("data segment targets unknown memory");
                    }
                    segment.offset = read_init_expr(reader_);
                    break;
                default:
                    fail("invalid data segment flags");
            }
            auto bytes = reader_.read_bytes(reader_.read_u32());
            segment.bytes.assign(bytes.begin(), bytes.end());
            module_->data_.push_back(std::move(segment));
        }
    }

    void parse_code() {
        std::uint32_t count = reader_.read_u32();
        if (count != module_->functions_.size()) {
            fail("function and code section counts differ");
        }
        for (std::uint32_t i = 0; i < count; ++i) {
            std::uint32_t size = reader_.read_u32();
            if (size > reader_.remaining()) {
                fail("function body out of bounds");
            }
            std::size_t body_end = reader_.position() + size;
            auto& fn = module_->functions_[i];

            std::uint32_t groups = reader_.read_u32();
            std::uint64_t total = 0;
            for (std::uint32_t g = 0; g < groups; ++g) {
                std::uint32_t n = reader_.read_u32();
                total += n;
                if (total > k_max_locals) {
                    fail("too many locals");
                }
                WasmValType type = decode_val_type(reader_.read_byte());
                fn.locals.insert(fn.locals.end(), n, type);
            }
            if (reader_.position() > body_end) {
                fail("function locals overrun body");
            }

            auto code = reader_.read_bytes(body_end - reader_.position());
            fn.code.assign(code.begin(), code.end());
            scan_blocks(fn);
        }
    }

    /// Read a block type and return (params, results)
    std::pair<std::uint32_t, std::uint32_t> read_block_type(ByteReader& r) {
        std::uint8_t b = r.peek_byte();
        if (b == 0x40) {
            r.read_byte();
            return {0, 0};
        }
        if (b == 0x7F || b == 0x7E || b == 0x7D || b == 0x7C) {
            r.read_byte();
            return {0, 1};
        }
        std::int64_t index = r.read_s33();
        if (index < 0 || static_cast<std::uint64_t>(index) >= module_->types_.size()) {
            fail("invalid block type");
        }
        const auto& type = module_->types_[static_cast<std::size_t>(index)];
        return {static_cast<std::uint32_t>(type.params.size()),
                static_cast<std::uint32_t>(type.results.size())};
    }

    /// Walk one body, skipping immediates, and record every block's extent
    void scan_blocks(WasmFunction& fn) {
        ByteReader r(fn.code);
        std::vector<std::size_t> open;
        bool closed = false;

        while (!r.at_end()) {
            if (closed) {
                fail("trailing bytes after function end");
            }
            std::size_t op_pc = r.position();
            auto op = static_cast<Op>(r.read_byte());

            switch (op) {
                case Op::Block:
                case Op::Loop:
                case Op::If: {
                    auto [params, results] = read_block_type(r);
                    BlockInfo info;
                    info.body_pc = r.position();
                    info.param_count = params;
                    info.result_count = results;
                    fn.blocks[op_pc] = info;
                    open.push_back(op_pc);
                    break;
                }
                case Op::Else:
                    if (open.empty() || static_cast<Op>(fn.code[open.back()]) != Op::If ||
                        fn.blocks[open.back()].else_pc != 0) {
                        fail("else without matching if");
                    }
                    fn.blocks[open.back()].else_pc = op_pc;
                    break;
                case Op::End:
                    if (open.empty()) {
                        closed = true;
                    } else {
                        fn.blocks[open.back()].end_pc = r.position();
                        open.pop_back();
                    }
                    break;

                case Op::Br:
                case Op::BrIf:
                case Op::LocalGet:
                case Op::LocalSet:
                case Op::LocalTee:
                case Op::GlobalGet:
                case Op::GlobalSet:
                    (void)r.read_u32();
                    break;
                case Op::Call: {
                    std::uint32_t target = r.read_u32();
                    if (target >= module_->function_count()) {
                        fail("call target out of range");
                    }
                    break;
                }
                case Op::CallIndirect: {
                    std::uint32_t type_index = r.read_u32();
                    if (type_index >= module_->types_.size()) {
                        fail("call_indirect type out of range");
                    }
                    (void)r.read_u32();
                    break;
                }
                case Op::BrTable: {
                    std::uint32_t n = r.read_u32();
                    for (std::uint32_t k = 0; k <= n; ++k) {
                        (void)r.read_u32();
                    }
                    break;
                }
                case Op::SelectTyped: {
                    std::uint32_t n = r.read_u32();
                    for (std::uint32_t k = 0; k < n; ++k) {
                        (void)decode_val_type(r.read_byte());
                    }
                    break;
                }
                case Op::MemorySize:
                case Op::MemoryGrow:
                    if (r.read_byte() != 0x00) {
                        fail("memory index must be zero");
                    }
                    break;
                case Op::I32Const: (void)r.read_i32(); break;
                case Op::I64Const: (void)r.read_i64(); break;
                case Op::F32Const: (void)r.read_f32(); break;
                case Op::F64Const: (void)r.read_f64(); break;
                case Op::PrefixFC: {
                    auto sub = static_cast<OpFC>(r.read_u32());
                    if (sub == OpFC::MemoryCopy) {
                        (void)r.read_byte();
                        (void)r.read_byte();
                    } else if (sub == OpFC::MemoryFill) {
                        (void)r.read_byte();
                    } else if (static_cast<std::uint32_t>(sub) > 7) {
                        unsupported("unsupported 0xFC instruction " +
                                    std::to_string(static_cast<std::uint32_t>(sub)));
                    }
                    break;
                }
                default: {
                    auto raw = static_cast<std::uint8_t>(op);
                    if (raw >= 0x28 && raw <= 0x3E) {
                        (void)r.read_u32();  // align
                        (void)r.read_u32();  // offset
                    } else if (raw == 0x00 || raw == 0x01 || raw == 0x0F || raw == 0x1A || raw == 0x1B ||
                               (raw >= 0x45 && raw <= 0xC4)) {
                        // no immediates
                    } else {
                        unsupported("unsupported opcode " + std::to_string(raw));
                    }
                    break;
                }
            }
        }

        if (!closed || !open.empty()) {
            fail("function body not terminated");
        }
    }

    void validate_indices() {
        const auto total = module_->function_count();
        for (const auto& exp : module_->exports_) {
            bool ok = true;
            switch (exp.kind) {
                case WasmExternKind::Func: ok = exp.index < total; break;
                case WasmExternKind::Memory: ok = module_->memory_.has_value() && exp.index == 0; break;
                case WasmExternKind::Global: ok = exp.index < module_->globals_.size(); break;
                case WasmExternKind::Table: ok = exp.index < module_->tables_.size(); break;
            }
            if (!ok) {
                fail("export '" + exp.name + "' refers to a missing item");
            }
        }
        if (module_->start_ && *module_->start_ >= total) {
            fail("start function out of range");
        }
        for (const auto& segment : module_->elements_) {
            for (auto index : segment.functions) {
                if (index >= total) {
                    fail("element refers to a missing function");
                }
            }
        }
    }

    ByteReader reader_;
    std::shared_ptr<WasmModule> module_;
};

// =============================================================================
// WasmModule
// =============================================================================

WasmResult<std::shared_ptr<const WasmModule>> WasmModule::parse(std::span<const std::uint8_t> bytes) {
    try {
        ModuleParser parser(bytes);
        std::shared_ptr<const WasmModule> module = parser.run();
        seedbed_core::wasm_logger()->debug("Decoded WASM module: {} functions, {} imports, {} custom sections",
                                           module->function_count(), module->imports().size(),
                                           module->custom_sections().size());
        return module;
    } catch (const WasmException& e) {
        return seedbed_core::Error(seedbed_core::LoadError::malformed_module(e.describe()));
    }
}

const WasmFunctionType& WasmModule::function_type(std::uint32_t func_index) const {
    if (func_index < imported_functions_) {
        return types_[import_type_indices_[func_index]];
    }
    return types_[functions_.at(func_index - imported_functions_).type_index];
}

const WasmExport* WasmModule::find_export(const std::string& name) const {
    for (const auto& exp : exports_) {
        if (exp.name == name) return &exp;
    }
    return nullptr;
}

const WasmExport* WasmModule::find_export(const std::string& name, WasmExternKind kind) const {
    const auto* exp = find_export(name);
    return (exp && exp->kind == kind) ? exp : nullptr;
}

const CustomSection* WasmModule::custom_section(const std::string& name) const {
    for (const auto& section : custom_sections_) {
        if (section.name == name) return &section;
    }
    return nullptr;
}

} // namespace seedbed_wasm
