#pragma once

/// @file module.hpp
/// @brief Decoded WASM module for seedbed_wasm

#include "types.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace seedbed_wasm {

// =============================================================================
// Module Contents
// =============================================================================

/// @brief Control-flow metadata for one block, loop or if
struct BlockInfo {
    std::size_t body_pc = 0;        ///< First instruction inside the block
    std::size_t else_pc = 0;        ///< Offset of the else opcode (0 = none)
    std::size_t end_pc = 0;         ///< Offset just past the matching end
    std::uint32_t param_count = 0;
    std::uint32_t result_count = 0;
};

/// @brief Constant expression used for global, data and element offsets
struct InitExpr {
    enum class Kind : std::uint8_t { Const, GlobalGet };

    Kind kind = Kind::Const;
    WasmValue value;
    std::uint32_t global_index = 0;
};

/// @brief Function defined in the module
struct WasmFunction {
    std::uint32_t type_index = 0;
    std::vector<WasmValType> locals;   ///< Declared locals, params excluded
    std::vector<std::uint8_t> code;    ///< Body expression including the final end
    std::unordered_map<std::size_t, BlockInfo> blocks;  ///< Keyed by opcode offset
};

struct WasmGlobalDef {
    WasmValType type = WasmValType::I32;
    bool is_mutable = false;
    InitExpr init;
};

struct WasmTableDef {
    WasmLimits limits;
};

struct ElementSegment {
    std::uint32_t table_index = 0;
    InitExpr offset;
    std::vector<std::uint32_t> functions;
};

struct DataSegment {
    bool passive = false;
    InitExpr offset;
    std::vector<std::uint8_t> bytes;
};

struct CustomSection {
    std::string name;
    std::vector<std::uint8_t> payload;
};

// =============================================================================
// WasmModule
// =============================================================================

/// @brief Decoded and structurally validated WASM module
///
/// Decoding resolves every block to its else/end offsets so the interpreter
/// never scans forward at run time. Modules using instructions outside the
/// supported set (SIMD, reference types, threads) fail to decode.
class WasmModule {
public:
    /// Decode a binary module; failures are LoadError::malformed_module
    [[nodiscard]] static WasmResult<std::shared_ptr<const WasmModule>> parse(std::span<const std::uint8_t> bytes);

    [[nodiscard]] const std::vector<WasmFunctionType>& types() const { return types_; }
    [[nodiscard]] const std::vector<WasmImport>& imports() const { return imports_; }
    [[nodiscard]] const std::vector<WasmFunction>& functions() const { return functions_; }
    [[nodiscard]] const std::vector<WasmTableDef>& tables() const { return tables_; }
    [[nodiscard]] const std::optional<WasmLimits>& memory() const { return memory_; }
    [[nodiscard]] const std::vector<WasmGlobalDef>& globals() const { return globals_; }
    [[nodiscard]] const std::vector<WasmExport>& exports() const { return exports_; }
    [[nodiscard]] const std::vector<ElementSegment>& elements() const { return elements_; }
    [[nodiscard]] const std::vector<DataSegment>& data() const { return data_; }
    [[nodiscard]] const std::vector<CustomSection>& custom_sections() const { return custom_sections_; }
    [[nodiscard]] std::optional<std::uint32_t> start_function() const { return start_; }

    /// Number of imported functions (they occupy the low function indices)
    [[nodiscard]] std::uint32_t imported_function_count() const { return imported_functions_; }
    [[nodiscard]] std::size_t function_count() const { return imported_functions_ + functions_.size(); }

    /// Signature of any function index, imported or defined
    [[nodiscard]] const WasmFunctionType& function_type(std::uint32_t func_index) const;

    [[nodiscard]] const WasmExport* find_export(const std::string& name) const;
    [[nodiscard]] const WasmExport* find_export(const std::string& name, WasmExternKind kind) const;

    /// First custom section with the given name
    [[nodiscard]] const CustomSection* custom_section(const std::string& name) const;

private:
    friend class ModuleParser;

    WasmModule() = default;

    std::vector<WasmFunctionType> types_;
    std::vector<WasmImport> imports_;
    std::vector<std::uint32_t> import_type_indices_;  ///< Per imported function
    std::uint32_t imported_functions_ = 0;
    std::vector<WasmFunction> functions_;
    std::vector<WasmTableDef> tables_;
    std::optional<WasmLimits> memory_;
    std::vector<WasmGlobalDef> globals_;
    std::vector<WasmExport> exports_;
    std::optional<std::uint32_t> start_;
    std::vector<ElementSegment> elements_;
    std::vector<DataSegment> data_;
    std::vector<CustomSection> custom_sections_;
};

} // namespace seedbed_wasm
