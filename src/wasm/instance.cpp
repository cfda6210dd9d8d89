/// @file instance.cpp
/// @brief WasmInstance implementation

#include <seedbed/wasm/instance.hpp>
#include <seedbed/core/log.hpp>

#include "interpreter.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace seedbed_wasm {

using seedbed_core::Error;
using seedbed_core::ErrorCode;

WasmResult<std::unique_ptr<WasmInstance>> WasmInstance::instantiate(
    std::shared_ptr<const WasmModule> module,
    std::vector<HostImport> imports,
    const WasmConfig& config) {
    if (!module) {
        return Error(ErrorCode::InvalidArgument, "Cannot instantiate a null module");
    }

    auto interpreter = std::make_unique<WasmInterpreter>(module, config);
    try {
        interpreter->link(std::move(imports));
        interpreter->run_start();
    } catch (const WasmException& e) {
        interpreter->reset();
        return Error(seedbed_core::LoadError::instantiation_failed(e.describe()));
    }

    seedbed_core::wasm_logger()->debug("Instantiated module with {} bytes of linear memory",
                                       interpreter->memory() ? interpreter->memory()->size() : 0);
    return std::unique_ptr<WasmInstance>(new WasmInstance(std::move(module), std::move(interpreter)));
}

WasmInstance::WasmInstance(std::shared_ptr<const WasmModule> module, std::unique_ptr<WasmInterpreter> interpreter)
    : module_(std::move(module))
    , interpreter_(std::move(interpreter)) {}

WasmInstance::~WasmInstance() = default;

const WasmConfig& WasmInstance::config() const {
    return interpreter_->config();
}

WasmMemory* WasmInstance::memory() {
    return interpreter_->memory();
}

const WasmMemory* WasmInstance::memory() const {
    return interpreter_->memory();
}

bool WasmInstance::exports_memory() const {
    if (!interpreter_->memory()) {
        return false;
    }
    for (const auto& exp : module_->exports()) {
        if (exp.kind == WasmExternKind::Memory) return true;
    }
    return false;
}

bool WasmInstance::has_function(const std::string& name) const {
    return module_->find_export(name, WasmExternKind::Func) != nullptr;
}

const WasmFunctionType* WasmInstance::function_signature(const std::string& name) const {
    const auto* exp = module_->find_export(name, WasmExternKind::Func);
    return exp ? &module_->function_type(exp->index) : nullptr;
}

WasmResult<std::vector<WasmValue>> WasmInstance::call(const std::string& name, std::span<const WasmValue> args) {
    const auto* exp = module_->find_export(name, WasmExternKind::Func);
    if (!exp) {
        return Error(seedbed_core::SandboxError::export_not_found(name));
    }
    if (interpreter_->executing()) {
        return Error(ErrorCode::InvalidState, "Re-entrant call to '" + name + "'");
    }

    const auto& type = module_->function_type(exp->index);
    if (args.size() != type.params.size()) {
        return Error(ErrorCode::InvalidArgument, "'" + name + "' expects " + std::to_string(type.params.size()) +
                                                     " arguments, got " + std::to_string(args.size()));
    }
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i].type != type.params[i]) {
            return Error(ErrorCode::InvalidArgument, "'" + name + "' argument " + std::to_string(i) + " must be " +
                                                         wasm_val_type_name(type.params[i]));
        }
    }

    try {
        return interpreter_->invoke(exp->index, args);
    } catch (const WasmException& e) {
        interpreter_->reset();
        seedbed_core::wasm_logger()->warn("Call to '{}' trapped: {}", name, e.message());
        return call_failure(e, name);
    }
}

void WasmInstance::set_memory_callback(MemoryAccessCallback callback) {
    interpreter_->set_memory_callback(std::move(callback));
}

std::uint64_t WasmInstance::fuel_consumed() const {
    return interpreter_->fuel_consumed();
}

} // namespace seedbed_wasm
