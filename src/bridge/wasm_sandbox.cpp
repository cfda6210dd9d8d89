/// @file wasm_sandbox.cpp
/// @brief WasmSandbox implementation

#include <seedbed/bridge/wasm_sandbox.hpp>
#include <seedbed/core/log.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace seedbed_bridge {

using seedbed_core::Error;
using seedbed_core::ErrorCode;
using seedbed_state::Value;
using seedbed_state::ValueArray;
using seedbed_wasm::WasmValType;
using seedbed_wasm::WasmValue;

namespace {

seedbed_core::Result<WasmValue> to_wasm(const Value& value, WasmValType type, std::size_t index) {
    auto mismatch = [&]() {
        return Error(ErrorCode::InvalidArgument, "argument " + std::to_string(index) + " of type " +
                                                     value.type_name() + " cannot be passed as " +
                                                     seedbed_wasm::wasm_val_type_name(type));
    };

    switch (type) {
        case WasmValType::I32: {
            std::int64_t v = 0;
            if (auto b = value.try_bool()) {
                v = *b ? 1 : 0;
            } else if (auto i = value.try_int()) {
                v = *i;
            } else {
                return mismatch();
            }
            // Accept both signed and unsigned 32-bit ranges
            if (v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::uint32_t>::max()) {
                return Error(ErrorCode::InvalidArgument, "argument " + std::to_string(index) + " out of i32 range");
            }
            return WasmValue(static_cast<std::int32_t>(static_cast<std::uint32_t>(v)));
        }
        case WasmValType::I64: {
            if (auto b = value.try_bool()) return WasmValue(static_cast<std::int64_t>(*b ? 1 : 0));
            if (auto i = value.try_int()) return WasmValue(*i);
            return mismatch();
        }
        case WasmValType::F32:
        case WasmValType::F64: {
            if (!value.is_numeric()) {
                return mismatch();
            }
            double d = value.as_numeric();
            if (type == WasmValType::F32) {
                return WasmValue(static_cast<float>(d));
            }
            return WasmValue(d);
        }
        default:
            return mismatch();
    }
}

Value from_wasm(const WasmValue& value) {
    switch (value.type) {
        case WasmValType::I32: return Value(static_cast<std::int64_t>(value.i32));
        case WasmValType::I64: return Value(value.i64);
        case WasmValType::F32: return Value(static_cast<double>(value.f32));
        case WasmValType::F64: return Value(value.f64);
        default: return Value{};
    }
}

} // namespace

WasmSandbox::WasmSandbox(seedbed_wasm::WasmConfig config)
    : config_(config) {}

WasmSandbox::~WasmSandbox() {
    release();
}

seedbed_core::Result<void> WasmSandbox::instantiate(std::span<const std::uint8_t> bytes) {
    if (instance_) {
        return Error(seedbed_core::LoadError::invalid_state("instantiated"));
    }

    auto parsed = seedbed_wasm::WasmModule::parse(bytes);
    if (!parsed) {
        return parsed.error();
    }

    std::vector<seedbed_wasm::HostImport> imports;
    seedbed_wasm::HostImport notify;
    notify.module = k_import_module;
    notify.name = k_notify_write;
    notify.signature.params = {WasmValType::I32, WasmValType::I32};
    notify.callback = [this](std::span<const WasmValue> args) -> seedbed_wasm::WasmResult<std::vector<WasmValue>> {
        auto offset = static_cast<std::uint32_t>(args[0].i32);
        auto length = static_cast<std::uint32_t>(args[1].i32);
        if (hook_) {
            hook_(offset, length);
        }
        return std::vector<WasmValue>{};
    };
    imports.push_back(std::move(notify));

    auto instance = seedbed_wasm::WasmInstance::instantiate(*parsed, std::move(imports), config_);
    if (!instance) {
        return instance.error();
    }

    module_ = std::move(*parsed);
    instance_ = std::move(*instance);
    instance_->set_memory_callback([this](std::size_t offset, std::size_t size, bool is_write) {
        if (is_write) {
            record_write(offset, size);
        }
    });
    dirty_.clear();

    seedbed_core::wasm_logger()->info("Sandbox instantiated ({} bytes memory, {} exports)",
                                      instance_->memory() ? instance_->memory()->size() : 0,
                                      module_->exports().size());
    return seedbed_core::Ok();
}

bool WasmSandbox::has_memory() const {
    return instance_ && instance_->exports_memory();
}

std::span<std::uint8_t> WasmSandbox::memory() {
    if (!has_memory()) {
        return {};
    }
    return instance_->memory()->bytes();
}

std::optional<std::vector<std::uint8_t>> WasmSandbox::custom_section(const std::string& name) const {
    if (!module_) {
        return std::nullopt;
    }
    const auto* section = module_->custom_section(name);
    if (!section) {
        return std::nullopt;
    }
    return section->payload;
}

bool WasmSandbox::has_export(const std::string& name) const {
    return instance_ && instance_->has_function(name);
}

seedbed_core::Result<Value> WasmSandbox::call(const std::string& name, const std::vector<Value>& args) {
    if (!instance_) {
        return Error(seedbed_core::SandboxError::not_instantiated());
    }
    const auto* signature = instance_->function_signature(name);
    if (!signature) {
        return Error(seedbed_core::SandboxError::export_not_found(name));
    }
    if (args.size() != signature->params.size()) {
        return Error(ErrorCode::InvalidArgument, "'" + name + "' expects " +
                                                     std::to_string(signature->params.size()) + " arguments, got " +
                                                     std::to_string(args.size()));
    }

    std::vector<WasmValue> wasm_args;
    wasm_args.reserve(args.size());
    for (std::size_t i = 0; i < args.size(); ++i) {
        auto converted = to_wasm(args[i], signature->params[i], i);
        if (!converted) {
            return converted.error().with_context("function", name);
        }
        wasm_args.push_back(*converted);
    }

    auto results = instance_->call(name, wasm_args);
    if (!results) {
        return results.error();
    }

    seedbed_core::wasm_logger()->trace("'{}' finished after {} instructions", name, instance_->fuel_consumed());

    if (results->empty()) {
        return Value{};
    }
    if (results->size() == 1) {
        return from_wasm(results->front());
    }
    ValueArray values;
    for (const auto& v : *results) {
        values.push_back(from_wasm(v));
    }
    return Value(std::move(values));
}

void WasmSandbox::record_write(std::size_t offset, std::size_t size) {
    if (!dirty_.empty()) {
        auto& last = dirty_.back();
        if (offset <= last.end() && offset + size >= last.offset) {
            std::size_t end = std::max(last.end(), offset + size);
            last.offset = std::min(last.offset, offset);
            last.length = end - last.offset;
            return;
        }
    }
    if (dirty_.size() >= k_max_dirty_ranges) {
        // Collapse into one covering range
        auto& first = dirty_.front();
        std::size_t begin = std::min(first.offset, offset);
        std::size_t end = std::max(first.end(), offset + size);
        for (const auto& range : dirty_) {
            begin = std::min(begin, range.offset);
            end = std::max(end, range.end());
        }
        dirty_.assign(1, DirtyRange{begin, end - begin});
        return;
    }
    dirty_.push_back(DirtyRange{offset, size});
}

std::vector<DirtyRange> WasmSandbox::take_dirty_ranges() {
    std::vector<DirtyRange> out;
    out.swap(dirty_);
    return out;
}

void WasmSandbox::release() {
    if (instance_) {
        seedbed_core::wasm_logger()->debug("Sandbox released");
    }
    instance_.reset();
    module_.reset();
    hook_ = nullptr;
    dirty_.clear();
}

} // namespace seedbed_bridge
