#pragma once

/// @file wasm_sandbox.hpp
/// @brief Sandbox backed by the seedbed_wasm interpreter

#include "sandbox.hpp"

#include <seedbed/wasm/instance.hpp>

namespace seedbed_bridge {

/// @brief WebAssembly sandbox
///
/// Offers the host import `seedbed.notify_write(offset: i32, len: i32)` and
/// records the range of every guest store instruction as a dirty range.
class WasmSandbox final : public Sandbox {
public:
    static constexpr const char* k_import_module = "seedbed";
    static constexpr const char* k_notify_write = "notify_write";

    /// Dirty ranges kept between drains; older ones are merged past this
    static constexpr std::size_t k_max_dirty_ranges = 1024;

    explicit WasmSandbox(seedbed_wasm::WasmConfig config = {});
    ~WasmSandbox() override;

    seedbed_core::Result<void> instantiate(std::span<const std::uint8_t> bytes) override;
    [[nodiscard]] bool is_instantiated() const override { return instance_ != nullptr; }
    [[nodiscard]] bool has_memory() const override;
    [[nodiscard]] std::span<std::uint8_t> memory() override;
    [[nodiscard]] std::optional<std::vector<std::uint8_t>> custom_section(const std::string& name) const override;
    [[nodiscard]] bool has_export(const std::string& name) const override;

    seedbed_core::Result<seedbed_state::Value> call(const std::string& name,
                                                    const std::vector<seedbed_state::Value>& args) override;

    void set_write_hook(WriteHook hook) override { hook_ = std::move(hook); }
    std::vector<DirtyRange> take_dirty_ranges() override;
    void release() override;

    [[nodiscard]] const seedbed_wasm::WasmConfig& config() const { return config_; }
    [[nodiscard]] seedbed_wasm::WasmInstance* instance() { return instance_.get(); }

private:
    void record_write(std::size_t offset, std::size_t size);

    seedbed_wasm::WasmConfig config_;
    std::shared_ptr<const seedbed_wasm::WasmModule> module_;
    std::unique_ptr<seedbed_wasm::WasmInstance> instance_;
    WriteHook hook_;
    std::vector<DirtyRange> dirty_;
};

} // namespace seedbed_bridge
