// seedbed_wasm instance and interpreter tests

#include <catch2/catch_test_macros.hpp>
#include <seedbed/wasm/wasm.hpp>

#include "module_builder.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace seedbed_wasm;
using namespace seedbed_test;
using seedbed_core::Error;
using seedbed_core::ErrorCode;

namespace {

std::unique_ptr<WasmInstance> instantiate(const Bytes& bytes, std::vector<HostImport> imports = {},
                                          const WasmConfig& config = {}) {
    auto module = WasmModule::parse(bytes);
    REQUIRE(module.is_ok());
    auto instance = WasmInstance::instantiate(module.value(), std::move(imports), config);
    REQUIRE(instance.is_ok());
    return std::move(instance).unwrap();
}

ErrorCode instantiate_error(const Bytes& bytes, std::vector<HostImport> imports = {},
                            const WasmConfig& config = {}) {
    auto module = WasmModule::parse(bytes);
    REQUIRE(module.is_ok());
    auto instance = WasmInstance::instantiate(module.value(), std::move(imports), config);
    REQUIRE(instance.is_err());
    return instance.error().code();
}

HostImport host(std::string name, WasmFunctionType type, HostFunctionCallback callback) {
    return HostImport{"env", std::move(name), std::move(type), std::move(callback)};
}

} // namespace

// =============================================================================
// Arithmetic and control flow
// =============================================================================

TEST_CASE("WasmInstance calls exported functions", "[wasm][instance]") {
    ModuleBuilder b;
    auto t = b.add_type({I32, I32}, {I32});
    auto add = b.add_function(t, Code().local_get(0).local_get(1).i32_add());
    b.export_function("add", add);

    auto instance = instantiate(b.build());
    REQUIRE(instance->has_function("add"));
    REQUIRE_FALSE(instance->has_function("sub"));

    const auto* sig = instance->function_signature("add");
    REQUIRE(sig != nullptr);
    REQUIRE(sig->params.size() == 2);
    REQUIRE(sig->results.size() == 1);

    std::vector<WasmValue> args = {WasmValue(2), WasmValue(3)};
    auto result = instance->call("add", args);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().size() == 1);
    REQUIRE(result.value()[0].type == WasmValType::I32);
    REQUIRE(result.value()[0].i32 == 5);
    REQUIRE(instance->fuel_consumed() > 0);
}

TEST_CASE("WasmInstance runs recursion with if/else", "[wasm][instance]") {
    ModuleBuilder b;
    auto t = b.add_type({I64}, {I64});
    // fac(n) = n == 0 ? 1 : n * fac(n - 1)
    auto fac = b.add_function(t, Code()
        .local_get(0).i64_eqz()
        .if_(I64)
            .i64_const(1)
        .else_()
            .local_get(0)
            .local_get(0).i64_const(1).i64_sub()
            .call(0)
            .i64_mul()
        .end());
    b.export_function("fac", fac);

    auto instance = instantiate(b.build());
    std::vector<WasmValue> args = {WasmValue(std::int64_t{10})};
    auto result = instance->call("fac", args);
    REQUIRE(result.is_ok());
    REQUIRE(result.value()[0].type == WasmValType::I64);
    REQUIRE(result.value()[0].i64 == 3628800);
}

TEST_CASE("WasmInstance runs loops with branches", "[wasm][instance]") {
    ModuleBuilder b;
    auto t = b.add_type({I32}, {I32});
    // acc = 0; while (n != 0) { acc += n; n -= 1; } return acc
    auto sum = b.add_function(t, Code()
        .block()
            .loop()
                .local_get(0).i32_eqz().br_if(1)
                .local_get(1).local_get(0).i32_add().local_set(1)
                .local_get(0).i32_const(1).i32_sub().local_set(0)
                .br(0)
            .end()
        .end()
        .local_get(1), {I32});
    b.export_function("sum", sum);

    auto instance = instantiate(b.build());
    std::vector<WasmValue> args = {WasmValue(100)};
    auto result = instance->call("sum", args);
    REQUIRE(result.is_ok());
    REQUIRE(result.value()[0].i32 == 5050);
}

// =============================================================================
// Memory
// =============================================================================

TEST_CASE("WasmInstance linear memory", "[wasm][instance][memory]") {
    ModuleBuilder b;
    auto store_t = b.add_type({I32, I32}, {});
    auto load_t = b.add_type({I32}, {I32});
    auto store = b.add_function(store_t, Code().local_get(0).local_get(1).i32_store());
    auto load = b.add_function(load_t, Code().local_get(0).i32_load());
    b.memory(1).export_memory()
     .export_function("store", store)
     .export_function("load", load)
     .data(16, {0x2A, 0x00, 0x00, 0x00});

    auto instance = instantiate(b.build());
    REQUIRE(instance->exports_memory());
    REQUIRE(instance->memory() != nullptr);
    REQUIRE(instance->memory()->size() == WasmMemory::page_size);

    SECTION("data segments initialize memory") {
        REQUIRE(instance->memory()->read<std::uint32_t>(16) == 42);
    }

    SECTION("stores report written ranges") {
        std::vector<std::pair<std::size_t, std::size_t>> writes;
        instance->set_memory_callback([&](std::size_t offset, std::size_t size, bool is_write) {
            if (is_write) writes.emplace_back(offset, size);
        });

        std::vector<WasmValue> args = {WasmValue(64), WasmValue(0x01020304)};
        REQUIRE(instance->call("store", args).is_ok());
        REQUIRE(writes.size() == 1);
        REQUIRE(writes[0] == std::pair<std::size_t, std::size_t>{64, 4});

        auto bytes = instance->memory()->bytes();
        REQUIRE(bytes[64] == 0x04);
        REQUIRE(bytes[67] == 0x01);

        std::vector<WasmValue> load_args = {WasmValue(64)};
        auto loaded = instance->call("load", load_args);
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.value()[0].i32 == 0x01020304);
    }

    SECTION("out of bounds access traps") {
        std::vector<WasmValue> args = {WasmValue(static_cast<std::int32_t>(WasmMemory::page_size - 2))};
        auto result = instance->call("load", args);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::Trap);
    }
}

TEST_CASE("WasmMemory growth and bounds", "[wasm][memory]") {
    WasmMemory memory(1, 2);
    REQUIRE(memory.pages() == 1);
    REQUIRE(memory.check_bounds(0, WasmMemory::page_size));
    REQUIRE_FALSE(memory.check_bounds(WasmMemory::page_size - 1, 2));

    memory.write<std::uint32_t>(100, 0xDEADBEEF);

    auto grown = memory.grow(1);
    REQUIRE(grown.is_ok());
    REQUIRE(grown.value() == 1);
    REQUIRE(memory.pages() == 2);
    REQUIRE(memory.read<std::uint32_t>(100) == 0xDEADBEEF);
    REQUIRE(memory.read<std::uint8_t>(WasmMemory::page_size + 10) == 0);

    auto refused = memory.grow(1);
    REQUIRE(refused.is_err());
    REQUIRE(refused.error().code() == ErrorCode::OutOfMemory);

    REQUIRE_THROWS_AS(memory.read<std::uint64_t>(2 * WasmMemory::page_size - 4), WasmException);
}

// =============================================================================
// Traps
// =============================================================================

TEST_CASE("WasmInstance traps leave the instance usable", "[wasm][instance]") {
    ModuleBuilder b;
    auto t = b.add_type({I32, I32}, {I32});
    auto void_t = b.add_type({}, {});
    auto div = b.add_function(t, Code().local_get(0).local_get(1).i32_div_s());
    auto boom = b.add_function(void_t, Code().unreachable());
    b.export_function("div", div).export_function("boom", boom);

    auto instance = instantiate(b.build());

    std::vector<WasmValue> by_zero = {WasmValue(1), WasmValue(0)};
    auto trapped = instance->call("div", by_zero);
    REQUIRE(trapped.is_err());
    REQUIRE(trapped.error().code() == ErrorCode::Trap);
    REQUIRE(trapped.error().is<seedbed_core::SandboxError>());
    REQUIRE(trapped.error().get_context("cause") != nullptr);
    REQUIRE(*trapped.error().get_context("cause") == "integer divide by zero");

    auto unreachable = instance->call("boom");
    REQUIRE(unreachable.is_err());
    REQUIRE(unreachable.error().code() == ErrorCode::Trap);
    REQUIRE(*unreachable.error().get_context("cause") == "unreachable executed");

    std::vector<WasmValue> ok = {WasmValue(6), WasmValue(3)};
    auto result = instance->call("div", ok);
    REQUIRE(result.is_ok());
    REQUIRE(result.value()[0].i32 == 2);
}

TEST_CASE("WasmInstance fuel limit", "[wasm][instance]") {
    ModuleBuilder b;
    auto t = b.add_type({}, {});
    auto spin = b.add_function(t, Code().loop().br(0).end());
    auto nop = b.add_function(t, Code());
    b.export_function("spin", spin).export_function("nop", nop);

    WasmConfig config;
    config.fuel_limit = 1000;
    auto instance = instantiate(b.build(), {}, config);

    auto result = instance->call("spin");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::Timeout);

    REQUIRE(instance->call("nop").is_ok());
    REQUIRE(instance->fuel_consumed() <= 1000);
}

TEST_CASE("WasmInstance call depth limit", "[wasm][instance]") {
    ModuleBuilder b;
    auto t = b.add_type({}, {});
    auto forever = b.add_function(t, Code().call(0));
    b.export_function("forever", forever);

    WasmConfig config;
    config.max_call_depth = 32;
    auto instance = instantiate(b.build(), {}, config);

    auto result = instance->call("forever");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::Trap);
}

// =============================================================================
// Arguments and exports
// =============================================================================

TEST_CASE("WasmInstance argument checking", "[wasm][instance]") {
    ModuleBuilder b;
    auto t = b.add_type({I32}, {I32});
    auto id = b.add_function(t, Code().local_get(0));
    b.export_function("id", id);
    auto instance = instantiate(b.build());

    SECTION("missing export") {
        auto result = instance->call("nope");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("wrong argument count") {
        auto result = instance->call("id");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("wrong argument type") {
        std::vector<WasmValue> args = {WasmValue(1.5)};
        auto result = instance->call("id", args);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }
}

// =============================================================================
// Host imports
// =============================================================================

TEST_CASE("WasmInstance host imports", "[wasm][instance][host]") {
    ModuleBuilder b;
    auto log_t = b.add_type({I32}, {});
    auto call_t = b.add_type({I32}, {});
    auto log = b.import_function("env", "log", log_t);
    auto emit = b.add_function(call_t, Code().local_get(0).call(log));
    b.export_function("emit", emit);
    const Bytes bytes = b.build();
    const WasmFunctionType log_sig{{WasmValType::I32}, {}};

    SECTION("arguments reach the host") {
        std::vector<std::int32_t> received;
        std::vector<HostImport> imports;
        imports.push_back(host("log", log_sig,
            [&](std::span<const WasmValue> args) -> WasmResult<std::vector<WasmValue>> {
                received.push_back(args[0].i32);
                return std::vector<WasmValue>{};
            }));
        auto instance = instantiate(bytes, std::move(imports));

        std::vector<WasmValue> args = {WasmValue(77)};
        REQUIRE(instance->call("emit", args).is_ok());
        REQUIRE(received == std::vector<std::int32_t>{77});
    }

    SECTION("host errors become traps") {
        std::vector<HostImport> imports;
        imports.push_back(host("log", log_sig,
            [](std::span<const WasmValue>) -> WasmResult<std::vector<WasmValue>> {
                return Error(ErrorCode::InvalidState, "host refused");
            }));
        auto instance = instantiate(bytes, std::move(imports));

        std::vector<WasmValue> args = {WasmValue(1)};
        auto result = instance->call("emit", args);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::Trap);
        REQUIRE(result.error().message().find("host refused") != std::string::npos);
    }

    SECTION("host exceptions become traps") {
        std::vector<HostImport> imports;
        imports.push_back(host("log", log_sig,
            [](std::span<const WasmValue>) -> WasmResult<std::vector<WasmValue>> {
                throw std::runtime_error("host threw");
            }));
        auto instance = instantiate(bytes, std::move(imports));

        std::vector<WasmValue> args = {WasmValue(1)};
        REQUIRE(instance->call("emit", args).error().code() == ErrorCode::Trap);
    }

    SECTION("missing import") {
        REQUIRE(instantiate_error(bytes) == ErrorCode::LoadFailed);
    }

    SECTION("mismatched import signature") {
        std::vector<HostImport> imports;
        imports.push_back(host("log", WasmFunctionType{{WasmValType::I64}, {}},
            [](std::span<const WasmValue>) -> WasmResult<std::vector<WasmValue>> {
                return std::vector<WasmValue>{};
            }));
        REQUIRE(instantiate_error(bytes, std::move(imports)) == ErrorCode::LoadFailed);
    }
}

TEST_CASE("WasmInstance memory limit", "[wasm][instance][memory]") {
    ModuleBuilder b;
    b.memory(32);
    const Bytes bytes = b.build();

    REQUIRE(instantiate_error(bytes) == ErrorCode::LoadFailed);

    WasmConfig roomy;
    roomy.max_memory_pages = 64;
    auto instance = instantiate(bytes, {}, roomy);
    REQUIRE(instance->memory()->pages() == 32);
    REQUIRE_FALSE(instance->exports_memory());
}

TEST_CASE("WasmInstance runs the start function", "[wasm][instance]") {
    ModuleBuilder b;
    auto t = b.add_type({}, {});
    auto init = b.add_function(t, Code().i32_const(0).i32_const(9).i32_store());
    b.memory(1).start(init);

    auto instance = instantiate(b.build());
    REQUIRE(instance->memory()->read<std::int32_t>(0) == 9);
}
