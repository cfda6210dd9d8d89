// seedbed_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <seedbed/core/error.hpp>
#include <cstdint>
#include <string>
#include <vector>

using namespace seedbed_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error codes and messages", "[core][error]") {
    SECTION("plain message has no category") {
        Error err("layout missing");
        REQUIRE(err.code() == ErrorCode::Unknown);
        REQUIRE(err.message() == "layout missing");
        REQUIRE(err.is<std::string>());
    }

    SECTION("explicit code") {
        Error err(ErrorCode::ValidationError, "[scheduler] max_flush_rounds must be positive");
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(std::string(error_code_name(err.code())) == "ValidationError");
        REQUIRE(err.as<StoreError>() == nullptr);
    }

    SECTION("context entries accumulate") {
        Error err = SandboxError::trap("tick", "integer divide by zero");
        err.with_context("cause", "integer divide by zero").with_context("module", "counter.wasm");
        REQUIRE(err.context().size() == 2);
        REQUIRE(*err.get_context("module") == "counter.wasm");
        REQUIRE(err.get_context("offset") == nullptr);
    }

    SECTION("every code has a name") {
        REQUIRE(std::string(error_code_name(ErrorCode::NotSupported)) == "NotSupported");
        REQUIRE(std::string(error_code_name(ErrorCode::CallbackFailed)) == "CallbackFailed");
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("StoreError::type_mismatch") {
        Error err = StoreError::type_mismatch("count", "int", "string");
        REQUIRE(err.code() == ErrorCode::TypeMismatch);
        REQUIRE(err.is<StoreError>());
        REQUIRE(err.as<StoreError>()->key == "count");
        REQUIRE(err.as<StoreError>()->expected == "int");
        REQUIRE(err.as<StoreError>()->found == "string");
    }

    SECTION("StoreError::disposed") {
        Error err = StoreError::disposed("set");
        REQUIRE(err.code() == ErrorCode::InvalidState);
    }

    SECTION("CycleError::cycle") {
        Error err = CycleError::cycle("a", {"a", "b", "a"});
        REQUIRE(err.code() == ErrorCode::CycleDetected);
        REQUIRE(err.message().find("a -> b -> a") != std::string::npos);
        REQUIRE(err.as<CycleError>()->path.front() == err.as<CycleError>()->path.back());
    }

    SECTION("LoadError kinds") {
        REQUIRE(Error(LoadError::malformed_module("bad magic")).code() == ErrorCode::ParseError);
        REQUIRE(Error(LoadError::missing_memory()).code() == ErrorCode::LoadFailed);
        REQUIRE(Error(LoadError::invalid_state("Ready")).code() == ErrorCode::InvalidState);
    }

    SECTION("BindingError kinds") {
        REQUIRE(Error(BindingError::duplicate_key("x")).code() == ErrorCode::AlreadyExists);
        REQUIRE(Error(BindingError::invalid_layout("not json")).code() == ErrorCode::ParseError);
        REQUIRE(Error(BindingError::overlap("x", "y", 4)).code() == ErrorCode::BindingFailed);
    }

    SECTION("SandboxError kinds") {
        REQUIRE(Error(SandboxError::export_not_found("run")).code() == ErrorCode::NotFound);
        REQUIRE(Error(SandboxError::trap("run", "unreachable")).code() == ErrorCode::Trap);
        REQUIRE(Error(SandboxError::fuel_exhausted("run")).code() == ErrorCode::Timeout);
    }

    SECTION("ComputeError::already_defined") {
        Error err = ComputeError::already_defined("total");
        REQUIRE(err.code() == ErrorCode::AlreadyExists);
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    Error err = BindingError::overlap("x", "y", 4);
    err.with_context("layout", "seedbed.layout");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[BindingFailed]") != std::string::npos);
    REQUIRE(chain.find("[BindingError]") != std::string::npos);
    REQUIRE(chain.find("conflicts with: y") != std::string::npos);
    REQUIRE(chain.find("layout: seedbed.layout") != std::string::npos);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

namespace {

Result<std::uint32_t> parse_offset(std::int64_t raw) {
    if (raw < 0) {
        return Error(ErrorCode::ValidationError, "offset must not be negative");
    }
    return static_cast<std::uint32_t>(raw);
}

} // namespace

TEST_CASE("Result carries a value or an error", "[core][result]") {
    auto good = parse_offset(12);
    REQUIRE(good);
    REQUIRE(*good == 12u);
    REQUIRE(good.value_or(99) == 12u);

    auto bad = parse_offset(-4);
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code() == ErrorCode::ValidationError);
    REQUIRE(bad.value_or(99) == 99u);
    REQUIRE_THROWS_AS(bad.unwrap(), std::runtime_error);

    Result<void> done = Ok();
    REQUIRE(done.is_ok());

    Result<void> refused = Err(Error(StoreError::limit_exceeded("title", "string length")));
    REQUIRE(refused.error().code() == ErrorCode::LimitExceeded);
}

TEST_CASE("Result moves owned values out", "[core][result]") {
    Result<std::vector<std::uint8_t>> bytes = Ok(std::vector<std::uint8_t>{0, 97, 115, 109});
    auto taken = std::move(bytes).unwrap();
    REQUIRE(taken.size() == 4);
    REQUIRE(taken[1] == 97);
}

TEST_CASE("Result map and and_then", "[core][result]") {
    auto end_of = [](std::uint32_t offset) { return offset + 4; };

    REQUIRE(parse_offset(8).map(end_of).value() == 12u);

    auto failed = parse_offset(-1).map(end_of);
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().code() == ErrorCode::ValidationError);

    auto named = parse_offset(3).and_then([](std::uint32_t offset) -> Result<std::string> {
        return Ok("@" + std::to_string(offset));
    });
    REQUIRE(named.value() == "@3");

    auto skipped = parse_offset(-3).and_then([](std::uint32_t) -> Result<std::string> {
        return Ok(std::string("unreachable"));
    });
    REQUIRE(skipped.is_err());
}

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();
    debug::record_error(Error(SandboxError::not_instantiated()));
    debug::record_error(Error("plain"));
    REQUIRE(debug::total_error_count() == 2);
    REQUIRE(debug::error_stats_summary().find("Sandbox: 1") != std::string::npos);
    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}
