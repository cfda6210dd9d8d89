/// @file main.cpp
/// @brief seedbed_preview entry point - loads a module and drives its state
///
/// Loads a WebAssembly module into a RuntimeInstance, optionally seeds the
/// store from a JSON file, invokes exported functions and runs the timer
/// loop for a while before printing the final store as JSON.

#include <seedbed/core/diagnostics.hpp>
#include <seedbed/core/log.hpp>
#include <seedbed/runtime/config.hpp>
#include <seedbed/runtime/runtime.hpp>
#include <seedbed/state/timer.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct Options {
    fs::path module_path;
    fs::path state_path;
    fs::path config_path;
    std::vector<std::string> calls;
    long run_ms = 0;
    bool watch = false;
};

std::optional<std::vector<std::uint8_t>> read_binary(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::optional<std::string> read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] MODULE_PATH\n"
              << "\n"
              << "Arguments:\n"
              << "  MODULE_PATH        WebAssembly module to load\n"
              << "\n"
              << "Options:\n"
              << "  --state FILE       Seed the store from a JSON object\n"
              << "  --config FILE      Runtime configuration (TOML)\n"
              << "  --call NAME        Call an exported function (repeatable)\n"
              << "  --run-ms N         Keep the timer loop running for N milliseconds\n"
              << "  --watch            Log every delivered change\n"
              << "  --help, -h         Show this help message\n"
              << "  --version, -v      Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " counter.wasm --call increment --call increment\n"
              << "  " << program_name << " counter.wasm --state seed.json --run-ms 500\n";
}

void print_version() {
    std::cout << "seedbed_preview 0.1.0\n"
              << "seedbed reactive state runtime\n";
}

} // namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    Options options;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (arg == "--watch") {
            options.watch = true;
        } else if (arg == "--state" || arg == "--config" || arg == "--call" || arg == "--run-ms") {
            auto value = next();
            if (!value) {
                print_usage(argv[0]);
                return 1;
            }
            if (arg == "--state") {
                options.state_path = *value;
            } else if (arg == "--config") {
                options.config_path = *value;
            } else if (arg == "--call") {
                options.calls.push_back(*value);
            } else {
                try {
                    options.run_ms = std::stol(*value);
                } catch (const std::exception&) {
                    std::cerr << "Invalid --run-ms value: " << *value << "\n";
                    return 1;
                }
            }
        } else if (arg[0] != '-') {
            options.module_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (options.module_path.empty()) {
        std::cerr << "Error: No module specified.\n\n";
        print_usage(argv[0]);
        return 1;
    }

    // Configuration
    seedbed_runtime::RuntimeConfig config;
    if (!options.config_path.empty()) {
        auto loaded = seedbed_runtime::RuntimeConfig::load(options.config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().message() << "\n";
            return 1;
        }
        config = std::move(loaded).unwrap();
    }
    seedbed_core::configure_logging(config.logging);

    // Initial state
    seedbed_state::ValueObject initial_state;
    if (!options.state_path.empty()) {
        auto text = read_text(options.state_path);
        if (!text) {
            SEEDBED_LOG_ERROR("Cannot read state file: {}", options.state_path.string());
            return 1;
        }
        try {
            auto j = nlohmann::json::parse(*text);
            if (!j.is_object()) {
                SEEDBED_LOG_ERROR("State file must contain a JSON object");
                return 1;
            }
            auto state = j.get<seedbed_state::Value>();
            if (!state.is_object()) {
                SEEDBED_LOG_ERROR("State file must contain a JSON object");
                return 1;
            }
            initial_state = state.as_object();
        } catch (const nlohmann::json::exception& e) {
            SEEDBED_LOG_ERROR("Failed to parse state file: {}", e.what());
            return 1;
        }
    }

    auto bytecode = read_binary(options.module_path);
    if (!bytecode) {
        SEEDBED_LOG_ERROR("Cannot read module: {}", options.module_path.string());
        return 1;
    }

    seedbed_state::SteadyTimerQueue timers;
    seedbed_core::LogDiagnostics diagnostics;
    seedbed_runtime::RuntimeInstance runtime(
        seedbed_runtime::RuntimeContext{timers, &diagnostics, {}}, config);

    SEEDBED_LOG_INFO("Loading module: {} ({} bytes)", options.module_path.string(), bytecode->size());
    auto loaded = runtime.load(*bytecode, initial_state);
    if (!loaded) {
        SEEDBED_LOG_ERROR("Failed to load module: {}", loaded.error().message());
        return 1;
    }

    std::vector<seedbed_state::Subscription> subscriptions;
    if (options.watch) {
        for (const auto& [key, value] : runtime.store().snapshot()) {
            subscriptions.push_back(runtime.watch(key, [](const std::string& k, const seedbed_state::Value& v) {
                SEEDBED_LOG_INFO("  {} = {}", k, seedbed_state::to_display_string(v));
            }));
        }
    }

    int exit_code = 0;
    for (const auto& name : options.calls) {
        auto result = runtime.call_function(name);
        if (!result) {
            SEEDBED_LOG_ERROR("Call '{}' failed: {}", name, result.error().message());
            exit_code = 1;
            continue;
        }
        SEEDBED_LOG_INFO("Call '{}' returned {}", name, seedbed_state::to_display_string(*result));
        runtime.flush();
    }

    if (options.run_ms > 0) {
        timers.run_for(std::chrono::milliseconds(options.run_ms));
    }
    runtime.flush();

    std::cout << runtime.snapshot_json(2) << "\n";
    SEEDBED_LOG_DEBUG("Stats: {}", runtime.get_stats().to_json().dump());

    runtime.dispose();
    seedbed_core::shutdown_logging();
    return exit_code;
}
