/// @file config.cpp
/// @brief RuntimeConfig TOML loading

#include <seedbed/runtime/config.hpp>

#include <toml++/toml.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace seedbed_runtime {

using seedbed_core::Error;
using seedbed_core::ErrorCode;
using seedbed_core::Result;

namespace {

Error invalid(const std::string& message) {
    return Error(ErrorCode::ValidationError, message);
}

/// Non-negative integer field, or an error naming the offending key
Result<std::optional<std::uint64_t>> read_count(const toml::table& tbl, const char* section, const char* key) {
    auto node = tbl[key];
    if (!node) {
        return std::optional<std::uint64_t>{};
    }
    auto value = node.value<std::int64_t>();
    if (!value || *value < 0) {
        return invalid(std::string("[") + section + "] " + key + " must be a non-negative integer");
    }
    return std::optional<std::uint64_t>{static_cast<std::uint64_t>(*value)};
}

Result<void> parse_scheduler(const toml::table& tbl, RuntimeConfig& config) {
    auto tick = read_count(tbl, "scheduler", "tick_interval_ms");
    if (!tick) return tick.error();
    if (*tick) {
        config.scheduler.tick_interval = std::chrono::milliseconds(**tick);
    }

    auto rounds = read_count(tbl, "scheduler", "max_flush_rounds");
    if (!rounds) return rounds.error();
    if (*rounds) {
        if (**rounds == 0) {
            return invalid("[scheduler] max_flush_rounds must be at least 1");
        }
        config.scheduler.max_flush_rounds = static_cast<std::size_t>(**rounds);
    }
    return seedbed_core::Ok();
}

Result<void> parse_store(const toml::table& tbl, RuntimeConfig& config) {
    if (auto preset = tbl["limits"].value<std::string>()) {
        if (*preset == "sandboxed") {
            config.store_limits = seedbed_state::StoreLimits::sandboxed();
        } else if (*preset == "unlimited") {
            config.store_limits = seedbed_state::StoreLimits::unlimited();
        } else {
            return invalid("[store] limits must be \"sandboxed\" or \"unlimited\", got \"" + *preset + "\"");
        }
    }

    struct Field {
        const char* key;
        std::size_t* target;
    };
    const Field fields[] = {
        {"max_key_length", &config.store_limits.max_key_length},
        {"max_string_length", &config.store_limits.max_string_length},
        {"max_array_length", &config.store_limits.max_array_length},
        {"max_object_fields", &config.store_limits.max_object_fields},
    };
    for (const auto& field : fields) {
        auto value = read_count(tbl, "store", field.key);
        if (!value) return value.error();
        if (*value) {
            *field.target = static_cast<std::size_t>(**value);
        }
    }
    return seedbed_core::Ok();
}

Result<void> parse_sandbox(const toml::table& tbl, RuntimeConfig& config) {
    auto fuel = read_count(tbl, "sandbox", "fuel_limit");
    if (!fuel) return fuel.error();
    if (*fuel) config.sandbox.fuel_limit = **fuel;

    auto pages = read_count(tbl, "sandbox", "max_memory_pages");
    if (!pages) return pages.error();
    if (*pages) {
        if (**pages > 65536) {
            return invalid("[sandbox] max_memory_pages cannot exceed 65536");
        }
        config.sandbox.max_memory_pages = static_cast<std::size_t>(**pages);
    }

    auto depth = read_count(tbl, "sandbox", "max_call_depth");
    if (!depth) return depth.error();
    if (*depth) config.sandbox.max_call_depth = static_cast<std::size_t>(**depth);

    auto poll = read_count(tbl, "sandbox", "poll_interval_ms");
    if (!poll) return poll.error();
    if (*poll) {
        if (**poll == 0) {
            return invalid("[sandbox] poll_interval_ms must be positive");
        }
        config.bridge.poll_interval = std::chrono::milliseconds(**poll);
    }

    config.bridge.enable_polling = tbl["polling"].value_or(config.bridge.enable_polling);
    config.bridge.initializer = tbl["initializer"].value_or(config.bridge.initializer);
    config.bridge.layout_section = tbl["layout_section"].value_or(config.bridge.layout_section);
    return seedbed_core::Ok();
}

Result<void> parse_logging(const toml::table& tbl, RuntimeConfig& config) {
    if (auto level = tbl["level"].value<std::string>()) {
        auto parsed = seedbed_core::parse_log_level(*level);
        if (!parsed) {
            return invalid("[logging] unknown level \"" + *level + "\"");
        }
        config.logging.level = *parsed;
    }
    config.logging.console_enabled = tbl["console"].value_or(config.logging.console_enabled);
    config.logging.file_enabled = tbl["file"].value_or(config.logging.file_enabled);
    config.logging.log_directory = tbl["directory"].value_or(config.logging.log_directory);

    if (auto levels = tbl["levels"].as_table()) {
        for (const auto& [name, node] : *levels) {
            auto subsystem = seedbed_core::parse_subsystem(name.str());
            if (!subsystem) {
                return invalid("[logging.levels] unknown subsystem \"" + std::string(name.str()) + "\"");
            }
            auto text = node.value<std::string>();
            auto parsed = text ? seedbed_core::parse_log_level(*text) : std::nullopt;
            if (!parsed) {
                return invalid("[logging.levels] " + std::string(name.str()) + " needs a level name");
            }
            config.logging.subsystem_levels[*subsystem] = *parsed;
        }
    }
    return seedbed_core::Ok();
}

Result<void> parse_bindings(const toml::array& arr, RuntimeConfig& config) {
    for (std::size_t i = 0; i < arr.size(); ++i) {
        const auto* entry = arr[i].as_table();
        const std::string where = "[[bindings]] entry " + std::to_string(i);
        if (!entry) {
            return invalid(where + " must be a table");
        }

        auto key = (*entry)["key"].value<std::string>();
        if (!key) {
            return invalid(where + " needs a string key");
        }
        auto offset = (*entry)["offset"].value<std::int64_t>();
        if (!offset || *offset < 0) {
            return invalid(where + " needs a non-negative offset");
        }
        auto type = (*entry)["type"].value<std::string>();
        if (!type) {
            type = (*entry)["encoding"].value<std::string>();
        }
        if (!type) {
            return invalid(where + " needs a type");
        }

        std::optional<std::size_t> width;
        if (auto w = (*entry)["width"].value<std::int64_t>()) {
            if (*w <= 0) {
                return invalid(where + " has an invalid width");
            }
            width = static_cast<std::size_t>(*w);
        }

        auto binding = seedbed_bridge::make_binding(*key, static_cast<std::size_t>(*offset), *type, width);
        if (!binding) {
            return binding.error();
        }
        config.bridge.bindings.push_back(std::move(*binding));
    }
    return seedbed_core::Ok();
}

Result<RuntimeConfig> from_table(const toml::table& tbl) {
    RuntimeConfig config;

    if (auto section = tbl["scheduler"].as_table()) {
        auto parsed = parse_scheduler(*section, config);
        if (!parsed) return parsed.error();
    }
    if (auto section = tbl["store"].as_table()) {
        auto parsed = parse_store(*section, config);
        if (!parsed) return parsed.error();
    }
    if (auto section = tbl["sandbox"].as_table()) {
        auto parsed = parse_sandbox(*section, config);
        if (!parsed) return parsed.error();
    }
    if (auto section = tbl["logging"].as_table()) {
        auto parsed = parse_logging(*section, config);
        if (!parsed) return parsed.error();
    }
    if (auto bindings = tbl["bindings"].as_array()) {
        auto parsed = parse_bindings(*bindings, config);
        if (!parsed) return parsed.error();
    }
    return config;
}

} // namespace

Result<RuntimeConfig> RuntimeConfig::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error(ErrorCode::NotFound, "Config file not found: " + path.string());
    }
    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error(ErrorCode::ParseError, "Failed to parse " + path.string() + ": " + std::string(err.what()));
    }
}

Result<RuntimeConfig> RuntimeConfig::parse_string(std::string_view text) {
    try {
        auto tbl = toml::parse(text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error(ErrorCode::ParseError, "Failed to parse config: " + std::string(err.what()));
    }
}

} // namespace seedbed_runtime
