/// @file error.cpp
/// @brief Error naming, chain formatting and per-kind statistics

#include <seedbed/core/error.hpp>
#include <array>
#include <atomic>
#include <sstream>
#include <vector>

namespace seedbed_core {

namespace {

// Indexed by ErrorCode
constexpr std::array<const char*, 19> k_code_names = {
    "Unknown", "NotFound", "AlreadyExists", "InvalidArgument", "InvalidState",
    "IOError", "ParseError", "ValidationError", "TypeMismatch", "LimitExceeded",
    "CycleDetected", "LoadFailed", "BindingFailed", "ComputeFailed", "CallbackFailed",
    "Trap", "OutOfMemory", "Timeout", "NotSupported",
};
static_assert(k_code_names.size() == static_cast<std::size_t>(ErrorCode::NotSupported) + 1);

} // namespace

const char* error_code_name(ErrorCode code) {
    auto index = static_cast<std::size_t>(code);
    return index < k_code_names.size() ? k_code_names[index] : "Unknown";
}

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_store_error(const StoreError& err) {
    std::ostringstream oss;
    oss << "[StoreError] " << err.message;
    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }
    return oss.str();
}

std::string format_cycle_error(const CycleError& err) {
    std::ostringstream oss;
    oss << "[CycleError] " << err.message;
    if (!err.path.empty()) {
        oss << " (path length: " << err.path.size() << ")";
    }
    return oss.str();
}

std::string format_load_error(const LoadError& err) {
    return "[LoadError] " + err.message;
}

std::string format_binding_error(const BindingError& err) {
    std::ostringstream oss;
    oss << "[BindingError] " << err.message;
    if (!err.other_key.empty() && err.other_key != err.key) {
        oss << " (conflicts with: " << err.other_key << ")";
    }
    return oss.str();
}

std::string format_compute_error(const ComputeError& err) {
    return "[ComputeError] " + err.message;
}

std::string format_watcher_error(const WatcherError& err) {
    return "[WatcherError] " + err.message;
}

std::string format_sandbox_error(const SandboxError& err) {
    std::ostringstream oss;
    oss << "[SandboxError] " << err.message;
    if (!err.function.empty()) {
        oss << " (function: " << err.function << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, StoreError>) {
            oss << detail::format_store_error(err);
        } else if constexpr (std::is_same_v<T, CycleError>) {
            oss << detail::format_cycle_error(err);
        } else if constexpr (std::is_same_v<T, LoadError>) {
            oss << detail::format_load_error(err);
        } else if constexpr (std::is_same_v<T, BindingError>) {
            oss << detail::format_binding_error(err);
        } else if constexpr (std::is_same_v<T, ComputeError>) {
            oss << detail::format_compute_error(err);
        } else if constexpr (std::is_same_v<T, WatcherError>) {
            oss << detail::format_watcher_error(err);
        } else if constexpr (std::is_same_v<T, SandboxError>) {
            oss << detail::format_sandbox_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint32_t, Error>;
template class Result<std::uint64_t, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

namespace {

constexpr std::size_t k_kind_count = std::variant_size_v<Error::Variant>;

// Indexed like Error::Variant
constexpr std::array<const char*, k_kind_count> k_kind_labels = {
    "Store", "Cycle", "Load", "Binding", "Compute", "Watcher", "Sandbox", "Generic",
};

struct ErrorStats {
    std::atomic<std::uint64_t> total{0};
    std::array<std::atomic<std::uint64_t>, k_kind_count> by_kind{};
};

ErrorStats& stats() {
    static ErrorStats instance;
    return instance;
}

} // namespace

void record_error(const Error& error) {
    auto& s = stats();
    s.total.fetch_add(1, std::memory_order_relaxed);
    s.by_kind[error.variant().index()].fetch_add(1, std::memory_order_relaxed);
}

std::uint64_t total_error_count() {
    return stats().total.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    auto& s = stats();
    s.total.store(0, std::memory_order_relaxed);
    for (auto& counter : s.by_kind) {
        counter.store(0, std::memory_order_relaxed);
    }
}

std::string error_stats_summary() {
    const auto& s = stats();
    std::ostringstream oss;
    oss << "Error Statistics:\n  Total: " << s.total.load() << "\n";
    for (std::size_t i = 0; i < k_kind_count; ++i) {
        oss << "  " << k_kind_labels[i] << ": " << s.by_kind[i].load() << "\n";
    }
    return oss.str();
}

} // namespace debug

} // namespace seedbed_core
