/// @file computed.cpp
/// @brief Computed value engine implementation

#include <seedbed/state/computed.hpp>
#include <seedbed/core/diagnostics.hpp>
#include <seedbed/core/log.hpp>

#include <algorithm>
#include <exception>
#include <optional>
#include <set>
#include <string>

namespace seedbed_state {

using seedbed_core::ComputeError;
using seedbed_core::CycleError;
using seedbed_core::Err;
using seedbed_core::Ok;

ComputedEngine::ComputedEngine(Store& store, BatchScheduler& scheduler, seedbed_core::DiagnosticsSink* diagnostics)
    : m_store(store)
    , m_scheduler(scheduler)
    , m_diagnostics(diagnostics) {}

ComputedEngine::~ComputedEngine() {
    clear();
}

bool ComputedEngine::is_computed(const std::string& key) const {
    return m_descriptors.find(key) != m_descriptors.end();
}

const ComputedDescriptor* ComputedEngine::find(const std::string& key) const {
    auto it = m_descriptors.find(key);
    return it != m_descriptors.end() ? &it->second : nullptr;
}

// =============================================================================
// Cycle detection
// =============================================================================

std::vector<std::string> ComputedEngine::find_path(const std::string& from, const std::string& to) const {
    // Depth-first over computed dependency edges
    std::vector<std::string> path;
    std::set<std::string> visited;

    std::function<bool(const std::string&)> visit = [&](const std::string& node) -> bool {
        path.push_back(node);
        if (node == to) {
            return true;
        }
        if (visited.insert(node).second) {
            auto it = m_descriptors.find(node);
            if (it != m_descriptors.end()) {
                for (const auto& dep : it->second.dependencies) {
                    if (visit(dep)) {
                        return true;
                    }
                }
            }
        }
        path.pop_back();
        return false;
    };

    if (visit(from)) {
        return path;
    }
    return {};
}

// =============================================================================
// Registration
// =============================================================================

seedbed_core::Result<void> ComputedEngine::define(const std::string& key, ComputeFn compute,
                                                  std::vector<std::string> dependencies) {
    if (m_store.is_disposed() || m_scheduler.is_disposed()) {
        return Err(seedbed_core::StoreError::disposed("register computed '" + key + "'"));
    }
    if (!compute) {
        return Err(seedbed_core::Error(seedbed_core::ErrorCode::InvalidArgument,
                                       "Computed '" + key + "' has no compute function"));
    }
    if (is_computed(key)) {
        return Err(ComputeError::already_defined(key));
    }

    // Dedupe while keeping first-seen order
    std::vector<std::string> deps;
    for (auto& dep : dependencies) {
        if (std::find(deps.begin(), deps.end(), dep) == deps.end()) {
            deps.push_back(std::move(dep));
        }
    }

    for (const auto& dep : deps) {
        if (dep == key) {
            return Err(CycleError::self_reference(key));
        }
        auto path = find_path(dep, key);
        if (!path.empty()) {
            path.insert(path.begin(), key);
            return Err(CycleError::cycle(key, std::move(path)));
        }
    }

    ComputedDescriptor descriptor;
    descriptor.key = key;
    descriptor.compute = std::move(compute);
    descriptor.dependencies = std::move(deps);

    // First evaluation goes through the normal write path
    auto first = evaluate(descriptor);
    if (!first && !first.error().is<ComputeError>()) {
        return Err(first.error());
    }

    std::string owner = key;
    descriptor.watcher = make_watch_handle([this, owner](const std::string&, const Value&) {
        auto result = recompute(owner);
        (void)result;  // failures already reported by evaluate()
    });

    auto [it, inserted] = m_descriptors.emplace(key, std::move(descriptor));
    for (const auto& dep : it->second.dependencies) {
        m_scheduler.watch(dep, it->second.watcher);
    }

    seedbed_core::store_logger()->debug("Computed '{}' registered over {} dependencies",
                                        key, it->second.dependencies.size());
    return Ok();
}

bool ComputedEngine::remove(const std::string& key) {
    auto it = m_descriptors.find(key);
    if (it == m_descriptors.end()) {
        return false;
    }
    for (const auto& dep : it->second.dependencies) {
        m_scheduler.unwatch(dep, it->second.watcher);
    }
    m_descriptors.erase(it);
    return true;
}

void ComputedEngine::clear() {
    if (!m_scheduler.is_disposed()) {
        for (auto& [key, descriptor] : m_descriptors) {
            for (const auto& dep : descriptor.dependencies) {
                m_scheduler.unwatch(dep, descriptor.watcher);
            }
        }
    }
    m_descriptors.clear();
}

// =============================================================================
// Evaluation
// =============================================================================

seedbed_core::Result<bool> ComputedEngine::recompute(const std::string& key) {
    auto it = m_descriptors.find(key);
    if (it == m_descriptors.end()) {
        return Err<bool>(seedbed_core::Error(seedbed_core::ErrorCode::NotFound, "No computed '" + key + "'"));
    }
    return evaluate(it->second);
}

seedbed_core::Result<bool> ComputedEngine::evaluate(ComputedDescriptor& descriptor) {
    ++descriptor.evaluations;

    Value value;
    std::optional<std::string> failure;
    try {
        value = descriptor.compute(m_store);
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "unknown exception";
    }
    if (failure) {
        ++descriptor.failures;
        seedbed_core::Error error = ComputeError::evaluation_failed(descriptor.key, *failure);
        report(error);
        return Err<bool>(std::move(error));
    }

    auto written = m_store.set(descriptor.key, std::move(value));
    if (!written) {
        ++descriptor.failures;
        seedbed_core::Error error = ComputeError::write_rejected(descriptor.key, written.error().message());
        report(error);
        // Surface the store's own error to define() callers
        return Err<bool>(written.error());
    }
    return written;
}

void ComputedEngine::report(const seedbed_core::Error& error) {
    seedbed_core::debug::record_error(error);
    seedbed_core::store_logger()->warn("{}", error.message());
    if (m_diagnostics) {
        m_diagnostics->report_error("computed", error);
    }
}

} // namespace seedbed_state
