#pragma once

/// @file computed.hpp
/// @brief Values derived from other store keys

#include "fwd.hpp"
#include "scheduler.hpp"
#include "store.hpp"
#include <seedbed/core/error.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace seedbed_core { class DiagnosticsSink; }

namespace seedbed_state {

/// Derivation function; reads its dependencies from the store
using ComputeFn = std::function<Value(const Store&)>;

/// Registered derivation
struct ComputedDescriptor {
    std::string key;
    ComputeFn compute;
    std::vector<std::string> dependencies;
    WatchHandle watcher;
    std::uint64_t evaluations = 0;
    std::uint64_t failures = 0;
};

/// Owns computed descriptors and keeps their keys in sync
///
/// A descriptor is evaluated once at registration and again whenever one of
/// its dependencies is delivered by the scheduler. Evaluation happens inside
/// the delivering flush, so chains of computed values settle in one tick.
class ComputedEngine {
public:
    ComputedEngine(Store& store, BatchScheduler& scheduler, seedbed_core::DiagnosticsSink* diagnostics = nullptr);
    ~ComputedEngine();

    ComputedEngine(const ComputedEngine&) = delete;
    ComputedEngine& operator=(const ComputedEngine&) = delete;

    /// Register key = compute(store) over dependencies
    ///
    /// Fails with CycleError if key is reachable from its dependencies through
    /// other computed keys, ComputeError::AlreadyDefined if key is already
    /// computed, or a StoreError if the first result cannot be stored. A throw
    /// from the first evaluation is reported and the descriptor stays
    /// registered.
    seedbed_core::Result<void> define(const std::string& key, ComputeFn compute,
                                      std::vector<std::string> dependencies);

    /// Unregister; false if key is not computed
    bool remove(const std::string& key);

    /// Re-run one descriptor now
    seedbed_core::Result<bool> recompute(const std::string& key);

    [[nodiscard]] bool is_computed(const std::string& key) const;
    [[nodiscard]] std::size_t size() const noexcept { return m_descriptors.size(); }
    [[nodiscard]] const ComputedDescriptor* find(const std::string& key) const;

    /// Dependency path from `from` back to `to` through computed keys, if any
    [[nodiscard]] std::vector<std::string> find_path(const std::string& from, const std::string& to) const;

    /// Drop every descriptor and its watchers
    void clear();

private:
    /// Evaluate and store; reports failures
    seedbed_core::Result<bool> evaluate(ComputedDescriptor& descriptor);

    void report(const seedbed_core::Error& error);

    Store& m_store;
    BatchScheduler& m_scheduler;
    seedbed_core::DiagnosticsSink* m_diagnostics;
    std::map<std::string, ComputedDescriptor> m_descriptors;
};

} // namespace seedbed_state
