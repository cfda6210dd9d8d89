#pragma once

/// @file transaction.hpp
/// @brief Scoped batching of store writes

#include "scheduler.hpp"

#include <utility>

namespace seedbed_state {

/// RAII transaction scope
///
/// While any Transaction is open the scheduler does not run timed ticks.
/// Closing the outermost scope flushes once, also during stack unwinding.
/// Writes are not rolled back on failure.
class Transaction {
public:
    explicit Transaction(BatchScheduler& scheduler)
        : m_scheduler(&scheduler) {
        m_scheduler->begin_transaction();
    }

    ~Transaction() {
        commit();
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Transaction(Transaction&& other) noexcept
        : m_scheduler(std::exchange(other.m_scheduler, nullptr)) {}
    Transaction& operator=(Transaction&&) = delete;

    /// Close the scope early
    void commit() {
        if (m_scheduler) {
            std::exchange(m_scheduler, nullptr)->end_transaction();
        }
    }

private:
    BatchScheduler* m_scheduler;
};

/// Run fn inside a transaction; exceptions from fn propagate after the flush
template<typename F>
decltype(auto) transaction(BatchScheduler& scheduler, F&& fn) {
    Transaction scope(scheduler);
    return std::forward<F>(fn)();
}

} // namespace seedbed_state
