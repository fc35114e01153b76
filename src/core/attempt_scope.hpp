#pragma once

#include <atomic>
#include <utility>
#include <vector>
#include "balance_book.hpp"
#include "venue/atomic_sequence.hpp"

namespace arbx {

// Holds the in-progress flag for one attempt. acquired() is false when
// another attempt (another thread, or a nested trigger) already holds it.
class AttemptGuard {
public:
    explicit AttemptGuard(std::atomic<bool>& flag)
        : flag_(flag), acquired_(!flag.exchange(true, std::memory_order_acq_rel)) {}

    ~AttemptGuard() {
        if (acquired_) {
            flag_.store(false, std::memory_order_release);
        }
    }

    AttemptGuard(const AttemptGuard&) = delete;
    AttemptGuard& operator=(const AttemptGuard&) = delete;

    bool acquired() const { return acquired_; }

private:
    std::atomic<bool>& flag_;
    bool acquired_;
};

// Balance snapshot taken at Scanning entry, plus an open sequence on every
// venue the attempt may move. Unless commit() is reached the book and the
// venues are put back exactly as they were.
class AttemptScope {
public:
    AttemptScope(BalanceBook& balances, std::vector<AtomicSequence*> venues)
        : balances_(balances), snapshot_(balances.snapshot()), venues_(std::move(venues)) {
        for (AtomicSequence* venue : venues_) {
            venue->begin_sequence();
        }
    }

    ~AttemptScope() {
        if (!committed_) {
            rollback();
        }
    }

    AttemptScope(const AttemptScope&) = delete;
    AttemptScope& operator=(const AttemptScope&) = delete;

    void commit() {
        for (AtomicSequence* venue : venues_) {
            venue->commit_sequence();
        }
        committed_ = true;
    }

    void rollback() {
        committed_ = true;
        for (auto it = venues_.rbegin(); it != venues_.rend(); ++it) {
            (*it)->revert_sequence();
        }
        balances_.restore(snapshot_);
    }

private:
    BalanceBook& balances_;
    BalanceBook::Snapshot snapshot_;
    std::vector<AtomicSequence*> venues_;
    bool committed_ = false;
};

} // namespace arbx
