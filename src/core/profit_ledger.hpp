#pragma once

#include <mutex>
#include <string>
#include <vector>
#include "types.hpp"

namespace arbx {

struct SettledTrade {
    std::string attempt_id;
    Strategy strategy = Strategy::DIRECT;
    Address token_in;
    Address token_out;
    double amount = 0.0;
    double profit = 0.0;  // reference units
    long long settled_at = 0;
};

// Running total of realized profit. Only a committing attempt writes here,
// once, after every obligation of the attempt is met.
class ProfitLedger {
public:
    ProfitLedger() = default;

    // Throws ValidationError for negative profit; the total never decreases
    void record(const SettledTrade& trade);

    double total_profit() const;
    size_t settled_count() const;
    std::vector<SettledTrade> history() const;

private:
    mutable std::mutex mutex_;
    double total_profit_ = 0.0;
    std::vector<SettledTrade> trades_;
};

} // namespace arbx
