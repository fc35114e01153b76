#include "profit_ledger.hpp"
#include "exceptions.hpp"

namespace arbx {

void ProfitLedger::record(const SettledTrade& trade) {
    if (!(trade.profit >= 0.0)) {
        throw ValidationError("ledger rejects negative profit " + std::to_string(trade.profit));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    total_profit_ += trade.profit;
    trades_.push_back(trade);
}

double ProfitLedger::total_profit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_profit_;
}

size_t ProfitLedger::settled_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_.size();
}

std::vector<SettledTrade> ProfitLedger::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_;
}

} // namespace arbx
