#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"
#include "balance_book.hpp"
#include "trade_executor.hpp"
#include "venue/lending_pool.hpp"

namespace arbx {

// State of the one flash loan the engine has in flight
struct PendingFlashLoan {
    Opportunity opportunity;
    FlashLoanRequest request;
    std::string params_digest;        // sha256 of the params sent to the pool
    // Runs once the trade is done and before repayment is approved; throwing
    // unwinds the loan. Returns how much of the borrowed asset it spent.
    std::function<double(const TradeResult& trade, double fee)> settle;
    std::optional<TradeResult> trade;
    std::vector<double> fees;
    double settlement_spent = 0.0;
    bool repayment_approved = false;
};

// Entry point the lending pool calls mid-sequence. It trades the borrowed
// funds, settles the proceeds and approves principal + fee for every asset,
// or throws so that the pool unwinds the whole loan. It never returns
// success with a shortfall.
class FlashLoanCallback : public FlashLoanReceiver {
public:
    FlashLoanCallback(const Address& lending_pool, const Address& self,
                      TradeExecutor& executor, BalanceBook& balances);

    bool on_loan_received(const Address& caller,
                          const std::vector<Address>& assets,
                          const std::vector<double>& amounts,
                          const std::vector<double>& fees,
                          const Address& initiator,
                          const std::string& params) override;

    void arm(PendingFlashLoan* pending) { pending_ = pending; }
    void disarm() { pending_ = nullptr; }
    bool is_armed() const { return pending_ != nullptr; }

    static std::string encode_params(const Opportunity& opportunity);
    // Throws ValidationError on malformed params
    static Opportunity decode_params(const std::string& params);

private:
    void verify_loan_terms(const std::vector<Address>& assets,
                           const std::vector<double>& amounts,
                           const std::vector<double>& fees,
                           const Opportunity& opportunity) const;

    Address lending_pool_;
    Address self_;
    TradeExecutor& executor_;
    BalanceBook& balances_;
    PendingFlashLoan* pending_ = nullptr;
};

// Arms the callback for the lifetime of one flash attempt
class ArmedFlashLoan {
public:
    ArmedFlashLoan(FlashLoanCallback& callback, PendingFlashLoan& pending)
        : callback_(callback) {
        callback_.arm(&pending);
    }
    ~ArmedFlashLoan() { callback_.disarm(); }

    ArmedFlashLoan(const ArmedFlashLoan&) = delete;
    ArmedFlashLoan& operator=(const ArmedFlashLoan&) = delete;

private:
    FlashLoanCallback& callback_;
};

} // namespace arbx
