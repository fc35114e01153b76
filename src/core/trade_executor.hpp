#pragma once

#include "types.hpp"
#include "risk_gate.hpp"
#include "balance_book.hpp"
#include "venue/swap_router.hpp"

namespace arbx {

// Moves value through the router. Every leg carries an explicit, strictly
// positive minimum output; a leg that reverts or under-delivers raises
// CollaboratorError and leaves the rollback to the enclosing attempt.
class TradeExecutor {
public:
    TradeExecutor(const RiskGate& risk_gate, SwapRouter& router, BalanceBook& balances,
                  const ExecutionSettings& settings);
    virtual ~TradeExecutor() = default;

    // Round trip from the executor's own funds. The second leg must return
    // at least amount + required_profit (token_in units).
    virtual TradeResult execute(const Opportunity& opportunity, double required_profit);

    // Round trip with borrowed funds already credited. Only slippage bounds
    // the legs here; solvency is checked against the loan by the callback.
    virtual TradeResult execute_borrowed(const Opportunity& opportunity);

    // Single swap used by the super-profit overlay
    virtual double convert(const Address& token_in, const Address& token_out,
                           double amount, double min_amount_out);

    const ExecutionSettings& settings() const { return settings_; }

private:
    TradeResult round_trip(const Opportunity& opportunity, double min_return);
    double swap_leg(const Address& token_in, const Address& token_out,
                    double amount_in, double min_amount_out);
    void require_eligible(const Opportunity& opportunity) const;

    const RiskGate& risk_gate_;
    SwapRouter& router_;
    BalanceBook& balances_;
    ExecutionSettings settings_;
};

} // namespace arbx
