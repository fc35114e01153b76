#include "trade_executor.hpp"
#include "exceptions.hpp"
#include "venue/venue_exception.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>

namespace arbx {

TradeExecutor::TradeExecutor(const RiskGate& risk_gate, SwapRouter& router, BalanceBook& balances,
                             const ExecutionSettings& settings)
    : risk_gate_(risk_gate), router_(router), balances_(balances), settings_(settings) {}

TradeResult TradeExecutor::execute(const Opportunity& opportunity, double required_profit) {
    require_eligible(opportunity);

    const double slippage_floor = opportunity.expected_return * (1.0 - settings_.max_slippage);
    const double min_return = std::max(slippage_floor, opportunity.amount + std::max(0.0, required_profit));
    return round_trip(opportunity, min_return);
}

TradeResult TradeExecutor::execute_borrowed(const Opportunity& opportunity) {
    require_eligible(opportunity);
    return round_trip(opportunity, opportunity.expected_return * (1.0 - settings_.max_slippage));
}

double TradeExecutor::convert(const Address& token_in, const Address& token_out,
                              double amount, double min_amount_out) {
    if (amount <= 0.0) {
        throw ValidationError("conversion amount must be positive");
    }
    return swap_leg(token_in, token_out, amount, min_amount_out);
}

TradeResult TradeExecutor::round_trip(const Opportunity& opportunity, double min_return) {
    if (opportunity.amount <= 0.0) {
        throw ValidationError("trade amount must be positive");
    }

    TradeResult result;
    result.token_in = opportunity.token_in;
    result.token_out = opportunity.token_out;
    result.amount_in = opportunity.amount;

    const double min_intermediate = opportunity.expected_intermediate * (1.0 - settings_.max_slippage);
    result.intermediate_out = swap_leg(opportunity.token_in, opportunity.token_out,
                                       opportunity.amount, min_intermediate);
    result.amount_out = swap_leg(opportunity.token_out, opportunity.token_in,
                                 result.intermediate_out, min_return);

    ARBX_LOG_DEBUG("Round trip {} -> {}: in {} mid {} out {}",
                   address::shorten(result.token_in), address::shorten(result.token_out),
                   result.amount_in, result.intermediate_out, result.amount_out);
    return result;
}

double TradeExecutor::swap_leg(const Address& token_in, const Address& token_out,
                               double amount_in, double min_amount_out) {
    // Zero minimum would accept any output
    if (!(min_amount_out > 0.0) || !std::isfinite(min_amount_out)) {
        throw TradingError("refusing swap " + address::shorten(token_in) + " -> " +
                           address::shorten(token_out) + " without a positive minimum output");
    }

    balances_.debit(token_in, amount_in);

    double amount_out = 0.0;
    try {
        amount_out = router_.swap_exact_tokens_for_tokens(amount_in, min_amount_out,
                                                          token_in, token_out, balances_.owner());
    } catch (const VenueException& e) {
        throw CollaboratorError("swap " + address::shorten(token_in) + " -> " +
                                address::shorten(token_out) + " reverted: " + e.what());
    }

    if (!std::isfinite(amount_out) || amount_out < min_amount_out) {
        throw CollaboratorError("swap " + address::shorten(token_in) + " -> " +
                                address::shorten(token_out) + " returned " + std::to_string(amount_out) +
                                ", below minimum " + std::to_string(min_amount_out));
    }

    balances_.credit(token_out, amount_out);
    return amount_out;
}

void TradeExecutor::require_eligible(const Opportunity& opportunity) const {
    for (const auto& token : {opportunity.token_in, opportunity.token_out}) {
        if (!risk_gate_.is_eligible(token)) {
            throw RiskRejection("token " + token + " is not eligible for trading");
        }
    }
}

} // namespace arbx
