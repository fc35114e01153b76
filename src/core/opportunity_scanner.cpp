#include "opportunity_scanner.hpp"
#include "venue/venue_exception.hpp"
#include "utils/logger.hpp"

namespace arbx {

OpportunityScanner::OpportunityScanner(const RiskGate& risk_gate, SwapRouter& router, PriceFeed& price_feed,
                                       const ExecutionSettings& settings, const Address& gas_token)
    : risk_gate_(risk_gate), router_(router), price_feed_(price_feed),
      settings_(settings), gas_token_(gas_token) {}

std::optional<Opportunity> OpportunityScanner::find_opportunity(double amount, const ScanContext& context) {
    return scan(std::nullopt, amount, context);
}

std::optional<Opportunity> OpportunityScanner::find_opportunity_from(const Address& token, double amount,
                                                                     const ScanContext& context) {
    return scan(token, amount, context);
}

std::vector<std::pair<Address, Address>> OpportunityScanner::candidate_pairs() const {
    std::vector<std::pair<Address, Address>> pairs;
    const auto tokens = risk_gate_.monitored_tokens();
    for (const auto& token_x : tokens) {
        if (!risk_gate_.is_eligible(token_x)) {
            continue;
        }
        for (const auto& token_y : tokens) {
            if (token_x == token_y || !risk_gate_.is_eligible(token_y)) {
                continue;
            }
            pairs.emplace_back(token_x, token_y);
        }
    }
    return pairs;
}

std::optional<Opportunity> OpportunityScanner::scan(const std::optional<Address>& from, double amount,
                                                    const ScanContext& context) {
    price_cache_.clear();
    const double threshold = risk_gate_.config().profit_threshold;

    for (const auto& [token_x, token_y] : candidate_pairs()) {
        if (from && token_x != *from) {
            continue;
        }

        auto candidate = evaluate_pair(token_x, token_y, amount, context);
        if (!candidate) {
            continue;
        }

        ARBX_LOG_DEBUG("Pair {} -> {} expected profit {} (threshold {})",
                       address::shorten(token_x), address::shorten(token_y),
                       candidate->expected_profit, threshold);

        if (candidate->expected_profit > threshold) {
            utils::TradingLogger::log_opportunity(token_x, token_y, amount, candidate->expected_profit);
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<Opportunity> OpportunityScanner::evaluate_pair(const Address& token_x, const Address& token_y,
                                                             double amount, const ScanContext& context) {
    double intermediate = 0.0;
    double returned = 0.0;
    try {
        const double liquidity_threshold = risk_gate_.config().liquidity_threshold;
        if (liquidity_threshold > 0.0) {
            double depth = router_.get_liquidity(token_x, token_y) * price_of(token_x);
            if (depth < liquidity_threshold) {
                ARBX_LOG_DEBUG("Pair {} -> {} skipped: liquidity {} below {}",
                               address::shorten(token_x), address::shorten(token_y),
                               depth, liquidity_threshold);
                return std::nullopt;
            }
        }

        intermediate = router_.get_amount_out(amount, token_x, token_y);
        if (intermediate <= 0.0) {
            return std::nullopt;
        }
        returned = router_.get_amount_out(intermediate, token_y, token_x);
    } catch (const VenueException& e) {
        ARBX_LOG_DEBUG("Pair {} -> {} has no quote: {}",
                       address::shorten(token_x), address::shorten(token_y), e.what());
        return std::nullopt;
    }

    const double price_x = price_of(token_x);
    Opportunity opportunity;
    opportunity.token_in = token_x;
    opportunity.token_out = token_y;
    opportunity.amount = amount;
    opportunity.expected_intermediate = intermediate;
    opportunity.expected_return = returned;
    opportunity.expected_profit = (returned - amount) * price_x
                                  - gas_cost(context.gas_price)
                                  - amount * context.loan_premium * price_x;
    return opportunity;
}

double OpportunityScanner::gas_cost(double gas_price) {
    if (settings_.gas_units_per_swap <= 0.0 || gas_price <= 0.0) {
        return 0.0;
    }
    // gwei -> native units, valued at the gas token price
    return gas_price * settings_.gas_units_per_swap * 2.0 * 1e-9 * price_of(gas_token_);
}

double OpportunityScanner::price_of(const Address& token) {
    auto it = price_cache_.find(token);
    if (it != price_cache_.end()) {
        return it->second;
    }
    double price = price_feed_.get_price(token);
    price_cache_[token] = price;
    return price;
}

} // namespace arbx
