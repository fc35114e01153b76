#pragma once

#include <map>
#include <optional>
#include <utility>
#include <vector>
#include "types.hpp"
#include "risk_gate.hpp"
#include "price_feed.hpp"
#include "venue/swap_router.hpp"

namespace arbx {

// Per-attempt inputs to pricing
struct ScanContext {
    double gas_price = 0.0;      // gwei, read once at admission
    double loan_premium = 0.0;   // fraction of principal, flash path only
};

// Walks the monitored set as an ordered product: outer loop over token X,
// inner loop over token Y, both in insertion order, skipping X == Y and any
// pair with an ineligible token. The first pair whose round trip X -> Y -> X
// beats the profit threshold wins; later pairs are not priced at all.
class OpportunityScanner {
public:
    OpportunityScanner(const RiskGate& risk_gate, SwapRouter& router, PriceFeed& price_feed,
                       const ExecutionSettings& settings, const Address& gas_token);
    virtual ~OpportunityScanner() = default;

    virtual std::optional<Opportunity> find_opportunity(double amount, const ScanContext& context);

    // Same walk restricted to X == token (the flash-loan funding asset)
    virtual std::optional<Opportunity> find_opportunity_from(const Address& token, double amount,
                                                             const ScanContext& context);

    // Eligible ordered pairs in scan order
    std::vector<std::pair<Address, Address>> candidate_pairs() const;

    // Prices one ordered pair. std::nullopt when the router has no route or
    // the pair fails the liquidity gate. Oracle failures propagate.
    std::optional<Opportunity> evaluate_pair(const Address& token_x, const Address& token_y,
                                             double amount, const ScanContext& context);

    // Gas for both legs, in reference units
    double gas_cost(double gas_price);

    // Validated reference price, cached until the next scan starts
    double price_of(const Address& token);

private:
    std::optional<Opportunity> scan(const std::optional<Address>& from, double amount,
                                    const ScanContext& context);

    const RiskGate& risk_gate_;
    SwapRouter& router_;
    PriceFeed& price_feed_;
    ExecutionSettings settings_;
    Address gas_token_;
    std::map<Address, double> price_cache_;  // valid for one scan only
};

} // namespace arbx
