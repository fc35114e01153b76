#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "event_pusher.hpp"

namespace arbx {

// Mutable risk configuration plus the token allow/deny sets.
// Authorization is the caller's job (ArbitrageEngine checks the operator
// before any mutator is reached); every mutation emits an event.
class RiskGate {
public:
    explicit RiskGate(EventPusher* event_pusher = nullptr);
    virtual ~RiskGate() = default;

    void set_event_pusher(EventPusher* event_pusher) { event_pusher_ = event_pusher; }

    // Admission: not paused and candidate gas price within the ceiling.
    // A gas refusal raises a risk alert.
    virtual bool admit(double candidate_gas_price) const;
    // Human readable reason admit() would refuse, empty when admitted
    std::string admission_failure(double candidate_gas_price) const;

    // Approved and not blacklisted
    virtual bool is_eligible(const Address& token) const;

    void pause();
    void unpause();
    void set_thresholds(double gas_price_limit, double profit_threshold,
                        double super_profit_threshold, double liquidity_threshold);

    // Approves and appends to the monitored set. Fails on the zero address,
    // on an already approved token and on a blacklisted token.
    void approve(const Address& token);
    // Logical removal; clears approval. Fails on the zero address and on an
    // already blacklisted token.
    void blacklist(const Address& token);

    RiskConfig config() const;
    bool is_paused() const;
    std::vector<Address> monitored_tokens() const;
    std::vector<Address> blacklisted_tokens() const;
    std::optional<TokenRef> token(const Address& token) const;

private:
    void emit(Event event);

    EventPusher* event_pusher_;
    mutable std::shared_mutex mutex_;
    RiskConfig config_;
    std::unordered_map<Address, TokenRef> tokens_;
    std::vector<Address> monitored_;    // insertion order, no duplicates
    std::vector<Address> blacklisted_;  // order of blacklisting
};

} // namespace arbx
