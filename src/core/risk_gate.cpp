#include "risk_gate.hpp"
#include "exceptions.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>

namespace arbx {

RiskGate::RiskGate(EventPusher* event_pusher)
    : event_pusher_(event_pusher) {}

bool RiskGate::admit(double candidate_gas_price) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (config_.is_paused) {
        return false;
    }
    if (candidate_gas_price > config_.gas_price_limit) {
        utils::TradingLogger::log_risk_alert("GAS_CEILING", "gas price above limit",
                                             candidate_gas_price, config_.gas_price_limit);
        return false;
    }
    return true;
}

std::string RiskGate::admission_failure(double candidate_gas_price) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (config_.is_paused) {
        return "execution is paused";
    }
    if (candidate_gas_price > config_.gas_price_limit) {
        return "gas price " + std::to_string(candidate_gas_price) +
               " exceeds limit " + std::to_string(config_.gas_price_limit);
    }
    return "";
}

bool RiskGate::is_eligible(const Address& token) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tokens_.find(token);
    return it != tokens_.end() && it->second.is_eligible();
}

void RiskGate::pause() {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (config_.is_paused) {
            throw ValidationError("already paused");
        }
        config_.is_paused = true;
    }
    ARBX_LOG_WARN("Execution paused");
    emit(PausedEvent{});
}

void RiskGate::unpause() {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!config_.is_paused) {
            throw ValidationError("not paused");
        }
        config_.is_paused = false;
    }
    ARBX_LOG_INFO("Execution unpaused");
    emit(UnpausedEvent{});
}

void RiskGate::set_thresholds(double gas_price_limit, double profit_threshold,
                              double super_profit_threshold, double liquidity_threshold) {
    for (double value : {gas_price_limit, profit_threshold, super_profit_threshold, liquidity_threshold}) {
        if (!std::isfinite(value) || value < 0.0) {
            throw ValidationError("thresholds must be finite and non-negative");
        }
    }
    if (super_profit_threshold < profit_threshold) {
        throw ValidationError("super profit threshold " + std::to_string(super_profit_threshold) +
                              " is below profit threshold " + std::to_string(profit_threshold));
    }

    RiskConfig updated;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        config_.gas_price_limit = gas_price_limit;
        config_.profit_threshold = profit_threshold;
        config_.super_profit_threshold = super_profit_threshold;
        config_.liquidity_threshold = liquidity_threshold;
        updated = config_;
    }
    emit(ThresholdsUpdatedEvent{updated});
}

void RiskGate::approve(const Address& token) {
    if (address::is_zero(token)) {
        throw ValidationError("cannot approve the zero address");
    }
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        TokenRef& ref = tokens_[token];
        ref.address = token;
        if (ref.approved) {
            throw ValidationError("token " + token + " is already approved");
        }
        if (ref.blacklisted) {
            throw ValidationError("token " + token + " is blacklisted");
        }
        ref.approved = true;
        if (std::find(monitored_.begin(), monitored_.end(), token) == monitored_.end()) {
            monitored_.push_back(token);
        }
    }
    emit(TokenApprovedEvent{token});
}

void RiskGate::blacklist(const Address& token) {
    if (address::is_zero(token)) {
        throw ValidationError("cannot blacklist the zero address");
    }
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        TokenRef& ref = tokens_[token];
        ref.address = token;
        if (ref.blacklisted) {
            throw ValidationError("token " + token + " is already blacklisted");
        }
        ref.blacklisted = true;
        ref.approved = false;
        blacklisted_.push_back(token);
    }
    emit(TokenBlacklistedEvent{token});
}

RiskConfig RiskGate::config() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return config_;
}

bool RiskGate::is_paused() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return config_.is_paused;
}

std::vector<Address> RiskGate::monitored_tokens() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return monitored_;
}

std::vector<Address> RiskGate::blacklisted_tokens() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return blacklisted_;
}

std::optional<TokenRef> RiskGate::token(const Address& token) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void RiskGate::emit(Event event) {
    if (event_pusher_) {
        event_pusher_->push_event(std::move(event));
    }
}

} // namespace arbx
