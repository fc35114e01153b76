#include "simulated_market.hpp"
#include "venue_exception.hpp"
#include "core/exceptions.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/logger.hpp"
#include <cmath>

namespace arbx {
namespace venue {

namespace {

Address config_address(const std::string& value, const std::string& what) {
    try {
        return address::normalize(value);
    } catch (const ValidationError& e) {
        throw ConfigurationError("simulation " + what + ": " + e.what());
    }
}

} // namespace

double ConstantProductPool::amount_out(double amount_in, const Address& token_in, double fee) const {
    const double reserve_in = reserve_of(token_in);
    const double reserve_out = token_in == token_a ? reserve_b : reserve_a;
    if (amount_in <= 0.0 || reserve_in <= 0.0 || reserve_out <= 0.0) {
        return 0.0;
    }
    const double in_with_fee = amount_in * (1.0 - fee);
    return in_with_fee * reserve_out / (reserve_in + in_with_fee);
}

void ConstantProductPool::apply_swap(double amount_in, double amount_out, const Address& token_in) {
    if (token_in == token_a) {
        reserve_a += amount_in;
        reserve_b -= amount_out;
    } else {
        reserve_b += amount_in;
        reserve_a -= amount_out;
    }
}

// SimulatedRouter

SimulatedRouter::SimulatedRouter(const Address& address, double fee)
    : address_(address), fee_(fee) {}

void SimulatedRouter::add_pool(const std::string& venue, const Address& token_a, const Address& token_b,
                               double reserve_a, double reserve_b) {
    if (token_a == token_b) {
        throw VenueException("pool tokens must differ");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    pools_.push_back(ConstantProductPool{venue, token_a, token_b, reserve_a, reserve_b});
}

ConstantProductPool* SimulatedRouter::best_pool(double amount_in, const Address& token_in,
                                                const Address& token_out, double& amount_out) {
    ConstantProductPool* best = nullptr;
    amount_out = 0.0;
    for (auto& pool : pools_) {
        if (!pool.connects(token_in, token_out)) {
            continue;
        }
        double out = pool.amount_out(amount_in, token_in, fee_);
        if (best == nullptr || out > amount_out) {
            best = &pool;
            amount_out = out;
        }
    }
    if (best == nullptr) {
        throw VenueException("no pool for " + address::shorten(token_in) + " -> " + address::shorten(token_out));
    }
    return best;
}

double SimulatedRouter::get_amount_out(double amount_in, const Address& token_in, const Address& token_out) {
    std::lock_guard<std::mutex> lock(mutex_);
    double amount_out = 0.0;
    best_pool(amount_in, token_in, token_out, amount_out);
    return amount_out;
}

double SimulatedRouter::get_liquidity(const Address& token_in, const Address& token_out) {
    std::lock_guard<std::mutex> lock(mutex_);
    double depth = 0.0;
    bool listed = false;
    for (const auto& pool : pools_) {
        if (pool.connects(token_in, token_out)) {
            depth += pool.reserve_of(token_in);
            listed = true;
        }
    }
    if (!listed) {
        throw VenueException("no pool for " + address::shorten(token_in) + " -> " + address::shorten(token_out));
    }
    return depth;
}

double SimulatedRouter::swap_exact_tokens_for_tokens(double amount_in, double min_amount_out,
                                                     const Address& token_in, const Address& token_out,
                                                     const Address& recipient) {
    std::lock_guard<std::mutex> lock(mutex_);
    double amount_out = 0.0;
    ConstantProductPool* pool = best_pool(amount_in, token_in, token_out, amount_out);
    if (amount_out <= 0.0 || amount_out < min_amount_out) {
        throw VenueException("INSUFFICIENT_OUTPUT_AMOUNT: " + std::to_string(amount_out) +
                             " < " + std::to_string(min_amount_out));
    }
    pool->apply_swap(amount_in, amount_out, token_in);
    ++swap_count_;
    ARBX_LOG_DEBUG("[{}] swap {} {} -> {} {} for {}", pool->venue, amount_in, address::shorten(token_in),
                   amount_out, address::shorten(token_out), address::shorten(recipient));
    return amount_out;
}

void SimulatedRouter::begin_sequence() {
    std::lock_guard<std::mutex> lock(mutex_);
    checkpoint_ = Checkpoint{pools_, swap_count_};
}

void SimulatedRouter::commit_sequence() {
    std::lock_guard<std::mutex> lock(mutex_);
    checkpoint_.reset();
}

void SimulatedRouter::revert_sequence() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!checkpoint_) {
        return;
    }
    if (swap_count_ != checkpoint_->swap_count) {
        ARBX_LOG_DEBUG("Reverting {} swaps", swap_count_ - checkpoint_->swap_count);
    }
    pools_ = std::move(checkpoint_->pools);
    swap_count_ = checkpoint_->swap_count;
    checkpoint_.reset();
}

std::vector<ConstantProductPool> SimulatedRouter::pools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pools_;
}

size_t SimulatedRouter::swap_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return swap_count_;
}

// SimulatedPriceOracle

SimulatedPriceOracle::SimulatedPriceOracle(const Address& address, Clock clock)
    : address_(address), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = []() { return utils::CryptoUtils::current_timestamp_sec(); };
    }
}

void SimulatedPriceOracle::set_price(const Address& token, double price, long long age_sec) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry entry;
    entry.reading.price = price;
    entry.age_sec = age_sec;
    entries_[token] = entry;
}

void SimulatedPriceOracle::set_reading(const Address& token, const OracleReading& reading) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry entry;
    entry.reading = reading;
    entry.relative = false;
    entries_[token] = entry;
}

void SimulatedPriceOracle::clear(const Address& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(token);
}

std::optional<OracleReading> SimulatedPriceOracle::latest_reading(const Address& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(token);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    OracleReading reading = it->second.reading;
    if (it->second.relative) {
        reading.updated_at = clock_() - it->second.age_sec;
    }
    return reading;
}

// SimulatedGasOracle

SimulatedGasOracle::SimulatedGasOracle(const Address& address, double gas_price_gwei)
    : address_(address), gas_price_(gas_price_gwei) {}

void SimulatedGasOracle::set_gas_price(double gas_price_gwei) {
    std::lock_guard<std::mutex> lock(mutex_);
    gas_price_ = gas_price_gwei;
}

double SimulatedGasOracle::latest_gas_price() {
    std::lock_guard<std::mutex> lock(mutex_);
    return gas_price_;
}

// SimulatedLendingPool

SimulatedLendingPool::SimulatedLendingPool(const Address& address, double premium)
    : address_(address), premium_(premium) {}

void SimulatedLendingPool::set_liquidity(const Address& token, double amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserves_[token] = amount;
}

double SimulatedLendingPool::liquidity(const Address& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reserves_.find(token);
    return it != reserves_.end() ? it->second : 0.0;
}

double SimulatedLendingPool::collected_fees(const Address& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fees_.find(token);
    return it != fees_.end() ? it->second : 0.0;
}

void SimulatedLendingPool::flash_loan(const Address& initiator,
                                      FlashLoanReceiver& receiver,
                                      TokenCustody& custody,
                                      const FlashLoanRequest& request,
                                      const std::string& params) {
    if (!request.is_well_formed()) {
        throw VenueException("malformed flash loan request");
    }

    std::map<Address, double> reserves_before;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loan_in_flight_) {
            throw VenueException("flash loan already in progress");
        }
        for (size_t i = 0; i < request.assets.size(); ++i) {
            if (reserves_[request.assets[i]] < request.amounts[i]) {
                throw VenueException("insufficient liquidity for " + address::shorten(request.assets[i]));
            }
        }
        reserves_before = reserves_;
        for (size_t i = 0; i < request.assets.size(); ++i) {
            reserves_[request.assets[i]] -= request.amounts[i];
        }
        loan_in_flight_ = true;
    }

    std::vector<double> fees;
    fees.reserve(request.amounts.size());
    for (double amount : request.amounts) {
        fees.push_back(amount * premium_);
    }

    try {
        for (size_t i = 0; i < request.assets.size(); ++i) {
            custody.transfer_in(address_, request.assets[i], request.amounts[i]);
        }

        if (!receiver.on_loan_received(address_, request.assets, request.amounts, fees, initiator, params)) {
            throw VenueException("flash loan receiver returned false");
        }

        for (size_t i = 0; i < request.assets.size(); ++i) {
            try {
                custody.transfer_from(address_, request.assets[i], request.amounts[i] + fees[i]);
            } catch (const ArbxException& e) {
                throw VenueException(std::string("repayment pull failed: ") + e.what());
            }
        }
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(mutex_);
        reserves_ = reserves_before;
        loan_in_flight_ = false;
        ARBX_LOG_WARN("Flash loan to {} unwound", address::shorten(initiator));
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < request.assets.size(); ++i) {
        reserves_[request.assets[i]] += request.amounts[i] + fees[i];
        fees_[request.assets[i]] += fees[i];
    }
    loan_in_flight_ = false;
}

void SimulatedLendingPool::begin_sequence() {
    std::lock_guard<std::mutex> lock(mutex_);
    checkpoint_ = Checkpoint{reserves_, fees_};
}

void SimulatedLendingPool::commit_sequence() {
    std::lock_guard<std::mutex> lock(mutex_);
    checkpoint_.reset();
}

void SimulatedLendingPool::revert_sequence() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!checkpoint_) {
        return;
    }
    reserves_ = std::move(checkpoint_->reserves);
    fees_ = std::move(checkpoint_->fees);
    checkpoint_.reset();
}

// SimulatedMarket

std::vector<std::shared_ptr<PriceOracle>> SimulatedMarket::price_oracles() const {
    return std::vector<std::shared_ptr<PriceOracle>>(oracles.begin(), oracles.end());
}

SimulatedMarket build_simulated_market(const utils::SimulationConfig& config,
                                       SimulatedPriceOracle::Clock clock) {
    SimulatedMarket market;
    market.router = std::make_shared<SimulatedRouter>(config_address(config.router, "router"), config.swap_fee);
    market.gas_oracle = std::make_shared<SimulatedGasOracle>(config_address(config.gas_oracle, "gas oracle"),
                                                             config.gas_price_gwei);
    market.lending_pool = std::make_shared<SimulatedLendingPool>(
        config_address(config.lending_pool, "lending pool"), config.flash_loan_premium);

    for (const auto& pool : config.pools) {
        market.router->add_pool(pool.venue, config_address(pool.token_a, "pool token"),
                                config_address(pool.token_b, "pool token"),
                                pool.reserve_a, pool.reserve_b);
    }

    for (const auto& oracle_config : config.oracles) {
        auto oracle = std::make_shared<SimulatedPriceOracle>(config_address(oracle_config.address, "oracle"), clock);
        for (const auto& [token, price] : oracle_config.prices) {
            oracle->set_price(config_address(token, "oracle token"), price, oracle_config.age_sec);
        }
        market.oracles.push_back(oracle);
    }

    for (const auto& [token, amount] : config.lending_liquidity) {
        market.lending_pool->set_liquidity(config_address(token, "lending token"), amount);
    }

    ARBX_LOG_INFO("Simulated market: {} pools, {} oracles, gas {} gwei, loan premium {}",
                  config.pools.size(), config.oracles.size(), config.gas_price_gwei, config.flash_loan_premium);
    return market;
}

} // namespace venue
} // namespace arbx
