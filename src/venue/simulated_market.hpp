#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "swap_router.hpp"
#include "price_oracle.hpp"
#include "lending_pool.hpp"
#include "utils/config_types.hpp"

namespace arbx {
namespace venue {

// Constant-product pool x * y = k with the fee taken on the input side
struct ConstantProductPool {
    std::string venue;
    Address token_a;
    Address token_b;
    double reserve_a = 0.0;
    double reserve_b = 0.0;

    bool connects(const Address& in, const Address& out) const {
        return (in == token_a && out == token_b) || (in == token_b && out == token_a);
    }
    double reserve_of(const Address& token) const { return token == token_a ? reserve_a : reserve_b; }
    double amount_out(double amount_in, const Address& token_in, double fee) const;
    void apply_swap(double amount_in, double amount_out, const Address& token_in);
};

// Routes each swap through the best-paying pool among all venues that list
// the pair, so a price gap between venues shows up as a round-trip profit.
class SimulatedRouter : public SwapRouter {
public:
    SimulatedRouter(const Address& address, double fee);

    void add_pool(const std::string& venue, const Address& token_a, const Address& token_b,
                  double reserve_a, double reserve_b);

    Address address() const override { return address_; }
    double get_amount_out(double amount_in, const Address& token_in, const Address& token_out) override;
    double get_liquidity(const Address& token_in, const Address& token_out) override;
    double swap_exact_tokens_for_tokens(double amount_in, double min_amount_out,
                                        const Address& token_in, const Address& token_out,
                                        const Address& recipient) override;

    // Reserves and swap count at begin are restored by revert
    void begin_sequence() override;
    void commit_sequence() override;
    void revert_sequence() override;

    std::vector<ConstantProductPool> pools() const;
    size_t swap_count() const;

private:
    struct Checkpoint {
        std::vector<ConstantProductPool> pools;
        size_t swap_count = 0;
    };

    ConstantProductPool* best_pool(double amount_in, const Address& token_in, const Address& token_out,
                                   double& amount_out);

    Address address_;
    double fee_;
    mutable std::mutex mutex_;
    std::vector<ConstantProductPool> pools_;
    size_t swap_count_ = 0;
    std::optional<Checkpoint> checkpoint_;
};

class SimulatedPriceOracle : public PriceOracle {
public:
    using Clock = std::function<long long()>;

    explicit SimulatedPriceOracle(const Address& address, Clock clock = Clock());

    // Reading reported as updated age_sec seconds before now
    void set_price(const Address& token, double price, long long age_sec = 0);
    void set_reading(const Address& token, const OracleReading& reading);
    void clear(const Address& token);

    Address address() const override { return address_; }
    std::optional<OracleReading> latest_reading(const Address& token) override;

private:
    struct Entry {
        OracleReading reading;
        long long age_sec = 0;
        bool relative = true;  // updated_at follows the clock
    };

    Address address_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::map<Address, Entry> entries_;
};

class SimulatedGasOracle : public GasPriceOracle {
public:
    SimulatedGasOracle(const Address& address, double gas_price_gwei);

    void set_gas_price(double gas_price_gwei);

    Address address() const override { return address_; }
    double latest_gas_price() override;

private:
    Address address_;
    mutable std::mutex mutex_;
    double gas_price_;
};

// Lends from its own reserves, calls the receiver once, then pulls
// principal + fee through the borrower's custody. Any failure puts the
// reserves back and rethrows, so a loan is either repaid or never happened.
class SimulatedLendingPool : public LendingPool {
public:
    SimulatedLendingPool(const Address& address, double premium);

    void set_liquidity(const Address& token, double amount);
    double liquidity(const Address& token) const;
    double collected_fees(const Address& token) const;

    Address address() const override { return address_; }
    double flash_loan_premium() const override { return premium_; }
    void flash_loan(const Address& initiator,
                    FlashLoanReceiver& receiver,
                    TokenCustody& custody,
                    const FlashLoanRequest& request,
                    const std::string& params) override;

    // A loan repaid inside the sequence is taken back by revert
    void begin_sequence() override;
    void commit_sequence() override;
    void revert_sequence() override;

private:
    struct Checkpoint {
        std::map<Address, double> reserves;
        std::map<Address, double> fees;
    };

    Address address_;
    double premium_;
    mutable std::mutex mutex_;
    std::map<Address, double> reserves_;
    std::map<Address, double> fees_;
    bool loan_in_flight_ = false;
    std::optional<Checkpoint> checkpoint_;
};

// Every collaborator of one simulated deployment
struct SimulatedMarket {
    std::shared_ptr<SimulatedRouter> router;
    std::vector<std::shared_ptr<SimulatedPriceOracle>> oracles;
    std::shared_ptr<SimulatedGasOracle> gas_oracle;
    std::shared_ptr<SimulatedLendingPool> lending_pool;

    std::vector<std::shared_ptr<PriceOracle>> price_oracles() const;
};

// Addresses are normalized; throws ConfigurationError on malformed input
SimulatedMarket build_simulated_market(const utils::SimulationConfig& config,
                                       SimulatedPriceOracle::Clock clock = SimulatedPriceOracle::Clock());

} // namespace venue
} // namespace arbx
