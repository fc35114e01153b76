#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "types.hpp"
#include "event_bus.hpp"
#include "risk_gate.hpp"
#include "balance_book.hpp"
#include "profit_ledger.hpp"
#include "price_feed.hpp"
#include "opportunity_scanner.hpp"
#include "trade_executor.hpp"
#include "flash_loan_callback.hpp"
#include "venue/swap_router.hpp"
#include "venue/price_oracle.hpp"
#include "venue/lending_pool.hpp"

namespace arbx {

// One-time setup of an engine instance
struct EngineSetup {
    Address owner;   // the single authorized operator
    Address self;    // the executor's own address, flash loan initiator
    std::shared_ptr<SwapRouter> router;
    std::vector<std::shared_ptr<PriceOracle>> price_oracles;
    std::shared_ptr<GasPriceOracle> gas_oracle;
    std::shared_ptr<LendingPool> lending_pool;
    std::vector<Address> monitored_tokens;  // approved at construction, in order
    Address base_token;    // flash loan funding asset, also pays gas
    Address stable_token;  // super-profit settlement asset
    ExecutionSettings execution;
    PriceFeedSettings price_feed;
    RiskConfig risk;
    PriceFeed::Clock clock;
};

// Top-level driver. Every trigger runs one self-contained cycle
// Idle -> Scanning -> Executing -> Settled | Failed -> Idle under the attempt
// guard; operator commands are serialized against attempts.
class ArbitrageEngine {
public:
    // Throws ConfigurationError on a null collaborator, a zero address, an
    // empty oracle list, a zero or duplicate token or invalid thresholds
    explicit ArbitrageEngine(EngineSetup setup);

    ArbitrageEngine(const ArbitrageEngine&) = delete;
    ArbitrageEngine& operator=(const ArbitrageEngine&) = delete;

    // Operator commands. AuthorizationError when caller is not the owner.
    ExecutionReport trigger_direct(const Address& caller, double amount);
    ExecutionReport trigger_flashloan(const Address& caller, double amount);
    void add_monitored_token(const Address& caller, const Address& token);
    void blacklist_token(const Address& caller, const Address& token);
    void pause(const Address& caller);
    void unpause(const Address& caller);
    void set_thresholds(const Address& caller, double gas_price_limit, double profit_threshold,
                        double super_profit_threshold, double liquidity_threshold);
    void deposit(const Address& caller, const Address& token, double amount);
    void withdraw(const Address& caller, const Address& token, double amount);

    // Read surface
    double current_gas_price() const;  // gwei, OracleError if not positive
    RiskConfig risk_config() const { return risk_gate_.config(); }
    double total_profit() const { return ledger_.total_profit(); }
    std::vector<Address> monitored_tokens() const { return risk_gate_.monitored_tokens(); }
    std::vector<Address> blacklisted_tokens() const { return risk_gate_.blacklisted_tokens(); }
    double balance_of(const Address& token) const { return balances_.balance_of(token); }
    ExecutionState state() const { return state_.load(); }

    const Address& owner() const { return setup_.owner; }
    const Address& self_address() const { return setup_.self; }
    const Address& base_token() const { return setup_.base_token; }
    const Address& stable_token() const { return setup_.stable_token; }

    EventBus& events() { return events_; }
    const ProfitLedger& ledger() const { return ledger_; }
    FlashLoanReceiver& flash_loan_receiver() { return callback_; }

private:
    static EngineSetup validate_setup(EngineSetup setup);

    void require_operator(const Address& caller, const char* action) const;
    std::unique_lock<std::mutex> lock_state(const char* action);
    Address checked_token(const Address& token) const;

    // Excess over the super-profit threshold and the profit-token amount
    // sold to move it into the stable token
    struct Conversion {
        double excess = 0.0;
        double spent = 0.0;
    };

    ExecutionReport run_attempt(Strategy strategy, double amount);
    double execute_direct(const Opportunity& opportunity, double gas_price,
                          TradeResult& trade, Conversion& conversion);
    double execute_flash(const Opportunity& opportunity, double gas_price,
                         TradeResult& trade, Conversion& conversion);
    Conversion realize(const TradeResult& trade, double profit);
    double convert_super_profit(const Address& profit_token, double excess);
    void book(ExecutionReport& report, const TradeResult& trade, double profit, const Conversion& conversion);

    // Refused before scanning; the machine never leaves Idle
    ExecutionReport& reject(ExecutionReport& report, FailureKind kind, const std::string& reason);
    ExecutionReport& fail(ExecutionReport& report, FailureKind kind, const std::string& reason);
    void set_state(ExecutionState state) { state_.store(state); }

    EngineSetup setup_;
    EventBus events_;
    RiskGate risk_gate_;
    BalanceBook balances_;
    ProfitLedger ledger_;
    PriceFeed price_feed_;
    OpportunityScanner scanner_;
    TradeExecutor executor_;
    FlashLoanCallback callback_;

    std::mutex state_mutex_;
    std::atomic<bool> attempt_in_progress_{false};
    std::atomic<std::thread::id> attempt_thread_{};
    std::atomic<ExecutionState> state_{ExecutionState::IDLE};
};

} // namespace arbx
