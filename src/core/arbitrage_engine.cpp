#include "arbitrage_engine.hpp"
#include "attempt_scope.hpp"
#include "exceptions.hpp"
#include "venue/venue_exception.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace arbx {

namespace {

constexpr double kReconcileTolerance = 1e-9;

bool is_positive_amount(double amount) {
    return std::isfinite(amount) && amount > 0.0;
}

Address checked_address(const Address& value, const std::string& what) {
    if (address::is_zero(value)) {
        throw ConfigurationError(what + " must not be the zero address");
    }
    try {
        return address::normalize(value);
    } catch (const ValidationError& e) {
        throw ConfigurationError(what + ": " + e.what());
    }
}

} // namespace

ArbitrageEngine::ArbitrageEngine(EngineSetup setup)
    : setup_(validate_setup(std::move(setup))),
      risk_gate_(&events_),
      balances_(setup_.self),
      price_feed_(setup_.price_oracles, setup_.price_feed, setup_.clock),
      scanner_(risk_gate_, *setup_.router, price_feed_, setup_.execution, setup_.base_token),
      executor_(risk_gate_, *setup_.router, balances_, setup_.execution),
      callback_(setup_.lending_pool->address(), setup_.self, executor_, balances_) {
    const RiskConfig& risk = setup_.risk;
    risk_gate_.set_thresholds(risk.gas_price_limit, risk.profit_threshold,
                              risk.super_profit_threshold, risk.liquidity_threshold);
    for (const auto& token : setup_.monitored_tokens) {
        risk_gate_.approve(token);
    }
    if (risk.is_paused) {
        risk_gate_.pause();
    }

    utils::TradingLogger::log_system_event("ENGINE_INITIALIZED",
        "owner " + address::shorten(setup_.owner) + ", " +
        std::to_string(setup_.monitored_tokens.size()) + " tokens, " +
        std::to_string(setup_.price_oracles.size()) + " price oracles");
}

EngineSetup ArbitrageEngine::validate_setup(EngineSetup setup) {
    if (!setup.router) {
        throw ConfigurationError("swap router is required");
    }
    if (!setup.gas_oracle) {
        throw ConfigurationError("gas price oracle is required");
    }
    if (!setup.lending_pool) {
        throw ConfigurationError("lending pool is required");
    }
    if (setup.price_oracles.empty()) {
        throw ConfigurationError("at least one price oracle is required");
    }
    for (const auto& oracle : setup.price_oracles) {
        if (!oracle) {
            throw ConfigurationError("price oracle list contains a null entry");
        }
        checked_address(oracle->address(), "price oracle");
    }
    checked_address(setup.router->address(), "swap router");
    checked_address(setup.gas_oracle->address(), "gas price oracle");
    checked_address(setup.lending_pool->address(), "lending pool");

    setup.owner = checked_address(setup.owner, "owner");
    setup.self = checked_address(setup.self, "executor address");
    setup.base_token = checked_address(setup.base_token, "base token");
    setup.stable_token = checked_address(setup.stable_token, "stable token");

    std::set<Address> seen;
    for (auto& token : setup.monitored_tokens) {
        token = checked_address(token, "monitored token");
        if (!seen.insert(token).second) {
            throw ConfigurationError("monitored token " + token + " is listed twice");
        }
    }

    const RiskConfig& risk = setup.risk;
    for (double value : {risk.gas_price_limit, risk.profit_threshold,
                         risk.super_profit_threshold, risk.liquidity_threshold}) {
        if (!std::isfinite(value) || value < 0.0) {
            throw ConfigurationError("risk thresholds must be finite and non-negative");
        }
    }
    if (risk.super_profit_threshold < risk.profit_threshold) {
        throw ConfigurationError("super profit threshold is below profit threshold");
    }

    const ExecutionSettings& execution = setup.execution;
    if (!std::isfinite(execution.max_slippage) || execution.max_slippage < 0.0 ||
        execution.max_slippage >= 1.0) {
        throw ConfigurationError("max slippage must be in [0, 1)");
    }
    if (!std::isfinite(execution.gas_units_per_swap) || execution.gas_units_per_swap < 0.0) {
        throw ConfigurationError("gas units per swap must be non-negative");
    }
    return setup;
}

ExecutionReport ArbitrageEngine::trigger_direct(const Address& caller, double amount) {
    require_operator(caller, "trigger direct execution");
    if (!is_positive_amount(amount)) {
        throw ValidationError("trade amount must be positive, got " + std::to_string(amount));
    }
    return run_attempt(Strategy::DIRECT, amount);
}

ExecutionReport ArbitrageEngine::trigger_flashloan(const Address& caller, double amount) {
    require_operator(caller, "trigger flash loan execution");
    if (!is_positive_amount(amount)) {
        throw ValidationError("loan amount must be positive, got " + std::to_string(amount));
    }
    return run_attempt(Strategy::FLASH_LOAN, amount);
}

void ArbitrageEngine::add_monitored_token(const Address& caller, const Address& token) {
    require_operator(caller, "add a monitored token");
    Address normalized = checked_token(token);
    auto lock = lock_state("add a monitored token");
    risk_gate_.approve(normalized);
}

void ArbitrageEngine::blacklist_token(const Address& caller, const Address& token) {
    require_operator(caller, "blacklist a token");
    Address normalized = checked_token(token);
    auto lock = lock_state("blacklist a token");
    risk_gate_.blacklist(normalized);
}

void ArbitrageEngine::pause(const Address& caller) {
    require_operator(caller, "pause");
    auto lock = lock_state("pause");
    risk_gate_.pause();
}

void ArbitrageEngine::unpause(const Address& caller) {
    require_operator(caller, "unpause");
    auto lock = lock_state("unpause");
    risk_gate_.unpause();
}

void ArbitrageEngine::set_thresholds(const Address& caller, double gas_price_limit, double profit_threshold,
                                     double super_profit_threshold, double liquidity_threshold) {
    require_operator(caller, "set thresholds");
    auto lock = lock_state("set thresholds");
    risk_gate_.set_thresholds(gas_price_limit, profit_threshold, super_profit_threshold, liquidity_threshold);
}

void ArbitrageEngine::deposit(const Address& caller, const Address& token, double amount) {
    require_operator(caller, "deposit");
    Address normalized = checked_token(token);
    if (!is_positive_amount(amount)) {
        throw ValidationError("deposit amount must be positive");
    }
    auto lock = lock_state("deposit");
    balances_.transfer_in(setup_.owner, normalized, amount);
    ARBX_LOG_INFO("Deposited {} of {}", amount, address::shorten(normalized));
}

void ArbitrageEngine::withdraw(const Address& caller, const Address& token, double amount) {
    require_operator(caller, "withdraw");
    Address normalized = checked_token(token);
    if (!is_positive_amount(amount)) {
        throw ValidationError("withdrawal amount must be positive");
    }
    auto lock = lock_state("withdraw");
    balances_.debit(normalized, amount);
    ARBX_LOG_INFO("Withdrew {} of {} to {}", amount, address::shorten(normalized),
                  address::shorten(setup_.owner));
}

double ArbitrageEngine::current_gas_price() const {
    double gas_price = 0.0;
    try {
        gas_price = setup_.gas_oracle->latest_gas_price();
    } catch (const OracleError&) {
        throw;
    } catch (const std::exception& e) {
        throw OracleError(std::string("gas price oracle failed: ") + e.what());
    }
    if (!std::isfinite(gas_price) || gas_price <= 0.0) {
        throw OracleError("gas price oracle reported " + std::to_string(gas_price));
    }
    return gas_price;
}

void ArbitrageEngine::require_operator(const Address& caller, const char* action) const {
    if (!address::is_valid(caller) || address::normalize(caller) != setup_.owner) {
        throw AuthorizationError(caller + " may not " + action);
    }
}

std::unique_lock<std::mutex> ArbitrageEngine::lock_state(const char* action) {
    // The attempt thread already holds the state mutex
    if (attempt_in_progress_.load() && attempt_thread_.load() == std::this_thread::get_id()) {
        throw RiskRejection(std::string("cannot ") + action + " from inside a running attempt");
    }
    return std::unique_lock<std::mutex>(state_mutex_);
}

Address ArbitrageEngine::checked_token(const Address& token) const {
    if (address::is_zero(token)) {
        throw ValidationError("token must not be the zero address");
    }
    return address::normalize(token);
}

ExecutionReport ArbitrageEngine::run_attempt(Strategy strategy, double amount) {
    ExecutionReport report;
    report.attempt_id = utils::CryptoUtils::generate_attempt_id();
    report.strategy = strategy;

    AttemptGuard guard(attempt_in_progress_);
    if (!guard.acquired()) {
        return reject(report, FailureKind::RISK_REJECTION, "execution already in progress");
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    attempt_thread_.store(std::this_thread::get_id());
    ARBX_SCOPED_TIMER("arbitrage_attempt");
    ARBX_LOG_INFO("Attempt {} started: {} amount {}", report.attempt_id, to_string(strategy), amount);

    struct ThreadReset {
        std::atomic<std::thread::id>& id;
        ~ThreadReset() { id.store(std::thread::id()); }
    } thread_reset{attempt_thread_};

    // Admission, before any scanning. The pause check needs no gas reading.
    if (risk_gate_.is_paused()) {
        return reject(report, FailureKind::RISK_REJECTION, "execution is paused");
    }
    double gas_price = 0.0;
    try {
        gas_price = current_gas_price();
    } catch (const OracleError& e) {
        return reject(report, FailureKind::ORACLE_INVALID, e.what());
    }
    if (!risk_gate_.admit(gas_price)) {
        return reject(report, FailureKind::RISK_REJECTION, risk_gate_.admission_failure(gas_price));
    }

    AttemptScope scope(balances_, {setup_.router.get(), setup_.lending_pool.get()});
    FailureKind failure = FailureKind::NONE;
    std::string reason;
    try {
        set_state(ExecutionState::SCANNING);
        ScanContext context;
        context.gas_price = gas_price;

        std::optional<Opportunity> opportunity;
        if (strategy == Strategy::DIRECT) {
            opportunity = scanner_.find_opportunity(amount, context);
        } else {
            context.loan_premium = setup_.lending_pool->flash_loan_premium();
            opportunity = scanner_.find_opportunity_from(setup_.base_token, amount, context);
        }
        if (!opportunity) {
            scope.rollback();
            return fail(report, FailureKind::NO_OPPORTUNITY,
                        "no profitable opportunity above threshold " +
                        std::to_string(risk_gate_.config().profit_threshold));
        }
        report.opportunity = opportunity;

        set_state(ExecutionState::EXECUTING);
        TradeResult trade;
        Conversion conversion;
        double profit = strategy == Strategy::DIRECT
            ? execute_direct(*opportunity, gas_price, trade, conversion)
            : execute_flash(*opportunity, gas_price, trade, conversion);

        book(report, trade, profit, conversion);
        scope.commit();

        set_state(ExecutionState::SETTLED);
        report.final_state = ExecutionState::SETTLED;
        report.success = true;
        report.realized_profit = profit;
        events_.push_event(ArbitrageExecutedEvent{profit, to_string(strategy), report.attempt_id});
        utils::TradingLogger::log_trade_executed(report.attempt_id, to_string(strategy), profit,
                                                 trade.amount_in, trade.amount_out);
        set_state(ExecutionState::IDLE);
        return report;
    } catch (const RiskRejection& e) {
        failure = FailureKind::RISK_REJECTION;
        reason = e.what();
    } catch (const OracleError& e) {
        failure = FailureKind::ORACLE_INVALID;
        reason = e.what();
    } catch (const TradingError& e) {
        failure = FailureKind::TRADING_ERROR;
        reason = e.what();
    } catch (const ValidationError& e) {
        failure = FailureKind::TRADING_ERROR;
        reason = e.what();
    } catch (const CollaboratorError& e) {
        failure = FailureKind::COLLABORATOR_FAILURE;
        reason = e.what();
    } catch (const AuthorizationError& e) {
        // The callback refused the lender's call
        failure = FailureKind::COLLABORATOR_FAILURE;
        reason = e.what();
    } catch (const VenueException& e) {
        failure = FailureKind::COLLABORATOR_FAILURE;
        reason = std::string("venue failure: ") + e.what();
    } catch (const std::exception& e) {
        failure = FailureKind::COLLABORATOR_FAILURE;
        reason = std::string("unexpected failure: ") + e.what();
    }

    scope.rollback();
    return fail(report, failure, reason);
}

double ArbitrageEngine::execute_direct(const Opportunity& opportunity, double gas_price,
                                       TradeResult& trade, Conversion& conversion) {
    const double price_in = scanner_.price_of(opportunity.token_in);
    const double gas_cost = scanner_.gas_cost(gas_price);

    // Second leg must cover the threshold and gas, in token_in units
    const double required_profit = (risk_gate_.config().profit_threshold + gas_cost) / price_in;
    trade = executor_.execute(opportunity, required_profit);

    const double profit = (trade.amount_out - trade.amount_in) * price_in - gas_cost;
    conversion = realize(trade, profit);
    return profit;
}

double ArbitrageEngine::execute_flash(const Opportunity& opportunity, double gas_price,
                                      TradeResult& trade, Conversion& conversion) {
    const Address& pool = setup_.lending_pool->address();
    const Address& asset = setup_.base_token;
    const double price_in = scanner_.price_of(asset);
    const double gas_cost = scanner_.gas_cost(gas_price);

    PendingFlashLoan pending;
    pending.opportunity = opportunity;
    pending.request.assets = {asset};
    pending.request.amounts = {opportunity.amount};
    pending.request.modes = {0};
    if (!pending.request.is_well_formed()) {
        throw ValidationError("malformed flash loan request");
    }

    // Profit check and super-profit conversion happen while the loan is
    // open, so a failure in either unwinds the lender too
    double profit = 0.0;
    pending.settle = [&](const TradeResult& result, double fee) {
        profit = (result.amount_out - result.amount_in - fee) * price_in - gas_cost;
        conversion = realize(result, profit);
        return conversion.spent;
    };

    const std::string params = FlashLoanCallback::encode_params(opportunity);
    pending.params_digest = utils::CryptoUtils::sha256_hex(params);
    const double balance_before = balances_.balance_of(asset);

    ARBX_LOG_INFO("Requesting flash loan of {} {} from {}", opportunity.amount,
                  address::shorten(asset), address::shorten(pool));
    {
        ArmedFlashLoan armed(callback_, pending);
        try {
            setup_.lending_pool->flash_loan(setup_.self, callback_, balances_, pending.request, params);
        } catch (const VenueException& e) {
            throw CollaboratorError(std::string("flash loan reverted: ") + e.what());
        }
    }

    if (!pending.trade || !pending.repayment_approved) {
        throw CollaboratorError("lending pool returned without running the loan callback");
    }
    trade = *pending.trade;
    const double fee = pending.fees.front();

    if (balances_.allowance(pool, asset) > kReconcileTolerance) {
        throw CollaboratorError("lending pool did not pull the repayment");
    }
    const double expected_balance =
        balance_before + trade.amount_out - trade.amount_in - fee - pending.settlement_spent;
    const double actual_balance = balances_.balance_of(asset);
    if (std::fabs(actual_balance - expected_balance) >
        kReconcileTolerance * std::max(1.0, std::fabs(expected_balance))) {
        throw CollaboratorError("balance after repayment is " + std::to_string(actual_balance) +
                                ", expected " + std::to_string(expected_balance));
    }
    return profit;
}

ArbitrageEngine::Conversion ArbitrageEngine::realize(const TradeResult& trade, double profit) {
    if (!(profit > 0.0)) {
        throw TradingError("attempt realized no net profit (" + std::to_string(profit) + ")");
    }

    Conversion conversion;
    const double super_threshold = risk_gate_.config().super_profit_threshold;
    if (profit > super_threshold) {
        conversion.excess = profit - super_threshold;
        conversion.spent = convert_super_profit(trade.token_in, conversion.excess);
    }
    return conversion;
}

double ArbitrageEngine::convert_super_profit(const Address& profit_token, double excess) {
    const Address& stable = setup_.stable_token;
    if (profit_token == stable) {
        ARBX_LOG_INFO("Super profit {} already held in the stable token", excess);
        return 0.0;
    }

    const double amount_in = excess / scanner_.price_of(profit_token);
    const double min_out = excess / scanner_.price_of(stable) * (1.0 - setup_.execution.max_slippage);
    const double received = executor_.convert(profit_token, stable, amount_in, min_out);
    ARBX_LOG_INFO("Converted {} {} into {} {}", amount_in, address::shorten(profit_token),
                  received, address::shorten(stable));
    return amount_in;
}

void ArbitrageEngine::book(ExecutionReport& report, const TradeResult& trade, double profit,
                           const Conversion& conversion) {
    if (conversion.excess > 0.0) {
        report.super_profit_converted = conversion.excess;
        events_.push_event(SuperProfitConvertedEvent{conversion.excess, report.attempt_id});
    }

    SettledTrade settled;
    settled.attempt_id = report.attempt_id;
    settled.strategy = report.strategy;
    settled.token_in = trade.token_in;
    settled.token_out = trade.token_out;
    settled.amount = trade.amount_in;
    settled.profit = profit;
    settled.settled_at = utils::CryptoUtils::current_timestamp_ms();
    ledger_.record(settled);
}

ExecutionReport& ArbitrageEngine::reject(ExecutionReport& report, FailureKind kind, const std::string& reason) {
    report.final_state = ExecutionState::IDLE;
    report.success = false;
    report.failure = kind;
    report.reason = reason;

    events_.push_event(ArbitrageFailedEvent{reason, report.attempt_id});
    utils::TradingLogger::log_trade_failed(report.attempt_id, to_string(report.strategy),
                                           std::string(to_string(kind)) + ": " + reason);
    return report;
}

ExecutionReport& ArbitrageEngine::fail(ExecutionReport& report, FailureKind kind, const std::string& reason) {
    set_state(ExecutionState::FAILED);
    report.final_state = ExecutionState::FAILED;
    report.success = false;
    report.failure = kind;
    report.reason = reason;

    events_.push_event(ArbitrageFailedEvent{reason, report.attempt_id});
    utils::TradingLogger::log_trade_failed(report.attempt_id, to_string(report.strategy),
                                           std::string(to_string(kind)) + ": " + reason);
    set_state(ExecutionState::IDLE);
    return report;
}

} // namespace arbx
