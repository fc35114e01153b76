#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "utils/address.hpp"

namespace arbx {

enum class ExecutionState {
    IDLE,
    SCANNING,
    EXECUTING,
    SETTLED,
    FAILED
};

enum class Strategy {
    DIRECT,
    FLASH_LOAN
};

enum class FailureKind {
    NONE,
    RISK_REJECTION,
    NO_OPPORTUNITY,
    ORACLE_INVALID,
    COLLABORATOR_FAILURE,
    TRADING_ERROR
};

const char* to_string(ExecutionState state);
const char* to_string(Strategy strategy);
const char* to_string(FailureKind kind);

struct TokenRef {
    Address address;
    bool approved = false;
    bool blacklisted = false;

    // Blacklisting always wins over approval
    bool is_eligible() const { return approved && !blacklisted; }
};

// All thresholds are in the oracle quote unit
struct RiskConfig {
    double gas_price_limit = 0.0;
    double profit_threshold = 0.0;
    double super_profit_threshold = 0.0;
    double liquidity_threshold = 0.0;
    bool is_paused = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(RiskConfig, gas_price_limit, profit_threshold, super_profit_threshold, liquidity_threshold, is_paused)

// Execution parameters shared by scanner and executor
struct ExecutionSettings {
    double max_slippage = 0.005;            // fraction of the quoted output
    double gas_units_per_swap = 150000.0;   // gas paid per router leg
};

// Round trip token_in -> token_out -> token_in, recomputed on every attempt
struct Opportunity {
    Address token_in;
    Address token_out;
    double amount = 0.0;
    double expected_intermediate = 0.0;  // token_out received on the first leg
    double expected_return = 0.0;        // token_in received on the second leg
    double expected_profit = 0.0;        // reference units, net of gas and loan premium
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Opportunity, token_in, token_out, amount, expected_intermediate, expected_return, expected_profit)

struct FlashLoanRequest {
    std::vector<Address> assets;
    std::vector<double> amounts;
    std::vector<int> modes;  // 0 = repay within the same sequence

    bool is_well_formed() const;
};

// Token amounts actually moved by a round trip
struct TradeResult {
    Address token_in;
    Address token_out;
    double amount_in = 0.0;
    double intermediate_out = 0.0;
    double amount_out = 0.0;
};

struct ExecutionReport {
    std::string attempt_id;
    Strategy strategy = Strategy::DIRECT;
    ExecutionState final_state = ExecutionState::IDLE;
    bool success = false;
    FailureKind failure = FailureKind::NONE;
    std::string reason;
    std::optional<Opportunity> opportunity;
    double realized_profit = 0.0;
    double super_profit_converted = 0.0;
};

} // namespace arbx
