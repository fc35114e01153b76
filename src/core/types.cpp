#include "core/types.hpp"

namespace arbx {

const char* to_string(ExecutionState state) {
    switch (state) {
        case ExecutionState::IDLE: return "Idle";
        case ExecutionState::SCANNING: return "Scanning";
        case ExecutionState::EXECUTING: return "Executing";
        case ExecutionState::SETTLED: return "Settled";
        case ExecutionState::FAILED: return "Failed";
    }
    return "Unknown";
}

const char* to_string(Strategy strategy) {
    switch (strategy) {
        case Strategy::DIRECT: return "direct";
        case Strategy::FLASH_LOAN: return "flashloan";
    }
    return "unknown";
}

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::NONE: return "none";
        case FailureKind::RISK_REJECTION: return "risk_rejection";
        case FailureKind::NO_OPPORTUNITY: return "no_opportunity";
        case FailureKind::ORACLE_INVALID: return "oracle_invalid";
        case FailureKind::COLLABORATOR_FAILURE: return "collaborator_failure";
        case FailureKind::TRADING_ERROR: return "trading_error";
    }
    return "unknown";
}

bool FlashLoanRequest::is_well_formed() const {
    if (assets.empty() || assets.size() != amounts.size() || assets.size() != modes.size()) {
        return false;
    }
    for (size_t i = 0; i < assets.size(); ++i) {
        if (address::is_zero(assets[i]) || amounts[i] <= 0.0 || modes[i] != 0) {
            return false;
        }
    }
    return true;
}

} // namespace arbx
