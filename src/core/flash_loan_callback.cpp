#include "flash_loan_callback.hpp"
#include "exceptions.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/logger.hpp"
#include <cmath>
#include <nlohmann/json.hpp>

namespace arbx {

namespace {
constexpr double kAmountTolerance = 1e-9;
}

FlashLoanCallback::FlashLoanCallback(const Address& lending_pool, const Address& self,
                                     TradeExecutor& executor, BalanceBook& balances)
    : lending_pool_(lending_pool), self_(self), executor_(executor), balances_(balances) {}

bool FlashLoanCallback::on_loan_received(const Address& caller,
                                         const std::vector<Address>& assets,
                                         const std::vector<double>& amounts,
                                         const std::vector<double>& fees,
                                         const Address& initiator,
                                         const std::string& params) {
    if (caller != lending_pool_) {
        throw AuthorizationError("flash loan callback from " + caller + ", expected lending pool " + lending_pool_);
    }
    if (initiator != self_) {
        throw AuthorizationError("flash loan initiated by " + initiator + ", not by this executor");
    }
    if (pending_ == nullptr) {
        throw AuthorizationError("flash loan callback with no loan in flight");
    }
    if (!utils::CryptoUtils::secure_compare(utils::CryptoUtils::sha256_hex(params), pending_->params_digest)) {
        throw AuthorizationError("flash loan params differ from the request");
    }

    Opportunity opportunity = decode_params(params);
    verify_loan_terms(assets, amounts, fees, opportunity);

    ARBX_LOG_INFO("Flash loan received: {} of {} (fee {})",
                  amounts.front(), address::shorten(assets.front()), fees.front());

    TradeResult trade = executor_.execute_borrowed(opportunity);

    for (size_t i = 0; i < assets.size(); ++i) {
        const double owed = amounts[i] + fees[i];
        const double available = assets[i] == trade.token_in ? trade.amount_out : 0.0;
        if (available + kAmountTolerance < owed) {
            throw TradingError("insufficient repayment for " + address::shorten(assets[i]) +
                               ": proceeds " + std::to_string(available) +
                               " < principal + fee " + std::to_string(owed));
        }
    }

    double spent = 0.0;
    if (pending_->settle) {
        spent = pending_->settle(trade, fees.front());
    }

    for (size_t i = 0; i < assets.size(); ++i) {
        const double owed = amounts[i] + fees[i];
        if (balances_.balance_of(assets[i]) + kAmountTolerance < owed) {
            throw TradingError("balance cannot cover repayment of " + std::to_string(owed));
        }
        balances_.approve(lending_pool_, assets[i], owed);
    }

    pending_->trade = trade;
    pending_->fees = fees;
    pending_->settlement_spent = spent;
    pending_->repayment_approved = true;
    return true;
}

void FlashLoanCallback::verify_loan_terms(const std::vector<Address>& assets,
                                          const std::vector<double>& amounts,
                                          const std::vector<double>& fees,
                                          const Opportunity& opportunity) const {
    const FlashLoanRequest& request = pending_->request;
    if (assets != request.assets || amounts.size() != request.amounts.size() ||
        fees.size() != assets.size()) {
        throw CollaboratorError("flash loan delivered different assets than requested");
    }
    for (size_t i = 0; i < amounts.size(); ++i) {
        if (std::fabs(amounts[i] - request.amounts[i]) > kAmountTolerance) {
            throw CollaboratorError("flash loan delivered " + std::to_string(amounts[i]) +
                                    " instead of " + std::to_string(request.amounts[i]));
        }
        if (!std::isfinite(fees[i]) || fees[i] < 0.0) {
            throw CollaboratorError("flash loan reported an invalid fee");
        }
    }
    if (opportunity.token_in != assets.front() ||
        std::fabs(opportunity.amount - amounts.front()) > kAmountTolerance) {
        throw ValidationError("flash loan params do not describe the borrowed funds");
    }
}

std::string FlashLoanCallback::encode_params(const Opportunity& opportunity) {
    return nlohmann::json(opportunity).dump();
}

Opportunity FlashLoanCallback::decode_params(const std::string& params) {
    try {
        return nlohmann::json::parse(params).get<Opportunity>();
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("malformed flash loan params: ") + e.what());
    }
}

} // namespace arbx
