#include "balance_book.hpp"
#include "exceptions.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace arbx {

namespace {
// Rounding slack for amounts that went through floating point pricing
constexpr double kDust = 1e-12;
}

BalanceBook::BalanceBook(const Address& owner)
    : owner_(owner) {}

double BalanceBook::balance_of(const Address& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(token);
    if (it != balances_.end()) {
        return it->second;
    }
    return 0.0;
}

void BalanceBook::credit(const Address& token, double amount) {
    if (amount < 0.0) {
        throw ValidationError("negative credit of " + std::to_string(amount));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[token] += amount;
}

void BalanceBook::debit(const Address& token, double amount) {
    if (amount < 0.0) {
        throw ValidationError("negative debit of " + std::to_string(amount));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    double& balance = balances_[token];
    if (balance + kDust < amount) {
        throw TradingError("insufficient balance of " + address::shorten(token) +
                           ": have " + std::to_string(balance) +
                           ", need " + std::to_string(amount));
    }
    balance = std::max(0.0, balance - amount);
}

void BalanceBook::approve(const Address& spender, const Address& token, double amount) {
    if (amount < 0.0) {
        throw ValidationError("negative allowance");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    allowances_[{spender, token}] = amount;
}

double BalanceBook::allowance(const Address& spender, const Address& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find({spender, token});
    if (it != allowances_.end()) {
        return it->second;
    }
    return 0.0;
}

void BalanceBook::transfer_in(const Address& from, const Address& token, double amount) {
    ARBX_LOG_DEBUG("Transfer in: {} of {} from {}", amount, address::shorten(token), address::shorten(from));
    credit(token, amount);
}

void BalanceBook::transfer_from(const Address& spender, const Address& token, double amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto allowance_it = allowances_.find({spender, token});
    double granted = allowance_it != allowances_.end() ? allowance_it->second : 0.0;
    if (granted + kDust < amount) {
        throw TradingError("allowance of " + address::shorten(spender) + " for " +
                           address::shorten(token) + " is " + std::to_string(granted) +
                           ", pull of " + std::to_string(amount) + " refused");
    }
    double& balance = balances_[token];
    if (balance + kDust < amount) {
        throw TradingError("insufficient balance of " + address::shorten(token) +
                           " for pull of " + std::to_string(amount));
    }
    balance = std::max(0.0, balance - amount);
    if (allowance_it != allowances_.end()) {
        allowance_it->second = std::max(0.0, granted - amount);
    }
}

BalanceBook::Snapshot BalanceBook::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Snapshot{balances_, allowances_};
}

void BalanceBook::restore(const Snapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_ = snapshot.balances;
    allowances_ = snapshot.allowances;
}

} // namespace arbx
