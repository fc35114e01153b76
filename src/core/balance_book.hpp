#pragma once

#include <map>
#include <string>
#include <mutex>
#include <utility>
#include "types.hpp"
#include "venue/lending_pool.hpp"

namespace arbx {

// The executor's own token holdings and the allowances it has granted.
// Snapshots let a failed attempt put every balance back exactly.
class BalanceBook : public TokenCustody {
public:
    struct Snapshot {
        std::map<Address, double> balances;
        std::map<std::pair<Address, Address>, double> allowances;  // (spender, token)
    };

    explicit BalanceBook(const Address& owner);

    const Address& owner() const { return owner_; }

    double balance_of(const Address& token) const;
    void credit(const Address& token, double amount);
    // Throws TradingError when the balance does not cover amount
    void debit(const Address& token, double amount);

    void approve(const Address& spender, const Address& token, double amount);
    double allowance(const Address& spender, const Address& token) const;

    // TokenCustody
    void transfer_in(const Address& from, const Address& token, double amount) override;
    void transfer_from(const Address& spender, const Address& token, double amount) override;

    Snapshot snapshot() const;
    void restore(const Snapshot& snapshot);

private:
    Address owner_;
    mutable std::mutex mutex_;
    std::map<Address, double> balances_;
    std::map<std::pair<Address, Address>, double> allowances_;
};

} // namespace arbx
