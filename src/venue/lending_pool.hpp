#pragma once

#include <string>
#include <vector>
#include "core/types.hpp"
#include "atomic_sequence.hpp"

namespace arbx {

// Token movements the lending pool performs against a borrower
class TokenCustody {
public:
    virtual ~TokenCustody() = default;

    virtual void transfer_in(const Address& from, const Address& token, double amount) = 0;

    // Pulls amount against the allowance granted to spender; throws when not covered
    virtual void transfer_from(const Address& spender, const Address& token, double amount) = 0;
};

class FlashLoanReceiver {
public:
    virtual ~FlashLoanReceiver() = default;

    virtual bool on_loan_received(const Address& caller,
                                  const std::vector<Address>& assets,
                                  const std::vector<double>& amounts,
                                  const std::vector<double>& fees,
                                  const Address& initiator,
                                  const std::string& params) = 0;
};

class LendingPool : public AtomicSequence {
public:
    virtual ~LendingPool() = default;

    virtual Address address() const = 0;

    // Fee as a fraction of principal
    virtual double flash_loan_premium() const = 0;

    // Lends, invokes the receiver once, pulls principal + fee.
    // Any failure (callback false or throwing, missing repayment) unwinds the
    // loan and surfaces as an exception.
    virtual void flash_loan(const Address& initiator,
                            FlashLoanReceiver& receiver,
                            TokenCustody& custody,
                            const FlashLoanRequest& request,
                            const std::string& params) = 0;
};

} // namespace arbx
