#pragma once

#include "atomic_sequence.hpp"
#include "utils/address.hpp"

namespace arbx {

class SwapRouter : public AtomicSequence {
public:
    virtual ~SwapRouter() = default;

    virtual Address address() const = 0;

    // Quote including venue fees; throws VenueException when no route exists
    virtual double get_amount_out(double amount_in, const Address& token_in, const Address& token_out) = 0;

    // Depth of the token_in side of the pair, in token_in units
    virtual double get_liquidity(const Address& token_in, const Address& token_out) = 0;

    // Returns the amount actually delivered to recipient.
    // Throws VenueException if the output would fall below min_amount_out.
    virtual double swap_exact_tokens_for_tokens(double amount_in, double min_amount_out,
                                                const Address& token_in, const Address& token_out,
                                                const Address& recipient) = 0;
};

} // namespace arbx
