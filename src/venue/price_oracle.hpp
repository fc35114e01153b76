#pragma once

#include <optional>
#include "utils/address.hpp"

namespace arbx {

struct OracleReading {
    double price = 0.0;        // quote units per whole token
    long long updated_at = 0;  // unix seconds
    bool answered = true;      // false when the round is incomplete
};

class PriceOracle {
public:
    virtual ~PriceOracle() = default;

    virtual Address address() const = 0;

    // std::nullopt when the oracle does not cover the token
    virtual std::optional<OracleReading> latest_reading(const Address& token) = 0;
};

class GasPriceOracle {
public:
    virtual ~GasPriceOracle() = default;

    virtual Address address() const = 0;

    // gwei
    virtual double latest_gas_price() = 0;
};

} // namespace arbx
