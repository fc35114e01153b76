#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "types.hpp"
#include "venue/price_oracle.hpp"

namespace arbx {

struct PriceFeedSettings {
    long long max_staleness_sec = 3600;
    long long max_future_skew_sec = 300;
    double max_deviation = 0.0;  // relative spread across sources, 0 disables the check
};

// Folds several oracles into one validated price: stale, unanswered and
// non-positive readings are dropped, the median of the rest is returned.
class PriceFeed {
public:
    using Clock = std::function<long long()>;  // unix seconds

    PriceFeed(std::vector<std::shared_ptr<PriceOracle>> oracles,
              const PriceFeedSettings& settings,
              Clock clock = Clock());
    virtual ~PriceFeed() = default;

    // Throws OracleError when no source yields a valid reading
    virtual double get_price(const Address& token);

    size_t oracle_count() const { return oracles_.size(); }
    const PriceFeedSettings& settings() const { return settings_; }

private:
    bool is_valid(const OracleReading& reading, long long now, std::string& why) const;

    std::vector<std::shared_ptr<PriceOracle>> oracles_;
    PriceFeedSettings settings_;
    Clock clock_;
};

} // namespace arbx
