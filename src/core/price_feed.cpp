#include "price_feed.hpp"
#include "exceptions.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>

namespace arbx {

PriceFeed::PriceFeed(std::vector<std::shared_ptr<PriceOracle>> oracles,
                     const PriceFeedSettings& settings,
                     Clock clock)
    : oracles_(std::move(oracles)), settings_(settings), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = []() { return utils::CryptoUtils::current_timestamp_sec(); };
    }
}

double PriceFeed::get_price(const Address& token) {
    const long long now = clock_();
    std::vector<double> prices;
    prices.reserve(oracles_.size());

    for (const auto& oracle : oracles_) {
        std::optional<OracleReading> reading;
        try {
            reading = oracle->latest_reading(token);
        } catch (const std::exception& e) {
            ARBX_LOG_WARN("Oracle {} failed for {}: {}",
                          address::shorten(oracle->address()), address::shorten(token), e.what());
            continue;
        }
        if (!reading) {
            continue;
        }

        std::string why;
        if (!is_valid(*reading, now, why)) {
            ARBX_LOG_WARN("Oracle {} reading for {} rejected: {}",
                          address::shorten(oracle->address()), address::shorten(token), why);
            continue;
        }
        prices.push_back(reading->price);
    }

    if (prices.empty()) {
        throw OracleError("no valid price for " + token);
    }

    std::sort(prices.begin(), prices.end());
    const size_t mid = prices.size() / 2;
    const double median = prices.size() % 2 == 1 ? prices[mid] : (prices[mid - 1] + prices[mid]) / 2.0;

    if (settings_.max_deviation > 0.0 && prices.size() > 1) {
        double deviation = (prices.back() - prices.front()) / median;
        if (deviation > settings_.max_deviation) {
            throw OracleError("sources disagree on " + token + " by " +
                              std::to_string(deviation * 100.0) + "%");
        }
    }

    return median;
}

bool PriceFeed::is_valid(const OracleReading& reading, long long now, std::string& why) const {
    if (!reading.answered) {
        why = "round not answered";
        return false;
    }
    if (!std::isfinite(reading.price) || reading.price <= 0.0) {
        why = "non-positive price " + std::to_string(reading.price);
        return false;
    }
    if (reading.updated_at <= 0) {
        why = "missing timestamp";
        return false;
    }
    if (now - reading.updated_at > settings_.max_staleness_sec) {
        why = "stale by " + std::to_string(now - reading.updated_at) + "s";
        return false;
    }
    if (reading.updated_at - now > settings_.max_future_skew_sec) {
        why = "timestamp in the future";
        return false;
    }
    return true;
}

} // namespace arbx
