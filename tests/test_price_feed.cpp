#include <gtest/gtest.h>
#include "core/price_feed.hpp"
#include "core/exceptions.hpp"
#include "venue/venue_exception.hpp"
#include "mocks/mock_price_oracle.hpp"

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

constexpr long long kNow = 1700000000;
const arbx::Address kToken = arbx::address::from_index(0xa1);

arbx::OracleReading reading(double price, long long updated_at = kNow, bool answered = true) {
    arbx::OracleReading r;
    r.price = price;
    r.updated_at = updated_at;
    r.answered = answered;
    return r;
}

} // namespace

class PriceFeedTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<arbx::testing::MockPriceOracle>> make_oracle(unsigned long long index) {
        auto oracle = std::make_shared<NiceMock<arbx::testing::MockPriceOracle>>();
        ON_CALL(*oracle, address()).WillByDefault(Return(arbx::address::from_index(index)));
        return oracle;
    }

    arbx::PriceFeed make_feed(std::vector<std::shared_ptr<arbx::PriceOracle>> oracles) {
        return arbx::PriceFeed(std::move(oracles), settings, []() { return kNow; });
    }

    arbx::PriceFeedSettings settings;
};

TEST_F(PriceFeedTest, SingleValidReading) {
    auto oracle = make_oracle(1);
    ON_CALL(*oracle, latest_reading(kToken)).WillByDefault(Return(reading(2000.0, kNow - 10)));

    auto feed = make_feed({oracle});
    EXPECT_DOUBLE_EQ(feed.get_price(kToken), 2000.0);
}

TEST_F(PriceFeedTest, MedianOfSeveralSources) {
    auto a = make_oracle(1);
    auto b = make_oracle(2);
    auto c = make_oracle(3);
    ON_CALL(*a, latest_reading(_)).WillByDefault(Return(reading(101.0)));
    ON_CALL(*b, latest_reading(_)).WillByDefault(Return(reading(99.0)));
    ON_CALL(*c, latest_reading(_)).WillByDefault(Return(reading(100.0)));

    auto feed = make_feed({a, b, c});
    EXPECT_DOUBLE_EQ(feed.get_price(kToken), 100.0);
}

TEST_F(PriceFeedTest, StaleReadingIsSkipped) {
    settings.max_staleness_sec = 60;
    auto stale = make_oracle(1);
    auto fresh = make_oracle(2);
    ON_CALL(*stale, latest_reading(_)).WillByDefault(Return(reading(500.0, kNow - 61)));
    ON_CALL(*fresh, latest_reading(_)).WillByDefault(Return(reading(100.0, kNow - 59)));

    auto feed = make_feed({stale, fresh});
    EXPECT_DOUBLE_EQ(feed.get_price(kToken), 100.0);
}

TEST_F(PriceFeedTest, OnlyStaleReadingsIsOracleError) {
    settings.max_staleness_sec = 60;
    auto stale = make_oracle(1);
    ON_CALL(*stale, latest_reading(_)).WillByDefault(Return(reading(100.0, kNow - 3600)));

    auto feed = make_feed({stale});
    EXPECT_THROW(feed.get_price(kToken), arbx::OracleError);
}

TEST_F(PriceFeedTest, NonPositiveAndUnansweredReadingsAreInvalid) {
    auto zero = make_oracle(1);
    auto negative = make_oracle(2);
    auto unanswered = make_oracle(3);
    auto no_timestamp = make_oracle(4);
    ON_CALL(*zero, latest_reading(_)).WillByDefault(Return(reading(0.0)));
    ON_CALL(*negative, latest_reading(_)).WillByDefault(Return(reading(-5.0)));
    ON_CALL(*unanswered, latest_reading(_)).WillByDefault(Return(reading(100.0, kNow, false)));
    ON_CALL(*no_timestamp, latest_reading(_)).WillByDefault(Return(reading(100.0, 0)));

    auto feed = make_feed({zero, negative, unanswered, no_timestamp});
    EXPECT_THROW(feed.get_price(kToken), arbx::OracleError);
}

TEST_F(PriceFeedTest, FutureTimestampBeyondSkewIsInvalid) {
    settings.max_future_skew_sec = 30;
    auto oracle = make_oracle(1);
    ON_CALL(*oracle, latest_reading(_)).WillByDefault(Return(reading(100.0, kNow + 31)));

    auto feed = make_feed({oracle});
    EXPECT_THROW(feed.get_price(kToken), arbx::OracleError);
}

TEST_F(PriceFeedTest, FailingOrSilentSourceFallsBackToOthers) {
    auto failing = make_oracle(1);
    auto silent = make_oracle(2);
    auto healthy = make_oracle(3);
    ON_CALL(*failing, latest_reading(_)).WillByDefault(Throw(arbx::VenueException("rpc timeout")));
    ON_CALL(*silent, latest_reading(_)).WillByDefault(Return(std::nullopt));
    ON_CALL(*healthy, latest_reading(_)).WillByDefault(Return(reading(42.0)));

    auto feed = make_feed({failing, silent, healthy});
    EXPECT_DOUBLE_EQ(feed.get_price(kToken), 42.0);
}

TEST_F(PriceFeedTest, DisagreeingSourcesRejectedWhenDeviationBounded) {
    settings.max_deviation = 0.01;
    auto a = make_oracle(1);
    auto b = make_oracle(2);
    ON_CALL(*a, latest_reading(_)).WillByDefault(Return(reading(100.0)));
    ON_CALL(*b, latest_reading(_)).WillByDefault(Return(reading(110.0)));

    auto feed = make_feed({a, b});
    EXPECT_THROW(feed.get_price(kToken), arbx::OracleError);

    settings.max_deviation = 0.0;
    auto unbounded = make_feed({a, b});
    EXPECT_DOUBLE_EQ(unbounded.get_price(kToken), 105.0);
}
