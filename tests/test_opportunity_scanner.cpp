#include <gtest/gtest.h>
#include "core/opportunity_scanner.hpp"
#include "core/exceptions.hpp"
#include "venue/venue_exception.hpp"
#include "mocks/mock_swap_router.hpp"
#include "mocks/mock_price_oracle.hpp"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

constexpr long long kNow = 1700000000;
const arbx::Address kT1 = arbx::address::from_index(0xa1);
const arbx::Address kT2 = arbx::address::from_index(0xa2);
const arbx::Address kT3 = arbx::address::from_index(0xa3);

using Pair = std::pair<arbx::Address, arbx::Address>;

} // namespace

class OpportunityScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        oracle = std::make_shared<NiceMock<arbx::testing::MockPriceOracle>>();
        ON_CALL(*oracle, address()).WillByDefault(Return(arbx::address::from_index(0x60)));
        ON_CALL(*oracle, latest_reading(_)).WillByDefault(Return(arbx::OracleReading{1.0, kNow, true}));

        feed = std::make_unique<arbx::PriceFeed>(
            std::vector<std::shared_ptr<arbx::PriceOracle>>{oracle}, arbx::PriceFeedSettings{},
            []() { return kNow; });

        settings.max_slippage = 0.005;
        settings.gas_units_per_swap = 0.0;

        gate.set_thresholds(100.0, 1.0, 5.0, 0.0);
        for (const auto& token : {kT1, kT2, kT3}) {
            gate.approve(token);
        }
        scanner = std::make_unique<arbx::OpportunityScanner>(gate, router, *feed, settings, kT1);
    }

    void quote(const arbx::Address& in, const arbx::Address& out, double amount_out) {
        ON_CALL(router, get_amount_out(_, in, out)).WillByDefault(Return(amount_out));
    }

    arbx::RiskGate gate;
    NiceMock<arbx::testing::MockSwapRouter> router;
    std::shared_ptr<NiceMock<arbx::testing::MockPriceOracle>> oracle;
    std::unique_ptr<arbx::PriceFeed> feed;
    arbx::ExecutionSettings settings;
    std::unique_ptr<arbx::OpportunityScanner> scanner;
    arbx::ScanContext context{50.0, 0.0};
};

TEST_F(OpportunityScannerTest, EnumeratesOrderedPairsInInsertionOrder) {
    std::vector<Pair> expected = {
        {kT1, kT2}, {kT1, kT3}, {kT2, kT1}, {kT2, kT3}, {kT3, kT1}, {kT3, kT2}
    };
    EXPECT_EQ(scanner->candidate_pairs(), expected);
}

TEST_F(OpportunityScannerTest, BlacklistedTokenIsNeverPaired) {
    gate.blacklist(kT2);

    std::vector<Pair> expected = {{kT1, kT3}, {kT3, kT1}};
    EXPECT_EQ(scanner->candidate_pairs(), expected);

    // The router is never asked about T2, and no returned pair touches it
    EXPECT_CALL(router, get_amount_out(_, kT2, _)).Times(0);
    EXPECT_CALL(router, get_amount_out(_, _, kT2)).Times(0);
    EXPECT_CALL(router, get_amount_out(_, kT1, kT3)).Times(AnyNumber()).WillRepeatedly(Return(100.0));
    EXPECT_CALL(router, get_amount_out(_, kT3, kT1)).Times(AnyNumber()).WillRepeatedly(Return(103.0));

    auto opportunity = scanner->find_opportunity(100.0, context);
    ASSERT_TRUE(opportunity.has_value());
    EXPECT_NE(opportunity->token_in, kT2);
    EXPECT_NE(opportunity->token_out, kT2);
}

TEST_F(OpportunityScannerTest, ProfitBelowThresholdIsNoOpportunity) {
    gate.blacklist(kT3);
    quote(kT1, kT2, 100.0);
    quote(kT2, kT1, 100.5);

    // 0.5 against a threshold of 1
    EXPECT_FALSE(scanner->find_opportunity(100.0, context).has_value());
}

TEST_F(OpportunityScannerTest, FirstQualifyingPairWins) {
    quote(kT1, kT2, 100.0);
    quote(kT2, kT1, 100.0);
    quote(kT1, kT3, 100.0);
    quote(kT3, kT1, 102.0);
    quote(kT3, kT2, 100.0);
    quote(kT2, kT3, 110.0);

    // (T1,T3) qualifies before the more profitable (T2,T3) is reached
    EXPECT_CALL(router, get_amount_out(_, kT2, kT3)).Times(0);

    auto opportunity = scanner->find_opportunity(100.0, context);
    ASSERT_TRUE(opportunity.has_value());
    EXPECT_EQ(opportunity->token_in, kT1);
    EXPECT_EQ(opportunity->token_out, kT3);
    EXPECT_DOUBLE_EQ(opportunity->expected_intermediate, 100.0);
    EXPECT_DOUBLE_EQ(opportunity->expected_return, 102.0);
    EXPECT_DOUBLE_EQ(opportunity->expected_profit, 2.0);
}

TEST_F(OpportunityScannerTest, PairWithoutRouteIsSkipped) {
    ON_CALL(router, get_amount_out(_, kT1, kT2)).WillByDefault(Throw(arbx::VenueException("no pool")));
    quote(kT1, kT3, 50.0);
    quote(kT3, kT1, 105.0);

    auto opportunity = scanner->find_opportunity(100.0, context);
    ASSERT_TRUE(opportunity.has_value());
    EXPECT_EQ(opportunity->token_out, kT3);
}

TEST_F(OpportunityScannerTest, InvalidOraclePriceAbortsScan) {
    quote(kT1, kT2, 100.0);
    quote(kT2, kT1, 110.0);
    ON_CALL(*oracle, latest_reading(_)).WillByDefault(Return(arbx::OracleReading{0.0, kNow, true}));

    EXPECT_THROW(scanner->find_opportunity(100.0, context), arbx::OracleError);
}

TEST_F(OpportunityScannerTest, GasAndLoanPremiumReduceExpectedProfit) {
    settings.gas_units_per_swap = 100000.0;
    scanner = std::make_unique<arbx::OpportunityScanner>(gate, router, *feed, settings, kT1);
    ON_CALL(*oracle, latest_reading(kT1)).WillByDefault(Return(arbx::OracleReading{2.0, kNow, true}));

    // 50 gwei * 100000 * 2 legs = 0.01 native, at price 2
    EXPECT_DOUBLE_EQ(scanner->gas_cost(50.0), 0.02);
    EXPECT_DOUBLE_EQ(scanner->gas_cost(0.0), 0.0);

    arbx::ScanContext flash{50.0, 0.01};
    quote(kT1, kT2, 100.0);
    quote(kT2, kT1, 103.0);

    auto opportunity = scanner->evaluate_pair(kT1, kT2, 100.0, flash);
    ASSERT_TRUE(opportunity.has_value());
    // (103 - 100) * 2 - 0.02 - 100 * 0.01 * 2
    EXPECT_NEAR(opportunity->expected_profit, 3.98, 1e-9);
}

TEST_F(OpportunityScannerTest, LiquidityGateSkipsShallowPairs) {
    gate.set_thresholds(100.0, 1.0, 5.0, 10000.0);
    quote(kT1, kT2, 100.0);
    quote(kT2, kT1, 110.0);
    ON_CALL(router, get_liquidity(kT1, kT2)).WillByDefault(Return(500.0));
    ON_CALL(router, get_liquidity(kT1, kT3)).WillByDefault(Return(50000.0));
    quote(kT1, kT3, 100.0);
    quote(kT3, kT1, 104.0);

    auto opportunity = scanner->find_opportunity(100.0, context);
    ASSERT_TRUE(opportunity.has_value());
    EXPECT_EQ(opportunity->token_out, kT3);
}

TEST_F(OpportunityScannerTest, FindFromRestrictsFundingToken) {
    quote(kT1, kT2, 100.0);
    quote(kT2, kT1, 100.0);
    quote(kT1, kT3, 100.0);
    quote(kT3, kT1, 100.0);
    quote(kT2, kT3, 100.0);
    quote(kT3, kT2, 120.0);

    EXPECT_TRUE(scanner->find_opportunity(100.0, context).has_value());
    EXPECT_FALSE(scanner->find_opportunity_from(kT1, 100.0, context).has_value());

    auto from_t2 = scanner->find_opportunity_from(kT2, 100.0, context);
    ASSERT_TRUE(from_t2.has_value());
    EXPECT_EQ(from_t2->token_in, kT2);
    EXPECT_EQ(from_t2->token_out, kT3);
}
