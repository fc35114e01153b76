#include <gtest/gtest.h>
#include "core/risk_gate.hpp"
#include "core/exceptions.hpp"
#include "mocks/mock_event_pusher.hpp"

using ::testing::_;
using ::testing::NiceMock;

namespace {

const arbx::Address kT1 = arbx::address::from_index(0xa1);
const arbx::Address kT2 = arbx::address::from_index(0xa2);

template <typename T>
bool holds(const arbx::Event& event) {
    return std::holds_alternative<T>(event);
}

} // namespace

class RiskGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        gate = std::make_unique<arbx::RiskGate>(&pusher);
        gate->set_thresholds(100.0, 1.0, 5.0, 0.0);
    }

    NiceMock<arbx::testing::MockEventPusher> pusher;
    std::unique_ptr<arbx::RiskGate> gate;
};

TEST_F(RiskGateTest, AdmitsGasAtOrBelowLimit) {
    EXPECT_TRUE(gate->admit(50.0));
    EXPECT_TRUE(gate->admit(100.0));
    EXPECT_FALSE(gate->admit(100.5));
    EXPECT_NE(gate->admission_failure(150.0).find("exceeds limit"), std::string::npos);
    EXPECT_TRUE(gate->admission_failure(100.0).empty());
}

TEST_F(RiskGateTest, PausedGateRejectsEverything) {
    EXPECT_CALL(pusher, push_event(::testing::Truly(holds<arbx::PausedEvent>))).Times(1);
    gate->pause();

    EXPECT_TRUE(gate->is_paused());
    EXPECT_FALSE(gate->admit(1.0));
    EXPECT_EQ(gate->admission_failure(1.0), "execution is paused");
}

TEST_F(RiskGateTest, PauseTwiceFailsWithoutSecondEvent) {
    EXPECT_CALL(pusher, push_event(_)).Times(1);
    gate->pause();
    EXPECT_THROW(gate->pause(), arbx::ValidationError);
    EXPECT_TRUE(gate->is_paused());
}

TEST_F(RiskGateTest, UnpauseRequiresPausedGate) {
    EXPECT_THROW(gate->unpause(), arbx::ValidationError);

    gate->pause();
    EXPECT_CALL(pusher, push_event(::testing::Truly(holds<arbx::UnpausedEvent>))).Times(1);
    gate->unpause();
    EXPECT_FALSE(gate->is_paused());
    EXPECT_TRUE(gate->admit(10.0));
}

TEST_F(RiskGateTest, SetThresholdsEmitsUpdatedConfig) {
    EXPECT_CALL(pusher, push_event(::testing::Truly([](const arbx::Event& event) {
        auto* updated = std::get_if<arbx::ThresholdsUpdatedEvent>(&event);
        return updated != nullptr && updated->config.gas_price_limit == 80.0 &&
               updated->config.super_profit_threshold == 20.0;
    }))).Times(1);

    gate->set_thresholds(80.0, 2.0, 20.0, 1000.0);

    arbx::RiskConfig config = gate->config();
    EXPECT_DOUBLE_EQ(config.gas_price_limit, 80.0);
    EXPECT_DOUBLE_EQ(config.profit_threshold, 2.0);
    EXPECT_DOUBLE_EQ(config.super_profit_threshold, 20.0);
    EXPECT_DOUBLE_EQ(config.liquidity_threshold, 1000.0);
}

TEST_F(RiskGateTest, SetThresholdsRejectsInvalidValuesAndKeepsConfig) {
    EXPECT_CALL(pusher, push_event(_)).Times(0);

    EXPECT_THROW(gate->set_thresholds(100.0, 5.0, 1.0, 0.0), arbx::ValidationError);
    EXPECT_THROW(gate->set_thresholds(-1.0, 1.0, 5.0, 0.0), arbx::ValidationError);
    EXPECT_THROW(gate->set_thresholds(100.0, 1.0, 5.0, std::nan("")), arbx::ValidationError);

    EXPECT_DOUBLE_EQ(gate->config().profit_threshold, 1.0);
    EXPECT_DOUBLE_EQ(gate->config().super_profit_threshold, 5.0);
}

TEST_F(RiskGateTest, ApproveAddsToMonitoredSetInOrder) {
    EXPECT_CALL(pusher, push_event(::testing::Truly(holds<arbx::TokenApprovedEvent>))).Times(2);
    gate->approve(kT2);
    gate->approve(kT1);

    EXPECT_EQ(gate->monitored_tokens(), (std::vector<arbx::Address>{kT2, kT1}));
    EXPECT_TRUE(gate->is_eligible(kT1));
    EXPECT_TRUE(gate->is_eligible(kT2));
}

TEST_F(RiskGateTest, ApproveTwiceFailsWithNoStateChange) {
    gate->approve(kT1);

    EXPECT_CALL(pusher, push_event(_)).Times(0);
    EXPECT_THROW(gate->approve(kT1), arbx::ValidationError);
    EXPECT_EQ(gate->monitored_tokens().size(), 1u);
}

TEST_F(RiskGateTest, ApproveRejectsZeroAddress) {
    EXPECT_THROW(gate->approve(arbx::address::ZERO), arbx::ValidationError);
    EXPECT_THROW(gate->approve(""), arbx::ValidationError);
    EXPECT_TRUE(gate->monitored_tokens().empty());
}

TEST_F(RiskGateTest, BlacklistOverridesApproval) {
    gate->approve(kT1);
    EXPECT_CALL(pusher, push_event(::testing::Truly(holds<arbx::TokenBlacklistedEvent>))).Times(1);
    gate->blacklist(kT1);

    EXPECT_FALSE(gate->is_eligible(kT1));
    auto ref = gate->token(kT1);
    ASSERT_TRUE(ref.has_value());
    EXPECT_FALSE(ref->approved);
    EXPECT_TRUE(ref->blacklisted);

    // Logical removal only
    EXPECT_EQ(gate->monitored_tokens(), (std::vector<arbx::Address>{kT1}));
    EXPECT_EQ(gate->blacklisted_tokens(), (std::vector<arbx::Address>{kT1}));
}

TEST_F(RiskGateTest, BlacklistTwiceFailsWithNoStateChange) {
    gate->blacklist(kT1);

    EXPECT_CALL(pusher, push_event(_)).Times(0);
    EXPECT_THROW(gate->blacklist(kT1), arbx::ValidationError);
    EXPECT_EQ(gate->blacklisted_tokens().size(), 1u);
}

TEST_F(RiskGateTest, BlacklistedTokenCannotBeApproved) {
    gate->blacklist(kT2);
    EXPECT_THROW(gate->approve(kT2), arbx::ValidationError);
    EXPECT_FALSE(gate->is_eligible(kT2));
}

TEST_F(RiskGateTest, UnknownTokenIsNotEligible) {
    EXPECT_FALSE(gate->is_eligible(kT1));
    EXPECT_FALSE(gate->token(kT1).has_value());
}
