#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "core/balance_book.hpp"
#include "core/profit_ledger.hpp"
#include "core/attempt_scope.hpp"
#include "core/exceptions.hpp"

namespace {

const arbx::Address kSelf = arbx::address::from_index(0x5e1f);
const arbx::Address kPool = arbx::address::from_index(0x4001);
const arbx::Address kT1 = arbx::address::from_index(0xa1);
const arbx::Address kT2 = arbx::address::from_index(0xa2);

// Records the sequence calls it receives, tagged with its name
class RecordingVenue : public arbx::AtomicSequence {
public:
    RecordingVenue(std::string name, std::vector<std::string>& calls)
        : name_(std::move(name)), calls_(calls) {}

    void begin_sequence() override { calls_.push_back("begin " + name_); }
    void commit_sequence() override { calls_.push_back("commit " + name_); }
    void revert_sequence() override { calls_.push_back("revert " + name_); }

private:
    std::string name_;
    std::vector<std::string>& calls_;
};

arbx::SettledTrade settled(const std::string& id, double profit) {
    arbx::SettledTrade trade;
    trade.attempt_id = id;
    trade.token_in = kT1;
    trade.token_out = kT2;
    trade.amount = 100.0;
    trade.profit = profit;
    return trade;
}

} // namespace

TEST(BalanceBookTest, CreditAndDebit) {
    arbx::BalanceBook book(kSelf);
    EXPECT_DOUBLE_EQ(book.balance_of(kT1), 0.0);

    book.credit(kT1, 10.0);
    book.debit(kT1, 4.0);
    EXPECT_DOUBLE_EQ(book.balance_of(kT1), 6.0);
    EXPECT_EQ(book.owner(), kSelf);
}

TEST(BalanceBookTest, OverdraftIsRefused) {
    arbx::BalanceBook book(kSelf);
    book.credit(kT1, 1.0);

    EXPECT_THROW(book.debit(kT1, 1.5), arbx::TradingError);
    EXPECT_DOUBLE_EQ(book.balance_of(kT1), 1.0);
    EXPECT_THROW(book.credit(kT1, -1.0), arbx::ValidationError);
}

TEST(BalanceBookTest, PullNeedsAllowanceAndBalance) {
    arbx::BalanceBook book(kSelf);
    book.transfer_in(kPool, kT1, 101.0);

    EXPECT_THROW(book.transfer_from(kPool, kT1, 101.0), arbx::TradingError);

    book.approve(kPool, kT1, 101.0);
    book.transfer_from(kPool, kT1, 100.0);
    EXPECT_DOUBLE_EQ(book.balance_of(kT1), 1.0);
    EXPECT_DOUBLE_EQ(book.allowance(kPool, kT1), 1.0);

    // Allowance left, balance not
    EXPECT_THROW(book.transfer_from(kPool, kT1, 1.5), arbx::TradingError);
}

TEST(BalanceBookTest, RestoreReturnsToSnapshot) {
    arbx::BalanceBook book(kSelf);
    book.credit(kT1, 5.0);
    auto snapshot = book.snapshot();

    book.debit(kT1, 5.0);
    book.credit(kT2, 7.0);
    book.approve(kPool, kT2, 7.0);
    book.restore(snapshot);

    EXPECT_DOUBLE_EQ(book.balance_of(kT1), 5.0);
    EXPECT_DOUBLE_EQ(book.balance_of(kT2), 0.0);
    EXPECT_DOUBLE_EQ(book.allowance(kPool, kT2), 0.0);
}

TEST(AttemptScopeTest, UncommittedScopeRollsBack) {
    arbx::BalanceBook book(kSelf);
    book.credit(kT1, 5.0);
    {
        arbx::AttemptScope scope(book, {});
        book.debit(kT1, 5.0);
    }
    EXPECT_DOUBLE_EQ(book.balance_of(kT1), 5.0);
}

TEST(AttemptScopeTest, CommittedScopeKeepsChanges) {
    arbx::BalanceBook book(kSelf);
    book.credit(kT1, 5.0);
    {
        arbx::AttemptScope scope(book, {});
        book.credit(kT1, 1.0);
        scope.commit();
    }
    EXPECT_DOUBLE_EQ(book.balance_of(kT1), 6.0);
}

TEST(AttemptScopeTest, VenuesRevertInReverseOrderWhenNotCommitted) {
    std::vector<std::string> calls;
    RecordingVenue router("router", calls);
    RecordingVenue pool("pool", calls);
    arbx::BalanceBook book(kSelf);
    {
        arbx::AttemptScope scope(book, {&router, &pool});
    }
    EXPECT_EQ(calls, (std::vector<std::string>{"begin router", "begin pool", "revert pool", "revert router"}));
}

TEST(AttemptScopeTest, ExplicitRollbackRevertsOnce) {
    std::vector<std::string> calls;
    RecordingVenue router("router", calls);
    arbx::BalanceBook book(kSelf);
    book.credit(kT1, 2.0);
    {
        arbx::AttemptScope scope(book, {&router});
        book.debit(kT1, 2.0);
        scope.rollback();
        EXPECT_DOUBLE_EQ(book.balance_of(kT1), 2.0);
    }
    EXPECT_EQ(calls, (std::vector<std::string>{"begin router", "revert router"}));
}

TEST(AttemptScopeTest, CommitReleasesVenueSnapshots) {
    std::vector<std::string> calls;
    RecordingVenue router("router", calls);
    arbx::BalanceBook book(kSelf);
    {
        arbx::AttemptScope scope(book, {&router});
        scope.commit();
    }
    EXPECT_EQ(calls, (std::vector<std::string>{"begin router", "commit router"}));
}

TEST(AttemptScopeTest, GuardAdmitsOneHolder) {
    std::atomic<bool> flag{false};
    {
        arbx::AttemptGuard first(flag);
        EXPECT_TRUE(first.acquired());
        arbx::AttemptGuard second(flag);
        EXPECT_FALSE(second.acquired());
    }
    EXPECT_FALSE(flag.load());
    arbx::AttemptGuard third(flag);
    EXPECT_TRUE(third.acquired());
}

TEST(ProfitLedgerTest, AccumulatesInOrder) {
    arbx::ProfitLedger ledger;
    ledger.record(settled("a", 2.0));
    ledger.record(settled("b", 0.5));

    EXPECT_DOUBLE_EQ(ledger.total_profit(), 2.5);
    EXPECT_EQ(ledger.settled_count(), 2u);
    auto history = ledger.history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].attempt_id, "a");
    EXPECT_EQ(history[1].attempt_id, "b");
}

TEST(ProfitLedgerTest, NegativeProfitIsRejected) {
    arbx::ProfitLedger ledger;
    ledger.record(settled("a", 1.0));

    EXPECT_THROW(ledger.record(settled("b", -0.1)), arbx::ValidationError);
    EXPECT_DOUBLE_EQ(ledger.total_profit(), 1.0);
    EXPECT_EQ(ledger.settled_count(), 1u);
}
