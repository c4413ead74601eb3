// TALLY - Amount Limit Tests
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "ledger_fixture.h"

#include <limits>

namespace tally {
namespace ledger {
namespace test {

// ============================================================================
// Splits at the top of the amount range
// ============================================================================

TEST(LargeSplitTest, MaximumDepositSplitsExactly) {
    auto shares = SplitAmount(MAX_MONEY, {5000, 2000, 1500, 1000, 500});
    ASSERT_EQ(shares.size(), 5u);
    EXPECT_EQ(shares[0], MAX_MONEY / 2);
    EXPECT_EQ(shares[1], MAX_MONEY / 5);
    EXPECT_EQ(shares[2], MAX_MONEY / 20 * 3);
    EXPECT_EQ(shares[3], MAX_MONEY / 10);
    EXPECT_EQ(shares[4], MAX_MONEY / 20);
}

TEST(LargeSplitTest, RemainderNearMaximumGoesToLargestShare) {
    // Each share truncates one unit; the four lost units land on the 50% share
    auto shares = SplitAmount(MAX_MONEY - 1, {5000, 2000, 1500, 1000, 500});
    ASSERT_EQ(shares.size(), 5u);
    EXPECT_EQ(shares[0], MAX_MONEY / 2 + 3);
    EXPECT_EQ(shares[1], MAX_MONEY / 5 - 1);
    EXPECT_EQ(shares[2], MAX_MONEY / 20 * 3 - 1);
    EXPECT_EQ(shares[3], MAX_MONEY / 10 - 1);
    EXPECT_EQ(shares[4], MAX_MONEY / 20 - 1);

    Amount sum = 0;
    for (Amount share : shares) sum += share;
    EXPECT_EQ(sum, MAX_MONEY - 1);
}

TEST(LargeSplitTest, TreasuryTotalsNearTheLimit) {
    std::vector<LogicalAccount> accounts(9);
    for (size_t i = 0; i < accounts.size(); ++i) {
        accounts[i].name = "vault_" + std::to_string(i);
        accounts[i].balance = MAX_MONEY;
    }
    accounts[0].type = AccountType::RESERVE;
    accounts[0].targetPercent = 1000;

    auto status = SummarizeTreasury(accounts);
    EXPECT_EQ(status.total, MAX_TREASURY);
    ASSERT_TRUE(status.reserve.present);
    // One ninth of the total against a 10% target
    EXPECT_TRUE(status.reserve.healthy);

    accounts.push_back(accounts.back());
    EXPECT_EQ(CaptureKind([&] { TotalBalance(accounts); }), ErrorKind::StorageError);
}

// ============================================================================
// Treasury holdings limit
// ============================================================================

class TreasuryLimitTest : public LedgerFixture {
protected:
    /// A new account holding MAX_MONEY; with no rules the deposit stays put
    AccountId FillAccount(const std::string& name) {
        AccountId id = MakeAccount(name).id;
        ledger_.RecordTransaction(Deposit(MAX_MONEY, id));
        return id;
    }
};

TEST_F(TreasuryLimitTest, DepositsStopAtTheTreasuryLimit) {
    for (int i = 0; i < 9; ++i) {
        FillAccount("vault_" + std::to_string(i));
    }
    EXPECT_EQ(accounts_.TotalHoldings(), MAX_TREASURY);

    AccountId tenth = MakeAccount("vault_9").id;
    EXPECT_EQ(CaptureKind([&] { ledger_.RecordTransaction(Deposit(MAX_MONEY, tenth)); }),
              ErrorKind::ValidationError);
    EXPECT_EQ(CaptureKind([&] { ledger_.RecordTransaction(Deposit(1, tenth)); }),
              ErrorKind::ValidationError);
    EXPECT_EQ(Balance(tenth), 0);
    EXPECT_EQ(accounts_.TotalHoldings(), MAX_TREASURY);

    auto totals = ledger_.ComputeTotals();
    EXPECT_EQ(totals.deposits, AmountSum(MAX_TREASURY));
    EXPECT_EQ(totals.transactionCount, 9u);

    auto status = SummarizeTreasury(accounts_.ListAccounts(false));
    EXPECT_EQ(status.total, MAX_TREASURY);
}

TEST_F(TreasuryLimitTest, WithdrawalsFreeRoomForDeposits) {
    AccountId full = 0;
    for (int i = 0; i < 9; ++i) {
        full = FillAccount("vault_" + std::to_string(i));
    }
    ledger_.RecordTransaction(Withdrawal(COIN, full));
    EXPECT_NO_THROW(ledger_.RecordTransaction(Deposit(COIN, full)));
    EXPECT_EQ(accounts_.TotalHoldings(), MAX_TREASURY);
}

TEST_F(TreasuryLimitTest, PendingDepositIsCheckedWhenCompleted) {
    AccountId full = 0;
    for (int i = 0; i < 9; ++i) {
        full = FillAccount("vault_" + std::to_string(i));
    }
    AccountId late = MakeAccount("late").id;
    ledger_.RecordTransaction(Withdrawal(COIN, full));
    auto pending = ledger_.RecordTransaction(Deposit(2 * COIN, late, TransactionStatus::PENDING));

    EXPECT_EQ(CaptureKind([&] {
        ledger_.CompleteTransaction(pending.transaction.id, TransactionStatus::COMPLETED, "ops");
    }), ErrorKind::ValidationError);
    EXPECT_EQ(ledger_.GetTransaction(pending.transaction.id).status, TransactionStatus::PENDING);
    EXPECT_EQ(Balance(late), 0);
}

TEST_F(TreasuryLimitTest, LifetimeTotalsPassTheInt64Range) {
    AccountId id = MakeAccount("vault").id;
    for (int i = 0; i < 10; ++i) {
        ledger_.RecordTransaction(Deposit(MAX_MONEY, id));
        ledger_.RecordTransaction(Withdrawal(MAX_MONEY, id));
    }

    auto totals = ledger_.ComputeTotals();
    EXPECT_EQ(totals.deposits, AmountSum(MAX_MONEY) * 10);
    EXPECT_EQ(totals.withdrawals, AmountSum(MAX_MONEY) * 10);
    EXPECT_GT(totals.deposits, AmountSum(std::numeric_limits<int64_t>::max()));
    EXPECT_EQ(totals.deposits - totals.withdrawals, 0);
    EXPECT_EQ(Balance(id), 0);
}

TEST_F(TreasuryLimitTest, ReconcileAtTheTreasuryLimit) {
    for (int i = 0; i < 9; ++i) {
        FillAccount("vault_" + std::to_string(i));
    }

    auto balanced = reconciler_.Reconcile(MAX_TREASURY, "bank", "", "auditor");
    EXPECT_EQ(balanced.internalBalance, MAX_TREASURY);
    EXPECT_EQ(balanced.discrepancy, 0);
    EXPECT_EQ(balanced.status, ReconciliationStatus::BALANCED);

    auto shortfall = reconciler_.Reconcile(MAX_MONEY, "bank", "", "auditor");
    EXPECT_EQ(shortfall.internalBalance, MAX_TREASURY);
    EXPECT_EQ(shortfall.discrepancy, MAX_MONEY - MAX_TREASURY);
    EXPECT_EQ(shortfall.status, ReconciliationStatus::CRITICAL);
    EXPECT_NEAR(shortfall.discrepancyPercent, -800.0 / 9.0, 1e-9);

    auto minor = reconciler_.Reconcile(MAX_TREASURY - MAX_TREASURY / 200, "bank", "", "auditor");
    EXPECT_EQ(minor.status, ReconciliationStatus::MINOR_DISCREPANCY);

    EXPECT_EQ(CaptureKind([&] { reconciler_.Reconcile(MAX_TREASURY + 1, "bank", "", "auditor"); }),
              ErrorKind::ValidationError);
}

// ============================================================================
// Per-account limit
// ============================================================================

class AccountLimitTest : public LedgerFixture {
protected:
    void SetUp() override { SeedTreasury(); }
};

TEST_F(AccountLimitTest, IntakeMayPassThroughTheLimitDuringFanOut) {
    ledger_.RecordTransaction(Deposit(COIN, mainId_));
    EXPECT_EQ(Balance(mainId_), COIN / 2);

    auto result = ledger_.RecordTransaction(Deposit(MAX_MONEY, mainId_));
    ASSERT_TRUE(result.allocation);
    EXPECT_TRUE(result.allocation->allocated);
    EXPECT_EQ(result.allocation->total, MAX_MONEY);

    EXPECT_EQ(Balance(mainId_), COIN / 2 + MAX_MONEY / 2);
    EXPECT_EQ(Balance(reserveId_), COIN / 5 + MAX_MONEY / 5);
    EXPECT_EQ(Balance(marketingId_), COIN / 20 + MAX_MONEY / 20);
    EXPECT_EQ(SumOfBalances(), COIN + MAX_MONEY);
}

TEST_F(AccountLimitTest, PendingDepositCompletesThroughFanOut) {
    ledger_.RecordTransaction(Deposit(COIN, mainId_));
    auto pending = ledger_.RecordTransaction(Deposit(MAX_MONEY, mainId_,
                                                     TransactionStatus::PENDING));
    auto completed = ledger_.CompleteTransaction(pending.transaction.id,
                                                 TransactionStatus::COMPLETED, "ops");
    EXPECT_EQ(completed.transaction.status, TransactionStatus::COMPLETED);
    EXPECT_EQ(Balance(mainId_), COIN / 2 + MAX_MONEY / 2);
}

TEST_F(AccountLimitTest, FinalBalanceAboveTheLimitIsRefused) {
    ledger_.RecordTransaction(Deposit(MAX_MONEY, mainId_));
    ledger_.RecordTransaction(Deposit(MAX_MONEY, mainId_));
    EXPECT_EQ(Balance(mainId_), MAX_MONEY);

    size_t before = ledger_.ComputeTotals().transactionCount;
    EXPECT_EQ(CaptureKind([&] { ledger_.RecordTransaction(Deposit(MAX_MONEY, mainId_)); }),
              ErrorKind::ValidationError);
    EXPECT_EQ(Balance(mainId_), MAX_MONEY);
    EXPECT_EQ(SumOfBalances(), 2 * MAX_MONEY);
    EXPECT_EQ(ledger_.ComputeTotals().transactionCount, before);
}

TEST_F(TreasuryLimitTest, LaterAllocationRespectsTheAccountLimit) {
    AccountId vault = FillAccount("vault");
    AccountId intake = MakeAccount("intake").id;
    auto deposit = ledger_.RecordTransaction(Deposit(MAX_MONEY, intake));
    ASSERT_TRUE(deposit.allocation);
    EXPECT_FALSE(deposit.allocation->allocated);

    NewRule rule;
    rule.name = "all_to_vault";
    rule.items = {{"vault", FULL_PERCENT}};
    rules_.CreateRule(rule, "tester");

    EXPECT_EQ(CaptureKind([&] { allocator_.Allocate(deposit.transaction.id, "ops"); }),
              ErrorKind::ValidationError);
    EXPECT_EQ(Balance(vault), MAX_MONEY);
    EXPECT_EQ(Balance(intake), MAX_MONEY);
    EXPECT_FALSE(allocator_.IsAllocated(deposit.transaction.id));
}

} // namespace test
} // namespace ledger
} // namespace tally
