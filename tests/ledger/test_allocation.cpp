// TALLY - Allocation Engine Tests
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "ledger_fixture.h"

#include <numeric>

namespace tally {
namespace ledger {
namespace test {

// ============================================================================
// Split Arithmetic
// ============================================================================

TEST(SplitAmountTest, ExactSplit) {
    auto shares = SplitAmount(100 * COIN, {5000, 2000, 1500, 1000, 500});
    EXPECT_EQ(shares, (std::vector<Amount>{50 * COIN, 20 * COIN, 15 * COIN, 10 * COIN, 5 * COIN}));
}

TEST(SplitAmountTest, RemainderGoesToLargestShare) {
    // 1 unit split 33.34/33.33/33.33: every share truncates to zero
    auto shares = SplitAmount(1, {3333, 3334, 3333});
    EXPECT_EQ(shares, (std::vector<Amount>{0, 1, 0}));

    shares = SplitAmount(10, {3333, 3333, 3334});
    EXPECT_EQ(shares, (std::vector<Amount>{3, 3, 4}));
}

TEST(SplitAmountTest, TiesFavourFirstLargest) {
    auto shares = SplitAmount(3, {5000, 5000});
    EXPECT_EQ(shares, (std::vector<Amount>{2, 1}));
}

TEST(SplitAmountTest, SharesAlwaysSumToAmount) {
    const std::vector<BasisPoints> percents{4000, 3000, 2000, 700, 300};
    for (Amount amount : {Amount(1), Amount(7), Amount(99), Amount(12345), 3 * COIN + 17, MAX_MONEY}) {
        auto shares = SplitAmount(amount, percents);
        EXPECT_EQ(std::accumulate(shares.begin(), shares.end(), Amount(0)), amount) << amount;
    }
}

// ============================================================================
// Engine
// ============================================================================

class AllocationEngineTest : public LedgerFixture {
protected:
    void SetUp() override { SeedTreasury(); }
};

TEST_F(AllocationEngineTest, DepositIsSplitByRule) {
    auto result = ledger_.RecordTransaction(Deposit(100 * COIN, mainId_));
    ASSERT_TRUE(result.allocation.has_value());
    const auto& allocation = *result.allocation;
    EXPECT_TRUE(allocation.allocated);
    EXPECT_FALSE(allocation.replayed);
    EXPECT_EQ(allocation.ruleName, "default_allocation");
    EXPECT_EQ(allocation.total, 100 * COIN);
    ASSERT_EQ(allocation.shares.size(), 5u);

    EXPECT_EQ(Balance(mainId_), 50 * COIN);
    EXPECT_EQ(Balance(reserveId_), 20 * COIN);
    EXPECT_EQ(Balance(rewardsId_), 15 * COIN);
    EXPECT_EQ(Balance(devId_), 10 * COIN);
    EXPECT_EQ(Balance(marketingId_), 5 * COIN);
    EXPECT_EQ(SumOfBalances(), 100 * COIN);
}

TEST_F(AllocationEngineTest, ChildrenReferenceTheDeposit) {
    auto deposit = ledger_.RecordTransaction(Deposit(100 * COIN, mainId_)).transaction;

    TransactionFilter filter;
    filter.parentId = deposit.id;
    auto children = ledger_.ListTransactions(filter);
    ASSERT_EQ(children.total, 5u);
    for (const auto& child : children.items) {
        EXPECT_EQ(child.type, TransactionType::INTERNAL_ALLOCATION);
        EXPECT_EQ(child.status, TransactionStatus::COMPLETED);
        EXPECT_EQ(child.fromAccount, std::optional<AccountId>(mainId_));
        EXPECT_EQ(child.metadata.at(AllocationMeta::RULE_NAME), "default_allocation");
    }

    auto stored = allocator_.GetAllocations(deposit.id);
    EXPECT_TRUE(stored.allocated);
    EXPECT_EQ(stored.total, 100 * COIN);
    EXPECT_EQ(stored.ruleName, "default_allocation");
    EXPECT_TRUE(allocator_.IsAllocated(deposit.id));
}

TEST_F(AllocationEngineTest, SecondAllocateIsReplay) {
    auto deposit = ledger_.RecordTransaction(Deposit(100 * COIN, mainId_)).transaction;

    auto again = allocator_.Allocate(deposit.id, "tester");
    EXPECT_TRUE(again.replayed);
    EXPECT_EQ(again.shares.size(), 5u);
    EXPECT_EQ(Balance(reserveId_), 20 * COIN);
    EXPECT_EQ(SumOfBalances(), 100 * COIN);

    TransactionFilter filter;
    filter.type = TransactionType::INTERNAL_ALLOCATION;
    EXPECT_EQ(ledger_.ListTransactions(filter).total, 5u);
}

TEST_F(AllocationEngineTest, NoRuleLeavesDepositUnallocated) {
    auto rule = rules_.FindRuleByName("default_allocation");
    ASSERT_TRUE(rule.has_value());
    rules_.DeactivateRule(rule->id, "tester");

    auto result = ledger_.RecordTransaction(Deposit(40 * COIN, mainId_));
    ASSERT_TRUE(result.allocation.has_value());
    EXPECT_FALSE(result.allocation->allocated);
    EXPECT_FALSE(result.allocation->reason.empty());
    EXPECT_EQ(Balance(mainId_), 40 * COIN);

    auto unallocated = ledger_.ListUnallocatedDeposits();
    ASSERT_EQ(unallocated.size(), 1u);
    EXPECT_EQ(unallocated[0].id, result.transaction.id);

    EXPECT_EQ(CaptureKind([&] { allocator_.Allocate(result.transaction.id, "tester"); }),
              ErrorKind::NoApplicableRule);

    // Once a rule exists the deposit can be allocated later
    NewRule manual;
    manual.name = "manual";
    manual.items = {{"reserve_fund", FULL_PERCENT}};
    rules_.CreateRule(manual, "tester");

    auto allocated = allocator_.Allocate(result.transaction.id, "tester");
    EXPECT_TRUE(allocated.allocated);
    EXPECT_FALSE(allocated.replayed);
    EXPECT_EQ(Balance(mainId_), 0);
    EXPECT_EQ(Balance(reserveId_), 40 * COIN);
    EXPECT_TRUE(ledger_.ListUnallocatedDeposits().empty());
}

TEST_F(AllocationEngineTest, AllocateRejectsNonDeposits) {
    auto pending = ledger_.RecordTransaction(
        Deposit(COIN, mainId_, TransactionStatus::PENDING)).transaction;
    EXPECT_EQ(CaptureKind([&] { allocator_.Allocate(pending.id, "tester"); }),
              ErrorKind::ValidationError);
    EXPECT_EQ(CaptureKind([&] { allocator_.Allocate(9999, "tester"); }), ErrorKind::NotFound);
}

TEST_F(AllocationEngineTest, InactiveTargetBreaksTheRule) {
    accounts_.SetAccountActive(marketingId_, false, "tester");
    EXPECT_EQ(CaptureKind([&] { allocator_.Plan(100 * COIN); }),
              ErrorKind::InvalidRuleConfiguration);

    // The deposit is refused as a whole
    EXPECT_EQ(CaptureKind([&] { ledger_.RecordTransaction(Deposit(100 * COIN, mainId_)); }),
              ErrorKind::InvalidRuleConfiguration);
    EXPECT_EQ(Balance(mainId_), 0);
    EXPECT_EQ(ledger_.ComputeTotals().transactionCount, 0u);
}

TEST_F(AllocationEngineTest, ZeroSharesAreSkipped) {
    NewRule tiny;
    tiny.name = "tiny";
    tiny.priority = 1;
    tiny.maxAmount = 10;
    tiny.items = {{"main_operating", 9999}, {"marketing_fund", 1}};
    rules_.CreateRule(tiny, "tester");

    auto result = ledger_.RecordTransaction(Deposit(10, mainId_));
    ASSERT_TRUE(result.allocation.has_value());
    EXPECT_TRUE(result.allocation->allocated);
    ASSERT_EQ(result.allocation->shares.size(), 1u);
    EXPECT_EQ(result.allocation->shares[0].accountId, mainId_);
    EXPECT_EQ(Balance(mainId_), 10);
    EXPECT_EQ(Balance(marketingId_), 0);
}

TEST_F(AllocationEngineTest, AllocationIsAudited) {
    auto deposit = ledger_.RecordTransaction(Deposit(100 * COIN, mainId_)).transaction;

    AuditFilter filter;
    filter.entityType = EntityType::TRANSACTION;
    filter.entityId = deposit.id;
    auto entries = audit_.Query(filter);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].action, AuditAction::EXECUTE);
    EXPECT_EQ(entries[0].after.at("total"), FormatAmount(100 * COIN));
    EXPECT_EQ(entries[1].action, AuditAction::CREATE);
}

} // namespace test
} // namespace ledger
} // namespace tally
