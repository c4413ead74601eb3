// TALLY - Reconciliation Tests
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "ledger_fixture.h"

namespace tally {
namespace ledger {
namespace test {

// ============================================================================
// Classification
// ============================================================================

TEST(ClassifyTest, Thresholds) {
    const Amount internal = 1000 * COIN;
    EXPECT_EQ(ClassifyDiscrepancy(internal, 0), ReconciliationStatus::BALANCED);
    EXPECT_EQ(ClassifyDiscrepancy(internal, 5 * COIN), ReconciliationStatus::MINOR_DISCREPANCY);
    EXPECT_EQ(ClassifyDiscrepancy(internal, 10 * COIN), ReconciliationStatus::MAJOR_DISCREPANCY);
    EXPECT_EQ(ClassifyDiscrepancy(internal, 40 * COIN), ReconciliationStatus::MAJOR_DISCREPANCY);
    EXPECT_EQ(ClassifyDiscrepancy(internal, 50 * COIN), ReconciliationStatus::CRITICAL);
    EXPECT_EQ(ClassifyDiscrepancy(internal, 60 * COIN), ReconciliationStatus::CRITICAL);
}

TEST(ClassifyTest, SignDoesNotMatter) {
    const Amount internal = 1000 * COIN;
    EXPECT_EQ(ClassifyDiscrepancy(internal, -5 * COIN), ReconciliationStatus::MINOR_DISCREPANCY);
    EXPECT_EQ(ClassifyDiscrepancy(internal, -40 * COIN), ReconciliationStatus::MAJOR_DISCREPANCY);
    EXPECT_EQ(ClassifyDiscrepancy(internal, -60 * COIN), ReconciliationStatus::CRITICAL);
}

TEST(ClassifyTest, EmptyTreasuryUsesOneUnitBase) {
    EXPECT_EQ(ClassifyDiscrepancy(0, 0), ReconciliationStatus::BALANCED);
    EXPECT_EQ(ClassifyDiscrepancy(0, 1), ReconciliationStatus::CRITICAL);
    EXPECT_DOUBLE_EQ(DiscrepancyPercent(0, 1), 100.0);
}

TEST(ClassifyTest, Percent) {
    EXPECT_DOUBLE_EQ(DiscrepancyPercent(1000 * COIN, 40 * COIN), 4.0);
    EXPECT_DOUBLE_EQ(DiscrepancyPercent(1000 * COIN, -5 * COIN), -0.5);
}

// ============================================================================
// Engine
// ============================================================================

class ReconciliationTest : public LedgerFixture {
protected:
    void SetUp() override {
        SeedTreasury();
        ledger_.RecordTransaction(Deposit(1000 * COIN, mainId_));
    }
};

TEST_F(ReconciliationTest, ComparesAgainstActiveTotal) {
    auto balanced = reconciler_.Reconcile(1000 * COIN, "bank", "", "auditor");
    EXPECT_EQ(balanced.status, ReconciliationStatus::BALANCED);
    EXPECT_EQ(balanced.internalBalance, 1000 * COIN);
    EXPECT_EQ(balanced.discrepancy, 0);
    EXPECT_EQ(balanced.source, "bank");
    EXPECT_GT(balanced.computedAtMs, 0);

    EXPECT_EQ(reconciler_.Reconcile(1005 * COIN, "bank", "", "auditor").status,
              ReconciliationStatus::MINOR_DISCREPANCY);
    EXPECT_EQ(reconciler_.Reconcile(1040 * COIN, "bank", "", "auditor").status,
              ReconciliationStatus::MAJOR_DISCREPANCY);

    auto critical = reconciler_.Reconcile(1060 * COIN, "bank", "", "auditor");
    EXPECT_EQ(critical.status, ReconciliationStatus::CRITICAL);
    EXPECT_EQ(critical.discrepancy, 60 * COIN);
    EXPECT_DOUBLE_EQ(critical.discrepancyPercent, 6.0);
}

TEST_F(ReconciliationTest, LargerTreasury) {
    ledger_.RecordTransaction(Deposit(9000 * COIN, mainId_));
    auto record = reconciler_.Reconcile(10300 * COIN, "", "", "auditor");
    EXPECT_EQ(record.internalBalance, 10000 * COIN);
    EXPECT_EQ(record.status, ReconciliationStatus::MAJOR_DISCREPANCY);
    EXPECT_EQ(record.source, "manual");
}

TEST_F(ReconciliationTest, InactiveAccountsAreExcluded) {
    accounts_.SetAccountActive(marketingId_, false, "tester");
    auto record = reconciler_.Reconcile(1000 * COIN, "bank", "", "auditor");
    EXPECT_EQ(record.internalBalance, 950 * COIN);
    EXPECT_EQ(record.discrepancy, 50 * COIN);
}

TEST_F(ReconciliationTest, NeverTouchesBalances) {
    reconciler_.Reconcile(2000 * COIN, "bank", "", "auditor");
    EXPECT_EQ(SumOfBalances(), 1000 * COIN);
}

TEST_F(ReconciliationTest, RejectsOutOfRangeBalance) {
    EXPECT_EQ(CaptureKind([&] { reconciler_.Reconcile(-1, "bank", "", "auditor"); }),
              ErrorKind::ValidationError);
}

TEST_F(ReconciliationTest, ResolveOnce) {
    auto record = reconciler_.Reconcile(1060 * COIN, "bank", "", "auditor");
    auto resolved = reconciler_.Resolve(record.id, "bank fee booked late", "guardian-1");
    EXPECT_TRUE(resolved.IsResolved());
    EXPECT_EQ(resolved.resolvedBy, std::optional<std::string>("guardian-1"));
    EXPECT_EQ(reconciler_.GetRecord(record.id).resolutionNotes,
              std::optional<std::string>("bank fee booked late"));

    EXPECT_EQ(CaptureKind([&] { reconciler_.Resolve(record.id, "again", "guardian-2"); }),
              ErrorKind::AlreadyResolved);
    EXPECT_EQ(CaptureKind([&] { reconciler_.Resolve(999, "x", "guardian-1"); }),
              ErrorKind::NotFound);

    AuditFilter filter;
    filter.entityType = EntityType::RECONCILIATION;
    auto entries = audit_.Query(filter);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].action, AuditAction::UPDATE);
    EXPECT_EQ(entries[0].after.at("resolved"), "true");
}

TEST_F(ReconciliationTest, HistoryAndLatest) {
    EXPECT_FALSE(reconciler_.GetLatest().has_value());

    reconciler_.Reconcile(1000 * COIN, "bank", "", "auditor");
    reconciler_.Reconcile(1060 * COIN, "bank", "", "auditor");
    auto last = reconciler_.Reconcile(1001 * COIN, "bank", "", "auditor");

    auto latest = reconciler_.GetLatest();
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->id, last.id);

    auto history = reconciler_.ListHistory(10, std::nullopt);
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].id, last.id);

    auto critical = reconciler_.ListHistory(10, ReconciliationStatus::CRITICAL);
    ASSERT_EQ(critical.size(), 1u);
    EXPECT_EQ(critical[0].externalBalance, 1060 * COIN);

    EXPECT_EQ(reconciler_.ListHistory(2, std::nullopt).size(), 2u);
}

} // namespace test
} // namespace ledger
} // namespace tally
