// TALLY - Ledger Concurrency Tests
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "ledger_fixture.h"

#include "tally/util/threadpool.h"

#include <atomic>
#include <future>
#include <set>

namespace tally {
namespace ledger {
namespace test {

// ============================================================================
// Retry Policy
// ============================================================================

TEST(RetryPolicyTest, BackoffDoublesAndCaps) {
    RetryPolicy policy;
    policy.baseDelayMs = 2;
    policy.maxDelayMs = 10;
    EXPECT_EQ(policy.BackoffDelay(1).count(), 2);
    EXPECT_EQ(policy.BackoffDelay(2).count(), 4);
    EXPECT_EQ(policy.BackoffDelay(3).count(), 8);
    EXPECT_EQ(policy.BackoffDelay(4).count(), 10);
    EXPECT_EQ(policy.BackoffDelay(40).count(), 10);
}

TEST(RetryPolicyTest, RetriesTransientConflicts) {
    RetryPolicy policy = FastRetry();
    int calls = 0;
    int value = RunWithRetry(policy, "test", [&]() {
        if (++calls < 3) {
            throw LedgerError(ErrorKind::TransientConflict, "busy");
        }
        return 7;
    });
    EXPECT_EQ(value, 7);
    EXPECT_EQ(calls, 3);
}

TEST(RetryPolicyTest, GivesUpAfterMaxAttempts) {
    RetryPolicy policy = FastRetry();
    policy.maxAttempts = 3;
    int calls = 0;
    EXPECT_EQ(CaptureKind([&] {
        RunWithRetry(policy, "test", [&]() -> int {
            ++calls;
            throw LedgerError(ErrorKind::TransientConflict, "busy");
        });
    }), ErrorKind::TransientConflict);
    EXPECT_EQ(calls, 3);
}

TEST(RetryPolicyTest, OtherErrorsAreNotRetried) {
    int calls = 0;
    EXPECT_EQ(CaptureKind([&] {
        RunWithRetry(FastRetry(), "test", [&]() -> int {
            ++calls;
            throw LedgerError(ErrorKind::InsufficientFunds, "empty");
        });
    }), ErrorKind::InsufficientFunds);
    EXPECT_EQ(calls, 1);
}

// ============================================================================
// Account Locks
// ============================================================================

TEST(AccountLockTest, GuardHoldsSortedUniqueIds) {
    AccountLockTable locks;
    auto guard = locks.Acquire({3, 1, 3, 2});
    EXPECT_EQ(guard.Accounts(), (std::vector<AccountId>{1, 2, 3}));
    EXPECT_TRUE(guard.Holds(2));
    EXPECT_FALSE(guard.Holds(4));
}

TEST(AccountLockTest, TimeoutIsTransientConflict) {
    AccountLockTable locks(std::chrono::milliseconds(20));
    auto held = locks.Acquire({5});

    auto blocked = std::async(std::launch::async, [&locks]() {
        return CaptureKind([&locks] { locks.Acquire({4, 5}); });
    });
    EXPECT_EQ(blocked.get(), ErrorKind::TransientConflict);

    // Lock 4 was released when acquiring 5 failed
    auto other = std::async(std::launch::async, [&locks]() {
        auto guard = locks.Acquire({4});
        return guard.Holds(4);
    });
    EXPECT_TRUE(other.get());
}

// ============================================================================
// Concurrent Deposits
// ============================================================================

class ConcurrentLedgerTest : public LedgerFixture {
protected:
    void SetUp() override { SeedTreasury(); }
};

TEST_F(ConcurrentLedgerTest, ParallelDepositsConserveValue) {
    constexpr int DEPOSITS = 50;
    util::ThreadPool pool(8);
    std::vector<std::future<RecordResult>> results;
    for (int i = 0; i < DEPOSITS; ++i) {
        results.push_back(pool.Submit([this]() {
            return ledger_.RecordTransaction(Deposit(10 * COIN, mainId_));
        }));
    }

    std::set<TransactionId> ids;
    for (auto& future : results) {
        RecordResult result = future.get();
        ASSERT_TRUE(result.allocation.has_value());
        EXPECT_TRUE(result.allocation->allocated);
        ids.insert(result.transaction.id);
    }
    EXPECT_EQ(ids.size(), static_cast<size_t>(DEPOSITS));

    EXPECT_EQ(Balance(mainId_), 250 * COIN);
    EXPECT_EQ(Balance(reserveId_), 100 * COIN);
    EXPECT_EQ(Balance(rewardsId_), 75 * COIN);
    EXPECT_EQ(Balance(devId_), 50 * COIN);
    EXPECT_EQ(Balance(marketingId_), 25 * COIN);

    auto totals = ledger_.ComputeTotals();
    EXPECT_EQ(totals.deposits, 500 * COIN);
    EXPECT_EQ(SumOfBalances(), totals.deposits - totals.withdrawals);
    EXPECT_TRUE(ledger_.ListUnallocatedDeposits().empty());
}

TEST_F(ConcurrentLedgerTest, SameExternalRefRecordsOnce) {
    constexpr int ATTEMPTS = 16;
    util::ThreadPool pool(8);
    std::vector<std::future<RecordResult>> results;
    for (int i = 0; i < ATTEMPTS; ++i) {
        results.push_back(pool.Submit([this]() {
            auto request = Deposit(10 * COIN, mainId_);
            request.externalRef = "wire-42";
            return ledger_.RecordTransaction(request);
        }));
    }

    std::set<TransactionId> ids;
    int fresh = 0;
    for (auto& future : results) {
        RecordResult result = future.get();
        ids.insert(result.transaction.id);
        if (!result.replayed) ++fresh;
    }
    EXPECT_EQ(ids.size(), 1u);
    EXPECT_EQ(fresh, 1);
    EXPECT_EQ(SumOfBalances(), 10 * COIN);
}

TEST_F(ConcurrentLedgerTest, DepositsAndWithdrawalsStayNonNegative) {
    ledger_.RecordTransaction(Deposit(100 * COIN, mainId_));

    util::ThreadPool pool(8);
    std::atomic<int> refused{0};
    std::vector<std::future<void>> results;
    for (int i = 0; i < 40; ++i) {
        results.push_back(pool.Submit([this, &refused]() {
            try {
                ledger_.RecordTransaction(Withdrawal(2 * COIN, reserveId_));
            } catch (const LedgerError& e) {
                if (e.Kind() != ErrorKind::InsufficientFunds) throw;
                refused.fetch_add(1);
            }
        }));
    }
    for (auto& future : results) {
        future.get();
    }

    // The reserve held 20.00: exactly ten withdrawals fit
    EXPECT_EQ(refused.load(), 30);
    EXPECT_EQ(Balance(reserveId_), 0);
    auto totals = ledger_.ComputeTotals();
    EXPECT_EQ(SumOfBalances(), totals.deposits - totals.withdrawals);
}

} // namespace test
} // namespace ledger
} // namespace tally
