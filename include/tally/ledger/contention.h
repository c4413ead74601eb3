// TALLY - Contention Handling
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Per-account exclusive locks acquired in ascending id order with a bounded
// wait, plus the bounded exponential-backoff retry loop that wraps every
// ledger unit of work.

#ifndef TALLY_LEDGER_CONTENTION_H
#define TALLY_LEDGER_CONTENTION_H

#include "tally/db/database.h"
#include "tally/ledger/errors.h"
#include "tally/ledger/types.h"
#include "tally/util/logging.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tally {
namespace ledger {

// ============================================================================
// Retry Policy
// ============================================================================

struct RetryPolicy {
    int maxAttempts{5};
    int64_t baseDelayMs{2};
    int64_t maxDelayMs{50};

    /// Delay before retry number `attempt` (1-based): base * 2^(attempt-1), capped
    std::chrono::milliseconds BackoffDelay(int attempt) const;
};

/// Convert a failed storage status into a LedgerError
/// (TransientConflict for commit conflicts, StorageError otherwise)
void ThrowOnStorageError(const db::Status& status, const std::string& context);

/**
 * Run one unit of work, retrying TransientConflict with exponential
 * backoff. After the last attempt the conflict propagates to the caller.
 */
template<typename Func>
auto RunWithRetry(const RetryPolicy& policy, const char* operation, Func&& func)
    -> decltype(func()) {
    for (int attempt = 1;; ++attempt) {
        try {
            return func();
        } catch (const LedgerError& e) {
            if (e.Kind() != ErrorKind::TransientConflict) {
                throw;
            }
            if (attempt >= policy.maxAttempts) {
                LOG_ERROR(util::LogCategory::LEDGER) << operation << " abandoned after "
                                                     << attempt << " attempts: " << e.what();
                throw;
            }
            LOG_DEBUG(util::LogCategory::LEDGER) << operation << " attempt " << attempt
                                                 << " conflicted (" << e.what() << "), retrying";
        }
        std::this_thread::sleep_for(policy.BackoffDelay(attempt));
    }
}

// ============================================================================
// Account Lock Table
// ============================================================================

/// Lock taken by every external deposit; account ids start at 1
constexpr AccountId TREASURY_SUPPLY_LOCK = 0;

class AccountLockTable {
public:
    /// Locks held for the duration of one unit of work
    class Guard {
    public:
        Guard() = default;
        Guard(Guard&&) = default;
        Guard& operator=(Guard&&) = default;

        bool Holds(AccountId id) const;
        const std::vector<AccountId>& Accounts() const { return ids_; }

    private:
        friend class AccountLockTable;
        std::vector<AccountId> ids_;
        std::vector<std::unique_lock<std::timed_mutex>> locks_;
    };

    explicit AccountLockTable(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

    AccountLockTable(const AccountLockTable&) = delete;
    AccountLockTable& operator=(const AccountLockTable&) = delete;

    /**
     * Lock the given accounts (duplicates ignored) in ascending id order.
     * Throws LedgerError(TransientConflict) if a lock is not obtained
     * within the timeout; locks already taken are released.
     */
    Guard Acquire(std::vector<AccountId> ids);

private:
    std::timed_mutex& MutexFor(AccountId id);

    std::chrono::milliseconds timeout_;
    std::mutex mutex_;
    std::map<AccountId, std::unique_ptr<std::timed_mutex>> locks_;
};

} // namespace ledger
} // namespace tally

#endif // TALLY_LEDGER_CONTENTION_H
