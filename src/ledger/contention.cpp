// TALLY - Contention Handling
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/ledger/contention.h"

#include <algorithm>

namespace tally {
namespace ledger {

std::chrono::milliseconds RetryPolicy::BackoffDelay(int attempt) const {
    int64_t delay = baseDelayMs;
    for (int i = 1; i < attempt && delay < maxDelayMs; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, maxDelayMs));
}

void ThrowOnStorageError(const db::Status& status, const std::string& context) {
    if (status.ok()) {
        return;
    }
    if (status.IsRetryable()) {
        throw LedgerError(ErrorKind::TransientConflict, context + ": " + status.ToString());
    }
    LOG_ERROR(util::LogCategory::DB) << context << ": " << status.ToString();
    throw LedgerError(ErrorKind::StorageError, context + ": " + status.ToString());
}

// ============================================================================
// AccountLockTable
// ============================================================================

bool AccountLockTable::Guard::Holds(AccountId id) const {
    return std::binary_search(ids_.begin(), ids_.end(), id);
}

AccountLockTable::AccountLockTable(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

std::timed_mutex& AccountLockTable::MutexFor(AccountId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = locks_[id];
    if (!slot) {
        slot = std::make_unique<std::timed_mutex>();
    }
    return *slot;
}

AccountLockTable::Guard AccountLockTable::Acquire(std::vector<AccountId> ids) {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    Guard guard;
    guard.locks_.reserve(ids.size());
    for (AccountId id : ids) {
        std::unique_lock<std::timed_mutex> lock(MutexFor(id), std::defer_lock);
        if (!lock.try_lock_for(timeout_)) {
            LOG_DEBUG(util::LogCategory::LEDGER) << "Timed out waiting for lock on account " << id;
            throw LedgerError(ErrorKind::TransientConflict,
                              "timed out waiting for account " + std::to_string(id));
        }
        guard.locks_.push_back(std::move(lock));
    }
    guard.ids_ = std::move(ids);
    return guard;
}

} // namespace ledger
} // namespace tally
