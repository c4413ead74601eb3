// TALLY - Transaction Ledger
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Append-mostly log of balance-affecting events and the sole writer of
// account balances. Recording a COMPLETED external deposit allocates it
// in the same unit of work: callers observe the deposit with all of its
// allocation children, or nothing.

#ifndef TALLY_LEDGER_LEDGER_H
#define TALLY_LEDGER_LEDGER_H

#include "tally/db/ledgerdb.h"
#include "tally/ledger/accounts.h"
#include "tally/ledger/allocation.h"
#include "tally/ledger/audit.h"
#include "tally/ledger/contention.h"
#include "tally/ledger/types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tally {
namespace ledger {

constexpr size_t DEFAULT_PAGE_LIMIT = 50;
constexpr size_t MAX_PAGE_LIMIT = 100;

/// Maximum length of an external reference
constexpr size_t MAX_EXTERNAL_REF_LENGTH = 256;

/// Actor recorded when a request names none
constexpr const char* SYSTEM_ACTOR = "system";

struct TransactionRequest {
    TransactionType type{TransactionType::EXTERNAL_DEPOSIT};
    TransactionStatus status{TransactionStatus::COMPLETED};
    Amount amount{0};
    std::optional<AccountId> fromAccount;
    std::optional<AccountId> toAccount;
    std::optional<TransactionId> parentId;
    std::optional<std::string> externalRef;
    std::string description;
    Metadata metadata;
    std::string performedBy;
};

struct RecordResult {
    LedgerTransaction transaction;
    /// The external reference was already recorded; nothing was written
    bool replayed{false};
    /// Present when the transaction is a completed deposit
    std::optional<AllocationResult> allocation;
};

struct TransactionFilter {
    std::optional<TransactionType> type;
    std::optional<TransactionStatus> status;
    /// Matches either side
    std::optional<AccountId> account;
    std::optional<AccountId> fromAccount;
    std::optional<AccountId> toAccount;
    std::optional<TransactionId> parentId;
    std::optional<Timestamp> since;
    std::optional<Timestamp> until;
    size_t limit{DEFAULT_PAGE_LIMIT};
    size_t offset{0};
};

struct TransactionPage {
    std::vector<LedgerTransaction> items;
    size_t total{0};
    size_t limit{0};
    size_t offset{0};
};

/// Sums over completed external flows, unbounded over the ledger's lifetime
struct LedgerTotals {
    AmountSum deposits{0};
    AmountSum withdrawals{0};
    size_t transactionCount{0};
};

/**
 * Check which account fields a transaction type requires:
 * EXTERNAL_DEPOSIT has no `from` and a `to`, EXTERNAL_WITHDRAWAL has a
 * `from` and no `to`, every other type has both.
 * Throws LedgerError(InvalidTransactionShape).
 */
void ValidateShape(TransactionType type,
                   const std::optional<AccountId>& fromAccount,
                   const std::optional<AccountId>& toAccount);

class TransactionLedger {
public:
    TransactionLedger(db::LedgerDB& store, AccountStore& accounts, AllocationEngine& allocator,
                      AuditLog& audit, AccountLockTable& locks,
                      RetryPolicy retry = RetryPolicy());

    /**
     * Validate and record a transaction. COMPLETED transactions apply
     * their balance effects; a COMPLETED deposit is allocated in the same
     * unit. An already used external reference returns the existing
     * transaction with replayed set.
     *
     * Throws ValidationError, InvalidTransactionShape, UnknownAccount,
     * InsufficientFunds, InvalidRuleConfiguration or TransientConflict.
     */
    RecordResult RecordTransaction(const TransactionRequest& request);

    /**
     * Move a PENDING transaction to COMPLETED, FAILED or CANCELLED.
     * Completing applies the balance effects (and allocation for a
     * deposit). Any other transition throws ValidationError.
     */
    RecordResult CompleteTransaction(TransactionId id, TransactionStatus newStatus,
                                     const std::string& actor);

    /// Throws NotFound
    LedgerTransaction GetTransaction(TransactionId id) const;

    /// Newest first; throws ValidationError for a limit outside 1..100
    TransactionPage ListTransactions(const TransactionFilter& filter) const;

    /// Completed deposits with no allocation children, newest first
    std::vector<LedgerTransaction> ListUnallocatedDeposits() const;

    LedgerTotals ComputeTotals() const;

private:
    /// Stage the balance effects of a completed transaction
    void ApplyEffects(db::UnitOfWork& uow, const LedgerTransaction& tx);

    /// Accounts whose locks a completed transaction needs
    std::vector<AccountId> LockSet(const LedgerTransaction& tx,
                                   const std::optional<AllocationPlan>& plan) const;

    void CheckAccountUsable(const std::optional<AccountId>& id, const char* side) const;

    db::LedgerDB& store_;
    AccountStore& accounts_;
    AllocationEngine& allocator_;
    AuditLog& audit_;
    AccountLockTable& locks_;
    RetryPolicy retry_;
};

} // namespace ledger
} // namespace tally

#endif // TALLY_LEDGER_LEDGER_H
