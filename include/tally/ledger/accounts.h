// TALLY - Account Store
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Owns the logical accounts and their balances. Balances change only
// through AdjustBalance, called by the transaction ledger and the
// allocation engine inside their unit of work.

#ifndef TALLY_LEDGER_ACCOUNTS_H
#define TALLY_LEDGER_ACCOUNTS_H

#include "tally/db/ledgerdb.h"
#include "tally/ledger/audit.h"
#include "tally/ledger/contention.h"
#include "tally/ledger/types.h"

#include <optional>
#include <string>
#include <vector>

namespace tally {
namespace ledger {

/// Maximum length of account and rule names
constexpr size_t MAX_NAME_LENGTH = 100;

struct NewAccount {
    std::string name;
    AccountType type{AccountType::CUSTOM};
    std::string description;
    BasisPoints targetPercent{0};
};

/// Reserve account position within the pooled total
struct ReserveHealth {
    bool present{false};
    std::string accountName;
    Amount balance{0};
    BasisPoints targetPercent{0};
    /// balance / total * 100, for display
    double actualPercent{0.0};
    bool healthy{true};
};

struct TreasuryStatus {
    std::vector<LogicalAccount> accounts;
    Amount total{0};
    ReserveHealth reserve;
};

/**
 * Sum account balances. Throws StorageError if the stored balances add up
 * to more than MAX_TREASURY, which deposits never allow.
 */
Amount TotalBalance(const std::vector<LogicalAccount>& accounts);

/**
 * Summarize active accounts. The reserve (first RESERVE account) is
 * healthy when it holds at least 90% of its target share of the total;
 * with no reserve or an empty treasury it is reported healthy.
 */
TreasuryStatus SummarizeTreasury(std::vector<LogicalAccount> activeAccounts);

class AccountStore {
public:
    AccountStore(db::LedgerDB& store, AuditLog& audit, AccountLockTable& locks,
                 RetryPolicy retry = RetryPolicy());

    /// Throws DuplicateAccount if the name is taken, ValidationError on bad input
    LogicalAccount CreateAccount(const NewAccount& request, const std::string& actor);

    /// Throws NotFound
    LogicalAccount GetAccount(AccountId id) const;
    LogicalAccount GetAccountByName(const std::string& name) const;

    std::optional<LogicalAccount> FindAccount(AccountId id) const;
    std::optional<LogicalAccount> FindAccountByName(const std::string& name) const;

    /// Resolve a reference that is either a numeric id or a name
    std::optional<LogicalAccount> FindAccountByRef(const std::string& ref) const;

    /// Accounts in id order
    std::vector<LogicalAccount> ListAccounts(bool includeInactive) const;

    /// Activate or deactivate; audited UPDATE with before/after
    LogicalAccount SetAccountActive(AccountId id, bool active, const std::string& actor);

    /// Sum of every balance, inactive accounts included
    Amount TotalHoldings() const;

    /**
     * Apply a balance delta inside a unit of work. Throws UnknownAccount if
     * the account does not exist and InsufficientFunds if the balance
     * would become negative. The upper bound is left to CheckStagedBalances
     * so a deposit may pass through its intake account before fan-out.
     */
    void AdjustBalance(db::UnitOfWork& uow, AccountId id, Amount delta,
                       TransactionId transactionId);

    /// Throws ValidationError if a staged balance exceeds MAX_MONEY
    void CheckStagedBalances(const db::UnitOfWork& uow) const;

private:
    db::LedgerDB& store_;
    AuditLog& audit_;
    AccountLockTable& locks_;
    RetryPolicy retry_;
};

} // namespace ledger
} // namespace tally

#endif // TALLY_LEDGER_ACCOUNTS_H
