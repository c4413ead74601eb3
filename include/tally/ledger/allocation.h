// TALLY - Allocation Engine
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Splits a completed external deposit across the target accounts of the
// selected allocation rule. Each share moves from the deposit's intake
// account to its target as a COMPLETED INTERNAL_ALLOCATION child. The
// (parent, target) pair is claimed as a unique key, so a deposit is
// allocated at most once however often it is delivered.

#ifndef TALLY_LEDGER_ALLOCATION_H
#define TALLY_LEDGER_ALLOCATION_H

#include "tally/db/ledgerdb.h"
#include "tally/ledger/accounts.h"
#include "tally/ledger/audit.h"
#include "tally/ledger/contention.h"
#include "tally/ledger/rules.h"
#include "tally/ledger/types.h"

#include <optional>
#include <string>
#include <vector>

namespace tally {
namespace ledger {

/// Metadata keys stamped on allocation children
namespace AllocationMeta {
    constexpr const char* RULE_ID = "rule_id";
    constexpr const char* RULE_NAME = "rule_name";
    constexpr const char* PERCENT_BP = "percent_bp";
}

struct AllocationShare {
    AccountId accountId{0};
    std::string accountName;
    BasisPoints percent{0};
    Amount amount{0};
    TransactionId transactionId{0};
};

struct AllocationResult {
    TransactionId depositId{0};
    /// Children exist for the deposit
    bool allocated{false};
    /// The children already existed; nothing was written
    bool replayed{false};
    std::optional<RuleId> ruleId;
    std::string ruleName;
    Amount total{0};
    std::vector<AllocationShare> shares;
    /// Why the deposit was left unallocated
    std::string reason;
};

/// Rule chosen for an amount with its targets resolved
struct AllocationPlan {
    AllocationRule rule;
    std::vector<LogicalAccount> targets;   // item order
    std::vector<Amount> amounts;           // item order
};

/**
 * Split an amount by basis points, truncating each share. The remainder
 * goes to the largest percentage (first one on ties) so the shares sum to
 * the amount exactly.
 */
std::vector<Amount> SplitAmount(Amount amount, const std::vector<BasisPoints>& percents);

class AllocationEngine {
public:
    AllocationEngine(db::LedgerDB& store, AccountStore& accounts, RuleBook& rules,
                     AuditLog& audit, AccountLockTable& locks,
                     RetryPolicy retry = RetryPolicy());

    /**
     * Select and validate the rule for an amount. Returns nullopt when no
     * active rule admits it. Throws InvalidRuleConfiguration if the chosen
     * rule does not sum to 100 or names a missing, inactive or repeated
     * account.
     */
    std::optional<AllocationPlan> Plan(Amount amount) const;

    /**
     * Allocate a completed deposit inside the caller's unit of work. The
     * guard must hold the intake and every target account; if the rule's
     * targets changed since the locks were taken TransientConflict is
     * thrown so the caller retries. Returns an unallocated result (with a
     * WARN log) when no rule applies.
     */
    AllocationResult Apply(db::UnitOfWork& uow, const LedgerTransaction& deposit,
                           const AccountLockTable::Guard& guard, const std::string& actor);

    /**
     * Allocate an existing completed deposit in its own unit. Returns the
     * prior result unchanged if it was already allocated. Throws NotFound,
     * ValidationError (not a completed deposit) or NoApplicableRule.
     */
    AllocationResult Allocate(TransactionId depositId, const std::string& actor);

    /// Result rebuilt from the stored children of a deposit. Throws NotFound.
    AllocationResult GetAllocations(TransactionId depositId) const;

    /// Whether a deposit has allocation children
    bool IsAllocated(TransactionId depositId) const;

private:
    AllocationResult LoadResult(const LedgerTransaction& deposit) const;

    db::LedgerDB& store_;
    AccountStore& accounts_;
    RuleBook& rules_;
    AuditLog& audit_;
    AccountLockTable& locks_;
    RetryPolicy retry_;
};

} // namespace ledger
} // namespace tally

#endif // TALLY_LEDGER_ALLOCATION_H
