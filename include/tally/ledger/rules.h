// TALLY - Allocation Rules
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Named, prioritized percentage splits applied to incoming deposits.

#ifndef TALLY_LEDGER_RULES_H
#define TALLY_LEDGER_RULES_H

#include "tally/db/ledgerdb.h"
#include "tally/ledger/accounts.h"
#include "tally/ledger/audit.h"
#include "tally/ledger/contention.h"
#include "tally/ledger/types.h"

#include <optional>
#include <string>
#include <vector>

namespace tally {
namespace ledger {

struct NewRule {
    std::string name;
    bool active{true};
    int32_t priority{DEFAULT_RULE_PRIORITY};
    std::vector<AllocationItem> items;
    std::optional<Amount> minAmount;
    std::optional<Amount> maxAmount;
    std::string description;
};

/// Partial update; unset fields keep their value
struct RuleUpdate {
    std::optional<std::string> name;
    std::optional<bool> active;
    std::optional<int32_t> priority;
    std::optional<std::vector<AllocationItem>> items;
    std::optional<std::optional<Amount>> minAmount;
    std::optional<std::optional<Amount>> maxAmount;
    std::optional<std::string> description;
};

/**
 * Check a rule's split: at least one item, each percentage in (0, 100],
 * total exactly 100, no account twice, max >= min.
 * @return Empty string if valid, else the reason
 */
std::string CheckRuleShape(const std::vector<AllocationItem>& items,
                           const std::optional<Amount>& minAmount,
                           const std::optional<Amount>& maxAmount);

class RuleBook {
public:
    RuleBook(db::LedgerDB& store, AccountStore& accounts, AuditLog& audit,
             RetryPolicy retry = RetryPolicy());

    /// Throws ValidationError, UnknownAccount or DuplicateRule
    AllocationRule CreateRule(const NewRule& request, const std::string& actor);

    /// Throws NotFound plus the CreateRule failures; audited UPDATE
    AllocationRule UpdateRule(RuleId id, const RuleUpdate& update, const std::string& actor);

    /// Delete = deactivate; audited DELETE. Throws NotFound.
    AllocationRule DeactivateRule(RuleId id, const std::string& actor);

    /// Throws NotFound
    AllocationRule GetRule(RuleId id) const;
    std::optional<AllocationRule> FindRuleByName(const std::string& name) const;

    /// Ordered by priority, then id
    std::vector<AllocationRule> ListRules(bool activeOnly) const;

    /**
     * Rule applied to a deposit of this amount: the active rule whose
     * bounds admit it with the lowest priority value (lowest id on ties).
     */
    std::optional<AllocationRule> SelectRule(Amount amount) const;

private:
    void ValidateRule(const std::vector<AllocationItem>& items,
                      const std::optional<Amount>& minAmount,
                      const std::optional<Amount>& maxAmount) const;

    db::LedgerDB& store_;
    AccountStore& accounts_;
    AuditLog& audit_;
    RetryPolicy retry_;
};

} // namespace ledger
} // namespace tally

#endif // TALLY_LEDGER_RULES_H
