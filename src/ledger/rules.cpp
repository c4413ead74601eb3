// TALLY - Allocation Rules
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/ledger/rules.h"

#include <algorithm>
#include <set>

namespace tally {
namespace ledger {

namespace {

void ValidateRuleName(const std::string& name) {
    if (name.empty() || name.size() > MAX_NAME_LENGTH) {
        throw LedgerError(ErrorKind::ValidationError,
                          "rule name must be 1-" + std::to_string(MAX_NAME_LENGTH) + " characters");
    }
}

} // namespace

std::string CheckRuleShape(const std::vector<AllocationItem>& items,
                           const std::optional<Amount>& minAmount,
                           const std::optional<Amount>& maxAmount) {
    if (items.empty()) {
        return "a rule needs at least one allocation";
    }

    std::set<std::string> seen;
    BasisPoints total = 0;
    for (const auto& item : items) {
        if (item.accountName.empty()) {
            return "allocation account name is empty";
        }
        if (item.percent <= 0 || item.percent > FULL_PERCENT) {
            return "percentage for '" + item.accountName + "' must be within (0, 100]";
        }
        if (!seen.insert(item.accountName).second) {
            return "account '" + item.accountName + "' appears more than once";
        }
        total += item.percent;
    }
    if (total != FULL_PERCENT) {
        return "percentages sum to " + FormatPercent(total) + ", expected 100.00";
    }

    if (minAmount && !MoneyRange(*minAmount)) {
        return "min_amount out of range";
    }
    if (maxAmount && !MoneyRange(*maxAmount)) {
        return "max_amount out of range";
    }
    if (minAmount && maxAmount && *maxAmount < *minAmount) {
        return "max_amount is below min_amount";
    }
    return "";
}

RuleBook::RuleBook(db::LedgerDB& store, AccountStore& accounts, AuditLog& audit,
                   RetryPolicy retry)
    : store_(store), accounts_(accounts), audit_(audit), retry_(retry) {}

void RuleBook::ValidateRule(const std::vector<AllocationItem>& items,
                            const std::optional<Amount>& minAmount,
                            const std::optional<Amount>& maxAmount) const {
    std::string reason = CheckRuleShape(items, minAmount, maxAmount);
    if (!reason.empty()) {
        throw LedgerError(ErrorKind::ValidationError, reason);
    }
    for (const auto& item : items) {
        if (!accounts_.FindAccountByName(item.accountName)) {
            throw LedgerError(ErrorKind::UnknownAccount,
                              "account '" + item.accountName + "' does not exist");
        }
    }
}

AllocationRule RuleBook::CreateRule(const NewRule& request, const std::string& actor) {
    ValidateRuleName(request.name);
    ValidateRule(request.items, request.minAmount, request.maxAmount);

    AllocationRule created = RunWithRetry(retry_, "CreateRule", [&]() {
        if (FindRuleByName(request.name)) {
            throw LedgerError(ErrorKind::DuplicateRule, "rule '" + request.name + "' already exists");
        }

        db::UnitOfWork uow(store_);
        AllocationRule rule;
        ThrowOnStorageError(store_.NextId(db::prefix::RULE, &rule.id), "allocate rule id");
        rule.name = request.name;
        rule.active = request.active;
        rule.priority = request.priority;
        rule.items = request.items;
        rule.minAmount = request.minAmount;
        rule.maxAmount = request.maxAmount;
        rule.description = request.description;
        rule.createdBy = actor;
        rule.createdAt = rule.updatedAt = GetTime();

        uow.Put(db::RuleKey(rule.id), rule);
        uow.Claim(db::RuleNameKey(rule.name), db::EncodeId(rule.id));
        audit_.Record(uow, EntityType::RULE, rule.id, AuditAction::CREATE,
                      {}, rule.ToSnapshot(), actor);

        db::Status s = uow.Commit();
        if (s.IsAlreadyExists() && FindRuleByName(request.name)) {
            throw LedgerError(ErrorKind::DuplicateRule, "rule '" + request.name + "' already exists");
        }
        ThrowOnStorageError(s, "commit rule creation");
        return rule;
    });

    LOG_INFO(util::LogCategory::ALLOC) << "Created allocation rule " << created.id << " '"
                                       << created.name << "' priority " << created.priority
                                       << " by " << actor;
    return created;
}

AllocationRule RuleBook::UpdateRule(RuleId id, const RuleUpdate& update, const std::string& actor) {
    if (update.name) {
        ValidateRuleName(*update.name);
    }

    AllocationRule updated = RunWithRetry(retry_, "UpdateRule", [&]() {
        db::UnitOfWork uow(store_);
        std::string raw;
        db::Status s = store_.ReadSnapshot().Get(db::RuleKey(id), &raw);
        if (s.IsNotFound()) {
            throw LedgerError(ErrorKind::NotFound, "rule " + std::to_string(id) + " not found");
        }
        ThrowOnStorageError(s, "read rule");

        AllocationRule rule;
        if (!db::DeserializeFromString(raw, rule)) {
            ThrowOnStorageError(db::Status::Corruption("undecodable rule"), "read rule");
        }
        Metadata before = rule.ToSnapshot();
        std::string oldName = rule.name;

        if (update.name) rule.name = *update.name;
        if (update.active) rule.active = *update.active;
        if (update.priority) rule.priority = *update.priority;
        if (update.items) rule.items = *update.items;
        if (update.minAmount) rule.minAmount = *update.minAmount;
        if (update.maxAmount) rule.maxAmount = *update.maxAmount;
        if (update.description) rule.description = *update.description;
        ValidateRule(rule.items, rule.minAmount, rule.maxAmount);
        rule.updatedAt = GetTime();

        if (rule.name != oldName) {
            if (FindRuleByName(rule.name)) {
                throw LedgerError(ErrorKind::DuplicateRule, "rule '" + rule.name + "' already exists");
            }
            uow.Delete(db::RuleNameKey(oldName));
            uow.Claim(db::RuleNameKey(rule.name), db::EncodeId(rule.id));
        }

        uow.Expect(db::RuleKey(id), raw);
        uow.Put(db::RuleKey(id), rule);
        audit_.Record(uow, EntityType::RULE, id, AuditAction::UPDATE,
                      before, rule.ToSnapshot(), actor);

        s = uow.Commit();
        if (s.IsAlreadyExists()) {
            throw LedgerError(ErrorKind::DuplicateRule, "rule '" + rule.name + "' already exists");
        }
        ThrowOnStorageError(s, "commit rule update");
        return rule;
    });

    LOG_INFO(util::LogCategory::ALLOC) << "Updated allocation rule " << id << " '"
                                       << updated.name << "' by " << actor;
    return updated;
}

AllocationRule RuleBook::DeactivateRule(RuleId id, const std::string& actor) {
    AllocationRule result = RunWithRetry(retry_, "DeactivateRule", [&]() {
        db::UnitOfWork uow(store_);
        std::string raw;
        db::Status s = store_.ReadSnapshot().Get(db::RuleKey(id), &raw);
        if (s.IsNotFound()) {
            throw LedgerError(ErrorKind::NotFound, "rule " + std::to_string(id) + " not found");
        }
        ThrowOnStorageError(s, "read rule");

        AllocationRule rule;
        if (!db::DeserializeFromString(raw, rule)) {
            ThrowOnStorageError(db::Status::Corruption("undecodable rule"), "read rule");
        }
        Metadata before = rule.ToSnapshot();
        rule.active = false;
        rule.updatedAt = GetTime();

        uow.Expect(db::RuleKey(id), raw);
        uow.Put(db::RuleKey(id), rule);
        audit_.Record(uow, EntityType::RULE, id, AuditAction::DELETE,
                      before, rule.ToSnapshot(), actor);
        ThrowOnStorageError(uow.Commit(), "commit rule deactivation");
        return rule;
    });

    LOG_INFO(util::LogCategory::ALLOC) << "Deactivated allocation rule " << id << " by " << actor;
    return result;
}

AllocationRule RuleBook::GetRule(RuleId id) const {
    AllocationRule rule;
    db::Status s = store_.ReadSnapshot().ReadRule(id, &rule);
    if (s.IsNotFound()) {
        throw LedgerError(ErrorKind::NotFound, "rule " + std::to_string(id) + " not found");
    }
    ThrowOnStorageError(s, "read rule");
    return rule;
}

std::optional<AllocationRule> RuleBook::FindRuleByName(const std::string& name) const {
    auto snapshot = store_.ReadSnapshot();
    RuleId id = 0;
    db::Status s = snapshot.FindRuleByName(name, &id);
    if (s.IsNotFound()) {
        return std::nullopt;
    }
    ThrowOnStorageError(s, "read rule name index");

    AllocationRule rule;
    s = snapshot.ReadRule(id, &rule);
    if (s.IsNotFound()) {
        return std::nullopt;
    }
    ThrowOnStorageError(s, "read rule");
    return rule;
}

std::vector<AllocationRule> RuleBook::ListRules(bool activeOnly) const {
    std::vector<AllocationRule> rules;
    db::Status s = store_.ReadSnapshot().ForEach<AllocationRule>(db::prefix::RULE, false,
        [&](const AllocationRule& rule) {
            if (!activeOnly || rule.active) {
                rules.push_back(rule);
            }
            return true;
        });
    ThrowOnStorageError(s, "scan rules");

    std::stable_sort(rules.begin(), rules.end(),
        [](const AllocationRule& a, const AllocationRule& b) {
            if (a.priority != b.priority) return a.priority < b.priority;
            return a.id < b.id;
        });
    return rules;
}

std::optional<AllocationRule> RuleBook::SelectRule(Amount amount) const {
    for (auto& rule : ListRules(true)) {
        if (rule.Matches(amount)) {
            return rule;
        }
    }
    return std::nullopt;
}

} // namespace ledger
} // namespace tally
