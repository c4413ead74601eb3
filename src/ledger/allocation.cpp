// TALLY - Allocation Engine
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/ledger/allocation.h"

#include <set>

namespace tally {
namespace ledger {

std::vector<Amount> SplitAmount(Amount amount, const std::vector<BasisPoints>& percents) {
    std::vector<Amount> shares;
    shares.reserve(percents.size());
    if (percents.empty()) {
        return shares;
    }

    Amount allocated = 0;
    size_t largest = 0;
    for (size_t i = 0; i < percents.size(); ++i) {
        Amount share = ApplyBasisPoints(amount, percents[i]);
        shares.push_back(share);
        allocated += share;
        if (percents[i] > percents[largest]) {
            largest = i;
        }
    }
    shares[largest] += amount - allocated;
    return shares;
}

AllocationEngine::AllocationEngine(db::LedgerDB& store, AccountStore& accounts, RuleBook& rules,
                                   AuditLog& audit, AccountLockTable& locks, RetryPolicy retry)
    : store_(store)
    , accounts_(accounts)
    , rules_(rules)
    , audit_(audit)
    , locks_(locks)
    , retry_(retry) {}

std::optional<AllocationPlan> AllocationEngine::Plan(Amount amount) const {
    auto rule = rules_.SelectRule(amount);
    if (!rule) {
        return std::nullopt;
    }

    auto invalid = [&rule](const std::string& why) {
        return LedgerError(ErrorKind::InvalidRuleConfiguration,
                           "rule '" + rule->name + "': " + why);
    };

    if (rule->items.empty()) {
        throw invalid("no allocations");
    }
    if (rule->TotalPercent() != FULL_PERCENT) {
        throw invalid("percentages sum to " + FormatPercent(rule->TotalPercent()));
    }

    AllocationPlan plan;
    std::set<AccountId> seen;
    std::vector<BasisPoints> percents;
    for (const auto& item : rule->items) {
        if (item.percent <= 0) {
            throw invalid("non-positive percentage for '" + item.accountName + "'");
        }
        auto account = accounts_.FindAccountByName(item.accountName);
        if (!account) {
            throw invalid("account '" + item.accountName + "' does not exist");
        }
        if (!account->active) {
            throw invalid("account '" + item.accountName + "' is inactive");
        }
        if (!seen.insert(account->id).second) {
            throw invalid("account '" + item.accountName + "' appears more than once");
        }
        plan.targets.push_back(*account);
        percents.push_back(item.percent);
    }
    plan.amounts = SplitAmount(amount, percents);
    plan.rule = std::move(*rule);
    return plan;
}

AllocationResult AllocationEngine::LoadResult(const LedgerTransaction& deposit) const {
    AllocationResult result;
    result.depositId = deposit.id;

    auto snapshot = store_.ReadSnapshot();
    std::vector<std::pair<AccountId, TransactionId>> children;
    ThrowOnStorageError(snapshot.ListAllocationChildren(deposit.id, &children),
                        "read allocation index");

    for (const auto& [target, childId] : children) {
        LedgerTransaction child;
        ThrowOnStorageError(snapshot.ReadTransaction(childId, &child), "read allocation child");

        AllocationShare share;
        share.accountId = target;
        share.amount = child.amount;
        share.transactionId = child.id;

        LogicalAccount account;
        db::Status s = snapshot.ReadAccount(target, &account);
        if (s.ok()) {
            share.accountName = account.name;
        } else if (!s.IsNotFound()) {
            ThrowOnStorageError(s, "read allocation target");
        }

        auto it = child.metadata.find(AllocationMeta::PERCENT_BP);
        if (it != child.metadata.end()) {
            share.percent = std::stoll(it->second);
        }
        if (!result.ruleId) {
            auto ruleIt = child.metadata.find(AllocationMeta::RULE_ID);
            if (ruleIt != child.metadata.end()) {
                result.ruleId = std::stoull(ruleIt->second);
            }
            auto nameIt = child.metadata.find(AllocationMeta::RULE_NAME);
            if (nameIt != child.metadata.end()) {
                result.ruleName = nameIt->second;
            }
        }

        result.total += share.amount;
        result.shares.push_back(std::move(share));
    }

    result.allocated = !result.shares.empty();
    return result;
}

AllocationResult AllocationEngine::Apply(db::UnitOfWork& uow, const LedgerTransaction& deposit,
                                         const AccountLockTable::Guard& guard,
                                         const std::string& actor) {
    AllocationResult existing = LoadResult(deposit);
    if (existing.allocated) {
        existing.replayed = true;
        return existing;
    }

    AllocationResult result;
    result.depositId = deposit.id;

    auto plan = Plan(deposit.amount);
    if (!plan) {
        result.reason = "no active allocation rule matches amount " + FormatAmount(deposit.amount);
        LOG_WARN(util::LogCategory::ALLOC) << "Deposit " << deposit.id << " left unallocated: "
                                           << result.reason;
        return result;
    }

    AccountId intake = *deposit.toAccount;
    if (!guard.Holds(intake)) {
        throw LedgerError(ErrorKind::TransientConflict, "intake account is not locked");
    }
    for (const auto& target : plan->targets) {
        if (!guard.Holds(target.id)) {
            throw LedgerError(ErrorKind::TransientConflict,
                              "targets of rule '" + plan->rule.name + "' changed during allocation");
        }
    }

    result.ruleId = plan->rule.id;
    result.ruleName = plan->rule.name;
    Timestamp now = GetTime();
    std::string childIds;

    for (size_t i = 0; i < plan->targets.size(); ++i) {
        const LogicalAccount& target = plan->targets[i];
        Amount amount = plan->amounts[i];
        if (amount == 0) {
            continue;
        }

        LedgerTransaction child;
        ThrowOnStorageError(store_.NextId(db::prefix::TRANSACTION, &child.id),
                            "allocate transaction id");
        child.type = TransactionType::INTERNAL_ALLOCATION;
        child.status = TransactionStatus::COMPLETED;
        child.amount = amount;
        child.fromAccount = intake;
        child.toAccount = target.id;
        child.parentId = deposit.id;
        child.description = "Allocation of deposit " + std::to_string(deposit.id) + " to " +
                            target.name + " via rule '" + plan->rule.name + "'";
        child.metadata[AllocationMeta::RULE_ID] = std::to_string(plan->rule.id);
        child.metadata[AllocationMeta::RULE_NAME] = plan->rule.name;
        child.metadata[AllocationMeta::PERCENT_BP] = std::to_string(plan->rule.items[i].percent);
        child.performedBy = actor;
        child.createdAt = now;
        child.completedAt = now;

        accounts_.AdjustBalance(uow, intake, -amount, child.id);
        accounts_.AdjustBalance(uow, target.id, amount, child.id);
        uow.Put(db::TransactionKey(child.id), child);
        uow.Claim(db::AllocationKey(deposit.id, target.id), db::EncodeId(child.id));

        AllocationShare share;
        share.accountId = target.id;
        share.accountName = target.name;
        share.percent = plan->rule.items[i].percent;
        share.amount = amount;
        share.transactionId = child.id;
        result.total += amount;
        result.shares.push_back(std::move(share));

        if (!childIds.empty()) childIds += ",";
        childIds += std::to_string(child.id);
    }

    Metadata after;
    after["rule_id"] = std::to_string(plan->rule.id);
    after["rule_name"] = plan->rule.name;
    after["children"] = childIds;
    after["total"] = FormatAmount(result.total);
    audit_.Record(uow, EntityType::TRANSACTION, deposit.id, AuditAction::EXECUTE, {}, after, actor);

    result.allocated = true;
    return result;
}

AllocationResult AllocationEngine::Allocate(TransactionId depositId, const std::string& actor) {
    AllocationResult result = RunWithRetry(retry_, "Allocate", [&]() {
        LedgerTransaction deposit;
        db::Status s = store_.ReadSnapshot().ReadTransaction(depositId, &deposit);
        if (s.IsNotFound()) {
            throw LedgerError(ErrorKind::NotFound,
                              "transaction " + std::to_string(depositId) + " not found");
        }
        ThrowOnStorageError(s, "read transaction");
        if (!deposit.IsCompletedDeposit() || !deposit.toAccount) {
            throw LedgerError(ErrorKind::ValidationError,
                              "transaction " + std::to_string(depositId) +
                              " is not a completed external deposit");
        }

        AllocationResult prior = LoadResult(deposit);
        if (prior.allocated) {
            prior.replayed = true;
            return prior;
        }

        auto plan = Plan(deposit.amount);
        if (!plan) {
            throw LedgerError(ErrorKind::NoApplicableRule,
                              "no active allocation rule matches amount " +
                              FormatAmount(deposit.amount));
        }

        std::vector<AccountId> lockIds{*deposit.toAccount};
        for (const auto& target : plan->targets) {
            lockIds.push_back(target.id);
        }
        auto guard = locks_.Acquire(lockIds);

        db::UnitOfWork uow(store_);
        AllocationResult applied = Apply(uow, deposit, guard, actor);
        if (applied.replayed) {
            return applied;
        }
        if (!applied.allocated) {
            throw LedgerError(ErrorKind::NoApplicableRule, applied.reason);
        }
        accounts_.CheckStagedBalances(uow);
        ThrowOnStorageError(uow.Commit(), "commit allocation");

        LOG_INFO(util::LogCategory::ALLOC) << "Allocated deposit " << depositId << " ("
                                           << FormatAmount(applied.total) << ") via rule '"
                                           << applied.ruleName << "' into "
                                           << applied.shares.size() << " accounts";
        return applied;
    });
    return result;
}

AllocationResult AllocationEngine::GetAllocations(TransactionId depositId) const {
    LedgerTransaction deposit;
    db::Status s = store_.ReadSnapshot().ReadTransaction(depositId, &deposit);
    if (s.IsNotFound()) {
        throw LedgerError(ErrorKind::NotFound,
                          "transaction " + std::to_string(depositId) + " not found");
    }
    ThrowOnStorageError(s, "read transaction");
    return LoadResult(deposit);
}

bool AllocationEngine::IsAllocated(TransactionId depositId) const {
    std::vector<std::pair<AccountId, TransactionId>> children;
    ThrowOnStorageError(store_.ReadSnapshot().ListAllocationChildren(depositId, &children),
                        "read allocation index");
    return !children.empty();
}

} // namespace ledger
} // namespace tally
