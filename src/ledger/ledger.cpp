// TALLY - Transaction Ledger
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/ledger/ledger.h"

namespace tally {
namespace ledger {

void ValidateShape(TransactionType type,
                   const std::optional<AccountId>& fromAccount,
                   const std::optional<AccountId>& toAccount) {
    const char* name = TransactionTypeToString(type);
    switch (type) {
        case TransactionType::EXTERNAL_DEPOSIT:
            if (fromAccount || !toAccount) {
                throw LedgerError(ErrorKind::InvalidTransactionShape,
                                  std::string(name) + " requires a to_account and no from_account");
            }
            return;
        case TransactionType::EXTERNAL_WITHDRAWAL:
            if (!fromAccount || toAccount) {
                throw LedgerError(ErrorKind::InvalidTransactionShape,
                                  std::string(name) + " requires a from_account and no to_account");
            }
            return;
        default:
            if (!fromAccount || !toAccount) {
                throw LedgerError(ErrorKind::InvalidTransactionShape,
                                  std::string(name) + " requires both from_account and to_account");
            }
            return;
    }
}

TransactionLedger::TransactionLedger(db::LedgerDB& store, AccountStore& accounts,
                                     AllocationEngine& allocator, AuditLog& audit,
                                     AccountLockTable& locks, RetryPolicy retry)
    : store_(store)
    , accounts_(accounts)
    , allocator_(allocator)
    , audit_(audit)
    , locks_(locks)
    , retry_(retry) {}

void TransactionLedger::CheckAccountUsable(const std::optional<AccountId>& id,
                                           const char* side) const {
    if (!id) {
        return;
    }
    auto account = accounts_.FindAccount(*id);
    if (!account) {
        throw LedgerError(ErrorKind::UnknownAccount,
                          std::string(side) + " account " + std::to_string(*id) + " does not exist");
    }
    if (!account->active) {
        throw LedgerError(ErrorKind::ValidationError,
                          std::string(side) + " account '" + account->name + "' is inactive");
    }
}

void TransactionLedger::ApplyEffects(db::UnitOfWork& uow, const LedgerTransaction& tx) {
    for (const auto& id : {tx.fromAccount, tx.toAccount}) {
        if (!id) continue;
        LogicalAccount* account = nullptr;
        db::Status s = uow.StageAccount(*id, &account);
        if (s.IsNotFound()) {
            throw LedgerError(ErrorKind::UnknownAccount,
                              "account " + std::to_string(*id) + " does not exist");
        }
        ThrowOnStorageError(s, "read account");
        if (!account->active) {
            throw LedgerError(ErrorKind::ValidationError,
                              "account '" + account->name + "' is inactive");
        }
    }

    switch (tx.type) {
        case TransactionType::EXTERNAL_DEPOSIT: {
            Amount held = accounts_.TotalHoldings();
            if (tx.amount > MAX_TREASURY - held) {
                throw LedgerError(ErrorKind::ValidationError,
                                  "deposit of " + FormatAmount(tx.amount) +
                                  " would raise treasury holdings of " + FormatAmount(held) +
                                  " above " + FormatAmount(MAX_TREASURY));
            }
            accounts_.AdjustBalance(uow, *tx.toAccount, tx.amount, tx.id);
            break;
        }
        case TransactionType::EXTERNAL_WITHDRAWAL:
            accounts_.AdjustBalance(uow, *tx.fromAccount, -tx.amount, tx.id);
            break;
        default:
            accounts_.AdjustBalance(uow, *tx.fromAccount, -tx.amount, tx.id);
            accounts_.AdjustBalance(uow, *tx.toAccount, tx.amount, tx.id);
            break;
    }
}

std::vector<AccountId> TransactionLedger::LockSet(const LedgerTransaction& tx,
                                                  const std::optional<AllocationPlan>& plan) const {
    std::vector<AccountId> ids;
    if (tx.type == TransactionType::EXTERNAL_DEPOSIT) ids.push_back(TREASURY_SUPPLY_LOCK);
    if (tx.fromAccount) ids.push_back(*tx.fromAccount);
    if (tx.toAccount) ids.push_back(*tx.toAccount);
    if (plan) {
        for (const auto& target : plan->targets) {
            ids.push_back(target.id);
        }
    }
    return ids;
}

RecordResult TransactionLedger::RecordTransaction(const TransactionRequest& request) {
    if (request.amount <= 0 || !MoneyRange(request.amount)) {
        throw LedgerError(ErrorKind::ValidationError, "amount must be positive and within range");
    }
    ValidateShape(request.type, request.fromAccount, request.toAccount);
    if (request.externalRef &&
        (request.externalRef->empty() || request.externalRef->size() > MAX_EXTERNAL_REF_LENGTH)) {
        throw LedgerError(ErrorKind::ValidationError,
                          "external_ref must be 1-" + std::to_string(MAX_EXTERNAL_REF_LENGTH) +
                          " characters");
    }
    std::string actor = request.performedBy.empty() ? SYSTEM_ACTOR : request.performedBy;

    RecordResult result = RunWithRetry(retry_, "RecordTransaction", [&]() {
        RecordResult out;

        if (request.externalRef) {
            TransactionId existing = 0;
            db::Status s = store_.ReadSnapshot().FindExternalRef(*request.externalRef, &existing);
            if (s.ok()) {
                out.transaction = GetTransaction(existing);
                out.replayed = true;
                if (out.transaction.IsCompletedDeposit()) {
                    out.allocation = allocator_.GetAllocations(existing);
                }
                return out;
            }
            if (!s.IsNotFound()) {
                ThrowOnStorageError(s, "read external reference index");
            }
        }

        CheckAccountUsable(request.fromAccount, "from");
        CheckAccountUsable(request.toAccount, "to");
        if (request.parentId) {
            LedgerTransaction parent;
            db::Status s = store_.ReadSnapshot().ReadTransaction(*request.parentId, &parent);
            if (s.IsNotFound()) {
                throw LedgerError(ErrorKind::ValidationError,
                                  "parent transaction " + std::to_string(*request.parentId) +
                                  " does not exist");
            }
            ThrowOnStorageError(s, "read parent transaction");
        }

        LedgerTransaction tx;
        tx.type = request.type;
        tx.status = request.status;
        tx.amount = request.amount;
        tx.fromAccount = request.fromAccount;
        tx.toAccount = request.toAccount;
        tx.parentId = request.parentId;
        tx.externalRef = request.externalRef;
        tx.description = request.description;
        tx.metadata = request.metadata;
        tx.performedBy = actor;
        tx.createdAt = GetTime();

        std::optional<AllocationPlan> plan;
        if (tx.IsCompletedDeposit()) {
            plan = allocator_.Plan(tx.amount);
        }

        AccountLockTable::Guard guard;
        if (tx.IsCompleted()) {
            guard = locks_.Acquire(LockSet(tx, plan));
        }

        db::UnitOfWork uow(store_);
        ThrowOnStorageError(store_.NextId(db::prefix::TRANSACTION, &tx.id),
                            "allocate transaction id");
        if (tx.IsCompleted()) {
            tx.completedAt = tx.createdAt;
            ApplyEffects(uow, tx);
        }

        uow.Put(db::TransactionKey(tx.id), tx);
        if (tx.externalRef) {
            uow.Claim(db::ExternalRefKey(*tx.externalRef), db::EncodeId(tx.id));
        }
        audit_.Record(uow, EntityType::TRANSACTION, tx.id, AuditAction::CREATE,
                      {}, tx.ToSnapshot(), actor);

        if (tx.IsCompletedDeposit()) {
            out.allocation = allocator_.Apply(uow, tx, guard, actor);
        }

        accounts_.CheckStagedBalances(uow);
        ThrowOnStorageError(uow.Commit(), "commit transaction");
        out.transaction = tx;
        return out;
    });

    if (!result.replayed) {
        const auto& tx = result.transaction;
        LOG_INFO(util::LogCategory::LEDGER) << "Recorded " << TransactionTypeToString(tx.type)
                                            << " " << tx.id << " of " << FormatAmount(tx.amount)
                                            << " (" << TransactionStatusToString(tx.status)
                                            << ") by " << tx.performedBy;
        if (result.allocation && result.allocation->allocated) {
            LOG_INFO(util::LogCategory::ALLOC) << "Allocated deposit " << tx.id << " via rule '"
                                               << result.allocation->ruleName << "' into "
                                               << result.allocation->shares.size() << " accounts";
        }
    } else {
        LOG_DEBUG(util::LogCategory::LEDGER) << "External reference replayed, returning transaction "
                                             << result.transaction.id;
    }
    return result;
}

RecordResult TransactionLedger::CompleteTransaction(TransactionId id, TransactionStatus newStatus,
                                                    const std::string& actor) {
    if (newStatus != TransactionStatus::COMPLETED &&
        newStatus != TransactionStatus::FAILED &&
        newStatus != TransactionStatus::CANCELLED) {
        throw LedgerError(ErrorKind::ValidationError,
                          std::string("cannot move a transaction to ") +
                          TransactionStatusToString(newStatus));
    }
    std::string who = actor.empty() ? SYSTEM_ACTOR : actor;

    RecordResult result = RunWithRetry(retry_, "CompleteTransaction", [&]() {
        std::string raw;
        db::Status s = store_.ReadSnapshot().Get(db::TransactionKey(id), &raw);
        if (s.IsNotFound()) {
            throw LedgerError(ErrorKind::NotFound, "transaction " + std::to_string(id) + " not found");
        }
        ThrowOnStorageError(s, "read transaction");

        LedgerTransaction tx;
        if (!db::DeserializeFromString(raw, tx)) {
            ThrowOnStorageError(db::Status::Corruption("undecodable transaction"), "read transaction");
        }
        if (tx.status != TransactionStatus::PENDING) {
            throw LedgerError(ErrorKind::ValidationError,
                              "transaction " + std::to_string(id) + " is " +
                              TransactionStatusToString(tx.status) + ", only PENDING can change");
        }

        Metadata before = tx.ToSnapshot();
        tx.status = newStatus;

        std::optional<AllocationPlan> plan;
        AccountLockTable::Guard guard;
        if (tx.IsCompleted()) {
            if (tx.IsCompletedDeposit()) {
                plan = allocator_.Plan(tx.amount);
            }
            guard = locks_.Acquire(LockSet(tx, plan));
        }

        db::UnitOfWork uow(store_);
        if (tx.IsCompleted()) {
            tx.completedAt = GetTime();
            ApplyEffects(uow, tx);
        }
        uow.Expect(db::TransactionKey(id), raw);
        uow.Put(db::TransactionKey(id), tx);
        audit_.Record(uow, EntityType::TRANSACTION, id, AuditAction::UPDATE,
                      before, tx.ToSnapshot(), who);

        RecordResult out;
        if (tx.IsCompletedDeposit()) {
            out.allocation = allocator_.Apply(uow, tx, guard, who);
        }
        accounts_.CheckStagedBalances(uow);
        ThrowOnStorageError(uow.Commit(), "commit status change");
        out.transaction = tx;
        return out;
    });

    LOG_INFO(util::LogCategory::LEDGER) << "Transaction " << id << " moved to "
                                        << TransactionStatusToString(newStatus) << " by " << who;
    return result;
}

LedgerTransaction TransactionLedger::GetTransaction(TransactionId id) const {
    LedgerTransaction tx;
    db::Status s = store_.ReadSnapshot().ReadTransaction(id, &tx);
    if (s.IsNotFound()) {
        throw LedgerError(ErrorKind::NotFound, "transaction " + std::to_string(id) + " not found");
    }
    ThrowOnStorageError(s, "read transaction");
    return tx;
}

TransactionPage TransactionLedger::ListTransactions(const TransactionFilter& filter) const {
    if (filter.limit < 1 || filter.limit > MAX_PAGE_LIMIT) {
        throw LedgerError(ErrorKind::ValidationError,
                          "limit must be within 1-" + std::to_string(MAX_PAGE_LIMIT));
    }

    TransactionPage page;
    page.limit = filter.limit;
    page.offset = filter.offset;

    db::Status s = store_.ReadSnapshot().ForEach<LedgerTransaction>(db::prefix::TRANSACTION, true,
        [&](const LedgerTransaction& tx) {
            if (filter.type && tx.type != *filter.type) return true;
            if (filter.status && tx.status != *filter.status) return true;
            if (filter.account && tx.fromAccount != filter.account &&
                tx.toAccount != filter.account) return true;
            if (filter.fromAccount && tx.fromAccount != filter.fromAccount) return true;
            if (filter.toAccount && tx.toAccount != filter.toAccount) return true;
            if (filter.parentId && tx.parentId != filter.parentId) return true;
            if (filter.since && tx.createdAt < *filter.since) return true;
            if (filter.until && tx.createdAt > *filter.until) return true;

            if (page.total >= filter.offset && page.items.size() < filter.limit) {
                page.items.push_back(tx);
            }
            ++page.total;
            return true;
        });
    ThrowOnStorageError(s, "scan transactions");
    return page;
}

std::vector<LedgerTransaction> TransactionLedger::ListUnallocatedDeposits() const {
    std::vector<LedgerTransaction> deposits;
    auto snapshot = store_.ReadSnapshot();
    db::Status s = snapshot.ForEach<LedgerTransaction>(db::prefix::TRANSACTION, true,
        [&](const LedgerTransaction& tx) {
            if (tx.IsCompletedDeposit()) {
                deposits.push_back(tx);
            }
            return true;
        });
    ThrowOnStorageError(s, "scan transactions");

    std::vector<LedgerTransaction> unallocated;
    std::vector<std::pair<AccountId, TransactionId>> children;
    for (auto& tx : deposits) {
        ThrowOnStorageError(snapshot.ListAllocationChildren(tx.id, &children),
                            "read allocation index");
        if (children.empty()) {
            unallocated.push_back(std::move(tx));
        }
    }
    return unallocated;
}

LedgerTotals TransactionLedger::ComputeTotals() const {
    LedgerTotals totals;
    db::Status s = store_.ReadSnapshot().ForEach<LedgerTransaction>(db::prefix::TRANSACTION, false,
        [&](const LedgerTransaction& tx) {
            ++totals.transactionCount;
            if (!tx.IsCompleted()) return true;
            if (tx.type == TransactionType::EXTERNAL_DEPOSIT) {
                totals.deposits += tx.amount;
            } else if (tx.type == TransactionType::EXTERNAL_WITHDRAWAL) {
                totals.withdrawals += tx.amount;
            }
            return true;
        });
    ThrowOnStorageError(s, "scan transactions");
    return totals;
}

} // namespace ledger
} // namespace tally
