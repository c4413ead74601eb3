// TALLY - Reconciliation Engine
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/ledger/reconcile.h"
#include "tally/ledger/accounts.h"

#include <algorithm>

namespace tally {
namespace ledger {

ReconciliationStatus ClassifyDiscrepancy(Amount internalTotal, Amount discrepancy) {
    if (discrepancy == 0) {
        return ReconciliationStatus::BALANCED;
    }
    __int128 base = std::max<Amount>(internalTotal, 1);
    __int128 magnitude = discrepancy < 0 ? -static_cast<__int128>(discrepancy)
                                         : static_cast<__int128>(discrepancy);
    if (magnitude * 100 < base) {
        return ReconciliationStatus::MINOR_DISCREPANCY;
    }
    if (magnitude * 20 < base) {
        return ReconciliationStatus::MAJOR_DISCREPANCY;
    }
    return ReconciliationStatus::CRITICAL;
}

double DiscrepancyPercent(Amount internalTotal, Amount discrepancy) {
    Amount base = std::max<Amount>(internalTotal, 1);
    return static_cast<double>(discrepancy) / static_cast<double>(base) * 100.0;
}

ReconciliationEngine::ReconciliationEngine(db::LedgerDB& store, AuditLog& audit, RetryPolicy retry)
    : store_(store), audit_(audit), retry_(retry) {}

ReconciliationRecord ReconciliationEngine::Reconcile(Amount externalBalance,
                                                     const std::string& source,
                                                     const std::string& notes,
                                                     const std::string& actor) {
    if (externalBalance < 0 || externalBalance > MAX_TREASURY) {
        throw LedgerError(ErrorKind::ValidationError, "external balance out of range");
    }

    ReconciliationRecord record = RunWithRetry(retry_, "Reconcile", [&]() {
        ReconciliationRecord rec;
        {
            std::vector<LogicalAccount> active;
            db::Status s = store_.ReadSnapshot().ForEach<LogicalAccount>(db::prefix::ACCOUNT, false,
                [&active](const LogicalAccount& account) {
                    if (account.active) {
                        active.push_back(account);
                    }
                    return true;
                });
            ThrowOnStorageError(s, "scan accounts");
            rec.internalBalance = TotalBalance(active);
            rec.computedAtMs = GetTimeMillis();
        }

        rec.externalBalance = externalBalance;
        rec.discrepancy = externalBalance - rec.internalBalance;
        rec.discrepancyPercent = DiscrepancyPercent(rec.internalBalance, rec.discrepancy);
        rec.status = ClassifyDiscrepancy(rec.internalBalance, rec.discrepancy);
        rec.source = source.empty() ? "manual" : source;
        rec.notes = notes;
        rec.performedBy = actor;
        rec.createdAt = GetTime();

        db::UnitOfWork uow(store_);
        ThrowOnStorageError(store_.NextId(db::prefix::RECONCILIATION, &rec.id),
                            "allocate reconciliation id");
        uow.Put(db::ReconciliationKey(rec.id), rec);
        audit_.Record(uow, EntityType::RECONCILIATION, rec.id, AuditAction::CREATE,
                      {}, rec.ToSnapshot(), actor);
        ThrowOnStorageError(uow.Commit(), "commit reconciliation");
        return rec;
    });

    if (record.status == ReconciliationStatus::BALANCED) {
        LOG_INFO(util::LogCategory::RECON) << "Reconciliation " << record.id << " balanced at "
                                           << FormatAmount(record.internalBalance);
    } else {
        LOG_WARN(util::LogCategory::RECON) << "Reconciliation " << record.id << " "
                                           << ReconciliationStatusToString(record.status)
                                           << ": external " << FormatAmount(record.externalBalance)
                                           << ", internal " << FormatAmount(record.internalBalance)
                                           << ", discrepancy " << FormatAmount(record.discrepancy);
    }
    return record;
}

ReconciliationRecord ReconciliationEngine::Resolve(ReconciliationId id, const std::string& notes,
                                                   const std::string& resolver) {
    ReconciliationRecord record = RunWithRetry(retry_, "ResolveReconciliation", [&]() {
        std::string raw;
        db::Status s = store_.ReadSnapshot().Get(db::ReconciliationKey(id), &raw);
        if (s.IsNotFound()) {
            throw LedgerError(ErrorKind::NotFound,
                              "reconciliation " + std::to_string(id) + " not found");
        }
        ThrowOnStorageError(s, "read reconciliation");

        ReconciliationRecord rec;
        if (!db::DeserializeFromString(raw, rec)) {
            ThrowOnStorageError(db::Status::Corruption("undecodable reconciliation"),
                                "read reconciliation");
        }
        if (rec.IsResolved()) {
            throw LedgerError(ErrorKind::AlreadyResolved,
                              "reconciliation " + std::to_string(id) + " is already resolved");
        }

        Metadata before = rec.ToSnapshot();
        rec.resolutionNotes = notes;
        rec.resolvedBy = resolver;
        rec.resolvedAt = GetTime();

        db::UnitOfWork uow(store_);
        uow.Expect(db::ReconciliationKey(id), raw);
        uow.Put(db::ReconciliationKey(id), rec);
        audit_.Record(uow, EntityType::RECONCILIATION, id, AuditAction::UPDATE,
                      before, rec.ToSnapshot(), resolver);
        ThrowOnStorageError(uow.Commit(), "commit resolution");
        return rec;
    });

    LOG_INFO(util::LogCategory::RECON) << "Reconciliation " << id << " resolved by " << resolver;
    return record;
}

ReconciliationRecord ReconciliationEngine::GetRecord(ReconciliationId id) const {
    ReconciliationRecord rec;
    db::Status s = store_.ReadSnapshot().ReadReconciliation(id, &rec);
    if (s.IsNotFound()) {
        throw LedgerError(ErrorKind::NotFound, "reconciliation " + std::to_string(id) + " not found");
    }
    ThrowOnStorageError(s, "read reconciliation");
    return rec;
}

std::optional<ReconciliationRecord> ReconciliationEngine::GetLatest() const {
    auto history = ListHistory(1, std::nullopt);
    if (history.empty()) {
        return std::nullopt;
    }
    return history.front();
}

std::vector<ReconciliationRecord> ReconciliationEngine::ListHistory(
    size_t limit, const std::optional<ReconciliationStatus>& status) const {
    if (limit == 0) {
        limit = DEFAULT_RECONCILIATION_LIMIT;
    }
    std::vector<ReconciliationRecord> records;
    db::Status s = store_.ReadSnapshot().ForEach<ReconciliationRecord>(
        db::prefix::RECONCILIATION, true,
        [&](const ReconciliationRecord& rec) {
            if (status && rec.status != *status) return true;
            records.push_back(rec);
            return records.size() < limit;
        });
    ThrowOnStorageError(s, "scan reconciliations");
    return records;
}

} // namespace ledger
} // namespace tally
