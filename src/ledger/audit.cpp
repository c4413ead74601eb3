// TALLY - Audit Log
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/ledger/audit.h"
#include "tally/ledger/contention.h"

#include <algorithm>

namespace tally {
namespace ledger {

AuditLog::AuditLog(db::LedgerDB& store) : store_(store) {}

AuditEntry AuditLog::Record(db::UnitOfWork& uow,
                            const std::string& entityType,
                            uint64_t entityId,
                            AuditAction action,
                            const Metadata& before,
                            const Metadata& after,
                            const std::string& actor) {
    AuditEntry entry;
    ThrowOnStorageError(store_.NextId(db::prefix::AUDIT, &entry.id), "allocate audit id");
    entry.entityType = entityType;
    entry.entityId = entityId;
    entry.action = action;
    entry.before = before;
    entry.after = after;
    entry.performedBy = actor;
    entry.createdAt = GetTime();

    uow.Put(db::AuditKey(entry.id), entry);
    return entry;
}

std::vector<AuditEntry> AuditLog::Query(const AuditFilter& filter) const {
    size_t limit = filter.limit == 0 ? DEFAULT_AUDIT_LIMIT
                                     : std::min(filter.limit, MAX_AUDIT_LIMIT);
    std::vector<AuditEntry> result;

    auto snapshot = store_.ReadSnapshot();
    db::Status s = snapshot.ForEach<AuditEntry>(db::prefix::AUDIT, true,
        [&](const AuditEntry& entry) {
            if (filter.entityType && entry.entityType != *filter.entityType) return true;
            if (filter.entityId && entry.entityId != *filter.entityId) return true;
            if (filter.performedBy && entry.performedBy != *filter.performedBy) return true;
            result.push_back(entry);
            return result.size() < limit;
        });
    ThrowOnStorageError(s, "scan audit log");
    return result;
}

} // namespace ledger
} // namespace tally
