// TALLY - Audit Log
// Copyright (c) 2024 TALLY Developers
// MIT License

#ifndef TALLY_LEDGER_AUDIT_H
#define TALLY_LEDGER_AUDIT_H

#include "tally/db/ledgerdb.h"
#include "tally/ledger/types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tally {
namespace ledger {

constexpr size_t DEFAULT_AUDIT_LIMIT = 100;
constexpr size_t MAX_AUDIT_LIMIT = 1000;

struct AuditFilter {
    std::optional<std::string> entityType;
    std::optional<uint64_t> entityId;
    std::optional<std::string> performedBy;
    size_t limit{DEFAULT_AUDIT_LIMIT};
};

/// Append-only record of every ledger mutation; entries are never deleted
class AuditLog {
public:
    explicit AuditLog(db::LedgerDB& store);

    /// Stage an entry inside the mutation's unit of work
    AuditEntry Record(db::UnitOfWork& uow,
                      const std::string& entityType,
                      uint64_t entityId,
                      AuditAction action,
                      const Metadata& before,
                      const Metadata& after,
                      const std::string& actor);

    /// Matching entries, newest first
    std::vector<AuditEntry> Query(const AuditFilter& filter) const;

private:
    db::LedgerDB& store_;
};

} // namespace ledger
} // namespace tally

#endif // TALLY_LEDGER_AUDIT_H
