// TALLY - Reconciliation Engine
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Compares an externally reported balance against the total of the active
// accounts, read from one point-in-time snapshot, and records the result.
// Balances are never corrected automatically.

#ifndef TALLY_LEDGER_RECONCILE_H
#define TALLY_LEDGER_RECONCILE_H

#include "tally/db/ledgerdb.h"
#include "tally/ledger/audit.h"
#include "tally/ledger/contention.h"
#include "tally/ledger/types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tally {
namespace ledger {

constexpr size_t DEFAULT_RECONCILIATION_LIMIT = 20;

/**
 * Classify a discrepancy against an internal total. With
 * base = max(internal, 1 unit): zero is BALANCED, |d| below 1% of base is
 * MINOR_DISCREPANCY, below 5% MAJOR_DISCREPANCY, otherwise CRITICAL.
 */
ReconciliationStatus ClassifyDiscrepancy(Amount internalTotal, Amount discrepancy);

/// discrepancy / max(internal, 1 unit) * 100
double DiscrepancyPercent(Amount internalTotal, Amount discrepancy);

class ReconciliationEngine {
public:
    ReconciliationEngine(db::LedgerDB& store, AuditLog& audit, RetryPolicy retry = RetryPolicy());

    /// Record a comparison; audited CREATE. Throws ValidationError for a bad balance.
    ReconciliationRecord Reconcile(Amount externalBalance, const std::string& source,
                                   const std::string& notes, const std::string& actor);

    /// Attach resolution notes; throws NotFound or AlreadyResolved. Audited UPDATE.
    ReconciliationRecord Resolve(ReconciliationId id, const std::string& notes,
                                 const std::string& resolver);

    /// Throws NotFound
    ReconciliationRecord GetRecord(ReconciliationId id) const;

    std::optional<ReconciliationRecord> GetLatest() const;

    /// Newest first
    std::vector<ReconciliationRecord> ListHistory(
        size_t limit, const std::optional<ReconciliationStatus>& status) const;

private:
    db::LedgerDB& store_;
    AuditLog& audit_;
    RetryPolicy retry_;
};

} // namespace ledger
} // namespace tally

#endif // TALLY_LEDGER_RECONCILE_H
