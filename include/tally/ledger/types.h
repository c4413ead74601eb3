// TALLY - Ledger Record Types
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Records persisted by the treasury ledger: logical accounts, ledger
// transactions, allocation rules, reconciliation records and audit entries.

#ifndef TALLY_LEDGER_TYPES_H
#define TALLY_LEDGER_TYPES_H

#include "tally/core/types.h"
#include "tally/core/serialize.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tally {
namespace ledger {

using AccountId = uint64_t;
using TransactionId = uint64_t;
using RuleId = uint64_t;
using ReconciliationId = uint64_t;
using AuditId = uint64_t;

/// Structured string map used for transaction metadata and audit snapshots
using Metadata = std::map<std::string, std::string>;

/// Default rule priority (lower value wins)
constexpr int32_t DEFAULT_RULE_PRIORITY = 100;

/// Role required for privileged mutations
constexpr const char* GUARDIAN_ROLE = "guardian";

// ============================================================================
// Enumerations
// ============================================================================

enum class AccountType : uint8_t {
    OPERATING = 0,
    RESERVE = 1,
    REWARDS = 2,
    DEVELOPMENT = 3,
    MARKETING = 4,
    CUSTOM = 5,
};

enum class TransactionType : uint8_t {
    EXTERNAL_DEPOSIT = 0,
    EXTERNAL_WITHDRAWAL = 1,
    INTERNAL_ALLOCATION = 2,
    PAYMENT = 3,
    REFUND = 4,
    FEE = 5,
    NFT_MINT = 6,
    REWARD = 7,
};

enum class TransactionStatus : uint8_t {
    PENDING = 0,
    COMPLETED = 1,
    FAILED = 2,
    CANCELLED = 3,
    REFUNDED = 4,
};

enum class ReconciliationStatus : uint8_t {
    BALANCED = 0,
    MINOR_DISCREPANCY = 1,
    MAJOR_DISCREPANCY = 2,
    CRITICAL = 3,
};

enum class AuditAction : uint8_t {
    CREATE = 0,
    UPDATE = 1,
    DELETE = 2,
    EXECUTE = 3,
};

const char* AccountTypeToString(AccountType type);
std::optional<AccountType> ParseAccountType(const std::string& str);

const char* TransactionTypeToString(TransactionType type);
std::optional<TransactionType> ParseTransactionType(const std::string& str);

const char* TransactionStatusToString(TransactionStatus status);
std::optional<TransactionStatus> ParseTransactionStatus(const std::string& str);

const char* ReconciliationStatusToString(ReconciliationStatus status);
std::optional<ReconciliationStatus> ParseReconciliationStatus(const std::string& str);

const char* AuditActionToString(AuditAction action);

/// Entity type labels carried by audit entries
namespace EntityType {
    constexpr const char* ACCOUNT = "logical_account";
    constexpr const char* TRANSACTION = "ledger_transaction";
    constexpr const char* RULE = "allocation_rule";
    constexpr const char* RECONCILIATION = "reconciliation";
}

// ============================================================================
// Logical Account
// ============================================================================

struct LogicalAccount {
    AccountId id{0};
    std::string name;
    AccountType type{AccountType::CUSTOM};
    std::string description;
    /// Target share of the treasury, used for reserve health
    BasisPoints targetPercent{0};
    Amount balance{0};
    bool active{true};
    /// Incremented on every committed write; compared at commit time
    uint64_t version{0};
    Timestamp createdAt{0};
    Timestamp updatedAt{0};

    Metadata ToSnapshot() const;
};

// ============================================================================
// Ledger Transaction
// ============================================================================

struct LedgerTransaction {
    TransactionId id{0};
    TransactionType type{TransactionType::EXTERNAL_DEPOSIT};
    TransactionStatus status{TransactionStatus::PENDING};
    Amount amount{0};
    std::optional<AccountId> fromAccount;
    std::optional<AccountId> toAccount;
    std::optional<TransactionId> parentId;
    std::optional<std::string> externalRef;
    std::string description;
    Metadata metadata;
    std::string performedBy;
    Timestamp createdAt{0};
    std::optional<Timestamp> completedAt;

    bool IsCompleted() const { return status == TransactionStatus::COMPLETED; }
    bool IsCompletedDeposit() const {
        return IsCompleted() && type == TransactionType::EXTERNAL_DEPOSIT;
    }

    Metadata ToSnapshot() const;
};

// ============================================================================
// Allocation Rule
// ============================================================================

struct AllocationItem {
    std::string accountName;
    BasisPoints percent{0};

    bool operator==(const AllocationItem& other) const {
        return accountName == other.accountName && percent == other.percent;
    }
};

struct AllocationRule {
    RuleId id{0};
    std::string name;
    bool active{true};
    int32_t priority{DEFAULT_RULE_PRIORITY};
    std::vector<AllocationItem> items;
    std::optional<Amount> minAmount;
    std::optional<Amount> maxAmount;
    std::string description;
    std::string createdBy;
    Timestamp createdAt{0};
    Timestamp updatedAt{0};

    /// Whether the optional bounds admit this amount (inclusive)
    bool Matches(Amount amount) const {
        if (minAmount && amount < *minAmount) return false;
        if (maxAmount && amount > *maxAmount) return false;
        return true;
    }

    /// Sum of item percentages; 10000 for a well-formed rule
    BasisPoints TotalPercent() const {
        BasisPoints total = 0;
        for (const auto& item : items) {
            total += item.percent;
        }
        return total;
    }

    Metadata ToSnapshot() const;
};

// ============================================================================
// Reconciliation Record
// ============================================================================

struct ReconciliationRecord {
    ReconciliationId id{0};
    Amount externalBalance{0};
    Amount internalBalance{0};
    /// external - internal
    Amount discrepancy{0};
    /// discrepancy / max(internal, 1 unit) * 100, for display
    double discrepancyPercent{0.0};
    ReconciliationStatus status{ReconciliationStatus::BALANCED};
    std::string source;
    std::string notes;
    std::optional<std::string> resolutionNotes;
    std::optional<std::string> resolvedBy;
    std::optional<Timestamp> resolvedAt;
    std::string performedBy;
    Timestamp createdAt{0};
    /// Wall clock (ms) of the snapshot the totals were read from
    int64_t computedAtMs{0};

    bool IsResolved() const { return resolvedAt.has_value(); }

    Metadata ToSnapshot() const;
};

// ============================================================================
// Audit Entry
// ============================================================================

struct AuditEntry {
    AuditId id{0};
    std::string entityType;
    uint64_t entityId{0};
    AuditAction action{AuditAction::CREATE};
    Metadata before;
    Metadata after;
    std::string performedBy;
    Timestamp createdAt{0};
};

// ============================================================================
// Serialization
// ============================================================================

template<typename Stream, typename E>
void SerializeEnum(Stream& s, E value) {
    ::tally::Serialize(s, static_cast<uint8_t>(value));
}

template<typename Stream, typename E>
void UnserializeEnum(Stream& s, E& value) {
    uint8_t raw = 0;
    ::tally::Unserialize(s, raw);
    value = static_cast<E>(raw);
}

template<typename Stream>
void Serialize(Stream& s, const LogicalAccount& a) {
    ::tally::Serialize(s, a.id);
    ::tally::Serialize(s, a.name);
    SerializeEnum(s, a.type);
    ::tally::Serialize(s, a.description);
    ::tally::Serialize(s, a.targetPercent);
    ::tally::Serialize(s, a.balance);
    ::tally::Serialize(s, a.active);
    ::tally::Serialize(s, a.version);
    ::tally::Serialize(s, a.createdAt);
    ::tally::Serialize(s, a.updatedAt);
}

template<typename Stream>
void Unserialize(Stream& s, LogicalAccount& a) {
    ::tally::Unserialize(s, a.id);
    ::tally::Unserialize(s, a.name);
    UnserializeEnum(s, a.type);
    ::tally::Unserialize(s, a.description);
    ::tally::Unserialize(s, a.targetPercent);
    ::tally::Unserialize(s, a.balance);
    ::tally::Unserialize(s, a.active);
    ::tally::Unserialize(s, a.version);
    ::tally::Unserialize(s, a.createdAt);
    ::tally::Unserialize(s, a.updatedAt);
}

template<typename Stream>
void Serialize(Stream& s, const LedgerTransaction& tx) {
    ::tally::Serialize(s, tx.id);
    SerializeEnum(s, tx.type);
    SerializeEnum(s, tx.status);
    ::tally::Serialize(s, tx.amount);
    ::tally::Serialize(s, tx.fromAccount);
    ::tally::Serialize(s, tx.toAccount);
    ::tally::Serialize(s, tx.parentId);
    ::tally::Serialize(s, tx.externalRef);
    ::tally::Serialize(s, tx.description);
    ::tally::Serialize(s, tx.metadata);
    ::tally::Serialize(s, tx.performedBy);
    ::tally::Serialize(s, tx.createdAt);
    ::tally::Serialize(s, tx.completedAt);
}

template<typename Stream>
void Unserialize(Stream& s, LedgerTransaction& tx) {
    ::tally::Unserialize(s, tx.id);
    UnserializeEnum(s, tx.type);
    UnserializeEnum(s, tx.status);
    ::tally::Unserialize(s, tx.amount);
    ::tally::Unserialize(s, tx.fromAccount);
    ::tally::Unserialize(s, tx.toAccount);
    ::tally::Unserialize(s, tx.parentId);
    ::tally::Unserialize(s, tx.externalRef);
    ::tally::Unserialize(s, tx.description);
    ::tally::Unserialize(s, tx.metadata);
    ::tally::Unserialize(s, tx.performedBy);
    ::tally::Unserialize(s, tx.createdAt);
    ::tally::Unserialize(s, tx.completedAt);
}

template<typename Stream>
void Serialize(Stream& s, const AllocationItem& item) {
    ::tally::Serialize(s, item.accountName);
    ::tally::Serialize(s, item.percent);
}

template<typename Stream>
void Unserialize(Stream& s, AllocationItem& item) {
    ::tally::Unserialize(s, item.accountName);
    ::tally::Unserialize(s, item.percent);
}

template<typename Stream>
void Serialize(Stream& s, const AllocationRule& rule) {
    ::tally::Serialize(s, rule.id);
    ::tally::Serialize(s, rule.name);
    ::tally::Serialize(s, rule.active);
    ::tally::Serialize(s, rule.priority);
    WriteLength(s, rule.items.size());
    for (const auto& item : rule.items) {
        Serialize(s, item);
    }
    ::tally::Serialize(s, rule.minAmount);
    ::tally::Serialize(s, rule.maxAmount);
    ::tally::Serialize(s, rule.description);
    ::tally::Serialize(s, rule.createdBy);
    ::tally::Serialize(s, rule.createdAt);
    ::tally::Serialize(s, rule.updatedAt);
}

template<typename Stream>
void Unserialize(Stream& s, AllocationRule& rule) {
    ::tally::Unserialize(s, rule.id);
    ::tally::Unserialize(s, rule.name);
    ::tally::Unserialize(s, rule.active);
    ::tally::Unserialize(s, rule.priority);
    uint32_t count = ReadLength(s);
    rule.items.clear();
    for (uint32_t i = 0; i < count; ++i) {
        AllocationItem item;
        Unserialize(s, item);
        rule.items.push_back(std::move(item));
    }
    ::tally::Unserialize(s, rule.minAmount);
    ::tally::Unserialize(s, rule.maxAmount);
    ::tally::Unserialize(s, rule.description);
    ::tally::Unserialize(s, rule.createdBy);
    ::tally::Unserialize(s, rule.createdAt);
    ::tally::Unserialize(s, rule.updatedAt);
}

template<typename Stream>
void Serialize(Stream& s, const ReconciliationRecord& r) {
    ::tally::Serialize(s, r.id);
    ::tally::Serialize(s, r.externalBalance);
    ::tally::Serialize(s, r.internalBalance);
    ::tally::Serialize(s, r.discrepancy);
    ::tally::Serialize(s, r.discrepancyPercent);
    SerializeEnum(s, r.status);
    ::tally::Serialize(s, r.source);
    ::tally::Serialize(s, r.notes);
    ::tally::Serialize(s, r.resolutionNotes);
    ::tally::Serialize(s, r.resolvedBy);
    ::tally::Serialize(s, r.resolvedAt);
    ::tally::Serialize(s, r.performedBy);
    ::tally::Serialize(s, r.createdAt);
    ::tally::Serialize(s, r.computedAtMs);
}

template<typename Stream>
void Unserialize(Stream& s, ReconciliationRecord& r) {
    ::tally::Unserialize(s, r.id);
    ::tally::Unserialize(s, r.externalBalance);
    ::tally::Unserialize(s, r.internalBalance);
    ::tally::Unserialize(s, r.discrepancy);
    ::tally::Unserialize(s, r.discrepancyPercent);
    UnserializeEnum(s, r.status);
    ::tally::Unserialize(s, r.source);
    ::tally::Unserialize(s, r.notes);
    ::tally::Unserialize(s, r.resolutionNotes);
    ::tally::Unserialize(s, r.resolvedBy);
    ::tally::Unserialize(s, r.resolvedAt);
    ::tally::Unserialize(s, r.performedBy);
    ::tally::Unserialize(s, r.createdAt);
    ::tally::Unserialize(s, r.computedAtMs);
}

template<typename Stream>
void Serialize(Stream& s, const AuditEntry& e) {
    ::tally::Serialize(s, e.id);
    ::tally::Serialize(s, e.entityType);
    ::tally::Serialize(s, e.entityId);
    SerializeEnum(s, e.action);
    ::tally::Serialize(s, e.before);
    ::tally::Serialize(s, e.after);
    ::tally::Serialize(s, e.performedBy);
    ::tally::Serialize(s, e.createdAt);
}

template<typename Stream>
void Unserialize(Stream& s, AuditEntry& e) {
    ::tally::Unserialize(s, e.id);
    ::tally::Unserialize(s, e.entityType);
    ::tally::Unserialize(s, e.entityId);
    UnserializeEnum(s, e.action);
    ::tally::Unserialize(s, e.before);
    ::tally::Unserialize(s, e.after);
    ::tally::Unserialize(s, e.performedBy);
    ::tally::Unserialize(s, e.createdAt);
}

} // namespace ledger
} // namespace tally

#endif // TALLY_LEDGER_TYPES_H
