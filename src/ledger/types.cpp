// TALLY - Ledger Record Types
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/ledger/types.h"

#include <cstdio>

namespace tally {
namespace ledger {

// ============================================================================
// Enum Conversions
// ============================================================================

const char* AccountTypeToString(AccountType type) {
    switch (type) {
        case AccountType::OPERATING:   return "OPERATING";
        case AccountType::RESERVE:     return "RESERVE";
        case AccountType::REWARDS:     return "REWARDS";
        case AccountType::DEVELOPMENT: return "DEVELOPMENT";
        case AccountType::MARKETING:   return "MARKETING";
        case AccountType::CUSTOM:      return "CUSTOM";
    }
    return "UNKNOWN";
}

std::optional<AccountType> ParseAccountType(const std::string& str) {
    if (str == "OPERATING") return AccountType::OPERATING;
    if (str == "RESERVE") return AccountType::RESERVE;
    if (str == "REWARDS") return AccountType::REWARDS;
    if (str == "DEVELOPMENT") return AccountType::DEVELOPMENT;
    if (str == "MARKETING") return AccountType::MARKETING;
    if (str == "CUSTOM") return AccountType::CUSTOM;
    return std::nullopt;
}

const char* TransactionTypeToString(TransactionType type) {
    switch (type) {
        case TransactionType::EXTERNAL_DEPOSIT:    return "EXTERNAL_DEPOSIT";
        case TransactionType::EXTERNAL_WITHDRAWAL: return "EXTERNAL_WITHDRAWAL";
        case TransactionType::INTERNAL_ALLOCATION: return "INTERNAL_ALLOCATION";
        case TransactionType::PAYMENT:             return "PAYMENT";
        case TransactionType::REFUND:              return "REFUND";
        case TransactionType::FEE:                 return "FEE";
        case TransactionType::NFT_MINT:            return "NFT_MINT";
        case TransactionType::REWARD:              return "REWARD";
    }
    return "UNKNOWN";
}

std::optional<TransactionType> ParseTransactionType(const std::string& str) {
    if (str == "EXTERNAL_DEPOSIT") return TransactionType::EXTERNAL_DEPOSIT;
    if (str == "EXTERNAL_WITHDRAWAL") return TransactionType::EXTERNAL_WITHDRAWAL;
    if (str == "INTERNAL_ALLOCATION") return TransactionType::INTERNAL_ALLOCATION;
    if (str == "PAYMENT") return TransactionType::PAYMENT;
    if (str == "REFUND") return TransactionType::REFUND;
    if (str == "FEE") return TransactionType::FEE;
    if (str == "NFT_MINT") return TransactionType::NFT_MINT;
    if (str == "REWARD") return TransactionType::REWARD;
    return std::nullopt;
}

const char* TransactionStatusToString(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::PENDING:   return "PENDING";
        case TransactionStatus::COMPLETED: return "COMPLETED";
        case TransactionStatus::FAILED:    return "FAILED";
        case TransactionStatus::CANCELLED: return "CANCELLED";
        case TransactionStatus::REFUNDED:  return "REFUNDED";
    }
    return "UNKNOWN";
}

std::optional<TransactionStatus> ParseTransactionStatus(const std::string& str) {
    if (str == "PENDING") return TransactionStatus::PENDING;
    if (str == "COMPLETED") return TransactionStatus::COMPLETED;
    if (str == "FAILED") return TransactionStatus::FAILED;
    if (str == "CANCELLED") return TransactionStatus::CANCELLED;
    if (str == "REFUNDED") return TransactionStatus::REFUNDED;
    return std::nullopt;
}

const char* ReconciliationStatusToString(ReconciliationStatus status) {
    switch (status) {
        case ReconciliationStatus::BALANCED:          return "BALANCED";
        case ReconciliationStatus::MINOR_DISCREPANCY: return "MINOR_DISCREPANCY";
        case ReconciliationStatus::MAJOR_DISCREPANCY: return "MAJOR_DISCREPANCY";
        case ReconciliationStatus::CRITICAL:          return "CRITICAL";
    }
    return "UNKNOWN";
}

std::optional<ReconciliationStatus> ParseReconciliationStatus(const std::string& str) {
    if (str == "BALANCED") return ReconciliationStatus::BALANCED;
    if (str == "MINOR_DISCREPANCY") return ReconciliationStatus::MINOR_DISCREPANCY;
    if (str == "MAJOR_DISCREPANCY") return ReconciliationStatus::MAJOR_DISCREPANCY;
    if (str == "CRITICAL") return ReconciliationStatus::CRITICAL;
    return std::nullopt;
}

const char* AuditActionToString(AuditAction action) {
    switch (action) {
        case AuditAction::CREATE:  return "CREATE";
        case AuditAction::UPDATE:  return "UPDATE";
        case AuditAction::DELETE:  return "DELETE";
        case AuditAction::EXECUTE: return "EXECUTE";
    }
    return "UNKNOWN";
}

// ============================================================================
// Audit Snapshots
// ============================================================================

Metadata LogicalAccount::ToSnapshot() const {
    Metadata snap;
    snap["id"] = std::to_string(id);
    snap["name"] = name;
    snap["type"] = AccountTypeToString(type);
    snap["target_percent"] = FormatPercent(targetPercent);
    snap["balance"] = FormatAmount(balance);
    snap["active"] = active ? "true" : "false";
    return snap;
}

Metadata LedgerTransaction::ToSnapshot() const {
    Metadata snap;
    snap["id"] = std::to_string(id);
    snap["type"] = TransactionTypeToString(type);
    snap["status"] = TransactionStatusToString(status);
    snap["amount"] = FormatAmount(amount);
    if (fromAccount) snap["from_account"] = std::to_string(*fromAccount);
    if (toAccount) snap["to_account"] = std::to_string(*toAccount);
    if (parentId) snap["parent_id"] = std::to_string(*parentId);
    if (externalRef) snap["external_ref"] = *externalRef;
    return snap;
}

Metadata AllocationRule::ToSnapshot() const {
    Metadata snap;
    snap["id"] = std::to_string(id);
    snap["name"] = name;
    snap["active"] = active ? "true" : "false";
    snap["priority"] = std::to_string(priority);
    std::string split;
    for (const auto& item : items) {
        if (!split.empty()) split += ",";
        split += item.accountName + ":" + FormatPercent(item.percent);
    }
    snap["allocations"] = split;
    if (minAmount) snap["min_amount"] = FormatAmount(*minAmount);
    if (maxAmount) snap["max_amount"] = FormatAmount(*maxAmount);
    return snap;
}

Metadata ReconciliationRecord::ToSnapshot() const {
    Metadata snap;
    snap["id"] = std::to_string(id);
    snap["external_balance"] = FormatAmount(externalBalance);
    snap["internal_balance"] = FormatAmount(internalBalance);
    snap["discrepancy"] = FormatAmount(discrepancy);
    snap["status"] = ReconciliationStatusToString(status);
    snap["source"] = source;
    snap["resolved"] = IsResolved() ? "true" : "false";
    if (resolvedBy) snap["resolved_by"] = *resolvedBy;
    return snap;
}

} // namespace ledger
} // namespace tally
