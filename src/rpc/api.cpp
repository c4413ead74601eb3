// TALLY - Treasury API
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/rpc/api.h"
#include "tally/auth/gate.h"
#include "tally/ledger/accounts.h"
#include "tally/ledger/allocation.h"
#include "tally/node/context.h"
#include "tally/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace tally {
namespace rpc {

using ledger::ErrorKind;
using ledger::LedgerError;
using util::JSONValue;

namespace {

LedgerError Invalid(const std::string& message) {
    return LedgerError(ErrorKind::ValidationError, message);
}

std::string Upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool IsDigits(const std::string& s) {
    return !s.empty() && s.size() <= 19 &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

uint64_t ParseId(const std::string& text, const char* what) {
    if (!IsDigits(text)) {
        throw Invalid(std::string(what) + " id must be a positive integer");
    }
    return std::stoull(text);
}

JSONValue Object() {
    return JSONValue(JSONValue::Object{});
}

JSONValue Array() {
    return JSONValue(JSONValue::Array{});
}

JSONValue MetadataToJSON(const ledger::Metadata& metadata) {
    JSONValue out = Object();
    for (const auto& [key, value] : metadata) {
        out[key] = value;
    }
    return out;
}

template<typename T>
JSONValue Nullable(const std::optional<T>& value) {
    return value ? JSONValue(*value) : JSONValue();
}

JSONValue NullableAmount(const std::optional<Amount>& value) {
    return value ? JSONValue(FormatAmount(*value)) : JSONValue();
}

/// Request body as an object; an empty body reads as {}
JSONValue ParseBody(const HttpRequest& request) {
    if (request.body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Object();
    }
    auto parsed = JSONValue::TryParse(request.body);
    if (!parsed || !parsed->IsObject()) {
        throw Invalid("request body must be a JSON object");
    }
    return *parsed;
}

bool Present(const JSONValue& body, const char* key) {
    return body.HasKey(key) && !body[key].IsNull();
}

std::string NumberOrString(const JSONValue& value, const char* field) {
    if (value.IsString()) return value.GetString();
    if (value.IsNumber()) return value.GetNumberText();
    throw Invalid(std::string(field) + " must be a decimal string or number");
}

Amount ReadAmount(const JSONValue& value, const char* field, Amount limit = MAX_MONEY) {
    auto amount = ParseAmount(NumberOrString(value, field), limit);
    if (!amount) {
        throw Invalid(std::string(field) + " must be a decimal with at most 8 places within range");
    }
    return *amount;
}

BasisPoints ReadPercent(const JSONValue& value, const char* field) {
    auto percent = ParsePercent(NumberOrString(value, field));
    if (!percent) {
        throw Invalid(std::string(field) + " must be a percentage with at most 2 decimals");
    }
    return *percent;
}

std::string ReadString(const JSONValue& body, const char* key, const std::string& def = "") {
    if (!Present(body, key)) return def;
    if (!body[key].IsString()) {
        throw Invalid(std::string(key) + " must be a string");
    }
    return body[key].GetString();
}

std::optional<std::string> ReadOptString(const JSONValue& body, const char* key) {
    if (!Present(body, key)) return std::nullopt;
    return ReadString(body, key);
}

bool ReadBool(const JSONValue& body, const char* key, bool def) {
    if (!Present(body, key)) return def;
    if (!body[key].IsBool()) {
        throw Invalid(std::string(key) + " must be a boolean");
    }
    return body[key].GetBool();
}

int32_t ReadPriority(const JSONValue& value) {
    if (!value.IsInt() || value.GetInt() < INT32_MIN || value.GetInt() > INT32_MAX) {
        throw Invalid("priority must be an integer");
    }
    return static_cast<int32_t>(value.GetInt());
}

std::vector<ledger::AllocationItem> ReadItems(const JSONValue& value) {
    if (!value.IsArray()) {
        throw Invalid("allocation_config must be an array");
    }
    std::vector<ledger::AllocationItem> items;
    for (const auto& entry : value.GetArray()) {
        if (!entry.IsObject() || !entry["account_name"].IsString()) {
            throw Invalid("allocation_config entries need account_name and percentage");
        }
        items.push_back({entry["account_name"].GetString(),
                         ReadPercent(entry["percentage"], "percentage")});
    }
    return items;
}

ledger::Metadata ReadMetadata(const JSONValue& body) {
    ledger::Metadata metadata;
    if (!Present(body, "metadata")) return metadata;
    const JSONValue& value = body["metadata"];
    if (!value.IsObject()) {
        throw Invalid("metadata must be an object");
    }
    for (const auto& [key, entry] : value.GetObject()) {
        if (entry.IsString()) {
            metadata[key] = entry.GetString();
        } else if (entry.IsNumber()) {
            metadata[key] = entry.GetNumberText();
        } else {
            metadata[key] = entry.ToJSON();
        }
    }
    return metadata;
}

std::optional<std::string> QueryParam(const HttpRequest& request, const char* key) {
    auto it = request.query.find(key);
    if (it == request.query.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

size_t QueryUnsigned(const HttpRequest& request, const char* key, size_t def) {
    auto value = QueryParam(request, key);
    if (!value) return def;
    if (!IsDigits(*value)) {
        throw Invalid(std::string(key) + " must be a non-negative integer");
    }
    return static_cast<size_t>(std::stoull(*value));
}

bool QueryFlag(const HttpRequest& request, const char* key, bool def) {
    auto value = QueryParam(request, key);
    if (!value) return def;
    std::string v = Upper(*value);
    if (v == "TRUE" || v == "1" || v == "YES") return true;
    if (v == "FALSE" || v == "0" || v == "NO") return false;
    throw Invalid(std::string(key) + " must be true or false");
}

ApiResponse Ok(JSONValue body, int status = 200) {
    return ApiResponse{status, std::move(body)};
}

JSONValue ReserveToJSON(const ledger::ReserveHealth& reserve) {
    JSONValue out = Object();
    out["present"] = reserve.present;
    out["account_name"] = reserve.present ? JSONValue(reserve.accountName) : JSONValue();
    out["reserve_percentage"] = FormatPercent(reserve.targetPercent);
    out["reserve_balance"] = FormatAmount(reserve.balance);
    out["actual_reserve_percentage"] = reserve.actualPercent;
    out["is_healthy"] = reserve.healthy;
    return out;
}

JSONValue RecordResultToJSON(const ledger::RecordResult& result) {
    JSONValue out = Object();
    out["transaction"] = TransactionToJSON(result.transaction);
    out["replayed"] = result.replayed;
    if (result.allocation) {
        out["allocation"] = AllocationToJSON(*result.allocation);
    }
    return out;
}

} // namespace

// ============================================================================
// Error mapping
// ============================================================================

int StatusForError(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ValidationError:
        case ErrorKind::UnknownAccount:
        case ErrorKind::InvalidTransactionShape:
        case ErrorKind::InvalidRuleConfiguration:
            return 400;
        case ErrorKind::InvalidToken:
        case ErrorKind::TokenExpired:
            return 401;
        case ErrorKind::InsufficientRole:
            return 403;
        case ErrorKind::NotFound:
            return 404;
        case ErrorKind::DuplicateAccount:
        case ErrorKind::DuplicateRule:
        case ErrorKind::AlreadyResolved:
            return 409;
        case ErrorKind::InsufficientFunds:
        case ErrorKind::NoApplicableRule:
            return 422;
        case ErrorKind::TransientConflict:
            return 503;
        case ErrorKind::StorageError:
            return 500;
    }
    return 500;
}

JSONValue ErrorBody(ErrorKind kind, const std::string& message) {
    JSONValue error = Object();
    error["kind"] = ledger::ErrorKindToString(kind);
    error["message"] = message;
    JSONValue body = Object();
    body["error"] = error;
    return body;
}

// ============================================================================
// JSON views
// ============================================================================

JSONValue AccountToJSON(const ledger::LogicalAccount& account) {
    JSONValue out = Object();
    out["id"] = account.id;
    out["account_name"] = account.name;
    out["account_type"] = ledger::AccountTypeToString(account.type);
    out["description"] = account.description;
    out["allocation_percentage"] = FormatPercent(account.targetPercent);
    out["current_balance"] = FormatAmount(account.balance);
    out["is_active"] = account.active;
    out["version"] = account.version;
    out["created_at"] = account.createdAt;
    out["updated_at"] = account.updatedAt;
    return out;
}

JSONValue TransactionToJSON(const ledger::LedgerTransaction& tx) {
    JSONValue out = Object();
    out["id"] = tx.id;
    out["transaction_type"] = ledger::TransactionTypeToString(tx.type);
    out["status"] = ledger::TransactionStatusToString(tx.status);
    out["amount"] = FormatAmount(tx.amount);
    out["from_account_id"] = Nullable(tx.fromAccount);
    out["to_account_id"] = Nullable(tx.toAccount);
    out["parent_transaction_id"] = Nullable(tx.parentId);
    out["external_ref"] = Nullable(tx.externalRef);
    out["description"] = tx.description;
    out["metadata"] = MetadataToJSON(tx.metadata);
    out["performed_by"] = tx.performedBy;
    out["created_at"] = tx.createdAt;
    out["completed_at"] = Nullable(tx.completedAt);
    return out;
}

JSONValue AllocationToJSON(const ledger::AllocationResult& result) {
    JSONValue out = Object();
    out["deposit_id"] = result.depositId;
    out["allocated"] = result.allocated;
    out["unallocated"] = !result.allocated;
    out["replayed"] = result.replayed;
    out["rule_id"] = Nullable(result.ruleId);
    out["rule_name"] = result.ruleName;
    out["total"] = FormatAmount(result.total);

    JSONValue childIds = Array();
    JSONValue shares = Array();
    for (const auto& share : result.shares) {
        childIds.Push(JSONValue(share.transactionId));
        JSONValue item = Object();
        item["account_id"] = share.accountId;
        item["account_name"] = share.accountName;
        item["percentage"] = FormatPercent(share.percent);
        item["amount"] = FormatAmount(share.amount);
        item["transaction_id"] = share.transactionId;
        shares.Push(std::move(item));
    }
    out["child_transaction_ids"] = childIds;
    out["allocations"] = shares;
    if (!result.reason.empty()) {
        out["reason"] = result.reason;
    }
    return out;
}

JSONValue RuleToJSON(const ledger::AllocationRule& rule) {
    JSONValue out = Object();
    out["id"] = rule.id;
    out["rule_name"] = rule.name;
    out["is_active"] = rule.active;
    out["priority"] = rule.priority;
    JSONValue items = Array();
    for (const auto& item : rule.items) {
        JSONValue entry = Object();
        entry["account_name"] = item.accountName;
        entry["percentage"] = FormatPercent(item.percent);
        items.Push(std::move(entry));
    }
    out["allocation_config"] = items;
    out["min_amount"] = NullableAmount(rule.minAmount);
    out["max_amount"] = NullableAmount(rule.maxAmount);
    out["description"] = rule.description;
    out["created_by"] = rule.createdBy;
    out["created_at"] = rule.createdAt;
    out["updated_at"] = rule.updatedAt;
    return out;
}

JSONValue ReconciliationToJSON(const ledger::ReconciliationRecord& record) {
    JSONValue out = Object();
    out["id"] = record.id;
    out["external_balance"] = FormatAmount(record.externalBalance);
    out["internal_balance"] = FormatAmount(record.internalBalance);
    out["discrepancy"] = FormatAmount(record.discrepancy);
    out["discrepancy_percentage"] = record.discrepancyPercent;
    out["status"] = ledger::ReconciliationStatusToString(record.status);
    out["source"] = record.source;
    out["notes"] = record.notes;
    out["resolution_notes"] = Nullable(record.resolutionNotes);
    out["resolved_by"] = Nullable(record.resolvedBy);
    out["resolved_at"] = Nullable(record.resolvedAt);
    out["performed_by"] = record.performedBy;
    out["created_at"] = record.createdAt;
    out["computed_at_ms"] = record.computedAtMs;
    return out;
}

JSONValue AuditEntryToJSON(const ledger::AuditEntry& entry) {
    JSONValue out = Object();
    out["id"] = entry.id;
    out["entity_type"] = entry.entityType;
    out["entity_id"] = entry.entityId;
    out["action"] = ledger::AuditActionToString(entry.action);
    out["old_values"] = MetadataToJSON(entry.before);
    out["new_values"] = MetadataToJSON(entry.after);
    out["performed_by"] = entry.performedBy;
    out["created_at"] = entry.createdAt;
    return out;
}

// ============================================================================
// Dispatch
// ============================================================================

TreasuryApi::TreasuryApi(NodeContext& node) : node_(node) {}

HttpResponse TreasuryApi::Handle(const HttpRequest& request) {
    ApiResponse result = Dispatch(request);
    HttpResponse response;
    response.status = result.status;
    response.body = result.body.ToJSON();
    return response;
}

ApiResponse TreasuryApi::Dispatch(const HttpRequest& request) {
    Segments segments;
    size_t start = 0;
    const std::string& path = request.path;
    while (start < path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (slash > start) {
            segments.push_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }

    try {
        return Route(request, segments);
    } catch (const LedgerError& e) {
        int status = StatusForError(e.Kind());
        if (status >= 500) {
            LOG_ERROR(util::LogCategory::HTTP) << request.method << " " << request.path
                                               << " failed: " << e.what();
        }
        return ApiResponse{status, ErrorBody(e.Kind(), e.what())};
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::HTTP) << request.method << " " << request.path
                                           << " raised: " << e.what();
        return ApiResponse{500, ErrorBody(ErrorKind::StorageError, "internal error")};
    }
}

ApiResponse TreasuryApi::Route(const HttpRequest& request, const Segments& path) {
    const std::string& method = request.method;
    const size_t n = path.size();
    auto methodNotAllowed = [&]() {
        return ApiResponse{405, ErrorBody(ErrorKind::ValidationError,
                                          method + " not allowed on " + request.path)};
    };

    if (n == 1 && path[0] == "health") {
        if (method != "GET") return methodNotAllowed();
        return Health();
    }

    if (n >= 1 && path[0] == "transactions") {
        if (n == 1) {
            if (method == "GET") return ListTransactions(request);
            if (method == "POST") return PostTransaction(request);
            return methodNotAllowed();
        }
        if (n == 2 && path[1] == "unallocated") {
            if (method != "GET") return methodNotAllowed();
            return ListUnallocated();
        }
        if (n == 2) {
            if (method != "GET") return methodNotAllowed();
            return GetTransaction(path[1]);
        }
        if (n == 3 && path[2] == "allocations") {
            if (method != "GET") return methodNotAllowed();
            return GetAllocations(path[1]);
        }
        if (n == 3 && path[2] == "complete") {
            if (method != "POST") return methodNotAllowed();
            return CompleteTransaction(request, path[1]);
        }
        if (n == 3 && path[2] == "allocate") {
            if (method != "POST") return methodNotAllowed();
            return AllocateTransaction(request, path[1]);
        }
    }

    if (n >= 2 && path[0] == "treasury") {
        const std::string& section = path[1];
        if (n == 2 && section == "status") {
            if (method != "GET") return methodNotAllowed();
            return TreasuryStatus();
        }
        if (section == "accounts") {
            if (n == 2) {
                if (method == "GET") return ListAccounts(request);
                if (method == "POST") return CreateAccount(request);
                return methodNotAllowed();
            }
            if (n == 3) {
                if (method != "GET") return methodNotAllowed();
                return GetAccount(path[2]);
            }
            if (n == 4 && path[3] == "active") {
                if (method != "POST") return methodNotAllowed();
                return SetAccountActive(request, path[2]);
            }
        }
        if (n == 2 && section == "reconcile") {
            if (method != "POST") return methodNotAllowed();
            return Reconcile(request);
        }
        if (section == "reconciliations") {
            if (n == 2) {
                if (method != "GET") return methodNotAllowed();
                return ListReconciliations(request);
            }
            if (n == 3 && path[2] == "latest") {
                if (method != "GET") return methodNotAllowed();
                return LatestReconciliation();
            }
            if (n == 3) {
                if (method != "GET") return methodNotAllowed();
                return Ok(ReconciliationToJSON(
                    node_.reconciler->GetRecord(ParseId(path[2], "reconciliation"))));
            }
            if (n == 4 && path[3] == "resolve") {
                if (method != "POST") return methodNotAllowed();
                return ResolveReconciliation(request, path[2]);
            }
        }
    }

    if (n >= 1 && path[0] == "allocation-rules") {
        if (n == 1) {
            if (method == "GET") return ListRules(request);
            if (method == "POST") return CreateRule(request);
            return methodNotAllowed();
        }
        if (n == 2) {
            if (method == "GET") return GetRule(path[1]);
            if (method == "PATCH") return UpdateRule(request, path[1]);
            if (method == "DELETE") return DeleteRule(request, path[1]);
            return methodNotAllowed();
        }
    }

    if (n == 1 && path[0] == "audit") {
        if (method != "GET") return methodNotAllowed();
        return QueryAudit(request);
    }

    return ApiResponse{404, ErrorBody(ErrorKind::NotFound, "no route for " + request.path)};
}

auth::Claims TreasuryApi::RequireGuardian(const HttpRequest& request) const {
    std::string header = request.Header("authorization");
    auto token = auth::AccessGate::ParseBearer(header);
    if (!token) {
        throw LedgerError(ErrorKind::InvalidToken, "missing bearer token");
    }
    return node_.gate->Authorize(*token, ledger::GUARDIAN_ROLE);
}

ledger::AccountId TreasuryApi::ResolveAccount(const JSONValue& ref, const char* field) const {
    if (ref.IsInt()) {
        if (ref.GetInt() <= 0) {
            throw LedgerError(ErrorKind::UnknownAccount,
                              std::string(field) + " account " + ref.GetNumberText() +
                              " does not exist");
        }
        return ResolveAccount(std::to_string(ref.GetInt()), field);
    }
    if (ref.IsString()) {
        return ResolveAccount(ref.GetString(), field);
    }
    throw Invalid(std::string(field) + " must be an account id or name");
}

ledger::AccountId TreasuryApi::ResolveAccount(const std::string& ref, const char* field) const {
    auto account = node_.accounts->FindAccountByRef(ref);
    if (!account) {
        throw LedgerError(ErrorKind::UnknownAccount,
                          std::string(field) + " account '" + ref + "' does not exist");
    }
    return account->id;
}

// ============================================================================
// /transactions
// ============================================================================

ApiResponse TreasuryApi::PostTransaction(const HttpRequest& request) {
    JSONValue body = ParseBody(request);

    ledger::TransactionRequest tx;
    std::string typeText = ReadString(body, "transaction_type");
    auto type = ledger::ParseTransactionType(Upper(typeText));
    if (!type) {
        throw Invalid("unknown transaction_type '" + typeText + "'");
    }
    tx.type = *type;

    std::string statusText = ReadString(body, "status", "PENDING");
    auto status = ledger::ParseTransactionStatus(Upper(statusText));
    if (!status) {
        throw Invalid("unknown status '" + statusText + "'");
    }
    if (*status == ledger::TransactionStatus::REFUNDED) {
        throw Invalid("transactions cannot be recorded as REFUNDED");
    }
    tx.status = *status;

    if (!Present(body, "amount")) {
        throw Invalid("amount is required");
    }
    tx.amount = ReadAmount(body["amount"], "amount");

    if (Present(body, "from_account")) {
        tx.fromAccount = ResolveAccount(body["from_account"], "from");
    }
    if (Present(body, "to_account")) {
        tx.toAccount = ResolveAccount(body["to_account"], "to");
    }
    if (Present(body, "parent_transaction_id")) {
        const JSONValue& parent = body["parent_transaction_id"];
        if (!parent.IsInt() || parent.GetInt() <= 0) {
            throw Invalid("parent_transaction_id must be a positive integer");
        }
        tx.parentId = static_cast<ledger::TransactionId>(parent.GetInt());
    }
    tx.externalRef = ReadOptString(body, "external_ref");
    tx.description = ReadString(body, "description");
    tx.metadata = ReadMetadata(body);
    tx.performedBy = ReadString(body, "performed_by", ledger::SYSTEM_ACTOR);

    ledger::RecordResult result = node_.transactions->RecordTransaction(tx);
    return Ok(RecordResultToJSON(result), result.replayed ? 200 : 201);
}

ApiResponse TreasuryApi::ListTransactions(const HttpRequest& request) {
    ledger::TransactionFilter filter;
    if (auto type = QueryParam(request, "type")) {
        filter.type = ledger::ParseTransactionType(Upper(*type));
        if (!filter.type) throw Invalid("unknown type '" + *type + "'");
    }
    if (auto status = QueryParam(request, "status")) {
        filter.status = ledger::ParseTransactionStatus(Upper(*status));
        if (!filter.status) throw Invalid("unknown status '" + *status + "'");
    }
    if (auto account = QueryParam(request, "account")) {
        filter.account = ResolveAccount(*account, "account");
    }
    if (auto from = QueryParam(request, "from")) {
        filter.fromAccount = ResolveAccount(*from, "from");
    }
    if (auto to = QueryParam(request, "to")) {
        filter.toAccount = ResolveAccount(*to, "to");
    }
    if (auto parent = QueryParam(request, "parent")) {
        filter.parentId = ParseId(*parent, "parent");
    }
    if (QueryParam(request, "since")) {
        filter.since = static_cast<Timestamp>(QueryUnsigned(request, "since", 0));
    }
    if (QueryParam(request, "until")) {
        filter.until = static_cast<Timestamp>(QueryUnsigned(request, "until", 0));
    }
    filter.limit = QueryUnsigned(request, "limit", ledger::DEFAULT_PAGE_LIMIT);
    filter.offset = QueryUnsigned(request, "offset", 0);

    ledger::TransactionPage page = node_.transactions->ListTransactions(filter);
    JSONValue items = Array();
    for (const auto& tx : page.items) {
        items.Push(TransactionToJSON(tx));
    }
    JSONValue out = Object();
    out["transactions"] = items;
    out["total"] = page.total;
    out["limit"] = page.limit;
    out["offset"] = page.offset;
    return Ok(out);
}

ApiResponse TreasuryApi::GetTransaction(const std::string& idText) {
    return Ok(TransactionToJSON(node_.transactions->GetTransaction(ParseId(idText, "transaction"))));
}

ApiResponse TreasuryApi::GetAllocations(const std::string& idText) {
    return Ok(AllocationToJSON(node_.allocator->GetAllocations(ParseId(idText, "transaction"))));
}

ApiResponse TreasuryApi::CompleteTransaction(const HttpRequest& request,
                                             const std::string& idText) {
    auth::Claims claims = RequireGuardian(request);
    ledger::TransactionId id = ParseId(idText, "transaction");
    JSONValue body = ParseBody(request);

    std::string statusText = ReadString(body, "status", "COMPLETED");
    auto status = ledger::ParseTransactionStatus(Upper(statusText));
    if (!status) {
        throw Invalid("unknown status '" + statusText + "'");
    }
    return Ok(RecordResultToJSON(node_.transactions->CompleteTransaction(id, *status,
                                                                         claims.subject)));
}

ApiResponse TreasuryApi::AllocateTransaction(const HttpRequest& request,
                                             const std::string& idText) {
    auth::Claims claims = RequireGuardian(request);
    ledger::TransactionId id = ParseId(idText, "transaction");
    return Ok(AllocationToJSON(node_.allocator->Allocate(id, claims.subject)));
}

ApiResponse TreasuryApi::ListUnallocated() {
    JSONValue items = Array();
    for (const auto& tx : node_.transactions->ListUnallocatedDeposits()) {
        items.Push(TransactionToJSON(tx));
    }
    JSONValue out = Object();
    out["count"] = items.Size();
    out["transactions"] = items;
    return Ok(out);
}

// ============================================================================
// /treasury
// ============================================================================

ApiResponse TreasuryApi::TreasuryStatus() {
    ledger::TreasuryStatus status =
        ledger::SummarizeTreasury(node_.accounts->ListAccounts(false));

    JSONValue accounts = Array();
    for (const auto& account : status.accounts) {
        accounts.Push(AccountToJSON(account));
    }
    JSONValue out = Object();
    out["total_balance"] = FormatAmount(status.total);
    out["account_count"] = status.accounts.size();
    out["accounts"] = accounts;
    out["reserve_status"] = ReserveToJSON(status.reserve);
    return Ok(out);
}

ApiResponse TreasuryApi::ListAccounts(const HttpRequest& request) {
    bool includeInactive = QueryFlag(request, "include_inactive", false);
    JSONValue items = Array();
    for (const auto& account : node_.accounts->ListAccounts(includeInactive)) {
        items.Push(AccountToJSON(account));
    }
    JSONValue out = Object();
    out["count"] = items.Size();
    out["accounts"] = items;
    return Ok(out);
}

ApiResponse TreasuryApi::GetAccount(const std::string& ref) {
    auto account = node_.accounts->FindAccountByRef(ref);
    if (!account) {
        throw LedgerError(ErrorKind::NotFound, "account '" + ref + "' not found");
    }
    return Ok(AccountToJSON(*account));
}

ApiResponse TreasuryApi::CreateAccount(const HttpRequest& request) {
    auth::Claims claims = RequireGuardian(request);
    JSONValue body = ParseBody(request);

    ledger::NewAccount account;
    account.name = ReadString(body, "account_name");
    std::string typeText = ReadString(body, "account_type", "CUSTOM");
    auto type = ledger::ParseAccountType(Upper(typeText));
    if (!type) {
        throw Invalid("unknown account_type '" + typeText + "'");
    }
    account.type = *type;
    account.description = ReadString(body, "description");
    if (Present(body, "allocation_percentage")) {
        account.targetPercent = ReadPercent(body["allocation_percentage"],
                                            "allocation_percentage");
    }
    return Ok(AccountToJSON(node_.accounts->CreateAccount(account, claims.subject)), 201);
}

ApiResponse TreasuryApi::SetAccountActive(const HttpRequest& request, const std::string& idText) {
    auth::Claims claims = RequireGuardian(request);
    ledger::AccountId id = ParseId(idText, "account");
    JSONValue body = ParseBody(request);
    if (!Present(body, "is_active")) {
        throw Invalid("is_active is required");
    }
    bool active = ReadBool(body, "is_active", true);
    return Ok(AccountToJSON(node_.accounts->SetAccountActive(id, active, claims.subject)));
}

ApiResponse TreasuryApi::Reconcile(const HttpRequest& request) {
    auth::Claims claims = RequireGuardian(request);
    JSONValue body = ParseBody(request);

    const char* balanceKey = Present(body, "external_balance") ? "external_balance"
                                                               : "external_wallet_balance";
    if (!Present(body, balanceKey)) {
        throw Invalid("external_balance is required");
    }
    Amount external = ReadAmount(body[balanceKey], "external_balance", MAX_TREASURY);
    std::string source = ReadString(body, "source",
                                    ReadString(body, "external_wallet_address"));
    std::string notes = ReadString(body, "notes");

    return Ok(ReconciliationToJSON(node_.reconciler->Reconcile(external, source, notes,
                                                               claims.subject)), 201);
}

ApiResponse TreasuryApi::ListReconciliations(const HttpRequest& request) {
    size_t limit = QueryUnsigned(request, "limit", ledger::DEFAULT_RECONCILIATION_LIMIT);
    std::optional<ledger::ReconciliationStatus> status;
    if (auto text = QueryParam(request, "status")) {
        status = ledger::ParseReconciliationStatus(Upper(*text));
        if (!status) throw Invalid("unknown status '" + *text + "'");
    }
    JSONValue items = Array();
    for (const auto& record : node_.reconciler->ListHistory(limit, status)) {
        items.Push(ReconciliationToJSON(record));
    }
    JSONValue out = Object();
    out["count"] = items.Size();
    out["reconciliations"] = items;
    return Ok(out);
}

ApiResponse TreasuryApi::LatestReconciliation() {
    auto latest = node_.reconciler->GetLatest();
    if (!latest) {
        throw LedgerError(ErrorKind::NotFound, "no reconciliation has been run");
    }
    return Ok(ReconciliationToJSON(*latest));
}

ApiResponse TreasuryApi::ResolveReconciliation(const HttpRequest& request,
                                               const std::string& idText) {
    auth::Claims claims = RequireGuardian(request);
    ledger::ReconciliationId id = ParseId(idText, "reconciliation");
    JSONValue body = ParseBody(request);
    std::string notes = ReadString(body, "resolution_notes", ReadString(body, "notes"));
    if (notes.empty()) {
        throw Invalid("resolution_notes is required");
    }
    return Ok(ReconciliationToJSON(node_.reconciler->Resolve(id, notes, claims.subject)));
}

// ============================================================================
// /allocation-rules
// ============================================================================

ApiResponse TreasuryApi::ListRules(const HttpRequest& request) {
    bool activeOnly = QueryFlag(request, "active_only", true);
    JSONValue items = Array();
    for (const auto& rule : node_.rules->ListRules(activeOnly)) {
        items.Push(RuleToJSON(rule));
    }
    JSONValue out = Object();
    out["count"] = items.Size();
    out["rules"] = items;
    return Ok(out);
}

ApiResponse TreasuryApi::GetRule(const std::string& idText) {
    return Ok(RuleToJSON(node_.rules->GetRule(ParseId(idText, "rule"))));
}

ApiResponse TreasuryApi::CreateRule(const HttpRequest& request) {
    auth::Claims claims = RequireGuardian(request);
    JSONValue body = ParseBody(request);

    ledger::NewRule rule;
    rule.name = ReadString(body, "rule_name");
    rule.active = ReadBool(body, "is_active", true);
    if (Present(body, "priority")) {
        rule.priority = ReadPriority(body["priority"]);
    }
    if (!Present(body, "allocation_config")) {
        throw Invalid("allocation_config is required");
    }
    rule.items = ReadItems(body["allocation_config"]);
    if (Present(body, "min_amount")) {
        rule.minAmount = ReadAmount(body["min_amount"], "min_amount");
    }
    if (Present(body, "max_amount")) {
        rule.maxAmount = ReadAmount(body["max_amount"], "max_amount");
    }
    rule.description = ReadString(body, "description");

    return Ok(RuleToJSON(node_.rules->CreateRule(rule, claims.subject)), 201);
}

ApiResponse TreasuryApi::UpdateRule(const HttpRequest& request, const std::string& idText) {
    auth::Claims claims = RequireGuardian(request);
    ledger::RuleId id = ParseId(idText, "rule");
    JSONValue body = ParseBody(request);

    ledger::RuleUpdate update;
    update.name = ReadOptString(body, "rule_name");
    if (Present(body, "is_active")) {
        update.active = ReadBool(body, "is_active", true);
    }
    if (Present(body, "priority")) {
        update.priority = ReadPriority(body["priority"]);
    }
    if (Present(body, "allocation_config")) {
        update.items = ReadItems(body["allocation_config"]);
    }
    // An explicit null clears a bound
    if (body.HasKey("min_amount")) {
        update.minAmount = body["min_amount"].IsNull()
            ? std::optional<Amount>()
            : std::optional<Amount>(ReadAmount(body["min_amount"], "min_amount"));
    }
    if (body.HasKey("max_amount")) {
        update.maxAmount = body["max_amount"].IsNull()
            ? std::optional<Amount>()
            : std::optional<Amount>(ReadAmount(body["max_amount"], "max_amount"));
    }
    update.description = ReadOptString(body, "description");

    return Ok(RuleToJSON(node_.rules->UpdateRule(id, update, claims.subject)));
}

ApiResponse TreasuryApi::DeleteRule(const HttpRequest& request, const std::string& idText) {
    auth::Claims claims = RequireGuardian(request);
    return Ok(RuleToJSON(node_.rules->DeactivateRule(ParseId(idText, "rule"), claims.subject)));
}

// ============================================================================
// /audit and /health
// ============================================================================

ApiResponse TreasuryApi::QueryAudit(const HttpRequest& request) {
    ledger::AuditFilter filter;
    filter.entityType = QueryParam(request, "entity_type");
    if (auto id = QueryParam(request, "entity_id")) {
        filter.entityId = ParseId(*id, "entity");
    }
    filter.performedBy = QueryParam(request, "performed_by");
    filter.limit = QueryUnsigned(request, "limit", ledger::DEFAULT_AUDIT_LIMIT);
    if (filter.limit > ledger::MAX_AUDIT_LIMIT) {
        throw Invalid("limit must be at most " + std::to_string(ledger::MAX_AUDIT_LIMIT));
    }

    JSONValue items = Array();
    for (const auto& entry : node_.audit->Query(filter)) {
        items.Push(AuditEntryToJSON(entry));
    }
    JSONValue out = Object();
    out["count"] = items.Size();
    out["entries"] = items;
    return Ok(out);
}

ApiResponse TreasuryApi::Health() {
    HealthReport report = CheckHealth(node_);
    JSONValue store = Object();
    store["backend"] = report.backend;
    store["connected"] = report.storeConnected;
    if (!report.storeError.empty()) {
        store["error"] = report.storeError;
    }

    JSONValue out = Object();
    out["status"] = report.Healthy() ? "healthy" : "unhealthy";
    out["environment"] = report.environment;
    out["database"] = store;
    out["value_bearing"] = report.valueBearing;
    out["nft_mint_value"] = FormatAmount(report.nftMintValue);
    return Ok(out, report.Healthy() ? 200 : 503);
}

} // namespace rpc
} // namespace tally
