// TALLY - Treasury API
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// REST dispatcher over the ledger components. Used by tallyd behind the
// HTTP server and directly in-process by tests.
//
// Amounts travel as decimal strings ("100.00000000"); inputs accept a
// string or a JSON number with at most 8 decimals. Percentages travel as
// strings with 2 decimals. Failures produce
// {"error":{"kind":"<ErrorKind>","message":"..."}}.

#ifndef TALLY_RPC_API_H
#define TALLY_RPC_API_H

#include "tally/ledger/errors.h"
#include "tally/ledger/types.h"
#include "tally/rpc/http.h"
#include "tally/util/json.h"

#include <string>
#include <vector>

namespace tally {

struct NodeContext;

namespace auth {
struct Claims;
}

namespace ledger {
struct AllocationResult;
struct ReserveHealth;
}

namespace rpc {

/// HTTP status reported for a failure kind
int StatusForError(ledger::ErrorKind kind);

/// {"error":{"kind":...,"message":...}}
util::JSONValue ErrorBody(ledger::ErrorKind kind, const std::string& message);

// JSON views of the ledger records
util::JSONValue AccountToJSON(const ledger::LogicalAccount& account);
util::JSONValue TransactionToJSON(const ledger::LedgerTransaction& tx);
util::JSONValue AllocationToJSON(const ledger::AllocationResult& result);
util::JSONValue RuleToJSON(const ledger::AllocationRule& rule);
util::JSONValue ReconciliationToJSON(const ledger::ReconciliationRecord& record);
util::JSONValue AuditEntryToJSON(const ledger::AuditEntry& entry);

struct ApiResponse {
    int status{200};
    util::JSONValue body;
};

class TreasuryApi {
public:
    /// The node must stay initialized for the lifetime of the API
    explicit TreasuryApi(NodeContext& node);

    /// Route a request; never throws
    HttpResponse Handle(const HttpRequest& request);

    /// Route and return the JSON body; never throws
    ApiResponse Dispatch(const HttpRequest& request);

private:
    using Segments = std::vector<std::string>;

    ApiResponse Route(const HttpRequest& request, const Segments& path);

    /// Verify the bearer token and require the guardian role
    auth::Claims RequireGuardian(const HttpRequest& request) const;

    // /transactions
    ApiResponse PostTransaction(const HttpRequest& request);
    ApiResponse ListTransactions(const HttpRequest& request);
    ApiResponse GetTransaction(const std::string& idText);
    ApiResponse GetAllocations(const std::string& idText);
    ApiResponse CompleteTransaction(const HttpRequest& request, const std::string& idText);
    ApiResponse AllocateTransaction(const HttpRequest& request, const std::string& idText);
    ApiResponse ListUnallocated();

    // /treasury
    ApiResponse TreasuryStatus();
    ApiResponse ListAccounts(const HttpRequest& request);
    ApiResponse GetAccount(const std::string& ref);
    ApiResponse CreateAccount(const HttpRequest& request);
    ApiResponse SetAccountActive(const HttpRequest& request, const std::string& idText);
    ApiResponse Reconcile(const HttpRequest& request);
    ApiResponse ListReconciliations(const HttpRequest& request);
    ApiResponse LatestReconciliation();
    ApiResponse ResolveReconciliation(const HttpRequest& request, const std::string& idText);

    // /allocation-rules
    ApiResponse ListRules(const HttpRequest& request);
    ApiResponse GetRule(const std::string& idText);
    ApiResponse CreateRule(const HttpRequest& request);
    ApiResponse UpdateRule(const HttpRequest& request, const std::string& idText);
    ApiResponse DeleteRule(const HttpRequest& request, const std::string& idText);

    ApiResponse QueryAudit(const HttpRequest& request);
    ApiResponse Health();

    /// Resolve an id-or-name account reference; throws UnknownAccount
    ledger::AccountId ResolveAccount(const util::JSONValue& ref, const char* field) const;
    ledger::AccountId ResolveAccount(const std::string& ref, const char* field) const;

    NodeContext& node_;
};

} // namespace rpc
} // namespace tally

#endif // TALLY_RPC_API_H
