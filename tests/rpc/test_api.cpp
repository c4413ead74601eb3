// TALLY - Treasury API Tests
// Copyright (c) 2024 TALLY Developers
// MIT License

#include <gtest/gtest.h>

#include "tally/auth/gate.h"
#include "tally/node/context.h"
#include "tally/rpc/api.h"
#include "tally/rpc/http.h"

#include <memory>
#include <string>

namespace tally {
namespace rpc {
namespace test {

using ledger::ErrorKind;
using util::JSONValue;

// ============================================================================
// Error Mapping
// ============================================================================

TEST(ApiErrorTest, StatusForError) {
    EXPECT_EQ(StatusForError(ErrorKind::ValidationError), 400);
    EXPECT_EQ(StatusForError(ErrorKind::UnknownAccount), 400);
    EXPECT_EQ(StatusForError(ErrorKind::InvalidTransactionShape), 400);
    EXPECT_EQ(StatusForError(ErrorKind::InvalidRuleConfiguration), 400);
    EXPECT_EQ(StatusForError(ErrorKind::InvalidToken), 401);
    EXPECT_EQ(StatusForError(ErrorKind::TokenExpired), 401);
    EXPECT_EQ(StatusForError(ErrorKind::InsufficientRole), 403);
    EXPECT_EQ(StatusForError(ErrorKind::NotFound), 404);
    EXPECT_EQ(StatusForError(ErrorKind::DuplicateAccount), 409);
    EXPECT_EQ(StatusForError(ErrorKind::DuplicateRule), 409);
    EXPECT_EQ(StatusForError(ErrorKind::AlreadyResolved), 409);
    EXPECT_EQ(StatusForError(ErrorKind::InsufficientFunds), 422);
    EXPECT_EQ(StatusForError(ErrorKind::NoApplicableRule), 422);
    EXPECT_EQ(StatusForError(ErrorKind::TransientConflict), 503);
    EXPECT_EQ(StatusForError(ErrorKind::StorageError), 500);
}

TEST(ApiErrorTest, ErrorBody) {
    JSONValue body = ErrorBody(ErrorKind::DuplicateRule, "rule 'x' already exists");
    EXPECT_EQ(body.ToJSON(),
              "{\"error\":{\"kind\":\"DuplicateRule\",\"message\":\"rule 'x' already exists\"}}");
}

// ============================================================================
// Dispatch
// ============================================================================

class TreasuryApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        NodeInitOptions options;
        options.jwtSecret = "api-test-secret-with-32-characters-min";
        ASSERT_TRUE(InitializeNode(node_, options));
        api_ = std::make_unique<TreasuryApi>(node_);
        guardian_ = node_.gate->IssueToken("guardian-1", ledger::GUARDIAN_ROLE);
        viewer_ = node_.gate->IssueToken("viewer-1", "viewer");
    }

    void TearDown() override {
        api_.reset();
        ShutdownNode(node_);
    }

    ApiResponse Call(const std::string& method, const std::string& target,
                     const std::string& body = "", const std::string& token = "") {
        HttpRequest request;
        request.method = method;
        size_t qmark = target.find('?');
        request.path = target.substr(0, qmark);
        if (qmark != std::string::npos) {
            EXPECT_TRUE(ParseQueryString(target.substr(qmark + 1), request.query));
        }
        request.body = body;
        if (!token.empty()) {
            request.headers["authorization"] = "Bearer " + token;
        }
        return api_->Dispatch(request);
    }

    static std::string Kind(const ApiResponse& response) {
        return response.body["error"]["kind"].GetString();
    }

    NodeContext node_;
    std::unique_ptr<TreasuryApi> api_;
    std::string guardian_;
    std::string viewer_;
};

TEST_F(TreasuryApiTest, Health) {
    ApiResponse response = Call("GET", "/health");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body["status"].GetString(), "healthy");
    EXPECT_EQ(response.body["environment"].GetString(), DEFAULT_ENVIRONMENT);
    EXPECT_EQ(response.body["database"]["backend"].GetString(), "memory");
    EXPECT_TRUE(response.body["database"]["connected"].GetBool());
    EXPECT_FALSE(response.body["value_bearing"].GetBool());
}

TEST_F(TreasuryApiTest, UnknownRouteAndMethod) {
    ApiResponse missing = Call("GET", "/nowhere");
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(Kind(missing), "NotFound");

    EXPECT_EQ(Call("DELETE", "/transactions").status, 405);
    EXPECT_EQ(Call("POST", "/health").status, 405);
    EXPECT_EQ(Call("PUT", "/allocation-rules/1").status, 405);
}

TEST_F(TreasuryApiTest, DepositIsCreatedThenReplayed) {
    const std::string body =
        "{\"transaction_type\":\"external_deposit\",\"status\":\"COMPLETED\","
        "\"amount\":\"100.00\",\"to_account\":\"main_operating\","
        "\"external_ref\":\"wire-7\",\"metadata\":{\"chain\":\"eth\",\"block\":42}}";

    ApiResponse created = Call("POST", "/transactions", body);
    ASSERT_EQ(created.status, 201) << created.body.ToJSON();
    const JSONValue& tx = created.body["transaction"];
    EXPECT_EQ(tx["transaction_type"].GetString(), "EXTERNAL_DEPOSIT");
    EXPECT_EQ(tx["status"].GetString(), "COMPLETED");
    EXPECT_EQ(tx["amount"].GetString(), FormatAmount(100 * COIN));
    EXPECT_EQ(tx["performed_by"].GetString(), ledger::SYSTEM_ACTOR);
    EXPECT_EQ(tx["metadata"]["block"].GetString(), "42");
    EXPECT_FALSE(created.body["replayed"].GetBool());

    const JSONValue& allocation = created.body["allocation"];
    EXPECT_TRUE(allocation["allocated"].GetBool());
    EXPECT_EQ(allocation["rule_name"].GetString(), DEFAULT_RULE_NAME);
    EXPECT_EQ(allocation["child_transaction_ids"].Size(), 5u);

    ApiResponse replay = Call("POST", "/transactions", body);
    EXPECT_EQ(replay.status, 200);
    EXPECT_TRUE(replay.body["replayed"].GetBool());
    EXPECT_EQ(replay.body["transaction"]["id"].GetInt(), tx["id"].GetInt());

    ApiResponse children = Call("GET", "/transactions?type=INTERNAL_ALLOCATION");
    EXPECT_EQ(children.status, 200);
    EXPECT_EQ(children.body["total"].GetInt(), 5);
}

TEST_F(TreasuryApiTest, TransactionsDefaultToPending) {
    ApiResponse created = Call("POST", "/transactions",
        "{\"transaction_type\":\"EXTERNAL_DEPOSIT\",\"amount\":5,\"to_account\":1}");
    ASSERT_EQ(created.status, 201) << created.body.ToJSON();
    EXPECT_EQ(created.body["transaction"]["status"].GetString(), "PENDING");
    EXPECT_FALSE(created.body.HasKey("allocation"));

    std::string id = std::to_string(created.body["transaction"]["id"].GetInt());
    EXPECT_EQ(Call("POST", "/transactions/" + id + "/complete", "{}").status, 401);

    ApiResponse completed = Call("POST", "/transactions/" + id + "/complete", "{}", guardian_);
    ASSERT_EQ(completed.status, 200) << completed.body.ToJSON();
    EXPECT_EQ(completed.body["transaction"]["status"].GetString(), "COMPLETED");
    EXPECT_TRUE(completed.body["allocation"]["allocated"].GetBool());

    ApiResponse again = Call("POST", "/transactions/" + id + "/complete", "{}", guardian_);
    EXPECT_EQ(again.status, 400);
}

TEST_F(TreasuryApiTest, TransactionValidation) {
    ApiResponse unknown = Call("POST", "/transactions",
        "{\"transaction_type\":\"EXTERNAL_DEPOSIT\",\"amount\":\"1\",\"to_account\":\"nobody\"}");
    EXPECT_EQ(unknown.status, 400);
    EXPECT_EQ(Kind(unknown), "UnknownAccount");

    ApiResponse tooPrecise = Call("POST", "/transactions",
        "{\"transaction_type\":\"EXTERNAL_DEPOSIT\",\"amount\":\"1.123456789\",\"to_account\":1}");
    EXPECT_EQ(tooPrecise.status, 400);
    EXPECT_EQ(Kind(tooPrecise), "ValidationError");

    EXPECT_EQ(Call("POST", "/transactions", "[1,2]").status, 400);
    EXPECT_EQ(Call("POST", "/transactions", "{\"transaction_type\":\"GIFT\",\"amount\":1}").status,
              400);
    EXPECT_EQ(Call("GET", "/transactions/abc").status, 400);
    EXPECT_EQ(Call("GET", "/transactions/9999").status, 404);
    EXPECT_EQ(Call("GET", "/transactions?limit=0").status, 400);
}

TEST_F(TreasuryApiTest, OverdraftIsUnprocessable) {
    ApiResponse response = Call("POST", "/transactions",
        "{\"transaction_type\":\"EXTERNAL_WITHDRAWAL\",\"status\":\"COMPLETED\","
        "\"amount\":\"1\",\"from_account\":\"reserve_fund\"}");
    EXPECT_EQ(response.status, 422);
    EXPECT_EQ(Kind(response), "InsufficientFunds");
}

TEST_F(TreasuryApiTest, TreasuryStatus) {
    Call("POST", "/transactions",
         "{\"transaction_type\":\"EXTERNAL_DEPOSIT\",\"status\":\"COMPLETED\","
         "\"amount\":\"1000\",\"to_account\":\"main_operating\"}");

    ApiResponse status = Call("GET", "/treasury/status");
    ASSERT_EQ(status.status, 200);
    EXPECT_EQ(status.body["total_balance"].GetString(), FormatAmount(1000 * COIN));
    EXPECT_EQ(status.body["account_count"].GetInt(), 5);
    EXPECT_EQ(status.body["accounts"].Size(), 5u);

    const JSONValue& reserve = status.body["reserve_status"];
    EXPECT_TRUE(reserve["present"].GetBool());
    EXPECT_EQ(reserve["account_name"].GetString(), "reserve_fund");
    EXPECT_EQ(reserve["reserve_percentage"].GetString(), FormatPercent(2000));
    EXPECT_EQ(reserve["reserve_balance"].GetString(), FormatAmount(200 * COIN));
    EXPECT_TRUE(reserve["is_healthy"].GetBool());

    ApiResponse account = Call("GET", "/treasury/accounts/reserve_fund");
    ASSERT_EQ(account.status, 200);
    EXPECT_EQ(account.body["account_type"].GetString(), "RESERVE");
    EXPECT_EQ(account.body["current_balance"].GetString(), FormatAmount(200 * COIN));
    EXPECT_EQ(Call("GET", "/treasury/accounts/missing").status, 404);
}

TEST_F(TreasuryApiTest, AccountManagementRequiresGuardian) {
    const std::string body = "{\"account_name\":\"grants\",\"account_type\":\"custom\"}";
    EXPECT_EQ(Call("POST", "/treasury/accounts", body).status, 401);
    EXPECT_EQ(Call("POST", "/treasury/accounts", body, viewer_).status, 403);

    ApiResponse created = Call("POST", "/treasury/accounts", body, guardian_);
    ASSERT_EQ(created.status, 201) << created.body.ToJSON();
    EXPECT_EQ(created.body["account_name"].GetString(), "grants");
    EXPECT_EQ(created.body["current_balance"].GetString(), FormatAmount(0));

    ApiResponse duplicate = Call("POST", "/treasury/accounts", body, guardian_);
    EXPECT_EQ(duplicate.status, 409);
    EXPECT_EQ(Kind(duplicate), "DuplicateAccount");

    std::string id = std::to_string(created.body["id"].GetInt());
    ApiResponse deactivated = Call("POST", "/treasury/accounts/" + id + "/active",
                                   "{\"is_active\":false}", guardian_);
    ASSERT_EQ(deactivated.status, 200);
    EXPECT_FALSE(deactivated.body["is_active"].GetBool());
    EXPECT_EQ(Call("GET", "/treasury/accounts").body["count"].GetInt(), 5);
    EXPECT_EQ(Call("GET", "/treasury/accounts?include_inactive=true").body["count"].GetInt(), 6);
}

TEST_F(TreasuryApiTest, RuleLifecycle) {
    const std::string rule =
        "{\"rule_name\":\"split\",\"priority\":1,\"allocation_config\":["
        "{\"account_name\":\"reserve_fund\",\"percentage\":\"60\"},"
        "{\"account_name\":\"marketing_fund\",\"percentage\":40}]}";

    EXPECT_EQ(Call("POST", "/allocation-rules", rule).status, 401);
    EXPECT_EQ(Call("POST", "/allocation-rules", rule, viewer_).status, 403);

    ApiResponse created = Call("POST", "/allocation-rules", rule, guardian_);
    ASSERT_EQ(created.status, 201) << created.body.ToJSON();
    const JSONValue& config = created.body["allocation_config"];
    ASSERT_EQ(config.Size(), 2u);
    EXPECT_EQ(config[0]["percentage"].GetString(), FormatPercent(6000));
    EXPECT_TRUE(created.body["max_amount"].IsNull());
    EXPECT_EQ(created.body["created_by"].GetString(), "guardian-1");

    EXPECT_EQ(Call("POST", "/allocation-rules", rule, guardian_).status, 409);

    ApiResponse badSum = Call("POST", "/allocation-rules",
        "{\"rule_name\":\"short\",\"allocation_config\":["
        "{\"account_name\":\"reserve_fund\",\"percentage\":\"99\"}]}", guardian_);
    EXPECT_EQ(badSum.status, 400);

    std::string id = std::to_string(created.body["id"].GetInt());
    ApiResponse patched = Call("PATCH", "/allocation-rules/" + id,
                               "{\"max_amount\":\"50\",\"description\":\"small deposits\"}",
                               guardian_);
    ASSERT_EQ(patched.status, 200) << patched.body.ToJSON();
    EXPECT_EQ(patched.body["max_amount"].GetString(), FormatAmount(50 * COIN));
    EXPECT_EQ(patched.body["rule_name"].GetString(), "split");

    EXPECT_EQ(Call("GET", "/allocation-rules").body["count"].GetInt(), 2);

    ApiResponse deleted = Call("DELETE", "/allocation-rules/" + id, "", guardian_);
    ASSERT_EQ(deleted.status, 200);
    EXPECT_FALSE(deleted.body["is_active"].GetBool());
    EXPECT_EQ(Call("GET", "/allocation-rules").body["count"].GetInt(), 1);
    EXPECT_EQ(Call("GET", "/allocation-rules?active_only=false").body["count"].GetInt(), 2);
    EXPECT_EQ(Call("GET", "/allocation-rules/" + id).status, 200);
    EXPECT_EQ(Call("GET", "/allocation-rules/77").status, 404);
}

TEST_F(TreasuryApiTest, ReconcileAndResolve) {
    Call("POST", "/transactions",
         "{\"transaction_type\":\"EXTERNAL_DEPOSIT\",\"status\":\"COMPLETED\","
         "\"amount\":\"1000\",\"to_account\":\"main_operating\"}");

    const std::string body = "{\"external_balance\":\"1060\",\"source\":\"bank\"}";
    EXPECT_EQ(Call("POST", "/treasury/reconcile", body).status, 401);

    ApiResponse expired = Call("POST", "/treasury/reconcile", body,
                               node_.gate->IssueToken("guardian-1", ledger::GUARDIAN_ROLE, -1));
    EXPECT_EQ(expired.status, 401);
    EXPECT_EQ(Kind(expired), "TokenExpired");

    EXPECT_EQ(Call("GET", "/treasury/reconciliations/latest").status, 404);

    ApiResponse record = Call("POST", "/treasury/reconcile", body, guardian_);
    ASSERT_EQ(record.status, 201) << record.body.ToJSON();
    EXPECT_EQ(record.body["status"].GetString(), "CRITICAL");
    EXPECT_EQ(record.body["internal_balance"].GetString(), FormatAmount(1000 * COIN));
    EXPECT_EQ(record.body["discrepancy"].GetString(), FormatAmount(60 * COIN));
    EXPECT_EQ(record.body["performed_by"].GetString(), "guardian-1");
    EXPECT_TRUE(record.body["resolved_by"].IsNull());

    std::string id = std::to_string(record.body["id"].GetInt());
    EXPECT_EQ(Call("POST", "/treasury/reconciliations/" + id + "/resolve", "{}", guardian_).status,
              400);

    ApiResponse resolved = Call("POST", "/treasury/reconciliations/" + id + "/resolve",
                                "{\"resolution_notes\":\"fee booked late\"}", guardian_);
    ASSERT_EQ(resolved.status, 200);
    EXPECT_EQ(resolved.body["resolved_by"].GetString(), "guardian-1");

    ApiResponse twice = Call("POST", "/treasury/reconciliations/" + id + "/resolve",
                             "{\"resolution_notes\":\"again\"}", guardian_);
    EXPECT_EQ(twice.status, 409);
    EXPECT_EQ(Kind(twice), "AlreadyResolved");

    ApiResponse latest = Call("GET", "/treasury/reconciliations/latest");
    ASSERT_EQ(latest.status, 200);
    EXPECT_EQ(latest.body["id"].GetInt(), record.body["id"].GetInt());
    EXPECT_EQ(Call("GET", "/treasury/reconciliations?status=CRITICAL").body["count"].GetInt(), 1);
    EXPECT_EQ(Call("GET", "/treasury/reconciliations?status=BALANCED").body["count"].GetInt(), 0);
}

TEST_F(TreasuryApiTest, ReconcileAcceptsBalancesUpToTheTreasuryLimit) {
    ApiResponse large = Call("POST", "/treasury/reconcile",
                             "{\"external_balance\":\"90000000000\"}", guardian_);
    ASSERT_EQ(large.status, 201) << large.body.ToJSON();
    EXPECT_EQ(large.body["discrepancy"].GetString(), FormatAmount(MAX_TREASURY));
    EXPECT_EQ(large.body["status"].GetString(), "CRITICAL");

    ApiResponse tooLarge = Call("POST", "/treasury/reconcile",
                                "{\"external_balance\":\"90000000000.00000001\"}", guardian_);
    EXPECT_EQ(tooLarge.status, 400);
    EXPECT_EQ(Kind(tooLarge), "ValidationError");
}

TEST_F(TreasuryApiTest, UnallocatedDepositsCanBeAllocatedLater) {
    auto rule = node_.rules->FindRuleByName(DEFAULT_RULE_NAME);
    ASSERT_TRUE(rule.has_value());
    node_.rules->DeactivateRule(rule->id, "tester");

    ApiResponse deposit = Call("POST", "/transactions",
        "{\"transaction_type\":\"EXTERNAL_DEPOSIT\",\"status\":\"COMPLETED\","
        "\"amount\":\"10\",\"to_account\":\"main_operating\"}");
    ASSERT_EQ(deposit.status, 201);
    EXPECT_TRUE(deposit.body["allocation"]["unallocated"].GetBool());

    EXPECT_EQ(Call("GET", "/transactions/unallocated").body["count"].GetInt(), 1);

    std::string id = std::to_string(deposit.body["transaction"]["id"].GetInt());
    ApiResponse refused = Call("POST", "/transactions/" + id + "/allocate", "", guardian_);
    EXPECT_EQ(refused.status, 422);
    EXPECT_EQ(Kind(refused), "NoApplicableRule");

    Call("POST", "/allocation-rules",
         "{\"rule_name\":\"all_reserve\",\"allocation_config\":["
         "{\"account_name\":\"reserve_fund\",\"percentage\":100}]}", guardian_);

    ApiResponse allocated = Call("POST", "/transactions/" + id + "/allocate", "", guardian_);
    ASSERT_EQ(allocated.status, 200) << allocated.body.ToJSON();
    EXPECT_TRUE(allocated.body["allocated"].GetBool());
    EXPECT_EQ(Call("GET", "/transactions/unallocated").body["count"].GetInt(), 0);

    ApiResponse stored = Call("GET", "/transactions/" + id + "/allocations");
    EXPECT_EQ(stored.body["rule_name"].GetString(), "all_reserve");
}

TEST_F(TreasuryApiTest, AuditTrail) {
    Call("POST", "/treasury/accounts", "{\"account_name\":\"grants\"}", guardian_);

    ApiResponse audit = Call("GET", "/audit?entity_type=logical_account&performed_by=guardian-1");
    ASSERT_EQ(audit.status, 200);
    ASSERT_EQ(audit.body["count"].GetInt(), 1);
    const JSONValue& entries = audit.body["entries"];
    const JSONValue& entry = entries[0];
    EXPECT_EQ(entry["action"].GetString(), "CREATE");
    EXPECT_EQ(entry["new_values"]["name"].GetString(), "grants");

    EXPECT_EQ(Call("GET", "/audit?limit=5000").status, 400);
}

TEST_F(TreasuryApiTest, HandleSerializesBody) {
    HttpRequest request;
    request.method = "GET";
    request.path = "/treasury/accounts/main_operating";
    HttpResponse response = api_->Handle(request);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.contentType, "application/json");
    JSONValue parsed = JSONValue::Parse(response.body);
    EXPECT_EQ(parsed["account_name"].GetString(), "main_operating");
}

} // namespace test
} // namespace rpc
} // namespace tally
