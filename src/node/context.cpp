// TALLY - Node Context Implementation
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/node/context.h"
#include "tally/db/database.h"
#include "tally/ledger/errors.h"
#include "tally/util/config.h"
#include "tally/util/logging.h"

#include <cstdlib>
#include <stdexcept>
#include <system_error>

namespace tally {

namespace {

bool CreateDirectoryIfNeeded(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return std::filesystem::is_directory(path, ec);
    }
    return std::filesystem::create_directories(path, ec);
}

struct SeedAccount {
    const char* name;
    ledger::AccountType type;
    BasisPoints targetPercent;
    const char* description;
};

const SeedAccount SEED_ACCOUNTS[] = {
    {"main_operating", ledger::AccountType::OPERATING, 5000, "Main operating account"},
    {"reserve_fund", ledger::AccountType::RESERVE, 2000, "Reserve held against liabilities"},
    {"rewards_pool", ledger::AccountType::REWARDS, 1500, "Community rewards"},
    {"development_fund", ledger::AccountType::DEVELOPMENT, 1000, "Development funding"},
    {"marketing_fund", ledger::AccountType::MARKETING, 500, "Marketing and growth"},
};

} // namespace

// ============================================================================
// Options
// ============================================================================

bool LoadNodeOptions(const util::ConfigManager& config, NodeInitOptions& options,
                     std::string& error) {
    namespace ConfigKeys = util::ConfigKeys;

    options.dataDir = config.GetDataDir();

    if (auto env = config.TryGetString(ConfigKeys::ENVIRONMENT); env && !env->empty()) {
        options.environment = *env;
    } else if (const char* fromEnv = std::getenv(util::ConfigEnv::APP_ENVIRONMENT);
               fromEnv && *fromEnv) {
        options.environment = fromEnv;
    } else {
        options.environment = DEFAULT_ENVIRONMENT;
    }

    if (auto secret = config.TryGetString(ConfigKeys::JWTSECRET); secret && !secret->empty()) {
        options.jwtSecret = *secret;
    } else if (const char* fromEnv = std::getenv(util::ConfigEnv::JWT_SECRET)) {
        options.jwtSecret = fromEnv;
    }

    std::string mintValue = config.GetString(ConfigKeys::NFTMINTVALUE, "0");
    auto parsed = ParseAmount(mintValue);
    if (!parsed || *parsed < 0) {
        error = "invalid nftmintvalue: " + mintValue;
        return false;
    }
    options.nftMintValue = *parsed;

    options.seedDefaults = config.GetBool(ConfigKeys::SEEDDEFAULTS, true);

    int64_t attempts = config.GetInt(ConfigKeys::RETRYATTEMPTS, options.retry.maxAttempts);
    int64_t baseMs = config.GetInt(ConfigKeys::RETRYBASEMS, options.retry.baseDelayMs);
    int64_t maxMs = config.GetInt(ConfigKeys::RETRYMAXMS, options.retry.maxDelayMs);
    int64_t lockMs = config.GetInt(ConfigKeys::LOCKTIMEOUTMS, options.lockTimeout.count());
    if (attempts < 1 || attempts > 100 || baseMs < 0 || maxMs < baseMs || lockMs < 1) {
        error = "invalid retry or lock timeout settings";
        return false;
    }
    options.retry.maxAttempts = static_cast<int>(attempts);
    options.retry.baseDelayMs = baseMs;
    options.retry.maxDelayMs = maxMs;
    options.lockTimeout = std::chrono::milliseconds(lockMs);
    return true;
}

bool CheckMintSentinel(const std::string& environment, Amount nftMintValue, std::string& reason) {
    if (nftMintValue != 0 && environment != MAINNET_ENVIRONMENT) {
        reason = "nftmintvalue must be 0 outside mainnet (environment '" + environment +
                 "', value " + FormatAmount(nftMintValue) + ")";
        return false;
    }
    return true;
}

// ============================================================================
// InitializeNode
// ============================================================================

bool InitializeNode(NodeContext& node, const NodeInitOptions& options) {
    LOG_INFO(util::LogCategory::DEFAULT) << "Initializing node (environment "
                                         << options.environment << ")...";

    std::string reason;
    if (!CheckMintSentinel(options.environment, options.nftMintValue, reason)) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Refusing to start: " << reason;
        return false;
    }

    node.environment = options.environment;
    node.nftMintValue = options.nftMintValue;
    node.dataDir = options.dataDir;

    // Access gate
    try {
        node.gate = std::make_unique<auth::AccessGate>(options.jwtSecret);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(util::LogCategory::AUTH) << "Invalid jwtsecret: " << e.what();
        return false;
    }

    // Store
    std::unique_ptr<db::Database> database;
    if (options.dataDir.empty()) {
        database = db::OpenMemoryDatabase();
        LOG_INFO(util::LogCategory::DB) << "Using in-memory store";
    } else {
        std::filesystem::path ledgerDir = options.dataDir / "ledger";
        if (!CreateDirectoryIfNeeded(options.dataDir)) {
            LOG_ERROR(util::LogCategory::DB) << "Failed to create data directory: "
                                             << options.dataDir.string();
            return false;
        }
        db::Options dbOptions;
        dbOptions.create_if_missing = true;
        auto [status, opened] = db::OpenDatabase(ledgerDir, dbOptions);
        if (!status.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Failed to open store at " << ledgerDir.string()
                                             << ": " << status.ToString();
            return false;
        }
        database = std::move(opened);
        LOG_INFO(util::LogCategory::DB) << "Store directory: " << ledgerDir.string();
    }
    node.store = std::make_unique<db::LedgerDB>(std::move(database));
    LOG_INFO(util::LogCategory::DB) << "Store backend: " << node.store->BackendName();

    // Ledger components
    node.locks = std::make_unique<ledger::AccountLockTable>(options.lockTimeout);
    node.audit = std::make_unique<ledger::AuditLog>(*node.store);
    node.accounts = std::make_unique<ledger::AccountStore>(*node.store, *node.audit,
                                                           *node.locks, options.retry);
    node.rules = std::make_unique<ledger::RuleBook>(*node.store, *node.accounts, *node.audit,
                                                    options.retry);
    node.allocator = std::make_unique<ledger::AllocationEngine>(
        *node.store, *node.accounts, *node.rules, *node.audit, *node.locks, options.retry);
    node.transactions = std::make_unique<ledger::TransactionLedger>(
        *node.store, *node.accounts, *node.allocator, *node.audit, *node.locks, options.retry);
    node.reconciler = std::make_unique<ledger::ReconciliationEngine>(*node.store, *node.audit,
                                                                     options.retry);

    if (options.seedDefaults) {
        try {
            if (SeedDefaults(node)) {
                LOG_INFO(util::LogCategory::LEDGER) << "Seeded default accounts and rule";
            }
        } catch (const ledger::LedgerError& e) {
            LOG_ERROR(util::LogCategory::LEDGER) << "Seeding failed: " << e.what();
            return false;
        }
    }

    node.initialized.store(true);
    LOG_INFO(util::LogCategory::DEFAULT) << "Node initialized"
                                         << (node.IsValueBearing() ? " (value-bearing)" : "");
    return true;
}

bool SeedDefaults(NodeContext& node) {
    if (!node.accounts->ListAccounts(true).empty()) {
        return false;
    }

    ledger::NewRule rule;
    rule.name = DEFAULT_RULE_NAME;
    rule.priority = ledger::DEFAULT_RULE_PRIORITY;
    rule.description = "Default treasury split";

    for (const auto& seed : SEED_ACCOUNTS) {
        ledger::NewAccount account;
        account.name = seed.name;
        account.type = seed.type;
        account.description = seed.description;
        account.targetPercent = seed.targetPercent;
        node.accounts->CreateAccount(account, ledger::SYSTEM_ACTOR);
        rule.items.push_back({seed.name, seed.targetPercent});
    }

    if (!node.rules->FindRuleByName(DEFAULT_RULE_NAME)) {
        node.rules->CreateRule(rule, ledger::SYSTEM_ACTOR);
    }
    return true;
}

HealthReport CheckHealth(const NodeContext& node) {
    HealthReport report;
    report.environment = node.environment;
    report.valueBearing = node.IsValueBearing();
    report.nftMintValue = node.nftMintValue;
    if (node.store) {
        report.backend = node.store->BackendName();
        db::Status s = node.store->CheckConnection();
        report.storeConnected = s.ok();
        if (!s.ok()) {
            report.storeError = s.ToString();
            LOG_WARN(util::LogCategory::DB) << "Store check failed: " << report.storeError;
        }
    } else {
        report.storeError = "store not open";
    }
    return report;
}

// ============================================================================
// ShutdownNode
// ============================================================================

void ShutdownNode(NodeContext& node) {
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down node...";

    node.initialized.store(false);

    node.reconciler.reset();
    node.transactions.reset();
    node.allocator.reset();
    node.rules.reset();
    node.accounts.reset();
    node.audit.reset();
    node.locks.reset();
    node.gate.reset();

    if (node.store) {
        LOG_INFO(util::LogCategory::DB) << "Closing store...";
        node.store.reset();
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "Node shutdown complete";
}

// ============================================================================
// Shutdown Control
// ============================================================================

static std::atomic<bool> g_shutdownRequested{false};

void RequestShutdown() {
    g_shutdownRequested.store(true);
}

bool ShutdownRequested() {
    return g_shutdownRequested.load();
}

} // namespace tally
