// TALLY - Node Context
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// This file defines the NodeContext structure that owns the store and the
// ledger components of a running tallyd, and the functions that bring
// them up and down.

#ifndef TALLY_NODE_CONTEXT_H
#define TALLY_NODE_CONTEXT_H

#include "tally/auth/gate.h"
#include "tally/core/types.h"
#include "tally/db/ledgerdb.h"
#include "tally/ledger/accounts.h"
#include "tally/ledger/allocation.h"
#include "tally/ledger/audit.h"
#include "tally/ledger/contention.h"
#include "tally/ledger/ledger.h"
#include "tally/ledger/reconcile.h"
#include "tally/ledger/rules.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace tally {

namespace util {
class ConfigManager;
}

/// The only environment in which value-bearing operations are enabled
constexpr const char* MAINNET_ENVIRONMENT = "mainnet";

constexpr const char* DEFAULT_ENVIRONMENT = "development";

/// Name of the rule created by seeding
constexpr const char* DEFAULT_RULE_NAME = "default_allocation";

// ============================================================================
// Node Initialization Options
// ============================================================================

/**
 * Options for node initialization.
 * Populated from command-line and config file.
 */
struct NodeInitOptions {
    /// Store directory; empty keeps the ledger in memory
    std::filesystem::path dataDir;

    std::string environment{DEFAULT_ENVIRONMENT};

    /// Shared token secret (at least 32 characters)
    std::string jwtSecret;

    /// NFT mint value; must be zero outside mainnet
    Amount nftMintValue{0};

    /// Create the demo accounts and default rule on an empty store
    bool seedDefaults{true};

    ledger::RetryPolicy retry;

    std::chrono::milliseconds lockTimeout{2000};
};

/**
 * Fill options from configuration. `environment` falls back to
 * APP_ENVIRONMENT and `jwtsecret` to GUARDIAN_JWT_SECRET.
 * @return false with a message when a value does not parse
 */
bool LoadNodeOptions(const util::ConfigManager& config, NodeInitOptions& options,
                     std::string& error);

/**
 * Startup sentinel: a non-zero NFT mint value is only allowed on mainnet.
 * @return false with the reason otherwise
 */
bool CheckMintSentinel(const std::string& environment, Amount nftMintValue, std::string& reason);

struct HealthReport {
    std::string environment;
    std::string backend;
    bool storeConnected{false};
    std::string storeError;
    bool valueBearing{false};
    Amount nftMintValue{0};

    bool Healthy() const { return storeConnected; }
};

// ============================================================================
// Node Context - Holds all node state
// ============================================================================

struct NodeContext {
    std::unique_ptr<db::LedgerDB> store;
    std::unique_ptr<ledger::AccountLockTable> locks;
    std::unique_ptr<ledger::AuditLog> audit;
    std::unique_ptr<ledger::AccountStore> accounts;
    std::unique_ptr<ledger::RuleBook> rules;
    std::unique_ptr<ledger::AllocationEngine> allocator;
    std::unique_ptr<ledger::TransactionLedger> transactions;
    std::unique_ptr<ledger::ReconciliationEngine> reconciler;
    std::unique_ptr<auth::AccessGate> gate;

    std::string environment{DEFAULT_ENVIRONMENT};
    Amount nftMintValue{0};
    std::filesystem::path dataDir;

    std::atomic<bool> initialized{false};

    NodeContext() = default;
    ~NodeContext() = default;

    NodeContext(const NodeContext&) = delete;
    NodeContext& operator=(const NodeContext&) = delete;

    bool IsReady() const { return initialized.load() && transactions != nullptr; }

    /// Whether value-bearing operations are enabled
    bool IsValueBearing() const { return environment == MAINNET_ENVIRONMENT; }
};

// ============================================================================
// Node Initialization Functions
// ============================================================================

/**
 * Initialize the node:
 * 1. Checks the mint sentinel
 * 2. Opens the store (<datadir>/ledger, or memory)
 * 3. Builds the access gate and the ledger components
 * 4. Seeds defaults on an empty store when enabled
 *
 * @return true if initialization succeeded; failures are logged
 */
bool InitializeNode(NodeContext& node, const NodeInitOptions& options);

/**
 * Create the demo accounts (main_operating 50%, reserve_fund 20%,
 * rewards_pool 15%, development_fund 10%, marketing_fund 5%) and the
 * default rule across them. Does nothing if any account exists.
 * @return true if anything was created
 */
bool SeedDefaults(NodeContext& node);

/// Store connectivity, environment and sentinel state
HealthReport CheckHealth(const NodeContext& node);

/// Release the components in reverse order of creation
void ShutdownNode(NodeContext& node);

// ============================================================================
// Shutdown Control
// ============================================================================

/// Thread-safe; callable from a signal handler
void RequestShutdown();

bool ShutdownRequested();

} // namespace tally

#endif // TALLY_NODE_CONTEXT_H
