// TALLY - Node Context Tests
// Copyright (c) 2024 TALLY Developers
// MIT License

#include <gtest/gtest.h>

#include "tally/node/context.h"
#include "tally/util/config.h"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace tally {
namespace test {

namespace {

const char* const TEST_SECRET = "test-secret-with-at-least-32-characters!";

NodeInitOptions MemoryOptions() {
    NodeInitOptions options;
    options.jwtSecret = TEST_SECRET;
    return options;
}

} // namespace

// ============================================================================
// Options
// ============================================================================

class NodeOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv(util::ConfigEnv::APP_ENVIRONMENT);
        unsetenv(util::ConfigEnv::JWT_SECRET);
    }

    void TearDown() override {
        unsetenv(util::ConfigEnv::APP_ENVIRONMENT);
        unsetenv(util::ConfigEnv::JWT_SECRET);
    }

    util::ConfigManager config_;
};

TEST_F(NodeOptionsTest, ReadsConfiguredValues) {
    auto parsed = config_.ParseString(
        "datadir=/var/lib/tally\n"
        "environment=staging\n"
        "jwtsecret=" + std::string(TEST_SECRET) + "\n"
        "nftmintvalue=0\n"
        "seeddefaults=0\n"
        "retryattempts=7\n"
        "retrybasems=3\n"
        "retrymaxms=30\n"
        "locktimeoutms=500\n");
    ASSERT_TRUE(parsed.success) << parsed.ToString();

    NodeInitOptions options;
    std::string error;
    ASSERT_TRUE(LoadNodeOptions(config_, options, error)) << error;
    EXPECT_EQ(options.dataDir, std::filesystem::path("/var/lib/tally"));
    EXPECT_EQ(options.environment, "staging");
    EXPECT_EQ(options.jwtSecret, TEST_SECRET);
    EXPECT_EQ(options.nftMintValue, 0);
    EXPECT_FALSE(options.seedDefaults);
    EXPECT_EQ(options.retry.maxAttempts, 7);
    EXPECT_EQ(options.retry.baseDelayMs, 3);
    EXPECT_EQ(options.retry.maxDelayMs, 30);
    EXPECT_EQ(options.lockTimeout.count(), 500);
}

TEST_F(NodeOptionsTest, FallsBackToEnvironment) {
    setenv(util::ConfigEnv::APP_ENVIRONMENT, "mainnet", 1);
    setenv(util::ConfigEnv::JWT_SECRET, TEST_SECRET, 1);

    NodeInitOptions options;
    std::string error;
    ASSERT_TRUE(LoadNodeOptions(config_, options, error)) << error;
    EXPECT_EQ(options.environment, "mainnet");
    EXPECT_EQ(options.jwtSecret, TEST_SECRET);
    EXPECT_TRUE(options.seedDefaults);
}

TEST_F(NodeOptionsTest, DefaultsToDevelopment) {
    NodeInitOptions options;
    std::string error;
    ASSERT_TRUE(LoadNodeOptions(config_, options, error)) << error;
    EXPECT_EQ(options.environment, DEFAULT_ENVIRONMENT);
    EXPECT_TRUE(options.jwtSecret.empty());
}

TEST_F(NodeOptionsTest, RejectsBadValues) {
    NodeInitOptions options;
    std::string error;

    config_.Set(util::ConfigKeys::NFTMINTVALUE, "lots");
    EXPECT_FALSE(LoadNodeOptions(config_, options, error));
    EXPECT_NE(error.find("nftmintvalue"), std::string::npos);

    config_.Set(util::ConfigKeys::NFTMINTVALUE, "0");
    config_.Set(util::ConfigKeys::RETRYATTEMPTS, "0");
    EXPECT_FALSE(LoadNodeOptions(config_, options, error));

    config_.Set(util::ConfigKeys::RETRYATTEMPTS, "3");
    config_.Set(util::ConfigKeys::RETRYBASEMS, "20");
    config_.Set(util::ConfigKeys::RETRYMAXMS, "10");
    EXPECT_FALSE(LoadNodeOptions(config_, options, error));
}

// ============================================================================
// Mint Sentinel
// ============================================================================

TEST(MintSentinelTest, NonZeroOnlyOnMainnet) {
    std::string reason;
    EXPECT_TRUE(CheckMintSentinel("development", 0, reason));
    EXPECT_TRUE(CheckMintSentinel(MAINNET_ENVIRONMENT, 5 * COIN, reason));
    EXPECT_FALSE(CheckMintSentinel("development", 5 * COIN, reason));
    EXPECT_NE(reason.find("development"), std::string::npos);
    EXPECT_FALSE(CheckMintSentinel("Mainnet", 1, reason));
}

// ============================================================================
// Initialization
// ============================================================================

TEST(NodeInitTest, MemoryNodeIsSeeded) {
    NodeContext node;
    ASSERT_TRUE(InitializeNode(node, MemoryOptions()));
    EXPECT_TRUE(node.IsReady());
    EXPECT_FALSE(node.IsValueBearing());
    ASSERT_TRUE(node.gate != nullptr);

    auto accounts = node.accounts->ListAccounts(true);
    ASSERT_EQ(accounts.size(), 5u);
    EXPECT_EQ(accounts[0].name, "main_operating");
    EXPECT_EQ(accounts[1].type, ledger::AccountType::RESERVE);
    EXPECT_EQ(accounts[1].targetPercent, 2000);

    auto rule = node.rules->FindRuleByName(DEFAULT_RULE_NAME);
    ASSERT_TRUE(rule.has_value());
    EXPECT_EQ(rule->items.size(), 5u);
    EXPECT_EQ(rule->TotalPercent(), FULL_PERCENT);
    EXPECT_EQ(rule->createdBy, ledger::SYSTEM_ACTOR);

    // Seeding is skipped once accounts exist
    EXPECT_FALSE(SeedDefaults(node));

    ShutdownNode(node);
    EXPECT_FALSE(node.IsReady());
    EXPECT_TRUE(node.store == nullptr);
}

TEST(NodeInitTest, SeedingCanBeDisabled) {
    NodeContext node;
    NodeInitOptions options = MemoryOptions();
    options.seedDefaults = false;
    ASSERT_TRUE(InitializeNode(node, options));
    EXPECT_TRUE(node.accounts->ListAccounts(true).empty());
    EXPECT_TRUE(node.rules->ListRules(false).empty());
}

TEST(NodeInitTest, SeededNodeAllocatesDeposits) {
    NodeContext node;
    ASSERT_TRUE(InitializeNode(node, MemoryOptions()));
    auto intake = node.accounts->GetAccountByName("main_operating");

    ledger::TransactionRequest request;
    request.type = ledger::TransactionType::EXTERNAL_DEPOSIT;
    request.amount = 100 * COIN;
    request.toAccount = intake.id;
    auto result = node.transactions->RecordTransaction(request);
    ASSERT_TRUE(result.allocation.has_value());
    EXPECT_TRUE(result.allocation->allocated);
    EXPECT_EQ(result.transaction.performedBy, ledger::SYSTEM_ACTOR);
    EXPECT_EQ(node.accounts->GetAccountByName("reserve_fund").balance, 20 * COIN);
}

TEST(NodeInitTest, ShortSecretFails) {
    NodeContext node;
    NodeInitOptions options = MemoryOptions();
    options.jwtSecret = "short";
    EXPECT_FALSE(InitializeNode(node, options));
    EXPECT_FALSE(node.IsReady());
}

TEST(NodeInitTest, MintValueOutsideMainnetFails) {
    NodeContext node;
    NodeInitOptions options = MemoryOptions();
    options.nftMintValue = COIN;
    EXPECT_FALSE(InitializeNode(node, options));
    EXPECT_FALSE(node.IsReady());

    NodeContext mainnet;
    options.environment = MAINNET_ENVIRONMENT;
    ASSERT_TRUE(InitializeNode(mainnet, options));
    EXPECT_TRUE(mainnet.IsValueBearing());
}

TEST(NodeInitTest, DataDirectoryIsCreated) {
    auto dir = std::filesystem::temp_directory_path() /
               ("tally_node_test_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);

    {
        NodeContext node;
        NodeInitOptions options = MemoryOptions();
        options.dataDir = dir;
        ASSERT_TRUE(InitializeNode(node, options));
        EXPECT_TRUE(std::filesystem::is_directory(dir));
        EXPECT_EQ(node.accounts->ListAccounts(true).size(), 5u);
        ShutdownNode(node);
    }
    std::filesystem::remove_all(dir);
}

// ============================================================================
// Health
// ============================================================================

TEST(NodeHealthTest, ReportsStoreAndEnvironment) {
    NodeContext node;
    ASSERT_TRUE(InitializeNode(node, MemoryOptions()));

    HealthReport report = CheckHealth(node);
    EXPECT_TRUE(report.Healthy());
    EXPECT_EQ(report.backend, "memory");
    EXPECT_EQ(report.environment, DEFAULT_ENVIRONMENT);
    EXPECT_FALSE(report.valueBearing);

    ShutdownNode(node);
    report = CheckHealth(node);
    EXPECT_FALSE(report.Healthy());
    EXPECT_FALSE(report.storeError.empty());
}

} // namespace test
} // namespace tally
