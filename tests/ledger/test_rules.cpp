// TALLY - Allocation Rule Tests
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "ledger_fixture.h"

namespace tally {
namespace ledger {
namespace test {

class RuleBookTest : public LedgerFixture {
protected:
    void SetUp() override {
        MakeAccount("alpha");
        MakeAccount("beta");
        MakeAccount("gamma");
    }

    NewRule Rule(const std::string& name, std::vector<AllocationItem> items,
                 int32_t priority = DEFAULT_RULE_PRIORITY) {
        NewRule rule;
        rule.name = name;
        rule.items = std::move(items);
        rule.priority = priority;
        return rule;
    }
};

// ============================================================================
// Shape Checks
// ============================================================================

TEST(RuleShapeTest, AcceptsExactHundred) {
    EXPECT_EQ(CheckRuleShape({{"a", 6000}, {"b", 4000}}, std::nullopt, std::nullopt), "");
    EXPECT_EQ(CheckRuleShape({{"a", FULL_PERCENT}}, COIN, 2 * COIN), "");
}

TEST(RuleShapeTest, RejectsMalformedSplits) {
    EXPECT_NE(CheckRuleShape({}, std::nullopt, std::nullopt), "");
    EXPECT_NE(CheckRuleShape({{"a", 6000}, {"b", 3900}}, std::nullopt, std::nullopt), "");
    EXPECT_NE(CheckRuleShape({{"a", 6000}, {"b", 4100}}, std::nullopt, std::nullopt), "");
    EXPECT_NE(CheckRuleShape({{"a", 0}, {"b", FULL_PERCENT}}, std::nullopt, std::nullopt), "");
    EXPECT_NE(CheckRuleShape({{"a", 5000}, {"a", 5000}}, std::nullopt, std::nullopt), "");
    EXPECT_NE(CheckRuleShape({{"", FULL_PERCENT}}, std::nullopt, std::nullopt), "");
    EXPECT_NE(CheckRuleShape({{"a", FULL_PERCENT}}, 2 * COIN, COIN), "");
    EXPECT_NE(CheckRuleShape({{"a", FULL_PERCENT}}, Amount(-1), std::nullopt), "");
}

// ============================================================================
// Creation
// ============================================================================

TEST_F(RuleBookTest, CreateAndRead) {
    auto rule = rules_.CreateRule(Rule("split", {{"alpha", 7000}, {"beta", 3000}}, 5), "ops");
    EXPECT_EQ(rule.id, 1u);
    EXPECT_TRUE(rule.active);
    EXPECT_EQ(rule.createdBy, "ops");

    auto loaded = rules_.GetRule(rule.id);
    EXPECT_EQ(loaded.name, "split");
    EXPECT_EQ(loaded.priority, 5);
    EXPECT_EQ(loaded.items, rule.items);
    EXPECT_EQ(rules_.FindRuleByName("split")->id, rule.id);
}

TEST_F(RuleBookTest, PercentagesMustSumToHundred) {
    EXPECT_EQ(CaptureKind([&] {
        rules_.CreateRule(Rule("short", {{"alpha", 6000}, {"beta", 3900}}), "ops");
    }), ErrorKind::ValidationError);
    EXPECT_EQ(CaptureKind([&] {
        rules_.CreateRule(Rule("long", {{"alpha", 6000}, {"beta", 4100}}), "ops");
    }), ErrorKind::ValidationError);
    EXPECT_TRUE(rules_.ListRules(false).empty());
}

TEST_F(RuleBookTest, TargetsMustExist) {
    EXPECT_EQ(CaptureKind([&] {
        rules_.CreateRule(Rule("ghost", {{"alpha", 5000}, {"nowhere", 5000}}), "ops");
    }), ErrorKind::UnknownAccount);
}

TEST_F(RuleBookTest, NamesAreUnique) {
    rules_.CreateRule(Rule("split", {{"alpha", FULL_PERCENT}}), "ops");
    EXPECT_EQ(CaptureKind([&] {
        rules_.CreateRule(Rule("split", {{"beta", FULL_PERCENT}}), "ops");
    }), ErrorKind::DuplicateRule);
    EXPECT_EQ(CaptureKind([&] { rules_.CreateRule(Rule("", {{"beta", FULL_PERCENT}}), "ops"); }),
              ErrorKind::ValidationError);
}

// ============================================================================
// Update and Deactivation
// ============================================================================

TEST_F(RuleBookTest, PartialUpdate) {
    auto rule = rules_.CreateRule(Rule("split", {{"alpha", FULL_PERCENT}}), "ops");

    RuleUpdate update;
    update.priority = 1;
    update.items = std::vector<AllocationItem>{{"beta", 2500}, {"gamma", 7500}};
    update.maxAmount = std::optional<Amount>(100 * COIN);
    auto updated = rules_.UpdateRule(rule.id, update, "ops");

    EXPECT_EQ(updated.name, "split");
    EXPECT_EQ(updated.priority, 1);
    EXPECT_EQ(updated.items.size(), 2u);
    ASSERT_TRUE(updated.maxAmount.has_value());
    EXPECT_EQ(*updated.maxAmount, 100 * COIN);
    EXPECT_EQ(rules_.GetRule(rule.id).items, updated.items);

    // Clearing a bound
    RuleUpdate clear;
    clear.maxAmount = std::optional<Amount>();
    EXPECT_FALSE(rules_.UpdateRule(rule.id, clear, "ops").maxAmount.has_value());
}

TEST_F(RuleBookTest, UpdateValidatesTheResult) {
    auto rule = rules_.CreateRule(Rule("split", {{"alpha", FULL_PERCENT}}), "ops");
    rules_.CreateRule(Rule("other", {{"beta", FULL_PERCENT}}), "ops");

    RuleUpdate badSplit;
    badSplit.items = std::vector<AllocationItem>{{"alpha", 5000}};
    EXPECT_EQ(CaptureKind([&] { rules_.UpdateRule(rule.id, badSplit, "ops"); }),
              ErrorKind::ValidationError);

    RuleUpdate rename;
    rename.name = "other";
    EXPECT_EQ(CaptureKind([&] { rules_.UpdateRule(rule.id, rename, "ops"); }),
              ErrorKind::DuplicateRule);

    EXPECT_EQ(CaptureKind([&] { rules_.UpdateRule(99, RuleUpdate(), "ops"); }),
              ErrorKind::NotFound);
    EXPECT_EQ(rules_.GetRule(rule.id).items.size(), 1u);
}

TEST_F(RuleBookTest, RenameFreesOldName) {
    auto rule = rules_.CreateRule(Rule("split", {{"alpha", FULL_PERCENT}}), "ops");
    RuleUpdate rename;
    rename.name = "renamed";
    rules_.UpdateRule(rule.id, rename, "ops");

    EXPECT_FALSE(rules_.FindRuleByName("split").has_value());
    EXPECT_EQ(rules_.FindRuleByName("renamed")->id, rule.id);
    EXPECT_NO_THROW(rules_.CreateRule(Rule("split", {{"beta", FULL_PERCENT}}), "ops"));
}

TEST_F(RuleBookTest, DeactivateIsSoftDelete) {
    auto rule = rules_.CreateRule(Rule("split", {{"alpha", FULL_PERCENT}}), "ops");
    auto deactivated = rules_.DeactivateRule(rule.id, "ops");
    EXPECT_FALSE(deactivated.active);
    EXPECT_TRUE(rules_.ListRules(true).empty());
    EXPECT_EQ(rules_.ListRules(false).size(), 1u);
    EXPECT_FALSE(rules_.SelectRule(COIN).has_value());

    AuditFilter filter;
    filter.entityType = EntityType::RULE;
    auto entries = audit_.Query(filter);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].action, AuditAction::DELETE);
    EXPECT_EQ(entries[1].action, AuditAction::CREATE);

    EXPECT_EQ(CaptureKind([&] { rules_.DeactivateRule(42, "ops"); }), ErrorKind::NotFound);
}

// ============================================================================
// Selection
// ============================================================================

TEST_F(RuleBookTest, LowestPriorityValueWins) {
    rules_.CreateRule(Rule("fallback", {{"alpha", FULL_PERCENT}}, 100), "ops");
    auto preferred = rules_.CreateRule(Rule("preferred", {{"beta", FULL_PERCENT}}, 10), "ops");
    rules_.CreateRule(Rule("tied", {{"gamma", FULL_PERCENT}}, 10), "ops");

    auto selected = rules_.SelectRule(COIN);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected->id, preferred.id);

    auto ordered = rules_.ListRules(true);
    ASSERT_EQ(ordered.size(), 3u);
    EXPECT_EQ(ordered[0].name, "preferred");
    EXPECT_EQ(ordered[1].name, "tied");
    EXPECT_EQ(ordered[2].name, "fallback");
}

TEST_F(RuleBookTest, BoundsRestrictSelection) {
    NewRule large = Rule("large", {{"alpha", FULL_PERCENT}}, 1);
    large.minAmount = 1000 * COIN;
    rules_.CreateRule(large, "ops");

    NewRule small = Rule("small", {{"beta", FULL_PERCENT}}, 2);
    small.maxAmount = 100 * COIN;
    rules_.CreateRule(small, "ops");

    EXPECT_EQ(rules_.SelectRule(5000 * COIN)->name, "large");
    EXPECT_EQ(rules_.SelectRule(1000 * COIN)->name, "large");
    EXPECT_EQ(rules_.SelectRule(100 * COIN)->name, "small");
    EXPECT_FALSE(rules_.SelectRule(500 * COIN).has_value());
}

} // namespace test
} // namespace ledger
} // namespace tally
