#include "fullsync/reconcile/rules.hpp"

#include <gtest/gtest.h>

using namespace fullsync;
using core::ExpectedDifferenceRule;
using core::Presence;
using reconcile::DifferenceRules;

TEST(DifferenceRulesTest, NarrowestRuleWins) {
    DifferenceRules rules({
        {"*", "", Presence::Both, true, "ANY"},
        {"product", "", Presence::Both, false, "PRODUCT_ANY"},
        {"*", "updated_at", Presence::Both, true, "CLOCK_SKEW"},
        {"product", "price", Presence::Both, false, "PRICE_DRIFT"},
    });

    auto exact = rules.field_verdict("product", "price");
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(exact->specificity, 3);
    EXPECT_EQ(exact->reason, "PRICE_DRIFT");
    EXPECT_FALSE(exact->expected);

    auto any_type = rules.field_verdict("product", "updated_at");
    ASSERT_TRUE(any_type.has_value());
    EXPECT_EQ(any_type->specificity, 2);
    EXPECT_TRUE(any_type->expected);

    auto any_field = rules.field_verdict("product", "name");
    ASSERT_TRUE(any_field.has_value());
    EXPECT_EQ(any_field->specificity, 1);
    EXPECT_EQ(any_field->reason, "PRODUCT_ANY");

    auto fallback = rules.field_verdict("category", "name");
    ASSERT_TRUE(fallback.has_value());
    EXPECT_EQ(fallback->specificity, 0);
    EXPECT_EQ(fallback->reason, "ANY");
}

TEST(DifferenceRulesTest, FirstDeclaredWinsAmongEquals) {
    DifferenceRules rules({
        {"product", "name", Presence::Both, true, "FIRST"},
        {"product", "name", Presence::Both, false, "SECOND"},
    });
    auto verdict = rules.field_verdict("product", "name");
    ASSERT_TRUE(verdict.has_value());
    EXPECT_EQ(verdict->reason, "FIRST");
}

TEST(DifferenceRulesTest, NoMatchingRule) {
    DifferenceRules rules({{"category", "name", Presence::Both, true, "RENAMED"}});
    EXPECT_FALSE(rules.field_verdict("product", "name").has_value());
    EXPECT_FALSE(rules.field_verdict("category", "price").has_value());
}

TEST(DifferenceRulesTest, PresenceRulesAreSeparate) {
    DifferenceRules rules({
        {"*", "", Presence::Both, true, "ANY_FIELD"},
        {"*", "", Presence::TargetOnly, true, "LOCAL_ONLY_DATA"},
        {"session_token", "", Presence::TargetOnly, false, "STALE_TOKEN"},
    });

    EXPECT_FALSE(rules.presence_verdict("product", Presence::SourceOnly).has_value());

    auto generic = rules.presence_verdict("product", Presence::TargetOnly);
    ASSERT_TRUE(generic.has_value());
    EXPECT_EQ(generic->specificity, 0);
    EXPECT_EQ(generic->reason, "LOCAL_ONLY_DATA");

    auto specific = rules.presence_verdict("session_token", Presence::TargetOnly);
    ASSERT_TRUE(specific.has_value());
    EXPECT_EQ(specific->specificity, 1);
    EXPECT_FALSE(specific->expected);
}
