#include "fullsync/transfer/migration.hpp"

#include "support/fixtures.hpp"

#include <gtest/gtest.h>

using namespace fullsync;
using transfer::SchemaConverter;

namespace {

std::vector<core::SchemaMigration> migrations() {
    return {
        {"1", "2", "product", {{"cost", "price"}}},
        {"2", "3", "*", {{"label", "name"}}},
        {"2", "3", "category", {{"parent", "parent_id"}}},
        {"1", "3", "order", {{"total", "amount"}}},
    };
}

} // namespace

TEST(SchemaConverterTest, SameRevisionNeedsNoSteps) {
    SchemaConverter converter(migrations());
    auto plan = converter.plan("2", "2");
    ASSERT_TRUE(plan.is_ok());
    EXPECT_TRUE(plan.value().empty());
}

TEST(SchemaConverterTest, ShortestChainWins) {
    SchemaConverter converter(migrations());
    auto plan = converter.plan("1", "3");
    ASSERT_TRUE(plan.is_ok());
    ASSERT_EQ(plan.value().size(), 1u);
    EXPECT_EQ(plan.value()[0]->entity_type, "order");
}

TEST(SchemaConverterTest, ChainsStepsInOrder) {
    std::vector<core::SchemaMigration> chain{
        {"1", "2", "product", {{"cost", "price"}}},
        {"2", "3", "*", {{"label", "name"}}},
    };
    SchemaConverter converter(chain);
    auto plan = converter.plan("1", "3");
    ASSERT_TRUE(plan.is_ok());
    ASSERT_EQ(plan.value().size(), 2u);

    data::Record record{"product", "p-1", {{"cost", "10"}, {"label", "Tea"}}};
    EXPECT_TRUE(SchemaConverter::apply(plan.value(), record));
    EXPECT_EQ(record.fields, (std::map<std::string, std::string>{{"name", "Tea"}, {"price", "10"}}));
}

TEST(SchemaConverterTest, NoPathIsValidationError) {
    SchemaConverter converter(migrations());
    auto plan = converter.plan("3", "1");
    ASSERT_TRUE(plan.is_error());
    EXPECT_EQ(plan.error().code, ErrorCode::Validation);
}

TEST(SchemaConverterTest, MigrationsOnlyTouchTheirEntityType) {
    SchemaConverter converter(migrations());
    auto plan = converter.plan("2", "3");
    ASSERT_TRUE(plan.is_ok());
    ASSERT_EQ(plan.value().size(), 2u);

    data::Record product{"product", "p-1", {{"parent", "x"}}};
    EXPECT_FALSE(SchemaConverter::apply(plan.value(), product));

    data::Record category{"category", "c-1", {{"parent", "c-0"}, {"label", "Drinks"}}};
    EXPECT_TRUE(SchemaConverter::apply(plan.value(), category));
    EXPECT_EQ(*category.field("parent_id"), "c-0");
    EXPECT_EQ(*category.field("name"), "Drinks");
}

TEST(SchemaConverterTest, ConvertRewritesStagedRecords) {
    SchemaConverter converter(migrations());
    data::InMemoryDatabase destination("remote", "2");
    auto transaction = destination.begin_restore();
    ASSERT_TRUE(transaction.is_ok());
    ASSERT_TRUE(transaction.value()->stage(data::Record{"business", "b-1", {{"label", "Shop"}}}).is_ok());
    ASSERT_TRUE(transaction.value()->stage(data::Record{"business", "b-2", {{"name", "Other"}}}).is_ok());

    auto changed = converter.convert(*transaction.value(), "2", "3");
    ASSERT_TRUE(changed.is_ok());
    EXPECT_EQ(changed.value(), 1u);

    ASSERT_TRUE(transaction.value()->commit().is_ok());
    auto stored = destination.dataset().get("business", "b-1");
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(*stored.value().field("name"), "Shop");
}
