#include "fullsync/data/filter.hpp"

#include "support/fixtures.hpp"

#include <gtest/gtest.h>

using namespace fullsync;
using data::FilterOptions;
using data::Record;

TEST(ResolveScopeTest, EmptyFilterCoversSchemaInDependencyOrder) {
    const auto config = fixtures::shop_config();
    auto scope = data::resolve_scope(config, FilterOptions{});
    ASSERT_TRUE(scope.is_ok());
    EXPECT_EQ(scope.value(), (std::vector<std::string>{"business", "category", "product"}));
}

TEST(ResolveScopeTest, SelectedTypesKeepDependencyOrder) {
    const auto config = fixtures::shop_config();
    FilterOptions filter;
    filter.entity_types = {"product", "business"};

    auto scope = data::resolve_scope(config, filter);
    ASSERT_TRUE(scope.is_ok());
    EXPECT_EQ(scope.value(), (std::vector<std::string>{"business", "product"}));
}

TEST(ResolveScopeTest, UnknownTypeIsValidationError) {
    const auto config = fixtures::shop_config();
    FilterOptions filter;
    filter.entity_types = {"invoice"};

    auto scope = data::resolve_scope(config, filter);
    ASSERT_TRUE(scope.is_error());
    EXPECT_EQ(scope.error().code, ErrorCode::Validation);
    EXPECT_NE(scope.error().message.find("invoice"), std::string::npos);
}

TEST(ResolveScopeTest, ExcludedTypeIsValidationError) {
    auto config = fixtures::shop_config();
    config.entities.push_back({"audit_log", {}});
    FilterOptions filter;
    filter.entity_types = {"audit_log"};

    auto scope = data::resolve_scope(config, filter);
    ASSERT_TRUE(scope.is_error());
    EXPECT_EQ(scope.error().code, ErrorCode::Validation);
}

TEST(RecordFilterTest, FieldEqualsKeepsRecordsWithoutTheField) {
    FilterOptions options;
    options.field_equals = {{"business_id", "b-1"}};
    data::RecordFilter filter(options, "is_demo");

    EXPECT_TRUE(filter.matches(fixtures::product(1, "b-1")));
    EXPECT_FALSE(filter.matches(fixtures::product(1, "b-2")));
    EXPECT_TRUE(filter.matches(Record{"business", "b-2", {{"name", "Other"}}}));
}

TEST(RecordFilterTest, DemoDataDroppedOnRequest) {
    Record demo{"product", "p-9", {{"is_demo", "true"}}};
    Record real{"product", "p-8", {{"is_demo", "false"}}};

    FilterOptions keep_all;
    EXPECT_TRUE(data::RecordFilter(keep_all, "is_demo").matches(demo));

    FilterOptions no_demo;
    no_demo.include_demo_data = false;
    data::RecordFilter filter(no_demo, "is_demo");
    EXPECT_FALSE(filter.matches(demo));
    EXPECT_TRUE(filter.matches(real));
}
