#include "fullsync/core/config.hpp"

#include "support/fixtures.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>

using namespace fullsync;
using nlohmann::json;

namespace {

json shop_document() {
    return json::parse(R"({
        "schema_revision": "3",
        "entities": [
            "business",
            {"name": "category", "references": {"business_id": "business"}},
            {"name": "product", "references": {"category_id": "category"}},
            "audit_log"
        ],
        "excluded_entity_types": ["audit_log"],
        "expected_differences": [
            {"entity_type": "*", "field": "updated_at", "reason": "timestamp"},
            {"entity_type": "order", "presence": "target_only", "classification": "expected"}
        ],
        "schema_migrations": [
            {"from": "2", "to": "3", "entity_type": "product", "rename_fields": {"cost": "price"}}
        ],
        "transfer": {"chunk_size": 1024, "batch_size": 50, "compression": false},
        "session": {
            "phase_timeouts_ms": {"transfer": 5000},
            "lease_ttl_ms": 20000,
            "heartbeat_interval_ms": 5000,
            "supported": [{"direction": "push", "method": "bulk"}]
        },
        "reconciliation": {"failure_ratio": 0.1}
    })");
}

} // namespace

TEST(SyncConfigTest, ParsesFullDocument) {
    auto parsed = core::parse_config(shop_document());
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().describe();
    const auto& config = parsed.value();

    EXPECT_EQ(config.schema_revision, "3");
    ASSERT_EQ(config.entities.size(), 4u);
    EXPECT_EQ(config.entities[1].references.at("business_id"), "business");
    EXPECT_TRUE(config.is_excluded("audit_log"));
    EXPECT_EQ(config.dependency_order(), (std::vector<std::string>{"business", "category", "product"}));

    ASSERT_EQ(config.expected_differences.size(), 2u);
    EXPECT_EQ(config.expected_differences[0].presence, core::Presence::Both);
    EXPECT_EQ(config.expected_differences[1].presence, core::Presence::TargetOnly);

    ASSERT_EQ(config.schema_migrations.size(), 1u);
    EXPECT_EQ(config.schema_migrations[0].rename_fields.at("cost"), "price");

    EXPECT_EQ(config.transfer.chunk_size, 1024u);
    EXPECT_EQ(config.transfer.batch_size, 50u);
    EXPECT_FALSE(config.transfer.compression);
    EXPECT_DOUBLE_EQ(config.reconciliation.failure_ratio, 0.1);
}

TEST(SyncConfigTest, PhaseTimeoutFallsBackToDefault) {
    auto parsed = core::parse_config(shop_document());
    ASSERT_TRUE(parsed.is_ok());
    const auto& config = parsed.value();

    EXPECT_EQ(config.phase_timeout("transfer"), std::chrono::milliseconds(5000));
    EXPECT_EQ(config.phase_timeout("verify"), config.session.default_phase_timeout);
}

TEST(SyncConfigTest, SupportedPairsAreRestrictable) {
    auto parsed = core::parse_config(shop_document());
    ASSERT_TRUE(parsed.is_ok());

    EXPECT_TRUE(parsed.value().supports(Direction::Push, Method::Bulk));
    EXPECT_FALSE(parsed.value().supports(Direction::Pull, Method::Incremental));
}

TEST(SyncConfigTest, DefaultsSupportEveryPair) {
    core::SyncConfig config;
    for (auto direction : {Direction::Push, Direction::Pull}) {
        for (auto method : {Method::Bulk, Method::Incremental}) {
            EXPECT_TRUE(config.supports(direction, method));
        }
    }
}

TEST(SyncConfigTest, RejectsForwardReference) {
    auto document = json::parse(R"({
        "entities": [
            {"name": "product", "references": {"category_id": "category"}},
            "category"
        ]
    })");
    auto parsed = core::parse_config(document);
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::Config);
}

TEST(SyncConfigTest, RejectsDuplicateEntity) {
    auto parsed = core::parse_config(json::parse(R"({"entities": ["business", "business"]})"));
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::Config);
}

TEST(SyncConfigTest, RejectsHeartbeatNotShorterThanTtl) {
    auto parsed = core::parse_config(json::parse(R"({
        "session": {"lease_ttl_ms": 1000, "heartbeat_interval_ms": 1000}
    })"));
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::Config);
}

TEST(SyncConfigTest, RejectsUnknownPresence) {
    auto parsed = core::parse_config(json::parse(R"({
        "expected_differences": [{"presence": "sometimes"}]
    })"));
    ASSERT_TRUE(parsed.is_error());
    EXPECT_NE(parsed.error().message.find("sometimes"), std::string::npos);
}

TEST(SyncConfigTest, MalformedValueIsConfigError) {
    auto parsed = core::parse_config(json::parse(R"({"transfer": {"batch_size": "many"}})"));
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::Config);
}

TEST(SyncConfigTest, LoadsFromFile) {
    fixtures::TempDir dir("fullsync-config");
    const auto path = dir.path() / "fullsync.json";
    {
        std::ofstream out(path);
        out << shop_document().dump();
    }

    auto loaded = core::load_config(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().describe();
    EXPECT_EQ(loaded.value().schema_revision, "3");

    auto missing = core::load_config(dir.path() / "absent.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::Config);
}

TEST(SyncConfigTest, ValidateConfigAcceptsTestSchema) {
    EXPECT_TRUE(core::validate_config(fixtures::shop_config()).is_ok());
}
