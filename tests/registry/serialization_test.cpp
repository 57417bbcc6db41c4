#include "fullsync/registry/serialization.hpp"

#include <gtest/gtest.h>

using namespace fullsync;
using registry::json;

TEST(SessionJsonTest, UsesCamelCaseAndNulls) {
    session::SyncSessionInfo info;
    info.id = "session-1";
    info.phase = session::Phase::Transfer;
    info.source_name = "local";
    info.destination_name = "remote";
    info.started_at = registry::from_epoch_ms(1700000000123);

    const auto document = registry::session_to_json(info);
    EXPECT_EQ(document.at("phase"), "transfer");
    EXPECT_EQ(document.at("direction"), "push");
    EXPECT_EQ(document.at("method"), "bulk");
    EXPECT_EQ(document.at("sourceName"), "local");
    EXPECT_EQ(document.at("startedAt"), 1700000000123);
    EXPECT_TRUE(document.at("completedAt").is_null());
    EXPECT_TRUE(document.at("errorCode").is_null());
    EXPECT_TRUE(document.at("reconciliationReportId").is_null());
}

TEST(SessionJsonTest, ReadsBackFailure) {
    session::SyncSessionInfo info;
    info.id = "session-2";
    info.method = Method::Incremental;
    info.phase = session::Phase::Failed;
    info.completed_at = registry::from_epoch_ms(5000);
    info.error_code = ErrorCode::PhaseTimeout;
    info.error_message = "PhaseTimeoutError: phase transfer exceeded its budget of 0ms";

    auto parsed = registry::session_from_json(registry::session_to_json(info));
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().phase, session::Phase::Failed);
    EXPECT_EQ(parsed.value().error_code, ErrorCode::PhaseTimeout);
    EXPECT_EQ(parsed.value().error_message, info.error_message);
    ASSERT_TRUE(parsed.value().completed_at.has_value());
    EXPECT_EQ(registry::to_epoch_ms(*parsed.value().completed_at), 5000);
    EXPECT_TRUE(parsed.value().reconciliation_report_id.empty());
}

TEST(SessionJsonTest, RejectsUnknownPhase) {
    auto document = registry::session_to_json(session::SyncSessionInfo{});
    document["phase"] = "paused";
    auto parsed = registry::session_from_json(document);
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::Io);

    auto missing = registry::session_from_json(json{{"phase", "pending"}});
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::Io);
}

TEST(ReportJsonTest, FindingsAreOptional) {
    reconcile::ReconciliationReport report;
    report.id = "report-1";
    report.direction = Direction::Pull;
    report.findings.push_back({"product", "p-1", reconcile::Classification::ExpectedDifference,
                               "{}", "{}", "CLOCK_SKEW"});

    const auto summary = registry::report_to_json(report, false);
    EXPECT_FALSE(summary.contains("perEntityFindings"));
    EXPECT_EQ(summary.at("overallStatus"), "clean");
    EXPECT_EQ(summary.at("direction"), "pull");

    const auto full = registry::report_to_json(report);
    ASSERT_EQ(full.at("perEntityFindings").size(), 1u);
    EXPECT_EQ(full.at("perEntityFindings")[0].at("classification"), "expected_difference");

    auto parsed = registry::report_from_json(full);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().direction, Direction::Pull);
    ASSERT_EQ(parsed.value().findings.size(), 1u);
    EXPECT_EQ(parsed.value().findings[0].classification, reconcile::Classification::ExpectedDifference);
}

TEST(ReportJsonTest, RejectsUnknownClassification) {
    reconcile::ReconciliationReport report;
    report.id = "report-2";
    report.findings.push_back({"product", "p-1", reconcile::Classification::ExactMatch, "", "", "EXACT"});
    auto document = registry::report_to_json(report);
    document["perEntityFindings"][0]["classification"] = "maybe";

    auto parsed = registry::report_from_json(document);
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::Io);
}

TEST(LeaseJsonTest, KeepsExpiryToTheMillisecond) {
    registry::Lease lease{"local<->remote", "owner/session-1", registry::from_epoch_ms(1700000000999)};
    auto parsed = registry::lease_from_json(registry::lease_to_json(lease));
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().key, lease.key);
    EXPECT_EQ(parsed.value().owner_token, lease.owner_token);
    EXPECT_EQ(parsed.value().expires_at, lease.expires_at);

    EXPECT_TRUE(registry::lease_from_json(json{{"key", "k"}}).is_error());
}
