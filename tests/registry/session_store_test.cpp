#include "fullsync/registry/serialization.hpp"
#include "fullsync/registry/session_store.hpp"

#include "support/fixtures.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>

using namespace fullsync;
using registry::from_epoch_ms;
using session::Phase;
using std::chrono::milliseconds;

namespace {

session::SyncSessionInfo make_info(const std::string& id, Phase phase, std::int64_t started_ms) {
    session::SyncSessionInfo info;
    info.id = id;
    info.direction = Direction::Pull;
    info.method = Method::Incremental;
    info.phase = phase;
    info.source_name = "remote";
    info.destination_name = "local";
    info.filter.entity_types = {"product"};
    info.filter.field_equals = {{"business_id", "b-1"}};
    info.started_at = from_epoch_ms(started_ms);
    info.updated_at = from_epoch_ms(started_ms + 50);
    info.last_confirmed_sequence = 120;
    info.owner_token = "owner-1/" + id;
    return info;
}

reconcile::ReconciliationReport make_report(const std::string& id) {
    reconcile::ReconciliationReport report;
    report.id = id;
    report.session_id = "session-1";
    report.created_at = from_epoch_ms(1700000000000);
    report.exact_matches = 9;
    report.unexpected_mismatches = 1;
    report.overall_status = reconcile::OverallStatus::Degraded;
    report.entity_summaries.push_back({"product", 10, 9, 0, 1});
    report.findings.push_back({"product", "p-4", reconcile::Classification::UnexpectedMismatch,
                               R"({"price":"1"})", R"({"price":"2"})", "FIELD_MISMATCH:price"});
    return report;
}

} // namespace

template<typename Store>
class SessionStoreTest : public ::testing::Test {
protected:
    SessionStoreTest() {
        if constexpr (std::is_same_v<Store, registry::JsonFileSessionStore>) {
            store = std::make_unique<Store>(dir.path());
        } else {
            store = std::make_unique<Store>();
        }
    }

    fixtures::TempDir dir{"fullsync-registry"};
    std::unique_ptr<registry::SessionStore> store;
};

using StoreTypes = ::testing::Types<registry::InMemorySessionStore, registry::JsonFileSessionStore>;
TYPED_TEST_SUITE(SessionStoreTest, StoreTypes);

TYPED_TEST(SessionStoreTest, SavesAndLoadsSessions) {
    auto info = make_info("session-a", Phase::Transfer, 1700000000000);
    info.error_code = ErrorCode::Apply;
    info.error_message = "ApplyError: rejected";
    ASSERT_TRUE(this->store->save(info).is_ok());

    auto loaded = this->store->load("session-a");
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().describe();
    EXPECT_EQ(loaded.value().phase, Phase::Transfer);
    EXPECT_EQ(loaded.value().direction, Direction::Pull);
    EXPECT_EQ(loaded.value().last_confirmed_sequence, 120u);
    EXPECT_EQ(loaded.value().filter.field_equals.at("business_id"), "b-1");
    EXPECT_EQ(loaded.value().started_at, info.started_at);
    EXPECT_EQ(loaded.value().error_code, ErrorCode::Apply);
    EXPECT_EQ(loaded.value().owner_token, "owner-1/session-a");

    info.phase = Phase::Restore;
    ASSERT_TRUE(this->store->save(info).is_ok());
    EXPECT_EQ(this->store->load("session-a").value().phase, Phase::Restore);
}

TYPED_TEST(SessionStoreTest, UnknownSessionIsNotFound) {
    auto loaded = this->store->load("session-none");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ErrorCode::NotFound);
}

TYPED_TEST(SessionStoreTest, ListsActiveSessionsOldestFirst) {
    ASSERT_TRUE(this->store->save(make_info("session-c", Phase::Backup, 3000)).is_ok());
    ASSERT_TRUE(this->store->save(make_info("session-a", Phase::Transfer, 1000)).is_ok());
    ASSERT_TRUE(this->store->save(make_info("session-b", Phase::Completed, 2000)).is_ok());
    ASSERT_TRUE(this->store->save(make_info("session-d", Phase::Cancelled, 500)).is_ok());

    auto active = this->store->list_active();
    ASSERT_TRUE(active.is_ok());
    ASSERT_EQ(active.value().size(), 2u);
    EXPECT_EQ(active.value()[0].id, "session-a");
    EXPECT_EQ(active.value()[1].id, "session-c");
}

TYPED_TEST(SessionStoreTest, ReportsAreWrittenOnce) {
    ASSERT_TRUE(this->store->save_report(make_report("report-1")).is_ok());

    auto duplicate = this->store->save_report(make_report("report-1"));
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error().code, ErrorCode::Conflict);

    auto loaded = this->store->load_report("report-1");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().overall_status, reconcile::OverallStatus::Degraded);
    ASSERT_EQ(loaded.value().findings.size(), 1u);
    EXPECT_EQ(loaded.value().findings[0].reason_code, "FIELD_MISMATCH:price");
    ASSERT_EQ(loaded.value().entity_summaries.size(), 1u);
    EXPECT_EQ(loaded.value().entity_summaries[0].unexpected, 1u);

    auto missing = this->store->load_report("report-2");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TYPED_TEST(SessionStoreTest, LeaseExcludesOtherOwners) {
    const auto key = registry::pair_key("local", "remote");
    ASSERT_TRUE(this->store->acquire_lease(key, "owner-a", milliseconds(60000)).is_ok());
    EXPECT_TRUE(this->store->acquire_lease(key, "owner-a", milliseconds(60000)).is_ok());

    auto taken = this->store->acquire_lease(key, "owner-b", milliseconds(60000));
    ASSERT_TRUE(taken.is_error());
    EXPECT_EQ(taken.error().code, ErrorCode::Conflict);
    EXPECT_NE(taken.error().message.find(key), std::string::npos);

    auto renewed = this->store->renew_lease(key, "owner-a", milliseconds(60000));
    ASSERT_TRUE(renewed.is_ok());
    EXPECT_EQ(renewed.value().owner_token, "owner-a");

    auto stolen = this->store->renew_lease(key, "owner-b", milliseconds(60000));
    ASSERT_TRUE(stolen.is_error());
    EXPECT_EQ(stolen.error().code, ErrorCode::LeaseLost);
}

TYPED_TEST(SessionStoreTest, ReleaseOnlyByOwner) {
    const auto key = registry::pair_key("local", "remote");
    ASSERT_TRUE(this->store->acquire_lease(key, "owner-a", milliseconds(60000)).is_ok());

    EXPECT_TRUE(this->store->release_lease(key, "owner-b").is_ok());
    EXPECT_TRUE(this->store->acquire_lease(key, "owner-b", milliseconds(60000)).is_error());

    EXPECT_TRUE(this->store->release_lease(key, "owner-a").is_ok());
    EXPECT_TRUE(this->store->acquire_lease(key, "owner-b", milliseconds(60000)).is_ok());

    auto renew_missing = this->store->renew_lease(registry::pair_key("x", "y"), "owner-a", milliseconds(1000));
    ASSERT_TRUE(renew_missing.is_error());
    EXPECT_EQ(renew_missing.error().code, ErrorCode::LeaseLost);
}

TYPED_TEST(SessionStoreTest, ExpiredLeaseCanBeTaken) {
    const auto key = registry::pair_key("local", "remote");
    ASSERT_TRUE(this->store->acquire_lease(key, "owner-a", milliseconds(0)).is_ok());
    ASSERT_TRUE(this->store->acquire_lease(key, "owner-b", milliseconds(60000)).is_ok());

    auto renewed = this->store->renew_lease(key, "owner-a", milliseconds(60000));
    ASSERT_TRUE(renewed.is_error());
    EXPECT_EQ(renewed.error().code, ErrorCode::LeaseLost);
}

TYPED_TEST(SessionStoreTest, SaveIsFencedByLease) {
    const auto key = registry::pair_key("local", "remote");
    auto stale = make_info("session-a", Phase::Transfer, 1000);
    stale.owner_token = "owner-a";

    // An expired lease still fences for its holder until someone takes it.
    ASSERT_TRUE(this->store->acquire_lease(key, "owner-a", milliseconds(0)).is_ok());
    ASSERT_TRUE(this->store->save(stale).is_ok());

    ASSERT_TRUE(this->store->acquire_lease(key, "owner-b", milliseconds(60000)).is_ok());
    auto refused = this->store->save(stale);
    ASSERT_TRUE(refused.is_error());
    EXPECT_EQ(refused.error().code, ErrorCode::LeaseLost);

    auto successor = stale;
    successor.owner_token = "owner-b";
    successor.phase = Phase::Restore;
    ASSERT_TRUE(this->store->save(successor).is_ok());

    // Once released, the record itself names its owner.
    ASSERT_TRUE(this->store->release_lease(key, "owner-b").is_ok());
    auto late = this->store->save(stale);
    ASSERT_TRUE(late.is_error());
    EXPECT_EQ(late.error().code, ErrorCode::LeaseLost);

    auto loaded = this->store->load("session-a");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().phase, Phase::Restore);
    EXPECT_EQ(loaded.value().owner_token, "owner-b");

    auto unowned = make_info("session-b", Phase::Pending, 2000);
    unowned.owner_token.clear();
    EXPECT_TRUE(this->store->save(unowned).is_ok());
}

TEST(PairKeyTest, SameForBothDirections) {
    EXPECT_EQ(registry::pair_key("local", "remote"), registry::pair_key("remote", "local"));
    EXPECT_NE(registry::pair_key("local", "remote"), registry::pair_key("local", "backup"));
}

TEST(LeaseAvailableTest, Rules) {
    const auto now = from_epoch_ms(10000);
    EXPECT_TRUE(registry::lease_available(std::nullopt, "a", now));
    EXPECT_TRUE(registry::lease_available(registry::Lease{"k", "a", from_epoch_ms(20000)}, "a", now));
    EXPECT_FALSE(registry::lease_available(registry::Lease{"k", "b", from_epoch_ms(20000)}, "a", now));
    EXPECT_TRUE(registry::lease_available(registry::Lease{"k", "b", now}, "a", now));
}

TEST(JsonFileSessionStoreTest, SurvivesReopen) {
    fixtures::TempDir dir("fullsync-registry");
    {
        registry::JsonFileSessionStore store(dir.path());
        ASSERT_TRUE(store.save(make_info("session-a", Phase::Transfer, 1000)).is_ok());
        ASSERT_TRUE(store.save_report(make_report("report-1")).is_ok());
        ASSERT_TRUE(store.acquire_lease(registry::pair_key("local", "remote"), "owner-a", milliseconds(60000)).is_ok());
    }

    registry::JsonFileSessionStore reopened(dir.path());
    EXPECT_EQ(reopened.load("session-a").value().last_confirmed_sequence, 120u);
    EXPECT_TRUE(reopened.load_report("report-1").is_ok());
    EXPECT_TRUE(reopened.acquire_lease(registry::pair_key("local", "remote"), "owner-b", milliseconds(60000)).is_error());

    EXPECT_TRUE(std::filesystem::exists(dir.path() / "sessions" / "session-a.json"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "reports" / "report-1.json"));
    std::size_t leases = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path() / "leases")) {
        EXPECT_EQ(entry.path().extension().string(), ".json");
        ++leases;
    }
    EXPECT_EQ(leases, 1u);
}

TEST(JsonFileSessionStoreTest, StoresSharingRootGrantLeaseOnce) {
    fixtures::TempDir dir("fullsync-registry");
    registry::JsonFileSessionStore first(dir.path());
    registry::JsonFileSessionStore second(dir.path());

    for (int round = 0; round < 50; ++round) {
        const auto key = registry::pair_key("local", "remote-" + std::to_string(round));
        std::atomic<bool> go{false};
        std::atomic<int> granted{0};
        auto contend = [&](registry::JsonFileSessionStore& store, const std::string& owner) {
            while (!go.load()) {
                std::this_thread::yield();
            }
            if (store.acquire_lease(key, owner, milliseconds(60000)).is_ok()) {
                ++granted;
            }
        };

        std::thread a([&]() { contend(first, "owner-a"); });
        std::thread b([&]() { contend(second, "owner-b"); });
        go = true;
        a.join();
        b.join();
        EXPECT_EQ(granted.load(), 1) << "round " << round;
    }
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "registry.lock"));
}

TEST(JsonFileSessionStoreTest, CorruptDocumentIsIoError) {
    fixtures::TempDir dir("fullsync-registry");
    registry::JsonFileSessionStore store(dir.path());
    std::filesystem::create_directories(dir.path() / "sessions");
    std::ofstream(dir.path() / "sessions" / "session-x.json") << "{ not json";

    auto loaded = store.load("session-x");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ErrorCode::Io);

    auto active = store.list_active();
    ASSERT_TRUE(active.is_error());
    EXPECT_EQ(active.error().code, ErrorCode::Io);
}

TEST(JsonFileSessionStoreTest, EmptyRootHasNoSessions) {
    fixtures::TempDir dir("fullsync-registry");
    registry::JsonFileSessionStore store(dir.path() / "not-created-yet");
    auto active = store.list_active();
    ASSERT_TRUE(active.is_ok());
    EXPECT_TRUE(active.value().empty());
}
