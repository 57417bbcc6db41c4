#include "fullsync/codec/snapshot_codec.hpp"
#include "fullsync/events/events.hpp"
#include "fullsync/session/driver.hpp"
#include "fullsync/session/manager.hpp"

#include "support/fixtures.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace fullsync;
using session::CancelResult;
using session::Phase;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

/// Collects session events; handlers run on sync workers.
class EventLog {
public:
    explicit EventLog(events::EventBus& bus) {
        bus.subscribe<events::SyncStartedEvent>([this](const events::SyncStartedEvent& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            started_.push_back(e);
        });
        bus.subscribe<events::SyncPhaseChangedEvent>([this](const events::SyncPhaseChangedEvent& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            phases_.push_back(e);
        });
        bus.subscribe<events::SyncCompletedEvent>([this](const events::SyncCompletedEvent& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            completed_.push_back(e);
        });
        bus.subscribe<events::SyncFailedEvent>([this](const events::SyncFailedEvent& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            failed_.push_back(e);
        });
        bus.subscribe<events::SyncCancelledEvent>([this](const events::SyncCancelledEvent& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.push_back(e);
        });
        bus.subscribe<events::LeaseLostEvent>([this](const events::LeaseLostEvent& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            lease_lost_.push_back(e);
        });
        bus.subscribe<events::BatchRetryEvent>([this](const events::BatchRetryEvent& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            retries_.push_back(e);
        });
    }

    std::vector<events::SyncStartedEvent> started() const { return copy(started_); }
    std::vector<events::SyncPhaseChangedEvent> phases() const { return copy(phases_); }
    std::vector<events::SyncCompletedEvent> completed() const { return copy(completed_); }
    std::vector<events::SyncFailedEvent> failed() const { return copy(failed_); }
    std::vector<events::SyncCancelledEvent> cancelled() const { return copy(cancelled_); }
    std::vector<events::LeaseLostEvent> lease_lost() const { return copy(lease_lost_); }
    std::vector<events::BatchRetryEvent> retries() const { return copy(retries_); }

private:
    template<typename T>
    std::vector<T> copy(const std::vector<T>& events) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events;
    }

    mutable std::mutex mutex_;
    std::vector<events::SyncStartedEvent> started_;
    std::vector<events::SyncPhaseChangedEvent> phases_;
    std::vector<events::SyncCompletedEvent> completed_;
    std::vector<events::SyncFailedEvent> failed_;
    std::vector<events::SyncCancelledEvent> cancelled_;
    std::vector<events::LeaseLostEvent> lease_lost_;
    std::vector<events::BatchRetryEvent> retries_;
};

/// Flips one byte of a file in place.
void flip_byte(const std::filesystem::path& path, std::uintmax_t offset) {
    std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
    ASSERT_TRUE(file.is_open());
    file.seekg(static_cast<std::streamoff>(offset));
    char byte = 0;
    file.read(&byte, 1);
    byte = static_cast<char>(byte ^ 0x5A);
    file.seekp(static_cast<std::streamoff>(offset));
    file.write(&byte, 1);
}

} // namespace

class SyncManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        local.release.open();
        remote.release.open();
        if (manager_) {
            manager_->shutdown();
        }
    }

    /// Built on first use so a test can adjust the config beforehand.
    session::SyncManager& manager() {
        if (!manager_) {
            manager_ = std::make_unique<session::SyncManager>(config, local, remote, store, bus, "test-owner");
        }
        return *manager_;
    }

    session::SyncSessionInfo run_to_end(Direction direction, Method method, data::FilterOptions filter = {}) {
        auto id = manager().start_sync(direction, method, std::move(filter));
        EXPECT_TRUE(id.is_ok()) << id.error().describe();
        auto info = manager().wait(id.value(), seconds(30));
        EXPECT_TRUE(info.is_ok());
        return info.value();
    }

    core::SyncConfig config = fixtures::shop_config();
    fixtures::GatedDatabase local{"local"};
    fixtures::GatedDatabase remote{"remote"};
    registry::InMemorySessionStore store;
    events::EventBus bus;
    EventLog log{bus};
    std::unique_ptr<session::SyncManager> manager_;
};

TEST_F(SyncManagerTest, BulkPushReplicatesAndReconciles) {
    fixtures::seed_shop(local.dataset(), 100);

    const auto info = run_to_end(Direction::Push, Method::Bulk);
    ASSERT_EQ(info.phase, Phase::Completed) << info.error_message;
    EXPECT_EQ(info.source_name, "local");
    EXPECT_EQ(info.destination_name, "remote");
    EXPECT_EQ(info.entities_transferred, 102u);
    EXPECT_EQ(info.entities_total, 102u);
    EXPECT_GT(info.bytes_total, 0u);
    EXPECT_EQ(info.bytes_transferred, info.bytes_total);
    EXPECT_TRUE(info.completed_at.has_value());
    EXPECT_EQ(remote.dataset().snapshot(), local.dataset().snapshot());

    auto report = manager().report(info.reconciliation_report_id);
    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(report.value().session_id, info.id);
    EXPECT_EQ(report.value().exact_matches, 102u);
    EXPECT_EQ(report.value().unexpected_mismatches, 0u);
    EXPECT_EQ(report.value().overall_status, reconcile::OverallStatus::Clean);
    ASSERT_EQ(report.value().entity_summaries.size(), 3u);
    EXPECT_EQ(report.value().entity_summaries[2].entity_type, "product");
    EXPECT_EQ(report.value().entity_summaries[2].exact, 100u);

    auto persisted = store.load(info.id);
    ASSERT_TRUE(persisted.is_ok());
    EXPECT_EQ(persisted.value().phase, Phase::Completed);
    EXPECT_FALSE(std::filesystem::exists(session::spool_path(config, info.id)));

    std::vector<Phase> walked;
    for (const auto& change : log.phases()) {
        walked.push_back(change.to);
    }
    EXPECT_EQ(walked, (std::vector<Phase>{Phase::Backup, Phase::Transfer, Phase::Convert,
                                          Phase::Restore, Phase::Verify, Phase::Completed}));
    ASSERT_EQ(log.completed().size(), 1u);
    EXPECT_EQ(log.completed()[0].report_id, info.reconciliation_report_id);

    // The lease went back to the registry.
    EXPECT_TRUE(store.acquire_lease(manager().lease_key(), "someone-else", milliseconds(1000)).is_ok());
}

TEST_F(SyncManagerTest, IncrementalPushConfirmsEverySequence) {
    fixtures::seed_shop(local.dataset(), 25);

    const auto info = run_to_end(Direction::Push, Method::Incremental);
    ASSERT_EQ(info.phase, Phase::Completed) << info.error_message;
    EXPECT_EQ(info.last_confirmed_sequence, 27u);
    EXPECT_EQ(info.entities_transferred, 27u);
    EXPECT_EQ(remote.dataset().snapshot(), local.dataset().snapshot());

    std::vector<Phase> walked;
    for (const auto& change : log.phases()) {
        walked.push_back(change.to);
    }
    EXPECT_EQ(walked, (std::vector<Phase>{Phase::Transfer, Phase::Restore, Phase::Verify, Phase::Completed}));
}

TEST_F(SyncManagerTest, EveryDirectionAndMethodCompletes) {
    fixtures::seed_shop(local.dataset(), 12);

    for (auto direction : {Direction::Push, Direction::Pull}) {
        for (auto method : {Method::Bulk, Method::Incremental}) {
            const auto info = run_to_end(direction, method);
            EXPECT_EQ(info.phase, Phase::Completed)
                << to_string(direction) << "/" << to_string(method) << ": " << info.error_message;
            auto report = manager().report(info.reconciliation_report_id);
            ASSERT_TRUE(report.is_ok());
            EXPECT_EQ(report.value().direction, direction);
            EXPECT_EQ(report.value().overall_status, reconcile::OverallStatus::Clean);
        }
    }
    EXPECT_EQ(log.completed().size(), 4u);
}

TEST_F(SyncManagerTest, PullCopiesRemoteIntoLocal) {
    fixtures::seed_shop(remote.dataset(), 8, "b-7");

    const auto info = run_to_end(Direction::Pull, Method::Bulk);
    ASSERT_EQ(info.phase, Phase::Completed);
    EXPECT_EQ(info.source_name, "remote");
    EXPECT_EQ(info.destination_name, "local");
    EXPECT_EQ(local.dataset().count("product"), 8u);
    EXPECT_TRUE(local.dataset().contains("business", "b-7"));
}

TEST_F(SyncManagerTest, FilterLimitsWhatMoves) {
    fixtures::seed_shop(local.dataset(), 6, "b-1");
    local.dataset().upsert(data::Record{"business", "b-2", {{"name", "Other"}}});
    local.dataset().upsert(fixtures::product(40, "b-2"));

    data::FilterOptions filter;
    filter.entity_types = {"business", "product"};
    filter.field_equals = {{"business_id", "b-1"}};
    config.transfer.batch_size = 100;
    // Products reference a category that this filter leaves behind.
    remote.dataset().upsert(data::Record{"category", "c-1", {{"business_id", "b-1"}}});

    const auto info = run_to_end(Direction::Push, Method::Incremental, filter);
    ASSERT_EQ(info.phase, Phase::Completed) << info.error_message;
    EXPECT_EQ(remote.dataset().count("product"), 6u);
    EXPECT_FALSE(remote.dataset().contains("product", "p-1040"));
    EXPECT_EQ(info.filter.entity_types, filter.entity_types);
}

TEST_F(SyncManagerTest, CorruptedSnapshotFailsInTransfer) {
    fixtures::seed_shop(local.dataset(), 50);
    remote.hold_restore = true;

    auto id = manager().start_sync(Direction::Push, Method::Bulk);
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(remote.reached.wait_for(seconds(10)));

    const auto spool = session::spool_path(config, id.value());
    ASSERT_TRUE(std::filesystem::exists(spool));
    flip_byte(spool, std::filesystem::file_size(spool) - codec::kTrailerSize);
    remote.release.open();

    auto info = manager().wait(id.value(), seconds(30));
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().phase, Phase::Failed);
    EXPECT_EQ(info.value().error_code, ErrorCode::Integrity);
    EXPECT_NE(info.value().error_message.find("checksum mismatch"), std::string::npos);
    EXPECT_EQ(remote.dataset().size(), 0u);
    EXPECT_FALSE(std::filesystem::exists(spool));

    const auto failed = log.failed();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].phase, Phase::Transfer);
    EXPECT_EQ(failed[0].code, ErrorCode::Integrity);
    EXPECT_TRUE(log.completed().empty());
}

TEST_F(SyncManagerTest, CancelDuringTransferIsAccepted) {
    fixtures::seed_shop(local.dataset(), 20);
    remote.hold_restore = true;

    auto id = manager().start_sync(Direction::Push, Method::Bulk);
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(remote.reached.wait_for(seconds(10)));

    auto cancelled = manager().cancel(id.value());
    ASSERT_TRUE(cancelled.is_ok());
    EXPECT_EQ(cancelled.value(), CancelResult::Accepted);
    remote.release.open();

    auto info = manager().wait(id.value(), seconds(30));
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().phase, Phase::Cancelled);
    EXPECT_FALSE(info.value().error_code.has_value());
    EXPECT_EQ(remote.dataset().size(), 0u);
    ASSERT_EQ(log.cancelled().size(), 1u);
    EXPECT_EQ(log.cancelled()[0].phase, Phase::Transfer);

    auto again = manager().cancel(id.value());
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value(), CancelResult::AlreadyTerminal);
}

TEST_F(SyncManagerTest, CancelDuringRestoreIsTooLate) {
    fixtures::seed_shop(local.dataset(), 20);
    remote.hold_commit = true;

    auto id = manager().start_sync(Direction::Push, Method::Bulk);
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(remote.reached.wait_for(seconds(10)));

    auto status = manager().status(id.value());
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().phase, Phase::Restore);

    auto cancelled = manager().cancel(id.value());
    ASSERT_TRUE(cancelled.is_ok());
    EXPECT_EQ(cancelled.value(), CancelResult::TooLate);
    remote.release.open();

    auto info = manager().wait(id.value(), seconds(30));
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().phase, Phase::Completed);
    EXPECT_EQ(remote.dataset().count("product"), 20u);
}

TEST_F(SyncManagerTest, SecondSessionOnPairIsConflict) {
    fixtures::seed_shop(local.dataset(), 10);
    remote.hold_restore = true;

    auto first = manager().start_sync(Direction::Push, Method::Bulk);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(remote.reached.wait_for(seconds(10)));

    auto second = manager().start_sync(Direction::Pull, Method::Incremental);
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().code, ErrorCode::Conflict);

    auto active = manager().list_active();
    ASSERT_TRUE(active.is_ok());
    ASSERT_EQ(active.value().size(), 1u);
    EXPECT_EQ(active.value()[0].id, first.value());

    remote.release.open();
    auto info = manager().wait(first.value(), seconds(30));
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().phase, Phase::Completed);

    auto after = manager().list_active();
    ASSERT_TRUE(after.is_ok());
    EXPECT_TRUE(after.value().empty());
}

TEST_F(SyncManagerTest, RejectsUnsupportedPairAndUnknownType) {
    config.session.supported = {{Direction::Push, Method::Bulk}};

    auto unsupported = manager().start_sync(Direction::Pull, Method::Incremental);
    ASSERT_TRUE(unsupported.is_error());
    EXPECT_EQ(unsupported.error().code, ErrorCode::Validation);

    data::FilterOptions filter;
    filter.entity_types = {"invoice"};
    auto unknown = manager().start_sync(Direction::Push, Method::Bulk, filter);
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().code, ErrorCode::Validation);

    EXPECT_TRUE(log.started().empty());
}

TEST_F(SyncManagerTest, PhaseBudgetExceededFailsSession) {
    config.session.phase_timeouts["transfer"] = milliseconds(0);
    fixtures::seed_shop(local.dataset(), 10);

    const auto info = run_to_end(Direction::Push, Method::Bulk);
    EXPECT_EQ(info.phase, Phase::Failed);
    EXPECT_EQ(info.error_code, ErrorCode::PhaseTimeout);
    ASSERT_EQ(log.failed().size(), 1u);
    EXPECT_EQ(log.failed()[0].phase, Phase::Transfer);
    EXPECT_EQ(remote.dataset().size(), 0u);
}

TEST_F(SyncManagerTest, TransientApplyFailureIsRetried) {
    fixtures::seed_shop(local.dataset(), 15);
    remote.fail_upserts = 1;

    const auto info = run_to_end(Direction::Push, Method::Incremental);
    ASSERT_EQ(info.phase, Phase::Completed) << info.error_message;
    ASSERT_EQ(log.retries().size(), 1u);
    EXPECT_EQ(log.retries()[0].attempt, 1u);
    EXPECT_EQ(remote.dataset().count("product"), 15u);
}

TEST_F(SyncManagerTest, PersistentApplyFailureFailsSession) {
    fixtures::seed_shop(local.dataset(), 5);
    remote.fail_upserts = 100;

    const auto info = run_to_end(Direction::Push, Method::Incremental);
    EXPECT_EQ(info.phase, Phase::Failed);
    EXPECT_EQ(info.error_code, ErrorCode::Apply);
    EXPECT_EQ(info.last_confirmed_sequence, 0u);
    EXPECT_EQ(log.retries().size(), config.transfer.max_apply_retries);
}

TEST_F(SyncManagerTest, LostLeaseStopsWithoutTouchingRegistry) {
    fixtures::seed_shop(local.dataset(), 30);
    remote.hold_upsert = true;

    auto id = manager().start_sync(Direction::Push, Method::Incremental);
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(remote.reached.wait_for(seconds(10)));

    const auto key = manager().lease_key();
    store.expire_lease(key);
    ASSERT_TRUE(store.acquire_lease(key, "intruder", milliseconds(60000)).is_ok());
    manager().renew_leases();
    remote.release.open();

    auto info = manager().wait(id.value(), seconds(30));
    ASSERT_TRUE(info.is_ok());

    ASSERT_EQ(log.lease_lost().size(), 1u);
    EXPECT_EQ(log.lease_lost()[0].lease_key, key);
    EXPECT_TRUE(log.failed().empty());
    EXPECT_TRUE(log.completed().empty());

    auto persisted = store.load(id.value());
    ASSERT_TRUE(persisted.is_ok());
    EXPECT_EQ(persisted.value().phase, Phase::Transfer);
    // The new owner still holds the lease.
    EXPECT_TRUE(store.renew_lease(key, "intruder", milliseconds(60000)).is_ok());
}

TEST_F(SyncManagerTest, LeaseTakenBeforeCommitLeavesDestinationUntouched) {
    fixtures::seed_shop(local.dataset(), 20);
    remote.hold_restore = true;

    auto id = manager().start_sync(Direction::Push, Method::Bulk);
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(remote.reached.wait_for(seconds(10)));

    // No heartbeat runs in between: the driver learns it from the registry.
    const auto key = manager().lease_key();
    store.expire_lease(key);
    ASSERT_TRUE(store.acquire_lease(key, "successor", milliseconds(60000)).is_ok());
    remote.release.open();

    auto info = manager().wait(id.value(), seconds(30));
    ASSERT_TRUE(info.is_ok());

    EXPECT_EQ(remote.dataset().size(), 0u);
    ASSERT_EQ(log.lease_lost().size(), 1u);
    EXPECT_TRUE(log.completed().empty());
    EXPECT_TRUE(log.failed().empty());

    auto persisted = store.load(id.value());
    ASSERT_TRUE(persisted.is_ok());
    EXPECT_EQ(persisted.value().phase, Phase::Transfer);
    EXPECT_TRUE(store.renew_lease(key, "successor", milliseconds(60000)).is_ok());
}

TEST_F(SyncManagerTest, LeaseTakenMidStreamStopsBeforeNextBatch) {
    fixtures::seed_shop(local.dataset(), 30);
    remote.hold_upsert = true;

    auto id = manager().start_sync(Direction::Push, Method::Incremental);
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(remote.reached.wait_for(seconds(10)));

    const auto key = manager().lease_key();
    store.expire_lease(key);
    ASSERT_TRUE(store.acquire_lease(key, "successor", milliseconds(60000)).is_ok());
    remote.release.open();

    auto info = manager().wait(id.value(), seconds(30));
    ASSERT_TRUE(info.is_ok());

    // The batch in flight lands; nothing after it does.
    EXPECT_EQ(remote.upsert_calls.load(), 1);
    EXPECT_EQ(remote.dataset().size(), 10u);
    ASSERT_EQ(log.lease_lost().size(), 1u);
    EXPECT_TRUE(log.completed().empty());

    auto persisted = store.load(id.value());
    ASSERT_TRUE(persisted.is_ok());
    EXPECT_EQ(persisted.value().phase, Phase::Transfer);
    EXPECT_EQ(persisted.value().owner_token, "test-owner/" + id.value());
}

TEST_F(SyncManagerTest, LeaseTakenDuringCommitIsNeverRecordedCompleted) {
    fixtures::seed_shop(local.dataset(), 20);
    remote.hold_commit = true;

    auto id = manager().start_sync(Direction::Push, Method::Bulk);
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(remote.reached.wait_for(seconds(10)));

    const auto key = manager().lease_key();
    store.expire_lease(key);
    ASSERT_TRUE(store.acquire_lease(key, "successor", milliseconds(60000)).is_ok());
    remote.release.open();

    auto info = manager().wait(id.value(), seconds(30));
    ASSERT_TRUE(info.is_ok());

    ASSERT_EQ(log.lease_lost().size(), 1u);
    EXPECT_TRUE(log.completed().empty());
    auto persisted = store.load(id.value());
    ASSERT_TRUE(persisted.is_ok());
    EXPECT_EQ(persisted.value().phase, Phase::Restore);
    EXPECT_TRUE(persisted.value().reconciliation_report_id.empty());
}

TEST_F(SyncManagerTest, CancelMidStreamKeepsWholeBatches) {
    fixtures::seed_shop(local.dataset(), 30);
    remote.hold_upsert = true;

    auto id = manager().start_sync(Direction::Push, Method::Incremental);
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(remote.reached.wait_for(seconds(10)));

    auto cancelled = manager().cancel(id.value());
    ASSERT_TRUE(cancelled.is_ok());
    EXPECT_EQ(cancelled.value(), CancelResult::Accepted);
    remote.release.open();

    auto info = manager().wait(id.value(), seconds(30));
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().phase, Phase::Cancelled);
    EXPECT_EQ(remote.upsert_calls.load(), 1);
    EXPECT_EQ(remote.dataset().size(), 10u);

    auto persisted = store.load(id.value());
    ASSERT_TRUE(persisted.is_ok());
    EXPECT_EQ(persisted.value().phase, Phase::Cancelled);
    EXPECT_EQ(persisted.value().last_confirmed_sequence, 10u);
    ASSERT_EQ(log.cancelled().size(), 1u);
    EXPECT_EQ(log.cancelled()[0].phase, Phase::Transfer);
}

TEST_F(SyncManagerTest, FinishedSessionsAreAnsweredFromRegistry) {
    fixtures::seed_shop(local.dataset(), 5);

    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        ids.push_back(run_to_end(Direction::Push, Method::Incremental).id);
    }
    const auto deadline = std::chrono::steady_clock::now() + seconds(10);
    while (manager().running() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(5));
    }
    EXPECT_EQ(manager().running(), 0u);

    for (const auto& id : ids) {
        auto status = manager().status(id);
        ASSERT_TRUE(status.is_ok());
        EXPECT_EQ(status.value().phase, Phase::Completed);
        EXPECT_EQ(status.value().entities_transferred, 7u);
        auto again = manager().cancel(id);
        ASSERT_TRUE(again.is_ok());
        EXPECT_EQ(again.value(), CancelResult::AlreadyTerminal);
    }
}

TEST_F(SyncManagerTest, StartRacingShutdownLeavesNothingBehind) {
    fixtures::seed_shop(local.dataset(), 5);

    for (int round = 0; round < 20; ++round) {
        registry::InMemorySessionStore round_store;
        events::EventBus round_bus;
        session::SyncManager racing(config, local, remote, round_store, round_bus, "racer");

        Result<std::string> started = Err<std::string>(ErrorCode::Internal, "not started");
        std::thread starter([&]() { started = racing.start_sync(Direction::Push, Method::Bulk); });
        racing.shutdown();
        starter.join();

        if (started.is_ok()) {
            auto persisted = round_store.load(started.value());
            ASSERT_TRUE(persisted.is_ok());
            EXPECT_TRUE(session::is_terminal(persisted.value().phase))
                << "round " << round << ": " << to_string(persisted.value().phase);
        }
        auto active = round_store.list_active();
        ASSERT_TRUE(active.is_ok());
        EXPECT_TRUE(active.value().empty()) << "round " << round;
        EXPECT_TRUE(round_store.acquire_lease(racing.lease_key(), "next-owner", milliseconds(1000)).is_ok())
            << "round " << round;
    }
}

TEST_F(SyncManagerTest, ResumeContinuesIncrementalAfterCursor) {
    fixtures::seed_shop(local.dataset(), 8);
    // Sequences 1..5 (business, category, three products) already landed.
    remote.dataset().upsert(local.dataset().get("business", "b-1").value());
    remote.dataset().upsert(local.dataset().get("category", "c-1").value());
    for (int i = 1; i <= 3; ++i) {
        remote.dataset().upsert(fixtures::product(i));
    }

    session::SyncSessionInfo orphan;
    orphan.id = "session-orphan";
    orphan.direction = Direction::Push;
    orphan.method = Method::Incremental;
    orphan.phase = Phase::Transfer;
    orphan.source_name = "local";
    orphan.destination_name = "remote";
    orphan.last_confirmed_sequence = 5;
    orphan.owner_token = "crashed-owner/session-orphan";
    ASSERT_TRUE(store.save(orphan).is_ok());

    auto resumed = manager().resume("session-orphan");
    ASSERT_TRUE(resumed.is_ok()) << resumed.error().describe();
    EXPECT_EQ(resumed.value().phase, Phase::Transfer);
    EXPECT_NE(resumed.value().owner_token, orphan.owner_token);

    auto info = manager().wait("session-orphan", seconds(30));
    ASSERT_TRUE(info.is_ok());
    ASSERT_EQ(info.value().phase, Phase::Completed) << info.value().error_message;
    EXPECT_EQ(info.value().last_confirmed_sequence, 10u);
    EXPECT_EQ(remote.upsert_calls.load(), 1);
    EXPECT_EQ(remote.dataset().snapshot(), local.dataset().snapshot());

    ASSERT_EQ(log.started().size(), 1u);
    EXPECT_TRUE(log.started()[0].resumed);
}

TEST_F(SyncManagerTest, ResumeOfInterruptedRestoreFails) {
    session::SyncSessionInfo orphan;
    orphan.id = "session-convert";
    orphan.method = Method::Bulk;
    orphan.phase = Phase::Convert;
    orphan.source_name = "local";
    orphan.destination_name = "remote";
    ASSERT_TRUE(store.save(orphan).is_ok());

    auto resumed = manager().resume("session-convert");
    ASSERT_TRUE(resumed.is_ok());
    EXPECT_EQ(resumed.value().phase, Phase::Failed);
    EXPECT_EQ(resumed.value().error_code, ErrorCode::Apply);

    auto persisted = store.load("session-convert");
    ASSERT_TRUE(persisted.is_ok());
    EXPECT_EQ(persisted.value().phase, Phase::Failed);
    ASSERT_EQ(log.failed().size(), 1u);
    EXPECT_EQ(log.failed()[0].phase, Phase::Convert);

    EXPECT_TRUE(store.acquire_lease(manager().lease_key(), "next", milliseconds(1000)).is_ok());
}

TEST_F(SyncManagerTest, ResumeRefusals) {
    auto unknown = manager().resume("session-missing");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);

    session::SyncSessionInfo done;
    done.id = "session-done";
    done.phase = Phase::Completed;
    done.source_name = "local";
    done.destination_name = "remote";
    ASSERT_TRUE(store.save(done).is_ok());
    auto terminal = manager().resume("session-done");
    ASSERT_TRUE(terminal.is_error());
    EXPECT_EQ(terminal.error().code, ErrorCode::Validation);

    session::SyncSessionInfo held = done;
    held.id = "session-held";
    held.phase = Phase::Backup;
    ASSERT_TRUE(store.save(held).is_ok());
    ASSERT_TRUE(store.acquire_lease(manager().lease_key(), "other-process", milliseconds(60000)).is_ok());
    auto conflict = manager().resume("session-held");
    ASSERT_TRUE(conflict.is_error());
    EXPECT_EQ(conflict.error().code, ErrorCode::Conflict);
}

TEST_F(SyncManagerTest, CancelOfOrphanTakesItsLease) {
    session::SyncSessionInfo orphan;
    orphan.id = "session-stalled";
    orphan.phase = Phase::Transfer;
    orphan.source_name = "remote";
    orphan.destination_name = "local";
    ASSERT_TRUE(store.save(orphan).is_ok());

    auto cancelled = manager().cancel("session-stalled");
    ASSERT_TRUE(cancelled.is_ok());
    EXPECT_EQ(cancelled.value(), CancelResult::Accepted);
    EXPECT_EQ(store.load("session-stalled").value().phase, Phase::Cancelled);

    auto missing = manager().cancel("session-nowhere");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}
