/**
 * @file driver.hpp
 * @brief Runs one sync session through its phases
 *
 * WHY THIS FILE EXISTS:
 * The manager accepts requests and owns sessions; the driver does the
 * work. One driver runs per session on a worker thread, starting from the
 * phase the session is in, which is how resumed sessions pick up again.
 *
 * PHASES:
 * Bulk:        backup (spool snapshot) → transfer (decode into a staged
 *              restore) → convert (schema migrations) → restore (commit)
 *              → verify
 * Incremental: transfer (batches applied as they fill) → restore (last
 *              partial batch) → verify
 *
 * Every phase change is persisted before the work of the phase starts;
 * progress is persisted at most once per persist interval. The lease is
 * confirmed against the registry right before anything becomes visible
 * in the destination: the restore commit, each incremental batch and the
 * reconciliation report. After a lost lease the driver stops without
 * writing to the registry again.
 */

#pragma once

#include "fullsync/core/config.hpp"
#include "fullsync/core/result.hpp"
#include "fullsync/data/database.hpp"
#include "fullsync/data/filter.hpp"
#include "fullsync/events/event_bus.hpp"
#include "fullsync/registry/session_store.hpp"
#include "fullsync/session/handle.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fullsync::session {

struct DriverContext {
    const core::SyncConfig& config;
    data::DatabaseHandle& source;
    data::DatabaseHandle& destination;
    registry::SessionStore& store;
    events::EventBus& bus;
};

/// Spool file of a bulk session.
std::filesystem::path spool_path(const core::SyncConfig& config, const std::string& session_id);

class SessionDriver {
public:
    SessionDriver(DriverContext context, std::shared_ptr<SessionHandle> handle);

    /// Drives the session to a terminal phase, or stops on a lost lease.
    void run();

private:
    Result<void> run_bulk();
    Result<void> run_incremental();
    Result<void> verify();

    /// Transition, deadline reset, forced persist and event.
    Result<void> enter(Phase phase);
    Result<void> enter_restore();

    /// Cancel, lease and phase deadline, in that order.
    Result<void> check_interrupt() const;

    /// Renews the lease now; LeaseLost when another owner took it.
    Result<void> confirm_lease();

    Result<void> persist();
    void report_progress(std::uint64_t bytes, std::uint64_t entities);

    void finish(const Result<void>& outcome);

    DriverContext ctx_;
    std::shared_ptr<SessionHandle> handle_;
    std::vector<std::string> scope_;
    data::RecordFilter filter_;
    std::filesystem::path spool_;

    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::time_point deadline_;
    std::chrono::milliseconds phase_budget_{0};
    Phase phase_ = Phase::Pending;
    std::chrono::steady_clock::time_point last_persist_{};
};

} // namespace fullsync::session
