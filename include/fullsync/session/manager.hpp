/**
 * @file manager.hpp
 * @brief Entry point for starting, observing and steering sync sessions
 *
 * WHY THIS FILE EXISTS:
 * Callers (the HTTP API, the demo, tests) talk to one object. The manager
 * validates requests, takes the pair lease, persists the new session and
 * hands it to a SessionDriver on a Boost.Asio worker pool. Status, cancel,
 * resume and reports all go through here.
 *
 * DIRECTION:
 * push copies local → remote, pull copies remote → local. Both directions
 * share one lease, keyed by the unordered instance pair.
 *
 * THREAD SAFETY:
 * Every public method may be called from any thread. A session is held in
 * memory only while its driver runs; afterwards the registry answers.
 */

#pragma once

#include "fullsync/core/config.hpp"
#include "fullsync/core/result.hpp"
#include "fullsync/data/database.hpp"
#include "fullsync/data/filter.hpp"
#include "fullsync/events/event_bus.hpp"
#include "fullsync/reconcile/types.hpp"
#include "fullsync/registry/session_store.hpp"
#include "fullsync/session/handle.hpp"
#include "fullsync/session/lease_keeper.hpp"
#include "fullsync/session/types.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fullsync::session {

class SyncManager {
public:
    SyncManager(const core::SyncConfig& config,
                data::DatabaseHandle& local,
                data::DatabaseHandle& remote,
                registry::SessionStore& store,
                events::EventBus& bus,
                std::string owner_id = {});
    ~SyncManager();

    SyncManager(const SyncManager&) = delete;
    SyncManager& operator=(const SyncManager&) = delete;

    /**
     * @brief Creates a session in pending and starts driving it
     *
     * ERRORS:
     * - Validation: unsupported direction/method pair, unknown entity type
     * - Conflict: another live session holds the pair lease
     */
    Result<std::string> start_sync(Direction direction, Method method, data::FilterOptions filter = {});

    /// Latest known state, from memory when this process drives it, else the registry.
    Result<SyncSessionInfo> status(const std::string& session_id) const;

    Result<CancelResult> cancel(const std::string& session_id);

    /**
     * @brief Takes over a session orphaned by a crashed or stalled owner
     *
     * Incremental sessions continue after their last confirmed sequence.
     * Bulk sessions restart their backup, or re-stream the spool when they
     * stopped in transfer. Sessions that stopped in convert or restore
     * are failed, since their staged state was lost. Sessions stopped in
     * verify run verify again.
     *
     * ERRORS:
     * - NotFound: unknown session
     * - Validation: the session is terminal
     * - Conflict: its lease is still held, or this process already drives it
     */
    Result<SyncSessionInfo> resume(const std::string& session_id);

    /// Blocks until the driver stops or the timeout expires, then returns status().
    Result<SyncSessionInfo> wait(const std::string& session_id, std::chrono::milliseconds timeout) const;

    Result<std::vector<SyncSessionInfo>> list_active() const;

    Result<reconcile::ReconciliationReport> report(const std::string& report_id) const;

    /// Renews every lease now instead of at the next heartbeat.
    void renew_leases() { lease_keeper_.renew_now(); }

    /// Cancels what can still be cancelled and waits for every driver.
    /// A session accepted while this runs is recorded as cancelled.
    void shutdown();

    /// Sessions whose driver has not finished yet.
    [[nodiscard]] std::size_t running() const;

    [[nodiscard]] const std::string& owner_id() const noexcept { return owner_id_; }
    [[nodiscard]] std::string lease_key() const;

private:
    Result<std::shared_ptr<SessionHandle>> find_handle(const std::string& session_id) const;
    Result<void> launch(std::shared_ptr<SessionHandle> handle, bool resumed);
    void abandon(const std::shared_ptr<SessionHandle>& handle);
    void release(const std::shared_ptr<SessionHandle>& handle);
    std::string next_owner_token(const std::string& session_id) const;

    const core::SyncConfig& config_;
    data::DatabaseHandle& local_;
    data::DatabaseHandle& remote_;
    registry::SessionStore& store_;
    events::EventBus& bus_;
    std::string owner_id_;

    LeaseKeeper lease_keeper_;
    boost::asio::thread_pool pool_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SessionHandle>> handles_;
    bool shut_down_ = false;
};

} // namespace fullsync::session
