#pragma once

#include "fullsync/registry/session_store.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace fullsync::session {

/**
 * @brief Heartbeat that keeps the leases of running sessions alive
 *
 * A steady_timer on a private io_context fires every heartbeat interval and
 * renews every tracked lease. A renewal that fails drops the lease from the
 * keeper and invokes its on_lost callback exactly once.
 */
class LeaseKeeper {
public:
    using LostCallback = std::function<void(const registry::Lease& lease, const Error& error)>;

    LeaseKeeper(registry::SessionStore& store,
                std::chrono::milliseconds ttl,
                std::chrono::milliseconds heartbeat_interval);
    ~LeaseKeeper();

    LeaseKeeper(const LeaseKeeper&) = delete;
    LeaseKeeper& operator=(const LeaseKeeper&) = delete;

    void track(const std::string& key, const std::string& owner_token, LostCallback on_lost);
    void untrack(const std::string& owner_token);

    /// Runs one renewal round on the calling thread.
    void renew_now();

    void stop();

    [[nodiscard]] std::size_t tracked() const;

private:
    struct Entry {
        std::string key;
        LostCallback on_lost;
    };

    void schedule();

    registry::SessionStore& store_;
    std::chrono::milliseconds ttl_;
    std::chrono::milliseconds interval_;

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::asio::steady_timer timer_;
    std::thread thread_;
    std::atomic<bool> stopped_{false};

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;     ///< keyed by owner token
};

} // namespace fullsync::session
