#pragma once

#include "fullsync/core/result.hpp"
#include "fullsync/session/session.hpp"
#include "fullsync/session/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace fullsync::session {

/**
 * @brief Shared state between the driver of a session and its callers
 *
 * The driver mutates the session through update(); status polling copies
 * it through info(). Cancellation and lease loss are flags the driver
 * checks at chunk and batch boundaries.
 *
 * Entering restore and accepting a cancel both happen under the handle
 * mutex, so a cancel either lands before restore begins or is answered
 * TooLate.
 */
class SessionHandle {
public:
    SessionHandle(SyncSession session, std::string lease_key, std::string owner_token);

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& lease_key() const noexcept { return lease_key_; }
    [[nodiscard]] const std::string& owner_token() const noexcept { return owner_token_; }

    [[nodiscard]] SyncSessionInfo info() const;
    [[nodiscard]] Phase phase() const;

    template<typename Fn>
    auto update(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(session_);
    }

    CancelResult request_cancel();
    [[nodiscard]] bool cancel_requested() const noexcept { return cancel_requested_.load(); }

    /// Moves the session into restore unless a cancel was accepted first.
    Result<void> enter_restore();

    void mark_lease_lost() noexcept { lease_lost_.store(true); }
    [[nodiscard]] bool lease_lost() const noexcept { return lease_lost_.load(); }

    /// Called once by the driver after its last write.
    void mark_finished();
    [[nodiscard]] bool finished() const;

    /// True when the driver finished before the timeout.
    bool wait_finished(std::chrono::milliseconds timeout) const;

private:
    std::string id_;
    std::string lease_key_;
    std::string owner_token_;

    mutable std::mutex mutex_;
    mutable std::condition_variable finished_cv_;
    SyncSession session_;
    bool finished_ = false;

    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> lease_lost_{false};
};

} // namespace fullsync::session
