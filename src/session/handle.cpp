#include "fullsync/session/handle.hpp"

namespace fullsync::session {

SessionHandle::SessionHandle(SyncSession session, std::string lease_key, std::string owner_token)
    : id_(session.id()),
      lease_key_(std::move(lease_key)),
      owner_token_(std::move(owner_token)),
      session_(std::move(session)) {}

SyncSessionInfo SessionHandle::info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.info();
}

Phase SessionHandle::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.phase();
}

CancelResult SessionHandle::request_cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(session_.phase())) {
        return CancelResult::AlreadyTerminal;
    }
    if (!is_cancellable(session_.phase())) {
        return CancelResult::TooLate;
    }
    cancel_requested_.store(true);
    return CancelResult::Accepted;
}

Result<void> SessionHandle::enter_restore() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancel_requested_.load()) {
        return Err<void>(ErrorCode::Cancelled, "cancelled before restore");
    }
    return session_.transition_to(Phase::Restore);
}

void SessionHandle::mark_finished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    finished_cv_.notify_all();
}

bool SessionHandle::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

bool SessionHandle::wait_finished(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return finished_cv_.wait_for(lock, timeout, [this]() { return finished_; });
}

} // namespace fullsync::session
