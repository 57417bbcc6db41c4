#include "fullsync/session/manager.hpp"
#include "fullsync/core/ids.hpp"
#include "fullsync/events/events.hpp"
#include "fullsync/session/driver.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace fullsync::session {

SyncManager::SyncManager(const core::SyncConfig& config,
                         data::DatabaseHandle& local,
                         data::DatabaseHandle& remote,
                         registry::SessionStore& store,
                         events::EventBus& bus,
                         std::string owner_id)
    : config_(config),
      local_(local),
      remote_(remote),
      store_(store),
      bus_(bus),
      owner_id_(owner_id.empty() ? generate_id("owner") : std::move(owner_id)),
      lease_keeper_(store, config.session.lease_ttl, config.session.heartbeat_interval),
      pool_(config.session.worker_threads == 0 ? 1 : config.session.worker_threads) {
    spdlog::info("[SyncManager] owner={} local={} remote={} workers={}",
                 owner_id_, local_.name(), remote_.name(), config.session.worker_threads);
}

SyncManager::~SyncManager() {
    shutdown();
}

std::string SyncManager::lease_key() const {
    return registry::pair_key(local_.name(), remote_.name());
}

std::string SyncManager::next_owner_token(const std::string& session_id) const {
    return owner_id_ + "/" + session_id;
}

Result<std::string> SyncManager::start_sync(Direction direction, Method method, data::FilterOptions filter) {
    if (!config_.supports(direction, method)) {
        return Err<std::string>(ErrorCode::Validation,
            std::string(to_string(method)) + " " + to_string(direction) + " is not supported by this deployment");
    }
    auto scope = data::resolve_scope(config_, filter);
    if (scope.is_error()) {
        return Err<std::string>(scope.error());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return Err<std::string>(ErrorCode::Internal, "sync manager is shutting down");
        }
    }

    const auto id = generate_id("session");
    const auto token = next_owner_token(id);
    auto lease = store_.acquire_lease(lease_key(), token, config_.session.lease_ttl);
    if (lease.is_error()) {
        return Err<std::string>(lease.error());
    }

    auto& source = direction == Direction::Push ? local_ : remote_;
    auto& destination = direction == Direction::Push ? remote_ : local_;
    SyncSession session(id, direction, method, source.name(), destination.name(),
                        std::move(filter), config_.session.speed_window_samples);
    session.set_owner(token);

    auto saved = store_.save(session.info());
    if (saved.is_error()) {
        auto released = store_.release_lease(lease_key(), token);
        if (released.is_error()) {
            spdlog::warn("[SyncManager] lease {} not released: {}", lease_key(), released.error().message);
        }
        return Err<std::string>(saved.error());
    }

    auto launched = launch(std::make_shared<SessionHandle>(std::move(session), lease_key(), token), false);
    if (launched.is_error()) {
        return Err<std::string>(launched.error());
    }
    return Ok(id);
}

Result<void> SyncManager::launch(std::shared_ptr<SessionHandle> handle, bool resumed) {
    std::weak_ptr<SessionHandle> weak = handle;
    lease_keeper_.track(handle->lease_key(), handle->owner_token(),
        [weak](const registry::Lease&, const Error&) {
            if (auto owned = weak.lock()) {
                owned->mark_lease_lost();
            }
        });

    const auto info = handle->info();
    bus_.emit(events::SyncStartedEvent{info.id, info.direction, info.method,
                                       info.source_name, info.destination_name, resumed});

    {
        // Posting under the lock orders it before shutdown() joins the pool.
        std::lock_guard<std::mutex> lock(mutex_);
        if (!shut_down_) {
            handles_[handle->id()] = handle;
            boost::asio::post(pool_, [this, handle]() {
                const bool push = handle->info().direction == Direction::Push;
                DriverContext context{config_, push ? local_ : remote_, push ? remote_ : local_, store_, bus_};
                SessionDriver driver(context, handle);
                driver.run();
                release(handle);
                handle->mark_finished();

                std::lock_guard<std::mutex> done(mutex_);
                const auto it = handles_.find(handle->id());
                if (it != handles_.end() && it->second == handle) {
                    handles_.erase(it);
                }
            });
            return Ok();
        }
    }

    abandon(handle);
    return Err<void>(ErrorCode::Internal, "sync manager is shutting down");
}

void SyncManager::abandon(const std::shared_ptr<SessionHandle>& handle) {
    const Phase stopped_in = handle->phase();
    auto marked = handle->update([](SyncSession& s) { return s.mark_cancelled(); });
    auto saved = marked.is_ok() ? store_.save(handle->info()) : marked;
    if (saved.is_error()) {
        spdlog::error("[SyncManager] session={} not recorded as cancelled: {}", handle->id(), saved.error().message);
    }
    spdlog::info("[SyncManager] session={} cancelled before start: shutting down", handle->id());
    release(handle);
    handle->mark_finished();
    bus_.emit(events::SyncCancelledEvent{handle->id(), stopped_in});
}

void SyncManager::release(const std::shared_ptr<SessionHandle>& handle) {
    lease_keeper_.untrack(handle->owner_token());
    if (handle->lease_lost()) {
        return;
    }
    auto released = store_.release_lease(handle->lease_key(), handle->owner_token());
    if (released.is_error()) {
        spdlog::warn("[SyncManager] session={} lease {} not released: {}",
                     handle->id(), handle->lease_key(), released.error().message);
    }
}

Result<std::shared_ptr<SessionHandle>> SyncManager::find_handle(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = handles_.find(session_id);
    if (it == handles_.end()) {
        return Err<std::shared_ptr<SessionHandle>>(ErrorCode::NotFound, "session " + session_id + " is not driven here");
    }
    return Ok(it->second);
}

Result<SyncSessionInfo> SyncManager::status(const std::string& session_id) const {
    auto handle = find_handle(session_id);
    if (handle.is_ok()) {
        return Ok(handle.value()->info());
    }
    return store_.load(session_id);
}

Result<CancelResult> SyncManager::cancel(const std::string& session_id) {
    auto handle = find_handle(session_id);
    if (handle.is_ok() && !handle.value()->finished()) {
        const auto result = handle.value()->request_cancel();
        spdlog::info("[SyncManager] cancel session={} result={}", session_id, to_string(result));
        return Ok(result);
    }

    auto stored = store_.load(session_id);
    if (stored.is_error()) {
        return Err<CancelResult>(stored.error());
    }
    const auto& info = stored.value();
    if (is_terminal(info.phase)) {
        return Ok(CancelResult::AlreadyTerminal);
    }
    if (!is_cancellable(info.phase)) {
        return Ok(CancelResult::TooLate);
    }

    // Nobody drives it here: take its lease so a live owner elsewhere is not overwritten.
    const auto token = next_owner_token(session_id);
    const auto key = registry::pair_key(info.source_name, info.destination_name);
    auto lease = store_.acquire_lease(key, token, config_.session.lease_ttl);
    if (lease.is_error()) {
        return Err<CancelResult>(lease.error().code,
            "session " + session_id + " is driven by another process: " + lease.error().message);
    }

    SyncSession session(info, config_.session.speed_window_samples);
    session.set_owner(token);
    auto marked = session.mark_cancelled();
    auto saved = marked.is_ok() ? store_.save(session.info()) : marked;
    auto released = store_.release_lease(key, token);
    if (released.is_error()) {
        spdlog::warn("[SyncManager] lease {} not released: {}", key, released.error().message);
    }
    if (saved.is_error()) {
        return Err<CancelResult>(saved.error());
    }
    bus_.emit(events::SyncCancelledEvent{session_id, info.phase});
    return Ok(CancelResult::Accepted);
}

Result<SyncSessionInfo> SyncManager::resume(const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return Err<SyncSessionInfo>(ErrorCode::Internal, "sync manager is shutting down");
        }
        const auto it = handles_.find(session_id);
        if (it != handles_.end() && !it->second->finished()) {
            return Err<SyncSessionInfo>(ErrorCode::Conflict, "session " + session_id + " is already running here");
        }
    }

    auto stored = store_.load(session_id);
    if (stored.is_error()) {
        return stored;
    }
    auto info = std::move(stored.value());
    if (is_terminal(info.phase)) {
        return Err<SyncSessionInfo>(ErrorCode::Validation,
            "session " + session_id + " is already " + to_string(info.phase));
    }
    if (registry::pair_key(info.source_name, info.destination_name) != lease_key()) {
        return Err<SyncSessionInfo>(ErrorCode::Validation,
            "session " + session_id + " belongs to another instance pair");
    }

    const auto token = next_owner_token(session_id);
    auto lease = store_.acquire_lease(lease_key(), token, config_.session.lease_ttl);
    if (lease.is_error()) {
        return Err<SyncSessionInfo>(lease.error());
    }

    const Phase orphaned_in = info.phase;
    SyncSession session(std::move(info), config_.session.speed_window_samples);
    session.set_owner(token);
    spdlog::info("[SyncManager] resuming session={} phase={} cursor={}",
                 session_id, to_string(orphaned_in), session.info().last_confirmed_sequence);

    if (orphaned_in == Phase::Convert || orphaned_in == Phase::Restore) {
        const std::string message = std::string("interrupted during ") + to_string(orphaned_in) +
                                    "; staged records were not durable";
        auto marked = session.mark_failed(ErrorCode::Apply, message);
        auto saved = marked.is_ok() ? store_.save(session.info()) : marked;
        auto released = store_.release_lease(lease_key(), token);
        if (released.is_error()) {
            spdlog::warn("[SyncManager] lease {} not released: {}", lease_key(), released.error().message);
        }
        if (saved.is_error()) {
            return Err<SyncSessionInfo>(saved.error());
        }
        bus_.emit(events::SyncFailedEvent{session_id, orphaned_in, ErrorCode::Apply, message});
        return Ok(session.info());
    }

    auto saved = store_.save(session.info());
    if (saved.is_error()) {
        auto released = store_.release_lease(lease_key(), token);
        if (released.is_error()) {
            spdlog::warn("[SyncManager] lease {} not released: {}", lease_key(), released.error().message);
        }
        return Err<SyncSessionInfo>(saved.error());
    }

    auto handle = std::make_shared<SessionHandle>(std::move(session), lease_key(), token);
    auto snapshot = handle->info();
    auto launched = launch(std::move(handle), true);
    if (launched.is_error()) {
        return Err<SyncSessionInfo>(launched.error());
    }
    return Ok(std::move(snapshot));
}

Result<SyncSessionInfo> SyncManager::wait(const std::string& session_id, std::chrono::milliseconds timeout) const {
    auto handle = find_handle(session_id);
    if (handle.is_ok()) {
        handle.value()->wait_finished(timeout);
    }
    return status(session_id);
}

Result<std::vector<SyncSessionInfo>> SyncManager::list_active() const {
    auto stored = store_.list_active();
    if (stored.is_error()) {
        return stored;
    }

    std::vector<SyncSessionInfo> active;
    for (auto& info : stored.value()) {
        auto handle = find_handle(info.id);
        if (handle.is_ok()) {
            info = handle.value()->info();
        }
        if (!is_terminal(info.phase)) {
            active.push_back(std::move(info));
        }
    }
    return Ok(std::move(active));
}

std::size_t SyncManager::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

Result<reconcile::ReconciliationReport> SyncManager::report(const std::string& report_id) const {
    return store_.load_report(report_id);
}

void SyncManager::shutdown() {
    std::vector<std::shared_ptr<SessionHandle>> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        for (const auto& [id, handle] : handles_) {
            running.push_back(handle);
        }
    }

    for (const auto& handle : running) {
        if (!handle->finished()) {
            const auto result = handle->request_cancel();
            spdlog::debug("[SyncManager] shutdown cancel session={} result={}", handle->id(), to_string(result));
        }
    }
    pool_.join();
    lease_keeper_.stop();
}

} // namespace fullsync::session
