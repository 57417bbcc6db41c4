#include "fullsync/session/lease_keeper.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace fullsync::session {

LeaseKeeper::LeaseKeeper(registry::SessionStore& store,
                         std::chrono::milliseconds ttl,
                         std::chrono::milliseconds heartbeat_interval)
    : store_(store),
      ttl_(ttl),
      interval_(heartbeat_interval),
      work_(boost::asio::make_work_guard(io_)),
      timer_(io_) {
    schedule();
    thread_ = std::thread([this]() { io_.run(); });
}

LeaseKeeper::~LeaseKeeper() {
    stop();
}

void LeaseKeeper::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    work_.reset();
    io_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void LeaseKeeper::schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || stopped_.load()) {
            return;
        }
        renew_now();
        schedule();
    });
}

void LeaseKeeper::track(const std::string& key, const std::string& owner_token, LostCallback on_lost) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[owner_token] = Entry{key, std::move(on_lost)};
}

void LeaseKeeper::untrack(const std::string& owner_token) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(owner_token);
}

std::size_t LeaseKeeper::tracked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void LeaseKeeper::renew_now() {
    std::vector<std::pair<std::string, std::string>> round;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [token, entry] : entries_) {
            round.emplace_back(token, entry.key);
        }
    }

    for (const auto& [token, key] : round) {
        auto renewed = store_.renew_lease(key, token, ttl_);
        if (renewed.is_ok()) {
            spdlog::debug("[LeaseKeeper] renewed lease={} owner={}", key, token);
            continue;
        }
        if (renewed.error().code != ErrorCode::LeaseLost) {
            spdlog::warn("[LeaseKeeper] renewal of lease={} failed, retrying next round: {}",
                         key, renewed.error().message);
            continue;
        }

        LostCallback on_lost;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = entries_.find(token);
            if (it == entries_.end()) {
                continue;   // untracked while renewing
            }
            on_lost = std::move(it->second.on_lost);
            entries_.erase(it);
        }
        spdlog::warn("[LeaseKeeper] lost lease={} owner={}: {}", key, token, renewed.error().message);
        if (on_lost) {
            on_lost(registry::Lease{key, token, {}}, renewed.error());
        }
    }
}

} // namespace fullsync::session
