/**
 * @file session_store.hpp
 * @brief Durable record of sessions, reports and pair leases
 *
 * WHY THIS FILE EXISTS:
 * A session outlives the thread that drives it. The registry holds the
 * latest state of every session so status polling works from anywhere,
 * a crashed driver can be resumed, and only one process drives a given
 * instance pair at a time.
 *
 * LEASES:
 * A lease is (pair key, owner token, expiry). acquire_lease() succeeds when
 * no lease exists, the existing one expired, or the caller already owns it.
 * The owner renews before expiry; a renewal by anyone else fails with
 * LeaseLost.
 *
 * FENCING:
 * save() of a session carrying an owner token is refused with LeaseLost
 * when the pair lease is held by another token, or when no lease exists
 * and the stored record belongs to another owner. A driver whose lease
 * was taken over can therefore never overwrite its successor's record.
 *
 * IMPLEMENTATIONS:
 * - InMemorySessionStore: one process, used by tests and the demo
 * - JsonFileSessionStore: one JSON document per session/report/lease
 */

#pragma once

#include "fullsync/core/result.hpp"
#include "fullsync/reconcile/types.hpp"
#include "fullsync/session/types.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fullsync::registry {

struct Lease {
    std::string key;
    std::string owner_token;
    std::chrono::system_clock::time_point expires_at{};
};

class SessionStore {
public:
    virtual ~SessionStore() = default;

    /// LeaseLost when the writer is fenced off (see FENCING).
    virtual Result<void> save(const session::SyncSessionInfo& info) = 0;
    virtual Result<session::SyncSessionInfo> load(const std::string& session_id) const = 0;

    /// Sessions not yet in a terminal phase, oldest first.
    virtual Result<std::vector<session::SyncSessionInfo>> list_active() const = 0;

    virtual Result<void> save_report(const reconcile::ReconciliationReport& report) = 0;
    virtual Result<reconcile::ReconciliationReport> load_report(const std::string& report_id) const = 0;

    /// Conflict when another owner holds an unexpired lease.
    virtual Result<Lease> acquire_lease(const std::string& key,
                                        const std::string& owner_token,
                                        std::chrono::milliseconds ttl) = 0;

    /// LeaseLost when the lease expired and was taken, or belongs to someone else.
    virtual Result<Lease> renew_lease(const std::string& key,
                                      const std::string& owner_token,
                                      std::chrono::milliseconds ttl) = 0;

    /// No-op when the caller does not own the lease.
    virtual Result<void> release_lease(const std::string& key, const std::string& owner_token) = 0;
};

class InMemorySessionStore : public SessionStore {
public:
    Result<void> save(const session::SyncSessionInfo& info) override;
    Result<session::SyncSessionInfo> load(const std::string& session_id) const override;
    Result<std::vector<session::SyncSessionInfo>> list_active() const override;
    Result<void> save_report(const reconcile::ReconciliationReport& report) override;
    Result<reconcile::ReconciliationReport> load_report(const std::string& report_id) const override;
    Result<Lease> acquire_lease(const std::string& key, const std::string& owner_token,
                                std::chrono::milliseconds ttl) override;
    Result<Lease> renew_lease(const std::string& key, const std::string& owner_token,
                              std::chrono::milliseconds ttl) override;
    Result<void> release_lease(const std::string& key, const std::string& owner_token) override;

    /// Test hook: forces a lease to expire now.
    void expire_lease(const std::string& key);

private:
    mutable std::mutex mutex_;
    std::map<std::string, session::SyncSessionInfo> sessions_;
    std::map<std::string, reconcile::ReconciliationReport> reports_;
    std::map<std::string, Lease> leases_;
};

/**
 * @brief Registry kept as JSON files under a root directory
 *
 * root/sessions/<id>.json, root/reports/<id>.json, root/leases/<key>.json.
 * Writes go to a temporary file that is renamed over the target, so a
 * reader never sees a half-written document. Lease changes and session
 * saves run under an advisory lock on root/registry.lock, which makes
 * read-check-write atomic across processes sharing the root.
 */
class JsonFileSessionStore : public SessionStore {
public:
    explicit JsonFileSessionStore(std::filesystem::path root);

    Result<void> save(const session::SyncSessionInfo& info) override;
    Result<session::SyncSessionInfo> load(const std::string& session_id) const override;
    Result<std::vector<session::SyncSessionInfo>> list_active() const override;
    Result<void> save_report(const reconcile::ReconciliationReport& report) override;
    Result<reconcile::ReconciliationReport> load_report(const std::string& report_id) const override;
    Result<Lease> acquire_lease(const std::string& key, const std::string& owner_token,
                                std::chrono::milliseconds ttl) override;
    Result<Lease> renew_lease(const std::string& key, const std::string& owner_token,
                              std::chrono::milliseconds ttl) override;
    Result<void> release_lease(const std::string& key, const std::string& owner_token) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    Result<std::optional<Lease>> read_lease(const std::string& key) const;
    std::filesystem::path lease_path(const std::string& key) const;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
};

/// Unordered pair key: the same for push and pull between two instances.
[[nodiscard]] std::string pair_key(const std::string& first_instance, const std::string& second_instance);

/// True when owner_token may take the lease at now.
[[nodiscard]] bool lease_available(const std::optional<Lease>& current,
                                   const std::string& owner_token,
                                   std::chrono::system_clock::time_point now) noexcept;

} // namespace fullsync::registry
