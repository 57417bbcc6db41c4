#include "fullsync/registry/session_store.hpp"
#include "fullsync/registry/serialization.hpp"

#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>

#include <algorithm>
#include <fstream>

namespace fullsync::registry {
namespace fs = std::filesystem;
namespace bip = boost::interprocess;

namespace {

using Clock = std::chrono::system_clock;

void sort_oldest_first(std::vector<session::SyncSessionInfo>& sessions) {
    std::sort(sessions.begin(), sessions.end(), [](const auto& a, const auto& b) {
        return a.started_at == b.started_at ? a.id < b.id : a.started_at < b.started_at;
    });
}

Result<void> write_document(const fs::path& path, const json& document) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Err<void>(ErrorCode::Io, "cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    auto temporary = path;
    temporary += ".tmp";
    {
        std::ofstream output(temporary, std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorCode::Io, "cannot open " + temporary.string() + " for writing");
        }
        output << document.dump(2);
        if (!output) {
            return Err<void>(ErrorCode::Io, "failed to write " + temporary.string());
        }
    }
    fs::rename(temporary, path, ec);
    if (ec) {
        return Err<void>(ErrorCode::Io, "failed to move " + temporary.string() + " into place: " + ec.message());
    }
    return Ok();
}

Result<json> read_document(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<json>(ErrorCode::NotFound, path.filename().string() + " not found");
    }
    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return Err<json>(ErrorCode::Io, path.string() + " is not valid JSON");
    }
    return Ok(std::move(document));
}

/// Keeps registry file names to a safe alphabet.
std::string file_name_for(const std::string& key) {
    std::string name;
    name.reserve(key.size());
    for (char c : key) {
        const bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.';
        name.push_back(safe ? c : '_');
    }
    return name + ".json";
}

/// An owned write must come from the lease holder, or with no lease from
/// the owner already on record.
Result<void> check_writer(const session::SyncSessionInfo& info,
                          const std::optional<Lease>& lease,
                          const std::optional<std::string>& recorded_owner) {
    if (info.owner_token.empty()) {
        return Ok();
    }
    if (lease) {
        if (lease->owner_token == info.owner_token) {
            return Ok();
        }
        return Err<void>(ErrorCode::LeaseLost,
            "session " + info.id + " write refused: lease " + lease->key + " is held by " + lease->owner_token +
            ", not " + info.owner_token);
    }
    if (!recorded_owner || recorded_owner->empty() || *recorded_owner == info.owner_token) {
        return Ok();
    }
    return Err<void>(ErrorCode::LeaseLost,
        "session " + info.id + " write refused: it was taken over by " + *recorded_owner);
}

std::mutex& registry_process_mutex() {
    static std::mutex mutex;
    return mutex;
}

/**
 * Runs fn while holding the registry lock of root.
 *
 * file_lock excludes other processes but not other threads of this one,
 * so every store in the process also shares one mutex.
 */
template<typename T, typename Fn>
Result<T> with_registry_lock(const fs::path& root, Fn&& fn) {
    std::lock_guard<std::mutex> process_guard(registry_process_mutex());

    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        return Err<T>(ErrorCode::Io, "cannot create " + root.string() + ": " + ec.message());
    }
    const auto lock_path = root / "registry.lock";
    {
        std::ofstream touch(lock_path, std::ios::app);
        if (!touch) {
            return Err<T>(ErrorCode::Io, "cannot create lock file " + lock_path.string());
        }
    }

    try {
        bip::file_lock file(lock_path.c_str());
        bip::scoped_lock<bip::file_lock> guard(file);
        return fn();
    } catch (const bip::interprocess_exception& e) {
        return Err<T>(ErrorCode::Io, "cannot lock " + lock_path.string() + ": " + e.what());
    }
}

} // namespace

std::string pair_key(const std::string& first_instance, const std::string& second_instance) {
    const auto& low = std::min(first_instance, second_instance);
    const auto& high = std::max(first_instance, second_instance);
    return low + "<->" + high;
}

bool lease_available(const std::optional<Lease>& current,
                     const std::string& owner_token,
                     Clock::time_point now) noexcept {
    return !current || current->owner_token == owner_token || current->expires_at <= now;
}

// ════════════════════════════════════════════════════════
// InMemorySessionStore
// ════════════════════════════════════════════════════════

Result<void> InMemorySessionStore::save(const session::SyncSessionInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<Lease> lease;
    const auto held = leases_.find(pair_key(info.source_name, info.destination_name));
    if (held != leases_.end()) {
        lease = held->second;
    }
    std::optional<std::string> recorded_owner;
    const auto recorded = sessions_.find(info.id);
    if (recorded != sessions_.end()) {
        recorded_owner = recorded->second.owner_token;
    }
    auto allowed = check_writer(info, lease, recorded_owner);
    if (allowed.is_error()) {
        return allowed;
    }
    sessions_[info.id] = info;
    return Ok();
}

Result<session::SyncSessionInfo> InMemorySessionStore::load(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Err<session::SyncSessionInfo>(ErrorCode::NotFound, "session " + session_id + " not found");
    }
    return Ok(it->second);
}

Result<std::vector<session::SyncSessionInfo>> InMemorySessionStore::list_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<session::SyncSessionInfo> active;
    for (const auto& [id, info] : sessions_) {
        if (!session::is_terminal(info.phase)) {
            active.push_back(info);
        }
    }
    sort_oldest_first(active);
    return Ok(std::move(active));
}

Result<void> InMemorySessionStore::save_report(const reconcile::ReconciliationReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reports_.count(report.id) > 0) {
        return Err<void>(ErrorCode::Conflict, "report " + report.id + " already exists");
    }
    reports_.emplace(report.id, report);
    return Ok();
}

Result<reconcile::ReconciliationReport> InMemorySessionStore::load_report(const std::string& report_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = reports_.find(report_id);
    if (it == reports_.end()) {
        return Err<reconcile::ReconciliationReport>(ErrorCode::NotFound, "report " + report_id + " not found");
    }
    return Ok(it->second);
}

Result<Lease> InMemorySessionStore::acquire_lease(const std::string& key,
                                                  const std::string& owner_token,
                                                  std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    const auto it = leases_.find(key);
    std::optional<Lease> current;
    if (it != leases_.end()) {
        current = it->second;
    }
    if (!lease_available(current, owner_token, now)) {
        return Err<Lease>(ErrorCode::Conflict, "a sync is already in progress for " + key);
    }
    Lease lease{key, owner_token, now + ttl};
    leases_[key] = lease;
    return Ok(std::move(lease));
}

Result<Lease> InMemorySessionStore::renew_lease(const std::string& key,
                                                const std::string& owner_token,
                                                std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = leases_.find(key);
    if (it == leases_.end() || it->second.owner_token != owner_token) {
        return Err<Lease>(ErrorCode::LeaseLost, "lease on " + key + " is no longer held by " + owner_token);
    }
    it->second.expires_at = Clock::now() + ttl;
    return Ok(it->second);
}

Result<void> InMemorySessionStore::release_lease(const std::string& key, const std::string& owner_token) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = leases_.find(key);
    if (it != leases_.end() && it->second.owner_token == owner_token) {
        leases_.erase(it);
    }
    return Ok();
}

void InMemorySessionStore::expire_lease(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = leases_.find(key);
    if (it != leases_.end()) {
        it->second.expires_at = Clock::now() - std::chrono::milliseconds(1);
    }
}

// ════════════════════════════════════════════════════════
// JsonFileSessionStore
// ════════════════════════════════════════════════════════

JsonFileSessionStore::JsonFileSessionStore(fs::path root) : root_(std::move(root)) {}

Result<void> JsonFileSessionStore::save(const session::SyncSessionInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto path = root_ / "sessions" / file_name_for(info.id);
    return with_registry_lock<void>(root_, [&]() -> Result<void> {
        auto lease = read_lease(pair_key(info.source_name, info.destination_name));
        if (lease.is_error()) {
            return Err<void>(lease.error());
        }
        std::optional<std::string> recorded_owner;
        auto recorded = read_document(path);
        if (recorded.is_ok()) {
            recorded_owner = recorded.value().value("ownerToken", std::string());
        } else if (recorded.error().code != ErrorCode::NotFound) {
            return Err<void>(recorded.error());
        }
        auto allowed = check_writer(info, lease.value(), recorded_owner);
        if (allowed.is_error()) {
            return allowed;
        }
        return write_document(path, session_to_json(info));
    });
}

Result<session::SyncSessionInfo> JsonFileSessionStore::load(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto document = read_document(root_ / "sessions" / file_name_for(session_id));
    if (document.is_error()) {
        if (document.error().code == ErrorCode::NotFound) {
            return Err<session::SyncSessionInfo>(ErrorCode::NotFound, "session " + session_id + " not found");
        }
        return Err<session::SyncSessionInfo>(document.error());
    }
    return session_from_json(document.value());
}

Result<std::vector<session::SyncSessionInfo>> JsonFileSessionStore::list_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<session::SyncSessionInfo> active;
    const auto directory = root_ / "sessions";
    std::error_code ec;
    if (!fs::exists(directory, ec)) {
        return Ok(std::move(active));
    }

    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() != ".json") {
            continue;
        }
        auto document = read_document(it->path());
        if (document.is_error()) {
            return Err<std::vector<session::SyncSessionInfo>>(document.error());
        }
        auto info = session_from_json(document.value());
        if (info.is_error()) {
            return Err<std::vector<session::SyncSessionInfo>>(info.error());
        }
        if (!session::is_terminal(info.value().phase)) {
            active.push_back(std::move(info.value()));
        }
    }
    if (ec) {
        return Err<std::vector<session::SyncSessionInfo>>(ErrorCode::Io,
            "cannot list " + directory.string() + ": " + ec.message());
    }
    sort_oldest_first(active);
    return Ok(std::move(active));
}

Result<void> JsonFileSessionStore::save_report(const reconcile::ReconciliationReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto path = root_ / "reports" / file_name_for(report.id);
    std::error_code ec;
    if (fs::exists(path, ec)) {
        return Err<void>(ErrorCode::Conflict, "report " + report.id + " already exists");
    }
    return write_document(path, report_to_json(report));
}

Result<reconcile::ReconciliationReport> JsonFileSessionStore::load_report(const std::string& report_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto document = read_document(root_ / "reports" / file_name_for(report_id));
    if (document.is_error()) {
        if (document.error().code == ErrorCode::NotFound) {
            return Err<reconcile::ReconciliationReport>(ErrorCode::NotFound, "report " + report_id + " not found");
        }
        return Err<reconcile::ReconciliationReport>(document.error());
    }
    return report_from_json(document.value());
}

fs::path JsonFileSessionStore::lease_path(const std::string& key) const {
    return root_ / "leases" / file_name_for(key);
}

Result<std::optional<Lease>> JsonFileSessionStore::read_lease(const std::string& key) const {
    auto document = read_document(lease_path(key));
    if (document.is_error()) {
        if (document.error().code == ErrorCode::NotFound) {
            return Ok(std::optional<Lease>());
        }
        return Err<std::optional<Lease>>(document.error());
    }
    auto lease = lease_from_json(document.value());
    if (lease.is_error()) {
        return Err<std::optional<Lease>>(lease.error());
    }
    return Ok(std::optional<Lease>(std::move(lease.value())));
}

Result<Lease> JsonFileSessionStore::acquire_lease(const std::string& key,
                                                  const std::string& owner_token,
                                                  std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    return with_registry_lock<Lease>(root_, [&]() -> Result<Lease> {
        auto current = read_lease(key);
        if (current.is_error()) {
            return Err<Lease>(current.error());
        }
        const auto now = Clock::now();
        if (!lease_available(current.value(), owner_token, now)) {
            return Err<Lease>(ErrorCode::Conflict, "a sync is already in progress for " + key);
        }
        Lease lease{key, owner_token, now + ttl};
        auto written = write_document(lease_path(key), lease_to_json(lease));
        if (written.is_error()) {
            return Err<Lease>(written.error());
        }
        return Ok(std::move(lease));
    });
}

Result<Lease> JsonFileSessionStore::renew_lease(const std::string& key,
                                                const std::string& owner_token,
                                                std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    return with_registry_lock<Lease>(root_, [&]() -> Result<Lease> {
        auto current = read_lease(key);
        if (current.is_error()) {
            return Err<Lease>(current.error());
        }
        if (!current.value() || current.value()->owner_token != owner_token) {
            return Err<Lease>(ErrorCode::LeaseLost, "lease on " + key + " is no longer held by " + owner_token);
        }
        Lease lease{key, owner_token, Clock::now() + ttl};
        auto written = write_document(lease_path(key), lease_to_json(lease));
        if (written.is_error()) {
            return Err<Lease>(written.error());
        }
        return Ok(std::move(lease));
    });
}

Result<void> JsonFileSessionStore::release_lease(const std::string& key, const std::string& owner_token) {
    std::lock_guard<std::mutex> lock(mutex_);
    return with_registry_lock<void>(root_, [&]() -> Result<void> {
        auto current = read_lease(key);
        if (current.is_error()) {
            return Err<void>(current.error());
        }
        if (!current.value() || current.value()->owner_token != owner_token) {
            return Ok();
        }
        std::error_code ec;
        fs::remove(lease_path(key), ec);
        if (ec) {
            return Err<void>(ErrorCode::Io, "cannot remove lease " + key + ": " + ec.message());
        }
        return Ok();
    });
}

} // namespace fullsync::registry
