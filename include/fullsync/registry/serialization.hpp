#pragma once

#include "fullsync/core/result.hpp"
#include "fullsync/reconcile/types.hpp"
#include "fullsync/registry/session_store.hpp"
#include "fullsync/session/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>

namespace fullsync::registry {

using json = nlohmann::json;

/// Milliseconds since the Unix epoch.
[[nodiscard]] std::int64_t to_epoch_ms(std::chrono::system_clock::time_point time);
[[nodiscard]] std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms);

json session_to_json(const session::SyncSessionInfo& info);
Result<session::SyncSessionInfo> session_from_json(const json& document);

json report_to_json(const reconcile::ReconciliationReport& report, bool include_findings = true);
Result<reconcile::ReconciliationReport> report_from_json(const json& document);

json lease_to_json(const Lease& lease);
Result<Lease> lease_from_json(const json& document);

} // namespace fullsync::registry
