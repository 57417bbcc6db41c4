/**
 * @file sync_api.hpp
 * @brief HTTP trigger and validation endpoints
 *
 * ROUTES:
 *   POST /api/sync                  {direction, method, filterOptions} → 202 {sessionId, phase}
 *   GET  /api/sync/active           sessions not yet terminal
 *   POST /api/sync/validate         on-demand reconciliation, nothing stored
 *   GET  /api/sync/:id              latest known session state
 *   POST /api/sync/:id/cancel       {sessionId, result}
 *   POST /api/sync/:id/resume       → 202 session
 *   GET  /api/reports/:id           stored reconciliation report
 *   POST /api/snapshot/inspect      {"blob": hex} → header and trailer
 *
 * Errors answer {"error": "<Code>Error", "message": ...}.
 */

#pragma once

#include "fullsync/core/config.hpp"
#include "fullsync/core/error.hpp"
#include "fullsync/net/http_router.hpp"
#include "fullsync/reconcile/validation.hpp"
#include "fullsync/session/manager.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fullsync::api {

class SyncApi {
public:
    SyncApi(session::SyncManager& manager, const core::SyncConfig& config);

    void register_routes(net::HttpRouter& router);

    net::HttpResponse start(const net::HttpContext& ctx);
    net::HttpResponse status(const net::HttpContext& ctx) const;
    net::HttpResponse active(const net::HttpContext& ctx) const;
    net::HttpResponse cancel(const net::HttpContext& ctx);
    net::HttpResponse resume(const net::HttpContext& ctx);
    net::HttpResponse report(const net::HttpContext& ctx) const;
    net::HttpResponse validate(const net::HttpContext& ctx) const;
    net::HttpResponse inspect(const net::HttpContext& ctx) const;

private:
    session::SyncManager& manager_;
    reconcile::ValidationService validation_;
};

[[nodiscard]] net::HttpStatus status_for(ErrorCode code) noexcept;
net::HttpResponse error_response(const Error& error);

/// nullopt on odd length or a non-hex digit.
std::optional<std::vector<std::uint8_t>> hex_decode(const std::string& hex);
std::string hex_encode(const std::vector<std::uint8_t>& data);

} // namespace fullsync::api
