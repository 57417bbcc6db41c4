#include "fullsync/api/sync_api.hpp"
#include "fullsync/codec/snapshot_codec.hpp"
#include "fullsync/data/record_json.hpp"
#include "fullsync/registry/serialization.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace fullsync::api {

using json = nlohmann::json;
using net::HttpContext;
using net::HttpResponse;
using net::HttpStatus;

namespace {

HttpResponse json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_json(body);
    return response;
}

HttpResponse bad_request(const std::string& message) {
    return net::json_error(HttpStatus::BAD_REQUEST, to_string(ErrorCode::Validation), message);
}

/// Empty body reads as {}.
std::optional<json> parse_body(const HttpContext& ctx) {
    const auto text = ctx.request.body_as_string();
    if (text.empty()) {
        return json::object();
    }
    auto payload = json::parse(text, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return std::nullopt;
    }
    return payload;
}

json header_to_json(const codec::SnapshotHeader& header) {
    return {
        {"sourceName", header.source_name},
        {"schemaRevision", header.schema_revision},
        {"createdAt", header.created_at_ms},
        {"entityTypes", header.entity_types},
        {"compressed", header.compressed}
    };
}

} // namespace

net::HttpStatus status_for(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Validation:
        case ErrorCode::Integrity:
            return HttpStatus::BAD_REQUEST;
        case ErrorCode::NotFound:
            return HttpStatus::NOT_FOUND;
        case ErrorCode::Conflict:
        case ErrorCode::TooLate:
            return HttpStatus::CONFLICT;
        default:
            return HttpStatus::INTERNAL_SERVER_ERROR;
    }
}

net::HttpResponse error_response(const Error& error) {
    return net::json_error(status_for(error.code), to_string(error.code), error.message);
}

std::optional<std::vector<std::uint8_t>> hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<std::uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<std::uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return bytes;
}

std::string hex_encode(const std::vector<std::uint8_t>& data) {
    std::ostringstream oss;
    for (auto byte : data) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

SyncApi::SyncApi(session::SyncManager& manager, const core::SyncConfig& config)
    : manager_(manager),
      validation_(config) {
}

void SyncApi::register_routes(net::HttpRouter& router) {
    router.post("/api/sync", [this](const HttpContext& ctx) { return start(ctx); });
    router.get("/api/sync/active", [this](const HttpContext& ctx) { return active(ctx); });
    router.post("/api/sync/validate", [this](const HttpContext& ctx) { return validate(ctx); });
    router.get("/api/sync/:id", [this](const HttpContext& ctx) { return status(ctx); });
    router.post("/api/sync/:id/cancel", [this](const HttpContext& ctx) { return cancel(ctx); });
    router.post("/api/sync/:id/resume", [this](const HttpContext& ctx) { return resume(ctx); });
    router.get("/api/reports/:id", [this](const HttpContext& ctx) { return report(ctx); });
    router.post("/api/snapshot/inspect", [this](const HttpContext& ctx) { return inspect(ctx); });
    spdlog::debug("[SyncApi] {} routes registered", router.route_count());
}

HttpResponse SyncApi::start(const HttpContext& ctx) {
    auto payload = parse_body(ctx);
    if (!payload) {
        return bad_request("request body is not a JSON object");
    }

    const auto direction = direction_from_string(payload->value("direction", std::string()));
    if (!direction) {
        return bad_request("direction must be push or pull");
    }
    const auto method = method_from_string(payload->value("method", std::string()));
    if (!method) {
        return bad_request("method must be bulk or incremental");
    }

    data::FilterOptions filter;
    if (payload->contains("filterOptions")) {
        try {
            filter = payload->at("filterOptions").get<data::FilterOptions>();
        } catch (const json::exception& e) {
            return bad_request(std::string("invalid filterOptions: ") + e.what());
        }
    }

    auto started = manager_.start_sync(*direction, *method, std::move(filter));
    if (started.is_error()) {
        spdlog::warn("[SyncApi] start {} {} rejected: {}",
                     to_string(*direction), to_string(*method), started.error().describe());
        return error_response(started.error());
    }
    return json_response(HttpStatus::ACCEPTED, {
        {"sessionId", started.value()},
        {"phase", session::to_string(session::Phase::Pending)}
    });
}

HttpResponse SyncApi::status(const HttpContext& ctx) const {
    auto info = manager_.status(ctx.get_param("id"));
    if (info.is_error()) {
        return error_response(info.error());
    }
    return json_response(HttpStatus::OK, registry::session_to_json(info.value()));
}

HttpResponse SyncApi::active(const HttpContext&) const {
    auto sessions = manager_.list_active();
    if (sessions.is_error()) {
        return error_response(sessions.error());
    }
    json list = json::array();
    for (const auto& info : sessions.value()) {
        list.push_back(registry::session_to_json(info));
    }
    return json_response(HttpStatus::OK, {{"sessions", std::move(list)}});
}

HttpResponse SyncApi::cancel(const HttpContext& ctx) {
    const auto id = ctx.get_param("id");
    auto result = manager_.cancel(id);
    if (result.is_error()) {
        return error_response(result.error());
    }
    const auto status = result.value() == session::CancelResult::Accepted ? HttpStatus::OK : HttpStatus::CONFLICT;
    return json_response(status, {
        {"sessionId", id},
        {"result", session::to_string(result.value())}
    });
}

HttpResponse SyncApi::resume(const HttpContext& ctx) {
    auto info = manager_.resume(ctx.get_param("id"));
    if (info.is_error()) {
        return error_response(info.error());
    }
    return json_response(HttpStatus::ACCEPTED, registry::session_to_json(info.value()));
}

HttpResponse SyncApi::report(const HttpContext& ctx) const {
    auto stored = manager_.report(ctx.get_param("id"));
    if (stored.is_error()) {
        return error_response(stored.error());
    }
    return json_response(HttpStatus::OK, registry::report_to_json(stored.value()));
}

HttpResponse SyncApi::validate(const HttpContext& ctx) const {
    auto payload = parse_body(ctx);
    if (!payload) {
        return bad_request("request body is not a JSON object");
    }

    auto result = validation_.validate(*payload);
    if (result.is_error()) {
        return error_response(result.error());
    }

    const auto& report = result.value();
    auto body = registry::report_to_json(report);
    body["summary"] = {
        {"exactMatches", report.exact_matches},
        {"expectedDifferences", report.expected_differences},
        {"unexpectedMismatches", report.unexpected_mismatches},
        {"compared", report.compared()}
    };
    return json_response(HttpStatus::OK, body);
}

HttpResponse SyncApi::inspect(const HttpContext& ctx) const {
    auto payload = parse_body(ctx);
    if (!payload) {
        return bad_request("request body is not a JSON object");
    }
    const auto blob_hex = payload->value("blob", std::string());
    if (blob_hex.empty()) {
        return bad_request("blob is required");
    }
    auto blob = hex_decode(blob_hex);
    if (!blob) {
        return bad_request("blob is not valid hex");
    }

    auto summary = codec::inspect_snapshot(*blob);
    if (summary.is_error()) {
        return error_response(summary.error());
    }
    const auto& value = summary.value();
    return json_response(HttpStatus::OK, {
        {"valid", true},
        {"header", header_to_json(value.header)},
        {"recordCount", value.trailer.record_count},
        {"payloadBytes", value.trailer.payload_bytes},
        {"crc32", value.trailer.crc32},
        {"totalBytes", value.total_bytes}
    });
}

} // namespace fullsync::api
