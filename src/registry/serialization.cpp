#include "fullsync/registry/serialization.hpp"
#include "fullsync/data/record_json.hpp"

namespace fullsync::registry {
namespace {

json optional_time(const std::optional<std::chrono::system_clock::time_point>& time) {
    return time ? json(to_epoch_ms(*time)) : json(nullptr);
}

std::optional<std::chrono::system_clock::time_point> read_optional_time(const json& document, const char* key) {
    if (!document.contains(key) || document.at(key).is_null()) {
        return std::nullopt;
    }
    return from_epoch_ms(document.at(key).get<std::int64_t>());
}

} // namespace

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

json session_to_json(const session::SyncSessionInfo& info) {
    return json{
        {"id", info.id},
        {"direction", to_string(info.direction)},
        {"method", to_string(info.method)},
        {"phase", session::to_string(info.phase)},
        {"sourceName", info.source_name},
        {"destinationName", info.destination_name},
        {"filter", info.filter},
        {"startedAt", to_epoch_ms(info.started_at)},
        {"updatedAt", to_epoch_ms(info.updated_at)},
        {"completedAt", optional_time(info.completed_at)},
        {"estimatedCompletion", optional_time(info.estimated_completion)},
        {"transferSpeed", info.transfer_speed},
        {"bytesTotal", info.bytes_total},
        {"bytesTransferred", info.bytes_transferred},
        {"entitiesTotal", info.entities_total},
        {"entitiesTransferred", info.entities_transferred},
        {"lastConfirmedSequence", info.last_confirmed_sequence},
        {"ownerToken", info.owner_token},
        {"errorCode", info.error_code ? json(to_string(*info.error_code)) : json(nullptr)},
        {"errorMessage", info.error_message.empty() ? json(nullptr) : json(info.error_message)},
        {"reconciliationReportId",
            info.reconciliation_report_id.empty() ? json(nullptr) : json(info.reconciliation_report_id)}
    };
}

Result<session::SyncSessionInfo> session_from_json(const json& document) {
    session::SyncSessionInfo info;
    try {
        info.id = document.at("id").get<std::string>();

        const auto direction = direction_from_string(document.at("direction").get<std::string>());
        const auto method = method_from_string(document.at("method").get<std::string>());
        const auto phase = session::phase_from_string(document.at("phase").get<std::string>());
        if (!direction || !method || !phase) {
            return Err<session::SyncSessionInfo>(ErrorCode::Io, "session document has unknown direction, method or phase");
        }
        info.direction = *direction;
        info.method = *method;
        info.phase = *phase;

        info.source_name = document.value("sourceName", std::string());
        info.destination_name = document.value("destinationName", std::string());
        if (document.contains("filter")) {
            info.filter = document.at("filter").get<data::FilterOptions>();
        }
        info.started_at = from_epoch_ms(document.value("startedAt", std::int64_t{0}));
        info.updated_at = from_epoch_ms(document.value("updatedAt", std::int64_t{0}));
        info.completed_at = read_optional_time(document, "completedAt");
        info.estimated_completion = read_optional_time(document, "estimatedCompletion");
        info.transfer_speed = document.value("transferSpeed", 0.0);
        info.bytes_total = document.value("bytesTotal", std::uint64_t{0});
        info.bytes_transferred = document.value("bytesTransferred", std::uint64_t{0});
        info.entities_total = document.value("entitiesTotal", std::uint64_t{0});
        info.entities_transferred = document.value("entitiesTransferred", std::uint64_t{0});
        info.last_confirmed_sequence = document.value("lastConfirmedSequence", std::uint64_t{0});
        info.owner_token = document.value("ownerToken", std::string());

        if (document.contains("errorCode") && document.at("errorCode").is_string()) {
            info.error_code = error_code_from_string(document.at("errorCode").get<std::string>());
        }
        if (document.contains("errorMessage") && document.at("errorMessage").is_string()) {
            info.error_message = document.at("errorMessage").get<std::string>();
        }
        if (document.contains("reconciliationReportId") && document.at("reconciliationReportId").is_string()) {
            info.reconciliation_report_id = document.at("reconciliationReportId").get<std::string>();
        }
    } catch (const json::exception& e) {
        return Err<session::SyncSessionInfo>(ErrorCode::Io, std::string("malformed session document: ") + e.what());
    }
    return Ok(std::move(info));
}

json report_to_json(const reconcile::ReconciliationReport& report, bool include_findings) {
    json summaries = json::array();
    for (const auto& summary : report.entity_summaries) {
        summaries.push_back({
            {"entityType", summary.entity_type},
            {"compared", summary.compared},
            {"exact", summary.exact},
            {"expected", summary.expected},
            {"unexpected", summary.unexpected}
        });
    }

    json document{
        {"id", report.id},
        {"sessionId", report.session_id},
        {"createdAt", to_epoch_ms(report.created_at)},
        {"direction", to_string(report.direction)},
        {"exactMatches", report.exact_matches},
        {"expectedDifferences", report.expected_differences},
        {"unexpectedMismatches", report.unexpected_mismatches},
        {"entitySummaries", std::move(summaries)},
        {"overallStatus", reconcile::to_string(report.overall_status)}
    };

    if (include_findings) {
        json findings = json::array();
        for (const auto& finding : report.findings) {
            findings.push_back({
                {"entityType", finding.entity_type},
                {"entityId", finding.entity_id},
                {"classification", reconcile::to_string(finding.classification)},
                {"sourceValue", finding.source_value},
                {"targetValue", finding.target_value},
                {"reasonCode", finding.reason_code}
            });
        }
        document["perEntityFindings"] = std::move(findings);
    }
    return document;
}

Result<reconcile::ReconciliationReport> report_from_json(const json& document) {
    reconcile::ReconciliationReport report;
    try {
        report.id = document.at("id").get<std::string>();
        report.session_id = document.value("sessionId", std::string());
        report.created_at = from_epoch_ms(document.value("createdAt", std::int64_t{0}));
        const auto direction = direction_from_string(document.value("direction", std::string("push")));
        const auto status = reconcile::overall_status_from_string(document.value("overallStatus", std::string("clean")));
        if (!direction || !status) {
            return Err<reconcile::ReconciliationReport>(ErrorCode::Io, "report document has unknown direction or status");
        }
        report.direction = *direction;
        report.overall_status = *status;
        report.exact_matches = document.value("exactMatches", std::uint64_t{0});
        report.expected_differences = document.value("expectedDifferences", std::uint64_t{0});
        report.unexpected_mismatches = document.value("unexpectedMismatches", std::uint64_t{0});

        for (const auto& node : document.value("entitySummaries", json::array())) {
            reconcile::EntitySummary summary;
            summary.entity_type = node.at("entityType").get<std::string>();
            summary.compared = node.value("compared", std::uint64_t{0});
            summary.exact = node.value("exact", std::uint64_t{0});
            summary.expected = node.value("expected", std::uint64_t{0});
            summary.unexpected = node.value("unexpected", std::uint64_t{0});
            report.entity_summaries.push_back(std::move(summary));
        }
        for (const auto& node : document.value("perEntityFindings", json::array())) {
            reconcile::Finding finding;
            finding.entity_type = node.at("entityType").get<std::string>();
            finding.entity_id = node.at("entityId").get<std::string>();
            const auto classification = reconcile::classification_from_string(node.at("classification").get<std::string>());
            if (!classification) {
                return Err<reconcile::ReconciliationReport>(ErrorCode::Io, "report finding has unknown classification");
            }
            finding.classification = *classification;
            finding.source_value = node.value("sourceValue", std::string());
            finding.target_value = node.value("targetValue", std::string());
            finding.reason_code = node.value("reasonCode", std::string());
            report.findings.push_back(std::move(finding));
        }
    } catch (const json::exception& e) {
        return Err<reconcile::ReconciliationReport>(ErrorCode::Io, std::string("malformed report document: ") + e.what());
    }
    return Ok(std::move(report));
}

json lease_to_json(const Lease& lease) {
    return json{
        {"key", lease.key},
        {"ownerToken", lease.owner_token},
        {"expiresAt", to_epoch_ms(lease.expires_at)}
    };
}

Result<Lease> lease_from_json(const json& document) {
    try {
        Lease lease;
        lease.key = document.at("key").get<std::string>();
        lease.owner_token = document.at("ownerToken").get<std::string>();
        lease.expires_at = from_epoch_ms(document.at("expiresAt").get<std::int64_t>());
        return Ok(std::move(lease));
    } catch (const json::exception& e) {
        return Err<Lease>(ErrorCode::Io, std::string("malformed lease document: ") + e.what());
    }
}

} // namespace fullsync::registry
