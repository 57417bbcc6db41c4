#include "fullsync/reconcile/validation.hpp"
#include "fullsync/core/ids.hpp"
#include "fullsync/data/record_json.hpp"

namespace fullsync::reconcile {

using nlohmann::json;

ValidationService::ValidationService(const core::SyncConfig& config)
    : engine_(config), failure_ratio_(config.reconciliation.failure_ratio) {}

Result<ReconciliationReport> ValidationService::validate_records(std::vector<data::Record> source,
                                                                 std::vector<data::Record> target,
                                                                 Direction direction) const {
    return engine_.compare(data::make_snapshot(std::move(source)), data::make_snapshot(std::move(target)), direction);
}

ReconciliationReport ValidationService::validate_restore(const transfer::RestoreResult& result,
                                                         Direction direction) const {
    ReconciliationReport report;
    report.id = generate_id("validation");
    report.created_at = std::chrono::system_clock::now();
    report.direction = direction;

    for (const auto& [type, counts] : result.entity_counts) {
        EntitySummary summary;
        summary.entity_type = type;
        summary.compared = counts.attempted;
        summary.exact = counts.applied;
        summary.unexpected = counts.attempted >= counts.applied ? counts.attempted - counts.applied : 0;
        report.exact_matches += summary.exact;
        report.unexpected_mismatches += summary.unexpected;
        report.entity_summaries.push_back(std::move(summary));
    }
    for (const auto& failure : result.failures) {
        report.findings.push_back(Finding{failure.entity_type, failure.entity_id,
                                          Classification::UnexpectedMismatch, "", "",
                                          "APPLY_FAILED: " + failure.error});
    }
    report.overall_status = overall_status_for(report.unexpected_mismatches, report.compared(), failure_ratio_);
    return report;
}

Result<ReconciliationReport> ValidationService::validate(const json& request) const {
    if (!request.is_object()) {
        return Err<ReconciliationReport>(ErrorCode::Validation, "validation request must be a JSON object");
    }

    Direction direction = Direction::Push;
    if (request.contains("direction")) {
        const auto parsed = request.at("direction").is_string()
            ? direction_from_string(request.at("direction").get<std::string>())
            : std::nullopt;
        if (!parsed) {
            return Err<ReconciliationReport>(ErrorCode::Validation, "direction must be 'push' or 'pull'");
        }
        direction = *parsed;
    }

    if (request.contains("restoreResult")) {
        auto result = restore_result_from_json(request.at("restoreResult"));
        if (result.is_error()) {
            return Err<ReconciliationReport>(result.error());
        }
        return Ok(validate_restore(result.value(), direction));
    }

    if (!request.contains("source") || !request.contains("target")) {
        return Err<ReconciliationReport>(ErrorCode::Validation,
            "validation request needs 'source' and 'target' record arrays or a 'restoreResult'");
    }
    auto source = data::records_from_json(request.at("source"));
    if (source.is_error()) {
        return Err<ReconciliationReport>(source.error());
    }
    auto target = data::records_from_json(request.at("target"));
    if (target.is_error()) {
        return Err<ReconciliationReport>(target.error());
    }
    return validate_records(std::move(source.value()), std::move(target.value()), direction);
}

Result<transfer::RestoreResult> restore_result_from_json(const json& document) {
    if (!document.is_object()) {
        return Err<transfer::RestoreResult>(ErrorCode::Validation, "restoreResult must be an object");
    }
    transfer::RestoreResult result;
    try {
        for (const auto& [type, counts] : document.value("entityCounts", json::object()).items()) {
            auto& entry = result.entity_counts[type];
            entry.attempted = counts.value("attempted", std::uint64_t{0});
            entry.applied = counts.value("applied", std::uint64_t{0});
            entry.failed = counts.value("failed", std::uint64_t{0});
        }
        for (const auto& node : document.value("failures", json::array())) {
            transfer::ApplyFailure failure;
            failure.entity_type = node.at("entityType").get<std::string>();
            failure.entity_id = node.value("entityId", std::string());
            failure.sequence = node.value("sequence", std::uint64_t{0});
            failure.error = node.value("error", std::string());
            result.failures.push_back(std::move(failure));
        }
    } catch (const json::exception& e) {
        return Err<transfer::RestoreResult>(ErrorCode::Validation, std::string("malformed restoreResult: ") + e.what());
    }
    return Ok(std::move(result));
}

json restore_result_to_json(const transfer::RestoreResult& result) {
    json counts = json::object();
    for (const auto& [type, entry] : result.entity_counts) {
        counts[type] = {{"attempted", entry.attempted}, {"applied", entry.applied}, {"failed", entry.failed}};
    }
    json failures = json::array();
    for (const auto& failure : result.failures) {
        failures.push_back({
            {"entityType", failure.entity_type},
            {"entityId", failure.entity_id},
            {"sequence", failure.sequence},
            {"error", failure.error}
        });
    }
    return json{{"entityCounts", std::move(counts)}, {"failures", std::move(failures)}};
}

} // namespace fullsync::reconcile
