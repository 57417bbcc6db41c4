#include "fullsync/reconcile/engine.hpp"
#include "fullsync/core/ids.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <set>

namespace fullsync::reconcile {
namespace {

using nlohmann::json;

std::string fields_json(const data::Record& record) {
    return json(record.fields).dump();
}

/// Only the named fields; an absent field is null.
std::string subset_json(const data::Record& record, const std::vector<std::string>& fields) {
    json subset = json::object();
    for (const auto& name : fields) {
        const auto* value = record.field(name);
        subset[name] = value ? json(*value) : json(nullptr);
    }
    return subset.dump();
}

std::vector<std::string> differing_fields(const data::Record& source, const data::Record& target) {
    std::vector<std::string> names;
    auto s = source.fields.begin();
    auto t = target.fields.begin();
    while (s != source.fields.end() || t != target.fields.end()) {
        if (t == target.fields.end() || (s != source.fields.end() && s->first < t->first)) {
            names.push_back(s->first);
            ++s;
        } else if (s == source.fields.end() || t->first < s->first) {
            names.push_back(t->first);
            ++t;
        } else {
            if (s->second != t->second) {
                names.push_back(s->first);
            }
            ++s;
            ++t;
        }
    }
    return names;
}

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) {
            joined += separator;
        }
        joined += part;
    }
    return joined;
}

} // namespace

OverallStatus overall_status_for(std::uint64_t unexpected, std::uint64_t compared, double failure_ratio) noexcept {
    if (unexpected == 0) {
        return OverallStatus::Clean;
    }
    if (compared == 0) {
        return OverallStatus::Failed;
    }
    const double ratio = static_cast<double>(unexpected) / static_cast<double>(compared);
    return ratio > failure_ratio ? OverallStatus::Failed : OverallStatus::Degraded;
}

ReconciliationEngine::ReconciliationEngine(const core::SyncConfig& config)
    : schema_order_(config.dependency_order()),
      excluded_(config.excluded_entity_types),
      rules_(config.expected_differences),
      settings_(config.reconciliation) {}

std::vector<std::string> ReconciliationEngine::comparison_order(const data::DatasetSnapshot& source,
                                                                const data::DatasetSnapshot& target) const {
    std::set<std::string> present;
    for (const auto& [type, table] : source) {
        present.insert(type);
    }
    for (const auto& [type, table] : target) {
        present.insert(type);
    }
    for (const auto& type : excluded_) {
        present.erase(type);
    }

    std::vector<std::string> order;
    for (const auto& type : schema_order_) {
        if (present.erase(type) > 0) {
            order.push_back(type);
        }
    }
    // Types outside the schema follow in name order.
    order.insert(order.end(), present.begin(), present.end());
    return order;
}

Result<ReconciliationReport> ReconciliationEngine::compare(const data::DatasetSnapshot& source,
                                                           const data::DatasetSnapshot& target,
                                                           Direction direction,
                                                           const std::string& session_id) const {
    const auto order = comparison_order(source, target);
    std::vector<EntityComparison> results(order.size());
    std::vector<std::optional<std::string>> failures(order.size());

    auto table_of = [](const data::DatasetSnapshot& snapshot, const std::string& type) -> const data::EntityTable* {
        const auto it = snapshot.find(type);
        return it == snapshot.end() ? nullptr : &it->second;
    };

    if (!order.empty()) {
        boost::asio::thread_pool pool(std::min(settings_.worker_threads, order.size()));
        for (std::size_t i = 0; i < order.size(); ++i) {
            boost::asio::post(pool, [&, i]() {
                try {
                    results[i] = compare_entity(order[i], table_of(source, order[i]), table_of(target, order[i]));
                } catch (const std::exception& e) {
                    failures[i] = e.what();
                }
            });
        }
        pool.join();
    }

    for (std::size_t i = 0; i < order.size(); ++i) {
        if (failures[i]) {
            return Err<ReconciliationReport>(ErrorCode::Internal,
                "reconciliation of " + order[i] + " failed: " + *failures[i]);
        }
    }

    ReconciliationReport report;
    report.id = generate_id("report");
    report.session_id = session_id;
    report.created_at = std::chrono::system_clock::now();
    report.direction = direction;
    for (auto& result : results) {
        report.exact_matches += result.summary.exact;
        report.expected_differences += result.summary.expected;
        report.unexpected_mismatches += result.summary.unexpected;
        report.entity_summaries.push_back(result.summary);
        std::move(result.findings.begin(), result.findings.end(), std::back_inserter(report.findings));
    }
    report.overall_status = overall_status_for(report.unexpected_mismatches, report.compared(), settings_.failure_ratio);

    spdlog::debug("[Reconcile] session={} types={} exact={} expected={} unexpected={} status={}",
                  session_id, order.size(), report.exact_matches, report.expected_differences,
                  report.unexpected_mismatches, to_string(report.overall_status));
    return Ok(std::move(report));
}

ReconciliationEngine::EntityComparison ReconciliationEngine::compare_entity(const std::string& entity_type,
                                                                            const data::EntityTable* source,
                                                                            const data::EntityTable* target) const {
    EntityComparison out;
    out.summary.entity_type = entity_type;

    static const data::EntityTable kEmpty;
    const auto& lhs = source ? *source : kEmpty;
    const auto& rhs = target ? *target : kEmpty;

    // Both tables are ordered by id, so a merge walk visits every key once.
    auto s = lhs.begin();
    auto t = rhs.begin();
    while (s != lhs.end() || t != rhs.end()) {
        if (t == rhs.end() || (s != lhs.end() && s->first < t->first)) {
            classify_one_side(s->second, core::Presence::SourceOnly, out);
            ++s;
        } else if (s == lhs.end() || t->first < s->first) {
            classify_one_side(t->second, core::Presence::TargetOnly, out);
            ++t;
        } else {
            if (s->second.fields == t->second.fields) {
                add_exact(s->second, t->second, out);
            } else {
                classify_both(s->second, t->second, out);
            }
            ++s;
            ++t;
        }
        ++out.summary.compared;
    }
    return out;
}

void ReconciliationEngine::add_exact(const data::Record& source, const data::Record& target, EntityComparison& out) const {
    ++out.summary.exact;
    if (settings_.include_exact_matches) {
        out.findings.push_back(Finding{source.entity_type, source.id, Classification::ExactMatch,
                                       fields_json(source), fields_json(target), "EXACT"});
    }
}

void ReconciliationEngine::classify_both(const data::Record& source,
                                         const data::Record& target,
                                         EntityComparison& out) const {
    const auto fields = differing_fields(source, target);

    std::vector<std::string> unexpected_fields;
    std::string unexpected_reason;
    std::set<std::string> expected_reasons;
    for (const auto& field : fields) {
        const auto verdict = rules_.field_verdict(source.entity_type, field);
        if (verdict && verdict->expected) {
            expected_reasons.insert(verdict->reason.empty() ? "EXPECTED_DIFFERENCE" : verdict->reason);
            continue;
        }
        unexpected_fields.push_back(field);
        if (verdict && unexpected_reason.empty() && !verdict->reason.empty()) {
            unexpected_reason = verdict->reason;
        }
    }

    Finding finding;
    finding.entity_type = source.entity_type;
    finding.entity_id = source.id;
    finding.source_value = subset_json(source, fields);
    finding.target_value = subset_json(target, fields);
    if (unexpected_fields.empty()) {
        finding.classification = Classification::ExpectedDifference;
        finding.reason_code = join(std::vector<std::string>(expected_reasons.begin(), expected_reasons.end()), ",");
        ++out.summary.expected;
    } else {
        finding.classification = Classification::UnexpectedMismatch;
        finding.reason_code = unexpected_reason.empty()
            ? "FIELD_MISMATCH:" + join(unexpected_fields, ",")
            : unexpected_reason;
        ++out.summary.unexpected;
    }
    out.findings.push_back(std::move(finding));
}

void ReconciliationEngine::classify_one_side(const data::Record& record,
                                             core::Presence presence,
                                             EntityComparison& out) const {
    const bool in_source = presence == core::Presence::SourceOnly;
    const auto verdict = rules_.presence_verdict(record.entity_type, presence);

    Finding finding;
    finding.entity_type = record.entity_type;
    finding.entity_id = record.id;
    (in_source ? finding.source_value : finding.target_value) = fields_json(record);

    if (verdict && verdict->expected) {
        finding.classification = Classification::ExpectedDifference;
        finding.reason_code = verdict->reason.empty() ? "EXPECTED_DIFFERENCE" : verdict->reason;
        ++out.summary.expected;
    } else {
        finding.classification = Classification::UnexpectedMismatch;
        if (verdict && !verdict->reason.empty()) {
            finding.reason_code = verdict->reason;
        } else {
            finding.reason_code = in_source ? "MISSING_IN_TARGET" : "EXTRA_IN_TARGET";
        }
        ++out.summary.unexpected;
    }
    out.findings.push_back(std::move(finding));
}

} // namespace fullsync::reconcile
