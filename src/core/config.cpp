#include "fullsync/core/config.hpp"

#include <algorithm>
#include <fstream>
#include <unordered_set>

namespace fullsync::core {
namespace {

using nlohmann::json;

Result<Presence> parse_presence(const std::string& text) {
    if (text == "both") {
        return Ok(Presence::Both);
    }
    if (text == "source_only") {
        return Ok(Presence::SourceOnly);
    }
    if (text == "target_only") {
        return Ok(Presence::TargetOnly);
    }
    return Err<Presence>(ErrorCode::Config, "unknown presence '" + text + "'");
}

std::chrono::milliseconds millis(const json& node, const char* key, std::chrono::milliseconds fallback) {
    if (!node.contains(key)) {
        return fallback;
    }
    return std::chrono::milliseconds(node.at(key).get<std::int64_t>());
}

Result<void> parse_entities(const json& document, SyncConfig& config) {
    if (!document.contains("entities")) {
        return Ok();
    }
    if (!document.at("entities").is_array()) {
        return Err<void>(ErrorCode::Config, "'entities' must be an array");
    }
    for (const auto& node : document.at("entities")) {
        EntityDefinition entity;
        if (node.is_string()) {
            entity.name = node.get<std::string>();
        } else {
            entity.name = node.at("name").get<std::string>();
            if (node.contains("references")) {
                entity.references = node.at("references").get<std::map<std::string, std::string>>();
            }
        }
        config.entities.push_back(std::move(entity));
    }
    return Ok();
}

Result<void> parse_rules(const json& document, SyncConfig& config) {
    if (!document.contains("expected_differences")) {
        return Ok();
    }
    for (const auto& node : document.at("expected_differences")) {
        ExpectedDifferenceRule rule;
        rule.entity_type = node.value("entity_type", std::string("*"));
        rule.field = node.value("field", std::string());
        rule.reason = node.value("reason", std::string());

        auto presence = parse_presence(node.value("presence", std::string("both")));
        if (presence.is_error()) {
            return Err<void>(presence.error());
        }
        rule.presence = presence.value();

        const auto classification = node.value("classification", std::string("expected"));
        if (classification != "expected" && classification != "unexpected") {
            return Err<void>(ErrorCode::Config, "unknown classification '" + classification + "'");
        }
        rule.expected = classification == "expected";
        config.expected_differences.push_back(std::move(rule));
    }
    return Ok();
}

void parse_migrations(const json& document, SyncConfig& config) {
    if (!document.contains("schema_migrations")) {
        return;
    }
    for (const auto& node : document.at("schema_migrations")) {
        SchemaMigration migration;
        migration.from_revision = node.at("from").get<std::string>();
        migration.to_revision = node.at("to").get<std::string>();
        migration.entity_type = node.value("entity_type", std::string("*"));
        if (node.contains("rename_fields")) {
            migration.rename_fields = node.at("rename_fields").get<std::map<std::string, std::string>>();
        }
        config.schema_migrations.push_back(std::move(migration));
    }
}

void parse_transfer(const json& node, TransferSettings& transfer) {
    transfer.chunk_size = node.value("chunk_size", transfer.chunk_size);
    transfer.batch_size = node.value("batch_size", transfer.batch_size);
    transfer.max_apply_retries = node.value("max_apply_retries", transfer.max_apply_retries);
    transfer.max_in_flight_batches = node.value("max_in_flight_batches", transfer.max_in_flight_batches);
    transfer.compression = node.value("compression", transfer.compression);
    if (node.contains("spool_dir")) {
        transfer.spool_dir = node.at("spool_dir").get<std::string>();
    }
    transfer.demo_flag_field = node.value("demo_flag_field", transfer.demo_flag_field);
}

Result<void> parse_session(const json& node, SessionSettings& session) {
    if (node.contains("phase_timeouts_ms")) {
        for (const auto& [phase, value] : node.at("phase_timeouts_ms").items()) {
            session.phase_timeouts[phase] = std::chrono::milliseconds(value.get<std::int64_t>());
        }
    }
    session.default_phase_timeout = millis(node, "default_phase_timeout_ms", session.default_phase_timeout);
    session.speed_window_samples = node.value("speed_window_samples", session.speed_window_samples);
    session.lease_ttl = millis(node, "lease_ttl_ms", session.lease_ttl);
    session.heartbeat_interval = millis(node, "heartbeat_interval_ms", session.heartbeat_interval);
    session.persist_interval = millis(node, "persist_interval_ms", session.persist_interval);
    session.worker_threads = node.value("worker_threads", session.worker_threads);

    if (node.contains("supported")) {
        session.supported.clear();
        for (const auto& entry : node.at("supported")) {
            const auto direction = direction_from_string(entry.at("direction").get<std::string>());
            const auto method = method_from_string(entry.at("method").get<std::string>());
            if (!direction || !method) {
                return Err<void>(ErrorCode::Config, "unknown direction/method in 'session.supported': " + entry.dump());
            }
            session.supported.emplace(*direction, *method);
        }
    }
    return Ok();
}

void parse_reconciliation(const json& node, ReconciliationSettings& reconciliation) {
    reconciliation.include_exact_matches = node.value("include_exact_matches", reconciliation.include_exact_matches);
    reconciliation.failure_ratio = node.value("failure_ratio", reconciliation.failure_ratio);
    reconciliation.worker_threads = node.value("worker_threads", reconciliation.worker_threads);
}

} // namespace

const char* to_string(Presence presence) noexcept {
    switch (presence) {
        case Presence::Both: return "both";
        case Presence::SourceOnly: return "source_only";
        case Presence::TargetOnly: return "target_only";
    }
    return "both";
}

const EntityDefinition* SyncConfig::find_entity(const std::string& name) const {
    const auto it = std::find_if(entities.begin(), entities.end(),
        [&name](const EntityDefinition& entity) { return entity.name == name; });
    return it == entities.end() ? nullptr : &*it;
}

bool SyncConfig::is_excluded(const std::string& entity_type) const {
    return std::find(excluded_entity_types.begin(), excluded_entity_types.end(), entity_type)
        != excluded_entity_types.end();
}

std::vector<std::string> SyncConfig::dependency_order() const {
    std::vector<std::string> order;
    order.reserve(entities.size());
    for (const auto& entity : entities) {
        if (!is_excluded(entity.name)) {
            order.push_back(entity.name);
        }
    }
    return order;
}

std::chrono::milliseconds SyncConfig::phase_timeout(const std::string& phase) const {
    const auto it = session.phase_timeouts.find(phase);
    return it == session.phase_timeouts.end() ? session.default_phase_timeout : it->second;
}

bool SyncConfig::supports(Direction direction, Method method) const {
    return session.supported.count({direction, method}) > 0;
}

Result<void> validate_config(const SyncConfig& config) {
    std::unordered_set<std::string> declared;
    for (const auto& entity : config.entities) {
        if (entity.name.empty()) {
            return Err<void>(ErrorCode::Config, "entity with empty name");
        }
        if (!declared.insert(entity.name).second) {
            return Err<void>(ErrorCode::Config, "entity '" + entity.name + "' declared twice");
        }
        for (const auto& [field, target] : entity.references) {
            if (target == entity.name) {
                continue;
            }
            if (declared.count(target) == 0) {
                return Err<void>(ErrorCode::Config,
                    "entity '" + entity.name + "' field '" + field + "' references '" + target +
                    "' which is not declared before it");
            }
        }
    }

    const auto& transfer = config.transfer;
    if (transfer.chunk_size == 0 || transfer.batch_size == 0 || transfer.max_in_flight_batches == 0) {
        return Err<void>(ErrorCode::Config, "transfer chunk_size, batch_size and max_in_flight_batches must be positive");
    }
    if (config.session.speed_window_samples == 0) {
        return Err<void>(ErrorCode::Config, "session.speed_window_samples must be positive");
    }
    if (config.session.worker_threads == 0 || config.reconciliation.worker_threads == 0) {
        return Err<void>(ErrorCode::Config, "worker_threads must be positive");
    }
    if (config.session.heartbeat_interval >= config.session.lease_ttl) {
        return Err<void>(ErrorCode::Config, "session.heartbeat_interval_ms must be shorter than lease_ttl_ms");
    }
    if (config.reconciliation.failure_ratio < 0.0 || config.reconciliation.failure_ratio > 1.0) {
        return Err<void>(ErrorCode::Config, "reconciliation.failure_ratio must be within [0, 1]");
    }
    for (const auto& migration : config.schema_migrations) {
        if (migration.from_revision.empty() || migration.to_revision.empty() ||
            migration.from_revision == migration.to_revision) {
            return Err<void>(ErrorCode::Config, "schema migration needs distinct 'from' and 'to' revisions");
        }
    }
    return Ok();
}

Result<SyncConfig> parse_config(const nlohmann::json& document) {
    if (!document.is_object()) {
        return Err<SyncConfig>(ErrorCode::Config, "config root must be an object");
    }

    SyncConfig config;
    try {
        config.schema_revision = document.value("schema_revision", config.schema_revision);

        auto entities = parse_entities(document, config);
        if (entities.is_error()) {
            return Err<SyncConfig>(entities.error());
        }
        if (document.contains("excluded_entity_types")) {
            config.excluded_entity_types = document.at("excluded_entity_types").get<std::vector<std::string>>();
        }
        auto rules = parse_rules(document, config);
        if (rules.is_error()) {
            return Err<SyncConfig>(rules.error());
        }
        parse_migrations(document, config);

        if (document.contains("transfer")) {
            parse_transfer(document.at("transfer"), config.transfer);
        }
        if (document.contains("session")) {
            auto session = parse_session(document.at("session"), config.session);
            if (session.is_error()) {
                return Err<SyncConfig>(session.error());
            }
        }
        if (document.contains("reconciliation")) {
            parse_reconciliation(document.at("reconciliation"), config.reconciliation);
        }
    } catch (const nlohmann::json::exception& e) {
        return Err<SyncConfig>(ErrorCode::Config, std::string("malformed config: ") + e.what());
    }

    auto valid = validate_config(config);
    if (valid.is_error()) {
        return Err<SyncConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<SyncConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<SyncConfig>(ErrorCode::Config, "cannot open config file " + path.string());
    }
    auto document = nlohmann::json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return Err<SyncConfig>(ErrorCode::Config, "config file " + path.string() + " is not valid JSON");
    }
    return parse_config(document);
}

} // namespace fullsync::core
