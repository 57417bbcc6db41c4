/**
 * @file config.hpp
 * @brief Engine configuration: entity schema, rules, and tuning knobs
 *
 * WHAT IT HOLDS:
 * - The entity schema in dependency order (referenced types first)
 * - Device-specific entity types that never leave an instance
 * - Expected-difference rules used by reconciliation
 * - Schema revision and migrations used by the convert phase
 * - Transfer, session and reconciliation settings
 *
 * Everything except the entity schema has a default. A config is
 * validated when loaded; a violation is reported as ErrorCode::Config.
 *
 * EXAMPLE:
 * auto config = load_config("fullsync.json");
 * if (config.is_error()) {
 *     spdlog::error("{}", config.error().describe());
 * }
 */

#pragma once

#include "fullsync/core/result.hpp"
#include "fullsync/core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace fullsync::core {

struct EntityDefinition {
    std::string name;
    /// field name -> referenced entity type
    std::map<std::string, std::string> references;
};

enum class Presence {
    Both,           ///< Record on both sides, field values differ
    SourceOnly,
    TargetOnly
};

[[nodiscard]] const char* to_string(Presence presence) noexcept;

/**
 * @brief Classifies a difference as expected or unexpected
 *
 * entity_type "*" matches any type, an empty field matches any field.
 * The narrowest matching rule wins.
 */
struct ExpectedDifferenceRule {
    std::string entity_type = "*";
    std::string field;
    Presence presence = Presence::Both;
    bool expected = true;
    std::string reason;
};

struct SchemaMigration {
    std::string from_revision;
    std::string to_revision;
    std::string entity_type = "*";
    std::map<std::string, std::string> rename_fields;
};

struct TransferSettings {
    std::size_t chunk_size = 64 * 1024;
    std::size_t batch_size = 100;
    std::size_t max_apply_retries = 3;
    std::size_t max_in_flight_batches = 4;
    bool compression = true;
    std::filesystem::path spool_dir = std::filesystem::temp_directory_path() / "fullsync-spool";
    std::string demo_flag_field = "is_demo";
};

struct SessionSettings {
    /// Keyed by phase name ("backup", "transfer", ...). Missing phases use default_phase_timeout.
    std::map<std::string, std::chrono::milliseconds> phase_timeouts;
    std::chrono::milliseconds default_phase_timeout{std::chrono::minutes(30)};
    std::size_t speed_window_samples = 10;
    std::chrono::milliseconds lease_ttl{30000};
    std::chrono::milliseconds heartbeat_interval{10000};
    std::chrono::milliseconds persist_interval{500};
    std::size_t worker_threads = 2;
    std::set<std::pair<Direction, Method>> supported {
        {Direction::Push, Method::Bulk},
        {Direction::Push, Method::Incremental},
        {Direction::Pull, Method::Bulk},
        {Direction::Pull, Method::Incremental},
    };
};

struct ReconciliationSettings {
    bool include_exact_matches = false;
    double failure_ratio = 0.05;
    std::size_t worker_threads = 4;
};

struct SyncConfig {
    std::string schema_revision = "1";
    std::vector<EntityDefinition> entities;
    std::vector<std::string> excluded_entity_types;
    std::vector<ExpectedDifferenceRule> expected_differences;
    std::vector<SchemaMigration> schema_migrations;
    TransferSettings transfer;
    SessionSettings session;
    ReconciliationSettings reconciliation;

    [[nodiscard]] const EntityDefinition* find_entity(const std::string& name) const;
    [[nodiscard]] bool is_excluded(const std::string& entity_type) const;

    /// Declared entity types in dependency order, excluded types removed.
    [[nodiscard]] std::vector<std::string> dependency_order() const;

    [[nodiscard]] std::chrono::milliseconds phase_timeout(const std::string& phase) const;
    [[nodiscard]] bool supports(Direction direction, Method method) const;
};

Result<SyncConfig> parse_config(const nlohmann::json& document);
Result<SyncConfig> load_config(const std::filesystem::path& path);

/// Checks the structural invariants of a config built in code.
Result<void> validate_config(const SyncConfig& config);

} // namespace fullsync::core
