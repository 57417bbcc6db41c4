#pragma once

#include "fullsync/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fullsync::reconcile {

enum class Classification {
    ExactMatch,
    ExpectedDifference,
    UnexpectedMismatch
};

enum class OverallStatus {
    Clean,      ///< No unexpected mismatches
    Degraded,   ///< Unexpected mismatches within the tolerated ratio
    Failed      ///< Unexpected mismatches above the tolerated ratio
};

[[nodiscard]] const char* to_string(Classification classification) noexcept;
[[nodiscard]] const char* to_string(OverallStatus status) noexcept;
[[nodiscard]] std::optional<Classification> classification_from_string(std::string_view text) noexcept;
[[nodiscard]] std::optional<OverallStatus> overall_status_from_string(std::string_view text) noexcept;

struct Finding {
    std::string entity_type;
    std::string entity_id;
    Classification classification = Classification::ExactMatch;
    std::string source_value;   ///< JSON text, empty when absent on the source
    std::string target_value;   ///< JSON text, empty when absent on the target
    std::string reason_code;
};

struct EntitySummary {
    std::string entity_type;
    std::uint64_t compared = 0;
    std::uint64_t exact = 0;
    std::uint64_t expected = 0;
    std::uint64_t unexpected = 0;
};

/**
 * @brief Result of comparing two data sets after a sync
 *
 * Built once by the engine and never modified afterwards. Findings are
 * ordered by comparison order of entity types, then by id.
 */
struct ReconciliationReport {
    std::string id;
    std::string session_id;
    std::chrono::system_clock::time_point created_at{};
    Direction direction = Direction::Push;

    std::uint64_t exact_matches = 0;
    std::uint64_t expected_differences = 0;
    std::uint64_t unexpected_mismatches = 0;

    std::vector<Finding> findings;
    std::vector<EntitySummary> entity_summaries;
    OverallStatus overall_status = OverallStatus::Clean;

    [[nodiscard]] std::uint64_t compared() const noexcept {
        return exact_matches + expected_differences + unexpected_mismatches;
    }
};

} // namespace fullsync::reconcile
