#pragma once

#include "fullsync/core/config.hpp"
#include "fullsync/core/result.hpp"
#include "fullsync/data/record.hpp"
#include "fullsync/reconcile/rules.hpp"
#include "fullsync/reconcile/types.hpp"

#include <string>
#include <vector>

namespace fullsync::reconcile {

/**
 * @brief Row-by-row comparison of two data sets
 *
 * Both sides are indexed by (entity type, id). Each key ends up as an exact
 * match, an expected difference (a rule says so) or an unexpected mismatch.
 * Entity types are compared on a worker pool and merged in comparison
 * order: schema dependency order first, then undeclared types by name.
 * Excluded types are never compared.
 */
class ReconciliationEngine {
public:
    explicit ReconciliationEngine(const core::SyncConfig& config);

    Result<ReconciliationReport> compare(const data::DatasetSnapshot& source,
                                         const data::DatasetSnapshot& target,
                                         Direction direction,
                                         const std::string& session_id = {}) const;

    [[nodiscard]] std::vector<std::string> comparison_order(const data::DatasetSnapshot& source,
                                                            const data::DatasetSnapshot& target) const;

private:
    struct EntityComparison {
        EntitySummary summary;
        std::vector<Finding> findings;
    };

    EntityComparison compare_entity(const std::string& entity_type,
                                    const data::EntityTable* source,
                                    const data::EntityTable* target) const;

    void classify_both(const data::Record& source, const data::Record& target, EntityComparison& out) const;
    void classify_one_side(const data::Record& record, core::Presence presence, EntityComparison& out) const;
    void add_exact(const data::Record& source, const data::Record& target, EntityComparison& out) const;

    std::vector<std::string> schema_order_;
    std::vector<std::string> excluded_;
    DifferenceRules rules_;
    core::ReconciliationSettings settings_;
};

/// clean when nothing is unexpected; failed above the ratio; degraded otherwise.
[[nodiscard]] OverallStatus overall_status_for(std::uint64_t unexpected, std::uint64_t compared, double failure_ratio) noexcept;

} // namespace fullsync::reconcile
