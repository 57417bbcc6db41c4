#pragma once

#include "fullsync/core/config.hpp"
#include "fullsync/core/result.hpp"
#include "fullsync/data/record.hpp"
#include "fullsync/reconcile/engine.hpp"
#include "fullsync/reconcile/types.hpp"
#include "fullsync/transfer/types.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace fullsync::reconcile {

/**
 * @brief Reconciliation on demand, outside of a session
 *
 * Accepts either two raw record sets or the apply statistics of an earlier
 * restore, and answers with a report that is not stored anywhere.
 *
 * Request forms:
 *   {"direction": "push", "source": [records], "target": [records]}
 *   {"restoreResult": {"entityCounts": {type: {attempted, applied, failed}},
 *                      "failures": [{entityType, entityId, sequence, error}]}}
 */
class ValidationService {
public:
    explicit ValidationService(const core::SyncConfig& config);

    Result<ReconciliationReport> validate_records(std::vector<data::Record> source,
                                                  std::vector<data::Record> target,
                                                  Direction direction) const;

    [[nodiscard]] ReconciliationReport validate_restore(const transfer::RestoreResult& result,
                                                        Direction direction = Direction::Push) const;

    Result<ReconciliationReport> validate(const nlohmann::json& request) const;

private:
    ReconciliationEngine engine_;
    double failure_ratio_;
};

Result<transfer::RestoreResult> restore_result_from_json(const nlohmann::json& document);
nlohmann::json restore_result_to_json(const transfer::RestoreResult& result);

} // namespace fullsync::reconcile
