#pragma once

#include "fullsync/core/config.hpp"
#include "fullsync/core/result.hpp"
#include "fullsync/data/database.hpp"
#include "fullsync/data/record.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace fullsync::transfer {

/**
 * @brief Adapts records between schema revisions
 *
 * Migrations form a graph of revision steps. plan() finds the shortest
 * chain of steps from one revision to another; every migration belonging
 * to a step is applied in declaration order.
 */
class SchemaConverter {
public:
    explicit SchemaConverter(std::vector<core::SchemaMigration> migrations);

    /// Empty plan when from == to. No path is a Validation error.
    Result<std::vector<const core::SchemaMigration*>> plan(const std::string& from, const std::string& to) const;

    /// Returns true when the record changed.
    static bool apply(const std::vector<const core::SchemaMigration*>& plan, data::Record& record);

    /// Converts every staged record of a restore transaction. Returns the number changed.
    Result<std::size_t> convert(data::RestoreTransaction& transaction,
                                const std::string& from,
                                const std::string& to) const;

private:
    std::vector<core::SchemaMigration> migrations_;
};

} // namespace fullsync::transfer
