#pragma once

#include "fullsync/core/config.hpp"
#include "fullsync/core/result.hpp"
#include "fullsync/data/record.hpp"

#include <map>
#include <string>
#include <vector>

namespace fullsync::data {

/**
 * @brief Narrows what a session moves and reconciles
 *
 * entity_types empty means every type declared in the schema.
 * field_equals keeps records whose field equals the value (for example
 * business_id); records without that field are kept, so shared reference
 * data travels with every business.
 */
struct FilterOptions {
    std::vector<std::string> entity_types;
    std::map<std::string, std::string> field_equals;
    bool include_demo_data = true;
};

/**
 * @brief Entity types a session covers, in dependency order
 *
 * Excluded types are dropped. A type that the schema does not declare is a
 * Validation error.
 */
Result<std::vector<std::string>> resolve_scope(const core::SyncConfig& config, const FilterOptions& filter);

class RecordFilter {
public:
    RecordFilter(FilterOptions options, std::string demo_flag_field);

    [[nodiscard]] bool matches(const Record& record) const;

private:
    FilterOptions options_;
    std::string demo_flag_field_;
};

} // namespace fullsync::data
