#include "fullsync/data/filter.hpp"

#include <algorithm>

namespace fullsync::data {
namespace {

bool is_truthy(const std::string& value) {
    return value == "1" || value == "true" || value == "TRUE" || value == "yes";
}

} // namespace

Result<std::vector<std::string>> resolve_scope(const core::SyncConfig& config, const FilterOptions& filter) {
    for (const auto& type : filter.entity_types) {
        if (config.find_entity(type) == nullptr) {
            return Err<std::vector<std::string>>(ErrorCode::Validation,
                "filter names unknown entity type '" + type + "'");
        }
        if (config.is_excluded(type)) {
            return Err<std::vector<std::string>>(ErrorCode::Validation,
                "entity type '" + type + "' is device-specific and never synchronised");
        }
    }

    auto order = config.dependency_order();
    if (filter.entity_types.empty()) {
        return Ok(std::move(order));
    }

    std::vector<std::string> scope;
    for (const auto& type : order) {
        if (std::find(filter.entity_types.begin(), filter.entity_types.end(), type) != filter.entity_types.end()) {
            scope.push_back(type);
        }
    }
    return Ok(std::move(scope));
}

RecordFilter::RecordFilter(FilterOptions options, std::string demo_flag_field)
    : options_(std::move(options)), demo_flag_field_(std::move(demo_flag_field)) {}

bool RecordFilter::matches(const Record& record) const {
    if (!options_.include_demo_data && !demo_flag_field_.empty()) {
        const auto* flag = record.field(demo_flag_field_);
        if (flag != nullptr && is_truthy(*flag)) {
            return false;
        }
    }
    for (const auto& [field, expected] : options_.field_equals) {
        const auto* value = record.field(field);
        if (value != nullptr && *value != expected) {
            return false;
        }
    }
    return true;
}

} // namespace fullsync::data
