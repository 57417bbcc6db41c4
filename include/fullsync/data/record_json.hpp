#pragma once

#include "fullsync/core/result.hpp"
#include "fullsync/data/filter.hpp"
#include "fullsync/data/record.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace fullsync::data {

// nlohmann ADL hooks. Record JSON: {"entity_type": ..., "id": ..., "fields": {...}}
void to_json(nlohmann::json& j, const Record& record);
void from_json(const nlohmann::json& j, Record& record);

void to_json(nlohmann::json& j, const FilterOptions& filter);
void from_json(const nlohmann::json& j, FilterOptions& filter);

/// Non-throwing parse of an array of records (API payloads).
Result<std::vector<Record>> records_from_json(const nlohmann::json& array);

} // namespace fullsync::data
