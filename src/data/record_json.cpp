#include "fullsync/data/record_json.hpp"

namespace fullsync::data {

void to_json(nlohmann::json& j, const Record& record) {
    j = nlohmann::json{
        {"entity_type", record.entity_type},
        {"id", record.id},
        {"fields", record.fields}
    };
}

void from_json(const nlohmann::json& j, Record& record) {
    j.at("entity_type").get_to(record.entity_type);
    j.at("id").get_to(record.id);
    record.fields.clear();
    if (!j.contains("fields")) {
        return;
    }
    for (const auto& [name, value] : j.at("fields").items()) {
        // Non-string scalars are kept in their JSON text form.
        record.fields[name] = value.is_string() ? value.get<std::string>() : value.dump();
    }
}

void to_json(nlohmann::json& j, const FilterOptions& filter) {
    j = nlohmann::json{
        {"entity_types", filter.entity_types},
        {"field_equals", filter.field_equals},
        {"include_demo_data", filter.include_demo_data}
    };
}

void from_json(const nlohmann::json& j, FilterOptions& filter) {
    filter = FilterOptions{};
    if (j.contains("entity_types")) {
        j.at("entity_types").get_to(filter.entity_types);
    }
    if (j.contains("field_equals")) {
        j.at("field_equals").get_to(filter.field_equals);
    }
    filter.include_demo_data = j.value("include_demo_data", true);
}

Result<std::vector<Record>> records_from_json(const nlohmann::json& array) {
    if (!array.is_array()) {
        return Err<std::vector<Record>>(ErrorCode::Validation, "expected an array of records");
    }
    try {
        return Ok(array.get<std::vector<Record>>());
    } catch (const nlohmann::json::exception& e) {
        return Err<std::vector<Record>>(ErrorCode::Validation, std::string("malformed record: ") + e.what());
    }
}

} // namespace fullsync::data
