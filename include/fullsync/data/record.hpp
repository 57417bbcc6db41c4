#pragma once

#include <map>
#include <string>
#include <vector>

namespace fullsync::data {

/**
 * @brief One row of one entity type
 *
 * Natural identifier is (entity_type, id). Field values are kept as text;
 * the engine never interprets them beyond equality and reference lookups.
 */
struct Record {
    std::string entity_type;
    std::string id;
    std::map<std::string, std::string> fields;

    /// Field value or nullptr when absent.
    [[nodiscard]] const std::string* field(const std::string& name) const {
        const auto it = fields.find(name);
        return it == fields.end() ? nullptr : &it->second;
    }

    bool operator==(const Record& other) const {
        return entity_type == other.entity_type && id == other.id && fields == other.fields;
    }
    bool operator!=(const Record& other) const { return !(*this == other); }
};

/// id -> record, ordered ascending by id.
using EntityTable = std::map<std::string, Record>;

/// entity type -> table. The in-memory view of one side used by reconciliation.
using DatasetSnapshot = std::map<std::string, EntityTable>;

inline void insert_record(DatasetSnapshot& snapshot, Record record) {
    auto& table = snapshot[record.entity_type];
    auto id = record.id;
    table.insert_or_assign(std::move(id), std::move(record));
}

inline DatasetSnapshot make_snapshot(std::vector<Record> records) {
    DatasetSnapshot snapshot;
    for (auto& record : records) {
        insert_record(snapshot, std::move(record));
    }
    return snapshot;
}

} // namespace fullsync::data
