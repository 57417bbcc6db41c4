#pragma once

/**
 * @file dataset.hpp
 * @brief Thread-safe in-memory table set for one database instance
 *
 * WHY THIS FILE EXISTS:
 * The engine moves records between two instances of the same schema.
 * Dataset is the storage behind InMemoryDatabase: a table per entity
 * type, ordered by id, guarded by a reader-writer lock.
 *
 * THREAD SAFETY PATTERN:
 * - Readers (get, list, snapshot) take std::shared_lock
 * - Writers (upsert, apply, remove) take std::unique_lock
 * - apply() writes a whole batch under one lock, so readers see
 *   either none or all of it
 *
 * EXAMPLE USAGE:
 * Dataset dataset;
 * dataset.upsert(Record{"product", "p-1", {{"name", "Tea"}}});
 * auto product = dataset.get("product", "p-1");
 */

#include "fullsync/core/result.hpp"
#include "fullsync/data/record.hpp"

#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace fullsync::data {

class Dataset {
public:
    /// Insert or replace by (entity_type, id).
    void upsert(Record record) {
        std::unique_lock lock(mutex_);
        insert_record(tables_, std::move(record));
    }

    /**
     * @brief Upsert a batch atomically
     *
     * Readers never observe a partially applied batch.
     */
    void apply(std::vector<Record> records) {
        std::unique_lock lock(mutex_);
        for (auto& record : records) {
            insert_record(tables_, std::move(record));
        }
    }

    /// Replace the whole content (bulk restore commit).
    void replace_with(DatasetSnapshot snapshot) {
        std::unique_lock lock(mutex_);
        tables_ = std::move(snapshot);
    }

    Result<Record> get(const std::string& entity_type, const std::string& id) const {
        std::shared_lock lock(mutex_);
        const auto table = tables_.find(entity_type);
        if (table == tables_.end()) {
            return Err<Record>(ErrorCode::NotFound, "no records of type '" + entity_type + "'");
        }
        const auto it = table->second.find(id);
        if (it == table->second.end()) {
            return Err<Record>(ErrorCode::NotFound, entity_type + ":" + id + " not found");
        }
        return Ok(it->second);
    }

    bool contains(const std::string& entity_type, const std::string& id) const {
        std::shared_lock lock(mutex_);
        const auto table = tables_.find(entity_type);
        return table != tables_.end() && table->second.count(id) > 0;
    }

    Result<void> remove(const std::string& entity_type, const std::string& id) {
        std::unique_lock lock(mutex_);
        const auto table = tables_.find(entity_type);
        if (table == tables_.end() || table->second.erase(id) == 0) {
            return Err<void>(ErrorCode::NotFound, entity_type + ":" + id + " not found");
        }
        return Ok();
    }

    /// Records of one type, ascending by id.
    std::vector<Record> list(const std::string& entity_type) const {
        std::shared_lock lock(mutex_);
        std::vector<Record> records;
        const auto table = tables_.find(entity_type);
        if (table == tables_.end()) {
            return records;
        }
        records.reserve(table->second.size());
        for (const auto& [id, record] : table->second) {
            records.push_back(record);
        }
        return records;
    }

    std::vector<std::string> entity_types() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> types;
        for (const auto& [type, table] : tables_) {
            if (!table.empty()) {
                types.push_back(type);
            }
        }
        return types;
    }

    DatasetSnapshot snapshot() const {
        std::shared_lock lock(mutex_);
        return tables_;
    }

    std::size_t size() const {
        std::shared_lock lock(mutex_);
        std::size_t total = 0;
        for (const auto& [type, table] : tables_) {
            total += table.size();
        }
        return total;
    }

    std::size_t count(const std::string& entity_type) const {
        std::shared_lock lock(mutex_);
        const auto table = tables_.find(entity_type);
        return table == tables_.end() ? 0 : table->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        tables_.clear();
    }

private:
    DatasetSnapshot tables_;
    mutable std::shared_mutex mutex_;
};

} // namespace fullsync::data
