/**
 * @file database.hpp
 * @brief Seam between the engine and a database instance
 *
 * WHY THIS FILE EXISTS:
 * The engine never touches a storage engine directly. Reading rows,
 * upserting batches and running a staged restore all go through
 * DatabaseHandle, so a real dump/restore backend plugs in by implementing
 * two small interfaces. InMemoryDatabase is the implementation used by the
 * example programs and the tests.
 *
 * RESTORE MODEL:
 * begin_restore() hands out a RestoreTransaction. Records are staged,
 * optionally transformed (schema conversion), then committed in one step.
 * A transaction destroyed without commit leaves the instance untouched.
 */

#pragma once

#include "fullsync/core/result.hpp"
#include "fullsync/data/dataset.hpp"
#include "fullsync/data/record.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace fullsync::data {

class RestoreTransaction {
public:
    virtual ~RestoreTransaction() = default;

    virtual Result<void> stage(Record record) = 0;

    /// Apply fn to every staged record in staging order.
    virtual void transform(const std::function<void(Record&)>& fn) = 0;

    [[nodiscard]] virtual std::size_t staged_count() const = 0;

    /// All-or-nothing. Returns the number of records written.
    virtual Result<std::size_t> commit() = 0;
};

class DatabaseHandle {
public:
    virtual ~DatabaseHandle() = default;

    [[nodiscard]] virtual const std::string& name() const = 0;
    [[nodiscard]] virtual std::string schema_revision() const = 0;

    /// Records of one type, ascending by id.
    virtual Result<std::vector<Record>> read_table(const std::string& entity_type) const = 0;

    [[nodiscard]] virtual bool contains(const std::string& entity_type, const std::string& id) const = 0;

    /// Upsert every record of the batch or none of them.
    virtual Result<void> upsert_batch(const std::vector<Record>& batch) = 0;

    virtual Result<std::unique_ptr<RestoreTransaction>> begin_restore() = 0;
};

class InMemoryDatabase : public DatabaseHandle {
public:
    explicit InMemoryDatabase(std::string name, std::string schema_revision = "1");

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] std::string schema_revision() const override;
    void set_schema_revision(std::string revision);

    Result<std::vector<Record>> read_table(const std::string& entity_type) const override;
    [[nodiscard]] bool contains(const std::string& entity_type, const std::string& id) const override;
    Result<void> upsert_batch(const std::vector<Record>& batch) override;
    Result<std::unique_ptr<RestoreTransaction>> begin_restore() override;

    Dataset& dataset() noexcept { return dataset_; }
    const Dataset& dataset() const noexcept { return dataset_; }

private:
    std::string name_;
    std::string schema_revision_;
    mutable std::mutex revision_mutex_;
    Dataset dataset_;
};

/**
 * @brief Reads the given entity types of a handle into memory
 *
 * Used by the verify phase and the validation surface. keep decides per
 * record whether it is part of the view (filters).
 */
Result<DatasetSnapshot> export_snapshot(const DatabaseHandle& handle,
                                        const std::vector<std::string>& entity_types,
                                        const std::function<bool(const Record&)>& keep = {});

} // namespace fullsync::data
