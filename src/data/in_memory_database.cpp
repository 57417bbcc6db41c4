#include "fullsync/data/database.hpp"

namespace fullsync::data {
namespace {

class InMemoryRestoreTransaction : public RestoreTransaction {
public:
    explicit InMemoryRestoreTransaction(Dataset& target) : target_(target) {}

    Result<void> stage(Record record) override {
        if (committed_) {
            return Err<void>(ErrorCode::Internal, "restore transaction already committed");
        }
        if (record.entity_type.empty() || record.id.empty()) {
            return Err<void>(ErrorCode::Apply, "record without entity type or id");
        }
        staged_.push_back(std::move(record));
        return Ok();
    }

    void transform(const std::function<void(Record&)>& fn) override {
        for (auto& record : staged_) {
            fn(record);
        }
    }

    [[nodiscard]] std::size_t staged_count() const override { return staged_.size(); }

    Result<std::size_t> commit() override {
        if (committed_) {
            return Err<std::size_t>(ErrorCode::Internal, "restore transaction already committed");
        }
        const std::size_t written = staged_.size();
        target_.apply(std::move(staged_));
        staged_.clear();
        committed_ = true;
        return Ok(written);
    }

private:
    Dataset& target_;
    std::vector<Record> staged_;
    bool committed_ = false;
};

} // namespace

InMemoryDatabase::InMemoryDatabase(std::string name, std::string schema_revision)
    : name_(std::move(name)), schema_revision_(std::move(schema_revision)) {}

std::string InMemoryDatabase::schema_revision() const {
    std::lock_guard<std::mutex> lock(revision_mutex_);
    return schema_revision_;
}

void InMemoryDatabase::set_schema_revision(std::string revision) {
    std::lock_guard<std::mutex> lock(revision_mutex_);
    schema_revision_ = std::move(revision);
}

Result<std::vector<Record>> InMemoryDatabase::read_table(const std::string& entity_type) const {
    return Ok(dataset_.list(entity_type));
}

bool InMemoryDatabase::contains(const std::string& entity_type, const std::string& id) const {
    return dataset_.contains(entity_type, id);
}

Result<void> InMemoryDatabase::upsert_batch(const std::vector<Record>& batch) {
    for (const auto& record : batch) {
        if (record.entity_type.empty() || record.id.empty()) {
            return Err<void>(ErrorCode::Apply, "record without entity type or id in batch");
        }
    }
    dataset_.apply(batch);
    return Ok();
}

Result<std::unique_ptr<RestoreTransaction>> InMemoryDatabase::begin_restore() {
    return Ok<std::unique_ptr<RestoreTransaction>>(std::make_unique<InMemoryRestoreTransaction>(dataset_));
}

Result<DatasetSnapshot> export_snapshot(const DatabaseHandle& handle,
                                        const std::vector<std::string>& entity_types,
                                        const std::function<bool(const Record&)>& keep) {
    DatasetSnapshot snapshot;
    for (const auto& type : entity_types) {
        auto rows = handle.read_table(type);
        if (rows.is_error()) {
            return Err<DatasetSnapshot>(rows.error());
        }
        auto& table = snapshot[type];
        for (auto& record : rows.value()) {
            if (keep && !keep(record)) {
                continue;
            }
            auto id = record.id;
            table.emplace(std::move(id), std::move(record));
        }
    }
    return Ok(std::move(snapshot));
}

} // namespace fullsync::data
