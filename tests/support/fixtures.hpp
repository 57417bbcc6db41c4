#pragma once

#include "fullsync/core/config.hpp"
#include "fullsync/data/database.hpp"
#include "fullsync/data/record.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fullsync::fixtures {

/// business ← category ← product, plus an excluded audit_log type.
inline core::SyncConfig shop_config() {
    core::SyncConfig config;
    config.entities = {
        {"business", {}},
        {"category", {{"business_id", "business"}}},
        {"product", {{"business_id", "business"}, {"category_id", "category"}}},
    };
    config.excluded_entity_types = {"audit_log"};
    config.transfer.chunk_size = 512;
    config.transfer.batch_size = 10;
    config.transfer.max_apply_retries = 2;
    config.transfer.spool_dir = std::filesystem::temp_directory_path() / "fullsync-test-spool";
    config.session.persist_interval = std::chrono::milliseconds(0);
    config.session.lease_ttl = std::chrono::milliseconds(60000);
    config.session.heartbeat_interval = std::chrono::milliseconds(30000);
    config.reconciliation.worker_threads = 2;
    return config;
}

inline data::Record product(int n, const std::string& business = "b-1") {
    return data::Record{"product", "p-" + std::to_string(1000 + n), {
        {"business_id", business},
        {"category_id", "c-1"},
        {"name", "Product " + std::to_string(n)},
        {"price", std::to_string(100 + n)}
    }};
}

/// One business, one category, n products.
inline void seed_shop(data::Dataset& dataset, int products, const std::string& business = "b-1") {
    dataset.upsert(data::Record{"business", business, {{"name", "Shop " + business}}});
    dataset.upsert(data::Record{"category", "c-1", {{"business_id", business}, {"name", "Drinks"}}});
    for (int i = 1; i <= products; ++i) {
        dataset.upsert(product(i, business));
    }
}

/// Opens once and stays open; waiters block until then.
class Latch {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return open_; });
    }

    bool wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

/**
 * @brief In-memory database whose writes can be held at a gate
 *
 * With hold_restore set, begin_restore() opens reached and blocks
 * until release is opened. With hold_commit set, the bulk commit does the
 * same. With hold_upsert set, the first upsert_batch does. fail_upserts
 * makes that many upsert_batch calls fail before they start succeeding.
 */
class GatedDatabase : public data::InMemoryDatabase {
public:
    using data::InMemoryDatabase::InMemoryDatabase;

    std::atomic<bool> hold_restore{false};
    std::atomic<bool> hold_commit{false};
    std::atomic<bool> hold_upsert{false};
    std::atomic<int> fail_upserts{0};
    std::atomic<int> upsert_calls{0};

    Latch reached;
    Latch release;

    Result<void> upsert_batch(const std::vector<data::Record>& batch) override {
        ++upsert_calls;
        if (hold_upsert.exchange(false)) {
            reached.open();
            release.wait();
        }
        if (fail_upserts.load() > 0) {
            --fail_upserts;
            return Err<void>(ErrorCode::Apply, "destination rejected the batch");
        }
        return data::InMemoryDatabase::upsert_batch(batch);
    }

    Result<std::unique_ptr<data::RestoreTransaction>> begin_restore() override {
        if (hold_restore.exchange(false)) {
            reached.open();
            release.wait();
        }
        auto inner = data::InMemoryDatabase::begin_restore();
        if (inner.is_error() || !hold_commit.exchange(false)) {
            return inner;
        }
        return Ok<std::unique_ptr<data::RestoreTransaction>>(
            std::make_unique<GatedTransaction>(std::move(inner.value()), reached, release));
    }

private:
    class GatedTransaction : public data::RestoreTransaction {
    public:
        GatedTransaction(std::unique_ptr<data::RestoreTransaction> inner, Latch& reached, Latch& release)
            : inner_(std::move(inner)), reached_(reached), release_(release) {}

        Result<void> stage(data::Record record) override { return inner_->stage(std::move(record)); }
        void transform(const std::function<void(data::Record&)>& fn) override { inner_->transform(fn); }
        [[nodiscard]] std::size_t staged_count() const override { return inner_->staged_count(); }

        Result<std::size_t> commit() override {
            reached_.open();
            release_.wait();
            return inner_->commit();
        }

    private:
        std::unique_ptr<data::RestoreTransaction> inner_;
        Latch& reached_;
        Latch& release_;
    };
};

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace fullsync::fixtures
