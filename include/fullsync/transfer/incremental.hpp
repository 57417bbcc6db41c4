#pragma once

#include "fullsync/core/config.hpp"
#include "fullsync/core/result.hpp"
#include "fullsync/data/database.hpp"
#include "fullsync/data/filter.hpp"
#include "fullsync/transfer/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fullsync::transfer {

/**
 * @brief Lazy, restartable sequence of record envelopes
 *
 * Walks the scope in dependency order and each table ascending by id,
 * numbering filtered records from 1. Records at or below the cursor are
 * skipped, so a stream built with the last confirmed sequence resumes
 * where the previous one stopped. Only one table is held in memory.
 */
class EnvelopeStream {
public:
    EnvelopeStream(const data::DatabaseHandle& source,
                   std::vector<std::string> scope,
                   data::RecordFilter filter,
                   std::uint64_t since_cursor);

    Result<std::optional<RecordEnvelope>> next();

    [[nodiscard]] std::uint64_t last_sequence() const noexcept { return sequence_; }

private:
    const data::DatabaseHandle& source_;
    std::vector<std::string> scope_;
    data::RecordFilter filter_;
    std::uint64_t since_cursor_;

    std::size_t type_index_ = 0;
    std::vector<data::Record> table_;
    std::size_t row_ = 0;
    bool table_loaded_ = false;
    std::uint64_t sequence_ = 0;
};

/// Number of records a stream over this scope yields from the start.
Result<std::uint64_t> count_records(const data::DatabaseHandle& source,
                                    const std::vector<std::string>& scope,
                                    const data::RecordFilter& filter);

enum class ApplyOutcome {
    Applied,        ///< Next in sequence; batched for application
    Buffered,       ///< Ahead of a gap; held until the gap fills
    Duplicate       ///< Already confirmed, batched or buffered; ignored
};

/**
 * @brief Destination side of an incremental stream
 *
 * Envelopes are re-ordered by sequence, checked against their CRC,
 * collected into batches and upserted one batch at a time. A batch is
 * applied atomically and retried up to max_apply_retries times; a record
 * that references a row missing from the destination fails the batch
 * without retry. The confirmed cursor only moves after a batch commits.
 * An installed batch guard runs before every upsert attempt; its error
 * fails the receiver without touching the destination.
 */
class IncrementalReceiver {
public:
    using BatchCommitted = std::function<void(std::uint64_t cursor, std::size_t applied)>;
    using RetryNotice = std::function<void(std::size_t attempt, const Error& error)>;
    using BatchGuard = std::function<Result<void>()>;

    IncrementalReceiver(data::DatabaseHandle& destination,
                        const core::SyncConfig& config,
                        std::uint64_t confirmed_cursor = 0);

    void on_batch_committed(BatchCommitted callback) { batch_committed_ = std::move(callback); }
    void on_retry(RetryNotice callback) { retry_notice_ = std::move(callback); }
    void guard_batches(BatchGuard guard) { batch_guard_ = std::move(guard); }

    Result<ApplyOutcome> accept(RecordEnvelope envelope);

    /// Applies the last partial batch. Fails when a gap never filled.
    Result<void> finish();

    [[nodiscard]] std::uint64_t confirmed_cursor() const noexcept { return confirmed_; }
    [[nodiscard]] std::size_t buffered() const noexcept { return pending_.size(); }
    [[nodiscard]] std::size_t batched() const noexcept { return batch_.size(); }
    [[nodiscard]] const RestoreResult& result() const noexcept { return result_; }

private:
    Result<void> enqueue(RecordEnvelope envelope);
    Result<void> apply_batch();
    std::optional<ApplyFailure> find_missing_dependency() const;
    Result<void> fail(Error error);

    data::DatabaseHandle& destination_;
    const core::SyncConfig& config_;
    std::size_t batch_size_;
    std::size_t reorder_window_;

    std::uint64_t confirmed_;
    std::uint64_t next_expected_;
    std::map<std::uint64_t, RecordEnvelope> pending_;
    std::vector<RecordEnvelope> batch_;

    RestoreResult result_;
    std::optional<Error> failure_;
    BatchCommitted batch_committed_;
    RetryNotice retry_notice_;
    BatchGuard batch_guard_;
};

class IncrementalTransfer {
public:
    explicit IncrementalTransfer(const core::SyncConfig& config);

    EnvelopeStream push(const data::DatabaseHandle& source,
                        std::vector<std::string> scope,
                        data::RecordFilter filter,
                        std::uint64_t since_cursor) const;

    Result<ApplyOutcome> pull(IncrementalReceiver& receiver, RecordEnvelope envelope) const {
        return receiver.accept(std::move(envelope));
    }

    /**
     * @brief Drives a stream into a receiver
     *
     * A reader thread keeps up to max_in_flight_batches batches of envelopes
     * queued ahead of the receiver. The interrupt check runs once per
     * envelope. Returns the number of envelopes delivered.
     */
    Result<std::uint64_t> stream(EnvelopeStream& envelopes,
                                 IncrementalReceiver& receiver,
                                 const InterruptCheck& interrupt = {}) const;

private:
    core::TransferSettings settings_;
};

} // namespace fullsync::transfer
