#include "fullsync/transfer/incremental.hpp"
#include "fullsync/transfer/channel.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <set>
#include <thread>

namespace fullsync::transfer {

// ════════════════════════════════════════════════════════
// Source side
// ════════════════════════════════════════════════════════

EnvelopeStream::EnvelopeStream(const data::DatabaseHandle& source,
                               std::vector<std::string> scope,
                               data::RecordFilter filter,
                               std::uint64_t since_cursor)
    : source_(source),
      scope_(std::move(scope)),
      filter_(std::move(filter)),
      since_cursor_(since_cursor) {}

Result<std::optional<RecordEnvelope>> EnvelopeStream::next() {
    using Next = std::optional<RecordEnvelope>;
    while (type_index_ < scope_.size()) {
        if (!table_loaded_) {
            auto rows = source_.read_table(scope_[type_index_]);
            if (rows.is_error()) {
                return Err<Next>(rows.error());
            }
            table_ = std::move(rows.value());
            row_ = 0;
            table_loaded_ = true;
        }

        while (row_ < table_.size()) {
            auto& record = table_[row_++];
            if (!filter_.matches(record)) {
                continue;
            }
            ++sequence_;
            if (sequence_ <= since_cursor_) {
                continue;
            }
            return Ok(Next(make_envelope(sequence_, std::move(record))));
        }

        table_.clear();
        table_loaded_ = false;
        ++type_index_;
    }
    return Ok(Next());
}

Result<std::uint64_t> count_records(const data::DatabaseHandle& source,
                                    const std::vector<std::string>& scope,
                                    const data::RecordFilter& filter) {
    std::uint64_t total = 0;
    for (const auto& type : scope) {
        auto rows = source.read_table(type);
        if (rows.is_error()) {
            return Err<std::uint64_t>(rows.error());
        }
        for (const auto& record : rows.value()) {
            if (filter.matches(record)) {
                ++total;
            }
        }
    }
    return Ok(total);
}

// ════════════════════════════════════════════════════════
// Destination side
// ════════════════════════════════════════════════════════

IncrementalReceiver::IncrementalReceiver(data::DatabaseHandle& destination,
                                         const core::SyncConfig& config,
                                         std::uint64_t confirmed_cursor)
    : destination_(destination),
      config_(config),
      batch_size_(config.transfer.batch_size),
      reorder_window_(config.transfer.batch_size * config.transfer.max_in_flight_batches),
      confirmed_(confirmed_cursor),
      next_expected_(confirmed_cursor + 1) {}

Result<ApplyOutcome> IncrementalReceiver::accept(RecordEnvelope envelope) {
    if (failure_) {
        return Err<ApplyOutcome>(*failure_);
    }
    if (envelope.sequence == 0) {
        return Err<ApplyOutcome>(ErrorCode::Integrity, "envelope without a sequence number");
    }
    if (envelope.entity_type != envelope.record.entity_type ||
        envelope.checksum != record_checksum(envelope.record)) {
        auto failed = fail(Error{ErrorCode::Integrity,
            "record checksum mismatch at sequence " + std::to_string(envelope.sequence) +
            " (" + envelope.entity_type + ":" + envelope.record.id + ")"});
        return Err<ApplyOutcome>(failed.error());
    }

    if (envelope.sequence < next_expected_) {
        return Ok(ApplyOutcome::Duplicate);
    }

    if (envelope.sequence > next_expected_) {
        if (pending_.count(envelope.sequence) > 0) {
            return Ok(ApplyOutcome::Duplicate);
        }
        if (pending_.size() >= reorder_window_) {
            auto failed = fail(Error{ErrorCode::Apply,
                "reorder window exhausted waiting for sequence " + std::to_string(next_expected_)});
            return Err<ApplyOutcome>(failed.error());
        }
        const auto sequence = envelope.sequence;
        pending_.emplace(sequence, std::move(envelope));
        return Ok(ApplyOutcome::Buffered);
    }

    auto queued = enqueue(std::move(envelope));
    if (queued.is_error()) {
        return Err<ApplyOutcome>(queued.error());
    }
    while (!pending_.empty() && pending_.begin()->first == next_expected_) {
        auto node = pending_.extract(pending_.begin());
        queued = enqueue(std::move(node.mapped()));
        if (queued.is_error()) {
            return Err<ApplyOutcome>(queued.error());
        }
    }
    return Ok(ApplyOutcome::Applied);
}

Result<void> IncrementalReceiver::finish() {
    if (failure_) {
        return Err<void>(*failure_);
    }
    if (!pending_.empty()) {
        return fail(Error{ErrorCode::Apply,
            "stream ended with a gap: sequence " + std::to_string(next_expected_) +
            " never arrived (" + std::to_string(pending_.size()) + " envelopes buffered)"});
    }
    return apply_batch();
}

Result<void> IncrementalReceiver::enqueue(RecordEnvelope envelope) {
    batch_.push_back(std::move(envelope));
    ++next_expected_;
    if (batch_.size() >= batch_size_) {
        return apply_batch();
    }
    return Ok();
}

std::optional<ApplyFailure> IncrementalReceiver::find_missing_dependency() const {
    std::set<std::pair<std::string, std::string>> earlier;
    for (const auto& envelope : batch_) {
        const auto& record = envelope.record;
        if (const auto* entity = config_.find_entity(record.entity_type)) {
            for (const auto& [field, target] : entity->references) {
                const auto* value = record.field(field);
                if (value == nullptr || value->empty() || config_.is_excluded(target)) {
                    continue;
                }
                if (earlier.count({target, *value}) > 0 || destination_.contains(target, *value)) {
                    continue;
                }
                return ApplyFailure{record.entity_type, record.id, envelope.sequence,
                    "missing dependency " + target + ":" + *value + " referenced by " +
                    record.entity_type + ":" + record.id + "." + field};
            }
        }
        earlier.emplace(record.entity_type, record.id);
    }
    return std::nullopt;
}

Result<void> IncrementalReceiver::apply_batch() {
    if (batch_.empty()) {
        return Ok();
    }

    for (const auto& envelope : batch_) {
        ++result_.entity_counts[envelope.entity_type].attempted;
    }
    auto mark_failed = [this]() {
        for (const auto& envelope : batch_) {
            ++result_.entity_counts[envelope.entity_type].failed;
        }
    };

    if (auto missing = find_missing_dependency()) {
        mark_failed();
        result_.failures.push_back(*missing);
        return fail(Error{ErrorCode::Apply, missing->error + " (sequence " + std::to_string(missing->sequence) + ")"});
    }

    std::vector<data::Record> records;
    records.reserve(batch_.size());
    for (const auto& envelope : batch_) {
        records.push_back(envelope.record);
    }

    const std::size_t attempts = config_.transfer.max_apply_retries + 1;
    Error last_error;
    for (std::size_t attempt = 1; attempt <= attempts; ++attempt) {
        if (batch_guard_) {
            auto allowed = batch_guard_();
            if (allowed.is_error()) {
                return fail(allowed.error());
            }
        }
        auto applied = destination_.upsert_batch(records);
        if (applied.is_ok()) {
            for (const auto& envelope : batch_) {
                ++result_.entity_counts[envelope.entity_type].applied;
            }
            confirmed_ = batch_.back().sequence;
            const std::size_t count = batch_.size();
            batch_.clear();
            if (batch_committed_) {
                batch_committed_(confirmed_, count);
            }
            return Ok();
        }

        last_error = applied.error();
        if (attempt < attempts) {
            spdlog::warn("[IncrementalApply] batch ending at sequence {} failed (attempt {}/{}): {}",
                         batch_.back().sequence, attempt, attempts, last_error.message);
            if (retry_notice_) {
                retry_notice_(attempt, last_error);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * attempt));
        }
    }

    mark_failed();
    const auto& first = batch_.front();
    result_.failures.push_back(ApplyFailure{first.entity_type, first.record.id, first.sequence, last_error.message});
    return fail(Error{ErrorCode::Apply,
        "batch of " + std::to_string(batch_.size()) + " records starting at " + first.entity_type + ":" +
        first.record.id + " (sequence " + std::to_string(first.sequence) + ") failed after " +
        std::to_string(attempts) + " attempts: " + last_error.message});
}

Result<void> IncrementalReceiver::fail(Error error) {
    failure_ = error;
    return Err<void>(std::move(error));
}

// ════════════════════════════════════════════════════════
// Strategy
// ════════════════════════════════════════════════════════

IncrementalTransfer::IncrementalTransfer(const core::SyncConfig& config) : settings_(config.transfer) {}

EnvelopeStream IncrementalTransfer::push(const data::DatabaseHandle& source,
                                         std::vector<std::string> scope,
                                         data::RecordFilter filter,
                                         std::uint64_t since_cursor) const {
    return EnvelopeStream(source, std::move(scope), std::move(filter), since_cursor);
}

Result<std::uint64_t> IncrementalTransfer::stream(EnvelopeStream& envelopes,
                                                  IncrementalReceiver& receiver,
                                                  const InterruptCheck& interrupt) const {
    BoundedChannel<RecordEnvelope> channel(settings_.batch_size * settings_.max_in_flight_batches);
    std::optional<Error> read_error;

    std::thread reader([&]() {
        while (true) {
            auto next = envelopes.next();
            if (next.is_error()) {
                read_error = next.error();
                break;
            }
            if (!next.value().has_value()) {
                break;
            }
            if (!channel.push(std::move(*next.value()))) {
                break;
            }
        }
        channel.close();
    });

    std::optional<Error> apply_error;
    std::uint64_t delivered = 0;
    while (auto envelope = channel.pop()) {
        if (interrupt) {
            auto check = interrupt();
            if (check.is_error()) {
                apply_error = check.error();
                break;
            }
        }
        auto accepted = pull(receiver, std::move(*envelope));
        if (accepted.is_error()) {
            apply_error = accepted.error();
            break;
        }
        ++delivered;
    }
    channel.close();
    reader.join();

    if (apply_error) {
        return Err<std::uint64_t>(*apply_error);
    }
    if (read_error) {
        return Err<std::uint64_t>(*read_error);
    }
    return Ok(delivered);
}

} // namespace fullsync::transfer
