#include "fullsync/session/driver.hpp"
#include "fullsync/events/events.hpp"
#include "fullsync/reconcile/engine.hpp"
#include "fullsync/transfer/bulk.hpp"
#include "fullsync/transfer/incremental.hpp"
#include "fullsync/transfer/migration.hpp"

#include <spdlog/spdlog.h>

namespace fullsync::session {
namespace fs = std::filesystem;

using SteadyClock = std::chrono::steady_clock;

fs::path spool_path(const core::SyncConfig& config, const std::string& session_id) {
    return config.transfer.spool_dir / ("full-sync-" + session_id + ".snap");
}

SessionDriver::SessionDriver(DriverContext context, std::shared_ptr<SessionHandle> handle)
    : ctx_(context),
      handle_(std::move(handle)),
      filter_(handle_->info().filter, ctx_.config.transfer.demo_flag_field),
      spool_(spool_path(ctx_.config, handle_->id())) {}

void SessionDriver::run() {
    started_ = SteadyClock::now();
    phase_ = handle_->phase();
    phase_budget_ = ctx_.config.phase_timeout(to_string(phase_));
    deadline_ = started_ + phase_budget_;

    Result<void> outcome = Ok();
    try {
        auto scope = data::resolve_scope(ctx_.config, handle_->info().filter);
        if (scope.is_error()) {
            outcome = Err<void>(scope.error());
        } else {
            scope_ = std::move(scope.value());
            outcome = handle_->info().method == Method::Bulk ? run_bulk() : run_incremental();
        }
    } catch (const std::exception& e) {
        outcome = Err<void>(ErrorCode::Internal, std::string("unexpected exception: ") + e.what());
    }
    finish(outcome);
}

// ════════════════════════════════════════════════════════
// Bulk
// ════════════════════════════════════════════════════════

Result<void> SessionDriver::run_bulk() {
    const Phase start = handle_->phase();
    if (start == Phase::Verify) {
        return verify();
    }

    transfer::BulkTransfer bulk(ctx_.config);
    const transfer::InterruptCheck interrupt = [this]() { return check_interrupt(); };

    if (start == Phase::Pending || start == Phase::Backup) {
        auto entered = enter(Phase::Backup);
        if (entered.is_error()) {
            return entered;
        }
        auto trailer = bulk.push_to_file(ctx_.source, scope_, filter_, spool_, interrupt);
        if (trailer.is_error()) {
            return Err<void>(trailer.error());
        }
        const auto record_count = trailer.value().record_count;
        handle_->update([&](SyncSession& s) { s.set_totals(0, record_count); });
    }

    auto entered = enter(Phase::Transfer);
    if (entered.is_error()) {
        return entered;
    }

    std::error_code ec;
    const auto spool_bytes = fs::file_size(spool_, ec);
    if (ec) {
        return Err<void>(ErrorCode::Io, "spool file " + spool_.string() + " is unavailable: " + ec.message());
    }
    handle_->update([&](SyncSession& s) { s.set_totals(spool_bytes, s.info().entities_total); });

    auto chunks = transfer::file_chunk_source(spool_, bulk.chunk_size());
    if (chunks.is_error()) {
        return Err<void>(chunks.error());
    }
    auto transaction = ctx_.destination.begin_restore();
    if (transaction.is_error()) {
        return Err<void>(transaction.error());
    }

    auto receipt = bulk.receive(chunks.value(), *transaction.value(), spool_bytes,
        [this](std::uint64_t done, std::uint64_t) { report_progress(done, 0); },
        interrupt);
    if (receipt.is_error()) {
        return Err<void>(receipt.error());
    }
    const auto& summary = receipt.value().summary;
    handle_->update([&](SyncSession& s) {
        s.set_totals(spool_bytes, summary.trailer.record_count);
        s.update_progress(summary.total_bytes, 0, std::chrono::system_clock::now());
    });

    entered = enter(Phase::Convert);
    if (entered.is_error()) {
        return entered;
    }
    transfer::SchemaConverter converter(ctx_.config.schema_migrations);
    auto converted = converter.convert(*transaction.value(),
                                       summary.header.schema_revision,
                                       ctx_.destination.schema_revision());
    if (converted.is_error()) {
        return Err<void>(converted.error());
    }
    spdlog::debug("[Driver] session={} converted={} from_revision={} to_revision={}",
                  handle_->id(), converted.value(), summary.header.schema_revision,
                  ctx_.destination.schema_revision());

    entered = enter_restore();
    if (entered.is_error()) {
        return entered;
    }
    auto confirmed = confirm_lease();
    if (confirmed.is_error()) {
        return confirmed;
    }
    auto committed = transaction.value()->commit();
    if (committed.is_error()) {
        return Err<void>(ErrorCode::Apply,
            "bulk restore into " + ctx_.destination.name() + " failed: " + committed.error().message);
    }
    const auto applied = committed.value();
    handle_->update([&](SyncSession& s) {
        s.update_progress(s.info().bytes_transferred, applied, std::chrono::system_clock::now());
    });

    return verify();
}

// ════════════════════════════════════════════════════════
// Incremental
// ════════════════════════════════════════════════════════

Result<void> SessionDriver::run_incremental() {
    if (handle_->phase() == Phase::Verify) {
        return verify();
    }

    transfer::IncrementalTransfer incremental(ctx_.config);
    const transfer::InterruptCheck interrupt = [this]() { return check_interrupt(); };

    auto entered = enter(Phase::Transfer);
    if (entered.is_error()) {
        return entered;
    }

    auto total = transfer::count_records(ctx_.source, scope_, filter_);
    if (total.is_error()) {
        return Err<void>(total.error());
    }
    const auto cursor = handle_->info().last_confirmed_sequence;
    handle_->update([&](SyncSession& s) { s.set_totals(0, total.value()); });

    transfer::IncrementalReceiver receiver(ctx_.destination, ctx_.config, cursor);
    receiver.on_batch_committed([this](std::uint64_t confirmed, std::size_t) {
        handle_->update([confirmed](SyncSession& s) { s.set_cursor(confirmed); });
        report_progress(0, confirmed);
    });
    receiver.on_retry([this](std::size_t attempt, const Error& error) {
        ctx_.bus.emit(events::BatchRetryEvent{handle_->id(), attempt, error.message});
    });
    receiver.guard_batches([this]() { return confirm_lease(); });

    spdlog::debug("[Driver] session={} streaming from cursor={} total={}", handle_->id(), cursor, total.value());
    auto envelopes = incremental.push(ctx_.source, scope_, filter_, cursor);
    auto streamed = incremental.stream(envelopes, receiver, interrupt);
    if (streamed.is_error()) {
        return Err<void>(streamed.error());
    }

    entered = enter_restore();
    if (entered.is_error()) {
        return entered;
    }
    auto flushed = receiver.finish();
    if (flushed.is_error()) {
        return flushed;
    }
    auto saved = persist();
    if (saved.is_error()) {
        return saved;
    }

    return verify();
}

// ════════════════════════════════════════════════════════
// Verify
// ════════════════════════════════════════════════════════

Result<void> SessionDriver::verify() {
    auto entered = enter(Phase::Verify);
    if (entered.is_error()) {
        return entered;
    }

    const auto keep = [this](const data::Record& record) { return filter_.matches(record); };
    auto source_view = data::export_snapshot(ctx_.source, scope_, keep);
    if (source_view.is_error()) {
        return Err<void>(source_view.error());
    }
    auto target_view = data::export_snapshot(ctx_.destination, scope_, keep);
    if (target_view.is_error()) {
        return Err<void>(target_view.error());
    }

    const auto info = handle_->info();
    reconcile::ReconciliationEngine engine(ctx_.config);
    auto report = engine.compare(source_view.value(), target_view.value(), info.direction, info.id);
    if (report.is_error()) {
        return Err<void>(report.error());
    }
    auto interrupted = check_interrupt();
    if (interrupted.is_error()) {
        return interrupted;
    }

    auto confirmed = confirm_lease();
    if (confirmed.is_error()) {
        return confirmed;
    }
    const auto& result = report.value();
    auto saved = ctx_.store.save_report(result);
    if (saved.is_error()) {
        return saved;
    }
    auto attached = handle_->update([&](SyncSession& s) { return s.attach_report(result.id); });
    if (attached.is_error()) {
        return attached;
    }
    ctx_.bus.emit(events::ReconciliationCompletedEvent{
        info.id, result.id, result.exact_matches, result.expected_differences,
        result.unexpected_mismatches, result.overall_status});

    return enter(Phase::Completed);
}

// ════════════════════════════════════════════════════════
// Phase bookkeeping
// ════════════════════════════════════════════════════════

Result<void> SessionDriver::enter(Phase next) {
    if (!is_terminal(next)) {
        auto interrupted = check_interrupt();
        if (interrupted.is_error()) {
            return interrupted;
        }
    }

    Phase previous = Phase::Pending;
    auto moved = handle_->update([&](SyncSession& s) {
        previous = s.phase();
        return s.transition_to(next);
    });
    if (moved.is_error()) {
        return moved;
    }

    phase_ = next;
    phase_budget_ = ctx_.config.phase_timeout(to_string(next));
    deadline_ = SteadyClock::now() + phase_budget_;

    auto saved = persist();
    if (saved.is_error()) {
        return saved;
    }
    if (previous != next) {
        ctx_.bus.emit(events::SyncPhaseChangedEvent{handle_->id(), previous, next});
    }
    return Ok();
}

Result<void> SessionDriver::enter_restore() {
    auto confirmed = confirm_lease();
    if (confirmed.is_error()) {
        return confirmed;
    }

    const Phase previous = handle_->phase();
    auto moved = handle_->enter_restore();
    if (moved.is_error()) {
        return moved;
    }

    phase_ = Phase::Restore;
    phase_budget_ = ctx_.config.phase_timeout(to_string(Phase::Restore));
    deadline_ = SteadyClock::now() + phase_budget_;

    auto saved = persist();
    if (saved.is_error()) {
        return saved;
    }
    ctx_.bus.emit(events::SyncPhaseChangedEvent{handle_->id(), previous, Phase::Restore});
    return Ok();
}

Result<void> SessionDriver::check_interrupt() const {
    if (handle_->lease_lost()) {
        return Err<void>(ErrorCode::LeaseLost, "lease " + handle_->lease_key() + " was lost");
    }
    if (handle_->cancel_requested()) {
        return Err<void>(ErrorCode::Cancelled, "cancelled by request");
    }
    if (SteadyClock::now() >= deadline_) {
        return Err<void>(ErrorCode::PhaseTimeout,
            std::string("phase ") + to_string(phase_) + " exceeded its budget of " +
            std::to_string(phase_budget_.count()) + "ms");
    }
    return Ok();
}

Result<void> SessionDriver::confirm_lease() {
    if (handle_->lease_lost()) {
        return Err<void>(ErrorCode::LeaseLost, "lease " + handle_->lease_key() + " was lost");
    }
    auto renewed = ctx_.store.renew_lease(handle_->lease_key(), handle_->owner_token(),
                                          ctx_.config.session.lease_ttl);
    if (renewed.is_error()) {
        if (renewed.error().code == ErrorCode::LeaseLost) {
            handle_->mark_lease_lost();
        }
        return Err<void>(renewed.error());
    }
    return Ok();
}

Result<void> SessionDriver::persist() {
    if (handle_->lease_lost()) {
        return Err<void>(ErrorCode::LeaseLost, "lease " + handle_->lease_key() + " was lost");
    }
    last_persist_ = SteadyClock::now();
    auto saved = ctx_.store.save(handle_->info());
    if (saved.is_error() && saved.error().code == ErrorCode::LeaseLost) {
        handle_->mark_lease_lost();
    }
    return saved;
}

void SessionDriver::report_progress(std::uint64_t bytes, std::uint64_t entities) {
    const auto info = handle_->update([&](SyncSession& s) {
        s.update_progress(bytes, entities, std::chrono::system_clock::now());
        return s.info();
    });

    if (SteadyClock::now() - last_persist_ < ctx_.config.session.persist_interval) {
        return;
    }
    auto saved = persist();
    if (saved.is_error()) {
        spdlog::warn("[Driver] session={} progress not persisted: {}", info.id, saved.error().message);
    }
    ctx_.bus.emit(events::SyncProgressEvent{
        info.id, info.phase, info.bytes_transferred, info.bytes_total,
        info.entities_transferred, info.entities_total, info.transfer_speed});
}

void SessionDriver::finish(const Result<void>& outcome) {
    const auto& id = handle_->id();
    const bool bulk = handle_->info().method == Method::Bulk;

    if (outcome.is_error() && outcome.error().code == ErrorCode::LeaseLost) {
        // Another owner may resume from the registry; leave the spool for it.
        ctx_.bus.emit(events::LeaseLostEvent{id, handle_->lease_key()});
        return;
    }

    if (outcome.is_ok()) {
        const auto info = handle_->info();
        reconcile::OverallStatus status = reconcile::OverallStatus::Clean;
        auto report = ctx_.store.load_report(info.reconciliation_report_id);
        if (report.is_ok()) {
            status = report.value().overall_status;
        }
        ctx_.bus.emit(events::SyncCompletedEvent{
            id, info.reconciliation_report_id, status, info.entities_transferred,
            std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - started_)});
    } else {
        const auto& error = outcome.error();
        const Phase stopped_in = phase_;
        Result<void> marked = Ok();
        if (error.code == ErrorCode::Cancelled) {
            marked = handle_->update([](SyncSession& s) { return s.mark_cancelled(); });
        } else {
            marked = handle_->update([&](SyncSession& s) { return s.mark_failed(error.code, error.message); });
        }
        if (marked.is_error()) {
            spdlog::error("[Driver] session={} cannot record outcome: {}", id, marked.error().message);
        }
        auto saved = persist();
        if (saved.is_error() && saved.error().code == ErrorCode::LeaseLost) {
            spdlog::warn("[Driver] session={} lease lost before {} could be recorded: {}",
                         id, to_string(error.code), error.message);
            ctx_.bus.emit(events::LeaseLostEvent{id, handle_->lease_key()});
            return;
        }
        if (saved.is_error()) {
            spdlog::error("[Driver] session={} terminal state not persisted: {}", id, saved.error().message);
        }

        if (error.code == ErrorCode::Cancelled) {
            ctx_.bus.emit(events::SyncCancelledEvent{id, stopped_in});
        } else {
            ctx_.bus.emit(events::SyncFailedEvent{id, stopped_in, error.code, error.message});
        }
    }

    if (bulk) {
        std::error_code ec;
        fs::remove(spool_, ec);
        if (ec) {
            spdlog::warn("[Driver] session={} spool {} not removed: {}", id, spool_.string(), ec.message());
        }
    }
}

} // namespace fullsync::session
