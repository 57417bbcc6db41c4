/**
 * @file components.hpp
 * @brief Event-driven components that observe sync sessions
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Both react to every session the manager runs
 */

#pragma once

#include "fullsync/events/event_bus.hpp"
#include "fullsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace fullsync::events {

/**
 * @brief Logs every session event through spdlog
 *
 * Progress goes to debug; failures and lease loss to warn/error.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SyncStartedEvent>([this](const SyncStartedEvent& e) {
            on_started(e);
        });

        bus_.subscribe<SyncPhaseChangedEvent>([this](const SyncPhaseChangedEvent& e) {
            on_phase_changed(e);
        });

        bus_.subscribe<SyncProgressEvent>([this](const SyncProgressEvent& e) {
            on_progress(e);
        });

        bus_.subscribe<BatchRetryEvent>([this](const BatchRetryEvent& e) {
            on_batch_retry(e);
        });

        bus_.subscribe<SyncCompletedEvent>([this](const SyncCompletedEvent& e) {
            on_completed(e);
        });

        bus_.subscribe<SyncFailedEvent>([this](const SyncFailedEvent& e) {
            on_failed(e);
        });

        bus_.subscribe<SyncCancelledEvent>([this](const SyncCancelledEvent& e) {
            on_cancelled(e);
        });

        bus_.subscribe<LeaseLostEvent>([this](const LeaseLostEvent& e) {
            on_lease_lost(e);
        });

        bus_.subscribe<ReconciliationCompletedEvent>([this](const ReconciliationCompletedEvent& e) {
            on_reconciled(e);
        });

        bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        });

        bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        });
    }

private:
    void on_started(const SyncStartedEvent& e) {
        spdlog::info("[SyncStarted] session={} direction={} method={} source={} destination={} resumed={}",
                     e.session_id, to_string(e.direction), to_string(e.method),
                     e.source_name, e.destination_name, e.resumed);
    }

    void on_phase_changed(const SyncPhaseChangedEvent& e) {
        spdlog::info("[PhaseChanged] session={} {} -> {}",
                     e.session_id, session::to_string(e.from), session::to_string(e.to));
    }

    void on_progress(const SyncProgressEvent& e) {
        spdlog::debug("[Progress] session={} phase={} bytes={}/{} entities={}/{} speed={:.1f}",
                      e.session_id, session::to_string(e.phase), e.bytes_transferred, e.bytes_total,
                      e.entities_transferred, e.entities_total, e.transfer_speed);
    }

    void on_batch_retry(const BatchRetryEvent& e) {
        spdlog::warn("[BatchRetry] session={} attempt={} error={}", e.session_id, e.attempt, e.error_message);
    }

    void on_completed(const SyncCompletedEvent& e) {
        spdlog::info("[SyncCompleted] session={} report={} status={} entities={} duration={}ms",
                     e.session_id, e.report_id, reconcile::to_string(e.overall_status),
                     e.entities_transferred, e.duration.count());
    }

    void on_failed(const SyncFailedEvent& e) {
        spdlog::error("[SyncFailed] session={} phase={} code={} error={}",
                      e.session_id, session::to_string(e.phase), to_string(e.code), e.error_message);
    }

    void on_cancelled(const SyncCancelledEvent& e) {
        spdlog::info("[SyncCancelled] session={} phase={}", e.session_id, session::to_string(e.phase));
    }

    void on_lease_lost(const LeaseLostEvent& e) {
        spdlog::warn("[LeaseLost] session={} lease={}", e.session_id, e.lease_key);
    }

    void on_reconciled(const ReconciliationCompletedEvent& e) {
        spdlog::info("[Reconciled] session={} report={} exact={} expected={} unexpected={} status={}",
                     e.session_id, e.report_id, e.exact_matches, e.expected_differences,
                     e.unexpected_mismatches, reconcile::to_string(e.overall_status));
    }

    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Full sync server listening on port {}", e.port);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Server shutting down: {}", e.reason);
        spdlog::info("════════════════════════════════════════════");
    }

    EventBus& bus_;
};

/**
 * @brief Counts sessions by outcome and totals the work they moved
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().sessions_completed.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sessions_started{0};
        std::atomic<uint64_t> sessions_resumed{0};
        std::atomic<uint64_t> sessions_completed{0};
        std::atomic<uint64_t> sessions_failed{0};
        std::atomic<uint64_t> sessions_cancelled{0};
        std::atomic<uint64_t> leases_lost{0};
        std::atomic<uint64_t> batch_retries{0};
        std::atomic<uint64_t> entities_transferred{0};
        std::atomic<uint64_t> reports_degraded{0};
        std::atomic<uint64_t> reports_failed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SyncStartedEvent>([this](const SyncStartedEvent& e) {
            stats_.sessions_started++;
            if (e.resumed) {
                stats_.sessions_resumed++;
            }
        });

        bus_.subscribe<SyncCompletedEvent>([this](const SyncCompletedEvent& e) {
            stats_.sessions_completed++;
            stats_.entities_transferred += e.entities_transferred;
        });

        bus_.subscribe<SyncFailedEvent>([this](const SyncFailedEvent&) {
            stats_.sessions_failed++;
        });

        bus_.subscribe<SyncCancelledEvent>([this](const SyncCancelledEvent&) {
            stats_.sessions_cancelled++;
        });

        bus_.subscribe<LeaseLostEvent>([this](const LeaseLostEvent&) {
            stats_.leases_lost++;
        });

        bus_.subscribe<BatchRetryEvent>([this](const BatchRetryEvent&) {
            stats_.batch_retries++;
        });

        bus_.subscribe<ReconciliationCompletedEvent>([this](const ReconciliationCompletedEvent& e) {
            on_reconciled(e);
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sync Statistics:");
        spdlog::info("  Sessions started:   {}", stats_.sessions_started.load());
        spdlog::info("  Sessions resumed:   {}", stats_.sessions_resumed.load());
        spdlog::info("  Completed:          {}", stats_.sessions_completed.load());
        spdlog::info("  Failed:             {}", stats_.sessions_failed.load());
        spdlog::info("  Cancelled:          {}", stats_.sessions_cancelled.load());
        spdlog::info("  Leases lost:        {}", stats_.leases_lost.load());
        spdlog::info("  Batch retries:      {}", stats_.batch_retries.load());
        spdlog::info("  Entities moved:     {}", stats_.entities_transferred.load());
        spdlog::info("  Degraded reports:   {}", stats_.reports_degraded.load());
        spdlog::info("  Failed reports:     {}", stats_.reports_failed.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_reconciled(const ReconciliationCompletedEvent& e) {
        if (e.overall_status == reconcile::OverallStatus::Degraded) {
            stats_.reports_degraded++;
        } else if (e.overall_status == reconcile::OverallStatus::Failed) {
            stats_.reports_failed++;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace fullsync::events
