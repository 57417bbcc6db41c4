/**
 * @file events.hpp
 * @brief Event types emitted over the life of a sync session
 *
 * NAMING CONVENTION:
 * Events are past-tense: SyncStartedEvent, SyncPhaseChangedEvent.
 *
 * Every session event is emitted by the SyncManager from the thread that
 * drives the session.
 */

#pragma once

#include "fullsync/core/error.hpp"
#include "fullsync/core/types.hpp"
#include "fullsync/reconcile/types.hpp"
#include "fullsync/session/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace fullsync::events {

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

/**
 * @brief A session was accepted and its lease acquired
 *
 * WHO SUBSCRIBES:
 * - Logger
 * - Metrics (sessions started)
 */
struct SyncStartedEvent {
    std::string session_id;
    Direction direction = Direction::Push;
    Method method = Method::Bulk;
    std::string source_name;
    std::string destination_name;
    bool resumed = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncPhaseChangedEvent {
    std::string session_id;
    session::Phase from = session::Phase::Pending;
    session::Phase to = session::Phase::Pending;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// Throttled like registry writes; one per persisted progress update.
struct SyncProgressEvent {
    std::string session_id;
    session::Phase phase = session::Phase::Transfer;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t bytes_total = 0;
    std::uint64_t entities_transferred = 0;
    std::uint64_t entities_total = 0;
    double transfer_speed = 0.0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// An incremental batch failed and is about to be retried.
struct BatchRetryEvent {
    std::string session_id;
    std::size_t attempt = 0;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncCompletedEvent {
    std::string session_id;
    std::string report_id;
    reconcile::OverallStatus overall_status = reconcile::OverallStatus::Clean;
    std::uint64_t entities_transferred = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncFailedEvent {
    std::string session_id;
    session::Phase phase = session::Phase::Pending;    ///< Phase the failure happened in
    ErrorCode code = ErrorCode::Internal;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncCancelledEvent {
    std::string session_id;
    session::Phase phase = session::Phase::Pending;    ///< Phase the cancel took effect in
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// Lease renewal failed; the driver stopped without touching the registry.
struct LeaseLostEvent {
    std::string session_id;
    std::string lease_key;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Reconciliation Events
// ════════════════════════════════════════════════════════

struct ReconciliationCompletedEvent {
    std::string session_id;
    std::string report_id;
    std::uint64_t exact_matches = 0;
    std::uint64_t expected_differences = 0;
    std::uint64_t unexpected_mismatches = 0;
    reconcile::OverallStatus overall_status = reconcile::OverallStatus::Clean;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    uint16_t port = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ServerShuttingDownEvent {
    std::string reason = "normal";
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace fullsync::events
