#pragma once

#include "fullsync/core/result.hpp"
#include "fullsync/session/progress.hpp"
#include "fullsync/session/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace fullsync::session {

/**
 * @brief Phase machine of one sync run
 *
 * Bulk:        pending → backup → transfer → convert → restore → verify → completed
 * Incremental: pending → transfer → restore → verify → completed
 *
 * failed and cancelled are reachable from every non-terminal phase and are
 * terminal themselves. Re-entering the current phase is a no-op.
 */
class SyncSession {
public:
    using Clock = std::chrono::system_clock;

    SyncSession(std::string id,
                Direction direction,
                Method method,
                std::string source_name,
                std::string destination_name,
                data::FilterOptions filter,
                std::size_t speed_window = 10);

    /// Rehydrates a persisted session (resume).
    explicit SyncSession(SyncSessionInfo info, std::size_t speed_window = 10);

    [[nodiscard]] const std::string& id() const noexcept { return info_.id; }
    [[nodiscard]] Phase phase() const noexcept { return info_.phase; }
    [[nodiscard]] Method method() const noexcept { return info_.method; }
    [[nodiscard]] const SyncSessionInfo& info() const noexcept { return info_; }

    Result<void> transition_to(Phase next);
    Result<void> mark_failed(ErrorCode code, std::string message);
    Result<void> mark_cancelled();

    void set_totals(std::uint64_t bytes_total, std::uint64_t entities_total);

    /// Cumulative counters; refreshes speed and estimated completion.
    void update_progress(std::uint64_t bytes_transferred, std::uint64_t entities_transferred, Clock::time_point now);

    void set_cursor(std::uint64_t sequence) noexcept { info_.last_confirmed_sequence = sequence; }
    void set_owner(std::string token) { info_.owner_token = std::move(token); }

    Result<void> attach_report(std::string report_id);

    [[nodiscard]] bool can_transition(Phase target) const noexcept;
    [[nodiscard]] static bool is_allowed(Method method, Phase from, Phase to) noexcept;

private:
    [[nodiscard]] std::uint64_t progress_units() const noexcept;
    [[nodiscard]] std::uint64_t progress_total() const noexcept;
    void touch(Clock::time_point now);

    SyncSessionInfo info_;
    ProgressEstimator estimator_;
};

} // namespace fullsync::session
