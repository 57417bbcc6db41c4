#pragma once

#include "fullsync/core/error.hpp"
#include "fullsync/core/types.hpp"
#include "fullsync/data/filter.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fullsync::session {

enum class Phase {
    Pending,
    Backup,
    Transfer,
    Convert,
    Restore,
    Verify,
    Completed,
    Failed,
    Cancelled
};

[[nodiscard]] const char* to_string(Phase phase) noexcept;
[[nodiscard]] std::optional<Phase> phase_from_string(std::string_view text) noexcept;

[[nodiscard]] constexpr bool is_terminal(Phase phase) noexcept {
    return phase == Phase::Completed || phase == Phase::Failed || phase == Phase::Cancelled;
}

/// Cancel is honoured up to and including convert; restore is all-or-nothing.
[[nodiscard]] constexpr bool is_cancellable(Phase phase) noexcept {
    return phase == Phase::Pending || phase == Phase::Backup ||
           phase == Phase::Transfer || phase == Phase::Convert;
}

/**
 * @brief Everything known about one sync run
 *
 * Persisted by the session registry on every phase change and, throttled,
 * on progress. Polling returns a copy of the latest state.
 */
struct SyncSessionInfo {
    std::string id;
    Direction direction = Direction::Push;
    Method method = Method::Bulk;
    Phase phase = Phase::Pending;

    std::string source_name;
    std::string destination_name;
    data::FilterOptions filter;

    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point updated_at{};
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::optional<std::chrono::system_clock::time_point> estimated_completion;
    double transfer_speed = 0.0;    ///< bytes/s for bulk, entities/s for incremental

    std::uint64_t bytes_total = 0;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t entities_total = 0;
    std::uint64_t entities_transferred = 0;

    std::uint64_t last_confirmed_sequence = 0;  ///< Incremental resume cursor
    std::string owner_token;                    ///< Lease token of the driving process

    std::optional<ErrorCode> error_code;        ///< Set only when failed
    std::string error_message;                  ///< Set only when failed
    std::string reconciliation_report_id;       ///< Set only after verify
};

enum class CancelResult {
    Accepted,
    TooLate,            ///< Restore has begun
    AlreadyTerminal
};

[[nodiscard]] const char* to_string(CancelResult result) noexcept;

} // namespace fullsync::session
