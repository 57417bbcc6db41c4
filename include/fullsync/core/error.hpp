#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fullsync {

/**
 * @brief Failure categories surfaced by the engine
 *
 * The first five mirror the conditions a caller can see on a failed
 * session. The rest are infrastructure conditions (registry, config,
 * ownership) that end up on the session the same way.
 */
enum class ErrorCode {
    Validation,     ///< Bad direction/method/filter, rejected before any phase
    Integrity,      ///< Snapshot checksum or framing mismatch
    Conflict,       ///< A sync is already in progress for the pair
    PhaseTimeout,   ///< A phase exceeded its budget
    Apply,          ///< A record or snapshot could not be written
    NotFound,
    TooLate,        ///< Cancel requested once restore has begun
    Cancelled,
    LeaseLost,      ///< Another process took over the session
    Io,
    Config,
    Internal
};

struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;

    /// "IntegrityError: snapshot checksum mismatch ..."
    [[nodiscard]] std::string describe() const;
};

[[nodiscard]] const char* to_string(ErrorCode code) noexcept;

[[nodiscard]] std::optional<ErrorCode> error_code_from_string(std::string_view name) noexcept;

} // namespace fullsync
