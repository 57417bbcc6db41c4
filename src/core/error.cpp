#include "fullsync/core/error.hpp"

#include <array>
#include <utility>

namespace fullsync {
namespace {

constexpr std::array<std::pair<ErrorCode, const char*>, 12> kNames {{
    {ErrorCode::Validation, "ValidationError"},
    {ErrorCode::Integrity, "IntegrityError"},
    {ErrorCode::Conflict, "ConflictError"},
    {ErrorCode::PhaseTimeout, "PhaseTimeoutError"},
    {ErrorCode::Apply, "ApplyError"},
    {ErrorCode::NotFound, "NotFoundError"},
    {ErrorCode::TooLate, "TooLateError"},
    {ErrorCode::Cancelled, "CancelledError"},
    {ErrorCode::LeaseLost, "LeaseLostError"},
    {ErrorCode::Io, "IoError"},
    {ErrorCode::Config, "ConfigError"},
    {ErrorCode::Internal, "InternalError"},
}};

} // namespace

std::string Error::describe() const {
    return std::string(to_string(code)) + ": " + message;
}

const char* to_string(ErrorCode code) noexcept {
    for (const auto& [value, name] : kNames) {
        if (value == code) {
            return name;
        }
    }
    return "InternalError";
}

std::optional<ErrorCode> error_code_from_string(std::string_view name) noexcept {
    for (const auto& [value, text] : kNames) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace fullsync
