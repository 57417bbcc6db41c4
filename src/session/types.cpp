#include "fullsync/session/types.hpp"

#include <array>
#include <utility>

namespace fullsync::session {
namespace {

constexpr std::array<std::pair<Phase, const char*>, 9> kPhaseNames {{
    {Phase::Pending, "pending"},
    {Phase::Backup, "backup"},
    {Phase::Transfer, "transfer"},
    {Phase::Convert, "convert"},
    {Phase::Restore, "restore"},
    {Phase::Verify, "verify"},
    {Phase::Completed, "completed"},
    {Phase::Failed, "failed"},
    {Phase::Cancelled, "cancelled"},
}};

} // namespace

const char* to_string(Phase phase) noexcept {
    for (const auto& [value, name] : kPhaseNames) {
        if (value == phase) {
            return name;
        }
    }
    return "pending";
}

std::optional<Phase> phase_from_string(std::string_view text) noexcept {
    for (const auto& [value, name] : kPhaseNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

const char* to_string(CancelResult result) noexcept {
    switch (result) {
        case CancelResult::Accepted: return "accepted";
        case CancelResult::TooLate: return "too_late";
        case CancelResult::AlreadyTerminal: return "already_terminal";
    }
    return "accepted";
}

} // namespace fullsync::session
