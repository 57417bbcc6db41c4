#include "fullsync/session/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace fullsync::session {
namespace {

using Table = std::unordered_map<Phase, std::vector<Phase>>;

const Table& bulk_transitions() {
    static const Table transitions {
        {Phase::Pending, {Phase::Backup}},
        {Phase::Backup, {Phase::Transfer}},
        {Phase::Transfer, {Phase::Convert}},
        {Phase::Convert, {Phase::Restore}},
        {Phase::Restore, {Phase::Verify}},
        {Phase::Verify, {Phase::Completed}},
    };
    return transitions;
}

const Table& incremental_transitions() {
    static const Table transitions {
        {Phase::Pending, {Phase::Transfer}},
        {Phase::Transfer, {Phase::Restore}},
        {Phase::Restore, {Phase::Verify}},
        {Phase::Verify, {Phase::Completed}},
    };
    return transitions;
}

} // namespace

SyncSession::SyncSession(std::string id,
                         Direction direction,
                         Method method,
                         std::string source_name,
                         std::string destination_name,
                         data::FilterOptions filter,
                         std::size_t speed_window)
    : estimator_(speed_window) {
    info_.id = std::move(id);
    info_.direction = direction;
    info_.method = method;
    info_.phase = Phase::Pending;
    info_.source_name = std::move(source_name);
    info_.destination_name = std::move(destination_name);
    info_.filter = std::move(filter);
    info_.started_at = Clock::now();
    info_.updated_at = info_.started_at;
}

SyncSession::SyncSession(SyncSessionInfo info, std::size_t speed_window)
    : info_(std::move(info)), estimator_(speed_window) {
    estimator_.reset(progress_units(), Clock::now());
}

bool SyncSession::is_allowed(Method method, Phase from, Phase to) noexcept {
    if (from == to) {
        return true;
    }
    if (is_terminal(from)) {
        return false;
    }
    if (to == Phase::Failed || to == Phase::Cancelled) {
        return true;
    }
    const auto& table = method == Method::Bulk ? bulk_transitions() : incremental_transitions();
    const auto it = table.find(from);
    if (it == table.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), to) != it->second.end();
}

bool SyncSession::can_transition(Phase target) const noexcept {
    return is_allowed(info_.method, info_.phase, target);
}

Result<void> SyncSession::transition_to(Phase next) {
    if (info_.phase == next) {
        return Ok();
    }
    if (!can_transition(next)) {
        return Err<void>(ErrorCode::Internal,
            std::string("illegal phase transition ") + to_string(info_.phase) + " -> " + to_string(next) +
            " for " + fullsync::to_string(info_.method) + " session " + info_.id);
    }

    const auto now = Clock::now();
    info_.phase = next;
    touch(now);
    estimator_.reset(progress_units(), now);
    info_.transfer_speed = 0.0;
    info_.estimated_completion.reset();

    if (next != Phase::Failed) {
        info_.error_code.reset();
        info_.error_message.clear();
    }
    if (is_terminal(next)) {
        info_.completed_at = now;
    }
    return Ok();
}

Result<void> SyncSession::mark_failed(ErrorCode code, std::string message) {
    if (is_terminal(info_.phase)) {
        return Err<void>(ErrorCode::Internal, "session " + info_.id + " is already terminal");
    }
    auto moved = transition_to(Phase::Failed);
    if (moved.is_error()) {
        return moved;
    }
    info_.error_code = code;
    info_.error_message = std::string(fullsync::to_string(code)) + ": " + message;
    return Ok();
}

Result<void> SyncSession::mark_cancelled() {
    if (is_terminal(info_.phase)) {
        return Err<void>(ErrorCode::Internal, "session " + info_.id + " is already terminal");
    }
    return transition_to(Phase::Cancelled);
}

void SyncSession::set_totals(std::uint64_t bytes_total, std::uint64_t entities_total) {
    info_.bytes_total = bytes_total;
    info_.entities_total = entities_total;
}

void SyncSession::update_progress(std::uint64_t bytes_transferred,
                                  std::uint64_t entities_transferred,
                                  Clock::time_point now) {
    info_.bytes_transferred = bytes_transferred;
    info_.entities_transferred = entities_transferred;
    estimator_.sample(progress_units(), now);
    info_.transfer_speed = estimator_.speed();
    info_.estimated_completion = estimator_.estimate_completion(progress_units(), progress_total(), now);
    touch(now);
}

Result<void> SyncSession::attach_report(std::string report_id) {
    if (info_.phase != Phase::Verify) {
        return Err<void>(ErrorCode::Internal,
            std::string("reconciliation report attached outside verify (phase ") + to_string(info_.phase) + ")");
    }
    info_.reconciliation_report_id = std::move(report_id);
    touch(Clock::now());
    return Ok();
}

std::uint64_t SyncSession::progress_units() const noexcept {
    return info_.method == Method::Bulk ? info_.bytes_transferred : info_.entities_transferred;
}

std::uint64_t SyncSession::progress_total() const noexcept {
    return info_.method == Method::Bulk ? info_.bytes_total : info_.entities_total;
}

void SyncSession::touch(Clock::time_point now) {
    info_.updated_at = std::max(info_.updated_at, now);
}

} // namespace fullsync::session
