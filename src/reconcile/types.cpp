#include "fullsync/reconcile/types.hpp"

namespace fullsync::reconcile {

const char* to_string(Classification classification) noexcept {
    switch (classification) {
        case Classification::ExactMatch: return "exact_match";
        case Classification::ExpectedDifference: return "expected_difference";
        case Classification::UnexpectedMismatch: return "unexpected_mismatch";
    }
    return "exact_match";
}

const char* to_string(OverallStatus status) noexcept {
    switch (status) {
        case OverallStatus::Clean: return "clean";
        case OverallStatus::Degraded: return "degraded";
        case OverallStatus::Failed: return "failed";
    }
    return "clean";
}

std::optional<Classification> classification_from_string(std::string_view text) noexcept {
    for (auto value : {Classification::ExactMatch, Classification::ExpectedDifference, Classification::UnexpectedMismatch}) {
        if (text == to_string(value)) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<OverallStatus> overall_status_from_string(std::string_view text) noexcept {
    for (auto value : {OverallStatus::Clean, OverallStatus::Degraded, OverallStatus::Failed}) {
        if (text == to_string(value)) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace fullsync::reconcile
