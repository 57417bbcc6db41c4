#pragma once

#include "fullsync/core/config.hpp"
#include "fullsync/core/types.hpp"
#include "fullsync/transfer/bulk.hpp"
#include "fullsync/transfer/incremental.hpp"

#include <variant>

namespace fullsync::transfer {

/// The transfer capability a session runs with. One of two closed variants.
using TransferStrategy = std::variant<BulkTransfer, IncrementalTransfer>;

inline TransferStrategy make_strategy(Method method, const core::SyncConfig& config) {
    if (method == Method::Bulk) {
        return TransferStrategy(std::in_place_type<BulkTransfer>, config);
    }
    return TransferStrategy(std::in_place_type<IncrementalTransfer>, config);
}

[[nodiscard]] inline Method method_of(const TransferStrategy& strategy) noexcept {
    return std::holds_alternative<BulkTransfer>(strategy) ? Method::Bulk : Method::Incremental;
}

} // namespace fullsync::transfer
