#pragma once

#include "fullsync/core/result.hpp"
#include "fullsync/data/record.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fullsync::transfer {

/// One piece of a bulk snapshot byte stream.
struct SnapshotChunk {
    std::string session_id;
    std::uint32_t chunk_index = 0;
    std::vector<std::uint8_t> bytes;
};

/// One record of an incremental stream. Sequence numbers increase across the whole stream.
struct RecordEnvelope {
    std::uint64_t sequence = 0;
    std::string entity_type;
    data::Record record;
    std::uint32_t checksum = 0;     ///< CRC32 of the serialized record
};

using TransferEnvelope = std::variant<SnapshotChunk, RecordEnvelope>;

[[nodiscard]] std::uint32_t record_checksum(const data::Record& record);

RecordEnvelope make_envelope(std::uint64_t sequence, data::Record record);

/// Yields the next chunk, or nullopt at end of stream.
using ChunkSource = std::function<Result<std::optional<std::vector<std::uint8_t>>>()>;

/// Called with units done and units total (bytes for bulk, entities for incremental).
using ProgressCallback = std::function<void(std::uint64_t done, std::uint64_t total)>;

/// Returns an error (Cancelled, PhaseTimeout, LeaseLost) when work must stop.
using InterruptCheck = std::function<Result<void>()>;

struct EntityApplyCounts {
    std::uint64_t attempted = 0;
    std::uint64_t applied = 0;
    std::uint64_t failed = 0;
};

struct ApplyFailure {
    std::string entity_type;
    std::string entity_id;
    std::uint64_t sequence = 0;
    std::string error;
};

/// Outcome of applying records to a destination, per entity type.
struct RestoreResult {
    std::map<std::string, EntityApplyCounts> entity_counts;
    std::vector<ApplyFailure> failures;

    [[nodiscard]] std::uint64_t applied_total() const {
        std::uint64_t total = 0;
        for (const auto& [type, counts] : entity_counts) {
            total += counts.applied;
        }
        return total;
    }
};

} // namespace fullsync::transfer
