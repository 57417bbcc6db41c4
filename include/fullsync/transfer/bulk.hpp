#pragma once

#include "fullsync/codec/snapshot_codec.hpp"
#include "fullsync/core/config.hpp"
#include "fullsync/core/result.hpp"
#include "fullsync/data/database.hpp"
#include "fullsync/data/filter.hpp"
#include "fullsync/transfer/channel.hpp"
#include "fullsync/transfer/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fullsync::transfer {

/// What a snapshot stream delivered into a restore transaction.
struct BulkReceipt {
    codec::SnapshotSummary summary;
    RestoreResult counts;       ///< attempted per type; applied is filled on commit
};

/**
 * @brief Whole-instance transfer through the snapshot codec
 *
 * push() encodes the filtered scope of a source as a chunked byte stream.
 * receive() decodes such a stream into a restore transaction, verifying the
 * checksum before anything can be committed. pull() is receive() plus commit.
 */
class BulkTransfer {
public:
    explicit BulkTransfer(const core::SyncConfig& config);

    Result<codec::SnapshotTrailer> push(const data::DatabaseHandle& source,
                                        const std::vector<std::string>& scope,
                                        const data::RecordFilter& filter,
                                        const codec::ChunkSink& sink,
                                        const InterruptCheck& interrupt = {}) const;

    /// push() into a spool file; a partial file is removed on failure.
    Result<codec::SnapshotTrailer> push_to_file(const data::DatabaseHandle& source,
                                                const std::vector<std::string>& scope,
                                                const data::RecordFilter& filter,
                                                const std::filesystem::path& path,
                                                const InterruptCheck& interrupt = {}) const;

    Result<BulkReceipt> receive(const ChunkSource& chunks,
                                data::RestoreTransaction& transaction,
                                std::uint64_t bytes_total,
                                const ProgressCallback& progress = {},
                                const InterruptCheck& interrupt = {}) const;

    Result<RestoreResult> pull(const ChunkSource& chunks,
                               data::DatabaseHandle& destination,
                               std::uint64_t bytes_total = 0,
                               const ProgressCallback& progress = {},
                               const InterruptCheck& interrupt = {}) const;

    [[nodiscard]] std::size_t chunk_size() const noexcept { return settings_.chunk_size; }

private:
    core::TransferSettings settings_;
};

Result<ChunkSource> file_chunk_source(const std::filesystem::path& path, std::size_t chunk_size);

/// Sink that blocks on a full channel; fails with Cancelled once the channel is closed.
codec::ChunkSink channel_sink(ChunkChannel& channel);

ChunkSource channel_source(ChunkChannel& channel);

ChunkSource memory_chunk_source(std::vector<std::vector<std::uint8_t>> chunks);

} // namespace fullsync::transfer
