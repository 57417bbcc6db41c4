/**
 * @file snapshot_codec.hpp
 * @brief Streaming encoder/decoder for bulk snapshots
 *
 * WHY THIS FILE EXISTS:
 * A bulk sync moves a whole instance as one opaque byte stream. The codec
 * frames records into that stream, optionally deflates it, and protects it
 * with a CRC32 so a damaged stream is rejected before anything is restored.
 *
 * WIRE LAYOUT (integers in network byte order):
 * ┌──────────────────────────────────────────────────┐
 * │ Magic "FSNP" (4) │ Version (1) │ Flags (1)       │
 * │ Header length (4) │ Header                       │
 * │   source name, schema revision, created at (ms), │
 * │   entity type list                               │
 * ├──────────────────────────────────────────────────┤
 * │ Payload (zlib stream when compressed):           │
 * │   frame*: record length (4) + record bytes       │
 * │   terminator: length 0                           │
 * ├──────────────────────────────────────────────────┤
 * │ Trailer: CRC32 (4) │ record count (8) │          │
 * │          payload length (8)                      │
 * └──────────────────────────────────────────────────┘
 *
 * The CRC covers the uncompressed payload including the terminator.
 *
 * MEMORY:
 * The encoder hands out chunks of at most chunk_size bytes and never holds
 * more than one chunk plus the zlib window. The decoder accepts chunks of
 * any size and keeps only the bytes of an incomplete frame.
 *
 * EXAMPLE:
 * SnapshotEncoder encoder(header, [&](std::vector<std::uint8_t>&& chunk) {
 *     return channel.send(std::move(chunk));
 * });
 * for (const auto& record : records) encoder.write(record);
 * auto trailer = encoder.finish();
 */

#pragma once

#include "fullsync/core/result.hpp"
#include "fullsync/data/record.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fullsync::codec {

inline constexpr std::array<char, 4> kSnapshotMagic{'F', 'S', 'N', 'P'};
inline constexpr std::uint8_t kSnapshotVersion = 1;
inline constexpr std::uint8_t kFlagCompressed = 0x01;
inline constexpr std::uint8_t kFlagChecksummed = 0x02;
inline constexpr std::size_t kTrailerSize = 4 + 8 + 8;

struct SnapshotHeader {
    std::string source_name;
    std::string schema_revision;
    std::int64_t created_at_ms = 0;
    std::vector<std::string> entity_types;
    bool compressed = true;
};

struct SnapshotTrailer {
    std::uint32_t crc32 = 0;
    std::uint64_t record_count = 0;
    std::uint64_t payload_bytes = 0;
};

struct SnapshotSummary {
    SnapshotHeader header;
    SnapshotTrailer trailer;
    std::uint64_t total_bytes = 0;
};

using ChunkSink = std::function<Result<void>(std::vector<std::uint8_t>&&)>;

class SnapshotEncoder {
public:
    SnapshotEncoder(SnapshotHeader header, ChunkSink sink, std::size_t chunk_size = 64 * 1024);
    ~SnapshotEncoder();

    SnapshotEncoder(const SnapshotEncoder&) = delete;
    SnapshotEncoder& operator=(const SnapshotEncoder&) = delete;

    Result<void> write(const data::Record& record);

    /// Terminates the payload, appends the trailer and flushes the last chunk.
    Result<SnapshotTrailer> finish();

    [[nodiscard]] std::uint64_t bytes_emitted() const noexcept;
    [[nodiscard]] std::uint64_t records_written() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

class SnapshotDecoder {
public:
    using RecordHandler = std::function<Result<void>(data::Record&&)>;

    explicit SnapshotDecoder(RecordHandler on_record);
    ~SnapshotDecoder();

    SnapshotDecoder(const SnapshotDecoder&) = delete;
    SnapshotDecoder& operator=(const SnapshotDecoder&) = delete;

    /**
     * @brief Consume the next piece of the stream
     *
     * Records are handed to the handler as soon as their frame is complete.
     * Framing, inflate and checksum failures are ErrorCode::Integrity; an
     * error returned by the handler is passed through unchanged.
     */
    Result<void> feed(const std::uint8_t* data, std::size_t size);
    Result<void> feed(const std::vector<std::uint8_t>& chunk) { return feed(chunk.data(), chunk.size()); }

    /// Fails with Integrity unless a complete, verified snapshot was fed.
    Result<SnapshotSummary> finish();

    [[nodiscard]] const std::optional<SnapshotHeader>& header() const noexcept;
    [[nodiscard]] std::uint64_t bytes_consumed() const noexcept;
    [[nodiscard]] std::uint64_t records_decoded() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

[[nodiscard]] bool has_snapshot_magic(const std::uint8_t* data, std::size_t size) noexcept;

/// Structural validation of a complete blob, records discarded.
Result<SnapshotSummary> inspect_snapshot(const std::vector<std::uint8_t>& blob);

} // namespace fullsync::codec
