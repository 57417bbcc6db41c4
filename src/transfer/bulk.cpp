#include "fullsync/transfer/bulk.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <memory>

namespace fullsync::transfer {
namespace fs = std::filesystem;

namespace {

std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

BulkTransfer::BulkTransfer(const core::SyncConfig& config) : settings_(config.transfer) {}

Result<codec::SnapshotTrailer> BulkTransfer::push(const data::DatabaseHandle& source,
                                                  const std::vector<std::string>& scope,
                                                  const data::RecordFilter& filter,
                                                  const codec::ChunkSink& sink,
                                                  const InterruptCheck& interrupt) const {
    codec::SnapshotHeader header;
    header.source_name = source.name();
    header.schema_revision = source.schema_revision();
    header.created_at_ms = now_ms();
    header.entity_types = scope;
    header.compressed = settings_.compression;

    // Interrupts are honoured once per emitted chunk.
    codec::ChunkSink guarded = [&](std::vector<std::uint8_t>&& chunk) -> Result<void> {
        if (interrupt) {
            auto check = interrupt();
            if (check.is_error()) {
                return check;
            }
        }
        return sink(std::move(chunk));
    };

    codec::SnapshotEncoder encoder(std::move(header), guarded, settings_.chunk_size);
    for (const auto& type : scope) {
        auto rows = source.read_table(type);
        if (rows.is_error()) {
            return Err<codec::SnapshotTrailer>(rows.error());
        }
        for (const auto& record : rows.value()) {
            if (!filter.matches(record)) {
                continue;
            }
            auto written = encoder.write(record);
            if (written.is_error()) {
                return Err<codec::SnapshotTrailer>(written.error());
            }
        }
        spdlog::debug("[BulkPush] source={} type={} records={} bytes_so_far={}",
                      source.name(), type, rows.value().size(), encoder.bytes_emitted());
    }
    return encoder.finish();
}

Result<codec::SnapshotTrailer> BulkTransfer::push_to_file(const data::DatabaseHandle& source,
                                                          const std::vector<std::string>& scope,
                                                          const data::RecordFilter& filter,
                                                          const fs::path& path,
                                                          const InterruptCheck& interrupt) const {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Err<codec::SnapshotTrailer>(ErrorCode::Io,
            "cannot create spool directory " + path.parent_path().string() + ": " + ec.message());
    }

    auto trailer = [&]() -> Result<codec::SnapshotTrailer> {
        std::ofstream output(path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<codec::SnapshotTrailer>(ErrorCode::Io, "cannot open spool file " + path.string());
        }
        auto file_sink = [&output, &path](std::vector<std::uint8_t>&& chunk) -> Result<void> {
            output.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
            if (!output) {
                return Err<void>(ErrorCode::Io, "failed to write spool file " + path.string());
            }
            return Ok();
        };
        auto result = push(source, scope, filter, file_sink, interrupt);
        output.flush();
        if (result.is_ok() && !output) {
            return Err<codec::SnapshotTrailer>(ErrorCode::Io, "failed to flush spool file " + path.string());
        }
        return result;
    }();

    if (trailer.is_error()) {
        fs::remove(path, ec);
    }
    return trailer;
}

Result<BulkReceipt> BulkTransfer::receive(const ChunkSource& chunks,
                                          data::RestoreTransaction& transaction,
                                          std::uint64_t bytes_total,
                                          const ProgressCallback& progress,
                                          const InterruptCheck& interrupt) const {
    BulkReceipt receipt;
    codec::SnapshotDecoder decoder([&](data::Record&& record) -> Result<void> {
        ++receipt.counts.entity_counts[record.entity_type].attempted;
        return transaction.stage(std::move(record));
    });

    while (true) {
        if (interrupt) {
            auto check = interrupt();
            if (check.is_error()) {
                return Err<BulkReceipt>(check.error());
            }
        }

        auto next = chunks();
        if (next.is_error()) {
            return Err<BulkReceipt>(next.error());
        }
        if (!next.value().has_value()) {
            break;
        }

        auto fed = decoder.feed(*next.value());
        if (fed.is_error()) {
            return Err<BulkReceipt>(fed.error());
        }
        if (progress) {
            progress(decoder.bytes_consumed(), std::max(bytes_total, decoder.bytes_consumed()));
        }
    }

    auto summary = decoder.finish();
    if (summary.is_error()) {
        return Err<BulkReceipt>(summary.error());
    }
    receipt.summary = std::move(summary.value());
    return Ok(std::move(receipt));
}

Result<RestoreResult> BulkTransfer::pull(const ChunkSource& chunks,
                                         data::DatabaseHandle& destination,
                                         std::uint64_t bytes_total,
                                         const ProgressCallback& progress,
                                         const InterruptCheck& interrupt) const {
    auto transaction = destination.begin_restore();
    if (transaction.is_error()) {
        return Err<RestoreResult>(transaction.error());
    }

    auto receipt = receive(chunks, *transaction.value(), bytes_total, progress, interrupt);
    if (receipt.is_error()) {
        return Err<RestoreResult>(receipt.error());
    }

    auto committed = transaction.value()->commit();
    if (committed.is_error()) {
        return Err<RestoreResult>(Error{ErrorCode::Apply,
            "bulk restore into " + destination.name() + " failed: " + committed.error().message});
    }

    auto counts = std::move(receipt.value().counts);
    for (auto& [type, entity] : counts.entity_counts) {
        entity.applied = entity.attempted;
    }
    return Ok(std::move(counts));
}

Result<ChunkSource> file_chunk_source(const fs::path& path, std::size_t chunk_size) {
    auto input = std::make_shared<std::ifstream>(path, std::ios::binary);
    if (!*input) {
        return Err<ChunkSource>(ErrorCode::Io, "cannot open spool file " + path.string());
    }
    const std::size_t size = chunk_size == 0 ? 64 * 1024 : chunk_size;

    ChunkSource source = [input, size, path]() -> Result<std::optional<std::vector<std::uint8_t>>> {
        std::vector<std::uint8_t> chunk(size);
        input->read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(size));
        const auto count = input->gcount();
        if (count <= 0) {
            if (input->bad()) {
                return Err<std::optional<std::vector<std::uint8_t>>>(ErrorCode::Io,
                    "failed to read spool file " + path.string());
            }
            return Ok(std::optional<std::vector<std::uint8_t>>());
        }
        chunk.resize(static_cast<std::size_t>(count));
        return Ok(std::optional<std::vector<std::uint8_t>>(std::move(chunk)));
    };
    return Ok(std::move(source));
}

codec::ChunkSink channel_sink(ChunkChannel& channel) {
    return [&channel](std::vector<std::uint8_t>&& chunk) -> Result<void> {
        if (!channel.push(std::move(chunk))) {
            return Err<void>(ErrorCode::Cancelled, "receiving side closed the stream");
        }
        return Ok();
    };
}

ChunkSource channel_source(ChunkChannel& channel) {
    return [&channel]() -> Result<std::optional<std::vector<std::uint8_t>>> {
        return Ok(channel.pop());
    };
}

ChunkSource memory_chunk_source(std::vector<std::vector<std::uint8_t>> chunks) {
    auto remaining = std::make_shared<std::vector<std::vector<std::uint8_t>>>(std::move(chunks));
    auto index = std::make_shared<std::size_t>(0);
    return [remaining, index]() -> Result<std::optional<std::vector<std::uint8_t>>> {
        if (*index >= remaining->size()) {
            return Ok(std::optional<std::vector<std::uint8_t>>());
        }
        return Ok(std::optional<std::vector<std::uint8_t>>((*remaining)[(*index)++]));
    };
}

} // namespace fullsync::transfer
