#include "fullsync/codec/snapshot_codec.hpp"
#include "fullsync/codec/record_serializer.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstring>

namespace fullsync::codec {
namespace {

constexpr std::size_t kPreambleSize = 4 + 1 + 1 + 4;
constexpr std::uint32_t kMaxHeaderBytes = 1024 * 1024;
constexpr std::uint32_t kMaxFrameBytes = 64 * 1024 * 1024;
constexpr std::size_t kScratchBytes = 16 * 1024;

std::string zlib_message(const z_stream& stream, int rv) {
    if (stream.msg != nullptr) {
        return stream.msg;
    }
    return "zlib error " + std::to_string(rv);
}

std::uint32_t read_be32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
            static_cast<std::uint32_t>(p[3]);
}

} // namespace

// ════════════════════════════════════════════════════════
// Encoder
// ════════════════════════════════════════════════════════

class SnapshotEncoder::Impl {
public:
    Impl(SnapshotHeader header, ChunkSink sink, std::size_t chunk_size)
        : header_(std::move(header)),
          sink_(std::move(sink)),
          chunk_size_(std::max<std::size_t>(chunk_size, 1)),
          scratch_(kScratchBytes) {
        crc_ = ::crc32(0L, Z_NULL, 0);
        write_preamble();
        if (header_.compressed) {
            const int rv = ::deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15, 8, Z_DEFAULT_STRATEGY);
            if (rv != Z_OK) {
                init_error_ = Error{ErrorCode::Internal, "deflateInit2 failed: " + zlib_message(stream_, rv)};
            } else {
                stream_ready_ = true;
            }
        }
    }

    ~Impl() {
        if (stream_ready_) {
            ::deflateEnd(&stream_);
        }
    }

    Result<void> write(const data::Record& record) {
        if (init_error_) {
            return Err<void>(*init_error_);
        }
        if (finished_) {
            return Err<void>(ErrorCode::Internal, "snapshot encoder already finished");
        }

        frame_.clear();
        RecordSerializer::write_uint32(frame_, 0);
        RecordSerializer::serialize(frame_, record);
        const std::size_t body = frame_.size() - 4;
        if (body > kMaxFrameBytes) {
            return Err<void>(ErrorCode::Apply,
                "record " + record.entity_type + ":" + record.id + " exceeds the maximum frame size");
        }
        const auto length = static_cast<std::uint32_t>(body);
        frame_[0] = static_cast<std::uint8_t>(length >> 24);
        frame_[1] = static_cast<std::uint8_t>(length >> 16);
        frame_[2] = static_cast<std::uint8_t>(length >> 8);
        frame_[3] = static_cast<std::uint8_t>(length);

        ++record_count_;
        return append_payload(frame_.data(), frame_.size());
    }

    Result<SnapshotTrailer> finish() {
        if (init_error_) {
            return Err<SnapshotTrailer>(*init_error_);
        }
        if (finished_) {
            return Err<SnapshotTrailer>(ErrorCode::Internal, "snapshot encoder already finished");
        }

        const std::uint8_t terminator[4] = {0, 0, 0, 0};
        auto appended = append_payload(terminator, sizeof(terminator));
        if (appended.is_error()) {
            return Err<SnapshotTrailer>(appended.error());
        }
        if (header_.compressed) {
            auto flushed = deflate_bytes(nullptr, 0, Z_FINISH);
            if (flushed.is_error()) {
                return Err<SnapshotTrailer>(flushed.error());
            }
        }

        SnapshotTrailer trailer;
        trailer.crc32 = static_cast<std::uint32_t>(crc_);
        trailer.record_count = record_count_;
        trailer.payload_bytes = payload_bytes_;

        RecordSerializer::write_uint32(pending_, trailer.crc32);
        RecordSerializer::write_uint64(pending_, trailer.record_count);
        RecordSerializer::write_uint64(pending_, trailer.payload_bytes);

        auto emitted = emit_chunks(true);
        if (emitted.is_error()) {
            return Err<SnapshotTrailer>(emitted.error());
        }
        finished_ = true;
        return Ok(trailer);
    }

    std::uint64_t bytes_emitted() const noexcept { return bytes_emitted_; }
    std::uint64_t records_written() const noexcept { return record_count_; }

private:
    void write_preamble() {
        pending_.insert(pending_.end(), kSnapshotMagic.begin(), kSnapshotMagic.end());
        RecordSerializer::write_uint8(pending_, kSnapshotVersion);
        std::uint8_t flags = kFlagChecksummed;
        if (header_.compressed) {
            flags |= kFlagCompressed;
        }
        RecordSerializer::write_uint8(pending_, flags);

        std::vector<std::uint8_t> body;
        RecordSerializer::write_string(body, header_.source_name);
        RecordSerializer::write_string(body, header_.schema_revision);
        RecordSerializer::write_int64(body, header_.created_at_ms);
        RecordSerializer::write_uint32(body, static_cast<std::uint32_t>(header_.entity_types.size()));
        for (const auto& type : header_.entity_types) {
            RecordSerializer::write_string(body, type);
        }
        RecordSerializer::write_uint32(pending_, static_cast<std::uint32_t>(body.size()));
        pending_.insert(pending_.end(), body.begin(), body.end());
    }

    Result<void> append_payload(const std::uint8_t* data, std::size_t size) {
        crc_ = ::crc32(crc_, data, static_cast<uInt>(size));
        payload_bytes_ += size;
        if (header_.compressed) {
            return deflate_bytes(data, size, Z_NO_FLUSH);
        }
        pending_.insert(pending_.end(), data, data + size);
        return emit_chunks(false);
    }

    Result<void> deflate_bytes(const std::uint8_t* data, std::size_t size, int flush) {
        stream_.next_in = const_cast<Bytef*>(data);
        stream_.avail_in = static_cast<uInt>(size);
        while (true) {
            stream_.next_out = scratch_.data();
            stream_.avail_out = static_cast<uInt>(scratch_.size());
            const int rv = ::deflate(&stream_, flush);
            if (rv != Z_OK && rv != Z_STREAM_END && rv != Z_BUF_ERROR) {
                return Err<void>(ErrorCode::Internal, "deflate failed: " + zlib_message(stream_, rv));
            }
            const std::size_t produced = scratch_.size() - stream_.avail_out;
            pending_.insert(pending_.end(), scratch_.begin(), scratch_.begin() + static_cast<std::ptrdiff_t>(produced));

            auto emitted = emit_chunks(false);
            if (emitted.is_error()) {
                return emitted;
            }

            if (flush == Z_FINISH) {
                if (rv == Z_STREAM_END) {
                    return Ok();
                }
            } else if (stream_.avail_out != 0) {
                return Ok();
            }
        }
    }

    /// Emits every full chunk; with drain also the remainder.
    Result<void> emit_chunks(bool drain) {
        std::size_t offset = 0;
        while (pending_.size() - offset >= chunk_size_ || (drain && offset < pending_.size())) {
            const std::size_t n = std::min(chunk_size_, pending_.size() - offset);
            std::vector<std::uint8_t> chunk(pending_.begin() + static_cast<std::ptrdiff_t>(offset),
                                            pending_.begin() + static_cast<std::ptrdiff_t>(offset + n));
            offset += n;
            bytes_emitted_ += n;
            auto sent = sink_(std::move(chunk));
            if (sent.is_error()) {
                pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
                return sent;
            }
        }
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
        return Ok();
    }

    SnapshotHeader header_;
    ChunkSink sink_;
    std::size_t chunk_size_;

    z_stream stream_ = {};
    bool stream_ready_ = false;
    std::optional<Error> init_error_;

    std::vector<std::uint8_t> pending_;
    std::vector<std::uint8_t> frame_;
    std::vector<std::uint8_t> scratch_;

    uLong crc_ = 0;
    std::uint64_t payload_bytes_ = 0;
    std::uint64_t record_count_ = 0;
    std::uint64_t bytes_emitted_ = 0;
    bool finished_ = false;
};

SnapshotEncoder::SnapshotEncoder(SnapshotHeader header, ChunkSink sink, std::size_t chunk_size)
    : impl_(std::make_unique<Impl>(std::move(header), std::move(sink), chunk_size)) {}

SnapshotEncoder::~SnapshotEncoder() = default;

Result<void> SnapshotEncoder::write(const data::Record& record) { return impl_->write(record); }
Result<SnapshotTrailer> SnapshotEncoder::finish() { return impl_->finish(); }
std::uint64_t SnapshotEncoder::bytes_emitted() const noexcept { return impl_->bytes_emitted(); }
std::uint64_t SnapshotEncoder::records_written() const noexcept { return impl_->records_written(); }

// ════════════════════════════════════════════════════════
// Decoder
// ════════════════════════════════════════════════════════

class SnapshotDecoder::Impl {
public:
    explicit Impl(RecordHandler on_record)
        : on_record_(std::move(on_record)), scratch_(kScratchBytes) {
        crc_ = ::crc32(0L, Z_NULL, 0);
    }

    ~Impl() {
        if (stream_ready_) {
            ::inflateEnd(&stream_);
        }
    }

    Result<void> feed(const std::uint8_t* data, std::size_t size) {
        if (failure_) {
            return Err<void>(*failure_);
        }
        bytes_consumed_ += size;
        std::size_t pos = 0;

        while (true) {
            switch (state_) {
                case State::Preamble: {
                    take(data, size, pos, kPreambleSize);
                    if (input_.size() < kPreambleSize) {
                        return Ok();
                    }
                    auto parsed = parse_preamble();
                    if (parsed.is_error()) {
                        return fail(parsed.error());
                    }
                    break;
                }
                case State::Header: {
                    take(data, size, pos, header_length_);
                    if (input_.size() < header_length_) {
                        return Ok();
                    }
                    auto parsed = parse_header();
                    if (parsed.is_error()) {
                        return fail(parsed.error());
                    }
                    break;
                }
                case State::Payload: {
                    auto consumed = compressed_ ? inflate_payload(data, size, pos) : copy_payload(data, size, pos);
                    if (consumed.is_error()) {
                        return fail(consumed.error());
                    }
                    if (state_ == State::Payload) {
                        return Ok();
                    }
                    break;
                }
                case State::Trailer: {
                    take(data, size, pos, kTrailerSize);
                    if (input_.size() < kTrailerSize) {
                        return Ok();
                    }
                    auto verified = parse_trailer();
                    if (verified.is_error()) {
                        return fail(verified.error());
                    }
                    break;
                }
                case State::Done:
                    if (pos < size) {
                        return fail(Error{ErrorCode::Integrity, "unexpected bytes after snapshot trailer"});
                    }
                    return Ok();
            }
        }
    }

    Result<SnapshotSummary> finish() {
        if (failure_) {
            return Err<SnapshotSummary>(*failure_);
        }
        if (state_ != State::Done) {
            return Err<SnapshotSummary>(ErrorCode::Integrity,
                std::string("snapshot truncated in ") + state_name() + " after " +
                std::to_string(bytes_consumed_) + " bytes");
        }
        summary_.total_bytes = bytes_consumed_;
        return Ok(summary_);
    }

    const std::optional<SnapshotHeader>& header() const noexcept { return header_; }
    std::uint64_t bytes_consumed() const noexcept { return bytes_consumed_; }
    std::uint64_t records_decoded() const noexcept { return records_; }

private:
    enum class State { Preamble, Header, Payload, Trailer, Done };

    const char* state_name() const noexcept {
        switch (state_) {
            case State::Preamble: return "preamble";
            case State::Header: return "header";
            case State::Payload: return "payload";
            case State::Trailer: return "trailer";
            case State::Done: return "done";
        }
        return "unknown";
    }

    Result<void> fail(Error error) {
        failure_ = error;
        return Err<void>(std::move(error));
    }

    void take(const std::uint8_t* data, std::size_t size, std::size_t& pos, std::size_t target) {
        if (input_.size() >= target || pos >= size) {
            return;
        }
        const std::size_t n = std::min(size - pos, target - input_.size());
        input_.insert(input_.end(), data + pos, data + pos + n);
        pos += n;
    }

    Result<void> parse_preamble() {
        if (!has_snapshot_magic(input_.data(), input_.size())) {
            return Err<void>(ErrorCode::Integrity, "not a snapshot: bad magic marker");
        }
        const std::uint8_t version = input_[4];
        if (version != kSnapshotVersion) {
            return Err<void>(ErrorCode::Integrity, "unsupported snapshot version " + std::to_string(version));
        }
        const std::uint8_t flags = input_[5];
        if ((flags & ~(kFlagCompressed | kFlagChecksummed)) != 0) {
            return Err<void>(ErrorCode::Integrity, "unknown snapshot flags " + std::to_string(flags));
        }
        compressed_ = (flags & kFlagCompressed) != 0;
        checksummed_ = (flags & kFlagChecksummed) != 0;
        header_length_ = read_be32(input_.data() + 6);
        if (header_length_ > kMaxHeaderBytes) {
            return Err<void>(ErrorCode::Integrity, "snapshot header length out of range");
        }
        input_.clear();
        state_ = State::Header;
        return Ok();
    }

    Result<void> parse_header() {
        SnapshotHeader header;
        header.compressed = compressed_;
        std::size_t cursor = 0;
        const auto* data = input_.data();
        const std::size_t size = input_.size();

        auto source = RecordSerializer::read_string(data, size, cursor);
        if (source.is_error()) {
            return Err<void>(source.error());
        }
        auto revision = RecordSerializer::read_string(data, size, cursor);
        if (revision.is_error()) {
            return Err<void>(revision.error());
        }
        auto created = RecordSerializer::read_int64(data, size, cursor);
        if (created.is_error()) {
            return Err<void>(created.error());
        }
        auto count = RecordSerializer::read_uint32(data, size, cursor);
        if (count.is_error()) {
            return Err<void>(count.error());
        }
        for (std::uint32_t i = 0; i < count.value(); ++i) {
            auto type = RecordSerializer::read_string(data, size, cursor);
            if (type.is_error()) {
                return Err<void>(type.error());
            }
            header.entity_types.push_back(std::move(type.value()));
        }
        if (cursor != size) {
            return Err<void>(ErrorCode::Integrity, "snapshot header length mismatch");
        }

        header.source_name = std::move(source.value());
        header.schema_revision = std::move(revision.value());
        header.created_at_ms = created.value();
        header_ = header;
        summary_.header = std::move(header);

        if (compressed_) {
            const int rv = ::inflateInit2(&stream_, 15);
            if (rv != Z_OK) {
                return Err<void>(ErrorCode::Internal, "inflateInit2 failed: " + zlib_message(stream_, rv));
            }
            stream_ready_ = true;
        }
        input_.clear();
        state_ = State::Payload;
        return Ok();
    }

    Result<void> copy_payload(const std::uint8_t* data, std::size_t size, std::size_t& pos) {
        payload_.insert(payload_.end(), data + pos, data + size);
        pos = size;
        auto parsed = parse_frames();
        if (parsed.is_error()) {
            return parsed;
        }
        if (terminated_) {
            // Uncompressed: whatever follows the terminator is the trailer.
            input_.assign(payload_.begin(), payload_.end());
            payload_.clear();
            if (input_.size() > kTrailerSize) {
                return Err<void>(ErrorCode::Integrity, "unexpected bytes after snapshot trailer");
            }
            state_ = State::Trailer;
        }
        return Ok();
    }

    Result<void> inflate_payload(const std::uint8_t* data, std::size_t size, std::size_t& pos) {
        stream_.next_in = const_cast<Bytef*>(data + pos);
        stream_.avail_in = static_cast<uInt>(size - pos);

        while (true) {
            stream_.next_out = scratch_.data();
            stream_.avail_out = static_cast<uInt>(scratch_.size());
            const int rv = ::inflate(&stream_, Z_NO_FLUSH);
            if (rv != Z_OK && rv != Z_STREAM_END && rv != Z_BUF_ERROR) {
                return Err<void>(ErrorCode::Integrity, "snapshot payload does not inflate: " + zlib_message(stream_, rv));
            }

            const std::size_t produced = scratch_.size() - stream_.avail_out;
            if (produced > 0) {
                payload_.insert(payload_.end(), scratch_.begin(), scratch_.begin() + static_cast<std::ptrdiff_t>(produced));
                auto parsed = parse_frames();
                if (parsed.is_error()) {
                    return parsed;
                }
            }

            if (rv == Z_STREAM_END) {
                pos = size - stream_.avail_in;
                if (!terminated_) {
                    return Err<void>(ErrorCode::Integrity, "compressed payload ended before its terminator frame");
                }
                input_.clear();
                state_ = State::Trailer;
                return Ok();
            }
            if (stream_.avail_in == 0 && (stream_.avail_out != 0 || rv == Z_BUF_ERROR)) {
                pos = size;
                return Ok();
            }
        }
    }

    Result<void> parse_frames() {
        std::size_t offset = 0;
        Result<void> outcome = Ok();

        while (true) {
            const std::size_t available = payload_.size() - offset;
            if (terminated_) {
                if (available > 0 && compressed_) {
                    outcome = Err<void>(ErrorCode::Integrity, "payload continues after its terminator frame");
                }
                break;
            }
            if (available < 4) {
                break;
            }
            const std::uint32_t length = read_be32(payload_.data() + offset);
            if (length == 0) {
                crc_ = ::crc32(crc_, payload_.data() + offset, 4);
                payload_bytes_ += 4;
                offset += 4;
                terminated_ = true;
                continue;
            }
            if (length > kMaxFrameBytes) {
                outcome = Err<void>(ErrorCode::Integrity, "record frame length out of range");
                break;
            }
            if (available < 4 + static_cast<std::size_t>(length)) {
                break;
            }

            const std::uint8_t* frame = payload_.data() + offset;
            crc_ = ::crc32(crc_, frame, 4 + length);
            payload_bytes_ += 4 + length;
            offset += 4 + length;

            auto record = RecordSerializer::deserialize(frame + 4, length);
            if (record.is_error()) {
                outcome = Err<void>(record.error());
                break;
            }
            ++records_;
            auto handled = on_record_(std::move(record.value()));
            if (handled.is_error()) {
                outcome = handled;
                break;
            }
        }

        payload_.erase(payload_.begin(), payload_.begin() + static_cast<std::ptrdiff_t>(offset));
        return outcome;
    }

    Result<void> parse_trailer() {
        std::size_t cursor = 0;
        const auto* data = input_.data();
        auto crc = RecordSerializer::read_uint32(data, input_.size(), cursor);
        auto count = RecordSerializer::read_uint64(data, input_.size(), cursor);
        auto length = RecordSerializer::read_uint64(data, input_.size(), cursor);
        if (crc.is_error() || count.is_error() || length.is_error()) {
            return Err<void>(ErrorCode::Integrity, "snapshot trailer truncated");
        }

        const auto computed = static_cast<std::uint32_t>(crc_);
        if (checksummed_ && crc.value() != computed) {
            return Err<void>(ErrorCode::Integrity,
                "snapshot checksum mismatch (expected " + std::to_string(crc.value()) +
                ", computed " + std::to_string(computed) + ")");
        }
        if (count.value() != records_) {
            return Err<void>(ErrorCode::Integrity,
                "snapshot record count mismatch (expected " + std::to_string(count.value()) +
                ", decoded " + std::to_string(records_) + ")");
        }
        if (length.value() != payload_bytes_) {
            return Err<void>(ErrorCode::Integrity, "snapshot payload length mismatch");
        }

        summary_.trailer = SnapshotTrailer{crc.value(), count.value(), length.value()};
        input_.clear();
        state_ = State::Done;
        return Ok();
    }

    RecordHandler on_record_;
    State state_ = State::Preamble;
    std::optional<Error> failure_;

    std::vector<std::uint8_t> input_;
    std::vector<std::uint8_t> payload_;
    std::vector<std::uint8_t> scratch_;

    bool compressed_ = false;
    bool checksummed_ = false;
    bool terminated_ = false;
    std::uint32_t header_length_ = 0;

    z_stream stream_ = {};
    bool stream_ready_ = false;

    uLong crc_ = 0;
    std::uint64_t payload_bytes_ = 0;
    std::uint64_t records_ = 0;
    std::uint64_t bytes_consumed_ = 0;

    std::optional<SnapshotHeader> header_;
    SnapshotSummary summary_;
};

SnapshotDecoder::SnapshotDecoder(RecordHandler on_record)
    : impl_(std::make_unique<Impl>(std::move(on_record))) {}

SnapshotDecoder::~SnapshotDecoder() = default;

Result<void> SnapshotDecoder::feed(const std::uint8_t* data, std::size_t size) { return impl_->feed(data, size); }
Result<SnapshotSummary> SnapshotDecoder::finish() { return impl_->finish(); }
const std::optional<SnapshotHeader>& SnapshotDecoder::header() const noexcept { return impl_->header(); }
std::uint64_t SnapshotDecoder::bytes_consumed() const noexcept { return impl_->bytes_consumed(); }
std::uint64_t SnapshotDecoder::records_decoded() const noexcept { return impl_->records_decoded(); }

bool has_snapshot_magic(const std::uint8_t* data, std::size_t size) noexcept {
    return size >= kSnapshotMagic.size() &&
           std::memcmp(data, kSnapshotMagic.data(), kSnapshotMagic.size()) == 0;
}

Result<SnapshotSummary> inspect_snapshot(const std::vector<std::uint8_t>& blob) {
    SnapshotDecoder decoder([](data::Record&&) { return Ok(); });
    auto fed = decoder.feed(blob);
    if (fed.is_error()) {
        return Err<SnapshotSummary>(fed.error());
    }
    return decoder.finish();
}

} // namespace fullsync::codec
