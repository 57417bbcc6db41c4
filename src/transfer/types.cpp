#include "fullsync/transfer/types.hpp"
#include "fullsync/codec/record_serializer.hpp"

#include <zlib.h>

namespace fullsync::transfer {

std::uint32_t record_checksum(const data::Record& record) {
    const auto bytes = codec::RecordSerializer::serialize(record);
    return static_cast<std::uint32_t>(::crc32(0L, bytes.data(), static_cast<uInt>(bytes.size())));
}

RecordEnvelope make_envelope(std::uint64_t sequence, data::Record record) {
    RecordEnvelope envelope;
    envelope.sequence = sequence;
    envelope.entity_type = record.entity_type;
    envelope.checksum = record_checksum(record);
    envelope.record = std::move(record);
    return envelope;
}

} // namespace fullsync::transfer
