#pragma once

/**
 * @file record_serializer.hpp
 * @brief Binary encoding of records inside a snapshot
 *
 * BINARY FORMAT (network byte order):
 * ┌─────────────────────────────────────┐
 * │ Version (1 byte)                    │
 * │ Entity type (4-byte len + bytes)    │
 * │ Id (4-byte len + bytes)             │
 * │ Field count (4 bytes)               │
 * │ For each field:                     │
 * │   Name (4-byte len + bytes)         │
 * │   Value (4-byte len + bytes)        │
 * └─────────────────────────────────────┘
 *
 * Any underflow or unknown version is reported as ErrorCode::Integrity:
 * the only way to get a malformed record here is a damaged snapshot.
 */

#include "fullsync/core/result.hpp"
#include "fullsync/data/record.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <arpa/inet.h>

namespace fullsync::codec {

class RecordSerializer {
public:
    static constexpr std::uint8_t kVersion = 1;

    static void serialize(std::vector<std::uint8_t>& buffer, const data::Record& record) {
        write_uint8(buffer, kVersion);
        write_string(buffer, record.entity_type);
        write_string(buffer, record.id);
        write_uint32(buffer, static_cast<std::uint32_t>(record.fields.size()));
        for (const auto& [name, value] : record.fields) {
            write_string(buffer, name);
            write_string(buffer, value);
        }
    }

    static std::vector<std::uint8_t> serialize(const data::Record& record) {
        std::vector<std::uint8_t> buffer;
        serialize(buffer, record);
        return buffer;
    }

    static Result<data::Record> deserialize(const std::uint8_t* data, std::size_t size) {
        std::size_t cursor = 0;
        data::Record record;

        auto version = read_uint8(data, size, cursor);
        if (version.is_error()) {
            return Err<data::Record>(version.error());
        }
        if (version.value() != kVersion) {
            return Err<data::Record>(ErrorCode::Integrity,
                "unsupported record version: " + std::to_string(version.value()));
        }

        auto type = read_string(data, size, cursor);
        if (type.is_error()) {
            return Err<data::Record>(type.error());
        }
        record.entity_type = std::move(type.value());

        auto id = read_string(data, size, cursor);
        if (id.is_error()) {
            return Err<data::Record>(id.error());
        }
        record.id = std::move(id.value());

        auto count = read_uint32(data, size, cursor);
        if (count.is_error()) {
            return Err<data::Record>(count.error());
        }
        for (std::uint32_t i = 0; i < count.value(); ++i) {
            auto name = read_string(data, size, cursor);
            if (name.is_error()) {
                return Err<data::Record>(name.error());
            }
            auto value = read_string(data, size, cursor);
            if (value.is_error()) {
                return Err<data::Record>(value.error());
            }
            record.fields.emplace(std::move(name.value()), std::move(value.value()));
        }

        if (cursor != size) {
            return Err<data::Record>(ErrorCode::Integrity, "trailing bytes after record");
        }
        return Ok(std::move(record));
    }

    // ════════════════════════════════════════════════════════
    // Primitive helpers (shared with the snapshot header)
    // ════════════════════════════════════════════════════════

    static void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value) {
        buffer.push_back(value);
    }

    static void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        std::uint32_t network_value = htonl(value);
        const auto* bytes = reinterpret_cast<const std::uint8_t*>(&network_value);
        buffer.insert(buffer.end(), bytes, bytes + 4);
    }

    static void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        write_uint32(buffer, static_cast<std::uint32_t>(value >> 32));
        write_uint32(buffer, static_cast<std::uint32_t>(value & 0xFFFFFFFFu));
    }

    static void write_int64(std::vector<std::uint8_t>& buffer, std::int64_t value) {
        write_uint64(buffer, static_cast<std::uint64_t>(value));
    }

    static void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }

    static Result<std::uint8_t> read_uint8(const std::uint8_t* data, std::size_t size, std::size_t& cursor) {
        if (cursor + 1 > size) {
            return Err<std::uint8_t>(ErrorCode::Integrity, "buffer underflow reading uint8");
        }
        return Ok(data[cursor++]);
    }

    static Result<std::uint32_t> read_uint32(const std::uint8_t* data, std::size_t size, std::size_t& cursor) {
        if (cursor + 4 > size) {
            return Err<std::uint32_t>(ErrorCode::Integrity, "buffer underflow reading uint32");
        }
        std::uint32_t network_value;
        std::memcpy(&network_value, data + cursor, 4);
        cursor += 4;
        return Ok(static_cast<std::uint32_t>(ntohl(network_value)));
    }

    static Result<std::uint64_t> read_uint64(const std::uint8_t* data, std::size_t size, std::size_t& cursor) {
        auto high = read_uint32(data, size, cursor);
        if (high.is_error()) {
            return Err<std::uint64_t>(high.error());
        }
        auto low = read_uint32(data, size, cursor);
        if (low.is_error()) {
            return Err<std::uint64_t>(low.error());
        }
        return Ok((static_cast<std::uint64_t>(high.value()) << 32) | low.value());
    }

    static Result<std::int64_t> read_int64(const std::uint8_t* data, std::size_t size, std::size_t& cursor) {
        auto value = read_uint64(data, size, cursor);
        if (value.is_error()) {
            return Err<std::int64_t>(value.error());
        }
        return Ok(static_cast<std::int64_t>(value.value()));
    }

    static Result<std::string> read_string(const std::uint8_t* data, std::size_t size, std::size_t& cursor) {
        auto length = read_uint32(data, size, cursor);
        if (length.is_error()) {
            return Err<std::string>(length.error());
        }
        if (cursor + length.value() > size) {
            return Err<std::string>(ErrorCode::Integrity, "buffer underflow reading string");
        }
        std::string value(reinterpret_cast<const char*>(data + cursor), length.value());
        cursor += length.value();
        return Ok(std::move(value));
    }
};

} // namespace fullsync::codec
