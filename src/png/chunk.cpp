#include "chunk.hpp"
#include "png_errors.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <sstream>
#include <stdexcept>
#include <zlib.h>

Chunk::Chunk(const ChunkType& type, std::vector<uint8_t> data)
    : chunkType(type), payload(std::move(data)) {
    if (payload.size() > MAX_LENGTH) {
        throw std::length_error("Chunk data of " + std::to_string(payload.size()) +
                                " bytes exceeds the maximum chunk length");
    }
    checksum = computeCrc(chunkType.bytes(), payload.data(), payload.size());
}

Chunk::Chunk(const ChunkType& type, std::vector<uint8_t> data, uint32_t crc)
    : chunkType(type), payload(std::move(data)), checksum(crc) {}

uint32_t Chunk::computeCrc(const ChunkTypeCode& type, const uint8_t* data, size_t length) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, type.data(), static_cast<uInt>(type.size()));
    if (length > 0)
        crc = crc32(crc, data, static_cast<uInt>(length));
    return static_cast<uint32_t>(crc);
}

std::pair<Chunk, size_t> Chunk::parse(const std::vector<uint8_t>& blob, size_t offset) {
    if (offset > blob.size() || blob.size() - offset < OVERHEAD) {
        throw MalformedChunkError("Truncated chunk at offset 0x" + to_hex(offset) +
                                  ": fewer than 12 bytes left");
    }

    uint32_t len = read_be32(blob, offset);
    if (len > MAX_LENGTH) {
        throw MalformedChunkError("Chunk at offset 0x" + to_hex(offset) +
                                  " declares length 0x" + to_hex(len) +
                                  " above the maximum of 0x" + to_hex(MAX_LENGTH));
    }

    size_t available = blob.size() - offset - OVERHEAD;
    if (len > available) {
        throw MalformedChunkError("Chunk at offset 0x" + to_hex(offset) +
                                  " declares " + std::to_string(len) + " data bytes but only " +
                                  std::to_string(available) + " remain");
    }

    size_t pos = offset + 4;
    ChunkTypeCode code = {blob[pos], blob[pos + 1], blob[pos + 2], blob[pos + 3]};
    if (!ChunkType::isAlphabetic(code)) {
        throw MalformedChunkError("Chunk at offset 0x" + to_hex(offset) +
                                  " has a type code that is not 4 ASCII letters");
    }

    // type and data are contiguous on disk
    uint32_t stored = read_be32(blob, pos + 4 + len);
    uLong computed = crc32(0L, Z_NULL, 0);
    computed = crc32(computed, &blob[pos], static_cast<uInt>(4 + len));

    if (stored != static_cast<uint32_t>(computed)) {
        throw MalformedChunkError("CRC mismatch in chunk at offset 0x" + to_hex(offset) +
                                  ": stored 0x" + to_hex(stored) +
                                  ", computed 0x" + to_hex(static_cast<uint32_t>(computed)));
    }

    std::vector<uint8_t> data(blob.begin() + pos + 4, blob.begin() + pos + 4 + len);
    Chunk chunk(ChunkType::fromBytes(code), std::move(data), stored);

    Logger::debug("0x" + to_hex(offset) + " " + chunk.type().toString() +
                  " length " + std::to_string(len));

    return {std::move(chunk), pos + 4 + len + 4};
}

std::string Chunk::dataAsString() const {
    if (!is_valid_utf8(payload)) {
        throw InvalidEncodingError("Data of chunk " + chunkType.toString() + " is not valid UTF-8 text");
    }
    return std::string(payload.begin(), payload.end());
}

std::vector<uint8_t> Chunk::asBytes() const {
    std::vector<uint8_t> bytes;
    bytes.reserve(OVERHEAD + payload.size());
    append_be32(bytes, length());
    bytes.insert(bytes.end(), chunkType.bytes().begin(), chunkType.bytes().end());
    bytes.insert(bytes.end(), payload.begin(), payload.end());
    append_be32(bytes, checksum);
    return bytes;
}

std::string Chunk::describe() const {
    std::ostringstream oss;
    oss << chunkType.toString()
        << "  length " << length()
        << "  crc 0x" << to_hex(checksum)
        << "  " << (chunkType.isCritical() ? "critical" : "ancillary")
        << ", " << (chunkType.isPublic() ? "public" : "private")
        << ", " << (chunkType.isSafeToCopy() ? "safe to copy" : "unsafe to copy");
    if (!chunkType.isReservedBitValid())
        oss << ", reserved bit set";
    return oss.str();
}

bool Chunk::operator==(const Chunk& other) const {
    return chunkType == other.chunkType &&
           checksum == other.checksum &&
           payload == other.payload;
}
