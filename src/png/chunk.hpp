#pragma once
#include "chunk_type.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/*
 On-disk layout:
   length   4 bytes  big-endian, payload size only
   type     4 bytes
   data     length bytes
   crc      4 bytes  big-endian CRC-32 over type + data
*/
class Chunk {
public:
    static constexpr uint32_t MAX_LENGTH = 0x7FFFFFFF;
    // length + type + crc
    static constexpr size_t OVERHEAD = 12;

    Chunk(const ChunkType& type, std::vector<uint8_t> data);

    // Parses one chunk starting at offset. Returns the chunk and the offset
    // just past its CRC. Throws MalformedChunkError.
    static std::pair<Chunk, size_t> parse(const std::vector<uint8_t>& blob, size_t offset = 0);

    static uint32_t computeCrc(const ChunkTypeCode& type, const uint8_t* data, size_t length);

    uint32_t length() const { return static_cast<uint32_t>(payload.size()); }
    const ChunkType& type() const { return chunkType; }
    const std::vector<uint8_t>& data() const { return payload; }
    uint32_t crc() const { return checksum; }

    // Throws InvalidEncodingError when the payload is not UTF-8
    std::string dataAsString() const;

    std::vector<uint8_t> asBytes() const;
    std::string describe() const;

    bool operator==(const Chunk& other) const;
    bool operator!=(const Chunk& other) const { return !(*this == other); }

private:
    Chunk(const ChunkType& type, std::vector<uint8_t> data, uint32_t crc);

    ChunkType chunkType;
    std::vector<uint8_t> payload;
    uint32_t checksum;
};
