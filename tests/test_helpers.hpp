#pragma once
#include "png.hpp"
#include <cstdint>
#include <string>
#include <vector>

inline std::vector<uint8_t> toBytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

inline std::vector<uint8_t> be32(uint32_t value) {
    return {static_cast<uint8_t>(value >> 24), static_cast<uint8_t>(value >> 16),
            static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value)};
}

// length | type | data | crc, with the CRC supplied by the caller
inline std::vector<uint8_t> rawChunk(uint32_t length, const std::string& type,
                                     const std::string& data, uint32_t crc) {
    std::vector<uint8_t> out = be32(length);
    out.insert(out.end(), type.begin(), type.end());
    out.insert(out.end(), data.begin(), data.end());
    auto crcBytes = be32(crc);
    out.insert(out.end(), crcBytes.begin(), crcBytes.end());
    return out;
}

// 1x1 greyscale image: IHDR, IDAT, IEND
inline Png minimalPng() {
    std::vector<uint8_t> ihdr = {
        0x00, 0x00, 0x00, 0x01,  // width
        0x00, 0x00, 0x00, 0x01,  // height
        0x08, 0x00, 0x00, 0x00, 0x00
    };
    std::vector<uint8_t> idat = {0x78, 0x9C, 0x63, 0x60, 0x00, 0x00, 0x00, 0x02, 0x00, 0x01};
    return Png({
        Chunk(ChunkType::fromString("IHDR"), ihdr),
        Chunk(ChunkType::fromString("IDAT"), idat),
        Chunk(ChunkType::fromString("IEND"), {}),
    });
}
