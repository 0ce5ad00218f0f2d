#pragma once
#include <array>
#include <cstdint>
#include <ostream>
#include <string>

// Raw 4-byte type code as found on disk, not necessarily a valid ChunkType
using ChunkTypeCode = std::array<uint8_t, 4>;

/*
 Chunk type code. Bit 5 of each byte carries a property:
   byte 0: ancillary    (0 = critical)
   byte 1: private      (0 = public)
   byte 2: reserved     (must be 0)
   byte 3: safe to copy (0 = unsafe)
*/
class ChunkType {
public:
    // Throw InvalidChunkTypeError on anything that is not 4 ASCII letters
    static ChunkType fromBytes(const ChunkTypeCode& bytes);
    static ChunkType fromString(const std::string& str);

    static bool isAlphabetic(const ChunkTypeCode& bytes);

    const ChunkTypeCode& bytes() const { return code; }
    std::string toString() const;

    bool isCritical() const { return (code[0] & PROPERTY_BIT) == 0; }
    bool isPublic() const { return (code[1] & PROPERTY_BIT) == 0; }
    bool isReservedBitValid() const { return (code[2] & PROPERTY_BIT) == 0; }
    bool isSafeToCopy() const { return (code[3] & PROPERTY_BIT) != 0; }

    // Letters only and reserved bit clear
    bool isValid() const;

    bool operator==(const ChunkType& other) const { return code == other.code; }
    bool operator!=(const ChunkType& other) const { return code != other.code; }

private:
    static constexpr uint8_t PROPERTY_BIT = 0x20;

    explicit ChunkType(const ChunkTypeCode& bytes) : code(bytes) {}

    ChunkTypeCode code;
};

std::ostream& operator<<(std::ostream& os, const ChunkType& type);
