#include "chunk_type.hpp"
#include "png_errors.hpp"
#include "helpers.hpp"

namespace {
bool isAsciiLetter(uint8_t b) {
    return (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z');
}

std::string printableCode(const ChunkTypeCode& bytes) {
    std::string out;
    for (uint8_t b : bytes) {
        if (b >= 0x20 && b < 0x7F)
            out += static_cast<char>(b);
        else
            out += "\\x" + to_hex(b);
    }
    return out;
}
}

ChunkType ChunkType::fromBytes(const ChunkTypeCode& bytes) {
    if (!isAlphabetic(bytes)) {
        throw InvalidChunkTypeError("Invalid chunk type \"" + printableCode(bytes) +
                                    "\": bytes must be ASCII letters");
    }
    return ChunkType(bytes);
}

ChunkType ChunkType::fromString(const std::string& str) {
    if (str.size() != 4) {
        throw InvalidChunkTypeError("Invalid chunk type \"" + str +
                                    "\": expected 4 characters, got " + std::to_string(str.size()));
    }
    ChunkTypeCode bytes;
    for (size_t i = 0; i < 4; ++i)
        bytes[i] = static_cast<uint8_t>(str[i]);
    return fromBytes(bytes);
}

bool ChunkType::isAlphabetic(const ChunkTypeCode& bytes) {
    for (uint8_t b : bytes) {
        if (!isAsciiLetter(b))
            return false;
    }
    return true;
}

std::string ChunkType::toString() const {
    return std::string(code.begin(), code.end());
}

bool ChunkType::isValid() const {
    return isAlphabetic(code) && isReservedBitValid();
}

std::ostream& operator<<(std::ostream& os, const ChunkType& type) {
    return os << type.toString();
}
