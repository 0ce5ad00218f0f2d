#include "png.hpp"
#include "png_errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

const std::array<uint8_t, 8> Png::STANDARD_HEADER = {
    0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A
};

namespace {
// Lookup by string: a wrong length is an invalid type, not a miss
ChunkTypeCode toCode(const std::string& type) {
    if (type.size() != 4) {
        throw InvalidChunkTypeError("Invalid chunk type \"" + type +
                                    "\": expected 4 characters, got " + std::to_string(type.size()));
    }
    ChunkTypeCode code;
    std::memcpy(code.data(), type.data(), 4);
    return code;
}

std::string codeName(const ChunkTypeCode& code) {
    return std::string(code.begin(), code.end());
}
}

Png::Png(std::vector<Chunk> chunks) : chunkList(std::move(chunks)) {}

Png::Png(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < STANDARD_HEADER.size() ||
        !std::equal(STANDARD_HEADER.begin(), STANDARD_HEADER.end(), bytes.begin())) {
        throw InvalidSignatureError("Input does not start with the PNG signature");
    }

    size_t pos = STANDARD_HEADER.size();
    while (pos < bytes.size()) {
        auto parsed = Chunk::parse(bytes, pos);
        pos = parsed.second;
        chunkList.push_back(std::move(parsed.first));
    }
    Logger::debug("Parsed " + std::to_string(chunkList.size()) + " chunks");
}

void Png::appendChunk(Chunk chunk) {
    chunkList.push_back(std::move(chunk));
}

void Png::insertChunk(size_t position, Chunk chunk) {
    if (position > chunkList.size()) {
        throw std::out_of_range("Cannot insert chunk at position " + std::to_string(position) +
                                " of " + std::to_string(chunkList.size()));
    }
    chunkList.insert(chunkList.begin() + position, std::move(chunk));
}

std::optional<size_t> Png::indexOf(const ChunkTypeCode& type) const {
    for (size_t i = 0; i < chunkList.size(); ++i) {
        if (chunkList[i].type().bytes() == type)
            return i;
    }
    return std::nullopt;
}

std::optional<size_t> Png::indexOf(const std::string& type) const {
    return indexOf(toCode(type));
}

std::optional<Chunk> Png::chunkByType(const ChunkTypeCode& type) const {
    auto index = indexOf(type);
    if (!index)
        return std::nullopt;
    return chunkList[*index];
}

std::optional<Chunk> Png::chunkByType(const std::string& type) const {
    return chunkByType(toCode(type));
}

std::vector<Chunk> Png::chunksByType(const ChunkTypeCode& type) const {
    std::vector<Chunk> matches;
    for (const auto& chunk : chunkList) {
        if (chunk.type().bytes() == type)
            matches.push_back(chunk);
    }
    return matches;
}

std::vector<Chunk> Png::chunksByType(const std::string& type) const {
    return chunksByType(toCode(type));
}

Chunk Png::removeFirstChunk(const ChunkTypeCode& type) {
    auto index = indexOf(type);
    if (!index) {
        throw ChunkNotFoundError("No chunk of type " + codeName(type) + " found");
    }
    Chunk removed = std::move(chunkList[*index]);
    chunkList.erase(chunkList.begin() + *index);
    Logger::debug("Removed chunk " + codeName(type) + " at index " + std::to_string(*index));
    return removed;
}

Chunk Png::removeFirstChunk(const std::string& type) {
    return removeFirstChunk(toCode(type));
}

std::vector<uint8_t> Png::asBytes() const {
    std::vector<uint8_t> bytes(STANDARD_HEADER.begin(), STANDARD_HEADER.end());
    for (const auto& chunk : chunkList) {
        auto chunkBytes = chunk.asBytes();
        bytes.insert(bytes.end(), chunkBytes.begin(), chunkBytes.end());
    }
    return bytes;
}
