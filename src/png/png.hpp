#pragma once
#include "chunk.hpp"
#include <array>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

/*
 Ordered sequence of chunks behind the 8-byte PNG signature.
 No ordering rules (IHDR first, IEND last) are enforced here, and several
 chunks may share a type.
*/
class Png {
public:
    static const std::array<uint8_t, 8> STANDARD_HEADER;

    // Lazy view over the types of the chunks currently held. Iterating again
    // reflects later mutations of the Png.
    class ChunkTypeRange {
    public:
        class iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = ChunkType;
            using difference_type = std::ptrdiff_t;
            using pointer = const ChunkType*;
            using reference = const ChunkType&;

            iterator() = default;
            explicit iterator(std::vector<Chunk>::const_iterator it) : current(it) {}

            reference operator*() const { return current->type(); }
            pointer operator->() const { return &current->type(); }
            iterator& operator++() { ++current; return *this; }
            iterator operator++(int) { iterator tmp = *this; ++current; return tmp; }
            bool operator==(const iterator& other) const { return current == other.current; }
            bool operator!=(const iterator& other) const { return current != other.current; }

        private:
            std::vector<Chunk>::const_iterator current;
        };

        explicit ChunkTypeRange(const std::vector<Chunk>& chunks) : chunks(&chunks) {}

        iterator begin() const { return iterator(chunks->begin()); }
        iterator end() const { return iterator(chunks->end()); }
        size_t size() const { return chunks->size(); }
        bool empty() const { return chunks->empty(); }

    private:
        const std::vector<Chunk>* chunks;
    };

    Png() = default;
    explicit Png(std::vector<Chunk> chunks);
    // Throws InvalidSignatureError or MalformedChunkError
    explicit Png(const std::vector<uint8_t>& bytes);

    void appendChunk(Chunk chunk);
    // position == chunkCount() appends; beyond that throws std::out_of_range
    void insertChunk(size_t position, Chunk chunk);

    std::optional<size_t> indexOf(const ChunkTypeCode& type) const;
    std::optional<size_t> indexOf(const std::string& type) const;

    std::optional<Chunk> chunkByType(const ChunkTypeCode& type) const;
    std::optional<Chunk> chunkByType(const std::string& type) const;
    std::vector<Chunk> chunksByType(const ChunkTypeCode& type) const;
    std::vector<Chunk> chunksByType(const std::string& type) const;

    // Throws ChunkNotFoundError
    Chunk removeFirstChunk(const ChunkTypeCode& type);
    Chunk removeFirstChunk(const std::string& type);

    ChunkTypeRange chunkTypes() const { return ChunkTypeRange(chunkList); }
    const std::vector<Chunk>& chunks() const { return chunkList; }
    size_t chunkCount() const { return chunkList.size(); }

    std::vector<uint8_t> asBytes() const;

    bool operator==(const Png& other) const { return chunkList == other.chunkList; }
    bool operator!=(const Png& other) const { return chunkList != other.chunkList; }

private:
    std::vector<Chunk> chunkList;
};
