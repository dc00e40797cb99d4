#pragma once
#ifndef PNG_HPP
#define PNG_HPP

#include <stdint.h>
#include <array>
#include <string>
#include <vector>
#include "Chunk.hpp"

// 137 P N G \r \n 26 \n
extern const std::array<uint8_t, 8> PNG_SIGNATURE;

class Png {
    std::vector<Chunk> chunkList; // In file order, IHDR first and IEND last
    public:
        explicit Png(std::vector<Chunk> chunks);

        /* Parses signature and every chunk up to the end of bytes.
           Throws SignatureError for a wrong signature and
           TruncatedChunkError / CrcMismatchError for the first bad chunk. */
        static Png parse(const std::vector<uint8_t>& bytes);

        // Adds chunk in front of a trailing IEND, or at the end if there is none
        void appendChunk(Chunk chunk);
        // Removes every chunk of the given type, returns how many were removed
        size_t removeChunks(const std::string& chunkType);

        const std::vector<Chunk>& chunks() const { return chunkList; }
        // First chunk of the given type or nullptr
        const Chunk* findChunk(const std::string& chunkType) const;
        std::vector<const Chunk*> findChunks(const ChunkType& chunkType) const;

        const std::array<uint8_t, 8>& header() const { return PNG_SIGNATURE; }

        std::vector<uint8_t> encode() const;
};

#endif
