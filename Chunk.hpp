#pragma once
#ifndef CHUNK_HPP
#define CHUNK_HPP

#include <stdint.h>
#include <stddef.h>
#include <ostream>
#include <string>
#include <vector>
#include "ChunkType.hpp"

/* One PNG chunk
    Length: 4 bytes, big-endian, counts only the data
    Type:   4 bytes
    Data:   Length bytes
    CRC:    4 bytes, big-endian, over Type + Data
*/
class Chunk {
    uint32_t dataLength;
    ChunkType type;
    std::vector<uint8_t> payload;
    uint32_t checksum;
    public:
        Chunk(const ChunkType& chunkType, std::vector<uint8_t> data);

        /* Reads one chunk from the start of data.
           Throws TruncatedChunkError if size is too small for the chunk,
           CrcMismatchError if the stored crc is wrong.
           Bytes after the crc are left alone. */
        static Chunk decode(const uint8_t* data, size_t size);
        static Chunk decode(const std::vector<uint8_t>& data);

        std::vector<uint8_t> encode() const;
        // Length + type + data + crc
        size_t encodedSize() const { return 12 + payload.size(); }

        uint32_t length() const { return dataLength; }
        const ChunkType& chunkType() const { return type; }
        const std::vector<uint8_t>& data() const { return payload; }
        uint32_t crc() const { return checksum; }

        // Throws EncodingError if data is not valid UTF-8
        std::string dataAsString() const;

        bool operator==(const Chunk& other) const;
        bool operator!=(const Chunk& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Chunk& chunk);

#endif
