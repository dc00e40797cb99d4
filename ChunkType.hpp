#pragma once
#ifndef CHUNK_TYPE_HPP
#define CHUNK_TYPE_HPP

#include <stdint.h>
#include <array>
#include <ostream>
#include <string>

/* Four character code of a chunk.
   Bit 5 of every byte (the letter case) carries a property:
     1st letter: uppercase is critical, lowercase is ancillary
     2nd letter: uppercase is public, lowercase is private
     3rd letter: reserved, must be uppercase
     4th letter: uppercase is unsafe to copy, lowercase is safe to copy
*/
class ChunkType {
    std::array<uint8_t, 4> type;
    public:
        explicit ChunkType(const std::array<uint8_t, 4>& bytes);

        // Throws ValidationError unless s is exactly 4 ASCII letters
        static ChunkType fromString(const std::string& s);

        const std::array<uint8_t, 4>& bytes() const { return type; }

        bool isCritical() const;
        bool isPublic() const;
        bool isReservedBitValid() const;
        bool isSafeToCopy() const;
        // Letters only and reserved bit valid
        bool isValid() const;

        // Throws EncodingError if the bytes are not valid UTF-8
        std::string toString() const;
        // Like toString but escapes non-printable bytes instead of throwing
        std::string toStringLossy() const;

        bool operator==(const ChunkType& other) const { return type == other.type; }
        bool operator!=(const ChunkType& other) const { return type != other.type; }
};

std::ostream& operator<<(std::ostream& os, const ChunkType& chunkType);

#endif
