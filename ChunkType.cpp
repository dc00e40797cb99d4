#include "ChunkType.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iomanip>
#include <sstream>

namespace {

inline bool isLetter(uint8_t c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

inline bool isUpper(uint8_t c) {
    return c >= 'A' && c <= 'Z';
}

inline bool isLower(uint8_t c) {
    return c >= 'a' && c <= 'z';
}

}


ChunkType::ChunkType(const std::array<uint8_t, 4>& bytes) : type(bytes) {}


ChunkType ChunkType::fromString(const std::string& s) {
    if (s.size() != 4)
        throw ValidationError("chunk type '" + s + "' must be exactly 4 bytes, got " +
                              std::to_string(s.size()));

    std::array<uint8_t, 4> bytes;
    for (size_t i = 0; i < 4; ++i) {
        uint8_t c = static_cast<uint8_t>(s[i]);
        if (!isLetter(c))
            throw ValidationError("chunk type '" + s + "' has a non-letter at position " +
                                  std::to_string(i));
        bytes[i] = c;
    }
    return ChunkType(bytes);
}


bool ChunkType::isCritical() const {
    return isUpper(type[0]);
}

bool ChunkType::isPublic() const {
    return isUpper(type[1]);
}

bool ChunkType::isReservedBitValid() const {
    return isUpper(type[2]);
}

bool ChunkType::isSafeToCopy() const {
    return isLower(type[3]);
}

bool ChunkType::isValid() const {
    for (uint8_t c : type) {
        if (!isLetter(c))
            return false;
    }
    return isReservedBitValid();
}


std::string ChunkType::toString() const {
    if (!isValidUtf8(type.data(), type.size()))
        throw EncodingError("chunk type bytes are not valid UTF-8");
    return std::string(type.begin(), type.end());
}


std::string ChunkType::toStringLossy() const {
    std::ostringstream ss;
    ss << *this;
    return ss.str();
}


std::ostream& operator<<(std::ostream& os, const ChunkType& chunkType) {
    // Print letters as is and anything else as \xHH, never throws
    for (uint8_t c : chunkType.bytes()) {
        if (c >= 0x20 && c < 0x7F) {
            os << static_cast<char>(c);
        } else {
            std::ios::fmtflags flags = os.flags();
            char fill = os.fill();
            os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
               << static_cast<int>(c);
            os.flags(flags);
            os.fill(fill);
        }
    }
    return os;
}
