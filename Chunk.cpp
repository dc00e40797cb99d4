#include "Chunk.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <array>
#include <iomanip>
#include <utility>

// PNG limits chunk data to 2^31 - 1 bytes
static const uint64_t MAX_CHUNK_LENGTH = 0x7FFFFFFF;

Chunk::Chunk(const ChunkType& chunkType, std::vector<uint8_t> data)
    : dataLength(0), type(chunkType), payload(std::move(data)), checksum(0) {
    if (payload.size() > MAX_CHUNK_LENGTH)
        throw FormatError("chunk data of " + std::to_string(payload.size()) +
                          " bytes does not fit in a PNG chunk");
    this->dataLength = static_cast<uint32_t>(payload.size());
    this->checksum = calculate_crc(type.bytes().data(), payload.data(), payload.size());
}


Chunk Chunk::decode(const uint8_t* data, size_t size) {
    if (size < 8)
        throw TruncatedChunkError("chunk header needs 8 bytes, only " +
                                  std::to_string(size) + " left");

    uint32_t length = readBigEndian(data);
    std::array<uint8_t, 4> typeBytes = {{data[4], data[5], data[6], data[7]}};
    ChunkType chunkType(typeBytes);

    // Compare against what is left so a huge length can not overflow
    if (static_cast<uint64_t>(length) + 4 > size - 8)
        throw TruncatedChunkError("chunk " + chunkType.toStringLossy() + " claims " +
                                  std::to_string(length) + " data bytes, only " +
                                  std::to_string(size - 8) + " left including crc");

    const uint8_t* chunkData = data + 8;
    uint32_t storedCrc = readBigEndian(chunkData + length);
    uint32_t computedCrc = calculate_crc(typeBytes.data(), chunkData, length);
    if (storedCrc != computedCrc)
        throw CrcMismatchError("chunk " + chunkType.toStringLossy() + " has crc " +
                               std::to_string(storedCrc) + " but its contents give " +
                               std::to_string(computedCrc),
                               storedCrc, computedCrc);

    return Chunk(chunkType, std::vector<uint8_t>(chunkData, chunkData + length));
}


Chunk Chunk::decode(const std::vector<uint8_t>& data) {
    return decode(data.data(), data.size());
}


std::vector<uint8_t> Chunk::encode() const {
    std::vector<uint8_t> out;
    out.reserve(encodedSize());
    writeBigEndian(out, dataLength);
    out.insert(out.end(), type.bytes().begin(), type.bytes().end());
    out.insert(out.end(), payload.begin(), payload.end());
    writeBigEndian(out, checksum);
    return out;
}


std::string Chunk::dataAsString() const {
    if (!isValidUtf8(payload.data(), payload.size()))
        throw EncodingError("data of chunk " + type.toStringLossy() + " is not valid UTF-8");
    return std::string(payload.begin(), payload.end());
}


bool Chunk::operator==(const Chunk& other) const {
    return type == other.type && checksum == other.checksum && payload == other.payload;
}


std::ostream& operator<<(std::ostream& os, const Chunk& chunk) {
    std::ios::fmtflags flags = os.flags();
    char fill = os.fill();
    os << "Chunk { length: " << chunk.length()
       << ", type: " << chunk.chunkType()
       << ", crc: 0x" << std::hex << std::setfill('0') << std::setw(8) << chunk.crc()
       << " }";
    os.flags(flags);
    os.fill(fill);
    return os;
}
