#include "Png.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstring>
#include <utility>

const std::array<uint8_t, 8> PNG_SIGNATURE = {{137, 80, 78, 71, 13, 10, 26, 10}};

namespace {

const std::array<uint8_t, 4> IEND_TYPE = {{'I', 'E', 'N', 'D'}};

// Raw byte compare, so a chunk with unprintable type never throws here
inline bool hasType(const Chunk& chunk, const std::string& chunkType) {
    return chunkType.size() == 4 &&
           memcmp(chunk.chunkType().bytes().data(), chunkType.data(), 4) == 0;
}

}

Png::Png(std::vector<Chunk> chunks) : chunkList(std::move(chunks)) {}


Png Png::parse(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < PNG_SIGNATURE.size())
        throw SignatureError("file is " + std::to_string(bytes.size()) +
                             " bytes, too short for a PNG signature");
    if (!std::equal(PNG_SIGNATURE.begin(), PNG_SIGNATURE.end(), bytes.begin()))
        throw SignatureError("file does not start with the PNG signature");

    std::vector<Chunk> chunks;
    size_t offset = PNG_SIGNATURE.size();
    while (offset < bytes.size()) {
        Chunk chunk = Chunk::decode(bytes.data() + offset, bytes.size() - offset);
        offset += chunk.encodedSize(); // 4 length + 4 type + data + 4 crc
        chunks.push_back(std::move(chunk));
    }
    return Png(std::move(chunks));
}


void Png::appendChunk(Chunk chunk) {
    if (!chunkList.empty() && chunkList.back().chunkType().bytes() == IEND_TYPE)
        chunkList.insert(chunkList.end() - 1, std::move(chunk));
    else
        chunkList.push_back(std::move(chunk));
}


size_t Png::removeChunks(const std::string& chunkType) {
    size_t before = chunkList.size();
    chunkList.erase(std::remove_if(chunkList.begin(), chunkList.end(),
                                   [&chunkType](const Chunk& c) { return hasType(c, chunkType); }),
                    chunkList.end());
    return before - chunkList.size();
}


const Chunk* Png::findChunk(const std::string& chunkType) const {
    for (const auto& chunk : chunkList) {
        if (hasType(chunk, chunkType))
            return &chunk;
    }
    return nullptr;
}


std::vector<const Chunk*> Png::findChunks(const ChunkType& chunkType) const {
    std::vector<const Chunk*> found;
    for (const auto& chunk : chunkList) {
        if (chunk.chunkType() == chunkType)
            found.push_back(&chunk);
    }
    return found;
}


std::vector<uint8_t> Png::encode() const {
    size_t total = PNG_SIGNATURE.size();
    for (const auto& chunk : chunkList)
        total += chunk.encodedSize();

    std::vector<uint8_t> out;
    out.reserve(total);
    out.insert(out.end(), PNG_SIGNATURE.begin(), PNG_SIGNATURE.end());
    for (const auto& chunk : chunkList) {
        std::vector<uint8_t> bytes = chunk.encode();
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
    return out;
}
