#include "commands.hpp"
#include "ChunkType.hpp"
#include "Chunk.hpp"
#include "Png.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <thread>
#include <utility>

namespace {

Png readPng(const std::string& path) {
    std::vector<uint8_t> bytes = readFile(path);
    Png png = Png::parse(bytes);

    if (Verbose) {
        std::cerr << "Read " << path << ": " << bytes.size() << " bytes, "
                  << png.chunks().size() << " chunks" << std::endl;
    }
    if (Verbose > 1) {
        for (const auto& chunk : png.chunks())
            std::cerr << "  " << chunk << std::endl;
    }
    return png;
}

void writePng(const std::string& path, const Png& png) {
    std::vector<uint8_t> bytes = png.encode();
    writeFile(path, bytes);

    if (Verbose) {
        std::cerr << "Wrote " << path << ": " << bytes.size() << " bytes, "
                  << png.chunks().size() << " chunks" << std::endl;
    }
}

}


std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream fs(path, std::ios::in | std::ios::binary | std::ios::ate);
    if (!fs)
        throw IoError("could not open " + path);

    std::streamsize size = fs.tellg();
    if (size < 0)
        throw IoError("could not get size of " + path);
    fs.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !fs.read(reinterpret_cast<char*>(buffer.data()), size))
        throw IoError("could not read " + path);
    return buffer;
}


void writeFile(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream fs(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!fs.is_open())
        throw IoError("could not open " + path + " for writing");

    fs.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    fs.close();
    if (!fs)
        throw IoError("could not write " + path);
}


void hideMessage(const std::string& inputPath, const std::string& chunkType,
                 const std::string& message, const std::string& outputPath) {
    ChunkType type = ChunkType::fromString(chunkType);
    Png png = readPng(inputPath);

    Chunk chunk(type, std::vector<uint8_t>(message.begin(), message.end()));
    if (Verbose)
        std::cerr << "Adding " << chunk << std::endl;
    png.appendChunk(std::move(chunk));

    writePng(outputPath.empty() ? inputPath : outputPath, png);
}


std::vector<std::string> findMessages(const std::string& path, const std::string& chunkType) {
    ChunkType type = ChunkType::fromString(chunkType);
    Png png = readPng(path);

    std::vector<std::string> messages;
    for (const Chunk* chunk : png.findChunks(type))
        messages.push_back(chunk->dataAsString());

    if (Verbose)
        std::cerr << "Found " << messages.size() << " " << chunkType << " chunks" << std::endl;
    return messages;
}


size_t deleteMessages(const std::string& path, const std::string& chunkType) {
    ChunkType::fromString(chunkType); // reject typos before touching the file
    Png png = readPng(path);

    size_t removed = png.removeChunks(chunkType);
    if (Verbose)
        std::cerr << "Removed " << removed << " " << chunkType << " chunks" << std::endl;

    writePng(path, png);
    return removed;
}


void slowPrint(std::ostream& os, const std::string& text, unsigned int delayMs) {
    for (char c : text) {
        os << c << std::flush;
        if (delayMs > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    }
}
