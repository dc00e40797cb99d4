#include "Chunk.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include "test_helpers.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <cassert>
#include <cstdlib>

static const char* MESSAGE = "This is where your secret message will be!";
static const uint32_t MESSAGE_CRC = 2882656334u;

std::vector<uint8_t> assemble(uint32_t length, const char* type, const std::string& data, uint32_t crc) {
    std::vector<uint8_t> bytes;
    writeBigEndian(bytes, length);
    bytes.insert(bytes.end(), type, type + 4);
    bytes.insert(bytes.end(), data.begin(), data.end());
    writeBigEndian(bytes, crc);
    return bytes;
}

Chunk testing_chunk() {
    return Chunk::decode(assemble(42, "RuSt", MESSAGE, MESSAGE_CRC));
}

void test_new_chunk() {
    std::cout << "Test: New chunk computes length and crc... ";

    Chunk chunk(ChunkType::fromString("RuSt"), toBytes(MESSAGE));
    assert(chunk.length() == 42);
    assert(chunk.crc() == MESSAGE_CRC);
    assert(chunk.encodedSize() == 54);

    std::cout << "PASSED\n";
}

void test_valid_chunk_from_bytes() {
    std::cout << "Test: Decode valid chunk... ";

    Chunk chunk = testing_chunk();
    assert(chunk.length() == 42);
    assert(chunk.chunkType().toString() == "RuSt");
    assert(chunk.dataAsString() == MESSAGE);
    assert(chunk.crc() == MESSAGE_CRC);

    std::cout << "PASSED\n";
}

void test_invalid_crc() {
    std::cout << "Test: Decode chunk with wrong crc... ";

    try {
        Chunk::decode(assemble(42, "RuSt", MESSAGE, 2882656333u));
        std::cout << "FAILED (should have thrown)\n";
        std::exit(1);
    } catch (const CrcMismatchError& e) {
        assert(e.storedCrc() == 2882656333u);
        assert(e.computedCrc() == MESSAGE_CRC);
        std::cout << "PASSED (caught: " << e.what() << ")\n";
    }
}

void test_round_trip() {
    std::cout << "Test: Encode then decode... ";

    std::vector<std::vector<uint8_t>> payloads = {
        {},
        {0x00},
        toBytes(MESSAGE),
        std::vector<uint8_t>(70000, 0xAB)
    };
    for (const auto& payload : payloads) {
        Chunk chunk(ChunkType::fromString("ruSt"), payload);
        std::vector<uint8_t> bytes = chunk.encode();
        assert(bytes.size() == 12 + payload.size());
        assert(readBigEndian(bytes.data()) == payload.size());

        Chunk decoded = Chunk::decode(bytes);
        assert(decoded == chunk);
        assert(decoded.chunkType() == chunk.chunkType());
        assert(decoded.data() == payload);
        assert(decoded.crc() == chunk.crc());
    }

    // Every empty IEND carries this crc
    Chunk iend(ChunkType::fromString("IEND"), std::vector<uint8_t>());
    assert(iend.crc() == 0xAE426082u);

    std::cout << "PASSED\n";
}

void test_tamper_every_byte() {
    std::cout << "Test: Flipping any byte breaks decode... ";

    std::vector<uint8_t> good = Chunk(ChunkType::fromString("RuSt"), toBytes(MESSAGE)).encode();
    for (size_t i = 0; i < good.size(); ++i) {
        std::vector<uint8_t> bad = good;
        bad[i] ^= 0x01;
        bool threw = false;
        try {
            Chunk::decode(bad);
        } catch (const CrcMismatchError&) {
            assert(i >= 4); // type, data or crc
            threw = true;
        } catch (const FormatError&) {
            assert(i < 4); // length no longer matches the buffer
            threw = true;
        }
        assert(threw);
    }

    std::cout << "PASSED\n";
}

void test_truncated() {
    std::cout << "Test: Decode truncated chunks... ";

    std::vector<uint8_t> good = Chunk(ChunkType::fromString("RuSt"), toBytes(MESSAGE)).encode();
    // Every proper prefix is too short
    for (size_t size = 0; size < good.size(); ++size) {
        try {
            Chunk::decode(good.data(), size);
            std::cout << "FAILED (prefix of " << size << " bytes should have thrown)\n";
            std::exit(1);
        } catch (const TruncatedChunkError&) {
        }
    }

    // Length near 2^32 must not wrap around
    std::vector<uint8_t> huge = assemble(0xFFFFFFFFu, "RuSt", "abc", 0);
    try {
        Chunk::decode(huge);
        std::cout << "FAILED (huge length should have thrown)\n";
        std::exit(1);
    } catch (const TruncatedChunkError& e) {
        std::cout << "PASSED (caught: " << e.what() << ")\n";
    }
}

void test_trailing_bytes_ignored() {
    std::cout << "Test: Decode stops after the crc... ";

    std::vector<uint8_t> bytes = assemble(42, "RuSt", MESSAGE, MESSAGE_CRC);
    bytes.push_back(0xDE);
    bytes.push_back(0xAD);
    Chunk chunk = Chunk::decode(bytes);
    assert(chunk.length() == 42);
    assert(chunk.encodedSize() == bytes.size() - 2);

    std::cout << "PASSED\n";
}

void test_data_as_string() {
    std::cout << "Test: Chunk data as string... ";

    std::string utf8 = "h\xc3\xa9llo \xe2\x82\xac \xf0\x9f\x98\x80";
    Chunk text(ChunkType::fromString("ruSt"), toBytes(utf8));
    assert(text.dataAsString() == utf8);

    Chunk empty(ChunkType::fromString("ruSt"), std::vector<uint8_t>());
    assert(empty.dataAsString().empty());

    std::vector<std::vector<uint8_t>> invalid = {
        {0xFF},
        {'a', 0x80},              // stray continuation
        {0xC3},                   // truncated
        {0xC0, 0xAF},             // overlong '/'
        {0xE0, 0x80, 0xAF},       // overlong
        {0xED, 0xA0, 0x80},       // surrogate
        {0xF4, 0x90, 0x80, 0x80}  // above U+10FFFF
    };
    for (const auto& bytes : invalid) {
        Chunk chunk(ChunkType::fromString("ruSt"), bytes);
        try {
            chunk.dataAsString();
            std::cout << "FAILED (should have thrown)\n";
            std::exit(1);
        } catch (const EncodingError&) {
        }
    }

    std::cout << "PASSED\n";
}

void test_print() {
    std::cout << "Test: Chunk printing... ";

    std::ostringstream ss;
    ss << testing_chunk();
    assert(ss.str() == "Chunk { length: 42, type: RuSt, crc: 0xabd1d84e }");

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "=== Chunk Tests ===\n";

    test_new_chunk();
    test_valid_chunk_from_bytes();
    test_invalid_crc();
    test_round_trip();
    test_tamper_every_byte();
    test_truncated();
    test_trailing_bytes_ignored();
    test_data_as_string();
    test_print();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
