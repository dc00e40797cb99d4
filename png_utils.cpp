#include "utils.hpp"
#include <zlib.h>

int Verbose = 0;

uint32_t calculate_crc(const uint8_t* type, const uint8_t* data, size_t length) {
    uLong crc = crc32(0L, Z_NULL, 0);                       // Start CRC
    crc = crc32(crc, reinterpret_cast<const Bytef*>(type), 4); // Chunk type
    // zlib takes uInt lengths, so feed big payloads in pieces
    while (length > 0) {
        uInt piece = length > 0x40000000 ? 0x40000000 : static_cast<uInt>(length);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), piece); // Chunk data
        data += piece;
        length -= piece;
    }
    return static_cast<uint32_t>(crc);
}


uint32_t readBigEndian(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
            static_cast<uint32_t>(data[3]);
}


void writeBigEndian(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}


bool isValidUtf8(const uint8_t* data, size_t length) {
    size_t i = 0;
    while (i < length) {
        uint8_t lead = data[i];
        if (lead < 0x80) { // ASCII
            ++i;
            continue;
        }

        size_t extra = 0;
        uint8_t low = 0x80; // allowed range of the first continuation byte
        uint8_t high = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            extra = 1;
        } else if (lead == 0xE0) {
            extra = 2;
            low = 0xA0; // overlong
        } else if (lead == 0xED) {
            extra = 2;
            high = 0x9F; // surrogates
        } else if (lead >= 0xE1 && lead <= 0xEF) {
            extra = 2;
        } else if (lead == 0xF0) {
            extra = 3;
            low = 0x90; // overlong
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            extra = 3;
        } else if (lead == 0xF4) {
            extra = 3;
            high = 0x8F; // above U+10FFFF
        } else {
            return false; // 0x80..0xC1 and 0xF5..0xFF never start a sequence
        }

        if (length - i <= extra)
            return false;
        if (data[i + 1] < low || data[i + 1] > high)
            return false;
        for (size_t k = 2; k <= extra; ++k) {
            if ((data[i + k] & 0xC0) != 0x80)
                return false;
        }
        i += extra + 1;
    }
    return true;
}
