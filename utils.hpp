#pragma once
#ifndef UTILS_HPP
#define UTILS_HPP

#include <stdint.h> // uint8_t, uint32_t
#include <stddef.h> // size_t
#include <vector>

// Verbosity level, raised by -v on the command line
extern int Verbose;

/*Calculates crc of chunk (CRC-32/ISO-HDLC over type + data, not the length)*/
uint32_t calculate_crc(const uint8_t* type, const uint8_t* data, size_t length);

/*Reads 4 bytes as a big-endian value, PNG stores every integer that way*/
uint32_t readBigEndian(const uint8_t* data);

/*Appends value to out as 4 big-endian bytes*/
void writeBigEndian(std::vector<uint8_t>& out, uint32_t value);

/* Checks that data is well-formed UTF-8:
   - no stray continuation bytes or truncated sequences
   - no overlong encodings
   - no UTF-16 surrogates (U+D800..U+DFFF)
   - nothing above U+10FFFF
*/
bool isValidUtf8(const uint8_t* data, size_t length);

#endif
