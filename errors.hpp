#pragma once
#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdint.h>
#include <stdexcept>
#include <string>

// Base of everything the png code throws
class PngError : public std::runtime_error {
    public:
        explicit PngError(const std::string& message)
            : std::runtime_error(message) {}
};

// Signature or chunk framing is malformed
class FormatError : public PngError {
    public:
        explicit FormatError(const std::string& message)
            : PngError(message) {}
};

class SignatureError : public FormatError {
    public:
        explicit SignatureError(const std::string& message)
            : FormatError(message) {}
};

class TruncatedChunkError : public FormatError {
    public:
        explicit TruncatedChunkError(const std::string& message)
            : FormatError(message) {}
};

/* Error when type or data of a chunk do not match its crc,
   the file is corrupted or was tampered with */
class CrcMismatchError : public FormatError {
    uint32_t stored;
    uint32_t computed;
    public:
        CrcMismatchError(const std::string& message, uint32_t storedCrc, uint32_t computedCrc)
            : FormatError(message), stored(storedCrc), computed(computedCrc) {}
        uint32_t storedCrc() const { return stored; }
        uint32_t computedCrc() const { return computed; }
};

// Chunk type string given by the user is not legal
class ValidationError : public PngError {
    public:
        explicit ValidationError(const std::string& message)
            : PngError(message) {}
};

// Bytes are not valid UTF-8 where text was asked for
class EncodingError : public PngError {
    public:
        explicit EncodingError(const std::string& message)
            : PngError(message) {}
};

class IoError : public PngError {
    public:
        explicit IoError(const std::string& message)
            : PngError(message) {}
};

#endif
