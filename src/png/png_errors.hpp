#pragma once
#include <stdexcept>
#include <string>

class PngError : public std::runtime_error {
public:
    explicit PngError(const std::string& message)
        : std::runtime_error(message) {}
};

// Buffer does not start with the PNG magic bytes
class InvalidSignatureError : public PngError {
public:
    explicit InvalidSignatureError(const std::string& message)
        : PngError(message) {}
};

// Length out of bounds, bad type bytes or CRC mismatch
class MalformedChunkError : public PngError {
public:
    explicit MalformedChunkError(const std::string& message)
        : PngError(message) {}
};

class InvalidChunkTypeError : public PngError {
public:
    explicit InvalidChunkTypeError(const std::string& message)
        : PngError(message) {}
};

class ChunkNotFoundError : public PngError {
public:
    explicit ChunkNotFoundError(const std::string& message)
        : PngError(message) {}
};

class InvalidEncodingError : public PngError {
public:
    explicit InvalidEncodingError(const std::string& message)
        : PngError(message) {}
};
