#pragma once
#include <cstdint>
#include <vector>
#include <string>

//
// Big-endian readers / writers
//
uint32_t read_be32(const std::vector<uint8_t>& blob, size_t offset);
void append_be32(std::vector<uint8_t>& blob, uint32_t value);

std::string to_hex(uint64_t value);

// Space separated hex bytes, truncated to maxBytes with a trailing "..."
std::string hex_bytes(const std::vector<uint8_t>& data, size_t maxBytes = 32);

// Strict UTF-8: rejects overlongs, surrogates and code points above U+10FFFF
bool is_valid_utf8(const std::vector<uint8_t>& data);
