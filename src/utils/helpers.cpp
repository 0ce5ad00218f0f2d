#include "helpers.hpp"
#include <array>
#include <charconv>
#include <iomanip>
#include <sstream>

//
// Big-endian readers / writers
//
uint32_t read_be32(const std::vector<uint8_t>& blob, size_t offset) {
    return (static_cast<uint32_t>(blob[offset]) << 24) |
           (static_cast<uint32_t>(blob[offset + 1]) << 16) |
           (static_cast<uint32_t>(blob[offset + 2]) << 8) |
           (static_cast<uint32_t>(blob[offset + 3]));
}

void append_be32(std::vector<uint8_t>& blob, uint32_t value) {
    blob.push_back(static_cast<uint8_t>(value >> 24));
    blob.push_back(static_cast<uint8_t>(value >> 16));
    blob.push_back(static_cast<uint8_t>(value >> 8));
    blob.push_back(static_cast<uint8_t>(value));
}

std::string to_hex(uint64_t value)
{
   std::array<char, 16> buffer;
   auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                              value, 16);  // base 16

   std::string hex(buffer.data(), result.ptr);
   return hex;
}

std::string hex_bytes(const std::vector<uint8_t>& data, size_t maxBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    size_t shown = data.size() < maxBytes ? data.size() : maxBytes;
    for (size_t i = 0; i < shown; ++i) {
        if (i != 0)
            oss << ' ';
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    if (shown < data.size())
        oss << " ...";
    return oss.str();
}

bool is_valid_utf8(const std::vector<uint8_t>& data) {
    size_t i = 0;
    while (i < data.size()) {
        uint8_t lead = data[i];
        size_t extra;
        uint32_t cp;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            return false;
        }

        if (i + extra >= data.size())
            return false;

        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cont = data[i + k];
            if ((cont & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cont & 0x3F);
        }

        // overlong forms
        if ((extra == 1 && cp < 0x80) ||
            (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000))
            return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;

        i += extra + 1;
    }
    return true;
}
