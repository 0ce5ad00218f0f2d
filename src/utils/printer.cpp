#include "printer.hpp"
#include "helpers.hpp"
#include "cJSON.h"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace {
std::string properties(const ChunkType& type) {
    std::string flags;
    flags += type.isCritical() ? "critical" : "ancillary";
    flags += type.isPublic() ? ",public" : ",private";
    flags += type.isSafeToCopy() ? ",copy" : ",nocopy";
    if (!type.isReservedBitValid())
        flags += ",reserved";
    return flags;
}

cJSON* build_json_chunk(const Chunk& chunk, size_t offset) {
    cJSON* item = cJSON_CreateObject();
    cJSON_AddStringToObject(item, "offset", to_hex(offset).c_str());
    cJSON_AddStringToObject(item, "type", chunk.type().toString().c_str());
    cJSON_AddNumberToObject(item, "length", static_cast<double>(chunk.length()));
    cJSON_AddStringToObject(item, "crc", to_hex(chunk.crc()).c_str());
    cJSON_AddBoolToObject(item, "critical", chunk.type().isCritical());
    cJSON_AddBoolToObject(item, "public", chunk.type().isPublic());
    cJSON_AddBoolToObject(item, "safeToCopy", chunk.type().isSafeToCopy());
    return item;
}
}

void printChunkTable(const Png& png, const std::string& inputFile, std::ostream& out) {
    out << inputFile << ": " << png.chunkCount() << " chunks";
    std::string separator = " (";
    for (const auto& type : png.chunkTypes()) {
        out << separator << type;
        separator = " ";
    }
    out << (png.chunkCount() > 0 ? ")\n" : "\n");
    out << "OFFSET\t\tTYPE\tLENGTH\t\tCRC\t\tPROPERTIES\n";

    size_t offset = Png::STANDARD_HEADER.size();
    for (const auto& chunk : png.chunks()) {
        out << "0x" << std::left << std::setw(10) << to_hex(offset)
            << "\t" << chunk.type()
            << "\t" << std::setw(10) << chunk.length()
            << "\t" << std::setw(10) << to_hex(chunk.crc())
            << "\t" << properties(chunk.type()) << std::right << "\n";
        offset += Chunk::OVERHEAD + chunk.length();
    }
}

void dumpJson(const Png& png, const std::string& filename) {
    std::ofstream outFile(filename, std::ios::binary);
    if (!outFile.is_open()) {
        throw std::runtime_error("Cannot open " + filename + " for writing");
    }

    cJSON* root = cJSON_CreateArray();
    size_t offset = Png::STANDARD_HEADER.size();
    for (const auto& chunk : png.chunks()) {
        cJSON_AddItemToArray(root, build_json_chunk(chunk, offset));
        offset += Chunk::OVERHEAD + chunk.length();
    }

    char* jsonStr = cJSON_Print(root);
    cJSON_Delete(root);
    if (jsonStr == nullptr) {
        throw std::runtime_error("Failed to render JSON for " + filename);
    }
    outFile.write(jsonStr, std::strlen(jsonStr));
    std::free(jsonStr);

    if (!outFile) {
        throw std::runtime_error("Error while writing " + filename);
    }
}
