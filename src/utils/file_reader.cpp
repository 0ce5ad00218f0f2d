#include "file_reader.hpp"
#include "logger.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

std::vector<uint8_t> readFile(const std::string& path) {
    if (path == "-") {
        Logger::debug("Reading input from stdin");
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(std::cin)),
                                     std::istreambuf_iterator<char>());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("Error while reading " + path);
    }
    Logger::debug("Read " + std::to_string(bytes.size()) + " bytes from " + path);
    return bytes;
}

void writeFile(const std::string& path, const std::vector<uint8_t>& bytes) {
    if (path == "-") {
        std::cout.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        std::cout.flush();
        if (!std::cout) {
            throw std::runtime_error("Error while writing to stdout");
        }
        return;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open file " + path + " for writing");
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    if (!out) {
        throw std::runtime_error("Error while writing " + path);
    }
    Logger::debug("Wrote " + std::to_string(bytes.size()) + " bytes to " + path);
}
