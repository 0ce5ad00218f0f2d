#pragma once
#include <cstdint>
#include <string>
#include <vector>

// "-" reads stdin / writes stdout
std::vector<uint8_t> readFile(const std::string& path);
void writeFile(const std::string& path, const std::vector<uint8_t>& bytes);
