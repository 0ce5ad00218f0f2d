#pragma once
#include "png.hpp"
#include <ostream>
#include <string>

void printChunkTable(const Png& png, const std::string& inputFile, std::ostream& out);
void dumpJson(const Png& png, const std::string& filename);
