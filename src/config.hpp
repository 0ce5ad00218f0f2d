#pragma once
#include "logger.hpp"
#include <string>
#include <vector>

struct Config {
    std::string command;
    std::vector<std::string> args;  // positional arguments after the command name
    std::string outputFile;         // empty: write back to the input file
    bool jsonOutput = false;
    std::string jsonFile;
    LogLevel logLevel = LogLevel::WARN;
};
