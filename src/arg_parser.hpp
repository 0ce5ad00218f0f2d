#pragma once
#include "config.hpp"
#include <string>
#include <unordered_map>
#include <vector>

class ArgParser {
public:
    struct OptionInfo {
        bool takesValue;
        std::string canonicalName;
    };

    std::unordered_map<std::string, OptionInfo> optionDefs;
    std::unordered_map<std::string, std::string> parsedOptions;
    std::vector<std::string> positional;

    void addOption(const std::string& name, bool takesValue, const std::string& canonical) {
        optionDefs[name] = {takesValue, canonical};
    }

    // Options are recognised up to "--"; everything after it is positional
    void parse(int argc, const char* const argv[]);

    bool has(const std::string& canonical) const {
        return parsedOptions.count(canonical) != 0;
    }

    std::string get(const std::string& canonical, const std::string& def = "") const {
        auto it = parsedOptions.find(canonical);
        return it != parsedOptions.end() ? it->second : def;
    }
};

// Returns false when usage was requested or no command was given
bool parseArgs(int argc, const char* const argv[], Config& config);
