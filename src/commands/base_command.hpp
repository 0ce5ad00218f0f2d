#pragma once
#include "config.hpp"
#include <ostream>
#include <stdexcept>
#include <string>

class BaseCommand {
public:
    virtual ~BaseCommand() = default;
    virtual std::string name() const = 0;
    virtual std::string usage() const = 0;
    // Returns the process exit code; hard failures are thrown
    virtual int run(const Config& config, std::ostream& out) = 0;

protected:
    void requireArgs(const Config& config, size_t count) const {
        if (config.args.size() < count) {
            throw std::runtime_error("Missing arguments for " + name() + "\nUsage: " + usage());
        }
    }

    static std::string destination(const Config& config) {
        return config.outputFile.empty() ? config.args.front() : config.outputFile;
    }
};
