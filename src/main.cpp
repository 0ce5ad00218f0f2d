#include "arg_parser.hpp"
#include "command_registry.hpp"
#include "logger.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

#define PNGSTASH_VERSION "0.3"

void printUsage() {
    std::cout << "pngstash v" << PNGSTASH_VERSION << " - hide messages in PNG chunks\n"
              << "Usage: pngstash [options] <command> <args...>\n"
              << "Commands:\n";
    for (const auto& command : CommandRegistry::instance().createAll()) {
        std::cout << "  " << command->usage() << "\n";
    }
    std::cout << "Options:\n"
              << "  -o [file]  Output file for encode/remove (default: overwrite input)\n"
              << "  -j [file]  Also dump the chunk listing as JSON (print)\n"
              << "  -q         Silence warnings and errors\n"
              << "  -v         Verbose output\n"
              << "  -d         Enable Debug mode\n"
              << "  -h         Show this help message\n"
              << "Use - as file to read stdin / write stdout.\n"
              << "Arguments after -- are never read as options (e.g. a message \"-v\").\n";
}

int main(int argc, char* argv[]) {
    Config config;
    try {
        if (!parseArgs(argc, argv, config)) {
            printUsage();
            return 0;
        }
        Logger::info("pngstash v" PNGSTASH_VERSION);

        auto command = CommandRegistry::instance().create(config.command);
        if (!command) {
            Logger::error("Unknown command: " + config.command);
            printUsage();
            return 2;
        }

        Logger::debug("Running " + command->name());
        return command->run(config, std::cout);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
