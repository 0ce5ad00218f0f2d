#include "command_registration.hpp"
#include "png.hpp"
#include "file_reader.hpp"
#include "printer.hpp"
#include "logger.hpp"

class PrintCommand : public BaseCommand {
public:
    std::string name() const override { return "print"; }
    std::string usage() const override {
        return "pngstash print <file> [-j output.json]";
    }
    int run(const Config& config, std::ostream& out) override;
};

int PrintCommand::run(const Config& config, std::ostream& out) {
    requireArgs(config, 1);
    Png png(readFile(config.args[0]));

    printChunkTable(png, config.args[0], out);
    if (config.jsonOutput) {
        dumpJson(png, config.jsonFile);
        Logger::info("Wrote JSON listing to " + config.jsonFile);
    }
    return 0;
}

REGISTER_COMMAND(PrintCommand)
