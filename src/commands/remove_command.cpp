#include "command_registration.hpp"
#include "png.hpp"
#include "png_errors.hpp"
#include "file_reader.hpp"
#include "helpers.hpp"
#include "logger.hpp"

class RemoveCommand : public BaseCommand {
public:
    std::string name() const override { return "remove"; }
    std::string usage() const override {
        return "pngstash remove <file> <chunk_type> [-o output]";
    }
    int run(const Config& config, std::ostream& out) override;
};

int RemoveCommand::run(const Config& config, std::ostream& out) {
    requireArgs(config, 2);
    Png png(readFile(config.args[0]));

    Chunk removed = png.removeFirstChunk(config.args[1]);

    std::string target = destination(config);
    writeFile(target, png.asBytes());

    std::string shown;
    try {
        shown = removed.dataAsString();
    } catch (const InvalidEncodingError&) {
        shown = hex_bytes(removed.data());
    }
    Logger::info("Removed " + removed.describe() + " from " + config.args[0]);

    // stdout carries the image when the target is "-"
    if (target != "-")
        out << "Removed " << removed.type() << ": " << shown << "\n";
    return 0;
}

REGISTER_COMMAND(RemoveCommand)
