#include "command_registration.hpp"
#include "png.hpp"
#include "file_reader.hpp"
#include "logger.hpp"

class DecodeCommand : public BaseCommand {
public:
    std::string name() const override { return "decode"; }
    std::string usage() const override {
        return "pngstash decode <file> <chunk_type>";
    }
    int run(const Config& config, std::ostream& out) override;
};

int DecodeCommand::run(const Config& config, std::ostream& out) {
    requireArgs(config, 2);
    Png png(readFile(config.args[0]));

    auto chunk = png.chunkByType(config.args[1]);
    if (!chunk) {
        Logger::error("No chunk of type " + config.args[1] + " in " + config.args[0]);
        return 1;
    }

    out << chunk->dataAsString() << "\n";
    return 0;
}

REGISTER_COMMAND(DecodeCommand)
