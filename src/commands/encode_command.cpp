#include "command_registration.hpp"
#include "png.hpp"
#include "png_errors.hpp"
#include "file_reader.hpp"
#include "logger.hpp"

class EncodeCommand : public BaseCommand {
public:
    std::string name() const override { return "encode"; }
    std::string usage() const override {
        return "pngstash [-o output] encode <file> <chunk_type> [--] <message>";
    }
    int run(const Config& config, std::ostream& out) override;
};

int EncodeCommand::run(const Config& config, std::ostream& out) {
    requireArgs(config, 3);
    const std::string& input = config.args[0];
    const std::string& message = config.args[2];

    ChunkType type = ChunkType::fromString(config.args[1]);
    if (!type.isValid()) {
        throw InvalidChunkTypeError("Chunk type " + type.toString() + " has the reserved bit set");
    }

    Png png(readFile(input));
    if (type.isCritical()) {
        Logger::warn("Chunk type " + type.toString() +
                     " is critical; standard decoders refuse unknown critical chunks");
    }
    auto existing = png.chunksByType(type.bytes()).size();
    if (existing > 0) {
        Logger::warn(input + " already holds " + std::to_string(existing) +
                     " chunk(s) of type " + type.toString() + ", adding another");
    }

    Chunk chunk(type, std::vector<uint8_t>(message.begin(), message.end()));

    // keep IEND last so decoders still see a complete image
    auto iend = png.indexOf("IEND");
    if (iend) {
        Logger::debug("Inserting " + type.toString() + " before IEND at index " + std::to_string(*iend));
        png.insertChunk(*iend, std::move(chunk));
    } else {
        Logger::debug("No IEND chunk, appending " + type.toString());
        png.appendChunk(std::move(chunk));
    }

    std::string target = destination(config);
    writeFile(target, png.asBytes());
    Logger::info("Encoded " + std::to_string(message.size()) + " bytes as " + type.toString() + " into " + target);
    if (target != "-")
        out << "Message encoded into " << target << "\n";
    return 0;
}

REGISTER_COMMAND(EncodeCommand)
