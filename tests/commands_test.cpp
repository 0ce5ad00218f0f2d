#include "command_registry.hpp"
#include "file_reader.hpp"
#include "png.hpp"
#include "png_errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class CommandsTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("pngstash_") + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
        image = (dir / "image.png").string();
        writeFile(image, minimalPng().asBytes());
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    int run(const std::string& name, std::vector<std::string> args,
            const std::string& output = "", const std::string& json = "") {
        auto command = CommandRegistry::instance().create(name);
        EXPECT_NE(command, nullptr) << name;
        Config config;
        config.command = name;
        config.args = std::move(args);
        config.outputFile = output;
        config.jsonOutput = !json.empty();
        config.jsonFile = json;
        out.str("");
        return command->run(config, out);
    }

    fs::path dir;
    std::string image;
    std::ostringstream out;
};

TEST_F(CommandsTest, AllCommandsRegistered) {
    for (const char* name : {"encode", "decode", "remove", "print"}) {
        EXPECT_NE(CommandRegistry::instance().create(name), nullptr) << name;
    }
    EXPECT_EQ(CommandRegistry::instance().create("explode"), nullptr);
}

TEST_F(CommandsTest, EncodeInsertsBeforeIend) {
    EXPECT_EQ(run("encode", {image, "ruSt", "hello"}), 0);

    Png png(readFile(image));
    std::vector<std::string> types;
    for (const auto& type : png.chunkTypes())
        types.push_back(type.toString());
    EXPECT_EQ(types, (std::vector<std::string>{"IHDR", "IDAT", "ruSt", "IEND"}));
}

TEST_F(CommandsTest, EncodeWithoutIendAppends) {
    Png noEnd({Chunk(ChunkType::fromString("IHDR"), toBytes("0123456789abc"))});
    writeFile(image, noEnd.asBytes());

    EXPECT_EQ(run("encode", {image, "ruSt", "tail"}), 0);
    Png png(readFile(image));
    ASSERT_EQ(png.chunkCount(), 2u);
    EXPECT_EQ(png.chunks().back().type().toString(), "ruSt");
}

TEST_F(CommandsTest, EncodeToSeparateOutput) {
    std::string output = (dir / "out.png").string();
    EXPECT_EQ(run("encode", {image, "ruSt", "hello"}, output), 0);

    EXPECT_EQ(Png(readFile(image)), minimalPng());
    EXPECT_EQ(Png(readFile(output)).chunkCount(), 4u);
}

TEST_F(CommandsTest, EncodeRejectsReservedBit) {
    EXPECT_THROW(run("encode", {image, "Rust", "hello"}), InvalidChunkTypeError);
    EXPECT_THROW(run("encode", {image, "Ru1t", "hello"}), InvalidChunkTypeError);
    EXPECT_EQ(Png(readFile(image)), minimalPng());
}

TEST_F(CommandsTest, EncodeThenDecode) {
    ASSERT_EQ(run("encode", {image, "ruSt", "a secret message"}), 0);
    EXPECT_EQ(run("decode", {image, "ruSt"}), 0);
    EXPECT_EQ(out.str(), "a secret message\n");
}

TEST_F(CommandsTest, DecodeMissingTypeReturnsNonZero) {
    EXPECT_EQ(run("decode", {image, "ruSt"}), 1);
    EXPECT_EQ(out.str(), "");
}

TEST_F(CommandsTest, DecodeBinaryPayloadIsInvalidEncoding) {
    Png png = minimalPng();
    png.insertChunk(2, Chunk(ChunkType::fromString("biNa"), {0xFF, 0xFE}));
    writeFile(image, png.asBytes());
    EXPECT_THROW(run("decode", {image, "biNa"}), InvalidEncodingError);
}

TEST_F(CommandsTest, RemoveRestoresOriginal) {
    ASSERT_EQ(run("encode", {image, "ruSt", "hello"}), 0);
    EXPECT_EQ(run("remove", {image, "ruSt"}), 0);
    EXPECT_EQ(out.str(), "Removed ruSt: hello\n");
    EXPECT_EQ(readFile(image), minimalPng().asBytes());
}

TEST_F(CommandsTest, EncodeStoresDashedMessage) {
    ASSERT_EQ(run("encode", {image, "ruSt", "--help"}), 0);
    EXPECT_EQ(run("decode", {image, "ruSt"}), 0);
    EXPECT_EQ(out.str(), "--help\n");
}

TEST_F(CommandsTest, RemoveAbsentThrows) {
    EXPECT_THROW(run("remove", {image, "ruSt"}), ChunkNotFoundError);
}

TEST_F(CommandsTest, MissingArgumentsThrow) {
    EXPECT_THROW(run("encode", {image, "ruSt"}), std::runtime_error);
    EXPECT_THROW(run("decode", {image}), std::runtime_error);
    EXPECT_THROW(run("print", {}), std::runtime_error);
}

TEST_F(CommandsTest, NotAPngThrows) {
    std::string text = (dir / "notes.txt").string();
    writeFile(text, toBytes("just some text"));
    EXPECT_THROW(run("print", {text}), InvalidSignatureError);
}

TEST_F(CommandsTest, MissingFileThrows) {
    EXPECT_THROW(run("print", {(dir / "nope.png").string()}), std::runtime_error);
}

TEST_F(CommandsTest, PrintListsChunks) {
    EXPECT_EQ(run("print", {image}), 0);
    std::string listing = out.str();
    EXPECT_NE(listing.find("3 chunks (IHDR IDAT IEND)"), std::string::npos);
    EXPECT_NE(listing.find("IHDR"), std::string::npos);
    EXPECT_NE(listing.find("IDAT"), std::string::npos);
    EXPECT_NE(listing.find("ae426082"), std::string::npos);
}

TEST_F(CommandsTest, PrintDumpsJson) {
    std::string json = (dir / "chunks.json").string();
    EXPECT_EQ(run("print", {image}, "", json), 0);

    std::ifstream in(json);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("\"type\":\t\"IEND\""), std::string::npos);
    EXPECT_NE(content.str().find("\"crc\":\t\"ae426082\""), std::string::npos);
}
