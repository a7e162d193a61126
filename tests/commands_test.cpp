#include "cli/commands.hpp"
#include "io/png_file.hpp"
#include "png/png.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pngme {
namespace {

    namespace fs = std::filesystem;

    static Png base_png()
    {
        const std::string text = "tiny";
        return Png::from_chunks(
            { Chunk(ChunkType::from_string("IHDR"),
                    std::vector<uint8_t>(text.begin(), text.end())),
              Chunk(ChunkType::from_string("IEND"), {}) });
    }


    class CommandsTest : public ::testing::Test {
    protected:
        void SetUp() override
        {
            const ::testing::TestInfo* info
                = ::testing::UnitTest::GetInstance()->current_test_info();
            dir_ = fs::temp_directory_path()
                   / (std::string("pngme_") + info->test_suite_name() + "_"
                      + info->name());
            fs::remove_all(dir_);
            fs::create_directories(dir_);
            png_path_ = (dir_ / "in.png").string();
            save_png(base_png(), png_path_);
        }

        void TearDown() override
        {
            std::error_code ec;
            fs::remove_all(dir_, ec);
        }

        int cli(std::vector<std::string> args)
        {
            args.insert(args.begin(), "pngme");
            std::vector<char*> argv;
            for (std::string& a : args) {
                argv.push_back(&a[0]);
            }
            out_.str("");
            err_.str("");
            return run_cli(static_cast<int>(argv.size()), argv.data(), out_,
                           err_);
        }

        fs::path dir_;
        std::string png_path_;
        std::ostringstream out_;
        std::ostringstream err_;
    };

}  // namespace


TEST_F(CommandsTest, EncodeInPlaceThenDecode)
{
    std::ostringstream out;
    run_encode({ png_path_, "ruSt", "hidden message", "" }, out);

    const Png png = load_png(png_path_);
    ASSERT_EQ(png.chunks().size(), 3u);
    EXPECT_EQ(png.chunks().back().chunk_type().to_string(), "ruSt");

    std::ostringstream decoded;
    run_decode({ png_path_, "ruSt" }, decoded);
    EXPECT_EQ(decoded.str(), "Found chunk: \"hidden message\"\n");
}


TEST_F(CommandsTest, EncodeToSeparateOutput)
{
    const std::string output = (dir_ / "out.png").string();
    std::ostringstream out;
    run_encode({ png_path_, "ruSt", "msg", output }, out);

    EXPECT_EQ(load_png(png_path_).chunks().size(), 2u);
    EXPECT_EQ(load_png(output).chunks().size(), 3u);
}


TEST_F(CommandsTest, EncodeRejectsBadChunkType)
{
    std::ostringstream out;
    try {
        run_encode({ png_path_, "ru5t", "msg", "" }, out);
        FAIL() << "expected failure";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()).rfind("invalid chunk type", 0), 0u);
    }
    EXPECT_EQ(load_png(png_path_).chunks().size(), 2u);
}


TEST_F(CommandsTest, DecodeMissingChunk)
{
    std::ostringstream out;
    EXPECT_THROW(run_decode({ png_path_, "ruSt" }, out), std::runtime_error);
}


TEST_F(CommandsTest, RemovePersists)
{
    std::ostringstream out;
    run_encode({ png_path_, "ruSt", "bye", "" }, out);

    std::ostringstream removed;
    run_remove({ png_path_, "ruSt" }, removed);
    EXPECT_EQ(removed.str(), "Removed chunk with message: \"bye\"\n");
    EXPECT_EQ(load_png(png_path_).as_bytes(), base_png().as_bytes());
}


TEST_F(CommandsTest, PrintListsChunksInOrder)
{
    std::ostringstream out;
    run_print({ png_path_ }, out);
    EXPECT_EQ(out.str(), "Chunk \"IHDR\": \"tiny\"\nChunk \"IEND\": \"\"\n");
}


TEST_F(CommandsTest, MissingFile)
{
    std::ostringstream out;
    const std::string missing = (dir_ / "nope.png").string();
    try {
        run_print({ missing }, out);
        FAIL() << "expected failure";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "Entered path is not a valid file.");
    }
    // a directory is not a file either
    EXPECT_THROW(run_print({ dir_.string() }, out), std::runtime_error);
}


TEST_F(CommandsTest, CorruptFileReportsParseFailure)
{
    std::vector<uint8_t> bytes = read_file_bytes(png_path_);
    bytes.back() ^= 0xFF;
    write_file_bytes(png_path_, bytes);

    std::ostringstream out;
    try {
        run_print({ png_path_ }, out);
        FAIL() << "expected failure";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()).rfind("failed to parse png file", 0),
                  0u);
    }
}


TEST_F(CommandsTest, RunCliDispatch)
{
    EXPECT_EQ(cli({ "encode", png_path_, "ruSt", "via cli" }), 0);
    EXPECT_EQ(cli({ "decode", png_path_, "ruSt" }), 0);
    EXPECT_EQ(out_.str(), "Found chunk: \"via cli\"\n");

    EXPECT_EQ(cli({ "print", png_path_ }), 0);
    EXPECT_NE(out_.str().find("Chunk \"ruSt\": \"via cli\""), std::string::npos);

    EXPECT_EQ(cli({ "remove", png_path_, "ruSt" }), 0);
    EXPECT_EQ(cli({ "decode", png_path_, "ruSt" }), 2);
    EXPECT_EQ(err_.str(), "[ERROR] chunk not found\n");
}


TEST_F(CommandsTest, RunCliUsage)
{
    EXPECT_EQ(cli({}), 1);
    EXPECT_NE(out_.str().find("Usage:"), std::string::npos);
    EXPECT_EQ(cli({ "--help" }), 0);
    EXPECT_EQ(cli({ "decode", png_path_ }), 1);
    EXPECT_EQ(cli({ "frobnicate", png_path_ }), 1);
    EXPECT_NE(err_.str().find("Usage:"), std::string::npos);
}

}  // namespace pngme
