#include <gtest/gtest.h>

#include "io/gzip_file.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace bitatlas;
namespace fs = std::filesystem;

namespace
{
fs::path TempDir(const char* name)
{
    const fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::vector<std::uint8_t> ReadRaw(const fs::path& p)
{
    std::ifstream f(p, std::ios::binary);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}
} // namespace

TEST(GzipFile, WritesGzipThatReadsBack)
{
    const fs::path dir = TempDir("bitatlas_gzip_roundtrip");
    const fs::path path = dir / "atlas.gz";

    // Mostly zero with a few marks, like a sparse atlas.
    std::vector<std::uint8_t> payload(200000, 0);
    for (size_t i = 0; i < payload.size(); i += 997)
        payload[i] = (std::uint8_t)(i & 0xFF);

    std::string err;
    ASSERT_TRUE(WriteGzipFile(path.string(), payload, GzipFileWriter::kBestCompression, err)) << err;

    const std::vector<std::uint8_t> raw = ReadRaw(path);
    ASSERT_GE(raw.size(), 18u);
    EXPECT_EQ(raw[0], 0x1f);
    EXPECT_EQ(raw[1], 0x8b);
    EXPECT_EQ(raw[2], 8); // deflate
    EXPECT_LT(raw.size(), payload.size());

    std::vector<std::uint8_t> back;
    ASSERT_TRUE(ReadGzipFile(path.string(), back, err)) << err;
    EXPECT_EQ(back, payload);

    fs::remove_all(dir);
}

TEST(GzipFile, StreamedWritesConcatenate)
{
    const fs::path dir = TempDir("bitatlas_gzip_stream");
    const fs::path path = dir / "parts.gz";

    std::string err;
    GzipFileWriter w;
    ASSERT_TRUE(w.Open(path.string(), GzipFileWriter::kBestCompression, err)) << err;
    EXPECT_TRUE(w.IsOpen());
    const std::string a = "first,";
    const std::string b = "second";
    ASSERT_TRUE(w.Write(a.data(), a.size(), err)) << err;
    ASSERT_TRUE(w.Write(b.data(), b.size(), err)) << err;
    ASSERT_TRUE(w.Close(err)) << err;
    EXPECT_FALSE(w.IsOpen());

    std::vector<std::uint8_t> back;
    ASSERT_TRUE(ReadGzipFile(path.string(), back, err)) << err;
    EXPECT_EQ(std::string(back.begin(), back.end()), "first,second");

    fs::remove_all(dir);
}

TEST(GzipFile, EmptyPayloadIsStillAValidStream)
{
    const fs::path dir = TempDir("bitatlas_gzip_empty");
    const fs::path path = dir / "empty.gz";

    std::string err;
    ASSERT_TRUE(WriteGzipFile(path.string(), {}, GzipFileWriter::kBestCompression, err)) << err;
    EXPECT_TRUE(fs::exists(path));

    std::vector<std::uint8_t> back = {1};
    ASSERT_TRUE(ReadGzipFile(path.string(), back, err)) << err;
    EXPECT_TRUE(back.empty());

    fs::remove_all(dir);
}

TEST(GzipFile, UnfinishedWriterRemovesPartialFile)
{
    const fs::path dir = TempDir("bitatlas_gzip_abort");
    const fs::path path = dir / "partial.gz";

    std::string err;
    {
        GzipFileWriter w;
        ASSERT_TRUE(w.Open(path.string(), GzipFileWriter::kBestCompression, err)) << err;
        const std::vector<std::uint8_t> data(4096, 0xAB);
        ASSERT_TRUE(w.Write(data.data(), data.size(), err)) << err;
        EXPECT_TRUE(fs::exists(path));
    }
    EXPECT_FALSE(fs::exists(path));

    fs::remove_all(dir);
}

TEST(GzipFile, ReportsCreateAndOpenFailures)
{
    const fs::path dir = TempDir("bitatlas_gzip_fail");
    const std::string bad = (dir / "no_such_dir" / "atlas.gz").string();

    std::string err;
    GzipFileWriter w;
    EXPECT_FALSE(w.Open(bad, GzipFileWriter::kBestCompression, err));
    EXPECT_NE(err.find("Failed to create"), std::string::npos) << err;
    EXPECT_FALSE(w.IsOpen());

    std::vector<std::uint8_t> out;
    EXPECT_FALSE(ReadGzipFile(bad, out, err));
    EXPECT_NE(err.find("no_such_dir"), std::string::npos) << err;

    fs::remove_all(dir);
}

TEST(GzipFile, RejectsUncompressedInput)
{
    const fs::path dir = TempDir("bitatlas_gzip_raw");
    const fs::path path = dir / "raw.bin";
    {
        std::ofstream out(path, std::ios::binary);
        const std::string payload(512, '\x5a');
        out << payload;
    }

    std::vector<std::uint8_t> back = {1, 2};
    std::string err;
    EXPECT_FALSE(ReadGzipFile(path.string(), back, err));
    EXPECT_NE(err.find("Not a gzip file"), std::string::npos) << err;
    EXPECT_TRUE(back.empty());

    fs::remove_all(dir);
}

TEST(GzipFile, WriteAndCloseRequireOpen)
{
    GzipFileWriter w;
    std::string err;
    const char byte = 'x';
    EXPECT_FALSE(w.Write(&byte, 1, err));
    EXPECT_NE(err.find("not open"), std::string::npos) << err;
    EXPECT_FALSE(w.Close(err));
}
