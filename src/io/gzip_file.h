#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bitatlas
{
// Streams bytes through a zlib gzip encoder into a newly created file.
//
// Close() finishes the deflate stream (gzip trailer) and only then closes the file.
// If the writer is destroyed without a successful Close(), or any step fails, the deflate
// stream is released first, then the file, and the partial output is deleted.
//
// zlib types stay out of this header (see gzip_file.cpp).
class GzipFileWriter
{
public:
    static constexpr int kBestCompression = 9;

    GzipFileWriter() = default;
    ~GzipFileWriter();

    GzipFileWriter(const GzipFileWriter&) = delete;
    GzipFileWriter& operator=(const GzipFileWriter&) = delete;

    bool Open(const std::string& path, int level, std::string& err);
    bool Write(const void* data, std::size_t len, std::string& err);
    bool Close(std::string& err);

    bool IsOpen() const { return m != nullptr; }

private:
    struct Impl;
    Impl* m = nullptr;

    void Abort();
};

// Open + Write + Close in one call.
bool WriteGzipFile(const std::string& path,
                   const std::vector<std::uint8_t>& bytes,
                   int level,
                   std::string& err);

// Reads a whole gzip file and returns the decompressed bytes.
bool ReadGzipFile(const std::string& path, std::vector<std::uint8_t>& out, std::string& err);
} // namespace bitatlas
