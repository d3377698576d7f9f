#include "io/gzip_file.h"

#include <zlib.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <limits>

namespace bitatlas
{
namespace
{
// windowBits + 16 selects the gzip wrapper instead of zlib's.
static constexpr int kGzipWindowBits = 15 + 16;
static constexpr int kMemLevel = 8;
static constexpr std::size_t kChunk = 64 * 1024;

static std::string ZlibError(const char* what, int code, const z_stream& zs)
{
    std::string s = std::string(what) + " failed (" + std::to_string(code) + ")";
    if (zs.msg)
        s += std::string(": ") + zs.msg;
    return s;
}
} // namespace

struct GzipFileWriter::Impl
{
    std::string path;
    std::FILE* file = nullptr;
    z_stream zs{};
    bool zs_live = false;
    std::vector<unsigned char> out_buf = std::vector<unsigned char>(kChunk);

    // Runs deflate() with `flush` until zlib stops producing output, writing it to `file`.
    bool Pump(int flush, std::string& err)
    {
        for (;;)
        {
            zs.next_out = out_buf.data();
            zs.avail_out = (uInt)out_buf.size();
            const int rc = deflate(&zs, flush);
            if (rc == Z_STREAM_ERROR)
            {
                err = ZlibError("deflate", rc, zs);
                return false;
            }
            const std::size_t have = out_buf.size() - zs.avail_out;
            if (have > 0 && std::fwrite(out_buf.data(), 1, have, file) != have)
            {
                err = "Failed to write: " + path;
                return false;
            }
            if (flush == Z_FINISH)
            {
                if (rc == Z_STREAM_END)
                    return true;
                if (rc != Z_OK && rc != Z_BUF_ERROR)
                {
                    err = ZlibError("deflate(Z_FINISH)", rc, zs);
                    return false;
                }
                continue;
            }
            if (zs.avail_out != 0)
                return true;
        }
    }
};

GzipFileWriter::~GzipFileWriter()
{
    Abort();
}

void GzipFileWriter::Abort()
{
    if (!m)
        return;
    if (m->zs_live)
    {
        deflateEnd(&m->zs);
        m->zs_live = false;
    }
    if (m->file)
    {
        std::fclose(m->file);
        m->file = nullptr;
    }
    std::error_code ec;
    std::filesystem::remove(m->path, ec);
    delete m;
    m = nullptr;
}

bool GzipFileWriter::Open(const std::string& path, int level, std::string& err)
{
    err.clear();
    Abort();

    m = new Impl();
    m->path = path;
    m->file = std::fopen(path.c_str(), "wb");
    if (!m->file)
    {
        err = "Failed to create: " + path;
        delete m;
        m = nullptr;
        return false;
    }

    const int rc = deflateInit2(&m->zs, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK)
    {
        err = ZlibError("deflateInit2", rc, m->zs);
        Abort();
        return false;
    }
    m->zs_live = true;
    return true;
}

bool GzipFileWriter::Write(const void* data, std::size_t len, std::string& err)
{
    err.clear();
    if (!m || !m->zs_live)
    {
        err = "Gzip writer is not open.";
        return false;
    }

    const auto* p = static_cast<const unsigned char*>(data);
    while (len > 0)
    {
        const std::size_t n = std::min<std::size_t>(len, std::numeric_limits<uInt>::max());
        m->zs.next_in = const_cast<Bytef*>(p);
        m->zs.avail_in = (uInt)n;
        if (!m->Pump(Z_NO_FLUSH, err))
        {
            Abort();
            return false;
        }
        p += n;
        len -= n;
    }
    return true;
}

bool GzipFileWriter::Close(std::string& err)
{
    err.clear();
    if (!m || !m->zs_live)
    {
        err = "Gzip writer is not open.";
        return false;
    }

    // Compressor first: the gzip trailer is only emitted by Z_FINISH.
    m->zs.next_in = nullptr;
    m->zs.avail_in = 0;
    if (!m->Pump(Z_FINISH, err))
    {
        Abort();
        return false;
    }
    deflateEnd(&m->zs);
    m->zs_live = false;

    // Then the file.
    const bool flushed = std::fflush(m->file) == 0;
    const bool closed = std::fclose(m->file) == 0;
    m->file = nullptr;
    if (!flushed || !closed)
    {
        err = "Failed to finish writing: " + m->path;
        Abort();
        return false;
    }

    delete m;
    m = nullptr;
    return true;
}

bool WriteGzipFile(const std::string& path,
                   const std::vector<std::uint8_t>& bytes,
                   int level,
                   std::string& err)
{
    GzipFileWriter w;
    if (!w.Open(path, level, err))
        return false;
    if (!w.Write(bytes.data(), bytes.size(), err))
        return false;
    return w.Close(err);
}

bool ReadGzipFile(const std::string& path, std::vector<std::uint8_t>& out, std::string& err)
{
    err.clear();
    out.clear();

    gzFile f = gzopen(path.c_str(), "rb");
    if (!f)
    {
        err = "Failed to open: " + path;
        return false;
    }

    std::vector<std::uint8_t> buf(kChunk);
    for (;;)
    {
        const int n = gzread(f, buf.data(), (unsigned)buf.size());
        if (n < 0)
        {
            int code = 0;
            const char* msg = gzerror(f, &code);
            err = "Failed to decompress " + path + ": " + (msg ? msg : "unknown error");
            gzclose(f);
            out.clear();
            return false;
        }
        // gzread passes non-gzip input through unchanged; only accept a real gzip stream.
        if (gzdirect(f))
        {
            err = "Not a gzip file: " + path;
            gzclose(f);
            out.clear();
            return false;
        }
        if (n == 0)
            break;
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }

    if (gzclose(f) != Z_OK)
    {
        err = "Failed to close: " + path;
        out.clear();
        return false;
    }
    return true;
}
} // namespace bitatlas
