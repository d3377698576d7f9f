#include "core/atlas_canvas.h"
#include "io/atlas_packer.h"
#include "io/gzip_file.h"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace bitatlas;

namespace
{
static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " --input <atlas.gz> [--packing alpha1|rgba8]\n"
              << "               [--cell-width N] [--cell-height N] [--codepoint U+XXXX]... [--summary]\n"
              << "\n"
              << "Decompresses an atlas written by bitatlas_gen, checks its payload size and prints\n"
              << "the requested cells ('#' = opaque, '.' = transparent).\n"
              << "\n"
              << "Options:\n"
              << "  --input <path>       Atlas file (required)\n"
              << "  --packing <p>        alpha1 | rgba8 (default: alpha1)\n"
              << "  --cell-width N       Cell width in pixels (default: 12)\n"
              << "  --cell-height N      Cell height in pixels (default: 16)\n"
              << "  --codepoint <cp>     Cell to print; U+XXXX, 0xXXXX or decimal (repeatable)\n"
              << "  --summary            Print the number of non-empty cells\n";
}

static bool ParseCodepoint(std::string_view s, char32_t& out)
{
    int base = 10;
    if (s.size() > 2 && (s.substr(0, 2) == "U+" || s.substr(0, 2) == "u+" || s.substr(0, 2) == "0x"))
    {
        s.remove_prefix(2);
        base = 16;
    }
    if (s.empty())
        return false;
    const std::string tmp(s);
    char* end = nullptr;
    const unsigned long v = std::strtoul(tmp.c_str(), &end, base);
    if (!end || *end != '\0' || v > kLastCodepoint)
        return false;
    out = (char32_t)v;
    return true;
}

static bool ParsePositive(std::string_view s, int& out)
{
    const std::string tmp(s);
    char* end = nullptr;
    const long v = std::strtol(tmp.c_str(), &end, 10);
    if (!end || *end != '\0' || v <= 0 || v > 4096)
        return false;
    out = (int)v;
    return true;
}

static bool CellEmpty(const std::vector<std::uint8_t>& mask, int width, int cell_w, int cell_h, char32_t cp)
{
    const int cx = (int)(cp % kGridColumns) * cell_w;
    const int cy = (int)(cp / kGridColumns) * cell_h;
    for (int y = 0; y < cell_h; ++y)
        for (int x = 0; x < cell_w; ++x)
            if (mask[(size_t)(cy + y) * (size_t)width + (size_t)(cx + x)])
                return false;
    return true;
}

static void PrintCell(const std::vector<std::uint8_t>& mask, int width, int cell_w, int cell_h, char32_t cp)
{
    const int cx = (int)(cp % kGridColumns) * cell_w;
    const int cy = (int)(cp / kGridColumns) * cell_h;
    std::cout << FormatCodepoint(cp) << " cell (" << (cp % kGridColumns) << "," << (cp / kGridColumns) << ")\n";
    for (int y = 0; y < cell_h; ++y)
    {
        std::string row;
        row.reserve((size_t)cell_w);
        for (int x = 0; x < cell_w; ++x)
            row.push_back(mask[(size_t)(cy + y) * (size_t)width + (size_t)(cx + x)] ? '#' : '.');
        std::cout << "  " << row << "\n";
    }
}
} // namespace

int main(int argc, char** argv)
{
    std::string input;
    Packing packing = Packing::Alpha1;
    int cell_w = 12;
    int cell_h = 16;
    bool summary = false;
    std::vector<char32_t> codepoints;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt) -> std::string_view {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << opt << "\n";
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return std::string_view(argv[++i]);
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "--input")
        {
            input = std::string(need("--input"));
        }
        else if (a == "--packing")
        {
            if (!ParsePacking(need("--packing"), packing))
            {
                std::cerr << "Invalid --packing value (expected alpha1|rgba8)\n";
                return 2;
            }
        }
        else if (a == "--cell-width" || a == "--cell-height")
        {
            int& dst = (a == "--cell-width") ? cell_w : cell_h;
            if (!ParsePositive(need(argv[i]), dst))
            {
                std::cerr << "Invalid " << a << " value\n";
                return 2;
            }
        }
        else if (a == "--codepoint")
        {
            char32_t cp = 0;
            if (!ParseCodepoint(need("--codepoint"), cp))
            {
                std::cerr << "Invalid --codepoint value (expected U+XXXX <= U+FFFF)\n";
                return 2;
            }
            codepoints.push_back(cp);
        }
        else if (a == "--summary")
        {
            summary = true;
        }
        else
        {
            std::cerr << "Unknown arg: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    if (input.empty())
    {
        std::cerr << "Missing required --input\n";
        PrintUsage(argv[0]);
        return 2;
    }

    std::vector<std::uint8_t> payload;
    std::string err;
    if (!ReadGzipFile(input, payload, err))
    {
        std::cerr << "bitatlas_inspect: FAIL: " << err << "\n";
        return 1;
    }

    const int width = cell_w * kGridColumns;
    const int height = cell_h * kGridRows;
    std::vector<std::uint8_t> mask;
    const bool ok = (packing == Packing::Alpha1) ? UnpackAlpha1(payload, width, height, mask, err)
                                                 : UnpackRgba8(payload, width, height, mask, err);
    if (!ok)
    {
        std::cerr << "bitatlas_inspect: FAIL: " << err << "\n";
        return 1;
    }

    std::cout << "Atlas: " << width << "x" << height << " (" << PackingName(packing) << ", " << payload.size()
              << " bytes)\n";

    if (summary)
    {
        int non_empty = 0;
        for (char32_t cp = 0; cp <= kLastCodepoint; ++cp)
            if (!CellEmpty(mask, width, cell_w, cell_h, cp))
                ++non_empty;
        std::cout << "Non-empty cells: " << non_empty << "\n";
    }

    for (char32_t cp : codepoints)
        PrintCell(mask, width, cell_w, cell_h, cp);
    return 0;
}
