#include "core/atlas_canvas.h"

#include <cstdio>

namespace bitatlas
{
std::string FormatCodepoint(char32_t cp)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", (unsigned)cp);
    return buf;
}

bool ValidateCellSize(int cell_width, int cell_height, std::string& err)
{
    if (cell_width <= 0 || cell_height <= 0)
    {
        err = "cell_width and cell_height must be positive";
        return false;
    }
    if (cell_width > kMaxCellSize || cell_height > kMaxCellSize)
    {
        err = "cell_width and cell_height must be at most " + std::to_string(kMaxCellSize);
        return false;
    }
    return true;
}

void DrawOver(AtlasCanvas& canvas, const GlyphBitmap& glyph, int dst_x, int dst_y)
{
    for (int y = 0; y < glyph.height; ++y)
    {
        std::uint8_t* row = canvas.alpha.data() + (size_t)(dst_y + y) * (size_t)canvas.width + (size_t)dst_x;
        for (int x = 0; x < glyph.width; ++x)
        {
            if (glyph.Opaque(x, y))
                row[x] = 0xFF;
        }
    }
}

void GlyphDestination(glyph::Variant variant,
                      const AtlasOptions& options,
                      char32_t cp,
                      const GlyphBitmap& glyph,
                      int& out_x,
                      int& out_y)
{
    const int cell_x = (int)(cp % kGridColumns) * options.cell_width;
    const int cell_y = (int)(cp / kGridColumns) * options.cell_height;

    switch (variant)
    {
    case glyph::Variant::Legacy:
        out_x = cell_x + glyph.origin_x;
        out_y = cell_y + (options.cell_height - glyph.height) - kLegacyDescentRows - glyph.origin_y;
        break;
    case glyph::Variant::Extended:
        out_x = cell_x;
        out_y = cell_y;
        break;
    }
}

bool BuildAtlas(const glyph::GlyphResolver& resolver,
                const AtlasOptions& options,
                AtlasCanvas& out,
                AtlasStats& stats,
                std::string& err)
{
    err.clear();
    stats = AtlasStats{};
    if (!ValidateCellSize(options.cell_width, options.cell_height, err))
        return false;

    out.Reset(options.cell_width * kGridColumns, options.cell_height * kGridRows);
    const glyph::Variant variant = resolver.Options().variant;

    GlyphBitmap g;
    for (char32_t cp = 0; cp <= kLastCodepoint; ++cp)
    {
        glyph::FontType type = glyph::FontType::None;
        if (!resolver.ResolveGlyph(cp, g, type))
        {
            if (type != glyph::FontType::None)
                ++stats.unresolved;
            continue;
        }
        if (g.clipped_pixels > 0)
            ++stats.clipped;
        if (g.Empty())
            continue;

        int dx = 0;
        int dy = 0;
        GlyphDestination(variant, options, cp, g, dx, dy);

        const int cell_x = (int)(cp % kGridColumns) * options.cell_width;
        const bool fits_columns = dx >= cell_x && dx + g.width <= cell_x + options.cell_width;
        const bool fits_canvas = dy >= 0 && dy + g.height <= out.height;
        if (!fits_columns || !fits_canvas)
        {
            err = "glyph " + FormatCodepoint(cp) + " (" + glyph::FontTypeName(type) + ") at (" +
                  std::to_string(dx) + "," + std::to_string(dy) + ") size " + std::to_string(g.width) + "x" +
                  std::to_string(g.height) + (fits_columns ? " leaves the canvas" : " leaves its cell columns");
            return false;
        }

        DrawOver(out, g, dx, dy);
        ++stats.drawn[(size_t)type];
    }
    return true;
}
} // namespace bitatlas
