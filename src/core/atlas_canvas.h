#pragma once

#include "core/glyph_bitmap.h"
#include "core/glyph_resolve.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace bitatlas
{
// The atlas is a 256x256 grid of cells; code point cp lives in cell (cp % 256, cp / 256).
static constexpr int kGridColumns = 256;
static constexpr int kGridRows = 256;
static constexpr char32_t kLastCodepoint = 0xFFFF;

// Largest cell edge accepted; keeps (cell * 256)^2 canvases and RGBA8 payloads addressable.
static constexpr int kMaxCellSize = 64;

// Legacy layout: rows kept free between the baseline and the cell bottom.
static constexpr int kLegacyDescentRows = 4;

// 8-bit alpha canvas. Row-major, 0 = transparent.
struct AtlasCanvas
{
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> alpha;

    void Reset(int w, int h)
    {
        width = w;
        height = h;
        alpha.assign((size_t)w * (size_t)h, 0);
    }

    std::uint8_t At(int x, int y) const { return alpha[(size_t)y * (size_t)width + (size_t)x]; }
};

struct AtlasOptions
{
    int cell_width = 12;
    int cell_height = 16;
};

// Both cell edges in 1..kMaxCellSize.
bool ValidateCellSize(int cell_width, int cell_height, std::string& err);

struct AtlasStats
{
    // Cells drawn, indexed by glyph::FontType (None stays 0).
    std::array<int, 4> drawn{};
    // Code points classified to a provider that turned out not to define them.
    int unresolved = 0;
    // Resolved glyphs whose ink did not fit the cell-baked box and was cut off.
    int clipped = 0;

    int TotalDrawn() const { return drawn[1] + drawn[2] + drawn[3]; }
    int Drawn(glyph::FontType t) const { return drawn[(size_t)t]; }
};

// "Draw over" composite: opaque source pixels become opaque (255) in the canvas, transparent
// ones leave it untouched. The caller guarantees the rectangle is inside the canvas.
void DrawOver(AtlasCanvas& canvas, const GlyphBitmap& glyph, int dst_x, int dst_y);

// Destination of `glyph` for `cp`, following the resolver's variant:
// - Legacy:   (cell_x + origin_x, cell_y + (cell_h - h) - 4 - origin_y)
// - Extended: (cell_x, cell_y)
void GlyphDestination(glyph::Variant variant,
                      const AtlasOptions& options,
                      char32_t cp,
                      const GlyphBitmap& glyph,
                      int& out_x,
                      int& out_y);

// Resolves and composites every code point 0..0xFFFF into a fresh canvas of
// (cell_width*256) x (cell_height*256).
// Fails if a glyph would leave its cell's columns or the canvas.
bool BuildAtlas(const glyph::GlyphResolver& resolver,
                const AtlasOptions& options,
                AtlasCanvas& out,
                AtlasStats& stats,
                std::string& err);

// "U+0041"
std::string FormatCodepoint(char32_t cp);
} // namespace bitatlas
