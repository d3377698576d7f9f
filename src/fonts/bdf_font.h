#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace bitatlas::bdf
{
// ---------------------------------------------------------------------------
// Glyph Bitmap Distribution Format (BDF 2.1) loader.
//
// Only what the atlas needs is kept: per-glyph bounding box, advance and 1bpp rows.
// Vertical metrics follow BDF (y grows upward, baseline at y == 0).
// ---------------------------------------------------------------------------

struct Glyph
{
    int dwidth = 0; // horizontal advance in pixels

    // BBX: bounding box size and offset of its lower-left corner from the origin.
    int bbx_w = 0;
    int bbx_h = 0;
    int bbx_x = 0;
    int bbx_y = 0;

    // Row-major 1 byte per pixel (0/1), size bbx_w*bbx_h.
    std::vector<std::uint8_t> bits;
};

struct Font
{
    std::string name;     // FONT
    int pixel_size = 0;   // PIXEL_SIZE property, falls back to SIZE
    int ascent = 0;       // FONT_ASCENT
    int descent = 0;      // FONT_DESCENT

    std::unordered_map<char32_t, Glyph> glyphs;
};

// Parse a BDF font from raw file bytes.
// Glyphs with ENCODING -1 (unencoded) or outside the Unicode range are skipped.
bool LoadFontFromBytes(const std::vector<std::uint8_t>& bytes, Font& out, std::string& err);

// Reads the whole file then parses it. `err` names the path on failure.
bool LoadFontFromFile(const std::string& path, Font& out, std::string& err);
} // namespace bitatlas::bdf
