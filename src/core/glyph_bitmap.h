#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bitatlas
{
// One rendered glyph as handed out by a provider.
//
// - `alpha` is row-major, size width*height. 0 = transparent, anything else = opaque.
// - `origin_x` / `origin_y` place the bitmap relative to the glyph origin (BDF convention:
//   y grows upward). Cell-baked bitmaps always carry (0,0).
struct GlyphBitmap
{
    int width = 0;
    int height = 0;
    int origin_x = 0;
    int origin_y = 0;
    std::vector<std::uint8_t> alpha;

    // Source ink pixels that fell outside a cell-baked box and were dropped.
    int clipped_pixels = 0;

    bool Empty() const { return width <= 0 || height <= 0; }

    bool Opaque(int x, int y) const
    {
        return alpha[(size_t)y * (size_t)width + (size_t)x] != 0;
    }
};
} // namespace bitatlas
