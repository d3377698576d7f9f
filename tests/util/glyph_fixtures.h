#pragma once

// In-memory glyph data for tests: no BDF files involved.

#include "core/east_asian_width.h"
#include "fonts/bdf_font.h"
#include "fonts/glyph_provider.h"

#include <cstdint>
#include <initializer_list>
#include <utility>

namespace bitatlas::test
{
// w x h glyph with every pixel set, BBX offset (x, y).
inline bdf::Glyph SolidGlyph(int w, int h, int x = 0, int y = 0, int dwidth = -1)
{
    bdf::Glyph g;
    g.bbx_w = w;
    g.bbx_h = h;
    g.bbx_x = x;
    g.bbx_y = y;
    g.dwidth = (dwidth >= 0) ? dwidth : x + w;
    g.bits.assign((size_t)w * (size_t)h, 1);
    return g;
}

// Single-pixel-column glyph, useful to tell providers apart by shape.
inline bdf::Glyph BarGlyph(int column, int w, int h)
{
    bdf::Glyph g;
    g.bbx_w = w;
    g.bbx_h = h;
    g.dwidth = w;
    g.bits.assign((size_t)w * (size_t)h, 0);
    for (int y = 0; y < h; ++y)
        g.bits[(size_t)y * (size_t)w + (size_t)column] = 1;
    return g;
}

inline bdf::Font MakeFont(int pixel_size, std::initializer_list<std::pair<char32_t, bdf::Glyph>> glyphs)
{
    bdf::Font f;
    f.name = "test";
    f.pixel_size = pixel_size;
    f.ascent = 12;
    f.descent = 4;
    for (const auto& kv : glyphs)
        f.glyphs[kv.first] = kv.second;
    return f;
}

inline bdf::Font MakeRangeFont(int pixel_size, char32_t first, char32_t last, const bdf::Glyph& g)
{
    bdf::Font f;
    f.name = "range";
    f.pixel_size = pixel_size;
    f.ascent = 12;
    f.descent = 4;
    for (char32_t cp = first; cp <= last; ++cp)
        f.glyphs[cp] = g;
    return f;
}

inline GlyphSet MakeGlyphSet(const ProviderOptions& options)
{
    GlyphSet s;
    s.fixed = GlyphProvider(ProviderKind::Fixed, options);
    s.proportional = GlyphProvider(ProviderKind::Proportional, options);
    s.supplementary = GlyphProvider(ProviderKind::Supplementary, options);
    return s;
}

inline EastAsianWidth NeverAmbiguous(char32_t)
{
    return EastAsianWidth::Neutral;
}

inline EastAsianWidth AlwaysAmbiguous(char32_t)
{
    return EastAsianWidth::Ambiguous;
}
} // namespace bitatlas::test
