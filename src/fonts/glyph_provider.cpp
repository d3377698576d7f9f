#include "fonts/glyph_provider.h"

#include <algorithm>
#include <utility>

namespace bitatlas
{
const char* ProviderKindName(ProviderKind k)
{
    switch (k)
    {
    case ProviderKind::Fixed:         return "fixed";
    case ProviderKind::Proportional:  return "proportional";
    case ProviderKind::Supplementary: return "supplementary";
    }
    return "?";
}

void GlyphProvider::AddFont(bdf::Font font)
{
    for (bdf::Font& f : fonts_)
    {
        if (f.pixel_size != font.pixel_size)
            continue;
        // unordered_map::insert keeps the existing entry on collision.
        for (auto& kv : font.glyphs)
            f.glyphs.insert(std::move(kv));
        return;
    }
    fonts_.push_back(std::move(font));
}

const bdf::Font* GlyphProvider::FontForSize(int size) const
{
    for (const bdf::Font& f : fonts_)
        if (f.pixel_size == size)
            return &f;
    return nullptr;
}

bool GlyphProvider::Has(char32_t cp, int size) const
{
    const bdf::Font* f = FontForSize(size);
    return f && f->glyphs.find(cp) != f->glyphs.end();
}

bool GlyphProvider::Lookup(char32_t cp, int size, GlyphBitmap& out) const
{
    out = GlyphBitmap{};
    const bdf::Font* f = FontForSize(size);
    if (!f)
        return false;
    const auto it = f->glyphs.find(cp);
    if (it == f->glyphs.end())
        return false;
    const bdf::Glyph& g = it->second;

    if (options_.form == GlyphForm::Tight)
    {
        out.width = g.bbx_w;
        out.height = g.bbx_h;
        out.origin_x = g.bbx_x;
        out.origin_y = g.bbx_y;
        out.alpha.resize(g.bits.size());
        for (size_t i = 0; i < g.bits.size(); ++i)
            out.alpha[i] = g.bits[i] ? 0xFF : 0x00;
        return true;
    }

    // CellBaked: place the ink on the baseline inside an advance-wide, cell-tall box.
    // Ink that falls outside the box is dropped and counted in clipped_pixels.
    out.width = std::max(g.dwidth, g.bbx_x + g.bbx_w);
    out.height = options_.cell_height;
    if (out.width <= 0 || out.height <= 0)
    {
        out.width = 0;
        out.height = 0;
        for (std::uint8_t b : g.bits)
            out.clipped_pixels += b ? 1 : 0;
        return true;
    }
    out.alpha.assign((size_t)out.width * (size_t)out.height, 0);

    const int top = options_.baseline - (g.bbx_y + g.bbx_h);
    for (int y = 0; y < g.bbx_h; ++y)
    {
        const int dy = top + y;
        for (int x = 0; x < g.bbx_w; ++x)
        {
            if (!g.bits[(size_t)y * (size_t)g.bbx_w + (size_t)x])
                continue;
            const int dx = g.bbx_x + x;
            if (dy < 0 || dy >= out.height || dx < 0 || dx >= out.width)
            {
                ++out.clipped_pixels;
                continue;
            }
            out.alpha[(size_t)dy * (size_t)out.width + (size_t)dx] = 0xFF;
        }
    }
    return true;
}

std::size_t GlyphProvider::GlyphCount() const
{
    std::size_t n = 0;
    for (const bdf::Font& f : fonts_)
        n += f.glyphs.size();
    return n;
}

bool LoadGlyphSet(const GlyphSetSources& sources,
                  const ProviderOptions& options,
                  GlyphSet& out,
                  std::string& err)
{
    err.clear();
    out.fixed = GlyphProvider(ProviderKind::Fixed, options);
    out.proportional = GlyphProvider(ProviderKind::Proportional, options);
    out.supplementary = GlyphProvider(ProviderKind::Supplementary, options);

    auto load_all = [&](const std::vector<std::string>& paths, GlyphProvider& provider) -> bool {
        for (const std::string& path : paths)
        {
            bdf::Font font;
            std::string load_err;
            if (!bdf::LoadFontFromFile(path, font, load_err))
            {
                err = std::string(ProviderKindName(provider.Kind())) + " provider: " + load_err;
                return false;
            }
            provider.AddFont(std::move(font));
        }
        return true;
    };

    return load_all(sources.fixed, out.fixed) &&
           load_all(sources.proportional, out.proportional) &&
           load_all(sources.supplementary, out.supplementary);
}
} // namespace bitatlas
