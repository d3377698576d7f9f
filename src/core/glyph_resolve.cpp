#include "core/glyph_resolve.h"

namespace bitatlas::glyph
{
const char* VariantName(Variant v)
{
    switch (v)
    {
    case Variant::Legacy:   return "legacy";
    case Variant::Extended: return "extended";
    }
    return "?";
}

bool ParseVariant(std::string_view s, Variant& out)
{
    if (s == "legacy")
    {
        out = Variant::Legacy;
        return true;
    }
    if (s == "extended")
    {
        out = Variant::Extended;
        return true;
    }
    return false;
}

const char* FontTypeName(FontType t)
{
    switch (t)
    {
    case FontType::None:          return "none";
    case FontType::Fixed:         return "fixed";
    case FontType::Proportional:  return "proportional";
    case FontType::Supplementary: return "supplementary";
    }
    return "?";
}

FontType GlyphResolver::ClassifyCodepoint(char32_t cp) const
{
    if (cp >= kBoxDrawingFirst && cp <= kBoxDrawingLast)
        return FontType::Supplementary;

    const int size = options_.glyph_size;
    if (options_.variant == Variant::Legacy)
    {
        if (glyphs_.proportional.Has(cp, size))
            return FontType::Proportional;
        if (glyphs_.supplementary.Has(cp, size))
            return FontType::Supplementary;
        return FontType::None;
    }

    if (cp >= kHalfwidthKatakanaFirst && cp <= kHalfwidthKatakanaLast)
        return FontType::Proportional;

    if (options_.width_fn && options_.width_fn(cp) == EastAsianWidth::Ambiguous)
        return options_.prefer_east_asia ? FontType::Proportional : FontType::Fixed;

    if (glyphs_.fixed.Has(cp, size))
        return FontType::Fixed;
    if (glyphs_.proportional.Has(cp, size))
        return FontType::Proportional;
    if (glyphs_.supplementary.Has(cp, size))
        return FontType::Supplementary;
    return FontType::None;
}

bool GlyphResolver::ResolveGlyph(char32_t cp, GlyphBitmap& out) const
{
    FontType unused = FontType::None;
    return ResolveGlyph(cp, out, unused);
}

bool GlyphResolver::ResolveGlyph(char32_t cp, GlyphBitmap& out, FontType& out_type) const
{
    out = GlyphBitmap{};
    out_type = ClassifyCodepoint(cp);

    ProviderKind kind = ProviderKind::Fixed;
    switch (out_type)
    {
    case FontType::None:          return false;
    case FontType::Fixed:         kind = ProviderKind::Fixed; break;
    case FontType::Proportional:  kind = ProviderKind::Proportional; break;
    case FontType::Supplementary: kind = ProviderKind::Supplementary; break;
    }
    return glyphs_.Get(kind).Lookup(cp, options_.glyph_size, out);
}
} // namespace bitatlas::glyph
