#pragma once

// Per-code-point glyph source selection.
//
// Several providers may define the same code point; the atlas must take each glyph from
// exactly one of them. The override rules below win over what the providers declare:
// - Box Drawing always comes from the supplementary font.
// - (extended) Halfwidth Katakana always comes from the proportional font.
// - (extended) East-Asian-Ambiguous code points go to the proportional font when east-Asia
//   preference is on, else to the fixed font, whether or not that font has the glyph.
// Otherwise the first provider declaring the code point wins.

#include "core/east_asian_width.h"
#include "core/glyph_bitmap.h"
#include "fonts/glyph_provider.h"

#include <cstdint>
#include <string_view>

namespace bitatlas::glyph
{
static constexpr char32_t kBoxDrawingFirst = 0x2500;
static constexpr char32_t kBoxDrawingLast = 0x257F;
static constexpr char32_t kHalfwidthKatakanaFirst = 0xFF65;
static constexpr char32_t kHalfwidthKatakanaLast = 0xFF9F;

// Legacy: proportional + supplementary only, bottom-aligned tight glyphs, RGBA8 output.
// Extended: adds the fixed font and the katakana/ambiguous-width rules, cell-baked glyphs.
enum class Variant : std::uint8_t
{
    Legacy = 0,
    Extended,
};

enum class FontType : std::uint8_t
{
    None = 0,
    Fixed,
    Proportional,
    Supplementary,
};

const char* VariantName(Variant v);
bool ParseVariant(std::string_view s, Variant& out);
const char* FontTypeName(FontType t);

struct ResolverOptions
{
    Variant variant = Variant::Extended;
    bool prefer_east_asia = false;
    int glyph_size = 12;
    EastAsianWidthFn width_fn = &ClassifyEastAsianWidth;
};

class GlyphResolver
{
public:
    GlyphResolver(const GlyphSet& glyphs, const ResolverOptions& options)
        : glyphs_(glyphs), options_(options)
    {
    }

    const ResolverOptions& Options() const { return options_; }

    // Pure function of `cp` and the options.
    FontType ClassifyCodepoint(char32_t cp) const;

    // Returns false when the code point has no glyph: either no provider was selected, or
    // the selected provider does not define it.
    bool ResolveGlyph(char32_t cp, GlyphBitmap& out) const;

    // Same as ResolveGlyph but also reports the classification that was used.
    bool ResolveGlyph(char32_t cp, GlyphBitmap& out, FontType& out_type) const;

private:
    const GlyphSet& glyphs_;
    ResolverOptions options_;
};
} // namespace bitatlas::glyph
