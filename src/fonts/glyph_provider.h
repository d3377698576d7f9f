#pragma once

#include "core/glyph_bitmap.h"
#include "fonts/bdf_font.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bitatlas
{
// The three glyph sources the atlas is assembled from. The set is closed: every provider
// is one of these kinds and a GlyphSet holds exactly one of each.
enum class ProviderKind : std::uint8_t
{
    Fixed = 0,     // fixed-width (misc-fixed style)
    Proportional,  // M+ style
    Supplementary, // Baekmuk style (Hangul / CJK fill-in)
};

const char* ProviderKindName(ProviderKind k);

// How Lookup() shapes the returned bitmap.
enum class GlyphForm : std::uint8_t
{
    // BDF bounding box; origin = BBX offsets (y up).
    Tight = 0,
    // `advance x cell_height` bitmap with ink already sitting on `baseline`; origin (0,0).
    CellBaked,
};

struct ProviderOptions
{
    GlyphForm form = GlyphForm::Tight;
    int cell_height = 16; // CellBaked only
    int baseline = 12;    // CellBaked only: row index of the baseline from the top
};

// Immutable code point -> glyph table, one per BDF pixel size.
class GlyphProvider
{
public:
    GlyphProvider() = default;
    GlyphProvider(ProviderKind kind, ProviderOptions options) : kind_(kind), options_(options) {}

    ProviderKind Kind() const { return kind_; }
    const ProviderOptions& Options() const { return options_; }

    // Adds a parsed font. Fonts sharing a pixel size are merged; the first font added keeps
    // any code point both define.
    void AddFont(bdf::Font font);

    // True if a glyph for `cp` exists at `size` pixels.
    bool Has(char32_t cp, int size) const;

    // Returns false (and leaves `out` empty) when `cp` has no glyph at `size`.
    bool Lookup(char32_t cp, int size, GlyphBitmap& out) const;

    std::size_t GlyphCount() const;

private:
    const bdf::Font* FontForSize(int size) const;

    ProviderKind kind_ = ProviderKind::Fixed;
    ProviderOptions options_;
    std::vector<bdf::Font> fonts_; // one entry per pixel size
};

struct GlyphSet
{
    GlyphProvider fixed{ProviderKind::Fixed, {}};
    GlyphProvider proportional{ProviderKind::Proportional, {}};
    GlyphProvider supplementary{ProviderKind::Supplementary, {}};

    const GlyphProvider& Get(ProviderKind k) const
    {
        const GlyphProvider* p = &fixed;
        switch (k)
        {
        case ProviderKind::Fixed:         break;
        case ProviderKind::Proportional:  p = &proportional; break;
        case ProviderKind::Supplementary: p = &supplementary; break;
        }
        return *p;
    }
    GlyphProvider& Get(ProviderKind k)
    {
        return const_cast<GlyphProvider&>(static_cast<const GlyphSet&>(*this).Get(k));
    }
};

// BDF files per provider kind.
struct GlyphSetSources
{
    std::vector<std::string> fixed;
    std::vector<std::string> proportional;
    std::vector<std::string> supplementary;
};

// Loads every listed BDF file into a fresh GlyphSet whose providers all use `options`.
bool LoadGlyphSet(const GlyphSetSources& sources,
                  const ProviderOptions& options,
                  GlyphSet& out,
                  std::string& err);
} // namespace bitatlas
