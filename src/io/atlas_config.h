#pragma once

#include "core/atlas_canvas.h"
#include "core/glyph_resolve.h"
#include "fonts/glyph_provider.h"
#include "io/atlas_packer.h"

#include <string>

namespace bitatlas
{
// Generator settings. Loaded from an optional JSON file, then overridden from the command
// line. Defaults describe the extended 12x16 atlas.
struct AtlasConfig
{
    int schema_version = 1;

    glyph::Variant variant = glyph::Variant::Extended;
    Packing packing = Packing::Alpha1;
    bool packing_set = false; // false: packing follows the variant

    int cell_width = 12;
    int cell_height = 16;
    int glyph_size = 12;
    int baseline = 12; // extended only: baseline row inside the cell
    bool prefer_east_asia = false;

    GlyphSetSources providers;

    // Derived views.
    Packing EffectivePacking() const;
    AtlasOptions ToAtlasOptions() const;
    ProviderOptions ToProviderOptions() const;
    glyph::ResolverOptions ToResolverOptions() const;
};

// Command-line values layered over a loaded config. Empty strings and false flags leave the
// config untouched; provider paths are appended after the config's own lists.
struct CliOverrides
{
    std::string variant;
    std::string packing;
    bool prefer_east_asia = false;
    GlyphSetSources providers;
};

// Fails (leaving `cfg` unchanged) on an unknown variant or packing name.
bool ApplyCliOverrides(AtlasConfig& cfg, const CliOverrides& cli, std::string& err);

// Parses a JSON document. Relative provider paths are resolved against `base_dir`.
bool ParseAtlasConfig(const std::string& json_text,
                      const std::string& base_dir,
                      AtlasConfig& out,
                      std::string& err);

bool LoadAtlasConfig(const std::string& path, AtlasConfig& out, std::string& err);

// Range checks shared by the file loader and CLI overrides.
bool ValidateAtlasConfig(const AtlasConfig& cfg, std::string& err);
} // namespace bitatlas
