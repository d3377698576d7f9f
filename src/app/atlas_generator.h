#pragma once

#include "core/atlas_canvas.h"
#include "fonts/glyph_provider.h"
#include "io/atlas_config.h"

#include <cstddef>
#include <string>

namespace bitatlas
{
struct GenerateReport
{
    int width = 0;
    int height = 0;
    Packing packing = Packing::Alpha1;
    std::size_t payload_bytes = 0;
    AtlasStats stats;
};

// Resolve -> composite -> pack -> gzip for an already loaded glyph set.
bool GenerateAtlas(const GlyphSet& glyphs,
                   const AtlasConfig& cfg,
                   const std::string& output_path,
                   GenerateReport& report,
                   std::string& err);

// Same, loading the glyph set from the BDF files named in `cfg.providers`.
bool GenerateAtlas(const AtlasConfig& cfg,
                   const std::string& output_path,
                   GenerateReport& report,
                   std::string& err);
} // namespace bitatlas
