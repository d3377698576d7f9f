#include "app/atlas_generator.h"

#include "core/glyph_resolve.h"
#include "io/atlas_packer.h"
#include "io/gzip_file.h"

#include <vector>

namespace bitatlas
{
bool GenerateAtlas(const GlyphSet& glyphs,
                   const AtlasConfig& cfg,
                   const std::string& output_path,
                   GenerateReport& report,
                   std::string& err)
{
    err.clear();
    report = GenerateReport{};
    if (output_path.empty())
    {
        err = "No output path.";
        return false;
    }
    if (!ValidateAtlasConfig(cfg, err))
        return false;

    const glyph::GlyphResolver resolver(glyphs, cfg.ToResolverOptions());

    AtlasCanvas canvas;
    if (!BuildAtlas(resolver, cfg.ToAtlasOptions(), canvas, report.stats, err))
        return false;
    report.width = canvas.width;
    report.height = canvas.height;
    report.packing = cfg.EffectivePacking();

    std::vector<std::uint8_t> payload;
    if (!PackCanvas(report.packing, canvas, payload, err))
        return false;
    report.payload_bytes = payload.size();

    // The canvas is not needed past this point; release it before compressing.
    canvas = AtlasCanvas{};

    return WriteGzipFile(output_path, payload, GzipFileWriter::kBestCompression, err);
}

bool GenerateAtlas(const AtlasConfig& cfg,
                   const std::string& output_path,
                   GenerateReport& report,
                   std::string& err)
{
    GlyphSet glyphs;
    if (!LoadGlyphSet(cfg.providers, cfg.ToProviderOptions(), glyphs, err))
        return false;
    return GenerateAtlas(glyphs, cfg, output_path, report, err);
}
} // namespace bitatlas
