#include "app/atlas_generator.h"
#include "io/atlas_config.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

using namespace bitatlas;

namespace
{
static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " --output <path> [--eastasia] [--config <file.json>]\n"
              << "               [--variant legacy|extended] [--packing alpha1|rgba8]\n"
              << "               [--fixed <bdf>]... [--proportional <bdf>]... [--supplementary <bdf>]...\n"
              << "               [--quiet]\n"
              << "\n"
              << "Builds a 256x256-cell bitmap font atlas covering U+0000..U+FFFF and writes it\n"
              << "gzip-compressed (best compression).\n"
              << "\n"
              << "Options:\n"
              << "  --output <path>        Output file (required)\n"
              << "  --eastasia             Ambiguous-width code points use the proportional font\n"
              << "  --config <file.json>   Settings file; command-line options override it\n"
              << "  --variant <v>          legacy | extended (default: extended)\n"
              << "  --packing <p>          alpha1 | rgba8 (default: alpha1, rgba8 for legacy)\n"
              << "  --fixed <bdf>          Add a BDF file to the fixed-width provider\n"
              << "  --proportional <bdf>   Add a BDF file to the proportional provider\n"
              << "  --supplementary <bdf>  Add a BDF file to the supplementary provider\n"
              << "  --quiet                Do not print the summary\n";
}

static void PrintSummary(const std::string& output, const GenerateReport& r)
{
    std::cout << "Wrote:    " << output << "\n";
    std::cout << "Atlas:    " << r.width << "x" << r.height << " (" << PackingName(r.packing) << ", "
              << r.payload_bytes << " bytes before compression)\n";
    std::cout << "Glyphs:   " << r.stats.TotalDrawn() << "\n";
    std::cout << "  fixed=" << r.stats.Drawn(glyph::FontType::Fixed)
              << " proportional=" << r.stats.Drawn(glyph::FontType::Proportional)
              << " supplementary=" << r.stats.Drawn(glyph::FontType::Supplementary) << "\n";
    if (r.stats.unresolved > 0)
        std::cout << "  selected but undefined: " << r.stats.unresolved << "\n";
    if (r.stats.clipped > 0)
        std::cout << "  clipped to the cell: " << r.stats.clipped << "\n";
}
} // namespace

int main(int argc, char** argv)
{
    std::string output;
    std::string config_path;
    bool quiet = false;
    CliOverrides cli;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt) -> std::string_view {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << opt << "\n";
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return std::string_view(argv[++i]);
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "--output")
            output = std::string(need("--output"));
        else if (a == "--config")
            config_path = std::string(need("--config"));
        else if (a == "--eastasia")
            cli.prefer_east_asia = true;
        else if (a == "--quiet")
            quiet = true;
        else if (a == "--variant")
            cli.variant = std::string(need("--variant"));
        else if (a == "--packing")
            cli.packing = std::string(need("--packing"));
        else if (a == "--fixed")
            cli.providers.fixed.emplace_back(need("--fixed"));
        else if (a == "--proportional")
            cli.providers.proportional.emplace_back(need("--proportional"));
        else if (a == "--supplementary")
            cli.providers.supplementary.emplace_back(need("--supplementary"));
        else
        {
            std::cerr << "Unknown arg: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    if (output.empty())
    {
        std::cerr << "Missing required --output\n";
        PrintUsage(argv[0]);
        return 2;
    }

    AtlasConfig cfg;
    std::string err;
    if (!config_path.empty() && !LoadAtlasConfig(config_path, cfg, err))
    {
        std::cerr << "bitatlas_gen: FAIL: " << err << "\n";
        return 1;
    }

    if (!ApplyCliOverrides(cfg, cli, err))
    {
        std::cerr << err << "\n";
        return 2;
    }

    if (cfg.variant == glyph::Variant::Legacy && cfg.prefer_east_asia)
        std::cerr << "bitatlas_gen: note: --eastasia has no effect on the legacy variant\n";

    GenerateReport report;
    if (!GenerateAtlas(cfg, output, report, err))
    {
        std::cerr << "bitatlas_gen: FAIL: " << err << "\n";
        return 1;
    }

    if (report.stats.clipped > 0)
        std::cerr << "bitatlas_gen: warning: " << report.stats.clipped
                  << " glyph(s) had ink outside the cell and were clipped\n";
    if (!quiet)
        PrintSummary(output, report);
    return 0;
}
