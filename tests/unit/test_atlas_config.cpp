#include <gtest/gtest.h>

#include "io/atlas_config.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace bitatlas;
namespace fs = std::filesystem;

TEST(AtlasConfig, DefaultsDescribeExtendedAtlas)
{
    AtlasConfig cfg;
    std::string err;
    ASSERT_TRUE(ParseAtlasConfig("{}", "", cfg, err)) << err;
    EXPECT_EQ(cfg.variant, glyph::Variant::Extended);
    EXPECT_EQ(cfg.EffectivePacking(), Packing::Alpha1);
    EXPECT_EQ(cfg.cell_width, 12);
    EXPECT_EQ(cfg.cell_height, 16);
    EXPECT_EQ(cfg.glyph_size, 12);
    EXPECT_EQ(cfg.baseline, 12);
    EXPECT_FALSE(cfg.prefer_east_asia);
    EXPECT_TRUE(cfg.providers.fixed.empty());

    const ProviderOptions po = cfg.ToProviderOptions();
    EXPECT_EQ(po.form, GlyphForm::CellBaked);
    EXPECT_EQ(po.baseline, 12);
}

TEST(AtlasConfig, LegacyDefaultsToRgbaAndTightGlyphs)
{
    AtlasConfig cfg;
    std::string err;
    ASSERT_TRUE(ParseAtlasConfig(R"({"variant": "legacy"})", "", cfg, err)) << err;
    EXPECT_EQ(cfg.EffectivePacking(), Packing::Rgba8);
    EXPECT_EQ(cfg.ToProviderOptions().form, GlyphForm::Tight);
    EXPECT_EQ(cfg.ToResolverOptions().variant, glyph::Variant::Legacy);

    // An explicit packing wins over the variant default.
    AtlasConfig explicit_cfg;
    ASSERT_TRUE(ParseAtlasConfig(R"({"variant": "legacy", "packing": "alpha1"})", "", explicit_cfg, err)) << err;
    EXPECT_EQ(explicit_cfg.EffectivePacking(), Packing::Alpha1);
}

TEST(AtlasConfig, ReadsAllFields)
{
    const std::string text = R"({
        "schema_version": 1,
        "variant": "extended",
        "packing": "rgba8",
        "cell_width": 16,
        "cell_height": 24,
        "glyph_size": 16,
        "baseline": 19,
        "prefer_east_asia": true,
        "providers": {
            "fixed": ["fonts/fixed.bdf", "/abs/more.bdf"],
            "proportional": ["fonts/mplus.bdf"],
            "supplementary": ["../baekmuk.bdf"]
        }
    })";

    AtlasConfig cfg;
    std::string err;
    ASSERT_TRUE(ParseAtlasConfig(text, "/etc/bitatlas", cfg, err)) << err;
    EXPECT_EQ(cfg.EffectivePacking(), Packing::Rgba8);
    EXPECT_EQ(cfg.cell_width, 16);
    EXPECT_EQ(cfg.cell_height, 24);
    EXPECT_EQ(cfg.glyph_size, 16);
    EXPECT_EQ(cfg.baseline, 19);
    EXPECT_TRUE(cfg.prefer_east_asia);

    ASSERT_EQ(cfg.providers.fixed.size(), 2u);
    EXPECT_EQ(cfg.providers.fixed[0], fs::path("/etc/bitatlas/fonts/fixed.bdf").lexically_normal().string());
    EXPECT_EQ(cfg.providers.fixed[1], fs::path("/abs/more.bdf").lexically_normal().string());
    ASSERT_EQ(cfg.providers.supplementary.size(), 1u);
    EXPECT_EQ(cfg.providers.supplementary[0], fs::path("/etc/baekmuk.bdf").lexically_normal().string());

    const AtlasOptions ao = cfg.ToAtlasOptions();
    EXPECT_EQ(ao.cell_width, 16);
    EXPECT_EQ(ao.cell_height, 24);
    const glyph::ResolverOptions ro = cfg.ToResolverOptions();
    EXPECT_TRUE(ro.prefer_east_asia);
    EXPECT_EQ(ro.glyph_size, 16);
}

TEST(AtlasConfig, RejectsBadValues)
{
    struct Case
    {
        const char* json;
        const char* expect;
    };
    const Case cases[] = {
        {R"({"variant": "modern"})", "variant"},
        {R"({"packing": "rgb565"})", "packing"},
        {R"({"schema_version": 2})", "schema_version"},
        {R"({"cell_width": 0})", "positive"},
        {R"({"cell_width": 10000000})", "at most 64"},
        {R"({"cell_height": 65})", "at most 64"},
        {R"({"cell_height": "16"})", "cell_height must be an integer"},
        {R"({"baseline": 17})", "baseline"},
        {R"({"prefer_east_asia": 1})", "prefer_east_asia"},
        {R"({"providers": {"fixed": "a.bdf"}})", "providers.fixed"},
        {R"([1, 2])", "top-level"},
        {R"({"variant": )", "Failed to parse config"},
    };

    for (const Case& c : cases)
    {
        AtlasConfig cfg;
        std::string err;
        EXPECT_FALSE(ParseAtlasConfig(c.json, "", cfg, err)) << c.json;
        EXPECT_NE(err.find(c.expect), std::string::npos) << c.json << " -> " << err;
    }
}

TEST(AtlasConfig, LoadResolvesPathsAgainstConfigDirectory)
{
    const fs::path dir = fs::temp_directory_path() / "bitatlas_config_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const fs::path path = dir / "atlas.json";
    {
        std::ofstream out(path);
        out << R"({"providers": {"proportional": ["mplus_f12r.bdf"]}})";
    }

    AtlasConfig cfg;
    std::string err;
    ASSERT_TRUE(LoadAtlasConfig(path.string(), cfg, err)) << err;
    ASSERT_EQ(cfg.providers.proportional.size(), 1u);
    EXPECT_EQ(cfg.providers.proportional[0], (dir / "mplus_f12r.bdf").lexically_normal().string());

    EXPECT_FALSE(LoadAtlasConfig((dir / "missing.json").string(), cfg, err));
    EXPECT_NE(err.find("missing.json"), std::string::npos) << err;

    fs::remove_all(dir);
}

TEST(AtlasConfig, LoadPrefixesParseErrorsWithPath)
{
    const fs::path dir = fs::temp_directory_path() / "bitatlas_config_bad";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const fs::path path = dir / "bad.json";
    {
        std::ofstream out(path);
        out << R"({"variant": "modern"})";
    }

    AtlasConfig cfg;
    std::string err;
    EXPECT_FALSE(LoadAtlasConfig(path.string(), cfg, err));
    EXPECT_EQ(err.rfind(path.string(), 0), 0u) << err;
    EXPECT_NE(err.find("variant"), std::string::npos) << err;

    fs::remove_all(dir);
}

TEST(AtlasConfig, CliOverridesWinOverFileValues)
{
    AtlasConfig cfg;
    std::string err;
    ASSERT_TRUE(ParseAtlasConfig(R"({"variant": "extended", "packing": "alpha1"})", "", cfg, err)) << err;

    CliOverrides cli;
    cli.variant = "legacy";
    cli.packing = "rgba8";
    cli.prefer_east_asia = true;
    ASSERT_TRUE(ApplyCliOverrides(cfg, cli, err)) << err;
    EXPECT_EQ(cfg.variant, glyph::Variant::Legacy);
    EXPECT_TRUE(cfg.packing_set);
    EXPECT_EQ(cfg.EffectivePacking(), Packing::Rgba8);
    EXPECT_TRUE(cfg.prefer_east_asia);
}

TEST(AtlasConfig, EmptyCliOverridesKeepFileValues)
{
    AtlasConfig cfg;
    std::string err;
    ASSERT_TRUE(ParseAtlasConfig(R"({"variant": "legacy", "prefer_east_asia": true})", "", cfg, err)) << err;

    ASSERT_TRUE(ApplyCliOverrides(cfg, CliOverrides{}, err)) << err;
    EXPECT_EQ(cfg.variant, glyph::Variant::Legacy);
    EXPECT_FALSE(cfg.packing_set);
    EXPECT_EQ(cfg.EffectivePacking(), Packing::Rgba8);
    // A flag that is not given does not clear the file's setting.
    EXPECT_TRUE(cfg.prefer_east_asia);
}

TEST(AtlasConfig, CliProvidersAppendAfterFileLists)
{
    AtlasConfig cfg;
    std::string err;
    ASSERT_TRUE(ParseAtlasConfig(R"({"providers": {"fixed": ["/fonts/a.bdf"], "supplementary": ["/fonts/s.bdf"]}})",
                                 "", cfg, err))
        << err;

    CliOverrides cli;
    cli.providers.fixed = {"/cli/b.bdf", "/cli/c.bdf"};
    cli.providers.proportional = {"/cli/p.bdf"};
    ASSERT_TRUE(ApplyCliOverrides(cfg, cli, err)) << err;

    const std::vector<std::string> fixed = {"/fonts/a.bdf", "/cli/b.bdf", "/cli/c.bdf"};
    EXPECT_EQ(cfg.providers.fixed, fixed);
    EXPECT_EQ(cfg.providers.proportional, std::vector<std::string>{"/cli/p.bdf"});
    EXPECT_EQ(cfg.providers.supplementary, std::vector<std::string>{"/fonts/s.bdf"});
}

TEST(AtlasConfig, BadCliOverrideLeavesConfigUnchanged)
{
    AtlasConfig cfg;
    std::string err;

    CliOverrides cli;
    cli.variant = "legacy";
    cli.packing = "rgb565";
    cli.providers.fixed = {"/cli/b.bdf"};
    EXPECT_FALSE(ApplyCliOverrides(cfg, cli, err));
    EXPECT_NE(err.find("--packing"), std::string::npos) << err;
    EXPECT_EQ(cfg.variant, glyph::Variant::Extended);
    EXPECT_TRUE(cfg.providers.fixed.empty());

    cli.packing.clear();
    cli.variant = "modern";
    EXPECT_FALSE(ApplyCliOverrides(cfg, cli, err));
    EXPECT_NE(err.find("--variant"), std::string::npos) << err;
}
