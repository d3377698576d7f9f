#include "io/atlas_config.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace bitatlas
{
namespace
{
static bool ReadPathList(const json& j,
                         const char* key,
                         const std::string& base_dir,
                         std::vector<std::string>& out,
                         std::string& err)
{
    if (!j.contains(key))
        return true;
    const json& arr = j[key];
    if (!arr.is_array())
    {
        err = std::string("providers.") + key + " must be an array of paths";
        return false;
    }
    for (const auto& item : arr)
    {
        if (!item.is_string())
        {
            err = std::string("providers.") + key + " must be an array of paths";
            return false;
        }
        fs::path p = fs::path(item.get<std::string>());
        if (p.is_relative() && !base_dir.empty())
            p = fs::path(base_dir) / p;
        out.push_back(p.lexically_normal().string());
    }
    return true;
}

static bool ReadInt(const json& j, const char* key, int& out, std::string& err)
{
    if (!j.contains(key))
        return true;
    if (!j[key].is_number_integer())
    {
        err = std::string(key) + " must be an integer";
        return false;
    }
    out = j[key].get<int>();
    return true;
}

static bool FromJson(const json& j, const std::string& base_dir, AtlasConfig& out, std::string& err)
{
    if (!j.is_object())
    {
        err = "Expected a top-level JSON object";
        return false;
    }

    if (j.contains("schema_version"))
    {
        if (!j["schema_version"].is_number_integer() || j["schema_version"].get<int>() != 1)
        {
            err = "Unsupported schema_version (expected 1)";
            return false;
        }
    }

    if (j.contains("variant"))
    {
        if (!j["variant"].is_string() || !glyph::ParseVariant(j["variant"].get<std::string>(), out.variant))
        {
            err = "variant must be \"legacy\" or \"extended\"";
            return false;
        }
    }
    if (j.contains("packing"))
    {
        if (!j["packing"].is_string() || !ParsePacking(j["packing"].get<std::string>(), out.packing))
        {
            err = "packing must be \"alpha1\" or \"rgba8\"";
            return false;
        }
        out.packing_set = true;
    }

    if (!ReadInt(j, "cell_width", out.cell_width, err) || !ReadInt(j, "cell_height", out.cell_height, err) ||
        !ReadInt(j, "glyph_size", out.glyph_size, err) || !ReadInt(j, "baseline", out.baseline, err))
        return false;

    if (j.contains("prefer_east_asia"))
    {
        if (!j["prefer_east_asia"].is_boolean())
        {
            err = "prefer_east_asia must be a boolean";
            return false;
        }
        out.prefer_east_asia = j["prefer_east_asia"].get<bool>();
    }

    if (j.contains("providers"))
    {
        const json& p = j["providers"];
        if (!p.is_object())
        {
            err = "providers must be an object";
            return false;
        }
        if (!ReadPathList(p, "fixed", base_dir, out.providers.fixed, err) ||
            !ReadPathList(p, "proportional", base_dir, out.providers.proportional, err) ||
            !ReadPathList(p, "supplementary", base_dir, out.providers.supplementary, err))
            return false;
    }

    return ValidateAtlasConfig(out, err);
}
} // namespace

Packing AtlasConfig::EffectivePacking() const
{
    if (packing_set)
        return packing;
    return (variant == glyph::Variant::Legacy) ? Packing::Rgba8 : Packing::Alpha1;
}

AtlasOptions AtlasConfig::ToAtlasOptions() const
{
    AtlasOptions o;
    o.cell_width = cell_width;
    o.cell_height = cell_height;
    return o;
}

ProviderOptions AtlasConfig::ToProviderOptions() const
{
    ProviderOptions o;
    o.form = (variant == glyph::Variant::Legacy) ? GlyphForm::Tight : GlyphForm::CellBaked;
    o.cell_height = cell_height;
    o.baseline = baseline;
    return o;
}

glyph::ResolverOptions AtlasConfig::ToResolverOptions() const
{
    glyph::ResolverOptions o;
    o.variant = variant;
    o.prefer_east_asia = prefer_east_asia;
    o.glyph_size = glyph_size;
    return o;
}

bool ValidateAtlasConfig(const AtlasConfig& cfg, std::string& err)
{
    if (!ValidateCellSize(cfg.cell_width, cfg.cell_height, err))
        return false;
    if (cfg.glyph_size <= 0)
    {
        err = "glyph_size must be positive";
        return false;
    }
    if (cfg.baseline < 0 || cfg.baseline > cfg.cell_height)
    {
        err = "baseline must lie within the cell (0..cell_height)";
        return false;
    }
    return true;
}

bool ApplyCliOverrides(AtlasConfig& cfg, const CliOverrides& cli, std::string& err)
{
    err.clear();
    AtlasConfig next = cfg;

    if (!cli.variant.empty() && !glyph::ParseVariant(cli.variant, next.variant))
    {
        err = "Invalid --variant value (expected legacy|extended)";
        return false;
    }
    if (!cli.packing.empty())
    {
        if (!ParsePacking(cli.packing, next.packing))
        {
            err = "Invalid --packing value (expected alpha1|rgba8)";
            return false;
        }
        next.packing_set = true;
    }
    if (cli.prefer_east_asia)
        next.prefer_east_asia = true;

    auto append = [](std::vector<std::string>& dst, const std::vector<std::string>& src) {
        dst.insert(dst.end(), src.begin(), src.end());
    };
    append(next.providers.fixed, cli.providers.fixed);
    append(next.providers.proportional, cli.providers.proportional);
    append(next.providers.supplementary, cli.providers.supplementary);

    cfg = std::move(next);
    return true;
}

bool ParseAtlasConfig(const std::string& json_text,
                      const std::string& base_dir,
                      AtlasConfig& out,
                      std::string& err)
{
    err.clear();
    json j;
    try
    {
        j = json::parse(json_text);
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse config: ") + e.what();
        return false;
    }
    return FromJson(j, base_dir, out, err);
}

bool LoadAtlasConfig(const std::string& path, AtlasConfig& out, std::string& err)
{
    err.clear();
    std::ifstream f(path);
    if (!f)
    {
        err = "Failed to open config: " + path;
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();

    const std::string base_dir = fs::path(path).parent_path().string();
    if (!ParseAtlasConfig(ss.str(), base_dir, out, err))
    {
        err = path + ": " + err;
        return false;
    }
    return true;
}
} // namespace bitatlas
