#include "io/atlas_packer.h"

namespace bitatlas
{
namespace
{
// Canvas pixels are white with coverage `a`; premultiplied, every channel equals `a`.
// Widen to 16 bits the way 8-bit samples are expanded (a * 0x101).
static inline std::uint16_t PremultipliedSample16(std::uint8_t a)
{
    return (std::uint16_t)((std::uint16_t)a * 0x101u);
}

static bool CheckCanvas(const AtlasCanvas& canvas, std::string& err)
{
    if (canvas.width <= 0 || canvas.height <= 0)
    {
        err = "Invalid canvas dimensions.";
        return false;
    }
    if (canvas.alpha.size() != (size_t)canvas.width * (size_t)canvas.height)
    {
        err = "Canvas buffer size does not match its dimensions.";
        return false;
    }
    return true;
}
} // namespace

const char* PackingName(Packing p)
{
    switch (p)
    {
    case Packing::Alpha1: return "alpha1";
    case Packing::Rgba8:  return "rgba8";
    }
    return "?";
}

bool ParsePacking(std::string_view s, Packing& out)
{
    if (s == "alpha1")
    {
        out = Packing::Alpha1;
        return true;
    }
    if (s == "rgba8")
    {
        out = Packing::Rgba8;
        return true;
    }
    return false;
}

std::size_t PackedSize(Packing p, int width, int height)
{
    const std::size_t pixels = (std::size_t)width * (std::size_t)height;
    switch (p)
    {
    case Packing::Alpha1: return pixels / 8u;
    case Packing::Rgba8:  return pixels * 4u;
    }
    return 0;
}

bool PackAlpha1(const AtlasCanvas& canvas, std::vector<std::uint8_t>& out, std::string& err)
{
    err.clear();
    out.clear();
    if (!CheckCanvas(canvas, err))
        return false;
    if (canvas.width % 8 != 0 || canvas.height % 8 != 0)
    {
        err = "1-bit packing needs width and height divisible by 8 (got " + std::to_string(canvas.width) + "x" +
              std::to_string(canvas.height) + ").";
        return false;
    }

    out.assign(PackedSize(Packing::Alpha1, canvas.width, canvas.height), 0);
    const size_t n = canvas.alpha.size();
    for (size_t idx = 0; idx < n; ++idx)
    {
        if (canvas.alpha[idx] != 0)
            out[idx / 8] |= (std::uint8_t)(1u << (7 - idx % 8));
    }
    return true;
}

bool PackRgba8(const AtlasCanvas& canvas, std::vector<std::uint8_t>& out, std::string& err)
{
    err.clear();
    out.clear();
    if (!CheckCanvas(canvas, err))
        return false;

    out.resize(PackedSize(Packing::Rgba8, canvas.width, canvas.height));
    const size_t n = canvas.alpha.size();
    for (size_t idx = 0; idx < n; ++idx)
    {
        const std::uint8_t c = (std::uint8_t)(PremultipliedSample16(canvas.alpha[idx]) >> 8);
        std::uint8_t* px = out.data() + idx * 4u;
        px[0] = c;
        px[1] = c;
        px[2] = c;
        px[3] = c;
    }
    return true;
}

bool PackCanvas(Packing p, const AtlasCanvas& canvas, std::vector<std::uint8_t>& out, std::string& err)
{
    switch (p)
    {
    case Packing::Alpha1: return PackAlpha1(canvas, out, err);
    case Packing::Rgba8:  return PackRgba8(canvas, out, err);
    }
    err = "Unknown packing.";
    return false;
}

bool UnpackAlpha1(const std::vector<std::uint8_t>& bytes,
                  int width,
                  int height,
                  std::vector<std::uint8_t>& out_mask,
                  std::string& err)
{
    err.clear();
    out_mask.clear();
    if (width <= 0 || height <= 0 || width % 8 != 0 || height % 8 != 0)
    {
        err = "Invalid 1-bit atlas dimensions.";
        return false;
    }
    const size_t expected = PackedSize(Packing::Alpha1, width, height);
    if (bytes.size() != expected)
    {
        err = "Payload is " + std::to_string(bytes.size()) + " bytes, expected " + std::to_string(expected) + ".";
        return false;
    }

    const size_t n = (size_t)width * (size_t)height;
    out_mask.resize(n);
    for (size_t idx = 0; idx < n; ++idx)
        out_mask[idx] = (bytes[idx / 8] >> (7 - idx % 8)) & 1u;
    return true;
}

bool UnpackRgba8(const std::vector<std::uint8_t>& bytes,
                 int width,
                 int height,
                 std::vector<std::uint8_t>& out_mask,
                 std::string& err)
{
    err.clear();
    out_mask.clear();
    if (width <= 0 || height <= 0)
    {
        err = "Invalid RGBA atlas dimensions.";
        return false;
    }
    const size_t expected = PackedSize(Packing::Rgba8, width, height);
    if (bytes.size() != expected)
    {
        err = "Payload is " + std::to_string(bytes.size()) + " bytes, expected " + std::to_string(expected) + ".";
        return false;
    }

    const size_t n = (size_t)width * (size_t)height;
    out_mask.resize(n);
    for (size_t idx = 0; idx < n; ++idx)
        out_mask[idx] = bytes[idx * 4u + 3u] != 0 ? 1 : 0;
    return true;
}
} // namespace bitatlas
