#include "fonts/bdf_font.h"

#include <cstddef>
#include <fstream>
#include <iterator>
#include <string_view>
#include <utility>

namespace bitatlas::bdf
{
namespace
{
static void ComputeLineRanges(const std::vector<std::uint8_t>& bytes,
                              std::vector<std::pair<size_t, size_t>>& out)
{
    out.clear();
    size_t start = 0;
    for (size_t i = 0; i <= bytes.size(); ++i)
    {
        if (i == bytes.size() || bytes[i] == '\n')
        {
            size_t end = i;
            if (end > start && bytes[end - 1] == '\r')
                --end;
            if (i < bytes.size() || end > start)
                out.emplace_back(start, end);
            start = i + 1;
        }
    }
}

static std::vector<std::string_view> SplitWords(std::string_view s)
{
    std::vector<std::string_view> parts;
    size_t i = 0;
    while (i < s.size())
    {
        while (i < s.size() && (s[i] == ' ' || s[i] == '\t'))
            ++i;
        if (i >= s.size())
            break;
        size_t j = i;
        while (j < s.size() && s[j] != ' ' && s[j] != '\t')
            ++j;
        parts.push_back(s.substr(i, j - i));
        i = j;
    }
    return parts;
}

static bool ParseInt(std::string_view s, int& out_v)
{
    out_v = 0;
    if (s.empty())
        return false;
    int sign = 1;
    size_t k = 0;
    if (s[0] == '-' || s[0] == '+')
    {
        sign = (s[0] == '-') ? -1 : 1;
        k = 1;
    }
    bool any = false;
    long long v = 0;
    for (; k < s.size(); ++k)
    {
        const char c = s[k];
        if (c < '0' || c > '9')
            return false;
        any = true;
        v = v * 10 + (c - '0');
        if (v > 0x7FFFFFFFll)
            return false;
    }
    if (!any)
        return false;
    out_v = (int)(v * sign);
    return true;
}

static int HexNibble(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

struct Parser
{
    const std::vector<std::uint8_t>& bytes;
    std::vector<std::pair<size_t, size_t>> lines;
    size_t line_idx = 0;
    std::string& err;

    std::string_view Line(size_t idx) const
    {
        const auto [s, e] = lines[idx];
        return std::string_view((const char*)bytes.data() + s, e - s);
    }

    bool Fail(const std::string& why)
    {
        err = "BDF: " + why + " (line " + std::to_string(line_idx) + ")";
        return false;
    }
};

static bool ParseProperties(Parser& p, int count, Font& out, int& pixel_size_prop)
{
    for (int n = 0; p.line_idx < p.lines.size(); ++n)
    {
        const std::string_view line = p.Line(p.line_idx++);
        const auto w = SplitWords(line);
        if (w.empty())
            continue;
        if (w[0] == "ENDPROPERTIES")
            return true;
        if (n >= count && count > 0)
            return p.Fail("more properties than declared");
        if (w.size() < 2)
            continue;

        int v = 0;
        if (w[0] == "PIXEL_SIZE" && ParseInt(w[1], v))
            pixel_size_prop = v;
        else if (w[0] == "FONT_ASCENT" && ParseInt(w[1], v))
            out.ascent = v;
        else if (w[0] == "FONT_DESCENT" && ParseInt(w[1], v))
            out.descent = v;
    }
    return p.Fail("missing ENDPROPERTIES");
}

static bool ParseBitmapRows(Parser& p, Glyph& g)
{
    const size_t row_bytes = (size_t)(g.bbx_w + 7) / 8;
    g.bits.assign((size_t)g.bbx_w * (size_t)g.bbx_h, 0);
    for (int y = 0; y < g.bbx_h; ++y)
    {
        if (p.line_idx >= p.lines.size())
            return p.Fail("truncated BITMAP");
        const auto w = SplitWords(p.Line(p.line_idx++));
        if (w.empty() || w[0] == "ENDCHAR")
            return p.Fail("BITMAP has fewer rows than BBX height");
        const std::string_view hex = w[0];
        if (hex.size() < row_bytes * 2)
            return p.Fail("BITMAP row too short");

        for (size_t b = 0; b < row_bytes; ++b)
        {
            const int hi = HexNibble(hex[b * 2 + 0]);
            const int lo = HexNibble(hex[b * 2 + 1]);
            if (hi < 0 || lo < 0)
                return p.Fail("invalid hex digit in BITMAP");
            const int byte = (hi << 4) | lo;
            for (int bit = 0; bit < 8; ++bit)
            {
                const int x = (int)b * 8 + bit;
                if (x >= g.bbx_w)
                    break;
                if (byte & (0x80 >> bit))
                    g.bits[(size_t)y * (size_t)g.bbx_w + (size_t)x] = 1;
            }
        }
    }
    return true;
}

static bool ParseChar(Parser& p, const int font_bbx[4], Font& out)
{
    Glyph g;
    g.bbx_w = font_bbx[0];
    g.bbx_h = font_bbx[1];
    g.bbx_x = font_bbx[2];
    g.bbx_y = font_bbx[3];
    int encoding = -1;
    bool have_encoding = false;
    bool have_bitmap = false;

    while (p.line_idx < p.lines.size())
    {
        const auto w = SplitWords(p.Line(p.line_idx++));
        if (w.empty())
            continue;

        if (w[0] == "ENCODING")
        {
            if (w.size() < 2 || !ParseInt(w[1], encoding))
                return p.Fail("invalid ENCODING");
            have_encoding = true;
        }
        else if (w[0] == "DWIDTH")
        {
            if (w.size() < 2 || !ParseInt(w[1], g.dwidth))
                return p.Fail("invalid DWIDTH");
        }
        else if (w[0] == "BBX")
        {
            if (w.size() < 5 || !ParseInt(w[1], g.bbx_w) || !ParseInt(w[2], g.bbx_h) ||
                !ParseInt(w[3], g.bbx_x) || !ParseInt(w[4], g.bbx_y))
                return p.Fail("invalid BBX");
            if (g.bbx_w < 0 || g.bbx_h < 0)
                return p.Fail("negative BBX size");
        }
        else if (w[0] == "BITMAP")
        {
            if (!ParseBitmapRows(p, g))
                return false;
            have_bitmap = true;
        }
        else if (w[0] == "ENDCHAR")
        {
            if (!have_encoding)
                return p.Fail("glyph without ENCODING");
            if (!have_bitmap)
                g.bits.assign((size_t)g.bbx_w * (size_t)g.bbx_h, 0);
            if (encoding < 0 || encoding > 0x10FFFF)
                return true; // unencoded glyph
            if (g.dwidth == 0)
                g.dwidth = g.bbx_x + g.bbx_w;
            out.glyphs[(char32_t)encoding] = std::move(g);
            return true;
        }
    }
    return p.Fail("missing ENDCHAR");
}
} // namespace

bool LoadFontFromBytes(const std::vector<std::uint8_t>& bytes, Font& out, std::string& err)
{
    err.clear();
    out = Font{};

    Parser p{bytes, {}, 0, err};
    ComputeLineRanges(bytes, p.lines);

    while (p.line_idx < p.lines.size() && SplitWords(p.Line(p.line_idx)).empty())
        ++p.line_idx;
    if (p.line_idx >= p.lines.size())
        return p.Fail("empty input");
    {
        const auto w = SplitWords(p.Line(p.line_idx++));
        if (w[0] != "STARTFONT")
            return p.Fail("not a BDF file (missing STARTFONT)");
    }

    int font_bbx[4] = {0, 0, 0, 0};
    int point_size = 0;
    int pixel_size_prop = 0;
    bool ended = false;

    while (p.line_idx < p.lines.size())
    {
        const std::string_view line = p.Line(p.line_idx++);
        const auto w = SplitWords(line);
        if (w.empty() || w[0] == "COMMENT")
            continue;

        if (w[0] == "FONT")
        {
            const size_t at = line.find("FONT") + 4;
            std::string_view rest = line.substr(at);
            while (!rest.empty() && (rest.front() == ' ' || rest.front() == '\t'))
                rest.remove_prefix(1);
            out.name = std::string(rest);
        }
        else if (w[0] == "SIZE")
        {
            if (w.size() < 2 || !ParseInt(w[1], point_size))
                return p.Fail("invalid SIZE");
        }
        else if (w[0] == "FONTBOUNDINGBOX")
        {
            if (w.size() < 5 || !ParseInt(w[1], font_bbx[0]) || !ParseInt(w[2], font_bbx[1]) ||
                !ParseInt(w[3], font_bbx[2]) || !ParseInt(w[4], font_bbx[3]))
                return p.Fail("invalid FONTBOUNDINGBOX");
        }
        else if (w[0] == "STARTPROPERTIES")
        {
            int count = 0;
            if (w.size() >= 2 && (!ParseInt(w[1], count) || count < 0))
                return p.Fail("invalid STARTPROPERTIES");
            if (!ParseProperties(p, count, out, pixel_size_prop))
                return false;
        }
        else if (w[0] == "STARTCHAR")
        {
            if (!ParseChar(p, font_bbx, out))
                return false;
        }
        else if (w[0] == "ENDFONT")
        {
            ended = true;
            break;
        }
    }

    if (!ended)
        return p.Fail("missing ENDFONT");

    out.pixel_size = (pixel_size_prop > 0) ? pixel_size_prop : point_size;
    if (out.pixel_size <= 0)
        return p.Fail("font has neither PIXEL_SIZE nor SIZE");
    if (out.ascent == 0 && out.descent == 0)
    {
        // No FONT_ASCENT/FONT_DESCENT: derive from the font bounding box.
        out.ascent = font_bbx[1] + font_bbx[3];
        out.descent = -font_bbx[3];
    }
    return true;
}

bool LoadFontFromFile(const std::string& path, Font& out, std::string& err)
{
    err.clear();
    std::ifstream f(path, std::ios::binary);
    if (!f)
    {
        err = "Failed to open: " + path;
        return false;
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad())
    {
        err = "Failed to read: " + path;
        return false;
    }

    if (!LoadFontFromBytes(bytes, out, err))
    {
        err = path + ": " + err;
        return false;
    }
    return true;
}
} // namespace bitatlas::bdf
