#pragma once

#include <cstdint>

namespace bitatlas
{
// Unicode East_Asian_Width property (UAX #11).
enum class EastAsianWidth : std::uint8_t
{
    Neutral = 0,
    Ambiguous,
    Halfwidth,
    Fullwidth,
    Narrow,
    Wide,
};

// Backed by ICU's character property tables.
EastAsianWidth ClassifyEastAsianWidth(char32_t cp);

using EastAsianWidthFn = EastAsianWidth (*)(char32_t cp);
} // namespace bitatlas
