#include "core/east_asian_width.h"

#include <unicode/uchar.h>

namespace bitatlas
{
EastAsianWidth ClassifyEastAsianWidth(char32_t cp)
{
    const int32_t v = u_getIntPropertyValue(static_cast<UChar32>(cp), UCHAR_EAST_ASIAN_WIDTH);
    switch (v)
    {
    case U_EA_AMBIGUOUS: return EastAsianWidth::Ambiguous;
    case U_EA_HALFWIDTH: return EastAsianWidth::Halfwidth;
    case U_EA_FULLWIDTH: return EastAsianWidth::Fullwidth;
    case U_EA_NARROW:    return EastAsianWidth::Narrow;
    case U_EA_WIDE:      return EastAsianWidth::Wide;
    default:             return EastAsianWidth::Neutral;
    }
}
} // namespace bitatlas
