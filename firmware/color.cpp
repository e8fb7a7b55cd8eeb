/*
 * Color representations used between patterns and drivers.
 */

#include "color.h"

#include <math.h>

namespace shimmer {

Rgb hsvToRgb(const Hsv& hsv)
{
    float h = hsv.h - floorf(hsv.h);
    float s = clamp01(hsv.s);
    float v = clamp01(hsv.v);

    // Six sectors around the color wheel.
    float scaled = h * 6.0f;
    int sector = int(scaled);
    if (sector > 5) sector = 5;
    float f = scaled - float(sector);

    float p = v * (1.0f - s);
    float q = v * (1.0f - s * f);
    float t = v * (1.0f - s * (1.0f - f));

    switch (sector) {
        case 0: return Rgb{ v, t, p };
        case 1: return Rgb{ q, v, p };
        case 2: return Rgb{ p, v, t };
        case 3: return Rgb{ p, q, v };
        case 4: return Rgb{ t, p, v };
        default: return Rgb{ v, p, q };
    }
}

} // namespace shimmer
