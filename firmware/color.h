/*
 * Color representations used between patterns and drivers.
 */

#pragma once

#include <stdint.h>

namespace shimmer {

// Working color produced by patterns. Channels are linear, nominally in [0, 1].
struct Rgb {
    float r, g, b;
};

// Output color after correction, one byte per channel.
struct Rgb8 {
    uint8_t r, g, b;
};

// Hue, saturation and value, all in [0, 1]. Hue wraps around.
struct Hsv {
    float h, s, v;
};

Rgb hsvToRgb(const Hsv& hsv);

// NaN maps to zero.
inline float clamp01(float x) {
    return !(x > 0.0f) ? 0.0f : x > 1.0f ? 1.0f : x;
}

inline Rgb lerp(const Rgb& a, const Rgb& b, float t) {
    return Rgb{ a.r + (b.r - a.r) * t, a.g + (b.g - a.g) * t, a.b + (b.b - a.b) * t };
}

} // namespace shimmer
