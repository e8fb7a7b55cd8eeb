/*
 * Fixed-size coordinate vectors for 1D, 2D and 3D layouts.
 */

#pragma once

#include <stddef.h>
#include <math.h>

namespace shimmer {

constexpr float twoPi = 6.28318530717958647692f;

// A point in a layout's coordinate space, nominally within [-1, 1] per axis.
template <size_t N>
struct Vec {
    static_assert(N >= 1 && N <= 3, "layouts are 1D, 2D or 3D");
    static constexpr size_t dimensions = N;

    float v[N];

    constexpr float operator[](size_t i) const { return v[i]; }
    float& operator[](size_t i) { return v[i]; }

    constexpr float x() const { return v[0]; }
    constexpr float y() const { static_assert(N >= 2, "no y axis"); return v[1]; }
    constexpr float z() const { static_assert(N >= 3, "no z axis"); return v[2]; }
};

using Vec1 = Vec<1>;
using Vec2 = Vec<2>;
using Vec3 = Vec<3>;

constexpr Vec1 vec(float x) { return Vec1{{ x }}; }
constexpr Vec2 vec(float x, float y) { return Vec2{{ x, y }}; }
constexpr Vec3 vec(float x, float y, float z) { return Vec3{{ x, y, z }}; }

template <size_t N>
constexpr Vec<N> operator+(const Vec<N>& a, const Vec<N>& b) {
    Vec<N> out{};
    for (size_t i = 0; i < N; ++i) out.v[i] = a.v[i] + b.v[i];
    return out;
}

template <size_t N>
constexpr Vec<N> operator-(const Vec<N>& a, const Vec<N>& b) {
    Vec<N> out{};
    for (size_t i = 0; i < N; ++i) out.v[i] = a.v[i] - b.v[i];
    return out;
}

template <size_t N>
constexpr Vec<N> operator*(const Vec<N>& a, float s) {
    Vec<N> out{};
    for (size_t i = 0; i < N; ++i) out.v[i] = a.v[i] * s;
    return out;
}

template <size_t N>
constexpr bool operator==(const Vec<N>& a, const Vec<N>& b) {
    for (size_t i = 0; i < N; ++i) {
        if (a.v[i] != b.v[i]) return false;
    }
    return true;
}

template <size_t N>
constexpr float dot(const Vec<N>& a, const Vec<N>& b) {
    float sum = 0;
    for (size_t i = 0; i < N; ++i) sum += a.v[i] * b.v[i];
    return sum;
}

template <size_t N>
inline float distance(const Vec<N>& a, const Vec<N>& b) {
    Vec<N> d = a - b;
    return sqrtf(dot(d, d));
}

// Point at fraction |t| of the way from |a| to |b|.
template <size_t N>
constexpr Vec<N> lerp(const Vec<N>& a, const Vec<N>& b, float t) {
    return a + (b - a) * t;
}

} // namespace shimmer
