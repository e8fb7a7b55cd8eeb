/*
 * Coherent gradient noise in two, three and four dimensions.
 */

#include "noise.h"

#include <math.h>

namespace shimmer {
namespace noise {
namespace {

// Ken Perlin's reference permutation.
constexpr uint8_t referencePermutation[256] = {
    151,160,137,91,90,15,131,13,201,95,96,53,194,233,7,225,140,36,103,30,69,142,
    8,99,37,240,21,10,23,190,6,148,247,120,234,75,0,26,197,62,94,252,219,203,117,
    35,11,32,57,177,33,88,237,149,56,87,174,20,125,136,171,168,68,175,74,165,71,
    134,139,48,27,166,77,146,158,231,83,111,229,122,60,211,133,230,220,105,92,41,
    55,46,245,40,244,102,143,54,65,25,63,161,1,216,80,73,209,76,132,187,208,89,
    18,169,200,196,135,130,116,188,159,86,164,100,109,198,173,186,3,64,52,217,226,
    250,124,123,5,202,38,147,118,126,255,82,85,212,207,206,59,227,47,16,58,17,182,
    189,28,42,223,183,170,213,119,248,152,2,44,154,163,70,221,153,101,155,167,43,
    172,9,129,22,39,253,19,98,108,110,79,113,224,232,178,185,112,104,218,246,97,
    228,251,34,242,193,238,210,144,12,191,179,162,241,81,51,145,235,249,14,239,
    107,49,192,214,31,181,199,106,157,184,84,204,176,115,121,50,45,127,4,150,254,
    138,236,205,93,222,114,67,29,24,72,243,141,128,195,78,66,215,61,156,180,
};

// Edge midpoints of a cube, shared by the 3D simplex and OpenSimplex gradients.
constexpr float grad3[12][3] = {
    {1,1,0}, {-1,1,0}, {1,-1,0}, {-1,-1,0},
    {1,0,1}, {-1,0,1}, {1,0,-1}, {-1,0,-1},
    {0,1,1}, {0,-1,1}, {0,1,-1}, {0,-1,-1},
};

// Edge midpoints of a tesseract.
constexpr float grad4[32][4] = {
    {0,1,1,1}, {0,1,1,-1}, {0,1,-1,1}, {0,1,-1,-1},
    {0,-1,1,1}, {0,-1,1,-1}, {0,-1,-1,1}, {0,-1,-1,-1},
    {1,0,1,1}, {1,0,1,-1}, {1,0,-1,1}, {1,0,-1,-1},
    {-1,0,1,1}, {-1,0,1,-1}, {-1,0,-1,1}, {-1,0,-1,-1},
    {1,1,0,1}, {1,1,0,-1}, {1,-1,0,1}, {1,-1,0,-1},
    {-1,1,0,1}, {-1,1,0,-1}, {-1,-1,0,1}, {-1,-1,0,-1},
    {1,1,1,0}, {1,1,-1,0}, {1,-1,1,0}, {1,-1,-1,0},
    {-1,1,1,0}, {-1,1,-1,0}, {-1,-1,1,0}, {-1,-1,-1,0},
};

// Unit directions every 45 degrees for 2D OpenSimplex.
constexpr float grad2[8][2] = {
    {1.0f, 0.0f}, {0.70710678f, 0.70710678f}, {0.0f, 1.0f}, {-0.70710678f, 0.70710678f},
    {-1.0f, 0.0f}, {-0.70710678f, -0.70710678f}, {0.0f, -1.0f}, {0.70710678f, -0.70710678f},
};

inline float clampUnit(float x) {
    return x < -1.0f ? -1.0f : x > 1.0f ? 1.0f : x;
}

inline int fastFloor(double x) {
    int i = int(x);
    return x < double(i) ? i - 1 : i;
}

inline float fade(float t) { return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f); }

inline float lerp(float t, float a, float b) { return a + t * (b - a); }

inline float perlinGrad(int hash, float x, float y, float z) {
    int h = hash & 15;
    float u = h < 8 ? x : y;
    float v = h < 4 ? y : (h == 12 || h == 14 ? x : z);
    return ((h & 1) ? -u : u) + ((h & 2) ? -v : v);
}

inline float perlinGrad(int hash, float x, float y, float z, float w) {
    int h = hash & 31;
    float a = y, b = z, c = w;
    switch (h >> 3) {
        case 1: a = w; b = x; c = y; break;
        case 2: a = z; b = w; c = x; break;
        case 3: a = y; b = z; c = w; break;
    }
    return ((h & 4) ? a : -a) + ((h & 2) ? b : -b) + ((h & 1) ? c : -c);
}

// Falloff kernel shared by the simplex family.
inline float corner(float radiusSquared, float distanceSquared, float gradientDot) {
    float t = radiusSquared - distanceSquared;
    if (t <= 0.0f) return 0.0f;
    t *= t;
    return t * t * gradientDot;
}

uint32_t xorshift32(uint32_t& state) {
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    return state;
}

} // namespace

Permutation::Permutation(uint32_t seed)
{
    uint8_t table[256];
    for (int i = 0; i < 256; ++i) table[i] = referencePermutation[i];

    if (seed != 0) {
        uint32_t state = seed;
        for (int i = 255; i > 0; --i) {
            int j = int(xorshift32(state) % uint32_t(i + 1));
            uint8_t tmp = table[i];
            table[i] = table[j];
            table[j] = tmp;
        }
    }

    for (int i = 0; i < 512; ++i) p_[i] = table[i & 255];
}

/*** Perlin ***/

float Perlin::get(double x, double y) const
{
    // The z = 0 slice of 3D noise.
    return get(x, y, 0.0);
}

float Perlin::get(double px, double py, double pz) const
{
    // Split in double so large coordinates keep their fractional part.
    int X = fastFloor(px), Y = fastFloor(py), Z = fastFloor(pz);
    float x = float(px - X), y = float(py - Y), z = float(pz - Z);
    X &= 255;
    Y &= 255;
    Z &= 255;

    float u = fade(x), v = fade(y), w = fade(z);
    const Permutation& p = perm_;
    int A = p[X] + Y, AA = p[A] + Z, AB = p[A + 1] + Z;
    int B = p[X + 1] + Y, BA = p[B] + Z, BB = p[B + 1] + Z;

    return clampUnit(lerp(w,
            lerp(v, lerp(u, perlinGrad(p[AA], x, y, z), perlinGrad(p[BA], x - 1, y, z)),
                    lerp(u, perlinGrad(p[AB], x, y - 1, z), perlinGrad(p[BB], x - 1, y - 1, z))),
            lerp(v, lerp(u, perlinGrad(p[AA + 1], x, y, z - 1), perlinGrad(p[BA + 1], x - 1, y, z - 1)),
                    lerp(u, perlinGrad(p[AB + 1], x, y - 1, z - 1), perlinGrad(p[BB + 1], x - 1, y - 1, z - 1)))));
}

float Perlin::get(double px, double py, double pz, double pw) const
{
    int X = fastFloor(px), Y = fastFloor(py), Z = fastFloor(pz), W = fastFloor(pw);
    float x = float(px - X), y = float(py - Y), z = float(pz - Z), w = float(pw - W);
    X &= 255;
    Y &= 255;
    Z &= 255;
    W &= 255;

    float fx = fade(x), fy = fade(y), fz = fade(z), fw = fade(w);
    const Permutation& p = perm_;
    int A = p[X] + Y, AA = p[A] + Z, AB = p[A + 1] + Z;
    int B = p[X + 1] + Y, BA = p[B] + Z, BB = p[B + 1] + Z;
    int AAA = p[AA] + W, AAB = p[AA + 1] + W, ABA = p[AB] + W, ABB = p[AB + 1] + W;
    int BAA = p[BA] + W, BAB = p[BA + 1] + W, BBA = p[BB] + W, BBB = p[BB + 1] + W;

    float w0 = lerp(fz,
            lerp(fy, lerp(fx, perlinGrad(p[AAA], x, y, z, w), perlinGrad(p[BAA], x - 1, y, z, w)),
                    lerp(fx, perlinGrad(p[ABA], x, y - 1, z, w), perlinGrad(p[BBA], x - 1, y - 1, z, w))),
            lerp(fy, lerp(fx, perlinGrad(p[AAB], x, y, z - 1, w), perlinGrad(p[BAB], x - 1, y, z - 1, w)),
                    lerp(fx, perlinGrad(p[ABB], x, y - 1, z - 1, w), perlinGrad(p[BBB], x - 1, y - 1, z - 1, w))));
    float w1 = lerp(fz,
            lerp(fy, lerp(fx, perlinGrad(p[AAA + 1], x, y, z, w - 1), perlinGrad(p[BAA + 1], x - 1, y, z, w - 1)),
                    lerp(fx, perlinGrad(p[ABA + 1], x, y - 1, z, w - 1), perlinGrad(p[BBA + 1], x - 1, y - 1, z, w - 1))),
            lerp(fy, lerp(fx, perlinGrad(p[AAB + 1], x, y, z - 1, w - 1), perlinGrad(p[BAB + 1], x - 1, y, z - 1, w - 1)),
                    lerp(fx, perlinGrad(p[ABB + 1], x, y - 1, z - 1, w - 1), perlinGrad(p[BBB + 1], x - 1, y - 1, z - 1, w - 1))));
    return clampUnit(lerp(fw, w0, w1));
}

/*** Simplex ***/

float Simplex::get(double x, double y) const
{
    const double F2 = 0.36602540378;  // (sqrt(3) - 1) / 2
    const float G2 = 0.21132486540f;  // (3 - sqrt(3)) / 6

    double s = (x + y) * F2;
    int i = fastFloor(x + s), j = fastFloor(y + s);
    double t = double(i + j) * G2;
    float x0 = float(x - (i - t)), y0 = float(y - (j - t));

    int i1 = x0 > y0 ? 1 : 0;
    int j1 = x0 > y0 ? 0 : 1;

    float x1 = x0 - float(i1) + G2, y1 = y0 - float(j1) + G2;
    float x2 = x0 - 1.0f + 2.0f * G2, y2 = y0 - 1.0f + 2.0f * G2;

    int ii = i & 255, jj = j & 255;
    const Permutation& p = perm_;
    int gi0 = p[ii + p[jj]] % 12;
    int gi1 = p[ii + i1 + p[jj + j1]] % 12;
    int gi2 = p[ii + 1 + p[jj + 1]] % 12;

    float n = corner(0.5f, x0 * x0 + y0 * y0, grad3[gi0][0] * x0 + grad3[gi0][1] * y0) +
            corner(0.5f, x1 * x1 + y1 * y1, grad3[gi1][0] * x1 + grad3[gi1][1] * y1) +
            corner(0.5f, x2 * x2 + y2 * y2, grad3[gi2][0] * x2 + grad3[gi2][1] * y2);
    return clampUnit(70.0f * n);
}

float Simplex::get(double x, double y, double z) const
{
    const double F3 = 1.0 / 3.0;
    const float G3 = 1.0f / 6.0f;

    double s = (x + y + z) * F3;
    int i = fastFloor(x + s), j = fastFloor(y + s), k = fastFloor(z + s);
    double t = double(i + j + k) / 6.0;
    float x0 = float(x - (i - t)), y0 = float(y - (j - t)), z0 = float(z - (k - t));

    // Which of the six simplices of the skewed cube holds the point.
    int i1, j1, k1, i2, j2, k2;
    if (x0 >= y0) {
        if (y0 >= z0)      { i1 = 1; j1 = 0; k1 = 0; i2 = 1; j2 = 1; k2 = 0; }
        else if (x0 >= z0) { i1 = 1; j1 = 0; k1 = 0; i2 = 1; j2 = 0; k2 = 1; }
        else               { i1 = 0; j1 = 0; k1 = 1; i2 = 1; j2 = 0; k2 = 1; }
    } else {
        if (y0 < z0)       { i1 = 0; j1 = 0; k1 = 1; i2 = 0; j2 = 1; k2 = 1; }
        else if (x0 < z0)  { i1 = 0; j1 = 1; k1 = 0; i2 = 0; j2 = 1; k2 = 1; }
        else               { i1 = 0; j1 = 1; k1 = 0; i2 = 1; j2 = 1; k2 = 0; }
    }

    float x1 = x0 - float(i1) + G3, y1 = y0 - float(j1) + G3, z1 = z0 - float(k1) + G3;
    float x2 = x0 - float(i2) + 2.0f * G3, y2 = y0 - float(j2) + 2.0f * G3, z2 = z0 - float(k2) + 2.0f * G3;
    float x3 = x0 - 1.0f + 3.0f * G3, y3 = y0 - 1.0f + 3.0f * G3, z3 = z0 - 1.0f + 3.0f * G3;

    int ii = i & 255, jj = j & 255, kk = k & 255;
    const Permutation& p = perm_;
    int gi0 = p[ii + p[jj + p[kk]]] % 12;
    int gi1 = p[ii + i1 + p[jj + j1 + p[kk + k1]]] % 12;
    int gi2 = p[ii + i2 + p[jj + j2 + p[kk + k2]]] % 12;
    int gi3 = p[ii + 1 + p[jj + 1 + p[kk + 1]]] % 12;

    auto dot3 = [](int g, float a, float b, float c) {
        return grad3[g][0] * a + grad3[g][1] * b + grad3[g][2] * c;
    };
    float n = corner(0.6f, x0 * x0 + y0 * y0 + z0 * z0, dot3(gi0, x0, y0, z0)) +
            corner(0.6f, x1 * x1 + y1 * y1 + z1 * z1, dot3(gi1, x1, y1, z1)) +
            corner(0.6f, x2 * x2 + y2 * y2 + z2 * z2, dot3(gi2, x2, y2, z2)) +
            corner(0.6f, x3 * x3 + y3 * y3 + z3 * z3, dot3(gi3, x3, y3, z3));
    return clampUnit(32.0f * n);
}

float Simplex::get(double x, double y, double z, double w) const
{
    const double F4 = 0.30901699437;  // (sqrt(5) - 1) / 4
    const float G4 = 0.13819660113f;  // (5 - sqrt(5)) / 20

    double s = (x + y + z + w) * F4;
    int i = fastFloor(x + s), j = fastFloor(y + s), k = fastFloor(z + s), l = fastFloor(w + s);
    double t = double(i + j + k + l) * double(G4);
    float x0 = float(x - (i - t)), y0 = float(y - (j - t));
    float z0 = float(z - (k - t)), w0 = float(w - (l - t));

    // Rank the coordinates to find which of the 24 simplices holds the point.
    int rankx = 0, ranky = 0, rankz = 0, rankw = 0;
    if (x0 > y0) rankx++; else ranky++;
    if (x0 > z0) rankx++; else rankz++;
    if (x0 > w0) rankx++; else rankw++;
    if (y0 > z0) ranky++; else rankz++;
    if (y0 > w0) ranky++; else rankw++;
    if (z0 > w0) rankz++; else rankw++;

    int i1 = rankx >= 3, j1 = ranky >= 3, k1 = rankz >= 3, l1 = rankw >= 3;
    int i2 = rankx >= 2, j2 = ranky >= 2, k2 = rankz >= 2, l2 = rankw >= 2;
    int i3 = rankx >= 1, j3 = ranky >= 1, k3 = rankz >= 1, l3 = rankw >= 1;

    float offsets[5][4] = {
        { x0, y0, z0, w0 },
        { x0 - i1 + G4, y0 - j1 + G4, z0 - k1 + G4, w0 - l1 + G4 },
        { x0 - i2 + 2.0f * G4, y0 - j2 + 2.0f * G4, z0 - k2 + 2.0f * G4, w0 - l2 + 2.0f * G4 },
        { x0 - i3 + 3.0f * G4, y0 - j3 + 3.0f * G4, z0 - k3 + 3.0f * G4, w0 - l3 + 3.0f * G4 },
        { x0 - 1.0f + 4.0f * G4, y0 - 1.0f + 4.0f * G4, z0 - 1.0f + 4.0f * G4, w0 - 1.0f + 4.0f * G4 },
    };

    int ii = i & 255, jj = j & 255, kk = k & 255, ll = l & 255;
    const Permutation& p = perm_;
    int gi[5] = {
        p[ii + p[jj + p[kk + p[ll]]]] % 32,
        p[ii + i1 + p[jj + j1 + p[kk + k1 + p[ll + l1]]]] % 32,
        p[ii + i2 + p[jj + j2 + p[kk + k2 + p[ll + l2]]]] % 32,
        p[ii + i3 + p[jj + j3 + p[kk + k3 + p[ll + l3]]]] % 32,
        p[ii + 1 + p[jj + 1 + p[kk + 1 + p[ll + 1]]]] % 32,
    };

    float n = 0.0f;
    for (int c = 0; c < 5; ++c) {
        const float* d = offsets[c];
        const float* g = grad4[gi[c]];
        n += corner(0.6f, d[0] * d[0] + d[1] * d[1] + d[2] * d[2] + d[3] * d[3],
                g[0] * d[0] + g[1] * d[1] + g[2] * d[2] + g[3] * d[3]);
    }
    return clampUnit(27.0f * n);
}

/*** OpenSimplex ***/

template <size_t D>
float OpenSimplex::evaluate(const double (&p)[D]) const
{
    static_assert(D >= 2 && D <= 4, "2D to 4D only");

    // Kernel radius covers the farthest point from both lattices.
    const float radiusSquared = 0.75f;
    // Brings the kernel sums back to roughly [-1, 1].
    constexpr float scale = D == 2 ? 8.0f : D == 3 ? 12.0f : 16.0f;

    float sum = 0.0f;
    for (int lattice = 0; lattice < 2; ++lattice) {
        double offset = lattice ? 0.5 : 0.0;
        int base[D];
        float frac[D];
        for (size_t a = 0; a < D; ++a) {
            double q = p[a] - offset;
            base[a] = fastFloor(q);
            frac[a] = float(q - base[a]);
        }

        for (unsigned c = 0; c < (1u << D); ++c) {
            float delta[D];
            float dd = 0.0f;
            for (size_t a = 0; a < D; ++a) {
                delta[a] = frac[a] - float((c >> a) & 1);
                dd += delta[a] * delta[a];
            }
            if (dd >= radiusSquared) continue;

            int h = lattice ? 101 : 0;
            for (size_t a = D; a-- > 0;) {
                h = perm_[((base[a] + int((c >> a) & 1)) & 255) + h];
            }

            float g;
            if constexpr (D == 2) {
                g = grad2[h & 7][0] * delta[0] + grad2[h & 7][1] * delta[1];
            } else if constexpr (D == 3) {
                const float* v = grad3[h % 12];
                g = (v[0] * delta[0] + v[1] * delta[1] + v[2] * delta[2]) * 0.70710678f;
            } else {
                const float* v = grad4[h & 31];
                g = (v[0] * delta[0] + v[1] * delta[1] + v[2] * delta[2] + v[3] * delta[3]) * 0.57735027f;
            }
            sum += corner(radiusSquared, dd, g);
        }
    }
    return clampUnit(scale * sum);
}

float OpenSimplex::get(double x, double y) const
{
    const double p[2] = { x, y };
    return evaluate(p);
}

float OpenSimplex::get(double x, double y, double z) const
{
    const double p[3] = { x, y, z };
    return evaluate(p);
}

float OpenSimplex::get(double x, double y, double z, double w) const
{
    const double p[4] = { x, y, z, w };
    return evaluate(p);
}

} // namespace noise
} // namespace shimmer
