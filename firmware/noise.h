/*
 * Coherent gradient noise in two, three and four dimensions.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>

#include "shimmer/protocol.h"

namespace shimmer {
namespace noise {

// Hash table shared by the lattice noise functions. Seed 0 keeps Ken Perlin's
// reference permutation, any other seed shuffles it.
class Permutation {
    uint8_t p_[512];

public:
    explicit Permutation(uint32_t seed = 0);

    inline int operator[](int i) const { return p_[i & 511]; }
};

// Ken Perlin's improved noise.
class Perlin {
    Permutation perm_;

public:
    static constexpr protocol::NoiseAlgorithm algorithm = protocol::NoiseAlgorithm::perlin;

    explicit Perlin(uint32_t seed = 0) : perm_(seed) {}

    // Each returns a value in [-1, 1]. Integer lattice points return 0.
    // Coordinates are split into lattice cell and offset in double
    // precision, so a slowly moving time axis keeps its resolution.
    float get(double x, double y) const;
    float get(double x, double y, double z) const;
    float get(double x, double y, double z, double w) const;
};

// Simplex noise on the skewed simplex lattice, after Stefan Gustavson.
class Simplex {
    Permutation perm_;

public:
    static constexpr protocol::NoiseAlgorithm algorithm = protocol::NoiseAlgorithm::simplex;

    explicit Simplex(uint32_t seed = 0) : perm_(seed) {}

    float get(double x, double y) const;
    float get(double x, double y, double z) const;
    float get(double x, double y, double z, double w) const;
};

// Noise in the style of OpenSimplex: radial kernels summed over two
// interleaved cubic lattices, one offset by half a cell on every axis.
// Avoids the axis-aligned artifacts of Perlin noise without the simplex
// lattice.
class OpenSimplex {
    Permutation perm_;

    template <size_t D>
    float evaluate(const double (&p)[D]) const;

public:
    static constexpr protocol::NoiseAlgorithm algorithm = protocol::NoiseAlgorithm::openSimplex;

    explicit OpenSimplex(uint32_t seed = 0) : perm_(seed) {}

    float get(double x, double y) const;
    float get(double x, double y, double z) const;
    float get(double x, double y, double z, double w) const;
};

} // namespace noise
} // namespace shimmer
