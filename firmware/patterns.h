/*
 * Patterns map a layout coordinate and the elapsed time to a working color.
 *
 * Every pattern provides:
 *   - dimensions, the layout dimensionality it samples
 *   - Params, its configuration
 *   - advance(timeMs), called once per tick before any evaluate()
 *   - evaluate(position, timeMs), a pure function of its arguments and
 *     of the state left by the last advance()
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <math.h>

#include <tuple>

#include "shimmer/protocol.h"
#include "color.h"
#include "noise.h"
#include "vec.h"

namespace shimmer {

struct RainbowParams {
    // Hue cycles per unit of distance along the x axis.
    float positionScalar = 1.0f;
    // Hue cycles per millisecond.
    float timeScalar = 0.0001f;
};

// Hue wheel that scrolls along the x axis over time.
template <size_t N>
class Rainbow {
    RainbowParams params_;

public:
    static constexpr size_t dimensions = N;
    static constexpr protocol::PatternType type = protocol::PatternType::rainbow;
    using Params = RainbowParams;

    explicit Rainbow(const Params& params) : params_(params) {}

    void advance(uint64_t timeMs) {}

    Rgb evaluate(const Vec<N>& position, uint64_t timeMs) const {
        // Double precision keeps the phase exact enough after days of uptime.
        double phase = double(params_.positionScalar) * double(position.x()) +
                double(params_.timeScalar) * double(timeMs);
        return hsvToRgb(Hsv{ float(phase - floor(phase)), 1.0f, 1.0f });
    }

    const Params& params() const { return params_; }
};

struct NoiseParams {
    // Spatial frequency: noise cells per unit of distance.
    float positionScalar = 0.5f;
    // Time frequency: noise cells per millisecond.
    float timeScalar = 0.0001f;
    protocol::NoiseMapping mapping = protocol::NoiseMapping::hue;
    // Gradient endpoints for NoiseMapping::gradient.
    Rgb low{ 0.0f, 0.0f, 0.0f };
    Rgb high{ 1.0f, 1.0f, 1.0f };
    // Zero selects the reference permutation.
    uint32_t seed = 0;
};

// Samples a noise function one dimension above the layout, using the
// extra axis for time, so the field drifts smoothly.
template <size_t N, typename NoiseFn>
class Noise {
    NoiseParams params_;
    NoiseFn noise_;
    uint64_t phaseTimeMs_ = 0;
    // Kept in double: after days of uptime a float can no longer tell
    // one tick from the next.
    double phase_ = 0.0;

    double phaseAt(uint64_t timeMs) const {
        return double(timeMs) * double(params_.timeScalar);
    }

    float sample(const Vec<N>& position, double phase) const {
        const float s = params_.positionScalar;
        if constexpr (N == 1) {
            return noise_.get(position.x() * s, phase);
        } else if constexpr (N == 2) {
            return noise_.get(position.x() * s, position.y() * s, phase);
        } else {
            return noise_.get(position.x() * s, position.y() * s, position.z() * s, phase);
        }
    }

public:
    static constexpr size_t dimensions = N;
    static constexpr protocol::PatternType type = protocol::PatternType::noise;
    static constexpr protocol::NoiseAlgorithm algorithm = NoiseFn::algorithm;
    using Params = NoiseParams;

    explicit Noise(const Params& params) : params_(params), noise_(params.seed) {}

    // Caches the time coordinate shared by every pixel of the tick.
    void advance(uint64_t timeMs) {
        phaseTimeMs_ = timeMs;
        phase_ = phaseAt(timeMs);
    }

    Rgb evaluate(const Vec<N>& position, uint64_t timeMs) const {
        double phase = timeMs == phaseTimeMs_ ? phase_ : phaseAt(timeMs);
        float n = sample(position, phase);

        if (params_.mapping == protocol::NoiseMapping::gradient) {
            return lerp(params_.low, params_.high, (n + 1.0f) * 0.5f);
        }
        // A full trip through [-1, 1] goes twice around the hue wheel.
        return hsvToRgb(Hsv{ n - floorf(n), 1.0f, 1.0f });
    }

    const Params& params() const { return params_; }
};

template <size_t N> using PerlinNoise = Noise<N, noise::Perlin>;
template <size_t N> using SimplexNoise = Noise<N, noise::Simplex>;
template <size_t N> using OpenSimplexNoise = Noise<N, noise::OpenSimplex>;

// Several patterns compiled into one, with one of them active at a time.
// The set is fixed at compile time; which member renders can change
// between ticks. Each member keeps its own state while inactive.
template <typename... Patterns>
class PatternSwitch {
    static_assert(sizeof...(Patterns) >= 1, "A switch needs at least one pattern.");

    using First = typename std::tuple_element<0, std::tuple<Patterns...>>::type;

public:
    static constexpr size_t dimensions = First::dimensions;
    static constexpr size_t count = sizeof...(Patterns);

    static_assert(((Patterns::dimensions == dimensions) && ...),
            "Switched patterns must share one dimensionality.");

    struct Params {
        std::tuple<typename Patterns::Params...> patterns;
        // Index of the pattern that renders first.
        size_t active = 0;
    };

private:
    std::tuple<Patterns...> patterns_;
    size_t active_;

    template <size_t I = 0>
    void advanceAt(size_t index, uint64_t timeMs) {
        if constexpr (I + 1 < count) {
            if (index != I) return advanceAt<I + 1>(index, timeMs);
        }
        std::get<I>(patterns_).advance(timeMs);
    }

    template <size_t I = 0>
    Rgb evaluateAt(size_t index, const Vec<dimensions>& position, uint64_t timeMs) const {
        if constexpr (I + 1 < count) {
            if (index != I) return evaluateAt<I + 1>(index, position, timeMs);
        }
        return std::get<I>(patterns_).evaluate(position, timeMs);
    }

public:
    explicit PatternSwitch(const Params& params) :
            patterns_(params.patterns),
            active_(params.active < count ? params.active : 0) {}

    void advance(uint64_t timeMs) { advanceAt(active_, timeMs); }

    Rgb evaluate(const Vec<dimensions>& position, uint64_t timeMs) const {
        return evaluateAt(active_, position, timeMs);
    }

    size_t active() const { return active_; }

    // Returns false and keeps the current pattern if |index| is out of range.
    bool select(size_t index) {
        if (index >= count) return false;
        active_ = index;
        return true;
    }

    // Moves to the next pattern, wrapping from the last to the first.
    void toggle() { active_ = (active_ + 1) % count; }

    // Rebuilds member |I| with new parameters. Takes effect on the next tick
    // whether or not it is active.
    template <size_t I>
    void setParams(const typename std::tuple_element<I, std::tuple<Patterns...>>::type::Params& params) {
        using PatternT = typename std::tuple_element<I, std::tuple<Patterns...>>::type;
        std::get<I>(patterns_) = PatternT(params);
    }

    template <size_t I>
    const typename std::tuple_element<I, std::tuple<Patterns...>>::type& pattern() const {
        return std::get<I>(patterns_);
    }
};

} // namespace shimmer
