/*
 * Renders working colors into output colors for the LEDs: brightness,
 * white point, gamma and dithering.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <math.h>

#include "shimmer/protocol.h"
#include "color.h"
#include "config.h"
#include "errors.h"

namespace shimmer {
namespace render {

using protocol::DitherMode;

// Per-channel scale factors applied after brightness, also known as the
// white point.
struct ColorCorrection {
    float red = 1.0f, green = 1.0f, blue = 1.0f;
};

// Configuration options for the correction stage.
struct CorrectionOptions {
    // Global brightness multiplier, clamped to [0, 1].
    float brightness = config::defaultBrightness;

    // Power for the nonlinear portion of the curve. 1.0 disables it.
    float gamma = config::defaultGamma;

    ColorCorrection whitepoint;

    // The curve can start with a linear section near zero, which avoids
    // very low output values that flicker when dithered. The section is
    // disabled while linearCutoff is zero. A good starting point is 1/256.0,
    // corresponding to the lowest 8-bit PWM level.
    //
    // Slope (output / input) of the linear section.
    float linearSlope = 1.0f;
    // Output level where the linear section hands over to the power curve.
    float linearCutoff = 0.0f;

    DitherMode ditherMode = DitherMode::temporal;
};

// Returns Error::invalidGamma if the curve parameters can't describe a
// monotonic mapping of [0, 1] onto itself.
[[nodiscard]] inline Error validate(const CorrectionOptions& options) {
    if (!(options.gamma > 0.0f) || !isfinite(options.gamma)) return Error::invalidGamma;
    if (!(options.linearSlope > 0.0f) || !isfinite(options.linearSlope)) return Error::invalidGamma;
    if (!(options.linearCutoff >= 0.0f) || !(options.linearCutoff < 1.0f)) return Error::invalidGamma;
    if (options.linearCutoff / options.linearSlope >= 1.0f) return Error::invalidGamma;
    return Error::none;
}

// Scales a color by the global brightness.
class BrightnessOp {
    float brightness_;

public:
    explicit BrightnessOp(float brightness) : brightness_(clamp01(brightness)) {}

    [[gnu::always_inline]] Rgb operator()(Rgb color) const {
        return Rgb{ color.r * brightness_, color.g * brightness_, color.b * brightness_ };
    }

    void set(float brightness) { brightness_ = clamp01(brightness); }
    float get() const { return brightness_; }
};

// Scales each channel by the white point.
class WhitepointOp {
    ColorCorrection whitepoint_;

public:
    explicit WhitepointOp(const ColorCorrection& whitepoint) : whitepoint_(whitepoint) {}

    [[gnu::always_inline]] Rgb operator()(Rgb color) const {
        return Rgb{ color.r * whitepoint_.red, color.g * whitepoint_.green, color.b * whitepoint_.blue };
    }

    void set(const ColorCorrection& whitepoint) { whitepoint_ = whitepoint; }
    const ColorCorrection& get() const { return whitepoint_; }
};

// Applies the compound curve: a linear section near zero, then a power
// curve that starts right where the linear portion leaves off so there is
// no discontinuity. The output is clamped to [0, 1].
class GammaOp {
    const float gamma_, linearSlope_, linearCutoff_, linearRange_;
    const bool identity_;

    float apply(float input) const {
        input = clamp01(input);
        if (identity_) return input;

        float output = input * linearSlope_;
        if (output > linearCutoff_) {
            output = linearCutoff_ +
                    powf((input - linearRange_) / (1.0f - linearRange_), gamma_) * (1.0f - linearCutoff_);
        }
        return clamp01(output);
    }

public:
    GammaOp(float gamma, float linearSlope, float linearCutoff) :
            gamma_(gamma), linearSlope_(linearSlope), linearCutoff_(linearCutoff),
            linearRange_(linearCutoff / linearSlope),
            identity_(gamma == 1.0f && linearSlope == 1.0f && linearCutoff == 0.0f) {}

    [[gnu::always_inline]] Rgb operator()(Rgb color) const {
        return Rgb{ apply(color.r), apply(color.g), apply(color.b) };
    }
};

// Quantizes a color to 8 bits per channel, dithering (or not) depending on the mode.
template <DitherMode mode, size_t Capacity>
class DitherOp {
public:
    // Rounds to the nearest level.
    [[gnu::always_inline]] Rgb8 operator()(size_t index, Rgb color) {
        return Rgb8{ level(color.r), level(color.g), level(color.b) };
    }

    void reset() {}

private:
    static uint8_t level(float x) {
        return uint8_t(clamp01(x) * 255.0f + 0.5f);
    }
};

// Carries each pixel's quantization error into its next frame, so the
// average output over time approaches the exact value.
template <size_t Capacity>
class DitherOp<DitherMode::temporal, Capacity> {
    // Residuals stay within [0, 1) of one output level.
    float residuals_[Capacity][3] = {};

    static uint8_t level(float x, float& residual) {
        float v = clamp01(x) * 255.0f + residual;
        float out = floorf(v);
        if (out > 255.0f) out = 255.0f;
        residual = v - out;
        return uint8_t(out);
    }

public:
    [[gnu::always_inline]] Rgb8 operator()(size_t index, Rgb color) {
        float* r = residuals_[index];
        return Rgb8{ level(color.r, r[0]), level(color.g, r[1]), level(color.b, r[2]) };
    }

    void reset() {
        for (size_t i = 0; i < Capacity; ++i) {
            residuals_[i][0] = residuals_[i][1] = residuals_[i][2] = 0.0f;
        }
    }

    const float* residual(size_t index) const { return residuals_[index]; }
};

// The whole correction stage for up to |Capacity| pixels.
// The dither mode is chosen at runtime, so the per-pixel loop is
// specialized once per mode and selected per frame rather than per pixel.
template <size_t Capacity>
class Corrector {
    BrightnessOp brightness_;
    WhitepointOp whitepoint_;
    GammaOp gamma_;
    const DitherMode ditherMode_;
    DitherOp<DitherMode::none, Capacity> round_;
    DitherOp<DitherMode::temporal, Capacity> dither_;

    template <typename DO>
    void applyWith(DO& quantize, const Rgb* in, Rgb8* out, size_t count) {
        for (size_t i = 0; i < count; ++i) {
            out[i] = quantize(i, gamma_(whitepoint_(brightness_(in[i]))));
        }
    }

public:
    explicit Corrector(const CorrectionOptions& options) :
            brightness_(options.brightness),
            whitepoint_(options.whitepoint),
            gamma_(options.gamma, options.linearSlope, options.linearCutoff),
            ditherMode_(options.ditherMode) {}

    void setBrightness(float brightness) { brightness_.set(brightness); }
    float brightness() const { return brightness_.get(); }
    void setColorCorrection(const ColorCorrection& whitepoint) { whitepoint_.set(whitepoint); }
    const ColorCorrection& colorCorrection() const { return whitepoint_.get(); }
    DitherMode ditherMode() const { return ditherMode_; }

    // Transforms |count| working colors into output colors.
    void apply(const Rgb* in, Rgb8* out, size_t count) {
        if (count > Capacity) count = Capacity;
        switch (ditherMode_) {
            case DitherMode::none: applyWith(round_, in, out, count); break;
            case DitherMode::temporal: applyWith(dither_, in, out, count); break;
        }
    }

    // Forgets accumulated quantization error.
    void resetDither() { dither_.reset(); }
};

} // namespace render
} // namespace shimmer
