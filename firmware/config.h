/*
 * Shimmer Firmware
 *
 * Copyright (c) 2013 Micah Elizabeth Scott
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of
 * this software and associated documentation files (the "Software"), to deal in
 * the Software without restriction, including without limitation the rights to
 * use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of
 * the Software, and to permit persons to whom the Software is furnished to do so,
 * subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS
 * FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR
 * COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER
 * IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
 * CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once

#include <stddef.h>

/*** Memory limits ***/

// Configures the maximum number of LED pixels a pipeline built at runtime
// can drive.
//
// This setting determines how much memory each pipeline reserves. Every pixel
// costs a working color, an output color, a dither residual, a coordinate,
// and its encoded bytes on the wire, roughly 60 bytes in total.
#ifndef SHIMMER_CONFIG_MAX_PIXELS
#define SHIMMER_CONFIG_MAX_PIXELS (1024)
#endif

// Configures the maximum number of shapes in a layout.
#ifndef SHIMMER_CONFIG_MAX_SHAPES
#define SHIMMER_CONFIG_MAX_SHAPES (16)
#endif

#if SHIMMER_CONFIG_MAX_PIXELS < 1 || SHIMMER_CONFIG_MAX_SHAPES < 1
#error "Pipelines need room for at least one pixel and one shape. Check limits in config.h."
#endif

// Quick sanity check: the largest pulse train (32 pulses per RGBW pixel,
// 4 bytes per pulse) has to stay addressable by a 32-bit DMA descriptor.
#if (SHIMMER_CONFIG_MAX_PIXELS * 32 * 4) >= (1 << 30)
#error "Pulse buffers won't fit. Try adjusting limits in config.h."
#endif

/*** Color defaults ***/

// Gamma exponent applied when a configuration doesn't name one.
#define SHIMMER_CONFIG_DEFAULT_GAMMA (2.8f)

// Global brightness multiplier applied when a configuration doesn't name one.
#define SHIMMER_CONFIG_DEFAULT_BRIGHTNESS (1.0f)

/*** Pipeline configuration ***/

// List of tags for the pipelines that can be selected at runtime.
// Each entry compiles one pattern and driver combination for one
// layout dimensionality.
#define SHIMMER_CONFIG_PIPELINE(dims, pattern, driver) \
        shimmer::PipelineTag<dims, pattern, \
                shimmer::led::driver<shimmer::config::maxPixels>>
#define SHIMMER_CONFIG_PIPELINES_FOR(dims) \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::Rainbow<dims>, Apa102Driver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::Rainbow<dims>, Lpd8806Driver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::Rainbow<dims>, ClocklessSpiDriver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::Rainbow<dims>, ClocklessRgbwSpiDriver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::PerlinNoise<dims>, Apa102Driver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::PerlinNoise<dims>, Lpd8806Driver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::PerlinNoise<dims>, ClocklessSpiDriver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::PerlinNoise<dims>, ClocklessRgbwSpiDriver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::SimplexNoise<dims>, Apa102Driver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::SimplexNoise<dims>, Lpd8806Driver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::SimplexNoise<dims>, ClocklessSpiDriver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::SimplexNoise<dims>, ClocklessRgbwSpiDriver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::OpenSimplexNoise<dims>, Apa102Driver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::OpenSimplexNoise<dims>, Lpd8806Driver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::OpenSimplexNoise<dims>, ClocklessSpiDriver), \
        SHIMMER_CONFIG_PIPELINE(dims, shimmer::OpenSimplexNoise<dims>, ClocklessRgbwSpiDriver)
#ifndef SHIMMER_CONFIG_PIPELINES
#define SHIMMER_CONFIG_PIPELINES \
        SHIMMER_CONFIG_PIPELINES_FOR(1), \
        SHIMMER_CONFIG_PIPELINES_FOR(2), \
        SHIMMER_CONFIG_PIPELINES_FOR(3)
#endif

/*** USB host configuration ***/

// Default device the host streams frames to.
#define SHIMMER_CONFIG_VENDOR_ID       0x1d50
#define SHIMMER_CONFIG_PRODUCT_ID      0x607a
#define SHIMMER_CONFIG_OUT_ENDPOINT    0x01
#define SHIMMER_CONFIG_USB_TIMEOUT_MS  2000

#ifdef __cplusplus
namespace shimmer {
namespace config {

constexpr size_t maxPixels = SHIMMER_CONFIG_MAX_PIXELS;
constexpr size_t maxShapes = SHIMMER_CONFIG_MAX_SHAPES;
constexpr float defaultGamma = SHIMMER_CONFIG_DEFAULT_GAMMA;
constexpr float defaultBrightness = SHIMMER_CONFIG_DEFAULT_BRIGHTNESS;

} // namespace config
} // namespace shimmer
#endif
