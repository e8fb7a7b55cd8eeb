/*
 * Wire formats and configuration enums for the supported LED chipsets.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string.h>

#include "led_timings.h"

namespace shimmer {
namespace protocol {

// LED chip families that can be driven.
enum class Chipset : uint8_t {
    apa102 = 0,      // clocked, 5-bit global brightness per pixel
    lpd8806 = 1,     // clocked, 7 bits per channel
    ws2812 = 2,      // clockless, 3 channels
    sk6812 = 3,      // clockless, 3 channels, SK6812 timings
    sk6812Rgbw = 4,  // clockless, 4 channels
};

// True for chips with separate data and clock lines.
constexpr bool isClocked(Chipset chipset) {
    return chipset == Chipset::apa102 || chipset == Chipset::lpd8806;
}

// Number of bytes each pixel occupies in the chip's color stream.
constexpr size_t channelsPerPixel(Chipset chipset) {
    return chipset == Chipset::sk6812Rgbw ? 4 : 3;
}

// Order in which the color channels are transmitted.
enum class RgbOrder : uint8_t {
    rgb = 0,
    rbg = 1,
    grb = 2,
    gbr = 3,
    brg = 4,
    bgr = 5,
};

// Arranges r, g, b in transmission order.
inline void reorder(RgbOrder order, uint8_t r, uint8_t g, uint8_t b, uint8_t out[3]) {
    switch (order) {
        case RgbOrder::rgb: out[0] = r; out[1] = g; out[2] = b; break;
        case RgbOrder::rbg: out[0] = r; out[1] = b; out[2] = g; break;
        case RgbOrder::grb: out[0] = g; out[1] = r; out[2] = b; break;
        case RgbOrder::gbr: out[0] = g; out[1] = b; out[2] = r; break;
        case RgbOrder::brg: out[0] = b; out[1] = r; out[2] = g; break;
        case RgbOrder::bgr: out[0] = b; out[1] = g; out[2] = r; break;
    }
}

// Native channel order of each chipset.
constexpr RgbOrder defaultOrder(Chipset chipset) {
    return chipset == Chipset::apa102 ? RgbOrder::bgr : RgbOrder::grb;
}

// The type of dither to apply to each pixel.
enum class DitherMode : uint8_t {
    none = 0,
    temporal = 1,
};

// Pattern families.
enum class PatternType : uint8_t {
    rainbow = 0,
    noise = 1,
};

// Coherent noise functions available to the noise pattern.
enum class NoiseAlgorithm : uint8_t {
    perlin = 0,
    simplex = 1,
    openSimplex = 2,
};

// How a noise sample in [-1, 1] becomes a color.
enum class NoiseMapping : uint8_t {
    hue = 0,       // the sample picks a hue at full saturation and value
    gradient = 1,  // the sample blends between two colors
};

namespace apa102 {

// Frame layout: four zero bytes, then one 4-byte word per pixel, then end padding.
constexpr size_t startFrameSize = 4;
constexpr size_t pixelSize = 4;
constexpr uint8_t maxBrightness = 31;

// First byte of each pixel word: 0b111 followed by the 5-bit global brightness.
constexpr uint8_t pixelMarker(uint8_t brightness) {
    return 0xe0 | (brightness & 0x1f);
}

// Each LED delays the clock by half a cycle, so the end frame needs one
// extra clock edge per LED, i.e. one byte for every 16 pixels.
constexpr size_t endFrameSize(size_t pixelCount) {
    return (pixelCount + 15) / 16;
}

constexpr size_t frameSize(size_t pixelCount) {
    return startFrameSize + pixelCount * pixelSize + endFrameSize(pixelCount);
}

} // namespace apa102

namespace lpd8806 {

constexpr size_t pixelSize = 3;

// Channels are 7 bits wide and every data byte carries the high bit.
constexpr uint8_t encode(uint8_t value) {
    return 0x80 | (value >> 1);
}

// Zero bytes that reset the chain's data pointer, one per 32 pixels.
constexpr size_t latchSize(size_t pixelCount) {
    return (pixelCount + 31) / 32;
}

constexpr size_t frameSize(size_t pixelCount) {
    return pixelCount * pixelSize + latchSize(pixelCount);
}

} // namespace lpd8806

namespace clockless {

// A bit-banged serial transfer reproduces each data bit as a run of cells
// on the data line: the first cells high, the rest low.
// 2.4 MHz gives three 417 ns cells per WS2812 bit: 0 is 100, 1 is 110.
constexpr uint32_t spiFrequencyWS2812 = 2400000;
// 3.2 MHz gives four 313 ns cells per SK6812 bit: 0 is 1000, 1 is 1100.
constexpr uint32_t spiFrequencySK6812 = 3200000;
constexpr uint32_t minCellsPerBit = 3;
constexpr uint32_t maxCellsPerBit = 4;

// Bytes on the wire for one data byte: 8 bits of |cellsPerBit| cells each.
constexpr size_t spiBytesPerByte(uint32_t cellsPerBit) {
    return cellsPerBit;
}

// Zero bytes that hold the line low for the latch interval.
constexpr size_t spiResetBytes(uint32_t resetNs, uint32_t frequency) {
    return static_cast<size_t>((uint64_t(resetNs) * frequency + 7999999999ULL) / 8000000000ULL);
}

// Upper bound on reset bytes for validated timings at the fastest supported clock.
constexpr uint32_t maxSpiFrequency = 4000000;
constexpr size_t maxSpiResetBytes = spiResetBytes(300000, maxSpiFrequency);

} // namespace clockless

struct NamedChipset {
    const char* name;
    const Chipset chipset;
};
constexpr NamedChipset namedChipsets[] = {
    { "apa102", Chipset::apa102 },
    { "lpd8806", Chipset::lpd8806 },
    { "ws2812", Chipset::ws2812 },
    { "sk6812", Chipset::sk6812 },
    { "sk6812-rgbw", Chipset::sk6812Rgbw },
};

inline const Chipset* chipsetByName(const char* name) {
    for (const auto& elem : namedChipsets) {
        if (strcmp(elem.name, name) == 0) return &elem.chipset;
    }
    return nullptr;
}

// Default single-wire timings for a clockless chipset.
constexpr const led::Timings& defaultTimings(Chipset chipset) {
    return chipset == Chipset::ws2812 ? led::timingsWS2812 : led::timingsSK6812;
}

// Serial clock that reproduces a clockless chipset's default timings.
constexpr uint32_t defaultSpiFrequency(Chipset chipset) {
    return chipset == Chipset::ws2812 ? clockless::spiFrequencyWS2812 : clockless::spiFrequencySK6812;
}

} // namespace protocol
} // namespace shimmer
