/*
 * LED timing parameters for self-clocked single-wire strips
 * (WS2811, WS2812B, and SK6812).
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string.h>

namespace shimmer {
namespace led {

// Timings for the single-wire output protocol, all in nanoseconds.
// Can be tuned to optimize performance for various models.
struct Timings {
    // High and low time of a 0 bit.
    uint32_t t0h, t0l;
    // High and low time of a 1 bit.
    uint32_t t1h, t1l;
    // Low time that latches the frame into the LEDs.
    uint32_t reset;
};

// Chips accept each pulse edge within this many nanoseconds of nominal.
constexpr uint32_t pulseTolerance = 150;

// Length of the longer of the two bit periods.
constexpr uint32_t bitPeriod(const Timings& timings) {
    return timings.t0h + timings.t0l > timings.t1h + timings.t1l ?
            timings.t0h + timings.t0l : timings.t1h + timings.t1l;
}

// Perform basic sanity checks for LED timings so a mistyped configuration
// can't produce a waveform that no chip would ever accept.
// - bit period: 500 ns to 10 us (100 kHz to 2 MHz)
// - t0h, t1h: nonzero, t1h greater than t0h
// - t0l, t1l: nonzero
// - reset: at least 6 us and no more than 300 us, typically 50 to 80 us
inline bool validateTimings(const Timings& timings) {
    uint32_t period = bitPeriod(timings);
    return period >= 500 && period <= 10000 &&
            timings.t0h > 0 && timings.t1h > timings.t0h &&
            timings.t0l > 0 && timings.t1l > 0 &&
            timings.reset >= 6000 && timings.reset <= 300000;
}

// WS2812B datasheet values for the 800 kHz protocol.
constexpr Timings timingsWS2812 { 400, 850, 800, 450, 50000 };

// WS2811 in its 400 kHz mode.
constexpr Timings timingsWS2811 { 500, 2000, 1200, 1300, 50000 };

// SK6812 has shorter high pulses and wants a longer latch.
constexpr Timings timingsSK6812 { 300, 900, 600, 600, 80000 };

struct NamedTimings {
    const char* name;
    const Timings timings;
};
constexpr NamedTimings namedTimings[] = {
    { "ws2812", timingsWS2812 },
    { "ws2811", timingsWS2811 },
    { "sk6812", timingsSK6812 },
};

inline const Timings* timingsByName(const char* name) {
    for (const auto& elem : namedTimings) {
        if (strcmp(elem.name, name) == 0) return &elem.timings;
    }
    return nullptr;
}

} // namespace led
} // namespace shimmer
