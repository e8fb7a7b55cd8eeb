/*
 * LED output drivers: encode a frame of output colors into a chipset's
 * wire format and hand it to a transport.
 */

#include "led_driver.h"

namespace shimmer {
namespace led {
namespace {

// Rounds a duration in nanoseconds to the nearest whole number of ticks.
uint32_t toTicks(uint32_t ns, uint32_t ticksPerSecond) {
    return uint32_t((uint64_t(ns) * ticksPerSecond + 500000000ULL) / 1000000000ULL);
}

bool withinTolerance(double actualNs, uint32_t nominalNs) {
    double delta = actualNs - double(nominalNs);
    return delta <= double(pulseTolerance) && delta >= -double(pulseTolerance);
}

} // namespace

size_t Apa102::encode(uint8_t* out, const Rgb8* pixels, size_t count, const ClockedOptions& options)
{
    uint8_t* begin = out;
    for (size_t i = 0; i < protocol::apa102::startFrameSize; ++i) *out++ = 0x00;

    uint8_t marker = protocol::apa102::pixelMarker(options.globalBrightness > protocol::apa102::maxBrightness ?
            protocol::apa102::maxBrightness : options.globalBrightness);
    for (size_t i = 0; i < count; ++i) {
        *out++ = marker;
        pixelChannels<3>(pixels[i], options.order, out);
        out += 3;
    }

    for (size_t i = protocol::apa102::endFrameSize(count); i > 0; --i) *out++ = 0x00;
    return size_t(out - begin);
}

size_t Lpd8806::encode(uint8_t* out, const Rgb8* pixels, size_t count, const ClockedOptions& options)
{
    uint8_t* begin = out;
    for (size_t i = 0; i < count; ++i) {
        uint8_t bytes[3];
        pixelChannels<3>(pixels[i], options.order, bytes);
        *out++ = protocol::lpd8806::encode(bytes[0]);
        *out++ = protocol::lpd8806::encode(bytes[1]);
        *out++ = protocol::lpd8806::encode(bytes[2]);
    }

    for (size_t i = protocol::lpd8806::latchSize(count); i > 0; --i) *out++ = 0x00;
    return size_t(out - begin);
}

Error PulseTable::derive(const Timings& timings, uint32_t resolution, PulseTable* out)
{
    if (!validateTimings(timings) || resolution == 0) return Error::invalidTimings;

    const uint32_t durations[5] = { timings.t0h, timings.t0l, timings.t1h, timings.t1l, timings.reset };
    uint32_t ticks[5];
    for (size_t i = 0; i < 5; ++i) {
        ticks[i] = toTicks(durations[i], resolution);
        if (ticks[i] == 0 || ticks[i] > maxPulseTicks) return Error::invalidTimings;
    }

    // Data pulses must survive the rounding to whole ticks. The latch only
    // needs to be long enough.
    const double tickNs = 1e9 / double(resolution);
    for (size_t i = 0; i < 4; ++i) {
        if (!withinTolerance(ticks[i] * tickNs, durations[i])) return Error::invalidTimings;
    }

    out->zero = PulseCode{ uint16_t(ticks[0]), uint16_t(ticks[1]) };
    out->one = PulseCode{ uint16_t(ticks[2]), uint16_t(ticks[3]) };
    out->reset = PulseCode{ 0, uint16_t(ticks[4]) };
    return Error::none;
}

Error SpiEncoding::derive(const Timings& timings, uint32_t frequency, SpiEncoding* out)
{
    if (!validateTimings(timings)) return Error::invalidTimings;
    if (frequency == 0 || frequency > protocol::clockless::maxSpiFrequency) return Error::invalidTimings;

    const double cellNs = 1e9 / double(frequency);
    uint32_t cells = uint32_t(double(bitPeriod(timings)) / cellNs + 0.5);
    if (cells < protocol::clockless::minCellsPerBit || cells > protocol::clockless::maxCellsPerBit) {
        return Error::invalidTimings;
    }

    uint32_t zeroHigh = uint32_t(double(timings.t0h) / cellNs + 0.5);
    uint32_t oneHigh = uint32_t(double(timings.t1h) / cellNs + 0.5);
    if (zeroHigh == 0 || oneHigh <= zeroHigh || oneHigh >= cells) return Error::invalidTimings;

    if (!withinTolerance(zeroHigh * cellNs, timings.t0h) ||
            !withinTolerance((cells - zeroHigh) * cellNs, timings.t0l) ||
            !withinTolerance(oneHigh * cellNs, timings.t1h) ||
            !withinTolerance((cells - oneHigh) * cellNs, timings.t1l)) {
        return Error::invalidTimings;
    }

    out->frequency = frequency;
    out->cellsPerBit = cells;
    out->zeroHighCells = zeroHigh;
    out->oneHighCells = oneHigh;
    out->resetBytes = protocol::clockless::spiResetBytes(timings.reset, frequency);

    // A bit is |high| one cells followed by zero cells.
    const uint32_t zeroPattern = ((1u << zeroHigh) - 1) << (cells - zeroHigh);
    const uint32_t onePattern = ((1u << oneHigh) - 1) << (cells - oneHigh);
    for (uint32_t value = 0; value < 256; ++value) {
        uint32_t bits = 0;
        for (int bit = 7; bit >= 0; --bit) {
            bits = (bits << cells) | ((value >> bit) & 1 ? onePattern : zeroPattern);
        }
        out->lookup[value] = bits;
    }
    return Error::none;
}

} // namespace led
} // namespace shimmer
