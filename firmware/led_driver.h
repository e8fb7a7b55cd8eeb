/*
 * LED output drivers: encode a frame of output colors into a chipset's
 * wire format and hand it to a transport.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>

#include "shimmer/led_timings.h"
#include "shimmer/protocol.h"
#include "color.h"
#include "errors.h"

namespace shimmer {
namespace led {

/*** Transports ***/

// Synchronous byte sink for SPI-style transfers.
// Blocks until the bytes are on the wire. Returns false on bus failure.
class ByteWriter {
public:
    virtual ~ByteWriter() {}
    virtual bool write(const uint8_t* data, size_t len) = 0;
};

// One high pulse followed by one low pulse, in ticks of the pulse generator.
struct PulseCode {
    uint16_t high, low;
};

// Longest pulse a code can describe.
constexpr uint32_t maxPulseTicks = 0x7fff;

// Synchronous pulse-train generator, such as a remote-control peripheral.
// Blocks until the train has been sent. Returns false on failure.
class PulseWriter {
public:
    virtual ~PulseWriter() {}
    // Ticks per second.
    virtual uint32_t resolution() const = 0;
    virtual bool write(const PulseCode* codes, size_t count) = 0;
};

// Color channels of one pixel in transmission order. Four-channel pixels
// move the common part of r, g and b into the white channel.
template <size_t Channels>
inline void pixelChannels(const Rgb8& color, protocol::RgbOrder order, uint8_t* out) {
    static_assert(Channels == 3 || Channels == 4, "RGB or RGBW");
    if constexpr (Channels == 4) {
        uint8_t w = color.r < color.g ? color.r : color.g;
        if (color.b < w) w = color.b;
        protocol::reorder(order, color.r - w, color.g - w, color.b - w, out);
        out[3] = w;
    } else {
        protocol::reorder(order, color.r, color.g, color.b, out);
    }
}

/*** Clocked chipsets ***/

// Configuration options for a clocked (data + clock) strip.
struct ClockedOptions {
    ByteWriter* writer = nullptr;
    size_t pixelCount = 0;
    protocol::RgbOrder order = protocol::RgbOrder::bgr;
    // APA102 only: 5-bit brightness sent with every pixel.
    uint8_t globalBrightness = protocol::apa102::maxBrightness;
};

struct Apa102 {
    static constexpr protocol::Chipset chipset = protocol::Chipset::apa102;
    static constexpr size_t frameSize(size_t pixelCount) { return protocol::apa102::frameSize(pixelCount); }

    // Writes a whole frame to |out| and returns its length.
    static size_t encode(uint8_t* out, const Rgb8* pixels, size_t count, const ClockedOptions& options);
};

struct Lpd8806 {
    static constexpr protocol::Chipset chipset = protocol::Chipset::lpd8806;
    static constexpr size_t frameSize(size_t pixelCount) { return protocol::lpd8806::frameSize(pixelCount); }

    static size_t encode(uint8_t* out, const Rgb8* pixels, size_t count, const ClockedOptions& options);
};

// Encodes whole frames for a clocked chip into a buffer sized for
// |Capacity| pixels and sends each frame in one write.
template <typename Chip, size_t Capacity>
class ClockedDriver {
    ByteWriter* const writer_;
    const ClockedOptions options_;
    size_t frameSize_ = 0;
    uint8_t frame_[Chip::frameSize(Capacity)];

public:
    using Options = ClockedOptions;
    static constexpr size_t capacity = Capacity;

    static constexpr bool supports(protocol::Chipset chipset) { return chipset == Chip::chipset; }

    [[nodiscard]] static Error validate(const Options& options) {
        if (options.writer == nullptr) return Error::missingChannel;
        if (options.pixelCount > Capacity) return Error::capacityExceeded;
        return Error::none;
    }

    explicit ClockedDriver(const Options& options) : writer_(options.writer), options_(options) {}

    size_t pixelCount() const { return options_.pixelCount; }

    // Encodes and transmits one frame of pixelCount() colors.
    [[nodiscard]] Error write(const Rgb8* pixels) {
        frameSize_ = Chip::encode(frame_, pixels, options_.pixelCount, options_);
        return writer_->write(frame_, frameSize_) ? Error::none : Error::transmission;
    }

    // The most recently encoded frame.
    const uint8_t* frame() const { return frame_; }
    size_t frameSize() const { return frameSize_; }
};

template <size_t Capacity> using Apa102Driver = ClockedDriver<Apa102, Capacity>;
template <size_t Capacity> using Lpd8806Driver = ClockedDriver<Lpd8806, Capacity>;

/*** Clockless chipsets ***/

// Configuration options for a clockless (single-wire) strip.
// The pulse driver writes to |pulseWriter|, the serial driver to |writer|.
struct ClocklessOptions {
    ByteWriter* writer = nullptr;
    PulseWriter* pulseWriter = nullptr;
    size_t pixelCount = 0;
    protocol::RgbOrder order = protocol::RgbOrder::grb;
    Timings timings = timingsWS2812;
    // Serial clock used to synthesize the waveform.
    uint32_t spiFrequency = protocol::clockless::spiFrequencyWS2812;
};

// Pulse codes for a 0 bit, a 1 bit and the latch.
struct PulseTable {
    PulseCode zero, one, reset;

    // Converts |timings| to ticks at |resolution| ticks per second.
    // Fails with Error::invalidTimings if the timings are out of range or
    // can't be reproduced within pulseTolerance.
    [[nodiscard]] static Error derive(const Timings& timings, uint32_t resolution, PulseTable* out);
};

// Serial bit patterns reproducing a clockless waveform.
struct SpiEncoding {
    uint32_t frequency = 0;
    uint32_t cellsPerBit = 0;
    uint32_t zeroHighCells = 0, oneHighCells = 0;
    size_t resetBytes = 0;
    // Wire bits for every data byte, most significant cell first and
    // right-aligned to 8 * cellsPerBit bits.
    uint32_t lookup[256];

    // Chooses cell counts for |timings| at |frequency|. Fails with
    // Error::invalidTimings if a bit can't be split into 3 or 4 cells whose
    // edges land within pulseTolerance.
    [[nodiscard]] static Error derive(const Timings& timings, uint32_t frequency, SpiEncoding* out);

    // Appends the wire bytes for one data byte, returns the new end.
    inline uint8_t* put(uint8_t* out, uint8_t value) const {
        uint32_t bits = lookup[value];
        for (size_t i = protocol::clockless::spiBytesPerByte(cellsPerBit); i > 0; --i) {
            *out++ = uint8_t(bits >> ((i - 1) * 8));
        }
        return out;
    }
};

// Drives a clockless strip with a pulse generator: 8 codes per channel
// byte, most significant bit first, followed by one latch code.
template <size_t Capacity, size_t Channels = 3>
class ClocklessPulseDriver {
    PulseWriter* const writer_;
    const ClocklessOptions options_;
    PulseTable table_{};
    size_t frameSize_ = 0;
    PulseCode pulses_[Capacity * Channels * 8 + 1];

public:
    using Options = ClocklessOptions;
    static constexpr size_t capacity = Capacity;
    static constexpr size_t channels = Channels;

    static constexpr bool supports(protocol::Chipset chipset) {
        return !protocol::isClocked(chipset) && protocol::channelsPerPixel(chipset) == Channels;
    }

    [[nodiscard]] static Error validate(const Options& options) {
        if (options.pulseWriter == nullptr) return Error::missingChannel;
        if (options.pixelCount > Capacity) return Error::capacityExceeded;
        PulseTable table;
        return PulseTable::derive(options.timings, options.pulseWriter->resolution(), &table);
    }

    explicit ClocklessPulseDriver(const Options& options) : writer_(options.pulseWriter), options_(options) {
        if (PulseTable::derive(options.timings, writer_->resolution(), &table_) != Error::none) {
            table_ = PulseTable{};
        }
    }

    size_t pixelCount() const { return options_.pixelCount; }

    [[nodiscard]] Error write(const Rgb8* pixels) {
        PulseCode* out = pulses_;
        for (size_t i = 0; i < options_.pixelCount; ++i) {
            uint8_t bytes[Channels];
            pixelChannels<Channels>(pixels[i], options_.order, bytes);
            for (size_t c = 0; c < Channels; ++c) {
                for (int bit = 7; bit >= 0; --bit) {
                    *out++ = (bytes[c] >> bit) & 1 ? table_.one : table_.zero;
                }
            }
        }
        *out++ = table_.reset;
        frameSize_ = size_t(out - pulses_);
        return writer_->write(pulses_, frameSize_) ? Error::none : Error::transmission;
    }

    const PulseCode* frame() const { return pulses_; }
    size_t frameSize() const { return frameSize_; }
    const PulseTable& table() const { return table_; }
};

// Drives a clockless strip through a serial data line clocked fast enough
// that each data bit becomes a short run of cells, followed by enough zero
// bytes to latch.
template <size_t Capacity, size_t Channels = 3>
class ClocklessSpiDriver {
    ByteWriter* const writer_;
    const ClocklessOptions options_;
    SpiEncoding encoding_;
    size_t frameSize_ = 0;
    uint8_t frame_[Capacity * Channels * protocol::clockless::spiBytesPerByte(protocol::clockless::maxCellsPerBit) +
            protocol::clockless::maxSpiResetBytes];

public:
    using Options = ClocklessOptions;
    static constexpr size_t capacity = Capacity;
    static constexpr size_t channels = Channels;

    static constexpr bool supports(protocol::Chipset chipset) {
        return !protocol::isClocked(chipset) && protocol::channelsPerPixel(chipset) == Channels;
    }

    [[nodiscard]] static Error validate(const Options& options) {
        if (options.writer == nullptr) return Error::missingChannel;
        if (options.pixelCount > Capacity) return Error::capacityExceeded;
        SpiEncoding encoding;
        return SpiEncoding::derive(options.timings, options.spiFrequency, &encoding);
    }

    explicit ClocklessSpiDriver(const Options& options) : writer_(options.writer), options_(options) {
        if (SpiEncoding::derive(options.timings, options.spiFrequency, &encoding_) != Error::none) {
            encoding_ = SpiEncoding{};
        }
    }

    size_t pixelCount() const { return options_.pixelCount; }

    [[nodiscard]] Error write(const Rgb8* pixels) {
        uint8_t* out = frame_;
        for (size_t i = 0; i < options_.pixelCount; ++i) {
            uint8_t bytes[Channels];
            pixelChannels<Channels>(pixels[i], options_.order, bytes);
            for (size_t c = 0; c < Channels; ++c) {
                out = encoding_.put(out, bytes[c]);
            }
        }
        for (size_t i = 0; i < encoding_.resetBytes; ++i) *out++ = 0;
        frameSize_ = size_t(out - frame_);
        return writer_->write(frame_, frameSize_) ? Error::none : Error::transmission;
    }

    const uint8_t* frame() const { return frame_; }
    size_t frameSize() const { return frameSize_; }
    const SpiEncoding& encoding() const { return encoding_; }
};

template <size_t Capacity> using ClocklessRgbwSpiDriver = ClocklessSpiDriver<Capacity, 4>;
template <size_t Capacity> using ClocklessRgbwPulseDriver = ClocklessPulseDriver<Capacity, 4>;

} // namespace led
} // namespace shimmer
