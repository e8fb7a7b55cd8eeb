/*
 * Transports that record what a driver sends, for tests.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <vector>

#include "led_driver.h"

namespace shimmer {
namespace test {

// Keeps a copy of the last write and counts all writes.
class RecordingByteWriter : public led::ByteWriter {
public:
    std::vector<uint8_t> last;
    size_t writes = 0;

    bool write(const uint8_t* data, size_t len) override {
        last.assign(data, data + len);
        writes++;
        return true;
    }
};

// Rejects every write after the first |okWrites|.
class FailingByteWriter : public led::ByteWriter {
public:
    size_t okWrites;
    size_t writes = 0;

    explicit FailingByteWriter(size_t okWrites = 0) : okWrites(okWrites) {}

    bool write(const uint8_t* data, size_t len) override {
        return writes++ < okWrites;
    }
};

class RecordingPulseWriter : public led::PulseWriter {
public:
    uint32_t ticksPerSecond;
    std::vector<led::PulseCode> last;

    explicit RecordingPulseWriter(uint32_t ticksPerSecond) : ticksPerSecond(ticksPerSecond) {}

    uint32_t resolution() const override { return ticksPerSecond; }

    bool write(const led::PulseCode* codes, size_t count) override {
        last.assign(codes, codes + count);
        return true;
    }
};

} // namespace test
} // namespace shimmer
