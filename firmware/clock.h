/*
 * Monotonic time sources that don't roll over.
 */

#pragma once

#include <stdint.h>

namespace shimmer {

// A monotonic millisecond clock.
class TimeSource {
public:
    virtual ~TimeSource() {}
    virtual uint64_t nowMs() = 0;
};

// The host's steady clock.
class SteadyClock : public TimeSource {
public:
    uint64_t nowMs() override;
};

// Milliseconds since the first reading of a time source. Never decreases,
// even if the source steps backwards.
class ElapsedTimer {
    TimeSource& source_;
    uint64_t start_ = 0;
    uint64_t last_ = 0;
    bool started_ = false;

public:
    explicit ElapsedTimer(TimeSource& source) : source_(source) {}

    uint64_t elapsedMs();
    void restart() { started_ = false; }
};

} // namespace shimmer
