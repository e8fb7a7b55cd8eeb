/*
 * Monotonic time sources that don't roll over.
 */

#include "clock.h"

#include <chrono>

namespace shimmer {

uint64_t SteadyClock::nowMs()
{
    using namespace std::chrono;
    return uint64_t(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

uint64_t ElapsedTimer::elapsedMs()
{
    uint64_t now = source_.nowMs();
    if (!started_) {
        started_ = true;
        start_ = now;
        last_ = 0;
        return 0;
    }

    uint64_t elapsed = now >= start_ ? now - start_ : 0;
    if (elapsed > last_) last_ = elapsed;
    return last_;
}

} // namespace shimmer
