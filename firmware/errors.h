/*
 * Error codes reported while building and running a pipeline.
 */

#pragma once

#include <stdint.h>

namespace shimmer {

enum class Error : uint8_t {
    none = 0,

    // Build errors, reported once by ControlBuilder::build().
    missingLayout,       // no shapes were given
    emptyShape,          // a shape resolves to zero pixels
    invalidShape,        // a layout entry could not be resolved into a shape
    tooManyShapes,       // more shapes than config::maxShapes
    pixelCountMismatch,  // layout and driver disagree on the pixel count
    capacityExceeded,    // more pixels than the pipeline was compiled for
    invalidGamma,        // gamma or linear section parameters out of range
    invalidTimings,      // clockless timings rejected or not reproducible
    missingChannel,      // driver has no transport to write to
    unknownPipeline,     // combination not compiled into the pipeline table

    // Tick errors.
    transmission,        // the transport rejected a frame
};

// Printable name of an error code.
constexpr const char* errorName(Error error) {
    switch (error) {
        case Error::none: return "none";
        case Error::missingLayout: return "missing layout";
        case Error::emptyShape: return "empty shape";
        case Error::invalidShape: return "invalid shape";
        case Error::tooManyShapes: return "too many shapes";
        case Error::pixelCountMismatch: return "pixel count mismatch";
        case Error::capacityExceeded: return "capacity exceeded";
        case Error::invalidGamma: return "invalid gamma";
        case Error::invalidTimings: return "invalid timings";
        case Error::missingChannel: return "missing channel";
        case Error::unknownPipeline: return "unknown pipeline";
        case Error::transmission: return "transmission failed";
    }
    return "unknown";
}

} // namespace shimmer
