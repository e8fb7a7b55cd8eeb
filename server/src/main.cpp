/*
 * Shimmer host: renders the configured pattern and streams it to an LED
 * bridge over USB.
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

#include "configloader.h"
#include "usbchannel.h"
#include "clock.h"
#include "control.h"
#include "debug.h"
#include <string.h>
#include <iostream>
#include <thread>
#include <chrono>

namespace {

const uint64_t kStatsIntervalMs = 10000;
const unsigned kFramePeriodMs = 10;

void logSink(const char *text)
{
    std::clog << text;
}

void usage(const char *argv0)
{
    std::clog << "usage: " << argv0 << " [--verbose] <config.json>\n";
}

// Holds the largest compiled pipeline, so it stays out of the stack.
shimmer::PipelineHolder holder;

} // namespace

int main(int argc, char **argv)
{
    const char *path = 0;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (!strcmp(argv[i], "--verbose") || !strcmp(argv[i], "-v")) {
            verbose = true;
        } else if (!path) {
            path = argv[i];
        } else {
            usage(argv[0]);
            return 1;
        }
    }
    if (!path) {
        usage(argv[0]);
        return 1;
    }

    shimmer::debug::setSink(logSink);

    // Large point buffers, keep them off the stack as well.
    static ConfigLoader config(verbose);
    if (!config.loadFile(path)) {
        return 1;
    }

    UsbChannel usb(config.usbVendor(), config.usbProduct(), config.usbEndpoint(), verbose);
    int r = usb.open();
    if (r < 0) {
        std::clog << "Can't open USB device: " << libusb_strerror(libusb_error(r)) << "\n";
        return 1;
    }

    // The reason has already gone through the debug sink.
    if (holder.init(config.pipelineId(), config.pipelineOptions(&usb)) != shimmer::Error::none) {
        return 1;
    }
    shimmer::dumpBuildOptions(config.pipelineId(), config.pipelineOptions(&usb).correction);

    shimmer::Pipeline &pipeline = *holder.get();
    shimmer::SteadyClock clock;
    shimmer::ElapsedTimer timer(clock);
    uint64_t nextStats = kStatsIntervalMs;

    for (;;) {
        uint64_t now = timer.elapsedMs();

        // A dropped frame is replaced by the next one, the pipeline reports it.
        shimmer::Error error = pipeline.tick(now);
        if (error != shimmer::Error::none && verbose) {
            std::clog << "USB write failed on frame " << pipeline.stats().frames << "\n";
        }

        if (config.printStats() && now >= nextStats) {
            shimmer::dumpStats(pipeline);
            nextStats = now + kStatsIntervalMs;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(kFramePeriodMs));
    }

    return 0;
}
