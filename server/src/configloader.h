/*
 * Shimmer host configuration loader.
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

#include <stdint.h>
#include <stddef.h>

#include "rapidjson/document.h"
#include "control.h"

class ConfigLoader {
public:
    typedef rapidjson::Value Value;
    typedef rapidjson::Document Document;

    ConfigLoader(bool verbose);

    // Parses a JSON configuration document. Problems with individual keys
    // are reported on std::clog and replaced with defaults, except layout
    // problems, which are kept for the build to fail on. Returns false only
    // if the document isn't a JSON object at all.
    bool parse(const char *json);

    // Reads and parses a file.
    bool loadFile(const char *path);

    const shimmer::PipelineId &pipelineId() const { return mId; }

    // Options for building the configured pipeline, with the given
    // transports plugged into the driver.
    shimmer::PipelineOptions pipelineOptions(shimmer::led::ByteWriter *writer,
        shimmer::led::PulseWriter *pulseWriter = nullptr) const;

    size_t shapeCount() const { return mShapeCount; }
    size_t pixelCount() const { return mPixelCount; }

    // Error::invalidShape or Error::tooManyShapes if the layout couldn't be
    // taken as written. Passed on to the build through pipelineOptions().
    shimmer::Error layoutError() const { return mLayoutError; }

    uint16_t usbVendor() const { return mUsbVendor; }
    uint16_t usbProduct() const { return mUsbProduct; }
    uint8_t usbEndpoint() const { return mUsbEndpoint; }
    bool printStats() const { return mPrintStats; }

private:
    bool mVerbose;

    shimmer::PipelineId mId;
    size_t mShapeCount;
    size_t mPointCount;
    size_t mPixelCount;
    shimmer::Error mLayoutError;

    shimmer::Shape<1> mShapes1[shimmer::config::maxShapes];
    shimmer::Shape<2> mShapes2[shimmer::config::maxShapes];
    shimmer::Shape<3> mShapes3[shimmer::config::maxShapes];
    shimmer::Vec<1> mPoints1[shimmer::config::maxPixels];
    shimmer::Vec<2> mPoints2[shimmer::config::maxPixels];
    shimmer::Vec<3> mPoints3[shimmer::config::maxPixels];

    shimmer::RainbowParams mRainbow;
    shimmer::NoiseParams mNoise;
    shimmer::protocol::RgbOrder mOrder;
    uint8_t mGlobalBrightness;
    shimmer::led::Timings mTimings;
    uint32_t mSpiFrequency;
    shimmer::render::CorrectionOptions mCorrection;

    uint16_t mUsbVendor;
    uint16_t mUsbProduct;
    uint8_t mUsbEndpoint;
    bool mPrintStats;

    void reset();
    void parseConfiguration(const Value &config);
    void parseLayout(const Value &layout, const Value &pixels);
    void parsePattern(const Value &pattern);
    void parseDriver(const Value &driver);
    void parseColorCorrection(const Value &color);
    void parseUsb(const Value &usb);

    template <size_t N> bool parseShape(const Value &shape, shimmer::Shape<N> &out, shimmer::Vec<N> *points);
    template <size_t N> bool parseVec(const Value &value, shimmer::Vec<N> &out);
    bool parseRgb(const Value &value, shimmer::Rgb &out);
    bool parseCount(const Value &value, const char *name, size_t &out);
};
