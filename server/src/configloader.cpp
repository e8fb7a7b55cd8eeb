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

#include "configloader.h"
#include "rapidjson/error/en.h"
#include <math.h>
#include <string.h>
#include <fstream>
#include <iostream>
#include <sstream>

using shimmer::Error;
using shimmer::Rgb;
using shimmer::Shape;
using shimmer::Vec;
namespace protocol = shimmer::protocol;

namespace {

// Looks up a member without tripping RapidJSON's assertion on missing keys.
const rapidjson::Value &member(const rapidjson::Value &object, const char *name)
{
    static const rapidjson::Value null;
    if (!object.IsObject()) return null;
    rapidjson::Value::ConstMemberIterator i = object.FindMember(name);
    return i == object.MemberEnd() ? null : i->value;
}

struct NamedOrder {
    const char *name;
    protocol::RgbOrder order;
};
const NamedOrder namedOrders[] = {
    { "rgb", protocol::RgbOrder::rgb },
    { "rbg", protocol::RgbOrder::rbg },
    { "grb", protocol::RgbOrder::grb },
    { "gbr", protocol::RgbOrder::gbr },
    { "brg", protocol::RgbOrder::brg },
    { "bgr", protocol::RgbOrder::bgr },
};

float degreesToRadians(double degrees)
{
    return float(degrees * (shimmer::twoPi / 360.0));
}

} // namespace

ConfigLoader::ConfigLoader(bool verbose)
    : mVerbose(verbose)
{
    reset();
}

void ConfigLoader::reset()
{
    mId = shimmer::PipelineId{ 1, protocol::PatternType::rainbow,
        protocol::NoiseAlgorithm::perlin, protocol::Chipset::ws2812 };
    mShapeCount = 0;
    mPointCount = 0;
    mPixelCount = 0;
    mLayoutError = Error::none;

    mRainbow = shimmer::RainbowParams();
    mNoise = shimmer::NoiseParams();
    mOrder = protocol::defaultOrder(mId.chipset);
    mGlobalBrightness = protocol::apa102::maxBrightness;
    mTimings = protocol::defaultTimings(mId.chipset);
    mSpiFrequency = protocol::defaultSpiFrequency(mId.chipset);
    mCorrection = shimmer::render::CorrectionOptions();

    mUsbVendor = SHIMMER_CONFIG_VENDOR_ID;
    mUsbProduct = SHIMMER_CONFIG_PRODUCT_ID;
    mUsbEndpoint = SHIMMER_CONFIG_OUT_ENDPOINT;
    mPrintStats = false;
}

bool ConfigLoader::loadFile(const char *path)
{
    std::ifstream file(path);
    if (!file) {
        std::clog << "Can't open configuration file '" << path << "'\n";
        return false;
    }

    std::stringstream contents;
    contents << file.rdbuf();
    return parse(contents.str().c_str());
}

bool ConfigLoader::parse(const char *json)
{
    reset();

    Document doc;
    doc.Parse<0>(json);
    if (doc.HasParseError()) {
        std::clog << "Parse error at character " << doc.GetErrorOffset()
                  << ": " << rapidjson::GetParseError_En(doc.GetParseError()) << "\n";
        return false;
    }

    if (!doc.IsObject()) {
        std::clog << "Configuration is not a JSON object\n";
        return false;
    }

    parseConfiguration(doc);
    return true;
}

void ConfigLoader::parseConfiguration(const Value &config)
{
    // Dimensions
    const Value &dimensions = member(config, "dimensions");
    if (dimensions.IsUint() && dimensions.GetUint() >= 1 && dimensions.GetUint() <= 3) {
        mId.dimensions = dimensions.GetUint();
    } else if (!dimensions.IsNull()) {
        std::clog << "Value for 'dimensions' must be 1 to 3, or null (default).\n";
    }

    parseDriver(member(config, "driver"));
    parseLayout(member(config, "layout"), member(config, "pixels"));
    parsePattern(member(config, "pattern"));

    // Brightness
    const Value &brightness = member(config, "brightness");
    if (brightness.IsNumber() && brightness.GetDouble() >= 0.0 && brightness.GetDouble() <= 1.0) {
        mCorrection.brightness = float(brightness.GetDouble());
    } else if (!brightness.IsNull()) {
        std::clog << "Value for 'brightness' must be 0 to 1, or null (default).\n";
    }

    parseColorCorrection(member(config, "color"));

    // Dithering
    const Value &dither = member(config, "dither");
    if (dither.IsBool()) {
        mCorrection.ditherMode = dither.IsTrue() ? protocol::DitherMode::temporal :
                protocol::DitherMode::none;
    } else if (!dither.IsNull()) {
        std::clog << "Value for 'dither' must be true, false, or null (default).\n";
    }

    parseUsb(member(config, "usb"));

    // Statistics
    const Value &printStats = member(member(config, "debug"), "printStats");
    if (printStats.IsBool()) {
        mPrintStats = printStats.IsTrue();
    } else if (!printStats.IsNull()) {
        std::clog << "Value for 'debug.printStats' must be true, false, or null (default).\n";
    }
}

void ConfigLoader::parseLayout(const Value &layout, const Value &pixels)
{
    /*
     * The layout is a list of shapes in wiring order. Dropping any of them
     * would shift every later pixel, so a shape that can't be parsed or a
     * list that is too long is kept as a layout error and fails the build.
     * The remaining shapes are still parsed to report their problems too.
     */

    if (!layout.IsArray()) {
        if (!layout.IsNull()) {
            std::clog << "Value for 'layout' must be a list of shapes.\n";
            mLayoutError = Error::invalidShape;
        }
        return;
    }

    if (layout.Size() > shimmer::config::maxShapes) {
        std::clog << "Layout can have no more than " << shimmer::config::maxShapes << " shapes.\n";
        mLayoutError = Error::tooManyShapes;
    }

    for (rapidjson::SizeType i = 0; i < layout.Size() && mShapeCount < shimmer::config::maxShapes; ++i) {
        bool ok = false;
        switch (mId.dimensions) {
            case 1: ok = parseShape<1>(layout[i], mShapes1[mShapeCount], mPoints1); break;
            case 2: ok = parseShape<2>(layout[i], mShapes2[mShapeCount], mPoints2); break;
            case 3: ok = parseShape<3>(layout[i], mShapes3[mShapeCount], mPoints3); break;
        }
        if (ok) {
            mShapeCount++;
        } else {
            std::clog << "Can't resolve layout shape " << i << ".\n";
            if (mLayoutError == Error::none) mLayoutError = Error::invalidShape;
        }
    }

    switch (mId.dimensions) {
        case 1: mPixelCount = shimmer::totalPixelCount(mShapes1, mShapeCount); break;
        case 2: mPixelCount = shimmer::totalPixelCount(mShapes2, mShapeCount); break;
        case 3: mPixelCount = shimmer::totalPixelCount(mShapes3, mShapeCount); break;
    }

    // An explicit pixel count must agree with the layout.
    if (pixels.IsUint()) {
        if (pixels.GetUint() != mPixelCount && mVerbose) {
            std::clog << "Layout resolves to " << mPixelCount << " pixels but 'pixels' is "
                      << pixels.GetUint() << ".\n";
        }
        mPixelCount = pixels.GetUint();
    } else if (!pixels.IsNull()) {
        std::clog << "Value for 'pixels' must be a positive integer, or null (layout size).\n";
    }
}

template <size_t N>
bool ConfigLoader::parseVec(const Value &value, Vec<N> &out)
{
    if (!value.IsArray() || value.Size() != N) {
        std::clog << "Coordinates must be a list of " << N << " numbers.\n";
        return false;
    }
    for (rapidjson::SizeType i = 0; i < N; ++i) {
        if (!value[i].IsNumber()) {
            std::clog << "Coordinates must be a list of " << N << " numbers.\n";
            return false;
        }
        out.v[i] = float(value[i].GetDouble());
    }
    return true;
}

bool ConfigLoader::parseCount(const Value &value, const char *name, size_t &out)
{
    if (value.IsUint() && value.GetUint() >= 1 && value.GetUint() <= shimmer::config::maxPixels) {
        out = value.GetUint();
        return true;
    }
    std::clog << "Value for '" << name << "' must be 1 to " << shimmer::config::maxPixels << ".\n";
    return false;
}

template <size_t N>
bool ConfigLoader::parseShape(const Value &shape, Shape<N> &out, Vec<N> *points)
{
    const Value &kind = member(shape, "shape");
    if (!kind.IsString()) {
        std::clog << "Each layout entry needs a 'shape' name.\n";
        return false;
    }
    const char *name = kind.GetString();

    if (!strcmp(name, "point")) {
        Vec<N> position{};
        size_t count = 1;
        if (!parseVec(member(shape, "position"), position)) return false;
        if (!member(shape, "count").IsNull() && !parseCount(member(shape, "count"), "count", count)) return false;
        out = Shape<N>::point(position, count);
        return true;
    }

    if (!strcmp(name, "line")) {
        Vec<N> start{}, end{};
        size_t count = 0;
        if (!parseVec(member(shape, "start"), start) || !parseVec(member(shape, "end"), end) ||
            !parseCount(member(shape, "count"), "count", count)) {
            return false;
        }
        out = Shape<N>::line(start, end, count);
        return true;
    }

    if (!strcmp(name, "grid")) {
        Vec<N> start{}, rowEnd{}, colEnd{};
        size_t rows = 0, cols = 0;
        if (!parseVec(member(shape, "start"), start) || !parseVec(member(shape, "rowEnd"), rowEnd) ||
            !parseVec(member(shape, "colEnd"), colEnd) ||
            !parseCount(member(shape, "rows"), "rows", rows) ||
            !parseCount(member(shape, "cols"), "cols", cols)) {
            return false;
        }
        const Value &serpentine = member(shape, "serpentine");
        if (!serpentine.IsBool() && !serpentine.IsNull()) {
            std::clog << "Value for 'serpentine' must be true, false, or null (default).\n";
        }
        out = Shape<N>::grid(start, rowEnd, colEnd, rows, cols, serpentine.IsTrue());
        return true;
    }

    if (!strcmp(name, "arc")) {
        Vec<N> center{};
        size_t count = 0;
        const Value &radius = member(shape, "radius");
        const Value &angleStart = member(shape, "angleStart");
        const Value &angleEnd = member(shape, "angleEnd");
        if (!parseVec(member(shape, "center"), center) ||
            !parseCount(member(shape, "count"), "count", count)) {
            return false;
        }
        if (!radius.IsNumber()) {
            std::clog << "Value for 'radius' must be a number.\n";
            return false;
        }
        if ((!angleStart.IsNumber() && !angleStart.IsNull()) || (!angleEnd.IsNumber() && !angleEnd.IsNull())) {
            std::clog << "Arc angles must be numbers in degrees, or null (full circle).\n";
            return false;
        }
        double start = angleStart.IsNumber() ? angleStart.GetDouble() : 0.0;
        double end = angleEnd.IsNumber() ? angleEnd.GetDouble() : start + 360.0;
        out = Shape<N>::arc(center, float(radius.GetDouble()),
            degreesToRadians(start), degreesToRadians(end), count);
        return true;
    }

    if (!strcmp(name, "points")) {
        const Value &list = member(shape, "points");
        if (!list.IsArray() || list.Empty()) {
            std::clog << "Value for 'points' must be a non-empty list of coordinates.\n";
            return false;
        }
        if (mPointCount + list.Size() > shimmer::config::maxPixels) {
            std::clog << "Point lists can hold no more than " << shimmer::config::maxPixels << " points in total.\n";
            return false;
        }
        Vec<N> *first = points + mPointCount;
        for (rapidjson::SizeType i = 0; i < list.Size(); ++i) {
            if (!parseVec(list[i], first[i])) return false;
        }
        mPointCount += list.Size();
        out = Shape<N>::pointList(first, list.Size());
        return true;
    }

    std::clog << "Unknown shape '" << name << "'.\n";
    return false;
}

bool ConfigLoader::parseRgb(const Value &value, Rgb &out)
{
    if (value.IsArray() && value.Size() == 3 &&
        value[0u].IsNumber() && value[1].IsNumber() && value[2].IsNumber()) {
        out = Rgb{ float(value[0u].GetDouble()), float(value[1].GetDouble()), float(value[2].GetDouble()) };
        return true;
    }
    return false;
}

void ConfigLoader::parsePattern(const Value &pattern)
{
    if (pattern.IsNull()) return;  // assume default values
    if (!pattern.IsObject()) {
        std::clog << "Pattern must be a JSON dictionary object.\n";
        return;
    }

    const Value &type = member(pattern, "type");
    if (type.IsString() && !strcmp(type.GetString(), "rainbow")) {
        mId.pattern = protocol::PatternType::rainbow;
    } else if (type.IsString() && !strcmp(type.GetString(), "noise")) {
        mId.pattern = protocol::PatternType::noise;
    } else if (!type.IsNull()) {
        std::clog << "Value for 'pattern.type' must be \"rainbow\", \"noise\", or null (default).\n";
    }

    const Value &algorithm = member(pattern, "algorithm");
    if (algorithm.IsString() && !strcmp(algorithm.GetString(), "perlin")) {
        mId.algorithm = protocol::NoiseAlgorithm::perlin;
    } else if (algorithm.IsString() && !strcmp(algorithm.GetString(), "simplex")) {
        mId.algorithm = protocol::NoiseAlgorithm::simplex;
    } else if (algorithm.IsString() && !strcmp(algorithm.GetString(), "opensimplex")) {
        mId.algorithm = protocol::NoiseAlgorithm::openSimplex;
    } else if (!algorithm.IsNull()) {
        std::clog << "Value for 'pattern.algorithm' must be \"perlin\", \"simplex\", \"opensimplex\", or null (default).\n";
    }

    const Value &positionScalar = member(pattern, "positionScalar");
    if (positionScalar.IsNumber()) {
        mRainbow.positionScalar = mNoise.positionScalar = float(positionScalar.GetDouble());
    } else if (!positionScalar.IsNull()) {
        std::clog << "Value for 'pattern.positionScalar' must be a number.\n";
    }

    const Value &timeScalar = member(pattern, "timeScalar");
    if (timeScalar.IsNumber()) {
        mRainbow.timeScalar = mNoise.timeScalar = float(timeScalar.GetDouble());
    } else if (!timeScalar.IsNull()) {
        std::clog << "Value for 'pattern.timeScalar' must be a number.\n";
    }

    const Value &mapping = member(pattern, "mapping");
    if (mapping.IsString() && !strcmp(mapping.GetString(), "hue")) {
        mNoise.mapping = protocol::NoiseMapping::hue;
    } else if (mapping.IsString() && !strcmp(mapping.GetString(), "gradient")) {
        mNoise.mapping = protocol::NoiseMapping::gradient;
    } else if (!mapping.IsNull()) {
        std::clog << "Value for 'pattern.mapping' must be \"hue\", \"gradient\", or null (default).\n";
    }

    const Value &low = member(pattern, "low");
    if (!low.IsNull() && !parseRgb(low, mNoise.low)) {
        std::clog << "Value for 'pattern.low' must be a list of 3 numbers.\n";
    }
    const Value &high = member(pattern, "high");
    if (!high.IsNull() && !parseRgb(high, mNoise.high)) {
        std::clog << "Value for 'pattern.high' must be a list of 3 numbers.\n";
    }

    const Value &seed = member(pattern, "seed");
    if (seed.IsUint()) {
        mNoise.seed = seed.GetUint();
    } else if (!seed.IsNull()) {
        std::clog << "Value for 'pattern.seed' must be a non-negative integer.\n";
    }
}

void ConfigLoader::parseDriver(const Value &driver)
{
    if (driver.IsNull()) return;  // assume default values
    if (!driver.IsObject()) {
        std::clog << "Driver must be a JSON dictionary object.\n";
        return;
    }

    // Chipset, which also sets the defaults below.
    const Value &chipset = member(driver, "chipset");
    if (chipset.IsString()) {
        const protocol::Chipset *found = protocol::chipsetByName(chipset.GetString());
        if (found) {
            mId.chipset = *found;
            mOrder = protocol::defaultOrder(mId.chipset);
            if (!protocol::isClocked(mId.chipset)) {
                mTimings = protocol::defaultTimings(mId.chipset);
                mSpiFrequency = protocol::defaultSpiFrequency(mId.chipset);
            }
        } else {
            std::clog << "Unknown chipset '" << chipset.GetString() << "'.\n";
        }
    } else if (!chipset.IsNull()) {
        std::clog << "Value for 'driver.chipset' must be a chipset name.\n";
    }

    const Value &order = member(driver, "order");
    if (order.IsString()) {
        bool found = false;
        for (const auto &elem : namedOrders) {
            if (!strcmp(elem.name, order.GetString())) {
                mOrder = elem.order;
                found = true;
            }
        }
        if (!found) {
            std::clog << "Value for 'driver.order' must be a permutation of \"rgb\".\n";
        }
    } else if (!order.IsNull()) {
        std::clog << "Value for 'driver.order' must be a permutation of \"rgb\", or null (default).\n";
    }

    const Value &globalBrightness = member(driver, "globalBrightness");
    if (globalBrightness.IsUint() && globalBrightness.GetUint() <= protocol::apa102::maxBrightness) {
        mGlobalBrightness = uint8_t(globalBrightness.GetUint());
    } else if (!globalBrightness.IsNull()) {
        std::clog << "Value for 'driver.globalBrightness' must be 0 to 31, or null (default).\n";
    }

    // Timings by preset name or as [t0h, t0l, t1h, t1l, reset] in nanoseconds.
    const Value &timings = member(driver, "timings");
    if (timings.IsString()) {
        const shimmer::led::Timings *preset = shimmer::led::timingsByName(timings.GetString());
        if (preset) {
            mTimings = *preset;
        } else {
            std::clog << "Unknown timings '" << timings.GetString() << "'.\n";
        }
    } else if (timings.IsArray() && timings.Size() == 5 &&
        timings[0u].IsUint() && timings[1].IsUint() && timings[2].IsUint() &&
        timings[3].IsUint() && timings[4].IsUint()) {
        shimmer::led::Timings custom = { timings[0u].GetUint(), timings[1].GetUint(),
            timings[2].GetUint(), timings[3].GetUint(), timings[4].GetUint() };
        if (shimmer::led::validateTimings(custom)) {
            mTimings = custom;
        } else {
            std::clog << "Timings are out of range, using defaults.\n";
        }
    } else if (!timings.IsNull()) {
        std::clog << "Value for 'driver.timings' must be a preset name or a list of 5 durations in ns.\n";
    }

    const Value &spiFrequency = member(driver, "spiFrequency");
    if (spiFrequency.IsUint() && spiFrequency.GetUint() > 0 &&
        spiFrequency.GetUint() <= protocol::clockless::maxSpiFrequency) {
        mSpiFrequency = spiFrequency.GetUint();
    } else if (!spiFrequency.IsNull()) {
        std::clog << "Value for 'driver.spiFrequency' must be 1 to "
                  << protocol::clockless::maxSpiFrequency << " Hz, or null (default).\n";
    }
}

void ConfigLoader::parseColorCorrection(const Value &color)
{
    /*
     * 'color' may be null to keep the defaults, or a dictionary of options
     * including 'gamma', 'whitepoint', 'linearSlope' and 'linearCutoff'.
     * Out-of-range curves are left for the build to reject.
     */

    if (color.IsObject()) {
        const Value &vGamma = member(color, "gamma");
        const Value &vWhitepoint = member(color, "whitepoint");
        const Value &vLinearSlope = member(color, "linearSlope");
        const Value &vLinearCutoff = member(color, "linearCutoff");

        if (vGamma.IsNumber()) {
            mCorrection.gamma = float(vGamma.GetDouble());
        } else if (!vGamma.IsNull()) {
            std::clog << "Gamma value must be a number.\n";
        }

        if (vLinearSlope.IsNumber()) {
            mCorrection.linearSlope = float(vLinearSlope.GetDouble());
        } else if (!vLinearSlope.IsNull()) {
            std::clog << "Linear slope value must be a number.\n";
        }

        if (vLinearCutoff.IsNumber()) {
            mCorrection.linearCutoff = float(vLinearCutoff.GetDouble());
        } else if (!vLinearCutoff.IsNull()) {
            std::clog << "Linear cutoff value must be a number.\n";
        }

        Rgb whitepoint;
        if (parseRgb(vWhitepoint, whitepoint)) {
            mCorrection.whitepoint = shimmer::render::ColorCorrection{ whitepoint.r, whitepoint.g, whitepoint.b };
        } else if (!vWhitepoint.IsNull()) {
            std::clog << "Whitepoint value must be a list of 3 numbers.\n";
        }

    } else if (!color.IsNull()) {
        std::clog << "Color correction value must be a JSON dictionary object.\n";
    }
}

void ConfigLoader::parseUsb(const Value &usb)
{
    if (usb.IsNull()) return;
    if (!usb.IsObject()) {
        std::clog << "USB options must be a JSON dictionary object.\n";
        return;
    }

    const Value &vendor = member(usb, "vendor");
    if (vendor.IsUint() && vendor.GetUint() <= 0xffff) {
        mUsbVendor = uint16_t(vendor.GetUint());
    } else if (!vendor.IsNull()) {
        std::clog << "Value for 'usb.vendor' must be 0 to 65535, or null (default).\n";
    }

    const Value &product = member(usb, "product");
    if (product.IsUint() && product.GetUint() <= 0xffff) {
        mUsbProduct = uint16_t(product.GetUint());
    } else if (!product.IsNull()) {
        std::clog << "Value for 'usb.product' must be 0 to 65535, or null (default).\n";
    }

    const Value &endpoint = member(usb, "endpoint");
    if (endpoint.IsUint() && endpoint.GetUint() >= 1 && endpoint.GetUint() <= 15) {
        mUsbEndpoint = uint8_t(endpoint.GetUint());
    } else if (!endpoint.IsNull()) {
        std::clog << "Value for 'usb.endpoint' must be 1 to 15, or null (default).\n";
    }
}

shimmer::PipelineOptions ConfigLoader::pipelineOptions(shimmer::led::ByteWriter *writer,
    shimmer::led::PulseWriter *pulseWriter) const
{
    shimmer::PipelineOptions options;
    options.shapes1 = mShapes1;
    options.shapes2 = mShapes2;
    options.shapes3 = mShapes3;
    options.shapeCount = mShapeCount;
    options.rainbow = mRainbow;
    options.noise = mNoise;

    options.clocked.writer = writer;
    options.clocked.pixelCount = mPixelCount;
    options.clocked.order = mOrder;
    options.clocked.globalBrightness = mGlobalBrightness;

    options.clockless.writer = writer;
    options.clockless.pulseWriter = pulseWriter;
    options.clockless.pixelCount = mPixelCount;
    options.clockless.order = mOrder;
    options.clockless.timings = mTimings;
    options.clockless.spiFrequency = mSpiFrequency;

    options.correction = mCorrection;
    options.layoutError = mLayoutError;
    return options;
}
