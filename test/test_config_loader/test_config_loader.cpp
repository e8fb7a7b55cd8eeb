/*
 * Host configuration loader tests.
 */

#include <unity.h>
#include <string>

#include "configloader.h"
#include "../mocks/recording_writers.h"

using namespace shimmer;
using shimmer::test::RecordingByteWriter;

void setUp(void) {}
void tearDown(void) {}

// The loader holds whole point buffers, keep it off the stack.
static ConfigLoader loader(false);
static PipelineHolder holder;

void test_defaults(void) {
    TEST_ASSERT(loader.parse("{ \"layout\": [ { \"shape\": \"line\", \"start\": [-1], \"end\": [1], \"count\": 8 } ] }"));

    const PipelineId& id = loader.pipelineId();
    TEST_ASSERT_EQUAL(1, id.dimensions);
    TEST_ASSERT_EQUAL(protocol::PatternType::rainbow, id.pattern);
    TEST_ASSERT_EQUAL(protocol::Chipset::ws2812, id.chipset);
    TEST_ASSERT_EQUAL(1, loader.shapeCount());
    TEST_ASSERT_EQUAL(8, loader.pixelCount());
    TEST_ASSERT_EQUAL(Error::none, loader.layoutError());
    TEST_ASSERT_EQUAL_HEX16(SHIMMER_CONFIG_VENDOR_ID, loader.usbVendor());
    TEST_ASSERT_FALSE(loader.printStats());

    RecordingByteWriter writer;
    PipelineOptions options = loader.pipelineOptions(&writer);
    TEST_ASSERT_EQUAL(8, options.clockless.pixelCount);
    TEST_ASSERT_EQUAL(protocol::RgbOrder::grb, options.clockless.order);
    TEST_ASSERT_EQUAL_FLOAT(config::defaultGamma, options.correction.gamma);
    TEST_ASSERT_EQUAL(protocol::DitherMode::temporal, options.correction.ditherMode);
}

void test_full_configuration(void) {
    const char* json =
        "{"
        "  \"dimensions\": 2,"
        "  \"layout\": ["
        "    { \"shape\": \"grid\", \"start\": [-1, -1], \"rowEnd\": [1, -1], \"colEnd\": [-1, 1],"
        "      \"rows\": 4, \"cols\": 5, \"serpentine\": true },"
        "    { \"shape\": \"arc\", \"center\": [0, 0], \"radius\": 0.5, \"count\": 6 },"
        "    { \"shape\": \"points\", \"points\": [[0.1, 0.2], [0.3, 0.4]] },"
        "    { \"shape\": \"point\", \"position\": [0, 0] }"
        "  ],"
        "  \"pixels\": 29,"
        "  \"pattern\": { \"type\": \"noise\", \"algorithm\": \"opensimplex\", \"positionScalar\": 2,"
        "                \"timeScalar\": 0.001, \"mapping\": \"gradient\", \"low\": [0, 0, 0.5],"
        "                \"high\": [1, 0.5, 0], \"seed\": 42 },"
        "  \"driver\": { \"chipset\": \"apa102\", \"order\": \"rgb\", \"globalBrightness\": 7 },"
        "  \"brightness\": 0.25,"
        "  \"color\": { \"gamma\": 2.2, \"whitepoint\": [1, 0.9, 0.8], \"linearSlope\": 0.5,"
        "              \"linearCutoff\": 0.01 },"
        "  \"dither\": false,"
        "  \"usb\": { \"vendor\": 4660, \"product\": 22136, \"endpoint\": 2 },"
        "  \"debug\": { \"printStats\": true }"
        "}";
    TEST_ASSERT(loader.parse(json));

    const PipelineId& id = loader.pipelineId();
    TEST_ASSERT_EQUAL(2, id.dimensions);
    TEST_ASSERT_EQUAL(protocol::PatternType::noise, id.pattern);
    TEST_ASSERT_EQUAL(protocol::NoiseAlgorithm::openSimplex, id.algorithm);
    TEST_ASSERT_EQUAL(protocol::Chipset::apa102, id.chipset);
    TEST_ASSERT_EQUAL(4, loader.shapeCount());
    TEST_ASSERT_EQUAL(29, loader.pixelCount());

    RecordingByteWriter writer;
    PipelineOptions options = loader.pipelineOptions(&writer);
    TEST_ASSERT_EQUAL(protocol::RgbOrder::rgb, options.clocked.order);
    TEST_ASSERT_EQUAL_UINT8(7, options.clocked.globalBrightness);
    TEST_ASSERT_EQUAL_FLOAT(2.0f, options.noise.positionScalar);
    TEST_ASSERT_EQUAL(protocol::NoiseMapping::gradient, options.noise.mapping);
    TEST_ASSERT_EQUAL_FLOAT(0.5f, options.noise.low.b);
    TEST_ASSERT_EQUAL(42, options.noise.seed);
    TEST_ASSERT_EQUAL_FLOAT(0.25f, options.correction.brightness);
    TEST_ASSERT_EQUAL_FLOAT(2.2f, options.correction.gamma);
    TEST_ASSERT_EQUAL_FLOAT(0.8f, options.correction.whitepoint.blue);
    TEST_ASSERT_EQUAL(protocol::DitherMode::none, options.correction.ditherMode);
    TEST_ASSERT_EQUAL_HEX16(0x1234, loader.usbVendor());
    TEST_ASSERT_EQUAL_HEX16(0x5678, loader.usbProduct());
    TEST_ASSERT_EQUAL_UINT8(2, loader.usbEndpoint());
    TEST_ASSERT(loader.printStats());

    // Point list coordinates are kept by the loader.
    TEST_ASSERT_EQUAL(ShapeKind::pointList, options.shapes2[2].kind);
    TEST_ASSERT_EQUAL_FLOAT(0.3f, options.shapes2[2].pointAt(1).x());

    TEST_ASSERT_EQUAL(Error::none, holder.init(id, options));
    TEST_ASSERT_EQUAL(Error::none, holder.get()->tick(0));
    TEST_ASSERT_EQUAL(protocol::apa102::frameSize(29), writer.last.size());
    holder.clear();
}

void test_timings_and_spi_frequency(void) {
    TEST_ASSERT(loader.parse(
        "{ \"layout\": [ { \"shape\": \"point\", \"position\": [0], \"count\": 2 } ],"
        "  \"driver\": { \"chipset\": \"ws2812\", \"timings\": \"ws2811\", \"spiFrequency\": 1600000 } }"));
    RecordingByteWriter writer;
    PipelineOptions options = loader.pipelineOptions(&writer);
    TEST_ASSERT_EQUAL(led::timingsWS2811.t0l, options.clockless.timings.t0l);
    TEST_ASSERT_EQUAL(1600000, options.clockless.spiFrequency);
    TEST_ASSERT_EQUAL(Error::none, holder.init(loader.pipelineId(), options));
    holder.clear();

    TEST_ASSERT(loader.parse(
        "{ \"layout\": [ { \"shape\": \"point\", \"position\": [0] } ],"
        "  \"driver\": { \"chipset\": \"sk6812-rgbw\", \"timings\": [300, 900, 600, 600, 80000] } }"));
    options = loader.pipelineOptions(&writer);
    TEST_ASSERT_EQUAL(protocol::Chipset::sk6812Rgbw, loader.pipelineId().chipset);
    TEST_ASSERT_EQUAL(protocol::clockless::spiFrequencySK6812, options.clockless.spiFrequency);
    TEST_ASSERT_EQUAL(80000, options.clockless.timings.reset);
}

void test_invalid_values_fall_back_to_defaults(void) {
    TEST_ASSERT(loader.parse(
        "{ \"dimensions\": 7, \"brightness\": \"bright\", \"dither\": 3,"
        "  \"driver\": { \"chipset\": \"neopixel\", \"globalBrightness\": 99, \"timings\": [1, 2] },"
        "  \"pattern\": { \"type\": \"plasma\" },"
        "  \"layout\": [ { \"shape\": \"line\", \"start\": [0], \"end\": [1], \"count\": 4 } ] }"));

    const PipelineId& id = loader.pipelineId();
    TEST_ASSERT_EQUAL(1, id.dimensions);
    TEST_ASSERT_EQUAL(protocol::PatternType::rainbow, id.pattern);
    TEST_ASSERT_EQUAL(protocol::Chipset::ws2812, id.chipset);

    RecordingByteWriter writer;
    PipelineOptions options = loader.pipelineOptions(&writer);
    TEST_ASSERT_EQUAL_FLOAT(config::defaultBrightness, options.correction.brightness);
    TEST_ASSERT_EQUAL(protocol::DitherMode::temporal, options.correction.ditherMode);
    TEST_ASSERT_EQUAL_UINT8(31, options.clocked.globalBrightness);
    TEST_ASSERT_EQUAL(led::timingsWS2812.t0h, options.clockless.timings.t0h);
}

void test_bad_shapes_fail_the_build(void) {
    TEST_ASSERT(loader.parse(
        "{ \"layout\": ["
        "    { \"shape\": \"spiral\" },"
        "    { \"shape\": \"line\", \"start\": [0, 1], \"end\": [1], \"count\": 3 },"
        "    { \"shape\": \"line\", \"start\": [0], \"end\": [1], \"count\": 3 }"
        "  ] }"));
    TEST_ASSERT_EQUAL(Error::invalidShape, loader.layoutError());

    // The one good shape would build on its own, the pipeline must not.
    RecordingByteWriter writer;
    PipelineOptions options = loader.pipelineOptions(&writer);
    TEST_ASSERT_EQUAL(Error::invalidShape, options.layoutError);
    TEST_ASSERT_EQUAL(Error::invalidShape, holder.init(loader.pipelineId(), options));
    TEST_ASSERT_NULL(holder.get());

    TEST_ASSERT(loader.parse("{ \"layout\": { \"shape\": \"point\", \"position\": [0] } }"));
    TEST_ASSERT_EQUAL(Error::invalidShape, holder.init(loader.pipelineId(), loader.pipelineOptions(&writer)));
}

void test_too_many_shapes_fail_the_build(void) {
    std::string json = "{ \"layout\": [";
    for (size_t i = 0; i <= config::maxShapes; ++i) {
        if (i) json += ",";
        json += " { \"shape\": \"point\", \"position\": [0] }";
    }
    json += " ] }";

    TEST_ASSERT(loader.parse(json.c_str()));
    TEST_ASSERT_EQUAL(Error::tooManyShapes, loader.layoutError());
    TEST_ASSERT_EQUAL(config::maxShapes, loader.shapeCount());

    RecordingByteWriter writer;
    TEST_ASSERT_EQUAL(Error::tooManyShapes, holder.init(loader.pipelineId(), loader.pipelineOptions(&writer)));
    TEST_ASSERT_NULL(holder.get());
}

void test_layout_errors_reach_the_build(void) {
    RecordingByteWriter writer;

    TEST_ASSERT(loader.parse("{ \"driver\": { \"chipset\": \"lpd8806\" } }"));
    TEST_ASSERT_EQUAL(Error::missingLayout, holder.init(loader.pipelineId(), loader.pipelineOptions(&writer)));

    TEST_ASSERT(loader.parse(
        "{ \"layout\": [ { \"shape\": \"point\", \"position\": [0], \"count\": 3 } ], \"pixels\": 5 }"));
    TEST_ASSERT_EQUAL(Error::pixelCountMismatch, holder.init(loader.pipelineId(), loader.pipelineOptions(&writer)));

    TEST_ASSERT(loader.parse(
        "{ \"layout\": [ { \"shape\": \"point\", \"position\": [0] } ], \"color\": { \"gamma\": 0 } }"));
    TEST_ASSERT_EQUAL(Error::invalidGamma, holder.init(loader.pipelineId(), loader.pipelineOptions(&writer)));
    TEST_ASSERT_NULL(holder.get());
}

void test_rejects_malformed_documents(void) {
    TEST_ASSERT_FALSE(loader.parse("{ \"layout\": [ "));
    TEST_ASSERT_FALSE(loader.parse("[1, 2, 3]"));
    TEST_ASSERT_FALSE(loader.loadFile("/nonexistent/shimmer.json"));
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_defaults);
    RUN_TEST(test_full_configuration);
    RUN_TEST(test_timings_and_spi_frequency);
    RUN_TEST(test_invalid_values_fall_back_to_defaults);
    RUN_TEST(test_bad_shapes_fail_the_build);
    RUN_TEST(test_too_many_shapes_fail_the_build);
    RUN_TEST(test_layout_errors_reach_the_build);
    RUN_TEST(test_rejects_malformed_documents);
    return UNITY_END();
}
