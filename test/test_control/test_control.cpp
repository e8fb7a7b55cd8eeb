/*
 * Pipeline build and tick tests.
 */

#include <unity.h>
#include <string>

#include "control.h"
#include "../mocks/recording_writers.h"

using namespace shimmer;
using shimmer::test::FailingByteWriter;
using shimmer::test::RecordingByteWriter;

void setUp(void) {}
void tearDown(void) {}

using RainbowStrip = Control<1, 8, Rainbow<1>, led::Apa102Driver<8>>;

static const Shape<1> strip[] = { Shape<1>::line(vec(0.0f), vec(0.0f), 3) };

static RainbowParams stillRainbow() {
    RainbowParams params;
    params.timeScalar = 0.0f;
    return params;
}

static led::ClockedOptions clocked(led::ByteWriter* writer, size_t pixels) {
    led::ClockedOptions options;
    options.writer = writer;
    options.pixelCount = pixels;
    return options;
}

static auto rainbowBuilder(led::ByteWriter* writer, size_t pixels) {
    return ControlBuilder<1, 8>()
            .withLayout(strip)
            .withPattern<Rainbow<1>>(stillRainbow())
            .withDriver<led::Apa102Driver<8>>(clocked(writer, pixels))
            .withGamma(1.0f)
            .withDither(protocol::DitherMode::none);
}

void test_build_and_tick(void) {
    RecordingByteWriter writer;
    ControlStorage<RainbowStrip> mem;
    Error error = Error::transmission;
    RainbowStrip* control = rainbowBuilder(&writer, 3).build(&mem, &error);

    TEST_ASSERT_EQUAL(Error::none, error);
    TEST_ASSERT_NOT_NULL(control);
    TEST_ASSERT_EQUAL(3, control->pixelCount());
    TEST_ASSERT_EQUAL(0, writer.writes);

    TEST_ASSERT_EQUAL(Error::none, control->tick(0));
    TEST_ASSERT_EQUAL(1, writer.writes);
    TEST_ASSERT_EQUAL(1, control->stats().frames);

    // Every pixel sits at x = 0, which is red.
    const uint8_t expected[] = {
        0x00, 0x00, 0x00, 0x00,
        0xff, 0x00, 0x00, 0xff,
        0xff, 0x00, 0x00, 0xff,
        0xff, 0x00, 0x00, 0xff,
        0x00,
    };
    TEST_ASSERT_EQUAL(sizeof expected, writer.last.size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, writer.last.data(), sizeof expected);
    TEST_ASSERT_EQUAL_UINT8(255, control->frame()[2].r);

    control->~RainbowStrip();
}

void test_brightness_applies_on_next_tick(void) {
    RecordingByteWriter writer;
    ControlStorage<RainbowStrip> mem;
    RainbowStrip* control = rainbowBuilder(&writer, 3).build(&mem, nullptr);
    TEST_ASSERT_NOT_NULL(control);

    control->setBrightness(0.0f);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, control->brightness());
    TEST_ASSERT_EQUAL(Error::none, control->tick(100));
    for (size_t i = 4; i < 16; i += 4) {
        TEST_ASSERT_EQUAL_HEX8(0xff, writer.last[i]);
        TEST_ASSERT_EQUAL_HEX8(0x00, writer.last[i + 1]);
        TEST_ASSERT_EQUAL_HEX8(0x00, writer.last[i + 2]);
        TEST_ASSERT_EQUAL_HEX8(0x00, writer.last[i + 3]);
    }
    control->~RainbowStrip();
}

void test_build_errors(void) {
    RecordingByteWriter writer;
    ControlStorage<RainbowStrip> mem;
    Error error = Error::none;

    TEST_ASSERT_NULL(rainbowBuilder(&writer, 4).build(&mem, &error));
    TEST_ASSERT_EQUAL(Error::pixelCountMismatch, error);

    TEST_ASSERT_NULL(rainbowBuilder(nullptr, 3).build(&mem, &error));
    TEST_ASSERT_EQUAL(Error::missingChannel, error);

    TEST_ASSERT_NULL(rainbowBuilder(&writer, 9).build(&mem, &error));
    TEST_ASSERT_EQUAL(Error::capacityExceeded, error);

    TEST_ASSERT_NULL(rainbowBuilder(&writer, 3).withGamma(-1.0f).build(&mem, &error));
    TEST_ASSERT_EQUAL(Error::invalidGamma, error);

    TEST_ASSERT_NULL(rainbowBuilder(&writer, 3).withLayout(strip, 0).build(&mem, &error));
    TEST_ASSERT_EQUAL(Error::missingLayout, error);

    TEST_ASSERT_EQUAL(0, writer.writes);
}

void test_transmission_errors_are_counted(void) {
    FailingByteWriter writer(1);
    ControlStorage<RainbowStrip> mem;
    RainbowStrip* control = rainbowBuilder(&writer, 3).build(&mem, nullptr);
    TEST_ASSERT_NOT_NULL(control);

    TEST_ASSERT_EQUAL(Error::none, control->tick(0));
    TEST_ASSERT_EQUAL(Error::transmission, control->tick(10));
    TEST_ASSERT_EQUAL(Error::transmission, control->tick(20));

    TEST_ASSERT_EQUAL(3, control->stats().frames);
    TEST_ASSERT_EQUAL(2, control->stats().transmissionErrors);
    control->~RainbowStrip();
}

void test_noise_pipeline_on_a_grid(void) {
    using NoiseGrid = Control<2, 16, SimplexNoise<2>, led::ClocklessSpiDriver<16>>;
    const Shape<2> grid[] = { Shape<2>::grid(vec(-1, -1), vec(1, -1), vec(-1, 1), 3, 4, true) };

    RecordingByteWriter writer;
    led::ClocklessOptions options;
    options.writer = &writer;
    options.pixelCount = 12;

    ControlStorage<NoiseGrid> mem;
    Error error = Error::none;
    NoiseGrid* control = ControlBuilder<2, 16>()
            .withLayout(grid)
            .withPattern<SimplexNoise<2>>(NoiseParams())
            .withDriver<led::ClocklessSpiDriver<16>>(options)
            .withBrightness(0.5f)
            .build(&mem, &error);
    TEST_ASSERT_EQUAL(Error::none, error);
    TEST_ASSERT_NOT_NULL(control);
    TEST_ASSERT_EQUAL(12, control->layout().size());

    TEST_ASSERT_EQUAL(Error::none, control->tick(1000));
    TEST_ASSERT_EQUAL(12 * 3 * 3 + 15, writer.last.size());
    control->~NoiseGrid();
}

static PipelineHolder holder;

void test_holder_builds_runtime_selection(void) {
    static const Shape<2> shapes[] = { Shape<2>::line(vec(-1, 0), vec(1, 0), 10) };
    RecordingByteWriter writer;

    PipelineOptions options;
    options.shapes2 = shapes;
    options.shapeCount = 1;
    options.clocked.writer = &writer;
    options.clocked.pixelCount = 10;

    PipelineId id = { 2, protocol::PatternType::noise, protocol::NoiseAlgorithm::openSimplex,
            protocol::Chipset::apa102 };
    TEST_ASSERT_EQUAL(Error::none, holder.init(id, options));
    TEST_ASSERT_NOT_NULL(holder.get());
    TEST_ASSERT_EQUAL(10, holder.get()->pixelCount());
    TEST_ASSERT_EQUAL(Error::none, holder.get()->tick(0));
    TEST_ASSERT_EQUAL(protocol::apa102::frameSize(10), writer.last.size());

    holder.clear();
    TEST_ASSERT_NULL(holder.get());
}

void test_holder_reports_build_errors(void) {
    PipelineOptions options;
    PipelineId id = { 1, protocol::PatternType::rainbow, protocol::NoiseAlgorithm::perlin,
            protocol::Chipset::ws2812 };

    // No transport and no layout.
    TEST_ASSERT_EQUAL(Error::missingChannel, holder.init(id, options));
    TEST_ASSERT_NULL(holder.get());

    id.dimensions = 4;
    TEST_ASSERT_EQUAL(Error::unknownPipeline, holder.init(id, options));
    TEST_ASSERT_NULL(holder.get());
    TEST_ASSERT_EQUAL(48, PipelineHolder::compiledPipelines());
}

static std::string dumped;

static void captureSink(const char* text) {
    dumped += text;
}

void test_dump_build_options(void) {
    debug::setSink(captureSink);
    PipelineId id = { 3, protocol::PatternType::noise, protocol::NoiseAlgorithm::perlin,
            protocol::Chipset::sk6812Rgbw };
    dumpBuildOptions(id, render::CorrectionOptions());
    debug::setSink(nullptr);

    TEST_ASSERT(dumped.find("- dimensions: 3\r\n") != std::string::npos);
    TEST_ASSERT(dumped.find("- pattern: perlin noise\r\n") != std::string::npos);
    TEST_ASSERT(dumped.find("- chipset: sk6812-rgbw\r\n") != std::string::npos);
    TEST_ASSERT(dumped.find("- gamma: 2.800\r\n") != std::string::npos);
}

void test_build_errors_go_to_the_debug_sink(void) {
    RecordingByteWriter writer;
    ControlStorage<RainbowStrip> mem;
    Error error = Error::none;

    dumped.clear();
    debug::setSink(captureSink);
    TEST_ASSERT_NULL(rainbowBuilder(&writer, 4).build(&mem, &error));
    debug::setSink(nullptr);

    TEST_ASSERT_EQUAL_STRING("Can't build pipeline: pixel count mismatch\r\n", dumped.c_str());
}

void test_transmission_errors_go_to_the_debug_sink(void) {
    FailingByteWriter writer(1);
    ControlStorage<RainbowStrip> mem;
    RainbowStrip* control = rainbowBuilder(&writer, 3).build(&mem, nullptr);
    TEST_ASSERT_NOT_NULL(control);

    dumped.clear();
    debug::setSink(captureSink);
    TEST_ASSERT_EQUAL(Error::none, control->tick(0));
    TEST_ASSERT_EQUAL(Error::transmission, control->tick(10));
    TEST_ASSERT_EQUAL(Error::transmission, control->tick(20));
    debug::setSink(nullptr);

    // One line for the run of failures, the counter keeps the total.
    TEST_ASSERT_EQUAL_STRING("Frame 2 dropped: transmission failed\r\n", dumped.c_str());
    TEST_ASSERT_EQUAL(2, control->stats().transmissionErrors);
    control->~RainbowStrip();
}

void test_color_correction_applies_on_next_tick(void) {
    RecordingByteWriter writer;
    ControlStorage<RainbowStrip> mem;
    Pipeline* pipeline = rainbowBuilder(&writer, 3).build(&mem, nullptr);
    TEST_ASSERT_NOT_NULL(pipeline);

    TEST_ASSERT_EQUAL(Error::none, pipeline->tick(0));
    TEST_ASSERT_EQUAL_UINT8(255, pipeline->frame()[0].r);

    pipeline->setColorCorrection(render::ColorCorrection{ 0.5f, 1.0f, 1.0f });
    TEST_ASSERT_EQUAL_FLOAT(0.5f, pipeline->colorCorrection().red);
    TEST_ASSERT_EQUAL(Error::none, pipeline->tick(10));
    TEST_ASSERT_EQUAL_UINT8(128, pipeline->frame()[0].r);
    TEST_ASSERT_EQUAL_HEX8(0x80, writer.last[7]);
    pipeline->~Pipeline();
}

void test_pattern_switch_in_a_pipeline(void) {
    using Patterns = PatternSwitch<Rainbow<1>, PerlinNoise<1>>;
    using SwitchStrip = Control<1, 8, Patterns, led::Apa102Driver<8>>;

    Patterns::Params params;
    std::get<0>(params.patterns) = stillRainbow();
    std::get<1>(params.patterns).mapping = protocol::NoiseMapping::gradient;

    RecordingByteWriter writer;
    ControlStorage<SwitchStrip> mem;
    Error error = Error::transmission;
    SwitchStrip* control = ControlBuilder<1, 8>()
            .withLayout(strip)
            .withPattern<Patterns>(params)
            .withDriver<led::Apa102Driver<8>>(clocked(&writer, 3))
            .withGamma(1.0f)
            .withDither(protocol::DitherMode::none)
            .build(&mem, &error);
    TEST_ASSERT_EQUAL(Error::none, error);
    TEST_ASSERT_NOT_NULL(control);

    TEST_ASSERT_EQUAL(Error::none, control->tick(0));
    const uint8_t red[] = { 0xff, 0x00, 0x00, 0xff };
    TEST_ASSERT_EQUAL_HEX8_ARRAY(red, writer.last.data() + 4, 4);

    // Lattice points of Perlin noise sit halfway along the gradient.
    control->pattern().toggle();
    TEST_ASSERT_EQUAL(Error::none, control->tick(0));
    const uint8_t grey[] = { 0xff, 0x80, 0x80, 0x80 };
    TEST_ASSERT_EQUAL_HEX8_ARRAY(grey, writer.last.data() + 4, 4);
    control->~SwitchStrip();
}

void test_holder_refuses_a_partial_layout(void) {
    static const Shape<1> shapes[] = { Shape<1>::line(vec(0.0f), vec(1.0f), 3) };
    RecordingByteWriter writer;

    PipelineOptions options;
    options.shapes1 = shapes;
    options.shapeCount = 1;
    options.clocked.writer = &writer;
    options.clocked.pixelCount = 3;
    options.layoutError = Error::invalidShape;

    PipelineId id = { 1, protocol::PatternType::rainbow, protocol::NoiseAlgorithm::perlin,
            protocol::Chipset::apa102 };
    dumped.clear();
    debug::setSink(captureSink);
    TEST_ASSERT_EQUAL(Error::invalidShape, holder.init(id, options));
    debug::setSink(nullptr);
    TEST_ASSERT_NULL(holder.get());
    TEST_ASSERT_EQUAL_STRING("Can't build pipeline: invalid shape\r\n", dumped.c_str());

    options.layoutError = Error::none;
    TEST_ASSERT_EQUAL(Error::none, holder.init(id, options));
    holder.clear();
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_build_and_tick);
    RUN_TEST(test_brightness_applies_on_next_tick);
    RUN_TEST(test_build_errors);
    RUN_TEST(test_transmission_errors_are_counted);
    RUN_TEST(test_noise_pipeline_on_a_grid);
    RUN_TEST(test_holder_builds_runtime_selection);
    RUN_TEST(test_holder_reports_build_errors);
    RUN_TEST(test_dump_build_options);
    RUN_TEST(test_build_errors_go_to_the_debug_sink);
    RUN_TEST(test_transmission_errors_go_to_the_debug_sink);
    RUN_TEST(test_color_correction_applies_on_next_tick);
    RUN_TEST(test_pattern_switch_in_a_pipeline);
    RUN_TEST(test_holder_refuses_a_partial_layout);
    return UNITY_END();
}
