/*
 * Color conversion tests.
 */

#include <unity.h>

#include "color.h"

using namespace shimmer;

void setUp(void) {}
void tearDown(void) {}

static void assertRgb(float r, float g, float b, const Rgb& actual) {
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, r, actual.r);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, g, actual.g);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, b, actual.b);
}

void test_primary_hues(void) {
    assertRgb(1, 0, 0, hsvToRgb(Hsv{ 0.0f, 1.0f, 1.0f }));
    assertRgb(1, 1, 0, hsvToRgb(Hsv{ 1.0f / 6, 1.0f, 1.0f }));
    assertRgb(0, 1, 0, hsvToRgb(Hsv{ 2.0f / 6, 1.0f, 1.0f }));
    assertRgb(0, 0, 1, hsvToRgb(Hsv{ 4.0f / 6, 1.0f, 1.0f }));
}

void test_hue_wraps(void) {
    assertRgb(1, 0, 0, hsvToRgb(Hsv{ 1.0f, 1.0f, 1.0f }));
    assertRgb(0, 1, 0, hsvToRgb(Hsv{ -2.0f / 3, 1.0f, 1.0f }));
}

void test_saturation_and_value(void) {
    assertRgb(0.5f, 0.5f, 0.5f, hsvToRgb(Hsv{ 0.3f, 0.0f, 0.5f }));
    assertRgb(0, 0, 0, hsvToRgb(Hsv{ 0.7f, 1.0f, 0.0f }));
    // Out-of-range inputs are clamped.
    assertRgb(1, 0, 0, hsvToRgb(Hsv{ 0.0f, 2.0f, 3.0f }));
}

void test_clamp_and_lerp(void) {
    TEST_ASSERT_EQUAL_FLOAT(0.0f, clamp01(-0.5f));
    TEST_ASSERT_EQUAL_FLOAT(1.0f, clamp01(1.5f));
    TEST_ASSERT_EQUAL_FLOAT(0.25f, clamp01(0.25f));
    assertRgb(0.5f, 0.25f, 0.0f, lerp(Rgb{ 0, 0, 0 }, Rgb{ 1, 0.5f, 0 }, 0.5f));
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_primary_hues);
    RUN_TEST(test_hue_wraps);
    RUN_TEST(test_saturation_and_value);
    RUN_TEST(test_clamp_and_lerp);
    return UNITY_END();
}
