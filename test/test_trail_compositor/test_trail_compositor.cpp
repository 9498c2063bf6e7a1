/**
 * @file test_trail_compositor.cpp
 * @brief Unit tests for TrailCompositor painting, wrapping and saturation
 */

#include <unity.h>
#include "../../src/core/TrailCompositor.h"

using namespace lumibeacon::core;

// ============================================================================
// Helper Functions
// ============================================================================

static void assertPixel(const CRGB& px, uint8_t r, uint8_t g, uint8_t b) {
    TEST_ASSERT_EQUAL_UINT8(r, px.r);
    TEST_ASSERT_EQUAL_UINT8(g, px.g);
    TEST_ASSERT_EQUAL_UINT8(b, px.b);
}

// ============================================================================
// Test: Head Only
// ============================================================================

void test_single_pixel_trail() {
    PixelBuffer buf = makeBlankFrame(10);
    TrailCompositor::paint(buf, 5, CRGB(255, 0, 0), 1, 0.75f);

    for (size_t i = 0; i < buf.size(); i++) {
        if (i == 5) {
            assertPixel(buf[i], 255, 0, 0);
        } else {
            assertPixel(buf[i], 0, 0, 0);
        }
    }
}

void test_zero_fade_paints_only_head() {
    PixelBuffer buf = makeBlankFrame(10);
    TrailCompositor::paint(buf, 4, CRGB(90, 90, 90), 5, 0.0f);

    assertPixel(buf[4], 90, 90, 90);
    assertPixel(buf[3], 0, 0, 0);
    assertPixel(buf[0], 0, 0, 0);
}

// ============================================================================
// Test: Wrap and Fade
// ============================================================================

void test_trail_wraps_below_zero() {
    PixelBuffer buf = makeBlankFrame(10);
    TrailCompositor::paint(buf, 0, CRGB(100, 0, 0), 3, 0.5f);

    TEST_ASSERT_EQUAL_UINT8(100, buf[0].r);
    TEST_ASSERT_EQUAL_UINT8(50, buf[9].r);
    TEST_ASSERT_EQUAL_UINT8(25, buf[8].r);
    TEST_ASSERT_EQUAL_UINT8(0, buf[7].r);
}

void test_fade_truncates_toward_zero() {
    PixelBuffer buf = makeBlankFrame(4);
    TrailCompositor::paint(buf, 3, CRGB(1, 3, 255), 2, 0.5f);

    assertPixel(buf[3], 1, 3, 255);
    assertPixel(buf[2], 0, 1, 127);
}

void test_full_fade_factor_no_attenuation() {
    PixelBuffer buf = makeBlankFrame(8);
    TrailCompositor::paint(buf, 7, CRGB(10, 20, 30), 8, 1.0f);

    for (const CRGB& px : buf) {
        assertPixel(px, 10, 20, 30);
    }
}

void test_trail_longer_than_buffer_accumulates() {
    PixelBuffer buf = makeBlankFrame(3);
    TrailCompositor::paint(buf, 0, CRGB(10, 0, 0), 6, 1.0f);

    for (const CRGB& px : buf) {
        TEST_ASSERT_EQUAL_UINT8_MESSAGE(20, px.r, "Each slot receives two contributions");
    }
}

// ============================================================================
// Test: Saturation
// ============================================================================

void test_additive_blend_clamps_at_255() {
    PixelBuffer buf = makeBlankFrame(5);
    buf[2] = CRGB(200, 200, 0);

    TrailCompositor::paint(buf, 2, CRGB(100, 10, 0), 1, 1.0f);

    assertPixel(buf[2], 255, 210, 0);
}

void test_two_beacons_blend_additively() {
    PixelBuffer buf = makeBlankFrame(5);
    TrailCompositor::paint(buf, 1, CRGB(100, 0, 0), 1, 0.5f);
    TrailCompositor::paint(buf, 1, CRGB(0, 0, 80), 1, 0.5f);

    assertPixel(buf[1], 100, 0, 80);
}

void test_empty_buffer_is_noop() {
    PixelBuffer buf;
    TrailCompositor::paint(buf, 3, CRGB(255, 255, 255), 4, 0.5f);
    TEST_ASSERT_EQUAL_UINT32(0, buf.size());
}

void test_wrap_index() {
    TEST_ASSERT_EQUAL_UINT32(0, TrailCompositor::wrapIndex(0, 10));
    TEST_ASSERT_EQUAL_UINT32(9, TrailCompositor::wrapIndex(-1, 10));
    TEST_ASSERT_EQUAL_UINT32(5, TrailCompositor::wrapIndex(-25, 10));
    TEST_ASSERT_EQUAL_UINT32(3, TrailCompositor::wrapIndex(13, 10));
}

// ============================================================================
// Unity setUp/tearDown
// ============================================================================

void setUp(void) {
}

void tearDown(void) {
}

// ============================================================================
// Test Runner
// ============================================================================

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_single_pixel_trail);
    RUN_TEST(test_zero_fade_paints_only_head);

    RUN_TEST(test_trail_wraps_below_zero);
    RUN_TEST(test_fade_truncates_toward_zero);
    RUN_TEST(test_full_fade_factor_no_attenuation);
    RUN_TEST(test_trail_longer_than_buffer_accumulates);

    RUN_TEST(test_additive_blend_clamps_at_255);
    RUN_TEST(test_two_beacons_blend_additively);
    RUN_TEST(test_empty_buffer_is_noop);
    RUN_TEST(test_wrap_index);

    return UNITY_END();
}
