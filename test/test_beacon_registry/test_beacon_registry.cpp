/**
 * @file test_beacon_registry.cpp
 * @brief Unit tests for BeaconRegistry ageing, fade-out and eviction
 *
 * Decay is driven by ManualClock except for one test that uses the real
 * steady clock with short sleeps.
 */

#include <unity.h>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include "../../src/core/BeaconRegistry.h"
#include "../support/ManualClock.h"

using namespace lumibeacon::core;
using lumibeacon::test::ManualClock;

// ============================================================================
// Test: Fresh Sightings
// ============================================================================

void test_update_then_snapshot_fully_visible() {
    ManualClock clock;
    BeaconRegistry registry(5.0, 3.0, clock);

    registry.update("x", -50);
    BeaconSnapshot snap = registry.snapshot();

    TEST_ASSERT_EQUAL_UINT32(1, snap.size());
    TEST_ASSERT_EQUAL_INT(-50, snap["x"].rssi);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, snap["x"].visibility);
}

void test_update_replaces_rssi_and_resets_age() {
    ManualClock clock;
    BeaconRegistry registry(1.0, 1.0, clock);

    registry.update("x", -80);
    clock.advance(1.5);
    registry.update("x", -40);

    BeaconSnapshot snap = registry.snapshot();
    TEST_ASSERT_EQUAL_INT(-40, snap["x"].rssi);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, snap["x"].visibility);
}

void test_empty_registry_snapshot_is_empty() {
    ManualClock clock;
    BeaconRegistry registry(5.0, 3.0, clock);
    TEST_ASSERT_TRUE(registry.snapshot().empty());
}

// ============================================================================
// Test: Decay
// ============================================================================

void test_visible_until_timeout() {
    ManualClock clock;
    BeaconRegistry registry(2.0, 4.0, clock);

    registry.update("x", -60);
    clock.advance(2.0);

    TEST_ASSERT_EQUAL_FLOAT_MESSAGE(1.0f, registry.snapshot()["x"].visibility,
                                    "Age equal to timeout is still fully visible");
}

void test_linear_fade_after_timeout() {
    ManualClock clock;
    BeaconRegistry registry(2.0, 4.0, clock);

    registry.update("x", -60);
    clock.advance(3.0);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 0.75f, registry.snapshot()["x"].visibility);

    clock.advance(2.0);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 0.25f, registry.snapshot()["x"].visibility);
}

void test_expired_beacon_removed() {
    ManualClock clock;
    BeaconRegistry registry(2.0, 4.0, clock);

    registry.update("x", -60);
    registry.update("y", -70);
    clock.advance(6.0);

    BeaconSnapshot snap = registry.snapshot();
    TEST_ASSERT_TRUE_MESSAGE(snap.empty(), "life == 0 must be evicted");
    TEST_ASSERT_EQUAL_UINT32(0, registry.size());
}

void test_only_stale_beacons_expire() {
    ManualClock clock;
    BeaconRegistry registry(1.0, 1.0, clock);

    registry.update("old", -60);
    clock.advance(1.9);
    registry.update("new", -60);
    clock.advance(0.2);

    BeaconSnapshot snap = registry.snapshot();
    TEST_ASSERT_EQUAL_UINT32(1, snap.size());
    TEST_ASSERT_TRUE(snap.find("new") != snap.end());
}

void test_zero_fade_out_expires_right_after_timeout() {
    TEST_ASSERT_EQUAL_DOUBLE(1.0, BeaconRegistry::visibilityForAge(1.0, 1.0, 0.0));
    TEST_ASSERT_EQUAL_DOUBLE(0.0, BeaconRegistry::visibilityForAge(1.001, 1.0, 0.0));
}

void test_real_clock_decay() {
    BeaconRegistry registry(0.1, 0.2);

    registry.update("x", -50);
    std::this_thread::sleep_for(std::chrono::milliseconds(150));

    BeaconSnapshot snap = registry.snapshot();
    TEST_ASSERT_TRUE(snap.find("x") != snap.end());
    TEST_ASSERT_TRUE(snap["x"].visibility > 0.0f);
    TEST_ASSERT_TRUE(snap["x"].visibility < 1.0f);

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    TEST_ASSERT_TRUE(registry.snapshot().empty());
}

// ============================================================================
// Test: Concurrency
// ============================================================================

void test_concurrent_update_and_snapshot() {
    BeaconRegistry registry(5.0, 3.0);
    constexpr int WRITERS = 4;
    constexpr int UPDATES = 2000;

    std::vector<std::thread> writers;
    for (int w = 0; w < WRITERS; w++) {
        writers.emplace_back([&registry, w] {
            const std::string id = "beacon_" + std::to_string(w);
            for (int i = 0; i < UPDATES; i++) {
                registry.update(id, -30 - (i % 60));
            }
        });
    }

    size_t maxSeen = 0;
    for (int i = 0; i < 500; i++) {
        const size_t n = registry.snapshot().size();
        if (n > maxSeen) maxSeen = n;
    }

    for (auto& t : writers) {
        t.join();
    }

    TEST_ASSERT_TRUE(maxSeen <= static_cast<size_t>(WRITERS));
    TEST_ASSERT_EQUAL_UINT32(WRITERS, registry.snapshot().size());
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

    RUN_TEST(test_update_then_snapshot_fully_visible);
    RUN_TEST(test_update_replaces_rssi_and_resets_age);
    RUN_TEST(test_empty_registry_snapshot_is_empty);

    RUN_TEST(test_visible_until_timeout);
    RUN_TEST(test_linear_fade_after_timeout);
    RUN_TEST(test_expired_beacon_removed);
    RUN_TEST(test_only_stale_beacons_expire);
    RUN_TEST(test_zero_fade_out_expires_right_after_timeout);
    RUN_TEST(test_real_clock_decay);

    RUN_TEST(test_concurrent_update_and_snapshot);

    return UNITY_END();
}
