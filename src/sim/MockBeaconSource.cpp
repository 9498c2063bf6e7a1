// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file MockBeaconSource.cpp
 * @brief Synthetic beacon generator implementation
 */

#include "MockBeaconSource.h"

#define LB_LOG_TAG "Mock"
#include "../utils/Log.h"

#include <chrono>
#include <cmath>

namespace lumibeacon {
namespace sim {

namespace {

constexpr double TWO_PI = 6.283185307179586;
constexpr double ORBIT_PERIOD_S = 10.0;
constexpr double NOISE_AMPLITUDE = 3.0;

} // namespace

MockBeaconSource::MockBeaconSource(const MockBeaconSettings& settings)
    : m_settings(settings)
{
}

MockBeaconSource::~MockBeaconSource() {
    stop();
}

std::string MockBeaconSource::beaconId(uint16_t index) {
    return "beacon_" + std::to_string(index);
}

std::map<std::string, int> MockBeaconSource::step(double timeDelta) {
    std::lock_guard<std::mutex> lock(m_stepMutex);
    m_time += timeDelta;

    std::map<std::string, int> beacons;
    const uint16_t n = m_settings.beaconCount;
    const double span = static_cast<double>(m_settings.rssiMax - m_settings.rssiMin);

    for (uint16_t i = 0; i < n; i++) {
        const double angle = TWO_PI * (m_time / ORBIT_PERIOD_S + static_cast<double>(i) / n);
        const double pos = 0.5 + 0.4 * std::cos(angle);
        const double noise = NOISE_AMPLITUDE * std::sin(m_time * 2.0 + i);
        const double rssi = m_settings.rssiMin + pos * span + noise;
        beacons[beaconId(i)] = static_cast<int>(std::trunc(rssi));
    }
    return beacons;
}

double MockBeaconSource::getSimulatedTime() const {
    std::lock_guard<std::mutex> lock(m_stepMutex);
    return m_time;
}

// ============================================================================
// Background Worker
// ============================================================================

bool MockBeaconSource::start(core::BeaconRegistry& registry, double intervalSeconds) {
    if (m_running.load()) {
        LB_LOGW("Mock beacon source already running");
        return false;
    }
    if (!(intervalSeconds > 0.0)) {
        LB_LOGE("Mock beacon interval must be positive");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        m_stopRequested = false;
    }
    m_running.store(true);
    m_worker = std::thread(&MockBeaconSource::workerLoop, this, &registry, intervalSeconds);
    LB_LOGI("Generating %u mock beacons every %.2fs", m_settings.beaconCount, intervalSeconds);
    return true;
}

void MockBeaconSource::stop() {
    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        m_stopRequested = true;
    }
    m_wakeCv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
    m_running.store(false);
}

void MockBeaconSource::workerLoop(core::BeaconRegistry* registry, double intervalSeconds) {
    const auto interval = std::chrono::duration<double>(intervalSeconds);

    while (true) {
        for (const auto& entry : step(intervalSeconds)) {
            registry->update(entry.first, entry.second);
        }

        std::unique_lock<std::mutex> lock(m_wakeMutex);
        if (m_wakeCv.wait_for(lock, interval, [this] { return m_stopRequested; })) {
            break;
        }
    }
}

} // namespace sim
} // namespace lumibeacon
