/**
 * @file MockBeaconSource.h
 * @brief Synthetic beacons for running the renderer without a broker
 *
 * Beacons beacon_0 .. beacon_{N-1} move around a circle; beacon i reports
 *   pos  = 0.5 + 0.4 * cos(2*pi*(t/10 + i/N))
 *   rssi = trunc(min + pos * (max - min) + 3 * sin(2t + i))
 * where t advances by the step on every call to step().
 *
 * start() runs step() on a background worker that writes into a
 * BeaconRegistry, the same way the MQTT ingest path does.
 */

#pragma once

#include "../core/BeaconRegistry.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace lumibeacon {
namespace sim {

struct MockBeaconSettings {
    uint16_t beaconCount = 3;
    int rssiMin = -90;
    int rssiMax = -30;
};

class MockBeaconSource {
public:
    explicit MockBeaconSource(const MockBeaconSettings& settings = MockBeaconSettings());
    ~MockBeaconSource();

    MockBeaconSource(const MockBeaconSource&) = delete;
    MockBeaconSource& operator=(const MockBeaconSource&) = delete;

    /**
     * @brief Advance simulated time and return every beacon's signal strength
     */
    std::map<std::string, int> step(double timeDelta = 0.1);

    /**
     * @brief Start a worker that steps every intervalSeconds and updates registry
     * @return false if already running or the interval is not positive
     */
    bool start(core::BeaconRegistry& registry, double intervalSeconds);

    /**
     * @brief Stop and join the worker (no-op if not running)
     */
    void stop();

    bool isRunning() const { return m_running.load(); }
    double getSimulatedTime() const;

    static std::string beaconId(uint16_t index);

private:
    void workerLoop(core::BeaconRegistry* registry, double intervalSeconds);

    const MockBeaconSettings m_settings;

    mutable std::mutex m_stepMutex;
    double m_time = 0.0;

    std::atomic<bool> m_running{false};
    std::mutex m_wakeMutex;
    std::condition_variable m_wakeCv;
    bool m_stopRequested = false;
    std::thread m_worker;
};

} // namespace sim
} // namespace lumibeacon
