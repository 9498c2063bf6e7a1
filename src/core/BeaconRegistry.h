// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file BeaconRegistry.h
 * @brief Thread-safe beacon liveness store with timeout and fade-out
 *
 * Each beacon keeps its last RSSI and the time it was last heard. Visibility
 * ("life") is derived on every snapshot:
 *
 *   age <= timeout            -> 1.0
 *   age >  timeout            -> max(0, 1 - (age - timeout) / fadeOut)
 *
 * Beacons whose visibility reaches 0 are dropped during the snapshot that
 * observes it (lazy garbage collection).
 *
 * Writers: MQTT network thread (BeaconIngestAdapter), mock generator worker.
 * Readers: render loop. Every access is serialised by one mutex; critical
 * sections never perform I/O.
 */

#pragma once

#include "IClock.h"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace lumibeacon {
namespace core {

/**
 * @brief Immutable view of one beacon handed to consumers
 */
struct BeaconView {
    int rssi = 0;
    float visibility = 0.0f;
};

/// Identity -> view. A fully materialised copy; never aliases registry state.
using BeaconSnapshot = std::map<std::string, BeaconView>;

class BeaconRegistry {
public:
    static constexpr double DEFAULT_TIMEOUT_SECONDS = 5.0;
    static constexpr double DEFAULT_FADE_OUT_SECONDS = 3.0;

    /**
     * @brief Create a registry on the process steady clock
     */
    BeaconRegistry(double timeoutSeconds = DEFAULT_TIMEOUT_SECONDS,
                   double fadeOutSeconds = DEFAULT_FADE_OUT_SECONDS);

    /**
     * @brief Create a registry on an injected clock
     * @param clock Must outlive the registry
     */
    BeaconRegistry(double timeoutSeconds, double fadeOutSeconds, const IClock& clock);

    BeaconRegistry(const BeaconRegistry&) = delete;
    BeaconRegistry& operator=(const BeaconRegistry&) = delete;

    /**
     * @brief Record a sighting; last write wins
     *
     * Stamps the beacon with now() so it is fully visible again.
     */
    void update(const std::string& identity, int rssi);

    /**
     * @brief Current beacons with their visibility
     *
     * Removes beacons that have completely faded out.
     */
    BeaconSnapshot snapshot();

    /**
     * @brief Number of stored beacons, including ones a snapshot would expire
     */
    size_t size() const;

    double getTimeoutSeconds() const { return m_timeoutSeconds; }
    double getFadeOutSeconds() const { return m_fadeOutSeconds; }

    /**
     * @brief Visibility for a beacon of the given age
     *
     * A non-positive fade-out makes the beacon vanish as soon as it times out.
     */
    static double visibilityForAge(double ageSeconds, double timeoutSeconds, double fadeOutSeconds);

private:
    struct Record {
        int rssi = 0;
        double lastSeen = 0.0;
    };

    static const IClock& defaultClock();

    const double m_timeoutSeconds;
    const double m_fadeOutSeconds;
    const IClock& m_clock;

    mutable std::mutex m_mutex;
    std::map<std::string, Record> m_beacons;
};

} // namespace core
} // namespace lumibeacon
