// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file BeaconRegistry.cpp
 * @brief Beacon liveness store implementation
 */

#include "BeaconRegistry.h"

#include <algorithm>

namespace lumibeacon {
namespace core {

BeaconRegistry::BeaconRegistry(double timeoutSeconds, double fadeOutSeconds)
    : BeaconRegistry(timeoutSeconds, fadeOutSeconds, defaultClock())
{
}

BeaconRegistry::BeaconRegistry(double timeoutSeconds, double fadeOutSeconds, const IClock& clock)
    : m_timeoutSeconds(timeoutSeconds)
    , m_fadeOutSeconds(fadeOutSeconds)
    , m_clock(clock)
{
}

const IClock& BeaconRegistry::defaultClock() {
    static const SteadyClock clock;
    return clock;
}

void BeaconRegistry::update(const std::string& identity, int rssi) {
    const double now = m_clock.nowSeconds();

    std::lock_guard<std::mutex> lock(m_mutex);
    Record& record = m_beacons[identity];
    record.rssi = rssi;
    record.lastSeen = now;
}

BeaconSnapshot BeaconRegistry::snapshot() {
    const double now = m_clock.nowSeconds();
    BeaconSnapshot active;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_beacons.begin(); it != m_beacons.end(); ) {
        const double life = visibilityForAge(now - it->second.lastSeen,
                                             m_timeoutSeconds, m_fadeOutSeconds);
        if (life <= 0.0) {
            it = m_beacons.erase(it);
            continue;
        }

        BeaconView view;
        view.rssi = it->second.rssi;
        view.visibility = static_cast<float>(life);
        active.emplace(it->first, view);
        ++it;
    }

    return active;
}

size_t BeaconRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_beacons.size();
}

double BeaconRegistry::visibilityForAge(double ageSeconds, double timeoutSeconds, double fadeOutSeconds) {
    if (ageSeconds <= timeoutSeconds) {
        return 1.0;
    }
    if (fadeOutSeconds <= 0.0) {
        return 0.0;
    }
    const double decay = (ageSeconds - timeoutSeconds) / fadeOutSeconds;
    return std::max(0.0, 1.0 - decay);
}

} // namespace core
} // namespace lumibeacon
