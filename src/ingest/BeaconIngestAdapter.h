// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file BeaconIngestAdapter.h
 * @brief Feeds decoded beacon messages into the BeaconRegistry
 *
 * Transport-agnostic: network::MqttSubscriber calls handleMessage() from the
 * MQTT client's network thread; tests call it directly. The adapter never
 * calls into the render loop; the registry is the only shared state.
 */

#pragma once

#include "BeaconMessageCodec.h"
#include "../core/BeaconRegistry.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace lumibeacon {
namespace ingest {

/**
 * @brief Message counters since construction
 */
struct IngestStats {
    uint32_t accepted = 0;          ///< Messages forwarded to the registry
    uint32_t filtered = 0;          ///< Other locations (expected, silent)
    uint32_t rejected = 0;          ///< Malformed topic/payload, mismatched ids
    double elapsedSeconds = 0.0;
    double acceptRate = 0.0;        ///< accepted / elapsedSeconds
    std::map<std::string, uint32_t> perBeacon;

    size_t uniqueBeacons() const { return perBeacon.size(); }
};

class BeaconIngestAdapter {
public:
    BeaconIngestAdapter(core::BeaconRegistry& registry, const std::string& locationFilter);

    BeaconIngestAdapter(const BeaconIngestAdapter&) = delete;
    BeaconIngestAdapter& operator=(const BeaconIngestAdapter&) = delete;

    /**
     * @brief Decode one message and update the registry on success
     *
     * Thread-safe. Malformed messages are logged at warning level and dropped;
     * other locations and short topics are dropped silently.
     *
     * @return true if the registry was updated
     */
    bool handleMessage(const char* topic, const void* payload, size_t length);

    IngestStats getStats() const;

    const std::string& getLocationFilter() const { return m_locationFilter; }

private:
    core::BeaconRegistry& m_registry;
    const std::string m_locationFilter;
    const std::chrono::steady_clock::time_point m_startTime;

    mutable std::mutex m_statsMutex;
    IngestStats m_stats;
};

} // namespace ingest
} // namespace lumibeacon
