// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file BeaconIngestAdapter.cpp
 * @brief Beacon message to registry adapter implementation
 */

#include "BeaconIngestAdapter.h"

#define LB_LOG_TAG "Ingest"
#include "../utils/Log.h"

namespace lumibeacon {
namespace ingest {

BeaconIngestAdapter::BeaconIngestAdapter(core::BeaconRegistry& registry, const std::string& locationFilter)
    : m_registry(registry)
    , m_locationFilter(locationFilter)
    , m_startTime(std::chrono::steady_clock::now())
{
}

bool BeaconIngestAdapter::handleMessage(const char* topic, const void* payload, size_t length) {
    const BeaconDecodeResult result = BeaconMessageCodec::decode(
        topic, static_cast<const char*>(payload), length, m_locationFilter.c_str());

    if (!result.success) {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        switch (result.status) {
            case BeaconDecodeStatus::MALFORMED_TOPIC:
            case BeaconDecodeStatus::LOCATION_MISMATCH:
                m_stats.filtered++;
                break;
            default:
                m_stats.rejected++;
                LB_LOGW("Dropped message on %s [%s]: %s", topic ? topic : "(null)",
                        BeaconMessageCodec::statusName(result.status), result.errorMsg);
                break;
        }
        return false;
    }

    m_registry.update(result.message.identity, result.message.rssi);

    std::lock_guard<std::mutex> lock(m_statsMutex);
    m_stats.accepted++;
    m_stats.perBeacon[result.message.identity]++;
    LB_LOGD("Beacon %s rssi=%d", result.message.identity.c_str(), result.message.rssi);
    return true;
}

IngestStats BeaconIngestAdapter::getStats() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    IngestStats copy = m_stats;
    copy.elapsedSeconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - m_startTime).count();
    copy.acceptRate = copy.elapsedSeconds > 0.0 ? copy.accepted / copy.elapsedSeconds : 0.0;
    return copy;
}

} // namespace ingest
} // namespace lumibeacon
