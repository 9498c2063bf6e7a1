// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PositionTracker.h
 * @brief Per-beacon cursor that walks along the LED track
 *
 * Every advance() moves a beacon one pixel forward, wrapping at the track
 * length. Render-loop only; not thread-safe.
 */

#pragma once

#include "BeaconRegistry.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace lumibeacon {
namespace core {

class PositionTracker {
public:
    /**
     * @param trackLength Number of pixels; must be >= 1 (checked by RenderLoop::begin)
     */
    explicit PositionTracker(uint16_t trackLength);

    /**
     * @brief Move a beacon one step and return its new index
     *
     * A beacon seen for the first time starts at 0. Requires trackLength >= 1.
     */
    uint16_t advance(const std::string& identity);

    /**
     * @brief Drop cursors for beacons missing from the snapshot
     *
     * Keeps the cursor map bounded under beacon churn. A beacon that comes back
     * after expiring restarts at index 0.
     *
     * @return Number of cursors removed
     */
    size_t retainOnly(const BeaconSnapshot& live);

    size_t getCursorCount() const { return m_cursors.size(); }
    uint16_t getTrackLength() const { return m_trackLength; }

private:
    uint16_t m_trackLength;
    std::unordered_map<std::string, uint16_t> m_cursors;
};

} // namespace core
} // namespace lumibeacon
