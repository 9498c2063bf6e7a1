// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PositionTracker.cpp
 * @brief Per-beacon cursor implementation
 */

#include "PositionTracker.h"

namespace lumibeacon {
namespace core {

PositionTracker::PositionTracker(uint16_t trackLength)
    : m_trackLength(trackLength)
{
}

uint16_t PositionTracker::advance(const std::string& identity) {
    auto it = m_cursors.find(identity);
    if (it == m_cursors.end()) {
        m_cursors.emplace(identity, 0);
        return 0;
    }

    it->second = static_cast<uint16_t>((it->second + 1u) % m_trackLength);
    return it->second;
}

size_t PositionTracker::retainOnly(const BeaconSnapshot& live) {
    size_t removed = 0;
    for (auto it = m_cursors.begin(); it != m_cursors.end(); ) {
        if (live.find(it->first) == live.end()) {
            it = m_cursors.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace core
} // namespace lumibeacon
