// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file TrailCompositor.h
 * @brief Additive motion-trail painter
 *
 * Paints a head pixel at `position` and `trailLength - 1` pixels behind it,
 * each attenuated by fadeFactor^i. Contributions are added with saturating
 * CRGB addition, so overlapping beacons brighten up to white and never wrap.
 */

#pragma once

#include "PixelBuffer.h"

#include <cstddef>
#include <cstdint>

namespace lumibeacon {
namespace core {

class TrailCompositor {
public:
    /**
     * @brief Paint one beacon's trail into the frame
     *
     * Indices wrap in both directions; a trail longer than the buffer wraps
     * around and accumulates on the same pixels. Scaled channels are truncated
     * toward zero (1 * 0.5 -> 0). fadeFactor is not validated here.
     *
     * @param buffer Frame to modify in place (no-op when empty)
     * @param position Head index (any integer, wrapped into range)
     * @param color Head color
     * @param trailLength Number of pixels including the head
     * @param fadeFactor Per-step attenuation, expected in [0, 1]
     */
    static void paint(PixelBuffer& buffer, int position, const CRGB& color,
                      uint16_t trailLength, float fadeFactor);

    /// Wrap any integer index into [0, length)
    static size_t wrapIndex(long index, size_t length);

private:
    static uint8_t attenuate(uint8_t channel, double attenuation);
};

} // namespace core
} // namespace lumibeacon
