// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PixelBuffer.h
 * @brief Frame buffer type shared by the compositor and every output sink
 */

#pragma once

#include <FastLED.h>
#include <cstddef>
#include <vector>

namespace lumibeacon {
namespace core {

/**
 * @brief One frame: trackLength pixels, allocated all-black per frame
 *
 * CRGB channels are uint8_t, so the [0, 255] range holds by construction.
 */
using PixelBuffer = std::vector<CRGB>;

inline PixelBuffer makeBlankFrame(size_t ledCount) {
    return PixelBuffer(ledCount, CRGB(0, 0, 0));
}

} // namespace core
} // namespace lumibeacon
