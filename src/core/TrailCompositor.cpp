// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file TrailCompositor.cpp
 * @brief Additive motion-trail painter implementation
 */

#include "TrailCompositor.h"

#include <cmath>

namespace lumibeacon {
namespace core {

void TrailCompositor::paint(PixelBuffer& buffer, int position, const CRGB& color,
                            uint16_t trailLength, float fadeFactor) {
    const size_t length = buffer.size();
    if (length == 0) {
        return;
    }

    for (uint16_t i = 0; i < trailLength; i++) {
        const size_t idx = wrapIndex(static_cast<long>(position) - static_cast<long>(i), length);
        const double attenuation = std::pow(static_cast<double>(fadeFactor), static_cast<double>(i));

        // CRGB::operator+= saturates each channel at 255 (qadd8)
        buffer[idx] += CRGB(attenuate(color.r, attenuation),
                            attenuate(color.g, attenuation),
                            attenuate(color.b, attenuation));
    }
}

size_t TrailCompositor::wrapIndex(long index, size_t length) {
    const long n = static_cast<long>(length);
    long wrapped = index % n;
    if (wrapped < 0) {
        wrapped += n;
    }
    return static_cast<size_t>(wrapped);
}

uint8_t TrailCompositor::attenuate(uint8_t channel, double attenuation) {
    const double scaled = static_cast<double>(channel) * attenuation;
    if (!(scaled > 0.0)) return 0;
    if (scaled >= 255.0) return 255;
    return static_cast<uint8_t>(scaled);  // truncate toward zero
}

} // namespace core
} // namespace lumibeacon
