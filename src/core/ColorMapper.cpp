// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ColorMapper.cpp
 * @brief Beacon color mapping implementation
 */

#include "ColorMapper.h"

#include <algorithm>
#include <cmath>

namespace lumibeacon {
namespace core {

namespace {

constexpr uint32_t FNV_OFFSET_BASIS = 2166136261u;
constexpr uint32_t FNV_PRIME = 16777619u;

// Top 24 bits of the hash, normalised into [0, 1)
constexpr double HASH_PREFIX_RANGE = 16777216.0;  // 2^24

inline double lerp(double a, double b, double t) {
    return a + (b - a) * t;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

CRGB ColorMapper::colorFor(const std::string& identity, int rssi, float visibility) const {
    const RgbF base = gradientColor(estimateDistance(rssi));

    HsvF hsv = rgbToHsv(base);
    hsv.h = std::fmod(hsv.h + hueOffset(identity), 1.0);
    hsv.v *= static_cast<double>(visibility);

    const RgbF shifted = hsvToRgb(hsv);
    return CRGB(toChannel(shifted.r), toChannel(shifted.g), toChannel(shifted.b));
}

double ColorMapper::estimateDistance(int rssi) const {
    const double exponent = (m_model.referencePower - static_cast<double>(rssi))
                          / (10.0 * m_model.pathLossExponent);
    return std::pow(10.0, exponent);
}

RgbF ColorMapper::gradientColor(double distanceMeters) const {
    const double d = std::max(m_model.nearMeters, std::min(m_model.farMeters, distanceMeters));
    const double t = (d - m_model.nearMeters) / (m_model.farMeters - m_model.nearMeters);

    RgbF out;
    if (t < 0.5) {
        out.r = lerp(0.0, 1.0, t / 0.5);
        out.g = 1.0;
    } else {
        out.r = 1.0;
        out.g = lerp(1.0, 0.0, (t - 0.5) / 0.5);
    }
    out.b = 0.0;
    return out;
}

double ColorMapper::hueOffset(const std::string& identity) const {
    const uint32_t prefix = fnv1a(identity) >> 8;
    return (static_cast<double>(prefix) / HASH_PREFIX_RANGE) * m_model.hueBand;
}

// ============================================================================
// Color Space Helpers
// ============================================================================

HsvF ColorMapper::rgbToHsv(const RgbF& rgb) {
    const double maxc = std::max(rgb.r, std::max(rgb.g, rgb.b));
    const double minc = std::min(rgb.r, std::min(rgb.g, rgb.b));

    HsvF out;
    out.v = maxc;
    if (maxc == minc) {
        return out;  // achromatic: h = s = 0
    }

    const double span = maxc - minc;
    out.s = span / maxc;

    const double rc = (maxc - rgb.r) / span;
    const double gc = (maxc - rgb.g) / span;
    const double bc = (maxc - rgb.b) / span;

    double h;
    if (rgb.r == maxc) {
        h = bc - gc;
    } else if (rgb.g == maxc) {
        h = 2.0 + rc - bc;
    } else {
        h = 4.0 + gc - rc;
    }

    h = std::fmod(h / 6.0, 1.0);
    if (h < 0.0) {
        h += 1.0;
    }
    out.h = h;
    return out;
}

RgbF ColorMapper::hsvToRgb(const HsvF& hsv) {
    if (hsv.s == 0.0) {
        return RgbF{hsv.v, hsv.v, hsv.v};
    }

    const double scaled = hsv.h * 6.0;
    const int sector = static_cast<int>(std::floor(scaled));
    const double f = scaled - sector;
    const double p = hsv.v * (1.0 - hsv.s);
    const double q = hsv.v * (1.0 - hsv.s * f);
    const double t = hsv.v * (1.0 - hsv.s * (1.0 - f));

    switch (((sector % 6) + 6) % 6) {
        case 0:  return RgbF{hsv.v, t, p};
        case 1:  return RgbF{q, hsv.v, p};
        case 2:  return RgbF{p, hsv.v, t};
        case 3:  return RgbF{p, q, hsv.v};
        case 4:  return RgbF{t, p, hsv.v};
        default: return RgbF{hsv.v, p, q};
    }
}

uint32_t ColorMapper::fnv1a(const std::string& text) {
    uint32_t hash = FNV_OFFSET_BASIS;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= FNV_PRIME;
    }
    return hash;
}

uint8_t ColorMapper::toChannel(double unit) {
    const double scaled = unit * 255.0;
    if (!(scaled > 0.0)) return 0;      // also catches NaN
    if (scaled >= 255.0) return 255;
    return static_cast<uint8_t>(scaled);
}

} // namespace core
} // namespace lumibeacon
