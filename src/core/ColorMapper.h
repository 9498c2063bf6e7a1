// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ColorMapper.h
 * @brief Beacon (identity, RSSI, visibility) to pixel color mapping
 *
 * Pipeline:
 *   RSSI -> distance (log-distance path loss)
 *        -> near/far gradient (yellow -> red)
 *        -> per-identity hue offset (FNV-1a of the identity, 0..8% of the circle)
 *        -> value scaled by visibility
 *        -> CRGB, channels truncated toward zero
 *
 * Stateless apart from the immutable model constants; safe to share.
 */

#pragma once

#include <FastLED.h>
#include <cstdint>
#include <string>

namespace lumibeacon {
namespace core {

/**
 * @brief Floating point color, channels nominally in [0, 1]
 */
struct RgbF {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
};

struct HsvF {
    double h = 0.0;  ///< Hue in [0, 1)
    double s = 0.0;
    double v = 0.0;
};

/**
 * @brief Tunable constants of the color model
 */
struct ColorModel {
    double referencePower = -59.0;   ///< RSSI at 1 m (dBm)
    double pathLossExponent = 2.0;   ///< 2.0 = free space
    double nearMeters = 0.5;         ///< At or below: pure "near" color
    double farMeters = 10.0;         ///< At or above: pure "far" color
    double hueBand = 0.08;           ///< Max identity hue offset (fraction of circle)
};

class ColorMapper {
public:
    ColorMapper() = default;
    explicit ColorMapper(const ColorModel& model) : m_model(model) {}

    /**
     * @brief Map a beacon to its display color
     *
     * @param identity Beacon identity (any string)
     * @param rssi Signal strength in dBm
     * @param visibility Beacon life in [0, 1]; outside that range is a caller error
     */
    CRGB colorFor(const std::string& identity, int rssi, float visibility) const;

    /**
     * @brief Estimated distance in meters for a signal strength
     *
     * rssi == referencePower yields exactly 1.0.
     */
    double estimateDistance(int rssi) const;

    /**
     * @brief Base gradient color for a distance (clamped to [near, far])
     *
     * Below the midpoint red ramps 0 -> 1 with green held at 1; above it green
     * ramps 1 -> 0 with red held at 1. Blue is always 0.
     */
    RgbF gradientColor(double distanceMeters) const;

    /**
     * @brief Stable per-identity hue offset in [0, hueBand)
     */
    double hueOffset(const std::string& identity) const;

    const ColorModel& model() const { return m_model; }

    // ------------------------------------------------------------------------
    // Color space helpers (double precision, hue as a fraction of the circle)
    // ------------------------------------------------------------------------

    static HsvF rgbToHsv(const RgbF& rgb);
    static RgbF hsvToRgb(const HsvF& hsv);

    /// 32-bit FNV-1a over the identity bytes
    static uint32_t fnv1a(const std::string& text);

    /// Scale [0, 1] to [0, 255] truncating toward zero (out-of-range clamped)
    static uint8_t toChannel(double unit);

private:
    ColorModel m_model;
};

} // namespace core
} // namespace lumibeacon
