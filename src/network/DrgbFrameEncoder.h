/**
 * @file DrgbFrameEncoder.h
 * @brief WLED realtime "DRGB" datagram encoder
 *
 * Datagram format: ['D']['R']['G']['B'][R0][G0][B0][R1][G1][B1]...
 * Exactly 4 + 3*N bytes for an N-pixel frame, no other framing.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <vector>
#include <FastLED.h>

namespace lumibeacon {
namespace network {

// ============================================================================
// DRGB Configuration
// ============================================================================

namespace DrgbConfig {
    constexpr uint8_t HEADER[4] = {'D', 'R', 'G', 'B'};
    constexpr size_t HEADER_SIZE = sizeof(HEADER);
    constexpr size_t BYTES_PER_PIXEL = 3;

    constexpr size_t frameSize(size_t pixelCount) {
        return HEADER_SIZE + pixelCount * BYTES_PER_PIXEL;
    }
}

// ============================================================================
// DRGB Frame Encoder
// ============================================================================

class DrgbFrameEncoder {
public:
    /**
     * @brief Encode pixels into a DRGB datagram
     * @param leds Source pixels
     * @param count Number of pixels
     * @param outputBuffer Output buffer (at least frameSize(count) bytes)
     * @param bufferSize Size of output buffer
     * @return Number of bytes written, or 0 on error
     */
    static size_t encode(const CRGB* leds, size_t count, uint8_t* outputBuffer, size_t bufferSize) {
        if (!outputBuffer) return 0;
        if (count > 0 && !leds) return 0;
        if (bufferSize < DrgbConfig::frameSize(count)) return 0;

        uint8_t* dst = outputBuffer;
        for (size_t i = 0; i < DrgbConfig::HEADER_SIZE; i++) {
            *dst++ = DrgbConfig::HEADER[i];
        }
        for (size_t i = 0; i < count; i++) {
            *dst++ = leds[i].r;
            *dst++ = leds[i].g;
            *dst++ = leds[i].b;
        }
        return DrgbConfig::frameSize(count);
    }

    /**
     * @brief Encode a whole frame into a freshly sized byte vector
     */
    static std::vector<uint8_t> encode(const std::vector<CRGB>& frame) {
        std::vector<uint8_t> out(DrgbConfig::frameSize(frame.size()));
        encode(frame.data(), frame.size(), out.data(), out.size());
        return out;
    }

    /**
     * @brief Check header and that the payload is a whole number of pixels
     */
    static bool validate(const uint8_t* frame, size_t frameSize) {
        if (!frame || frameSize < DrgbConfig::HEADER_SIZE) return false;
        for (size_t i = 0; i < DrgbConfig::HEADER_SIZE; i++) {
            if (frame[i] != DrgbConfig::HEADER[i]) return false;
        }
        return ((frameSize - DrgbConfig::HEADER_SIZE) % DrgbConfig::BYTES_PER_PIXEL) == 0;
    }
};

} // namespace network
} // namespace lumibeacon
