// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file WledStateCodec.cpp
 * @brief WLED JSON state codec implementation
 */

#include "WledStateCodec.h"

namespace lumibeacon {
namespace network {

// ============================================================================
// Encode Functions
// ============================================================================

void WledStateCodec::encodeState(const core::PixelBuffer& frame, JsonObject& obj) {
    obj["on"] = true;

    JsonArray segments = obj["seg"].to<JsonArray>();
    JsonObject segment = segments.add<JsonObject>();
    segment["id"] = 0;

    JsonArray pixels = segment["i"].to<JsonArray>();
    for (const CRGB& led : frame) {
        JsonArray rgb = pixels.add<JsonArray>();
        rgb.add(led.r);
        rgb.add(led.g);
        rgb.add(led.b);
    }
}

std::string WledStateCodec::serializeState(const core::PixelBuffer& frame) {
    JsonDocument doc;
    JsonObject obj = doc.to<JsonObject>();
    encodeState(frame, obj);

    std::string body;
    serializeJson(doc, body);
    return body;
}

std::string WledStateCodec::stateUrl(const std::string& host) {
    return std::string("http://") + host + STATE_PATH;
}

} // namespace network
} // namespace lumibeacon
