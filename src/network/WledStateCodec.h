/**
 * @file WledStateCodec.h
 * @brief JSON codec for the WLED /json/state request body
 *
 * Body: {"on": true, "seg": [{"id": 0, "i": [[r,g,b], [r,g,b], ...]}]}
 *
 * Single canonical location for WLED JSON keys. HttpJsonSink only sees the
 * serialized string.
 */

#pragma once

#include <ArduinoJson.h>
#include <string>

#include "../core/PixelBuffer.h"

namespace lumibeacon {
namespace network {

class WledStateCodec {
public:
    static constexpr const char* STATE_PATH = "/json/state";

    /**
     * @brief Fill obj with the state update for one frame
     */
    static void encodeState(const core::PixelBuffer& frame, JsonObject& obj);

    /**
     * @brief Serialize one frame's state update to a JSON string
     */
    static std::string serializeState(const core::PixelBuffer& frame);

    /**
     * @brief Endpoint URL for a host ("http://<host>/json/state")
     */
    static std::string stateUrl(const std::string& host);
};

} // namespace network
} // namespace lumibeacon
