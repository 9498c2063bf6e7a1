/**
 * @file BeaconMessageCodec.h
 * @brief Decoder for espresense-style beacon MQTT messages
 *
 * Topic:   <root...>/<identity>/<location>
 * Payload: {"id": "<identity>", "rssi": <number>, ...}  (extra keys ignored)
 *
 * Single canonical location for reading beacon message topics and JSON keys.
 * All other code consumes the typed BeaconMessage.
 *
 * Decode order (first failure wins):
 *   1. Topic has at least 4 segments              -> MALFORMED_TOPIC
 *   2. Last segment equals the location filter    -> LOCATION_MISMATCH
 *   3. Payload parses as JSON                     -> INVALID_JSON
 *   4. "id" is a non-empty string, "rssi" a number -> MISSING_FIELDS
 *   5. "rssi" fits an int after truncation        -> INVALID_FIELD
 *   6. Payload id equals topic identity           -> ID_MISMATCH
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace lumibeacon {
namespace ingest {

static constexpr size_t MAX_ERROR_MSG = 128;
static constexpr size_t MIN_TOPIC_SEGMENTS = 4;

enum class BeaconDecodeStatus : uint8_t {
    OK = 0,
    MALFORMED_TOPIC,
    LOCATION_MISMATCH,
    INVALID_JSON,
    MISSING_FIELDS,
    INVALID_FIELD,
    ID_MISMATCH
};

/**
 * @brief Decoded beacon sighting
 */
struct BeaconMessage {
    std::string identity;
    int rssi = 0;   ///< Truncated toward zero
};

struct BeaconDecodeResult {
    bool success;
    BeaconDecodeStatus status;
    BeaconMessage message;
    char errorMsg[MAX_ERROR_MSG];

    BeaconDecodeResult() : success(false), status(BeaconDecodeStatus::OK) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

/**
 * @brief Identity and location extracted from a topic
 */
struct BeaconTopic {
    std::string identity;
    std::string location;
    size_t segmentCount = 0;
};

class BeaconMessageCodec {
public:
    /**
     * @brief Split a topic on '/' (empty segments count)
     * @return false if the topic has fewer than MIN_TOPIC_SEGMENTS segments
     */
    static bool parseTopic(const char* topic, BeaconTopic& out);

    /**
     * @brief Decode one message for the given location filter
     *
     * @param topic MQTT topic (null treated as malformed)
     * @param payload Raw payload bytes (not necessarily NUL-terminated)
     * @param length Payload length in bytes
     * @param locationFilter Location tag to accept
     */
    static BeaconDecodeResult decode(const char* topic, const char* payload, size_t length,
                                     const char* locationFilter);

    static const char* statusName(BeaconDecodeStatus status);
};

} // namespace ingest
} // namespace lumibeacon
