// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file BeaconMessageCodec.cpp
 * @brief Beacon MQTT message decoder implementation
 */

#include "BeaconMessageCodec.h"

#include <ArduinoJson.h>
#include <climits>
#include <cmath>
#include <cstdio>

namespace lumibeacon {
namespace ingest {

// ============================================================================
// Topic Parsing
// ============================================================================

bool BeaconMessageCodec::parseTopic(const char* topic, BeaconTopic& out) {
    out = BeaconTopic();
    if (topic == nullptr) {
        return false;
    }

    // Walk segments keeping only the last two
    std::string previous;
    std::string current;
    size_t segments = 1;
    for (const char* p = topic; *p != '\0'; ++p) {
        if (*p == '/') {
            previous.swap(current);
            current.clear();
            segments++;
        } else {
            current.push_back(*p);
        }
    }

    out.segmentCount = segments;
    if (segments < MIN_TOPIC_SEGMENTS) {
        return false;
    }

    out.identity = previous;
    out.location = current;
    return true;
}

// ============================================================================
// Message Decoding
// ============================================================================

BeaconDecodeResult BeaconMessageCodec::decode(const char* topic, const char* payload, size_t length,
                                              const char* locationFilter) {
    BeaconDecodeResult result;

    BeaconTopic parsed;
    if (!parseTopic(topic, parsed)) {
        result.status = BeaconDecodeStatus::MALFORMED_TOPIC;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Topic has %u segments, need %u",
                 static_cast<unsigned>(parsed.segmentCount), static_cast<unsigned>(MIN_TOPIC_SEGMENTS));
        return result;
    }

    if (locationFilter == nullptr || parsed.location != locationFilter) {
        result.status = BeaconDecodeStatus::LOCATION_MISMATCH;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Location '%s' not subscribed", parsed.location.c_str());
        return result;
    }

    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, payload, length);
    if (error) {
        result.status = BeaconDecodeStatus::INVALID_JSON;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid JSON: %s", error.c_str());
        return result;
    }

    JsonVariantConst id = doc["id"];
    JsonVariantConst rssi = doc["rssi"];

    const bool hasId = id.is<const char*>() && strlen(id.as<const char*>()) > 0;
    const bool hasRssi = rssi.is<long long>() || rssi.is<double>();
    if (!hasId || !hasRssi) {
        result.status = BeaconDecodeStatus::MISSING_FIELDS;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing id or rssi (id=%s, rssi=%s)",
                 hasId ? "ok" : "missing", hasRssi ? "ok" : "missing");
        return result;
    }

    const double rawRssi = rssi.as<double>();
    const double truncated = std::trunc(rawRssi);
    if (!std::isfinite(truncated) || truncated < static_cast<double>(INT_MIN) ||
        truncated > static_cast<double>(INT_MAX)) {
        result.status = BeaconDecodeStatus::INVALID_FIELD;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "rssi out of range");
        return result;
    }

    const char* payloadId = id.as<const char*>();
    if (parsed.identity != payloadId) {
        result.status = BeaconDecodeStatus::ID_MISMATCH;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Beacon ID mismatch - topic: %s, payload: %s",
                 parsed.identity.c_str(), payloadId);
        return result;
    }

    result.message.identity = parsed.identity;
    result.message.rssi = static_cast<int>(truncated);
    result.status = BeaconDecodeStatus::OK;
    result.success = true;
    return result;
}

const char* BeaconMessageCodec::statusName(BeaconDecodeStatus status) {
    switch (status) {
        case BeaconDecodeStatus::OK:                return "ok";
        case BeaconDecodeStatus::MALFORMED_TOPIC:   return "malformed_topic";
        case BeaconDecodeStatus::LOCATION_MISMATCH: return "location_mismatch";
        case BeaconDecodeStatus::INVALID_JSON:      return "invalid_json";
        case BeaconDecodeStatus::MISSING_FIELDS:    return "missing_fields";
        case BeaconDecodeStatus::INVALID_FIELD:     return "invalid_field";
        case BeaconDecodeStatus::ID_MISMATCH:       return "id_mismatch";
    }
    return "unknown";
}

} // namespace ingest
} // namespace lumibeacon
