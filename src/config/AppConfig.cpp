// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AppConfig.cpp
 * @brief Configuration loading, validation and export
 */

#include "AppConfig.h"

#include <ArduinoJson.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>

#define LB_LOG_TAG "Config"
#include "../utils/Log.h"

namespace lumibeacon {
namespace config {

const char* const ConfigLoader::KEYS[] = {
    "WLED_HOST",
    "LED_COUNT",
    "OUTPUT_MODE",
    "HTTP_TIMEOUT",
    "HTTP_RETRIES",
    "UDP_PORT",
    "MQTT_BROKER",
    "MQTT_PORT",
    "MQTT_LOCATION",
    "MQTT_BASE_TOPIC",
    "MQTT_USERNAME",
    "MQTT_PASSWORD",
    "BEACON_TIMEOUT_SECONDS",
    "BEACON_FADE_OUT_SECONDS",
    "UPDATE_INTERVAL",
    "TRAIL_LENGTH",
    "FADE_FACTOR",
    "LOG_LEVEL"
};

const size_t ConfigLoader::KEY_COUNT = sizeof(ConfigLoader::KEYS) / sizeof(ConfigLoader::KEYS[0]);

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(begin, end - begin);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool parseLong(const std::string& text, long& out) {
    const std::string s = trim(text);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long value = strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') return false;
    out = value;
    return true;
}

bool parseDouble(const std::string& text, double& out) {
    const std::string s = trim(text);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    double value = strtod(s.c_str(), &end);
    if (errno != 0 || end == nullptr || *end != '\0' || !std::isfinite(value)) return false;
    out = value;
    return true;
}

ConfigResult fail(const char* fmt, const char* key, const std::string& value) {
    ConfigResult result;
    snprintf(result.errorMsg, MAX_ERROR_MSG, fmt, key, value.c_str());
    return result;
}

ConfigResult ok() {
    ConfigResult result;
    result.success = true;
    return result;
}

bool isValidLogLevel(const std::string& name) {
    int level = 0;
    return logging::levelFromName(name.c_str(), level);
}

} // namespace

// ============================================================================
// dotenv / Environment
// ============================================================================

bool ConfigLoader::parseEnvLine(const std::string& line, std::string& key, std::string& value) {
    std::string s = trim(line);
    if (s.empty() || s[0] == '#') return false;

    if (s.compare(0, 7, "export ") == 0) {
        s = trim(s.substr(7));
    }

    const size_t eq = s.find('=');
    if (eq == std::string::npos || eq == 0) return false;

    key = trim(s.substr(0, eq));
    value = trim(s.substr(eq + 1));
    if (key.empty()) return false;

    if (value.size() >= 2 && (value[0] == '"' || value[0] == '\'') && value.back() == value[0]) {
        value = value.substr(1, value.size() - 2);
    } else {
        // Unquoted values may carry a trailing " # comment"
        const size_t hash = value.find(" #");
        if (hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }
    }
    return true;
}

bool ConfigLoader::loadEnvFile(const char* path) {
    if (path == nullptr) return false;

    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string line;
    std::string key;
    std::string value;
    size_t loaded = 0;
    while (std::getline(in, line)) {
        if (parseEnvLine(line, key, value)) {
            m_values[key] = value;
            loaded++;
        }
    }
    LB_LOGD("Loaded %lu entries from %s", (unsigned long)loaded, path);
    return true;
}

void ConfigLoader::loadEnvironment() {
    for (size_t i = 0; i < KEY_COUNT; i++) {
        const char* value = getenv(KEYS[i]);
        if (value != nullptr) {
            m_values[KEYS[i]] = value;
        }
    }
}

void ConfigLoader::set(const std::string& key, const std::string& value) {
    m_values[key] = value;
}

bool ConfigLoader::has(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

// ============================================================================
// Build
// ============================================================================

ConfigResult ConfigLoader::build(AppConfig& out) const {
    for (const auto& entry : m_values) {
        const char* key = entry.first.c_str();
        const std::string& raw = entry.second;
        long lv = 0;
        double dv = 0.0;

        if (entry.first == "WLED_HOST") {
            out.wledHost = trim(raw);
        } else if (entry.first == "LED_COUNT") {
            if (!parseLong(raw, lv)) return fail("%s must be an integer (got '%s')", key, raw);
            if (lv < ConfigLimits::LED_COUNT_MIN || lv > ConfigLimits::LED_COUNT_MAX) {
                return fail("%s must be between 1 and 4096 (got '%s')", key, raw);
            }
            out.ledCount = static_cast<uint16_t>(lv);
        } else if (entry.first == "OUTPUT_MODE") {
            const std::string mode = toLower(trim(raw));
            if (mode == "udp") {
                out.outputMode = OutputMode::UDP;
            } else if (mode == "http") {
                out.outputMode = OutputMode::HTTP;
            } else {
                return fail("%s must be 'udp' or 'http' (got '%s')", key, raw);
            }
        } else if (entry.first == "HTTP_TIMEOUT") {
            if (!parseDouble(raw, dv)) return fail("%s must be a number (got '%s')", key, raw);
            if (!(dv > 0.0 && dv <= ConfigLimits::HTTP_TIMEOUT_MAX_S)) {
                return fail("%s must be in (0, 60] seconds (got '%s')", key, raw);
            }
            out.httpTimeoutSeconds = dv;
        } else if (entry.first == "HTTP_RETRIES") {
            if (!parseLong(raw, lv)) return fail("%s must be an integer (got '%s')", key, raw);
            if (lv < ConfigLimits::HTTP_RETRIES_MIN || lv > ConfigLimits::HTTP_RETRIES_MAX) {
                return fail("%s must be between 1 and 10 (got '%s')", key, raw);
            }
            out.httpRetries = static_cast<uint8_t>(lv);
        } else if (entry.first == "UDP_PORT" || entry.first == "MQTT_PORT") {
            if (!parseLong(raw, lv)) return fail("%s must be an integer (got '%s')", key, raw);
            if (lv < ConfigLimits::PORT_MIN || lv > ConfigLimits::PORT_MAX) {
                return fail("%s must be between 1 and 65535 (got '%s')", key, raw);
            }
            if (entry.first == "UDP_PORT") {
                out.udpPort = static_cast<uint16_t>(lv);
            } else {
                out.mqttPort = static_cast<uint16_t>(lv);
            }
        } else if (entry.first == "MQTT_BROKER") {
            out.mqttBroker = trim(raw);
        } else if (entry.first == "MQTT_LOCATION") {
            out.mqttLocation = trim(raw);
        } else if (entry.first == "MQTT_BASE_TOPIC") {
            out.mqttBaseTopic = trim(raw);
        } else if (entry.first == "MQTT_USERNAME") {
            out.mqttUsername = raw;
        } else if (entry.first == "MQTT_PASSWORD") {
            out.mqttPassword = raw;
        } else if (entry.first == "BEACON_TIMEOUT_SECONDS") {
            if (!parseDouble(raw, dv)) return fail("%s must be a number (got '%s')", key, raw);
            out.beaconTimeoutSeconds = dv;
        } else if (entry.first == "BEACON_FADE_OUT_SECONDS") {
            if (!parseDouble(raw, dv)) return fail("%s must be a number (got '%s')", key, raw);
            out.beaconFadeOutSeconds = dv;
        } else if (entry.first == "UPDATE_INTERVAL") {
            if (!parseDouble(raw, dv)) return fail("%s must be a number (got '%s')", key, raw);
            if (!(dv > 0.0 && dv <= ConfigLimits::UPDATE_INTERVAL_MAX_S)) {
                return fail("%s must be in (0, 3600] seconds (got '%s')", key, raw);
            }
            out.updateIntervalSeconds = dv;
        } else if (entry.first == "TRAIL_LENGTH") {
            if (!parseLong(raw, lv)) return fail("%s must be an integer (got '%s')", key, raw);
            if (lv < ConfigLimits::TRAIL_LENGTH_MIN || lv > ConfigLimits::TRAIL_LENGTH_MAX) {
                return fail("%s must be between 1 and 1000 (got '%s')", key, raw);
            }
            out.trailLength = static_cast<uint16_t>(lv);
        } else if (entry.first == "FADE_FACTOR") {
            if (!parseDouble(raw, dv)) return fail("%s must be a number (got '%s')", key, raw);
            if (!(dv > 0.0 && dv <= 1.0)) {
                return fail("%s must be in (0, 1] (got '%s')", key, raw);
            }
            out.fadeFactor = static_cast<float>(dv);
        } else if (entry.first == "LOG_LEVEL") {
            out.logLevel = toUpper(trim(raw));
        } else {
            LB_LOGD("Ignoring unknown key %s", key);
        }
    }

    return validate(out);
}

// ============================================================================
// Validation
// ============================================================================

ConfigResult validate(const AppConfig& config) {
    ConfigResult result;

    if (config.wledHost.empty()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "WLED_HOST must not be empty");
    } else if (config.ledCount < ConfigLimits::LED_COUNT_MIN || config.ledCount > ConfigLimits::LED_COUNT_MAX) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "LED_COUNT must be between 1 and 4096 (got %u)", config.ledCount);
    } else if (!(config.httpTimeoutSeconds > 0.0 && config.httpTimeoutSeconds <= ConfigLimits::HTTP_TIMEOUT_MAX_S)) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "HTTP_TIMEOUT must be in (0, 60] seconds (got %g)",
                 config.httpTimeoutSeconds);
    } else if (config.httpRetries < ConfigLimits::HTTP_RETRIES_MIN || config.httpRetries > ConfigLimits::HTTP_RETRIES_MAX) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "HTTP_RETRIES must be between 1 and 10 (got %u)", config.httpRetries);
    } else if (config.udpPort < ConfigLimits::PORT_MIN) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "UDP_PORT must be between 1 and 65535 (got %u)", config.udpPort);
    } else if (config.mqttBroker.empty()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "MQTT_BROKER must not be empty");
    } else if (config.mqttPort < ConfigLimits::PORT_MIN) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "MQTT_PORT must be between 1 and 65535 (got %u)", config.mqttPort);
    } else if (config.mqttLocation.empty()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "MQTT_LOCATION must not be empty");
    } else if (config.mqttBaseTopic.empty()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "MQTT_BASE_TOPIC must not be empty");
    } else if (!(config.beaconTimeoutSeconds >= 0.0)) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "BEACON_TIMEOUT_SECONDS must not be negative (got %g)",
                 config.beaconTimeoutSeconds);
    } else if (!(config.beaconFadeOutSeconds > 0.0)) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "BEACON_FADE_OUT_SECONDS must be positive (got %g)",
                 config.beaconFadeOutSeconds);
    } else if (!(config.updateIntervalSeconds > 0.0 &&
                 config.updateIntervalSeconds <= ConfigLimits::UPDATE_INTERVAL_MAX_S)) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "UPDATE_INTERVAL must be in (0, 3600] seconds (got %g)",
                 config.updateIntervalSeconds);
    } else if (config.trailLength < ConfigLimits::TRAIL_LENGTH_MIN || config.trailLength > ConfigLimits::TRAIL_LENGTH_MAX) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "TRAIL_LENGTH must be between 1 and 1000 (got %u)", config.trailLength);
    } else if (!(config.fadeFactor > 0.0f && config.fadeFactor <= 1.0f)) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "FADE_FACTOR must be in (0, 1] (got %g)",
                 static_cast<double>(config.fadeFactor));
    } else if (!isValidLogLevel(config.logLevel)) {
        snprintf(result.errorMsg, MAX_ERROR_MSG,
                 "LOG_LEVEL must be one of DEBUG, INFO, WARNING, ERROR, CRITICAL (got '%s')",
                 config.logLevel.c_str());
    } else {
        return ok();
    }
    return result;
}

bool applyLogLevel(const AppConfig& config) {
    int level = LB_LOG_LEVEL_INFO;
    if (!logging::levelFromName(config.logLevel.c_str(), level)) {
        return false;
    }
    logging::setLogLevel(level);
    return true;
}

// ============================================================================
// Export
// ============================================================================

const char* outputModeName(OutputMode mode) {
    switch (mode) {
        case OutputMode::UDP:  return "udp";
        case OutputMode::HTTP: return "http";
    }
    return "unknown";
}

std::string toJson(const AppConfig& config, bool maskPassword) {
    JsonDocument doc;
    JsonObject obj = doc.to<JsonObject>();

    obj["wled_host"] = config.wledHost;
    obj["led_count"] = config.ledCount;
    obj["output_mode"] = outputModeName(config.outputMode);
    obj["http_timeout"] = config.httpTimeoutSeconds;
    obj["http_retries"] = config.httpRetries;
    obj["udp_port"] = config.udpPort;

    JsonObject mqtt = obj["mqtt"].to<JsonObject>();
    mqtt["broker"] = config.mqttBroker;
    mqtt["port"] = config.mqttPort;
    mqtt["location"] = config.mqttLocation;
    mqtt["base_topic"] = config.mqttBaseTopic;
    if (!config.mqttUsername.empty()) {
        mqtt["username"] = config.mqttUsername;
    }
    if (!config.mqttPassword.empty()) {
        mqtt["password"] = maskPassword ? "***" : config.mqttPassword.c_str();
    }

    obj["beacon_timeout_seconds"] = config.beaconTimeoutSeconds;
    obj["beacon_fade_out_seconds"] = config.beaconFadeOutSeconds;
    obj["update_interval"] = config.updateIntervalSeconds;
    obj["trail_length"] = config.trailLength;
    obj["fade_factor"] = config.fadeFactor;
    obj["log_level"] = config.logLevel;

    std::string out;
    serializeJson(doc, out);
    return out;
}

core::RenderConfig toRenderConfig(const AppConfig& config) {
    core::RenderConfig render;
    render.trackLength = config.ledCount;
    render.trailLength = config.trailLength;
    render.fadeFactor = config.fadeFactor;
    const double intervalMs = std::round(config.updateIntervalSeconds * 1000.0);
    render.intervalMs = intervalMs < 1.0 ? 1u : static_cast<uint32_t>(intervalMs);
    return render;
}

} // namespace config
} // namespace lumibeacon
