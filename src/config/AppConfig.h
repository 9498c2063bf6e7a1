/**
 * @file AppConfig.h
 * @brief Runtime configuration for the beacon bridge and simulator
 *
 * Values are layered, later sources winning:
 *   1. Built-in defaults (the AppConfig member initialisers)
 *   2. dotenv file (KEY=VALUE lines, '#' comments, optional quotes)
 *   3. Process environment
 *   4. Command-line overrides (ConfigLoader::set)
 *
 * ConfigLoader only collects raw strings; build() parses and range-checks
 * them into an AppConfig in one place so a bad value is reported with its key
 * before any component starts.
 *
 * Keys:
 *   WLED_HOST, LED_COUNT, OUTPUT_MODE, HTTP_TIMEOUT, HTTP_RETRIES, UDP_PORT,
 *   MQTT_BROKER, MQTT_PORT, MQTT_LOCATION, MQTT_BASE_TOPIC, MQTT_USERNAME,
 *   MQTT_PASSWORD, BEACON_TIMEOUT_SECONDS, BEACON_FADE_OUT_SECONDS,
 *   UPDATE_INTERVAL, TRAIL_LENGTH, FADE_FACTOR, LOG_LEVEL
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <string>

#include "../core/RenderLoop.h"

namespace lumibeacon {
namespace config {

static constexpr size_t MAX_ERROR_MSG = 160;

// ============================================================================
// Ranges
// ============================================================================

namespace ConfigLimits {
    constexpr long LED_COUNT_MIN = 1;
    constexpr long LED_COUNT_MAX = 4096;
    constexpr long TRAIL_LENGTH_MIN = 1;
    constexpr long TRAIL_LENGTH_MAX = 1000;
    constexpr long HTTP_RETRIES_MIN = 1;
    constexpr long HTTP_RETRIES_MAX = 10;
    constexpr long PORT_MIN = 1;
    constexpr long PORT_MAX = 65535;
    constexpr double HTTP_TIMEOUT_MAX_S = 60.0;
    constexpr double UPDATE_INTERVAL_MAX_S = 3600.0;
}

enum class OutputMode : uint8_t {
    UDP = 0,
    HTTP = 1
};

/**
 * @brief Fully parsed configuration
 */
struct AppConfig {
    std::string wledHost = "wled.local";
    uint16_t ledCount = 60;
    OutputMode outputMode = OutputMode::UDP;
    double httpTimeoutSeconds = 1.0;
    uint8_t httpRetries = 3;
    uint16_t udpPort = 21324;

    std::string mqttBroker = "localhost";
    uint16_t mqttPort = 1883;
    std::string mqttLocation = "balkon";
    std::string mqttBaseTopic = "espresense/devices";
    std::string mqttUsername;
    std::string mqttPassword;

    double beaconTimeoutSeconds = 6.0;
    double beaconFadeOutSeconds = 4.0;
    double updateIntervalSeconds = 0.2;
    uint16_t trailLength = 10;
    float fadeFactor = 0.75f;
    std::string logLevel = "INFO";
};

struct ConfigResult {
    bool success;
    char errorMsg[MAX_ERROR_MSG];

    ConfigResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

// ============================================================================
// Loader
// ============================================================================

class ConfigLoader {
public:
    /// Every recognised key, in documentation order
    static const char* const KEYS[];
    static const size_t KEY_COUNT;

    /**
     * @brief Merge a dotenv file
     * @return false if the file cannot be opened (values unchanged)
     */
    bool loadEnvFile(const char* path);

    /**
     * @brief Merge recognised keys present in the process environment
     */
    void loadEnvironment();

    /**
     * @brief Override one key (command line)
     */
    void set(const std::string& key, const std::string& value);

    bool has(const std::string& key) const;

    /**
     * @brief Parse and validate every collected value into out
     *
     * Keys not collected keep out's current value. On failure errorMsg names
     * the offending key and out may be partially updated.
     */
    ConfigResult build(AppConfig& out) const;

    /**
     * @brief Split one dotenv line
     * @return false for blank lines, comments and lines without '='
     */
    static bool parseEnvLine(const std::string& line, std::string& key, std::string& value);

private:
    std::map<std::string, std::string> m_values;
};

// ============================================================================
// Validation / Export
// ============================================================================

/**
 * @brief Range-check a configuration assembled in code
 */
ConfigResult validate(const AppConfig& config);

/**
 * @brief Apply LOG_LEVEL to the runtime log threshold
 * @return false if the level name is not recognised
 */
bool applyLogLevel(const AppConfig& config);

/**
 * @brief Effective configuration as a JSON object string
 * @param maskPassword Replace a set password with "***"
 */
std::string toJson(const AppConfig& config, bool maskPassword = true);

const char* outputModeName(OutputMode mode);

/**
 * @brief Render parameters derived from the configuration
 */
core::RenderConfig toRenderConfig(const AppConfig& config);

} // namespace config
} // namespace lumibeacon
