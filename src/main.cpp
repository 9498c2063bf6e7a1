// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file main.cpp
 * @brief lumibeacon: MQTT beacon sightings -> WLED LED strip
 *
 * Startup order:
 *   1. Configuration (defaults, dotenv, environment, command line), validated
 *   2. Output sink (UDP DRGB or HTTP JSON)
 *   3. Signal watcher (before the MQTT network thread exists)
 *   4. MQTT subscriber feeding the beacon registry
 *   5. Render loop on the main thread until SIGINT/SIGTERM or --duration
 */

#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <memory>
#include <string>

#include "config/AppConfig.h"
#include "core/BeaconRegistry.h"
#include "core/RenderLoop.h"
#include "ingest/BeaconIngestAdapter.h"
#include "network/HttpJsonSink.h"
#include "network/MqttSubscriber.h"
#include "network/UdpDrgbSink.h"
#include "utils/ShutdownSignal.h"

#define LB_LOG_TAG "Main"
#include "utils/Log.h"

using namespace lumibeacon;

namespace {

constexpr const char* DEFAULT_ENV_FILE = ".env";

void printUsage(const char* prog) {
    printf("Usage: %s [options]\n"
           "\n"
           "Render BLE beacon sightings from MQTT onto a WLED LED strip.\n"
           "\n"
           "Options:\n"
           "  --env-file PATH      dotenv file to load (default: .env)\n"
           "  --duration SECONDS   stop after this many seconds (default: run forever)\n"
           "  -h, --help           show this help and exit\n"
           "\n"
           "All other settings come from the environment or the dotenv file:\n",
           prog);
    for (size_t i = 0; i < config::ConfigLoader::KEY_COUNT; i++) {
        printf("  %s\n", config::ConfigLoader::KEYS[i]);
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string envFile = DEFAULT_ENV_FILE;
    double durationSeconds = 0.0;

    static const struct option longOptions[] = {
        {"env-file", required_argument, nullptr, 'e'},
        {"duration", required_argument, nullptr, 'd'},
        {"help",     no_argument,       nullptr, 'h'},
        {nullptr,    0,                 nullptr, 0}
    };

    int opt = 0;
    while ((opt = getopt_long(argc, argv, "h", longOptions, nullptr)) != -1) {
        switch (opt) {
            case 'e':
                envFile = optarg;
                break;
            case 'd': {
                char* end = nullptr;
                durationSeconds = strtod(optarg, &end);
                if (end == optarg || *end != '\0' || durationSeconds < 0.0) {
                    fprintf(stderr, "Invalid --duration '%s'\n", optarg);
                    return EXIT_FAILURE;
                }
                break;
            }
            case 'h':
                printUsage(argv[0]);
                return EXIT_SUCCESS;
            default:
                printUsage(argv[0]);
                return EXIT_FAILURE;
        }
    }

    // ========================================================================
    // Configuration
    // ========================================================================

    config::ConfigLoader loader;
    if (!loader.loadEnvFile(envFile.c_str())) {
        LB_LOGW("No dotenv file at %s, using environment and defaults", envFile.c_str());
    }
    loader.loadEnvironment();

    config::AppConfig cfg;
    const config::ConfigResult result = loader.build(cfg);
    if (!result.success) {
        LB_LOGE("Configuration error: %s", result.errorMsg);
        return EXIT_FAILURE;
    }
    config::applyLogLevel(cfg);

    LB_LOGI("Starting lumibeacon");
    LB_LOGD("Configuration: %s", config::toJson(cfg).c_str());

    core::RenderConfig renderConfig = config::toRenderConfig(cfg);
    renderConfig.durationSeconds = durationSeconds;

    core::BeaconRegistry registry(cfg.beaconTimeoutSeconds, cfg.beaconFadeOutSeconds);

    // ========================================================================
    // Output Sink
    // ========================================================================

    std::unique_ptr<network::UdpDrgbSink> udpSink;
    std::unique_ptr<network::HttpJsonSink> httpSink;
    core::IFrameSink* sink = nullptr;

    if (cfg.outputMode == config::OutputMode::UDP) {
        udpSink.reset(new network::UdpDrgbSink(cfg.wledHost, cfg.udpPort));
        if (!udpSink->begin()) {
            return EXIT_FAILURE;
        }
        LB_LOGI("Using WLED UDP output at %s:%u with %u LEDs", cfg.wledHost.c_str(), cfg.udpPort, cfg.ledCount);
        sink = udpSink.get();
    } else {
        network::HttpSinkSettings httpSettings;
        httpSettings.host = cfg.wledHost;
        httpSettings.timeoutSeconds = cfg.httpTimeoutSeconds;
        httpSettings.maxAttempts = cfg.httpRetries;
        httpSink.reset(new network::HttpJsonSink(httpSettings));
        if (!httpSink->begin()) {
            return EXIT_FAILURE;
        }
        LB_LOGI("Using WLED HTTP output at %s with %u LEDs", cfg.wledHost.c_str(), cfg.ledCount);
        sink = httpSink.get();
    }

    core::RenderLoop renderLoop(registry, *sink, renderConfig);
    if (!renderLoop.begin()) {
        return EXIT_FAILURE;
    }

    utils::ShutdownSignal shutdown;
    if (!shutdown.install([&renderLoop](int) { renderLoop.requestStop(); })) {
        return EXIT_FAILURE;
    }

    // ========================================================================
    // Beacon Ingest
    // ========================================================================

    ingest::BeaconIngestAdapter adapter(registry, cfg.mqttLocation);

    network::MqttSettings mqttSettings;
    mqttSettings.host = cfg.mqttBroker;
    mqttSettings.port = cfg.mqttPort;
    mqttSettings.username = cfg.mqttUsername;
    mqttSettings.password = cfg.mqttPassword;
    mqttSettings.baseTopic = cfg.mqttBaseTopic;

    network::MqttSubscriber subscriber(mqttSettings, adapter);
    if (!subscriber.begin()) {
        return EXIT_FAILURE;
    }
    LB_LOGI("MQTT listener started for location '%s' on %s:%u",
            cfg.mqttLocation.c_str(), cfg.mqttBroker.c_str(), cfg.mqttPort);

    // ========================================================================
    // Render
    // ========================================================================

    LB_LOGI("Starting animation loop with interval %.2fs", cfg.updateIntervalSeconds);
    renderLoop.run();

    subscriber.stop();
    shutdown.release();

    const ingest::IngestStats stats = adapter.getStats();
    LB_LOGI("Ingested %lu messages from %lu beacons (%lu filtered, %lu rejected)",
            (unsigned long)stats.accepted, (unsigned long)stats.uniqueBeacons(),
            (unsigned long)stats.filtered, (unsigned long)stats.rejected);
    return EXIT_SUCCESS;
}
