// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file main_sim.cpp
 * @brief lumibeacon-sim: render beacons as a colored grid in the terminal
 *
 * Beacons come from the mock generator by default, or from the MQTT broker
 * with --mqtt. Log output goes to stderr; the grid owns stdout.
 */

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <memory>
#include <string>

#include "config/AppConfig.h"
#include "core/BeaconRegistry.h"
#include "core/RenderLoop.h"
#include "ingest/BeaconIngestAdapter.h"
#include "network/MqttSubscriber.h"
#include "sim/MockBeaconSource.h"
#include "sim/TerminalSimulatorSink.h"
#include "utils/ShutdownSignal.h"

#define LB_LOG_TAG "Sim"
#include "utils/Log.h"

using namespace lumibeacon;

namespace {

constexpr double SIM_BEACON_TIMEOUT_S = 3.0;
constexpr double SIM_BEACON_FADE_OUT_S = 2.0;

struct SimOptions {
    long rows = 10;
    long cols = 6;
    long beacons = 3;
    double durationSeconds = 0.0;
    bool useMqtt = false;
};

void printUsage(const char* prog) {
    printf("Usage: %s [options]\n"
           "\n"
           "Options:\n"
           "  --led-count N          total LEDs (default: 60)\n"
           "  --rows N               grid rows (default: 10)\n"
           "  --cols N               grid columns (default: 6)\n"
           "  --beacons N            mock beacons (default: 3)\n"
           "  --update-interval S    seconds between frames (default: 0.1)\n"
           "  --trail-length N       trail length in LEDs (default: 8)\n"
           "  --fade-factor F        trail fade factor (default: 0.7)\n"
           "  --duration S           stop after S seconds (default: infinite)\n"
           "  --mqtt                 use MQTT beacons instead of the mock generator\n"
           "  --mqtt-broker HOST     broker host (default: localhost)\n"
           "  --mqtt-port PORT       broker port (default: 1883)\n"
           "  --mqtt-location NAME   location filter (default: balkon)\n"
           "  --mqtt-username USER   broker username\n"
           "  --mqtt-password PASS   broker password\n"
           "  -h, --help             show this help and exit\n",
           prog);
}

bool parsePositive(const char* text, long& out) {
    errno = 0;
    char* end = nullptr;
    long value = strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || value <= 0) return false;
    out = value;
    return true;
}

void printBanner(const config::AppConfig& cfg, const SimOptions& opts) {
    const std::string rule(80, '=');
    printf("\n%s\nLumibeacon LED Strip Simulator\n%s\n", rule.c_str(), rule.c_str());
    printf("LED Count: %u (%ldx%ld grid)\n", cfg.ledCount, opts.rows, opts.cols);
    if (opts.useMqtt) {
        printf("Beacon Source: MQTT (%s:%u, location: %s)\n",
               cfg.mqttBroker.c_str(), cfg.mqttPort, cfg.mqttLocation.c_str());
    } else {
        printf("Beacon Source: Mock Generator (%ld beacons)\n", opts.beacons);
    }
    printf("Update Interval: %.2fs\n", cfg.updateIntervalSeconds);
    printf("Trail Length: %u\n", cfg.trailLength);
    printf("Fade Factor: %g\n", static_cast<double>(cfg.fadeFactor));
    if (opts.durationSeconds > 0.0) {
        printf("Duration: %.1fs\n", opts.durationSeconds);
    }
    printf("Press Ctrl+C to exit\n%s\n\n", rule.c_str());
    fflush(stdout);
}

} // namespace

int main(int argc, char** argv) {
    SimOptions opts;
    config::ConfigLoader loader;
    loader.set("UPDATE_INTERVAL", "0.1");
    loader.set("TRAIL_LENGTH", "8");
    loader.set("FADE_FACTOR", "0.7");

    enum {
        OPT_LED_COUNT = 1000, OPT_ROWS, OPT_COLS, OPT_BEACONS, OPT_INTERVAL, OPT_TRAIL,
        OPT_FADE, OPT_DURATION, OPT_MQTT, OPT_BROKER, OPT_PORT, OPT_LOCATION, OPT_USER, OPT_PASS
    };

    static const struct option longOptions[] = {
        {"led-count",       required_argument, nullptr, OPT_LED_COUNT},
        {"rows",            required_argument, nullptr, OPT_ROWS},
        {"cols",            required_argument, nullptr, OPT_COLS},
        {"beacons",         required_argument, nullptr, OPT_BEACONS},
        {"update-interval", required_argument, nullptr, OPT_INTERVAL},
        {"trail-length",    required_argument, nullptr, OPT_TRAIL},
        {"fade-factor",     required_argument, nullptr, OPT_FADE},
        {"duration",        required_argument, nullptr, OPT_DURATION},
        {"mqtt",            no_argument,       nullptr, OPT_MQTT},
        {"mqtt-broker",     required_argument, nullptr, OPT_BROKER},
        {"mqtt-port",       required_argument, nullptr, OPT_PORT},
        {"mqtt-location",   required_argument, nullptr, OPT_LOCATION},
        {"mqtt-username",   required_argument, nullptr, OPT_USER},
        {"mqtt-password",   required_argument, nullptr, OPT_PASS},
        {"help",            no_argument,       nullptr, 'h'},
        {nullptr,           0,                 nullptr, 0}
    };

    int opt = 0;
    while ((opt = getopt_long(argc, argv, "h", longOptions, nullptr)) != -1) {
        switch (opt) {
            case OPT_LED_COUNT: loader.set("LED_COUNT", optarg); break;
            case OPT_INTERVAL:  loader.set("UPDATE_INTERVAL", optarg); break;
            case OPT_TRAIL:     loader.set("TRAIL_LENGTH", optarg); break;
            case OPT_FADE:      loader.set("FADE_FACTOR", optarg); break;
            case OPT_BROKER:    loader.set("MQTT_BROKER", optarg); break;
            case OPT_PORT:      loader.set("MQTT_PORT", optarg); break;
            case OPT_LOCATION:  loader.set("MQTT_LOCATION", optarg); break;
            case OPT_USER:      loader.set("MQTT_USERNAME", optarg); break;
            case OPT_PASS:      loader.set("MQTT_PASSWORD", optarg); break;
            case OPT_MQTT:      opts.useMqtt = true; break;
            case OPT_ROWS:
                if (!parsePositive(optarg, opts.rows)) {
                    fprintf(stderr, "--rows must be positive\n");
                    return EXIT_FAILURE;
                }
                break;
            case OPT_COLS:
                if (!parsePositive(optarg, opts.cols)) {
                    fprintf(stderr, "--cols must be positive\n");
                    return EXIT_FAILURE;
                }
                break;
            case OPT_BEACONS:
                if (!parsePositive(optarg, opts.beacons) || opts.beacons > UINT16_MAX) {
                    fprintf(stderr, "--beacons must be positive\n");
                    return EXIT_FAILURE;
                }
                break;
            case OPT_DURATION: {
                char* end = nullptr;
                opts.durationSeconds = strtod(optarg, &end);
                if (end == optarg || *end != '\0' || opts.durationSeconds < 0.0) {
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

    config::AppConfig cfg;
    cfg.beaconTimeoutSeconds = SIM_BEACON_TIMEOUT_S;
    cfg.beaconFadeOutSeconds = SIM_BEACON_FADE_OUT_S;
    const config::ConfigResult result = loader.build(cfg);
    if (!result.success) {
        fprintf(stderr, "Invalid option: %s\n", result.errorMsg);
        return EXIT_FAILURE;
    }

    sim::TerminalSimulatorSink simulator(cfg.ledCount, static_cast<uint16_t>(opts.rows),
                                         static_cast<uint16_t>(opts.cols));
    if (opts.rows > UINT16_MAX || opts.cols > UINT16_MAX || !simulator.begin()) {
        return EXIT_FAILURE;
    }

    core::RenderConfig renderConfig = config::toRenderConfig(cfg);
    renderConfig.durationSeconds = opts.durationSeconds;

    core::BeaconRegistry registry(cfg.beaconTimeoutSeconds, cfg.beaconFadeOutSeconds);
    core::RenderLoop renderLoop(registry, simulator, renderConfig);
    if (!renderLoop.begin()) {
        return EXIT_FAILURE;
    }

    utils::ShutdownSignal shutdown;
    if (!shutdown.install([&renderLoop](int) { renderLoop.requestStop(); })) {
        return EXIT_FAILURE;
    }

    LB_LOGI("Configuration: %u LEDs (%ldx%ld), beacon source: %s, %.2fs interval",
            cfg.ledCount, opts.rows, opts.cols, opts.useMqtt ? "MQTT" : "Mock Generator",
            cfg.updateIntervalSeconds);

    // ========================================================================
    // Beacon Source
    // ========================================================================

    std::unique_ptr<ingest::BeaconIngestAdapter> adapter;
    std::unique_ptr<network::MqttSubscriber> subscriber;
    sim::MockBeaconSettings mockSettings;
    mockSettings.beaconCount = static_cast<uint16_t>(opts.beacons);
    sim::MockBeaconSource mockSource(mockSettings);

    if (opts.useMqtt) {
        adapter.reset(new ingest::BeaconIngestAdapter(registry, cfg.mqttLocation));

        network::MqttSettings mqttSettings;
        mqttSettings.host = cfg.mqttBroker;
        mqttSettings.port = cfg.mqttPort;
        mqttSettings.username = cfg.mqttUsername;
        mqttSettings.password = cfg.mqttPassword;
        mqttSettings.baseTopic = cfg.mqttBaseTopic;

        subscriber.reset(new network::MqttSubscriber(mqttSettings, *adapter));
        if (!subscriber->begin()) {
            return EXIT_FAILURE;
        }

        ingest::BeaconIngestAdapter* stats = adapter.get();
        renderLoop.setFrameCallback([stats](const core::RenderStats& frame) {
            const ingest::IngestStats ingestStats = stats->getStats();
            const double elapsed = frame.elapsedSeconds;
            const double fps = elapsed > 0.0 ? frame.framesRendered / elapsed : 0.0;
            const unsigned long secs = static_cast<unsigned long>(elapsed);
            printf("\rMQTT: %4lu msgs | %6.1f msg/s | Beacons: %2lu | FPS: %5.1f | Time: %02lu:%02lu",
                   (unsigned long)ingestStats.accepted, ingestStats.acceptRate,
                   (unsigned long)frame.lastBeaconCount, fps, secs / 60, secs % 60);
            fflush(stdout);
        });
    } else {
        if (!mockSource.start(registry, cfg.updateIntervalSeconds)) {
            return EXIT_FAILURE;
        }
    }

    printBanner(cfg, opts);
    renderLoop.run();

    mockSource.stop();
    if (subscriber) {
        subscriber->stop();
    }
    shutdown.release();

    if (shutdown.wasSignalled()) {
        printf("\n\nSimulation interrupted by user.\n");
    }
    const core::RenderStats stats = renderLoop.getStats();
    LB_LOGI("Simulation complete. Rendered %lu frames in %.2fs",
            (unsigned long)stats.framesRendered, stats.elapsedSeconds);
    return EXIT_SUCCESS;
}
