// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file MqttSubscriber.h
 * @brief libmosquitto client bound to a BeaconIngestAdapter
 *
 * Subscribes to "<baseTopic>/+/+" on every (re)connect and forwards each
 * message to the adapter from libmosquitto's own network thread
 * (mosquitto_loop_start). Reconnects are handled by the library with
 * exponential backoff.
 */

#pragma once

#include "../ingest/BeaconIngestAdapter.h"

#include <atomic>
#include <cstdint>
#include <string>

struct mosquitto;
struct mosquitto_message;

namespace lumibeacon {
namespace network {

struct MqttSettings {
    std::string host = "localhost";
    uint16_t port = 1883;
    std::string username;               ///< Used only if both username and password are set
    std::string password;
    std::string baseTopic = "espresense/devices";
    uint16_t keepaliveSeconds = 30;
    std::string clientId;               ///< Empty = broker-assigned
};

class MqttSubscriber {
public:
    static constexpr uint16_t RECONNECT_DELAY_MIN_S = 1;
    static constexpr uint16_t RECONNECT_DELAY_MAX_S = 30;

    MqttSubscriber(const MqttSettings& settings, ingest::BeaconIngestAdapter& adapter);
    ~MqttSubscriber();

    MqttSubscriber(const MqttSubscriber&) = delete;
    MqttSubscriber& operator=(const MqttSubscriber&) = delete;

    /**
     * @brief Create the client, connect and start the network thread
     * @return false (and logs) if the client cannot be created or connected
     */
    bool begin();

    /**
     * @brief Disconnect and join the network thread
     */
    void stop();

    bool isStarted() const { return m_started; }
    bool isConnected() const { return m_connected.load(); }

    /// "<baseTopic>/+/+"
    std::string getSubscriptionTopic() const;

private:
    static void onConnect(struct mosquitto* client, void* context, int rc);
    static void onDisconnect(struct mosquitto* client, void* context, int rc);
    static void onMessage(struct mosquitto* client, void* context, const struct mosquitto_message* message);

    MqttSettings m_settings;
    ingest::BeaconIngestAdapter& m_adapter;
    struct mosquitto* m_client = nullptr;
    bool m_started = false;
    std::atomic<bool> m_connected{false};
};

} // namespace network
} // namespace lumibeacon
