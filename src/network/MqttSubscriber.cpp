// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file MqttSubscriber.cpp
 * @brief libmosquitto beacon subscriber implementation
 */

#include "MqttSubscriber.h"

#include <mosquitto.h>
#include <mutex>

#define LB_LOG_TAG "MQTT"
#include "../utils/Log.h"

namespace lumibeacon {
namespace network {

namespace {

std::once_flag s_libInitOnce;

} // namespace

MqttSubscriber::MqttSubscriber(const MqttSettings& settings, ingest::BeaconIngestAdapter& adapter)
    : m_settings(settings)
    , m_adapter(adapter)
{
}

MqttSubscriber::~MqttSubscriber() {
    stop();
}

std::string MqttSubscriber::getSubscriptionTopic() const {
    return m_settings.baseTopic + "/+/+";
}

// ============================================================================
// Lifecycle
// ============================================================================

bool MqttSubscriber::begin() {
    if (m_started) {
        return true;
    }

    std::call_once(s_libInitOnce, [] { mosquitto_lib_init(); });

    const char* clientId = m_settings.clientId.empty() ? nullptr : m_settings.clientId.c_str();
    m_client = mosquitto_new(clientId, true, this);
    if (m_client == nullptr) {
        LB_LOGE("Failed to create MQTT client");
        return false;
    }

    mosquitto_connect_callback_set(m_client, &MqttSubscriber::onConnect);
    mosquitto_disconnect_callback_set(m_client, &MqttSubscriber::onDisconnect);
    mosquitto_message_callback_set(m_client, &MqttSubscriber::onMessage);

    if (!m_settings.username.empty() && !m_settings.password.empty()) {
        int rc = mosquitto_username_pw_set(m_client, m_settings.username.c_str(),
                                           m_settings.password.c_str());
        if (rc != MOSQ_ERR_SUCCESS) {
            LB_LOGE("Failed to set MQTT credentials: %s", mosquitto_strerror(rc));
            mosquitto_destroy(m_client);
            m_client = nullptr;
            return false;
        }
    }

    mosquitto_reconnect_delay_set(m_client, RECONNECT_DELAY_MIN_S, RECONNECT_DELAY_MAX_S, true);

    LB_LOGI("Connecting to MQTT broker %s:%u", m_settings.host.c_str(), m_settings.port);
    int rc = mosquitto_connect(m_client, m_settings.host.c_str(), m_settings.port,
                               m_settings.keepaliveSeconds);
    if (rc != MOSQ_ERR_SUCCESS) {
        LB_LOGE("MQTT connect to %s:%u failed: %s", m_settings.host.c_str(), m_settings.port,
                mosquitto_strerror(rc));
        mosquitto_destroy(m_client);
        m_client = nullptr;
        return false;
    }

    rc = mosquitto_loop_start(m_client);
    if (rc != MOSQ_ERR_SUCCESS) {
        LB_LOGE("Failed to start MQTT network thread: %s", mosquitto_strerror(rc));
        mosquitto_disconnect(m_client);
        mosquitto_destroy(m_client);
        m_client = nullptr;
        return false;
    }

    m_started = true;
    return true;
}

void MqttSubscriber::stop() {
    if (m_client == nullptr) {
        return;
    }

    mosquitto_disconnect(m_client);
    if (m_started) {
        mosquitto_loop_stop(m_client, false);
    }
    mosquitto_destroy(m_client);
    m_client = nullptr;
    m_started = false;
    m_connected.store(false);
    LB_LOGI("MQTT subscriber stopped");
}

// ============================================================================
// Callbacks (libmosquitto network thread)
// ============================================================================

void MqttSubscriber::onConnect(struct mosquitto* client, void* context, int rc) {
    auto* self = static_cast<MqttSubscriber*>(context);
    if (rc != 0) {
        LB_LOGW("MQTT connection refused: %s", mosquitto_connack_string(rc));
        return;
    }

    self->m_connected.store(true);
    const std::string topic = self->getSubscriptionTopic();
    int subRc = mosquitto_subscribe(client, nullptr, topic.c_str(), 0);
    if (subRc != MOSQ_ERR_SUCCESS) {
        LB_LOGE("Subscribe to %s failed: %s", topic.c_str(), mosquitto_strerror(subRc));
        return;
    }
    LB_LOGI("Connected, subscribed to %s (location filter '%s')", topic.c_str(),
            self->m_adapter.getLocationFilter().c_str());
}

void MqttSubscriber::onDisconnect(struct mosquitto* client, void* context, int rc) {
    (void)client;
    auto* self = static_cast<MqttSubscriber*>(context);
    self->m_connected.store(false);
    if (rc != 0) {
        LB_LOGW("MQTT connection lost (%s), reconnecting", mosquitto_strerror(rc));
    }
}

void MqttSubscriber::onMessage(struct mosquitto* client, void* context,
                               const struct mosquitto_message* message) {
    (void)client;
    if (message == nullptr) {
        return;
    }
    auto* self = static_cast<MqttSubscriber*>(context);
    self->m_adapter.handleMessage(message->topic, message->payload,
                                  static_cast<size_t>(message->payloadlen));
}

} // namespace network
} // namespace lumibeacon
