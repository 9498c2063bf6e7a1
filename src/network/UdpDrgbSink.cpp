// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file UdpDrgbSink.cpp
 * @brief UDP DRGB frame sink implementation
 */

#include "UdpDrgbSink.h"
#include "DrgbFrameEncoder.h"

#define LB_LOG_TAG "UdpSink"
#include "../utils/Log.h"

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <unistd.h>

namespace lumibeacon {
namespace network {

// ============================================================================
// Construction / Lifecycle
// ============================================================================

UdpDrgbSink::UdpDrgbSink(const std::string& host, uint16_t port)
    : m_host(host)
    , m_port(port)
{
}

UdpDrgbSink::~UdpDrgbSink() {
    stop();
}

bool UdpDrgbSink::begin() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stats.started) return true;

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;

    const std::string service = std::to_string(m_port);
    struct addrinfo* results = nullptr;
    int rc = getaddrinfo(m_host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0 || results == nullptr) {
        LB_LOGE("Cannot resolve %s: %s", m_host.c_str(), gai_strerror(rc));
        return false;
    }

    for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        m_socket = fd;
        memcpy(&m_target, ai->ai_addr, ai->ai_addrlen);
        m_targetLen = static_cast<socklen_t>(ai->ai_addrlen);
        break;
    }
    freeaddrinfo(results);

    if (m_socket < 0) {
        LB_LOGE("Failed to open UDP socket for %s:%u: %s", m_host.c_str(), m_port, strerror(errno));
        return false;
    }

    m_stats = UdpStats{};
    m_stats.started = true;
    LB_LOGI("UDP DRGB sink targeting %s:%u", m_host.c_str(), m_port);
    return true;
}

void UdpDrgbSink::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_socket >= 0) {
        close(m_socket);
        m_socket = -1;
    }
    m_stats.started = false;
}

// ============================================================================
// Frame Delivery
// ============================================================================

void UdpDrgbSink::update(const core::PixelBuffer& frame) {
    const std::vector<uint8_t> datagram = DrgbFrameEncoder::encode(frame);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_socket < 0) {
        m_stats.dropped++;
        if (m_stats.dropped == 1) {
            m_lastWarnMs = LB_LOG_MILLIS();
            LB_LOGW("UDP sink not started, dropping frame");
        } else {
            LB_LOG_THROTTLE(m_lastWarnMs, WARN_INTERVAL_MS,
                            LB_LOGW("UDP sink not started, dropping frame (dropped=%lu)",
                                    (unsigned long)m_stats.dropped));
        }
        return;
    }

    m_stats.attempts++;
    ssize_t sent = sendto(m_socket, datagram.data(), datagram.size(), 0,
                          reinterpret_cast<const struct sockaddr*>(&m_target), m_targetLen);
    if (sent < 0 || static_cast<size_t>(sent) != datagram.size()) {
        const int err = errno;
        m_stats.failures++;
        if (m_stats.failures == 1) {
            m_lastWarnMs = LB_LOG_MILLIS();
            LB_LOGW("UDP send to %s:%u failed: %s", m_host.c_str(), m_port, strerror(err));
        } else {
            LB_LOG_THROTTLE(m_lastWarnMs, WARN_INTERVAL_MS,
                            LB_LOGW("UDP send to %s:%u failed: %s (failures=%lu)",
                                    m_host.c_str(), m_port, strerror(err),
                                    (unsigned long)m_stats.failures));
        }
        return;
    }

    m_stats.success++;
    m_stats.lastBytes = static_cast<uint32_t>(datagram.size());
}

UdpDrgbSink::UdpStats UdpDrgbSink::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

} // namespace network
} // namespace lumibeacon
