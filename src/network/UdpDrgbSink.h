/**
 * @file UdpDrgbSink.h
 * @brief Frame sink sending WLED DRGB datagrams over UDP
 *
 * Fire-and-forget: one datagram per frame, no ACKs, no retransmits.
 * Send failures are counted and logged (throttled), never propagated.
 */

#pragma once

#include "../core/IFrameSink.h"

#include <cstdint>
#include <mutex>
#include <string>
#include <sys/socket.h>

namespace lumibeacon {
namespace network {

class UdpDrgbSink : public core::IFrameSink {
public:
    static constexpr uint32_t WARN_INTERVAL_MS = 5000;

    struct UdpStats {
        bool started = false;
        uint32_t attempts = 0;
        uint32_t success = 0;
        uint32_t failures = 0;
        uint32_t dropped = 0;       ///< Frames discarded while not started
        uint32_t lastBytes = 0;
    };

    UdpDrgbSink(const std::string& host, uint16_t port);
    ~UdpDrgbSink() override;

    UdpDrgbSink(const UdpDrgbSink&) = delete;
    UdpDrgbSink& operator=(const UdpDrgbSink&) = delete;

    /**
     * @brief Resolve the target and open the socket
     * @return false (and logs) if the host cannot be resolved or the socket opened
     */
    bool begin();
    void stop();

    void update(const core::PixelBuffer& frame) override;

    UdpStats getStats() const;
    const std::string& getHost() const { return m_host; }
    uint16_t getPort() const { return m_port; }

private:
    const std::string m_host;
    const uint16_t m_port;
    int m_socket = -1;
    struct sockaddr_storage m_target {};
    socklen_t m_targetLen = 0;

    mutable std::mutex m_mutex;
    UdpStats m_stats;
    uint32_t m_lastWarnMs = 0;
};

} // namespace network
} // namespace lumibeacon
