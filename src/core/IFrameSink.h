/**
 * @file IFrameSink.h
 * @brief Output contract for finished frames
 *
 * Implementations:
 * - network::UdpDrgbSink      (WLED DRGB realtime datagrams)
 * - network::HttpJsonSink     (WLED JSON state API, bounded retries)
 * - sim::TerminalSimulatorSink (ANSI grid in the terminal)
 *
 * update() must accept a buffer of the configured LED count, must not throw
 * and must absorb transient transport failures itself.
 */

#pragma once

#include "PixelBuffer.h"

namespace lumibeacon {
namespace core {

class IFrameSink {
public:
    virtual ~IFrameSink() = default;

    /**
     * @brief Deliver one finished frame
     */
    virtual void update(const PixelBuffer& frame) = 0;
};

} // namespace core
} // namespace lumibeacon
