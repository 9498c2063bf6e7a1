// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file HttpJsonSink.h
 * @brief Frame sink posting WLED JSON state updates over HTTP (libcurl)
 *
 * One POST per frame. Timeouts and connection failures are retried up to
 * maxAttempts with a short fixed backoff; when attempts are exhausted the
 * frame is dropped and an error is logged. Any other transport error is
 * logged and the frame dropped without retry. Non-2xx responses count as
 * delivered (the device answered) and are logged at warning level.
 */

#pragma once

#include "../core/IFrameSink.h"

#include <cstdint>
#include <mutex>
#include <string>

namespace lumibeacon {
namespace network {

struct HttpSinkSettings {
    std::string host = "wled.local";
    double timeoutSeconds = 1.0;
    uint8_t maxAttempts = 3;
    uint32_t retryDelayMs = 50;
};

enum class HttpAttemptResult : uint8_t {
    OK = 0,         ///< Request completed (any HTTP status)
    RETRYABLE,      ///< Timeout or connection failure
    FATAL           ///< Any other transport error
};

struct HttpAttempt {
    HttpAttemptResult result = HttpAttemptResult::FATAL;
    long statusCode = 0;
    std::string error;
};

class HttpJsonSink : public core::IFrameSink {
public:
    static constexpr double MAX_TIMEOUT_SECONDS = 60.0;

    struct HttpStats {
        uint32_t framesDelivered = 0;
        uint32_t framesDropped = 0;
        uint32_t attempts = 0;
        uint32_t retries = 0;
        uint32_t httpErrors = 0;        ///< Delivered with a non-2xx status
        long lastStatusCode = 0;
    };

    explicit HttpJsonSink(const HttpSinkSettings& settings);
    ~HttpJsonSink() override;

    HttpJsonSink(const HttpJsonSink&) = delete;
    HttpJsonSink& operator=(const HttpJsonSink&) = delete;

    /**
     * @brief Create the libcurl handle
     * @return false (and logs) if the timeout is outside (0, MAX_TIMEOUT_SECONDS]
     *         or libcurl cannot be initialised
     */
    bool begin();
    void stop();

    void update(const core::PixelBuffer& frame) override;

    HttpStats getStats() const;
    const std::string& getUrl() const { return m_url; }
    const HttpSinkSettings& getSettings() const { return m_settings; }

protected:
    /**
     * @brief Perform one POST of body to url
     *
     * Overridden in tests to script transport outcomes.
     */
    virtual HttpAttempt performRequest(const std::string& url, const std::string& body);

    /**
     * @brief Wait between attempts
     */
    virtual void backoff(uint32_t delayMs);

private:
    const HttpSinkSettings m_settings;
    const std::string m_url;
    void* m_curl = nullptr;

    mutable std::mutex m_statsMutex;
    HttpStats m_stats;
};

} // namespace network
} // namespace lumibeacon
