// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file HttpJsonSink.cpp
 * @brief WLED HTTP JSON frame sink implementation
 */

#include "HttpJsonSink.h"
#include "WledStateCodec.h"

#define LB_LOG_TAG "HttpSink"
#include "../utils/Log.h"

#include <chrono>
#include <curl/curl.h>
#include <thread>

namespace lumibeacon {
namespace network {

namespace {

std::once_flag s_curlInitOnce;

// Response bodies are not needed; swallow them instead of letting curl print to stdout
size_t discardBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    (void)ptr;
    (void)userdata;
    return size * nmemb;
}

bool isRetryable(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return true;
        default:
            return false;
    }
}

} // namespace

// ============================================================================
// Construction / Lifecycle
// ============================================================================

HttpJsonSink::HttpJsonSink(const HttpSinkSettings& settings)
    : m_settings(settings)
    , m_url(WledStateCodec::stateUrl(settings.host))
{
}

HttpJsonSink::~HttpJsonSink() {
    stop();
}

bool HttpJsonSink::begin() {
    if (m_curl != nullptr) return true;

    if (!(m_settings.timeoutSeconds > 0.0 && m_settings.timeoutSeconds <= MAX_TIMEOUT_SECONDS)) {
        LB_LOGE("HTTP timeout must be in (0, %.0f] seconds (got %g)",
                MAX_TIMEOUT_SECONDS, m_settings.timeoutSeconds);
        return false;
    }

    std::call_once(s_curlInitOnce, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    m_curl = curl_easy_init();
    if (m_curl == nullptr) {
        LB_LOGE("Failed to initialise libcurl handle");
        return false;
    }

    LB_LOGI("HTTP JSON sink targeting %s (timeout %.2fs, %u attempts)",
            m_url.c_str(), m_settings.timeoutSeconds, m_settings.maxAttempts);
    return true;
}

void HttpJsonSink::stop() {
    if (m_curl != nullptr) {
        curl_easy_cleanup(static_cast<CURL*>(m_curl));
        m_curl = nullptr;
    }
}

// ============================================================================
// Frame Delivery
// ============================================================================

void HttpJsonSink::update(const core::PixelBuffer& frame) {
    const std::string body = WledStateCodec::serializeState(frame);
    const uint8_t maxAttempts = m_settings.maxAttempts > 0 ? m_settings.maxAttempts : 1;

    for (uint8_t attempt = 1; attempt <= maxAttempts; attempt++) {
        const HttpAttempt outcome = performRequest(m_url, body);

        {
            std::lock_guard<std::mutex> lock(m_statsMutex);
            m_stats.attempts++;
            if (attempt > 1) m_stats.retries++;
        }

        if (outcome.result == HttpAttemptResult::OK) {
            std::lock_guard<std::mutex> lock(m_statsMutex);
            m_stats.framesDelivered++;
            m_stats.lastStatusCode = outcome.statusCode;
            if (outcome.statusCode < 200 || outcome.statusCode >= 300) {
                m_stats.httpErrors++;
                LB_LOGW("%s answered HTTP %ld", m_settings.host.c_str(), outcome.statusCode);
            }
            return;
        }

        if (outcome.result == HttpAttemptResult::FATAL) {
            LB_LOGE("HTTP request error for %s: %s", m_settings.host.c_str(), outcome.error.c_str());
            break;
        }

        if (attempt < maxAttempts) {
            LB_LOGW("HTTP timeout on attempt %u/%u for %s, retrying",
                    attempt, maxAttempts, m_settings.host.c_str());
            backoff(m_settings.retryDelayMs);
        } else {
            LB_LOGE("HTTP request failed after %u attempts for %s: %s",
                    maxAttempts, m_settings.host.c_str(), outcome.error.c_str());
        }
    }

    std::lock_guard<std::mutex> lock(m_statsMutex);
    m_stats.framesDropped++;
}

HttpAttempt HttpJsonSink::performRequest(const std::string& url, const std::string& body) {
    HttpAttempt outcome;
    CURL* curl = static_cast<CURL*>(m_curl);
    if (curl == nullptr) {
        outcome.result = HttpAttemptResult::FATAL;
        outcome.error = "sink not started";
        return outcome;
    }

    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");
    const long timeoutMs = static_cast<long>(m_settings.timeoutSeconds * 1000.0);

    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardBody);

    const CURLcode code = curl_easy_perform(curl);
    curl_slist_free_all(headers);

    if (code == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &outcome.statusCode);
        outcome.result = HttpAttemptResult::OK;
        return outcome;
    }

    outcome.result = isRetryable(code) ? HttpAttemptResult::RETRYABLE : HttpAttemptResult::FATAL;
    outcome.error = curl_easy_strerror(code);
    return outcome;
}

void HttpJsonSink::backoff(uint32_t delayMs) {
    std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
}

HttpJsonSink::HttpStats HttpJsonSink::getStats() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_stats;
}

} // namespace network
} // namespace lumibeacon
