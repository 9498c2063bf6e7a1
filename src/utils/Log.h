// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Log.h
 * @brief Unified logging system for Lumibeacon
 *
 * Provides consistent, colored logging with automatic timestamps and component tags.
 *
 * Usage:
 *   #define LB_LOG_TAG "MyComponent"
 *   #include "utils/Log.h"
 *
 *   LB_LOGI("Initialized with %d items", count);
 *   LB_LOGE("Failed: %s (code=%d)", msg, err);
 *   LB_LOGW("Queue high: %u entries", depth);
 *   LB_LOGD("Debug value: %f", val);
 *
 * Output format (stderr, so the terminal simulator keeps stdout):
 *   [12345][INFO][MyComponent] Initialized with 5 items
 *   [12346][ERROR][MyComponent] Failed: timeout (code=-1)
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>

// ============================================================================
// ANSI Color Constants
// ============================================================================

#define LB_ANSI_RESET      "\033[0m"

#define LB_CLR_GREEN       "\033[1;32m"   // Info
#define LB_CLR_RED         "\033[1;31m"   // Errors
#define LB_CLR_MAGENTA     "\033[1;35m"   // Warnings
#define LB_CLR_GRAY        "\033[0;37m"   // Debug (dim)

#define LB_CLR_ERROR       LB_CLR_RED
#define LB_CLR_WARN        LB_CLR_MAGENTA
#define LB_CLR_INFO        LB_CLR_GREEN
#define LB_CLR_DEBUG       LB_CLR_GRAY

// ============================================================================
// Log Level Configuration
// ============================================================================
// Compile-time ceiling via build flags:
//   -D LB_LOG_LEVEL=3   (0=None, 1=Error, 2=Warn, 3=Info, 4=Debug)
// The runtime threshold (LOG_LEVEL in the configuration) can only lower
// verbosity below this ceiling.

#ifndef LB_LOG_LEVEL
    #define LB_LOG_LEVEL 4
#endif

#define LB_LOG_LEVEL_NONE  0
#define LB_LOG_LEVEL_ERROR 1
#define LB_LOG_LEVEL_WARN  2
#define LB_LOG_LEVEL_INFO  3
#define LB_LOG_LEVEL_DEBUG 4

namespace lumibeacon {
namespace logging {

// Callback type for log output interception
using LogCallback = std::function<void(const char* formattedLine)>;

inline LogCallback& getLogCallback() {
    static LogCallback callback = nullptr;
    return callback;
}

// Not synchronized with concurrent logging; set once at startup (or in tests).
inline void setLogCallback(LogCallback cb) {
    getLogCallback() = cb;
}

inline void clearLogCallback() {
    getLogCallback() = nullptr;
}

inline bool hasLogCallback() {
    return getLogCallback() != nullptr;
}

inline std::atomic<int>& runtimeLevel() {
    static std::atomic<int> level{LB_LOG_LEVEL_INFO};
    return level;
}

inline void setLogLevel(int level) {
    runtimeLevel().store(level, std::memory_order_relaxed);
}

inline int getLogLevel() {
    return runtimeLevel().load(std::memory_order_relaxed);
}

inline bool isEnabled(int level) {
    return level <= getLogLevel();
}

/**
 * @brief Map a configuration level name to a numeric level
 *
 * Accepts DEBUG, INFO, WARNING, ERROR and CRITICAL (CRITICAL maps to ERROR).
 *
 * @return true if the name was recognised
 */
inline bool levelFromName(const char* name, int& outLevel) {
    if (name == nullptr) return false;
    if (strcmp(name, "DEBUG") == 0)    { outLevel = LB_LOG_LEVEL_DEBUG; return true; }
    if (strcmp(name, "INFO") == 0)     { outLevel = LB_LOG_LEVEL_INFO;  return true; }
    if (strcmp(name, "WARNING") == 0)  { outLevel = LB_LOG_LEVEL_WARN;  return true; }
    if (strcmp(name, "ERROR") == 0)    { outLevel = LB_LOG_LEVEL_ERROR; return true; }
    if (strcmp(name, "CRITICAL") == 0) { outLevel = LB_LOG_LEVEL_ERROR; return true; }
    return false;
}

// Milliseconds since the first log call (process start in practice)
inline uint32_t millis() {
    static const auto start = std::chrono::steady_clock::now();
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

inline void output(const char* formatted) {
    fputs(formatted, stderr);

    if (hasLogCallback()) {
        getLogCallback()(formatted);
    }
}

} // namespace logging
} // namespace lumibeacon

#define LB_LOG_MILLIS() ::lumibeacon::logging::millis()

// ============================================================================
// Core Logging Macros
// ============================================================================

#ifndef LB_LOG_TAG
    #define LB_LOG_TAG "LB"
#endif

#define LB_LOG_FORMAT(level_str, level_color, fmt) \
    "[%lu]" level_color "[" level_str "]" LB_ANSI_RESET "[" LB_LOG_TAG "] " fmt "\n"

#define LB_LOG_BUFFER_SIZE 512

#define LB_LOG_IMPL(level, level_str, level_color, fmt, ...) \
    do { \
        if (::lumibeacon::logging::isEnabled(level)) { \
            char _lb_log_buf[LB_LOG_BUFFER_SIZE]; \
            snprintf(_lb_log_buf, sizeof(_lb_log_buf), \
                     LB_LOG_FORMAT(level_str, level_color, fmt), \
                     (unsigned long)LB_LOG_MILLIS(), ##__VA_ARGS__); \
            ::lumibeacon::logging::output(_lb_log_buf); \
        } \
    } while(0)

#if LB_LOG_LEVEL >= LB_LOG_LEVEL_ERROR
    #define LB_LOGE(fmt, ...) LB_LOG_IMPL(LB_LOG_LEVEL_ERROR, "ERROR", LB_CLR_ERROR, fmt, ##__VA_ARGS__)
#else
    #define LB_LOGE(fmt, ...) ((void)0)
#endif

#if LB_LOG_LEVEL >= LB_LOG_LEVEL_WARN
    #define LB_LOGW(fmt, ...) LB_LOG_IMPL(LB_LOG_LEVEL_WARN, "WARN", LB_CLR_WARN, fmt, ##__VA_ARGS__)
#else
    #define LB_LOGW(fmt, ...) ((void)0)
#endif

#if LB_LOG_LEVEL >= LB_LOG_LEVEL_INFO
    #define LB_LOGI(fmt, ...) LB_LOG_IMPL(LB_LOG_LEVEL_INFO, "INFO", LB_CLR_INFO, fmt, ##__VA_ARGS__)
#else
    #define LB_LOGI(fmt, ...) ((void)0)
#endif

#if LB_LOG_LEVEL >= LB_LOG_LEVEL_DEBUG
    #define LB_LOGD(fmt, ...) LB_LOG_IMPL(LB_LOG_LEVEL_DEBUG, "DEBUG", LB_CLR_DEBUG, fmt, ##__VA_ARGS__)
#else
    #define LB_LOGD(fmt, ...) ((void)0)
#endif

// ============================================================================
// Conditional Logging (Throttled)
// ============================================================================
// For logs that should only appear occasionally from the frame loop.
//
// Usage:
//   static uint32_t lastLog = 0;
//   LB_LOG_THROTTLE(lastLog, 1000, LB_LOGI("Status: %d", val));

#define LB_LOG_THROTTLE(last_var, interval_ms, log_statement) \
    do { \
        uint32_t _now = LB_LOG_MILLIS(); \
        if (_now - (last_var) >= (interval_ms)) { \
            (last_var) = _now; \
            log_statement; \
        } \
    } while(0)
