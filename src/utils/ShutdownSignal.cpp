// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ShutdownSignal.cpp
 * @brief Signal watcher implementation
 */

#include "ShutdownSignal.h"

#include <csignal>
#include <cstring>
#include <pthread.h>
#include <unistd.h>

#define LB_LOG_TAG "Signal"
#include "Log.h"

namespace lumibeacon {
namespace utils {

namespace {

void watchedSignals(sigset_t& set) {
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGUSR1);
}

} // namespace

ShutdownSignal::~ShutdownSignal() {
    release();
}

bool ShutdownSignal::install(StopHandler handler, StopHandler forceHandler) {
    if (m_watcher.joinable()) return true;

    sigset_t set;
    watchedSignals(set);
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        LB_LOGE("Failed to block signals: %s", strerror(rc));
        return false;
    }

    m_handler = handler;
    m_forceHandler = forceHandler;
    m_releasing.store(false);
    m_watcher = std::thread(&ShutdownSignal::watch, this);
    return true;
}

void ShutdownSignal::release() {
    if (!m_watcher.joinable()) return;

    m_releasing.store(true);
    pthread_kill(m_watcher.native_handle(), SIGUSR1);
    m_watcher.join();
}

void ShutdownSignal::watch() {
    sigset_t set;
    watchedSignals(set);

    while (true) {
        int signum = 0;
        const int rc = sigwait(&set, &signum);
        if (rc != 0) {
            LB_LOGE("sigwait failed: %s", strerror(rc));
            return;
        }

        if (signum == SIGUSR1) {
            if (m_releasing.load()) {
                return;
            }
            LB_LOGD("Ignoring external SIGUSR1");
            continue;
        }

        const char* name = signum == SIGINT ? "SIGINT" : "SIGTERM";
        if (m_signalCount.fetch_add(1) == 0) {
            LB_LOGI("Received %s, stopping (repeat to force exit)", name);
            if (m_handler) {
                m_handler(signum);
            }
            continue;
        }

        LB_LOGW("Received %s again, forcing exit", name);
        if (m_forceHandler) {
            m_forceHandler(signum);
        } else {
            _exit(128 + signum);
        }
    }
}

} // namespace utils
} // namespace lumibeacon
