// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RenderLoop.cpp
 * @brief Periodic frame renderer implementation
 */

#include "RenderLoop.h"
#include "TrailCompositor.h"

#define LB_LOG_TAG "Render"
#include "../utils/Log.h"

namespace lumibeacon {
namespace core {

// ============================================================================
// Construction / Lifecycle
// ============================================================================

RenderLoop::RenderLoop(BeaconRegistry& registry, IFrameSink& sink, const RenderConfig& config)
    : RenderLoop(registry, sink, config, ColorMapper())
{
}

RenderLoop::RenderLoop(BeaconRegistry& registry, IFrameSink& sink, const RenderConfig& config,
                       const ColorMapper& mapper)
    : m_registry(registry)
    , m_sink(sink)
    , m_config(config)
    , m_mapper(mapper)
    , m_tracker(config.trackLength)
    , m_startTime(std::chrono::steady_clock::now())
{
}

bool RenderLoop::begin() {
    if (m_config.trackLength == 0) {
        LB_LOGE("Track length must be at least 1 LED");
        return false;
    }

    m_startTime = std::chrono::steady_clock::now();
    m_started = true;
    m_state.store(RenderState::RUNNING);
    LB_LOGI("Render loop ready: %u LEDs, trail %u, fade %.2f, interval %lu ms",
            m_config.trackLength, m_config.trailLength, m_config.fadeFactor,
            (unsigned long)m_config.intervalMs);
    return true;
}

// ============================================================================
// Frame Rendering
// ============================================================================

PixelBuffer RenderLoop::renderFrame() {
    PixelBuffer frame = makeBlankFrame(m_config.trackLength);
    const BeaconSnapshot beacons = m_registry.snapshot();

    if (m_config.evictExpiredCursors) {
        m_tracker.retainOnly(beacons);
    }

    for (const auto& entry : beacons) {
        const uint16_t position = m_tracker.advance(entry.first);
        const CRGB color = m_mapper.colorFor(entry.first, entry.second.rssi, entry.second.visibility);
        TrailCompositor::paint(frame, position, color, m_config.trailLength, m_config.fadeFactor);
    }

    std::lock_guard<std::mutex> lock(m_statsMutex);
    m_stats.lastBeaconCount = static_cast<uint32_t>(beacons.size());
    return frame;
}

bool RenderLoop::tick() {
    if (!m_started) {
        if (!m_reportedNotStarted) {
            m_reportedNotStarted = true;
            LB_LOGE("tick() called before a successful begin()");
        }
        m_state.store(RenderState::STOPPED);
        return false;
    }

    if (!m_stopRequested.load() && durationElapsed()) {
        LB_LOGI("Duration limit of %.1fs reached, stopping", m_config.durationSeconds);
        m_stopRequested.store(true);
    }
    if (m_stopRequested.load()) {
        m_state.store(RenderState::STOPPED);
        return false;
    }

    const PixelBuffer frame = renderFrame();
    m_sink.update(frame);

    RenderStats snapshot;
    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        m_stats.framesRendered++;
        m_stats.elapsedSeconds = elapsedSeconds();
        snapshot = m_stats;
    }

    if (m_frameCallback) {
        m_frameCallback(snapshot);
    }
    return true;
}

void RenderLoop::run() {
    if (!m_started) {
        LB_LOGE("run() called before a successful begin()");
        m_state.store(RenderState::STOPPED);
        return;
    }
    m_state.store(RenderState::RUNNING);

    while (tick()) {
        std::unique_lock<std::mutex> lock(m_sleepMutex);
        m_sleepCv.wait_for(lock, std::chrono::milliseconds(m_config.intervalMs),
                           [this] { return m_stopRequested.load(); });
    }

    const RenderStats stats = getStats();
    LB_LOGI("Render loop stopped: %lu frames in %.2fs",
            (unsigned long)stats.framesRendered, stats.elapsedSeconds);
}

void RenderLoop::requestStop() {
    {
        std::lock_guard<std::mutex> lock(m_sleepMutex);
        m_stopRequested.store(true);
    }
    m_sleepCv.notify_all();
}

// ============================================================================
// Diagnostics
// ============================================================================

RenderStats RenderLoop::getStats() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    RenderStats copy = m_stats;
    copy.elapsedSeconds = elapsedSeconds();
    return copy;
}

bool RenderLoop::durationElapsed() const {
    return m_config.durationSeconds > 0.0 && elapsedSeconds() > m_config.durationSeconds;
}

double RenderLoop::elapsedSeconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - m_startTime).count();
}

} // namespace core
} // namespace lumibeacon
