// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RenderLoop.h
 * @brief Periodic frame renderer: registry snapshot -> trails -> sink
 *
 * Per tick:
 *   1. Stop check (external request or duration limit)
 *   2. Fresh all-black frame of trackLength pixels
 *   3. Registry snapshot
 *   4. For each beacon: advance cursor, map color, paint trail
 *   5. sink.update(frame)
 *   6. Sleep for the render interval (woken early by requestStop())
 *
 * The loop owns the PositionTracker; registry and sink are injected and must
 * outlive it. Only requestStop(), isStopRequested() and getStats() may be
 * called from other threads.
 */

#pragma once

#include "BeaconRegistry.h"
#include "ColorMapper.h"
#include "IFrameSink.h"
#include "PixelBuffer.h"
#include "PositionTracker.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>

namespace lumibeacon {
namespace core {

/**
 * @brief Render parameters (validated by config::AppConfig before use)
 */
struct RenderConfig {
    uint16_t trackLength = 60;          ///< LEDs in the strip
    uint16_t trailLength = 10;          ///< Trail pixels including the head
    float fadeFactor = 0.75f;           ///< Per-pixel trail attenuation
    uint32_t intervalMs = 200;          ///< Sleep between frames
    double durationSeconds = 0.0;       ///< Stop after this long (0 = run forever)
    bool evictExpiredCursors = true;    ///< Forget cursors of beacons that expired
};

enum class RenderState : uint8_t {
    RUNNING = 0,
    STOPPED = 1
};

struct RenderStats {
    uint32_t framesRendered = 0;
    uint32_t lastBeaconCount = 0;
    double elapsedSeconds = 0.0;
};

class RenderLoop {
public:
    /// Invoked on the render thread after each delivered frame
    using FrameCallback = std::function<void(const RenderStats& stats)>;

    RenderLoop(BeaconRegistry& registry, IFrameSink& sink, const RenderConfig& config);
    RenderLoop(BeaconRegistry& registry, IFrameSink& sink, const RenderConfig& config,
               const ColorMapper& mapper);

    RenderLoop(const RenderLoop&) = delete;
    RenderLoop& operator=(const RenderLoop&) = delete;

    /**
     * @brief Check preconditions before the first tick
     *
     * Must succeed before tick() or run() will render anything.
     *
     * @return false (and logs) if the track is empty
     */
    bool begin();

    /**
     * @brief Render one frame and hand it to the sink
     * @return false if begin() has not succeeded or the loop is stopped
     *         (nothing rendered)
     */
    bool tick();

    /**
     * @brief Tick until stopped; blocks the calling thread
     */
    void run();

    /**
     * @brief Ask the loop to stop; wakes a sleeping run() immediately
     */
    void requestStop();

    bool isStopRequested() const { return m_stopRequested.load(); }
    RenderState getState() const { return m_state.load(); }

    RenderStats getStats() const;

    void setFrameCallback(FrameCallback cb) { m_frameCallback = cb; }

    const PositionTracker& getTracker() const { return m_tracker; }
    const RenderConfig& getConfig() const { return m_config; }

private:
    /**
     * @brief Compose one frame from the current registry contents
     *
     * Advances cursors; does not touch the sink. Only called after begin().
     */
    PixelBuffer renderFrame();

    bool durationElapsed() const;
    double elapsedSeconds() const;

    BeaconRegistry& m_registry;
    IFrameSink& m_sink;
    const RenderConfig m_config;
    const ColorMapper m_mapper;
    PositionTracker m_tracker;

    std::atomic<bool> m_stopRequested{false};
    std::atomic<RenderState> m_state{RenderState::RUNNING};

    std::mutex m_sleepMutex;
    std::condition_variable m_sleepCv;

    mutable std::mutex m_statsMutex;
    RenderStats m_stats;
    std::chrono::steady_clock::time_point m_startTime;
    bool m_started = false;
    bool m_reportedNotStarted = false;

    FrameCallback m_frameCallback;
};

} // namespace core
} // namespace lumibeacon
