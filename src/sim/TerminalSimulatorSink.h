/**
 * @file TerminalSimulatorSink.h
 * @brief Frame sink drawing the strip as an ANSI true-color grid
 *
 * LED i is drawn at row i / cols, column i % cols. Each frame clears the
 * screen, prints a header, the grid, a footer rule and the average
 * brightness. Output goes to a caller-supplied FILE* (stdout by default).
 */

#pragma once

#include "../core/IFrameSink.h"

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

namespace lumibeacon {
namespace sim {

class TerminalSimulatorSink : public core::IFrameSink {
public:
    TerminalSimulatorSink(uint16_t ledCount, uint16_t rows, uint16_t cols, FILE* out = stdout);

    TerminalSimulatorSink(const TerminalSimulatorSink&) = delete;
    TerminalSimulatorSink& operator=(const TerminalSimulatorSink&) = delete;

    /**
     * @brief Validate the grid geometry
     * @return false (and logs) unless rows * cols == ledCount
     */
    bool begin();

    void update(const core::PixelBuffer& frame) override;

    /**
     * @brief Copy of the most recent frame (all black before the first update)
     */
    core::PixelBuffer snapshot() const;

    /**
     * @brief Render a frame to a string without touching the sink state
     */
    std::string renderToString(const core::PixelBuffer& frame) const;

    /**
     * @brief Mean over pixels of (r + g + b) / 3 with integer division per pixel
     */
    static double averageBrightness(const core::PixelBuffer& frame);

    uint16_t getRows() const { return m_rows; }
    uint16_t getCols() const { return m_cols; }

private:
    const uint16_t m_ledCount;
    const uint16_t m_rows;
    const uint16_t m_cols;
    FILE* m_out;

    mutable std::mutex m_mutex;
    core::PixelBuffer m_current;
};

} // namespace sim
} // namespace lumibeacon
