// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file TerminalSimulatorSink.cpp
 * @brief ANSI terminal LED grid implementation
 */

#include "TerminalSimulatorSink.h"

#define LB_LOG_TAG "Sim"
#include "../utils/Log.h"

namespace lumibeacon {
namespace sim {

namespace {

constexpr const char* CLEAR_SCREEN = "\033[H\033[J";
constexpr const char* PIXEL_GLYPH = "\xE2\x96\x88";    // U+2588 full block

} // namespace

TerminalSimulatorSink::TerminalSimulatorSink(uint16_t ledCount, uint16_t rows, uint16_t cols, FILE* out)
    : m_ledCount(ledCount)
    , m_rows(rows)
    , m_cols(cols)
    , m_out(out)
    , m_current(core::makeBlankFrame(ledCount))
{
}

bool TerminalSimulatorSink::begin() {
    if (static_cast<uint32_t>(m_rows) * m_cols != m_ledCount) {
        LB_LOGE("rows (%u) x cols (%u) = %lu does not equal led count (%u)",
                m_rows, m_cols, (unsigned long)m_rows * m_cols, m_ledCount);
        return false;
    }
    if (m_out == nullptr) {
        LB_LOGE("No output stream for simulator");
        return false;
    }
    return true;
}

void TerminalSimulatorSink::update(const core::PixelBuffer& frame) {
    std::string text;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_current = frame;
        text = renderToString(m_current);
    }

    if (m_out != nullptr) {
        fputs(text.c_str(), m_out);
        fflush(m_out);
    }
}

core::PixelBuffer TerminalSimulatorSink::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current;
}

// ============================================================================
// Rendering
// ============================================================================

std::string TerminalSimulatorSink::renderToString(const core::PixelBuffer& frame) const {
    const std::string rule(static_cast<size_t>(m_cols) * 4 + 2, '=');
    char cell[64];

    std::string out;
    out.reserve(static_cast<size_t>(m_rows) * m_cols * 32 + 256);
    out += CLEAR_SCREEN;
    out += "LED Strip Simulator - Press Ctrl+C to exit\n";
    out += rule;
    out += '\n';

    for (uint16_t row = 0; row < m_rows; row++) {
        for (uint16_t col = 0; col < m_cols; col++) {
            const size_t idx = static_cast<size_t>(row) * m_cols + col;
            const CRGB led = idx < frame.size() ? frame[idx] : CRGB(0, 0, 0);
            snprintf(cell, sizeof(cell), "\033[38;2;%u;%u;%um%s\033[0m  ",
                     led.r, led.g, led.b, PIXEL_GLYPH);
            out += cell;
        }
        out += '\n';
    }

    out += rule;
    out += '\n';
    snprintf(cell, sizeof(cell), "Average brightness: %.1f/255\n", averageBrightness(frame));
    out += cell;
    return out;
}

double TerminalSimulatorSink::averageBrightness(const core::PixelBuffer& frame) {
    if (frame.empty()) return 0.0;

    unsigned long total = 0;
    for (const CRGB& led : frame) {
        total += (static_cast<unsigned>(led.r) + led.g + led.b) / 3;
    }
    return static_cast<double>(total) / static_cast<double>(frame.size());
}

} // namespace sim
} // namespace lumibeacon
