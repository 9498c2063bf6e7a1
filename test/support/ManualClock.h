/**
 * @file ManualClock.h
 * @brief Test clock that only moves when told to
 */

#pragma once

#include "../../src/core/IClock.h"

#include <atomic>

namespace lumibeacon {
namespace test {

class ManualClock : public core::IClock {
public:
    explicit ManualClock(double startSeconds = 1000.0) : m_now(startSeconds) {}

    double nowSeconds() const override { return m_now.load(); }

    void advance(double seconds) { m_now.store(m_now.load() + seconds); }
    void set(double seconds) { m_now.store(seconds); }

private:
    std::atomic<double> m_now;
};

} // namespace test
} // namespace lumibeacon
