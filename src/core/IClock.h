/**
 * @file IClock.h
 * @brief Time source abstraction for beacon ageing
 *
 * The beacon registry only needs "seconds since some fixed origin". Production
 * code uses the monotonic steady clock; tests inject a manually advanced clock.
 */

#pragma once

#include <chrono>

namespace lumibeacon {
namespace core {

class IClock {
public:
    virtual ~IClock() = default;

    /**
     * @brief Current time in seconds from an arbitrary fixed origin
     */
    virtual double nowSeconds() const = 0;
};

/**
 * @brief Monotonic clock backed by std::chrono::steady_clock
 */
class SteadyClock : public IClock {
public:
    double nowSeconds() const override {
        return std::chrono::duration<double>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }
};

} // namespace core
} // namespace lumibeacon
