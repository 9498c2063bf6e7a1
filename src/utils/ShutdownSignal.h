/**
 * @file ShutdownSignal.h
 * @brief SIGINT/SIGTERM watcher that runs a stop handler on its own thread
 *
 * install() blocks SIGINT, SIGTERM and SIGUSR1 for the calling thread and
 * every thread created afterwards, then waits for them with sigwait() on a
 * dedicated thread. Call it from main() before starting any other thread.
 *
 * The first SIGINT/SIGTERM runs the stop handler; the watcher keeps waiting
 * and a second one runs the force handler (default: _exit(128 + signum)).
 * SIGUSR1 releases the watcher only when sent by release(); an external
 * SIGUSR1 is ignored.
 */

#pragma once

#include <atomic>
#include <functional>
#include <thread>

namespace lumibeacon {
namespace utils {

class ShutdownSignal {
public:
    using StopHandler = std::function<void(int signum)>;

    ShutdownSignal() = default;
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    /**
     * @param handler Runs on the first stop signal
     * @param forceHandler Runs on every later stop signal (null = _exit)
     * @return false (and logs) if the signal mask cannot be changed
     */
    bool install(StopHandler handler, StopHandler forceHandler = nullptr);

    /**
     * @brief Release and join the watcher thread
     */
    void release();

    bool wasSignalled() const { return m_signalCount.load() > 0; }
    unsigned getSignalCount() const { return m_signalCount.load(); }

private:
    void watch();

    StopHandler m_handler;
    StopHandler m_forceHandler;
    std::thread m_watcher;
    std::atomic<unsigned> m_signalCount{0};
    std::atomic<bool> m_releasing{false};
};

} // namespace utils
} // namespace lumibeacon
