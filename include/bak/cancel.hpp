// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

/**
 * @file cancel.hpp
 * @brief Turns SIGINT/SIGTERM into a cooperative stop request
 */

#ifndef BAK_CANCEL_HPP
#define BAK_CANCEL_HPP

#include <atomic>
#include <future>
#include <thread>

#include <signal.h>

namespace bak {

/**
 * Process interrupt listener
 *
 * install() blocks SIGINT and SIGTERM in the calling thread and starts a
 * listener thread that waits for them. Threads created afterwards inherit
 * the mask, so only the listener ever sees the signals. The first signal
 * (or request_stop()) sets the stop flag and fulfils a one-shot
 * notification carrying the signal number; the listener then exits and
 * later interrupts have no further effect.
 *
 * The copy loop polls stop_requested() between files, never mid-copy.
 *
 * Call install() before starting any other thread, and destroy the monitor
 * on the thread that installed it (the saved mask is restored there). At
 * most one installed monitor may exist per process.
 */
class CancellationMonitor {
  public:
    CancellationMonitor();
    ~CancellationMonitor();

    CancellationMonitor(const CancellationMonitor &) = delete;
    CancellationMonitor &operator=(const CancellationMonitor &) = delete;

    /**
     * Block the signals and start listening. Idempotent.
     * @throws Error if the signal mask cannot be changed
     */
    void install();

    /// Non-blocking: true once a stop has been requested by any route
    [[nodiscard]] bool stop_requested() const;

    /// One-shot notification; ready with the signal number (0 for request_stop())
    [[nodiscard]] std::shared_future<int> notification() const { return notified_; }

    /**
     * Request a stop without a signal. Only the first request (from either
     * route) has an effect.
     * @return True if this call was the one that triggered the stop
     */
    bool request_stop(int signo = 0);

    [[nodiscard]] bool installed() const noexcept { return installed_; }

  private:
    void listen();
    void uninstall() noexcept;

    std::atomic<bool> interrupted_{false};
    std::atomic<bool> shutdown_{false};
    std::promise<int> promise_;
    std::shared_future<int> notified_;

    std::thread listener_;
    sigset_t watched_{};
    sigset_t saved_mask_{};
    bool installed_ = false;
};

} // namespace bak

#endif // BAK_CANCEL_HPP
