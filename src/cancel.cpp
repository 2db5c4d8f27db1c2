// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

#include <bak/cancel.hpp>
#include <bak/error.hpp>
#include <bak/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>

#include <pthread.h>
#include <time.h>

namespace bak {

namespace {

constexpr long LISTEN_POLL_NS = 100 * 1000 * 1000; // 100 ms

} // namespace

CancellationMonitor::CancellationMonitor() : notified_(promise_.get_future().share()) {}

CancellationMonitor::~CancellationMonitor() {
    uninstall();
}

void CancellationMonitor::install() {
    if (installed_) return;

    sigemptyset(&watched_);
    sigaddset(&watched_, SIGINT);
    sigaddset(&watched_, SIGTERM);

    int rc = pthread_sigmask(SIG_BLOCK, &watched_, &saved_mask_);
    if (rc != 0) throw Error(rc, {}, "pthread_sigmask");

    listener_ = std::thread(&CancellationMonitor::listen, this);
    installed_ = true;
}

bool CancellationMonitor::stop_requested() const {
    if (interrupted_.load(std::memory_order_acquire)) return true;
    return notified_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

bool CancellationMonitor::request_stop(int signo) {
    if (interrupted_.exchange(true, std::memory_order_acq_rel)) return false;
    promise_.set_value(signo);
    return true;
}

void CancellationMonitor::listen() {
    struct timespec timeout = {0, LISTEN_POLL_NS};

    while (!shutdown_.load(std::memory_order_acquire)) {
        int signo = sigtimedwait(&watched_, nullptr, &timeout);
        if (signo < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            log_emit(LogLevel::Error, std::string("sigtimedwait: ") + strerror(errno));
            return;
        }

        log_emit(LogLevel::Notice, std::string("received ") + strsignal(signo) +
                                       ", stopping after the current file");
        request_stop(signo);
        return;
    }
}

void CancellationMonitor::uninstall() noexcept {
    if (!installed_) return;

    shutdown_.store(true, std::memory_order_release);
    if (listener_.joinable()) listener_.join();

    // Interrupts that arrived after the first one are still pending; consume
    // them so unblocking does not deliver them with the default action.
    struct timespec zero = {0, 0};
    while (sigtimedwait(&watched_, nullptr, &zero) > 0) {
    }

    pthread_sigmask(SIG_SETMASK, &saved_mask_, nullptr);
    installed_ = false;
}

} // namespace bak
