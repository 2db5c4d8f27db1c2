// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

/**
 * @file transfer.hpp
 * @brief One copy run: enumerate, total, copy file by file, summarize
 */

#ifndef BAK_TRANSFER_HPP
#define BAK_TRANSFER_HPP

#include <bak/cancel.hpp>
#include <bak/options.hpp>

#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>
#include <utility>

namespace bak {

/**
 * Run phases, in order. Completed and Interrupted are terminal.
 * An enumeration failure leaves the run in Enumerating and throws.
 */
enum class TransferState { Enumerating, Aggregating, Copying, Finishing, Completed, Interrupted };

[[nodiscard]] const char *transfer_state_name(TransferState state) noexcept;

/// What a finished run did
struct TransferOutcome {
    TransferState state = TransferState::Completed;
    uint64_t files_total = 0;
    uint64_t files_copied = 0;
    uint64_t files_failed = 0;
    uint64_t bytes_total = 0;
    uint64_t bytes_copied = 0;
    double elapsed_sec = 0.0;

    [[nodiscard]] bool interrupted() const noexcept {
        return state == TransferState::Interrupted;
    }
};

/**
 * Orchestrates a single copy run
 *
 * Per-file copy failures are printed and counted; the run goes on. A stop
 * requested through the monitor is honoured before the next file starts,
 * never in the middle of one. Everything user-facing is written to the
 * output stream given at construction.
 *
 * Example:
 * @code
 * bak::CancellationMonitor monitor;
 * monitor.install();
 * bak::Transfer transfer(bak::Options().source("a").destination("b").build(), monitor);
 * auto outcome = transfer.run();
 * @endcode
 */
class Transfer {
  public:
    using StateListener = std::function<void(TransferState)>;

    Transfer(TransferRequest request, CancellationMonitor &monitor, FILE *out = stdout);

    Transfer(const Transfer &) = delete;
    Transfer &operator=(const Transfer &) = delete;

    /**
     * Execute the run. Call once.
     * @throws Error if the source cannot be enumerated or the I/O engine
     *         cannot be created; nothing has been copied in that case
     */
    TransferOutcome run();

    [[nodiscard]] TransferState state() const noexcept { return state_; }

    /// Called on every state change, on the calling thread of run()
    void on_state_change(StateListener listener) { listener_ = std::move(listener); }

    [[nodiscard]] const TransferRequest &request() const noexcept { return request_; }

  private:
    void enter(TransferState next);
    void print_line(const std::string &line);

    TransferRequest request_;
    CancellationMonitor &monitor_;
    FILE *out_;
    TransferState state_ = TransferState::Enumerating;
    StateListener listener_;
};

} // namespace bak

#endif // BAK_TRANSFER_HPP
