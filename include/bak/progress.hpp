// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

/**
 * @file progress.hpp
 * @brief Shared progress counters and the background progress display
 */

#ifndef BAK_PROGRESS_HPP
#define BAK_PROGRESS_HPP

#include <bak/options.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <thread>

namespace bak {

/**
 * Progress of one run
 *
 * The totals are fixed at construction. The completed counters have a
 * single writer (the copy loop) and any number of readers. The byte count is
 * published before the file count, so a reader that sees N files done also
 * sees at least their bytes.
 */
class ProgressState {
  public:
    ProgressState(uint64_t total_files, uint64_t total_bytes) noexcept
        : total_files_(total_files), total_bytes_(total_bytes) {}

    ProgressState(const ProgressState &) = delete;
    ProgressState &operator=(const ProgressState &) = delete;

    /// Record one successfully copied file of @p bytes bytes
    void file_done(uint64_t bytes) noexcept {
        bytes_done_.fetch_add(bytes, std::memory_order_relaxed);
        completed_.fetch_add(1, std::memory_order_release);
    }

    [[nodiscard]] uint64_t completed() const noexcept {
        return completed_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t bytes_completed() const noexcept {
        return bytes_done_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t total_files() const noexcept { return total_files_; }
    [[nodiscard]] uint64_t total_bytes() const noexcept { return total_bytes_; }

  private:
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> bytes_done_{0};
    const uint64_t total_files_;
    const uint64_t total_bytes_;
};

/// Integer percentage, 0 when @p total is 0
[[nodiscard]] unsigned percent_of(uint64_t completed, uint64_t total) noexcept;

/// Everything one animation frame depends on
struct Frame {
    uint64_t index = 0;
    double elapsed_sec = 0.0;
    uint64_t completed = 0;
    uint64_t total = 0;
    uint64_t bytes_done = 0;
    uint64_t bytes_total = 0;
    bool color = false;
};

/**
 * Render one progress line (no leading carriage return)
 *
 * Spinner and sweeping comet are driven by the frame index and elapsed
 * time. The bar fills with bytes copied (file count when there are no
 * bytes); the percentage and "completed/total files" follow the file count,
 * followed by bytes copied of total.
 */
[[nodiscard]] std::string render_frame(const Frame &frame);

struct ReporterOptions {
    std::chrono::milliseconds interval = DEFAULT_FRAME_INTERVAL;
    FILE *out = stdout;
    bool animate = true; ///< Draw frames; summaries are printed either way
    bool color = true;
};

/**
 * Background progress display
 *
 * start() spawns a thread that redraws one terminal line per interval
 * until told to stop, or until every file is done. finish() and
 * interrupt() stop and join that thread, clear the line, then print the
 * matching summary, so the animation can never overwrite it.
 */
class ProgressReporter {
  public:
    ProgressReporter(const ProgressState &state, ReporterOptions opts);

    /// Stops the thread without printing a summary
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter &) = delete;
    ProgressReporter &operator=(const ProgressReporter &) = delete;

    /// Start the clock and the render thread
    void start();

    /// Stop and print "Done: <completed> of <total> files copied in <s>s"
    void finish();

    /// Stop and print the interruption summary and partial-copy warning
    void interrupt();

    /// True while the render loop is alive
    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    [[nodiscard]] uint64_t frames_rendered() const noexcept {
        return frames_.load(std::memory_order_relaxed);
    }

    /// Seconds since start() (0 before it)
    [[nodiscard]] double elapsed_seconds() const noexcept;

  private:
    void run();
    void stop_and_join();
    void clear_line();

    const ProgressState &state_;
    ReporterOptions opts_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    bool summarized_ = false;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> frames_{0};
    std::chrono::steady_clock::time_point start_{};
    bool started_ = false;
};

} // namespace bak

#endif // BAK_PROGRESS_HPP
