// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

#include <bak/format.hpp>
#include <bak/progress.hpp>
#include <bak/term.hpp>

#include <cstdio>

namespace bak {

namespace {

constexpr int BAR_WIDTH = 30;
constexpr double COMET_CELLS_PER_SEC = 14.0;

constexpr const char *SPINNER[] = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
constexpr size_t SPINNER_FRAMES = sizeof(SPINNER) / sizeof(SPINNER[0]);

} // namespace

unsigned percent_of(uint64_t completed, uint64_t total) noexcept {
    if (total == 0) return 0;
    if (completed >= total) return 100;
    return static_cast<unsigned>(completed * 100 / total);
}

std::string render_frame(const Frame &frame) {
    unsigned pct = percent_of(frame.completed, frame.total);

    // The bar follows bytes; an all-empty-files run falls back to file count
    unsigned fill_pct =
        frame.bytes_total > 0 ? percent_of(frame.bytes_done, frame.bytes_total) : pct;
    int filled = static_cast<int>(fill_pct) * BAR_WIDTH / 100;

    // Comet bounces across the unfilled part of the bar
    std::string bar(static_cast<size_t>(filled), '=');
    int empty = BAR_WIDTH - filled;
    if (empty > 0) {
        std::string rest(static_cast<size_t>(empty), ' ');
        if (empty > 1) {
            int span = 2 * (empty - 1);
            int step = static_cast<int>(frame.elapsed_sec * COMET_CELLS_PER_SEC) % span;
            int pos = step < empty ? step : span - step;
            rest[static_cast<size_t>(pos)] = '~';
        } else {
            rest[0] = '~';
        }
        bar += rest;
    }

    std::string done_bytes = format_bytes(static_cast<double>(frame.bytes_done));
    std::string total_bytes = format_bytes(static_cast<double>(frame.bytes_total));

    char counts[160];
    snprintf(counts, sizeof(counts), "%3u%%  %llu/%llu files  %s/%s  %.1fs", pct,
             static_cast<unsigned long long>(frame.completed),
             static_cast<unsigned long long>(frame.total), done_bytes.c_str(),
             total_bytes.c_str(), frame.elapsed_sec);

    std::string line;
    line += term::paint(SPINNER[frame.index % SPINNER_FRAMES], term::CYAN, frame.color);
    line += " [";
    line += term::paint(bar, term::CYAN, frame.color);
    line += "] ";
    line += term::paint(counts, term::BOLD, frame.color);
    return line;
}

ProgressReporter::ProgressReporter(const ProgressState &state, ReporterOptions opts)
    : state_(state), opts_(opts) {}

ProgressReporter::~ProgressReporter() {
    stop_and_join();
}

void ProgressReporter::start() {
    if (started_) return;
    started_ = true;
    start_ = std::chrono::steady_clock::now();
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&ProgressReporter::run, this);
}

double ProgressReporter::elapsed_seconds() const noexcept {
    if (!started_) return 0.0;
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
}

void ProgressReporter::run() {
    uint64_t index = 0;
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stop_) {
        lock.unlock();

        uint64_t done = state_.completed();
        if (opts_.animate) {
            Frame frame{index,
                        elapsed_seconds(),
                        done,
                        state_.total_files(),
                        state_.bytes_completed(),
                        state_.total_bytes(),
                        opts_.color};
            std::string line = render_frame(frame);
            fprintf(opts_.out, "%s%s", term::CLEAR_LINE, line.c_str());
            fflush(opts_.out);
        }
        index++;
        frames_.fetch_add(1, std::memory_order_relaxed);

        lock.lock();
        if (done >= state_.total_files()) break;
        cv_.wait_for(lock, opts_.interval, [this] { return stop_; });
    }

    running_.store(false, std::memory_order_release);
}

void ProgressReporter::stop_and_join() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    running_.store(false, std::memory_order_release);
}

void ProgressReporter::clear_line() {
    if (opts_.animate) fputs(term::CLEAR_LINE, opts_.out);
}

void ProgressReporter::finish() {
    stop_and_join();
    if (summarized_) return;
    summarized_ = true;

    uint64_t done = state_.completed();
    uint64_t total = state_.total_files();
    char msg[160];
    snprintf(msg, sizeof(msg), "Done: %llu of %llu files copied in %.2fs",
             static_cast<unsigned long long>(done), static_cast<unsigned long long>(total),
             elapsed_seconds());

    clear_line();
    fprintf(opts_.out, "%s", term::paint(msg, term::GREEN, opts_.color).c_str());
    if (done < total) {
        fprintf(opts_.out, " %s",
                term::paint("(" + std::to_string(total - done) + " failed)", term::RED,
                            opts_.color)
                    .c_str());
    }
    fputc('\n', opts_.out);
    fflush(opts_.out);
}

void ProgressReporter::interrupt() {
    stop_and_join();
    if (summarized_) return;
    summarized_ = true;

    char msg[160];
    snprintf(msg, sizeof(msg), "Interrupted: %llu of %llu files copied in %.2fs",
             static_cast<unsigned long long>(state_.completed()),
             static_cast<unsigned long long>(state_.total_files()), elapsed_seconds());

    clear_line();
    fprintf(opts_.out, "%s\n%s\n", term::paint(msg, term::YELLOW, opts_.color).c_str(),
            term::paint("Warning: files may be partially copied", term::YELLOW, opts_.color)
                .c_str());
    fflush(opts_.out);
}

} // namespace bak
