// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

#include <bak/copier.hpp>
#include <bak/enumerate.hpp>
#include <bak/error.hpp>
#include <bak/format.hpp>
#include <bak/log.hpp>
#include <bak/progress.hpp>
#include <bak/term.hpp>
#include <bak/transfer.hpp>

#include <aura.hpp>

#include <chrono>
#include <memory>

namespace bak {

namespace {

constexpr int ENGINE_QUEUE_DEPTH = 64;

std::unique_ptr<aura::Engine> make_engine() {
    // The copy loop is the only submitter: one ring, no cross-thread locking
    aura::Options opts;
    opts.queue_depth(ENGINE_QUEUE_DEPTH)
        .single_thread(true)
        .ring_count(1)
        .ring_select(aura::RingSelect::ThreadLocal);
    try {
        return std::make_unique<aura::Engine>(opts);
    } catch (const aura::Error &e) {
        throw Error(e.code(), {}, "create I/O engine");
    }
}

} // namespace

const char *transfer_state_name(TransferState state) noexcept {
    switch (state) {
    case TransferState::Enumerating:
        return "enumerating";
    case TransferState::Aggregating:
        return "aggregating";
    case TransferState::Copying:
        return "copying";
    case TransferState::Finishing:
        return "finishing";
    case TransferState::Completed:
        return "completed";
    case TransferState::Interrupted:
        return "interrupted";
    default:
        return "???";
    }
}

Transfer::Transfer(TransferRequest request, CancellationMonitor &monitor, FILE *out)
    : request_(std::move(request)), monitor_(monitor), out_(out) {}

void Transfer::enter(TransferState next) {
    state_ = next;
    log_emit(LogLevel::Debug, std::string("state: ") + transfer_state_name(next));
    if (listener_) listener_(next);
}

void Transfer::print_line(const std::string &line) {
    // Whole lines only; the animation redraws over whatever is left
    if (request_.show_progress()) fputs(term::CLEAR_LINE, out_);
    fprintf(out_, "%s\n", line.c_str());
    fflush(out_);
}

TransferOutcome Transfer::run() {
    const std::string &source = request_.source();
    const std::string &destination = request_.destination();
    const bool color = request_.color();

    log_emit(LogLevel::Info, "copy " + source + " -> " + destination +
                                 (request_.fast_mode() ? " (fast mode)" : " (protected mode)"));

    enter(TransferState::Enumerating);
    FileList files = enumerate_files(source);
    const bool source_is_file = is_regular_file(source);
    const bool dest_is_dir = is_directory(destination);

    enter(TransferState::Aggregating);
    TransferOutcome outcome;
    outcome.files_total = files.size();
    outcome.bytes_total = total_size(files);

    fprintf(out_, "Copying %llu file%s (total size: %llu bytes, %s)\n",
            static_cast<unsigned long long>(outcome.files_total),
            outcome.files_total == 1 ? "" : "s",
            static_cast<unsigned long long>(outcome.bytes_total),
            format_bytes(static_cast<double>(outcome.bytes_total)).c_str());
    fflush(out_);

    auto engine = make_engine();
    FileCopier copier(*engine, request_.fast_mode() ? CopyMode::Fast : CopyMode::Protected,
                      request_.chunk_size(), request_.sync_before_rename());

    ProgressState progress(outcome.files_total, outcome.bytes_total);
    ReporterOptions ropts;
    ropts.interval = request_.frame_interval();
    ropts.out = out_;
    ropts.animate = request_.show_progress();
    ropts.color = color;
    ProgressReporter reporter(progress, ropts);

    enter(TransferState::Copying);
    auto started = std::chrono::steady_clock::now();
    reporter.start();

    bool interrupted = false;
    for (const auto &file : files) {
        if (monitor_.stop_requested()) {
            interrupted = true;
            break;
        }

        std::string dst = destination_for(file, source, source_is_file, destination, dest_is_dir);
        try {
            uint64_t n = copier.copy(file, dst);
            outcome.bytes_copied += n;
            outcome.files_copied++;
            progress.file_done(n);
            if (request_.verbose()) print_line(term::paint("✔ OK: " + file, term::GREEN, color));
        } catch (const Error &e) {
            outcome.files_failed++;
            // The source path is already on the line; name the other path only
            std::string detail = e.path() == file ? e.reason() : e.what();
            print_line(term::paint("✘ FAILED: " + file + " (" + detail + ")", term::RED, color));
            log_emit(LogLevel::Debug, "copy " + file + " -> " + dst + ": " + e.op() + " " +
                                          e.path() + " failed with errno " +
                                          std::to_string(e.code()));
        }
    }

    enter(TransferState::Finishing);
    outcome.elapsed_sec =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    if (interrupted) {
        reporter.interrupt();
    } else {
        reporter.finish();
    }

    outcome.state = interrupted ? TransferState::Interrupted : TransferState::Completed;
    enter(outcome.state);

    log_emit(LogLevel::Info, std::string(transfer_state_name(outcome.state)) + ": " +
                                 std::to_string(outcome.files_copied) + "/" +
                                 std::to_string(outcome.files_total) + " files, " +
                                 std::to_string(outcome.files_failed) + " failed, " +
                                 std::to_string(outcome.bytes_copied) + " bytes");
    return outcome;
}

} // namespace bak
