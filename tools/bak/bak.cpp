/**
 * @file bak.cpp
 * @brief bak - file and directory copy with a live progress line
 *
 * Copies a file or a whole tree. Each file is written to "<dest>.tmp" and
 * renamed into place once complete, unless --fast-mode is given. Ctrl-C
 * stops the run after the file being copied; nothing is half-written at a
 * destination name in protected mode.
 *
 * Usage: bak [OPTIONS] [SOURCE] [DESTINATION]
 */

#ifndef _GNU_SOURCE
#    define _GNU_SOURCE
#endif
#include <bak.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include <getopt.h>
#include <unistd.h>

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    std::string source;            // --source
    std::string destination;       // --destination
    std::string source_pos;        // first positional
    std::string destination_pos;   // second positional
    size_t chunk_size = bak::DEFAULT_CHUNK_SIZE;
    bool verbose = false;
    bool fast_mode = false;
    bool low_animation = false;
    bool no_fsync = false;
    bool no_progress = false;
    bool no_color = false;
    bak::LogLevel log_level = bak::LogLevel::Warning;
};

// ============================================================================
// CLI parsing
// ============================================================================

static void print_usage(const char *argv0) {
    fprintf(stderr,
            "Usage: %s [OPTIONS] [SOURCE] [DESTINATION]\n"
            "\n"
            "File backup (copy) tool with progress display.\n"
            "Missing paths are asked for on the terminal.\n"
            "\n"
            "Options:\n"
            "  -s, --source PATH        Source file or directory\n"
            "  -d, --destination PATH   Destination path\n"
            "  -v, --verbose            Print a line for every copied file\n"
            "  -f, --fast-mode          Write destinations directly (no temp file)\n"
            "  -l, --low-animation      Redraw progress less often\n"
            "  -b, --chunk-size N       Copy chunk size (default: 256K). Suffixes: K, M, G\n"
            "  --no-fsync               Skip fdatasync before the final rename\n"
            "  --no-progress            Disable the progress animation\n"
            "  --no-color               Disable colored output\n"
            "  --log-level LEVEL        error, warn, notice, info or debug (default: warn)\n"
            "  -V, --version            Show version\n"
            "  -h, --help               Show this help\n",
            argv0);
}

static int parse_args(int argc, char **argv, Config &config) {
    static struct option long_opts[] = {{"source", required_argument, nullptr, 's'},
                                        {"destination", required_argument, nullptr, 'd'},
                                        {"verbose", no_argument, nullptr, 'v'},
                                        {"fast-mode", no_argument, nullptr, 'f'},
                                        {"low-animation", no_argument, nullptr, 'l'},
                                        {"chunk-size", required_argument, nullptr, 'b'},
                                        {"no-fsync", no_argument, nullptr, 'F'},
                                        {"no-progress", no_argument, nullptr, 'P'},
                                        {"no-color", no_argument, nullptr, 'C'},
                                        {"log-level", required_argument, nullptr, 'L'},
                                        {"version", no_argument, nullptr, 'V'},
                                        {"help", no_argument, nullptr, 'h'},
                                        {nullptr, 0, nullptr, 0}};

    int opt;
    while ((opt = getopt_long(argc, argv, "s:d:vflb:Vh", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 's':
            config.source = optarg;
            break;
        case 'd':
            config.destination = optarg;
            break;
        case 'v':
            config.verbose = true;
            break;
        case 'f':
            config.fast_mode = true;
            break;
        case 'l':
            config.low_animation = true;
            break;
        case 'b': {
            auto sz = bak::parse_size(optarg);
            if (!sz || *sz < bak::MIN_CHUNK_SIZE || *sz > bak::MAX_CHUNK_SIZE) {
                fprintf(stderr, "bak: invalid chunk size: %s (4K-64M)\n", optarg);
                return -1;
            }
            config.chunk_size = static_cast<size_t>(*sz);
            break;
        }
        case 'F':
            config.no_fsync = true;
            break;
        case 'P':
            config.no_progress = true;
            break;
        case 'C':
            config.no_color = true;
            break;
        case 'L': {
            auto level = bak::parse_log_level(optarg);
            if (!level) {
                fprintf(stderr, "bak: invalid log level: %s\n", optarg);
                return -1;
            }
            config.log_level = *level;
            break;
        }
        case 'V':
            printf("bak %s\n", BAK_VERSION);
            exit(0);
        case 'h':
            print_usage(argv[0]);
            exit(0);
        default:
            print_usage(argv[0]);
            return -1;
        }
    }

    int remaining = argc - optind;
    if (remaining > 2) {
        fprintf(stderr, "bak: too many arguments\n");
        print_usage(argv[0]);
        return -1;
    }
    if (remaining >= 1) config.source_pos = argv[optind];
    if (remaining == 2) config.destination_pos = argv[optind + 1];

    return 0;
}

// ============================================================================
// Interactive prompt
// ============================================================================

/// Ask on the controlling terminal (stdin/stderr without one). Empty on EOF.
static std::string prompt_path(const char *label) {
    FILE *tty = fopen("/dev/tty", "r+");
    FILE *in = tty ? tty : stdin;
    FILE *out = tty ? tty : stderr;

    fprintf(out, "%s: ", label);
    fflush(out);

    char *line = nullptr;
    size_t cap = 0;
    ssize_t n = getline(&line, &cap, in);
    std::string answer;
    if (n > 0) answer.assign(line, static_cast<size_t>(n));
    free(line);
    if (tty) fclose(tty);

    while (!answer.empty() && (answer.back() == '\n' || answer.back() == '\r' ||
                               answer.back() == ' ' || answer.back() == '\t'))
        answer.pop_back();
    return answer;
}

/// Named flag wins over the positional; prompt when both are missing
static std::string resolve_path(const std::string &named, const std::string &positional,
                                const char *label) {
    if (!named.empty()) return named;
    if (!positional.empty()) return positional;
    return prompt_path(label);
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char **argv) {
    Config config;
    if (parse_args(argc, argv, config) != 0) return 1;

    bak::install_log_handler(config.log_level, stderr);

    std::string source = resolve_path(config.source, config.source_pos, "Enter source path");
    if (source.empty()) {
        fprintf(stderr, "bak: no source path given\n");
        return 1;
    }
    std::string destination =
        resolve_path(config.destination, config.destination_pos, "Enter destination path");
    if (destination.empty()) {
        fprintf(stderr, "bak: no destination path given\n");
        return 1;
    }

    bool tty = isatty(STDOUT_FILENO) != 0;

    bak::TransferRequest request;
    try {
        request = bak::Options()
                      .source(source)
                      .destination(destination)
                      .verbose(config.verbose)
                      .fast_mode(config.fast_mode)
                      .low_animation(config.low_animation)
                      .sync_before_rename(!config.no_fsync)
                      .chunk_size(config.chunk_size)
                      .show_progress(tty && !config.no_progress)
                      .color(tty && !config.no_color)
                      .build();
    } catch (const bak::Error &e) {
        fprintf(stderr, "bak: %s\n", e.what());
        return 1;
    }

    // Must precede every other thread so they all inherit the blocked mask
    bak::CancellationMonitor monitor;
    try {
        monitor.install();
    } catch (const bak::Error &e) {
        fprintf(stderr, "bak: cannot install interrupt handler: %s\n", e.what());
        return 1;
    }

    try {
        bak::Transfer transfer(request, monitor);
        bak::TransferOutcome outcome = transfer.run();

        if (config.verbose) {
            double rate = outcome.elapsed_sec > 0
                              ? static_cast<double>(outcome.bytes_copied) / outcome.elapsed_sec
                              : 0.0;
            printf("Copied %s in %.2fs\n",
                   bak::format_bytes(static_cast<double>(outcome.bytes_copied)).c_str(),
                   outcome.elapsed_sec);
            printf("Throughput: %s\n", bak::format_rate(rate).c_str());
        }
    } catch (const bak::Error &e) {
        fprintf(stderr, "bak: %s\n", e.what());
        bak::log_emit(bak::LogLevel::Error, std::string("aborted: ") + e.what());
        bak::clear_log_handler();
        return 1;
    }

    // An interrupted run is a clean stop, not a failure
    bak::clear_log_handler();
    return 0;
}
