/**
 * @file stress_test.cpp
 * @brief Stress test for bak transfers under concurrent observation
 *
 * Tests:
 * 1. Protected mode - a concurrent reader never sees a partial destination
 * 2. Interruption under load - a stop request mid-run leaves only complete files
 * 3. Fast mode - bulk copy with content verification
 *
 * Run:   ./tests/stress_test [options]
 *
 * Options:
 *   --files <count>        Number of test files (default: 16)
 *   --size <bytes>         Size of each file, K/M/G suffix allowed (default: 4M)
 *   --chunk <bytes>        Copy chunk size (default: 256K)
 */

#include <bak.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;

// =============================================================================
// Configuration
// =============================================================================

struct Config {
    int num_files = 16;
    size_t file_size = 4 * 1024 * 1024; // 4MB per file
    size_t chunk_size = bak::DEFAULT_CHUNK_SIZE;
    std::string test_dir = "/tmp/bak_stress";
};

// =============================================================================
// Statistics
// =============================================================================

struct Stats {
    std::atomic<long long> files_copied{0};
    std::atomic<long long> files_failed{0};
    std::atomic<long long> bytes_copied{0};
    std::atomic<long long> observations{0};
    std::atomic<long long> partial_seen{0};
    std::atomic<long long> interrupts{0};

    void add(const bak::TransferOutcome &outcome) {
        files_copied += static_cast<long long>(outcome.files_copied);
        files_failed += static_cast<long long>(outcome.files_failed);
        bytes_copied += static_cast<long long>(outcome.bytes_copied);
        if (outcome.interrupted()) interrupts++;
    }

    void print(double elapsed_sec) const {
        double throughput_mb = (bytes_copied / (1024.0 * 1024.0)) / elapsed_sec;

        std::cout << "\n=== Stress Test Results ===\n";
        std::cout << "Duration:          " << std::fixed << std::setprecision(2) << elapsed_sec
                  << " seconds\n";
        std::cout << "Files copied:      " << files_copied << "\n";
        std::cout << "Files failed:      " << files_failed << "\n";
        std::cout << "Bytes copied:      " << bytes_copied / (1024 * 1024) << " MB\n";
        std::cout << "Observations:      " << observations << "\n";
        std::cout << "Partial files:     " << partial_seen << "\n";
        std::cout << "Interrupted runs:  " << interrupts << "\n";
        std::cout << "Throughput:        " << std::setprecision(1) << throughput_mb << " MB/s\n";
    }
};

// =============================================================================
// Test Files
// =============================================================================

static int rm_entry(const char *fpath, const struct stat *, int, struct FTW *) {
    return remove(fpath);
}

static void remove_tree(const std::string &path) {
    nftw(path.c_str(), rm_entry, 16, FTW_DEPTH | FTW_PHYS);
}

class TestFiles {
  public:
    TestFiles(const std::string &dir, int count, size_t file_size)
        : dir_(dir), src_dir_(dir + "/src"), file_size_(file_size) {
        remove_tree(dir_);
        if (mkdir(dir_.c_str(), 0755) != 0 || mkdir(src_dir_.c_str(), 0755) != 0) {
            throw std::runtime_error("Failed to create test directory: " + dir_);
        }

        // Random data so a torn copy cannot match by accident
        std::vector<char> buf(1024 * 1024);
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dist(0, 255);

        for (int i = 0; i < count; i++) {
            std::string name = "test_" + std::to_string(i) + ".dat";
            std::string path = src_dir_ + "/" + name;
            names_.push_back(name);

            int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
            if (fd < 0) {
                throw std::runtime_error("Failed to create test file: " + path);
            }

            for (size_t written = 0; written < file_size;) {
                for (auto &c : buf) {
                    c = static_cast<char>(dist(gen));
                }
                size_t chunk = std::min(buf.size(), file_size - written);
                if (write(fd, buf.data(), chunk) != static_cast<ssize_t>(chunk)) {
                    close(fd);
                    throw std::runtime_error("Failed to write test file");
                }
                written += chunk;
            }
            close(fd);
        }

        std::cout << "Created " << count << " test files of " << file_size / 1024 << " KB each\n";
    }

    ~TestFiles() { remove_tree(dir_); }

    const std::string &source_dir() const { return src_dir_; }
    const std::vector<std::string> &names() const { return names_; }
    size_t file_size() const { return file_size_; }

    /// Fresh, empty destination directory for one test
    std::string destination(const std::string &label) const {
        std::string dst = dir_ + "/" + label;
        remove_tree(dst);
        return dst;
    }

  private:
    std::string dir_;
    std::string src_dir_;
    size_t file_size_;
    std::vector<std::string> names_;
};

static bool same_contents(const std::string &a, const std::string &b) {
    FILE *fa = fopen(a.c_str(), "rb");
    FILE *fb = fopen(b.c_str(), "rb");
    bool same = fa && fb;
    std::vector<char> ba(64 * 1024), bb(64 * 1024);
    while (same) {
        size_t na = fread(ba.data(), 1, ba.size(), fa);
        size_t nb = fread(bb.data(), 1, bb.size(), fb);
        if (na != nb || memcmp(ba.data(), bb.data(), na) != 0) same = false;
        if (na == 0) break;
    }
    if (fa) fclose(fa);
    if (fb) fclose(fb);
    return same;
}

static int temp_count;

static int count_temp(const char *fpath, const struct stat *, int, struct FTW *) {
    size_t len = strlen(fpath);
    if (len > 4 && strcmp(fpath + len - 4, ".tmp") == 0) temp_count++;
    return 0;
}

static int temp_files_under(const std::string &dir) {
    temp_count = 0;
    nftw(dir.c_str(), count_temp, 16, FTW_PHYS);
    return temp_count;
}

static bak::TransferRequest make_request(const Config &config, const std::string &src,
                                         const std::string &dst, bool fast) {
    return bak::Options()
        .source(src)
        .destination(dst)
        .fast_mode(fast)
        .chunk_size(config.chunk_size)
        .show_progress(false)
        .color(false)
        .build();
}

// =============================================================================
// Stress Test: Protected Mode Visibility
// =============================================================================

void test_protected_visibility(const Config &config, const TestFiles &files, Stats &stats) {
    std::cout << "\n--- Test: Protected Mode Visibility ---\n";

    std::string dst = files.destination("protected");
    std::atomic<bool> done{false};

    // Polls every destination until the transfer returns
    std::thread observer([&]() {
        while (!done.load(std::memory_order_acquire)) {
            for (const auto &name : files.names()) {
                struct stat st;
                if (stat((dst + "/" + name).c_str(), &st) != 0) continue;
                stats.observations++;
                if (static_cast<size_t>(st.st_size) != files.file_size()) stats.partial_seen++;
            }
            std::this_thread::yield();
        }
    });

    bak::CancellationMonitor monitor;
    bak::Transfer transfer(make_request(config, files.source_dir(), dst, false), monitor);
    bak::TransferOutcome outcome;
    try {
        outcome = transfer.run();
    } catch (...) {
        done.store(true, std::memory_order_release);
        observer.join();
        throw;
    }
    done.store(true, std::memory_order_release);
    observer.join();
    stats.add(outcome);

    if (stats.partial_seen > 0) {
        throw std::runtime_error("observer saw a partially written destination");
    }
    if (outcome.files_copied != files.names().size() || outcome.files_failed != 0) {
        throw std::runtime_error("protected transfer did not copy every file");
    }
    for (const auto &name : files.names()) {
        if (!same_contents(files.source_dir() + "/" + name, dst + "/" + name)) {
            throw std::runtime_error("content mismatch: " + name);
        }
    }
    if (temp_files_under(dst) != 0) {
        throw std::runtime_error("temporary files left behind");
    }

    std::cout << "Observations: " << stats.observations << ", partial: " << stats.partial_seen
              << "\n";
}

// =============================================================================
// Stress Test: Interruption Under Load
// =============================================================================

void test_interrupt_under_load(const Config &config, const TestFiles &files, Stats &stats) {
    std::cout << "\n--- Test: Interruption Under Load ---\n";

    std::string dst = files.destination("interrupted");
    std::string first = dst + "/" + files.names().front();

    bak::CancellationMonitor monitor;
    std::atomic<bool> done{false};

    // Stop as soon as the first file lands
    std::thread stopper([&]() {
        auto deadline = Clock::now() + 30s;
        while (!done.load(std::memory_order_acquire) && Clock::now() < deadline) {
            struct stat st;
            if (stat(first.c_str(), &st) == 0) {
                monitor.request_stop(SIGINT);
                return;
            }
            std::this_thread::sleep_for(1ms);
        }
    });

    bak::Transfer transfer(make_request(config, files.source_dir(), dst, false), monitor);
    bak::TransferOutcome outcome;
    try {
        outcome = transfer.run();
    } catch (...) {
        done.store(true, std::memory_order_release);
        stopper.join();
        throw;
    }
    done.store(true, std::memory_order_release);
    stopper.join();
    stats.add(outcome);

    // Whatever made it across is whole
    size_t present = 0;
    for (const auto &name : files.names()) {
        std::string path = dst + "/" + name;
        struct stat st;
        if (stat(path.c_str(), &st) != 0) continue;
        present++;
        if (!same_contents(files.source_dir() + "/" + name, path)) {
            throw std::runtime_error("incomplete file after interrupt: " + name);
        }
    }
    if (present != outcome.files_copied) {
        throw std::runtime_error("destination count does not match copied count");
    }
    if (temp_files_under(dst) != 0) {
        throw std::runtime_error("temporary files left behind after interrupt");
    }

    std::cout << "State: " << bak::transfer_state_name(outcome.state) << ", copied "
              << outcome.files_copied << " of " << outcome.files_total << "\n";
}

// =============================================================================
// Stress Test: Fast Mode Bulk Copy
// =============================================================================

void test_fast_mode_bulk(const Config &config, const TestFiles &files, Stats &stats) {
    std::cout << "\n--- Test: Fast Mode Bulk Copy ---\n";

    std::string dst = files.destination("fast");
    bak::CancellationMonitor monitor;
    bak::Transfer transfer(make_request(config, files.source_dir(), dst, true), monitor);

    auto start = Clock::now();
    auto outcome = transfer.run();
    double elapsed = std::chrono::duration<double>(Clock::now() - start).count();
    stats.add(outcome);

    if (outcome.files_copied != files.names().size()) {
        throw std::runtime_error("fast transfer did not copy every file");
    }
    for (const auto &name : files.names()) {
        if (!same_contents(files.source_dir() + "/" + name, dst + "/" + name)) {
            throw std::runtime_error("content mismatch: " + name);
        }
    }

    std::cout << "Copied " << bak::format_bytes(static_cast<double>(outcome.bytes_copied))
              << " at " << bak::format_rate(static_cast<double>(outcome.bytes_copied) / elapsed)
              << "\n";
}

// =============================================================================
// Main
// =============================================================================

void print_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --files <count>        Number of test files (default: 16)\n";
    std::cerr << "  --size <bytes>         Size of each file (default: 4M)\n";
    std::cerr << "  --chunk <bytes>        Copy chunk size (default: 256K)\n";
    std::cerr << "  --quick                Quick test (8 files of 1 MB)\n";
    std::cerr << "  --help                 Show this help\n";
}

int main(int argc, char **argv) {
    Config config;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--files" && i + 1 < argc) {
            config.num_files = std::stoi(argv[++i]);
        } else if (arg == "--size" && i + 1 < argc) {
            auto size = bak::parse_size(argv[++i]);
            if (!size) {
                std::cerr << "Invalid size: " << argv[i] << "\n";
                return 1;
            }
            config.file_size = static_cast<size_t>(*size);
        } else if (arg == "--chunk" && i + 1 < argc) {
            auto size = bak::parse_size(argv[++i]);
            if (!size) {
                std::cerr << "Invalid chunk size: " << argv[i] << "\n";
                return 1;
            }
            config.chunk_size = static_cast<size_t>(*size);
        } else if (arg == "--quick") {
            config.num_files = 8;
            config.file_size = 1024 * 1024; // 1MB
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }
    if (config.num_files < 1) {
        std::cerr << "--files must be at least 1\n";
        return 1;
    }

    std::cout << "=== bak Stress Test ===\n";
    std::cout << "Test files:   " << config.num_files << "\n";
    std::cout << "File size:    " << config.file_size / 1024 << " KB\n";
    std::cout << "Chunk size:   " << config.chunk_size / 1024 << " KB\n";

    bak::install_log_handler(bak::LogLevel::Warning, stderr);

    try {
        std::cout << "\nCreating test files...\n";
        TestFiles files(config.test_dir, config.num_files, config.file_size);
        Stats stats;

        auto total_start = Clock::now();

        test_protected_visibility(config, files, stats);
        test_interrupt_under_load(config, files, stats);
        test_fast_mode_bulk(config, files, stats);

        auto total_elapsed = std::chrono::duration<double>(Clock::now() - total_start).count();
        stats.print(total_elapsed);

        if (stats.files_failed > 0) {
            std::cout << "\n*** WARNING: " << stats.files_failed << " files failed ***\n";
        }

        std::cout << "\n=== STRESS TEST PASSED ===\n";
        bak::clear_log_handler();
        return 0;

    } catch (const bak::Error &e) {
        std::cerr << "bak error: " << e.what() << "\n";
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    bak::clear_log_handler();
    return 1;
}
