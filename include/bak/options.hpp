// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

/**
 * @file options.hpp
 * @brief Transfer request and its builder
 */

#ifndef BAK_OPTIONS_HPP
#define BAK_OPTIONS_HPP

#include <bak/error.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>

namespace bak {

inline constexpr size_t DEFAULT_CHUNK_SIZE = 256 * 1024; // 256 KiB
inline constexpr size_t MIN_CHUNK_SIZE = 4 * 1024;
inline constexpr size_t MAX_CHUNK_SIZE = 64 * 1024 * 1024;

inline constexpr std::chrono::milliseconds DEFAULT_FRAME_INTERVAL{100};
inline constexpr std::chrono::milliseconds LOW_ANIMATION_FRAME_INTERVAL{500};

/**
 * One copy job, frozen
 *
 * Produced by Options::build(); there are no setters.
 */
class TransferRequest {
  public:
    [[nodiscard]] const std::string &source() const noexcept { return source_; }
    [[nodiscard]] const std::string &destination() const noexcept { return destination_; }
    [[nodiscard]] bool verbose() const noexcept { return verbose_; }
    [[nodiscard]] bool fast_mode() const noexcept { return fast_mode_; }
    [[nodiscard]] bool low_animation() const noexcept { return low_animation_; }
    [[nodiscard]] bool sync_before_rename() const noexcept { return sync_before_rename_; }
    [[nodiscard]] size_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] bool show_progress() const noexcept { return show_progress_; }
    [[nodiscard]] bool color() const noexcept { return color_; }

    /// Reporter cadence implied by low_animation()
    [[nodiscard]] std::chrono::milliseconds frame_interval() const noexcept {
        return low_animation_ ? LOW_ANIMATION_FRAME_INTERVAL : DEFAULT_FRAME_INTERVAL;
    }

  private:
    friend class Options;

    std::string source_;
    std::string destination_;
    bool verbose_ = false;
    bool fast_mode_ = false;
    bool low_animation_ = false;
    bool sync_before_rename_ = true;
    size_t chunk_size_ = DEFAULT_CHUNK_SIZE;
    bool show_progress_ = true;
    bool color_ = true;
};

/**
 * Transfer configuration
 *
 * Uses builder pattern for fluent configuration.
 *
 * Example:
 * @code
 * auto request = bak::Options()
 *                    .source("photos")
 *                    .destination("/mnt/backup/photos")
 *                    .verbose()
 *                    .build();
 * @endcode
 */
class Options {
  public:
    Options &source(std::string path) {
        req_.source_ = std::move(path);
        return *this;
    }

    Options &destination(std::string path) {
        req_.destination_ = std::move(path);
        return *this;
    }

    /// Print a line for every file copied successfully
    Options &verbose(bool enable = true) noexcept {
        req_.verbose_ = enable;
        return *this;
    }

    /// Write straight to the destination, no temporary file
    Options &fast_mode(bool enable = true) noexcept {
        req_.fast_mode_ = enable;
        return *this;
    }

    /// Redraw the progress line less often
    Options &low_animation(bool enable = true) noexcept {
        req_.low_animation_ = enable;
        return *this;
    }

    /// fdatasync the temporary file before renaming it (protected mode only)
    Options &sync_before_rename(bool enable = true) noexcept {
        req_.sync_before_rename_ = enable;
        return *this;
    }

    /**
     * Set copy chunk size
     * @param bytes Chunk size (default: 256 KiB, valid range: 4 KiB - 64 MiB)
     * @note Validated by build()
     */
    Options &chunk_size(size_t bytes) noexcept {
        req_.chunk_size_ = bytes;
        return *this;
    }

    Options &show_progress(bool enable = true) noexcept {
        req_.show_progress_ = enable;
        return *this;
    }

    Options &color(bool enable = true) noexcept {
        req_.color_ = enable;
        return *this;
    }

    /**
     * Validate and freeze
     * @throws Error(EINVAL) if a path is empty or the chunk size is out of range
     */
    [[nodiscard]] TransferRequest build() const {
        if (req_.source_.empty()) throw Error(EINVAL, {}, "empty source path");
        if (req_.destination_.empty()) throw Error(EINVAL, {}, "empty destination path");
        if (req_.chunk_size_ < MIN_CHUNK_SIZE || req_.chunk_size_ > MAX_CHUNK_SIZE)
            throw Error(EINVAL, {}, "chunk size out of range");
        return req_;
    }

  private:
    TransferRequest req_;
};

} // namespace bak

#endif // BAK_OPTIONS_HPP
