// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

/**
 * @file copier.hpp
 * @brief Single-file copy through the AuraIO engine
 */

#ifndef BAK_COPIER_HPP
#define BAK_COPIER_HPP

#include <bak/options.hpp>

#include <aura.hpp>

#include <cstdint>
#include <string>

namespace bak {

/// How a file reaches its destination
enum class CopyMode {
    Protected, ///< Write "<dest>.tmp", then rename it onto the destination
    Fast       ///< Write the destination directly
};

/**
 * Preferred staging name for @p destination in protected mode
 *
 * Used only if nothing exists at that name yet; otherwise the copier stages
 * to a unique "<destination>.XXXXXX.tmp" so existing entries survive.
 */
[[nodiscard]] std::string temp_path_for(const std::string &destination);

/**
 * Create every missing directory above @p path (mkdir -p of its parent)
 *
 * Idempotent. A path without a directory part is a no-op.
 *
 * @throws Error if a component cannot be created
 */
void make_parent_dirs(const std::string &path);

/**
 * Copies one file at a time
 *
 * Holds one engine buffer that is reused for every file. Must be used from
 * the thread that drives the engine.
 *
 * In protected mode the destination is never seen half-written: data goes to
 * a staging file it creates exclusively (see temp_path_for()), which is
 * renamed onto dst only once it is complete. A failed copy unlinks the
 * staging file before the error is rethrown.
 *
 * Example:
 * @code
 * aura::Engine engine;
 * bak::FileCopier copier(engine, bak::CopyMode::Protected);
 * uint64_t n = copier.copy("notes.txt", "backup/notes.txt");
 * @endcode
 */
class FileCopier {
  public:
    /**
     * @param engine             Engine used for reads, writes and fdatasync
     * @param mode               Protected or fast
     * @param chunk_size         Bytes per read
     * @param sync_before_rename fdatasync the staging file before rename
     * @throws Error if the buffer cannot be allocated
     */
    FileCopier(aura::Engine &engine, CopyMode mode, size_t chunk_size = DEFAULT_CHUNK_SIZE,
               bool sync_before_rename = true);

    FileCopier(const FileCopier &) = delete;
    FileCopier &operator=(const FileCopier &) = delete;

    /**
     * Copy @p src to @p dst, creating dst's parent directories
     *
     * @return Bytes written
     * @throws Error on any failure (source missing, permission denied,
     *         disk full, name too long, ...)
     */
    uint64_t copy(const std::string &src, const std::string &dst);

    [[nodiscard]] CopyMode mode() const noexcept { return mode_; }

  private:
    uint64_t copy_fd(int src_fd, int dst_fd, bool sync, const std::string &what);

    aura::Engine &engine_;
    aura::Buffer buffer_;
    CopyMode mode_;
    size_t chunk_size_;
    bool sync_before_rename_;
};

} // namespace bak

#endif // BAK_COPIER_HPP
