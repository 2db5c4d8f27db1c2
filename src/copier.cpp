// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

#ifndef _GNU_SOURCE
#    define _GNU_SOURCE
#endif
#include <bak/copier.hpp>
#include <bak/error.hpp>
#include <bak/log.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace bak {

namespace {

/// Owns a file descriptor; closes it on scope exit unless close() was called.
class UniqueFd {
  public:
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}

    ~UniqueFd() {
        if (fd_ >= 0) ::close(fd_);
    }

    UniqueFd(const UniqueFd &) = delete;
    UniqueFd &operator=(const UniqueFd &) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }

    explicit operator bool() const noexcept { return fd_ >= 0; }

    /// Close now and report the result (close can surface deferred write errors)
    int close() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd >= 0 ? ::close(fd) : 0;
    }

  private:
    int fd_;
};

bool is_transient(const aura::Error &e) noexcept {
    return e.code() == EINTR || e.code() == ETIME || e.code() == ETIMEDOUT;
}

/**
 * Read/write loop until EOF. Each chunk is read once and written in full,
 * retrying short writes from where they stopped.
 */
aura::Task<uint64_t> pump(aura::Engine &engine, aura::Buffer &buffer, size_t chunk, int src_fd,
                          int dst_fd, bool sync) {
    uint64_t total = 0;
    off_t offset = 0;

    for (;;) {
        ssize_t n = co_await engine.async_read(src_fd, buffer, chunk, offset);
        if (n == 0) break; // EOF

        size_t done = 0;
        while (done < static_cast<size_t>(n)) {
            void *at = static_cast<char *>(buffer.data()) + done;
            ssize_t w = co_await engine.async_write(dst_fd, aura::BufferRef(at),
                                                    static_cast<size_t>(n) - done,
                                                    offset + static_cast<off_t>(done));
            if (w == 0) throw aura::Error(EIO, "async_write: no progress");
            done += static_cast<size_t>(w);
        }

        offset += n;
        total += static_cast<uint64_t>(n);
    }

    if (sync) co_await engine.async_fdatasync(dst_fd);

    co_return total;
}

/**
 * Create the staging file for @p dst exclusively and set @p tmp to its name.
 * Whatever already sits at the preferred name (a user's "x.tmp", a file
 * copied earlier in this run, a symlink) is left untouched; a unique
 * "<dst>.XXXXXX.tmp" sibling is created instead.
 */
int create_staging(const std::string &dst, mode_t mode, std::string &tmp) {
    tmp = temp_path_for(dst);
    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, mode);
    if (fd >= 0 || errno != EEXIST) return fd;

    tmp = dst + ".XXXXXX.tmp";
    return mkostemps(tmp.data(), 4, O_CLOEXEC);
}

} // namespace

std::string temp_path_for(const std::string &destination) {
    return destination + ".tmp";
}

void make_parent_dirs(const std::string &path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return;

    std::string parent = path.substr(0, slash);
    struct stat st;
    if (stat(parent.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) return;

    // Walk components left to right; each mkdir may find its directory already there
    for (size_t pos = 1; pos <= parent.size(); pos++) {
        if (pos != parent.size() && parent[pos] != '/') continue;
        if (parent[pos - 1] == '/') continue;

        std::string prefix = parent.substr(0, pos);
        if (mkdir(prefix.c_str(), 0777) != 0 && errno != EEXIST) {
            throw_errno(prefix, "mkdir");
        }
    }
}

FileCopier::FileCopier(aura::Engine &engine, CopyMode mode, size_t chunk_size,
                       bool sync_before_rename)
    : engine_(engine), mode_(mode), chunk_size_(chunk_size),
      sync_before_rename_(sync_before_rename) {
    try {
        buffer_ = engine_.allocate_buffer(chunk_size_);
    } catch (const aura::Error &e) {
        throw Error(e.code(), {}, "allocate copy buffer");
    }
}

uint64_t FileCopier::copy_fd(int src_fd, int dst_fd, bool sync, const std::string &what) {
    auto task = pump(engine_, buffer_, chunk_size_, src_fd, dst_fd, sync);
    task.resume();

    // A Task may not be destroyed with I/O in flight, so a broken event loop
    // is remembered and reported only after the coroutine has finished.
    int loop_error = 0;
    while (!task.done()) {
        try {
            (void)engine_.wait(100);
        } catch (const aura::Error &e) {
            if (!is_transient(e) && loop_error == 0) loop_error = e.code();
        }
    }

    try {
        uint64_t n = task.get();
        if (loop_error != 0) throw Error(loop_error, what, "copy");
        return n;
    } catch (const aura::Error &e) {
        throw Error(e.code(), what, "copy");
    }
}

uint64_t FileCopier::copy(const std::string &src, const std::string &dst) {
    make_parent_dirs(dst);

    UniqueFd in(open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!in) throw_errno(src, "open");

    struct stat st;
    if (fstat(in.get(), &st) != 0) throw_errno(src, "stat");
    if (S_ISDIR(st.st_mode)) throw Error(EISDIR, src, "open");

    if (mode_ == CopyMode::Fast) {
        UniqueFd out(open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, st.st_mode & 07777));
        if (!out) throw_errno(dst, "create");

        uint64_t n = copy_fd(in.get(), out.get(), false, dst);
        if (out.close() != 0) throw_errno(dst, "close");
        return n;
    }

    std::string tmp;
    UniqueFd out(create_staging(dst, st.st_mode & 07777, tmp));
    if (!out) throw_errno(tmp, "create");

    try {
        // Also covers mkostemps' 0600 and the umask
        if (fchmod(out.get(), st.st_mode & 07777) != 0) {
            log_emit(LogLevel::Debug, "cannot set mode on " + tmp + ": " + strerror(errno));
        }

        uint64_t n = copy_fd(in.get(), out.get(), sync_before_rename_, dst);
        if (out.close() != 0) throw_errno(tmp, "close");
        if (rename(tmp.c_str(), dst.c_str()) != 0) throw_errno(dst, "rename");
        return n;
    } catch (...) {
        (void)out.close();
        if (unlink(tmp.c_str()) != 0 && errno != ENOENT) {
            log_emit(LogLevel::Debug, "cannot remove " + tmp + ": " + strerror(errno));
        }
        throw;
    }
}

} // namespace bak
