// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

#ifndef _GNU_SOURCE
#    define _GNU_SOURCE
#endif
#include <bak/enumerate.hpp>
#include <bak/error.hpp>
#include <bak/log.hpp>

#include <cerrno>
#include <cstring>

#include <ftw.h>
#include <sys/stat.h>

namespace bak {

namespace {

constexpr int NFTW_MAX_FDS = 64;

struct WalkContext {
    FileList *files;
    std::string failed_dir;
    int error = 0;
};

thread_local WalkContext *t_walk_ctx; // nftw doesn't support user_data

int nftw_callback(const char *fpath, const struct stat *sb, int typeflag, struct FTW * /*ftwbuf*/) {
    WalkContext *wc = t_walk_ctx;

    switch (typeflag) {
    case FTW_F:
        if (S_ISREG(sb->st_mode)) wc->files->push_back(fpath);
        return 0;
    case FTW_DNR:
        wc->error = errno ? errno : EACCES;
        wc->failed_dir = fpath;
        return 1;
    default:
        // FTW_D, symlinks, and entries that vanished mid-walk (FTW_NS)
        return 0;
    }
}

std::string trim_trailing_slashes(std::string path) {
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    return path;
}

} // namespace

bool is_directory(const std::string &path) noexcept {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool is_regular_file(const std::string &path) noexcept {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

FileList enumerate_files(const std::string &root) {
    struct stat st;
    if (stat(root.c_str(), &st) != 0) throw_errno(root, "stat");

    FileList files;
    if (S_ISREG(st.st_mode)) {
        files.push_back(root);
        return files;
    }
    if (!S_ISDIR(st.st_mode)) {
        log_emit(LogLevel::Notice, "skipping special file: " + root);
        return files;
    }

    // FTW_PHYS would report a symlinked root as a link; "/." walks through it
    std::string walk_root = trim_trailing_slashes(root);
    struct stat lst;
    if (lstat(walk_root.c_str(), &lst) == 0 && S_ISLNK(lst.st_mode)) walk_root += "/.";

    WalkContext wc{&files, {}, 0};
    t_walk_ctx = &wc;

    errno = 0;
    int rc = nftw(walk_root.c_str(), nftw_callback, NFTW_MAX_FDS, FTW_PHYS);
    t_walk_ctx = nullptr;

    if (wc.error != 0) throw Error(wc.error, wc.failed_dir, "read directory");
    if (rc != 0) throw_errno(root, "walk");

    log_emit(LogLevel::Debug, "walked " + root + ": " + std::to_string(files.size()) + " files");
    return files;
}

uint64_t total_size(const FileList &files) noexcept {
    uint64_t total = 0;
    for (const auto &f : files) {
        struct stat st;
        if (stat(f.c_str(), &st) == 0) total += static_cast<uint64_t>(st.st_size);
    }
    return total;
}

std::string base_name(const std::string &path) {
    std::string p = trim_trailing_slashes(path);
    auto pos = p.rfind('/');
    if (pos == std::string::npos || p.size() == 1) return p;
    return p.substr(pos + 1);
}

std::string path_join(const std::string &dir, const std::string &name) {
    std::string d = trim_trailing_slashes(dir);
    size_t start = 0;
    while (start < name.size() && name[start] == '/') start++;
    if (d != "/") d += '/';
    d.append(name, start, std::string::npos);
    return d;
}

std::string destination_for(const std::string &file, const std::string &source_root,
                            bool source_is_file, const std::string &destination,
                            bool dest_is_dir) {
    if (source_is_file) {
        return dest_is_dir ? path_join(destination, base_name(source_root)) : destination;
    }

    std::string root = trim_trailing_slashes(source_root);
    const char *suffix = file.c_str();
    if (file.compare(0, root.size(), root) == 0) suffix += root.size();

    // Drop separators and "./" left over from a symlinked root
    for (;;) {
        if (*suffix == '/') {
            suffix++;
        } else if (suffix[0] == '.' && suffix[1] == '/') {
            suffix += 2;
        } else {
            break;
        }
    }
    return path_join(destination, suffix);
}

} // namespace bak
