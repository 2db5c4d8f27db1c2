// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

/**
 * @file enumerate.hpp
 * @brief Source tree walking, size totals and destination path mapping
 */

#ifndef BAK_ENUMERATE_HPP
#define BAK_ENUMERATE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace bak {

/// Regular files to copy, in walk order
using FileList = std::vector<std::string>;

/**
 * List the regular files under @p root
 *
 * A regular-file root yields itself. A directory root is walked depth-first
 * in directory-iteration order; every subtree's files are contiguous.
 * Symbolic links and special files inside the tree are skipped, never
 * followed.
 *
 * @throws Error if the root does not exist, or if the root or any directory
 *         below it cannot be read
 */
[[nodiscard]] FileList enumerate_files(const std::string &root);

/**
 * Sum of the file sizes. A file that cannot be stat'ed counts as zero.
 */
[[nodiscard]] uint64_t total_size(const FileList &files) noexcept;

/// True if @p path names an existing directory (following links)
[[nodiscard]] bool is_directory(const std::string &path) noexcept;

/// True if @p path names an existing regular file (following links)
[[nodiscard]] bool is_regular_file(const std::string &path) noexcept;

/// Last path component of @p path, ignoring trailing slashes
[[nodiscard]] std::string base_name(const std::string &path);

/// @p dir joined with @p name by exactly one slash
[[nodiscard]] std::string path_join(const std::string &dir, const std::string &name);

/**
 * Where @p file should land
 *
 * @param file           A path from enumerate_files(source_root)
 * @param source_root    The root that was enumerated
 * @param source_is_file True if source_root is a regular file
 * @param destination    Requested destination
 * @param dest_is_dir    True if destination is an existing directory
 *
 * Single file into a directory: destination/<file name>. Single file
 * elsewhere: destination verbatim. Directory source:
 * destination/<path relative to source_root>.
 */
[[nodiscard]] std::string destination_for(const std::string &file, const std::string &source_root,
                                          bool source_is_file, const std::string &destination,
                                          bool dest_is_dir);

} // namespace bak

#endif // BAK_ENUMERATE_HPP
