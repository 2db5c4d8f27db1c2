// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

/**
 * @file error.hpp
 * @brief Failure of a filesystem step, with the path it was applied to
 */

#ifndef BAK_ERROR_HPP
#define BAK_ERROR_HPP

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

namespace bak {

/**
 * A failed step of a backup run
 *
 * Records the errno, the path the step was working on (empty for steps that
 * have none, such as engine setup) and a short verb naming the step
 * ("open", "rename", "mkdir", ...). what() reads "<op> <path>: <reason>".
 *
 * Per-file copy failures are reported with reason() next to the source
 * path; fatal ones are printed with what().
 */
class Error : public std::system_error {
  public:
    explicit Error(int err, std::string path = {}, std::string op = {})
        : std::system_error(err, std::generic_category(), describe(op, path)),
          path_(std::move(path)), op_(std::move(op)) {}

    /// Positive errno value
    [[nodiscard]] int code() const noexcept { return std::system_error::code().value(); }

    [[nodiscard]] const std::string &path() const noexcept { return path_; }
    [[nodiscard]] const std::string &op() const noexcept { return op_; }

    /// "<op>: <strerror>", or just the strerror text when there is no op
    [[nodiscard]] std::string reason() const {
        std::string msg = std::system_error::code().message();
        return op_.empty() ? msg : op_ + ": " + msg;
    }

    [[nodiscard]] bool is_not_found() const noexcept { return code() == ENOENT; }
    [[nodiscard]] bool is_permission_denied() const noexcept {
        return code() == EACCES || code() == EPERM;
    }
    [[nodiscard]] bool is_no_space() const noexcept {
        return code() == ENOSPC || code() == EDQUOT;
    }
    [[nodiscard]] bool is_name_too_long() const noexcept { return code() == ENAMETOOLONG; }
    [[nodiscard]] bool is_is_directory() const noexcept { return code() == EISDIR; }
    [[nodiscard]] bool is_invalid() const noexcept { return code() == EINVAL; }

  private:
    static std::string describe(const std::string &op, const std::string &path) {
        if (op.empty()) return path;
        if (path.empty()) return op;
        return op + " " + path;
    }

    std::string path_;
    std::string op_;
};

/// Raise the current errno as an Error for step @p op on @p path
[[noreturn]] inline void throw_errno(std::string path, std::string op) {
    throw Error(errno, std::move(path), std::move(op));
}

} // namespace bak

#endif // BAK_ERROR_HPP
