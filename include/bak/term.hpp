// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

/**
 * @file term.hpp
 * @brief ANSI styling for terminal output
 */

#ifndef BAK_TERM_HPP
#define BAK_TERM_HPP

#include <string>
#include <string_view>

namespace bak::term {

inline constexpr const char *RED = "31";
inline constexpr const char *GREEN = "32";
inline constexpr const char *YELLOW = "33";
inline constexpr const char *CYAN = "36";
inline constexpr const char *BOLD = "1";

/// Erase the current line and return the cursor to column 0
inline constexpr const char *CLEAR_LINE = "\r\033[2K";

/// Wrap @p text in an SGR sequence when @p enabled, otherwise return it unchanged
inline std::string paint(std::string_view text, const char *sgr, bool enabled) {
    if (!enabled) return std::string(text);
    std::string s;
    s.reserve(text.size() + 12);
    s += "\033[";
    s += sgr;
    s += 'm';
    s += text;
    s += "\033[0m";
    return s;
}

} // namespace bak::term

#endif // BAK_TERM_HPP
