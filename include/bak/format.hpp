// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

/**
 * @file format.hpp
 * @brief Size parsing and human-readable formatting
 */

#ifndef BAK_FORMAT_HPP
#define BAK_FORMAT_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace bak {

/// Parse "512", "4K", "1.5M", "2G" into bytes. nullopt on junk or negatives.
[[nodiscard]] std::optional<uint64_t> parse_size(const char *str);

/// "512 B", "3.0 KiB", "1.5 MiB", "2.0 GiB"
[[nodiscard]] std::string format_bytes(double bytes);

/// Same as format_bytes() with a "/s" suffix
[[nodiscard]] std::string format_rate(double bytes_per_sec);

} // namespace bak

#endif // BAK_FORMAT_HPP
