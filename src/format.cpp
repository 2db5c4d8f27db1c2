// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

#include <bak/format.hpp>

#include <cstdio>
#include <cstdlib>

namespace bak {

std::optional<uint64_t> parse_size(const char *str) {
    if (!str || !*str) return std::nullopt;

    char *endp;
    double val = strtod(str, &endp);
    if (endp == str || val < 0) return std::nullopt;

    switch (*endp) {
    case 'G':
    case 'g':
        val *= 1024.0 * 1024.0 * 1024.0;
        endp++;
        break;
    case 'M':
    case 'm':
        val *= 1024.0 * 1024.0;
        endp++;
        break;
    case 'K':
    case 'k':
        val *= 1024.0;
        endp++;
        break;
    case '\0':
        break;
    default:
        return std::nullopt;
    }
    if (*endp != '\0') return std::nullopt;

    if (val > static_cast<double>(UINT64_MAX / 2)) return std::nullopt;
    return static_cast<uint64_t>(val);
}

std::string format_bytes(double bytes) {
    char buf[32];
    if (bytes >= 1024.0 * 1024.0 * 1024.0)
        snprintf(buf, sizeof(buf), "%.1f GiB", bytes / (1024.0 * 1024.0 * 1024.0));
    else if (bytes >= 1024.0 * 1024.0) snprintf(buf, sizeof(buf), "%.1f MiB", bytes / (1024.0 * 1024.0));
    else if (bytes >= 1024.0) snprintf(buf, sizeof(buf), "%.1f KiB", bytes / 1024.0);
    else snprintf(buf, sizeof(buf), "%.0f B", bytes);
    return buf;
}

std::string format_rate(double bytes_per_sec) {
    return format_bytes(bytes_per_sec) + "/s";
}

} // namespace bak
