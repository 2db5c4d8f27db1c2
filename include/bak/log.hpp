// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

/**
 * @file log.hpp
 * @brief Logging for bak, routed through the AuraIO log pipeline
 *
 * bak does not keep a logger of its own. The handler installed here is
 * registered with aura::set_log_handler(), so engine diagnostics and bak
 * messages end up in the same sink with the same format.
 *
 * Example:
 * @code
 *   bak::install_log_handler(bak::LogLevel::Info, stderr);
 *   bak::log_emit(bak::LogLevel::Info, "copy started");
 *   // ...
 *   bak::clear_log_handler();
 * @endcode
 */

#ifndef BAK_LOG_HPP
#define BAK_LOG_HPP

#include <aura.h>

#include <cstdio>
#include <optional>
#include <string_view>

namespace bak {

/// Log severity levels (match syslog priorities 1:1, same values as aura::LogLevel)
enum class LogLevel {
    Error = AURA_LOG_ERR,
    Warning = AURA_LOG_WARN,
    Notice = AURA_LOG_NOTICE,
    Info = AURA_LOG_INFO,
    Debug = AURA_LOG_DEBUG
};

/// Return a short name for the given log level ("ERR", "WARN", etc.)
[[nodiscard]] const char *log_level_name(LogLevel level) noexcept;

/// Parse "error", "warn", "notice", "info" or "debug" (case-insensitive)
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

/**
 * Install the process-wide log handler.
 *
 * Messages less severe than @p min_level are dropped. Each accepted message
 * is written as one timestamped line to @p out. Replaces any previously
 * installed handler. Thread-safe.
 */
void install_log_handler(LogLevel min_level, FILE *out);

/// Remove the handler; logging becomes silent.
void clear_log_handler() noexcept;

/// Emit a message through the AuraIO log pipeline. No-op without a handler.
void log_emit(LogLevel level, std::string_view msg);

} // namespace bak

#endif // BAK_LOG_HPP
