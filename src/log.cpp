// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 bak Contributors

#include <bak/log.hpp>

#include <aura.hpp>

#include <chrono>
#include <cstring>
#include <ctime>
#include <string>
#include <strings.h>

namespace bak {

const char *log_level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Notice:
        return "NOTICE";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    default:
        return "???";
    }
}

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    struct Entry {
        const char *name;
        LogLevel level;
    };
    static constexpr Entry entries[] = {
        {"error", LogLevel::Error}, {"err", LogLevel::Error},
        {"warn", LogLevel::Warning}, {"warning", LogLevel::Warning},
        {"notice", LogLevel::Notice}, {"info", LogLevel::Info},
        {"debug", LogLevel::Debug},
    };
    for (const auto &e : entries) {
        if (name.size() == strlen(e.name) &&
            strncasecmp(name.data(), e.name, name.size()) == 0) {
            return e.level;
        }
    }
    return std::nullopt;
}

void install_log_handler(LogLevel min_level, FILE *out) {
    aura::set_log_handler([min_level, out](aura::LogLevel level, std::string_view msg) {
        if (static_cast<int>(level) > static_cast<int>(min_level)) return;

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t_now, &tm);
        char stamp[32];
        strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

        // One fprintf per message keeps lines whole across threads
        fprintf(out, "%s.%03d [bak] %s: %.*s\n", stamp, static_cast<int>(ms.count()),
                log_level_name(static_cast<LogLevel>(level)), static_cast<int>(msg.size()),
                msg.data());
        fflush(out);
    });
}

void clear_log_handler() noexcept {
    aura::clear_log_handler();
}

void log_emit(LogLevel level, std::string_view msg) {
    aura::log_emit(static_cast<aura::LogLevel>(level), msg);
}

} // namespace bak
