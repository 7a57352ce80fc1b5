#pragma once
#include <string>
#include <string_view>
#include <source_location>
#include <utility>
#include <optional>
#include <fmt/format.h>

// spdlog is built against the external fmt (SPDLOG_FMT_EXTERNAL).
#include <spdlog/spdlog.h>
#include <spdlog/common.h>

namespace bcproxy::log
{
    struct Options
    {
        // Where to write logs:
        bool to_console = true;
        bool to_file = true;
        std::string file_path = "logs/bcproxy.log";
        std::size_t max_file_bytes = 5 * 1024 * 1024; // 5MB
        std::size_t max_files = 3;

        // Behavior:
        bool async = true;
        int level = SPDLOG_LEVEL_INFO;
        int flush_on = SPDLOG_LEVEL_WARN;
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%t] [%^%l%$] [%s:%#] %v";
    };

    // Must be called once at startup (safe to call again; it re-initializes).
    void init(const Options &opts = {});

    // Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "critical", "off").
    std::optional<int> parse_level(std::string_view name);

    template <typename... Args>
    inline void log(std::source_location loc, int lvl,
                    fmt::format_string<Args...> fmtstr,
                    Args &&...args)
    {
        auto *logger = spdlog::default_logger_raw();
        if (!logger) [[unlikely]]
            return;

        // Skip formatting if level is disabled:
        if (!logger->should_log(static_cast<spdlog::level::level_enum>(lvl)))
            return;

        logger->log(
            spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
            static_cast<spdlog::level::level_enum>(lvl),
            fmtstr, std::forward<Args>(args)...);
    }
}

#define LTRACE(...) ::bcproxy::log::log(std::source_location::current(), SPDLOG_LEVEL_TRACE, __VA_ARGS__)
#define LDEBUG(...) ::bcproxy::log::log(std::source_location::current(), SPDLOG_LEVEL_DEBUG, __VA_ARGS__)
#define LINFO(...) ::bcproxy::log::log(std::source_location::current(), SPDLOG_LEVEL_INFO, __VA_ARGS__)
#define LWARN(...) ::bcproxy::log::log(std::source_location::current(), SPDLOG_LEVEL_WARN, __VA_ARGS__)
#define LERROR(...) ::bcproxy::log::log(std::source_location::current(), SPDLOG_LEVEL_ERROR, __VA_ARGS__)
#define LCRIT(...) ::bcproxy::log::log(std::source_location::current(), SPDLOG_LEVEL_CRITICAL, __VA_ARGS__)
