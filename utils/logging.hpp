// utils/logging.hpp
#pragma once
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <stdexcept>
#include <string>

namespace utils
{

    enum class LogLevel : int
    {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Off = 5
    };

    namespace detail
    {
        struct LevelName
        {
            const char *name;
            LogLevel level;
        };

        // First entry per level is the printed name; the rest are aliases.
        constexpr LevelName kLevelNames[] = {
            {"TRACE", LogLevel::Trace},
            {"DEBUG", LogLevel::Debug},
            {"INFO", LogLevel::Info},
            {"WARN", LogLevel::Warn},
            {"WARNING", LogLevel::Warn},
            {"ERROR", LogLevel::Error},
            {"OFF", LogLevel::Off},
            {"NONE", LogLevel::Off},
        };

        // Process-wide destination: threshold plus an optional mirror file.
        struct LogSink
        {
            LogLevel threshold = LogLevel::Info;
            std::ofstream file;
            std::string file_path;
        };

        inline LogSink &sink()
        {
            static LogSink s;
            return s;
        }

        // "HH:MM:SS.mmm" local time; cycle-rate logs need sub-second stamps.
        inline void format_timestamp(char *buf, size_t len)
        {
            using namespace std::chrono;
            const auto now = system_clock::now();
            const std::time_t t = system_clock::to_time_t(now);
            const long ms = static_cast<long>(
                duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

            std::tm tm{};
#if defined(_WIN32)
            localtime_s(&tm, &t);
#else
            localtime_r(&t, &tm);
#endif
            std::snprintf(buf, len, "%02d:%02d:%02d.%03ld",
                          tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
        }
    } // namespace detail

    inline const char *to_string(LogLevel lvl)
    {
        for (const auto &entry : detail::kLevelNames)
        {
            if (entry.level == lvl)
                return entry.name;
        }
        return "OFF";
    }

    // Case-insensitive; accepts every name in kLevelNames.
    // Throws std::invalid_argument on anything else.
    inline LogLevel parse_level(const std::string &name)
    {
        std::string upper;
        upper.reserve(name.size());
        for (char c : name)
            upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));

        for (const auto &entry : detail::kLevelNames)
        {
            if (upper == entry.name)
                return entry.level;
        }
        throw std::invalid_argument("Unknown log level: " + name);
    }

    inline void set_level(LogLevel lvl)
    {
        detail::sink().threshold = lvl;
    }

    inline LogLevel current_level()
    {
        return detail::sink().threshold;
    }

    inline bool level_enabled(LogLevel lvl)
    {
        const LogLevel threshold = detail::sink().threshold;
        return threshold != LogLevel::Off && lvl != LogLevel::Off && lvl >= threshold;
    }

    // Mirrors every emitted line to `path` (truncated). A failed open leaves
    // logging on stderr only.
    inline bool open_log_file(const std::string &path)
    {
        auto &s = detail::sink();
        if (s.file.is_open())
            s.file.close();
        s.file.clear();
        s.file_path.clear();

        s.file.open(path, std::ios::out | std::ios::trunc);
        if (!s.file.is_open())
        {
            std::fprintf(stderr, "[ERROR] Failed to open log file: %s\n", path.c_str());
            return false;
        }

        s.file_path = path;
        std::fprintf(stderr, "[INFO] Logging to file: %s\n", path.c_str());
        return true;
    }

    inline void close_log_file()
    {
        auto &s = detail::sink();
        if (s.file.is_open())
            s.file.close();
        s.file_path.clear();
    }

    // Empty when no mirror file is open
    inline const std::string &log_file_path()
    {
        return detail::sink().file_path;
    }

    inline void vlogf(LogLevel lvl, const char *fmt, va_list args)
    {
        if (!level_enabled(lvl))
            return;

        char ts[32];
        detail::format_timestamp(ts, sizeof(ts));

        char msg[1024];
        std::vsnprintf(msg, sizeof(msg), fmt, args);

        std::fprintf(stderr, "[%s] %-5s: %s\n", ts, to_string(lvl), msg);

        auto &s = detail::sink();
        if (s.file.is_open())
        {
            s.file << '[' << ts << "] " << to_string(lvl) << ": " << msg << '\n';
            s.file.flush();
        }
    }

    inline void logf(LogLevel lvl, const char *fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        vlogf(lvl, fmt, args);
        va_end(args);
    }

} // namespace utils

#define LOG_TRACE(...) ::utils::logf(::utils::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) ::utils::logf(::utils::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...) ::utils::logf(::utils::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) ::utils::logf(::utils::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) ::utils::logf(::utils::LogLevel::Error, __VA_ARGS__)
