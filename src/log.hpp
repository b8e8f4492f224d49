#pragma once

#include "common.hpp"

#include <cstdarg>
#include <cstdio>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <string_view>

namespace monkeysim
{
    enum class LogLevel : std::uint8_t
    {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
        Trace = 4,
        Off = 255,
    };

    inline const char *log_level_name(LogLevel lvl) noexcept
    {
        switch (lvl)
        {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Off:
            return "OFF";
        }
        return "UNKNOWN";
    }

    // Lower-case names as accepted on the command line ("info", "off", ...).
    inline std::optional<LogLevel> parse_log_level(std::string_view s) noexcept
    {
        for (const LogLevel lvl : {LogLevel::Error, LogLevel::Warn, LogLevel::Info, LogLevel::Debug, LogLevel::Trace,
                                   LogLevel::Off})
        {
            const std::string_view name = log_level_name(lvl);
            if (s.size() != name.size())
            {
                continue;
            }
            bool same = true;
            for (std::size_t i = 0; i < s.size() && same; ++i)
            {
                same = (s[i] >= 'a' && s[i] <= 'z') && static_cast<char>(s[i] - 'a' + 'A') == name[i];
            }
            if (same)
            {
                return lvl;
            }
        }
        return std::nullopt;
    }

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept
    {
        if (configured == LogLevel::Off)
        {
            return false;
        }
        return static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    // Process-wide logger. Lines look like
    //   [INFO][round=3] ...            (run-level, monkey == NoMonkey)
    //   [DEBUG][round=3][monkey=1] ...
    class Logger
    {
    public:
        static Logger &instance()
        {
            static Logger g;
            return g;
        }

        void set_level(LogLevel lvl)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_level = lvl;
        }

        // `f` must outlive any logging; nullptr discards output.
        void set_sink(FILE *f)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_sink = f;
        }

        void logf(LogLevel lvl, RoundIndex round, MonkeyId monkey, const char *fmt, ...)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (!m_sink || !log_enabled(m_level, lvl))
            {
                return;
            }

            char where[48];
            if (monkey == NoMonkey)
            {
                std::snprintf(where, sizeof(where), "[round=%llu]", static_cast<unsigned long long>(round));
            }
            else
            {
                std::snprintf(where, sizeof(where), "[round=%llu][monkey=%u]",
                              static_cast<unsigned long long>(round), static_cast<unsigned>(monkey));
            }

            char msg[1024];
            va_list args;
            va_start(args, fmt);
            std::vsnprintf(msg, sizeof(msg), fmt, args);
            va_end(args);

            std::fprintf(m_sink, "[%s]%s %s\n", log_level_name(lvl), where, msg);
            std::fflush(m_sink);
        }

    private:
        Logger() = default;

        std::mutex m_mu;
        LogLevel m_level = LogLevel::Off;
        FILE *m_sink = stderr;
    };
}
