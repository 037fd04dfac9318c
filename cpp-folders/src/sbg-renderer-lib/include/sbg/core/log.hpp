#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: log.hpp
    MODULE: core
    PURPOSE: Leveled console logger. Errors go to stderr, everything else to stdout.
*/


#include <atomic>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

namespace sbg
{
    enum class LogLevel : uint8_t
    {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
        Off = 4
    };

    inline const char* log_level_name(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::Debug: return "debug";
            case LogLevel::Info: return "info";
            case LogLevel::Warn: return "warn";
            case LogLevel::Error: return "error";
            case LogLevel::Off: return "off";
        }
        return "unknown";
    }

    inline LogLevel parse_log_level(std::string_view name, LogLevel fallback = LogLevel::Info)
    {
        if (name == "debug") return LogLevel::Debug;
        if (name == "info") return LogLevel::Info;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "off") return LogLevel::Off;
        return fallback;
    }

    inline std::atomic<uint8_t>& log_level_storage()
    {
        static std::atomic<uint8_t> level{(uint8_t)LogLevel::Info};
        return level;
    }

    inline void set_log_level(LogLevel level)
    {
        log_level_storage().store((uint8_t)level, std::memory_order_relaxed);
    }

    inline LogLevel log_level()
    {
        return (LogLevel)log_level_storage().load(std::memory_order_relaxed);
    }

    inline bool log_enabled(LogLevel level)
    {
        return (uint8_t)level >= (uint8_t)log_level();
    }

    inline void log_debug(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Debug)) return;
        std::cout << "[DEBUG] " << msg << std::endl;
    }

    inline void log_info(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Info)) return;
        std::cout << "[INFO] " << msg << std::endl;
    }

    inline void log_warn(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Warn)) return;
        std::cout << "[WARN] " << msg << std::endl;
    }

    inline void log_error(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Error)) return;
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}
