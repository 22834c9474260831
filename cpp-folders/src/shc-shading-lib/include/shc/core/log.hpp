#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: log.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Pipeline байгуулалт болон draw validation-ий алдаа, анхааруулгыг
            түвшингээр шүүж stdout/stderr руу бичнэ.
*/


#include <atomic>
#include <iostream>
#include <string>

namespace shc
{
    enum class LogLevel : int
    {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
        Off = 4
    };

    namespace detail
    {
        inline std::atomic<int>& log_threshold()
        {
            static std::atomic<int> level{(int)LogLevel::Info};
            return level;
        }

        inline bool log_enabled(LogLevel level)
        {
            return (int)level >= log_threshold().load(std::memory_order_relaxed);
        }
    }

    inline void set_log_level(LogLevel level)
    {
        detail::log_threshold().store((int)level, std::memory_order_relaxed);
    }

    inline void log_debug(const std::string& msg)
    {
        if (!detail::log_enabled(LogLevel::Debug)) return;
        std::cout << "[DEBUG] " << msg << std::endl;
    }

    inline void log_info(const std::string& msg)
    {
        if (!detail::log_enabled(LogLevel::Info)) return;
        std::cout << "[INFO] " << msg << std::endl;
    }

    inline void log_warn(const std::string& msg)
    {
        if (!detail::log_enabled(LogLevel::Warn)) return;
        std::cout << "[WARN] " << msg << std::endl;
    }

    inline void log_error(const std::string& msg)
    {
        if (!detail::log_enabled(LogLevel::Error)) return;
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}
