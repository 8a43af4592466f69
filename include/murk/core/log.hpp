#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: log.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Рендерер болон demo host-ийн мэдээллийн, анхааруулгын, алдааны
            мөрүүдийг нэг хэлбэрээр хэвлэнэ.
*/


#include <atomic>
#include <iostream>
#include <string>

namespace murk
{
    enum class LogLevel : int
    {
        Info = 0,
        Warn = 1,
        Error = 2,
        Silent = 3
    };

    inline std::atomic<int>& log_threshold()
    {
        static std::atomic<int> level{(int)LogLevel::Info};
        return level;
    }

    // Тестүүд чимээгүй ажиллах боломжтой байхаар босго тавина.
    inline void set_log_level(LogLevel level)
    {
        log_threshold().store((int)level, std::memory_order_relaxed);
    }

    inline bool log_enabled(LogLevel level)
    {
        return (int)level >= log_threshold().load(std::memory_order_relaxed);
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
