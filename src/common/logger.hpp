#pragma once

/**
 * @file logger.hpp
 * @brief Logging utilities for Smither
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <mutex>
#include <string>

namespace smither {

/**
 * @brief Logger wrapper for Smither
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     *
     * Thread-safe. Only the first call (or the first log statement) creates
     * the logger; later calls leave name and level alone, use set_level()
     * to change the level afterwards.
     *
     * @param name Logger name
     * @param level Log level (trace, debug, info, warn, error, critical)
     */
    static void init(const std::string& name = "smither",
                     spdlog::level::level_enum level = spdlog::level::info);

    /**
     * @brief Get the logger instance
     */
    static std::shared_ptr<spdlog::logger>& get();

    static void set_level(spdlog::level::level_enum level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::once_flag init_flag_;
};

// Convenience macros for logging
#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(smither::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(smither::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(smither::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(smither::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(smither::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(smither::Logger::get(), __VA_ARGS__)

}  // namespace smither
