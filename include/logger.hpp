#pragma once

/**
 * @file logger.hpp
 * @brief Logging for pgshift (spdlog)
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>

class Logger {
public:
    /**
     * @brief Initialize the logging system (no-op if already initialized)
     * @param name Logger name
     * @param level Log level (trace, debug, info, warn, error, critical)
     */
    static void init(const std::string& name = "pgshift",
                     spdlog::level::level_enum level = spdlog::level::info);

    /**
     * @brief Get the logger instance, initializing it on first use. Safe to call from any thread.
     */
    static std::shared_ptr<spdlog::logger> get();

    static void set_level(spdlog::level::level_enum level);

    /**
     * @brief Parse "trace".."critical" / "off"; throws std::runtime_error otherwise
     */
    static spdlog::level::level_enum parse_level(const std::string& name);

    static void shutdown();

private:
    // Caller holds the init lock.
    static void create_locked(const std::string& name, spdlog::level::level_enum level);

    static std::shared_ptr<spdlog::logger> logger_;
};

#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(Logger::get(), __VA_ARGS__)
