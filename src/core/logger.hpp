#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace hilal::core
{
    /// @brief Sink settings for Logger::init().
    struct LoggerConfig
    {
        std::string log_file = "hilal.log";
        spdlog::level::level_enum console_level = spdlog::level::info;
        spdlog::level::level_enum file_level = spdlog::level::trace;
    };

    /// @brief Centralized logging facility for Hilal.
    ///
    /// Provides two separate loggers:
    /// - **HILAL** (core): ephemeris, visibility, grid search, worker pools
    /// - **APP**: command-line tool, calendar progress, user-facing messages
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// Must be called once at startup before any HLL_ macros are used.
        static void init(const LoggerConfig& config = {});

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the engine-internal logger ("HILAL").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace hilal::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define HLL_CORE_TRACE(...)    ::hilal::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define HLL_CORE_DEBUG(...)    ::hilal::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define HLL_CORE_INFO(...)     ::hilal::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define HLL_CORE_WARN(...)     ::hilal::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define HLL_CORE_ERROR(...)    ::hilal::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define HLL_CORE_CRITICAL(...) ::hilal::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define HLL_TRACE(...)         ::hilal::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define HLL_INFO(...)          ::hilal::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define HLL_WARN(...)          ::hilal::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define HLL_ERROR(...)         ::hilal::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define HLL_CRITICAL(...)      ::hilal::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
