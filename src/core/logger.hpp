#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core + application loggers).

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

namespace sunpath::core
{
    /// @brief Centralized logging facility for SunPath.
    ///
    /// Provides two separate loggers:
    /// - **SUNPATH** (core): ephemeris engine, event search, time zones
    /// - **APP**: report front end, configuration, user-facing messages
    ///
    /// init() from main() attaches colored console output and a rotating
    /// log file. Without init() the loggers are created console-only on
    /// first access, so library calls never create or open files.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// If the file cannot be opened the loggers stay console-only and a
        /// warning is logged. Calling init() again once the file sink is
        /// attached is a no-op.
        static void init(const std::filesystem::path& log_file = "sunpath.log");

        /// @brief Flush and tear down all loggers.
        /// Later log calls recreate console-only loggers.
        static void shutdown();

        /// @brief True when the rotating file sink is attached.
        [[nodiscard]] static bool has_file_sink();

        /// @brief Set the level of both loggers.
        static void set_level(spdlog::level::level_enum level);

        /// @brief Access the core logger ("SUNPATH").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        /// @brief Create console-only loggers unless loggers already exist.
        static void init_console();

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace sunpath::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SP_CORE_TRACE(...)    ::sunpath::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define SP_CORE_DEBUG(...)    ::sunpath::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define SP_CORE_INFO(...)     ::sunpath::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define SP_CORE_WARN(...)     ::sunpath::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define SP_CORE_ERROR(...)    ::sunpath::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define SP_CORE_CRITICAL(...) ::sunpath::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define SP_TRACE(...)         ::sunpath::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define SP_DEBUG(...)         ::sunpath::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define SP_INFO(...)          ::sunpath::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define SP_WARN(...)          ::sunpath::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define SP_ERROR(...)         ::sunpath::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define SP_CRITICAL(...)      ::sunpath::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
