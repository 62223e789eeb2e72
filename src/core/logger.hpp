#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <memory>

namespace jyotish::core
{
    /// @brief Centralized logging facility for Jyotish.
    ///
    /// Provides two separate loggers:
    /// - **JYOTISH** (core): chart engine internals, reference tables, invariants
    /// - **APP**: driver program and batch orchestration
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging. Library code that logs
    /// before init() goes to spdlog's default logger.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        static void init();

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the engine-internal logger ("JYOTISH").
        [[nodiscard]] static std::shared_ptr<spdlog::logger> get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger> get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace jyotish::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define JYO_CORE_TRACE(...)    ::jyotish::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define JYO_CORE_DEBUG(...)    ::jyotish::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define JYO_CORE_INFO(...)     ::jyotish::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define JYO_CORE_WARN(...)     ::jyotish::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define JYO_CORE_ERROR(...)    ::jyotish::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define JYO_CORE_CRITICAL(...) ::jyotish::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define JYO_TRACE(...)         ::jyotish::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define JYO_INFO(...)          ::jyotish::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define JYO_WARN(...)          ::jyotish::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define JYO_ERROR(...)         ::jyotish::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define JYO_CRITICAL(...)      ::jyotish::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
