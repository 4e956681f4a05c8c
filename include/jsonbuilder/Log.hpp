/**
 * @file Log.hpp
 * @brief Logging through a named spdlog logger
 *
 * All jsonbuilder diagnostics go to the logger named "jsonbuilder".
 * An application that registers its own spdlog logger under that name
 * before first use gets the library's output routed there.
 */

#ifndef JSONBUILDER_LOG_HPP
#define JSONBUILDER_LOG_HPP

#include <spdlog/spdlog.h>
#include <memory>

namespace jsonbuilder {

/// Name of the logger in the spdlog registry.
constexpr const char* kLoggerName = "jsonbuilder";

/**
 * @brief Library logger, created with a stderr sink on first use
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Adjust library log verbosity
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace jsonbuilder

#define JSONBUILDER_TRACE(...) SPDLOG_LOGGER_TRACE(::jsonbuilder::logger(), __VA_ARGS__)
#define JSONBUILDER_DEBUG(...) SPDLOG_LOGGER_DEBUG(::jsonbuilder::logger(), __VA_ARGS__)
#define JSONBUILDER_INFO(...)  SPDLOG_LOGGER_INFO(::jsonbuilder::logger(), __VA_ARGS__)
#define JSONBUILDER_WARN(...)  SPDLOG_LOGGER_WARN(::jsonbuilder::logger(), __VA_ARGS__)
#define JSONBUILDER_ERROR(...) SPDLOG_LOGGER_ERROR(::jsonbuilder::logger(), __VA_ARGS__)

#endif // JSONBUILDER_LOG_HPP
