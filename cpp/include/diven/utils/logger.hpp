// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace diven::utils {

/**
 * @brief Verbosity levels understood by the DivEn logger
 */
enum class LogLevel { trace, debug, info, warn, error, off };

/**
 * @brief Access point for the library-wide spdlog logger
 *
 * All DivEn components log through a single spdlog logger named "diven"
 * writing to stderr. The initial level is read from the DIVEN_LOG_LEVEL
 * environment variable (trace, debug, info, warn, error or off) and defaults
 * to warn.
 *
 * Example:
 * @code
 * diven::utils::Logger::set_global_level(diven::utils::LogLevel::info);
 * DIVEN_LOGGER().info("Basis contains {} states", basis->get_num_states());
 * @endcode
 */
class Logger {
 public:
  /**
   * @brief Get the library logger, creating it on first use
   * @return Shared pointer to the "diven" spdlog logger
   */
  static std::shared_ptr<spdlog::logger> get();

  /**
   * @brief Set the verbosity of the library logger
   * @param level New log level
   */
  static void set_global_level(LogLevel level);

  /**
   * @brief Get the current verbosity of the library logger
   */
  static LogLevel get_global_level();

  /**
   * @brief Parse a level name such as "debug" or "WARN"
   * @param name Case-insensitive level name ("warning" is accepted for warn)
   * @return The corresponding LogLevel
   * @throws std::invalid_argument if the name is not a known level
   */
  static LogLevel level_from_string(const std::string& name);

 private:
  static spdlog::level::level_enum _to_spdlog(LogLevel level);
};

}  // namespace diven::utils

/// Reference to the library logger
#define DIVEN_LOGGER() (*::diven::utils::Logger::get())

/// Emit a trace record naming the enclosing function
#define DIVEN_LOG_TRACE_ENTERING() DIVEN_LOGGER().trace("Entering {}", __func__)
