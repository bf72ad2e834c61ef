// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <diven/utils/logger.hpp>
#include <stdexcept>
#include <string>

namespace diven::utils {

namespace {

constexpr const char* LOGGER_NAME = "diven";

}  // namespace

std::shared_ptr<spdlog::logger> Logger::get() {
  static std::shared_ptr<spdlog::logger> instance = []() {
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) {
      return existing;
    }

    LogLevel level = LogLevel::warn;
    std::string rejected_level;
    if (const char* env_value = std::getenv("DIVEN_LOG_LEVEL")) {
      try {
        level = level_from_string(env_value);
      } catch (const std::invalid_argument& e) {
        rejected_level = e.what();
      }
    }

    auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(_to_spdlog(level));
    if (!rejected_level.empty()) {
      logger->warn("Ignoring DIVEN_LOG_LEVEL: {}", rejected_level);
    }
    return logger;
  }();
  return instance;
}

void Logger::set_global_level(LogLevel level) {
  get()->set_level(_to_spdlog(level));
}

LogLevel Logger::get_global_level() {
  switch (get()->level()) {
    case spdlog::level::trace:
      return LogLevel::trace;
    case spdlog::level::debug:
      return LogLevel::debug;
    case spdlog::level::info:
      return LogLevel::info;
    case spdlog::level::warn:
      return LogLevel::warn;
    case spdlog::level::err:
    case spdlog::level::critical:
      return LogLevel::error;
    default:
      return LogLevel::off;
  }
}

LogLevel Logger::level_from_string(const std::string& name) {
  std::string normalized(name);
  std::transform(
      normalized.begin(), normalized.end(), normalized.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (normalized == "trace") return LogLevel::trace;
  if (normalized == "debug") return LogLevel::debug;
  if (normalized == "info") return LogLevel::info;
  if (normalized == "warn" || normalized == "warning") return LogLevel::warn;
  if (normalized == "error") return LogLevel::error;
  if (normalized == "off") return LogLevel::off;

  throw std::invalid_argument(
      "Unknown log level '" + name +
      "'. Expected one of: trace, debug, info, warn, error, off");
}

spdlog::level::level_enum Logger::_to_spdlog(LogLevel level) {
  switch (level) {
    case LogLevel::trace:
      return spdlog::level::trace;
    case LogLevel::debug:
      return spdlog::level::debug;
    case LogLevel::info:
      return spdlog::level::info;
    case LogLevel::warn:
      return spdlog::level::warn;
    case LogLevel::error:
      return spdlog::level::err;
    case LogLevel::off:
      return spdlog::level::off;
  }
  return spdlog::level::warn;
}

}  // namespace diven::utils
