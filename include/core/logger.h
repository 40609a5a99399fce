#pragma once

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include "core/env_config.h"

/**
 * @brief Plog initialization for the admission server
 *
 * Usage:
 *   Logger::init();
 *   PLOG_INFO << "[Component] message";
 */
namespace Logger {

/**
 * @brief Map a LOG_LEVEL string to a plog severity
 */
inline plog::Severity parseSeverity(const std::string &level,
                                    plog::Severity fallback) {
  std::string upper = level;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

  if (upper == "NONE") return plog::none;
  if (upper == "FATAL") return plog::fatal;
  if (upper == "ERROR") return plog::error;
  if (upper == "WARNING" || upper == "WARN") return plog::warning;
  if (upper == "INFO") return plog::info;
  if (upper == "DEBUG") return plog::debug;
  if (upper == "VERBOSE" || upper == "TRACE") return plog::verbose;
  return fallback;
}

/**
 * @brief Initialize plog with a rolling file appender
 *
 * @param log_dir Directory for admission.log (LOG_DIR, default ./logs)
 * @param log_level Severity unless LOG_LEVEL overrides it
 * @param enable_console Whether to also log to console
 */
inline void init(const std::string &log_dir = "",
                 plog::Severity log_level = plog::info,
                 bool enable_console = true) {
  std::string log_directory =
      log_dir.empty() ? EnvConfig::getString("LOG_DIR", "./logs") : log_dir;
  int max_files = EnvConfig::getInt("LOG_MAX_FILES", 5, 1, 100);

  try {
    std::filesystem::create_directories(log_directory);
  } catch (const std::exception &e) {
    std::cerr << "Warning: Failed to create log directory '" << log_directory
              << "': " << e.what() << std::endl;
    std::cerr << "Logs will be written to current directory." << std::endl;
    log_directory = ".";
  }

  log_level =
      parseSeverity(EnvConfig::getString("LOG_LEVEL", ""), log_level);

  std::string log_file_path = log_directory;
  if (log_file_path.back() != '/') {
    log_file_path += "/";
  }
  log_file_path += "admission.log";

  const size_t max_file_size = 10 * 1024 * 1024;
  static plog::RollingFileAppender<plog::TxtFormatter> rollingFileAppender(
      log_file_path.c_str(), max_file_size, max_files);

  if (enable_console) {
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender;
    plog::init(log_level, &consoleAppender).addAppender(&rollingFileAppender);
  } else {
    plog::init(log_level, &rollingFileAppender);
  }

  PLOG_INFO << "Logger initialized: " << log_file_path << " (level "
            << plog::severityToString(log_level) << ", " << max_files
            << " files x " << (max_file_size / (1024 * 1024)) << "MB)";
}

} // namespace Logger
