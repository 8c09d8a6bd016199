// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace discofill {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to per-component loggers throughout the engine.
 *
 * Thread-safety: All methods are thread-safe. State is guarded by a
 * single mutex; GetLogger() auto-initializes with defaults on first use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical)
   * @param log_to_file If true, log to file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Multiple calls are safe; only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "discofill.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (transfer, search, catalog, app, default)
   *
   * Unknown names fall back to the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (transfer, search, catalog, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);
};

} // namespace util
} // namespace discofill

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  discofill::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  discofill::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  discofill::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  discofill::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  discofill::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  discofill::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_XFER_TRACE(...)                                                    \
  discofill::util::LogManager::GetLogger("transfer")->trace(__VA_ARGS__)
#define LOG_XFER_DEBUG(...)                                                    \
  discofill::util::LogManager::GetLogger("transfer")->debug(__VA_ARGS__)
#define LOG_XFER_INFO(...)                                                     \
  discofill::util::LogManager::GetLogger("transfer")->info(__VA_ARGS__)
#define LOG_XFER_WARN(...)                                                     \
  discofill::util::LogManager::GetLogger("transfer")->warn(__VA_ARGS__)
#define LOG_XFER_ERROR(...)                                                    \
  discofill::util::LogManager::GetLogger("transfer")->error(__VA_ARGS__)

#define LOG_SEARCH_TRACE(...)                                                  \
  discofill::util::LogManager::GetLogger("search")->trace(__VA_ARGS__)
#define LOG_SEARCH_DEBUG(...)                                                  \
  discofill::util::LogManager::GetLogger("search")->debug(__VA_ARGS__)
#define LOG_SEARCH_INFO(...)                                                   \
  discofill::util::LogManager::GetLogger("search")->info(__VA_ARGS__)
#define LOG_SEARCH_WARN(...)                                                   \
  discofill::util::LogManager::GetLogger("search")->warn(__VA_ARGS__)
#define LOG_SEARCH_ERROR(...)                                                  \
  discofill::util::LogManager::GetLogger("search")->error(__VA_ARGS__)

#define LOG_CATALOG_TRACE(...)                                                 \
  discofill::util::LogManager::GetLogger("catalog")->trace(__VA_ARGS__)
#define LOG_CATALOG_DEBUG(...)                                                 \
  discofill::util::LogManager::GetLogger("catalog")->debug(__VA_ARGS__)
#define LOG_CATALOG_INFO(...)                                                  \
  discofill::util::LogManager::GetLogger("catalog")->info(__VA_ARGS__)
#define LOG_CATALOG_WARN(...)                                                  \
  discofill::util::LogManager::GetLogger("catalog")->warn(__VA_ARGS__)
#define LOG_CATALOG_ERROR(...)                                                 \
  discofill::util::LogManager::GetLogger("catalog")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  discofill::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  discofill::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  discofill::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
