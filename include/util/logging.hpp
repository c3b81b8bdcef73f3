// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace anchorsync {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the application.
 *
 * Thread-safety: All methods are thread-safe. Logger creation and
 * lookup are protected by a mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical)
   * @param log_to_file If true, log to file instead of stderr
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Multiple calls are safe; only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "anchorsync.log");

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "sync", "queue", "chain", "index")
   *
   * Auto-initializes if not initialized. Unknown components fall back to
   * the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (sync, queue, chain, index, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace anchorsync

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  anchorsync::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  anchorsync::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  anchorsync::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  anchorsync::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  anchorsync::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  anchorsync::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_SYNC_TRACE(...)                                                    \
  anchorsync::util::LogManager::GetLogger("sync")->trace(__VA_ARGS__)
#define LOG_SYNC_DEBUG(...)                                                    \
  anchorsync::util::LogManager::GetLogger("sync")->debug(__VA_ARGS__)
#define LOG_SYNC_INFO(...)                                                     \
  anchorsync::util::LogManager::GetLogger("sync")->info(__VA_ARGS__)
#define LOG_SYNC_WARN(...)                                                     \
  anchorsync::util::LogManager::GetLogger("sync")->warn(__VA_ARGS__)
#define LOG_SYNC_ERROR(...)                                                    \
  anchorsync::util::LogManager::GetLogger("sync")->error(__VA_ARGS__)

#define LOG_QUEUE_TRACE(...)                                                   \
  anchorsync::util::LogManager::GetLogger("queue")->trace(__VA_ARGS__)
#define LOG_QUEUE_DEBUG(...)                                                   \
  anchorsync::util::LogManager::GetLogger("queue")->debug(__VA_ARGS__)
#define LOG_QUEUE_INFO(...)                                                    \
  anchorsync::util::LogManager::GetLogger("queue")->info(__VA_ARGS__)
#define LOG_QUEUE_WARN(...)                                                    \
  anchorsync::util::LogManager::GetLogger("queue")->warn(__VA_ARGS__)
#define LOG_QUEUE_ERROR(...)                                                   \
  anchorsync::util::LogManager::GetLogger("queue")->error(__VA_ARGS__)

#define LOG_CHAIN_TRACE(...)                                                   \
  anchorsync::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  anchorsync::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  anchorsync::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  anchorsync::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  anchorsync::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_INDEX_TRACE(...)                                                   \
  anchorsync::util::LogManager::GetLogger("index")->trace(__VA_ARGS__)
#define LOG_INDEX_DEBUG(...)                                                   \
  anchorsync::util::LogManager::GetLogger("index")->debug(__VA_ARGS__)
#define LOG_INDEX_INFO(...)                                                    \
  anchorsync::util::LogManager::GetLogger("index")->info(__VA_ARGS__)
#define LOG_INDEX_WARN(...)                                                    \
  anchorsync::util::LogManager::GetLogger("index")->warn(__VA_ARGS__)
#define LOG_INDEX_ERROR(...)                                                   \
  anchorsync::util::LogManager::GetLogger("index")->error(__VA_ARGS__)
