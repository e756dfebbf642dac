/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for chatrelay (loghelper-compatible interface).
 * Provides CHATRELAY_LOG_DEBUG, CHATRELAY_LOG_INFO, CHATRELAY_LOG_WARN,
 * CHATRELAY_LOG_ERROR macros.
 */

#ifndef CHATRELAY_LOG_HPP_
#define CHATRELAY_LOG_HPP_

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace chatrelay {

// Process-wide logger. Handler threads log concurrently, so every record is
// written under one mutex to keep lines whole.
class Logger {
 public:
  enum class Level { kDebug = 0, kInfo, kWarn, kError };

  static void set_level(Level level) { min_level().store(level, std::memory_order_relaxed); }

  static Level level() { return min_level().load(std::memory_order_relaxed); }

  static bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(min_level().load(std::memory_order_relaxed));
  }

  static void log(Level level, const std::string& msg) {
    if (!enabled(level))
      return;
    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

 private:
  static std::atomic<Level>& min_level() {
    static std::atomic<Level> level{Level::kInfo};
    return level;
  }

  static std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
  }
};

// Message expressions are only evaluated when the level is enabled.
#define CHATRELAY_LOG_AT(lvl, msg)                  \
  do {                                              \
    if (::chatrelay::Logger::enabled(lvl)) {        \
      ::chatrelay::Logger::log(lvl, (msg));         \
    }                                               \
  } while (0)

#define CHATRELAY_LOG_DEBUG(msg) CHATRELAY_LOG_AT(::chatrelay::Logger::Level::kDebug, msg)
#define CHATRELAY_LOG_INFO(msg) CHATRELAY_LOG_AT(::chatrelay::Logger::Level::kInfo, msg)
#define CHATRELAY_LOG_WARN(msg) CHATRELAY_LOG_AT(::chatrelay::Logger::Level::kWarn, msg)
#define CHATRELAY_LOG_ERROR(msg) CHATRELAY_LOG_AT(::chatrelay::Logger::Level::kError, msg)

}  // namespace chatrelay

#endif  // CHATRELAY_LOG_HPP_
