/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Serializes output lines
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep
#include <cstdint> // IWYU pragma: keep
#include <cstdio> // IWYU pragma: keep
#include <mutex> // IWYU pragma: keep
#include <string> // IWYU pragma: keep

namespace Formicary {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    // Errors go to stderr so test runners keep them apart from progress output
    FILE *out = (level <= LogLevel::ERROR_LEVEL) ? stderr : stdout;
    fprintf(out, "Formicary - [%s] %s: %s\n", system, getLevelString(level),
            message);
    fflush(out);
  }

  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

#define FORMICARY_CRITICAL(system, msg)                                        \
  Formicary::Logger::Log(Formicary::LogLevel::CRITICAL, system, msg)
#define FORMICARY_ERROR(system, msg)                                           \
  Formicary::Logger::Log(Formicary::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define FORMICARY_WARN(system, msg)                                            \
  Formicary::Logger::Log(Formicary::LogLevel::WARNING, system, msg)
#define FORMICARY_INFO(system, msg)                                            \
  Formicary::Logger::Log(Formicary::LogLevel::INFO, system, msg)
#define FORMICARY_DEBUG(system, msg)                                           \
  Formicary::Logger::Log(Formicary::LogLevel::DEBUG_LEVEL, system, msg)
#else
// Release builds - message expressions are never evaluated
#define FORMICARY_WARN(system, msg) ((void)0)
#define FORMICARY_INFO(system, msg) ((void)0)
#define FORMICARY_DEBUG(system, msg) ((void)0)
#endif

} // namespace Formicary

// Convenience macros for each subsystem

#define WORLD_CRITICAL(msg) FORMICARY_CRITICAL("World", msg)
#define WORLD_ERROR(msg) FORMICARY_ERROR("World", msg)
#define WORLD_WARN(msg) FORMICARY_WARN("World", msg)
#define WORLD_INFO(msg) FORMICARY_INFO("World", msg)
#define WORLD_DEBUG(msg) FORMICARY_DEBUG("World", msg)

#define QUADTREE_ERROR(msg) FORMICARY_ERROR("Quadtree", msg)
#define QUADTREE_WARN(msg) FORMICARY_WARN("Quadtree", msg)
#define QUADTREE_INFO(msg) FORMICARY_INFO("Quadtree", msg)
#define QUADTREE_DEBUG(msg) FORMICARY_DEBUG("Quadtree", msg)

#define GRID_ERROR(msg) FORMICARY_ERROR("BitPackedGrid", msg)
#define GRID_WARN(msg) FORMICARY_WARN("BitPackedGrid", msg)
#define GRID_DEBUG(msg) FORMICARY_DEBUG("BitPackedGrid", msg)

#define SERIAL_ERROR(msg) FORMICARY_ERROR("GridSerializer", msg)
#define SERIAL_WARN(msg) FORMICARY_WARN("GridSerializer", msg)
#define SERIAL_INFO(msg) FORMICARY_INFO("GridSerializer", msg)
#define SERIAL_DEBUG(msg) FORMICARY_DEBUG("GridSerializer", msg)

#define CONFIG_ERROR(msg) FORMICARY_ERROR("WorldConfig", msg)
#define CONFIG_WARN(msg) FORMICARY_WARN("WorldConfig", msg)
#define CONFIG_INFO(msg) FORMICARY_INFO("WorldConfig", msg)

#endif // LOGGER_HPP
