/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PONG_LOGGER_HPP
#define PONG_LOGGER_HPP

#include <atomic> // IWYU pragma: keep - benchmark mode flag
#include <cstdint> // IWYU pragma: keep - uint8_t log level
#include <cstdio> // IWYU pragma: keep - printf() and fflush()
#include <mutex> // IWYU pragma: keep - serialised output
#include <string> // IWYU pragma: keep - std::string messages in macros

namespace PongEngine {
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
    printf("Pong Engine - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
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

#define PONG_CRITICAL(system, msg)                                             \
  PongEngine::Logger::Log(PongEngine::LogLevel::CRITICAL, system, msg)
#define PONG_ERROR(system, msg)                                                \
  PongEngine::Logger::Log(PongEngine::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define PONG_WARN(system, msg)                                                 \
  PongEngine::Logger::Log(PongEngine::LogLevel::WARNING, system, msg)
#define PONG_INFO(system, msg)                                                 \
  PongEngine::Logger::Log(PongEngine::LogLevel::INFO, system, msg)
#define PONG_DEBUG(system, msg)                                                \
  PongEngine::Logger::Log(PongEngine::LogLevel::DEBUG_LEVEL, system, msg)
#else
// Release builds - warnings and below compile away
#define PONG_WARN(system, msg) ((void)0)
#define PONG_INFO(system, msg) ((void)0)
#define PONG_DEBUG(system, msg) ((void)0)
#endif

// Core Systems
#define GAMELOOP_CRITICAL(msg) PONG_CRITICAL("GameLoop", msg)
#define GAMELOOP_ERROR(msg) PONG_ERROR("GameLoop", msg)
#define GAMELOOP_WARN(msg) PONG_WARN("GameLoop", msg)
#define GAMELOOP_INFO(msg) PONG_INFO("GameLoop", msg)
#define GAMELOOP_DEBUG(msg) PONG_DEBUG("GameLoop", msg)

// Entities
#define BALL_CRITICAL(msg) PONG_CRITICAL("Ball", msg)
#define BALL_ERROR(msg) PONG_ERROR("Ball", msg)
#define BALL_WARN(msg) PONG_WARN("Ball", msg)
#define BALL_INFO(msg) PONG_INFO("Ball", msg)
#define BALL_DEBUG(msg) PONG_DEBUG("Ball", msg)

#define PADDLE_CRITICAL(msg) PONG_CRITICAL("Paddle", msg)
#define PADDLE_ERROR(msg) PONG_ERROR("Paddle", msg)
#define PADDLE_WARN(msg) PONG_WARN("Paddle", msg)
#define PADDLE_INFO(msg) PONG_INFO("Paddle", msg)
#define PADDLE_DEBUG(msg) PONG_DEBUG("Paddle", msg)

// Collision and Physics
#define COLLISION_CRITICAL(msg) PONG_CRITICAL("CollisionManager", msg)
#define COLLISION_ERROR(msg) PONG_ERROR("CollisionManager", msg)
#define COLLISION_WARN(msg) PONG_WARN("CollisionManager", msg)
#define COLLISION_INFO(msg) PONG_INFO("CollisionManager", msg)
#define COLLISION_DEBUG(msg) PONG_DEBUG("CollisionManager", msg)

#define PHYSICS_CRITICAL(msg) PONG_CRITICAL("PhysicsManager", msg)
#define PHYSICS_ERROR(msg) PONG_ERROR("PhysicsManager", msg)
#define PHYSICS_WARN(msg) PONG_WARN("PhysicsManager", msg)
#define PHYSICS_INFO(msg) PONG_INFO("PhysicsManager", msg)
#define PHYSICS_DEBUG(msg) PONG_DEBUG("PhysicsManager", msg)

// Match flow
#define PAUSE_CRITICAL(msg) PONG_CRITICAL("PauseManager", msg)
#define PAUSE_ERROR(msg) PONG_ERROR("PauseManager", msg)
#define PAUSE_WARN(msg) PONG_WARN("PauseManager", msg)
#define PAUSE_INFO(msg) PONG_INFO("PauseManager", msg)
#define PAUSE_DEBUG(msg) PONG_DEBUG("PauseManager", msg)

#define RESIZE_CRITICAL(msg) PONG_CRITICAL("ResizeManager", msg)
#define RESIZE_ERROR(msg) PONG_ERROR("ResizeManager", msg)
#define RESIZE_WARN(msg) PONG_WARN("ResizeManager", msg)
#define RESIZE_INFO(msg) PONG_INFO("ResizeManager", msg)
#define RESIZE_DEBUG(msg) PONG_DEBUG("ResizeManager", msg)

// Configuration and persistence
#define SETTINGS_CRITICAL(msg) PONG_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) PONG_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) PONG_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) PONG_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) PONG_DEBUG("SettingsManager", msg)

#define JSON_ERROR(msg) PONG_ERROR("JsonReader", msg)
#define JSON_WARN(msg) PONG_WARN("JsonReader", msg)

// Benchmark mode convenience macros
#define PONG_ENABLE_BENCHMARK_MODE() PongEngine::Logger::SetBenchmarkMode(true)
#define PONG_DISABLE_BENCHMARK_MODE()                                          \
  PongEngine::Logger::SetBenchmarkMode(false)

} // namespace PongEngine

#endif // PONG_LOGGER_HPP
