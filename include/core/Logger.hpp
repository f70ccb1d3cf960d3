/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <functional>
#include <mutex>
#include <string>

namespace AuraEngine {

/**
 * @brief Record severity
 * Release builds keep CRITICAL and ERROR_LEVEL only. The _LEVEL suffixes
 * avoid clashes with platform ERROR/DEBUG macros.
 */
enum class LogLevel : uint8_t {
  CRITICAL = 0,
  ERROR_LEVEL = 1,
  WARNING = 2,
  INFO = 3,
  DEBUG_LEVEL = 4
};

/**
 * @brief Optional diagnostic sink notified for every emitted record.
 * The sink is observational only: whether one is installed never changes
 * what the simulation does.
 */
using LogSink = std::function<void(LogLevel level, const char *system,
                                   const std::string &message)>;

class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;
  static LogSink s_sink;
  static thread_local bool s_inSink;

  // Clears the re-entry flag however the sink call ends
  struct SinkScope {
    SinkScope() { s_inSink = true; }
    ~SinkScope() { s_inSink = false; }
    SinkScope(const SinkScope &) = delete;
    SinkScope &operator=(const SinkScope &) = delete;
  };

  /**
   * @brief Hands a record to the installed sink with s_logMutex released
   * Records the sink emits itself are not fed back into it, and a sink that
   * throws is reported on stderr instead of unwinding into the caller.
   */
  static void dispatchToSink(LogLevel level, const char *system,
                             const std::string &message) {
    if (s_inSink) {
      return;
    }
    LogSink sink;
    {
      std::lock_guard<std::mutex> lock(s_logMutex);
      sink = s_sink;
    }
    if (!sink) {
      return;
    }

    SinkScope scope;
    try {
      sink(level, system, message);
    } catch (const std::exception &e) {
      fprintf(stderr, "Aura Engine - [Logger] ERROR: log sink threw: %s\n",
              e.what());
    }
  }

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void SetSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(s_logMutex);
    s_sink = std::move(sink);
  }

  static void ClearSink() {
    std::lock_guard<std::mutex> lock(s_logMutex);
    s_sink = nullptr;
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

#ifdef DEBUG
  // Debug builds print everything to the console
  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    {
      std::lock_guard<std::mutex> lock(s_logMutex);
      printf("Aura Engine - [%s] %s: %s\n", system, getLevelString(level),
             message.c_str());
      fflush(stdout);
    }
    dispatchToSink(level, system, message);
  }
  static void Log(LogLevel level, const char *system, const char *message) {
    Log(level, system, std::string(message));
  }
#else
  // Release builds write CRITICAL/ERROR to a log file (see Logger.cpp)
  static void Log(LogLevel level, const char *system,
                  const std::string &message);
  static void Log(LogLevel level, const char *system, const char *message);
#endif
};

#ifdef DEBUG
#define AURA_CRITICAL(system, msg)                                             \
  AuraEngine::Logger::Log(AuraEngine::LogLevel::CRITICAL, system, msg)
#define AURA_ERROR(system, msg)                                                \
  AuraEngine::Logger::Log(AuraEngine::LogLevel::ERROR_LEVEL, system, msg)
#define AURA_WARN(system, msg)                                                 \
  AuraEngine::Logger::Log(AuraEngine::LogLevel::WARNING, system, msg)
#define AURA_INFO(system, msg)                                                 \
  AuraEngine::Logger::Log(AuraEngine::LogLevel::INFO, system, msg)
#define AURA_DEBUG(system, msg)                                                \
  AuraEngine::Logger::Log(AuraEngine::LogLevel::DEBUG_LEVEL, system, msg)
#else
#define AURA_CRITICAL(system, msg)                                             \
  AuraEngine::Logger::Log(AuraEngine::LogLevel::CRITICAL, system, msg)
#define AURA_ERROR(system, msg)                                                \
  AuraEngine::Logger::Log(AuraEngine::LogLevel::ERROR_LEVEL, system, msg)
#define AURA_WARN(system, msg) ((void)0)  // Zero overhead
#define AURA_INFO(system, msg) ((void)0)  // Zero overhead
#define AURA_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};
inline LogSink Logger::s_sink{};
inline thread_local bool Logger::s_inSink{false};

// Convenience macros for each particle subsystem

#define PARTICLE_CRITICAL(msg) AURA_CRITICAL("ParticleSystem", msg)
#define PARTICLE_ERROR(msg) AURA_ERROR("ParticleSystem", msg)
#define PARTICLE_WARN(msg) AURA_WARN("ParticleSystem", msg)
#define PARTICLE_INFO(msg) AURA_INFO("ParticleSystem", msg)
#define PARTICLE_DEBUG(msg) AURA_DEBUG("ParticleSystem", msg)

#define POOL_CRITICAL(msg) AURA_CRITICAL("ParticlePool", msg)
#define POOL_ERROR(msg) AURA_ERROR("ParticlePool", msg)
#define POOL_WARN(msg) AURA_WARN("ParticlePool", msg)
#define POOL_INFO(msg) AURA_INFO("ParticlePool", msg)
#define POOL_DEBUG(msg) AURA_DEBUG("ParticlePool", msg)

#define SPAWNER_CRITICAL(msg) AURA_CRITICAL("ParticleSpawner", msg)
#define SPAWNER_ERROR(msg) AURA_ERROR("ParticleSpawner", msg)
#define SPAWNER_WARN(msg) AURA_WARN("ParticleSpawner", msg)
#define SPAWNER_INFO(msg) AURA_INFO("ParticleSpawner", msg)
#define SPAWNER_DEBUG(msg) AURA_DEBUG("ParticleSpawner", msg)

#define RENDERER_CRITICAL(msg) AURA_CRITICAL("ParticleRenderer", msg)
#define RENDERER_ERROR(msg) AURA_ERROR("ParticleRenderer", msg)
#define RENDERER_WARN(msg) AURA_WARN("ParticleRenderer", msg)
#define RENDERER_INFO(msg) AURA_INFO("ParticleRenderer", msg)
#define RENDERER_DEBUG(msg) AURA_DEBUG("ParticleRenderer", msg)

// Benchmark mode silences every record, sink included
#define AURA_ENABLE_BENCHMARK_MODE() AuraEngine::Logger::SetBenchmarkMode(true)
#define AURA_DISABLE_BENCHMARK_MODE()                                          \
  AuraEngine::Logger::SetBenchmarkMode(false)

} // namespace AuraEngine

#endif // LOGGER_HPP
