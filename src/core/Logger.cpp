/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds log inline from Logger.hpp
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <optional>
#include <sstream>
#include <vector>

#ifndef AURA_APP_NAME
#define AURA_APP_NAME "AuraEngine"
#endif

namespace AuraEngine {
namespace {

namespace fs = std::filesystem;

constexpr size_t KEEP_LOG_FILES = 5;
constexpr std::uintmax_t MAX_LOG_BYTES = 1024 * 1024;
constexpr const char *LOG_PREFIX = "aura_";

std::tm localTime(std::time_t time) {
  std::tm result{};
#ifdef _WIN32
  localtime_s(&result, &time);
#else
  localtime_r(&time, &result);
#endif
  return result;
}

// "2025-01-31 12:00:00.123"
std::string timestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()) %
                      1000;
  const std::tm tm = localTime(std::chrono::system_clock::to_time_t(now));

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << millis.count();
  return out.str();
}

std::optional<fs::path> logDirectory() {
  char *prefPath = SDL_GetPrefPath("HammerForgedGames", AURA_APP_NAME);
  if (!prefPath) {
    return std::nullopt;
  }
  fs::path dir = fs::path(prefPath) / "logs";
  SDL_free(prefPath);

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return std::nullopt;
  }
  return dir;
}

/**
 * @brief Size-capped log file under the SDL preference path
 *
 * A new file starts on first use and whenever the current one passes
 * MAX_LOG_BYTES. Only the newest KEEP_LOG_FILES files are kept.
 */
class RotatingLogFile {
public:
  static RotatingLogFile &Instance() {
    static RotatingLogFile instance;
    return instance;
  }

  void append(LogLevel level, const char *system, const std::string &message) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_directoryResolved) {
      m_directory = logDirectory();
      m_directoryResolved = true;
    }
    if (!m_directory) {
      return; // no writable pref path; the sink still sees the record
    }
    if (!m_stream.is_open() || m_bytesWritten >= MAX_LOG_BYTES) {
      rotate();
      if (!m_stream.is_open()) {
        return;
      }
    }

    std::ostringstream line;
    line << timestamp() << " [" << Logger::getLevelString(level) << "] ["
         << system << "] " << message << '\n';
    const std::string text = line.str();
    m_stream << text;
    m_bytesWritten += text.size();

    // Errors must survive a crash
    if (level <= LogLevel::ERROR_LEVEL) {
      m_stream.flush();
    }
  }

private:
  RotatingLogFile() = default;
  ~RotatingLogFile() {
    if (m_stream.is_open()) {
      m_stream.flush();
    }
  }

  RotatingLogFile(const RotatingLogFile &) = delete;
  RotatingLogFile &operator=(const RotatingLogFile &) = delete;

  void rotate() {
    if (m_stream.is_open()) {
      m_stream.close();
    }

    const std::tm tm = localTime(std::time(nullptr));
    std::ostringstream name;
    name << LOG_PREFIX << std::put_time(&tm, "%Y%m%d_%H%M%S") << '_' << m_sequence++
         << ".log";

    m_stream.open(*m_directory / name.str(), std::ios::out | std::ios::trunc);
    m_bytesWritten = 0;
    if (m_stream.is_open()) {
      m_stream << "=== " << AURA_APP_NAME << " particle log, started "
               << timestamp() << " ===\n";
      m_stream.flush();
    }

    pruneOldFiles();
  }

  void pruneOldFiles() {
    std::error_code ec;
    std::vector<fs::directory_entry> files;
    for (const auto &entry : fs::directory_iterator(*m_directory, ec)) {
      const std::string filename = entry.path().filename().string();
      if (entry.path().extension() == ".log" && filename.starts_with(LOG_PREFIX)) {
        files.push_back(entry);
      }
    }
    if (files.size() <= KEEP_LOG_FILES) {
      return;
    }

    // Newest first; everything past the keep count goes
    std::sort(files.begin(), files.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                std::error_code ignored;
                return fs::last_write_time(a, ignored) > fs::last_write_time(b, ignored);
              });
    for (size_t i = KEEP_LOG_FILES; i < files.size(); ++i) {
      fs::remove(files[i].path(), ec);
    }
  }

  std::mutex m_mutex;
  std::ofstream m_stream;
  std::optional<fs::path> m_directory;
  bool m_directoryResolved{false};
  std::uintmax_t m_bytesWritten{0};
  unsigned m_sequence{0};
};

} // namespace

void Logger::Log(LogLevel level, const char *system, const std::string &message) {
  if (s_benchmarkMode.load(std::memory_order_relaxed)) {
    return;
  }
  RotatingLogFile::Instance().append(level, system, message);
  dispatchToSink(level, system, message);
}

void Logger::Log(LogLevel level, const char *system, const char *message) {
  Log(level, system, std::string(message));
}

} // namespace AuraEngine

#endif // ifndef DEBUG
