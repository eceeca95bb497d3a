// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include "lanspeed/core/logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <stdexcept>

namespace lanspeed {

Logger::Logger(const std::string& name, std::ostream& out, const Level min_level)
  : NAME(name), out_(&out), min_level_(min_level) {}

Logger::Logger(const std::string& name, const std::string& path, const Level min_level)
  : NAME(name), file_(path, std::ios::app), out_(&file_), min_level_(min_level) {
  if (!file_.is_open()) {
    throw std::runtime_error("Cannot open log file: " + path);
  }
}

void Logger::Log(const Level level, const std::string& message) {
  std::lock_guard<std::mutex> lock(lock_);
  if (level < min_level_) return;

  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
    now.time_since_epoch()).count() % 1000;
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &seconds);
#else
  localtime_r(&seconds, &local);
#endif

  *out_ << std::put_time(&local, "%Y-%m-%d %H:%M:%S") 
        << ',' << std::setfill('0') << std::setw(3) << millis << std::setfill(' ')
        << " [" << NAME << "] [" << ToString(level) << "] " << message << std::endl;
}

void Logger::SetLevel(const Level level) {
  std::lock_guard<std::mutex> lock(lock_);
  min_level_ = level;
}

Logger::Level Logger::GetLevel() const {
  std::lock_guard<std::mutex> lock(lock_);
  return min_level_;
}

const char* Logger::ToString(const Level level) {
  switch (level) {
    case DEBUG:   return "DEBUG";
    case INFO:    return "INFO";
    case WARNING: return "WARNING";
    case ERROR:   return "ERROR";
    default:      return "UNKNOWN";
  }
}

}
