// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_CORE_LOGGER_H_
#define LANSPEED_CORE_LOGGER_H_

#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace lanspeed {

class Logger {
public:
  enum Level {
    DEBUG,
    INFO,
    WARNING,
    ERROR
  };

public:
  // Writes to `out`, which must outlive the logger.
  Logger(const std::string& name, std::ostream& out = std::cerr,
         const Level min_level = INFO);

  // Appends to the file at `path`.
  // Throws std::runtime_error if the file cannot be opened.
  Logger(const std::string& name, const std::string& path,
         const Level min_level = INFO);

  void Log(const Level level, const std::string& message);

  void Debug(const std::string& message) { Log(DEBUG, message); }
  void Info(const std::string& message) { Log(INFO, message); }
  void Warning(const std::string& message) { Log(WARNING, message); }
  void Error(const std::string& message) { Log(ERROR, message); }

  void SetLevel(const Level level);
  Level GetLevel() const;

  static const char* ToString(const Level level);

public:
  const std::string NAME;

private:
  std::ofstream file_;
  std::ostream* out_;
  Level min_level_;
  mutable std::mutex lock_;
};

}

#endif
