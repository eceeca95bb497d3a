// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_CORE_CONSOLE_H_
#define LANSPEED_CORE_CONSOLE_H_

#include <string>

namespace lanspeed {

// ANSI escape codes for console output
namespace Console {
  const std::string GREEN = "\033[32m";
  const std::string RED = "\033[31m";
  const std::string YELLOW = "\033[33m";
  const std::string BLUE = "\033[34m";
  const std::string MAGENTA = "\033[35m";
  const std::string CYAN = "\033[36m";
  const std::string RESET = "\033[0m";
  const std::string BOLD = "\033[1m";
}

}

#endif
