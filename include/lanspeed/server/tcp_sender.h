// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_SERVER_TCP_SENDER_H_
#define LANSPEED_SERVER_TCP_SENDER_H_

#include <asio.hpp>
#include <vector>

#include "lanspeed/core/config.h"
#include "lanspeed/core/logger.h"

namespace lanspeed {

// Streams filler bytes over an accepted connection.
class TcpSender {
public:
  TcpSender(const Config& config, Logger& logger);

  // Writes exactly `file_size` bytes in tcp_chunk_size pieces, then closes
  // the socket. Errors are logged and only end this connection.
  // @return bytes actually written
  uint64_t Send(asio::ip::tcp::socket& socket, const uint64_t file_size);

private:
  Logger& logger_;
  const std::vector<uint8_t> filler_;
};

}

#endif
