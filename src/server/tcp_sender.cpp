// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include "lanspeed/server/tcp_sender.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace lanspeed {

TcpSender::TcpSender(const Config& config, Logger& logger)
  : logger_(logger),
    filler_(std::max<size_t>(config.tcp_chunk_size, 1), 'a') {}

uint64_t TcpSender::Send(asio::ip::tcp::socket& socket, const uint64_t file_size) {
  std::string peer = "unknown";
  uint64_t bytes_sent = 0;
  try {
    peer = socket.remote_endpoint().address().to_string();
    logger_.Info("[TCP] Handling client " + peer + " for " + std::to_string(file_size) + " bytes.");

    const auto start = std::chrono::steady_clock::now();
    while (bytes_sent < file_size) {
      const size_t chunk = static_cast<size_t>(
        std::min<uint64_t>(filler_.size(), file_size - bytes_sent));
      asio::write(socket, asio::buffer(filler_.data(), chunk));
      bytes_sent += chunk;
    }
    const double seconds = std::chrono::duration<double>(
      std::chrono::steady_clock::now() - start).count();

    std::ostringstream message;
    message << std::fixed << std::setprecision(2)
            << "[TCP] Sent " << bytes_sent << " bytes to " << peer
            << " in " << seconds << " seconds";
    if (seconds > 0) {
      message << " at " << (bytes_sent * 8.0 / seconds) << " bps";
    }
    logger_.Info(message.str());
  } catch (const std::exception& e) {
    logger_.Error("[TCP] Error with client " + peer + " after " + std::to_string(bytes_sent)
                  + " bytes: " + e.what());
  }

  std::error_code ignored;
  socket.shutdown(asio::ip::tcp::socket::shutdown_send, ignored);
  socket.close(ignored);
  logger_.Info("[TCP] Connection with " + peer + " closed.");
  return bytes_sent;
}

}
