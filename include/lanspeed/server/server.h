// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_SERVER_SERVER_H_
#define LANSPEED_SERVER_SERVER_H_

#include <asio.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "lanspeed/core/config.h"
#include "lanspeed/core/logger.h"
#include "lanspeed/core/worker_pool.h"
#include "lanspeed/server/offer_broadcaster.h"
#include "lanspeed/server/tcp_sender.h"
#include "lanspeed/server/udp_sender.h"

namespace lanspeed {

// Accepts TCP connections and UDP requests and hands them to bounded worker
// pools, while an OfferBroadcaster announces the two ports. TCP and UDP are
// driven by separate io_contexts so a saturated pool only stalls its own side.
class Server {
public:
  // Port 0 lets the OS pick; see TcpPort() / UdpPort().
  // Throws std::system_error if either port cannot be bound.
  Server(const Config& config, Logger& logger,
         const uint16_t tcp_port, const uint16_t udp_port);
  ~Server();

  // It will block thread
  void Start();
  // Also wakes a dispatch blocked on a saturated pool.
  void Stop();

  uint16_t TcpPort() const;
  uint16_t UdpPort() const;

  // "<digits>" optionally surrounded by whitespace, else empty.
  static std::optional<uint64_t> ParseRequestLine(const std::string& line);

private:
  void __Accept();
  void __ReadRequestLine(std::shared_ptr<asio::ip::tcp::socket> socket);
  void __ReceiveRequest();

private:
  Logger& logger_;
  std::atomic_bool running_ = true;

  asio::io_context io_context_;
  asio::io_context udp_io_context_;
  asio::ip::tcp::acceptor acceptor_;
  asio::ip::udp::socket udp_socket_;
  asio::ip::udp::endpoint remote_endpoint_;
  std::vector<uint8_t> recv_buffer_;

  TcpSender tcp_sender_;
  UdpSender udp_sender_;
  std::unique_ptr<OfferBroadcaster> broadcaster_;
  std::thread broadcaster_thread_;
  std::thread udp_thread_;

  // Declared last: tasks still running reference the members above.
  WorkerPool tcp_workers_;
  WorkerPool udp_workers_;
};

}

#endif
