// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_SERVER_OFFER_BROADCASTER_H_
#define LANSPEED_SERVER_OFFER_BROADCASTER_H_

#include <asio.hpp>
#include <atomic>
#include <vector>

#include "lanspeed/core/config.h"
#include "lanspeed/core/logger.h"

namespace lanspeed {

// Announces the server's ports every offer_interval.
class OfferBroadcaster {
public:
  OfferBroadcaster(const Config& config, Logger& logger,
                   const uint16_t udp_port, const uint16_t tcp_port);
  ~OfferBroadcaster();

  // It will block thread
  void Start();
  void Stop();

  size_t GetSentCount() const;
  size_t GetErrorCount() const;

private:
  void __Broadcast();
  void __ScheduleNext();

private:
  const Config& config_;
  Logger& logger_;
  const uint16_t UDP_PORT;
  const uint16_t TCP_PORT;
  // Ports never change for the life of the process, so the offer is built once.
  const std::vector<uint8_t> offer_;

  asio::io_context io_context_;
  asio::ip::udp::socket socket_;
  asio::ip::udp::endpoint target_;
  asio::steady_timer interval_timer_;

  std::atomic<size_t> sent_count_ = 0;
  std::atomic<size_t> error_count_ = 0;
};

}

#endif
