// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_CLIENT_OFFER_LISTENER_H_
#define LANSPEED_CLIENT_OFFER_LISTENER_H_

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <optional>
#include <vector>

#include "lanspeed/core/concurrent_queue.h"
#include "lanspeed/core/config.h"
#include "lanspeed/core/logger.h"
#include "lanspeed/core/transfer.h"
#include "lanspeed/core/transfer_state.h"

namespace lanspeed {

using OfferQueue = ConcurrentQueue<ServerEndpoint>;

// Waits up to `timeout` for an offer. On success marks `state` active and
// discards the offers queued behind it, which may come from servers that have
// since gone away.
std::optional<ServerEndpoint> ClaimOffer(OfferQueue& offers, TransferState& state,
                                         const std::chrono::milliseconds timeout);

class OfferListener {
public:
  // Binds the discovery port with address reuse, so several clients can share
  // one host. Throws std::system_error if the port cannot be bound.
  OfferListener(const Config& config, Logger& logger,
                const TransferState& state, OfferQueue& offers);
  ~OfferListener();

  // It will block thread
  void Start();
  // Start() returns within one discovery_timeout tick.
  void Stop();

  uint16_t LocalPort() const;
  size_t GetDroppedCount() const;

private:
  void __HandleDatagram(const asio::ip::udp::endpoint& sender_endpoint, const size_t size);

private:
  const Config& config_;
  Logger& logger_;
  const TransferState& state_;
  OfferQueue& offers_;

  // Set from construction so a Stop() racing ahead of Start() is not lost.
  std::atomic_bool running_ = true;
  asio::io_context io_context_;
  asio::ip::udp::socket socket_;
  std::vector<uint8_t> recv_buffer_;
  std::atomic<size_t> dropped_count_ = 0;
};

}

#endif
