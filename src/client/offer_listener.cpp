// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include "lanspeed/client/offer_listener.h"

#include "lanspeed/core/message.h"
#include "lanspeed/core/timed_receive.h"

namespace lanspeed {

std::optional<ServerEndpoint> ClaimOffer(OfferQueue& offers, TransferState& state,
                                         const std::chrono::milliseconds timeout) {
  std::optional<ServerEndpoint> offer = offers.wait_pop(timeout);
  if (offer) {
    state.SetActive(true);
    offers.clear();
  }
  return offer;
}

OfferListener::OfferListener(const Config& config, Logger& logger,
                             const TransferState& state, OfferQueue& offers)
: config_(config),
  logger_(logger),
  state_(state),
  offers_(offers),
  socket_(io_context_),
  recv_buffer_(config.udp_buffer_size) {
  try {
    socket_.open(asio::ip::udp::v4());
    socket_.set_option(asio::socket_base::reuse_address(true));
#ifdef SO_REUSEPORT
    socket_.set_option(asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>(true));
#endif
    socket_.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), config.discovery_port));
  } catch (const std::exception& e) {
    logger_.Error(std::string("Error initializing OfferListener: ") + e.what());
    throw;
  }
}

OfferListener::~OfferListener() {
  Stop();
}

void OfferListener::Start() {
  logger_.Info("[Offer] Listening for offers on port " + std::to_string(LocalPort()));

  asio::ip::udp::endpoint sender_endpoint;
  while (running_) {
    std::error_code error;
    const size_t len = ReceiveFrom(io_context_, socket_, asio::buffer(recv_buffer_),
                                   sender_endpoint, config_.discovery_timeout, error);
    if (error == asio::error::timed_out) {
      continue;
    }
    if (error) {
      logger_.Error("[Offer] Receive error(" + std::to_string(error.value()) + "): "
                    + error.message());
      continue;
    }
    __HandleDatagram(sender_endpoint, len);
  }
  logger_.Info("[Offer] Listener stopped");
}

void OfferListener::Stop() {
  running_ = false;
}

uint16_t OfferListener::LocalPort() const {
  std::error_code error;
  const auto endpoint = socket_.local_endpoint(error);
  return error ? 0 : endpoint.port();
}

size_t OfferListener::GetDroppedCount() const {
  return dropped_count_;
}

void OfferListener::__HandleDatagram(const asio::ip::udp::endpoint& sender_endpoint,
                                     const size_t size) {
  const std::optional<Offer> offer = DecodeOffer(recv_buffer_.data(), size);
  if (!offer) {
    logger_.Debug("[Offer] Ignored " + std::to_string(size) + " byte datagram from "
                  + sender_endpoint.address().to_string());
    return;
  }

  const std::string address = sender_endpoint.address().to_string();
  if (state_.IsActive()) {
    dropped_count_++;
    logger_.Debug("[Offer] Transfer in progress, dropped offer from " + address);
    return;
  }

  offers_.push(ServerEndpoint{address, offer->udp_port, offer->tcp_port});
  logger_.Info("[Offer] Received offer from " + address + " (UDP:"
               + std::to_string(offer->udp_port) + ", TCP:"
               + std::to_string(offer->tcp_port) + ")");
}

}
