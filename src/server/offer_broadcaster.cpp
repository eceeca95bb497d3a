// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include "lanspeed/server/offer_broadcaster.h"

#include "lanspeed/core/message.h"

namespace lanspeed {

OfferBroadcaster::OfferBroadcaster(const Config& config, Logger& logger,
                                   const uint16_t udp_port, const uint16_t tcp_port)
: config_(config),
  logger_(logger),
  UDP_PORT(udp_port),
  TCP_PORT(tcp_port),
  offer_(EncodeOffer(udp_port, tcp_port)),
  socket_(io_context_),
  interval_timer_(io_context_) {
  try {
    target_ = asio::ip::udp::endpoint(
      asio::ip::make_address(config.broadcast_address), config.discovery_port);
    socket_.open(asio::ip::udp::v4());
    socket_.set_option(asio::socket_base::broadcast(true));
  } catch (const std::exception& e) {
    logger_.Error(std::string("OfferBroadcaster construction failed: ") + e.what());
    throw;
  }
}

OfferBroadcaster::~OfferBroadcaster() {
  Stop();
}

void OfferBroadcaster::Start() {
  __Broadcast();
  io_context_.run();
}

void OfferBroadcaster::Stop() {
  io_context_.stop();
}

size_t OfferBroadcaster::GetSentCount() const {
  return sent_count_;
}

size_t OfferBroadcaster::GetErrorCount() const {
  return error_count_;
}

void OfferBroadcaster::__Broadcast() {
  std::error_code error;
  socket_.send_to(asio::buffer(offer_), target_, 0, error);
  if (error) {
    error_count_++;
    logger_.Error("[Offer] Error broadcasting offer(" + std::to_string(error.value()) + "): "
                  + error.message());
  } else {
    sent_count_++;
    logger_.Debug("[Offer] Broadcasted offer message (TCP:" + std::to_string(TCP_PORT)
                  + ", UDP:" + std::to_string(UDP_PORT) + ").");
  }
  __ScheduleNext();
}

void OfferBroadcaster::__ScheduleNext() {
  interval_timer_.expires_after(config_.offer_interval);
  interval_timer_.async_wait([this](const std::error_code& error) {
    if (error) {
      if (error != asio::error::operation_aborted) {
        logger_.Error("[Offer] Interval timer error(" + std::to_string(error.value()) + "): "
                      + error.message());
      }
      return;
    }
    __Broadcast();
  });
}

}
