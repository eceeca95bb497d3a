// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include "lanspeed/server/udp_sender.h"

#include <thread>

#include "lanspeed/core/message.h"

namespace lanspeed {

UdpSender::UdpSender(const Config& config, Logger& logger, asio::ip::udp::socket& socket)
  : config_(config),
    logger_(logger),
    socket_(socket),
    filler_(config.segment_size, 'a') {}

uint64_t UdpSender::HandleRequest(const std::vector<uint8_t>& datagram,
                                  const asio::ip::udp::endpoint& requester) {
  const std::string peer = requester.address().to_string() + ":" + std::to_string(requester.port());

  const std::optional<uint64_t> file_size = DecodeRequest(datagram);
  if (!file_size) {
    logger_.Warning("[UDP] Invalid request from " + peer + ".");
    return 0;
  }

  const uint64_t total_segments = SegmentCount(*file_size, filler_.size());
  logger_.Info("[UDP] Handling UDP request from " + peer + " for " + std::to_string(*file_size)
               + " bytes (" + std::to_string(total_segments) + " segments).");

  uint64_t segment = 1;
  try {
    for (; segment <= total_segments; segment++) {
      const std::vector<uint8_t> packet = EncodePayload(total_segments, segment, filler_);
      socket_.send_to(asio::buffer(packet), requester);
      if (config_.segment_delay.count() > 0) {
        std::this_thread::sleep_for(config_.segment_delay);
      }
    }
  } catch (const std::exception& e) {
    logger_.Error("[UDP] Error handling UDP request from " + peer + " at segment "
                  + std::to_string(segment) + ": " + e.what());
    return segment - 1;
  }

  logger_.Info("[UDP] Sent " + std::to_string(total_segments) + " segments to " + peer + ".");
  return total_segments;
}

}
