// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_SERVER_UDP_SENDER_H_
#define LANSPEED_SERVER_UDP_SENDER_H_

#include <asio.hpp>
#include <vector>

#include "lanspeed/core/config.h"
#include "lanspeed/core/logger.h"

namespace lanspeed {

// Answers one Request datagram with a burst of Payload segments.
// Several senders may share the server socket at once; each send is a single
// datagram, so no locking is done around it.
class UdpSender {
public:
  UdpSender(const Config& config, Logger& logger, asio::ip::udp::socket& socket);

  // Every segment carries a full segment_size filler block, including the
  // last one, so the bytes sent may exceed the requested size.
  // @return segments sent, 0 for an invalid request
  uint64_t HandleRequest(const std::vector<uint8_t>& datagram,
                         const asio::ip::udp::endpoint& requester);

private:
  const Config& config_;
  Logger& logger_;
  asio::ip::udp::socket& socket_;
  const std::vector<uint8_t> filler_;
};

}

#endif
