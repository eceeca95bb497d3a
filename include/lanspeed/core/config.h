// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_CORE_CONFIG_H_
#define LANSPEED_CORE_CONFIG_H_

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <string>

namespace lanspeed {

// Read-only tuning shared by the server and the client.
struct Config {
  // Discovery
  uint16_t discovery_port = 13117;
  std::string broadcast_address = "255.255.255.255";
  std::chrono::milliseconds offer_interval{1000};
  std::chrono::milliseconds discovery_timeout{1000};  // listener poll tick

  // UDP
  size_t udp_buffer_size = 65507;                     // max UDP datagram
  std::chrono::milliseconds udp_receive_timeout{2000};  // silence ends a stream
  size_t segment_size = 1024;
  std::chrono::microseconds segment_delay{100};

  // TCP
  size_t tcp_chunk_size = 4096;

  // Limits
  uint64_t max_file_size = 10ULL * 1024 * 1024 * 1024;
  int max_connections = 100;  // per protocol, per test
  size_t tcp_workers = 50;
  size_t udp_workers = 50;
};

}

#endif
