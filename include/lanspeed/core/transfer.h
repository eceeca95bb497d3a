// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_CORE_TRANSFER_H_
#define LANSPEED_CORE_TRANSFER_H_

#include <cstdint>
#include <optional>
#include <string>

namespace lanspeed {

enum class Protocol : uint8_t {
  TCP,
  UDP
};

const char* ToString(const Protocol protocol);

struct ServerEndpoint {
  std::string address;
  uint16_t udp_port;
  uint16_t tcp_port;
};

struct TransferJob {
  int id;  // 1-based, creation order within one test run
  Protocol protocol;
  ServerEndpoint endpoint;
  uint64_t file_size;
};

struct TransferResult {
  enum Status {
    COMPLETED,
    SHORT,   // peer closed before file_size bytes arrived
    FAILED   // transport error; see `error`
  };

  int id = 0;
  Protocol protocol = Protocol::TCP;
  Status status = COMPLETED;
  double elapsed_seconds = 0.0;
  uint64_t bytes_transferred = 0;
  double bits_per_second = 0.0;
  std::optional<double> loss_percentage;  // UDP only
  std::optional<double> jitter_seconds;   // UDP only
  std::string error;

  bool Succeeded() const { return status == COMPLETED; }
};

// bits / seconds, or 0 when no time elapsed.
double Throughput(const uint64_t bytes, const double elapsed_seconds);

TransferResult FailedResult(const TransferJob& job, const std::string& error);

// One human readable line, e.g.
// "UDP transfer #3 finished, total time: 2.01 seconds, ..."
std::string Describe(const TransferResult& result);

}

#endif
