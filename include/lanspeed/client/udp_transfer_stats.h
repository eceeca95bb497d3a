// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_CLIENT_UDP_TRANSFER_STATS_H_
#define LANSPEED_CLIENT_UDP_TRANSFER_STATS_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_set>

namespace lanspeed {

// Turns Payload arrivals of one UDP transfer into loss and jitter figures.
// Not thread-safe; owned by a single transfer unit.
class UdpTransferStats {
public:
  using Clock = std::chrono::steady_clock;

  // @return true if `current_segment` was seen for the first time and counted.
  bool AddSegment(const uint64_t total_segments, const uint64_t current_segment,
                  const size_t payload_size, const Clock::time_point arrival);

  // Segment count announced by the first valid Payload, if any arrived.
  std::optional<uint64_t> TotalSegments() const { return total_segments_; }
  uint64_t UniqueSegments() const { return seen_.size(); }
  uint64_t BytesReceived() const { return bytes_received_; }
  uint64_t PacketsReceived() const { return packets_received_; }

  // 100 when nothing arrived.
  double LossPercentage() const;

  // max(gap) - min(gap) over inter-arrival gaps, 0 with fewer than two packets.
  double JitterSeconds() const;

  std::optional<Clock::time_point> LastArrival() const { return last_arrival_; }

private:
  std::optional<uint64_t> total_segments_;
  std::unordered_set<uint64_t> seen_;
  uint64_t bytes_received_ = 0;
  uint64_t packets_received_ = 0;
  std::optional<Clock::time_point> last_arrival_;
  std::optional<Clock::duration> min_gap_;
  std::optional<Clock::duration> max_gap_;
};

}

#endif
