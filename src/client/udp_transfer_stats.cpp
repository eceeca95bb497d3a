// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include "lanspeed/client/udp_transfer_stats.h"

namespace lanspeed {

bool UdpTransferStats::AddSegment(const uint64_t total_segments,
                                  const uint64_t current_segment,
                                  const size_t payload_size,
                                  const Clock::time_point arrival) {
  if (!total_segments_) {
    total_segments_ = total_segments;
  }

  packets_received_++;
  if (last_arrival_) {
    const Clock::duration gap = arrival - *last_arrival_;
    if (!min_gap_ || gap < *min_gap_) min_gap_ = gap;
    if (!max_gap_ || gap > *max_gap_) max_gap_ = gap;
  }
  last_arrival_ = arrival;

  // Ids outside 1..total cannot belong to this transfer.
  if (current_segment == 0 || current_segment > *total_segments_) {
    return false;
  }
  if (!seen_.insert(current_segment).second) {
    return false;
  }
  bytes_received_ += payload_size;
  return true;
}

double UdpTransferStats::LossPercentage() const {
  if (!total_segments_ || *total_segments_ == 0) {
    return 100.0;
  }
  const uint64_t lost = *total_segments_ - seen_.size();
  return static_cast<double>(lost) / static_cast<double>(*total_segments_) * 100.0;
}

double UdpTransferStats::JitterSeconds() const {
  if (!min_gap_ || !max_gap_) {
    return 0.0;
  }
  return std::chrono::duration<double>(*max_gap_ - *min_gap_).count();
}

}
