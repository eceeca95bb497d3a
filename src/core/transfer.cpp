// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include "lanspeed/core/transfer.h"

#include <iomanip>
#include <sstream>

namespace lanspeed {

const char* ToString(const Protocol protocol) {
  switch (protocol) {
    case Protocol::TCP: return "TCP";
    case Protocol::UDP: return "UDP";
    default: return "UNKNOWN";
  }
}

double Throughput(const uint64_t bytes, const double elapsed_seconds) {
  if (elapsed_seconds <= 0.0) {
    return 0.0;
  }
  return static_cast<double>(bytes) * 8.0 / elapsed_seconds;
}

TransferResult FailedResult(const TransferJob& job, const std::string& error) {
  TransferResult result;
  result.id = job.id;
  result.protocol = job.protocol;
  result.status = TransferResult::FAILED;
  result.error = error;
  return result;
}

std::string Describe(const TransferResult& result) {
  std::ostringstream out;
  out << ToString(result.protocol) << " transfer #" << result.id;

  if (result.status == TransferResult::FAILED) {
    out << " failed: " << result.error;
    return out.str();
  }

  out << std::fixed << std::setprecision(2)
      << " finished, total time: " << result.elapsed_seconds << " seconds"
      << ", total speed: " << result.bits_per_second << " bits/second";
  if (result.loss_percentage) {
    out << ", percentage of packets received successfully: "
        << (100.0 - *result.loss_percentage) << "%";
  }
  if (result.jitter_seconds) {
    out << ", jitter: " << (*result.jitter_seconds * 1000.0) << " ms";
  }
  if (result.status == TransferResult::SHORT) {
    out << " (incomplete: " << result.error << ")";
  }
  return out.str();
}

}
