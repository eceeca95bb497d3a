// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_CLIENT_SPEED_TEST_H_
#define LANSPEED_CLIENT_SPEED_TEST_H_

#include <functional>
#include <vector>

#include "lanspeed/core/config.h"
#include "lanspeed/core/logger.h"
#include "lanspeed/core/transfer.h"

namespace lanspeed {

// Fans out one test run into concurrent transfer units and joins them.
class SpeedTest {
public:
  // Must not throw; a failing unit reports through its result.
  using UnitRunner = std::function<TransferResult(const TransferJob&)>;

public:
  // Runs TCP units with TcpReceiver and UDP units with UdpReceiver.
  SpeedTest(const Config& config, Logger& logger);
  SpeedTest(Logger& logger, UnitRunner runner);

  // Ids 1..tcp_count are TCP, the following udp_count ids are UDP.
  // Blocks until every unit has finished.
  // @return one result per unit, ordered by id.
  std::vector<TransferResult> Run(const ServerEndpoint& endpoint,
                                  const uint64_t file_size,
                                  const int tcp_count,
                                  const int udp_count);

  static std::vector<TransferJob> MakeJobs(const ServerEndpoint& endpoint,
                                           const uint64_t file_size,
                                           const int tcp_count,
                                           const int udp_count);

private:
  Logger& logger_;
  UnitRunner runner_;
};

}

#endif
