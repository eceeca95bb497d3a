// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_CLIENT_UDP_RECEIVER_H_
#define LANSPEED_CLIENT_UDP_RECEIVER_H_

#include "lanspeed/core/config.h"
#include "lanspeed/core/logger.h"
#include "lanspeed/core/transfer.h"

namespace lanspeed {

// One UDP transfer unit: sends a Request, then collects Payloads until the
// server goes quiet for `udp_receive_timeout`. Datagrams from any other
// endpoint are ignored.
class UdpReceiver {
public:
  UdpReceiver(const Config& config, Logger& logger);

  // Never throws; socket errors become a FAILED result.
  TransferResult Run(const TransferJob& job);

private:
  const Config& config_;
  Logger& logger_;
};

}

#endif
