// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_CLIENT_TCP_RECEIVER_H_
#define LANSPEED_CLIENT_TCP_RECEIVER_H_

#include "lanspeed/core/config.h"
#include "lanspeed/core/logger.h"
#include "lanspeed/core/transfer.h"

namespace lanspeed {

// One TCP transfer unit: sends "<file_size>\n" and drains the byte stream.
class TcpReceiver {
public:
  TcpReceiver(const Config& config, Logger& logger);

  // Never throws. An early close gives a SHORT result, errors a FAILED one.
  TransferResult Run(const TransferJob& job);

private:
  const Config& config_;
  Logger& logger_;
};

}

#endif
