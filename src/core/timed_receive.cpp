// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include "lanspeed/core/timed_receive.h"

namespace lanspeed {

size_t ReceiveFrom(asio::io_context& io_context,
                   asio::ip::udp::socket& socket,
                   const asio::mutable_buffer& buffer,
                   asio::ip::udp::endpoint& sender_endpoint,
                   const std::chrono::steady_clock::duration timeout,
                   std::error_code& error) {
  size_t received = 0;
  bool completed = false;
  socket.async_receive_from(
    buffer, sender_endpoint,
    [&](const std::error_code& ec, std::size_t bytes_transferred) {
      error = ec;
      received = bytes_transferred;
      completed = true;
    }
  );

  io_context.restart();
  io_context.run_for(timeout);

  if (!completed) {
    // Deadline hit; let the cancelled handler run before the locals go away.
    socket.cancel();
    io_context.restart();
    io_context.run();
    if (error == asio::error::operation_aborted) {
      error = asio::error::timed_out;
      return 0;
    }
  }
  return received;
}

}
