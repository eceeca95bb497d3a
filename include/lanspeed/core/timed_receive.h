// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_CORE_TIMED_RECEIVE_H_
#define LANSPEED_CORE_TIMED_RECEIVE_H_

#include <asio.hpp>
#include <chrono>

namespace lanspeed {

// Blocking receive_from with a deadline. The socket must belong to
// `io_context`, and no other thread may run that context.
// On timeout `error` is asio::error::timed_out and 0 is returned.
size_t ReceiveFrom(asio::io_context& io_context,
                   asio::ip::udp::socket& socket,
                   const asio::mutable_buffer& buffer,
                   asio::ip::udp::endpoint& sender_endpoint,
                   const std::chrono::steady_clock::duration timeout,
                   std::error_code& error);

}

#endif
