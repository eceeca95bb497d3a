// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include "lanspeed/client/tcp_receiver.h"

#include <asio.hpp>
#include <system_error>
#include <chrono>
#include <vector>

namespace lanspeed {

TcpReceiver::TcpReceiver(const Config& config, Logger& logger)
  : config_(config), logger_(logger) {}

TransferResult TcpReceiver::Run(const TransferJob& job) {
  try {
    asio::io_context io_context;
    asio::ip::tcp::socket socket(io_context);

    const auto start = std::chrono::steady_clock::now();
    socket.connect(asio::ip::tcp::endpoint(
      asio::ip::make_address(job.endpoint.address), job.endpoint.tcp_port));

    const std::string request = std::to_string(job.file_size) + "\n";
    asio::write(socket, asio::buffer(request));

    // Same read size as the UDP side.
    std::vector<uint8_t> recv_buffer(config_.udp_buffer_size);
    uint64_t bytes_received = 0;
    bool closed_early = false;

    while (bytes_received < job.file_size) {
      std::error_code error;
      const size_t len = socket.read_some(asio::buffer(recv_buffer), error);
      if (error == asio::error::eof) {
        closed_early = true;
        break;
      }
      if (error) {
        throw std::system_error(error);
      }
      bytes_received += len;
    }
    const auto end = std::chrono::steady_clock::now();

    std::error_code ignored;
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);

    TransferResult result;
    result.id = job.id;
    result.protocol = Protocol::TCP;
    result.elapsed_seconds = std::chrono::duration<double>(end - start).count();
    result.bytes_transferred = bytes_received;
    result.bits_per_second = Throughput(bytes_received, result.elapsed_seconds);
    if (closed_early) {
      result.status = TransferResult::SHORT;
      result.error = "connection closed after " + std::to_string(bytes_received)
                   + " of " + std::to_string(job.file_size) + " bytes";
      logger_.Warning("[TCP] Transfer #" + std::to_string(job.id) + ": " + result.error);
    } else {
      result.status = TransferResult::COMPLETED;
      logger_.Info("[TCP] Transfer #" + std::to_string(job.id) + " received "
                   + std::to_string(bytes_received) + " bytes from " + job.endpoint.address);
    }
    return result;
  }
  catch (const std::exception& e) {
    logger_.Error("[TCP] Transfer #" + std::to_string(job.id) + " failed: " + e.what());
    return FailedResult(job, e.what());
  }
}

}
