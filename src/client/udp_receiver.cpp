// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include "lanspeed/client/udp_receiver.h"

#include <asio.hpp>
#include <system_error>
#include <vector>

#include "lanspeed/client/udp_transfer_stats.h"
#include "lanspeed/core/message.h"
#include "lanspeed/core/timed_receive.h"

namespace lanspeed {

UdpReceiver::UdpReceiver(const Config& config, Logger& logger)
  : config_(config), logger_(logger) {}

TransferResult UdpReceiver::Run(const TransferJob& job) {
  try {
    asio::io_context io_context;
    asio::ip::udp::socket socket(io_context, asio::ip::udp::v4());
    socket.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), 0));  // OS allocates port

    const asio::ip::udp::endpoint server(
      asio::ip::make_address(job.endpoint.address), job.endpoint.udp_port);

    const std::vector<uint8_t> request = EncodeRequest(job.file_size);
    socket.send_to(asio::buffer(request), server);
    const auto start = UdpTransferStats::Clock::now();

    UdpTransferStats stats;
    std::vector<uint8_t> recv_buffer(config_.udp_buffer_size);
    asio::ip::udp::endpoint sender_endpoint;

    while (true) {
      std::error_code error;
      const size_t len = ReceiveFrom(io_context, socket, asio::buffer(recv_buffer),
                                     sender_endpoint, config_.udp_receive_timeout, error);
      if (error == asio::error::timed_out) {
        break;  // end of stream
      }
      if (error) {
        throw std::system_error(error);
      }
      if (sender_endpoint != server) {
        continue;  // stray traffic
      }
      const auto arrival = UdpTransferStats::Clock::now();

      const std::optional<Payload> payload = DecodePayload(recv_buffer.data(), len);
      if (!payload) {
        continue;
      }
      stats.AddSegment(payload->total_segments, payload->current_segment,
                       payload->data.size(), arrival);
    }

    // Measure up to the last arrival so the trailing silence is not billed.
    const auto end = stats.LastArrival() ? *stats.LastArrival()
                                         : UdpTransferStats::Clock::now();

    TransferResult result;
    result.id = job.id;
    result.protocol = Protocol::UDP;
    result.status = TransferResult::COMPLETED;
    result.elapsed_seconds = std::chrono::duration<double>(end - start).count();
    result.bytes_transferred = stats.BytesReceived();
    result.bits_per_second = Throughput(result.bytes_transferred, result.elapsed_seconds);
    result.loss_percentage = stats.LossPercentage();
    result.jitter_seconds = stats.JitterSeconds();

    logger_.Info("[UDP] Transfer #" + std::to_string(job.id) + " received "
                 + std::to_string(stats.UniqueSegments()) + "/"
                 + std::to_string(stats.TotalSegments().value_or(0)) + " segments ("
                 + std::to_string(result.bytes_transferred) + " bytes) from "
                 + job.endpoint.address);
    return result;
  }
  catch (const std::exception& e) {
    logger_.Error("[UDP] Transfer #" + std::to_string(job.id) + " failed: " + e.what());
    return FailedResult(job, e.what());
  }
}

}
