// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include "lanspeed/server/server.h"

#include <cctype>
#include <cstdint>
#include <istream>

namespace lanspeed {

Server::Server(const Config& config, Logger& logger,
               const uint16_t tcp_port, const uint16_t udp_port)
: logger_(logger),
  acceptor_(io_context_),
  udp_socket_(udp_io_context_),
  recv_buffer_(config.udp_buffer_size),
  tcp_sender_(config, logger),
  udp_sender_(config, logger, udp_socket_),
  tcp_workers_(config.tcp_workers),
  udp_workers_(config.udp_workers) {
  try {
    const asio::ip::tcp::endpoint tcp_endpoint(asio::ip::tcp::v4(), tcp_port);
    acceptor_.open(tcp_endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(tcp_endpoint);
    acceptor_.listen();

    udp_socket_.open(asio::ip::udp::v4());
    udp_socket_.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), udp_port));

    broadcaster_ = std::make_unique<OfferBroadcaster>(config, logger, UdpPort(), TcpPort());
  } catch (const std::exception& e) {
    logger_.Error(std::string("Server construction failed: ") + e.what());
    throw;
  }
}

Server::~Server() {
  Stop();
  if (broadcaster_thread_.joinable()) {
    broadcaster_thread_.join();
  }
  if (udp_thread_.joinable()) {
    udp_thread_.join();
  }
}

void Server::Start() {
  if (!running_) return;

  broadcaster_thread_ = std::thread([this]() { broadcaster_->Start(); });

  logger_.Info("[TCP] TCP server listening on port " + std::to_string(TcpPort()) + ".");
  logger_.Info("[UDP] UDP server listening on port " + std::to_string(UdpPort()) + ".");

  __ReceiveRequest();
  udp_thread_ = std::thread([this]() { udp_io_context_.run(); });

  __Accept();
  io_context_.run();

  udp_io_context_.stop();
  if (udp_thread_.joinable()) {
    udp_thread_.join();
  }
  broadcaster_->Stop();
  if (broadcaster_thread_.joinable()) {
    broadcaster_thread_.join();
  }
  logger_.Info("Server stopped.");
}

void Server::Stop() {
  running_ = false;
  tcp_workers_.Stop();
  udp_workers_.Stop();
  io_context_.stop();
  udp_io_context_.stop();
  if (broadcaster_) {
    broadcaster_->Stop();
  }
}

uint16_t Server::TcpPort() const {
  std::error_code error;
  const auto endpoint = acceptor_.local_endpoint(error);
  return error ? 0 : endpoint.port();
}

uint16_t Server::UdpPort() const {
  std::error_code error;
  const auto endpoint = udp_socket_.local_endpoint(error);
  return error ? 0 : endpoint.port();
}

std::optional<uint64_t> Server::ParseRequestLine(const std::string& line) {
  size_t begin = 0;
  size_t end = line.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(line[begin]))) begin++;
  while (end > begin && std::isspace(static_cast<unsigned char>(line[end - 1]))) end--;
  if (begin == end || end - begin > 20) {
    return std::nullopt;
  }

  uint64_t value = 0;
  for (size_t i = begin; i < end; i++) {
    const char c = line[i];
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    const uint64_t digit = static_cast<uint64_t>(c - '0');
    if (value > (UINT64_MAX - digit) / 10) {
      return std::nullopt;  // overflow
    }
    value = value * 10 + digit;
  }
  return value;
}

void Server::__Accept() {
  auto socket = std::make_shared<asio::ip::tcp::socket>(io_context_);
  acceptor_.async_accept(*socket, [this, socket](const std::error_code& error) {
    if (error) {
      if (error != asio::error::operation_aborted) {
        logger_.Error("[TCP] Error accepting connections(" + std::to_string(error.value())
                      + "): " + error.message());
      }
    } else {
      std::error_code ignored;
      logger_.Info("[TCP] Accepted connection from "
                   + socket->remote_endpoint(ignored).address().to_string() + ".");
      __ReadRequestLine(socket);
    }
    if (running_) __Accept();
  });
}

void Server::__ReadRequestLine(std::shared_ptr<asio::ip::tcp::socket> socket) {
  auto line_buffer = std::make_shared<asio::streambuf>(64);
  asio::async_read_until(*socket, *line_buffer, '\n',
    [this, socket, line_buffer](const std::error_code& error, std::size_t) {
      std::error_code ignored;
      const std::string peer = socket->remote_endpoint(ignored).address().to_string();
      if (error) {
        logger_.Warning("[TCP] No request line received from " + peer + ". Closing connection.");
        socket->close(ignored);
        return;
      }

      std::istream stream(line_buffer.get());
      std::string line;
      std::getline(stream, line);
      const std::optional<uint64_t> file_size = ParseRequestLine(line);
      if (!file_size) {
        logger_.Warning("[TCP] Malformed request line from " + peer + ". Closing connection.");
        socket->close(ignored);
        return;
      }

      logger_.Info("[TCP] Client " + peer + " requested " + std::to_string(*file_size) + " bytes.");
      // Blocks while all workers are busy; the accept backlog absorbs the wait.
      // UDP requests are received on their own thread meanwhile.
      const bool submitted = tcp_workers_.Submit([this, socket, size = *file_size]() {
        tcp_sender_.Send(*socket, size);
      });
      if (!submitted) {
        socket->close(ignored);
      }
    });
}

void Server::__ReceiveRequest() {
  udp_socket_.async_receive_from(
    asio::buffer(recv_buffer_), remote_endpoint_,
    [this](const std::error_code& error, std::size_t bytes_transferred) {
      if (error) {
        if (error != asio::error::operation_aborted) {
          logger_.Error("[UDP] Error receiving data(" + std::to_string(error.value()) + "): "
                        + error.message());
        }
      } else {
        std::vector<uint8_t> datagram(recv_buffer_.begin(),
                                      recv_buffer_.begin() + bytes_transferred);
        const asio::ip::udp::endpoint requester = remote_endpoint_;
        logger_.Debug("[UDP] Received request from " + requester.address().to_string() + ".");
        const bool submitted = udp_workers_.Submit([this, datagram = std::move(datagram), requester]() {
          udp_sender_.HandleRequest(datagram, requester);
        });
        if (!submitted) {
          logger_.Warning("[UDP] Server stopping, dropped request from "
                          + requester.address().to_string() + ".");
        }
      }
      if (running_) __ReceiveRequest();
    });
}

}
