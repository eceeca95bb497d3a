// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "lanspeed/core/config.h"
#include "lanspeed/core/console.h"
#include "lanspeed/core/logger.h"
#include "lanspeed/server/server.h"

using namespace lanspeed;

namespace {

void PrintHelp(const char* program, int exit_code) {
  std::cout << "Usage: " << program << " [--tcp_port <port>] [--udp_port <port>]\n"
            << "Options:\n"
            << "    --tcp_port <port>   TCP port to listen on [default 5001]\n"
            << "    --udp_port <port>   UDP port to listen on [default 5002]\n"
            << "    --help\n";
  std::exit(exit_code);
}

uint16_t ParsePort(const char* program, const std::string& flag, const char* value) {
  try {
    size_t consumed = 0;
    const int port = std::stoi(value, &consumed);
    if (consumed == std::string(value).size() && port >= 0 && port <= 65535) {
      return static_cast<uint16_t>(port);
    }
  } catch (const std::exception&) {
    // falls through to the usage message
  }
  std::cerr << "Invalid value for " << flag << ": " << value << std::endl;
  PrintHelp(program, 1);
  return 0;
}

// Address of the interface that routes off-host; nothing is sent.
std::string LocalAddress() {
  try {
    asio::io_context io_context;
    asio::ip::udp::socket socket(io_context, asio::ip::udp::v4());
    socket.connect(asio::ip::udp::endpoint(asio::ip::make_address("10.255.255.255"), 1));
    return socket.local_endpoint().address().to_string();
  } catch (const std::exception&) {
    return "127.0.0.1";
  }
}

}

int main(int argc, char* argv[]) {
  uint16_t tcp_port = 5001;
  uint16_t udp_port = 5002;

  for (int i = 1; i < argc; i++) {
    const std::string arg = argv[i];
    if (arg == "--help") {
      PrintHelp(argv[0], 0);
    } else if (arg == "--tcp_port" && i + 1 < argc) {
      tcp_port = ParsePort(argv[0], arg, argv[++i]);
    } else if (arg == "--udp_port" && i + 1 < argc) {
      udp_port = ParsePort(argv[0], arg, argv[++i]);
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      PrintHelp(argv[0], 1);
    }
  }

  const Config config;

  try {
    Logger logger("server", "server.log");
    Server server(config, logger, tcp_port, udp_port);

    asio::io_context signal_context;
    asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& error, int) {
      if (error) return;
      logger.Info("Server shutting down.");
      std::cout << Console::RED << "\nServer shutting down." << Console::RESET << std::endl;
      server.Stop();
    });
    std::thread signal_thread([&signal_context]() { signal_context.run(); });

    const std::string local_address = LocalAddress();
    logger.Info("Server started, listening on IP address " + local_address);
    std::cout << Console::GREEN << "Server started, listening on IP address " << local_address
              << Console::RESET << std::endl;
    std::cout << Console::BLUE << "[TCP] TCP server listening on port " << server.TcpPort()
              << Console::RESET << std::endl;
    std::cout << Console::MAGENTA << "[UDP] UDP server listening on port " << server.UdpPort()
              << Console::RESET << std::endl;

    server.Start();

    signal_context.stop();
    signal_thread.join();
  } catch (const std::exception& e) {
    std::cerr << Console::RED << "Server error: " << e.what() << Console::RESET << std::endl;
    return 1;
  }
  return 0;
}
