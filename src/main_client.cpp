// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include "lanspeed/client/offer_listener.h"
#include "lanspeed/client/speed_test.h"
#include "lanspeed/core/config.h"
#include "lanspeed/core/console.h"
#include "lanspeed/core/logger.h"
#include "lanspeed/core/transfer_state.h"

using namespace lanspeed;

namespace {

struct TestParameters {
  uint64_t file_size;
  int tcp_count;
  int udp_count;
};

// @return false on end of input
bool ReadInteger(const std::string& prompt, long long& value) {
  while (true) {
    std::cout << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
      return false;
    }
    try {
      size_t consumed = 0;
      value = std::stoll(line, &consumed);
      if (line.find_first_not_of(" \t\r", consumed) == std::string::npos) {
        return true;
      }
    } catch (const std::exception&) {
      // not a number, ask again
    }
    std::cout << Console::RED << "Invalid input. Please enter integer values." << Console::RESET << std::endl;
  }
}

// Re-prompts until the values are in range, so the core never sees bad input.
bool ReadParameters(const Config& config, TestParameters& params) {
  while (true) {
    long long file_size = 0;
    long long tcp_count = 0;
    long long udp_count = 0;
    if (!ReadInteger("Enter the file size to download (in bytes): ", file_size)) return false;
    if (file_size <= 0 || static_cast<unsigned long long>(file_size) > config.max_file_size) {
      std::cout << Console::RED << "File size must be between 1 and " << config.max_file_size
                << " bytes." << Console::RESET << std::endl;
      continue;
    }
    if (!ReadInteger("Enter the number of TCP connections: ", tcp_count)) return false;
    if (tcp_count < 0 || tcp_count > config.max_connections) {
      std::cout << Console::RED << "Number of TCP connections must be between 0 and "
                << config.max_connections << "." << Console::RESET << std::endl;
      continue;
    }
    if (!ReadInteger("Enter the number of UDP connections: ", udp_count)) return false;
    if (udp_count < 0 || udp_count > config.max_connections) {
      std::cout << Console::RED << "Number of UDP connections must be between 0 and "
                << config.max_connections << "." << Console::RESET << std::endl;
      continue;
    }
    if (tcp_count == 0 && udp_count == 0) {
      std::cout << Console::RED << "At least one TCP or UDP connection is required."
                << Console::RESET << std::endl;
      continue;
    }
    params = {static_cast<uint64_t>(file_size), static_cast<int>(tcp_count), static_cast<int>(udp_count)};
    return true;
  }
}

void PrintResult(const TransferResult& result) {
  const std::string& color = result.status == TransferResult::FAILED ? Console::RED
                           : result.protocol == Protocol::TCP ? Console::GREEN
                           : Console::YELLOW;
  std::cout << color << Describe(result) << Console::RESET << std::endl;
}

}

int main() {
  const Config config;

  try {
    Logger logger("client", "client.log");
    TransferState state;
    OfferQueue offers;
    OfferListener listener(config, logger, state, offers);
    std::thread listener_thread([&listener]() { listener.Start(); });

    std::mutex listener_join_mutex;
    auto stop_listener = [&]() {
      listener.Stop();
      std::lock_guard<std::mutex> lock(listener_join_mutex);
      if (listener_thread.joinable()) {
        listener_thread.join();
      }
    };

    std::atomic_bool running = true;
    asio::io_context signal_context;
    asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& error, int) {
      if (error) return;
      running = false;
      std::cout << Console::RED << "\nClient shutting down." << Console::RESET << std::endl;
      logger.Info("Client shutting down.");
      stop_listener();
      // In-flight transfers and a pending prompt are abandoned.
      std::exit(0);
    });
    std::thread signal_thread([&signal_context]() { signal_context.run(); });

    std::cout << Console::GREEN << "Client started, listening for offer requests..."
              << Console::RESET << std::endl;

    SpeedTest speed_test(config, logger);
    while (running) {
      // Goes active before prompting so offers do not pile up while the user types.
      const std::optional<ServerEndpoint> server =
        ClaimOffer(offers, state, std::chrono::milliseconds(100));
      if (!server) continue;

      std::cout << Console::CYAN << "Received offer from " << server->address
                << Console::RESET << std::endl;

      TestParameters params;
      if (!ReadParameters(config, params)) {
        break;
      }
      const std::vector<TransferResult> results = speed_test.Run(
        *server, params.file_size, params.tcp_count, params.udp_count);
      for (const TransferResult& result : results) {
        PrintResult(result);
      }
      std::cout << Console::GREEN << "All transfers complete, listening to offer requests"
                << Console::RESET << std::endl;

      state.SetActive(false);
    }

    stop_listener();
    signal_context.stop();
    signal_thread.join();
  } catch (const std::exception& e) {
    std::cerr << Console::RED << "Client error: " << e.what() << Console::RESET << std::endl;
    return 1;
  }
  return 0;
}
