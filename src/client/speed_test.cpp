// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include "lanspeed/client/speed_test.h"

#include <algorithm>
#include <asio.hpp>

#include "lanspeed/client/tcp_receiver.h"
#include "lanspeed/client/udp_receiver.h"

namespace lanspeed {

SpeedTest::SpeedTest(const Config& config, Logger& logger)
  : logger_(logger),
    runner_([&config, &logger](const TransferJob& job) {
      if (job.protocol == Protocol::TCP) {
        return TcpReceiver(config, logger).Run(job);
      }
      return UdpReceiver(config, logger).Run(job);
    }) {}

SpeedTest::SpeedTest(Logger& logger, UnitRunner runner)
  : logger_(logger), runner_(std::move(runner)) {}

std::vector<TransferJob> SpeedTest::MakeJobs(const ServerEndpoint& endpoint,
                                             const uint64_t file_size,
                                             const int tcp_count,
                                             const int udp_count) {
  std::vector<TransferJob> jobs;
  jobs.reserve(std::max(tcp_count, 0) + std::max(udp_count, 0));
  int id = 1;
  for (int i = 0; i < tcp_count; i++) {
    jobs.push_back({id++, Protocol::TCP, endpoint, file_size});
  }
  for (int i = 0; i < udp_count; i++) {
    jobs.push_back({id++, Protocol::UDP, endpoint, file_size});
  }
  return jobs;
}

std::vector<TransferResult> SpeedTest::Run(const ServerEndpoint& endpoint,
                                           const uint64_t file_size,
                                           const int tcp_count,
                                           const int udp_count) {
  const std::vector<TransferJob> jobs = MakeJobs(endpoint, file_size, tcp_count, udp_count);
  // Slot i belongs to job id i + 1; every unit writes only its own slot.
  std::vector<TransferResult> results(jobs.size());
  if (jobs.empty()) {
    return results;
  }

  logger_.Info("Starting speed test against " + endpoint.address + ": "
               + std::to_string(tcp_count) + " TCP, " + std::to_string(udp_count)
               + " UDP, " + std::to_string(file_size) + " bytes each");

  asio::thread_pool units(jobs.size());
  for (size_t i = 0; i < jobs.size(); i++) {
    asio::post(units, [this, &jobs, &results, i]() {
      try {
        results[i] = runner_(jobs[i]);
      } catch (const std::exception& e) {
        results[i] = FailedResult(jobs[i], e.what());
      }
      results[i].id = jobs[i].id;
      results[i].protocol = jobs[i].protocol;
    });
  }
  units.join();

  logger_.Info("Speed test finished, " + std::to_string(results.size()) + " transfers");
  return results;
}

}
