// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "lanspeed/client/speed_test.h"

using namespace lanspeed;
using namespace std::chrono_literals;

class SpeedTestTest : public ::testing::Test {
protected:
  static TransferResult Completed(const TransferJob& job) {
    TransferResult result;
    result.id = job.id;
    result.protocol = job.protocol;
    result.bytes_transferred = job.file_size;
    return result;
  }

  std::ostringstream log_;
  Logger logger_{"test", log_};
  const ServerEndpoint endpoint_{"127.0.0.1", 5002, 5001};
};

TEST_F(SpeedTestTest, JobIdsPutTcpBeforeUdp) {
  const auto jobs = SpeedTest::MakeJobs(endpoint_, 1000, 2, 3);
  ASSERT_EQ(jobs.size(), 5u);
  for (size_t i = 0; i < jobs.size(); i++) {
    EXPECT_EQ(jobs[i].id, static_cast<int>(i + 1));
    EXPECT_EQ(jobs[i].protocol, i < 2 ? Protocol::TCP : Protocol::UDP);
    EXPECT_EQ(jobs[i].file_size, 1000u);
  }
}

TEST_F(SpeedTestTest, ResultsFollowIdOrderNotCompletionOrder) {
  std::mutex order_mutex;
  std::vector<int> completion_order;

  SpeedTest test(logger_, [&](const TransferJob& job) {
    // The first unit finishes last.
    if (job.id == 1) std::this_thread::sleep_for(300ms);
    {
      std::lock_guard<std::mutex> lock(order_mutex);
      completion_order.push_back(job.id);
    }
    return Completed(job);
  });

  const auto start = std::chrono::steady_clock::now();
  const auto results = test.Run(endpoint_, 1000, 2, 1);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].id, 1);
  EXPECT_EQ(results[1].id, 2);
  EXPECT_EQ(results[2].id, 3);
  EXPECT_EQ(results[0].protocol, Protocol::TCP);
  EXPECT_EQ(results[1].protocol, Protocol::TCP);
  EXPECT_EQ(results[2].protocol, Protocol::UDP);

  // Returned only after the delayed unit was done.
  EXPECT_GE(elapsed, 300ms);
  ASSERT_EQ(completion_order.size(), 3u);
  EXPECT_EQ(completion_order.back(), 1);
}

TEST_F(SpeedTestTest, UnitsRunConcurrently) {
  std::mutex mutex;
  std::condition_variable all_started;
  int started = 0;
  std::atomic_bool saw_all = true;

  SpeedTest test(logger_, [&](const TransferJob& job) {
    std::unique_lock<std::mutex> lock(mutex);
    started++;
    all_started.notify_all();
    // Only passes if all four units are in flight at once.
    if (!all_started.wait_for(lock, 5s, [&] { return started == 4; })) {
      saw_all = false;
    }
    return Completed(job);
  });

  const auto results = test.Run(endpoint_, 10, 2, 2);
  EXPECT_EQ(results.size(), 4u);
  EXPECT_TRUE(saw_all.load());
}

TEST_F(SpeedTestTest, FailedUnitDoesNotAffectOthers) {
  SpeedTest test(logger_, [](const TransferJob& job) -> TransferResult {
    if (job.id == 2) {
      throw std::runtime_error("connection reset");
    }
    return Completed(job);
  });

  const auto results = test.Run(endpoint_, 10, 1, 2);
  ASSERT_EQ(results.size(), 3u);
  EXPECT_TRUE(results[0].Succeeded());
  EXPECT_EQ(results[1].status, TransferResult::FAILED);
  EXPECT_EQ(results[1].error, "connection reset");
  EXPECT_EQ(results[1].id, 2);
  EXPECT_EQ(results[1].protocol, Protocol::UDP);
  EXPECT_TRUE(results[2].Succeeded());
}

TEST_F(SpeedTestTest, NoUnitsGivesNoResults) {
  std::atomic<int> calls = 0;
  SpeedTest test(logger_, [&](const TransferJob& job) {
    calls++;
    return Completed(job);
  });
  EXPECT_TRUE(test.Run(endpoint_, 10, 0, 0).empty());
  EXPECT_EQ(calls.load(), 0);
}

TEST(TransferResultTest, DescribeMentionsLossForUdp) {
  TransferResult result;
  result.id = 3;
  result.protocol = Protocol::UDP;
  result.elapsed_seconds = 2.0;
  result.bits_per_second = 4096.0;
  result.loss_percentage = 25.0;
  result.jitter_seconds = 0.0015;
  const std::string line = Describe(result);
  EXPECT_NE(line.find("UDP transfer #3 finished"), std::string::npos);
  EXPECT_NE(line.find("75.00%"), std::string::npos);
  EXPECT_NE(line.find("1.50 ms"), std::string::npos);
}

TEST(TransferResultTest, ThroughputIsZeroWithoutElapsedTime) {
  EXPECT_DOUBLE_EQ(Throughput(1000, 0.0), 0.0);
  EXPECT_DOUBLE_EQ(Throughput(1000, 2.0), 4000.0);
}
