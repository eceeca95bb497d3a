// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_CORE_WORKER_POOL_H_
#define LANSPEED_CORE_WORKER_POOL_H_

#include <asio.hpp>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace lanspeed {

// Fixed number of worker threads with at most CAPACITY tasks in flight.
// Submit() blocks while the pool is saturated.
class WorkerPool {
public:
  explicit WorkerPool(const size_t capacity);
  ~WorkerPool();

  // @return false if the pool was stopped before a slot became free.
  bool Submit(std::function<void()> task);

  // Wakes blocked submitters and drops tasks that have not started yet.
  void Stop();

  // Waits for running tasks to finish.
  void Join();

  size_t InFlight() const;

public:
  const size_t CAPACITY;

private:
  void __Release();

private:
  asio::thread_pool pool_;
  mutable std::mutex slots_mutex_;
  std::condition_variable slot_released_;
  size_t in_flight_ = 0;
  bool stopped_ = false;
};

}

#endif
