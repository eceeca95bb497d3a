// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include "lanspeed/core/worker_pool.h"

namespace lanspeed {

WorkerPool::WorkerPool(const size_t capacity)
  : CAPACITY(capacity > 0 ? capacity : 1),
    pool_(CAPACITY) {}

WorkerPool::~WorkerPool() {
  Stop();
  Join();
}

bool WorkerPool::Submit(std::function<void()> task) {
  {
    std::unique_lock<std::mutex> lock(slots_mutex_);
    slot_released_.wait(lock, [this] { return stopped_ || in_flight_ < CAPACITY; });
    if (stopped_) {
      return false;
    }
    in_flight_++;
  }

  asio::post(pool_, [this, task = std::move(task)]() {
    // Tasks report their own errors; the slot is returned either way.
    struct SlotGuard {
      WorkerPool* owner;
      ~SlotGuard() { owner->__Release(); }
    } guard{this};
    task();
  });
  return true;
}

void WorkerPool::Stop() {
  {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    stopped_ = true;
  }
  slot_released_.notify_all();
  pool_.stop();
}

void WorkerPool::Join() {
  pool_.join();
}

size_t WorkerPool::InFlight() const {
  std::lock_guard<std::mutex> lock(slots_mutex_);
  return in_flight_;
}

void WorkerPool::__Release() {
  {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    in_flight_--;
  }
  slot_released_.notify_one();
}

}
