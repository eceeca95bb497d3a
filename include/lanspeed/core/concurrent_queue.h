// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_CORE_CONCURRENT_QUEUE_H_
#define LANSPEED_CORE_CONCURRENT_QUEUE_H_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace lanspeed {

template<typename Value>
class ConcurrentQueue {
private:
  std::deque<Value> data_;
  mutable std::mutex lock_;
  std::condition_variable pushed_;

public:
  void push(const Value& value) {
    {
      std::lock_guard<std::mutex> lock(lock_);
      data_.push_back(value);
    }
    pushed_.notify_one();
  }

  void push(Value&& value) {
    {
      std::lock_guard<std::mutex> lock(lock_);
      data_.push_back(std::move(value));
    }
    pushed_.notify_one();
  }

  std::optional<Value> try_pop() {
    std::lock_guard<std::mutex> lock(lock_);
    if (data_.empty()) {
      return std::nullopt;
    }
    Value value = std::move(data_.front());
    data_.pop_front();
    return value;
  }

  // Blocks up to `timeout` for an element.
  template<typename Rep, typename Period>
  std::optional<Value> wait_pop(const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(lock_);
    if (!pushed_.wait_for(lock, timeout, [this] { return !data_.empty(); })) {
      return std::nullopt;
    }
    Value value = std::move(data_.front());
    data_.pop_front();
    return value;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(lock_);
    data_.clear();
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(lock_);
    return data_.empty();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(lock_);
    return data_.size();
  }
};

}

#endif
