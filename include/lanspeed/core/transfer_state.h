// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#ifndef LANSPEED_CORE_TRANSFER_STATE_H_
#define LANSPEED_CORE_TRANSFER_STATE_H_

#include <atomic>

namespace lanspeed {

// Shared between the discovery listener and whoever runs speed tests.
// While active, incoming offers are dropped instead of queued.
class TransferState {
public:
  void SetActive(const bool active) { active_.store(active); }
  bool IsActive() const { return active_.load(); }

private:
  std::atomic_bool active_ = false;
};

}

#endif
