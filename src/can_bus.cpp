#include "obdsim/can_bus.hpp"
#include <algorithm>

namespace obdsim {

// ============================================================================
// BusEndpoint Implementation
// ============================================================================

BusEndpoint::~BusEndpoint() {
  bus_.detach(this);
}

bool BusEndpoint::send(const CANFrame& f) {
  if (f.length > CAN_MAX_DLEN) return false;
  bus_.deliver(this, f);
  return true;
}

bool BusEndpoint::recv(CANFrame& f, std::chrono::milliseconds timeout) {
  return inbound_.pop(f, timeout);
}

// ============================================================================
// VirtualBus Implementation
// ============================================================================

std::unique_ptr<BusEndpoint> VirtualBus::attach() {
  std::unique_ptr<BusEndpoint> endpoint(new BusEndpoint(*this));
  std::lock_guard<std::mutex> lock(mutex_);
  endpoints_.push_back(endpoint.get());
  return endpoint;
}

void VirtualBus::detach(const BusEndpoint* endpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  endpoints_.erase(std::remove(endpoints_.begin(), endpoints_.end(), endpoint),
                   endpoints_.end());
}

void VirtualBus::deliver(const BusEndpoint* sender, const CANFrame& f) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++frames_sent_;
  for (BusEndpoint* endpoint : endpoints_) {
    if (endpoint != sender) {
      endpoint->inbound_.push(f);
    }
  }
}

size_t VirtualBus::endpoint_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return endpoints_.size();
}

uint64_t VirtualBus::frames_sent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frames_sent_;
}

} // namespace obdsim
