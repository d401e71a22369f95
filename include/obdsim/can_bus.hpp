#ifndef OBDSIM_CAN_BUS_HPP
#define OBDSIM_CAN_BUS_HPP

/**
 * @file can_bus.hpp
 * @brief CAN driver abstraction and an in-process software bus
 *
 * VirtualBus behaves like a shared wire with no arbitration: a frame sent by
 * one endpoint is queued on every other attached endpoint, never echoed back
 * to its sender. Endpoints must be destroyed before their bus.
 */

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>
#include "obdsim/can_frame.hpp"
#include "obdsim/frame_queue.hpp"

namespace obdsim {

// Abstract CAN driver (virtual bus endpoint, TCP bridge client, test doubles)
class ICanDriver {
public:
  virtual ~ICanDriver() = default;
  virtual bool send(const CANFrame& f) = 0;
  virtual bool recv(CANFrame& f, std::chrono::milliseconds timeout) = 0;
};

class VirtualBus;

/// One node attached to a VirtualBus
class BusEndpoint : public ICanDriver {
public:
  ~BusEndpoint() override;

  BusEndpoint(const BusEndpoint&) = delete;
  BusEndpoint& operator=(const BusEndpoint&) = delete;

  bool send(const CANFrame& f) override;
  bool recv(CANFrame& f, std::chrono::milliseconds timeout) override;

  /// Frames delivered to this endpoint, oldest first
  FrameQueue& inbound() { return inbound_; }

private:
  friend class VirtualBus;
  explicit BusEndpoint(VirtualBus& bus) : bus_(bus) {}

  VirtualBus& bus_;
  FrameQueue inbound_;
};

class VirtualBus {
public:
  VirtualBus() = default;

  VirtualBus(const VirtualBus&) = delete;
  VirtualBus& operator=(const VirtualBus&) = delete;

  /// Attach a new endpoint; it detaches itself when destroyed
  std::unique_ptr<BusEndpoint> attach();

  size_t endpoint_count() const;

  // Statistics
  uint64_t frames_sent() const;

private:
  friend class BusEndpoint;
  void deliver(const BusEndpoint* sender, const CANFrame& f);
  void detach(const BusEndpoint* endpoint);

  mutable std::mutex mutex_;
  std::vector<BusEndpoint*> endpoints_;
  uint64_t frames_sent_{0};
};

} // namespace obdsim

#endif // OBDSIM_CAN_BUS_HPP
