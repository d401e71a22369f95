#ifndef OBDSIM_ECU_SIMULATOR_HPP
#define OBDSIM_ECU_SIMULATOR_HPP

/**
 * @file ecu_simulator.hpp
 * @brief A simulated OBD-II engine ECU on a virtual CAN bus, exported over TCP
 *
 * Requests arrive on two channels: the in-process VirtualBus and frames sent
 * by bridge clients. A single service loop alternates between them (bounded
 * bus poll, then at most one bridge request) so neither source can starve the
 * other. Every response is sent on the bus and broadcast to all bridge
 * clients.
 *
 * Usage:
 * @code
 *   obdsim::EcuConfig config;
 *   obdsim::EcuSimulator ecu(config);
 *   if (!ecu.start()) return 1;
 *   auto tester = ecu.bus().attach();
 *   tester->send(obdsim::obd::make_current_data_request(0x0C));
 * @endcode
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include "obdsim/can_bus.hpp"
#include "obdsim/config.hpp"
#include "obdsim/dtc_generator.hpp"
#include "obdsim/frame_queue.hpp"
#include "obdsim/obd_dtc.hpp"
#include "obdsim/service_dispatcher.hpp"
#include "obdsim/tcp_bridge.hpp"

namespace obdsim {

class EcuSimulator {
public:
  explicit EcuSimulator(const EcuConfig& config = EcuConfig{});
  ~EcuSimulator();

  EcuSimulator(const EcuSimulator&) = delete;
  EcuSimulator& operator=(const EcuSimulator&) = delete;

  /// Start the bridge listener, the service loop and (if enabled) the
  /// DTC generator. Returns false if the bridge could not be started.
  bool start();

  /// Stop everything and join all threads; safe to call twice
  void stop();

  bool is_running() const { return running_.load(); }

  /// Serve exactly one round of the fair loop (bus poll, then one bridge
  /// request). Returns the number of requests processed.
  size_t service_once();

  VirtualBus& bus() { return bus_; }
  dtc::DtcStore& dtc_store() { return store_; }
  DtcGenerator& generator() { return generator_; }
  ServiceDispatcher& dispatcher() { return dispatcher_; }
  bridge::BridgeServer& bridge_server() { return bridge_; }
  const EcuConfig& config() const { return config_; }

  uint64_t responses_sent() const { return responses_sent_.load(); }

private:
  void service_loop();
  void publish(const CANFrame& response);

  EcuConfig config_;
  uint32_t seed_;

  VirtualBus bus_;
  std::unique_ptr<BusEndpoint> endpoint_;
  FrameQueue bridge_requests_;

  dtc::DtcStore store_;
  ServiceDispatcher dispatcher_;
  DtcGenerator generator_;
  bridge::BridgeServer bridge_;

  std::atomic<bool> running_{false};
  std::thread service_thread_;
  std::atomic<uint64_t> responses_sent_{0};
};

} // namespace obdsim

#endif // OBDSIM_ECU_SIMULATOR_HPP
