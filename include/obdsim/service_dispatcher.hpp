#ifndef OBDSIM_SERVICE_DISPATCHER_HPP
#define OBDSIM_SERVICE_DISPATCHER_HPP

/**
 * @file service_dispatcher.hpp
 * @brief ECU side of OBD-II: turns one request frame into at most one response
 *
 * Supported requests (functional address 0x7DF only):
 * - 0x01 Show Current Data for the PIDs listed in obd.hpp
 * - 0x03 Read Stored DTCs (first three active codes)
 * - 0x04 Clear DTCs
 *
 * Anything else is logged and left unanswered, which is what a real ECU does
 * on the functional address.
 */

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include "obdsim/can_frame.hpp"
#include "obdsim/obd.hpp"
#include "obdsim/obd_dtc.hpp"

namespace obdsim {

/// Supported PIDs 0x01-0x20 advertised in the PID 0x00 response
constexpr uint8_t kSupportedPidBitmap[4] = {0xBF, 0xDF, 0xB9, 0x91};
constexpr uint8_t kEngineLoadRaw = 0x20;
constexpr uint8_t kMafRaw[2] = {0x00, 0xFA};

class ServiceDispatcher {
public:
  ServiceDispatcher(dtc::DtcStore& store, uint32_t seed);

  ServiceDispatcher(const ServiceDispatcher&) = delete;
  ServiceDispatcher& operator=(const ServiceDispatcher&) = delete;

  /// Response for `request`, or nullopt when the ECU stays silent
  std::optional<CANFrame> handle(const CANFrame& request);

  // Per-service handlers, callable directly
  std::optional<CANFrame> show_current_data(uint8_t pid);
  CANFrame read_stored_dtcs();
  CANFrame clear_dtcs();

  uint64_t requests_handled() const { return handled_.load(); }
  uint64_t requests_ignored() const { return ignored_.load(); }

private:
  uint8_t random_byte(uint8_t lo, uint8_t hi);

  dtc::DtcStore& store_;
  std::mutex rng_mutex_;
  std::mt19937 rng_;

  std::atomic<uint64_t> handled_{0};
  std::atomic<uint64_t> ignored_{0};
};

} // namespace obdsim

#endif // OBDSIM_SERVICE_DISPATCHER_HPP
