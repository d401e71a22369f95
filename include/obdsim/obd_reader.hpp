#ifndef OBDSIM_OBD_READER_HPP
#define OBDSIM_OBD_READER_HPP

/**
 * @file obd_reader.hpp
 * @brief Tester side of OBD-II: send one request, wait for the matching answer
 *
 * Responses carry no request identifier, so a response is accepted when it
 * - arrives on 0x7E8,
 * - has byte 1 == requested service + 0x40,
 * - for Service 0x01, has byte 2 == requested PID,
 * - and was received after the request went out.
 * Frames that do not match stay queued in arrival order. Frames older than
 * ReaderConfig::stale_after are discarded at the start of every query.
 *
 * A missing answer is reported as an empty optional (or false), never as an
 * exception.
 *
 * Usage:
 * @code
 *   obdsim::bridge::BridgeClient link;
 *   if (!link.connect("127.0.0.1", 55555)) return 1;
 *   obdsim::ObdReader reader(link, link.inbound());
 *   if (auto rpm = reader.read_rpm()) std::cout << *rpm << " rpm\n";
 * @endcode
 */

#include <cstdint>
#include <optional>
#include <vector>
#include "obdsim/can_bus.hpp"
#include "obdsim/can_frame.hpp"
#include "obdsim/config.hpp"
#include "obdsim/frame_queue.hpp"
#include "obdsim/obd.hpp"
#include "obdsim/obd_dtc.hpp"

namespace obdsim {

class ObdReader {
public:
  /**
   * @param tx Driver requests are sent through
   * @param rx Queue the responses for `tx` arrive in
   * @param config Timeout, poll interval and stale horizon
   */
  ObdReader(ICanDriver& tx, FrameQueue& rx, const ReaderConfig& config = ReaderConfig{});

  // ==========================================================================
  // Raw queries
  // ==========================================================================

  /// Service 0x01 request for `pid`; the full response frame or nullopt
  std::optional<CANFrame> query_pid(uint8_t pid);

  /// Service 0x03 / 0x04 request; the full response frame or nullopt
  std::optional<CANFrame> query_service(obd::Service service);

  // ==========================================================================
  // Decoded readings
  // ==========================================================================

  std::optional<double> read_rpm();
  std::optional<int> read_speed();               ///< km/h
  std::optional<int> read_coolant_temp();        ///< degC
  std::optional<double> read_throttle();         ///< %
  std::optional<double> read_engine_load();      ///< %
  std::optional<int> read_intake_temp();         ///< degC
  std::optional<double> read_maf();              ///< g/s
  std::optional<int> read_intake_pressure();     ///< kPa
  std::optional<int> read_barometric_pressure(); ///< kPa

  /// PID 0x00 bitmap, bit 31 = PID 0x01
  std::optional<uint32_t> read_supported_pids();

  // ==========================================================================
  // Trouble codes
  // ==========================================================================

  /// Stored DTCs (at most three, the capacity of one response frame)
  std::optional<std::vector<dtc::Dtc>> read_dtcs();

  /// True iff the ECU acknowledged the clear
  bool clear_dtcs();

  const ReaderConfig& config() const { return config_; }

private:
  std::optional<CANFrame> transact(const CANFrame& request, const FrameQueue::Predicate& match);

  /// Query `pid` and return its data bytes if at least `size` arrived
  std::optional<std::vector<uint8_t>> read_pid_data(obd::Pid pid, size_t size);

  ICanDriver& tx_;
  FrameQueue& rx_;
  ReaderConfig config_;
};

} // namespace obdsim

#endif // OBDSIM_OBD_READER_HPP
