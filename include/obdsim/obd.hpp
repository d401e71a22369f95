#ifndef OBDSIM_OBD_HPP
#define OBDSIM_OBD_HPP

/**
 * @file obd.hpp
 * @brief OBD-II (SAE J1979 / ISO 15031-5) identifiers, services and PIDs
 *
 * MESSAGE FORMAT (single CAN frame, 11-bit addressing):
 * - Request:  [N] [Service] [PID] [padding...]   on 0x7DF (functional)
 * - Positive: [N] [Service+0x40] [PID] [data...] on 0x7E8 (ECU #1)
 *
 * Byte 0 always counts the meaningful bytes that follow it.
 * An ECU that does not support a request stays silent; there is no
 * negative response on the functional address.
 */

#include <cstdint>
#include <string>
#include "obdsim/can_frame.hpp"

namespace obdsim {
namespace obd {

// ============================================================================
// Addressing
// ============================================================================

constexpr uint32_t kFunctionalRequestId = 0x7DF;  ///< Broadcast to all ECUs
constexpr uint32_t kEcuResponseId       = 0x7E8;  ///< ECU #1 response

// ============================================================================
// Services
// ============================================================================

enum class Service : uint8_t {
  ShowCurrentData = 0x01,  ///< Live data by PID
  ReadStoredDTCs  = 0x03,  ///< Confirmed emission-related DTCs
  ClearDTCs       = 0x04   ///< Clear DTCs and stored values
};

// Positive responses use Service + 0x40
constexpr uint8_t kPositiveResponseOffset = 0x40;

constexpr uint8_t positive_response(Service s) {
  return static_cast<uint8_t>(static_cast<uint8_t>(s) + kPositiveResponseOffset);
}

inline bool is_positive_response(uint8_t rx, Service req) {
  return rx == positive_response(req);
}

// ============================================================================
// Service 0x01 Parameter IDs
// ============================================================================

enum class Pid : uint8_t {
  SupportedPids01To20    = 0x00,  ///< 4-byte bitmap
  EngineLoad             = 0x04,  ///< A*100/255 %
  CoolantTemperature     = 0x05,  ///< A-40 degC
  IntakeManifoldPressure = 0x0B,  ///< A kPa
  EngineRpm              = 0x0C,  ///< ((A*256)+B)/4 rpm
  VehicleSpeed           = 0x0D,  ///< A km/h
  IntakeAirTemperature   = 0x0F,  ///< A-40 degC
  MafAirFlowRate         = 0x10,  ///< ((A*256)+B)/100 g/s
  ThrottlePosition       = 0x11,  ///< A*100/255 %
  BarometricPressure     = 0x33   ///< A kPa
};

/// Number of data bytes following the PID in a positive response, or 0 for
/// a PID this simulator does not implement.
uint8_t pid_data_size(uint8_t pid);

bool is_supported_pid(uint8_t pid);

const char* pid_name(uint8_t pid);

/// "0x0C" style text for service and PID bytes in log lines
std::string hex_byte(uint8_t value);

// ============================================================================
// Frame builders
// ============================================================================

/// [0x02, 0x01, pid, 0...] on 0x7DF, length 8
CANFrame make_current_data_request(uint8_t pid);

/// [0x01, service, 0...] on 0x7DF, length 8
CANFrame make_service_request(Service service);

// ============================================================================
// Value decoding (SAE J1979 formulas)
// ============================================================================

namespace decode {

inline double rpm(uint8_t a, uint8_t b) { return ((a * 256.0) + b) / 4.0; }
inline int temperature(uint8_t a) { return static_cast<int>(a) - 40; }
inline double percent(uint8_t a) { return (a * 100.0) / 255.0; }
inline double maf(uint8_t a, uint8_t b) { return ((a * 256.0) + b) / 100.0; }
inline int speed(uint8_t a) { return a; }
inline int pressure(uint8_t a) { return a; }

inline uint32_t bitmap(uint8_t a, uint8_t b, uint8_t c, uint8_t d) {
  return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(b) << 16) |
         (static_cast<uint32_t>(c) << 8) | static_cast<uint32_t>(d);
}

/// True when PID (1..0x20) is flagged in a PID 0x00 bitmap; bit 31 is PID 0x01.
inline bool bitmap_has_pid(uint32_t mask, uint8_t pid) {
  if (pid == 0 || pid > 0x20) return false;
  return (mask >> (32 - pid)) & 0x01;
}

} // namespace decode

} // namespace obd
} // namespace obdsim

#endif // OBDSIM_OBD_HPP
