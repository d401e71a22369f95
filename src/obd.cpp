#include "obdsim/obd.hpp"
#include <iomanip>
#include <sstream>

namespace obdsim {
namespace obd {

uint8_t pid_data_size(uint8_t pid) {
  switch (static_cast<Pid>(pid)) {
    case Pid::SupportedPids01To20:    return 4;
    case Pid::EngineRpm:              return 2;
    case Pid::MafAirFlowRate:         return 2;
    case Pid::EngineLoad:
    case Pid::CoolantTemperature:
    case Pid::IntakeManifoldPressure:
    case Pid::VehicleSpeed:
    case Pid::IntakeAirTemperature:
    case Pid::ThrottlePosition:
    case Pid::BarometricPressure:     return 1;
    default:                          return 0;
  }
}

bool is_supported_pid(uint8_t pid) {
  return pid_data_size(pid) != 0;
}

const char* pid_name(uint8_t pid) {
  switch (static_cast<Pid>(pid)) {
    case Pid::SupportedPids01To20:    return "Supported PIDs";
    case Pid::EngineLoad:             return "Calculated engine load";
    case Pid::CoolantTemperature:     return "Engine coolant temperature";
    case Pid::IntakeManifoldPressure: return "Intake manifold absolute pressure";
    case Pid::EngineRpm:              return "Engine RPM";
    case Pid::VehicleSpeed:           return "Vehicle speed";
    case Pid::IntakeAirTemperature:   return "Intake air temperature";
    case Pid::MafAirFlowRate:         return "MAF air flow rate";
    case Pid::ThrottlePosition:       return "Throttle position";
    case Pid::BarometricPressure:     return "Absolute barometric pressure";
    default:                          return "Unknown PID";
  }
}

std::string hex_byte(uint8_t value) {
  std::ostringstream oss;
  oss << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
      << static_cast<int>(value);
  return oss.str();
}

CANFrame make_current_data_request(uint8_t pid) {
  return CANFrame(kFunctionalRequestId,
                  {0x02, static_cast<uint8_t>(Service::ShowCurrentData), pid,
                   0x00, 0x00, 0x00, 0x00, 0x00});
}

CANFrame make_service_request(Service service) {
  return CANFrame(kFunctionalRequestId,
                  {0x01, static_cast<uint8_t>(service),
                   0x00, 0x00, 0x00, 0x00, 0x00, 0x00});
}

} // namespace obd
} // namespace obdsim
