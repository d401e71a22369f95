#include "obdsim/obd_reader.hpp"
#include "obdsim/logging.hpp"

namespace obdsim {

namespace {

constexpr const char* kComponent = "reader";

} // namespace

ObdReader::ObdReader(ICanDriver& tx, FrameQueue& rx, const ReaderConfig& config)
    : tx_(tx), rx_(rx), config_(config) {
}

std::optional<CANFrame> ObdReader::transact(const CANFrame& request,
                                            const FrameQueue::Predicate& match) {
  auto now = FrameQueue::Clock::now();
  size_t pruned = rx_.prune_before(now - config_.stale_after);
  if (pruned > 0) {
    logging::debug(kComponent, "discarded " + std::to_string(pruned) + " stale frame(s)");
  }

  auto sent_at = FrameQueue::Clock::now();
  if (!tx_.send(request)) {
    logging::warning(kComponent, "send failed: " + to_string(request));
    return std::nullopt;
  }

  CANFrame response;
  if (!rx_.take_first(match, response, sent_at + config_.timeout,
                      config_.poll_interval, sent_at)) {
    logging::debug(kComponent, "no response to " + to_string(request));
    return std::nullopt;
  }
  return response;
}

std::optional<CANFrame> ObdReader::query_pid(uint8_t pid) {
  const uint8_t expected = obd::positive_response(obd::Service::ShowCurrentData);
  auto match = [expected, pid](const CANFrame& f) {
    return f.arbitration_id == obd::kEcuResponseId && f.length >= 3 &&
           f.payload[1] == expected && f.payload[2] == pid;
  };

  auto response = transact(obd::make_current_data_request(pid), match);
  if (!response) {
    logging::debug(kComponent, "PID " + obd::hex_byte(pid) + ": no data");
  }
  return response;
}

std::optional<CANFrame> ObdReader::query_service(obd::Service service) {
  const uint8_t expected = obd::positive_response(service);
  auto match = [expected](const CANFrame& f) {
    return f.arbitration_id == obd::kEcuResponseId && f.length >= 2 &&
           f.payload[1] == expected;
  };
  return transact(obd::make_service_request(service), match);
}

std::optional<std::vector<uint8_t>> ObdReader::read_pid_data(obd::Pid pid, size_t size) {
  auto response = query_pid(static_cast<uint8_t>(pid));
  if (!response) return std::nullopt;

  if (response->length < 3 + size) {
    logging::warning(kComponent, "PID " + obd::hex_byte(static_cast<uint8_t>(pid)) +
                                     " response too short: " + to_string(*response));
    return std::nullopt;
  }
  return std::vector<uint8_t>(response->payload.begin() + 3,
                              response->payload.begin() + 3 + size);
}

std::optional<double> ObdReader::read_rpm() {
  auto d = read_pid_data(obd::Pid::EngineRpm, 2);
  if (!d) return std::nullopt;
  return obd::decode::rpm((*d)[0], (*d)[1]);
}

std::optional<int> ObdReader::read_speed() {
  auto d = read_pid_data(obd::Pid::VehicleSpeed, 1);
  if (!d) return std::nullopt;
  return obd::decode::speed((*d)[0]);
}

std::optional<int> ObdReader::read_coolant_temp() {
  auto d = read_pid_data(obd::Pid::CoolantTemperature, 1);
  if (!d) return std::nullopt;
  return obd::decode::temperature((*d)[0]);
}

std::optional<double> ObdReader::read_throttle() {
  auto d = read_pid_data(obd::Pid::ThrottlePosition, 1);
  if (!d) return std::nullopt;
  return obd::decode::percent((*d)[0]);
}

std::optional<double> ObdReader::read_engine_load() {
  auto d = read_pid_data(obd::Pid::EngineLoad, 1);
  if (!d) return std::nullopt;
  return obd::decode::percent((*d)[0]);
}

std::optional<int> ObdReader::read_intake_temp() {
  auto d = read_pid_data(obd::Pid::IntakeAirTemperature, 1);
  if (!d) return std::nullopt;
  return obd::decode::temperature((*d)[0]);
}

std::optional<double> ObdReader::read_maf() {
  auto d = read_pid_data(obd::Pid::MafAirFlowRate, 2);
  if (!d) return std::nullopt;
  return obd::decode::maf((*d)[0], (*d)[1]);
}

std::optional<int> ObdReader::read_intake_pressure() {
  auto d = read_pid_data(obd::Pid::IntakeManifoldPressure, 1);
  if (!d) return std::nullopt;
  return obd::decode::pressure((*d)[0]);
}

std::optional<int> ObdReader::read_barometric_pressure() {
  auto d = read_pid_data(obd::Pid::BarometricPressure, 1);
  if (!d) return std::nullopt;
  return obd::decode::pressure((*d)[0]);
}

std::optional<uint32_t> ObdReader::read_supported_pids() {
  auto d = read_pid_data(obd::Pid::SupportedPids01To20, 4);
  if (!d) return std::nullopt;
  return obd::decode::bitmap((*d)[0], (*d)[1], (*d)[2], (*d)[3]);
}

std::optional<std::vector<dtc::Dtc>> ObdReader::read_dtcs() {
  auto response = query_service(obd::Service::ReadStoredDTCs);
  if (!response) return std::nullopt;

  auto codes = dtc::parse_read_response(response->data());
  if (!codes) {
    logging::warning(kComponent, "malformed Service 0x03 response: " + to_string(*response));
  }
  return codes;
}

bool ObdReader::clear_dtcs() {
  return query_service(obd::Service::ClearDTCs).has_value();
}

} // namespace obdsim
