#include "obdsim/service_dispatcher.hpp"
#include "obdsim/logging.hpp"
#include <vector>

namespace obdsim {

namespace {

constexpr const char* kComponent = "dispatcher";

// [N, 0x41, pid, data...] with N counting everything after itself
CANFrame current_data_response(uint8_t pid, std::initializer_list<uint8_t> data) {
  std::vector<uint8_t> bytes;
  bytes.reserve(3 + data.size());
  bytes.push_back(static_cast<uint8_t>(2 + data.size()));
  bytes.push_back(obd::positive_response(obd::Service::ShowCurrentData));
  bytes.push_back(pid);
  bytes.insert(bytes.end(), data.begin(), data.end());
  return CANFrame(obd::kEcuResponseId, bytes);
}

} // namespace

ServiceDispatcher::ServiceDispatcher(dtc::DtcStore& store, uint32_t seed)
    : store_(store), rng_(seed) {
}

uint8_t ServiceDispatcher::random_byte(uint8_t lo, uint8_t hi) {
  std::lock_guard<std::mutex> lock(rng_mutex_);
  std::uniform_int_distribution<int> dist(lo, hi);
  return static_cast<uint8_t>(dist(rng_));
}

std::optional<CANFrame> ServiceDispatcher::handle(const CANFrame& request) {
  if (request.arbitration_id != obd::kFunctionalRequestId) {
    logging::debug(kComponent, "ignoring frame " + to_string(request));
    ++ignored_;
    return std::nullopt;
  }
  if (request.length < 2) {
    logging::warning(kComponent, "request too short: " + to_string(request));
    ++ignored_;
    return std::nullopt;
  }

  std::optional<CANFrame> response;
  uint8_t service = request.payload[1];

  switch (static_cast<obd::Service>(service)) {
    case obd::Service::ShowCurrentData:
      if (request.length < 3) {
        logging::warning(kComponent, "Service 0x01 request without PID: " + to_string(request));
        break;
      }
      response = show_current_data(request.payload[2]);
      break;

    case obd::Service::ReadStoredDTCs:
      response = read_stored_dtcs();
      break;

    case obd::Service::ClearDTCs:
      response = clear_dtcs();
      break;

    default:
      logging::warning(kComponent, "unsupported service " + obd::hex_byte(service));
      break;
  }

  if (response) {
    ++handled_;
    logging::debug(kComponent, to_string(request) + " -> " + to_string(*response));
  } else {
    ++ignored_;
  }
  return response;
}

std::optional<CANFrame> ServiceDispatcher::show_current_data(uint8_t pid) {
  switch (static_cast<obd::Pid>(pid)) {
    case obd::Pid::SupportedPids01To20:
      return current_data_response(pid, {kSupportedPidBitmap[0], kSupportedPidBitmap[1],
                                         kSupportedPidBitmap[2], kSupportedPidBitmap[3]});
    case obd::Pid::EngineLoad:
      return current_data_response(pid, {kEngineLoadRaw});
    case obd::Pid::CoolantTemperature:
      // 88..95 degC
      return current_data_response(pid, {random_byte(128, 135)});
    case obd::Pid::IntakeManifoldPressure:
      return current_data_response(pid, {random_byte(10, 40)});
    case obd::Pid::EngineRpm: {
      uint8_t a = random_byte(18, 70);
      uint8_t b = random_byte(0, 255);
      return current_data_response(pid, {a, b});
    }
    case obd::Pid::VehicleSpeed:
      return current_data_response(pid, {random_byte(40, 60)});
    case obd::Pid::IntakeAirTemperature:
      return current_data_response(pid, {random_byte(60, 64)});
    case obd::Pid::MafAirFlowRate:
      return current_data_response(pid, {kMafRaw[0], kMafRaw[1]});
    case obd::Pid::ThrottlePosition:
      return current_data_response(pid, {random_byte(20, 60)});
    case obd::Pid::BarometricPressure:
      return current_data_response(pid, {random_byte(20, 60)});
  }

  logging::warning(kComponent, "unsupported PID " + obd::hex_byte(pid));
  return std::nullopt;
}

CANFrame ServiceDispatcher::read_stored_dtcs() {
  auto codes = store_.snapshot();
  if (codes.size() > dtc::kMaxCodesPerFrame) {
    logging::debug(kComponent, std::to_string(codes.size() - dtc::kMaxCodesPerFrame) +
                                   " DTC(s) do not fit in the response");
  }
  return CANFrame(obd::kEcuResponseId, dtc::build_read_response(codes));
}

CANFrame ServiceDispatcher::clear_dtcs() {
  size_t removed = store_.clear();
  logging::info(kComponent, "cleared " + std::to_string(removed) + " DTC(s)");
  return CANFrame(obd::kEcuResponseId,
                  {0x01, obd::positive_response(obd::Service::ClearDTCs),
                   0x00, 0x00, 0x00, 0x00, 0x00, 0x00});
}

} // namespace obdsim
