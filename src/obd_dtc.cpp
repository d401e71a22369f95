#include "obdsim/obd_dtc.hpp"
#include "obdsim/obd.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace obdsim {
namespace dtc {

// ============================================================================
// DTC Code Parsing/Formatting
// ============================================================================

std::string DiagnosticTroubleCode::to_string() const {
  std::ostringstream oss;
  oss << 'P' << std::hex << std::uppercase << std::setfill('0')
      << std::setw(2) << static_cast<int>(high)
      << std::setw(2) << static_cast<int>(low);
  return oss.str();
}

std::optional<Dtc> parse(const std::string& text) {
  if (text.length() != 5 || std::toupper(static_cast<unsigned char>(text[0])) != 'P') {
    return std::nullopt;
  }

  uint16_t numeric = 0;
  for (size_t i = 1; i < text.length(); ++i) {
    char c = text[i];
    uint8_t digit = 0;
    if (c >= '0' && c <= '9') digit = c - '0';
    else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
    else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
    else return std::nullopt;
    numeric = static_cast<uint16_t>((numeric << 4) | digit);
  }

  return Dtc{static_cast<uint8_t>(numeric >> 8), static_cast<uint8_t>(numeric & 0xFF)};
}

const std::array<Dtc, kPoolSize>& fault_pool() {
  static const std::array<Dtc, kPoolSize> pool = {{
    {0x01, 0x33},  // P0133
    {0x01, 0x71},  // P0171
    {0x01, 0x74},  // P0174
    {0x03, 0x00},  // P0300
    {0x03, 0x01},  // P0301
    {0x04, 0x20},  // P0420
    {0x04, 0x40},  // P0440
    {0x05, 0x62},  // P0562
  }};
  return pool;
}

const char* describe(const Dtc& code) {
  switch ((static_cast<uint16_t>(code.high) << 8) | code.low) {
    case 0x0133: return "O2 Sensor Circuit Slow Response";
    case 0x0171: return "System Too Lean (Bank 1)";
    case 0x0174: return "System Too Lean (Bank 2)";
    case 0x0300: return "Random/Multiple Cylinder Misfire";
    case 0x0301: return "Cylinder 1 Misfire Detected";
    case 0x0420: return "Catalyst System Efficiency Below Threshold";
    case 0x0440: return "EVAP System Malfunction";
    case 0x0562: return "System Voltage Low";
    default:     return "Unknown DTC";
  }
}

// ============================================================================
// Service 0x03 Record Layout
// ============================================================================

std::vector<uint8_t> build_read_response(const std::vector<Dtc>& codes) {
  std::vector<uint8_t> record;
  record.push_back(0x00);  // count, patched below
  record.push_back(obd::positive_response(obd::Service::ReadStoredDTCs));

  size_t n = std::min(codes.size(), kMaxCodesPerFrame);
  for (size_t i = 0; i < n; ++i) {
    record.push_back(codes[i].high);
    record.push_back(codes[i].low);
  }

  record[0] = static_cast<uint8_t>(record.size() - 1);
  record.resize(8, 0x00);
  return record;
}

std::optional<std::vector<Dtc>> parse_read_response(const std::vector<uint8_t>& payload) {
  if (payload.size() < 2 ||
      !obd::is_positive_response(payload[1], obd::Service::ReadStoredDTCs)) {
    return std::nullopt;
  }

  // Byte 0 counts the response code plus two bytes per DTC
  size_t declared = payload[0] > 0 ? (payload[0] - 1) / 2 : 0;
  size_t available = (payload.size() - 2) / 2;
  size_t pairs = std::min(declared, available);

  std::vector<Dtc> codes;
  for (size_t i = 0; i < pairs; ++i) {
    Dtc code{payload[2 + i * 2], payload[3 + i * 2]};
    if (!code.is_padding()) {
      codes.push_back(code);
    }
  }
  return codes;
}

// ============================================================================
// DtcStore Implementation
// ============================================================================

std::vector<Dtc> DtcStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return codes_;
}

bool DtcStore::insert_if_absent(const Dtc& code, size_t limit) {
  if (code.is_padding()) return false;

  std::lock_guard<std::mutex> lock(mutex_);
  if (codes_.size() >= limit) return false;
  if (std::find(codes_.begin(), codes_.end(), code) != codes_.end()) return false;
  codes_.push_back(code);
  return true;
}

bool DtcStore::remove(const Dtc& code) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find(codes_.begin(), codes_.end(), code);
  if (it == codes_.end()) return false;
  codes_.erase(it);
  return true;
}

size_t DtcStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t removed = codes_.size();
  codes_.clear();
  return removed;
}

bool DtcStore::contains(const Dtc& code) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::find(codes_.begin(), codes_.end(), code) != codes_.end();
}

size_t DtcStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return codes_.size();
}

} // namespace dtc
} // namespace obdsim
