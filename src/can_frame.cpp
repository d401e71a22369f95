#include "obdsim/can_frame.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace obdsim {

// ============================================================================
// CANFrame Implementation
// ============================================================================

CANFrame::CANFrame(uint32_t id, std::initializer_list<uint8_t> bytes)
    : arbitration_id(id) {
  length = static_cast<uint8_t>(std::min<size_t>(bytes.size(), CAN_MAX_DLEN));
  std::copy_n(bytes.begin(), length, payload.begin());
}

CANFrame::CANFrame(uint32_t id, const std::vector<uint8_t>& bytes)
    : arbitration_id(id) {
  length = static_cast<uint8_t>(std::min<size_t>(bytes.size(), CAN_MAX_DLEN));
  std::copy_n(bytes.begin(), length, payload.begin());
}

std::vector<uint8_t> CANFrame::data() const {
  size_t n = std::min<size_t>(length, CAN_MAX_DLEN);
  return std::vector<uint8_t>(payload.begin(), payload.begin() + n);
}

bool CANFrame::operator==(const CANFrame& other) const {
  if (arbitration_id != other.arbitration_id || length != other.length) {
    return false;
  }
  size_t n = std::min<size_t>(length, CAN_MAX_DLEN);
  return std::equal(payload.begin(), payload.begin() + n, other.payload.begin());
}

std::string to_string(const CANFrame& frame) {
  std::ostringstream oss;
  oss << std::hex << std::uppercase << std::setfill('0')
      << std::setw(3) << frame.arbitration_id
      << " [" << std::dec << static_cast<int>(frame.length) << "]";

  oss << std::hex;
  for (uint8_t b : frame.data()) {
    oss << ' ' << std::setw(2) << static_cast<int>(b);
  }
  return oss.str();
}

// ============================================================================
// Bridge Codec Implementation
// ============================================================================

namespace codec {

WireFrame encode(const CANFrame& frame) {
  WireFrame wire{};

  // Little-endian 32-bit identifier
  wire[0] = static_cast<uint8_t>(frame.arbitration_id & 0xFF);
  wire[1] = static_cast<uint8_t>((frame.arbitration_id >> 8) & 0xFF);
  wire[2] = static_cast<uint8_t>((frame.arbitration_id >> 16) & 0xFF);
  wire[3] = static_cast<uint8_t>((frame.arbitration_id >> 24) & 0xFF);

  uint8_t len = std::min<uint8_t>(frame.length, CAN_MAX_DLEN);
  wire[kLengthOffset] = len;

  // Only meaningful bytes go on the wire; the rest stays zero
  std::copy_n(frame.payload.begin(), len, wire.begin() + kPayloadOffset);
  return wire;
}

bool decode(const uint8_t* data, size_t size, CANFrame& out) {
  if (data == nullptr || size != kWireSize) {
    return false;
  }

  uint8_t len = data[kLengthOffset];
  if (len > CAN_MAX_DLEN) {
    return false;
  }

  CANFrame frame;
  frame.arbitration_id = static_cast<uint32_t>(data[0]) |
                         (static_cast<uint32_t>(data[1]) << 8) |
                         (static_cast<uint32_t>(data[2]) << 16) |
                         (static_cast<uint32_t>(data[3]) << 24);
  frame.length = len;
  std::copy_n(data + kPayloadOffset, len, frame.payload.begin());

  out = frame;
  return true;
}

} // namespace codec

} // namespace obdsim
