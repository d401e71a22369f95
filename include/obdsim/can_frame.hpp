#ifndef OBDSIM_CAN_FRAME_HPP
#define OBDSIM_CAN_FRAME_HPP

/**
 * @file can_frame.hpp
 * @brief Classical CAN frame and its fixed-width bridge encoding
 *
 * Bridge wire format (13 bytes, no delimiter, no checksum):
 *
 *   offset  size  field
 *   0       4     arbitration id, little-endian
 *   4       1     length (0-8, number of meaningful payload bytes)
 *   5       8     payload, left-justified, zero-padded
 *
 * A receiver must read exactly kWireSize bytes before interpreting a message.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace obdsim {

// ============================================================================
// CAN Protocol Constants (ISO 11898)
// ============================================================================

constexpr uint8_t  CAN_MAX_DLEN = 8;            // Maximum data length for standard CAN
constexpr uint32_t CAN_SFF_MASK = 0x000007FFU;  // Standard ID mask (11 bits)

// ============================================================================
// CAN Frame Structure
// ============================================================================

struct CANFrame {
  uint32_t arbitration_id{0};                 // CAN identifier (11 bit used)
  uint8_t length{0};                          // Meaningful payload bytes (0-8)
  std::array<uint8_t, CAN_MAX_DLEN> payload{};  // Bytes >= length are padding

  CANFrame() = default;

  /// Build a frame from its meaningful bytes; anything beyond 8 bytes is dropped.
  CANFrame(uint32_t id, std::initializer_list<uint8_t> bytes);
  CANFrame(uint32_t id, const std::vector<uint8_t>& bytes);

  /// Meaningful bytes only (payload truncated to length)
  std::vector<uint8_t> data() const;

  /// Payload byte at index, or 0 when the index lies past length
  uint8_t at(size_t index) const {
    return index < length && index < CAN_MAX_DLEN ? payload[index] : 0;
  }

  bool is_standard_id() const { return arbitration_id <= CAN_SFF_MASK; }

  bool operator==(const CANFrame& other) const;
  bool operator!=(const CANFrame& other) const { return !(*this == other); }
};

/// Human-readable "7E8 [4] 03 41 0D 37" form for logs
std::string to_string(const CANFrame& frame);

// ============================================================================
// Bridge Frame Codec
// ============================================================================

namespace codec {

constexpr size_t kWireSize = 13;
constexpr size_t kIdSize = 4;
constexpr size_t kLengthOffset = 4;
constexpr size_t kPayloadOffset = 5;

using WireFrame = std::array<uint8_t, kWireSize>;

/// Encode a frame into its 13-byte wire form. A length above 8 is clamped.
WireFrame encode(const CANFrame& frame);

/// Decode exactly kWireSize bytes. Returns false for any other size or for a
/// length byte above 8; `out` is untouched on failure. Payload bytes beyond
/// the decoded length are cleared.
bool decode(const uint8_t* data, size_t size, CANFrame& out);

inline bool decode(const WireFrame& wire, CANFrame& out) {
  return decode(wire.data(), wire.size(), out);
}

inline bool decode(const std::vector<uint8_t>& wire, CANFrame& out) {
  return decode(wire.data(), wire.size(), out);
}

} // namespace codec

} // namespace obdsim

#endif // OBDSIM_CAN_FRAME_HPP
