#ifndef OBDSIM_OBD_DTC_HPP
#define OBDSIM_OBD_DTC_HPP

/**
 * @file obd_dtc.hpp
 * @brief Diagnostic Trouble Codes for OBD-II Service 0x03 / 0x04
 *
 * DTC Format (SAE J2012, two bytes as carried by Service 0x03):
 * - [High][Low], rendered "P<High:02X><Low:02X>" (e.g. 0x03 0x01 -> "P0301")
 * - Only powertrain codes are simulated, so the system letter is always 'P'
 * - The pair 0x00 0x00 is padding in a Service 0x03 response and is never
 *   an active code
 *
 * Service 0x03 positive response (single frame, at most three codes):
 *   [N] [0x43] [DTC1 H] [DTC1 L] [DTC2 H] [DTC2 L] [DTC3 H] [DTC3 L]
 *   where N = 1 + 2 * (number of codes in the frame)
 *
 * Usage:
 * @code
 *   obdsim::dtc::DtcStore store;
 *   store.insert_if_absent({0x03, 0x01});
 *   for (const auto& code : store.snapshot()) {
 *     std::cout << code.to_string() << " " << obdsim::dtc::describe(code) << "\n";
 *   }
 * @endcode
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace obdsim {
namespace dtc {

// ============================================================================
// DTC Data Structures
// ============================================================================

struct DiagnosticTroubleCode {
  uint8_t high{0};
  uint8_t low{0};

  /// "P0301" style text
  std::string to_string() const;

  /// Zero pair used as padding, never a stored code
  bool is_padding() const { return high == 0 && low == 0; }

  bool operator==(const DiagnosticTroubleCode& other) const {
    return high == other.high && low == other.low;
  }
  bool operator!=(const DiagnosticTroubleCode& other) const { return !(*this == other); }
};

using Dtc = DiagnosticTroubleCode;

/// Parse "P0301" (case-insensitive letter, four hex digits). Only 'P' codes
/// are accepted.
std::optional<Dtc> parse(const std::string& text);

/// Human-readable description of a known code, "Unknown DTC" otherwise
const char* describe(const Dtc& code);

// ============================================================================
// Simulated fault pool
// ============================================================================

constexpr size_t kPoolSize = 8;

/// Common powertrain faults the background generator draws from
const std::array<Dtc, kPoolSize>& fault_pool();

// ============================================================================
// Service 0x03 record layout
// ============================================================================

constexpr size_t kMaxCodesPerFrame = 3;

/// Build the 8-byte Service 0x03 payload from the first (up to) three codes
std::vector<uint8_t> build_read_response(const std::vector<Dtc>& codes);

/// Extract codes from a Service 0x03 payload. Padding pairs are skipped and
/// the count in byte 0 bounds the pairs read. Returns nullopt when byte 1 is
/// not 0x43.
std::optional<std::vector<Dtc>> parse_read_response(const std::vector<uint8_t>& payload);

// ============================================================================
// Active DTC store
// ============================================================================

/// Insertion-ordered, duplicate-free set of active codes. Every operation is
/// atomic with respect to every other one.
class DtcStore {
public:
  static constexpr size_t kUnbounded = std::numeric_limits<size_t>::max();

  DtcStore() = default;

  DtcStore(const DtcStore&) = delete;
  DtcStore& operator=(const DtcStore&) = delete;

  /// Immutable copy of the current codes in insertion order
  std::vector<Dtc> snapshot() const;

  /// Append `code` unless it is already present, padding, or the store
  /// already holds `limit` codes. Returns true if the code was added.
  bool insert_if_absent(const Dtc& code, size_t limit = kUnbounded);

  /// Remove `code`; returns false if it was not present
  bool remove(const Dtc& code);

  /// Remove every code; returns how many were removed
  size_t clear();

  bool contains(const Dtc& code) const;
  size_t size() const;
  bool empty() const { return size() == 0; }

private:
  mutable std::mutex mutex_;
  std::vector<Dtc> codes_;
};

} // namespace dtc
} // namespace obdsim

#endif // OBDSIM_OBD_DTC_HPP
