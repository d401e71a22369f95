#ifndef OBDSIM_CONFIG_HPP
#define OBDSIM_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Runtime configuration for the ECU simulator and the reader
 *
 * Command line (both programs):
 *   -H, --host HOST        bridge address            (default 127.0.0.1)
 *   -p, --port PORT        bridge TCP port           (default 55555)
 *   -v                     debug logging
 *   -l, --loglevel LEVEL   debug|info|warning|error|off
 *   -h, --help             usage
 *
 * ECU simulator only:
 *   -s, --seed N           seed the simulation RNG
 *       --no-generator     do not start the background DTC generator
 *
 * Reader only:
 *   -t, --timeout MS       response timeout
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "obdsim/logging.hpp"
#include "obdsim/tcp_bridge.hpp"

namespace obdsim {

/// Background DTC generator tuning
struct GeneratorConfig {
  bool enabled = true;
  std::chrono::milliseconds min_period{std::chrono::seconds(5)};
  std::chrono::milliseconds max_period{std::chrono::seconds(10)};
  double insert_probability = 0.7;
  double remove_probability = 0.1;
  size_t max_active_codes = 5;
};

struct EcuConfig {
  std::string host = bridge::kDefaultHost;
  uint16_t port = bridge::kDefaultPort;

  /// Upper bound on one local bus poll in the service loop
  std::chrono::milliseconds bus_poll{std::chrono::milliseconds(10)};

  GeneratorConfig generator{};

  /// Fixed RNG seed for reproducible runs; random_device when empty
  std::optional<uint32_t> seed;

  logging::Level log_level = logging::Level::Info;
};

struct ReaderConfig {
  std::string host = bridge::kDefaultHost;
  uint16_t port = bridge::kDefaultPort;

  std::chrono::milliseconds timeout{std::chrono::milliseconds(1000)};
  std::chrono::milliseconds poll_interval{std::chrono::milliseconds(10)};

  /// Queued responses older than this are discarded before each query
  std::chrono::milliseconds stale_after{std::chrono::seconds(10)};

  logging::Level log_level = logging::Level::Warning;
};

/// Result of command-line parsing
struct ParseResult {
  bool ok = false;
  bool help = false;                  ///< -h seen; caller prints usage
  std::string error;                  ///< Set when ok == false
  std::vector<std::string> positional;  ///< Non-option arguments in order
};

ParseResult parse_ecu_args(int argc, const char* const* argv, EcuConfig& config);
ParseResult parse_reader_args(int argc, const char* const* argv, ReaderConfig& config);

std::string ecu_usage(const std::string& program);
std::string reader_usage(const std::string& program);

} // namespace obdsim

#endif // OBDSIM_CONFIG_HPP
