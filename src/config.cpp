#include "obdsim/config.hpp"
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace obdsim {

namespace {

bool parse_unsigned(const std::string& text, unsigned long max, unsigned long& out) {
  if (text.empty() || text[0] == '-' || text[0] == '+') return false;
  errno = 0;
  char* end = nullptr;
  unsigned long value = std::strtoul(text.c_str(), &end, 0);
  if (errno != 0 || end == text.c_str() || *end != '\0' || value > max) {
    return false;
  }
  out = value;
  return true;
}

// Options shared by both programs. Returns false when `arg` is not one of
// them; sets result.error when it is but its value is bad.
bool parse_common(const std::string& arg, int argc, const char* const* argv, int& i,
                  std::string& host, uint16_t& port, logging::Level& level,
                  ParseResult& result) {
  auto next_value = [&](std::string& value) {
    if (i + 1 >= argc) {
      result.error = "missing value for " + arg;
      return false;
    }
    value = argv[++i];
    return true;
  };

  std::string value;
  if (arg == "-H" || arg == "--host") {
    if (next_value(value)) host = value;
    return true;
  }
  if (arg == "-p" || arg == "--port") {
    if (!next_value(value)) return true;
    unsigned long n = 0;
    if (!parse_unsigned(value, 0xFFFF, n)) {
      result.error = "invalid port: " + value;
    } else {
      port = static_cast<uint16_t>(n);
    }
    return true;
  }
  if (arg == "-v") {
    level = logging::Level::Debug;
    return true;
  }
  if (arg == "-l" || arg == "--loglevel") {
    if (!next_value(value)) return true;
    if (!logging::parse_level(value, level)) {
      result.error = "invalid log level: " + value;
    }
    return true;
  }
  if (arg == "-h" || arg == "--help") {
    result.help = true;
    return true;
  }
  return false;
}

} // namespace

ParseResult parse_ecu_args(int argc, const char* const* argv, EcuConfig& config) {
  ParseResult result;
  for (int i = 1; i < argc && result.error.empty(); ++i) {
    std::string arg = argv[i];

    if (parse_common(arg, argc, argv, i, config.host, config.port, config.log_level, result)) {
      continue;
    }

    if (arg == "-s" || arg == "--seed") {
      if (i + 1 >= argc) {
        result.error = "missing value for " + arg;
        break;
      }
      std::string value = argv[++i];
      unsigned long n = 0;
      if (!parse_unsigned(value, 0xFFFFFFFFUL, n)) {
        result.error = "invalid seed: " + value;
      } else {
        config.seed = static_cast<uint32_t>(n);
      }
    } else if (arg == "--no-generator") {
      config.generator.enabled = false;
    } else if (!arg.empty() && arg[0] == '-') {
      result.error = "unknown option: " + arg;
    } else {
      result.positional.push_back(arg);
    }
  }

  if (result.error.empty() && !result.positional.empty()) {
    result.error = "unexpected argument: " + result.positional.front();
  }
  result.ok = result.error.empty();
  return result;
}

ParseResult parse_reader_args(int argc, const char* const* argv, ReaderConfig& config) {
  ParseResult result;
  for (int i = 1; i < argc && result.error.empty(); ++i) {
    std::string arg = argv[i];

    if (parse_common(arg, argc, argv, i, config.host, config.port, config.log_level, result)) {
      continue;
    }

    if (arg == "-t" || arg == "--timeout") {
      if (i + 1 >= argc) {
        result.error = "missing value for " + arg;
        break;
      }
      std::string value = argv[++i];
      unsigned long ms = 0;
      if (!parse_unsigned(value, 3600000UL, ms) || ms == 0) {
        result.error = "invalid timeout: " + value;
      } else {
        config.timeout = std::chrono::milliseconds(ms);
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      result.error = "unknown option: " + arg;
    } else {
      result.positional.push_back(arg);
    }
  }

  result.ok = result.error.empty();
  return result;
}

std::string ecu_usage(const std::string& program) {
  std::ostringstream oss;
  oss << "Usage: " << program << " [options]\n"
      << "  -H, --host HOST        bridge listen address (default " << bridge::kDefaultHost << ")\n"
      << "  -p, --port PORT        bridge TCP port (default " << bridge::kDefaultPort << ")\n"
      << "  -s, --seed N           seed the simulation RNG\n"
      << "      --no-generator     do not inject trouble codes\n"
      << "  -v                     debug logging\n"
      << "  -l, --loglevel LEVEL   debug|info|warning|error|off\n"
      << "  -h, --help             show this message\n";
  return oss.str();
}

std::string reader_usage(const std::string& program) {
  std::ostringstream oss;
  oss << "Usage: " << program << " [options] <command> [args]\n"
      << "\nCommands:\n"
      << "  dashboard [N]          print N lines of live readings (default 10)\n"
      << "  dtcs                   list stored trouble codes\n"
      << "  clear                  clear stored trouble codes\n"
      << "  pid <hex>              raw Service 0x01 query\n"
      << "\nOptions:\n"
      << "  -H, --host HOST        bridge address (default " << bridge::kDefaultHost << ")\n"
      << "  -p, --port PORT        bridge TCP port (default " << bridge::kDefaultPort << ")\n"
      << "  -t, --timeout MS       response timeout (default 1000)\n"
      << "  -v                     debug logging\n"
      << "  -l, --loglevel LEVEL   debug|info|warning|error|off\n"
      << "  -h, --help             show this message\n";
  return oss.str();
}

} // namespace obdsim
