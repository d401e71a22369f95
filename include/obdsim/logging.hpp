#ifndef OBDSIM_LOGGING_HPP
#define OBDSIM_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief Minimal leveled diagnostics on std::cerr
 *
 * Lines are written as "LEVEL:component: message". A single process-wide
 * threshold filters everything below it. Output from concurrent threads is
 * serialized so lines never interleave.
 */

#include <cstdint>
#include <string>

namespace obdsim {
namespace logging {

enum class Level : uint8_t {
  Debug   = 0,
  Info    = 1,
  Warning = 2,
  Error   = 3,
  Off     = 4
};

void set_level(Level level);
Level level();

bool enabled(Level level);

/// Parse "debug", "INFO", "warn", "warning", "error", "off" (case-insensitive)
bool parse_level(const std::string& text, Level& out);

const char* level_name(Level level);

void write(Level level, const std::string& component, const std::string& message);

inline void debug(const std::string& component, const std::string& message) {
  write(Level::Debug, component, message);
}

inline void info(const std::string& component, const std::string& message) {
  write(Level::Info, component, message);
}

inline void warning(const std::string& component, const std::string& message) {
  write(Level::Warning, component, message);
}

inline void error(const std::string& component, const std::string& message) {
  write(Level::Error, component, message);
}

} // namespace logging
} // namespace obdsim

#endif // OBDSIM_LOGGING_HPP
