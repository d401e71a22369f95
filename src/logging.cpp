#include "obdsim/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace obdsim {
namespace logging {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_output_mutex;

} // namespace

void set_level(Level level) {
  g_level.store(level);
}

Level level() {
  return g_level.load();
}

bool enabled(Level lvl) {
  return lvl != Level::Off && lvl >= g_level.load();
}

bool parse_level(const std::string& text, Level& out) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "debug") { out = Level::Debug; return true; }
  if (lower == "info") { out = Level::Info; return true; }
  if (lower == "warn" || lower == "warning") { out = Level::Warning; return true; }
  if (lower == "error") { out = Level::Error; return true; }
  if (lower == "off" || lower == "none") { out = Level::Off; return true; }
  return false;
}

const char* level_name(Level lvl) {
  switch (lvl) {
    case Level::Debug:   return "DEBUG";
    case Level::Info:    return "INFO";
    case Level::Warning: return "WARNING";
    case Level::Error:   return "ERROR";
    case Level::Off:     return "OFF";
    default:             return "UNKNOWN";
  }
}

void write(Level lvl, const std::string& component, const std::string& message) {
  if (!enabled(lvl)) return;

  std::lock_guard<std::mutex> lock(g_output_mutex);
  std::cerr << level_name(lvl) << ':' << component << ": " << message << "\n";
}

} // namespace logging
} // namespace obdsim
