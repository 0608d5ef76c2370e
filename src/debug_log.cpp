#include "debug_log.hpp"
#include "config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

bool debug_log_enabled() {
  static bool enabled = [] {
    const char* path = std::getenv(SLATE_DEBUG_LOG_ENV);
    return path != nullptr && *path != '\0';
  }();
  return enabled;
}

std::ostream& debug_log() {
  static std::ofstream log;
  static std::ostream null_stream(nullptr);
  static bool initialized = false;
  if (!debug_log_enabled()) return null_stream;
  if (!initialized) {
    initialized = true;
    const char* path = std::getenv(SLATE_DEBUG_LOG_ENV);
    log.open(path, std::ios::app);
    if (!log) std::cerr << "[slate] failed to open debug log at '" << path << "'\n";
  }
  if (!log) return null_stream;
  return log;
}
