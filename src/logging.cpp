#include "../include/logging.h"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {

std::atomic<int> min_level{static_cast<int>(LogLevel::INFO)};
std::mutex log_mutex;

const char *level_prefix(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "debug ";
  case LogLevel::WARN:
    return "warn ";
  case LogLevel::ERROR:
    return "error ";
  default:
    return "";
  }
}

} // namespace

void set_log_level(LogLevel level) { min_level = static_cast<int>(level); }

LogLevel get_log_level() { return static_cast<LogLevel>(min_level.load()); }

void log_message(LogLevel level, const std::string &tag,
                 const std::string &text) {
  if (static_cast<int>(level) < min_level.load())
    return;
  std::lock_guard<std::mutex> lock(log_mutex);
  std::cerr << "[" << tag << "] " << level_prefix(level) << text << "\n";
}
