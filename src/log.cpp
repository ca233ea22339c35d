#include "log.h"
#include <atomic>
#include <iostream>
#include <mutex>

namespace rec {
namespace log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::kInfo)};
std::mutex g_mutex;

const char* tag(Level level) {
  switch (level) {
    case Level::kDebug: return "[debug] ";
    case Level::kInfo: return "[info] ";
    case Level::kWarn: return "[warn] ";
    case Level::kError: return "[error] ";
  }
  return "";
}

} // namespace

void setLevel(Level level) {
  g_level.store(static_cast<int>(level));
}

Level level() {
  return static_cast<Level>(g_level.load());
}

void write(Level level, const std::string& message) {
  if (static_cast<int>(level) < g_level.load()) {
    return;
  }

  std::lock_guard<std::mutex> lock(g_mutex);
  if (level >= Level::kWarn) {
    std::cerr << tag(level) << message << std::endl;
  } else {
    std::cout << tag(level) << message << std::endl;
  }
}

} // namespace log
} // namespace rec
