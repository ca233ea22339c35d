#pragma once

#include <string>

namespace rec {
namespace log {

enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

void setLevel(Level level);
Level level();

// Info and debug go to stdout, warnings and errors to stderr.
// One call writes one whole line even with many worker threads.
void write(Level level, const std::string& message);

inline void debug(const std::string& message) { write(Level::kDebug, message); }
inline void info(const std::string& message) { write(Level::kInfo, message); }
inline void warn(const std::string& message) { write(Level::kWarn, message); }
inline void error(const std::string& message) { write(Level::kError, message); }

} // namespace log
} // namespace rec
