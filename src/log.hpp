#pragma once

#include "mutex_ostream.hpp"

#include <ostream>
#include <string>

namespace repostore {

enum class log_level {
  debug = 0,
  info = 1,
  warn = 2,
  error = 3,
  off = 4,
};

// Set log level
void set_log_level(log_level level);

// Parse a log level name: debug, info, warn, error or off
log_level parse_log_level(const std::string& name);

// Returns the log stream if enabled, otherwise returns a null stream
mutex_ostream log(log_level level = log_level::info);

// Redirect log output. Intended for tests.
void set_log_stream(std::ostream& stream);

}  // namespace repostore
