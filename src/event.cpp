#include "event.hpp"

#include "commit_ostream.hpp"

#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace repostore {

static bool _events_enabled = false;
static std::ostream* _stream = &std::cout;
static std::mutex _mutex;

void set_events_enabled(bool enabled) { _events_enabled = enabled; }
bool events_enabled() { return _events_enabled; }

void set_event_stream(std::ostream& stream) {
  std::lock_guard<std::mutex> lock(_mutex);
  _stream = &stream;
}

// Emit an event in JSON format
void event(const std::string& type, nlohmann::json fields) {
  if (!_events_enabled) {
    return;
  }

  nlohmann::json record = {{"type", type}};
  if (fields.is_object()) {
    record.update(fields);
  }

  commit_ostream stream([](const std::string& message) {
    std::lock_guard<std::mutex> lock(_mutex);
    *_stream << message << std::flush;
  });
  stream << record.dump() << "\n";
}

nlohmann::json to_json(const file_descriptor& descriptor) {
  nlohmann::json object = {
      {"name", descriptor.name},
      {"path", descriptor.path},
      {"kind", to_string(descriptor.kind)},
      {"sha", descriptor.revision},
  };
  object["url"] = descriptor.url ? nlohmann::json(*descriptor.url) : nlohmann::json(nullptr);
  return object;
}

}  // namespace repostore
