#pragma once

#include "descriptor.hpp"

#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace repostore {

void set_events_enabled(bool enabled = true);
bool events_enabled();

// Redirect event output. Defaults to stdout.
void set_event_stream(std::ostream& stream);

// Emit one event as a single JSON line. The type is stored under "type".
void event(const std::string& type, nlohmann::json fields);

// JSON representation of a listing entry.
nlohmann::json to_json(const file_descriptor& descriptor);

}  // namespace repostore
