#include "remote_github.hpp"

#include "exception.hpp"
#include "log.hpp"
#include "version.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace repostore {

namespace {

std::optional<std::string> optional_string(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::string required_string(const nlohmann::json& object, const char* key) {
  auto value = optional_string(object, key);
  if (!value) {
    throw transport_error(std::string("malformed response: missing field: ") + key);
  }
  return *value;
}

// Returns the "message" field of an error response, or the raw body.
std::string error_message(const http_response& response) {
  auto body = nlohmann::json::parse(response.body, nullptr, false);
  if (!body.is_discarded() && body.is_object()) {
    if (auto message = optional_string(body, "message")) {
      return *message;
    }
  }
  return response.body;
}

nlohmann::json parse_body(const http_response& response) {
  auto body = nlohmann::json::parse(response.body, nullptr, false);
  if (body.is_discarded()) {
    throw transport_error("malformed response: invalid JSON", response.status);
  }
  return body;
}

// Throw the exception matching an unsuccessful response.
void check_status(const std::string& operation, const std::string& path, const http_response& response) {
  if (response.status >= 200 && response.status < 300) {
    return;
  }

  std::string message = error_message(response);
  std::string prefix = operation + ": " + (path.empty() ? "/" : path) + ": ";

  switch (response.status) {
    case 404:
      throw not_found(prefix + "not found");
    case 409:
    case 412:
      throw conflict_error(prefix + "revision conflict: " + message);
    case 422:
      // The remote reports a missing or mismatching sha as an invalid request
      if (message.find("sha") != std::string::npos) {
        throw conflict_error(prefix + "revision conflict: " + message);
      }
      break;
    default:
      break;
  }

  throw transport_error(prefix + "HTTP " + std::to_string(response.status) + ": " + message, response.status);
}

file_descriptor to_descriptor(const nlohmann::json& entry) {
  if (!entry.is_object()) {
    throw transport_error("malformed response: listing entry is not an object");
  }

  file_descriptor descriptor;
  descriptor.name = required_string(entry, "name");
  descriptor.path = required_string(entry, "path");
  descriptor.kind = parse_entry_kind(optional_string(entry, "type").value_or("file"));
  descriptor.revision = optional_string(entry, "sha").value_or("");
  descriptor.url = optional_string(entry, "download_url");
  return descriptor;
}

}  // namespace

remote_github::remote_github(const remote_options& options)
    : _options(options), _contents_url(url(options.api_url).append("repos/" + options.repository + "/contents")) {}

url remote_github::contents_url(const std::string& path, bool with_ref) const {
  url address = _contents_url.append(path);
  if (with_ref && !_options.branch.empty()) {
    return address.with_query("ref", _options.branch);
  }
  return address;
}

http_headers remote_github::headers(bool json_body) const {
  http_headers headers = {
      {"Accept", "application/vnd.github+json"},
      {"User-Agent", std::string("repostore/") + REPOSTORE_VERSION},
  };
  if (!_options.token.empty()) {
    headers.emplace_back("Authorization", "Bearer " + _options.token);
  }
  if (json_body) {
    headers.emplace_back("Content-Type", "application/json");
  }
  return headers;
}

lookup_result remote_github::get(const std::string& path) {
  try {
    http_response response = _http.get(contents_url(path, true).string(), headers(false));
    if (response.status == 404) {
      return lookup_result::make_not_found();
    }
    check_status("get", path, response);

    nlohmann::json body = parse_body(response);
    content_item item;

    // A directory is returned as the array of its entries
    if (body.is_array()) {
      item.kind = entry_kind::directory;
      return lookup_result::make_found(item);
    }
    if (!body.is_object()) {
      throw transport_error("get: " + path + ": malformed response", response.status);
    }

    item.kind = parse_entry_kind(optional_string(body, "type").value_or("file"));
    item.revision = required_string(body, "sha");
    item.url = optional_string(body, "download_url");

    // Files above the inline size limit come with empty content
    auto content = optional_string(body, "content");
    if (content && !content->empty()) {
      item.encoded_content = content;
    }

    return lookup_result::make_found(item);
  }
  catch (const std::exception&) {
    return lookup_result::make_error(std::current_exception());
  }
}

put_result remote_github::put(
    const std::string& path,
    const std::string& message,
    const std::string& encoded_content,
    const std::optional<std::string>& revision) {
  nlohmann::json request = {
      {"message", message},
      {"content", encoded_content},
  };
  if (revision) {
    request["sha"] = *revision;
  }
  if (!_options.branch.empty()) {
    request["branch"] = _options.branch;
  }

  std::string body = request.dump();
  http_response response = _http.request("PUT", contents_url(path, false).string(), headers(true), &body);
  check_status("put", path, response);

  nlohmann::json result = parse_body(response);
  if (!result.is_object() || !result.contains("content") || !result["content"].is_object()) {
    throw transport_error("put: " + path + ": malformed response", response.status);
  }

  return put_result{required_string(result["content"], "sha")};
}

void remote_github::remove(const std::string& path, const std::string& message, const std::string& revision) {
  nlohmann::json request = {
      {"message", message},
      {"sha", revision},
  };
  if (!_options.branch.empty()) {
    request["branch"] = _options.branch;
  }

  std::string body = request.dump();
  http_response response = _http.request("DELETE", contents_url(path, false).string(), headers(true), &body);
  check_status("delete", path, response);
}

std::vector<file_descriptor> remote_github::list(const std::string& path) {
  http_response response = _http.get(contents_url(path, true).string(), headers(false));
  check_status("list", path, response);

  nlohmann::json body = parse_body(response);
  if (!body.is_array()) {
    throw data_integrity_error("list: " + path + ": not a directory");
  }

  std::vector<file_descriptor> entries;
  entries.reserve(body.size());
  for (const auto& entry : body) {
    entries.push_back(to_descriptor(entry));
  }
  return entries;
}

std::string remote_github::fetch_binary(const std::string& address) {
  http_headers request_headers = {
      {"Accept", "application/octet-stream"},
      {"User-Agent", std::string("repostore/") + REPOSTORE_VERSION},
  };
  if (!_options.token.empty()) {
    request_headers.emplace_back("Authorization", "Bearer " + _options.token);
  }

  http_response response = _http.get(address, request_headers);
  if (response.status != 200) {
    throw transport_error(
        "failed to download: " + address + ": HTTP " + std::to_string(response.status), response.status);
  }

  log(log_level::debug) << "downloaded " << response.body.size() << " bytes: " << address << std::endl;
  return std::move(response.body);
}

}  // namespace repostore
