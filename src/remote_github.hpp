#pragma once

#include "http.hpp"
#include "remote.hpp"
#include "url.hpp"

#include <optional>
#include <string>
#include <vector>

namespace repostore {

// Remote backed by the GitHub repository contents API.
class remote_github : public remote {
 public:
  explicit remote_github(const remote_options& options);

  lookup_result get(const std::string& path) override;

  put_result put(
      const std::string& path,
      const std::string& message,
      const std::string& encoded_content,
      const std::optional<std::string>& revision) override;

  void remove(const std::string& path, const std::string& message, const std::string& revision) override;

  std::vector<file_descriptor> list(const std::string& path) override;

  std::string fetch_binary(const std::string& url) override;

 private:
  // Returns the contents API url of the given repository path.
  url contents_url(const std::string& path, bool with_ref) const;

  http_headers headers(bool json_body) const;

 private:
  remote_options _options;
  url _contents_url;
  http_client _http;
};

}  // namespace repostore
