#pragma once

#include <string>
#include <utility>
#include <vector>

namespace repostore {

struct http_response {
  long status = 0;
  std::string body;
};

using http_headers = std::vector<std::pair<std::string, std::string>>;

// Blocking HTTP client performing one request per call.
class http_client {
 public:
  http_client();
  ~http_client();

  http_client(const http_client&) = delete;
  http_client& operator=(const http_client&) = delete;

  // Perform a request and return the status and body of the response.
  // Throws transport_error if no response was received.
  http_response request(
      const std::string& method,
      const std::string& url,
      const http_headers& headers,
      const std::string* body = nullptr);

  http_response get(const std::string& url, const http_headers& headers) { return request("GET", url, headers); }
};

}  // namespace repostore
