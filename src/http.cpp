#include "http.hpp"

#include "exception.hpp"
#include "log.hpp"

#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace repostore {

namespace {

// RAII wrapper for CURL
class CURLHandle {
 public:
  CURLHandle() : handle_(curl_easy_init()) {
    if (!handle_) {
      throw std::runtime_error("Failed to initialize CURL");
    }
  }

  ~CURLHandle() {
    if (handle_) {
      curl_easy_cleanup(handle_);
    }
  }

  CURL* get() const { return handle_; }

 private:
  CURL* handle_;
};

// RAII wrapper for a CURL header list
class CURLHeaders {
 public:
  ~CURLHeaders() {
    if (list_) {
      curl_slist_free_all(list_);
    }
  }

  void append(const std::string& header) {
    curl_slist* list = curl_slist_append(list_, header.c_str());
    if (!list) {
      throw std::runtime_error("Failed to append CURL header");
    }
    list_ = list;
  }

  curl_slist* get() const { return list_; }

 private:
  curl_slist* list_ = nullptr;
};

// Callback to collect the response body into a string
size_t StringWriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  std::string* body = static_cast<std::string*>(userp);
  body->append(static_cast<const char*>(contents), size * nmemb);
  return size * nmemb;
}

}  // namespace

http_client::http_client() { curl_global_init(CURL_GLOBAL_DEFAULT); }

http_client::~http_client() { curl_global_cleanup(); }

http_response http_client::request(
    const std::string& method, const std::string& url, const http_headers& headers, const std::string* body) {
  CURLHandle curl;
  CURLHeaders header_list;
  http_response response;

  for (const auto& header : headers) {
    header_list.append(header.first + ": " + header.second);
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_VERBOSE, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, StringWriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

  if (method != "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
  }

  if (body) {
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body->size());
  }

  log(log_level::debug) << method << " " << url << std::endl;

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw transport_error(method + " " + url + ": CURL error: " + curl_easy_strerror(res));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

  log(log_level::debug) << method << " " << url << ": HTTP " << response.status << std::endl;
  return response;
}

}  // namespace repostore
