#pragma once

#include <mutex>
#include <string>

#include <curl/curl.h>

#include "msgforge/common.hpp"

namespace msgforge {

struct FetchOptions {
  int timeout_s{5};
  std::size_t max_body_bytes{64 * 1024};
  std::string accept{"application/json"};
};

struct FetchResult {
  long status{0};
  std::string body;
  std::string content_type;
  std::string error;

  bool ok() const { return error.empty() && status >= 200 && status < 300; }
  bool is_json() const { return to_lower(content_type).find("json") != std::string::npos; }
};

// Small blocking GET over libcurl for preview metadata. Bodies larger than
// max_body_bytes abort the transfer. Not thread-safe; create one per call site.
class HttpFetcher {
 public:
  HttpFetcher() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    easy_ = curl_easy_init();
  }

  ~HttpFetcher() {
    if (easy_) {
      curl_easy_cleanup(easy_);
    }
  }

  HttpFetcher(const HttpFetcher&) = delete;
  HttpFetcher& operator=(const HttpFetcher&) = delete;

  FetchResult get(const std::string& url, const FetchOptions& opts = {}) {
    FetchResult out;
    if (!easy_) {
      out.error = "curl init failed";
      return out;
    }

    curl_easy_reset(easy_);
    Sink sink{&out.body, opts.max_body_bytes, false};
    const std::string accept = "Accept: " + opts.accept;
    struct curl_slist* headers = curl_slist_append(nullptr, accept.c_str());

    curl_easy_setopt(easy_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy_, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &on_body);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(easy_, CURLOPT_TIMEOUT, static_cast<long>(opts.timeout_s));
    curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT, static_cast<long>((std::max)(1, opts.timeout_s / 2)));
    curl_easy_setopt(easy_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy_, CURLOPT_MAXREDIRS, 3L);
    curl_easy_setopt(easy_, CURLOPT_USERAGENT, "msgforge/0.1");
    curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);

    const CURLcode rc = curl_easy_perform(easy_);
    curl_slist_free_all(headers);

    if (sink.overflow) {
      out.error = "response exceeds " + std::to_string(opts.max_body_bytes) + " bytes";
    } else if (rc != CURLE_OK) {
      out.error = curl_easy_strerror(rc);
    }
    curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &out.status);
    char* content_type = nullptr;
    curl_easy_getinfo(easy_, CURLINFO_CONTENT_TYPE, &content_type);
    if (content_type) {
      out.content_type = content_type;
    }
    return out;
  }

 private:
  struct Sink {
    std::string* body;
    std::size_t limit;
    bool overflow;
  };

  static size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto n = size * nmemb;
    auto* sink = static_cast<Sink*>(userdata);
    if (sink->body->size() + n > sink->limit) {
      sink->overflow = true;
      return 0;
    }
    sink->body->append(ptr, n);
    return n;
  }

  CURL* easy_{nullptr};
};

}  // namespace msgforge
