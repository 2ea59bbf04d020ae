#pragma once

#include <curl/curl.h>

#include <string>

namespace helpdesk_core {

struct HttpResponse {
  long status = 0;
  std::string content_type;
  std::string body;
};

class HttpFetcher {
 public:
  virtual ~HttpFetcher() = default;

  // Throws SourceError when the request cannot be completed at all. HTTP error statuses
  // are returned, not thrown.
  virtual HttpResponse get(const std::string &url) = 0;
};

// Blocking GET over one reusable libcurl easy handle. Not thread safe.
class CurlHttpFetcher : public HttpFetcher {
 public:
  static constexpr const char *kUserAgent = "AI-Helpdesk/1.0";

  explicit CurlHttpFetcher(long timeout_seconds = 15);
  ~CurlHttpFetcher() override;

  CurlHttpFetcher(const CurlHttpFetcher &) = delete;
  CurlHttpFetcher &operator=(const CurlHttpFetcher &) = delete;

  HttpResponse get(const std::string &url) override;

 private:
  CURL *curl_handle_;
  long timeout_seconds_;
};

}  // namespace helpdesk_core
