#include "helpdesk_core/sources/http_fetcher.hpp"

#include "helpdesk_core/errors.hpp"

namespace helpdesk_core {

namespace {

size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *buffer) {
  size_t total_size = size * nmemb;
  buffer->append(static_cast<char *>(contents), total_size);
  return total_size;
}

}  // namespace

CurlHttpFetcher::CurlHttpFetcher(long timeout_seconds)
    : curl_handle_(curl_easy_init()), timeout_seconds_(timeout_seconds) {
  if (!curl_handle_) {
    throw SourceError("Failed to initialize CURL");
  }
}

CurlHttpFetcher::~CurlHttpFetcher() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

HttpResponse CurlHttpFetcher::get(const std::string &url) {
  HttpResponse response;

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_USERAGENT, kUserAgent);
  curl_easy_setopt(curl_handle_, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl_handle_, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT, timeout_seconds_);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response.body);

  CURLcode res = curl_easy_perform(curl_handle_);
  if (res != CURLE_OK) {
    throw SourceError("CURL request for " + url + " failed: " + curl_easy_strerror(res));
  }

  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &response.status);
  char *content_type = nullptr;
  if (curl_easy_getinfo(curl_handle_, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK &&
      content_type) {
    response.content_type = content_type;
  }
  return response;
}

}  // namespace helpdesk_core
