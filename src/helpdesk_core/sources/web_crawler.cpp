#include "helpdesk_core/sources/web_crawler.hpp"

#include <chrono>
#include <deque>
#include <iostream>
#include <thread>
#include <unordered_set>

#include "helpdesk_core/errors.hpp"

namespace helpdesk_core {

namespace {

struct CurlUrlDeleter {
  void operator()(CURLU *handle) const {
    curl_url_cleanup(handle);
  }
};
using CurlUrlHandle = std::unique_ptr<CURLU, CurlUrlDeleter>;

std::optional<std::string> get_part(CURLU *handle, CURLUPart part) {
  char *value = nullptr;
  if (curl_url_get(handle, part, &value, 0) != CURLUE_OK || !value) {
    return std::nullopt;
  }
  std::string result(value);
  curl_free(value);
  return result;
}

bool is_http_scheme(CURLU *handle) {
  auto scheme = get_part(handle, CURLUPART_SCHEME);
  return scheme && (*scheme == "http" || *scheme == "https");
}

bool looks_like_html(const HttpResponse &response) {
  return response.content_type.empty() ||
         response.content_type.find("html") != std::string::npos ||
         response.content_type.find("text/plain") != std::string::npos;
}

}  // namespace

void WebSourceConfig::validate() const {
  if (url.empty()) {
    throw ConfigError("web source requires a url");
  }
  if (!split_url(url)) {
    throw ConfigError("web source url is not an http(s) URL: " + url);
  }
  if (max_pages <= 0) {
    throw ConfigError("web source max_pages must be positive, got " + std::to_string(max_pages));
  }
  if (delay_seconds < 0.0) {
    throw ConfigError("web source delay cannot be negative");
  }
}

std::optional<std::string> resolve_url(const std::string &base, const std::string &href) {
  CurlUrlHandle handle(curl_url());
  if (!handle) {
    return std::nullopt;
  }
  if (curl_url_set(handle.get(), CURLUPART_URL, base.c_str(), 0) != CURLUE_OK) {
    return std::nullopt;
  }
  // A URL set on a handle that already holds one is resolved relative to it
  if (!href.empty() && curl_url_set(handle.get(), CURLUPART_URL, href.c_str(), 0) != CURLUE_OK) {
    return std::nullopt;
  }
  if (!is_http_scheme(handle.get())) {
    return std::nullopt;
  }
  curl_url_set(handle.get(), CURLUPART_FRAGMENT, nullptr, 0);
  return get_part(handle.get(), CURLUPART_URL);
}

std::optional<UrlParts> split_url(const std::string &url) {
  CurlUrlHandle handle(curl_url());
  if (!handle || curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
    return std::nullopt;
  }
  if (!is_http_scheme(handle.get())) {
    return std::nullopt;
  }
  UrlParts parts;
  parts.host = get_part(handle.get(), CURLUPART_HOST).value_or("");
  parts.port = get_part(handle.get(), CURLUPART_PORT).value_or("");
  parts.path = get_part(handle.get(), CURLUPART_PATH).value_or("/");
  return parts;
}

WebCrawler::WebCrawler(WebSourceConfig config)
    : WebCrawler(std::move(config), std::make_unique<CurlHttpFetcher>()) {}

WebCrawler::WebCrawler(WebSourceConfig config, std::unique_ptr<HttpFetcher> fetcher)
    : config_(std::move(config)), fetcher_(std::move(fetcher)) {
  config_.validate();
}

std::string WebCrawler::describe() const {
  return "web " + config_.url;
}

bool WebCrawler::should_follow(const UrlParts &start, const std::string &url) const {
  auto parts = split_url(url);
  if (!parts || parts->host != start.host || parts->port != start.port) {
    return false;
  }
  if (config_.allowed_paths.empty()) {
    return true;
  }
  for (const auto &prefix : config_.allowed_paths) {
    if (parts->path.rfind(prefix, 0) == 0) {
      return true;
    }
  }
  return false;
}

std::vector<Document> WebCrawler::fetch() {
  auto start_url = resolve_url(config_.url, "");
  auto start = start_url ? split_url(*start_url) : std::nullopt;
  if (!start) {
    throw SourceError("Cannot crawl " + config_.url + ": not an http(s) URL");
  }

  std::vector<Document> documents;
  std::deque<std::string> queue{*start_url};
  std::unordered_set<std::string> seen;
  const auto delay = std::chrono::duration<double>(config_.delay_seconds);

  while (!queue.empty() && documents.size() < static_cast<size_t>(config_.max_pages)) {
    std::string url = std::move(queue.front());
    queue.pop_front();
    if (!seen.insert(url).second) {
      continue;
    }

    HttpResponse response;
    try {
      response = fetcher_->get(url);
    } catch (const SourceError &e) {
      std::cerr << "[Crawler] Skipping " << url << ": " << e.what() << std::endl;
      continue;
    }
    if (response.status >= 400) {
      std::cerr << "[Crawler] Skipping " << url << ": HTTP " << response.status << std::endl;
      continue;
    }
    if (!looks_like_html(response)) {
      std::cerr << "[Crawler] Skipping " << url << ": content type " << response.content_type
                << std::endl;
      continue;
    }

    ExtractedPage page = extractor_.extract(response.body);

    Document document;
    document.metadata.id = url;
    document.metadata.source_kind = SourceKind::Web;
    document.metadata.origin = url;
    document.metadata.title = page.title.empty() ? url : page.title;
    document.metadata.fetched_at = std::chrono::system_clock::now();
    document.text = std::move(page.text);
    documents.push_back(std::move(document));
    std::cout << "[Crawler] Fetched " << url << " (" << documents.size() << "/"
              << config_.max_pages << ")" << std::endl;

    if (documents.size() >= static_cast<size_t>(config_.max_pages)) {
      break;
    }

    for (const auto &href : page.links) {
      auto absolute = resolve_url(url, href);
      if (absolute && seen.find(*absolute) == seen.end() && should_follow(*start, *absolute)) {
        queue.push_back(std::move(*absolute));
      }
    }

    if (config_.delay_seconds > 0.0 && !queue.empty()) {
      std::this_thread::sleep_for(delay);
    }
  }
  return documents;
}

}  // namespace helpdesk_core
