#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "helpdesk_core/sources/document_source.hpp"
#include "helpdesk_core/sources/html_text_extractor.hpp"
#include "helpdesk_core/sources/http_fetcher.hpp"

namespace helpdesk_core {

struct WebSourceConfig {
  std::string url;
  int max_pages = 50;
  double delay_seconds = 0.5;
  // Path prefixes a followed link must start with; empty allows every path.
  std::vector<std::string> allowed_paths;

  // Throws ConfigError
  void validate() const;
};

// Resolves href against base and drops the fragment. Only http(s) results are returned.
std::optional<std::string> resolve_url(const std::string &base, const std::string &href);

struct UrlParts {
  std::string host;
  std::string port;
  std::string path;
};
std::optional<UrlParts> split_url(const std::string &url);

/**
 * @class WebCrawler
 * @brief Breadth-first crawl of one site, one Document per fetched HTML page.
 *
 * Only links on the start page's host (and port) are followed, optionally restricted to
 * allowed path prefixes. A page that fails to download or answers with an error status
 * is logged and skipped.
 */
class WebCrawler : public DocumentSource {
 public:
  explicit WebCrawler(WebSourceConfig config);
  WebCrawler(WebSourceConfig config, std::unique_ptr<HttpFetcher> fetcher);

  std::vector<Document> fetch() override;
  std::string describe() const override;

 private:
  bool should_follow(const UrlParts &start, const std::string &url) const;

  WebSourceConfig config_;
  std::unique_ptr<HttpFetcher> fetcher_;
  HtmlTextExtractor extractor_;
};

}  // namespace helpdesk_core
