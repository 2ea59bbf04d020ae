#pragma once

#include <string>
#include <vector>

namespace helpdesk_core {

struct ExtractedPage {
  std::string title;
  std::string text;
  // href values in document order, exactly as written in the page
  std::vector<std::string> links;
};

/**
 * @class HtmlTextExtractor
 * @brief Turns an HTML page into plain text for indexing.
 *
 * script, style, noscript, header and footer elements are dropped together with their
 * content, as are comments. Every remaining tag becomes a single space, basic named
 * and numeric character references are decoded and whitespace is collapsed. Links
 * inside dropped elements are not reported.
 */
class HtmlTextExtractor {
 public:
  ExtractedPage extract(const std::string &html) const;

  static std::string decode_entities(const std::string &text);
};

}  // namespace helpdesk_core
