#include "helpdesk_core/sources/html_text_extractor.hpp"

#include <utf8.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <regex>

#include "helpdesk_core/chunking/text_normalizer.hpp"

namespace helpdesk_core {

namespace {

constexpr std::array<const char *, 5> kDroppedElements = {"script", "style", "noscript",
                                                          "header", "footer"};

std::string to_lower(const std::string &s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool is_name_end(char c) {
  return c == '>' || c == '/' || std::isspace(static_cast<unsigned char>(c));
}

// True when lower[pos] starts "<name" followed by a name terminator.
bool opens_element(const std::string &lower, size_t pos, const std::string &name) {
  if (lower.compare(pos + 1, name.size(), name) != 0)
    return false;
  const size_t after = pos + 1 + name.size();
  return after < lower.size() && is_name_end(lower[after]);
}

std::string remove_dropped_elements(const std::string &html) {
  const std::string lower = to_lower(html);
  std::string out;
  out.reserve(html.size());

  size_t pos = 0;
  while (pos < html.size()) {
    if (html[pos] != '<') {
      out.push_back(html[pos++]);
      continue;
    }

    if (lower.compare(pos, 4, "<!--") == 0) {
      const size_t close = lower.find("-->", pos + 4);
      pos = close == std::string::npos ? html.size() : close + 3;
      out.push_back(' ');
      continue;
    }

    bool dropped = false;
    for (const char *element : kDroppedElements) {
      const std::string name(element);
      if (!opens_element(lower, pos, name))
        continue;
      const size_t close = lower.find("</" + name, pos);
      if (close == std::string::npos) {
        pos = html.size();
      } else {
        const size_t end = lower.find('>', close);
        pos = end == std::string::npos ? html.size() : end + 1;
      }
      out.push_back(' ');
      dropped = true;
      break;
    }
    if (!dropped)
      out.push_back(html[pos++]);
  }
  return out;
}

std::string extract_title(const std::string &html) {
  const std::string lower = to_lower(html);
  size_t open = lower.find("<title");
  while (open != std::string::npos && !opens_element(lower, open, "title")) {
    open = lower.find("<title", open + 1);
  }
  if (open == std::string::npos)
    return "";
  const size_t start = lower.find('>', open);
  if (start == std::string::npos)
    return "";
  const size_t close = lower.find("</title", start);
  if (close == std::string::npos)
    return "";
  return normalize_text(HtmlTextExtractor::decode_entities(html.substr(start + 1, close - start - 1)));
}

std::string href_of(const std::string &tag) {
  static const std::regex href_re(R"(\shref\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s>]+)))",
                                  std::regex::icase);
  std::smatch match;
  if (!std::regex_search(tag, match, href_re))
    return "";
  for (size_t group = 1; group <= 3; ++group) {
    if (match[group].matched)
      return HtmlTextExtractor::decode_entities(match[group].str());
  }
  return "";
}

bool starts_tag(char next) {
  return std::isalpha(static_cast<unsigned char>(next)) || next == '/' || next == '!' ||
         next == '?';
}

}  // namespace

ExtractedPage HtmlTextExtractor::extract(const std::string &html) const {
  ExtractedPage page;
  page.title = extract_title(html);

  const std::string body = remove_dropped_elements(html);
  std::string text;
  text.reserve(body.size());

  size_t pos = 0;
  while (pos < body.size()) {
    const char c = body[pos];
    if (c != '<' || pos + 1 >= body.size() || !starts_tag(body[pos + 1])) {
      text.push_back(c);
      ++pos;
      continue;
    }

    const size_t end = body.find('>', pos);
    const std::string tag = body.substr(pos, end == std::string::npos ? std::string::npos
                                                                      : end - pos + 1);
    if (tag.size() > 2 && (tag[1] == 'a' || tag[1] == 'A') && is_name_end(tag[2])) {
      std::string href = href_of(tag);
      if (!href.empty())
        page.links.push_back(std::move(href));
    }
    // The <title> text is reported separately, not as page text
    if (opens_element(to_lower(tag), 0, "title")) {
      const size_t close = to_lower(body).find("</title", pos);
      if (close != std::string::npos) {
        const size_t close_end = body.find('>', close);
        pos = close_end == std::string::npos ? body.size() : close_end + 1;
        text.push_back(' ');
        continue;
      }
    }

    text.push_back(' ');
    pos = end == std::string::npos ? body.size() : end + 1;
  }

  page.text = normalize_text(decode_entities(text));
  return page;
}

std::string HtmlTextExtractor::decode_entities(const std::string &text) {
  std::string out;
  out.reserve(text.size());

  size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] != '&') {
      out.push_back(text[pos++]);
      continue;
    }
    const size_t semi = text.find(';', pos);
    if (semi == std::string::npos || semi - pos > 10) {
      out.push_back(text[pos++]);
      continue;
    }

    const std::string name = text.substr(pos + 1, semi - pos - 1);
    std::string replacement;
    if (name == "amp") {
      replacement = "&";
    } else if (name == "lt") {
      replacement = "<";
    } else if (name == "gt") {
      replacement = ">";
    } else if (name == "quot") {
      replacement = "\"";
    } else if (name == "apos") {
      replacement = "'";
    } else if (name == "nbsp") {
      replacement = " ";
    } else if (name.size() > 1 && name[0] == '#') {
      const bool hex = name[1] == 'x' || name[1] == 'X';
      const std::string digits = name.substr(hex ? 2 : 1);
      const bool well_formed =
          !digits.empty() &&
          std::all_of(digits.begin(), digits.end(), [hex](unsigned char d) {
            return hex ? std::isxdigit(d) : std::isdigit(d);
          });
      if (well_formed) {
        const unsigned long code_point = std::stoul(digits, nullptr, hex ? 16 : 10);
        if (code_point > 0 && code_point <= 0x10FFFF &&
            (code_point < 0xD800 || code_point > 0xDFFF)) {
          utf8::append(static_cast<uint32_t>(code_point), std::back_inserter(replacement));
        }
      }
    }

    if (replacement.empty()) {
      out.push_back(text[pos++]);
      continue;
    }
    out += replacement;
    pos = semi + 1;
  }
  return out;
}

}  // namespace helpdesk_core
