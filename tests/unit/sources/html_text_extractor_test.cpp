#include <gtest/gtest.h>

#include "helpdesk_core/sources/html_text_extractor.hpp"

namespace helpdesk_tests {

using namespace helpdesk_core;

TEST(HtmlTextExtractorTest, ExtractsTitleTextAndLinks) {
  const std::string html = R"(<!doctype html>
<html><head><title>Reset  your password</title>
<style>body { color: red; }</style></head>
<body>
  <header><a href="/nav">Navigation</a></header>
  <h1>Password reset</h1>
  <p>Open <b>Settings</b> and   choose <a href="/settings#reset">Reset</a>.</p>
  <script>var hidden = "do not index";</script>
  <!-- <p>commented out</p> -->
  <a class='x' href='/contact'>Contact</a>
  <footer>Copyright</footer>
</body></html>)";

  HtmlTextExtractor extractor;
  ExtractedPage page = extractor.extract(html);

  EXPECT_EQ(page.title, "Reset your password");
  EXPECT_EQ(page.text, "Password reset Open Settings and choose Reset . Contact");
  EXPECT_EQ(page.links, (std::vector<std::string>{"/settings#reset", "/contact"}));
}

TEST(HtmlTextExtractorTest, DropsScriptsStylesAndComments) {
  HtmlTextExtractor extractor;
  ExtractedPage page = extractor.extract(
      "<p>visible</p><SCRIPT type='text/javascript'>hidden()</SCRIPT>"
      "<noscript>enable js</noscript><!-- secret -->");
  EXPECT_EQ(page.text, "visible");
  EXPECT_TRUE(page.title.empty());
}

TEST(HtmlTextExtractorTest, DecodesEntities) {
  EXPECT_EQ(HtmlTextExtractor::decode_entities("Tom &amp; Jerry &lt;3 &quot;cats&quot;"),
            "Tom & Jerry <3 \"cats\"");
  EXPECT_EQ(HtmlTextExtractor::decode_entities("caf&#233; &#x263A;"), "caf\xC3\xA9 \xE2\x98\xBA");
  EXPECT_EQ(HtmlTextExtractor::decode_entities("a&nbsp;b"), "a b");
  EXPECT_EQ(HtmlTextExtractor::decode_entities("AT&T &unknown; &#xZZ;"), "AT&T &unknown; &#xZZ;");
}

TEST(HtmlTextExtractorTest, LessThanInTextIsKept) {
  HtmlTextExtractor extractor;
  EXPECT_EQ(extractor.extract("<p>1 < 2 and 3 &gt; 2</p>").text, "1 < 2 and 3 > 2");
}

}  // namespace helpdesk_tests
