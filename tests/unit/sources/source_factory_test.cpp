#include <gtest/gtest.h>

#include "helpdesk_core/errors.hpp"
#include "helpdesk_core/sources/source_factory.hpp"

namespace helpdesk_tests {

using namespace helpdesk_core;

TEST(SourceFactoryTest, ParsesWebSourceWithDefaults) {
  WebSourceConfig web = web_source_from_json({{"url", "https://help.example.com"}});
  EXPECT_EQ(web.url, "https://help.example.com");
  EXPECT_EQ(web.max_pages, 50);
  EXPECT_DOUBLE_EQ(web.delay_seconds, 0.5);
  EXPECT_TRUE(web.allowed_paths.empty());
}

TEST(SourceFactoryTest, WebSourceSurvivesJsonRoundTrip) {
  WebSourceConfig web = web_source_from_json({{"url", "https://help.example.com"},
                                              {"max_pages", 7},
                                              {"delay", 0.0},
                                              {"allowed_paths", {"/docs", "/faq"}}});
  WebSourceConfig again = web_source_from_json(to_json(web));
  EXPECT_EQ(again.max_pages, 7);
  EXPECT_EQ(again.allowed_paths, (std::vector<std::string>{"/docs", "/faq"}));
}

TEST(SourceFactoryTest, RejectsUnknownKeysAndBadTypes) {
  EXPECT_THROW(web_source_from_json({{"url", "https://x.example.com"}, {"depth", 3}}),
               ConfigError);
  EXPECT_THROW(web_source_from_json({{"url", 42}}), ConfigError);
  EXPECT_THROW(web_source_from_json({{"max_pages", 3}}), ConfigError);
  EXPECT_THROW(web_source_from_json(nlohmann::json::array()), ConfigError);
  EXPECT_THROW(notion_source_from_json({{"file", "export.md"}}), ConfigError);
}

TEST(SourceFactoryTest, NotionSourceKeepsOptionalId) {
  NotionSourceConfig notion = notion_source_from_json({{"path", "exports/guide.md"}});
  EXPECT_EQ(notion.path, std::filesystem::path("exports/guide.md"));
  EXPECT_TRUE(notion.id.empty());
  EXPECT_FALSE(to_json(notion).contains("id"));

  notion = notion_source_from_json({{"path", "exports/guide.md"}, {"id", "guide"}});
  EXPECT_EQ(to_json(notion)["id"], "guide");
}

TEST(SourceFactoryTest, MakesSourceForEachKind) {
  auto web = make_document_source(SourceKind::Web, {{"url", "https://help.example.com"}});
  EXPECT_EQ(web->describe(), "web https://help.example.com");

  auto notion = make_document_source(SourceKind::Notion, {{"path", "guide.md"}});
  EXPECT_EQ(notion->describe(), "notion guide.md");
}

}  // namespace helpdesk_tests
