#include <gtest/gtest.h>

#include "helpdesk_core/errors.hpp"
#include "helpdesk_core/sources/notion_export_reader.hpp"
#include "utilities_test.hpp"

namespace helpdesk_tests {

using namespace helpdesk_core;

class NotionExportReaderTest : public TempDirTestBase {};

TEST_F(NotionExportReaderTest, ReadsExportAsOneDocument) {
  const auto path = temp_dir_ / "Onboarding Guide.md";
  TestUtilities::write_file(path, "Intro line\n# Welcome aboard\n\nSet up your laptop.\n");

  NotionExportReader reader(NotionSourceConfig{path, ""});
  auto documents = reader.fetch();

  ASSERT_EQ(documents.size(), 1u);
  EXPECT_EQ(documents[0].metadata.id, "Onboarding Guide");
  EXPECT_EQ(documents[0].metadata.title, "Welcome aboard");
  EXPECT_EQ(documents[0].metadata.source_kind, SourceKind::Notion);
  EXPECT_EQ(documents[0].metadata.origin, path.string());
  EXPECT_NE(documents[0].text.find("Set up your laptop."), std::string::npos);
}

TEST_F(NotionExportReaderTest, FallsBackToStemAndHonoursIdOverride) {
  const auto path = temp_dir_ / "policies.txt";
  TestUtilities::write_file(path, "No headings here.\n");

  NotionExportReader reader(NotionSourceConfig{path, "hr-policies"});
  auto documents = reader.fetch();

  ASSERT_EQ(documents.size(), 1u);
  EXPECT_EQ(documents[0].metadata.id, "hr-policies");
  EXPECT_EQ(documents[0].metadata.title, "policies");
}

TEST_F(NotionExportReaderTest, MissingFileIsSourceError) {
  NotionExportReader reader(NotionSourceConfig{temp_dir_ / "missing.md", ""});
  EXPECT_THROW(reader.fetch(), SourceError);
}

TEST(NotionSourceConfigTest, RequiresPath) {
  EXPECT_THROW(NotionExportReader(NotionSourceConfig{}), ConfigError);
}

}  // namespace helpdesk_tests
