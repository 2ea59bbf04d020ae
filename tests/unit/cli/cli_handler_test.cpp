#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "helpdesk_cli/cli_handler.hpp"
#include "helpdesk_core/errors.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace helpdesk_tests {

using namespace helpdesk_cli;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Throw;

// Owns the argv storage handed to parse_arguments.
class ArgvBuilder {
 public:
  explicit ArgvBuilder(std::vector<std::string> args) : args_(std::move(args)) {
    args_.insert(args_.begin(), "helpdesk_cli");
    for (auto& arg : args_) {
      pointers_.push_back(arg.data());
    }
  }

  int argc() {
    return static_cast<int>(pointers_.size());
  }
  char** argv() {
    return pointers_.data();
  }

 private:
  std::vector<std::string> args_;
  std::vector<char*> pointers_;
};

CliOptions parse(std::vector<std::string> args) {
  ArgvBuilder builder(std::move(args));
  return CliHandler::parse_arguments(builder.argc(), builder.argv());
}

TEST(CliParseTest, NoArgumentsShowsHelp) {
  EXPECT_EQ(parse({}).command, Command::Help);
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
}

TEST(CliParseTest, AskJoinsPositionalWordsIntoQuestion) {
  CliOptions options = parse({"ask", "how", "do", "I", "reset", "--top-k", "3", "my", "password?"});
  EXPECT_EQ(options.command, Command::Ask);
  EXPECT_EQ(options.argument, "how do I reset my password?");
  ASSERT_TRUE(options.top_k.has_value());
  EXPECT_EQ(*options.top_k, 3);
}

TEST(CliParseTest, ShortAliases) {
  EXPECT_EQ(parse({"i"}).command, Command::Ingest);
  EXPECT_EQ(parse({"a", "question"}).command, Command::Ask);
  EXPECT_EQ(parse({"c"}).command, Command::Chat);
  EXPECT_EQ(parse({"s", "vpn"}).command, Command::Search);
}

TEST(CliParseTest, IngestFlags) {
  CliOptions options = parse({"ingest", "--web-url", "https://help.example.com/", "--max-pages",
                              "10", "--store-dir", "/tmp/store", "--config", "cfg.json"});
  EXPECT_EQ(options.command, Command::Ingest);
  EXPECT_EQ(*options.web_url, "https://help.example.com/");
  EXPECT_EQ(*options.max_pages, 10);
  EXPECT_EQ(*options.store_dir, "/tmp/store");
  EXPECT_EQ(options.config_path, "cfg.json");
}

TEST(CliParseTest, RejectsInvalidInvocations) {
  EXPECT_THROW(parse({"frobnicate"}), CliError);
  EXPECT_THROW(parse({"ask"}), CliError);
  EXPECT_THROW(parse({"search"}), CliError);
  EXPECT_THROW(parse({"forget"}), CliError);
  EXPECT_THROW(parse({"stats", "--verbose", "yes"}), CliError);
  EXPECT_THROW(parse({"ingest", "--max-pages"}), CliError);
  EXPECT_THROW(parse({"ingest", "--max-pages", "ten"}), CliError);
  EXPECT_THROW(parse({"ask", "q", "--top-k", "0"}), CliError);
}

TEST(CliFormatTest, FormatReferenceUsesLabelAndScore) {
  helpdesk_core::Citation citation;
  citation.chunk_id = "reset#0001";
  citation.title = "Resetting your password";
  citation.score = 0.8124f;
  EXPECT_EQ(format_reference(citation), "- Resetting your password (score=0.812)");

  citation.title.clear();
  citation.origin = "https://help.example.com/reset";
  EXPECT_EQ(format_reference(citation), "- https://help.example.com/reset (score=0.812)");
}

TEST(CliFormatTest, TruncateSnippetCutsOnCodePoints) {
  EXPECT_EQ(truncate_snippet("short", 200), "short");
  EXPECT_EQ(truncate_snippet("abcdef", 3), "abc...");

  // Two-byte and three-byte sequences count as one each
  const std::string text = "\xc3\xa9t\xc3\xa9 \xe2\x82\xac" "5";
  EXPECT_EQ(truncate_snippet(text, 2), "\xc3\xa9t...");
  EXPECT_EQ(truncate_snippet(text, 5), "\xc3\xa9t\xc3\xa9 \xe2\x82\xac...");
  EXPECT_EQ(truncate_snippet(text, 6), text);
}

class CliHandlerTest : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    config_path_ = (temp_dir_ / "helpdeskrc.json").string();
    TestUtilities::write_file(config_path_, R"({
  "store_dir": ")" + (temp_dir_ / "store").string() + R"(",
  "embedding_model": "mock-embed",
  "chunk_size": 60,
  "chunk_overlap": 10,
  "top_k": 2
})");
    guide_path_ = (temp_dir_ / "Password Guide.md").string();
    TestUtilities::write_file(guide_path_,
                              "# Resetting your password\n\nOpen the login page and choose "
                              "Forgot password. A reset link arrives by email.\n");

    embedder_ = std::make_shared<NiceMock<MockEmbeddingProvider>>();
    chat_ = std::make_shared<NiceMock<MockChatProvider>>();
  }

  int run(std::vector<std::string> args) {
    args.push_back("--config");
    args.push_back(config_path_);
    output_.str("");
    CliHandler handler(output_);
    handler.set_providers(embedder_, chat_);
    return handler.execute_command(parse(std::move(args)));
  }

  void ingest_guide() {
    ASSERT_EQ(run({"ingest", "--notion-file", guide_path_}), 0) << output_.str();
  }

  std::string config_path_;
  std::string guide_path_;
  std::ostringstream output_;
  std::shared_ptr<NiceMock<MockEmbeddingProvider>> embedder_;
  std::shared_ptr<NiceMock<MockChatProvider>> chat_;
};

TEST_F(CliHandlerTest, ResolveConfigAppliesOverrides) {
  CliOptions options = parse({"ingest", "--config", config_path_, "--web-url",
                              "https://help.example.com/", "--max-pages", "7", "--top-k", "4"});

  helpdesk_core::Config config = CliHandler::resolve_config(options);

  EXPECT_EQ(config.store_dir, (temp_dir_ / "store").string());
  EXPECT_EQ(config.top_k, 4);
  EXPECT_EQ(config.chunk_size, 60);
  ASSERT_EQ(config.web.size(), 1);
  EXPECT_EQ(config.web[0].url, "https://help.example.com/");
  EXPECT_EQ(config.web[0].max_pages, 7);
  EXPECT_TRUE(config.notion.empty());
}

TEST_F(CliHandlerTest, ResolveConfigRejectsInvalidOverrides) {
  CliOptions options = parse({"ingest", "--config", config_path_, "--web-url", "not a url"});
  EXPECT_THROW(CliHandler::resolve_config(options), helpdesk_core::ConfigError);
}

TEST_F(CliHandlerTest, HelpReturnsZero) {
  std::ostringstream out;
  CliHandler handler(out);
  EXPECT_EQ(handler.execute_command(parse({"help"})), 0);
  EXPECT_THAT(out.str(), HasSubstr("Usage: helpdesk_cli"));
}

TEST_F(CliHandlerTest, IngestWithoutSourcesIsAnError) {
  EXPECT_THROW(run({"ingest"}), CliError);
}

TEST_F(CliHandlerTest, IngestReportsEachDocument) {
  ingest_guide();
  EXPECT_THAT(output_.str(), HasSubstr("Password Guide: added"));
  EXPECT_THAT(output_.str(), HasSubstr("Ingested 1 document(s)"));

  ASSERT_EQ(run({"ingest", "--notion-file", guide_path_}), 0);
  EXPECT_THAT(output_.str(), HasSubstr("Password Guide: unchanged"));
}

TEST_F(CliHandlerTest, IngestOfMissingFileFails) {
  EXPECT_EQ(run({"ingest", "--notion-file", (temp_dir_ / "missing.md").string()}), 1);
}

TEST_F(CliHandlerTest, AskPrintsAnswerAndReferences) {
  ingest_guide();

  EXPECT_EQ(run({"ask", "How", "do", "I", "reset", "my", "password?"}), 0);

  EXPECT_THAT(output_.str(), HasSubstr("answer from"));
  EXPECT_THAT(output_.str(), HasSubstr("References:"));
  EXPECT_THAT(output_.str(), HasSubstr("- Resetting your password (score="));
}

TEST_F(CliHandlerTest, AskOnEmptyStoreSaysNothingWasFound) {
  EXPECT_EQ(run({"ask", "anything?"}), 0);
  EXPECT_THAT(output_.str(), HasSubstr("No relevant documents"));
  EXPECT_THAT(output_.str(), ::testing::Not(HasSubstr("References:")));
}

TEST_F(CliHandlerTest, AskReturnsOneWhenTheModelFails) {
  ingest_guide();
  EXPECT_CALL(*chat_, answer(_, _))
      .WillOnce(Throw(helpdesk_core::ProviderError(helpdesk_core::ProviderErrorKind::Network,
                                                   "connection refused")));

  EXPECT_EQ(run({"ask", "reset password"}), 1);
}

TEST_F(CliHandlerTest, SearchStatsForgetAndClear) {
  ingest_guide();

  EXPECT_EQ(run({"search", "forgot password"}), 0);
  EXPECT_THAT(output_.str(), HasSubstr("- Resetting your password (score="));

  EXPECT_EQ(run({"stats"}), 0);
  EXPECT_THAT(output_.str(), HasSubstr("Documents:       1"));

  EXPECT_EQ(run({"forget", "Password", "Guide"}), 0);
  EXPECT_THAT(output_.str(), HasSubstr("of Password Guide"));
  EXPECT_EQ(run({"forget", "Password", "Guide"}), 1);

  EXPECT_EQ(run({"search", "forgot password"}), 0);
  EXPECT_THAT(output_.str(), HasSubstr("No results."));

  ingest_guide();
  EXPECT_EQ(run({"clear"}), 0);
  EXPECT_EQ(run({"stats"}), 0);
  EXPECT_THAT(output_.str(), HasSubstr("Records:         0"));
}

TEST_F(CliHandlerTest, RepairKeepsReadableRecords) {
  ingest_guide();
  {
    std::ofstream out(temp_dir_ / "store" / helpdesk_core::VectorRecordStore::kRecordsFile,
                      std::ios::binary | std::ios::app);
    out << "{broken";
  }

  EXPECT_THROW(run({"stats"}), CliError);

  EXPECT_EQ(run({"repair"}), 0);
  EXPECT_THAT(output_.str(), HasSubstr("Store is corrupt"));
  EXPECT_THAT(output_.str(), HasSubstr("Rebuilt store with"));

  EXPECT_EQ(run({"repair"}), 0);
  EXPECT_THAT(output_.str(), HasSubstr("Store is healthy"));
  EXPECT_EQ(run({"stats"}), 0);
  EXPECT_THAT(output_.str(), HasSubstr("Documents:       1"));
}

}  // namespace helpdesk_tests
