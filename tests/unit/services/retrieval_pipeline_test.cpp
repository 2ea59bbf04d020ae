#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <limits>

#include "helpdesk_core/errors.hpp"
#include "helpdesk_core/services/retrieval_pipeline.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace helpdesk_tests {

using namespace helpdesk_core;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SizeIs;

class RetrievalPipelineTest : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    store_ = std::make_shared<VectorRecordStore>(StoreContext{temp_dir_ / "store", "mock-embed"});
    embedder_ = std::make_shared<NiceMock<MockEmbeddingProvider>>();
    chat_ = std::make_shared<NiceMock<MockChatProvider>>();
    options_.chunk_size = 40;
    options_.chunk_overlap = 10;
    options_.embed_batch_size = 2;
    options_.top_k = 3;
    pipeline_ = std::make_unique<RetrievalPipeline>(store_, embedder_, chat_, options_);
  }

  std::shared_ptr<VectorRecordStore> store_;
  std::shared_ptr<NiceMock<MockEmbeddingProvider>> embedder_;
  std::shared_ptr<NiceMock<MockChatProvider>> chat_;
  PipelineOptions options_;
  std::unique_ptr<RetrievalPipeline> pipeline_;
};

TEST_F(RetrievalPipelineTest, EmptyStoreAnswersWithoutContext) {
  EXPECT_CALL(*embedder_, embed(_)).Times(0);
  EXPECT_CALL(*chat_, answer("Where is the office?", SizeIs(0)))
      .WillOnce(Return("I do not know."));

  Answer answer = pipeline_->ask("Where is the office?");

  EXPECT_TRUE(answer.no_context);
  EXPECT_TRUE(answer.results.empty());
  EXPECT_TRUE(answer.citations.empty());
  EXPECT_EQ(answer.answer, "I do not know.");
}

TEST_F(RetrievalPipelineTest, IngestedTextIsRetrievedFirst) {
  pipeline_->ingest(TestUtilities::create_test_document("password", "Reset your password here"));
  pipeline_->ingest(TestUtilities::create_test_document("billing", "Invoices go out monthly"));

  auto results = pipeline_->retrieve("Reset your password here");
  ASSERT_FALSE(results.empty());
  EXPECT_EQ(results[0].chunk.document_id, "password");
  EXPECT_NEAR(results[0].score, 1.0f, 1e-5);

  Answer answer = pipeline_->ask("Reset your password here");
  EXPECT_FALSE(answer.no_context);
  ASSERT_EQ(answer.citations.size(), answer.results.size());
  EXPECT_EQ(answer.citations[0].label(), "Title of password");
  EXPECT_EQ(answer.answer, "answer from " + std::to_string(answer.results.size()) + " snippets");
}

TEST_F(RetrievalPipelineTest, IngestChunksAndEmbedsInBatches) {
  // 130 characters, 40/10 windows: 4 chunks, 2 batches of 2
  const std::string text(130, 'x');
  EXPECT_CALL(*embedder_, embed(SizeIs(2))).Times(2);

  IngestReport report = pipeline_->ingest(TestUtilities::create_test_document("long", text));

  EXPECT_EQ(report.outcome, IngestOutcome::Added);
  EXPECT_EQ(report.chunk_count, 4u);
  EXPECT_EQ(store_->record_count(), 4u);
  EXPECT_EQ(pipeline_->stats().indexed_records, 4u);
}

TEST_F(RetrievalPipelineTest, UnchangedDocumentIsSkipped) {
  auto document = TestUtilities::create_test_document("faq", "Support hours are nine to five");
  pipeline_->ingest(document);

  EXPECT_CALL(*embedder_, embed(_)).Times(0);
  document.text = "  Support hours are   nine to five\n";
  IngestReport report = pipeline_->ingest(document);

  EXPECT_EQ(report.outcome, IngestOutcome::Unchanged);
  EXPECT_EQ(store_->record_count(), 1u);
}

TEST_F(RetrievalPipelineTest, ChangedDocumentReplacesOnlyItsRecords) {
  pipeline_->ingest(TestUtilities::create_test_document("faq", std::string(70, 'a')));
  pipeline_->ingest(TestUtilities::create_test_document("other", "Other document text"));
  ASSERT_EQ(store_->record_count(), 3u);

  IngestReport report =
      pipeline_->ingest(TestUtilities::create_test_document("faq", "Shorter answer now"));

  EXPECT_EQ(report.outcome, IngestOutcome::Replaced);
  EXPECT_EQ(report.removed_count, 2u);
  EXPECT_EQ(report.chunk_count, 1u);
  EXPECT_EQ(store_->record_count(), 2u);

  auto records = store_->load_all();
  size_t other = 0;
  for (const auto& record : records) {
    if (record.chunk.document_id == "other") {
      ++other;
      EXPECT_EQ(record.chunk.text, "Other document text");
    }
  }
  EXPECT_EQ(other, 1u);
}

TEST_F(RetrievalPipelineTest, FailedBatchCommitsNothing) {
  pipeline_->ingest(TestUtilities::create_test_document("kept", "Existing content"));
  const auto before = store_->load_all();

  EXPECT_CALL(*embedder_, embed(_))
      .WillOnce([](const std::vector<std::string>& texts) {
        return std::vector<EmbeddingVector>(texts.size(), MockEmbeddingProvider::histogram("ab"));
      })
      .WillOnce([](const std::vector<std::string>&) -> std::vector<EmbeddingVector> {
        throw ProviderError(ProviderErrorKind::Quota, "rate limited");
      });

  try {
    pipeline_->ingest(TestUtilities::create_test_document("big", std::string(100, 'b')));
    FAIL() << "expected IngestError";
  } catch (const IngestError& e) {
    EXPECT_EQ(e.document_id(), "big");
    EXPECT_EQ(e.batch_index(), 1);
    EXPECT_NE(std::string(e.what()).find("rate limited"), std::string::npos);
  }

  EXPECT_EQ(store_->load_all(), before);
  EXPECT_EQ(pipeline_->stats().indexed_records, before.size());
}

TEST_F(RetrievalPipelineTest, WrongEmbeddingDimensionIsRejected) {
  pipeline_->ingest(TestUtilities::create_test_document("first", "Some text"));

  EXPECT_CALL(*embedder_, embed(_)).WillOnce(Return(std::vector<EmbeddingVector>{{1.0f, 2.0f}}));
  EXPECT_THROW(pipeline_->ingest(TestUtilities::create_test_document("second", "More text")),
               DimensionMismatch);
  EXPECT_EQ(store_->record_count(), 1u);
}

TEST_F(RetrievalPipelineTest, NonFiniteEmbeddingFailsTheIngest) {
  pipeline_->ingest(TestUtilities::create_test_document("kept", "Existing content"));
  const auto before = store_->load_all();

  EXPECT_CALL(*embedder_, embed(_)).WillOnce([](const std::vector<std::string>& texts) {
    std::vector<EmbeddingVector> vectors(texts.size(), MockEmbeddingProvider::histogram("ab"));
    vectors[0][3] = std::numeric_limits<float>::quiet_NaN();
    return vectors;
  });

  try {
    pipeline_->ingest(TestUtilities::create_test_document("broken", "Embeds to garbage"));
    FAIL() << "expected IngestError";
  } catch (const IngestError& e) {
    EXPECT_EQ(e.document_id(), "broken");
    EXPECT_EQ(e.batch_index(), 0);
  }

  EXPECT_EQ(store_->load_all(), before);
  EXPECT_NO_THROW(pipeline_->ingest(TestUtilities::create_test_document("next", "Still works")));
}

TEST_F(RetrievalPipelineTest, InvalidUtf8InMetadataIsRepaired) {
  auto document = TestUtilities::create_test_document("caf\xe9-guide", "Opening hours of the cafe");
  document.metadata.title = "Caf\xe9  Guide";
  document.metadata.origin = "/exports/Caf\xe9 Guide.md";

  IngestReport report = pipeline_->ingest(document);

  EXPECT_EQ(report.outcome, IngestOutcome::Added);
  EXPECT_EQ(report.document_id, "caf\xef\xbf\xbd-guide");
  auto records = store_->load_all();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].document.title, "Caf\xef\xbf\xbd Guide");
  EXPECT_EQ(records[0].document.origin, "/exports/Caf\xef\xbf\xbd Guide.md");

  IngestReport again = pipeline_->ingest(document);
  EXPECT_EQ(again.outcome, IngestOutcome::Unchanged);
}

TEST_F(RetrievalPipelineTest, IndexFollowsEveryCommit) {
  pipeline_->ingest(TestUtilities::create_test_document("faq", std::string(70, 'a')));
  pipeline_->ingest(TestUtilities::create_test_document("other", "Other document text"));
  pipeline_->ingest(TestUtilities::create_test_document("faq", "Shorter answer now"));
  pipeline_->forget("other");
  pipeline_->ingest(TestUtilities::create_test_document("late", "Arrived last"));

  RetrievalPipeline reloaded(store_, embedder_, chat_, options_);
  const auto expected = reloaded.retrieve("Shorter answer now", 10, -1.0f);
  const auto actual = pipeline_->retrieve("Shorter answer now", 10, -1.0f);

  EXPECT_EQ(pipeline_->stats().indexed_records, store_->record_count());
  ASSERT_EQ(actual.size(), expected.size());
  for (size_t i = 0; i < actual.size(); ++i) {
    EXPECT_EQ(actual[i].sequence, expected[i].sequence);
    EXPECT_EQ(actual[i].chunk.chunk_id, expected[i].chunk.chunk_id);
    EXPECT_FLOAT_EQ(actual[i].score, expected[i].score);
  }
}

TEST_F(RetrievalPipelineTest, RemovedStorageRootResetsTheIndex) {
  pipeline_->ingest(TestUtilities::create_test_document("one", "First document"));
  pipeline_->ingest(TestUtilities::create_test_document("two", "Second document"));
  std::filesystem::remove_all(temp_dir_ / "store");

  pipeline_->ingest(TestUtilities::create_test_document("three", "Third document"));

  EXPECT_EQ(store_->record_count(), 1u);
  EXPECT_EQ(pipeline_->stats().indexed_records, 1u);
  auto results = pipeline_->retrieve("Second document", 5, -1.0f);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].chunk.document_id, "three");
}

TEST_F(RetrievalPipelineTest, CancelledIngestLeavesStoreUntouched) {
  std::atomic<bool> cancel{true};
  EXPECT_THROW(
      pipeline_->ingest(TestUtilities::create_test_document("doc", "Some text"), &cancel),
      IngestCancelled);
  EXPECT_EQ(store_->record_count(), 0u);
}

TEST_F(RetrievalPipelineTest, QueryProviderErrorPropagates) {
  pipeline_->ingest(TestUtilities::create_test_document("doc", "Some text"));

  EXPECT_CALL(*embedder_, embed(_))
      .WillOnce([](const std::vector<std::string>&) -> std::vector<EmbeddingVector> {
        throw ProviderError(ProviderErrorKind::Network, "connection refused");
      });
  EXPECT_CALL(*chat_, answer(_, _)).Times(0);

  try {
    pipeline_->ask("Some text");
    FAIL() << "expected ProviderError";
  } catch (const ProviderError& e) {
    EXPECT_EQ(e.kind(), ProviderErrorKind::Network);
  }
}

TEST_F(RetrievalPipelineTest, ChatProviderErrorPropagates) {
  EXPECT_CALL(*chat_, answer(_, _))
      .WillOnce([](const std::string&, const std::vector<ContextSnippet>&) -> std::string {
        throw ProviderError(ProviderErrorKind::Timeout, "took too long");
      });
  EXPECT_THROW(pipeline_->ask("anything"), ProviderError);
}

TEST_F(RetrievalPipelineTest, EmptyQuestionIsRejected) {
  EXPECT_THROW(pipeline_->retrieve("   "), std::invalid_argument);
}

TEST_F(RetrievalPipelineTest, IngestAllReportsEachDocument) {
  std::vector<Document> documents = {
      TestUtilities::create_test_document("one", "First document"),
      TestUtilities::create_test_document("blank", "   \n  "),
      TestUtilities::create_test_document("", "No id at all"),
      TestUtilities::create_test_document("two", "Second document")};

  auto reports = pipeline_->ingest_all(documents);

  ASSERT_EQ(reports.size(), 4u);
  EXPECT_EQ(reports[0].outcome, IngestOutcome::Added);
  EXPECT_EQ(reports[1].outcome, IngestOutcome::Empty);
  EXPECT_EQ(reports[2].outcome, IngestOutcome::Failed);
  EXPECT_FALSE(reports[2].error.empty());
  EXPECT_EQ(reports[3].outcome, IngestOutcome::Added);
  EXPECT_EQ(store_->document_ids(), (std::vector<std::string>{"one", "two"}));
}

TEST_F(RetrievalPipelineTest, ForgetAndClearUpdateTheIndex) {
  pipeline_->ingest(TestUtilities::create_test_document("one", "First document"));
  pipeline_->ingest(TestUtilities::create_test_document("two", "Second document"));

  EXPECT_EQ(pipeline_->forget("one"), 1u);
  EXPECT_EQ(pipeline_->forget("one"), 0u);
  EXPECT_EQ(pipeline_->stats().indexed_records, 1u);

  pipeline_->clear();
  EXPECT_EQ(pipeline_->stats().indexed_records, 0u);
  EXPECT_TRUE(pipeline_->retrieve("Second document").empty());
}

TEST_F(RetrievalPipelineTest, ParallelIngestKeepsEveryDocument) {
  options_.max_parallel_documents = 3;
  auto pipeline = std::make_unique<RetrievalPipeline>(store_, embedder_, chat_, options_);

  std::vector<Document> documents;
  for (int i = 0; i < 8; ++i) {
    documents.push_back(TestUtilities::create_test_document(
        "doc" + std::to_string(i), "Document number " + std::string(static_cast<size_t>(i + 1), 'z')));
  }
  auto reports = pipeline->ingest_all(documents);

  for (const auto& report : reports) {
    EXPECT_EQ(report.outcome, IngestOutcome::Added) << report.document_id << ": " << report.error;
  }
  EXPECT_EQ(store_->document_ids().size(), 8u);
  EXPECT_EQ(pipeline->stats().indexed_records, store_->record_count());
}

TEST(PipelineOptionsTest, ValidatesRanges) {
  PipelineOptions options;
  EXPECT_NO_THROW(options.validate());
  options.embed_batch_size = 0;
  EXPECT_THROW(options.validate(), ConfigError);
  options = PipelineOptions{};
  options.min_score = 1.5f;
  EXPECT_THROW(options.validate(), ConfigError);
  options = PipelineOptions{};
  options.chunk_overlap = options.chunk_size;
  EXPECT_THROW(options.validate(), ConfigError);
}

}  // namespace helpdesk_tests
