#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "helpdesk_core/chunking/chunker.hpp"
#include "helpdesk_core/index/similarity_index.hpp"
#include "helpdesk_core/llm/chat_provider.hpp"
#include "helpdesk_core/llm/embedding_provider.hpp"
#include "helpdesk_core/storage/vector_record_store.hpp"
#include "helpdesk_core/types.hpp"

namespace helpdesk_core {

struct PipelineOptions {
  int chunk_size = 500;
  int chunk_overlap = 100;
  int embed_batch_size = 16;
  int top_k = 5;
  float min_score = 0.0f;
  int max_parallel_documents = 1;

  // Throws ConfigError
  void validate() const;
};

enum class IngestOutcome { Added, Replaced, Unchanged, Empty, Failed };
std::string to_string(IngestOutcome outcome);

struct IngestReport {
  std::string document_id;
  IngestOutcome outcome = IngestOutcome::Failed;
  size_t chunk_count = 0;
  // Records of a previous version that were replaced
  size_t removed_count = 0;
  // Set only when outcome is Failed
  std::string error;
};

struct Answer {
  std::string answer;
  std::vector<RetrievalResult> results;
  std::vector<Citation> citations;
  // Nothing in the store scored above the threshold
  bool no_context = false;
};

struct PipelineStats {
  StoreStats store;
  size_t indexed_records = 0;
};

/**
 * @class RetrievalPipeline
 * @brief Ingests documents into a VectorRecordStore and answers questions from it.
 *
 * Ingest runs normalize, hash, chunk, embed and assemble, then commits the document
 * in one store mutation. Every record of a document is buffered in memory until all
 * embedding batches have succeeded, so a failed or cancelled ingest leaves the store
 * untouched.
 *
 * Searches run against an immutable SimilarityIndex snapshot. After each committed
 * document a new snapshot is derived from the previous one and swapped in; only
 * construction, clear() and refresh_index() reload the whole store.
 */
class RetrievalPipeline {
 public:
  RetrievalPipeline(std::shared_ptr<VectorRecordStore> store,
                    std::shared_ptr<EmbeddingProvider> embedder,
                    std::shared_ptr<ChatProvider> chat,
                    PipelineOptions options = {});

  // Throws IngestError, IngestCancelled, DimensionMismatch, ChunkingError or IOError.
  IngestReport ingest(Document document,
                      const std::atomic<bool> *cancel = nullptr,
                      const ProgressUpdater &on_progress = {});

  // Runs up to max_parallel_documents ingests at a time and keeps going past failures.
  // Reports are returned in input order.
  std::vector<IngestReport> ingest_all(std::vector<Document> documents,
                                       const std::atomic<bool> *cancel = nullptr);

  std::vector<RetrievalResult> retrieve(const std::string &question,
                                        std::optional<int> k = std::nullopt,
                                        std::optional<float> min_score = std::nullopt) const;

  // ProviderError from either provider propagates unchanged.
  Answer ask(const std::string &question,
             std::optional<int> k = std::nullopt,
             std::optional<float> min_score = std::nullopt) const;

  size_t forget(const std::string &document_id);
  void clear();
  PipelineStats stats() const;

  // Reloads every record from the store
  void refresh_index();
  std::shared_ptr<const SimilarityIndex> index_snapshot() const;

  const PipelineOptions &options() const {
    return options_;
  }

 private:
  std::vector<EmbeddingVector> embed_chunks(const std::string &document_id,
                                            const std::vector<Chunk> &chunks,
                                            const std::atomic<bool> *cancel,
                                            const ProgressUpdater &on_progress);
  EmbeddingVector embed_question(const std::string &question) const;
  // Caller holds commit_mutex_
  void update_index_locked(const std::string &document_id,
                           const std::vector<StoreRecord> &committed);

  std::shared_ptr<VectorRecordStore> store_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<ChatProvider> chat_;
  PipelineOptions options_;
  Chunker chunker_;

  // Serializes the exists-check and commit of one document with index refreshes
  std::mutex commit_mutex_;
  mutable std::mutex index_mutex_;
  std::shared_ptr<const SimilarityIndex> index_;
};

}  // namespace helpdesk_core
