#include "helpdesk_core/services/retrieval_pipeline.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <stdexcept>

#include "helpdesk_core/chunking/text_normalizer.hpp"
#include "helpdesk_core/errors.hpp"

namespace helpdesk_core {

void PipelineOptions::validate() const {
  ChunkingOptions{chunk_size, chunk_overlap}.validate();
  if (embed_batch_size <= 0) {
    throw ConfigError("embed_batch_size must be positive, got " + std::to_string(embed_batch_size));
  }
  if (top_k <= 0) {
    throw ConfigError("top_k must be positive, got " + std::to_string(top_k));
  }
  if (min_score < -1.0f || min_score > 1.0f) {
    throw ConfigError("min_score must be within [-1, 1]");
  }
  if (max_parallel_documents <= 0) {
    throw ConfigError("max_parallel_documents must be positive, got " +
                      std::to_string(max_parallel_documents));
  }
}

std::string to_string(IngestOutcome outcome) {
  switch (outcome) {
    case IngestOutcome::Added:
      return "added";
    case IngestOutcome::Replaced:
      return "replaced";
    case IngestOutcome::Unchanged:
      return "unchanged";
    case IngestOutcome::Empty:
      return "empty";
    default:
      return "failed";
  }
}

RetrievalPipeline::RetrievalPipeline(std::shared_ptr<VectorRecordStore> store,
                                     std::shared_ptr<EmbeddingProvider> embedder,
                                     std::shared_ptr<ChatProvider> chat,
                                     PipelineOptions options)
    : store_(std::move(store)),
      embedder_(std::move(embedder)),
      chat_(std::move(chat)),
      options_(options),
      chunker_(ChunkingOptions{options.chunk_size, options.chunk_overlap}) {
  options_.validate();
  refresh_index();
}

IngestReport RetrievalPipeline::ingest(Document document,
                                       const std::atomic<bool> *cancel,
                                       const ProgressUpdater &on_progress) {
  auto progress = [&on_progress](float fraction, const std::string &message) {
    if (on_progress)
      on_progress(fraction, message);
  };

  // Ids, titles and origins come from page markup and file names, in any encoding
  document.metadata.id = repair_utf8(document.metadata.id);
  document.metadata.title = normalize_text(document.metadata.title);
  document.metadata.origin = repair_utf8(document.metadata.origin);

  const std::string document_id = document.metadata.id;
  if (document_id.empty()) {
    throw IngestError("<unnamed>", -1, "document has no id");
  }

  IngestReport report;
  report.document_id = document_id;

  // 1. Normalize and hash
  document.text = normalize_text(document.text);
  document.metadata.content_hash = compute_content_hash(document.text);
  if (store_->document_content_hash(document_id) == document.metadata.content_hash) {
    report.outcome = IngestOutcome::Unchanged;
    std::cout << "[Pipeline] " << document_id << " is unchanged, skipping" << std::endl;
    progress(1.0f, "Document unchanged.");
    return report;
  }
  progress(0.05f, "Text normalized.");

  // 2. Chunk
  std::vector<Chunk> chunks = chunker_.chunk(document.text, document_id);
  report.chunk_count = chunks.size();
  progress(0.1f, "Split into " + std::to_string(chunks.size()) + " chunks.");

  const std::string store_model = store_->embedding_model();
  if (store_->record_count() > 0 && store_model != embedder_->model_name()) {
    std::cerr << "[Pipeline] Warning: store holds embeddings from '" << store_model
              << "' but ingesting with '" << embedder_->model_name() << "'" << std::endl;
  }

  // 3. Embed, buffering everything until every batch has succeeded
  std::vector<EmbeddingVector> vectors = embed_chunks(document_id, chunks, cancel, on_progress);

  // 4. Assemble
  std::vector<StoreRecord> records;
  records.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    records.push_back(StoreRecord{0, std::move(chunks[i]), std::move(vectors[i]), document.metadata});
  }

  if (cancel && cancel->load()) {
    throw IngestCancelled(document_id);
  }

  // 5. Commit and update the index
  {
    std::lock_guard<std::mutex> lock(commit_mutex_);
    const bool exists = store_->document_content_hash(document_id).has_value();
    std::vector<StoreRecord> committed;
    if (exists) {
      ReplaceResult replaced = store_->replace_document(document_id, std::move(records));
      report.removed_count = replaced.removed;
      committed = std::move(replaced.committed);
      report.outcome = report.chunk_count > 0 ? IngestOutcome::Replaced : IngestOutcome::Empty;
    } else if (!records.empty()) {
      committed = store_->append(std::move(records));
      report.outcome = IngestOutcome::Added;
    } else {
      report.outcome = IngestOutcome::Empty;
    }
    if (exists || report.chunk_count > 0) {
      update_index_locked(document_id, committed);
    }
  }

  std::cout << "[Pipeline] " << document_id << ": " << to_string(report.outcome) << ", "
            << report.chunk_count << " chunks" << std::endl;
  progress(1.0f, "Ingest complete.");
  return report;
}

std::vector<EmbeddingVector> RetrievalPipeline::embed_chunks(const std::string &document_id,
                                                             const std::vector<Chunk> &chunks,
                                                             const std::atomic<bool> *cancel,
                                                             const ProgressUpdater &on_progress) {
  std::vector<EmbeddingVector> vectors;
  vectors.reserve(chunks.size());

  const size_t batch_size = static_cast<size_t>(options_.embed_batch_size);
  const std::optional<size_t> store_dimension = store_->dimension();

  for (size_t begin = 0; begin < chunks.size(); begin += batch_size) {
    if (cancel && cancel->load()) {
      throw IngestCancelled(document_id);
    }

    const int batch_index = static_cast<int>(begin / batch_size);
    const size_t end = std::min(chunks.size(), begin + batch_size);
    std::vector<std::string> texts;
    texts.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
      texts.push_back(chunks[i].text);
    }

    std::vector<EmbeddingVector> batch;
    try {
      batch = embedder_->embed(texts);
    } catch (const ProviderError &e) {
      throw IngestError(document_id, batch_index, e.what());
    }

    if (batch.size() != texts.size()) {
      throw IngestError(document_id, batch_index,
                        "provider returned " + std::to_string(batch.size()) + " vectors for " +
                            std::to_string(texts.size()) + " texts");
    }
    for (auto &vector : batch) {
      const size_t expected =
          store_dimension ? *store_dimension : (vectors.empty() ? vector.size() : vectors.front().size());
      if (vector.empty() || vector.size() != expected) {
        throw DimensionMismatch("embedding of document " + document_id + " batch " +
                                    std::to_string(batch_index),
                                expected, vector.size());
      }
      if (!std::all_of(vector.begin(), vector.end(), [](float v) { return std::isfinite(v); })) {
        throw IngestError(document_id, batch_index, "provider returned a non-finite embedding");
      }
      vectors.push_back(std::move(vector));
    }

    if (on_progress) {
      const float fraction = 0.1f + 0.8f * static_cast<float>(end) / static_cast<float>(chunks.size());
      on_progress(fraction, "Embedded chunk " + std::to_string(end) + " of " +
                                std::to_string(chunks.size()));
    }
  }
  return vectors;
}

std::vector<IngestReport> RetrievalPipeline::ingest_all(std::vector<Document> documents,
                                                        const std::atomic<bool> *cancel) {
  std::vector<IngestReport> reports(documents.size());
  std::atomic<size_t> next{0};

  auto run = [&]() {
    for (size_t i = next.fetch_add(1); i < documents.size(); i = next.fetch_add(1)) {
      IngestReport &report = reports[i];
      report.document_id = documents[i].metadata.id;
      try {
        report = ingest(std::move(documents[i]), cancel);
      } catch (const std::exception &e) {
        report.outcome = IngestOutcome::Failed;
        report.error = e.what();
        std::cerr << "[Pipeline] Ingest of " << report.document_id << " failed: " << e.what()
                  << std::endl;
      }
    }
  };

  const size_t workers =
      std::min(documents.size(), static_cast<size_t>(options_.max_parallel_documents));
  std::vector<std::future<void>> futures;
  for (size_t i = 1; i < workers; ++i) {
    futures.push_back(std::async(std::launch::async, run));
  }
  run();
  for (auto &future : futures) {
    future.get();
  }
  return reports;
}

EmbeddingVector RetrievalPipeline::embed_question(const std::string &question) const {
  std::vector<EmbeddingVector> vectors = embedder_->embed({question});
  if (vectors.size() != 1) {
    throw ProviderError(ProviderErrorKind::InvalidResponse,
                        "expected one query embedding, got " + std::to_string(vectors.size()));
  }
  return std::move(vectors.front());
}

std::vector<RetrievalResult> RetrievalPipeline::retrieve(const std::string &question,
                                                         std::optional<int> k,
                                                         std::optional<float> min_score) const {
  if (question.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw std::invalid_argument("question must not be empty");
  }
  const int limit = k.value_or(options_.top_k);
  auto index = index_snapshot();
  if (limit <= 0 || index->empty()) {
    return {};
  }
  EmbeddingVector query = embed_question(question);
  return index->search(query, limit, min_score.value_or(options_.min_score));
}

Answer RetrievalPipeline::ask(const std::string &question,
                              std::optional<int> k,
                              std::optional<float> min_score) const {
  Answer answer;
  answer.results = retrieve(question, k, min_score);
  answer.no_context = answer.results.empty();

  std::vector<ContextSnippet> context;
  context.reserve(answer.results.size());
  for (const auto &result : answer.results) {
    Citation citation = make_citation(result);
    context.push_back(ContextSnippet{citation.label(), result.chunk.text});
    answer.citations.push_back(std::move(citation));
  }

  answer.answer = chat_->answer(question, context);
  return answer;
}

size_t RetrievalPipeline::forget(const std::string &document_id) {
  std::lock_guard<std::mutex> lock(commit_mutex_);
  const size_t removed = store_->replace_document(document_id);
  if (removed > 0) {
    update_index_locked(document_id, {});
  }
  return removed;
}

void RetrievalPipeline::clear() {
  std::lock_guard<std::mutex> lock(commit_mutex_);
  store_->clear();
  refresh_index();
}

PipelineStats RetrievalPipeline::stats() const {
  return PipelineStats{store_->stats(), index_snapshot()->size()};
}

void RetrievalPipeline::refresh_index() {
  auto index = std::make_shared<const SimilarityIndex>(SimilarityIndex::build(store_->load_all()));
  std::lock_guard<std::mutex> lock(index_mutex_);
  index_ = std::move(index);
}

void RetrievalPipeline::update_index_locked(const std::string &document_id,
                                            const std::vector<StoreRecord> &committed) {
  std::shared_ptr<const SimilarityIndex> next;
  try {
    next = std::make_shared<const SimilarityIndex>(
        index_snapshot()->with_document(document_id, committed));
  } catch (const DimensionMismatch &e) {
    std::cerr << "[Pipeline] Index out of step with the store (" << e.what() << "), reloading"
              << std::endl;
    refresh_index();
    return;
  }

  // A storage root removed underneath us resets the store; only a reload sees that
  if (next->size() != store_->record_count()) {
    refresh_index();
    return;
  }
  std::lock_guard<std::mutex> lock(index_mutex_);
  index_ = std::move(next);
}

std::shared_ptr<const SimilarityIndex> RetrievalPipeline::index_snapshot() const {
  std::lock_guard<std::mutex> lock(index_mutex_);
  return index_;
}

}  // namespace helpdesk_core
